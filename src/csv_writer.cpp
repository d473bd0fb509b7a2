#include "csv_writer.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <utility>

namespace calc {

namespace {

// Замена двойных кавычек на одинарные и оборачивание в кавычки
std::string quote(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}

void writeRow(std::ofstream& stream, const CommandRecord& record) {
    stream << record.lineNumber << ',';
    stream << quote(record.command) << ',';
    stream << record.status << ',';

    // Запись числового значения, если оно есть
    if (record.value.has_value()) {
        stream << record.value.value();
    }
    stream << ',';

    stream << quote(record.message) << '\n';
}

std::ofstream openForAppend(const std::filesystem::path& path) {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV");
    }
    // Настройка формата вывода чисел
    stream.setf(std::ios::fixed);
    stream << std::setprecision(10);
    return stream;
}

} // namespace

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    initialize();
}

void CsvWriter::initialize() const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV");
    }
    stream << "line,command,status,result,message\n";
}

void CsvWriter::writeRecord(const CommandRecord& record) const {
    std::ofstream stream = openForAppend(path);
    writeRow(stream, record);
}

void CsvWriter::write(const std::vector<CommandRecord>& records) const {
    std::ofstream stream = openForAppend(path);
    for (const auto& record : records) {
        writeRow(stream, record);
    }
}

} // namespace calc
