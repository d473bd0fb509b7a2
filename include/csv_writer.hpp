#pragma once

#include <filesystem>
#include <vector>

#include "command_processor.hpp"

namespace calc {

// Класс для записи отчёта пакетного режима в формате CSV.
// Формат строки: line,command,status,result,message
// Двойные кавычки в тексте заменяются одинарными.
class CsvWriter {
public:
    // Конструктор создаёт файл (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов в файл
    void write(const std::vector<CommandRecord>& records) const;

    // Записывает один результат в файл (для потоковой записи)
    void writeRecord(const CommandRecord& record) const;

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path; // Путь к выходному файлу

    // Создаёт файл и записывает заголовок
    void initialize() const;
};

} // namespace calc
