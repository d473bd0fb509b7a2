#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "calculator.hpp"
#include "command_processor.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "user_input.hpp"

namespace {

    void printValue(const calc::Calculator& calculator) {
        std::cout << "  = " << Color::GREEN << calc::formatNumber(calculator.value())
            << Color::RESET << "\n";
    }

    void printHistory(const calc::Calculator& calculator) {
        std::cout << Color::BOLD << "История:\n" << Color::RESET;
        std::size_t index = 0;
        for (const auto& state : calculator.history()) {
            std::cout << "  " << Color::CYAN << ++index << Color::RESET << ". "
                << state.toString() << "\n";
        }
    }

    // Пакетный режим: одна команда на строку, результаты в CSV
    void runScriptMode(const std::filesystem::path& scriptPath,
                       const std::filesystem::path& reportPath) {
        std::ifstream input(scriptPath);
        if (!input.is_open()) {
            throw std::runtime_error("Не удалось открыть входной файл: " + scriptPath.string());
        }

        std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Входной файл:  " << Color::YELLOW << scriptPath << Color::RESET << "\n";
        std::cout << "  Выходной файл: " << Color::YELLOW << reportPath << Color::RESET << "\n\n";

        auto start = std::chrono::high_resolution_clock::now();

        calc::CommandProcessor processor;
        calc::CsvWriter writer(reportPath);

        std::size_t successCount = 0;
        std::size_t errorCount = 0;
        std::size_t lineNumber = 1;
        std::string line;

        while (std::getline(input, line)) {
            calc::CommandRecord record = processor.process(lineNumber++, trim(line));
            writer.writeRecord(record);
            if (record.status == "success") {
                ++successCount;
            }
            else {
                ++errorCount;
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cout << Color::BOLD << "Статистика:\n" << Color::RESET;
        std::cout << "  Всего команд:     " << Color::CYAN << (successCount + errorCount) << Color::RESET << "\n";
        std::cout << "  Успешно:          " << Color::GREEN << successCount << Color::RESET << "\n";
        if (errorCount > 0) {
            std::cout << "  Ошибок:           " << Color::RED << errorCount << Color::RESET << "\n";
        }
        std::cout << "  Итоговое значение: " << Color::GREEN
            << calc::formatNumber(processor.calculator().value()) << Color::RESET << "\n";
        std::cout << "  Время обработки:  " << duration.count() << " мс\n\n";

        std::cout << Color::GREEN << "Результаты сохранены в: " << reportPath << Color::RESET << "\n\n";
    }

    // Интерактивный режим: команды читаются до exit или конца ввода
    void runInteractiveMode(double initialValue) {
        calc::CommandProcessor processor(initialValue);
        printHelp();
        printValue(processor.calculator());

        std::string line;
        while (readLine("> ", line)) {
            std::string command = trim(line);
            if (command.empty()) {
                continue;
            }
            if (command == "exit" || command == "quit") {
                break;
            }
            if (command == "help") {
                printHelp();
                continue;
            }

            try {
                processor.execute(command);
                if (command == "history") {
                    printHistory(processor.calculator());
                }
                else {
                    printValue(processor.calculator());
                }
            }
            catch (const std::exception& ex) {
                printError(ex.what());
            }
        }
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    // Пакетный режим: calc_console run <script.txt> [report.csv]
    if (argc >= 2 && std::string(argv[1]) == "run") {
        try {
            if (argc < 3) {
                throw std::runtime_error("Использование: calc_console run <script.txt> [report.csv]");
            }
            std::filesystem::path scriptPath = argv[2];
            std::filesystem::path reportPath = argc >= 4
                ? normalizeReportPath(argv[3])
                : defaultReportPath(scriptPath);
            runScriptMode(scriptPath, reportPath);
            return 0;
        }
        catch (const std::exception& ex) {
            printError(ex.what());
            return 1;
        }
    }

    printHeader();

    try {
        double initialValue = argc >= 2 ? parseOperand(argv[1]) : 0.0;
        runInteractiveMode(initialValue);
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}
