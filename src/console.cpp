#include "console.hpp"

#include "calculator.hpp"

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Калькулятор с историей и отменой операций v" << calc::kVersion << "       ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printHelp() {
    std::cout << Color::BOLD << "Команды:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "add" << Color::RESET << " <x>       прибавить x\n";
    std::cout << "  " << Color::CYAN << "sub" << Color::RESET << " <x>       вычесть x\n";
    std::cout << "  " << Color::CYAN << "mul" << Color::RESET << " <x>       умножить на x\n";
    std::cout << "  " << Color::CYAN << "div" << Color::RESET << " <x>       разделить на x\n";
    std::cout << "  " << Color::CYAN << "pow" << Color::RESET << " <x>       возвести в степень x\n";
    std::cout << "  " << Color::CYAN << "set" << Color::RESET << " <x>       установить значение\n";
    std::cout << "  " << Color::CYAN << "clear" << Color::RESET << "         сбросить в 0 и очистить историю\n";
    std::cout << "  " << Color::CYAN << "undo" << Color::RESET << "          отменить последнюю операцию\n";
    std::cout << "  " << Color::CYAN << "value" << Color::RESET << "         показать текущее значение\n";
    std::cout << "  " << Color::CYAN << "history" << Color::RESET << "       показать историю\n";
    std::cout << "  " << Color::CYAN << "exit" << Color::RESET << "          выход\n\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n";
}
