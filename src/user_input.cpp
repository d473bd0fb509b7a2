#include "user_input.hpp"
#include "console.hpp"

#include "errors.hpp"
#include "validators.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <vector>

std::string trim(const std::string& text) {
    std::size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    std::size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Безопасный парсинг числа из строки
double parseOperand(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) {
        throw calc::InvalidInputError(std::vector<double>{}, "Ожидалось число, получена пустая строка");
    }

    errno = 0;
    const char* begin = input.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);

    // Хвост после числа ("12abc") тоже ошибка
    if (end == begin || end != begin + input.size()) {
        throw calc::InvalidInputError(std::vector<double>{}, "Ожидалось число, получено '" + input + "'");
    }

    // ERANGE выставляется и для субнормальных чисел, отвергаем только переполнение
    if (errno == ERANGE && std::fabs(value) == HUGE_VAL) {
        throw calc::InvalidInputError(std::vector<double>{}, "Число вне диапазона double: " + input);
    }

    // "nan" и "inf" strtod принимает, поэтому проверяем отдельно
    return calc::validateNumber(value);
}

bool readLine(const std::string& prompt, std::string& line) {
    std::cout << Color::BOLD << prompt << Color::RESET;
    if (!std::getline(std::cin, line)) {
        return false;
    }
    return true;
}
