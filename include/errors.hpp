#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace calc {

// Базовое исключение калькулятора.
// Хранит текст ошибки и значения, которые её вызвали (список может быть пустым).
// what() возвращает "сообщение: значения" или просто сообщение.
class CalculatorError : public std::runtime_error {
public:
    explicit CalculatorError(const std::string& message, std::vector<double> values = {});

    const std::string& message() const { return text; }
    const std::vector<double>& values() const { return offending; }

private:
    std::string text;
    std::vector<double> offending;
};

// Некорректный операнд: NaN, бесконечность, не число
// или нарушение области определения (0 в отрицательной степени и т.п.)
class InvalidInputError : public CalculatorError {
public:
    InvalidInputError(double value, const std::string& reason);
    InvalidInputError(std::vector<double> values, const std::string& reason);

    const std::string& reason() const { return message(); }
};

// Значение вне заданных границ
class OutOfRangeError : public CalculatorError {
public:
    OutOfRangeError(double value, std::optional<double> minValue, std::optional<double> maxValue);

    double value() const { return rejected; }
    std::optional<double> minValue() const { return lower; }
    std::optional<double> maxValue() const { return upper; }

private:
    double rejected;
    std::optional<double> lower;
    std::optional<double> upper;
};

// Делитель равен нулю. Хранит делимое
class DivisionByZeroError : public CalculatorError {
public:
    explicit DivisionByZeroError(double numerator);

    double numerator() const { return dividend; }

private:
    double dividend;
};

// Результат (или предварительная оценка) операции бесконечен
class OverflowError : public CalculatorError {
public:
    OverflowError(std::string operation, std::vector<double> operands);

    const std::string& operation() const { return opName; }
    const std::vector<double>& operands() const { return values(); }

private:
    std::string opName;
};

// Текстовое представление числа для сообщений и истории
std::string formatNumber(double value);

} // namespace calc
