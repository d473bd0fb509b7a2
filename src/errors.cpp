#include "errors.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace calc {

namespace {

// Сборка текста для what(): "сообщение: a" или "сообщение: (a, b)"
std::string composeWhat(const std::string& message, const std::vector<double>& values) {
    if (values.empty()) {
        return message;
    }
    std::string result = message + ": ";
    if (values.size() == 1) {
        return result + formatNumber(values.front());
    }
    result += '(';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += formatNumber(values[i]);
    }
    result += ')';
    return result;
}

std::string formatBound(std::optional<double> bound) {
    return bound.has_value() ? formatNumber(bound.value()) : "None";
}

} // namespace

std::string formatNumber(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::ostringstream stream;
    stream.precision(15);
    stream << value;
    return stream.str();
}

CalculatorError::CalculatorError(const std::string& message, std::vector<double> values)
    : std::runtime_error(composeWhat(message, values)),
      text(message),
      offending(std::move(values)) {}

InvalidInputError::InvalidInputError(double value, const std::string& reason)
    : CalculatorError(reason, { value }) {}

InvalidInputError::InvalidInputError(std::vector<double> values, const std::string& reason)
    : CalculatorError(reason, std::move(values)) {}

OutOfRangeError::OutOfRangeError(double value, std::optional<double> minValue,
                                 std::optional<double> maxValue)
    : CalculatorError("Значение вне диапазона [" + formatBound(minValue) + ", " +
                          formatBound(maxValue) + "]",
                      { value }),
      rejected(value),
      lower(minValue),
      upper(maxValue) {}

DivisionByZeroError::DivisionByZeroError(double numerator)
    : CalculatorError("Деление на ноль", { numerator }), dividend(numerator) {}

OverflowError::OverflowError(std::string operation, std::vector<double> operands)
    : CalculatorError("Переполнение в операции " + operation, std::move(operands)),
      opName(std::move(operation)) {}

} // namespace calc
