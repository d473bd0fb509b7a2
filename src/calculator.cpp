#include "calculator.hpp"

#include "errors.hpp"
#include "operations.hpp"
#include "validators.hpp"

#include <utility>

namespace calc {

std::string CalculatorState::toString() const {
    std::string result = operation + "(";
    for (std::size_t i = 0; i < operands.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += formatNumber(operands[i]);
    }
    result += ") = ";
    result += formatNumber(value);
    return result;
}

Calculator::Calculator(double initialValue) : current(validateNumber(initialValue)) {
    record("init", {});
}

void Calculator::record(const char* name, std::vector<double> operands) {
    records.push_back(CalculatorState{ current, name, std::move(operands) });
}

// Результат вычисляется до изменения состояния.
// Сначала запись в историю, потом присваивание: если push_back бросит,
// значение останется прежним.
Calculator& Calculator::apply(double (*operation)(double, double), double operand,
                              const char* name) {
    validateNumber(operand);
    double result = operation(current, operand);
    records.push_back(CalculatorState{ result, name, { operand } });
    current = result;
    return *this;
}

Calculator& Calculator::add(double operand) {
    return apply(&calc::add, operand, "add");
}

Calculator& Calculator::subtract(double operand) {
    return apply(&calc::subtract, operand, "subtract");
}

Calculator& Calculator::multiply(double operand) {
    return apply(&calc::multiply, operand, "multiply");
}

Calculator& Calculator::divide(double operand) {
    return apply(&calc::divide, operand, "divide");
}

Calculator& Calculator::power(double exponent) {
    return apply(&calc::power, exponent, "power");
}

Calculator& Calculator::set(double newValue) {
    validateNumber(newValue);
    records.push_back(CalculatorState{ newValue, "set", { newValue } });
    current = newValue;
    return *this;
}

Calculator& Calculator::clear() {
    current = 0.0;
    records.clear();
    record("clear", {});
    return *this;
}

Calculator& Calculator::undo() {
    // Начальную запись отменить нельзя
    if (records.size() <= 1) {
        throw CalculatorError("Нечего отменять");
    }
    records.pop_back();
    current = records.back().value;
    return *this;
}

Calculator Calculator::copy() const {
    return *this;
}

std::string Calculator::toString() const {
    return "Calculator(value=" + formatNumber(current) +
           ", history_len=" + std::to_string(records.size()) + ")";
}

} // namespace calc
