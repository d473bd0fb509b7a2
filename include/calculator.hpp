#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace calc {

// Версия библиотеки
inline constexpr const char* kVersion = "0.1.0";

// Снимок состояния калькулятора после успешной операции.
// Записи создаются один раз и больше не изменяются.
struct CalculatorState {
    double value;                  // Значение после операции
    std::string operation;         // Имя операции ("init", "add", "set", ...)
    std::vector<double> operands;  // Операнды в порядке передачи

    // Формат: "add(5) = 15"
    std::string toString() const;

    bool operator==(const CalculatorState& other) const = default;
};

// Калькулятор с текущим значением и историей операций.
// История никогда не бывает пустой: первая запись "init" (или "clear")
// создаётся в конструкторе и в clear(), и её нельзя отменить.
// При ошибке состояние не меняется, исключение передаётся вызывающему.
// Мутирующие методы возвращают ссылку на себя для цепочек:
//     Calculator(10).add(5).multiply(2).value() == 30.0
class Calculator {
public:
    // Выбрасывает InvalidInputError для NaN и бесконечностей
    explicit Calculator(double initialValue = 0.0);

    double value() const { return current; }

    // Копия истории в хронологическом порядке
    std::vector<CalculatorState> history() const { return records; }
    std::size_t historySize() const { return records.size(); }

    Calculator& add(double operand);
    Calculator& subtract(double operand);
    Calculator& multiply(double operand);
    Calculator& divide(double operand);
    Calculator& power(double exponent);

    // Прямая установка значения без арифметики
    Calculator& set(double newValue);

    // Сброс в 0.0, история начинается заново с записи "clear"
    Calculator& clear();

    // Удаляет последнюю запись и восстанавливает предыдущее значение.
    // CalculatorError, если отменять нечего.
    Calculator& undo();

    // Независимая копия (значение и история)
    Calculator copy() const;

    // Формат: "Calculator(value=30, history_len=3)"
    std::string toString() const;

    // Равенство только по текущему значению, история не учитывается
    bool operator==(const Calculator& other) const { return current == other.current; }

private:
    double current;
    std::vector<CalculatorState> records;

    // Общий путь для бинарных операций: проверка, вычисление, запись
    Calculator& apply(double (*operation)(double, double), double operand, const char* name);

    void record(const char* name, std::vector<double> operands);
};

} // namespace calc

// Хеш согласован с operator==: зависит только от значения
namespace std {
template <>
struct hash<calc::Calculator> {
    std::size_t operator()(const calc::Calculator& calculator) const noexcept {
        double value = calculator.value();
        // 0.0 и -0.0 равны, значит и хеш должен совпадать
        return std::hash<double>{}(value == 0.0 ? 0.0 : value);
    }
};
} // namespace std
