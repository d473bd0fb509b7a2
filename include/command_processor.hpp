#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "calculator.hpp"

namespace calc {

// Вид команды калькулятора
enum class CommandKind {
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Set,
    Clear,
    Undo,
    Value,
    History
};

// Разобранная команда калькулятора: имя и необязательный операнд
struct Command {
    CommandKind kind;
    std::string name;               // Каноническое имя: "add", "subtract", ...
    std::optional<double> operand;
};

// Результат выполнения одной строки команд
struct CommandRecord {
    std::size_t lineNumber;       // Номер строки во входном файле (или счётчик ввода)
    std::string command;          // Исходный текст команды
    std::optional<double> value;  // Значение калькулятора после команды (если успешно)
    std::string status;           // Статус (success или error)
    std::string message;          // Сообщение об ошибке (если есть)
};

// Разбор строки вида "add 5", "undo", "mul -2.5".
// Синонимы приводятся к каноническим именам (sub -> subtract, pow -> power, ...).
// Выбрасывает std::runtime_error для неизвестной команды или неверного числа аргументов
// и calc::InvalidInputError для некорректного операнда.
Command parseCommand(const std::string& line);

// Применяет команды к одному калькулятору.
// Вне ядра: только вызывает публичные операции Calculator.
class CommandProcessor {
public:
    explicit CommandProcessor(double initialValue = 0.0);

    // Разбирает и выполняет строку. Ошибки передаются вызывающему
    void execute(const std::string& line);

    // То же, но ошибки превращаются в запись со статусом "error"
    CommandRecord process(std::size_t lineNumber, const std::string& line);

    const Calculator& calculator() const { return engine; }

private:
    Calculator engine;

    void apply(const Command& command);
};

} // namespace calc
