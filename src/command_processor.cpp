#include "command_processor.hpp"

#include "user_input.hpp"

#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace calc {

namespace {

struct CommandSpec {
    CommandKind kind;
    const char* canonical;  // Каноническое имя команды
    bool needsOperand;      // Требуется ли числовой аргумент
};

// Допустимые команды и их синонимы
const std::unordered_map<std::string, CommandSpec> kCommands = {
    { "add", { CommandKind::Add, "add", true } },
    { "sub", { CommandKind::Subtract, "subtract", true } },
    { "subtract", { CommandKind::Subtract, "subtract", true } },
    { "mul", { CommandKind::Multiply, "multiply", true } },
    { "multiply", { CommandKind::Multiply, "multiply", true } },
    { "div", { CommandKind::Divide, "divide", true } },
    { "divide", { CommandKind::Divide, "divide", true } },
    { "pow", { CommandKind::Power, "power", true } },
    { "power", { CommandKind::Power, "power", true } },
    { "set", { CommandKind::Set, "set", true } },
    { "clear", { CommandKind::Clear, "clear", false } },
    { "undo", { CommandKind::Undo, "undo", false } },
    { "value", { CommandKind::Value, "value", false } },
    { "history", { CommandKind::History, "history", false } },
};

} // namespace

Command parseCommand(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }

    if (words.empty()) {
        throw std::runtime_error("Пустая строка");
    }

    auto found = kCommands.find(words.front());
    if (found == kCommands.end()) {
        throw std::runtime_error("Неизвестная команда: " + words.front());
    }

    const CommandSpec& spec = found->second;
    std::size_t expected = spec.needsOperand ? 2 : 1;
    if (words.size() != expected) {
        if (spec.needsOperand) {
            throw std::runtime_error("Команда '" + words.front() + "' требует один числовой аргумент");
        }
        throw std::runtime_error("Команда '" + words.front() + "' не принимает аргументов");
    }

    Command command{ spec.kind, spec.canonical, std::nullopt };
    if (spec.needsOperand) {
        command.operand = parseOperand(words[1]);
    }
    return command;
}

CommandProcessor::CommandProcessor(double initialValue) : engine(initialValue) {}

void CommandProcessor::apply(const Command& command) {
    switch (command.kind) {
    case CommandKind::Add:
        engine.add(*command.operand);
        break;
    case CommandKind::Subtract:
        engine.subtract(*command.operand);
        break;
    case CommandKind::Multiply:
        engine.multiply(*command.operand);
        break;
    case CommandKind::Divide:
        engine.divide(*command.operand);
        break;
    case CommandKind::Power:
        engine.power(*command.operand);
        break;
    case CommandKind::Set:
        engine.set(*command.operand);
        break;
    case CommandKind::Clear:
        engine.clear();
        break;
    case CommandKind::Undo:
        engine.undo();
        break;
    case CommandKind::Value:
    case CommandKind::History:
        // Команды только для чтения: состояние не меняется
        break;
    }
}

void CommandProcessor::execute(const std::string& line) {
    apply(parseCommand(line));
}

CommandRecord CommandProcessor::process(std::size_t lineNumber, const std::string& line) {
    CommandRecord record;
    record.lineNumber = lineNumber;
    record.command = line;
    try {
        execute(line);
        record.value = engine.value();
        record.status = "success";
        record.message = "";
    }
    catch (const std::exception& ex) {
        record.value.reset();
        record.status = "error";
        record.message = ex.what();
    }
    return record;
}

} // namespace calc
