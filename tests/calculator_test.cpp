// Файл: tests/calculator_test.cpp
// Назначение: состояние калькулятора, история, отмена и копирование.
// Инварианты: история не пуста, последняя запись совпадает с value(),
//             при ошибке состояние не меняется.

#include <gtest/gtest.h>

#include "calculator.hpp"
#include "errors.hpp"

#include <functional>
#include <limits>
#include <unordered_set>

using namespace calc;

namespace
{
// Последняя запись истории всегда совпадает с текущим значением
void expectConsistent(const Calculator& calculator)
{
    auto history = calculator.history();
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history.back().value, calculator.value());
}
} // namespace

TEST(CalculatorTest, DefaultStartsAtZeroWithInitRecord)
{
    Calculator calculator;
    EXPECT_EQ(calculator.value(), 0.0);
    auto history = calculator.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].operation, "init");
    EXPECT_TRUE(history[0].operands.empty());
    EXPECT_EQ(history[0].value, 0.0);
}

TEST(CalculatorTest, ConstructorRejectsNonFinite)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(Calculator{ nan }, InvalidInputError);
    EXPECT_THROW(Calculator{ inf }, InvalidInputError);
    EXPECT_THROW(Calculator{ -inf }, InvalidInputError);
}

TEST(CalculatorTest, ChainAndUndoScenario)
{
    Calculator calculator(10);
    EXPECT_EQ(calculator.add(5).multiply(2).value(), 30.0);
    EXPECT_EQ(calculator.undo().value(), 15.0);
    EXPECT_EQ(calculator.undo().value(), 10.0);
    EXPECT_THROW(calculator.undo(), CalculatorError);
    EXPECT_EQ(calculator.value(), 10.0);
    EXPECT_EQ(calculator.historySize(), 1u);
}

TEST(CalculatorTest, HistoryRecordsOperationsAndOperands)
{
    Calculator calculator(2);
    calculator.add(3).subtract(1).multiply(4).divide(2).power(2);

    auto history = calculator.history();
    ASSERT_EQ(history.size(), 6u);
    EXPECT_EQ(history[1].operation, "add");
    EXPECT_EQ(history[2].operation, "subtract");
    EXPECT_EQ(history[3].operation, "multiply");
    EXPECT_EQ(history[4].operation, "divide");
    EXPECT_EQ(history[5].operation, "power");
    ASSERT_EQ(history[1].operands.size(), 1u);
    EXPECT_EQ(history[1].operands[0], 3.0);
    EXPECT_EQ(history[4].value, 8.0);
    EXPECT_EQ(calculator.value(), 64.0);
    expectConsistent(calculator);
}

TEST(CalculatorTest, HistoryIsSnapshot)
{
    Calculator calculator(1);
    auto snapshot = calculator.history();
    calculator.add(1);
    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(calculator.historySize(), 2u);
}

TEST(CalculatorTest, SetRecordsSingleOperand)
{
    Calculator calculator(5);
    calculator.set(-12.5);
    EXPECT_EQ(calculator.value(), -12.5);
    auto history = calculator.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].operation, "set");
    ASSERT_EQ(history[1].operands.size(), 1u);
    EXPECT_EQ(history[1].operands[0], -12.5);
    EXPECT_THROW(calculator.set(std::numeric_limits<double>::quiet_NaN()), InvalidInputError);
    EXPECT_EQ(calculator.value(), -12.5);
}

TEST(CalculatorTest, ClearResetsHistory)
{
    Calculator calculator(7);
    calculator.add(100).multiply(2).clear();
    EXPECT_EQ(calculator.value(), 0.0);
    auto history = calculator.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].operation, "clear");
    EXPECT_TRUE(history[0].operands.empty());
    // Запись "clear" становится начальной и не отменяется
    EXPECT_THROW(calculator.undo(), CalculatorError);
}

TEST(CalculatorTest, UndoOnFreshInstanceFails)
{
    Calculator calculator(3);
    try {
        calculator.undo();
        FAIL() << "expected CalculatorError";
    }
    catch (const CalculatorError& error) {
        EXPECT_EQ(error.message(), "Нечего отменять");
    }
}

TEST(CalculatorTest, UndoRestoresSetValue)
{
    Calculator calculator(1);
    calculator.set(50).add(1);
    EXPECT_EQ(calculator.undo().value(), 50.0);
    EXPECT_EQ(calculator.undo().value(), 1.0);
}

TEST(CalculatorTest, FailedDivisionLeavesStateUnchanged)
{
    Calculator calculator(10);
    calculator.add(5);
    try {
        calculator.divide(0);
        FAIL() << "expected DivisionByZeroError";
    }
    catch (const DivisionByZeroError& error) {
        EXPECT_EQ(error.numerator(), 15.0);
    }
    EXPECT_EQ(calculator.value(), 15.0);
    EXPECT_EQ(calculator.historySize(), 2u);
    expectConsistent(calculator);
}

TEST(CalculatorTest, FailedOperationsPropagateOriginalErrors)
{
    Calculator calculator(1e308);
    EXPECT_THROW(calculator.multiply(10), OverflowError);
    EXPECT_THROW(calculator.add(1e308), OverflowError);
    EXPECT_THROW(calculator.add(std::numeric_limits<double>::infinity()), InvalidInputError);
    EXPECT_EQ(calculator.value(), 1e308);
    EXPECT_EQ(calculator.historySize(), 1u);

    Calculator zero;
    EXPECT_THROW(zero.power(-1), InvalidInputError);
    Calculator negative(-2);
    EXPECT_THROW(negative.power(0.5), InvalidInputError);
    EXPECT_EQ(negative.value(), -2.0);
}

TEST(CalculatorTest, CopyIsIndependent)
{
    Calculator original(10);
    original.add(5);
    Calculator copied = original.copy();

    EXPECT_EQ(copied.value(), 15.0);
    EXPECT_EQ(copied.history(), original.history());

    copied.multiply(3);
    EXPECT_EQ(original.value(), 15.0);
    EXPECT_EQ(original.historySize(), 2u);

    original.undo();
    EXPECT_EQ(copied.value(), 45.0);
    EXPECT_EQ(copied.historySize(), 3u);
    EXPECT_EQ(copied.undo().value(), 15.0);
}

TEST(CalculatorTest, EqualityUsesValueOnly)
{
    Calculator a(10);
    Calculator b(5);
    b.add(5);
    EXPECT_TRUE(a == b);
    EXPECT_NE(a.historySize(), b.historySize());
    b.add(1);
    EXPECT_FALSE(a == b);
}

TEST(CalculatorTest, HashIsConsistentWithEquality)
{
    Calculator a(10);
    Calculator b(4);
    b.add(6);
    std::hash<Calculator> hasher;
    EXPECT_EQ(hasher(a), hasher(b));

    Calculator positiveZero(0.0);
    Calculator negativeZero(-0.0);
    EXPECT_TRUE(positiveZero == negativeZero);
    EXPECT_EQ(hasher(positiveZero), hasher(negativeZero));

    std::unordered_set<Calculator> set{ a, b };
    EXPECT_EQ(set.size(), 1u);
}

TEST(CalculatorTest, TextRepresentation)
{
    Calculator calculator(10);
    calculator.add(5).multiply(2);
    EXPECT_EQ(calculator.toString(), "Calculator(value=30, history_len=3)");

    auto history = calculator.history();
    EXPECT_EQ(history[0].toString(), "init() = 10");
    EXPECT_EQ(history[1].toString(), "add(5) = 15");
}
