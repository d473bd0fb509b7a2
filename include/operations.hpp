#pragma once

namespace calc {

// Порог для предварительной проверки переполнения при умножении
constexpr double kOverflowThreshold = 1e307;

// Бинарные арифметические операции с защитой от переполнения.
// Все операнды предварительно проверяются через validateNumber.
// Ошибки: InvalidInputError, OverflowError, DivisionByZeroError (см. errors.hpp).

// Сумма a + b. OverflowError, если результат бесконечен
double add(double a, double b);

// Разность a - b. OverflowError, если результат бесконечен
double subtract(double a, double b);

// Произведение a * b.
// Сначала оценивает |a| > kOverflowThreshold / |b| (для ненулевых операндов),
// затем дополнительно проверяет, что произведение конечно.
double multiply(double a, double b);

// Частное a / b. DivisionByZeroError (с делимым a) при b == 0
double divide(double a, double b);

// Как divide, но при делении на ноль и переполнении возвращает fallback.
// fallback сам должен быть конечным числом.
double safeDivide(double a, double b, double fallback = 0.0);

// Возведение в степень.
// InvalidInputError для 0 в отрицательной степени
// и для отрицательного основания с дробным показателем.
double power(double base, double exponent);

// Остаток от деления со знаком делителя: 0 <= r < |b| при b > 0.
// Выполняется a == floor(a / b) * b + modulo(a, b).
double modulo(double a, double b);

} // namespace calc
