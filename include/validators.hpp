#pragma once

#include <optional>

namespace calc {

// Границы "безопасных" значений
constexpr double kMaxSafeValue = 1e308;
constexpr double kMinSafeValue = -1e308;

// Проверка, что значение является конечным числом.
// Возвращает значение без изменений.
// Выбрасывает InvalidInputError для NaN и бесконечностей.
double validateNumber(double value);

// Проверка положительности. Ноль допускается только при allowZero == true,
// отрицательные значения отклоняются всегда.
double validatePositive(double value, bool allowZero = false);

// Проверка на ненулевое значение (точное сравнение, без эпсилона)
double validateNonZero(double value);

// Проверка попадания в диапазон [minValue, maxValue] или (minValue, maxValue).
// Отсутствующая граница означает отсутствие ограничения с этой стороны.
// Выбрасывает OutOfRangeError.
double validateRange(double value,
                     std::optional<double> minValue = std::nullopt,
                     std::optional<double> maxValue = std::nullopt,
                     bool inclusive = true);

} // namespace calc
