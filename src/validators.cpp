#include "validators.hpp"

#include "errors.hpp"

#include <cmath>

namespace calc {

double validateNumber(double value) {
    if (std::isnan(value)) {
        throw InvalidInputError(value, "NaN не допускается");
    }
    if (std::isinf(value)) {
        throw InvalidInputError(value, "Бесконечность не допускается");
    }
    return value;
}

double validatePositive(double value, bool allowZero) {
    validateNumber(value);

    if (allowZero) {
        if (value < 0) {
            throw InvalidInputError(value, "Значение должно быть неотрицательным");
        }
    } else if (value <= 0) {
        throw InvalidInputError(value, "Значение должно быть положительным");
    }
    return value;
}

double validateNonZero(double value) {
    validateNumber(value);

    if (value == 0) {
        throw InvalidInputError(value, "Значение не должно быть нулём");
    }
    return value;
}

// Флаг inclusive действует на обе границы одновременно
double validateRange(double value, std::optional<double> minValue,
                     std::optional<double> maxValue, bool inclusive) {
    validateNumber(value);

    if (minValue.has_value()) {
        bool below = inclusive ? value < *minValue : value <= *minValue;
        if (below) {
            throw OutOfRangeError(value, minValue, maxValue);
        }
    }
    if (maxValue.has_value()) {
        bool above = inclusive ? value > *maxValue : value >= *maxValue;
        if (above) {
            throw OutOfRangeError(value, minValue, maxValue);
        }
    }
    return value;
}

} // namespace calc
