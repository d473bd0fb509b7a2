#include "operations.hpp"

#include "errors.hpp"
#include "validators.hpp"

#include <cmath>

namespace calc {

double add(double a, double b) {
    validateNumber(a);
    validateNumber(b);

    double result = a + b;
    if (std::isinf(result)) {
        throw OverflowError("addition", { a, b });
    }
    return result;
}

double subtract(double a, double b) {
    validateNumber(a);
    validateNumber(b);

    double result = a - b;
    if (std::isinf(result)) {
        throw OverflowError("subtraction", { a, b });
    }
    return result;
}

double multiply(double a, double b) {
    validateNumber(a);
    validateNumber(b);

    // Оценка до вычисления: ловит случаи у самой границы диапазона
    if (a != 0 && b != 0 && std::abs(a) > kOverflowThreshold / std::abs(b)) {
        throw OverflowError("multiplication", { a, b });
    }

    double result = a * b;
    if (std::isinf(result)) {
        throw OverflowError("multiplication", { a, b });
    }
    return result;
}

double divide(double a, double b) {
    validateNumber(a);
    validateNumber(b);

    if (b == 0) {
        throw DivisionByZeroError(a);
    }

    double result = a / b;
    if (std::isinf(result)) {
        throw OverflowError("division", { a, b });
    }
    return result;
}

double safeDivide(double a, double b, double fallback) {
    validateNumber(a);
    validateNumber(b);
    validateNumber(fallback);

    if (b == 0) {
        return fallback;
    }

    double result = a / b;
    if (std::isinf(result)) {
        return fallback;
    }
    return result;
}

double power(double base, double exponent) {
    validateNumber(base);
    validateNumber(exponent);

    if (base == 0 && exponent < 0) {
        throw InvalidInputError({ base, exponent }, "0 нельзя возводить в отрицательную степень");
    }
    if (base < 0 && std::trunc(exponent) != exponent) {
        throw InvalidInputError({ base, exponent },
                                "Отрицательное основание с нецелым показателем");
    }

    double result = std::pow(base, exponent);
    // NaN от std::pow означает ошибку области определения
    if (std::isnan(result)) {
        throw InvalidInputError({ base, exponent }, "Ошибка области определения");
    }
    if (std::isinf(result)) {
        throw OverflowError("exponentiation", { base, exponent });
    }
    return result;
}

double modulo(double a, double b) {
    validateNumber(a);
    validateNumber(b);

    if (b == 0) {
        throw DivisionByZeroError(a);
    }

    double result = std::fmod(a, b);
    if (result != 0) {
        // Знак остатка следует за знаком делителя
        if ((b < 0) != (result < 0)) {
            result += b;
        }
    } else {
        result = std::copysign(0.0, b);
    }
    return result;
}

} // namespace calc
