#pragma once

#include "Errors.hpp"
#include <string>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace quotedesk::domain {

/**
 * @brief Денежное значение
 *
 * Хранит целую часть и дробную часть в нано-единицах (10^-9), чтобы
 * суммы по строкам считались без накопления ошибки double.
 * Знаки units и nano всегда совпадают.
 * Переполнение int64 в арифметике бросает ValidationError.
 */
class Money {
public:
    static constexpr int64_t NANO_PER_UNIT = 1000000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)

    Money() = default;

    Money(int64_t u, int32_t n) : units(u), nano(n) {
        normalize();
    }

    static Money fromDouble(double value) {
        // 2^63: первое значение, не представимое в int64
        if (!std::isfinite(value) || std::fabs(value) >= 9223372036854775808.0) {
            throw ValidationError("Amount out of range");
        }
        Money m;
        double whole = std::trunc(value);
        m.units = static_cast<int64_t>(whole);
        m.nano = static_cast<int32_t>(std::llround((value - whole) * 1e9));
        m.normalize();
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isNegative() const {
        return units < 0 || nano < 0;
    }

    bool isZero() const {
        return units == 0 && nano == 0;
    }

    /**
     * @brief Сумма с двумя знаками после запятой: "1234.50"
     */
    std::string toString() const {
        int64_t cents = checkedAdd(checkedMul(units, 100), std::llround(nano / 1e7));
        std::ostringstream ss;
        if (cents < 0) {
            ss << '-';
            cents = -cents;
        }
        ss << cents / 100 << '.' << std::setw(2) << std::setfill('0') << cents % 100;
        return ss.str();
    }

    Money operator+(const Money& other) const {
        return Money(checkedAdd(units, other.units), nano + other.nano);
    }

    Money operator-(const Money& other) const {
        return Money(checkedSub(units, other.units), nano - other.nano);
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    /**
     * @brief Умножение на количество без перехода через double
     */
    Money operator*(int64_t multiplier) const {
        int64_t totalNano = checkedMul(nano, multiplier);
        Money result;
        result.units = checkedAdd(checkedMul(units, multiplier), totalNano / NANO_PER_UNIT);
        result.nano = static_cast<int32_t>(totalNano % NANO_PER_UNIT);
        result.normalize();
        return result;
    }

    bool operator<(const Money& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    static int64_t checkedAdd(int64_t a, int64_t b) {
        int64_t result;
        if (__builtin_add_overflow(a, b, &result)) {
            throw ValidationError("Amount out of range");
        }
        return result;
    }

    static int64_t checkedSub(int64_t a, int64_t b) {
        int64_t result;
        if (__builtin_sub_overflow(a, b, &result)) {
            throw ValidationError("Amount out of range");
        }
        return result;
    }

    static int64_t checkedMul(int64_t a, int64_t b) {
        int64_t result;
        if (__builtin_mul_overflow(a, b, &result)) {
            throw ValidationError("Amount out of range");
        }
        return result;
    }

    void normalize() {
        units = checkedAdd(units, nano / NANO_PER_UNIT);
        nano = static_cast<int32_t>(nano % NANO_PER_UNIT);

        // Приводим знак дробной части к знаку целой
        if (units > 0 && nano < 0) {
            units--;
            nano += static_cast<int32_t>(NANO_PER_UNIT);
        } else if (units < 0 && nano > 0) {
            units++;
            nano -= static_cast<int32_t>(NANO_PER_UNIT);
        }
    }
};

} // namespace quotedesk::domain
