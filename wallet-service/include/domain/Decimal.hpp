#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <cstdint>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Десятичное число с фиксированной точкой (9 знаков после запятой)
 *
 * Хранит значение как целую часть (units) и дробную часть в нано-единицах
 * (nano, 10^-9). Инвариант нормализации: 0 <= nano < 10^9, знак несёт units.
 * Например, -1.5 хранится как units=-2, nano=500000000.
 *
 * Сложение и сравнение точные. Умножение выполняется в целых числах
 * произвольной разрядности с округлением half-up (от нуля) на 9-м знаке,
 * поэтому при цепочке операций нет накопления ошибки double.
 */
class Decimal {
public:
    static constexpr int64_t NANO_FACTOR = 1000000000;

    int64_t units = 0;  // Целая часть
    int32_t nano = 0;   // Дробная часть (10^-9), всегда в [0, 10^9)

    Decimal() = default;

    Decimal(int64_t u, int32_t n) {
        assignFromNanos(BigInt(u) * NANO_FACTOR + n);
    }

    static Decimal fromUnits(int64_t value) {
        return Decimal(value, 0);
    }

    /**
     * @brief Создать из double с округлением до ближайшей нано-единицы
     * @throws std::invalid_argument для NaN/inf
     * @throws std::overflow_error если не помещается в int64
     */
    static Decimal fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Decimal::fromDouble: value is not finite");
        }
        double whole = std::floor(value);
        if (whole >= static_cast<double>(std::numeric_limits<int64_t>::max()) ||
            whole < static_cast<double>(std::numeric_limits<int64_t>::min())) {
            throw std::overflow_error("Decimal::fromDouble: value out of range");
        }
        auto fraction = static_cast<int64_t>(std::llround((value - whole) * NANO_FACTOR));
        Decimal d;
        d.assignFromNanos(BigInt(static_cast<int64_t>(whole)) * NANO_FACTOR + fraction);
        return d;
    }

    /**
     * @brief Разобрать строку вида "-123.456"
     * @throws std::invalid_argument если строка не является числом
     */
    static Decimal fromString(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Decimal::fromString: empty string");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            pos = 1;
        }

        BigInt whole = 0;
        BigInt fraction = 0;
        int fractionDigits = 0;
        bool seenDigit = false;
        bool seenDot = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seenDot) {
                    throw std::invalid_argument("Decimal::fromString: invalid number '" + text + "'");
                }
                seenDot = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Decimal::fromString: invalid number '" + text + "'");
            }
            seenDigit = true;
            if (!seenDot) {
                whole = whole * 10 + (c - '0');
            } else if (fractionDigits < 9) {
                fraction = fraction * 10 + (c - '0');
                ++fractionDigits;
            }
            // Знаки после 9-го отбрасываются
        }

        if (!seenDigit) {
            throw std::invalid_argument("Decimal::fromString: invalid number '" + text + "'");
        }

        for (int i = fractionDigits; i < 9; ++i) {
            fraction *= 10;
        }

        BigInt nanos = whole * NANO_FACTOR + fraction;
        Decimal d;
        d.assignFromNanos(negative ? BigInt(-nanos) : nanos);
        return d;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    /**
     * @brief Строковое представление без лишних нулей ("85", "0.85", "-1.5")
     */
    std::string toString() const {
        BigInt nanos = totalNanos();
        bool negative = nanos < 0;
        if (negative) {
            nanos = -nanos;
        }

        BigInt whole = nanos / NANO_FACTOR;
        BigInt rest = nanos % NANO_FACTOR;
        auto fraction = static_cast<int64_t>(rest);

        std::string result = negative ? "-" : "";
        result += whole.str();

        if (fraction != 0) {
            std::string digits = std::to_string(fraction);
            digits.insert(0, 9 - digits.size(), '0');
            while (!digits.empty() && digits.back() == '0') {
                digits.pop_back();
            }
            result += "." + digits;
        }
        return result;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isNegative() const { return units < 0; }
    bool isPositive() const { return !isNegative() && !isZero(); }

    Decimal operator+(const Decimal& other) const {
        Decimal result;
        result.assignFromNanos(totalNanos() + other.totalNanos());
        return result;
    }

    Decimal operator-(const Decimal& other) const {
        Decimal result;
        result.assignFromNanos(totalNanos() - other.totalNanos());
        return result;
    }

    /**
     * @brief Произведение с округлением half-up на 9-м знаке
     */
    Decimal operator*(const Decimal& other) const {
        BigInt product = totalNanos() * other.totalNanos();
        BigInt quotient = product / NANO_FACTOR;
        BigInt remainder = product % NANO_FACTOR;

        // Округление от нуля при остатке >= 0.5 нано
        if (remainder * 2 >= NANO_FACTOR) {
            ++quotient;
        } else if (remainder * 2 <= -NANO_FACTOR) {
            --quotient;
        }

        Decimal result;
        result.assignFromNanos(quotient);
        return result;
    }

    Decimal& operator+=(const Decimal& other) {
        *this = *this + other;
        return *this;
    }

    Decimal& operator-=(const Decimal& other) {
        *this = *this - other;
        return *this;
    }

    bool operator==(const Decimal& other) const {
        return units == other.units && nano == other.nano;
    }

    bool operator!=(const Decimal& other) const { return !(*this == other); }

    bool operator<(const Decimal& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Decimal& other) const { return other < *this; }
    bool operator<=(const Decimal& other) const { return !(other < *this); }
    bool operator>=(const Decimal& other) const { return !(*this < other); }

private:
    using BigInt = boost::multiprecision::cpp_int;

    BigInt totalNanos() const {
        return BigInt(units) * NANO_FACTOR + nano;
    }

    void assignFromNanos(const BigInt& nanos) {
        BigInt whole = nanos / NANO_FACTOR;
        BigInt fraction = nanos % NANO_FACTOR;

        // Нормализация: дробная часть неотрицательна
        if (fraction < 0) {
            fraction += NANO_FACTOR;
            --whole;
        }

        if (whole > std::numeric_limits<int64_t>::max() ||
            whole < std::numeric_limits<int64_t>::min()) {
            throw std::overflow_error("Decimal overflow");
        }

        units = static_cast<int64_t>(whole);
        nano = static_cast<int32_t>(fraction);
    }
};

} // namespace wallet::domain
