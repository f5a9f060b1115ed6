#pragma once

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Режим однократного округления
 */
enum class RoundingMode {
    DOWN,       ///< Отбросить дробный остаток (к нулю)
    HALF_UP     ///< Половина и больше — от нуля
};

/**
 * @brief Денежное значение с фиксированной точкой
 *
 * Хранит значение в микро-единицах (10^-6) в int64_t.
 * Сложение и вычитание точные. Умножение и деление на проценты
 * выполняются через 128-битное промежуточное значение с ОДНИМ
 * округлением в конце (mulDiv), поэтому двойного округления не бывает.
 *
 * double для денег не используется нигде.
 *
 * @example
 * ```cpp
 * auto loss = Decimal::parse("95");
 * auto payable = loss.mulDiv(Decimal::parse("10"), Decimal::hundred(), 1, RoundingMode::DOWN);
 * // payable == 9.5
 * ```
 */
class Decimal {
public:
    static constexpr int SCALE = 6;
    static constexpr int64_t MICROS_PER_UNIT = 1000000;

    Decimal() = default;

    static Decimal fromMicros(int64_t micros) {
        Decimal d;
        d.micros_ = micros;
        return d;
    }

    static Decimal fromUnits(int64_t units) {
        if (units > MAX_UNITS || units < -MAX_UNITS) {
            throw std::overflow_error("Decimal overflow: " + std::to_string(units));
        }
        return fromMicros(units * MICROS_PER_UNIT);
    }

    static Decimal zero() { return Decimal(); }
    static Decimal hundred() { return fromUnits(100); }

    /**
     * @brief Разобрать строку вида "-123.45"
     *
     * Больше SCALE значащих знаков после точки — ошибка,
     * молча округлять входные деньги нельзя.
     *
     * @throws std::invalid_argument при неверном формате
     * @throws std::overflow_error при переполнении
     */
    static Decimal parse(const std::string& str) {
        if (str.empty()) {
            throw std::invalid_argument("Empty decimal value");
        }

        size_t pos = 0;
        bool negative = false;
        if (str[0] == '-' || str[0] == '+') {
            negative = (str[0] == '-');
            pos = 1;
        }

        int64_t units = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDot = false;
        bool seenDigit = false;

        for (; pos < str.size(); ++pos) {
            char c = str[pos];
            if (c == '.') {
                if (seenDot) {
                    throw std::invalid_argument("Invalid decimal: " + str);
                }
                seenDot = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid decimal: " + str);
            }
            seenDigit = true;
            int digit = c - '0';
            if (!seenDot) {
                if (units > (MAX_UNITS - digit) / 10) {
                    throw std::overflow_error("Decimal overflow: " + str);
                }
                units = units * 10 + digit;
            } else if (fractionDigits < SCALE) {
                fraction = fraction * 10 + digit;
                ++fractionDigits;
            } else if (digit != 0) {
                throw std::invalid_argument("More than 6 decimal places: " + str);
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid decimal: " + str);
        }

        while (fractionDigits < SCALE) {
            fraction *= 10;
            ++fractionDigits;
        }

        int64_t micros = units * MICROS_PER_UNIT + fraction;
        return fromMicros(negative ? -micros : micros);
    }

    int64_t micros() const { return micros_; }

    /**
     * @brief Каноническая строка: минимум 2 знака после точки, без хвостовых нулей
     *
     * 100 → "100.00", 9.5 → "9.50", 10.005 → "10.005"
     */
    std::string toString() const {
        return format(2, true);
    }

    /**
     * @brief Строка с ровно decimals знаками (значение должно быть уже округлено)
     */
    std::string toString(int decimals) const {
        return round(decimals, RoundingMode::DOWN).format(decimals, false);
    }

    /**
     * @brief Округлить до decimals знаков после точки
     */
    Decimal round(int decimals, RoundingMode mode) const {
        int64_t step = pow10(SCALE - checkDecimals(decimals));
        return fromMicros(static_cast<int64_t>(divideRounded(micros_, step, mode)) * step);
    }

    /**
     * @brief this × num / den с одним округлением до decimals знаков
     *
     * Промежуточный результат точный (128 бит).
     *
     * @throws std::domain_error если den == 0
     * @throws std::overflow_error если результат не помещается в int64
     */
    Decimal mulDiv(const Decimal& num, const Decimal& den,
                   int decimals = SCALE, RoundingMode mode = RoundingMode::DOWN) const {
        if (den.micros_ == 0) {
            throw std::domain_error("Decimal division by zero");
        }
        int64_t step = pow10(SCALE - checkDecimals(decimals));
        __int128 numerator = static_cast<__int128>(micros_) * num.micros_;
        __int128 denominator = static_cast<__int128>(den.micros_) * step;
        __int128 result = divideRounded(numerator, denominator, mode) * step;
        if (result > std::numeric_limits<int64_t>::max() ||
            result < std::numeric_limits<int64_t>::min()) {
            throw std::overflow_error("Decimal overflow in mulDiv");
        }
        return fromMicros(static_cast<int64_t>(result));
    }

    /**
     * @brief Точное сравнение a×b и c×d без округления
     * @return -1, 0 или 1
     */
    static int compareProducts(const Decimal& a, const Decimal& b,
                               const Decimal& c, const Decimal& d) {
        __int128 lhs = static_cast<__int128>(a.micros_) * b.micros_;
        __int128 rhs = static_cast<__int128>(c.micros_) * d.micros_;
        if (lhs < rhs) return -1;
        if (lhs > rhs) return 1;
        return 0;
    }

    bool isZero() const { return micros_ == 0; }
    bool isNegative() const { return micros_ < 0; }
    bool isPositive() const { return micros_ > 0; }

    Decimal abs() const { return micros_ < 0 ? -*this : *this; }

    static Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }
    static Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }

    Decimal operator+(const Decimal& other) const {
        int64_t result = 0;
        if (__builtin_add_overflow(micros_, other.micros_, &result)) {
            throw std::overflow_error("Decimal overflow in addition");
        }
        return fromMicros(result);
    }

    Decimal operator-(const Decimal& other) const {
        int64_t result = 0;
        if (__builtin_sub_overflow(micros_, other.micros_, &result)) {
            throw std::overflow_error("Decimal overflow in subtraction");
        }
        return fromMicros(result);
    }

    Decimal operator-() const { return fromMicros(-micros_); }

    Decimal& operator+=(const Decimal& other) { return *this = *this + other; }
    Decimal& operator-=(const Decimal& other) { return *this = *this - other; }

    bool operator==(const Decimal& other) const { return micros_ == other.micros_; }
    bool operator!=(const Decimal& other) const { return micros_ != other.micros_; }
    bool operator<(const Decimal& other) const { return micros_ < other.micros_; }
    bool operator>(const Decimal& other) const { return micros_ > other.micros_; }
    bool operator<=(const Decimal& other) const { return micros_ <= other.micros_; }
    bool operator>=(const Decimal& other) const { return micros_ >= other.micros_; }

    friend std::ostream& operator<<(std::ostream& os, const Decimal& d) {
        return os << d.toString();
    }

private:
    static constexpr int64_t MAX_UNITS = std::numeric_limits<int64_t>::max() / MICROS_PER_UNIT - 1;

    int64_t micros_ = 0;

    static int checkDecimals(int decimals) {
        if (decimals < 0 || decimals > SCALE) {
            throw std::invalid_argument("Unsupported decimal places: " + std::to_string(decimals));
        }
        return decimals;
    }

    static constexpr int64_t pow10(int exp) {
        int64_t result = 1;
        for (int i = 0; i < exp; ++i) {
            result *= 10;
        }
        return result;
    }

    static __int128 divideRounded(__int128 numerator, __int128 denominator, RoundingMode mode) {
        if (denominator < 0) {
            numerator = -numerator;
            denominator = -denominator;
        }
        __int128 quotient = numerator / denominator;
        __int128 remainder = numerator % denominator;
        if (mode == RoundingMode::HALF_UP && remainder != 0) {
            __int128 twice = (remainder < 0 ? -remainder : remainder) * 2;
            if (twice >= denominator) {
                quotient += (numerator < 0) ? -1 : 1;
            }
        }
        return quotient;
    }

    std::string format(int minDecimals, bool trimZeros) const {
        uint64_t absMicros = micros_ < 0
            ? static_cast<uint64_t>(-(micros_ + 1)) + 1
            : static_cast<uint64_t>(micros_);
        uint64_t units = absMicros / MICROS_PER_UNIT;
        std::string digits = std::to_string(absMicros % MICROS_PER_UNIT);
        digits.insert(0, SCALE - digits.size(), '0');

        if (trimZeros) {
            while (digits.size() > static_cast<size_t>(minDecimals) && digits.back() == '0') {
                digits.pop_back();
            }
        } else {
            digits.resize(minDecimals);
        }

        std::string result = (micros_ < 0 ? "-" : "") + std::to_string(units);
        if (!digits.empty()) {
            result += "." + digits;
        }
        return result;
    }
};

} // namespace ledger::domain
