#pragma once

#include "domain/EscrowErrors.hpp"
#include <string>
#include <cstdint>
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace escrow::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит значение в минорных единицах (центы): фиксированная точка, 2 знака.
 * Объект неизменяемый: все операции возвращают новый Money.
 * Арифметика между разными валютами запрещена (CurrencyMismatchException).
 */
class Money {
public:
    Money() = default;

    Money(int64_t minorUnits, const std::string& currency)
        : minor_(minorUnits), currency_(normalizeCurrency(currency)) {}

    static Money zero(const std::string& currency) {
        return Money(0, currency);
    }

    static Money fromMinor(int64_t minorUnits, const std::string& currency) {
        return Money(minorUnits, currency);
    }

    /**
     * @brief Из double с округлением half-up до 2 знаков
     *
     * Для точных значений из JSON/HTTP предпочтительнее parse().
     */
    static Money fromDouble(double value, const std::string& currency) {
        if (!std::isfinite(value)) {
            throw InvalidArgumentException("Amount must be a finite number");
        }
        double scaled = value * 100.0;
        // Компенсируем представление 1.005 как 1.00499999...
        scaled += (scaled >= 0) ? 1e-7 : -1e-7;
        if (std::fabs(scaled) >= 9.2e18) {
            throw InvalidArgumentException("Amount out of range");
        }
        return Money(static_cast<int64_t>(std::llround(scaled)), currency);
    }

    /**
     * @brief Разбор десятичной строки ("12", "12.3", "-0.005")
     *
     * Лишние знаки после запятой округляются half-up (от нуля).
     */
    static Money parse(const std::string& text, const std::string& currency) {
        std::string s = trim(text);
        if (s.empty()) {
            throw InvalidArgumentException("Amount is required");
        }

        bool negative = false;
        size_t pos = 0;
        if (s[0] == '-' || s[0] == '+') {
            negative = (s[0] == '-');
            pos = 1;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool roundUp = false;
        bool seenDigit = false;
        bool seenDot = false;

        for (; pos < s.size(); ++pos) {
            char c = s[pos];
            if (c == '.') {
                if (seenDot) {
                    throw InvalidArgumentException("Invalid amount: " + text);
                }
                seenDot = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw InvalidArgumentException("Invalid amount: " + text);
            }
            seenDigit = true;
            int digit = c - '0';
            if (!seenDot) {
                if (whole > (INT64_MAX - digit) / 10 / 100) {
                    throw InvalidArgumentException("Amount too large: " + text);
                }
                whole = whole * 10 + digit;
            } else if (fractionDigits < 2) {
                fraction = fraction * 10 + digit;
                ++fractionDigits;
            } else if (fractionDigits == 2) {
                roundUp = digit >= 5;
                ++fractionDigits;
            }
        }

        if (!seenDigit) {
            throw InvalidArgumentException("Invalid amount: " + text);
        }

        while (fractionDigits < 2) {
            fraction *= 10;
            ++fractionDigits;
        }

        int64_t minor = whole * 100 + fraction + (roundUp ? 1 : 0);
        return Money(negative ? -minor : minor, currency);
    }

    int64_t minorUnits() const { return minor_; }
    const std::string& currency() const { return currency_; }

    double toDouble() const {
        return static_cast<double>(minor_) / 100.0;
    }

    std::string toString() const {
        // uint64_t: модуль INT64_MIN не помещается в int64_t
        uint64_t absMinor = minor_ < 0 ? 0 - static_cast<uint64_t>(minor_) : static_cast<uint64_t>(minor_);
        std::string cents = std::to_string(absMinor % 100);
        if (cents.size() < 2) cents = "0" + cents;
        return (minor_ < 0 ? "-" : "") + std::to_string(absMinor / 100) + "." + cents;
    }

    bool isZero() const { return minor_ == 0; }
    bool isPositive() const { return minor_ > 0; }
    bool isNegative() const { return minor_ < 0; }

    /**
     * @throws InvalidArgumentException при выходе за пределы int64 минорных единиц
     */
    Money operator+(const Money& other) const {
        requireSameCurrency(other);
        int64_t sum = 0;
        if (__builtin_add_overflow(minor_, other.minor_, &sum)) {
            throw InvalidArgumentException("Amount overflow: " + toString() + " + " + other.toString());
        }
        return Money(sum, currency_);
    }

    Money operator-(const Money& other) const {
        requireSameCurrency(other);
        int64_t difference = 0;
        if (__builtin_sub_overflow(minor_, other.minor_, &difference)) {
            throw InvalidArgumentException("Amount overflow: " + toString() + " - " + other.toString());
        }
        return Money(difference, currency_);
    }

    Money operator-() const {
        if (minor_ == INT64_MIN) {
            throw InvalidArgumentException("Amount overflow on negation");
        }
        return Money(-minor_, currency_);
    }

    bool operator<(const Money& other) const {
        requireSameCurrency(other);
        return minor_ < other.minor_;
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator<=(const Money& other) const {
        return !(other < *this);
    }

    bool operator>=(const Money& other) const {
        return !(*this < other);
    }

    bool operator==(const Money& other) const {
        return minor_ == other.minor_ && currency_ == other.currency_;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    static Money min(const Money& a, const Money& b) {
        return (b < a) ? b : a;
    }

    /**
     * @brief Нормализация кода валюты ISO-4217
     * @throws InvalidArgumentException если код не из 3 латинских букв
     */
    static std::string normalizeCurrency(const std::string& currency) {
        std::string code = trim(currency);
        std::transform(code.begin(), code.end(), code.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (code.size() != 3 ||
            !std::all_of(code.begin(), code.end(),
                         [](unsigned char c) { return c >= 'A' && c <= 'Z'; })) {
            throw InvalidArgumentException("Invalid currency code: '" + currency + "'");
        }
        return code;
    }

private:
    int64_t minor_ = 0;
    std::string currency_;

    void requireSameCurrency(const Money& other) const {
        if (currency_ != other.currency_) {
            throw CurrencyMismatchException(currency_, other.currency_);
        }
    }

    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }
};

} // namespace escrow::domain
