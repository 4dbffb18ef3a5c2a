#pragma once

#include "domain/Money.hpp"
#include <string>
#include <cstdint>
#include <cmath>

namespace escrow::domain {

/**
 * @brief Ставка комиссии платформы в процентах, [0, 100]
 *
 * Хранится в десятитысячных долях процента: 10% = 100000, 12.5% = 125000.
 */
class CommissionRate {
public:
    static constexpr int64_t UNITS_PER_PERCENT = 10000;
    static constexpr int64_t MAX_UNITS = 100 * UNITS_PER_PERCENT;

    CommissionRate() = default;

    static CommissionRate fromUnits(int64_t units) {
        if (units < 0 || units > MAX_UNITS) {
            throw InvalidArgumentException("Commission rate must be between 0 and 100.");
        }
        CommissionRate rate;
        rate.units_ = units;
        return rate;
    }

    static CommissionRate fromPercent(double percent) {
        if (!std::isfinite(percent)) {
            throw InvalidArgumentException("Commission rate must be between 0 and 100.");
        }
        return fromUnits(static_cast<int64_t>(std::llround(percent * UNITS_PER_PERCENT)));
    }

    int64_t units() const { return units_; }

    double percent() const {
        return static_cast<double>(units_) / UNITS_PER_PERCENT;
    }

    /**
     * @brief amount × rate / 100, округление half-up до 2 знаков
     */
    Money applyTo(const Money& amount) const {
        constexpr int64_t denominator = 100 * UNITS_PER_PERCENT;
        int64_t minor = amount.minorUnits();
        if (minor == INT64_MIN) {
            throw InvalidArgumentException("Amount too large for commission calculation");
        }
        int64_t absMinor = minor < 0 ? -minor : minor;
        if (units_ != 0 && absMinor > (INT64_MAX - denominator / 2) / units_) {
            throw InvalidArgumentException("Amount too large for commission calculation");
        }
        int64_t product = absMinor * units_;
        int64_t rounded = (product + denominator / 2) / denominator;
        return Money(minor < 0 ? -rounded : rounded, amount.currency());
    }

    std::string toString() const {
        std::string whole = std::to_string(units_ / UNITS_PER_PERCENT);
        int64_t frac = units_ % UNITS_PER_PERCENT;
        if (frac == 0) return whole;

        std::string digits = std::to_string(frac);
        while (digits.size() < 4) digits = "0" + digits;
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        return whole + "." + digits;
    }

    bool operator==(const CommissionRate& other) const { return units_ == other.units_; }
    bool operator!=(const CommissionRate& other) const { return units_ != other.units_; }

private:
    int64_t units_ = 0;
};

} // namespace escrow::domain
