#pragma once

#include "domain/EscrowErrors.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace escrow::domain {

/**
 * @brief Расчётный период (календарный месяц UTC)
 *
 * Границы: [первое число месяца, первое число следующего месяца).
 */
struct SettlementPeriod {
    static constexpr int MIN_YEAR = 2020;
    static constexpr int MAX_YEAR = 2100;

    int year = MIN_YEAR;
    int month = 1;

    /**
     * @throws InvalidArgumentException год вне [2020, 2100] или месяц вне [1, 12]
     */
    static SettlementPeriod of(int year, int month) {
        if (year < MIN_YEAR || year > MAX_YEAR) {
            throw InvalidArgumentException(
                "Year must be between " + std::to_string(MIN_YEAR) + " and " + std::to_string(MAX_YEAR) + ".");
        }
        if (month < 1 || month > 12) {
            throw InvalidArgumentException("Month must be between 1 and 12.");
        }
        SettlementPeriod period;
        period.year = year;
        period.month = month;
        return period;
    }

    Timestamp start() const { return Timestamp::startOfMonthUtc(year, month); }
    Timestamp end() const { return Timestamp::startOfNextMonthUtc(year, month); }

    bool contains(const Timestamp& ts) const {
        return ts >= start() && ts < end();
    }

    // "202501"
    std::string code() const {
        std::string mm = month < 10 ? "0" + std::to_string(month) : std::to_string(month);
        return std::to_string(year) + mm;
    }

    int ordinal() const { return year * 12 + (month - 1); }

    bool operator==(const SettlementPeriod& other) const { return ordinal() == other.ordinal(); }
    bool operator<(const SettlementPeriod& other) const { return ordinal() < other.ordinal(); }
    bool operator<=(const SettlementPeriod& other) const { return ordinal() <= other.ordinal(); }
};

} // namespace escrow::domain
