// include/domain/Timestamp.hpp
#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>

namespace escrow::domain {

/**
 * @brief Временная метка (UTC, точность: миллисекунды)
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    /**
     * @brief Полночь UTC первого дня месяца
     *
     * Не зависит от локальной таймзоны (в отличие от std::mktime).
     */
    static Timestamp startOfMonthUtc(int year, int month) {
        return fromUnixMillis(daysFromCivil(year, month, 1) * 86400LL * 1000LL);
    }

    /**
     * @brief Полночь UTC первого дня следующего месяца
     */
    static Timestamp startOfNextMonthUtc(int year, int month) {
        return month == 12 ? startOfMonthUtc(year + 1, 1) : startOfMonthUtc(year, month + 1);
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief ISO 8601: "2025-12-16T10:30:00.123Z"
     */
    std::string toString() const {
        int64_t millis = toUnixMillis();
        int64_t ms = ((millis % 1000) + 1000) % 1000;
        std::time_t seconds = static_cast<std::time_t>((millis - ms) / 1000);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << "." << std::setw(3) << std::setfill('0') << ms << "Z";
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }

private:
    // Howard Hinnant, days_from_civil
    static int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }
};

} // namespace escrow::domain
