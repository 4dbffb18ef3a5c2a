#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace escrow::settings::env {

/**
 * @brief Значение переменной окружения или fallback, если она не задана или пуста
 */
inline std::string text(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

/**
 * @brief Целое из ENV в диапазоне [min, max]
 *
 * @throws std::invalid_argument если значение не число или вне диапазона
 */
inline long long integer(const char* name, long long fallback, long long min, long long max) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }

    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + value);
    }
    if (consumed != std::string(value).size()) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + value);
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument(std::string(name) + " must be in [" + std::to_string(min) + ", " +
                                    std::to_string(max) + "]: " + value);
    }
    return parsed;
}

inline double decimal(const char* name, double fallback, double min, double max) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }

    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + value);
    }
    if (consumed != std::string(value).size() || parsed < min || parsed > max) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + value);
    }
    return parsed;
}

} // namespace escrow::settings::env
