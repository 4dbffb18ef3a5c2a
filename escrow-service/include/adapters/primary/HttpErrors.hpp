#pragma once

#include <IResponse.hpp>
#include "domain/EscrowErrors.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <iostream>

namespace escrow::adapters::primary {

/**
 * @brief JSON-ошибка {"error": message}
 */
inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief HTTP статус для доменной ошибки
 *
 * InvalidArgument/CurrencyMismatch → 400, NotFound → 404,
 * InvalidStateTransition → 409, Contention → 503,
 * InsufficientEscrowBalance → 500.
 */
inline int httpStatusFor(domain::ErrorCode code) {
    switch (code) {
        case domain::ErrorCode::INVALID_ARGUMENT:
        case domain::ErrorCode::CURRENCY_MISMATCH:
            return 400;
        case domain::ErrorCode::NOT_FOUND:
            return 404;
        case domain::ErrorCode::INVALID_STATE_TRANSITION:
            return 409;
        case domain::ErrorCode::CONTENTION:
            return 503;
        case domain::ErrorCode::INSUFFICIENT_ESCROW_BALANCE:
        default:
            return 500;
    }
}

inline void sendEscrowError(IResponse& res, const std::string& component, const domain::EscrowException& e) {
    int status = httpStatusFor(e.code());

    nlohmann::json error;
    error["error"] = e.what();
    error["code"] = domain::toString(e.code());
    if (e.isRetryable()) {
        error["retryable"] = true;
    }

    if (status >= 500) {
        std::cerr << "[" << component << "] " << domain::toString(e.code()) << ": " << e.what() << std::endl;
    }
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief Сегменты пути после базового префикса
 *
 * "/api/v1/escrows/esc-1/ledger", "/api/v1/escrows" → {"esc-1", "ledger"}
 */
inline std::vector<std::string> pathSegments(const std::string& path, const std::string& basePath) {
    std::string clean = path.substr(0, path.find('?'));
    std::vector<std::string> segments;
    if (clean.compare(0, basePath.size(), basePath) != 0) {
        return segments;
    }

    size_t pos = basePath.size();
    while (pos < clean.size()) {
        if (clean[pos] == '/') {
            ++pos;
            continue;
        }
        size_t next = clean.find('/', pos);
        if (next == std::string::npos) next = clean.size();
        segments.push_back(clean.substr(pos, next - pos));
        pos = next;
    }
    return segments;
}

} // namespace escrow::adapters::primary
