#pragma once

#include <string>

namespace escrow::domain {

enum class SettlementStatus {
    CLOSED,
    APPROVED,
    EXPORTED
};

inline std::string toString(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::CLOSED: return "CLOSED";
        case SettlementStatus::APPROVED: return "APPROVED";
        case SettlementStatus::EXPORTED: return "EXPORTED";
        default: return "UNKNOWN";
    }
}

inline SettlementStatus parseSettlementStatus(const std::string& str) {
    if (str == "APPROVED") return SettlementStatus::APPROVED;
    if (str == "EXPORTED") return SettlementStatus::EXPORTED;
    return SettlementStatus::CLOSED;
}

} // namespace escrow::domain
