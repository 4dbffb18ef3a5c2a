#pragma once

#include <string>

namespace escrow::domain {

enum class EscrowStatus {
    HELD,
    PARTIALLY_RELEASED,
    RELEASED,
    REFUNDED
};

inline std::string toString(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::HELD: return "HELD";
        case EscrowStatus::PARTIALLY_RELEASED: return "PARTIALLY_RELEASED";
        case EscrowStatus::RELEASED: return "RELEASED";
        case EscrowStatus::REFUNDED: return "REFUNDED";
        default: return "UNKNOWN";
    }
}

inline EscrowStatus parseEscrowStatus(const std::string& str) {
    if (str == "PARTIALLY_RELEASED") return EscrowStatus::PARTIALLY_RELEASED;
    if (str == "RELEASED") return EscrowStatus::RELEASED;
    if (str == "REFUNDED") return EscrowStatus::REFUNDED;
    return EscrowStatus::HELD;
}

} // namespace escrow::domain
