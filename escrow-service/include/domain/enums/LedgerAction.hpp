#pragma once

#include <string>

namespace escrow::domain {

enum class LedgerAction {
    CREATED,
    ALLOCATION_CREATED,
    ALLOCATION_ELIGIBLE,
    RELEASED,
    REFUNDED,
    PARTIAL_RELEASE,
    PARTIAL_REFUND
};

inline std::string toString(LedgerAction action) {
    switch (action) {
        case LedgerAction::CREATED: return "CREATED";
        case LedgerAction::ALLOCATION_CREATED: return "ALLOCATION_CREATED";
        case LedgerAction::ALLOCATION_ELIGIBLE: return "ALLOCATION_ELIGIBLE";
        case LedgerAction::RELEASED: return "RELEASED";
        case LedgerAction::REFUNDED: return "REFUNDED";
        case LedgerAction::PARTIAL_RELEASE: return "PARTIAL_RELEASE";
        case LedgerAction::PARTIAL_REFUND: return "PARTIAL_REFUND";
        default: return "UNKNOWN";
    }
}

inline LedgerAction parseLedgerAction(const std::string& str) {
    if (str == "ALLOCATION_CREATED") return LedgerAction::ALLOCATION_CREATED;
    if (str == "ALLOCATION_ELIGIBLE") return LedgerAction::ALLOCATION_ELIGIBLE;
    if (str == "RELEASED") return LedgerAction::RELEASED;
    if (str == "REFUNDED") return LedgerAction::REFUNDED;
    if (str == "PARTIAL_RELEASE") return LedgerAction::PARTIAL_RELEASE;
    if (str == "PARTIAL_REFUND") return LedgerAction::PARTIAL_REFUND;
    return LedgerAction::CREATED;
}

// Движения денег из escrow к продавцу
inline bool isReleaseAction(LedgerAction action) {
    return action == LedgerAction::RELEASED || action == LedgerAction::PARTIAL_RELEASE;
}

// Движения денег из escrow обратно покупателю
inline bool isRefundAction(LedgerAction action) {
    return action == LedgerAction::REFUNDED || action == LedgerAction::PARTIAL_REFUND;
}

} // namespace escrow::domain
