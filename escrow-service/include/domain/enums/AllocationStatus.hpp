#pragma once

#include <string>

namespace escrow::domain {

enum class AllocationStatus {
    CREATED,
    ELIGIBLE,
    PARTIAL_RELEASE,
    RELEASED,
    PARTIAL_REFUND,
    REFUNDED
};

inline std::string toString(AllocationStatus status) {
    switch (status) {
        case AllocationStatus::CREATED: return "CREATED";
        case AllocationStatus::ELIGIBLE: return "ELIGIBLE";
        case AllocationStatus::PARTIAL_RELEASE: return "PARTIAL_RELEASE";
        case AllocationStatus::RELEASED: return "RELEASED";
        case AllocationStatus::PARTIAL_REFUND: return "PARTIAL_REFUND";
        case AllocationStatus::REFUNDED: return "REFUNDED";
        default: return "UNKNOWN";
    }
}

inline AllocationStatus parseAllocationStatus(const std::string& str) {
    if (str == "ELIGIBLE") return AllocationStatus::ELIGIBLE;
    if (str == "PARTIAL_RELEASE") return AllocationStatus::PARTIAL_RELEASE;
    if (str == "RELEASED") return AllocationStatus::RELEASED;
    if (str == "PARTIAL_REFUND") return AllocationStatus::PARTIAL_REFUND;
    if (str == "REFUNDED") return AllocationStatus::REFUNDED;
    return AllocationStatus::CREATED;
}

inline bool isTerminal(AllocationStatus status) {
    return status == AllocationStatus::RELEASED || status == AllocationStatus::REFUNDED;
}

} // namespace escrow::domain
