#pragma once

#include "domain/Money.hpp"
#include "domain/enums/AllocationStatus.hpp"
#include "domain/enums/EscrowStatus.hpp"
#include "domain/enums/LedgerAction.hpp"
#include <string>

namespace escrow::domain {

/**
 * @brief Результат выплаты/возврата по аллокации
 */
class EscrowOperationResult {
public:
    std::string escrowPaymentId;
    std::string allocationId;
    LedgerAction action = LedgerAction::RELEASED;
    Money amount;
    AllocationStatus allocationStatus = AllocationStatus::CREATED;
    EscrowStatus escrowStatus = EscrowStatus::HELD;
    Money balanceAfter;
    std::string ledgerEntryId;
};

} // namespace escrow::domain
