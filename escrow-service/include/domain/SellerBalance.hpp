#pragma once

#include "domain/Money.hpp"
#include <string>
#include <cstddef>

namespace escrow::domain {

/**
 * @brief Сводка по деньгам продавца, находящимся в escrow
 *
 * Учитываются только незавершённые аллокации (не RELEASED и не REFUNDED):
 * totalHeld: остаток их долей, totalEligible: часть остатка, доступная к выплате,
 * pendingCommission: комиссия, которая будет удержана с остатка.
 * В released/refunded выплаченное и возвращённое по всем аллокациям магазина.
 */
struct SellerBalance {
    static constexpr const char* DEFAULT_CURRENCY = "USD";

    std::string storeId;
    std::string currency;
    Money totalHeld;
    Money totalEligible;
    Money pendingCommission;
    Money released;
    Money refunded;
    size_t heldAllocations = 0;
    size_t eligibleAllocations = 0;
};

} // namespace escrow::domain
