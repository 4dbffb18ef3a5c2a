#pragma once

#include "domain/Money.hpp"
#include "domain/CommissionRate.hpp"
#include <string>
#include <vector>
#include <optional>

namespace escrow::domain {

/**
 * @brief Доля одного продавца в оплаченном заказе
 */
struct SellerShare {
    std::string storeId;
    std::optional<std::string> shipmentId;
    Money amount;
    std::optional<Money> shippingAmount;
    // Если не задана, применяется ставка по умолчанию из EscrowSettings
    std::optional<CommissionRate> commissionRate;
};

/**
 * @brief Подтверждение оплаты заказа (событие order.payment_confirmed)
 */
struct PaymentConfirmation {
    std::string orderId;
    std::string buyerId;
    Money totalAmount;
    std::string currency;
    std::string paymentTransactionId;
    std::vector<SellerShare> sellerShares;
};

} // namespace escrow::domain
