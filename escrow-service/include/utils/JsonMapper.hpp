#pragma once

#include "domain/EscrowPayment.hpp"
#include "domain/EscrowLedger.hpp"
#include "domain/EscrowOperationResult.hpp"
#include "domain/SellerBalance.hpp"
#include "domain/LedgerReplay.hpp"
#include "domain/Settlement.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace escrow::utils {

/**
 * @brief Преобразование доменных объектов в JSON (HTTP ответы и события)
 *
 * Суммы передаются десятичной строкой ("12.30") рядом с полем currency,
 * чтобы не терять точность на double.
 */
class JsonMapper {
public:
    template<typename T>
    static nlohmann::json optional(const std::optional<T>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    static nlohmann::json optional(const std::optional<domain::Timestamp>& value) {
        return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
    }

    /**
     * @brief Сумма из JSON: строка "12.30" или число 12.3
     * @throws InvalidArgumentException для других типов
     */
    static domain::Money parseMoney(const nlohmann::json& value, const std::string& currency) {
        if (value.is_string()) {
            return domain::Money::parse(value.get<std::string>(), currency);
        }
        if (value.is_number()) {
            return domain::Money::fromDouble(value.get<double>(), currency);
        }
        throw domain::InvalidArgumentException("Amount must be a decimal string or a number");
    }

    static std::optional<std::string> optionalString(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || body[key].is_null()) {
            return std::nullopt;
        }
        return body[key].get<std::string>();
    }

    static nlohmann::json toJson(const domain::EscrowAllocation& allocation) {
        nlohmann::json j;
        j["allocation_id"] = allocation.id();
        j["escrow_payment_id"] = allocation.escrowPaymentId();
        j["store_id"] = allocation.storeId();
        j["shipment_id"] = optional(allocation.shipmentId());
        j["total_amount"] = allocation.totalAmount().toString();
        j["shipping_amount"] = allocation.shippingAmount().toString();
        j["commission_rate"] = allocation.commissionRate().toString();
        j["commission_amount"] = allocation.commissionAmount().toString();
        j["seller_payout"] = allocation.sellerPayout().toString();
        j["released_amount"] = allocation.releasedAmount().toString();
        j["refunded_amount"] = allocation.refundedAmount().toString();
        j["remaining_share"] = allocation.remainingShare().toString();
        j["currency"] = allocation.currency();
        j["status"] = domain::toString(allocation.status());
        j["payout_reference"] = optional(allocation.payoutReference());
        j["refund_reference"] = optional(allocation.refundReference());
        j["created_at"] = allocation.createdAt().toString();
        j["updated_at"] = allocation.updatedAt().toString();
        j["eligible_at"] = optional(allocation.eligibleAt());
        j["released_at"] = optional(allocation.releasedAt());
        j["refunded_at"] = optional(allocation.refundedAt());
        return j;
    }

    static nlohmann::json toJson(const domain::EscrowPayment& payment) {
        nlohmann::json j;
        j["escrow_payment_id"] = payment.id();
        j["order_id"] = payment.orderId();
        j["buyer_id"] = payment.buyerId();
        j["total_amount"] = payment.totalAmount().toString();
        j["released_amount"] = payment.releasedAmount().toString();
        j["refunded_amount"] = payment.refundedAmount().toString();
        j["remaining_balance"] = payment.remainingBalance().toString();
        j["currency"] = payment.currency();
        j["payment_transaction_id"] = payment.paymentTransactionId();
        j["status"] = domain::toString(payment.status());
        j["version"] = payment.version();
        j["created_at"] = payment.createdAt().toString();
        j["updated_at"] = payment.updatedAt().toString();

        j["allocations"] = nlohmann::json::array();
        for (const auto& allocation : payment.allocations()) {
            j["allocations"].push_back(toJson(allocation));
        }
        return j;
    }

    static nlohmann::json toJson(const domain::LedgerEntry& entry) {
        nlohmann::json j;
        j["entry_id"] = entry.id();
        j["sequence"] = entry.sequence();
        j["escrow_payment_id"] = entry.escrowPaymentId();
        j["allocation_id"] = optional(entry.allocationId());
        j["order_id"] = entry.orderId();
        j["store_id"] = optional(entry.storeId());
        j["buyer_id"] = entry.buyerId();
        j["action"] = domain::toString(entry.action());
        j["amount"] = entry.amount().toString();
        j["currency"] = entry.currency();
        j["balance_after"] = entry.balanceAfter().toString();
        j["external_reference"] = optional(entry.externalReference());
        j["notes"] = optional(entry.notes());
        j["initiated_by"] = entry.initiatedBy();
        j["created_at"] = entry.createdAt().toString();
        return j;
    }

    static nlohmann::json toJson(const domain::EscrowOperationResult& result) {
        nlohmann::json j;
        j["escrow_payment_id"] = result.escrowPaymentId;
        j["allocation_id"] = result.allocationId;
        j["action"] = domain::toString(result.action);
        j["amount"] = result.amount.toString();
        j["currency"] = result.amount.currency();
        j["allocation_status"] = domain::toString(result.allocationStatus);
        j["escrow_status"] = domain::toString(result.escrowStatus);
        j["balance_after"] = result.balanceAfter.toString();
        j["ledger_entry_id"] = result.ledgerEntryId;
        return j;
    }

    static nlohmann::json toJson(const domain::SellerBalance& balance) {
        nlohmann::json j;
        j["store_id"] = balance.storeId;
        j["currency"] = balance.currency;
        j["total_held"] = balance.totalHeld.toString();
        j["total_eligible"] = balance.totalEligible.toString();
        j["pending_commission"] = balance.pendingCommission.toString();
        j["released"] = balance.released.toString();
        j["refunded"] = balance.refunded.toString();
        j["held_allocations"] = balance.heldAllocations;
        j["eligible_allocations"] = balance.eligibleAllocations;
        return j;
    }

    static nlohmann::json toJson(const domain::ReconciliationResult& result) {
        nlohmann::json j;
        j["escrow_payment_id"] = result.escrowPaymentId;
        j["consistent"] = result.consistent();
        j["entries"] = result.totals.entryCount;
        j["ledger_released"] = result.totals.released.toString();
        j["ledger_refunded"] = result.totals.refunded.toString();
        j["ledger_balance_after"] = result.totals.lastBalanceAfter
            ? nlohmann::json(result.totals.lastBalanceAfter->toString())
            : nlohmann::json(nullptr);
        j["payment_released"] = result.expectedReleased.toString();
        j["payment_refunded"] = result.expectedRefunded.toString();
        j["payment_balance"] = result.expectedBalance.toString();
        j["discrepancies"] = result.discrepancies;
        return j;
    }

    static nlohmann::json toJson(const domain::SettlementItem& item) {
        nlohmann::json j;
        j["item_id"] = item.id();
        j["escrow_allocation_id"] = item.escrowAllocationId();
        j["shipment_id"] = optional(item.shipmentId());
        j["order_number"] = item.orderNumber();
        j["seller_amount"] = item.sellerAmount().toString();
        j["shipping_amount"] = item.shippingAmount().toString();
        j["commission_amount"] = item.commissionAmount().toString();
        j["refunded_amount"] = item.refundedAmount().toString();
        j["net_amount"] = item.netAmount().toString();
        j["transaction_date"] = item.transactionDate().toString();
        return j;
    }

    static nlohmann::json toJson(const domain::SettlementAdjustment& adjustment) {
        nlohmann::json j;
        j["adjustment_id"] = adjustment.id();
        j["original_year"] = adjustment.originalYear();
        j["original_month"] = adjustment.originalMonth();
        j["amount"] = adjustment.amount().toString();
        j["currency"] = adjustment.amount().currency();
        j["reason"] = adjustment.reason();
        j["related_order_id"] = optional(adjustment.relatedOrderId());
        j["related_order_number"] = optional(adjustment.relatedOrderNumber());
        j["created_at"] = adjustment.createdAt().toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Settlement& settlement) {
        nlohmann::json j;
        j["settlement_id"] = settlement.id();
        j["settlement_number"] = settlement.settlementNumber();
        j["store_id"] = settlement.storeId();
        j["year"] = settlement.year();
        j["month"] = settlement.month();
        j["period_start"] = settlement.periodStart().toString();
        j["period_end"] = settlement.periodEnd().toString();
        j["currency"] = settlement.currency();
        j["status"] = domain::toString(settlement.status());
        j["gross_sales"] = settlement.grossSales().toString();
        j["total_shipping"] = settlement.totalShipping().toString();
        j["total_commission"] = settlement.totalCommission().toString();
        j["total_refunds"] = settlement.totalRefunds().toString();
        j["total_adjustments"] = settlement.totalAdjustments().toString();
        j["net_payable"] = settlement.netPayable().toString();
        j["order_count"] = settlement.orderCount();
        j["approved_by"] = optional(settlement.approvedBy());
        j["approved_at"] = optional(settlement.approvedAt());
        j["exported_at"] = optional(settlement.exportedAt());
        j["notes"] = optional(settlement.notes());
        j["created_at"] = settlement.createdAt().toString();

        j["items"] = nlohmann::json::array();
        for (const auto& item : settlement.items()) {
            j["items"].push_back(toJson(item));
        }
        j["adjustments"] = nlohmann::json::array();
        for (const auto& adjustment : settlement.adjustments()) {
            j["adjustments"].push_back(toJson(adjustment));
        }
        return j;
    }
};

} // namespace escrow::utils
