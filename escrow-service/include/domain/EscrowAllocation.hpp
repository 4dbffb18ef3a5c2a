#pragma once

#include "domain/Money.hpp"
#include "domain/CommissionRate.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/AllocationStatus.hpp"
#include <string>
#include <optional>

namespace escrow::domain {

enum class AllocationOperation {
    MARK_ELIGIBLE,
    RELEASE,
    REFUND
};

inline std::string toString(AllocationOperation op) {
    switch (op) {
        case AllocationOperation::MARK_ELIGIBLE: return "MARK_ELIGIBLE";
        case AllocationOperation::RELEASE: return "RELEASE";
        case AllocationOperation::REFUND: return "REFUND";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Единственная функция переходов статуса аллокации
 *
 * @param current текущий статус
 * @param op операция
 * @param shareExhausted остаток доли после операции равен нулю
 * @throws InvalidStateTransitionException если операция недопустима
 */
AllocationStatus nextAllocationStatus(AllocationStatus current, AllocationOperation op, bool shareExhausted);

/**
 * @brief Доля одного продавца в escrow-платеже
 *
 * Комиссия = totalAmount × rate (half-up, 2 знака), выплата = total − комиссия.
 * Остаток доли = total − released − refunded; release и refund расходуют
 * один и тот же остаток, пока он не станет нулевым.
 *
 * Изменяется только через EscrowPayment (агрегат-владелец).
 */
class EscrowAllocation {
public:
    /**
     * @brief Полное состояние аллокации для загрузки из хранилища
     */
    struct Data {
        std::string id;
        std::string escrowPaymentId;
        std::string storeId;
        std::optional<std::string> shipmentId;
        Money totalAmount;
        Money shippingAmount;
        CommissionRate commissionRate;
        Money commissionAmount;
        Money sellerPayout;
        Money releasedAmount;
        Money refundedAmount;
        AllocationStatus status = AllocationStatus::CREATED;
        std::optional<std::string> payoutReference;
        std::optional<std::string> refundReference;
        Timestamp createdAt;
        Timestamp updatedAt;
        std::optional<Timestamp> eligibleAt;
        std::optional<Timestamp> releasedAt;
        std::optional<Timestamp> refundedAt;
    };

    static EscrowAllocation create(
        const std::string& escrowPaymentId,
        const std::string& storeId,
        const std::optional<std::string>& shipmentId,
        const Money& totalAmount,
        const Money& shippingAmount,
        const CommissionRate& commissionRate);

    static EscrowAllocation restore(Data data) { return EscrowAllocation(std::move(data)); }

    void markEligible();

    /**
     * @brief Выплатить продавцу часть или всю оставшуюся долю
     * @throws InvalidArgumentException amount <= 0 или больше остатка доли
     * @throws InvalidStateTransitionException из CREATED или терминального статуса
     */
    void release(const Money& amount, const std::optional<std::string>& payoutReference);

    void refund(const Money& amount, const std::optional<std::string>& refundReference);

    bool canBeReleased() const;
    bool canBeRefunded() const;

    Money remainingShare() const;

    // Комиссия, удерживаемая с уже выплаченной суммы
    Money commissionOnReleased() const { return commissionRate().applyTo(releasedAmount()); }

    const std::string& id() const { return data_.id; }
    const std::string& escrowPaymentId() const { return data_.escrowPaymentId; }
    const std::string& storeId() const { return data_.storeId; }
    const std::optional<std::string>& shipmentId() const { return data_.shipmentId; }
    const Money& totalAmount() const { return data_.totalAmount; }
    const Money& shippingAmount() const { return data_.shippingAmount; }
    const CommissionRate& commissionRate() const { return data_.commissionRate; }
    const Money& commissionAmount() const { return data_.commissionAmount; }
    const Money& sellerPayout() const { return data_.sellerPayout; }
    const Money& releasedAmount() const { return data_.releasedAmount; }
    const Money& refundedAmount() const { return data_.refundedAmount; }
    AllocationStatus status() const { return data_.status; }
    const std::string& currency() const { return data_.totalAmount.currency(); }
    const std::optional<std::string>& payoutReference() const { return data_.payoutReference; }
    const std::optional<std::string>& refundReference() const { return data_.refundReference; }
    const Timestamp& createdAt() const { return data_.createdAt; }
    const Timestamp& updatedAt() const { return data_.updatedAt; }
    const std::optional<Timestamp>& eligibleAt() const { return data_.eligibleAt; }
    const std::optional<Timestamp>& releasedAt() const { return data_.releasedAt; }
    const std::optional<Timestamp>& refundedAt() const { return data_.refundedAt; }

    const Data& data() const { return data_; }

private:
    explicit EscrowAllocation(Data data) : data_(std::move(data)) {}

    void validateDrawdown(const Money& amount, AllocationOperation op) const;

    Data data_;
};

} // namespace escrow::domain
