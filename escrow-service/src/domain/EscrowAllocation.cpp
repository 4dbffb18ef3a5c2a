#include "domain/EscrowAllocation.hpp"
#include "utils/UuidGenerator.hpp"

namespace escrow::domain {

AllocationStatus nextAllocationStatus(AllocationStatus current, AllocationOperation op, bool shareExhausted) {
    switch (current) {
        case AllocationStatus::CREATED:
            if (op == AllocationOperation::MARK_ELIGIBLE) {
                return AllocationStatus::ELIGIBLE;
            }
            break;

        case AllocationStatus::ELIGIBLE:
        case AllocationStatus::PARTIAL_RELEASE:
        case AllocationStatus::PARTIAL_REFUND:
            if (op == AllocationOperation::RELEASE) {
                return shareExhausted ? AllocationStatus::RELEASED : AllocationStatus::PARTIAL_RELEASE;
            }
            if (op == AllocationOperation::REFUND) {
                return shareExhausted ? AllocationStatus::REFUNDED : AllocationStatus::PARTIAL_REFUND;
            }
            break;

        case AllocationStatus::RELEASED:
        case AllocationStatus::REFUNDED:
            break;
    }

    throw InvalidStateTransitionException(
        "Cannot apply " + toString(op) + " to allocation in status " + toString(current) + ".");
}

EscrowAllocation EscrowAllocation::create(
    const std::string& escrowPaymentId,
    const std::string& storeId,
    const std::optional<std::string>& shipmentId,
    const Money& totalAmount,
    const Money& shippingAmount,
    const CommissionRate& commissionRate)
{
    if (escrowPaymentId.empty()) {
        throw InvalidArgumentException("Escrow payment ID is required.");
    }
    if (storeId.empty()) {
        throw InvalidArgumentException("Store ID is required.");
    }
    if (shipmentId && shipmentId->empty()) {
        throw InvalidArgumentException("Shipment ID must not be blank.");
    }
    if (totalAmount.isNegative()) {
        throw InvalidArgumentException("Allocation amount cannot be negative.");
    }
    if (shippingAmount.isNegative()) {
        throw InvalidArgumentException("Shipping amount cannot be negative.");
    }
    if (shippingAmount > totalAmount) {
        throw InvalidArgumentException("Shipping amount cannot exceed allocation amount.");
    }

    Data data;
    data.id = utils::UuidGenerator::generate();
    data.escrowPaymentId = escrowPaymentId;
    data.storeId = storeId;
    data.shipmentId = shipmentId;
    data.totalAmount = totalAmount;
    data.shippingAmount = shippingAmount;
    data.commissionRate = commissionRate;
    data.commissionAmount = commissionRate.applyTo(totalAmount);
    data.sellerPayout = totalAmount - data.commissionAmount;
    data.releasedAmount = Money::zero(totalAmount.currency());
    data.refundedAmount = Money::zero(totalAmount.currency());
    data.status = AllocationStatus::CREATED;
    data.createdAt = Timestamp::now();
    data.updatedAt = data.createdAt;

    return EscrowAllocation(std::move(data));
}

void EscrowAllocation::markEligible() {
    data_.status = nextAllocationStatus(data_.status, AllocationOperation::MARK_ELIGIBLE, false);
    data_.eligibleAt = Timestamp::now();
    data_.updatedAt = *data_.eligibleAt;
}

void EscrowAllocation::release(const Money& amount, const std::optional<std::string>& payoutReference) {
    validateDrawdown(amount, AllocationOperation::RELEASE);

    data_.releasedAmount = data_.releasedAmount + amount;
    data_.status = nextAllocationStatus(data_.status, AllocationOperation::RELEASE, remainingShare().isZero());
    if (payoutReference) {
        data_.payoutReference = payoutReference;
    }
    data_.releasedAt = Timestamp::now();
    data_.updatedAt = *data_.releasedAt;
}

void EscrowAllocation::refund(const Money& amount, const std::optional<std::string>& refundReference) {
    validateDrawdown(amount, AllocationOperation::REFUND);

    data_.refundedAmount = data_.refundedAmount + amount;
    data_.status = nextAllocationStatus(data_.status, AllocationOperation::REFUND, remainingShare().isZero());
    if (refundReference) {
        data_.refundReference = refundReference;
    }
    data_.refundedAt = Timestamp::now();
    data_.updatedAt = *data_.refundedAt;
}

bool EscrowAllocation::canBeReleased() const {
    return data_.status == AllocationStatus::ELIGIBLE
        || data_.status == AllocationStatus::PARTIAL_RELEASE
        || data_.status == AllocationStatus::PARTIAL_REFUND;
}

bool EscrowAllocation::canBeRefunded() const {
    return canBeReleased();
}

Money EscrowAllocation::remainingShare() const {
    return data_.totalAmount - data_.releasedAmount - data_.refundedAmount;
}

void EscrowAllocation::validateDrawdown(const Money& amount, AllocationOperation op) const {
    // Повторный release закрытой аллокации должен давать
    // InvalidStateTransition, а не ошибку суммы
    nextAllocationStatus(data_.status, op, false);

    if (!amount.isPositive()) {
        throw InvalidArgumentException("Amount must be greater than zero.");
    }

    Money remaining = remainingShare();
    if (amount > remaining) {
        throw InvalidArgumentException(
            "Insufficient allocation share: requested " + amount.toString() + " " + amount.currency() +
            ", remaining " + remaining.toString() + " " + remaining.currency() + ".");
    }
}

} // namespace escrow::domain
