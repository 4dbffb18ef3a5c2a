#include "domain/EscrowPayment.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>

namespace escrow::domain {

EscrowPayment EscrowPayment::create(
    const std::string& orderId,
    const std::string& buyerId,
    const Money& totalAmount,
    const std::string& currency,
    const std::string& paymentTransactionId)
{
    if (orderId.empty()) {
        throw InvalidArgumentException("Order ID is required.");
    }
    if (buyerId.empty()) {
        throw InvalidArgumentException("Buyer ID is required.");
    }
    if (paymentTransactionId.empty()) {
        throw InvalidArgumentException("Payment transaction ID is required.");
    }
    if (currency.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw InvalidArgumentException("Currency is required.");
    }

    std::string code = Money::normalizeCurrency(currency);
    if (code != totalAmount.currency()) {
        throw CurrencyMismatchException(code, totalAmount.currency());
    }
    if (!totalAmount.isPositive()) {
        throw InvalidArgumentException("Total amount must be greater than zero.");
    }

    Data data;
    data.id = utils::UuidGenerator::generate();
    data.orderId = orderId;
    data.buyerId = buyerId;
    data.totalAmount = totalAmount;
    data.paymentTransactionId = paymentTransactionId;
    data.releasedAmount = Money::zero(code);
    data.refundedAmount = Money::zero(code);
    data.status = EscrowStatus::HELD;
    data.version = 1;
    data.createdAt = Timestamp::now();
    data.updatedAt = data.createdAt;

    return EscrowPayment(std::move(data), {});
}

const EscrowAllocation& EscrowPayment::addAllocation(
    const std::string& storeId,
    const std::optional<std::string>& shipmentId,
    const Money& totalAmount,
    const Money& shippingAmount,
    const CommissionRate& commissionRate)
{
    if (!data_.releasedAmount.isZero() || !data_.refundedAmount.isZero()) {
        throw InvalidStateTransitionException(
            "Cannot add allocation to escrow in status " + toString(data_.status) + ".");
    }
    if (totalAmount.currency() != currency()) {
        throw CurrencyMismatchException(currency(), totalAmount.currency());
    }
    if (shipmentId) {
        bool duplicate = std::any_of(allocations_.begin(), allocations_.end(),
            [&shipmentId](const EscrowAllocation& a) { return a.shipmentId() == shipmentId; });
        if (duplicate) {
            throw InvalidArgumentException("Allocation for shipment " + *shipmentId + " already exists.");
        }
    }

    allocations_.push_back(EscrowAllocation::create(
        data_.id, storeId, shipmentId, totalAmount, shippingAmount, commissionRate));
    touch();
    return allocations_.back();
}

void EscrowPayment::validateAllocationsCoverTotal() const {
    if (allocations_.empty()) {
        throw InvalidArgumentException("Escrow payment requires at least one seller allocation.");
    }

    Money sum = Money::zero(currency());
    for (const auto& allocation : allocations_) {
        sum = sum + allocation.totalAmount();
    }

    if (sum != data_.totalAmount) {
        throw InvalidArgumentException(
            "Seller allocations (" + sum.toString() + ") must add up to the escrow total (" +
            data_.totalAmount.toString() + ").");
    }
}

const EscrowAllocation& EscrowPayment::markAllocationEligible(const std::string& allocationId) {
    size_t index = indexOf(allocationId);
    allocations_[index].markEligible();
    touch();
    return allocations_[index];
}

const EscrowAllocation& EscrowPayment::applyRelease(
    const std::string& allocationId,
    const Money& amount,
    const std::optional<std::string>& payoutReference)
{
    size_t index = indexOf(allocationId);

    EscrowAllocation updated = allocations_[index];
    updated.release(amount, payoutReference);
    guardBalance(amount, "release");

    allocations_[index] = std::move(updated);
    data_.releasedAmount = data_.releasedAmount + amount;
    touch();
    recalculateStatus();
    return allocations_[index];
}

const EscrowAllocation& EscrowPayment::applyRefund(
    const std::string& allocationId,
    const Money& amount,
    const std::optional<std::string>& refundReference)
{
    size_t index = indexOf(allocationId);

    EscrowAllocation updated = allocations_[index];
    updated.refund(amount, refundReference);
    guardBalance(amount, "refund");

    allocations_[index] = std::move(updated);
    data_.refundedAmount = data_.refundedAmount + amount;
    touch();
    recalculateStatus();
    return allocations_[index];
}

const EscrowAllocation* EscrowPayment::findAllocation(const std::string& allocationId) const {
    auto it = std::find_if(allocations_.begin(), allocations_.end(),
        [&allocationId](const EscrowAllocation& a) { return a.id() == allocationId; });
    return it != allocations_.end() ? &(*it) : nullptr;
}

size_t EscrowPayment::indexOf(const std::string& allocationId) const {
    for (size_t i = 0; i < allocations_.size(); ++i) {
        if (allocations_[i].id() == allocationId) {
            return i;
        }
    }
    throw NotFoundException("Allocation " + allocationId + " not found in escrow " + data_.id + ".");
}

void EscrowPayment::guardBalance(const Money& amount, const std::string& operation) const {
    Money remaining = remainingBalance();
    if (amount > remaining) {
        throw InsufficientEscrowBalanceException(
            "Escrow " + data_.id + ": " + operation + " of " + amount.toString() +
            " exceeds remaining balance " + remaining.toString() + ".");
    }
}

void EscrowPayment::touch() {
    data_.updatedAt = Timestamp::now();
    ++data_.version;
}

void EscrowPayment::recalculateStatus() {
    bool allTerminal = !allocations_.empty() && std::all_of(allocations_.begin(), allocations_.end(),
        [](const EscrowAllocation& a) { return isTerminal(a.status()); });

    // Статус считается по суммам платежа: все аллокации закрыты, но есть
    // и выплаты, и возвраты → PARTIALLY_RELEASED
    if (allTerminal && data_.refundedAmount.isZero()) {
        data_.status = EscrowStatus::RELEASED;
        data_.releasedAt = data_.updatedAt;
    } else if (allTerminal && data_.releasedAmount.isZero()) {
        data_.status = EscrowStatus::REFUNDED;
        data_.refundedAt = data_.updatedAt;
    } else if (!data_.releasedAmount.isZero() || !data_.refundedAmount.isZero()) {
        data_.status = EscrowStatus::PARTIALLY_RELEASED;
    } else {
        data_.status = EscrowStatus::HELD;
    }
}

} // namespace escrow::domain
