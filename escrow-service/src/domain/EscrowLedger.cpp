#include "domain/EscrowLedger.hpp"
#include "utils/UuidGenerator.hpp"

namespace escrow::domain {

LedgerEntry::LedgerEntry(Data data) : data_(std::move(data)) {
    if (data_.externalReference) {
        data_.externalReference = EscrowLedger::truncate(*data_.externalReference, MAX_REFERENCE_LENGTH);
    }
    if (data_.notes) {
        data_.notes = EscrowLedger::truncate(*data_.notes, MAX_NOTES_LENGTH);
    }
    data_.initiatedBy = EscrowLedger::truncate(
        data_.initiatedBy.empty() ? EscrowLedger::DEFAULT_INITIATOR : data_.initiatedBy,
        MAX_REFERENCE_LENGTH);
}

LedgerEntry::Data EscrowLedger::baseEntry(
    const EscrowPayment& payment,
    int64_t sequence,
    const std::string& initiatedBy)
{
    LedgerEntry::Data data;
    data.id = utils::UuidGenerator::generate();
    data.sequence = sequence;
    data.escrowPaymentId = payment.id();
    data.orderId = payment.orderId();
    data.buyerId = payment.buyerId();
    data.balanceAfter = payment.remainingBalance();
    data.initiatedBy = initiatedBy;
    data.createdAt = Timestamp::now();
    return data;
}

LedgerEntry EscrowLedger::createCreatedEntry(
    const EscrowPayment& payment,
    int64_t sequence,
    const std::string& initiatedBy)
{
    auto data = baseEntry(payment, sequence, initiatedBy);
    data.action = LedgerAction::CREATED;
    data.amount = payment.totalAmount();
    data.externalReference = payment.paymentTransactionId();
    data.notes = "Escrow created for order " + payment.orderId() +
                 ": " + payment.totalAmount().toString() + " " + payment.currency();
    return LedgerEntry(std::move(data));
}

LedgerEntry EscrowLedger::createAllocationEntry(
    const EscrowPayment& payment,
    const EscrowAllocation& allocation,
    int64_t sequence,
    const std::string& initiatedBy)
{
    auto data = baseEntry(payment, sequence, initiatedBy);
    data.action = LedgerAction::ALLOCATION_CREATED;
    data.allocationId = allocation.id();
    data.storeId = allocation.storeId();
    data.amount = allocation.totalAmount();
    data.externalReference = allocation.shipmentId();
    data.notes = "Allocation for store " + allocation.storeId() +
                 ": commission " + allocation.commissionAmount().toString() +
                 " (" + allocation.commissionRate().toString() + "%), payout " +
                 allocation.sellerPayout().toString();
    return LedgerEntry(std::move(data));
}

LedgerEntry EscrowLedger::createEligibleEntry(
    const EscrowPayment& payment,
    const EscrowAllocation& allocation,
    int64_t sequence,
    const std::string& initiatedBy)
{
    auto data = baseEntry(payment, sequence, initiatedBy);
    data.action = LedgerAction::ALLOCATION_ELIGIBLE;
    data.allocationId = allocation.id();
    data.storeId = allocation.storeId();
    data.amount = allocation.remainingShare();
    data.externalReference = allocation.shipmentId();
    data.notes = "Allocation eligible for release after delivery";
    return LedgerEntry(std::move(data));
}

LedgerEntry EscrowLedger::createReleaseEntry(
    const EscrowPayment& payment,
    const EscrowAllocation& allocation,
    int64_t sequence,
    const Money& amount,
    const std::optional<std::string>& payoutReference,
    const std::string& initiatedBy)
{
    auto data = baseEntry(payment, sequence, initiatedBy);
    data.action = allocation.status() == AllocationStatus::RELEASED
        ? LedgerAction::RELEASED
        : LedgerAction::PARTIAL_RELEASE;
    data.allocationId = allocation.id();
    data.storeId = allocation.storeId();
    data.amount = amount;
    data.externalReference = payoutReference;
    data.notes = "Released " + amount.toString() + " " + amount.currency() +
                 " to store " + allocation.storeId() +
                 ", remaining share " + allocation.remainingShare().toString();
    return LedgerEntry(std::move(data));
}

LedgerEntry EscrowLedger::createRefundEntry(
    const EscrowPayment& payment,
    const EscrowAllocation& allocation,
    int64_t sequence,
    const Money& amount,
    const std::optional<std::string>& refundReference,
    const std::string& initiatedBy)
{
    auto data = baseEntry(payment, sequence, initiatedBy);
    data.action = allocation.status() == AllocationStatus::REFUNDED
        ? LedgerAction::REFUNDED
        : LedgerAction::PARTIAL_REFUND;
    data.allocationId = allocation.id();
    data.storeId = allocation.storeId();
    data.amount = amount;
    data.externalReference = refundReference;
    data.notes = "Refunded " + amount.toString() + " " + amount.currency() +
                 " to buyer " + payment.buyerId() +
                 " from store " + allocation.storeId() +
                 ", remaining share " + allocation.remainingShare().toString();
    return LedgerEntry(std::move(data));
}

} // namespace escrow::domain
