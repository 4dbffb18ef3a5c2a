#include "domain/Settlement.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace escrow::domain {

// ============================================================================
// SettlementItem
// ============================================================================

SettlementItem SettlementItem::create(
    const std::string& settlementId,
    const std::string& escrowAllocationId,
    const std::optional<std::string>& shipmentId,
    const std::string& orderNumber,
    const Money& sellerAmount,
    const Money& shippingAmount,
    const Money& commissionAmount,
    const Money& refundedAmount,
    const Timestamp& transactionDate)
{
    if (settlementId.empty()) {
        throw InvalidArgumentException("Settlement ID is required.");
    }
    if (escrowAllocationId.empty()) {
        throw InvalidArgumentException("Escrow allocation ID is required.");
    }
    if (sellerAmount.isNegative() || shippingAmount.isNegative() ||
        commissionAmount.isNegative() || refundedAmount.isNegative()) {
        throw InvalidArgumentException("Settlement item amounts cannot be negative.");
    }

    Data data;
    data.id = utils::UuidGenerator::generate();
    data.settlementId = settlementId;
    data.escrowAllocationId = escrowAllocationId;
    data.shipmentId = shipmentId;
    data.orderNumber = orderNumber;
    data.sellerAmount = sellerAmount;
    data.shippingAmount = shippingAmount;
    data.commissionAmount = commissionAmount;
    data.refundedAmount = refundedAmount;
    data.netAmount = sellerAmount + shippingAmount - commissionAmount - refundedAmount;
    data.transactionDate = transactionDate;
    return SettlementItem(std::move(data));
}

// ============================================================================
// SettlementAdjustment
// ============================================================================

SettlementAdjustment SettlementAdjustment::create(
    const std::string& settlementId,
    int originalYear,
    int originalMonth,
    const Money& amount,
    const std::string& reason,
    const std::optional<std::string>& relatedOrderId,
    const std::optional<std::string>& relatedOrderNumber)
{
    if (settlementId.empty()) {
        throw InvalidArgumentException("Settlement ID is required.");
    }
    SettlementPeriod::of(originalYear, originalMonth);

    if (amount.isZero()) {
        throw InvalidArgumentException("Adjustment amount cannot be zero.");
    }

    auto begin = reason.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        throw InvalidArgumentException("Adjustment reason is required.");
    }
    auto end = reason.find_last_not_of(" \t\r\n");
    std::string trimmed = reason.substr(begin, end - begin + 1);
    if (trimmed.size() > MAX_REASON_LENGTH) {
        throw InvalidArgumentException(
            "Adjustment reason cannot exceed " + std::to_string(MAX_REASON_LENGTH) + " characters.");
    }

    Data data;
    data.id = utils::UuidGenerator::generate();
    data.settlementId = settlementId;
    data.originalYear = originalYear;
    data.originalMonth = originalMonth;
    data.amount = amount;
    data.reason = trimmed;
    data.relatedOrderId = relatedOrderId;
    data.relatedOrderNumber = relatedOrderNumber;
    data.createdAt = Timestamp::now();
    return SettlementAdjustment(std::move(data));
}

// ============================================================================
// Settlement
// ============================================================================

Settlement Settlement::create(const std::string& storeId, int year, int month, const std::string& currency) {
    if (storeId.empty()) {
        throw InvalidArgumentException("Store ID is required.");
    }
    auto period = SettlementPeriod::of(year, month);

    Data data;
    data.id = utils::UuidGenerator::generate();
    data.storeId = storeId;
    data.year = year;
    data.month = month;
    data.settlementNumber = formatNumber(storeId, period);
    data.currency = Money::normalizeCurrency(currency);
    data.status = SettlementStatus::CLOSED;
    data.createdAt = Timestamp::now();
    data.updatedAt = data.createdAt;
    return Settlement(std::move(data), {}, {});
}

std::string Settlement::formatNumber(const std::string& storeId, const SettlementPeriod& period) {
    std::string prefix = storeId.substr(0, std::min<size_t>(4, storeId.size()));
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return "STL-" + prefix + "-" + period.code();
}

void Settlement::addItem(const SettlementItem& item) {
    if (item.settlementId() != data_.id) {
        throw InvalidArgumentException("Item belongs to settlement " + item.settlementId() + ".");
    }
    if (item.currency() != data_.currency) {
        throw CurrencyMismatchException(data_.currency, item.currency());
    }
    if (hasItemFor(item.escrowAllocationId())) {
        throw InvalidArgumentException(
            "Settlement " + data_.settlementNumber + " already contains allocation " +
            item.escrowAllocationId() + ".");
    }
    items_.push_back(item);
}

void Settlement::recordAdjustment(const SettlementAdjustment& adjustment) {
    if (adjustment.settlementId() != data_.id) {
        throw InvalidArgumentException("Adjustment belongs to settlement " + adjustment.settlementId() + ".");
    }
    if (adjustment.amount().currency() != data_.currency) {
        throw CurrencyMismatchException(data_.currency, adjustment.amount().currency());
    }
    if (period() < adjustment.originalPeriod()) {
        throw InvalidArgumentException(
            "Adjustment period " + adjustment.originalPeriod().code() +
            " is later than settlement period " + period().code() + ".");
    }
    adjustments_.push_back(adjustment);
    data_.updatedAt = Timestamp::now();
}

void Settlement::approve(const std::string& approvedBy) {
    if (data_.status != SettlementStatus::CLOSED) {
        throw InvalidStateTransitionException(
            "Cannot approve settlement in status " + toString(data_.status) + ".");
    }
    if (approvedBy.empty()) {
        throw InvalidArgumentException("Approver is required.");
    }
    data_.status = SettlementStatus::APPROVED;
    data_.approvedBy = approvedBy;
    data_.approvedAt = Timestamp::now();
    data_.updatedAt = *data_.approvedAt;
}

void Settlement::markExported() {
    if (data_.status != SettlementStatus::APPROVED) {
        throw InvalidStateTransitionException(
            "Cannot export settlement in status " + toString(data_.status) + ".");
    }
    data_.status = SettlementStatus::EXPORTED;
    data_.exportedAt = Timestamp::now();
    data_.updatedAt = *data_.exportedAt;
}

void Settlement::updateNotes(const std::string& notes) {
    if (notes.size() > MAX_NOTES_LENGTH) {
        throw InvalidArgumentException(
            "Notes cannot exceed " + std::to_string(MAX_NOTES_LENGTH) + " characters.");
    }
    if (notes.empty()) {
        data_.notes.reset();
    } else {
        data_.notes = notes;
    }
    data_.updatedAt = Timestamp::now();
}

bool Settlement::hasItemFor(const std::string& escrowAllocationId) const {
    return std::any_of(items_.begin(), items_.end(),
        [&escrowAllocationId](const SettlementItem& i) { return i.escrowAllocationId() == escrowAllocationId; });
}

Money Settlement::grossSales() const {
    return sumItems([](const SettlementItem& i) { return i.sellerAmount(); });
}

Money Settlement::totalShipping() const {
    return sumItems([](const SettlementItem& i) { return i.shippingAmount(); });
}

Money Settlement::totalCommission() const {
    return sumItems([](const SettlementItem& i) { return i.commissionAmount(); });
}

Money Settlement::totalRefunds() const {
    return sumItems([](const SettlementItem& i) { return i.refundedAmount(); });
}

Money Settlement::totalAdjustments() const {
    Money total = Money::zero(data_.currency);
    for (const auto& adjustment : adjustments_) {
        total = total + adjustment.amount();
    }
    return total;
}

size_t Settlement::orderCount() const {
    std::set<std::string> orders;
    for (const auto& item : items_) {
        orders.insert(item.orderNumber());
    }
    return orders.size();
}

Money Settlement::netPayable() const {
    return grossSales() + totalShipping() - totalCommission() - totalRefunds() + totalAdjustments();
}

// ============================================================================
// Построение строки ведомости из журнала
// ============================================================================

std::optional<SettlementItem> buildSettlementItem(
    const std::string& settlementId,
    const EscrowAllocation& allocation,
    const std::vector<LedgerEntry>& entries,
    const SettlementPeriod& period)
{
    const std::string& currency = allocation.currency();
    const Timestamp start = period.start();
    const Timestamp end = period.end();

    Money releasedInPeriod = Money::zero(currency);
    Money refundedInPeriod = Money::zero(currency);
    Money releasedBefore = Money::zero(currency);
    Money releasedThroughEnd = Money::zero(currency);
    bool priorActivity = false;
    bool activityInPeriod = false;
    std::optional<Timestamp> lastActivity;
    std::string orderNumber;

    for (const auto& entry : entries) {
        if (entry.allocationId() != allocation.id()) {
            continue;
        }
        bool release = isReleaseAction(entry.action());
        bool refund = isRefundAction(entry.action());
        if (!release && !refund) {
            continue;
        }

        const Timestamp& at = entry.createdAt();
        if (at < start) {
            priorActivity = true;
            if (release) {
                releasedBefore = releasedBefore + entry.amount();
            }
        }
        if (at < end && release) {
            releasedThroughEnd = releasedThroughEnd + entry.amount();
        }
        if (period.contains(at)) {
            activityInPeriod = true;
            orderNumber = entry.orderId();
            if (release) {
                releasedInPeriod = releasedInPeriod + entry.amount();
            } else {
                refundedInPeriod = refundedInPeriod + entry.amount();
            }
            if (!lastActivity || *lastActivity < at) {
                lastActivity = at;
            }
        }
    }

    if (!activityInPeriod) {
        return std::nullopt;
    }

    Money grossInPeriod = releasedInPeriod + refundedInPeriod;
    Money shipping = priorActivity
        ? Money::zero(currency)
        : Money::min(allocation.shippingAmount(), grossInPeriod);
    Money seller = grossInPeriod - shipping;
    Money commission = allocation.commissionRate().applyTo(releasedThroughEnd)
                     - allocation.commissionRate().applyTo(releasedBefore);

    return SettlementItem::create(
        settlementId,
        allocation.id(),
        allocation.shipmentId(),
        orderNumber,
        seller,
        shipping,
        commission,
        refundedInPeriod,
        *lastActivity);
}

} // namespace escrow::domain
