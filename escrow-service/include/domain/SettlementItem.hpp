#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <optional>

namespace escrow::domain {

/**
 * @brief Строка расчётной ведомости: одна аллокация за период
 *
 * netAmount = seller + shipping − commission − refunded, вычисляется один раз
 * при создании и дальше не пересчитывается.
 */
class SettlementItem {
public:
    struct Data {
        std::string id;
        std::string settlementId;
        std::string escrowAllocationId;
        std::optional<std::string> shipmentId;
        std::string orderNumber;
        Money sellerAmount;
        Money shippingAmount;
        Money commissionAmount;
        Money refundedAmount;
        Money netAmount;
        Timestamp transactionDate;
    };

    static SettlementItem create(
        const std::string& settlementId,
        const std::string& escrowAllocationId,
        const std::optional<std::string>& shipmentId,
        const std::string& orderNumber,
        const Money& sellerAmount,
        const Money& shippingAmount,
        const Money& commissionAmount,
        const Money& refundedAmount,
        const Timestamp& transactionDate);

    // Загрузка из хранилища: netAmount берётся сохранённый
    static SettlementItem restore(Data data) { return SettlementItem(std::move(data)); }

    const std::string& id() const { return data_.id; }
    const std::string& settlementId() const { return data_.settlementId; }
    const std::string& escrowAllocationId() const { return data_.escrowAllocationId; }
    const std::optional<std::string>& shipmentId() const { return data_.shipmentId; }
    const std::string& orderNumber() const { return data_.orderNumber; }
    const Money& sellerAmount() const { return data_.sellerAmount; }
    const Money& shippingAmount() const { return data_.shippingAmount; }
    const Money& commissionAmount() const { return data_.commissionAmount; }
    const Money& refundedAmount() const { return data_.refundedAmount; }
    const Money& netAmount() const { return data_.netAmount; }
    const std::string& currency() const { return data_.netAmount.currency(); }
    const Timestamp& transactionDate() const { return data_.transactionDate; }

    const Data& data() const { return data_; }

private:
    explicit SettlementItem(Data data) : data_(std::move(data)) {}

    Data data_;
};

} // namespace escrow::domain
