#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/SettlementPeriod.hpp"
#include <string>
#include <optional>

namespace escrow::domain {

/**
 * @brief Корректировка уже закрытого периода
 *
 * amount со знаком: положительная сумма начисляется продавцу, отрицательная
 * удерживается. Закрытая ведомость не редактируется, только дополняется
 * корректировками.
 */
class SettlementAdjustment {
public:
    static constexpr size_t MAX_REASON_LENGTH = 500;

    struct Data {
        std::string id;
        std::string settlementId;
        int originalYear = SettlementPeriod::MIN_YEAR;
        int originalMonth = 1;
        Money amount;
        std::string reason;
        std::optional<std::string> relatedOrderId;
        std::optional<std::string> relatedOrderNumber;
        Timestamp createdAt;
    };

    /**
     * @throws InvalidArgumentException пустой settlementId, период вне диапазона,
     *         нулевая сумма, пустая или слишком длинная причина
     */
    static SettlementAdjustment create(
        const std::string& settlementId,
        int originalYear,
        int originalMonth,
        const Money& amount,
        const std::string& reason,
        const std::optional<std::string>& relatedOrderId,
        const std::optional<std::string>& relatedOrderNumber);

    static SettlementAdjustment restore(Data data) { return SettlementAdjustment(std::move(data)); }

    const std::string& id() const { return data_.id; }
    const std::string& settlementId() const { return data_.settlementId; }
    int originalYear() const { return data_.originalYear; }
    int originalMonth() const { return data_.originalMonth; }
    SettlementPeriod originalPeriod() const { return SettlementPeriod::of(data_.originalYear, data_.originalMonth); }
    const Money& amount() const { return data_.amount; }
    const std::string& reason() const { return data_.reason; }
    const std::optional<std::string>& relatedOrderId() const { return data_.relatedOrderId; }
    const std::optional<std::string>& relatedOrderNumber() const { return data_.relatedOrderNumber; }
    const Timestamp& createdAt() const { return data_.createdAt; }

    bool isCredit() const { return data_.amount.isPositive(); }

    const Data& data() const { return data_; }

private:
    explicit SettlementAdjustment(Data data) : data_(std::move(data)) {}

    Data data_;
};

} // namespace escrow::domain
