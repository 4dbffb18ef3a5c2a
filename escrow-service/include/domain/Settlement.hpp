#pragma once

#include "domain/SettlementItem.hpp"
#include "domain/SettlementAdjustment.hpp"
#include "domain/SettlementPeriod.hpp"
#include "domain/EscrowAllocation.hpp"
#include "domain/EscrowLedger.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/SettlementStatus.hpp"
#include <string>
#include <vector>
#include <optional>

namespace escrow::domain {

/**
 * @brief Расчётная ведомость продавца за месяц
 *
 * Жизненный цикл: CLOSED → APPROVED → EXPORTED.
 * Итоговые суммы не хранятся, а вычисляются из строк и корректировок.
 */
class Settlement {
public:
    static constexpr size_t MAX_NOTES_LENGTH = 500;

    struct Data {
        std::string id;
        std::string storeId;
        int year = SettlementPeriod::MIN_YEAR;
        int month = 1;
        std::string settlementNumber;
        std::string currency;
        SettlementStatus status = SettlementStatus::CLOSED;
        std::optional<std::string> approvedBy;
        std::optional<Timestamp> approvedAt;
        std::optional<Timestamp> exportedAt;
        std::optional<std::string> notes;
        Timestamp createdAt;
        Timestamp updatedAt;
    };

    /**
     * @brief Новая закрытая ведомость без строк
     * @throws InvalidArgumentException пустой storeId, период вне диапазона, некорректная валюта
     */
    static Settlement create(const std::string& storeId, int year, int month, const std::string& currency);

    static Settlement restore(Data data,
                              std::vector<SettlementItem> items,
                              std::vector<SettlementAdjustment> adjustments) {
        return Settlement(std::move(data), std::move(items), std::move(adjustments));
    }

    // STL-<первые 4 символа storeId в верхнем регистре>-<YYYYMM>
    static std::string formatNumber(const std::string& storeId, const SettlementPeriod& period);

    /**
     * @brief Добавить строку при формировании ведомости
     * @throws InvalidArgumentException строка для этой аллокации уже есть или чужой settlementId
     * @throws CurrencyMismatchException
     */
    void addItem(const SettlementItem& item);

    /**
     * @brief Добавить корректировку (в любом статусе)
     * @throws InvalidArgumentException исходный период позже периода ведомости
     */
    void recordAdjustment(const SettlementAdjustment& adjustment);

    void approve(const std::string& approvedBy);
    void markExported();
    void updateNotes(const std::string& notes);

    bool hasItemFor(const std::string& escrowAllocationId) const;

    Money grossSales() const;
    Money totalShipping() const;
    Money totalCommission() const;
    Money totalRefunds() const;
    Money totalAdjustments() const;
    size_t orderCount() const;

    // gross + shipping − commission − refunds + adjustments
    Money netPayable() const;

    const std::string& id() const { return data_.id; }
    const std::string& storeId() const { return data_.storeId; }
    int year() const { return data_.year; }
    int month() const { return data_.month; }
    SettlementPeriod period() const { return SettlementPeriod::of(data_.year, data_.month); }
    Timestamp periodStart() const { return period().start(); }
    Timestamp periodEnd() const { return period().end(); }
    const std::string& settlementNumber() const { return data_.settlementNumber; }
    const std::string& currency() const { return data_.currency; }
    SettlementStatus status() const { return data_.status; }
    const std::optional<std::string>& approvedBy() const { return data_.approvedBy; }
    const std::optional<Timestamp>& approvedAt() const { return data_.approvedAt; }
    const std::optional<Timestamp>& exportedAt() const { return data_.exportedAt; }
    const std::optional<std::string>& notes() const { return data_.notes; }
    const Timestamp& createdAt() const { return data_.createdAt; }
    const Timestamp& updatedAt() const { return data_.updatedAt; }
    const std::vector<SettlementItem>& items() const { return items_; }
    const std::vector<SettlementAdjustment>& adjustments() const { return adjustments_; }

    const Data& data() const { return data_; }

private:
    Settlement(Data data, std::vector<SettlementItem> items, std::vector<SettlementAdjustment> adjustments)
        : data_(std::move(data)), items_(std::move(items)), adjustments_(std::move(adjustments)) {}

    template<typename Getter>
    Money sumItems(Getter getter) const {
        Money total = Money::zero(data_.currency);
        for (const auto& item : items_) {
            total = total + getter(item);
        }
        return total;
    }

    Data data_;
    std::vector<SettlementItem> items_;
    std::vector<SettlementAdjustment> adjustments_;
};

/**
 * @brief Построить строку ведомости для аллокации по её записям журнала
 *
 * R: выплачено в периоде, F: возвращено в периоде.
 * - shipping = min(allocation.shipping, R + F), если до периода движений не было, иначе 0
 * - seller = R + F − shipping
 * - commission = rate% (выплачено до конца периода) − rate% (выплачено до начала)
 * - refunded = F
 *
 * @param entries записи журнала этой аллокации за всё время
 * @return std::nullopt, если в периоде нет выплат и возвратов
 */
std::optional<SettlementItem> buildSettlementItem(
    const std::string& settlementId,
    const EscrowAllocation& allocation,
    const std::vector<LedgerEntry>& entries,
    const SettlementPeriod& period);

} // namespace escrow::domain
