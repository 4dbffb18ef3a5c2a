#pragma once

#include "domain/EscrowPayment.hpp"
#include "domain/EscrowAllocation.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/LedgerAction.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace escrow::domain {

/**
 * @brief Запись аудиторского журнала escrow
 *
 * После создания не изменяется: у класса нет ни одного мутирующего метода,
 * а репозиторий умеет только добавлять записи.
 */
class LedgerEntry {
public:
    static constexpr size_t MAX_REFERENCE_LENGTH = 256;
    static constexpr size_t MAX_NOTES_LENGTH = 500;

    struct Data {
        std::string id;
        int64_t sequence = 0;
        std::string escrowPaymentId;
        std::optional<std::string> allocationId;
        std::string orderId;
        std::optional<std::string> storeId;
        std::string buyerId;
        LedgerAction action = LedgerAction::CREATED;
        Money amount;
        Money balanceAfter;
        std::optional<std::string> externalReference;
        std::optional<std::string> notes;
        std::string initiatedBy;
        Timestamp createdAt;
    };

    /**
     * @brief Собрать запись; строковые поля обрезаются до допустимой длины
     */
    explicit LedgerEntry(Data data);

    const std::string& id() const { return data_.id; }
    int64_t sequence() const { return data_.sequence; }
    const std::string& escrowPaymentId() const { return data_.escrowPaymentId; }
    const std::optional<std::string>& allocationId() const { return data_.allocationId; }
    const std::string& orderId() const { return data_.orderId; }
    const std::optional<std::string>& storeId() const { return data_.storeId; }
    const std::string& buyerId() const { return data_.buyerId; }
    LedgerAction action() const { return data_.action; }
    const Money& amount() const { return data_.amount; }
    const std::string& currency() const { return data_.amount.currency(); }
    const Money& balanceAfter() const { return data_.balanceAfter; }
    const std::optional<std::string>& externalReference() const { return data_.externalReference; }
    const std::optional<std::string>& notes() const { return data_.notes; }
    const std::string& initiatedBy() const { return data_.initiatedBy; }
    const Timestamp& createdAt() const { return data_.createdAt; }

    const Data& data() const { return data_; }

    // Порядок журнала: (createdAt, sequence)
    bool operator<(const LedgerEntry& other) const {
        if (data_.createdAt == other.data_.createdAt) {
            return data_.sequence < other.data_.sequence;
        }
        return data_.createdAt < other.data_.createdAt;
    }

private:
    Data data_;
};

/**
 * @brief Фабрики записей журнала, по одной на бизнес-событие
 *
 * Чистые функции: принимают снимок платежа/аллокации ПОСЛЕ применённого
 * изменения и выводят из него action, balanceAfter и notes.
 * Номер записи (sequence) выдаёт вызывающий код.
 */
class EscrowLedger {
public:
    static constexpr const char* DEFAULT_INITIATOR = "System";

    static LedgerEntry createCreatedEntry(
        const EscrowPayment& payment,
        int64_t sequence,
        const std::string& initiatedBy = DEFAULT_INITIATOR);

    static LedgerEntry createAllocationEntry(
        const EscrowPayment& payment,
        const EscrowAllocation& allocation,
        int64_t sequence,
        const std::string& initiatedBy = DEFAULT_INITIATOR);

    static LedgerEntry createEligibleEntry(
        const EscrowPayment& payment,
        const EscrowAllocation& allocation,
        int64_t sequence,
        const std::string& initiatedBy = DEFAULT_INITIATOR);

    /**
     * @brief Выплата продавцу
     *
     * RELEASED, если аллокация перешла в терминальный статус, иначе PARTIAL_RELEASE.
     */
    static LedgerEntry createReleaseEntry(
        const EscrowPayment& payment,
        const EscrowAllocation& allocation,
        int64_t sequence,
        const Money& amount,
        const std::optional<std::string>& payoutReference,
        const std::string& initiatedBy = DEFAULT_INITIATOR);

    static LedgerEntry createRefundEntry(
        const EscrowPayment& payment,
        const EscrowAllocation& allocation,
        int64_t sequence,
        const Money& amount,
        const std::optional<std::string>& refundReference,
        const std::string& initiatedBy = DEFAULT_INITIATOR);

    static std::string truncate(const std::string& value, size_t maxLength) {
        return value.size() <= maxLength ? value : value.substr(0, maxLength);
    }

private:
    static LedgerEntry::Data baseEntry(
        const EscrowPayment& payment,
        int64_t sequence,
        const std::string& initiatedBy);
};

} // namespace escrow::domain
