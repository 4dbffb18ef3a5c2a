// include/ports/output/IEscrowRepository.hpp
#pragma once

#include "domain/EscrowPayment.hpp"
#include "domain/EscrowLedger.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace escrow::ports::output {

/**
 * @brief Хранилище escrow-платежей, аллокаций и журнала
 *
 * Журнал только дополняется: методов изменения или удаления записей нет.
 * Состояние агрегата и новые записи журнала сохраняются одной транзакцией.
 *
 * @example
 * ```cpp
 * int64_t expected = payment.version();
 * payment.applyRelease(allocationId, amount, ref);
 * auto entry = EscrowLedger::createReleaseEntry(payment, allocation, seq, amount, ref);
 * repository->commit(payment, expected, {entry});
 * ```
 */
class IEscrowRepository {
public:
    virtual ~IEscrowRepository() = default;

    /**
     * @brief Сохранить новый платёж с аллокациями и начальными записями журнала
     * @throws ContentionException платёж для этого заказа уже существует
     */
    virtual void insert(const domain::EscrowPayment& payment,
                        const std::vector<domain::LedgerEntry>& entries) = 0;

    /**
     * @brief Атомарно сохранить изменённый платёж и добавить записи журнала
     *
     * Compare-and-swap по версии: запись проходит только если в хранилище
     * всё ещё лежит версия expectedVersion.
     *
     * @throws ContentionException версия изменилась (параллельная запись)
     */
    virtual void commit(const domain::EscrowPayment& payment,
                        int64_t expectedVersion,
                        const std::vector<domain::LedgerEntry>& entries) = 0;

    virtual std::optional<domain::EscrowPayment> findById(const std::string& escrowPaymentId) = 0;

    virtual std::optional<domain::EscrowPayment> findByOrderId(const std::string& orderId) = 0;

    /**
     * @brief ID платежа, которому принадлежит аллокация
     */
    virtual std::optional<std::string> findPaymentIdByAllocation(const std::string& allocationId) = 0;

    virtual std::vector<domain::EscrowAllocation> findAllocationsByStore(const std::string& storeId) = 0;

    /**
     * @brief Журнал платежа, упорядоченный по (createdAt, sequence)
     */
    virtual std::vector<domain::LedgerEntry> getLedger(const std::string& escrowPaymentId) = 0;

    /**
     * @brief Записи журнала по аллокациям магазина, упорядоченные по (createdAt, sequence)
     */
    virtual std::vector<domain::LedgerEntry> getLedgerByStore(const std::string& storeId) = 0;

    /**
     * @brief Последний выданный номер записи журнала (0, если записей нет)
     */
    virtual int64_t lastLedgerSequence(const std::string& escrowPaymentId) = 0;

    /**
     * @brief Магазины с выплатами/возвратами в интервале [from, to)
     */
    virtual std::vector<std::string> findStoresWithActivity(const domain::Timestamp& from,
                                                            const domain::Timestamp& to) = 0;
};

} // namespace escrow::ports::output
