// escrow-service/include/ports/input/IEscrowService.hpp
#pragma once

#include "domain/PaymentConfirmation.hpp"
#include "domain/EscrowPayment.hpp"
#include "domain/EscrowLedger.hpp"
#include "domain/EscrowOperationResult.hpp"
#include "domain/SellerBalance.hpp"
#include "domain/LedgerReplay.hpp"
#include <vector>
#include <optional>
#include <string>

namespace escrow::ports::input {

/**
 * @brief Интерфейс escrow-сервиса
 *
 * Команды изменяют платёж под блокировкой EscrowCoordinator и сохраняют
 * состояние вместе с записями журнала. Запросы читают снимок хранилища
 * без блокировки.
 */
class IEscrowService {
public:
    virtual ~IEscrowService() = default;

    /**
     * @brief Создать escrow и аллокации продавцов после оплаты заказа
     *
     * Повторное подтверждение того же заказа возвращает уже созданный escrow.
     */
    virtual domain::EscrowPayment onOrderPaymentConfirmed(const domain::PaymentConfirmation& confirmation) = 0;

    /**
     * @brief Отправление доставлено: аллокация становится доступной к выплате
     */
    virtual domain::EscrowAllocation onShipmentDelivered(const std::string& allocationId) = 0;

    /**
     * @brief Выплатить продавцу
     * @param amount сумма; если не задана, выплачивается весь остаток доли
     */
    virtual domain::EscrowOperationResult requestRelease(
        const std::string& allocationId,
        const std::optional<domain::Money>& amount,
        const std::optional<std::string>& payoutReference,
        const std::optional<std::string>& initiatedBy = std::nullopt) = 0;

    /**
     * @brief Вернуть покупателю
     * @param amount сумма; если не задана, возвращается весь остаток доли
     */
    virtual domain::EscrowOperationResult requestRefund(
        const std::string& allocationId,
        const std::optional<domain::Money>& amount,
        const std::optional<std::string>& refundReference,
        const std::optional<std::string>& initiatedBy = std::nullopt) = 0;

    /**
     * @brief Отмена заказа: вернуть покупателю остаток всех незакрытых аллокаций
     *
     * Аллокации в CREATED сначала становятся ELIGIBLE (с записью журнала),
     * закрытые аллокации пропускаются. Все изменения сохраняются одним commit.
     * @return по одному результату на каждую возвращённую аллокацию
     * @throws NotFoundException если escrow для заказа нет
     * @throws InvalidStateTransitionException если возвращать нечего
     */
    virtual std::vector<domain::EscrowOperationResult> refundOrder(
        const std::string& orderId,
        const std::optional<std::string>& refundReference,
        const std::optional<std::string>& initiatedBy = std::nullopt) = 0;

    /**
     * @brief Журнал платежа по (createdAt, sequence); каждый вызов возвращает новую копию
     */
    virtual std::vector<domain::LedgerEntry> getLedger(const std::string& escrowPaymentId) = 0;

    /**
     * @throws NotFoundException
     */
    virtual domain::Money getRemainingBalance(const std::string& escrowPaymentId) = 0;

    virtual std::optional<domain::EscrowPayment> getEscrowPayment(const std::string& escrowPaymentId) = 0;

    virtual std::optional<domain::EscrowPayment> getEscrowByOrderId(const std::string& orderId) = 0;

    /**
     * @brief Платёж, которому принадлежит аллокация
     */
    virtual std::optional<domain::EscrowPayment> getEscrowByAllocationId(const std::string& allocationId) = 0;

    virtual domain::SellerBalance getSellerBalance(const std::string& storeId) = 0;

    /**
     * @brief Сверить журнал с состоянием платежа
     * @throws NotFoundException
     */
    virtual domain::ReconciliationResult reconcile(const std::string& escrowPaymentId) = 0;
};

} // namespace escrow::ports::input
