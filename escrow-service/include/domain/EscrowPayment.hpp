#pragma once

#include "domain/EscrowAllocation.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/EscrowStatus.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace escrow::domain {

/**
 * @brief Escrow-платёж покупателя (корень агрегата, один на заказ)
 *
 * Владеет аллокациями продавцов и авторитетными счётчиками released/refunded.
 * Инвариант: 0 <= released + refunded <= total, remainingBalance >= 0.
 *
 * Все мутации выполняются вызывающим кодом под блокировкой EscrowCoordinator
 * для данного id; сам объект не потокобезопасен.
 */
class EscrowPayment {
public:
    struct Data {
        std::string id;
        std::string orderId;
        std::string buyerId;
        Money totalAmount;
        std::string paymentTransactionId;
        Money releasedAmount;
        Money refundedAmount;
        EscrowStatus status = EscrowStatus::HELD;
        int64_t version = 0;
        Timestamp createdAt;
        Timestamp updatedAt;
        std::optional<Timestamp> releasedAt;
        std::optional<Timestamp> refundedAt;
    };

    /**
     * @brief Создать escrow после подтверждения оплаты заказа
     * @throws InvalidArgumentException пустые ID, total <= 0, пустая/некорректная валюта
     * @throws CurrencyMismatchException currency не совпадает с валютой totalAmount
     */
    static EscrowPayment create(
        const std::string& orderId,
        const std::string& buyerId,
        const Money& totalAmount,
        const std::string& currency,
        const std::string& paymentTransactionId);

    static EscrowPayment restore(Data data, std::vector<EscrowAllocation> allocations) {
        return EscrowPayment(std::move(data), std::move(allocations));
    }

    /**
     * @brief Добавить долю продавца (fan-out при создании)
     *
     * Допустимо только пока по платежу не было выплат/возвратов.
     */
    const EscrowAllocation& addAllocation(
        const std::string& storeId,
        const std::optional<std::string>& shipmentId,
        const Money& totalAmount,
        const Money& shippingAmount,
        const CommissionRate& commissionRate);

    /**
     * @brief Проверить, что сумма аллокаций в точности равна total
     * @throws InvalidArgumentException
     */
    void validateAllocationsCoverTotal() const;

    const EscrowAllocation& markAllocationEligible(const std::string& allocationId);

    /**
     * @brief Выплата продавцу из доли аллокации
     *
     * Изменения применяются к копии аллокации и фиксируются только после
     * всех проверок: при исключении агрегат остаётся нетронутым.
     *
     * @throws NotFoundException аллокация не принадлежит платежу
     * @throws InvalidStateTransitionException недопустимый статус аллокации
     * @throws InvalidArgumentException amount <= 0 или больше остатка доли
     * @throws InsufficientEscrowBalanceException amount больше remainingBalance (нарушение инварианта)
     */
    const EscrowAllocation& applyRelease(
        const std::string& allocationId,
        const Money& amount,
        const std::optional<std::string>& payoutReference);

    const EscrowAllocation& applyRefund(
        const std::string& allocationId,
        const Money& amount,
        const std::optional<std::string>& refundReference);

    const EscrowAllocation* findAllocation(const std::string& allocationId) const;

    Money remainingBalance() const {
        return data_.totalAmount - data_.releasedAmount - data_.refundedAmount;
    }

    const std::string& id() const { return data_.id; }
    const std::string& orderId() const { return data_.orderId; }
    const std::string& buyerId() const { return data_.buyerId; }
    const Money& totalAmount() const { return data_.totalAmount; }
    const std::string& currency() const { return data_.totalAmount.currency(); }
    const std::string& paymentTransactionId() const { return data_.paymentTransactionId; }
    const Money& releasedAmount() const { return data_.releasedAmount; }
    const Money& refundedAmount() const { return data_.refundedAmount; }
    EscrowStatus status() const { return data_.status; }
    int64_t version() const { return data_.version; }
    const Timestamp& createdAt() const { return data_.createdAt; }
    const Timestamp& updatedAt() const { return data_.updatedAt; }
    const std::optional<Timestamp>& releasedAt() const { return data_.releasedAt; }
    const std::optional<Timestamp>& refundedAt() const { return data_.refundedAt; }
    const std::vector<EscrowAllocation>& allocations() const { return allocations_; }

    const Data& data() const { return data_; }

private:
    EscrowPayment(Data data, std::vector<EscrowAllocation> allocations)
        : data_(std::move(data)), allocations_(std::move(allocations)) {}

    size_t indexOf(const std::string& allocationId) const;
    void guardBalance(const Money& amount, const std::string& operation) const;
    void touch();
    void recalculateStatus();

    Data data_;
    std::vector<EscrowAllocation> allocations_;
};

} // namespace escrow::domain
