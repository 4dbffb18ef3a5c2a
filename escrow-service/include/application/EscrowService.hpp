// escrow-service/include/application/EscrowService.hpp
#pragma once

#include "ports/input/IEscrowService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IEscrowRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/EscrowCoordinator.hpp"
#include "settings/IEscrowSettings.hpp"
#include "domain/EscrowLedger.hpp"
#include "domain/LedgerReplay.hpp"
#include "utils/JsonMapper.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace escrow::application {

/**
 * @brief Сервис escrow-платежей
 *
 * Архитектура:
 * - команды (создание, eligible, release, refund) выполняются внутри
 *   EscrowCoordinator::execute для ID платежа: загрузка → доменная операция →
 *   запись журнала → repository->commit (состояние и журнал вместе)
 * - после успешного commit публикуется событие в RabbitMQ
 * - запросы читают снимок из репозитория без блокировки
 */
class EscrowService : public ports::input::IEscrowService {
public:
    EscrowService(
        std::shared_ptr<ports::output::IEscrowRepository> repository,
        std::shared_ptr<EscrowCoordinator> coordinator,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::IEscrowSettings> settings
    ) : repository_(std::move(repository))
      , coordinator_(std::move(coordinator))
      , eventPublisher_(std::move(eventPublisher))
      , metrics_(std::move(metrics))
      , defaultRate_(domain::CommissionRate::fromPercent(settings->getDefaultCommissionPercent()))
    {
        std::cout << "[EscrowService] Created, default commission "
                  << defaultRate_.toString() << "%" << std::endl;
    }

    domain::EscrowPayment onOrderPaymentConfirmed(const domain::PaymentConfirmation& confirmation) override {
        if (confirmation.orderId.empty()) {
            throw domain::InvalidArgumentException("Order ID is required.");
        }
        if (confirmation.sellerShares.empty()) {
            throw domain::InvalidArgumentException("At least one seller share is required.");
        }

        // Повторные подтверждения одного заказа сериализуются по orderId
        return guarded("order:" + confirmation.orderId, [&] {
            if (auto existing = repository_->findByOrderId(confirmation.orderId)) {
                std::cout << "[EscrowService] Escrow for order " << confirmation.orderId
                          << " already exists: " << existing->id() << std::endl;
                return *existing;
            }

            auto payment = domain::EscrowPayment::create(
                confirmation.orderId,
                confirmation.buyerId,
                confirmation.totalAmount,
                confirmation.currency,
                confirmation.paymentTransactionId);

            std::vector<domain::LedgerEntry> entries;
            int64_t sequence = 0;
            entries.push_back(domain::EscrowLedger::createCreatedEntry(payment, ++sequence));

            for (const auto& share : confirmation.sellerShares) {
                const auto& allocation = payment.addAllocation(
                    share.storeId,
                    share.shipmentId,
                    share.amount,
                    share.shippingAmount.value_or(domain::Money::zero(payment.currency())),
                    share.commissionRate.value_or(defaultRate_));
                entries.push_back(domain::EscrowLedger::createAllocationEntry(payment, allocation, ++sequence));
            }

            payment.validateAllocationsCoverTotal();

            try {
                repository_->insert(payment, entries);
            } catch (const domain::ContentionException&) {
                // Другой экземпляр сервиса успел создать escrow для этого заказа
                if (auto existing = repository_->findByOrderId(confirmation.orderId)) {
                    return *existing;
                }
                throw;
            }

            std::cout << "[EscrowService] Escrow " << payment.id() << " created for order "
                      << payment.orderId() << ": " << payment.totalAmount().toString() << " "
                      << payment.currency() << ", " << payment.allocations().size()
                      << " allocation(s)" << std::endl;

            metrics_->increment("escrows_created_total");
            publish("escrow.created", utils::JsonMapper::toJson(payment));
            return payment;
        });
    }

    domain::EscrowAllocation onShipmentDelivered(const std::string& allocationId) override {
        std::string paymentId = resolvePaymentId(allocationId);

        return guarded(paymentId, [&] {
            auto payment = loadPayment(paymentId);
            int64_t expectedVersion = payment.version();
            int64_t sequence = repository_->lastLedgerSequence(paymentId);

            const auto& allocation = payment.markAllocationEligible(allocationId);
            auto entry = domain::EscrowLedger::createEligibleEntry(payment, allocation, sequence + 1);
            repository_->commit(payment, expectedVersion, {entry});

            std::cout << "[EscrowService] Allocation " << allocationId << " eligible (store "
                      << allocation.storeId() << ")" << std::endl;

            metrics_->increment("allocations_eligible_total");
            publish("escrow.allocation_eligible", utils::JsonMapper::toJson(allocation));
            return allocation;
        });
    }

    domain::EscrowOperationResult requestRelease(
        const std::string& allocationId,
        const std::optional<domain::Money>& amount,
        const std::optional<std::string>& payoutReference,
        const std::optional<std::string>& initiatedBy) override
    {
        return drawDown(domain::AllocationOperation::RELEASE, allocationId, amount, payoutReference, initiatedBy);
    }

    domain::EscrowOperationResult requestRefund(
        const std::string& allocationId,
        const std::optional<domain::Money>& amount,
        const std::optional<std::string>& refundReference,
        const std::optional<std::string>& initiatedBy) override
    {
        return drawDown(domain::AllocationOperation::REFUND, allocationId, amount, refundReference, initiatedBy);
    }

    std::vector<domain::EscrowOperationResult> refundOrder(
        const std::string& orderId,
        const std::optional<std::string>& refundReference,
        const std::optional<std::string>& initiatedBy) override
    {
        if (orderId.empty()) {
            throw domain::InvalidArgumentException("Order ID is required.");
        }
        auto existing = repository_->findByOrderId(orderId);
        if (!existing) {
            throw domain::NotFoundException("Escrow for order " + orderId + " not found.");
        }
        std::string paymentId = existing->id();

        return guarded(paymentId, [&] {
            auto payment = loadPayment(paymentId);
            int64_t expectedVersion = payment.version();
            int64_t sequence = repository_->lastLedgerSequence(paymentId);
            std::string initiator = initiatedBy.value_or(domain::EscrowLedger::DEFAULT_INITIATOR);

            std::vector<std::string> openAllocations;
            for (const auto& allocation : payment.allocations()) {
                if (!domain::isTerminal(allocation.status()) && allocation.remainingShare().isPositive()) {
                    openAllocations.push_back(allocation.id());
                }
            }
            if (openAllocations.empty()) {
                throw domain::InvalidStateTransitionException(
                    "Escrow " + paymentId + " of order " + orderId + " has nothing left to refund.");
            }

            std::vector<domain::LedgerEntry> entries;
            std::vector<domain::EscrowOperationResult> results;

            try {
                for (const auto& allocationId : openAllocations) {
                    if (payment.findAllocation(allocationId)->status() == domain::AllocationStatus::CREATED) {
                        const auto& eligible = payment.markAllocationEligible(allocationId);
                        entries.push_back(domain::EscrowLedger::createEligibleEntry(payment, eligible, ++sequence));
                    }

                    domain::Money value = payment.findAllocation(allocationId)->remainingShare();
                    const auto& allocation = payment.applyRefund(allocationId, value, refundReference);
                    auto entry = domain::EscrowLedger::createRefundEntry(
                        payment, allocation, ++sequence, value, refundReference, initiator);

                    results.push_back(toResult(payment, allocation, entry, value));
                    entries.push_back(std::move(entry));
                }
            } catch (const domain::InsufficientEscrowBalanceException& e) {
                reportInvariantViolation(paymentId, e);
                throw;
            }

            repository_->commit(payment, expectedVersion, entries);

            std::cout << "[EscrowService] Order " << orderId << " refunded: " << results.size()
                      << " allocation(s), escrow " << paymentId << " now "
                      << domain::toString(payment.status()) << std::endl;

            for (auto& result : results) {
                // Статус платежа после всей отмены, а не после отдельной аллокации
                result.escrowStatus = payment.status();
                metrics_->increment("escrow_refunds_total");
                publish("escrow.refunded", utils::JsonMapper::toJson(result));
            }
            metrics_->increment("escrow_order_refunds_total");
            return results;
        });
    }

    std::vector<domain::LedgerEntry> getLedger(const std::string& escrowPaymentId) override {
        if (!repository_->findById(escrowPaymentId)) {
            throw domain::NotFoundException("Escrow payment " + escrowPaymentId + " not found.");
        }
        return repository_->getLedger(escrowPaymentId);
    }

    domain::Money getRemainingBalance(const std::string& escrowPaymentId) override {
        return loadPayment(escrowPaymentId).remainingBalance();
    }

    std::optional<domain::EscrowPayment> getEscrowPayment(const std::string& escrowPaymentId) override {
        return repository_->findById(escrowPaymentId);
    }

    std::optional<domain::EscrowPayment> getEscrowByOrderId(const std::string& orderId) override {
        return repository_->findByOrderId(orderId);
    }

    std::optional<domain::EscrowPayment> getEscrowByAllocationId(const std::string& allocationId) override {
        auto paymentId = repository_->findPaymentIdByAllocation(allocationId);
        if (!paymentId) {
            return std::nullopt;
        }
        return repository_->findById(*paymentId);
    }

    domain::SellerBalance getSellerBalance(const std::string& storeId) override {
        if (storeId.empty()) {
            throw domain::InvalidArgumentException("Store ID is required.");
        }

        auto allocations = repository_->findAllocationsByStore(storeId);

        domain::SellerBalance balance;
        balance.storeId = storeId;
        balance.currency = allocations.empty()
            ? domain::SellerBalance::DEFAULT_CURRENCY
            : allocations.front().currency();
        balance.totalHeld = domain::Money::zero(balance.currency);
        balance.totalEligible = domain::Money::zero(balance.currency);
        balance.pendingCommission = domain::Money::zero(balance.currency);
        balance.released = domain::Money::zero(balance.currency);
        balance.refunded = domain::Money::zero(balance.currency);

        for (const auto& allocation : allocations) {
            balance.released = balance.released + allocation.releasedAmount();
            balance.refunded = balance.refunded + allocation.refundedAmount();

            if (domain::isTerminal(allocation.status())) {
                continue;
            }

            domain::Money remaining = allocation.remainingShare();
            balance.totalHeld = balance.totalHeld + remaining;
            balance.pendingCommission = balance.pendingCommission + allocation.commissionRate().applyTo(remaining);
            ++balance.heldAllocations;

            if (allocation.canBeReleased()) {
                balance.totalEligible = balance.totalEligible + remaining;
                ++balance.eligibleAllocations;
            }
        }
        return balance;
    }

    domain::ReconciliationResult reconcile(const std::string& escrowPaymentId) override {
        auto payment = loadPayment(escrowPaymentId);
        auto result = domain::LedgerReplay::reconcile(payment, repository_->getLedger(escrowPaymentId));

        if (!result.consistent()) {
            std::cerr << "[EscrowService] ALERT: ledger of escrow " << escrowPaymentId
                      << " does not reconcile:";
            for (const auto& d : result.discrepancies) {
                std::cerr << " [" << d << "]";
            }
            std::cerr << std::endl;
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IEscrowRepository> repository_;
    std::shared_ptr<EscrowCoordinator> coordinator_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    domain::CommissionRate defaultRate_;

    /**
     * @brief Выплата или возврат из доли аллокации
     *
     * Состояние и запись журнала сохраняются одним commit; при любом
     * исключении до commit в хранилище ничего не попадает.
     */
    domain::EscrowOperationResult drawDown(
        domain::AllocationOperation operation,
        const std::string& allocationId,
        const std::optional<domain::Money>& amount,
        const std::optional<std::string>& reference,
        const std::optional<std::string>& initiatedBy)
    {
        std::string paymentId = resolvePaymentId(allocationId);
        bool release = operation == domain::AllocationOperation::RELEASE;

        return guarded(paymentId, [&] {
            auto payment = loadPayment(paymentId);
            const auto* current = payment.findAllocation(allocationId);
            if (!current) {
                throw domain::NotFoundException("Allocation " + allocationId + " not found.");
            }

            domain::Money value = amount ? *amount : current->remainingShare();
            if (value.currency() != payment.currency()) {
                throw domain::CurrencyMismatchException(payment.currency(), value.currency());
            }

            int64_t expectedVersion = payment.version();
            int64_t sequence = repository_->lastLedgerSequence(paymentId) + 1;
            std::string initiator = initiatedBy.value_or(domain::EscrowLedger::DEFAULT_INITIATOR);

            try {
                const auto& allocation = release
                    ? payment.applyRelease(allocationId, value, reference)
                    : payment.applyRefund(allocationId, value, reference);

                auto entry = release
                    ? domain::EscrowLedger::createReleaseEntry(payment, allocation, sequence, value, reference, initiator)
                    : domain::EscrowLedger::createRefundEntry(payment, allocation, sequence, value, reference, initiator);

                repository_->commit(payment, expectedVersion, {entry});

                auto result = toResult(payment, allocation, entry, value);

                std::cout << "[EscrowService] " << domain::toString(entry.action()) << " "
                          << value.toString() << " " << value.currency() << " on allocation "
                          << allocationId << ", balance after " << result.balanceAfter.toString()
                          << std::endl;

                metrics_->increment(release ? "escrow_releases_total" : "escrow_refunds_total");
                publish(release ? "escrow.released" : "escrow.refunded", utils::JsonMapper::toJson(result));
                return result;

            } catch (const domain::InsufficientEscrowBalanceException& e) {
                reportInvariantViolation(paymentId, e);
                throw;
            }
        });
    }

    static domain::EscrowOperationResult toResult(
        const domain::EscrowPayment& payment,
        const domain::EscrowAllocation& allocation,
        const domain::LedgerEntry& entry,
        const domain::Money& value)
    {
        domain::EscrowOperationResult result;
        result.escrowPaymentId = payment.id();
        result.allocationId = allocation.id();
        result.action = entry.action();
        result.amount = value;
        result.allocationStatus = allocation.status();
        result.escrowStatus = payment.status();
        result.balanceAfter = entry.balanceAfter();
        result.ledgerEntryId = entry.id();
        return result;
    }

    void reportInvariantViolation(const std::string& paymentId, const std::exception& e) {
        std::cerr << "[EscrowService] ALERT: escrow invariant violated on " << paymentId
                  << ": " << e.what() << std::endl;
        metrics_->increment("escrow_invariant_violations_total");
    }

    template<typename Action>
    auto guarded(const std::string& key, Action&& action) -> decltype(action()) {
        try {
            return coordinator_->execute(key, std::forward<Action>(action));
        } catch (const domain::ContentionException& e) {
            std::cout << "[EscrowService] Contention on " << key << ": " << e.what() << std::endl;
            metrics_->increment("escrow_contention_total");
            throw;
        }
    }

    std::string resolvePaymentId(const std::string& allocationId) {
        if (allocationId.empty()) {
            throw domain::InvalidArgumentException("Allocation ID is required.");
        }
        auto paymentId = repository_->findPaymentIdByAllocation(allocationId);
        if (!paymentId) {
            throw domain::NotFoundException("Allocation " + allocationId + " not found.");
        }
        return *paymentId;
    }

    domain::EscrowPayment loadPayment(const std::string& escrowPaymentId) {
        auto payment = repository_->findById(escrowPaymentId);
        if (!payment) {
            throw domain::NotFoundException("Escrow payment " + escrowPaymentId + " not found.");
        }
        return std::move(*payment);
    }

    void publish(const std::string& routingKey, nlohmann::json event) {
        try {
            event["timestamp"] = domain::Timestamp::now().toString();
            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[EscrowService] Failed to publish " << routingKey << ": " << e.what() << std::endl;
        }
    }
};

} // namespace escrow::application
