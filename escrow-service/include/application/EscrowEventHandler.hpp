// escrow-service/include/application/EscrowEventHandler.hpp
#pragma once

#include "ports/output/IEventConsumer.hpp"
#include "ports/input/IEscrowService.hpp"
#include "ports/input/ISettlementService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "utils/CancellationToken.hpp"
#include "utils/JsonMapper.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <optional>

namespace escrow::application {

/**
 * @brief Обработчик входящих событий
 *
 * Слушает события из escrow.events exchange:
 * - order.payment_confirmed → создать escrow и аллокации
 * - shipment.delivered → аллокация eligible
 * - payout.requested / refund.requested → выплата / возврат
 * - order.cancelled → вернуть покупателю всё, что осталось в escrow заказа
 * - settlement.period_ended → закрыть период для всех магазинов
 *
 * Ошибки бизнес-правил логируются и событие подтверждается. Временные
 * ошибки (ContentionException) пробрасываются как RetryableEventError,
 * чтобы брокер доставил событие повторно.
 */
class EscrowEventHandler {
public:
    EscrowEventHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::input::IEscrowService> escrowService,
        std::shared_ptr<ports::input::ISettlementService> settlementService,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : eventConsumer_(std::move(eventConsumer))
      , escrowService_(std::move(escrowService))
      , settlementService_(std::move(settlementService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[EscrowEventHandler] Created" << std::endl;
        subscribe();
    }

    /**
     * @brief Прервать идущее закрытие периода (при остановке сервиса)
     */
    void cancelPendingWork() {
        shutdown_.cancel();
    }

private:
    void subscribe() {
        eventConsumer_->subscribe(
            {"order.payment_confirmed", "shipment.delivered", "payout.requested",
             "refund.requested", "order.cancelled", "settlement.period_ended"},
            [this](const std::string& key, const std::string& msg) { handleEvent(key, msg); }
        );
        std::cout << "[EscrowEventHandler] Subscribed to 6 event types" << std::endl;
    }

    void handleEvent(const std::string& routingKey, const std::string& message) {
        metrics_->increment("events_received_total", {{"event", routingKey}});

        try {
            auto json = nlohmann::json::parse(message);

            if (routingKey == "order.payment_confirmed") {
                handlePaymentConfirmed(json);
            } else if (routingKey == "shipment.delivered") {
                handleShipmentDelivered(json);
            } else if (routingKey == "payout.requested") {
                handleDrawDown(json, true);
            } else if (routingKey == "refund.requested") {
                handleDrawDown(json, false);
            } else if (routingKey == "order.cancelled") {
                handleOrderCancelled(json);
            } else if (routingKey == "settlement.period_ended") {
                handlePeriodEnded(json);
            } else {
                std::cout << "[EscrowEventHandler] Ignoring " << routingKey << std::endl;
            }
        } catch (const domain::EscrowException& e) {
            std::cerr << "[EscrowEventHandler] " << routingKey << " failed ("
                      << domain::toString(e.code()) << (e.isRetryable() ? ", retryable" : "")
                      << "): " << e.what() << std::endl;
            if (e.isRetryable()) {
                metrics_->increment("events_retried_total", {{"event", routingKey}});
                throw ports::output::RetryableEventError(routingKey + ": " + e.what());
            }
            metrics_->increment("events_failed_total", {{"event", routingKey}});
        } catch (const std::exception& e) {
            std::cerr << "[EscrowEventHandler] Error: " << e.what() << std::endl;
        }
    }

    void handlePaymentConfirmed(const nlohmann::json& json) {
        domain::PaymentConfirmation confirmation;
        confirmation.orderId = json.value("order_id", "");
        confirmation.buyerId = json.value("buyer_id", "");
        confirmation.currency = json.value("currency", "");
        confirmation.paymentTransactionId = json.value("payment_transaction_id", "");
        confirmation.totalAmount = utils::JsonMapper::parseMoney(json.at("total_amount"), confirmation.currency);

        for (const auto& s : json.value("seller_shares", nlohmann::json::array())) {
            domain::SellerShare share;
            share.storeId = s.value("store_id", "");
            share.shipmentId = utils::JsonMapper::optionalString(s, "shipment_id");
            share.amount = utils::JsonMapper::parseMoney(s.at("amount"), confirmation.currency);
            if (s.contains("shipping_amount") && !s["shipping_amount"].is_null()) {
                share.shippingAmount = utils::JsonMapper::parseMoney(s["shipping_amount"], confirmation.currency);
            }
            if (s.contains("commission_rate") && !s["commission_rate"].is_null()) {
                share.commissionRate = domain::CommissionRate::fromPercent(s["commission_rate"].get<double>());
            }
            confirmation.sellerShares.push_back(share);
        }

        auto payment = escrowService_->onOrderPaymentConfirmed(confirmation);
        std::cout << "[EscrowEventHandler] order.payment_confirmed: " << confirmation.orderId
                  << " -> escrow " << payment.id() << std::endl;
    }

    void handleShipmentDelivered(const nlohmann::json& json) {
        std::string allocationId = json.value("allocation_id", "");
        auto allocation = escrowService_->onShipmentDelivered(allocationId);
        std::cout << "[EscrowEventHandler] shipment.delivered: " << allocationId
                  << " -> " << domain::toString(allocation.status()) << std::endl;
    }

    void handleDrawDown(const nlohmann::json& json, bool release) {
        std::string allocationId = json.value("allocation_id", "");
        auto reference = utils::JsonMapper::optionalString(json, release ? "payout_reference" : "refund_reference");
        auto initiatedBy = utils::JsonMapper::optionalString(json, "initiated_by");

        std::optional<domain::Money> amount;
        if (json.contains("amount") && !json["amount"].is_null()) {
            amount = utils::JsonMapper::parseMoney(json["amount"], currencyOf(allocationId, json));
        }

        auto result = release
            ? escrowService_->requestRelease(allocationId, amount, reference, initiatedBy)
            : escrowService_->requestRefund(allocationId, amount, reference, initiatedBy);

        std::cout << "[EscrowEventHandler] " << (release ? "payout.requested" : "refund.requested")
                  << ": " << allocationId << " -> " << domain::toString(result.allocationStatus)
                  << ", balance " << result.balanceAfter.toString() << std::endl;
    }

    void handleOrderCancelled(const nlohmann::json& json) {
        std::string orderId = json.value("order_id", "");
        auto reference = utils::JsonMapper::optionalString(json, "refund_reference");
        auto initiatedBy = utils::JsonMapper::optionalString(json, "initiated_by");

        auto results = escrowService_->refundOrder(orderId, reference, initiatedBy);
        std::cout << "[EscrowEventHandler] order.cancelled: " << orderId << " -> "
                  << results.size() << " allocation(s) refunded" << std::endl;
    }

    // Валюта суммы: из события, иначе валюта escrow
    std::string currencyOf(const std::string& allocationId, const nlohmann::json& json) {
        if (json.contains("currency") && json["currency"].is_string()) {
            return json["currency"].get<std::string>();
        }
        auto payment = escrowService_->getEscrowByAllocationId(allocationId);
        if (!payment) {
            throw domain::NotFoundException("Allocation " + allocationId + " not found.");
        }
        return payment->currency();
    }

    void handlePeriodEnded(const nlohmann::json& json) {
        int year = json.at("year").get<int>();
        int month = json.at("month").get<int>();

        auto results = settlementService_->closeAllSettlements(year, month, shutdown_);
        std::cout << "[EscrowEventHandler] settlement.period_ended " << year << "-" << month
                  << ": " << results.size() << " store(s) processed" << std::endl;
    }

    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::input::IEscrowService> escrowService_;
    std::shared_ptr<ports::input::ISettlementService> settlementService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    utils::CancellationToken shutdown_;
};

} // namespace escrow::application
