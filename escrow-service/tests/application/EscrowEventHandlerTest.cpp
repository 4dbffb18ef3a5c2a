/**
 * @file EscrowEventHandlerTest.cpp
 * @brief Unit tests for incoming event routing
 */

#include <gtest/gtest.h>
#include "application/EscrowEventHandler.hpp"
#include "application/EscrowService.hpp"
#include "application/SettlementService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/persistence/InMemoryEscrowRepository.hpp"
#include "adapters/secondary/persistence/InMemorySettlementRepository.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/MockEventConsumer.hpp"
#include "mocks/MockEventPublisher.hpp"
#include "mocks/TestEscrowSettings.hpp"
#include <ctime>
#include <future>
#include <thread>

using namespace escrow;
using namespace escrow::domain;

class EscrowEventHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto escrowSettings = std::make_shared<tests::TestEscrowSettings>(std::chrono::milliseconds(50));
        auto escrowRepository = std::make_shared<adapters::secondary::InMemoryEscrowRepository>();
        coordinator = std::make_shared<application::EscrowCoordinator>(escrowSettings);
        publisher = std::make_shared<tests::MockEventPublisher>();
        metrics = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());

        escrowService = std::make_shared<application::EscrowService>(
            escrowRepository, coordinator, publisher, metrics, escrowSettings);
        settlementService = std::make_shared<application::SettlementService>(
            escrowRepository, std::make_shared<adapters::secondary::InMemorySettlementRepository>(),
            coordinator, publisher, metrics, escrowSettings);

        consumer = std::make_shared<tests::MockEventConsumer>();
        handler = std::make_unique<application::EscrowEventHandler>(consumer, escrowService, settlementService, metrics);
    }

    std::string deliverPayment(const std::string& orderId) {
        nlohmann::json event = {
            {"order_id", orderId},
            {"buyer_id", "buyer-1"},
            {"currency", "USD"},
            {"payment_transaction_id", "txn-" + orderId},
            {"total_amount", "100.00"},
            {"seller_shares", nlohmann::json::array({
                {{"store_id", "store-1"}, {"shipment_id", "ship-1"}, {"amount", "100.00"},
                 {"shipping_amount", "5.00"}, {"commission_rate", 12.5}}
            })}
        };
        consumer->deliver("order.payment_confirmed", event.dump());

        auto payment = escrowService->getEscrowByOrderId(orderId);
        return payment ? payment->allocations().front().id() : std::string();
    }

    std::shared_ptr<application::EscrowCoordinator> coordinator;
    std::shared_ptr<tests::MockEventPublisher> publisher;
    std::shared_ptr<application::MetricsService> metrics;
    std::shared_ptr<ports::input::IEscrowService> escrowService;
    std::shared_ptr<ports::input::ISettlementService> settlementService;
    std::shared_ptr<tests::MockEventConsumer> consumer;
    std::unique_ptr<application::EscrowEventHandler> handler;
};

TEST_F(EscrowEventHandlerTest, Constructor_SubscribesToAllEvents) {
    EXPECT_TRUE(consumer->isSubscribed("order.payment_confirmed"));
    EXPECT_TRUE(consumer->isSubscribed("shipment.delivered"));
    EXPECT_TRUE(consumer->isSubscribed("payout.requested"));
    EXPECT_TRUE(consumer->isSubscribed("refund.requested"));
    EXPECT_TRUE(consumer->isSubscribed("order.cancelled"));
    EXPECT_TRUE(consumer->isSubscribed("settlement.period_ended"));
}

TEST_F(EscrowEventHandlerTest, PaymentConfirmed_CreatesEscrow) {
    auto allocationId = deliverPayment("order-1");
    ASSERT_FALSE(allocationId.empty());

    auto payment = escrowService->getEscrowByOrderId("order-1");
    ASSERT_TRUE(payment.has_value());
    const auto& allocation = payment->allocations().front();
    EXPECT_EQ(allocation.commissionRate().toString(), "12.5");
    EXPECT_EQ(allocation.commissionAmount().toString(), "12.50");
    EXPECT_EQ(allocation.shippingAmount().toString(), "5.00");
    EXPECT_EQ(metrics->value("events_received_total", {{"event", "order.payment_confirmed"}}), 1);
}

TEST_F(EscrowEventHandlerTest, DeliveryPayoutRefund_Flow) {
    auto allocationId = deliverPayment("order-2");

    consumer->deliver("shipment.delivered", nlohmann::json{{"allocation_id", allocationId}}.dump());
    consumer->deliver("payout.requested",
        nlohmann::json{{"allocation_id", allocationId}, {"amount", "60.00"}, {"payout_reference", "po-1"}}.dump());
    consumer->deliver("refund.requested",
        nlohmann::json{{"allocation_id", allocationId}, {"refund_reference", "rf-1"}, {"initiated_by", "support"}}.dump());

    auto payment = escrowService->getEscrowByOrderId("order-2");
    ASSERT_TRUE(payment.has_value());
    EXPECT_EQ(payment->releasedAmount().toString(), "60.00");
    EXPECT_EQ(payment->refundedAmount().toString(), "40.00");
    EXPECT_EQ(payment->allocations().front().status(), AllocationStatus::REFUNDED);
    EXPECT_EQ(escrowService->getLedger(payment->id()).back().initiatedBy(), "support");
}

TEST_F(EscrowEventHandlerTest, InvalidEvents_AreSwallowedAndLogged) {
    EXPECT_NO_THROW(consumer->deliver("order.payment_confirmed", "not json"));
    EXPECT_NO_THROW(consumer->deliver("shipment.delivered", R"({"allocation_id":"missing"})"));
    EXPECT_NO_THROW(consumer->deliver("payout.requested", R"({"allocation_id":"missing","amount":"1.00"})"));
    EXPECT_NO_THROW(consumer->deliver("settlement.period_ended", R"({"year":2019,"month":1})"));

    EXPECT_EQ(publisher->publishCallCount(), 0);
}

// Пока платёж заблокирован другой командой, выплата не теряется:
// обработчик сообщает о временной ошибке, и событие уходит на повтор
TEST_F(EscrowEventHandlerTest, HeldLock_PayoutIsRetryableNotAcked) {
    auto allocationId = deliverPayment("order-6");
    consumer->deliver("shipment.delivered", nlohmann::json{{"allocation_id", allocationId}}.dump());
    auto paymentId = escrowService->getEscrowByOrderId("order-6")->id();

    std::promise<void> locked;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    std::thread holder([&]() {
        coordinator->execute(paymentId, [&] {
            locked.set_value();
            releaseFuture.wait();
            return 0;
        });
    });
    locked.get_future().wait();

    auto payout = nlohmann::json{{"allocation_id", allocationId}, {"payout_reference", "po-1"}}.dump();
    EXPECT_THROW(consumer->deliver("payout.requested", payout), ports::output::RetryableEventError);
    EXPECT_THROW(consumer->deliver("refund.requested", payout), ports::output::RetryableEventError);

    release.set_value();
    holder.join();

    auto payment = escrowService->getEscrowPayment(paymentId);
    ASSERT_TRUE(payment.has_value());
    EXPECT_TRUE(payment->releasedAmount().isZero());
    EXPECT_EQ(metrics->value("events_retried_total", {{"event", "payout.requested"}}), 1);

    // Повторная доставка после освобождения блокировки проходит
    EXPECT_NO_THROW(consumer->deliver("payout.requested", payout));
    EXPECT_EQ(escrowService->getEscrowPayment(paymentId)->releasedAmount().toString(), "100.00");
}

TEST_F(EscrowEventHandlerTest, OrderCancelled_RefundsRemainingEscrow) {
    deliverPayment("order-7");

    consumer->deliver("order.cancelled",
        nlohmann::json{{"order_id", "order-7"}, {"refund_reference", "rf-cancel"}, {"initiated_by", "order-service"}}.dump());

    auto payment = escrowService->getEscrowByOrderId("order-7");
    ASSERT_TRUE(payment.has_value());
    EXPECT_EQ(payment->status(), EscrowStatus::REFUNDED);
    EXPECT_EQ(payment->refundedAmount().toString(), "100.00");
    EXPECT_EQ(escrowService->getLedger(payment->id()).back().externalReference(),
              std::optional<std::string>("rf-cancel"));
    EXPECT_EQ(publisher->messagesFor("escrow.refunded").size(), 1u);

    // Повторная отмена: возвращать нечего, событие подтверждается
    EXPECT_NO_THROW(consumer->deliver("order.cancelled", nlohmann::json{{"order_id", "order-7"}}.dump()));
    EXPECT_NO_THROW(consumer->deliver("order.cancelled", nlohmann::json{{"order_id", "missing"}}.dump()));
    EXPECT_EQ(metrics->value("events_failed_total", {{"event", "order.cancelled"}}), 2);
}

TEST_F(EscrowEventHandlerTest, PayoutBeforeDelivery_LeavesEscrowHeld) {
    auto allocationId = deliverPayment("order-3");

    consumer->deliver("payout.requested", nlohmann::json{{"allocation_id", allocationId}}.dump());

    auto payment = escrowService->getEscrowByOrderId("order-3");
    ASSERT_TRUE(payment.has_value());
    EXPECT_EQ(payment->status(), EscrowStatus::HELD);
    EXPECT_TRUE(payment->releasedAmount().isZero());
}

TEST_F(EscrowEventHandlerTest, PeriodEnded_ClosesActiveStores) {
    auto allocationId = deliverPayment("order-4");
    consumer->deliver("shipment.delivered", nlohmann::json{{"allocation_id", allocationId}}.dump());
    consumer->deliver("payout.requested", nlohmann::json{{"allocation_id", allocationId}}.dump());

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    int year = tm.tm_year + 1900;
    int month = tm.tm_mon + 1;

    consumer->deliver("settlement.period_ended", nlohmann::json{{"year", year}, {"month", month}}.dump());

    auto settlement = settlementService->findSettlement("store-1", year, month);
    ASSERT_TRUE(settlement.has_value());
    EXPECT_EQ(settlement->items().size(), 1u);
}

TEST_F(EscrowEventHandlerTest, CancelPendingWork_StopsPeriodClose) {
    auto allocationId = deliverPayment("order-5");
    consumer->deliver("shipment.delivered", nlohmann::json{{"allocation_id", allocationId}}.dump());
    consumer->deliver("payout.requested", nlohmann::json{{"allocation_id", allocationId}}.dump());

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);

    handler->cancelPendingWork();
    consumer->deliver("settlement.period_ended",
        nlohmann::json{{"year", tm.tm_year + 1900}, {"month", tm.tm_mon + 1}}.dump());

    EXPECT_FALSE(settlementService->findSettlement("store-1", tm.tm_year + 1900, tm.tm_mon + 1).has_value());
}
