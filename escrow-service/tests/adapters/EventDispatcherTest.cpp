/**
 * @file EventDispatcherTest.cpp
 * @brief Unit tests for off-thread event dispatch and ack/requeue decisions
 */

#include <gtest/gtest.h>
#include "adapters/secondary/events/EventDispatcher.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace escrow;
using adapters::secondary::DispatchOutcome;

class EventDispatcherTest : public ::testing::Test {
protected:
    adapters::secondary::EventDispatcher dispatcher;
};

TEST_F(EventDispatcherTest, Dispatch_Success_Acks) {
    std::string seen;
    dispatcher.subscribe({"order.payment_confirmed"}, [&seen](const std::string&, const std::string& msg) {
        seen = msg;
    });

    EXPECT_EQ(dispatcher.dispatch("order.payment_confirmed", "{\"order_id\":\"o-1\"}"), DispatchOutcome::ACK);
    EXPECT_EQ(seen, "{\"order_id\":\"o-1\"}");
}

TEST_F(EventDispatcherTest, Dispatch_NoHandlers_Acks) {
    EXPECT_EQ(dispatcher.dispatch("unknown.event", "{}"), DispatchOutcome::ACK);
}

TEST_F(EventDispatcherTest, Dispatch_RetryableError_Requeues) {
    dispatcher.subscribe({"payout.requested"}, [](const std::string&, const std::string&) {
        throw ports::output::RetryableEventError("lock busy");
    });

    EXPECT_EQ(dispatcher.dispatch("payout.requested", "{}"), DispatchOutcome::REQUEUE);
}

TEST_F(EventDispatcherTest, Dispatch_OtherError_Rejects) {
    dispatcher.subscribe({"payout.requested"}, [](const std::string&, const std::string&) {
        throw std::runtime_error("broken handler");
    });

    EXPECT_EQ(dispatcher.dispatch("payout.requested", "{}"), DispatchOutcome::REJECT);
}

TEST_F(EventDispatcherTest, Dispatch_RequeueWinsOverReject) {
    dispatcher.subscribe({"refund.requested"}, [](const std::string&, const std::string&) {
        throw std::runtime_error("broken handler");
    });
    dispatcher.subscribe({"refund.requested"}, [](const std::string&, const std::string&) {
        throw ports::output::RetryableEventError("lock busy");
    });

    EXPECT_EQ(dispatcher.dispatch("refund.requested", "{}"), DispatchOutcome::REQUEUE);
}

TEST_F(EventDispatcherTest, RoutingKeys_CollectsAllSubscriptions) {
    auto noop = [](const std::string&, const std::string&) {};
    dispatcher.subscribe({"a", "b"}, noop);
    dispatcher.subscribe({"b", "c"}, noop);

    EXPECT_EQ(dispatcher.routingKeys(), (std::set<std::string>{"a", "b", "c"}));
}

// Долгий обработчик не держит поток, который вызвал submit()
TEST_F(EventDispatcherTest, Submit_RunsHandlerOffCallerThread) {
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    std::thread::id handlerThread;

    dispatcher.subscribe({"settlement.period_ended"}, [&](const std::string&, const std::string&) {
        handlerThread = std::this_thread::get_id();
        entered.set_value();
        releaseFuture.wait();
    });

    std::promise<DispatchOutcome> outcome;
    auto start = std::chrono::steady_clock::now();
    dispatcher.submit("settlement.period_ended", "{}", [&outcome](DispatchOutcome o) { outcome.set_value(o); });
    auto submitTook = std::chrono::steady_clock::now() - start;

    entered.get_future().wait();
    auto result = outcome.get_future();
    EXPECT_EQ(result.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);
    EXPECT_LT(submitTook, std::chrono::seconds(1));

    release.set_value();
    EXPECT_EQ(result.get(), DispatchOutcome::ACK);
    EXPECT_NE(handlerThread, std::this_thread::get_id());
}

TEST_F(EventDispatcherTest, Submit_PreservesOrder) {
    std::vector<std::string> order;
    dispatcher.subscribe({"shipment.delivered"}, [&order](const std::string&, const std::string& msg) {
        order.push_back(msg);
    });

    std::promise<void> last;
    for (int i = 0; i < 5; ++i) {
        dispatcher.submit("shipment.delivered", std::to_string(i), [&last, i](DispatchOutcome) {
            if (i == 4) {
                last.set_value();
            }
        });
    }
    last.get_future().wait();

    EXPECT_EQ(order, (std::vector<std::string>{"0", "1", "2", "3", "4"}));
}

TEST_F(EventDispatcherTest, Submit_ReportsRequeue) {
    dispatcher.subscribe({"payout.requested"}, [](const std::string&, const std::string&) {
        throw ports::output::RetryableEventError("lock busy");
    });

    std::promise<DispatchOutcome> outcome;
    dispatcher.submit("payout.requested", "{}", [&outcome](DispatchOutcome o) { outcome.set_value(o); });

    EXPECT_EQ(outcome.get_future().get(), DispatchOutcome::REQUEUE);
}

TEST_F(EventDispatcherTest, Stop_IsIdempotent) {
    dispatcher.stop();
    EXPECT_NO_THROW(dispatcher.stop());
}
