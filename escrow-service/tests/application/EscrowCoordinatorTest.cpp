/**
 * @file EscrowCoordinatorTest.cpp
 * @brief Unit tests for per-key locking
 */

#include <gtest/gtest.h>
#include "application/EscrowCoordinator.hpp"
#include "mocks/TestEscrowSettings.hpp"
#include <atomic>
#include <future>
#include <thread>

using namespace escrow;

class EscrowCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator = std::make_shared<application::EscrowCoordinator>(
            std::make_shared<tests::TestEscrowSettings>(std::chrono::milliseconds(50)));
    }

    std::shared_ptr<application::EscrowCoordinator> coordinator;
};

TEST_F(EscrowCoordinatorTest, Execute_ReturnsActionResult) {
    int value = coordinator->execute("esc-1", [] { return 42; });

    EXPECT_EQ(value, 42);
    EXPECT_EQ(coordinator->trackedKeys(), 0u);
}

TEST_F(EscrowCoordinatorTest, Execute_TracksKeyOnlyWhileRunning) {
    size_t during = coordinator->execute("esc-1", [this] { return coordinator->trackedKeys(); });

    EXPECT_EQ(during, 1u);
    EXPECT_EQ(coordinator->trackedKeys(), 0u);
}

TEST_F(EscrowCoordinatorTest, ManyKeys_DoNotAccumulate) {
    for (int i = 0; i < 1000; ++i) {
        coordinator->execute("esc-" + std::to_string(i), [] { return 0; });
        coordinator->execute("order:" + std::to_string(i), [] { return 0; });
    }

    EXPECT_EQ(coordinator->trackedKeys(), 0u);
}

TEST_F(EscrowCoordinatorTest, Execute_PropagatesException) {
    EXPECT_THROW(coordinator->execute("esc-1", []() -> int {
        throw domain::InvalidArgumentException("bad");
    }), domain::InvalidArgumentException);

    // Блокировка освобождена
    EXPECT_EQ(coordinator->trackedKeys(), 0u);
    EXPECT_NO_THROW(coordinator->execute("esc-1", [] { return 0; }));
}

TEST_F(EscrowCoordinatorTest, HeldLock_TimesOutWithContention) {
    std::promise<void> locked;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    std::thread holder([&]() {
        coordinator->execute("esc-1", [&] {
            locked.set_value();
            releaseFuture.wait();
            return 0;
        });
    });
    locked.get_future().wait();

    try {
        coordinator->execute("esc-1", [] { return 0; });
        FAIL() << "Expected ContentionException";
    } catch (const domain::ContentionException& e) {
        EXPECT_TRUE(e.isRetryable());
        EXPECT_EQ(e.code(), domain::ErrorCode::CONTENTION);
    }

    // Другой ключ не блокируется
    EXPECT_EQ(coordinator->execute("esc-2", [] { return 7; }), 7);

    // Ключ держит только поток-владелец
    EXPECT_EQ(coordinator->trackedKeys(), 1u);

    release.set_value();
    holder.join();
    EXPECT_EQ(coordinator->trackedKeys(), 0u);
}

TEST_F(EscrowCoordinatorTest, SameKey_IsSerialized) {
    auto relaxed = std::make_shared<application::EscrowCoordinator>(
        std::make_shared<tests::TestEscrowSettings>(std::chrono::milliseconds(5000)));

    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            relaxed->execute("esc-1", [&] {
                int now = ++inside;
                int prev = maxInside.load();
                while (now > prev && !maxInside.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                --inside;
                return 0;
            });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(relaxed->trackedKeys(), 0u);
}
