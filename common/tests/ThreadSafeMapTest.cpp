#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <set>
#include <mutex>

struct TestData {
    int value;
    std::string name;

    TestData(int v = 0, const std::string& n = "") : value(v), name(n) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, TestData> map;
};

TEST_F(ThreadSafeMapTest, FindOrInsert_CreatesOnce) {
    int factoryCalls = 0;
    auto factory = [&factoryCalls]() {
        ++factoryCalls;
        return std::make_shared<TestData>(7, "created");
    };

    auto first = map.findOrInsert("lock-1", factory);
    auto second = map.findOrInsert("lock-1", factory);

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(factoryCalls, 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, FindOrInsert_DoesNotOverwriteExisting) {
    auto original = map.findOrInsert("key", []() { return std::make_shared<TestData>(1, "original"); });

    auto found = map.findOrInsert("key", []() { return std::make_shared<TestData>(2, "new"); });

    EXPECT_EQ(found->value, 1);
    EXPECT_EQ(found->name, "original");
}

TEST_F(ThreadSafeMapTest, ReleaseIfUnused_KeepsHeldValue) {
    auto held = map.findOrInsert("key", []() { return std::make_shared<TestData>(5, "held"); });

    EXPECT_FALSE(map.releaseIfUnused("key"));
    EXPECT_EQ(map.size(), 1u);

    held.reset();
    EXPECT_TRUE(map.releaseIfUnused("key"));
    EXPECT_EQ(map.size(), 0u);
    EXPECT_FALSE(map.releaseIfUnused("key"));
}

TEST_F(ThreadSafeMapTest, ReleaseIfUnused_MissingKey) {
    EXPECT_FALSE(map.releaseIfUnused("nonexistent"));
}

// Все потоки, запросившие один ключ, получают один и тот же объект
TEST_F(ThreadSafeMapTest, ConcurrentFindOrInsert_SingleInstance) {
    const int NUM_THREADS = 16;
    std::atomic<int> factoryCalls(0);
    std::vector<std::shared_ptr<TestData>> results(NUM_THREADS);
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t, &factoryCalls, &results]() {
            results[t] = map.findOrInsert("escrow-1", [&factoryCalls]() {
                factoryCalls++;
                return std::make_shared<TestData>(0, "lock");
            });
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(factoryCalls.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r.get(), results[0].get());
    }
}

// Каждый поток берёт, отпускает и освобождает свои ключи: карта не растёт
TEST_F(ThreadSafeMapTest, ConcurrentAcquireRelease_LeavesMapEmpty) {
    const int NUM_THREADS = 8;
    const int ROUNDS = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < ROUNDS; ++i) {
                // Половина ключей общая для всех потоков
                std::string key = (i % 2 == 0) ? "shared_" + std::to_string(i % 10)
                                               : "t" + std::to_string(t) + "_" + std::to_string(i);
                auto value = map.findOrInsert(key, []() { return std::make_shared<TestData>(); });
                EXPECT_NE(value, nullptr);
                value.reset();
                map.releaseIfUnused(key);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(map.size(), 0u);
}
