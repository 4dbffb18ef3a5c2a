/**
 * @file InMemorySettlementRepositoryTest.cpp
 * @brief Unit tests for the in-memory settlement store
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemorySettlementRepository.hpp"

using namespace escrow;
using namespace escrow::domain;

class InMemorySettlementRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository = std::make_shared<adapters::secondary::InMemorySettlementRepository>();
    }

    std::shared_ptr<adapters::secondary::InMemorySettlementRepository> repository;
};

TEST_F(InMemorySettlementRepositoryTest, Insert_SamePeriodTwice_Contention) {
    repository->insert(Settlement::create("store-1", 2025, 1, "USD"));

    EXPECT_THROW(repository->insert(Settlement::create("store-1", 2025, 1, "USD")), ContentionException);
    EXPECT_NO_THROW(repository->insert(Settlement::create("store-1", 2025, 2, "USD")));
    EXPECT_NO_THROW(repository->insert(Settlement::create("store-2", 2025, 1, "USD")));
}

TEST_F(InMemorySettlementRepositoryTest, Update_KeepsItems) {
    auto settlement = Settlement::create("store-1", 2025, 1, "USD");
    settlement.addItem(SettlementItem::create(settlement.id(), "alloc-1", std::nullopt, "order-1",
                                              Money::parse("10", "USD"), Money::zero("USD"),
                                              Money::parse("1", "USD"), Money::zero("USD"), Timestamp::now()));
    repository->insert(settlement);

    auto loaded = *repository->findById(settlement.id());
    loaded.approve("finance");
    repository->update(loaded);

    auto stored = repository->findByStoreAndPeriod("store-1", 2025, 1);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status(), SettlementStatus::APPROVED);
    EXPECT_EQ(stored->items().size(), 1u);
    EXPECT_EQ(stored->netPayable().toString(), "9.00");
}

TEST_F(InMemorySettlementRepositoryTest, AddAdjustment_UnknownSettlement_NotFound) {
    auto adjustment = SettlementAdjustment::create("missing", 2025, 1, Money::parse("1", "USD"),
                                                   "credit", std::nullopt, std::nullopt);

    EXPECT_THROW(repository->addAdjustment(adjustment), NotFoundException);
}

TEST_F(InMemorySettlementRepositoryTest, ListByStore_NewestFirst) {
    repository->insert(Settlement::create("store-1", 2024, 12, "USD"));
    repository->insert(Settlement::create("store-1", 2025, 2, "USD"));
    repository->insert(Settlement::create("store-2", 2025, 3, "USD"));

    auto list = repository->listByStore("store-1");

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].settlementNumber(), "STL-STOR-202502");
    EXPECT_EQ(list[1].settlementNumber(), "STL-STOR-202412");
}
