/**
 * @file EscrowAllocationTest.cpp
 * @brief Unit tests for allocation state machine and share accounting
 */

#include <gtest/gtest.h>
#include "domain/EscrowAllocation.hpp"

using namespace escrow::domain;

class EscrowAllocationTest : public ::testing::Test {
protected:
    EscrowAllocation makeAllocation(const std::string& amount = "100.00", const std::string& shipping = "0") {
        return EscrowAllocation::create(
            "esc-1", "store-1", std::string("ship-1"),
            Money::parse(amount, "USD"), Money::parse(shipping, "USD"),
            CommissionRate::fromPercent(10.0));
    }
};

// ============================================================================
// TRANSITION TABLE
// ============================================================================

TEST(AllocationTransitionTest, MarkEligible_OnlyFromCreated) {
    EXPECT_EQ(nextAllocationStatus(AllocationStatus::CREATED, AllocationOperation::MARK_ELIGIBLE, false),
              AllocationStatus::ELIGIBLE);
    EXPECT_THROW(nextAllocationStatus(AllocationStatus::ELIGIBLE, AllocationOperation::MARK_ELIGIBLE, false),
                 InvalidStateTransitionException);
    EXPECT_THROW(nextAllocationStatus(AllocationStatus::RELEASED, AllocationOperation::MARK_ELIGIBLE, false),
                 InvalidStateTransitionException);
}

TEST(AllocationTransitionTest, Release_PartialOrTerminal) {
    for (auto from : {AllocationStatus::ELIGIBLE, AllocationStatus::PARTIAL_RELEASE, AllocationStatus::PARTIAL_REFUND}) {
        EXPECT_EQ(nextAllocationStatus(from, AllocationOperation::RELEASE, false), AllocationStatus::PARTIAL_RELEASE);
        EXPECT_EQ(nextAllocationStatus(from, AllocationOperation::RELEASE, true), AllocationStatus::RELEASED);
    }
}

TEST(AllocationTransitionTest, Refund_PartialOrTerminal) {
    for (auto from : {AllocationStatus::ELIGIBLE, AllocationStatus::PARTIAL_RELEASE, AllocationStatus::PARTIAL_REFUND}) {
        EXPECT_EQ(nextAllocationStatus(from, AllocationOperation::REFUND, false), AllocationStatus::PARTIAL_REFUND);
        EXPECT_EQ(nextAllocationStatus(from, AllocationOperation::REFUND, true), AllocationStatus::REFUNDED);
    }
}

TEST(AllocationTransitionTest, TerminalStatesRejectEverything) {
    for (auto from : {AllocationStatus::RELEASED, AllocationStatus::REFUNDED}) {
        EXPECT_THROW(nextAllocationStatus(from, AllocationOperation::RELEASE, false), InvalidStateTransitionException);
        EXPECT_THROW(nextAllocationStatus(from, AllocationOperation::REFUND, true), InvalidStateTransitionException);
    }
}

TEST(AllocationTransitionTest, CreatedRejectsDrawdown) {
    EXPECT_THROW(nextAllocationStatus(AllocationStatus::CREATED, AllocationOperation::RELEASE, true),
                 InvalidStateTransitionException);
    EXPECT_THROW(nextAllocationStatus(AllocationStatus::CREATED, AllocationOperation::REFUND, true),
                 InvalidStateTransitionException);
}

// ============================================================================
// CREATION
// ============================================================================

TEST_F(EscrowAllocationTest, Create_ComputesCommissionAndPayout) {
    auto allocation = makeAllocation("100.00");

    EXPECT_EQ(allocation.status(), AllocationStatus::CREATED);
    EXPECT_EQ(allocation.commissionAmount().toString(), "10.00");
    EXPECT_EQ(allocation.sellerPayout().toString(), "90.00");
    EXPECT_EQ(allocation.remainingShare().toString(), "100.00");
    EXPECT_FALSE(allocation.id().empty());
}

TEST_F(EscrowAllocationTest, Create_ShippingAboveTotal_Throws) {
    EXPECT_THROW(makeAllocation("10.00", "10.01"), InvalidArgumentException);
}

TEST_F(EscrowAllocationTest, Create_BlankStore_Throws) {
    EXPECT_THROW(EscrowAllocation::create("esc-1", "", std::nullopt,
                                          Money::parse("1", "USD"), Money::zero("USD"),
                                          CommissionRate::fromPercent(5.0)),
                 InvalidArgumentException);
}

// ============================================================================
// DRAWDOWN
// ============================================================================

TEST_F(EscrowAllocationTest, Release_FromCreated_Throws) {
    auto allocation = makeAllocation();

    EXPECT_THROW(allocation.release(Money::parse("10", "USD"), std::nullopt), InvalidStateTransitionException);
    EXPECT_EQ(allocation.status(), AllocationStatus::CREATED);
}

TEST_F(EscrowAllocationTest, Refund_FromCreated_Throws) {
    auto allocation = makeAllocation();

    EXPECT_THROW(allocation.refund(Money::parse("10", "USD"), std::nullopt), InvalidStateTransitionException);
}

TEST_F(EscrowAllocationTest, Release_PartialThenFull) {
    auto allocation = makeAllocation();
    allocation.markEligible();
    ASSERT_TRUE(allocation.eligibleAt().has_value());

    allocation.release(Money::parse("40", "USD"), std::string("po-1"));
    EXPECT_EQ(allocation.status(), AllocationStatus::PARTIAL_RELEASE);
    EXPECT_EQ(allocation.remainingShare().toString(), "60.00");

    allocation.release(Money::parse("60", "USD"), std::string("po-2"));
    EXPECT_EQ(allocation.status(), AllocationStatus::RELEASED);
    EXPECT_TRUE(allocation.remainingShare().isZero());
    EXPECT_EQ(allocation.payoutReference(), std::optional<std::string>("po-2"));
}

TEST_F(EscrowAllocationTest, RefundAfterPartialRelease_SharesRemaining) {
    auto allocation = makeAllocation();
    allocation.markEligible();

    allocation.release(Money::parse("70", "USD"), std::nullopt);
    allocation.refund(Money::parse("30", "USD"), std::string("rf-1"));

    EXPECT_EQ(allocation.status(), AllocationStatus::REFUNDED);
    EXPECT_EQ(allocation.releasedAmount().toString(), "70.00");
    EXPECT_EQ(allocation.refundedAmount().toString(), "30.00");
    EXPECT_TRUE(allocation.remainingShare().isZero());
}

TEST_F(EscrowAllocationTest, Release_MoreThanRemaining_Throws) {
    auto allocation = makeAllocation("20.00");
    allocation.markEligible();

    EXPECT_THROW(allocation.release(Money::parse("50", "USD"), std::nullopt), InvalidArgumentException);
    EXPECT_EQ(allocation.status(), AllocationStatus::ELIGIBLE);
    EXPECT_TRUE(allocation.releasedAmount().isZero());
}

TEST_F(EscrowAllocationTest, Release_NonPositive_Throws) {
    auto allocation = makeAllocation();
    allocation.markEligible();

    EXPECT_THROW(allocation.release(Money::zero("USD"), std::nullopt), InvalidArgumentException);
    EXPECT_THROW(allocation.refund(Money::parse("-1", "USD"), std::nullopt), InvalidArgumentException);
}

TEST_F(EscrowAllocationTest, Release_WhenTerminal_IsStateError) {
    auto allocation = makeAllocation();
    allocation.markEligible();
    allocation.release(Money::parse("100", "USD"), std::nullopt);

    // Статус проверяется раньше суммы
    EXPECT_THROW(allocation.release(Money::parse("1", "USD"), std::nullopt), InvalidStateTransitionException);
}

TEST_F(EscrowAllocationTest, CommissionOnReleased_FollowsReleasedAmount) {
    auto allocation = makeAllocation();
    allocation.markEligible();
    allocation.release(Money::parse("50", "USD"), std::nullopt);

    EXPECT_EQ(allocation.commissionOnReleased().toString(), "5.00");
}
