/**
 * @file EscrowPaymentTest.cpp
 * @brief Unit tests for the escrow payment aggregate
 */

#include <gtest/gtest.h>
#include "domain/EscrowPayment.hpp"

using namespace escrow::domain;

namespace {

EscrowPayment makePayment(const std::string& total, const std::string& currency) {
    return EscrowPayment::create("order-1", "buyer-1", Money::parse(total, currency), currency, "txn-1");
}

} // namespace

// ============================================================================
// CREATION
// ============================================================================

TEST(EscrowPaymentTest, Create_StartsHeldAtVersionOne) {
    auto payment = makePayment("100.00", "USD");

    EXPECT_EQ(payment.status(), EscrowStatus::HELD);
    EXPECT_EQ(payment.version(), 1);
    EXPECT_EQ(payment.remainingBalance().toString(), "100.00");
    EXPECT_TRUE(payment.allocations().empty());
}

TEST(EscrowPaymentTest, Create_Validation) {
    EXPECT_THROW(EscrowPayment::create("", "b", Money::parse("1", "USD"), "USD", "t"), InvalidArgumentException);
    EXPECT_THROW(EscrowPayment::create("o", "b", Money::zero("USD"), "USD", "t"), InvalidArgumentException);
    EXPECT_THROW(EscrowPayment::create("o", "b", Money::parse("1", "USD"), " ", "t"), InvalidArgumentException);
    EXPECT_THROW(EscrowPayment::create("o", "b", Money::parse("1", "USD"), "EUR", "t"), CurrencyMismatchException);
}

TEST(EscrowPaymentTest, AddAllocation_BumpsVersion) {
    auto payment = makePayment("100.00", "USD");
    payment.addAllocation("store-1", std::nullopt, Money::parse("100", "USD"), Money::zero("USD"),
                          CommissionRate::fromPercent(10.0));

    EXPECT_EQ(payment.version(), 2);
    EXPECT_EQ(payment.allocations().front().escrowPaymentId(), payment.id());
}

TEST(EscrowPaymentTest, AddAllocation_CurrencyMismatch_Throws) {
    auto payment = makePayment("100.00", "USD");

    EXPECT_THROW(payment.addAllocation("store-1", std::nullopt, Money::parse("100", "EUR"), Money::zero("EUR"),
                                       CommissionRate::fromPercent(10.0)),
                 CurrencyMismatchException);
}

TEST(EscrowPaymentTest, AddAllocation_DuplicateShipment_Throws) {
    auto payment = makePayment("100.00", "USD");
    payment.addAllocation("store-1", std::string("ship-1"), Money::parse("50", "USD"), Money::zero("USD"),
                          CommissionRate::fromPercent(10.0));

    EXPECT_THROW(payment.addAllocation("store-2", std::string("ship-1"), Money::parse("50", "USD"),
                                       Money::zero("USD"), CommissionRate::fromPercent(10.0)),
                 InvalidArgumentException);
}

TEST(EscrowPaymentTest, AllocationsMustCoverTotal) {
    auto payment = makePayment("100.00", "USD");
    EXPECT_THROW(payment.validateAllocationsCoverTotal(), InvalidArgumentException);

    payment.addAllocation("store-1", std::nullopt, Money::parse("60", "USD"), Money::zero("USD"),
                          CommissionRate::fromPercent(10.0));
    EXPECT_THROW(payment.validateAllocationsCoverTotal(), InvalidArgumentException);

    payment.addAllocation("store-2", std::nullopt, Money::parse("40", "USD"), Money::zero("USD"),
                          CommissionRate::fromPercent(10.0));
    EXPECT_NO_THROW(payment.validateAllocationsCoverTotal());
}

// ============================================================================
// DRAWDOWN
// ============================================================================

TEST(EscrowPaymentTest, FullRelease_SingleSeller) {
    auto payment = makePayment("100.00", "USD");
    auto allocationId = payment.addAllocation("store-1", std::nullopt, Money::parse("100", "USD"),
                                              Money::zero("USD"), CommissionRate::fromPercent(10.0)).id();
    payment.markAllocationEligible(allocationId);

    const auto& allocation = payment.applyRelease(allocationId, Money::parse("100", "USD"), std::string("po-1"));

    EXPECT_EQ(allocation.status(), AllocationStatus::RELEASED);
    EXPECT_EQ(payment.status(), EscrowStatus::RELEASED);
    EXPECT_TRUE(payment.remainingBalance().isZero());
    EXPECT_TRUE(payment.releasedAt().has_value());
}

TEST(EscrowPaymentTest, PartialRefund_TwoSellers) {
    auto payment = makePayment("200.00", "EUR");
    auto first = payment.addAllocation("store-1", std::nullopt, Money::parse("120", "EUR"),
                                       Money::zero("EUR"), CommissionRate::fromPercent(10.0)).id();
    payment.addAllocation("store-2", std::nullopt, Money::parse("80", "EUR"),
                          Money::zero("EUR"), CommissionRate::fromPercent(10.0));
    payment.markAllocationEligible(first);

    const auto& allocation = payment.applyRefund(first, Money::parse("30", "EUR"), std::string("rf-1"));

    EXPECT_EQ(allocation.status(), AllocationStatus::PARTIAL_REFUND);
    EXPECT_EQ(payment.refundedAmount().toString(), "30.00");
    EXPECT_EQ(payment.remainingBalance().toString(), "170.00");
    EXPECT_EQ(payment.status(), EscrowStatus::PARTIALLY_RELEASED);
}

TEST(EscrowPaymentTest, OverRelease_LeavesAggregateUntouched) {
    auto payment = makePayment("100.00", "USD");
    auto allocationId = payment.addAllocation("store-1", std::nullopt, Money::parse("100", "USD"),
                                              Money::zero("USD"), CommissionRate::fromPercent(10.0)).id();
    payment.markAllocationEligible(allocationId);
    payment.applyRelease(allocationId, Money::parse("80", "USD"), std::nullopt);
    int64_t version = payment.version();

    EXPECT_THROW(payment.applyRelease(allocationId, Money::parse("50", "USD"), std::nullopt),
                 InvalidArgumentException);

    EXPECT_EQ(payment.version(), version);
    EXPECT_EQ(payment.releasedAmount().toString(), "80.00");
    EXPECT_EQ(payment.findAllocation(allocationId)->remainingShare().toString(), "20.00");
    EXPECT_EQ(payment.findAllocation(allocationId)->status(), AllocationStatus::PARTIAL_RELEASE);
}

TEST(EscrowPaymentTest, AllRefunded_PaymentRefunded) {
    auto payment = makePayment("50.00", "USD");
    auto allocationId = payment.addAllocation("store-1", std::nullopt, Money::parse("50", "USD"),
                                              Money::zero("USD"), CommissionRate::fromPercent(10.0)).id();
    payment.markAllocationEligible(allocationId);
    payment.applyRefund(allocationId, Money::parse("50", "USD"), std::nullopt);

    EXPECT_EQ(payment.status(), EscrowStatus::REFUNDED);
    EXPECT_TRUE(payment.refundedAt().has_value());
}

TEST(EscrowPaymentTest, ReleaseThenRefundRemainder_PaymentPartiallyReleased) {
    auto payment = makePayment("100.00", "USD");
    auto allocationId = payment.addAllocation("store-1", std::nullopt, Money::parse("100", "USD"),
                                              Money::zero("USD"), CommissionRate::fromPercent(10.0)).id();
    payment.markAllocationEligible(allocationId);
    payment.applyRelease(allocationId, Money::parse("60", "USD"), std::string("po-1"));

    const auto& allocation = payment.applyRefund(allocationId, Money::parse("40", "USD"), std::string("rf-1"));

    // Аллокация закрыта последней операцией, платёж отражает обе стороны
    EXPECT_EQ(allocation.status(), AllocationStatus::REFUNDED);
    EXPECT_EQ(payment.status(), EscrowStatus::PARTIALLY_RELEASED);
    EXPECT_TRUE(payment.remainingBalance().isZero());
    EXPECT_FALSE(payment.refundedAt().has_value());
}

TEST(EscrowPaymentTest, OneSellerReleasedOtherRefunded_PaymentPartiallyReleased) {
    auto payment = makePayment("200.00", "EUR");
    auto first = payment.addAllocation("store-1", std::nullopt, Money::parse("120", "EUR"),
                                       Money::zero("EUR"), CommissionRate::fromPercent(10.0)).id();
    auto second = payment.addAllocation("store-2", std::nullopt, Money::parse("80", "EUR"),
                                        Money::zero("EUR"), CommissionRate::fromPercent(10.0)).id();
    payment.markAllocationEligible(first);
    payment.markAllocationEligible(second);

    payment.applyRelease(first, Money::parse("120", "EUR"), std::nullopt);
    payment.applyRefund(second, Money::parse("80", "EUR"), std::nullopt);

    EXPECT_EQ(payment.status(), EscrowStatus::PARTIALLY_RELEASED);
    EXPECT_TRUE(payment.remainingBalance().isZero());
}

TEST(EscrowPaymentTest, UnknownAllocation_NotFound) {
    auto payment = makePayment("50.00", "USD");

    EXPECT_THROW(payment.markAllocationEligible("missing"), NotFoundException);
    EXPECT_EQ(payment.findAllocation("missing"), nullptr);
}

TEST(EscrowPaymentTest, AddAllocation_AfterDrawdown_Throws) {
    auto payment = makePayment("100.00", "USD");
    auto allocationId = payment.addAllocation("store-1", std::nullopt, Money::parse("100", "USD"),
                                              Money::zero("USD"), CommissionRate::fromPercent(10.0)).id();
    payment.markAllocationEligible(allocationId);
    payment.applyRelease(allocationId, Money::parse("10", "USD"), std::nullopt);

    EXPECT_THROW(payment.addAllocation("store-2", std::nullopt, Money::parse("1", "USD"), Money::zero("USD"),
                                       CommissionRate::fromPercent(10.0)),
                 InvalidStateTransitionException);
}
