/**
 * @file EscrowQueryHandlerTest.cpp
 * @brief Unit-тесты для EscrowQueryHandler
 *
 * GET /api/v1/escrows[?order_id=], /{id}, /{id}/ledger, /{id}/balance, /{id}/reconcile
 * POST /api/v1/escrows/{id}/refund
 */

#include <gtest/gtest.h>

#include "adapters/primary/EscrowQueryHandler.hpp"
#include "mocks/InMemoryServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace escrow;
using namespace escrow::adapters::primary;
using json = nlohmann::json;

class EscrowQueryHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        handler_ = std::make_unique<EscrowQueryHandler>(services_.escrowService);
    }

    SimpleRequest createRequest(const std::string &method, const std::string &path)
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        return req;
    }

    tests::InMemoryServices services_;
    std::unique_ptr<EscrowQueryHandler> handler_;
};

// ============================================================================
// GET /api/v1/escrows/{id}
// ============================================================================

TEST_F(EscrowQueryHandlerTest, GetEscrow_Returns200)
{
    auto payment = services_.createEscrow("order-1", "100.00");
    auto req = createRequest("GET", "/api/v1/escrows/" + payment.id());
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = json::parse(res.getBody());
    EXPECT_EQ(body["escrow_payment_id"], payment.id());
    EXPECT_EQ(body["total_amount"], "100.00");
    EXPECT_EQ(body["status"], "HELD");
    EXPECT_EQ(body["allocations"].size(), 1u);
}

TEST_F(EscrowQueryHandlerTest, GetEscrow_Unknown_Returns404)
{
    auto req = createRequest("GET", "/api/v1/escrows/missing");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(EscrowQueryHandlerTest, GetByOrder_UsesQueryParam)
{
    auto payment = services_.createEscrow("order-7", "10.00");
    auto req = createRequest("GET", "/api/v1/escrows");
    req.setQueryParam("order_id", "order-7");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(json::parse(res.getBody())["escrow_payment_id"], payment.id());
}

TEST_F(EscrowQueryHandlerTest, GetByOrder_MissingParam_Returns400)
{
    auto req = createRequest("GET", "/api/v1/escrows");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// LEDGER / BALANCE / RECONCILE
// ============================================================================

TEST_F(EscrowQueryHandlerTest, GetLedger_ReturnsOrderedEntries)
{
    auto payment = services_.createEscrow("order-2", "50.00");
    auto req = createRequest("GET", "/api/v1/escrows/" + payment.id() + "/ledger");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = json::parse(res.getBody());
    EXPECT_EQ(body["count"], 2);
    EXPECT_EQ(body["entries"][0]["action"], "CREATED");
    EXPECT_EQ(body["entries"][1]["action"], "ALLOCATION_CREATED");
    EXPECT_EQ(body["entries"][0]["initiated_by"], "System");
}

TEST_F(EscrowQueryHandlerTest, GetLedger_UnknownEscrow_Returns404)
{
    auto req = createRequest("GET", "/api/v1/escrows/missing/ledger");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
    EXPECT_EQ(json::parse(res.getBody())["code"], "NOT_FOUND");
}

TEST_F(EscrowQueryHandlerTest, GetBalance_Returns200)
{
    auto payment = services_.createEscrow("order-3", "75.50");
    auto req = createRequest("GET", "/api/v1/escrows/" + payment.id() + "/balance");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = json::parse(res.getBody());
    EXPECT_EQ(body["remaining_balance"], "75.50");
    EXPECT_EQ(body["currency"], "USD");
}

TEST_F(EscrowQueryHandlerTest, Reconcile_ConsistentEscrow)
{
    auto payment = services_.createEscrow("order-4", "20.00");
    auto req = createRequest("GET", "/api/v1/escrows/" + payment.id() + "/reconcile");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = json::parse(res.getBody());
    EXPECT_TRUE(body["consistent"].get<bool>());
    EXPECT_TRUE(body["discrepancies"].empty());
}

TEST_F(EscrowQueryHandlerTest, UnknownSubresource_Returns404)
{
    auto payment = services_.createEscrow("order-5", "20.00");
    auto req = createRequest("GET", "/api/v1/escrows/" + payment.id() + "/history");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(EscrowQueryHandlerTest, Post_Returns405)
{
    auto req = createRequest("POST", "/api/v1/escrows");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

// ============================================================================
// POST /api/v1/escrows/{id}/refund
// ============================================================================

TEST_F(EscrowQueryHandlerTest, RefundEscrow_RefundsWholeOrder)
{
    auto payment = services_.createEscrow("order-6", "75.00");
    auto req = createRequest("POST", "/api/v1/escrows/" + payment.id() + "/refund");
    req.setBody(R"({"reference": "rf-cancel", "initiated_by": "support"})");
    SimpleResponse res;

    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = json::parse(res.getBody());
    EXPECT_EQ(body["order_id"], "order-6");
    EXPECT_EQ(body["count"], 1);
    EXPECT_EQ(body["refunds"][0]["amount"], "75.00");

    auto stored = services_.escrowService->getEscrowPayment(payment.id());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status(), domain::EscrowStatus::REFUNDED);
    EXPECT_EQ(services_.publisher->messagesFor("escrow.refunded").size(), 1u);
}

TEST_F(EscrowQueryHandlerTest, RefundEscrow_Twice_Returns409)
{
    auto payment = services_.createEscrow("order-7", "10.00");
    auto first = createRequest("POST", "/api/v1/escrows/" + payment.id() + "/refund");
    SimpleResponse firstRes;
    handler_->handle(first, firstRes);
    ASSERT_EQ(firstRes.getStatus(), 200);

    auto second = createRequest("POST", "/api/v1/escrows/" + payment.id() + "/refund");
    SimpleResponse res;
    handler_->handle(second, res);

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(EscrowQueryHandlerTest, RefundEscrow_Unknown_Returns404)
{
    auto req = createRequest("POST", "/api/v1/escrows/missing/refund");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(EscrowQueryHandlerTest, RefundEscrow_InvalidJson_Returns400)
{
    auto payment = services_.createEscrow("order-8", "10.00");
    auto req = createRequest("POST", "/api/v1/escrows/" + payment.id() + "/refund");
    req.setBody("{not json");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
