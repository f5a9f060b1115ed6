/**
 * @file SettlementHandlerTest.cpp
 * @brief Unit-тесты для SettlementHandler
 *
 * POST /api/v1/settlements, POST /api/v1/profit-payouts
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/SettlementHandler.hpp"
#include "mocks/MockSettlementService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::adapters::primary;
using ledger::tests::MockSettlementService;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class SettlementHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockService_ = std::make_shared<MockSettlementService>();
        handler_ = std::make_unique<SettlementHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    domain::SettlementOutcome createOutcome()
    {
        domain::SettlementOutcome outcome;
        outcome.settlementId = "stl-0123456789abcdef0123456789abcdef";
        outcome.transactionId = "txn-42";
        outcome.snapshotId = "snp-7";
        outcome.kind = domain::SnapshotKind::LOSS;
        outcome.date = domain::Date::of(2024, 1, 6);
        outcome.paymentAmount = domain::Decimal::parse("10");
        outcome.capitalClosed = domain::Decimal::parse("100");
        outcome.remainingAfter = domain::Decimal::parse("800");
        outcome.pendingAfter = domain::Decimal::parse("80");
        outcome.yourShareAmount = domain::Decimal::parse("100");
        outcome.paymentMyShare = domain::Decimal::parse("10");
        return outcome;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockSettlementService> mockService_;
    std::unique_ptr<SettlementHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: POST /api/v1/settlements
// ============================================================================

TEST_F(SettlementHandlerTest, Settled_Returns201WithOutcome)
{
    EXPECT_CALL(*mockService_, settle(Field(&domain::SettlementRequest::accountId, "acc-001")))
        .WillOnce(Return(domain::SettlementResult::settled(createOutcome())));

    auto req = createRequest("POST", "/api/v1/settlements",
                             R"({"account_id": "acc-001", "amount": "10", "date": "2024-01-06"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "SETTLED");
    EXPECT_EQ(json["settlement"]["capital_closed"], "100.00");
    EXPECT_EQ(json["settlement"]["remaining"], "800.00");
    EXPECT_EQ(json["settlement"]["pending"], "80.00");
    EXPECT_EQ(json["settlement"]["snapshot_settled"], false);
}

TEST_F(SettlementHandlerTest, RequestFieldsPassedThrough)
{
    domain::SettlementRequest captured;
    EXPECT_CALL(*mockService_, settle(_))
        .WillOnce([this, &captured](const domain::SettlementRequest &request) {
            captured = request;
            return domain::SettlementResult::settled(createOutcome());
        });

    auto req = createRequest("POST", "/api/v1/settlements",
                             R"({"account_id": "acc-001", "amount": 9.55, "date": "2024-01-06",
                                 "note": "wire", "request_key": "k-1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(captured.amount, domain::Decimal::parse("9.55"));
    EXPECT_EQ(captured.date, domain::Date::of(2024, 1, 6));
    EXPECT_EQ(captured.note, "wire");
    EXPECT_EQ(captured.requestKey, "k-1");
}

TEST_F(SettlementHandlerTest, Duplicate_Returns200)
{
    EXPECT_CALL(*mockService_, settle(_))
        .WillOnce(Return(domain::SettlementResult::duplicate(createOutcome())));

    auto req = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-001", "amount": "10"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["status"], "DUPLICATE");
}

TEST_F(SettlementHandlerTest, InvalidPayment_Returns422)
{
    EXPECT_CALL(*mockService_, settle(_))
        .WillOnce(Return(domain::SettlementResult::failure(domain::SettlementStatus::INVALID_PAYMENT,
                                                           "Payment 90.10 exceeds pending 90.00")));

    auto req = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-001", "amount": "90.1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 422);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "INVALID_PAYMENT");
    EXPECT_EQ(json["error"], "Payment 90.10 exceeds pending 90.00");
    EXPECT_FALSE(json.contains("settlement"));
}

TEST_F(SettlementHandlerTest, NoActiveLoss_Returns409)
{
    EXPECT_CALL(*mockService_, settle(_))
        .WillOnce(Return(domain::SettlementResult::failure(domain::SettlementStatus::NO_ACTIVE_LOSS, "none")));

    auto req = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-001", "amount": "1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(SettlementHandlerTest, AccountNotFound_Returns404)
{
    EXPECT_CALL(*mockService_, settle(_))
        .WillOnce(Return(domain::SettlementResult::failure(domain::SettlementStatus::ACCOUNT_NOT_FOUND, "missing")));

    auto req = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-x", "amount": "1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(SettlementHandlerTest, InvariantViolation_Returns500)
{
    EXPECT_CALL(*mockService_, settle(_))
        .WillOnce(Return(domain::SettlementResult::failure(domain::SettlementStatus::INVARIANT_VIOLATION, "broken")));

    auto req = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-001", "amount": "1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

// ============================================================================
// ТЕСТЫ: POST /api/v1/profit-payouts
// ============================================================================

TEST_F(SettlementHandlerTest, ProfitPayout_RoutesToPayProfit)
{
    auto outcome = createOutcome();
    outcome.kind = domain::SnapshotKind::PROFIT;

    EXPECT_CALL(*mockService_, settle(_)).Times(0);
    EXPECT_CALL(*mockService_, payProfit(_))
        .WillOnce(Return(domain::SettlementResult::settled(outcome)));

    auto req = createRequest("POST", "/api/v1/profit-payouts", R"({"account_id": "acc-001", "amount": "20"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    EXPECT_EQ(parseJson(res.getBody())["settlement"]["kind"], "PROFIT");
}

// ============================================================================
// ТЕСТЫ: ВАЛИДАЦИЯ ЗАПРОСА
// ============================================================================

TEST_F(SettlementHandlerTest, InvalidJson_Returns400)
{
    EXPECT_CALL(*mockService_, settle(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/settlements", "{not json");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(SettlementHandlerTest, MissingAccountId_Returns400)
{
    EXPECT_CALL(*mockService_, settle(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/settlements", R"({"amount": "10"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(SettlementHandlerTest, MissingAmount_Returns400)
{
    EXPECT_CALL(*mockService_, settle(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-001"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(SettlementHandlerTest, MalformedAmountOrDate_Returns400)
{
    EXPECT_CALL(*mockService_, settle(_)).Times(0);

    SimpleResponse badAmount;
    auto req1 = createRequest("POST", "/api/v1/settlements", R"({"account_id": "acc-001", "amount": "ten"})");
    handler_->handle(req1, badAmount);
    EXPECT_EQ(badAmount.getStatus(), 400);

    SimpleResponse badDate;
    auto req2 = createRequest("POST", "/api/v1/settlements",
                              R"({"account_id": "acc-001", "amount": "10", "date": "06.01.2024"})");
    handler_->handle(req2, badDate);
    EXPECT_EQ(badDate.getStatus(), 400);
}

TEST_F(SettlementHandlerTest, WrongMethod_Returns405)
{
    auto req = createRequest("GET", "/api/v1/settlements");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
