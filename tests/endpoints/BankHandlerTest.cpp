/**
 * @file BankHandlerTest.cpp
 * @brief Unit-тесты для BankHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/BankHandler.hpp"
#include "mocks/MockInputPorts.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace economy;
using namespace economy::adapters::primary;
using namespace economy::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class BankHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockBankService_ = std::make_shared<MockBankService>();
        handler_ = std::make_unique<BankHandler>(mockBankService_);
    }

    SimpleRequest createRequest(const std::string& method,
                                const std::string& path,
                                const std::string& body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    nlohmann::json parseJson(const std::string& body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockBankService> mockBankService_;
    std::unique_ptr<BankHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: deposit / withdraw
// ============================================================================

TEST_F(BankHandlerTest, Deposit_Accepted_Returns200)
{
    domain::BankReceipt receipt;
    receipt.type = domain::TransactionType::DEPOSIT;
    receipt.amount = 300;
    receipt.newCash = 200;
    receipt.newSavings = 300;

    EXPECT_CALL(*mockBankService_, deposit("u1", "Alice", 300))
        .WillOnce(Return(domain::ActionResult<domain::BankReceipt>::accepted(receipt)));

    auto req = createRequest("POST", "/api/v1/economy/bank/deposit",
                             R"({"user_id": "u1", "display_name": "Alice", "amount": 300})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["type"], "deposit");
    EXPECT_EQ(json["savings"], 300);
    EXPECT_EQ(json["total_assets"], 500);
    EXPECT_FALSE(json.contains("remaining_daily_limit"));
}

TEST_F(BankHandlerTest, Deposit_Insufficient_Returns422WithShortfall)
{
    EXPECT_CALL(*mockBankService_, deposit("u1", _, 300))
        .WillOnce(Return(domain::ActionResult<domain::BankReceipt>::rejected(
            domain::Rejection::of(domain::RejectReason::INSUFFICIENT_CASH, "Not enough cash")
                .withShortfall(100))));

    auto req = createRequest("POST", "/api/v1/economy/bank/deposit", R"({"user_id": "u1", "amount": 300})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 422);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["reason"], "INSUFFICIENT_CASH");
    EXPECT_EQ(json["details"]["shortfall"], 100);
}

TEST_F(BankHandlerTest, Deposit_NonIntegerAmount_Returns400)
{
    EXPECT_CALL(*mockBankService_, deposit(_, _, _)).Times(0);

    auto req = createRequest("POST", "/api/v1/economy/bank/deposit", R"({"user_id": "u1", "amount": "300"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(BankHandlerTest, Withdraw_IncludesDailyLimit)
{
    domain::BankReceipt receipt;
    receipt.type = domain::TransactionType::WITHDRAW;
    receipt.amount = 100;
    receipt.withdrawnToday = 100;
    receipt.remainingDailyLimit = 49900;

    EXPECT_CALL(*mockBankService_, withdraw("u1", "u1", 100))
        .WillOnce(Return(domain::ActionResult<domain::BankReceipt>::accepted(receipt)));

    auto req = createRequest("POST", "/api/v1/economy/bank/withdraw", R"({"user_id": "u1", "amount": 100})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["withdrawn_today"], 100);
    EXPECT_EQ(json["remaining_daily_limit"], 49900);
}

// ============================================================================
// ТЕСТЫ: transfer / interest / info
// ============================================================================

TEST_F(BankHandlerTest, Transfer_RecipientNotFound_Returns422)
{
    EXPECT_CALL(*mockBankService_, transfer("u1", "u1", "ghost", 50))
        .WillOnce(Return(domain::ActionResult<domain::TransferReceipt>::rejected(
            domain::Rejection::of(domain::RejectReason::RECIPIENT_NOT_FOUND, "Recipient not found"))));

    auto req = createRequest("POST", "/api/v1/economy/bank/transfer",
                             R"({"user_id": "u1", "to_user_id": "ghost", "amount": 50})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 422);
    EXPECT_EQ(parseJson(res.getBody())["reason"], "RECIPIENT_NOT_FOUND");
}

TEST_F(BankHandlerTest, Transfer_MissingRecipient_Returns400)
{
    EXPECT_CALL(*mockBankService_, transfer(_, _, _, _)).Times(0);

    auto req = createRequest("POST", "/api/v1/economy/bank/transfer", R"({"user_id": "u1", "amount": 50})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(BankHandlerTest, Interest_ReturnsReport)
{
    domain::InterestReport report;
    report.processedAccounts = 2;
    report.skippedAccounts = 1;
    report.totalInterest = 15;

    EXPECT_CALL(*mockBankService_, accrueDailyInterest()).WillOnce(Return(report));

    auto req = createRequest("POST", "/api/v1/economy/bank/interest");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["processed_accounts"], 2);
    EXPECT_EQ(json["total_interest"], 15);
}

TEST_F(BankHandlerTest, Info_StoreUnavailable_Returns503)
{
    EXPECT_CALL(*mockBankService_, getBankInfo("u1"))
        .WillOnce(Throw(domain::StoreUnavailableError("timeout")));

    auto req = createRequest("GET", "/api/v1/economy/bank?user_id=u1");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
}

TEST_F(BankHandlerTest, Info_PostNotAllowed_Returns405)
{
    auto req = createRequest("POST", "/api/v1/economy/bank", R"({"user_id": "u1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

TEST_F(BankHandlerTest, UnknownOperation_Returns404)
{
    auto req = createRequest("POST", "/api/v1/economy/bank/loan", R"({"user_id": "u1"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}
