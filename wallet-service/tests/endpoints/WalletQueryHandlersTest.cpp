/**
 * @file WalletQueryHandlersTest.cpp
 * @brief Unit-тесты для обработчиков чтения
 *
 * GET /api/v1/wallet/balances
 * GET /api/v1/wallet/transactions
 * GET /api/v1/wallet/transactions/type/{TYPE}
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/GetBalancesHandler.hpp"
#include "adapters/primary/GetTransactionsHandler.hpp"
#include "../mocks/MockLedgerService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace wallet;
using namespace wallet::adapters::primary;
using namespace wallet::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class WalletQueryHandlersTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockLedgerService_ = std::make_shared<MockLedgerService>();
    }

    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &userId = "",
                                const std::string &pathPattern = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);

        if (!userId.empty())
        {
            req.setHeader("X-User-Id", userId);
        }

        if (!pathPattern.empty())
        {
            req.setPathPattern(pathPattern);
        }

        return req;
    }

    domain::LedgerEntry createEntry(const std::string &id, domain::LedgerEntryKind kind)
    {
        domain::LedgerEntry entry;
        entry.id = id;
        entry.ownerId = "alice";
        entry.kind = kind;
        entry.status = domain::LedgerEntryStatus::COMPLETED;
        entry.amount = domain::Decimal::fromUnits(10);
        entry.convertedAmount = domain::Decimal::fromUnits(10);
        return entry;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockLedgerService> mockLedgerService_;
};

// ============================================================================
// ТЕСТЫ: GET /api/v1/wallet/balances
// ============================================================================

TEST_F(WalletQueryHandlersTest, Balances_Returns200WithAllCurrencies)
{
    GetBalancesHandler handler(mockLedgerService_);

    domain::Balance ngn("alice", domain::Currency::NGN);
    ngn.credit(domain::Decimal::fromUnits(5000));
    domain::Balance usd("alice", domain::Currency::USD);
    usd.credit(domain::Decimal::fromString("12.5"));

    EXPECT_CALL(*mockLedgerService_, getBalances("alice"))
        .WillOnce(Return(std::vector<domain::Balance>{ngn, usd}));

    auto req = createRequest("GET", "/api/v1/wallet/balances", "alice");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["owner_id"], "alice");
    ASSERT_EQ(json["balances"].size(), 2u);
    EXPECT_EQ(json["balances"][0]["currency"], "NGN");
    EXPECT_DOUBLE_EQ(json["balances"][0]["available"].get<double>(), 5000.0);
    EXPECT_DOUBLE_EQ(json["balances"][1]["total"].get<double>(), 12.5);
    EXPECT_DOUBLE_EQ(json["balances"][1]["locked"].get<double>(), 0.0);
}

TEST_F(WalletQueryHandlersTest, Balances_NoUserHeader_Returns401)
{
    GetBalancesHandler handler(mockLedgerService_);
    EXPECT_CALL(*mockLedgerService_, getBalances(_)).Times(0);

    auto req = createRequest("GET", "/api/v1/wallet/balances");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
}

TEST_F(WalletQueryHandlersTest, Balances_StorageDown_Returns503)
{
    GetBalancesHandler handler(mockLedgerService_);

    EXPECT_CALL(*mockLedgerService_, getBalances("alice"))
        .WillOnce(Throw(domain::LedgerException(domain::LedgerErrorCode::StorageUnavailable,
                                                "Storage temporarily unavailable")));

    auto req = createRequest("GET", "/api/v1/wallet/balances", "alice");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
}

// ============================================================================
// ТЕСТЫ: GET /api/v1/wallet/transactions
// ============================================================================

TEST_F(WalletQueryHandlersTest, Transactions_DefaultPaging)
{
    GetTransactionsHandler handler(mockLedgerService_);

    domain::TransactionPage page;
    page.entries = {createEntry("e-2", domain::LedgerEntryKind::TRADE),
                    createEntry("e-1", domain::LedgerEntryKind::FUNDING)};
    page.total = 2;
    page.page = 1;
    page.limit = 10;
    page.totalPages = 1;

    EXPECT_CALL(*mockLedgerService_, getTransactions("alice", 1u, 10u))
        .WillOnce(Return(page));

    auto req = createRequest("GET", "/api/v1/wallet/transactions", "alice");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["data"].size(), 2u);
    EXPECT_EQ(json["data"][0]["id"], "e-2");
    EXPECT_EQ(json["meta"]["total"], 2);
    EXPECT_EQ(json["meta"]["total_pages"], 1);
}

TEST_F(WalletQueryHandlersTest, Transactions_QueryParams_Forwarded)
{
    GetTransactionsHandler handler(mockLedgerService_);

    domain::TransactionPage page;
    page.total = 25;
    page.page = 3;
    page.limit = 5;
    page.totalPages = 5;

    EXPECT_CALL(*mockLedgerService_, getTransactions("alice", 3u, 5u))
        .WillOnce(Return(page));

    auto req = createRequest("GET", "/api/v1/wallet/transactions", "alice");
    req.setQueryParam("page", "3");
    req.setQueryParam("limit", "5");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_TRUE(json["data"].empty());
    EXPECT_EQ(json["meta"]["page"], 3);
    EXPECT_EQ(json["meta"]["limit"], 5);
}

TEST_F(WalletQueryHandlersTest, Transactions_InvalidQueryParams_UseDefaults)
{
    GetTransactionsHandler handler(mockLedgerService_);

    EXPECT_CALL(*mockLedgerService_, getTransactions("alice", 1u, 10u))
        .WillOnce(Return(domain::TransactionPage{}));

    auto req = createRequest("GET", "/api/v1/wallet/transactions", "alice");
    req.setQueryParam("page", "-2");
    req.setQueryParam("limit", "abc");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(WalletQueryHandlersTest, TransactionsByType_Returns200)
{
    GetTransactionsHandler handler(mockLedgerService_);

    EXPECT_CALL(*mockLedgerService_, getTransactionsByKind("alice", domain::LedgerEntryKind::TRANSFER))
        .WillOnce(Return(std::vector<domain::LedgerEntry>{
            createEntry("t-1", domain::LedgerEntryKind::TRANSFER)}));

    auto req = createRequest("GET", "/api/v1/wallet/transactions/type/TRANSFER", "alice",
                             "/api/v1/wallet/transactions/type/*");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["type"], "TRANSFER");
}

TEST_F(WalletQueryHandlersTest, TransactionsByType_Unknown_Returns400)
{
    GetTransactionsHandler handler(mockLedgerService_);
    EXPECT_CALL(*mockLedgerService_, getTransactionsByKind(_, _)).Times(0);

    auto req = createRequest("GET", "/api/v1/wallet/transactions/type/REFUND", "alice",
                             "/api/v1/wallet/transactions/type/*");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Unknown transaction type: REFUND");
}

TEST_F(WalletQueryHandlersTest, Transactions_WrongMethod_Returns405)
{
    GetTransactionsHandler handler(mockLedgerService_);

    auto req = createRequest("POST", "/api/v1/wallet/transactions", "alice");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
