#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/LedgerService.hpp"
#include "../mocks/FaultyBalanceStore.hpp"
#include "../mocks/MockEligibilityChecker.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/MockRateService.hpp"
#include "../mocks/MockSettings.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <limits>

using namespace wallet;
using namespace wallet::application;
using domain::Currency;
using domain::Decimal;
using domain::LedgerErrorCode;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<tests::FaultyBalanceStore>();
        rateService_ = std::make_shared<NiceMock<tests::MockRateService>>();
        fallbackRates_ = std::make_shared<NiceMock<tests::MockFallbackRateService>>();
        eligibility_ = std::make_shared<NiceMock<tests::MockEligibilityChecker>>();
        publisher_ = std::make_shared<tests::MockEventPublisher>();
        settings_ = std::make_shared<tests::MockLedgerSettings>();

        ON_CALL(*eligibility_, isEligible(_)).WillByDefault(Return(true));
        ON_CALL(*eligibility_, exists(_)).WillByDefault(Return(true));

        service_ = std::make_shared<LedgerService>(
            store_, rateService_, fallbackRates_, eligibility_, publisher_, settings_);
    }

    void givenBalance(const std::string& owner, Currency currency, int64_t amount) {
        service_->fund(owner, Decimal::fromUnits(amount), currency, "seed");
        publisher_->clearMessages();
    }

    Decimal availableOf(const std::string& owner, Currency currency) {
        return store_->getOrCreate(owner, currency).available;
    }

    void givenLiveRate(Currency from, Currency to, double rate) {
        ON_CALL(*rateService_, resolveRate(from, to, false))
            .WillByDefault(Return(domain::ResolvedRate{rate, domain::RateOrigin::LIVE}));
    }

    static void expectLedgerError(const std::function<void()>& action, LedgerErrorCode code) {
        try {
            action();
            FAIL() << "Expected LedgerException " << domain::toString(code);
        } catch (const domain::LedgerException& e) {
            EXPECT_EQ(e.code(), code) << e.what();
        }
    }

    std::shared_ptr<tests::FaultyBalanceStore> store_;
    std::shared_ptr<NiceMock<tests::MockRateService>> rateService_;
    std::shared_ptr<NiceMock<tests::MockFallbackRateService>> fallbackRates_;
    std::shared_ptr<NiceMock<tests::MockEligibilityChecker>> eligibility_;
    std::shared_ptr<tests::MockEventPublisher> publisher_;
    std::shared_ptr<tests::MockLedgerSettings> settings_;
    std::shared_ptr<LedgerService> service_;
};

// ============================================================================
// ТЕСТЫ: fund
// ============================================================================

TEST_F(LedgerServiceTest, Fund_CreditsBalanceAndRecordsEntry) {
    auto entry = service_->fund("user-1", Decimal::fromString("1000.5"), Currency::NGN, "PAYSTACK_REF_123");

    EXPECT_EQ(entry.status, domain::LedgerEntryStatus::COMPLETED);
    EXPECT_EQ(entry.kind, domain::LedgerEntryKind::FUNDING);
    EXPECT_EQ(entry.reference.value_or(""), "PAYSTACK_REF_123");
    EXPECT_EQ(entry.description, "Wallet funded with 1000.5 NGN");
    EXPECT_FALSE(entry.id.empty());

    EXPECT_EQ(availableOf("user-1", Currency::NGN), Decimal::fromString("1000.5"));

    auto history = store_->findEntries("user-1", 10, 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, entry.id);
    EXPECT_EQ(history[0].status, domain::LedgerEntryStatus::COMPLETED);
}

TEST_F(LedgerServiceTest, Fund_PublishesNotification) {
    auto entry = service_->fund("user-1", Decimal::fromUnits(500), Currency::USD, "");

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "ledger.funding");

    auto json = nlohmann::json::parse(messages[0].message);
    EXPECT_EQ(json["entry_id"], entry.id);
    EXPECT_EQ(json["owner_id"], "user-1");
    EXPECT_EQ(json["kind"], "FUNDING");
    EXPECT_EQ(json["currency"], "USD");
    EXPECT_EQ(json["status"], "COMPLETED");
    EXPECT_DOUBLE_EQ(json["amount"].get<double>(), 500.0);
}

TEST_F(LedgerServiceTest, Fund_NonPositiveAmount_InvalidAmount) {
    expectLedgerError([&] { service_->fund("user-1", Decimal(), Currency::NGN, ""); },
                      LedgerErrorCode::InvalidAmount);
    expectLedgerError([&] { service_->fund("user-1", Decimal::fromUnits(-5), Currency::NGN, ""); },
                      LedgerErrorCode::InvalidAmount);

    // Отказ валидации не оставляет следов
    EXPECT_EQ(store_->countEntries("user-1"), 0u);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(LedgerServiceTest, Fund_IneligibleOwner_Rejected) {
    EXPECT_CALL(*eligibility_, isEligible("ghost")).WillOnce(Return(false));

    expectLedgerError([&] { service_->fund("ghost", Decimal::fromUnits(10), Currency::NGN, ""); },
                      LedgerErrorCode::OwnerNotEligible);
    EXPECT_EQ(store_->countEntries("ghost"), 0u);
}

TEST_F(LedgerServiceTest, Fund_EmptyOwner_RejectedWithoutLookup) {
    EXPECT_CALL(*eligibility_, isEligible(_)).Times(0);

    expectLedgerError([&] { service_->fund("", Decimal::fromUnits(10), Currency::NGN, ""); },
                      LedgerErrorCode::OwnerNotEligible);
}

// ============================================================================
// ТЕСТЫ: transfer
// ============================================================================

TEST_F(LedgerServiceTest, Transfer_MovesFunds) {
    givenBalance("alice", Currency::USD, 100);

    auto entry = service_->transfer("alice", "bob", Decimal::fromUnits(40), Currency::USD, "");

    EXPECT_EQ(entry.status, domain::LedgerEntryStatus::COMPLETED);
    EXPECT_EQ(entry.counterpartyId.value_or(""), "bob");
    EXPECT_EQ(entry.description, "Transfer to user bob");
    EXPECT_EQ(availableOf("alice", Currency::USD), Decimal::fromUnits(60));
    EXPECT_EQ(availableOf("bob", Currency::USD), Decimal::fromUnits(40));

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "ledger.transfer");
}

TEST_F(LedgerServiceTest, Transfer_CustomDescriptionKept) {
    givenBalance("alice", Currency::USD, 100);

    auto entry = service_->transfer("alice", "bob", Decimal::fromUnits(1), Currency::USD, "Payment for services");
    EXPECT_EQ(entry.description, "Payment for services");
}

TEST_F(LedgerServiceTest, Transfer_SameOwner_Rejected) {
    givenBalance("alice", Currency::USD, 100);

    expectLedgerError([&] { service_->transfer("alice", "alice", Decimal::fromUnits(10), Currency::USD, ""); },
                      LedgerErrorCode::SameOwner);
    EXPECT_EQ(availableOf("alice", Currency::USD), Decimal::fromUnits(100));
}

TEST_F(LedgerServiceTest, Transfer_Insufficient_BalancesUnchangedAndFailureAudited) {
    givenBalance("alice", Currency::USD, 30);

    expectLedgerError([&] { service_->transfer("alice", "bob", Decimal::fromUnits(50), Currency::USD, ""); },
                      LedgerErrorCode::InsufficientFunds);

    EXPECT_EQ(availableOf("alice", Currency::USD), Decimal::fromUnits(30));
    EXPECT_TRUE(availableOf("bob", Currency::USD).isZero());

    auto history = store_->findEntriesByKind("alice", domain::LedgerEntryKind::TRANSFER);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, domain::LedgerEntryStatus::FAILED);

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(messages[0].message)["status"], "FAILED");
}

TEST_F(LedgerServiceTest, Transfer_RecipientMustExistButNeedNotBeVerified) {
    givenBalance("alice", Currency::NGN, 100);
    EXPECT_CALL(*eligibility_, isEligible("bob")).Times(0);
    EXPECT_CALL(*eligibility_, isEligible("alice")).WillOnce(Return(true));
    EXPECT_CALL(*eligibility_, exists("bob")).WillOnce(Return(true));

    service_->transfer("alice", "bob", Decimal::fromUnits(100), Currency::NGN, "");
    EXPECT_EQ(availableOf("bob", Currency::NGN), Decimal::fromUnits(100));
}

TEST_F(LedgerServiceTest, Transfer_UnknownRecipient_RejectedBeforeHold) {
    givenBalance("alice", Currency::USD, 100);
    EXPECT_CALL(*eligibility_, exists("bbo")).WillOnce(Return(false));

    try {
        service_->transfer("alice", "bbo", Decimal::fromUnits(100), Currency::USD, "");
        FAIL() << "Expected OwnerNotEligible";
    } catch (const domain::LedgerException& e) {
        EXPECT_EQ(e.code(), LedgerErrorCode::OwnerNotEligible);
        EXPECT_STREQ(e.what(), "Recipient not found");
    }

    EXPECT_EQ(availableOf("alice", Currency::USD), Decimal::fromUnits(100));
    EXPECT_TRUE(store_->findBalances("bbo").empty());
    EXPECT_TRUE(store_->findEntriesByKind("alice", domain::LedgerEntryKind::TRANSFER).empty());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

// ============================================================================
// ТЕСТЫ: trade
// ============================================================================

TEST_F(LedgerServiceTest, Trade_ConvertsAtLiveRate) {
    givenBalance("user-1", Currency::USD, 1000);
    givenLiveRate(Currency::USD, Currency::EUR, 0.85);

    auto entry = service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100));

    EXPECT_EQ(entry.status, domain::LedgerEntryStatus::COMPLETED);
    EXPECT_EQ(entry.rate.toString(), "0.85");
    EXPECT_EQ(entry.convertedAmount, Decimal::fromUnits(85));
    EXPECT_EQ(entry.description, "Trade 100 USD for 85 EUR at rate 0.85");

    EXPECT_EQ(availableOf("user-1", Currency::USD), Decimal::fromUnits(900));
    EXPECT_EQ(availableOf("user-1", Currency::EUR), Decimal::fromUnits(85));

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "ledger.trade");
}

TEST_F(LedgerServiceTest, Trade_SameCurrency_Rejected) {
    EXPECT_CALL(*rateService_, resolveRate(_, _, _)).Times(0);

    expectLedgerError([&] { service_->trade("user-1", Currency::USD, Currency::USD, Decimal::fromUnits(1)); },
                      LedgerErrorCode::SameCurrency);
}

TEST_F(LedgerServiceTest, Trade_Insufficient_NamedCurrencyInMessage) {
    givenBalance("user-1", Currency::USD, 10);
    givenLiveRate(Currency::USD, Currency::EUR, 0.85);

    try {
        service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100));
        FAIL() << "Expected InsufficientFunds";
    } catch (const domain::LedgerException& e) {
        EXPECT_EQ(e.code(), LedgerErrorCode::InsufficientFunds);
        EXPECT_STREQ(e.what(), "Insufficient USD balance");
    }

    EXPECT_EQ(availableOf("user-1", Currency::USD), Decimal::fromUnits(10));
    EXPECT_TRUE(availableOf("user-1", Currency::EUR).isZero());

    // FAILED запись несёт курс, который был получен
    auto trades = store_->findEntriesByKind("user-1", domain::LedgerEntryKind::TRADE);
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].status, domain::LedgerEntryStatus::FAILED);
    EXPECT_EQ(trades[0].rate.toString(), "0.85");
    EXPECT_EQ(trades[0].convertedAmount, Decimal::fromUnits(85));
}

TEST_F(LedgerServiceTest, Trade_RateUnavailable_NoFallbackAndNoChange) {
    givenBalance("user-1", Currency::USD, 1000);
    EXPECT_CALL(*rateService_, resolveRate(Currency::USD, Currency::EUR, false))
        .WillOnce(Throw(domain::LedgerException(LedgerErrorCode::RateUnavailable, "FX down")));

    expectLedgerError([&] { service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100)); },
                      LedgerErrorCode::RateUnavailable);

    EXPECT_EQ(availableOf("user-1", Currency::USD), Decimal::fromUnits(1000));
    auto trades = store_->findEntriesByKind("user-1", domain::LedgerEntryKind::TRADE);
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].status, domain::LedgerEntryStatus::FAILED);
    EXPECT_TRUE(trades[0].rate.isZero());
    EXPECT_TRUE(trades[0].convertedAmount.isZero());
}

TEST_F(LedgerServiceTest, Trade_DeviationGuardDisabledByDefault) {
    givenBalance("user-1", Currency::USD, 1000);
    givenLiveRate(Currency::USD, Currency::EUR, 0.5);
    EXPECT_CALL(*fallbackRates_, getRate(_, _)).Times(0);

    service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100));
    EXPECT_EQ(availableOf("user-1", Currency::EUR), Decimal::fromUnits(50));
}

TEST_F(LedgerServiceTest, Trade_DeviationGuardRejectsMispricedRate) {
    settings_->maxRateDeviationPercent = 10.0;
    givenBalance("user-1", Currency::USD, 1000);
    givenLiveRate(Currency::USD, Currency::EUR, 0.5);
    ON_CALL(*fallbackRates_, getRate(Currency::USD, Currency::EUR)).WillByDefault(Return(0.92));

    expectLedgerError([&] { service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100)); },
                      LedgerErrorCode::RateUnavailable);
    EXPECT_EQ(availableOf("user-1", Currency::USD), Decimal::fromUnits(1000));
}

TEST_F(LedgerServiceTest, Trade_DeviationWithinLimit_Allowed) {
    settings_->maxRateDeviationPercent = 10.0;
    givenBalance("user-1", Currency::USD, 1000);
    givenLiveRate(Currency::USD, Currency::EUR, 0.9);
    ON_CALL(*fallbackRates_, getRate(Currency::USD, Currency::EUR)).WillByDefault(Return(0.92));

    auto entry = service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100));
    EXPECT_EQ(entry.convertedAmount, Decimal::fromUnits(90));
}

TEST_F(LedgerServiceTest, Trade_UnexpectedError_InternalAndRolledBack) {
    givenBalance("user-1", Currency::USD, 1000);
    EXPECT_CALL(*rateService_, resolveRate(_, _, _))
        .WillOnce(Throw(std::runtime_error("bad_alloc somewhere")));

    expectLedgerError([&] { service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100)); },
                      LedgerErrorCode::Internal);
    EXPECT_EQ(availableOf("user-1", Currency::USD), Decimal::fromUnits(1000));
}

TEST_F(LedgerServiceTest, Trade_CreditFailsAfterDebit_DebitRolledBack) {
    const auto nearMax = Decimal::fromUnits(std::numeric_limits<int64_t>::max());
    givenBalance("user-1", Currency::USD, 1000);
    service_->fund("user-1", nearMax, Currency::EUR, "seed");
    publisher_->clearMessages();
    givenLiveRate(Currency::USD, Currency::EUR, 0.85);

    // Списание USD проходит, зачисление EUR переполняет Decimal
    expectLedgerError([&] { service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(100)); },
                      LedgerErrorCode::Internal);

    EXPECT_EQ(availableOf("user-1", Currency::USD), Decimal::fromUnits(1000));
    EXPECT_EQ(store_->getOrCreate("user-1", Currency::USD).total, Decimal::fromUnits(1000));
    EXPECT_EQ(availableOf("user-1", Currency::EUR), nearMax);
    EXPECT_TRUE(store_->findEntriesByKind("user-1", domain::LedgerEntryKind::TRADE).empty());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

// ============================================================================
// ТЕСТЫ: сбои инфраструктуры
// ============================================================================

TEST_F(LedgerServiceTest, PublisherFailure_DoesNotFailOperation) {
    publisher_->setFailing(true);

    auto entry = service_->fund("user-1", Decimal::fromUnits(10), Currency::NGN, "");

    EXPECT_EQ(entry.status, domain::LedgerEntryStatus::COMPLETED);
    EXPECT_EQ(availableOf("user-1", Currency::NGN), Decimal::fromUnits(10));
}

TEST_F(LedgerServiceTest, TransientStorageFailure_StorageUnavailable) {
    store_->failHold = true;
    store_->retryableFailure = true;

    expectLedgerError([&] { service_->fund("user-1", Decimal::fromUnits(10), Currency::NGN, ""); },
                      LedgerErrorCode::StorageUnavailable);
}

TEST_F(LedgerServiceTest, FatalStorageFailure_Internal) {
    store_->failHold = true;
    store_->retryableFailure = false;

    expectLedgerError([&] { service_->fund("user-1", Decimal::fromUnits(10), Currency::NGN, ""); },
                      LedgerErrorCode::Internal);
}

TEST_F(LedgerServiceTest, AuditWriteFailure_OriginalErrorPreserved) {
    givenBalance("alice", Currency::USD, 5);
    store_->failAppend = true;

    expectLedgerError([&] { service_->transfer("alice", "bob", Decimal::fromUnits(50), Currency::USD, ""); },
                      LedgerErrorCode::InsufficientFunds);

    // Не сохранённая FAILED запись не анонсируется
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

// ============================================================================
// ТЕСТЫ: чтение
// ============================================================================

TEST_F(LedgerServiceTest, GetBalances_CreatesDefaultNgnBalance) {
    auto balances = service_->getBalances("newcomer");

    ASSERT_EQ(balances.size(), 1u);
    EXPECT_EQ(balances[0].currency, Currency::NGN);
    EXPECT_TRUE(balances[0].total.isZero());
}

TEST_F(LedgerServiceTest, GetBalances_SortedByCurrency) {
    givenBalance("user-1", Currency::USD, 1);
    givenBalance("user-1", Currency::EUR, 2);

    auto balances = service_->getBalances("user-1");

    ASSERT_EQ(balances.size(), 3u);
    EXPECT_EQ(balances[0].currency, Currency::EUR);
    EXPECT_EQ(balances[1].currency, Currency::NGN);
    EXPECT_EQ(balances[2].currency, Currency::USD);
}

TEST_F(LedgerServiceTest, GetTransactions_PagedNewestFirst) {
    for (int i = 1; i <= 15; ++i) {
        service_->fund("user-1", Decimal::fromUnits(i), Currency::NGN, "ref-" + std::to_string(i));
    }

    auto first = service_->getTransactions("user-1", 1, 10);
    EXPECT_EQ(first.total, 15u);
    EXPECT_EQ(first.totalPages, 2u);
    ASSERT_EQ(first.entries.size(), 10u);
    EXPECT_EQ(first.entries[0].reference.value_or(""), "ref-15");

    auto second = service_->getTransactions("user-1", 2, 10);
    ASSERT_EQ(second.entries.size(), 5u);
    EXPECT_EQ(second.entries[4].reference.value_or(""), "ref-1");
}

TEST_F(LedgerServiceTest, GetTransactions_NormalizesPaging) {
    service_->fund("user-1", Decimal::fromUnits(1), Currency::NGN, "");

    auto page = service_->getTransactions("user-1", 0, 0);
    EXPECT_EQ(page.page, 1u);
    EXPECT_EQ(page.limit, 10u);

    auto capped = service_->getTransactions("user-1", 1, 1000);
    EXPECT_EQ(capped.limit, 100u);
}

TEST_F(LedgerServiceTest, GetTransactions_PageBeyondEnd_EmptyWithoutStoreQuery) {
    service_->fund("user-1", Decimal::fromUnits(1), Currency::NGN, "");
    store_->findEntriesCalls = 0;

    auto page = service_->getTransactions("user-1", std::numeric_limits<size_t>::max(), 100);

    EXPECT_EQ(page.total, 1u);
    EXPECT_EQ(page.totalPages, 1u);
    EXPECT_TRUE(page.entries.empty());
    EXPECT_EQ(store_->findEntriesCalls, 0);
}

TEST_F(LedgerServiceTest, GetTransactionsByKind_FiltersKind) {
    givenBalance("user-1", Currency::USD, 100);
    givenLiveRate(Currency::USD, Currency::EUR, 0.85);
    service_->trade("user-1", Currency::USD, Currency::EUR, Decimal::fromUnits(10));
    service_->transfer("user-1", "user-2", Decimal::fromUnits(10), Currency::USD, "");

    EXPECT_EQ(service_->getTransactionsByKind("user-1", domain::LedgerEntryKind::TRADE).size(), 1u);
    EXPECT_EQ(service_->getTransactionsByKind("user-1", domain::LedgerEntryKind::TRANSFER).size(), 1u);
    EXPECT_EQ(service_->getTransactionsByKind("user-1", domain::LedgerEntryKind::FUNDING).size(), 1u);
}
