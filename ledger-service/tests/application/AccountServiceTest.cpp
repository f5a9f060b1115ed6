/**
 * @file AccountServiceTest.cpp
 * @brief Тесты открытия счетов, долей по умолчанию и сверки кэшей
 */

#include "fixtures/LedgerFixture.hpp"
#include <future>

using namespace ledger;
using namespace ledger::domain;
using ledger::tests::LedgerFixture;

class AccountServiceTest : public LedgerFixture {};

// ============================================================================
// OPEN / GET
// ============================================================================

TEST_F(AccountServiceTest, OpenAccount_AssignsIdAndStoresSplits) {
    ports::input::OpenAccountRequest request;
    request.clientName = "Bob";
    request.exchangeName = "Bybit";
    request.lossSplit = BeneficiarySplit::dual(dec("1"), dec("9"));
    request.profitSplit = BeneficiarySplit::single(dec("20"));

    auto account = accounts_->openAccount(request);

    EXPECT_EQ(account.accountId.rfind("acc-", 0), 0u);
    EXPECT_EQ(account.clientName, "Bob");
    EXPECT_TRUE(account.lossSplit.isDual());
    EXPECT_TRUE(account.cachedCapital.isZero());

    auto loaded = accounts_->getAccount(account.accountId);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->exchangeName, "Bybit");
    EXPECT_TRUE(loaded->profitSplit == BeneficiarySplit::single(dec("20")));
}

TEST_F(AccountServiceTest, OpenAccount_GeneratesUniqueIds) {
    auto first = openMyClient();
    auto second = openMyClient();

    EXPECT_NE(first, second);
    EXPECT_EQ(store_->size(), 2u);
}

TEST_F(AccountServiceTest, OpenAccount_Validation) {
    ports::input::OpenAccountRequest request;
    request.clientName = "";
    request.exchangeName = "Binance";
    request.lossSplit = BeneficiarySplit::single(dec("10"));
    request.profitSplit = BeneficiarySplit::single(dec("10"));
    EXPECT_THROW(accounts_->openAccount(request), std::invalid_argument);

    request.clientName = "Alice";
    request.lossSplit = BeneficiarySplit::dual(dec("60"), dec("50"));
    EXPECT_THROW(accounts_->openAccount(request), std::invalid_argument);

    request.lossSplit = BeneficiarySplit::single(dec("10"));
    request.profitSplit = BeneficiarySplit::single(dec("0"));
    EXPECT_THROW(accounts_->openAccount(request), std::invalid_argument);

    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(AccountServiceTest, GetAccount_NotFound) {
    EXPECT_FALSE(accounts_->getAccount("acc-missing").has_value());
}

// ============================================================================
// SHARE DEFAULTS
// ============================================================================

TEST_F(AccountServiceTest, UpdateShareDefaults_AppliesToNextSnapshot) {
    auto acc = openMyClient();
    fund(acc, "1000", 1);

    ASSERT_TRUE(accounts_->updateShareDefaults(acc, BeneficiarySplit::dual(dec("2"), dec("8")),
                                               BeneficiarySplit::single(dec("30"))));
    auto recorded = record(acc, "100", 5);

    ASSERT_TRUE(recorded.isOk());
    EXPECT_EQ(recorded.state->pending, dec("90"));
    EXPECT_EQ(recorded.state->pendingMyShare, dec("18"));
    EXPECT_EQ(recorded.state->pendingCounterpartyShare, dec("72"));
}

TEST_F(AccountServiceTest, UpdateShareDefaults_UnknownAccount) {
    EXPECT_FALSE(accounts_->updateShareDefaults("acc-missing", BeneficiarySplit::single(dec("10")),
                                                BeneficiarySplit::single(dec("10"))));
}

TEST_F(AccountServiceTest, UpdateShareDefaults_RejectsInvalidSplit) {
    auto acc = openMyClient();
    EXPECT_THROW(accounts_->updateShareDefaults(acc, BeneficiarySplit::single(dec("101")),
                                                BeneficiarySplit::single(dec("10"))),
                 std::invalid_argument);
    EXPECT_TRUE(accounts_->getAccount(acc)->lossSplit == BeneficiarySplit::single(dec("10")));
}

// ============================================================================
// CACHE RECONCILE
// ============================================================================

TEST_F(AccountServiceTest, ReconcileCaches_CleanLedgerHasNoDrift) {
    auto acc = openMyClient();
    fund(acc, "1000", 1);
    record(acc, "100", 5);

    auto report = accounts_->reconcileCaches();

    EXPECT_EQ(report.accountsChecked, 1);
    EXPECT_EQ(report.drifted, 0);
    EXPECT_EQ(report.failed, 0);
}

TEST_F(AccountServiceTest, ReconcileCaches_RepairsDriftedCache) {
    auto acc = openMyClient();
    fund(acc, "1000", 1);
    record(acc, "100", 5);
    openMyClient();

    store_->setCaches(acc, dec("1"), dec("2"));

    auto report = accounts_->reconcileCaches();

    EXPECT_EQ(report.accountsChecked, 2);
    EXPECT_EQ(report.drifted, 1);
    EXPECT_EQ(report.failed, 0);

    auto account = accounts_->getAccount(acc);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->cachedCapital, dec("1000"));
    EXPECT_EQ(account->cachedBalance, dec("100"));
}

TEST_F(AccountServiceTest, ReconcileCaches_LockedAccountCountedAsFailed) {
    auto acc = openMyClient();
    auto held = store_->begin(acc, ports::output::LockMode::EXCLUSIVE);

    auto report = std::async(std::launch::async, [this]() {
        return accounts_->reconcileCaches();
    }).get();

    EXPECT_EQ(report.accountsChecked, 1);
    EXPECT_EQ(report.failed, 1);
}
