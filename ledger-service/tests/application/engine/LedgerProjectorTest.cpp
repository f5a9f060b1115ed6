/**
 * @file LedgerProjectorTest.cpp
 * @brief Тесты проекции состояния, в том числе на прошедшую дату
 */

#include <gtest/gtest.h>
#include "application/engine/LedgerProjector.hpp"

using namespace ledger::domain;
using namespace ledger::application::engine;

class LedgerProjectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        account_.accountId = "acc-001";
        account_.lossSplit = BeneficiarySplit::dual(Decimal::parse("1"), Decimal::parse("9"));

        add(Transaction::funding("acc-001", Decimal::parse("100"), Date::of(2024, 1, 1)));
        add(Transaction::balanceRecord("acc-001", Decimal::parse("5"), Decimal::zero(), Date::of(2024, 1, 5)));

        snapshot_.id = "snp-1";
        snapshot_.kind = SnapshotKind::LOSS;
        snapshot_.amount = Decimal::parse("95");
        snapshot_.split = account_.lossSplit;
        snapshot_.balanceReference = BalanceReference{Date::of(2024, 1, 5), 2, Decimal::parse("5")};
    }

    void add(Transaction tx) {
        tx.sequence = static_cast<int64_t>(transactions_.size()) + 1;
        tx.id = "txn-" + std::to_string(tx.sequence);
        transactions_.push_back(tx);
    }

    void settle(const std::string& capitalClosed, const Date& date) {
        Transaction tx;
        tx.kind = TransactionKind::SETTLEMENT;
        tx.date = date;
        tx.capitalClosed = Decimal::parse(capitalClosed);
        tx.snapshotId = snapshot_.id;
        add(tx);
    }

    Account account_;
    std::vector<Transaction> transactions_;
    LossSnapshot snapshot_;
};

TEST_F(LedgerProjectorTest, ActiveLossWithCompanySplit) {
    auto state = LedgerProjector::project(account_, transactions_, {snapshot_});

    EXPECT_EQ(state.position, AccountPosition::LOSS);
    EXPECT_EQ(state.capital, Decimal::parse("100"));
    EXPECT_EQ(state.currentBalance, Decimal::parse("5"));
    EXPECT_EQ(state.loss, Decimal::parse("95"));
    EXPECT_EQ(state.remainingLoss, Decimal::parse("95"));
    EXPECT_EQ(state.pending, Decimal::parse("9.5"));
    EXPECT_EQ(state.pendingMyShare, Decimal::parse("0.9"));
    EXPECT_EQ(state.pendingCounterpartyShare, Decimal::parse("8.6"));
    ASSERT_TRUE(state.activeSnapshotId.has_value());
    EXPECT_EQ(*state.activeSnapshotId, "snp-1");
    EXPECT_FALSE(state.asOf.has_value());
}

TEST_F(LedgerProjectorTest, NoSnapshotMeansNoPending) {
    auto state = LedgerProjector::project(account_, {transactions_[0]}, {});

    EXPECT_EQ(state.position, AccountPosition::NEUTRAL);
    EXPECT_TRUE(state.pending.isZero());
    EXPECT_FALSE(state.activeSnapshotId.has_value());
}

TEST_F(LedgerProjectorTest, AsOfBeforeSnapshotIsNeutral) {
    auto state = LedgerProjector::project(account_, transactions_, {snapshot_}, Date::of(2024, 1, 3));

    EXPECT_EQ(state.position, AccountPosition::NEUTRAL);
    EXPECT_EQ(state.currentBalance, Decimal::parse("100"));
    EXPECT_FALSE(state.activeSnapshotId.has_value());
    ASSERT_TRUE(state.asOf.has_value());
    EXPECT_EQ(state.asOf->toString(), "2024-01-03");
}

TEST_F(LedgerProjectorTest, AsOfIgnoresLaterSettlements) {
    settle("50", Date::of(2024, 1, 10));
    snapshot_.isSettled = false;

    auto before = LedgerProjector::project(account_, transactions_, {snapshot_}, Date::of(2024, 1, 7));
    EXPECT_EQ(before.remainingLoss, Decimal::parse("95"));
    EXPECT_EQ(before.pending, Decimal::parse("9.5"));

    auto after = LedgerProjector::project(account_, transactions_, {snapshot_}, Date::of(2024, 1, 12));
    EXPECT_EQ(after.remainingLoss, Decimal::parse("45"));
    EXPECT_EQ(after.capital, Decimal::parse("50"));
    EXPECT_EQ(after.pending, Decimal::parse("4.5"));
}

TEST_F(LedgerProjectorTest, AsOfAfterFullSettlementIsNeutral) {
    settle("95", Date::of(2024, 1, 10));
    snapshot_.isSettled = true;

    auto state = LedgerProjector::project(account_, transactions_, {snapshot_}, Date::of(2024, 1, 12));

    EXPECT_EQ(state.position, AccountPosition::NEUTRAL);
    EXPECT_FALSE(state.activeSnapshotId.has_value());
    EXPECT_EQ(state.capital, Decimal::parse("5"));
    EXPECT_EQ(state.currentBalance, Decimal::parse("5"));
}

TEST_F(LedgerProjectorTest, CachedValuesPassedThrough) {
    account_.cachedCapital = Decimal::parse("100");
    account_.cachedBalance = Decimal::parse("5");

    auto state = LedgerProjector::project(account_, transactions_, {snapshot_});

    EXPECT_EQ(state.cachedCapital, Decimal::parse("100"));
    EXPECT_EQ(state.cachedBalance, Decimal::parse("5"));
}
