/**
 * @file LedgerDerivationTest.cpp
 * @brief Тесты производных величин: капитал, текущий баланс, классификация
 */

#include <gtest/gtest.h>
#include "application/engine/BalanceOracle.hpp"
#include "application/engine/CapitalCalculator.hpp"
#include "application/engine/LossProfitResolver.hpp"

using namespace ledger::domain;
using namespace ledger::application::engine;

class LedgerDerivationTest : public ::testing::Test {
protected:
    std::vector<Transaction> ledger_;
    int64_t nextSequence_ = 1;

    Transaction& add(Transaction tx) {
        tx.id = "txn-" + std::to_string(nextSequence_);
        tx.sequence = nextSequence_++;
        ledger_.push_back(tx);
        return ledger_.back();
    }

    void fund(const std::string& amount, const Date& date) {
        add(Transaction::funding("acc-001", Decimal::parse(amount), date));
    }

    void record(const std::string& balance, const Date& date, const std::string& adjustment = "0") {
        add(Transaction::balanceRecord("acc-001", Decimal::parse(balance), Decimal::parse(adjustment), date));
    }

    void settlement(const std::string& capitalClosed, const Date& date) {
        Transaction tx;
        tx.kind = TransactionKind::SETTLEMENT;
        tx.accountId = "acc-001";
        tx.date = date;
        tx.capitalClosed = Decimal::parse(capitalClosed);
        add(tx);
    }
};

// ============================================================================
// CAPITAL
// ============================================================================

TEST_F(LedgerDerivationTest, Capital_FundingMinusClosed) {
    fund("1000", Date::of(2024, 1, 1));
    fund("500", Date::of(2024, 1, 2));
    settlement("100", Date::of(2024, 1, 3));
    settlement("-40", Date::of(2024, 1, 4));

    EXPECT_EQ(CapitalCalculator::totalFunding(ledger_), Decimal::parse("1500"));
    EXPECT_EQ(CapitalCalculator::totalCapitalClosed(ledger_), Decimal::parse("60"));
    EXPECT_EQ(CapitalCalculator::capital(ledger_), Decimal::parse("1440"));
}

TEST_F(LedgerDerivationTest, Capital_IgnoresBalanceRecords) {
    fund("1000", Date::of(2024, 1, 1));
    record("10", Date::of(2024, 1, 2));

    EXPECT_EQ(CapitalCalculator::capital(ledger_), Decimal::parse("1000"));
}

// ============================================================================
// CURRENT BALANCE
// ============================================================================

TEST_F(LedgerDerivationTest, Balance_WithoutRecordsEqualsFunding) {
    fund("1000", Date::of(2024, 1, 1));
    fund("200", Date::of(2024, 1, 2));

    EXPECT_EQ(BalanceOracle::currentBalance(ledger_, nullptr), Decimal::parse("1200"));
}

TEST_F(LedgerDerivationTest, Balance_LatestRecordPlusLaterFunding) {
    fund("1000", Date::of(2024, 1, 1));
    record("100", Date::of(2024, 1, 5));
    record("80", Date::of(2024, 1, 6), "5");
    fund("50", Date::of(2024, 1, 7));

    EXPECT_EQ(BalanceOracle::currentBalance(ledger_, nullptr), Decimal::parse("135"));
}

TEST_F(LedgerDerivationTest, Balance_BackdatedRecordDoesNotOverrideLaterOne) {
    fund("1000", Date::of(2024, 1, 1));
    record("300", Date::of(2024, 1, 10));
    record("900", Date::of(2024, 1, 5));

    EXPECT_EQ(BalanceOracle::currentBalance(ledger_, nullptr), Decimal::parse("300"));
}

TEST_F(LedgerDerivationTest, Balance_FrozenWhileSnapshotActive) {
    fund("1000", Date::of(2024, 1, 1));
    record("100", Date::of(2024, 1, 5));

    LossSnapshot snapshot;
    snapshot.id = "snp-1";
    snapshot.balanceReference = BalanceOracle::referencePoint(ledger_, Date::of(2024, 1, 5));
    snapshot.amount = Decimal::parse("900");

    record("1500", Date::of(2024, 1, 6));

    EXPECT_EQ(BalanceOracle::currentBalance(ledger_, &snapshot), Decimal::parse("100"));
    EXPECT_EQ(BalanceOracle::currentBalance(ledger_, nullptr), Decimal::parse("1500"));
}

TEST_F(LedgerDerivationTest, ReferencePoint_PointsAtLatestBalanceEntry) {
    fund("1000", Date::of(2024, 1, 1));
    record("100", Date::of(2024, 1, 5));
    settlement("10", Date::of(2024, 1, 6));

    auto reference = BalanceOracle::referencePoint(ledger_, Date::of(2024, 1, 9));

    EXPECT_EQ(reference.date, Date::of(2024, 1, 5));
    EXPECT_EQ(reference.sequence, 2);
    EXPECT_EQ(reference.balance, Decimal::parse("100"));
}

TEST_F(LedgerDerivationTest, ReferencePoint_EmptyLedgerUsesFallback) {
    auto reference = BalanceOracle::referencePoint(ledger_, Date::of(2024, 2, 1));

    EXPECT_EQ(reference.date, Date::of(2024, 2, 1));
    EXPECT_EQ(reference.sequence, 0);
    EXPECT_TRUE(reference.balance.isZero());
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

TEST(LossProfitResolverTest, Loss) {
    auto result = LossProfitResolver::classify(Decimal::parse("1000"), Decimal::parse("100"));

    EXPECT_EQ(result.position, AccountPosition::LOSS);
    EXPECT_EQ(result.loss, Decimal::parse("900"));
    EXPECT_TRUE(result.profit.isZero());
    EXPECT_FALSE(result.isResidual());
}

TEST(LossProfitResolverTest, Profit) {
    auto result = LossProfitResolver::classify(Decimal::parse("1000"), Decimal::parse("1200"));

    EXPECT_EQ(result.position, AccountPosition::PROFIT);
    EXPECT_EQ(result.profit, Decimal::parse("200"));
    EXPECT_TRUE(result.loss.isZero());
}

TEST(LossProfitResolverTest, Neutral) {
    auto result = LossProfitResolver::classify(Decimal::parse("500"), Decimal::parse("500"));

    EXPECT_EQ(result.position, AccountPosition::NEUTRAL);
    EXPECT_TRUE(result.loss.isZero());
    EXPECT_TRUE(result.profit.isZero());
}

TEST(LossProfitResolverTest, ResidualBelowThreshold) {
    auto result = LossProfitResolver::classify(Decimal::parse("100"), Decimal::parse("99.995"));

    EXPECT_EQ(result.position, AccountPosition::LOSS);
    EXPECT_EQ(result.loss, Decimal::parse("0.005"));
    EXPECT_TRUE(result.isResidual());
}
