/**
 * @file BeneficiarySplitTest.cpp
 * @brief Тесты распределения долей (личный клиент / клиент компании)
 */

#include <gtest/gtest.h>
#include "domain/BeneficiarySplit.hpp"

using namespace ledger::domain;

TEST(BeneficiarySplitTest, SingleBeneficiary) {
    auto split = BeneficiarySplit::single(Decimal::parse("10"));

    EXPECT_FALSE(split.isDual());
    EXPECT_EQ(split.myPct(), Decimal::parse("10"));
    EXPECT_EQ(split.counterpartyPct(), Decimal::zero());
    EXPECT_EQ(split.totalPct(), Decimal::parse("10"));
    EXPECT_TRUE(split.isValid());
}

TEST(BeneficiarySplitTest, DualBeneficiary) {
    auto split = BeneficiarySplit::dual(Decimal::parse("1"), Decimal::parse("9"));

    EXPECT_TRUE(split.isDual());
    EXPECT_EQ(split.myPct(), Decimal::parse("1"));
    EXPECT_EQ(split.counterpartyPct(), Decimal::parse("9"));
    EXPECT_EQ(split.totalPct(), Decimal::parse("10"));
    EXPECT_TRUE(split.isValid());
}

TEST(BeneficiarySplitTest, DefaultIsInvalid) {
    EXPECT_FALSE(BeneficiarySplit().isValid());
}

TEST(BeneficiarySplitTest, Validation) {
    EXPECT_TRUE(BeneficiarySplit::single(Decimal::hundred()).isValid());
    EXPECT_FALSE(BeneficiarySplit::single(Decimal::parse("100.01")).isValid());
    EXPECT_FALSE(BeneficiarySplit::single(Decimal::zero()).isValid());
    EXPECT_FALSE(BeneficiarySplit::dual(Decimal::parse("-1"), Decimal::parse("11")).isValid());
    EXPECT_FALSE(BeneficiarySplit::dual(Decimal::parse("60"), Decimal::parse("50")).isValid());
    EXPECT_TRUE(BeneficiarySplit::dual(Decimal::zero(), Decimal::parse("5")).isValid());
}

TEST(BeneficiarySplitTest, EqualityDistinguishesKind) {
    auto single = BeneficiarySplit::single(Decimal::parse("10"));
    auto dual = BeneficiarySplit::dual(Decimal::parse("10"), Decimal::zero());

    EXPECT_FALSE(single == dual);
    EXPECT_TRUE(single == BeneficiarySplit::single(Decimal::parse("10")));
}
