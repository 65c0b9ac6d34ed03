// tests/rules/test_mana.cpp
#include "rules/mana.h"
#include "rules/errors.h"
#include <gtest/gtest.h>

TEST(ManaCostTest, Parse) {
    ManaCost cost = ManaCost::parse("3RG");
    EXPECT_EQ(cost.generic, 3);
    EXPECT_EQ(cost.cost[Color::RED], 1);
    EXPECT_EQ(cost.cost[Color::GREEN], 1);
    EXPECT_EQ(cost.toString(), "3RG");
}

TEST(ManaCostTest, ParseBracedSymbols) {
    ManaCost cost = ManaCost::parse("{2}{R}{G}");
    EXPECT_EQ(cost.generic, 2);
    EXPECT_EQ(cost.cost[Color::RED], 1);
    EXPECT_EQ(cost.cost[Color::GREEN], 1);
    EXPECT_EQ(cost.manaValue(), 4);
    EXPECT_EQ(cost.colors(), (Colors{Color::RED, Color::GREEN}));
}

TEST(ManaCostTest, XAndHybridCountAsGeneric) {
    EXPECT_EQ(ManaCost::parse("{X}{R}", 3).generic, 3);
    EXPECT_EQ(ManaCost::parse("{X}{R}").generic, 0);
    EXPECT_EQ(ManaCost::parse("{R/G}{G}").generic, 1);
    EXPECT_EQ(ManaCost::parse("{2/W}").generic, 2);
    EXPECT_EQ(ManaCost::parse("{B/P}").generic, 1);
}

TEST(ManaCostTest, RejectsUnknownSymbols) {
    EXPECT_THROW(ManaCost::parse("{Q}"), std::invalid_argument);
    EXPECT_THROW(ManaCost::parse("{R"), std::invalid_argument);
}

TEST(ManaTest, CanPayAndPay) {
    ManaCost cost = ManaCost::parse("2WU");
    Mana mana_pool;
    mana_pool.mana[Color::WHITE] = 1;
    mana_pool.mana[Color::BLUE] = 1;
    mana_pool.mana[Color::COLORLESS] = 2;

    EXPECT_TRUE(mana_pool.canPay(cost));
    mana_pool.pay(cost);
    EXPECT_EQ(mana_pool.mana[Color::WHITE], 0);
    EXPECT_EQ(mana_pool.mana[Color::BLUE], 0);
    EXPECT_EQ(mana_pool.mana[Color::COLORLESS], 0);
}

TEST(ManaTest, CannotPay) {
    ManaCost cost = ManaCost::parse("1BB");
    Mana mana_pool;
    mana_pool.mana[Color::BLACK] = 1;
    mana_pool.mana[Color::COLORLESS] = 1;

    EXPECT_FALSE(mana_pool.canPay(cost));
}

TEST(ManaTest, RedGreenScenario) {
    Mana mana_pool;
    mana_pool.add(Color::RED, 2);
    mana_pool.add(Color::GREEN, 1);

    ManaCost cost = ManaCost::parse("{R}{G}");
    EXPECT_TRUE(mana_pool.canPay(cost));
    mana_pool.pay(cost);
    EXPECT_EQ(mana_pool.amount(Color::RED), 1);
    EXPECT_EQ(mana_pool.amount(Color::GREEN), 0);

    EXPECT_FALSE(mana_pool.canPay(ManaCost::parse("{R}{R}")));
}

TEST(ManaTest, FailedPaymentChangesNothing) {
    Mana mana_pool = Mana::parse("RG");
    EXPECT_THROW(mana_pool.pay(ManaCost::parse("{R}{R}")), InsufficientManaError);
    EXPECT_EQ(mana_pool.amount(Color::RED), 1);
    EXPECT_EQ(mana_pool.amount(Color::GREEN), 1);
}

TEST(ManaTest, ZeroCostAlwaysPays) {
    Mana empty_pool;
    EXPECT_TRUE(empty_pool.canPay(ManaCost()));
    EXPECT_NO_THROW(empty_pool.pay(ManaCost::parse("0")));
    EXPECT_FALSE(empty_pool.canPay(ManaCost::parse("1")));
}

TEST(ManaTest, GenericDrainsColorlessBeforeColors) {
    Mana mana_pool;
    mana_pool.add(Color::COLORLESS, 1);
    mana_pool.add(Color::ANY, 1);
    mana_pool.add(Color::RED, 1);

    mana_pool.pay(ManaCost::parse("2"));
    EXPECT_EQ(mana_pool.amount(Color::COLORLESS), 0);
    EXPECT_EQ(mana_pool.amount(Color::ANY), 0);
    EXPECT_EQ(mana_pool.amount(Color::RED), 1);
}

TEST(ManaTest, AnyManaOnlyPaysGeneric) {
    Mana mana_pool = Mana::single(Color::ANY, 2);
    EXPECT_FALSE(mana_pool.canPay(ManaCost::parse("{R}")));
    EXPECT_TRUE(mana_pool.canPay(ManaCost::parse("{2}")));
}

// canPay agrees with pay on a copy, and pay never leaves a negative count.
TEST(ManaTest, CanPayMatchesPay) {
    const std::vector<std::string> pools = {"", "R", "RRG", "2WU", "3", "BBG", "1RGWUB"};
    const std::vector<std::string> costs = {"0", "R", "RG", "2R", "1BB", "2WU", "4", "WUBRG"};

    for (const std::string& pool_str : pools) {
        for (const std::string& cost_str : costs) {
            Mana pool = Mana::parse(pool_str);
            ManaCost cost = ManaCost::parse(cost_str);
            Mana copy = pool;
            bool paid = true;
            try {
                copy.pay(cost);
            } catch (const InsufficientManaError&) {
                paid = false;
            }
            EXPECT_EQ(pool.canPay(cost), paid) << pool_str << " paying " << cost_str;
            for (const auto& [color, amount] : copy.mana) {
                EXPECT_GE(amount, 0);
            }
        }
    }
}

TEST(ManaTest, CannotAddNegativeMana) {
    Mana mana_pool;
    EXPECT_THROW(mana_pool.add(Color::RED, -1), std::invalid_argument);
}
