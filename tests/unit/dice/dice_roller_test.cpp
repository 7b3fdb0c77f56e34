#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "wbs/dice/dice_roller.hpp"

using namespace wbs::dice;

// ---------------------------------------------------------------------------
// Random stream
// ---------------------------------------------------------------------------

TEST(DiceRollerTest, RollsStayInRange) {
    DiceRoller roller(7);
    for (int sides : kSupportedDieSizes) {
        for (int i = 0; i < 200; ++i) {
            int v = roller.rollDie(sides);
            ASSERT_GE(v, 1);
            ASSERT_LE(v, sides);
        }
    }
}

TEST(DiceRollerTest, SameSeedSameSequence) {
    DiceRoller a(1234);
    DiceRoller b(1234);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.rollDie(20), b.rollDie(20));
    }
}

TEST(DiceRollerTest, RollReturnsIndividualDice) {
    DiceRoller roller(99);
    auto roll = roller.roll(makeDice(4, 6, 3));
    ASSERT_EQ(roll.dice.size(), 4u);
    int sum = 0;
    for (int d : roll.dice) {
        sum += d;
    }
    EXPECT_EQ(roll.flatBonus, 3);
    EXPECT_EQ(roll.total, sum + 3);
    EXPECT_EQ(roll.diceTotal(), sum);
}

// ---------------------------------------------------------------------------
// d20 with advantage / disadvantage
// ---------------------------------------------------------------------------

TEST(DiceRollerTest, AdvantageKeepsHigher) {
    DiceRoller roller(1);
    roller.queueFixedRoll(20, 4);
    roller.queueFixedRoll(20, 17);
    auto d20 = roller.rollD20(true);
    EXPECT_EQ(d20.first, 4);
    ASSERT_TRUE(d20.second.has_value());
    EXPECT_EQ(*d20.second, 17);
    EXPECT_EQ(d20.natural, 17);
}

TEST(DiceRollerTest, DisadvantageKeepsLower) {
    DiceRoller roller(1);
    roller.queueFixedRoll(20, 4);
    roller.queueFixedRoll(20, 17);
    EXPECT_EQ(roller.rollD20(false, true).natural, 4);
}

TEST(DiceRollerTest, AdvantageAndDisadvantageCancel) {
    DiceRoller roller(1);
    roller.queueFixedRoll(20, 9);
    roller.queueFixedRoll(20, 18);
    auto d20 = roller.rollD20(true, true);
    EXPECT_EQ(d20.natural, 9);
    EXPECT_FALSE(d20.second.has_value());
}

// ---------------------------------------------------------------------------
// Overrides
// ---------------------------------------------------------------------------

TEST(DiceRollerTest, AlwaysMaxRoll) {
    DiceRoller roller(5);
    DiceOverrides overrides;
    overrides.alwaysMaxRoll = true;
    roller.setOverrides(overrides);
    EXPECT_EQ(roller.roll(makeDice(3, 8)).total, 24);
}

TEST(DiceRollerTest, AlwaysCritAffectsOnlyD20) {
    DiceRoller roller(5);
    DiceOverrides overrides;
    overrides.alwaysCrit = true;
    roller.setOverrides(overrides);
    EXPECT_EQ(roller.rollD20(false).natural, 20);
    int d6 = roller.rollDie(6);
    EXPECT_GE(d6, 1);
    EXPECT_LE(d6, 6);
}

TEST(DiceRollerTest, FixedRollsWinOverOtherOverrides) {
    DiceRoller roller(5);
    DiceOverrides overrides;
    overrides.alwaysMaxRoll = true;
    roller.setOverrides(overrides);
    roller.queueFixedRoll(6, 2);
    EXPECT_EQ(roller.rollDie(6), 2);
    EXPECT_EQ(roller.rollDie(6), 6);

    roller.clearOverrides();
    EXPECT_FALSE(roller.overrides().alwaysMaxRoll);
}

// ---------------------------------------------------------------------------
// Stream seeds
// ---------------------------------------------------------------------------

TEST(StreamSeedTest, DeterministicAndDistinct) {
    EXPECT_EQ(deriveStreamSeed(42, 0), deriveStreamSeed(42, 0));

    std::set<uint64_t> seen;
    for (uint64_t i = 0; i < 1000; ++i) {
        seen.insert(deriveStreamSeed(42, i));
    }
    EXPECT_EQ(seen.size(), 1000u);
    EXPECT_NE(deriveStreamSeed(42, 3), deriveStreamSeed(43, 3));
}
