/// @file dice_test.cpp
/// @brief Unit tests for DiceRoller and DefaultRandomSource.

#include <gtest/gtest.h>

#include <memory>

#include "vigor/game/dice.hpp"

#include "support/test_helpers.hpp"

using namespace vigor::game;
using vigor::test::ScriptedRandomSource;

// ═══════════════════════════════════════════════════════════════════════════
// Fudge dice
// ═══════════════════════════════════════════════════════════════════════════

class DiceRollerTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedRandomSource> source_ = std::make_shared<ScriptedRandomSource>();
    DiceRoller dice_{source_};
};

TEST_F(DiceRollerTest, FaceValueMapping) {
    EXPECT_EQ(DiceRoller::FudgeFaceValue(0), 0);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(1), 0);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(2), 1);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(3), 1);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(4), -1);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(5), -1);
}

TEST_F(DiceRollerTest, FaceValueReducesModuloSix) {
    EXPECT_EQ(DiceRoller::FudgeFaceValue(8), 1);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(-1), -1);
    EXPECT_EQ(DiceRoller::FudgeFaceValue(-6), 0);
}

TEST_F(DiceRollerTest, Roll4dFSumsFourDice) {
    source_->Push(2);
    source_->Push(3);
    source_->Push(4);
    source_->Push(0);
    EXPECT_EQ(dice_.Roll4dF(), 1);
    EXPECT_EQ(source_->Calls(), 4u);
}

TEST_F(DiceRollerTest, NonExtremeRollDoesNotExplode) {
    source_->PushFudge(3);
    EXPECT_EQ(dice_.RollExploding4dF(), 3);
    EXPECT_EQ(source_->Calls(), 4u);
}

TEST_F(DiceRollerTest, PlusFourExplodesOnce) {
    source_->PushFudge(4);
    source_->PushFudge(2);  // two plus faces among the re-roll
    EXPECT_EQ(dice_.RollExploding4dF(), 6);
    EXPECT_EQ(source_->Calls(), 8u);
}

TEST_F(DiceRollerTest, MinusFourExplodesDownward) {
    source_->PushFudge(-4);
    source_->PushFudge(-4);
    source_->PushFudge(-1);
    EXPECT_EQ(dice_.RollExploding4dF(), -9);
}

TEST_F(DiceRollerTest, ExplodingRerollsStopAtCap) {
    source_->PushFudge(4);
    for (int i = 0; i < kMaxExplodingRerolls + 5; ++i) {
        source_->PushFudge(4);
    }
    EXPECT_EQ(dice_.RollExploding4dF(), 4 + 4 * kMaxExplodingRerolls);
    EXPECT_EQ(source_->Remaining(), 20u);
}

TEST_F(DiceRollerTest, ModifierRollIsClamped) {
    source_->PushFudge(4);
    EXPECT_EQ(dice_.Roll4dFWithModifier(10, 0, 12), 12);
    source_->PushFudge(-4);
    EXPECT_EQ(dice_.Roll4dFWithModifier(1, 0, 12), 0);
}

TEST_F(DiceRollerTest, RollMultipleIgnoresNonPositiveCount) {
    EXPECT_TRUE(dice_.RollMultiple4dF(0).empty());
    EXPECT_TRUE(dice_.RollMultiple4dF(-3).empty());
    EXPECT_EQ(dice_.RollMultiple4dF(3).size(), 3u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Polyhedral dice
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DiceRollerTest, DieWithoutSidesRollsZero) {
    EXPECT_EQ(dice_.RollDie(0), 0);
    EXPECT_EQ(dice_.RollDie(-4), 0);
    EXPECT_EQ(source_->Calls(), 0u);
}

TEST_F(DiceRollerTest, RollDiceSumsResults) {
    source_->PushDie(3);
    source_->PushDie(5);
    source_->PushDie(6);
    EXPECT_EQ(dice_.RollDice(3, 6), 14);
}

TEST(DefaultRandomSourceTest, StaysWithinBounds) {
    DiceRoller dice(std::make_shared<DefaultRandomSource>(42));
    for (int i = 0; i < 500; ++i) {
        int die = dice.RollDie(12);
        EXPECT_GE(die, 1);
        EXPECT_LE(die, 12);
        int fudge = dice.Roll4dF();
        EXPECT_GE(fudge, -4);
        EXPECT_LE(fudge, 4);
    }
}

TEST(DefaultRandomSourceTest, SameSeedSameSequence) {
    DiceRoller a(std::make_shared<DefaultRandomSource>(7));
    DiceRoller b(std::make_shared<DefaultRandomSource>(7));
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(a.RollDie(20), b.RollDie(20));
    }
}

TEST(DefaultRandomSourceTest, NullSourceFallsBackToDefault) {
    DiceRoller dice(nullptr);
    int value = dice.RollDie(6);
    EXPECT_GE(value, 1);
    EXPECT_LE(value, 6);
}
