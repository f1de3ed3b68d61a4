#include <gtest/gtest.h>
#include "DiceRoller.hpp"
#include <array>

TEST(RandomDiceRollerTest, FacesInRange) {
    RandomDiceRoller roller(42);
    for (int i = 0; i < 1000; ++i) {
        int face = roller.rollDie();
        EXPECT_GE(face, 1);
        EXPECT_LE(face, 6);
    }
}

TEST(RandomDiceRollerTest, PairsInRange) {
    RandomDiceRoller roller;
    for (int i = 0; i < 1000; ++i) {
        int total = roller.rollPair();
        EXPECT_GE(total, 2);
        EXPECT_LE(total, 12);
    }
}

TEST(RandomDiceRollerTest, SameSeedSameSequence) {
    RandomDiceRoller a(1234);
    RandomDiceRoller b(1234);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.rollPair(), b.rollPair());
    }
}

TEST(RandomDiceRollerTest, ReseedRestartsSequence) {
    RandomDiceRoller roller(99);
    std::array<int, 20> first{};
    for (auto& v : first) v = roller.rollPair();

    roller.reseed(99);
    for (int v : first) {
        EXPECT_EQ(roller.rollPair(), v);
    }
}

TEST(RandomDiceRollerTest, PairDistributionIsTriangular) {
    RandomDiceRoller roller(2024);
    std::array<int, 13> counts{};
    const int samples = 36000;
    for (int i = 0; i < samples; ++i) {
        counts[roller.rollPair()]++;
    }

    EXPECT_EQ(counts[0], 0);
    EXPECT_EQ(counts[1], 0);

    // Expected 1000 per 1/36. Generous bounds, deterministic seed.
    EXPECT_NEAR(counts[7], 6000, 400);
    EXPECT_NEAR(counts[2], 1000, 200);
    EXPECT_NEAR(counts[12], 1000, 200);
    EXPECT_GT(counts[7], counts[6]);
    EXPECT_GT(counts[7], counts[8]);
    EXPECT_GT(counts[6], counts[2]);
    EXPECT_GT(counts[8], counts[12]);
}

TEST(ScriptedDiceRollerTest, ReplaysFacesInOrder) {
    ScriptedDiceRoller roller(std::vector<int>{1, 2, 3, 4});
    EXPECT_EQ(roller.rollDie(), 1);
    EXPECT_EQ(roller.rollDie(), 2);
    EXPECT_EQ(roller.rollPair(), 3 + 4);
    EXPECT_EQ(roller.getRollCount(), 4);
}

TEST(ScriptedDiceRollerTest, WrapsAround) {
    ScriptedDiceRoller roller(std::vector<int>{6, 5});
    EXPECT_EQ(roller.rollPair(), 11);
    EXPECT_EQ(roller.rollPair(), 11);
    EXPECT_EQ(roller.rollDie(), 6);
}

TEST(ScriptedDiceRollerTest, RewindAndReplace) {
    ScriptedDiceRoller roller(std::vector<int>{2, 3, 4});
    roller.rollDie();
    roller.rollDie();
    roller.rewind();
    EXPECT_EQ(roller.getRollCount(), 0);
    EXPECT_EQ(roller.rollDie(), 2);
    EXPECT_EQ(roller.getRollCount(), 1);

    roller.setFaces({5});
    EXPECT_EQ(roller.rollPair(), 10);
}

TEST(ScriptedDiceRollerTest, EmptyScriptRollsOnes) {
    ScriptedDiceRoller roller;
    EXPECT_EQ(roller.rollPair(), 2);
}
