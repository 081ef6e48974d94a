/**
 * @file LevelingTest.cpp
 * @brief Тесты ступеней опыта и прогресса внутри уровня
 */

#include <gtest/gtest.h>
#include "domain/Leveling.hpp"

using namespace economy::domain;

// ============================================================================
// ТЕСТЫ: levelForExperience
// ============================================================================

TEST(LevelingTest, TierBoundaries)
{
    EXPECT_EQ(levelForExperience(0), 1);
    EXPECT_EQ(levelForExperience(99), 1);
    EXPECT_EQ(levelForExperience(100), 2);
    EXPECT_EQ(levelForExperience(499), 5);
    EXPECT_EQ(levelForExperience(500), 6);
    EXPECT_EQ(levelForExperience(699), 6);
    EXPECT_EQ(levelForExperience(700), 7);
    EXPECT_EQ(levelForExperience(1499), 10);
    EXPECT_EQ(levelForExperience(1500), 11);
    EXPECT_EQ(levelForExperience(3999), 15);
    EXPECT_EQ(levelForExperience(4000), 16);
    EXPECT_EQ(levelForExperience(5000), 17);
}

TEST(LevelingTest, NegativeExperience_IsLevelOne)
{
    EXPECT_EQ(levelForExperience(-50), 1);
}

TEST(LevelingTest, Monotonic)
{
    int previous = levelForExperience(0);
    for (int64_t exp = 1; exp <= 20000; ++exp) {
        int current = levelForExperience(exp);
        ASSERT_GE(current, previous) << "exp=" << exp;
        previous = current;
    }
}

TEST(LevelingTest, ThresholdsAgreeWithLevels)
{
    for (int64_t exp = 0; exp <= 12000; exp += 7) {
        int level = levelForExperience(exp);
        EXPECT_LE(levelThreshold(level), exp);
        EXPECT_GT(levelThreshold(level + 1), exp);
    }
}

// ============================================================================
// ТЕСТЫ: levelProgress
// ============================================================================

TEST(LevelingTest, Progress_FirstTier)
{
    auto p = levelProgress(150);

    EXPECT_EQ(p.currentLevel, 2);
    EXPECT_EQ(p.nextLevel, 3);
    EXPECT_EQ(p.progressWithinLevel, 50);
    EXPECT_EQ(p.xpNeededForNext, 50);
    EXPECT_EQ(p.xpSpanOfCurrentLevel, 100);
    EXPECT_EQ(p.percentComplete, 50);
}

TEST(LevelingTest, Progress_SecondTierSpan)
{
    auto p = levelProgress(600);

    EXPECT_EQ(p.currentLevel, 6);
    EXPECT_EQ(p.progressWithinLevel, 100);
    EXPECT_EQ(p.xpSpanOfCurrentLevel, 200);
    EXPECT_EQ(p.xpNeededForNext, 100);
    EXPECT_EQ(p.percentComplete, 50);
}

TEST(LevelingTest, Progress_AtTierEdge)
{
    // Уровень 5: последний со ступенью 100, следующий начинается с 500
    auto p = levelProgress(400);

    EXPECT_EQ(p.currentLevel, 5);
    EXPECT_EQ(p.xpSpanOfCurrentLevel, 100);
    EXPECT_EQ(p.xpNeededForNext, 100);
    EXPECT_EQ(p.percentComplete, 0);
}
