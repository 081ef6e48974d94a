/**
 * @file RobberyServiceTest.cpp
 * @brief Тесты ограблений: проверки, исходы, кулдаун, статистика
 */

#include <gtest/gtest.h>
#include "application/RobberyService.hpp"
#include "domain/Leveling.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/ScriptedRandomSource.hpp"
#include "mocks/LedgerFixtures.hpp"

using namespace economy;
using namespace economy::application;
using namespace economy::domain;
using namespace economy::tests;

// ============================================================================
// Test Fixture
// ============================================================================

class RobberyServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        clock_ = std::make_shared<FakeClock>();
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(clock_);
        random_ = std::make_shared<ScriptedRandomSource>();
        service_ = std::make_shared<RobberyService>(store_, clock_, random_, defaultSettings());
    }

    void seed(const std::string& userId, int64_t cash, int level = 1)
    {
        seedAccount(*store_, userId, [&](UserAccount& a) {
            a.cash = cash;
            a.level = level;
            a.experience = levelThreshold(level);
        });
    }

    std::vector<RobberyRecord> robberies(const std::string& robberId)
    {
        return readLedger(*store_, [&](ports::output::ILedgerReader& r) { return r.robberiesBy(robberId, 0); });
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<ScriptedRandomSource> random_;
    std::shared_ptr<RobberyService> service_;
};

// ============================================================================
// ТЕСТЫ: исходы
// ============================================================================

TEST_F(RobberyServiceTest, Success_TakesRandomAmountWithinCap)
{
    seed("robber", 0, 5);
    seed("victim", 500);
    random_->pushUnit(0.1).pushInt(220);

    auto result = service_->rob("robber", "Robin", "victim");

    ASSERT_TRUE(result.isAccepted());
    EXPECT_TRUE(result.value().success);
    EXPECT_EQ(result.value().amount, 220);
    EXPECT_EQ(result.value().robberCash, 220);
    EXPECT_EQ(result.value().victimCash, 280);

    EXPECT_EQ(loadAccount(*store_, "robber").cash, 220);
    EXPECT_EQ(loadAccount(*store_, "victim").cash, 280);

    auto log = robberies("robber");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_TRUE(log[0].success);
    EXPECT_EQ(log[0].amount, 220);
    EXPECT_EQ(log[0].victimId, "victim");

    ASSERT_EQ(random_->intRanges().size(), 1u);
    EXPECT_EQ(random_->intRanges()[0], (std::pair<int64_t, int64_t>(50, 300)));
}

TEST_F(RobberyServiceTest, Success_CapBelowMinimumTakesCapWithoutDraw)
{
    seed("robber", 0, 5);
    seed("victim", 130);
    random_->pushUnit(0.1);

    auto result = service_->rob("robber", "Robin", "victim");

    ASSERT_TRUE(result.isAccepted());
    EXPECT_EQ(result.value().amount, 30);
    EXPECT_EQ(loadAccount(*store_, "victim").cash, 100);
    EXPECT_TRUE(random_->intRanges().empty());
}

TEST_F(RobberyServiceTest, Failure_RobberPaysPenaltyToVictim)
{
    seed("robber", 500, 5);
    seed("victim", 500);
    random_->pushUnit(0.3);   // граница: успех только при < 0.30

    auto result = service_->rob("robber", "Robin", "victim");

    ASSERT_TRUE(result.isAccepted());
    EXPECT_FALSE(result.value().success);
    EXPECT_EQ(result.value().amount, 20);
    EXPECT_EQ(loadAccount(*store_, "robber").cash, 480);
    EXPECT_EQ(loadAccount(*store_, "victim").cash, 520);
    EXPECT_FALSE(robberies("robber")[0].success);
}

TEST_F(RobberyServiceTest, Failure_PenaltyLimitedByRobberCash)
{
    seed("robber", 7, 5);
    seed("victim", 500);
    random_->pushUnit(0.99);

    auto result = service_->rob("robber", "Robin", "victim");

    ASSERT_TRUE(result.isAccepted());
    EXPECT_EQ(result.value().amount, 7);
    EXPECT_EQ(loadAccount(*store_, "robber").cash, 0);
    EXPECT_EQ(loadAccount(*store_, "victim").cash, 507);
}

// ============================================================================
// ТЕСТЫ: отказы
// ============================================================================

TEST_F(RobberyServiceTest, ProtectedVictim_NothingChanges)
{
    seed("robber", 50, 5);
    seed("victim", 80);

    auto result = service_->rob("robber", "Robin", "victim");

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::VICTIM_PROTECTED);
    EXPECT_EQ(loadAccount(*store_, "robber").cash, 50);
    EXPECT_EQ(loadAccount(*store_, "victim").cash, 80);
    EXPECT_TRUE(robberies("robber").empty());
    EXPECT_EQ(random_->unitCalls(), 0);
}

TEST_F(RobberyServiceTest, SelfTarget_CheckedFirst)
{
    auto result = service_->rob("robber", "Robin", "robber");

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::SELF_TARGET);
}

TEST_F(RobberyServiceTest, LevelTooLow)
{
    seed("robber", 0, 4);
    seed("victim", 500);

    auto result = service_->rob("robber", "Robin", "victim");

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::LEVEL_TOO_LOW);
    EXPECT_EQ(result.rejection().requiredLevel.value_or(-1), 5);
    EXPECT_EQ(result.rejection().currentLevel.value_or(-1), 4);
}

TEST_F(RobberyServiceTest, UnknownVictim_NotCreated)
{
    seed("robber", 0, 5);

    auto result = service_->rob("robber", "Robin", "ghost");

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::ACCOUNT_NOT_FOUND);
    EXPECT_FALSE(accountExists(*store_, "ghost"));
}

TEST_F(RobberyServiceTest, Cooldown_FromRobberyLog)
{
    seed("robber", 500, 5);
    seed("victim", 1000);
    random_->pushUnit(0.9).pushUnit(0.9);

    ASSERT_TRUE(service_->rob("robber", "Robin", "victim").isAccepted());

    clock_->advance(std::chrono::hours{2});
    auto blocked = service_->rob("robber", "Robin", "victim");
    ASSERT_TRUE(blocked.isRejected());
    EXPECT_EQ(blocked.reason(), RejectReason::ON_COOLDOWN);
    EXPECT_EQ(blocked.rejection().remainingMinutes.value_or(-1), 240);

    clock_->advance(std::chrono::hours{4});
    EXPECT_TRUE(service_->rob("robber", "Robin", "victim").isAccepted());
}

// ============================================================================
// ТЕСТЫ: статистика и цели
// ============================================================================

TEST_F(RobberyServiceTest, Stats_DerivedFromLog)
{
    seed("robber", 500, 5);
    seed("victim", 1000, 5);
    random_->pushUnit(0.1).pushInt(100).pushUnit(0.9).pushUnit(0.1).pushInt(60);

    service_->rob("robber", "Robin", "victim");        // +100
    clock_->advance(std::chrono::hours{6});
    service_->rob("robber", "Robin", "victim");        // -20
    service_->rob("victim", "Vic", "robber");          // victim грабит robber: +60

    auto result = service_->getRobberyStats("robber");

    ASSERT_TRUE(result.isAccepted());
    const auto& stats = result.value();
    EXPECT_EQ(stats.totalRobberies, 2);
    EXPECT_EQ(stats.successfulRobberies, 1);
    EXPECT_DOUBLE_EQ(stats.successRatePercent, 50.0);
    EXPECT_EQ(stats.totalGained, 100);
    EXPECT_EQ(stats.timesRobbed, 1);
    EXPECT_EQ(stats.timesRobbedSuccessfully, 1);
    EXPECT_EQ(stats.totalLost, 60);
    EXPECT_EQ(stats.robberiesToday, 2);
    EXPECT_EQ(stats.robbedToday, 1);
    EXPECT_FALSE(stats.canRob);
    ASSERT_TRUE(stats.cooldownRemainingMinutes.has_value());
    EXPECT_EQ(*stats.cooldownRemainingMinutes, 360);
    EXPECT_EQ(stats.recentAsRobber.size(), 2u);
}

TEST_F(RobberyServiceTest, Stats_UnknownAccount)
{
    EXPECT_EQ(service_->getRobberyStats("ghost").reason(), RejectReason::ACCOUNT_NOT_FOUND);
}

TEST_F(RobberyServiceTest, Targets_RichestFirstExcludingProtectedAndSelf)
{
    seed("robber", 5000, 5);
    seed("poor", 99);
    seed("mid", 400);
    seed("rich", 900);
    seed("rich2", 900);

    auto targets = service_->getRobberyTargets("robber", 0);

    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets[0].userId, "rich");
    EXPECT_EQ(targets[1].userId, "rich2");
    EXPECT_EQ(targets[2].userId, "mid");
    EXPECT_EQ(targets[2].maxTake, 300);
    EXPECT_EQ(targets[2].minTake, 50);

    auto limited = service_->getRobberyTargets("robber", 1);
    ASSERT_EQ(limited.size(), 1u);
}
