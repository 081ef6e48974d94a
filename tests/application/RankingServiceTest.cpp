/**
 * @file RankingServiceTest.cpp
 * @brief Тесты рейтингов
 */

#include <gtest/gtest.h>
#include "application/RankingService.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "mocks/LedgerFixtures.hpp"

using namespace economy;
using namespace economy::application;
using namespace economy::domain;
using namespace economy::tests;

class RankingServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
        service_ = std::make_shared<RankingService>(store_);

        seed("alice", 300, 700, 1000, 350, 4);
        seed("bob", 900, 0, 900, 350, 2);
        seed("carol", 500, 500, 1500, 120, 9);
        seed("dave", 0, 0, 0, 0, 0);
    }

    void seed(const std::string& id, int64_t cash, int64_t savings,
              int64_t earned, int64_t exp, int64_t checkins)
    {
        seedAccount(*store_, id, [&](UserAccount& a) {
            a.cash = cash;
            a.savings = savings;
            a.totalEarned = earned;
            a.experience = exp;
            a.level = levelForExperience(exp);
            a.totalCheckins = checkins;
        });
    }

    static std::vector<std::string> ids(const Leaderboard& board)
    {
        std::vector<std::string> result;
        for (const auto& e : board.entries) {
            result.push_back(e.userId);
        }
        return result;
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<RankingService> service_;
};

// ============================================================================
// ТЕСТЫ: topN
// ============================================================================

TEST_F(RankingServiceTest, TopN_TotalAssets_TiesBrokenByUserId)
{
    auto board = service_->topN(RankingMetric::TOTAL_ASSETS, 10);

    EXPECT_EQ(board.totalAccounts, 4);
    EXPECT_EQ(ids(board), (std::vector<std::string>{"alice", "carol", "bob"}));
    EXPECT_EQ(board.entries[0].value, 1000);
    EXPECT_EQ(board.entries[0].rank, 1);
    EXPECT_EQ(board.entries[2].rank, 3);
}

TEST_F(RankingServiceTest, TopN_ExcludesNonPositiveValues)
{
    auto board = service_->topN(RankingMetric::CASH, 10);

    EXPECT_EQ(ids(board), (std::vector<std::string>{"bob", "carol", "alice"}));
}

TEST_F(RankingServiceTest, TopN_RespectsLimit)
{
    auto board = service_->topN(RankingMetric::TOTAL_EARNED, 2);

    EXPECT_EQ(ids(board), (std::vector<std::string>{"carol", "alice"}));
}

TEST_F(RankingServiceTest, TopN_ZeroLimitIsEmpty)
{
    EXPECT_TRUE(service_->topN(RankingMetric::CASH, 0).entries.empty());
}

TEST_F(RankingServiceTest, TopN_ExperienceOrderedByLevelThenExperience)
{
    auto board = service_->topN(RankingMetric::EXPERIENCE, 10);

    EXPECT_EQ(ids(board), (std::vector<std::string>{"alice", "bob", "carol"}));
    EXPECT_EQ(board.entries[0].level, 4);
    EXPECT_EQ(board.entries[0].value, 350);
}

TEST_F(RankingServiceTest, TopN_Checkins)
{
    auto board = service_->topN(RankingMetric::TOTAL_CHECKINS, 10);

    EXPECT_EQ(ids(board), (std::vector<std::string>{"carol", "alice", "bob"}));
    EXPECT_EQ(board.entries[0].totalCheckins, 9);
}

// ============================================================================
// ТЕСТЫ: rank
// ============================================================================

TEST_F(RankingServiceTest, Rank_CountsStrictlyGreater)
{
    auto result = service_->rank("carol", RankingMetric::TOTAL_ASSETS);

    ASSERT_TRUE(result.isAccepted());
    EXPECT_EQ(result.value().rank, 1);
    EXPECT_EQ(result.value().value, 1000);
    EXPECT_EQ(result.value().totalAccounts, 4);

    EXPECT_EQ(service_->rank("alice", RankingMetric::TOTAL_ASSETS).value().rank, 1);
    EXPECT_EQ(service_->rank("bob", RankingMetric::TOTAL_ASSETS).value().rank, 3);
    EXPECT_EQ(service_->rank("dave", RankingMetric::TOTAL_ASSETS).value().rank, 4);
}

TEST_F(RankingServiceTest, Rank_UnknownUser)
{
    auto result = service_->rank("ghost", RankingMetric::CASH);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::ACCOUNT_NOT_FOUND);
}

TEST_F(RankingServiceTest, EmptyStore)
{
    auto empty = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
    RankingService service(empty);

    auto board = service.topN(RankingMetric::CASH, 10);
    EXPECT_TRUE(board.entries.empty());
    EXPECT_EQ(board.totalAccounts, 0);
}
