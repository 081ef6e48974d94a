/**
 * @file BankServiceTest.cpp
 * @brief Тесты банка: вклад, снятие, перевод, проценты, сверка журнала
 */

#include <gtest/gtest.h>
#include "application/BankService.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/FlakyLedgerStore.hpp"
#include "mocks/LedgerFixtures.hpp"
#include <algorithm>
#include <atomic>
#include <limits>
#include <thread>

using namespace economy;
using namespace economy::application;
using namespace economy::domain;
using namespace economy::tests;

// ============================================================================
// Test Fixture
// ============================================================================

class BankServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        clock_ = std::make_shared<FakeClock>();
        inner_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(clock_);
        store_ = std::make_shared<FlakyLedgerStore>(inner_);
        service_ = makeService(settings::BankRules{});
    }

    std::shared_ptr<BankService> makeService(const settings::BankRules& rules)
    {
        auto settings = std::make_shared<settings::EconomySettings>(
            settings::CheckinRules{}, settings::WorkRules{}, rules, settings::RobberyRules{});
        return std::make_shared<BankService>(store_, clock_, settings);
    }

    void seed(const std::string& userId, int64_t cash, int64_t savings)
    {
        seedAccount(*inner_, userId, [&](UserAccount& a) {
            a.cash = cash;
            a.savings = savings;
        });
    }

    std::vector<TransactionRecord> history(const std::string& userId)
    {
        return readLedger(*inner_, [&](ports::output::ILedgerReader& r) { return r.transactionsOf(userId, 0); });
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> inner_;
    std::shared_ptr<FlakyLedgerStore> store_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<BankService> service_;
};

// ============================================================================
// ТЕСТЫ: deposit
// ============================================================================

TEST_F(BankServiceTest, Deposit_MovesCashToSavings)
{
    seed("u1", 1000, 0);

    auto result = service_->deposit("u1", "Alice", 300);

    ASSERT_TRUE(result.isAccepted());
    EXPECT_EQ(result.value().newCash, 700);
    EXPECT_EQ(result.value().newSavings, 300);
    EXPECT_EQ(result.value().totalAssets(), 1000);

    auto log = history("u1");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, TransactionType::DEPOSIT);
    EXPECT_EQ(log[0].amount, 300);
    EXPECT_EQ(log[0].balanceBefore, 0);
    EXPECT_EQ(log[0].balanceAfter, 300);
}

TEST_F(BankServiceTest, Deposit_BelowMinimum_CashUnchanged)
{
    seed("u1", 50, 0);

    auto result = service_->deposit("u1", "Alice", 5);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::BELOW_MINIMUM);
    EXPECT_EQ(result.rejection().limit.value_or(-1), 10);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 5);
    EXPECT_EQ(loadAccount(*inner_, "u1").cash, 50);
    EXPECT_TRUE(history("u1").empty());
}

TEST_F(BankServiceTest, Deposit_AboveMaximum)
{
    seed("u1", 500000, 0);

    auto result = service_->deposit("u1", "Alice", 100001);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::ABOVE_MAXIMUM);
    EXPECT_EQ(result.rejection().limit.value_or(-1), 100000);
}

TEST_F(BankServiceTest, Deposit_MostNegativeAmount_ShortfallCountedFromZero)
{
    seed("u1", 50, 0);

    auto result = service_->deposit("u1", "Alice", std::numeric_limits<int64_t>::min());

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::BELOW_MINIMUM);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 10);
    EXPECT_EQ(loadAccount(*inner_, "u1").cash, 50);
    EXPECT_TRUE(history("u1").empty());
}

TEST_F(BankServiceTest, Deposit_InsufficientCash_ReportsShortfall)
{
    seed("u1", 40, 0);

    auto result = service_->deposit("u1", "Alice", 100);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::INSUFFICIENT_CASH);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 60);
}

TEST_F(BankServiceTest, Deposit_NewUserIsCreatedThenRejected)
{
    auto result = service_->deposit("fresh", "Fresh", 100);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::INSUFFICIENT_CASH);
    EXPECT_TRUE(accountExists(*inner_, "fresh"));
}

// ============================================================================
// ТЕСТЫ: withdraw
// ============================================================================

TEST_F(BankServiceTest, Withdraw_DailyLimitFromLog)
{
    settings::BankRules rules;
    rules.dailyWithdrawLimit = 500;
    service_ = makeService(rules);
    seed("u1", 0, 1000);

    auto first = service_->withdraw("u1", "Alice", 300);
    ASSERT_TRUE(first.isAccepted());
    EXPECT_EQ(first.value().withdrawnToday, 300);
    EXPECT_EQ(first.value().remainingDailyLimit, 200);

    auto second = service_->withdraw("u1", "Alice", 300);
    ASSERT_TRUE(second.isRejected());
    EXPECT_EQ(second.reason(), RejectReason::DAILY_LIMIT_EXCEEDED);
    EXPECT_EQ(second.rejection().remaining.value_or(-1), 200);
    EXPECT_EQ(second.rejection().limit.value_or(-1), 500);

    EXPECT_TRUE(service_->withdraw("u1", "Alice", 200).isAccepted());

    clock_->advance(std::chrono::hours{24});
    EXPECT_TRUE(service_->withdraw("u1", "Alice", 300).isAccepted());

    auto account = loadAccount(*inner_, "u1");
    EXPECT_EQ(account.savings, 200);
    EXPECT_EQ(account.cash, 800);
}

TEST_F(BankServiceTest, Withdraw_BelowMinimum)
{
    seed("u1", 0, 1000);

    auto result = service_->withdraw("u1", "Alice", 9);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::BELOW_MINIMUM);
    EXPECT_EQ(result.rejection().limit.value_or(-1), 10);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 1);

    auto account = loadAccount(*inner_, "u1");
    EXPECT_EQ(account.savings, 1000);
    EXPECT_EQ(account.cash, 0);
    EXPECT_TRUE(history("u1").empty());
}

TEST_F(BankServiceTest, Withdraw_AboveMaximum)
{
    seed("u1", 0, 200000);

    auto result = service_->withdraw("u1", "Alice", 50001);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::ABOVE_MAXIMUM);
    EXPECT_EQ(result.rejection().limit.value_or(-1), 50000);

    auto account = loadAccount(*inner_, "u1");
    EXPECT_EQ(account.savings, 200000);
    EXPECT_EQ(account.cash, 0);
    EXPECT_TRUE(history("u1").empty());
}

TEST_F(BankServiceTest, Withdraw_MostNegativeAmount_RejectedBelowMinimum)
{
    seed("u1", 0, 1000);

    auto result = service_->withdraw("u1", "Alice", std::numeric_limits<int64_t>::min());

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::BELOW_MINIMUM);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 10);
    EXPECT_EQ(loadAccount(*inner_, "u1").savings, 1000);
}

TEST_F(BankServiceTest, Withdraw_InsufficientSavings)
{
    seed("u1", 0, 50);

    auto result = service_->withdraw("u1", "Alice", 80);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::INSUFFICIENT_SAVINGS);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 30);
}

TEST_F(BankServiceTest, ConcurrentWithdraws_NoOverdraft)
{
    seed("u1", 0, 1000);

    constexpr int kThreads = 20;
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            if (service_->withdraw("u1", "Alice", 100).isAccepted()) {
                ++accepted;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto account = loadAccount(*inner_, "u1");
    EXPECT_EQ(accepted.load(), 10);
    EXPECT_EQ(account.savings, 1000 - 100 * accepted.load());
    EXPECT_EQ(account.savings, 0);
    EXPECT_EQ(account.cash, 1000);
}

// ============================================================================
// ТЕСТЫ: transfer
// ============================================================================

TEST_F(BankServiceTest, Transfer_MovesSavingsWithTwoRecords)
{
    seed("a", 0, 1000);
    seed("b", 0, 100);

    auto result = service_->transfer("a", "Alice", "b", 400);

    ASSERT_TRUE(result.isAccepted());
    EXPECT_EQ(result.value().fromSavings, 600);
    EXPECT_EQ(result.value().toSavings, 500);
    EXPECT_EQ(result.value().toDisplayName, "user_b");

    auto out = history("a");
    auto in = history("b");
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(in.size(), 1u);
    EXPECT_EQ(out[0].type, TransactionType::TRANSFER_OUT);
    EXPECT_EQ(in[0].type, TransactionType::TRANSFER_IN);
    EXPECT_EQ(out[0].amount, in[0].amount);
}

TEST_F(BankServiceTest, Transfer_ToSelf)
{
    seed("a", 0, 1000);

    auto result = service_->transfer("a", "Alice", "a", 100);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::SELF_TRANSFER);
}

TEST_F(BankServiceTest, Transfer_UnknownRecipientIsNotCreated)
{
    seed("a", 0, 1000);

    auto result = service_->transfer("a", "Alice", "ghost", 100);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::RECIPIENT_NOT_FOUND);
    EXPECT_FALSE(accountExists(*inner_, "ghost"));
    EXPECT_EQ(loadAccount(*inner_, "a").savings, 1000);
}

TEST_F(BankServiceTest, Transfer_BelowMinimum)
{
    seed("a", 0, 1000);
    seed("b", 0, 100);

    auto result = service_->transfer("a", "Alice", "b", 5);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::BELOW_MINIMUM);
    EXPECT_EQ(result.rejection().limit.value_or(-1), 10);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 5);
    EXPECT_EQ(loadAccount(*inner_, "a").savings, 1000);
    EXPECT_EQ(loadAccount(*inner_, "b").savings, 100);
    EXPECT_TRUE(history("a").empty());
    EXPECT_TRUE(history("b").empty());
}

TEST_F(BankServiceTest, Transfer_AboveMaximum)
{
    seed("a", 0, 500000);
    seed("b", 0, 100);

    auto result = service_->transfer("a", "Alice", "b", 100001);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::ABOVE_MAXIMUM);
    EXPECT_EQ(result.rejection().limit.value_or(-1), 100000);
    EXPECT_EQ(loadAccount(*inner_, "a").savings, 500000);
    EXPECT_EQ(loadAccount(*inner_, "b").savings, 100);
    EXPECT_TRUE(history("a").empty());
    EXPECT_TRUE(history("b").empty());
}

TEST_F(BankServiceTest, Transfer_MostNegativeAmount_RejectedBelowMinimum)
{
    seed("a", 0, 1000);
    seed("b", 0, 100);

    auto result = service_->transfer("a", "Alice", "b", std::numeric_limits<int64_t>::min());

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::BELOW_MINIMUM);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 10);
    EXPECT_EQ(loadAccount(*inner_, "a").savings, 1000);
    EXPECT_EQ(loadAccount(*inner_, "b").savings, 100);
}

TEST_F(BankServiceTest, Transfer_InsufficientSavings_NothingChanges)
{
    seed("a", 0, 60);
    seed("b", 0, 100);

    auto result = service_->transfer("a", "Alice", "b", 100);

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::INSUFFICIENT_SAVINGS);
    EXPECT_EQ(result.rejection().shortfall.value_or(-1), 40);
    EXPECT_EQ(loadAccount(*inner_, "a").savings, 60);
    EXPECT_EQ(loadAccount(*inner_, "b").savings, 100);
    EXPECT_TRUE(history("a").empty());
    EXPECT_TRUE(history("b").empty());
}

TEST_F(BankServiceTest, Transfer_StoreFailureChangesNothing)
{
    seed("a", 0, 1000);
    seed("b", 0, 0);
    store_->failNextWithUnavailable(1);

    EXPECT_THROW(service_->transfer("a", "Alice", "b", 100), StoreUnavailableError);

    EXPECT_EQ(loadAccount(*inner_, "a").savings, 1000);
    EXPECT_EQ(loadAccount(*inner_, "b").savings, 0);
    EXPECT_TRUE(history("a").empty());
    EXPECT_TRUE(history("b").empty());
}

TEST_F(BankServiceTest, Transfer_ConflictRetriedOnce)
{
    seed("a", 0, 1000);
    seed("b", 0, 0);
    store_->failNextWithConflict(1);

    EXPECT_TRUE(service_->transfer("a", "Alice", "b", 100).isAccepted());
    EXPECT_EQ(history("a").size(), 1u);
    EXPECT_EQ(loadAccount(*inner_, "b").savings, 100);
}

// ============================================================================
// ТЕСТЫ: проценты
// ============================================================================

TEST_F(BankServiceTest, Interest_BaseRate)
{
    seed("u1", 0, 1000);

    auto report = service_->accrueDailyInterest();

    EXPECT_EQ(report.processedAccounts, 1);
    EXPECT_EQ(report.totalInterest, 1);
    EXPECT_EQ(loadAccount(*inner_, "u1").savings, 1001);

    auto log = history("u1");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, TransactionType::INTEREST);
    EXPECT_EQ(log[0].balanceBefore, 1000);
    EXPECT_EQ(log[0].balanceAfter, 1001);
}

TEST_F(BankServiceTest, Interest_VipRate)
{
    seed("u1", 0, 20000);

    auto report = service_->accrueDailyInterest();

    EXPECT_EQ(report.totalInterest, 30);
    EXPECT_EQ(loadAccount(*inner_, "u1").savings, 20030);
}

TEST_F(BankServiceTest, Interest_OncePerDay)
{
    seed("u1", 0, 1000);

    service_->accrueDailyInterest();
    clock_->advance(std::chrono::hours{2});
    auto again = service_->accrueDailyInterest();

    EXPECT_EQ(again.processedAccounts, 0);
    EXPECT_EQ(again.skippedAccounts, 1);
    EXPECT_EQ(loadAccount(*inner_, "u1").savings, 1001);

    clock_->advance(std::chrono::hours{24});
    auto nextDay = service_->accrueDailyInterest();
    EXPECT_EQ(nextDay.processedAccounts, 1);
    EXPECT_EQ(loadAccount(*inner_, "u1").savings, 1002);
}

TEST_F(BankServiceTest, Interest_SkipsEmptyAndTinySavings)
{
    seed("empty", 500, 0);
    seed("tiny", 0, 5);

    auto report = service_->accrueDailyInterest();

    EXPECT_EQ(report.processedAccounts, 0);
    EXPECT_EQ(report.skippedAccounts, 1);
    EXPECT_TRUE(history("tiny").empty());
}

TEST_F(BankServiceTest, Interest_FailureOnOneAccountDoesNotStopBatch)
{
    seed("a", 0, 1000);
    seed("bad", 0, 1000);
    seed("c", 0, 2000);
    store_->failAccount("bad");

    auto report = service_->accrueDailyInterest();

    EXPECT_EQ(report.processedAccounts, 2);
    EXPECT_EQ(report.failedAccounts, 1);
    EXPECT_EQ(report.totalInterest, 3);
    EXPECT_EQ(loadAccount(*inner_, "bad").savings, 1000);
    EXPECT_EQ(loadAccount(*inner_, "c").savings, 2002);
}

// ============================================================================
// ТЕСТЫ: сверка и сводка
// ============================================================================

TEST_F(BankServiceTest, ReplayingLogReproducesSavings)
{
    seed("a", 5000, 0);
    seed("b", 0, 0);

    service_->deposit("a", "Alice", 3000);
    service_->withdraw("a", "Alice", 500);
    service_->transfer("a", "Alice", "b", 700);
    service_->accrueDailyInterest();
    service_->withdraw("b", "Bob", 100);

    for (const std::string id : {"a", "b"}) {
        auto log = history(id);
        std::reverse(log.begin(), log.end());

        int64_t replayed = 0;
        for (const auto& r : log) {
            EXPECT_EQ(r.balanceBefore, replayed) << id;
            replayed += r.savingsDelta();
            EXPECT_EQ(r.balanceAfter, replayed) << id;
        }
        EXPECT_EQ(replayed, loadAccount(*inner_, id).savings) << id;
    }
}

TEST_F(BankServiceTest, BankInfo_Summary)
{
    seed("u1", 1000, 15000);
    service_->deposit("u1", "Alice", 500);
    service_->withdraw("u1", "Alice", 200);

    auto result = service_->getBankInfo("u1");

    ASSERT_TRUE(result.isAccepted());
    const auto& info = result.value();
    EXPECT_EQ(info.savings, 15300);
    EXPECT_EQ(info.cash, 700);
    EXPECT_TRUE(info.isVip);
    EXPECT_DOUBLE_EQ(info.dailyRate, 0.0015);
    EXPECT_EQ(info.dailyInterestPreview, 22);   // floor(15300 × 0.0015)
    EXPECT_EQ(info.withdrawnToday, 200);
    EXPECT_EQ(info.remainingDailyLimit, 200000 - 200);
    EXPECT_EQ(info.totalTransactions, 2);
    EXPECT_EQ(info.totalDeposits, 500);
    EXPECT_EQ(info.totalWithdrawals, 200);
    ASSERT_EQ(info.recent.size(), 2u);
    EXPECT_EQ(info.recent[0].type, TransactionType::WITHDRAW);
}

TEST_F(BankServiceTest, BankInfo_UnknownAccount)
{
    auto result = service_->getBankInfo("ghost");

    ASSERT_TRUE(result.isRejected());
    EXPECT_EQ(result.reason(), RejectReason::ACCOUNT_NOT_FOUND);
}
