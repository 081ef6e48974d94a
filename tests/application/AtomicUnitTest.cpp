/**
 * @file AtomicUnitTest.cpp
 * @brief Тесты повторов атомарной единицы при конфликтах хранилища
 */

#include <gtest/gtest.h>
#include "application/AtomicUnit.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "mocks/FlakyLedgerStore.hpp"
#include "mocks/LedgerFixtures.hpp"

using namespace economy;
using namespace economy::application;
using namespace economy::ports::output;
using namespace economy::tests;

class AtomicUnitTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        inner_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
        store_ = std::make_shared<FlakyLedgerStore>(inner_);
    }

    int addCash(int maxRetries)
    {
        return runAtomically(*store_, {"u1"}, maxRetries, "AtomicUnitTest",
            [](ILedgerSession& s) {
                auto a = s.ensureAccount("u1", "Alice");
                a.cash += 5;
                s.saveAccount(a);
                return static_cast<int>(a.cash);
            });
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> inner_;
    std::shared_ptr<FlakyLedgerStore> store_;
};

TEST_F(AtomicUnitTest, ConflictIsRetriedTransparently)
{
    store_->failNextWithConflict(2);

    EXPECT_EQ(addCash(3), 5);
    EXPECT_EQ(store_->executeCalls(), 3);
    EXPECT_EQ(loadAccount(*inner_, "u1").cash, 5);
}

TEST_F(AtomicUnitTest, PersistentConflict_BecomesStoreUnavailable)
{
    store_->failNextWithConflict(10);

    EXPECT_THROW(addCash(2), domain::StoreUnavailableError);
    EXPECT_EQ(store_->executeCalls(), 3);
    EXPECT_FALSE(accountExists(*inner_, "u1"));
}

TEST_F(AtomicUnitTest, StoreUnavailable_IsNotRetried)
{
    store_->failNextWithUnavailable(1);

    EXPECT_THROW(addCash(3), domain::StoreUnavailableError);
    EXPECT_EQ(store_->executeCalls(), 1);
}

TEST_F(AtomicUnitTest, ZeroRetries_FailsOnFirstConflict)
{
    store_->failNextWithConflict(1);

    EXPECT_THROW(addCash(0), domain::StoreUnavailableError);
    EXPECT_EQ(store_->executeCalls(), 1);
}

TEST_F(AtomicUnitTest, ReadSnapshotReturnsValue)
{
    seedAccount(*inner_, "u1", [](domain::UserAccount& a) { a.cash = 42; });

    auto cash = readSnapshot(*store_, [](ILedgerReader& r) {
        return r.findAccount("u1")->cash;
    });
    EXPECT_EQ(cash, 42);
}
