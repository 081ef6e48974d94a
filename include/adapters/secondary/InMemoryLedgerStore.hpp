// include/adapters/secondary/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/AccountLockTable.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "domain/EconomyErrors.hpp"
#include <map>
#include <memory>
#include <set>
#include <vector>
#include <algorithm>
#include <shared_mutex>
#include <mutex>
#include <iostream>
#include <type_traits>

namespace economy::adapters::secondary {

/**
 * @brief In-memory реализация леджера
 *
 * Используется по умолчанию (ECONOMY_STORE_BACKEND=memory) и в тестах.
 *
 * Изоляция:
 * - единица работы держит мьютексы своих аккаунтов (AccountLockTable)
 *   всё время выполнения, в каноническом порядке;
 * - записи копятся в staged-состоянии и применяются одним шагом под
 *   эксклюзивной блокировкой данных;
 * - исключение внутри work отбрасывает staged-состояние целиком.
 *
 * Время создания аккаунта берётся из тех же часов, что и у сервисов.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    explicit InMemoryLedgerStore(std::shared_ptr<ports::output::IClock> clock = std::make_shared<SystemClock>())
        : clock_(std::move(clock)) {
        std::cout << "[InMemoryLedgerStore] Created" << std::endl;
    }

    void execute(const std::vector<std::string>& accountIds,
                 const std::function<void(ports::output::ILedgerSession&)>& work) override {
        auto ordered = ports::output::canonicalLockOrder(accountIds);
        auto guards = locks_.lockAll(ordered);

        Session session(*this, std::set<std::string>(ordered.begin(), ordered.end()));
        try {
            work(session);
        } catch (const std::exception& e) {
            std::cerr << "[InMemoryLedgerStore] Unit rolled back: " << e.what() << std::endl;
            throw;
        }
        commit(session.staged());
    }

    void read(const std::function<void(ports::output::ILedgerReader&)>& work) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        View view(committed_, nullptr);
        work(view);
    }

private:
    struct State {
        std::map<std::string, domain::UserAccount> accounts;
        std::vector<domain::TransactionRecord> transactions;
        std::vector<domain::WorkRecord> workRecords;
        std::vector<domain::CheckinRecord> checkins;
        std::vector<domain::RobberyRecord> robberies;
    };

    /**
     * @brief Чтение из зафиксированного состояния поверх которого лежат staged-записи
     *
     * Блокировок не берёт: вызывающий уже держит dataMutex_.
     */
    class View : public ports::output::ILedgerReader {
    public:
        View(const State& committed, const State* staged)
            : committed_(committed), staged_(staged) {}

        std::optional<domain::UserAccount> findAccount(const std::string& userId) override {
            if (staged_) {
                auto it = staged_->accounts.find(userId);
                if (it != staged_->accounts.end()) {
                    return it->second;
                }
            }
            auto it = committed_.accounts.find(userId);
            if (it != committed_.accounts.end()) {
                return it->second;
            }
            return std::nullopt;
        }

        std::vector<domain::UserAccount> listAccounts() override {
            std::map<std::string, domain::UserAccount> merged = committed_.accounts;
            if (staged_) {
                for (const auto& [id, account] : staged_->accounts) {
                    merged[id] = account;
                }
            }
            std::vector<domain::UserAccount> result;
            result.reserve(merged.size());
            for (auto& [id, account] : merged) {
                result.push_back(std::move(account));
            }
            return result;
        }

        int64_t sumTransactions(const std::string& userId,
                                domain::TransactionType type,
                                const domain::TimeWindow& window) override {
            int64_t sum = 0;
            forEach(&State::transactions, [&](const domain::TransactionRecord& r) {
                if (r.userId == userId && r.type == type && window.contains(r.timestamp)) {
                    sum += r.amount;
                }
            });
            return sum;
        }

        int64_t countTransactions(const std::string& userId,
                                  domain::TransactionType type,
                                  const domain::TimeWindow& window) override {
            int64_t count = 0;
            forEach(&State::transactions, [&](const domain::TransactionRecord& r) {
                if (r.userId == userId && r.type == type && window.contains(r.timestamp)) {
                    ++count;
                }
            });
            return count;
        }

        int64_t countWorkRecords(const std::string& userId,
                                 const domain::TimeWindow& window) override {
            int64_t count = 0;
            forEach(&State::workRecords, [&](const domain::WorkRecord& r) {
                if (r.userId == userId && window.contains(r.timestamp)) {
                    ++count;
                }
            });
            return count;
        }

        std::optional<domain::Timestamp> lastWorkAt(const std::string& userId,
                                                    const std::string& jobName) override {
            std::optional<domain::Timestamp> last;
            forEach(&State::workRecords, [&](const domain::WorkRecord& r) {
                if (r.userId == userId && r.jobName == jobName && (!last || r.timestamp > *last)) {
                    last = r.timestamp;
                }
            });
            return last;
        }

        std::optional<domain::Timestamp> lastRobberyAt(const std::string& robberId) override {
            std::optional<domain::Timestamp> last;
            forEach(&State::robberies, [&](const domain::RobberyRecord& r) {
                if (r.robberId == robberId && (!last || r.timestamp > *last)) {
                    last = r.timestamp;
                }
            });
            return last;
        }

        std::optional<domain::CheckinRecord> findCheckin(const std::string& userId,
                                                         domain::CalendarDate date) override {
            std::optional<domain::CheckinRecord> found;
            forEach(&State::checkins, [&](const domain::CheckinRecord& r) {
                if (r.userId == userId && r.date == date) {
                    found = r;
                }
            });
            return found;
        }

        std::vector<domain::TransactionRecord> transactionsOf(const std::string& userId,
                                                              std::size_t limit) override {
            return latest(&State::transactions, limit, [&](const domain::TransactionRecord& r) {
                return r.userId == userId;
            });
        }

        std::vector<domain::WorkRecord> workRecordsOf(const std::string& userId,
                                                      std::size_t limit) override {
            return latest(&State::workRecords, limit, [&](const domain::WorkRecord& r) {
                return r.userId == userId;
            });
        }

        std::vector<domain::CheckinRecord> checkinsOf(const std::string& userId,
                                                      std::size_t limit) override {
            return latest(&State::checkins, limit, [&](const domain::CheckinRecord& r) {
                return r.userId == userId;
            });
        }

        std::vector<domain::RobberyRecord> robberiesBy(const std::string& robberId,
                                                       std::size_t limit) override {
            return latest(&State::robberies, limit, [&](const domain::RobberyRecord& r) {
                return r.robberId == robberId;
            });
        }

        std::vector<domain::RobberyRecord> robberiesAgainst(const std::string& victimId,
                                                            std::size_t limit) override {
            return latest(&State::robberies, limit, [&](const domain::RobberyRecord& r) {
                return r.victimId == victimId;
            });
        }

    private:
        const State& committed_;
        const State* staged_;

        // Сначала зафиксированные записи, затем staged: порядок добавления
        template <typename Record, typename Fn>
        void forEach(std::vector<Record> State::*log, Fn&& fn) const {
            for (const auto& r : committed_.*log) {
                fn(r);
            }
            if (staged_) {
                for (const auto& r : staged_->*log) {
                    fn(r);
                }
            }
        }

        template <typename Record, typename Pred>
        std::vector<Record> latest(std::vector<Record> State::*log, std::size_t limit, Pred&& pred) const {
            std::vector<Record> result;
            forEach(log, [&](const Record& r) {
                if (pred(r)) {
                    result.push_back(r);
                }
            });
            std::reverse(result.begin(), result.end());
            if (limit > 0 && result.size() > limit) {
                result.resize(limit);
            }
            return result;
        }
    };

    /**
     * @brief Сессия единицы работы: чтение под shared-блокировкой, запись в staged
     */
    class Session : public ports::output::ILedgerSession {
    public:
        Session(InMemoryLedgerStore& store, std::set<std::string> locked)
            : store_(store), locked_(std::move(locked)) {}

        State& staged() { return staged_; }

        std::optional<domain::UserAccount> findAccount(const std::string& userId) override {
            return withView([&](View& v) { return v.findAccount(userId); });
        }

        std::vector<domain::UserAccount> listAccounts() override {
            return withView([&](View& v) { return v.listAccounts(); });
        }

        int64_t sumTransactions(const std::string& userId,
                                domain::TransactionType type,
                                const domain::TimeWindow& window) override {
            return withView([&](View& v) { return v.sumTransactions(userId, type, window); });
        }

        int64_t countTransactions(const std::string& userId,
                                  domain::TransactionType type,
                                  const domain::TimeWindow& window) override {
            return withView([&](View& v) { return v.countTransactions(userId, type, window); });
        }

        int64_t countWorkRecords(const std::string& userId,
                                 const domain::TimeWindow& window) override {
            return withView([&](View& v) { return v.countWorkRecords(userId, window); });
        }

        std::optional<domain::Timestamp> lastWorkAt(const std::string& userId,
                                                    const std::string& jobName) override {
            return withView([&](View& v) { return v.lastWorkAt(userId, jobName); });
        }

        std::optional<domain::Timestamp> lastRobberyAt(const std::string& robberId) override {
            return withView([&](View& v) { return v.lastRobberyAt(robberId); });
        }

        std::optional<domain::CheckinRecord> findCheckin(const std::string& userId,
                                                         domain::CalendarDate date) override {
            return withView([&](View& v) { return v.findCheckin(userId, date); });
        }

        std::vector<domain::TransactionRecord> transactionsOf(const std::string& userId,
                                                              std::size_t limit) override {
            return withView([&](View& v) { return v.transactionsOf(userId, limit); });
        }

        std::vector<domain::WorkRecord> workRecordsOf(const std::string& userId,
                                                      std::size_t limit) override {
            return withView([&](View& v) { return v.workRecordsOf(userId, limit); });
        }

        std::vector<domain::CheckinRecord> checkinsOf(const std::string& userId,
                                                      std::size_t limit) override {
            return withView([&](View& v) { return v.checkinsOf(userId, limit); });
        }

        std::vector<domain::RobberyRecord> robberiesBy(const std::string& robberId,
                                                       std::size_t limit) override {
            return withView([&](View& v) { return v.robberiesBy(robberId, limit); });
        }

        std::vector<domain::RobberyRecord> robberiesAgainst(const std::string& victimId,
                                                            std::size_t limit) override {
            return withView([&](View& v) { return v.robberiesAgainst(victimId, limit); });
        }

        domain::UserAccount ensureAccount(const std::string& userId,
                                          const std::string& displayName) override {
            requireLocked(userId);

            auto existing = findAccount(userId);
            if (!existing) {
                auto created = domain::UserAccount::create(userId, displayName, store_.clock_->now());
                staged_.accounts[userId] = created;
                std::cout << "[InMemoryLedgerStore] Created account " << userId << std::endl;
                return created;
            }

            if (!displayName.empty() && existing->displayName != displayName) {
                existing->displayName = displayName;
                staged_.accounts[userId] = *existing;
            }
            return *existing;
        }

        void saveAccount(const domain::UserAccount& account) override {
            requireLocked(account.userId);

            auto before = findAccount(account.userId);
            if (!before) {
                throw domain::InvariantViolationError("saveAccount for unknown account " + account.userId);
            }
            domain::checkAccountTransition(*before, account);
            staged_.accounts[account.userId] = account;
        }

        void appendTransaction(const domain::TransactionRecord& record) override {
            requireLocked(record.userId);
            if (record.amount <= 0) {
                throw domain::InvariantViolationError("Transaction amount must be positive for " + record.userId);
            }
            staged_.transactions.push_back(record);
        }

        void appendWork(const domain::WorkRecord& record) override {
            requireLocked(record.userId);
            staged_.workRecords.push_back(record);
        }

        void appendCheckin(const domain::CheckinRecord& record) override {
            requireLocked(record.userId);
            if (findCheckin(record.userId, record.date)) {
                throw domain::InvariantViolationError("Duplicate checkin for " + record.userId
                                                      + " on " + domain::toString(record.date));
            }
            staged_.checkins.push_back(record);
        }

        void appendRobbery(const domain::RobberyRecord& record) override {
            requireLocked(record.robberId);
            requireLocked(record.victimId);
            staged_.robberies.push_back(record);
        }

    private:
        InMemoryLedgerStore& store_;
        std::set<std::string> locked_;
        State staged_;

        template <typename Fn>
        std::invoke_result_t<Fn&, View&> withView(Fn&& fn) {
            std::shared_lock<std::shared_mutex> lock(store_.dataMutex_);
            View view(store_.committed_, &staged_);
            return fn(view);
        }

        void requireLocked(const std::string& userId) const {
            if (locked_.count(userId) == 0) {
                throw domain::InvariantViolationError("Write to unlocked account " + userId);
            }
        }
    };

    void commit(State& staged) {
        std::unique_lock<std::shared_mutex> lock(dataMutex_);

        for (auto& [id, account] : staged.accounts) {
            committed_.accounts[id] = std::move(account);
        }
        for (auto& r : staged.transactions) {
            r.id = ++lastTransactionId_;
            committed_.transactions.push_back(std::move(r));
        }
        for (auto& r : staged.workRecords) {
            r.id = ++lastWorkId_;
            committed_.workRecords.push_back(std::move(r));
        }
        for (auto& r : staged.checkins) {
            r.id = ++lastCheckinId_;
            committed_.checkins.push_back(std::move(r));
        }
        for (auto& r : staged.robberies) {
            r.id = ++lastRobberyId_;
            committed_.robberies.push_back(std::move(r));
        }
    }

    std::shared_ptr<ports::output::IClock> clock_;
    AccountLockTable locks_;
    mutable std::shared_mutex dataMutex_;
    State committed_;

    int64_t lastTransactionId_ = 0;
    int64_t lastWorkId_ = 0;
    int64_t lastCheckinId_ = 0;
    int64_t lastRobberyId_ = 0;
};

} // namespace economy::adapters::secondary
