// include/adapters/secondary/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include "domain/EconomyErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <set>
#include <iostream>

namespace economy::adapters::secondary {

/**
 * @brief Чтение леджера из PostgreSQL в рамках открытой транзакции
 *
 * Шаблон, чтобы одна реализация запросов служила и снимку (ILedgerReader),
 * и сессии записи (ILedgerSession).
 *
 * Время хранится в TIMESTAMPTZ, наружу отдаётся в миллисекундах от эпохи.
 */
template <typename Base>
class PostgresLedgerReader : public Base {
public:
    explicit PostgresLedgerReader(pqxx::transaction_base& txn) : txn_(txn) {}

    std::optional<domain::UserAccount> findAccount(const std::string& userId) override {
        auto result = txn_.exec_params(
            std::string(kAccountColumns) + " FROM users WHERE user_id = $1",
            userId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return toAccount(result[0]);
    }

    std::vector<domain::UserAccount> listAccounts() override {
        auto result = txn_.exec(std::string(kAccountColumns) + " FROM users ORDER BY user_id");
        std::vector<domain::UserAccount> accounts;
        accounts.reserve(result.size());
        for (const auto& row : result) {
            accounts.push_back(toAccount(row));
        }
        return accounts;
    }

    int64_t sumTransactions(const std::string& userId,
                            domain::TransactionType type,
                            const domain::TimeWindow& window) override {
        auto result = txn_.exec_params(
            "SELECT COALESCE(SUM(amount), 0) AS total FROM bank_transactions "
            "WHERE user_id = $1 AND transaction_type = $2 "
            "AND created_at >= to_timestamp($3::double precision / 1000.0) "
            "AND created_at < to_timestamp($4::double precision / 1000.0)",
            userId, domain::toString(type), window.from.toMillis(), window.to.toMillis()
        );
        return result[0]["total"].as<int64_t>();
    }

    int64_t countTransactions(const std::string& userId,
                              domain::TransactionType type,
                              const domain::TimeWindow& window) override {
        auto result = txn_.exec_params(
            "SELECT COUNT(*) AS cnt FROM bank_transactions "
            "WHERE user_id = $1 AND transaction_type = $2 "
            "AND created_at >= to_timestamp($3::double precision / 1000.0) "
            "AND created_at < to_timestamp($4::double precision / 1000.0)",
            userId, domain::toString(type), window.from.toMillis(), window.to.toMillis()
        );
        return result[0]["cnt"].as<int64_t>();
    }

    int64_t countWorkRecords(const std::string& userId,
                             const domain::TimeWindow& window) override {
        auto result = txn_.exec_params(
            "SELECT COUNT(*) AS cnt FROM work_records "
            "WHERE user_id = $1 "
            "AND work_time >= to_timestamp($2::double precision / 1000.0) "
            "AND work_time < to_timestamp($3::double precision / 1000.0)",
            userId, window.from.toMillis(), window.to.toMillis()
        );
        return result[0]["cnt"].as<int64_t>();
    }

    std::optional<domain::Timestamp> lastWorkAt(const std::string& userId,
                                                const std::string& jobName) override {
        auto result = txn_.exec_params(
            "SELECT (EXTRACT(EPOCH FROM MAX(work_time)) * 1000)::BIGINT AS last_ms "
            "FROM work_records WHERE user_id = $1 AND work_type = $2",
            userId, jobName
        );
        if (result[0]["last_ms"].is_null()) {
            return std::nullopt;
        }
        return domain::Timestamp::fromMillis(result[0]["last_ms"].as<int64_t>());
    }

    std::optional<domain::Timestamp> lastRobberyAt(const std::string& robberId) override {
        auto result = txn_.exec_params(
            "SELECT (EXTRACT(EPOCH FROM MAX(created_at)) * 1000)::BIGINT AS last_ms "
            "FROM robbery_records WHERE robber_id = $1",
            robberId
        );
        if (result[0]["last_ms"].is_null()) {
            return std::nullopt;
        }
        return domain::Timestamp::fromMillis(result[0]["last_ms"].as<int64_t>());
    }

    std::optional<domain::CheckinRecord> findCheckin(const std::string& userId,
                                                     domain::CalendarDate date) override {
        auto result = txn_.exec_params(
            std::string(kCheckinColumns) + " FROM checkin_records "
            "WHERE user_id = $1 AND checkin_date = $2::date",
            userId, domain::toString(date)
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return toCheckin(result[0]);
    }

    std::vector<domain::TransactionRecord> transactionsOf(const std::string& userId,
                                                          std::size_t limit) override {
        auto result = txn_.exec_params(
            "SELECT id, user_id, transaction_type, amount, balance_before, balance_after, "
            "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS ts_ms "
            "FROM bank_transactions WHERE user_id = $1 "
            "ORDER BY created_at DESC, id DESC LIMIT $2",
            userId, limitParam(limit)
        );
        std::vector<domain::TransactionRecord> records;
        for (const auto& row : result) {
            domain::TransactionRecord r;
            r.id = row["id"].as<int64_t>();
            r.userId = row["user_id"].as<std::string>();
            r.type = domain::parseTransactionType(row["transaction_type"].as<std::string>());
            r.amount = row["amount"].as<int64_t>();
            r.balanceBefore = row["balance_before"].as<int64_t>();
            r.balanceAfter = row["balance_after"].as<int64_t>();
            r.timestamp = domain::Timestamp::fromMillis(row["ts_ms"].as<int64_t>());
            records.push_back(std::move(r));
        }
        return records;
    }

    std::vector<domain::WorkRecord> workRecordsOf(const std::string& userId,
                                                  std::size_t limit) override {
        auto result = txn_.exec_params(
            "SELECT id, user_id, work_type, base_salary, bonus, total_earned, "
            "(EXTRACT(EPOCH FROM work_time) * 1000)::BIGINT AS ts_ms "
            "FROM work_records WHERE user_id = $1 "
            "ORDER BY work_time DESC, id DESC LIMIT $2",
            userId, limitParam(limit)
        );
        std::vector<domain::WorkRecord> records;
        for (const auto& row : result) {
            domain::WorkRecord r;
            r.id = row["id"].as<int64_t>();
            r.userId = row["user_id"].as<std::string>();
            r.jobName = row["work_type"].as<std::string>();
            r.baseSalary = row["base_salary"].as<int64_t>();
            r.bonus = row["bonus"].as<int64_t>();
            r.totalEarned = row["total_earned"].as<int64_t>();
            r.timestamp = domain::Timestamp::fromMillis(row["ts_ms"].as<int64_t>());
            records.push_back(std::move(r));
        }
        return records;
    }

    std::vector<domain::CheckinRecord> checkinsOf(const std::string& userId,
                                                  std::size_t limit) override {
        auto result = txn_.exec_params(
            std::string(kCheckinColumns) + " FROM checkin_records WHERE user_id = $1 "
            "ORDER BY checkin_date DESC, id DESC LIMIT $2",
            userId, limitParam(limit)
        );
        std::vector<domain::CheckinRecord> records;
        for (const auto& row : result) {
            records.push_back(toCheckin(row));
        }
        return records;
    }

    std::vector<domain::RobberyRecord> robberiesBy(const std::string& robberId,
                                                   std::size_t limit) override {
        return robberies("robber_id", robberId, limit);
    }

    std::vector<domain::RobberyRecord> robberiesAgainst(const std::string& victimId,
                                                        std::size_t limit) override {
        return robberies("victim_id", victimId, limit);
    }

protected:
    pqxx::transaction_base& txn_;

    static constexpr const char* kAccountColumns =
        "SELECT user_id, username, money, bank_money, total_earned, level, exp, "
        "last_checkin::text AS last_checkin, checkin_streak, total_checkin, "
        "(EXTRACT(EPOCH FROM last_work_time) * 1000)::BIGINT AS last_work_ms, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms, "
        "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms";

    static constexpr const char* kCheckinColumns =
        "SELECT id, user_id, checkin_date::text AS checkin_date, reward_money, consecutive_days, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS ts_ms";

    static std::optional<int64_t> limitParam(std::size_t limit) {
        // LIMIT NULL в PostgreSQL означает "без ограничения"
        if (limit == 0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(limit);
    }

    static domain::UserAccount toAccount(const pqxx::row& row) {
        domain::UserAccount account;
        account.userId = row["user_id"].as<std::string>();
        account.displayName = row["username"].as<std::string>();
        account.cash = row["money"].as<int64_t>();
        account.savings = row["bank_money"].as<int64_t>();
        account.totalEarned = row["total_earned"].as<int64_t>();
        account.level = row["level"].as<int>();
        account.experience = row["exp"].as<int64_t>();
        if (!row["last_checkin"].is_null()) {
            account.lastCheckinDate = domain::parseCalendarDate(row["last_checkin"].as<std::string>());
        }
        account.checkinStreak = row["checkin_streak"].as<int>();
        account.totalCheckins = row["total_checkin"].as<int64_t>();
        if (!row["last_work_ms"].is_null()) {
            account.lastWorkTime = domain::Timestamp::fromMillis(row["last_work_ms"].as<int64_t>());
        }
        account.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        account.updatedAt = domain::Timestamp::fromMillis(row["updated_ms"].as<int64_t>());
        return account;
    }

    static domain::CheckinRecord toCheckin(const pqxx::row& row) {
        domain::CheckinRecord r;
        r.id = row["id"].as<int64_t>();
        r.userId = row["user_id"].as<std::string>();
        r.date = domain::parseCalendarDate(row["checkin_date"].as<std::string>());
        r.rewardAmount = row["reward_money"].as<int64_t>();
        r.consecutiveDays = row["consecutive_days"].as<int>();
        r.timestamp = domain::Timestamp::fromMillis(row["ts_ms"].as<int64_t>());
        return r;
    }

    std::vector<domain::RobberyRecord> robberies(const std::string& column,
                                                 const std::string& userId,
                                                 std::size_t limit) {
        auto result = txn_.exec_params(
            "SELECT id, robber_id, victim_id, amount, success, COALESCE(result_message, '') AS result_message, "
            "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS ts_ms "
            "FROM robbery_records WHERE " + column + " = $1 "
            "ORDER BY created_at DESC, id DESC LIMIT $2",
            userId, limitParam(limit)
        );
        std::vector<domain::RobberyRecord> records;
        for (const auto& row : result) {
            domain::RobberyRecord r;
            r.id = row["id"].as<int64_t>();
            r.robberId = row["robber_id"].as<std::string>();
            r.victimId = row["victim_id"].as<std::string>();
            r.amount = row["amount"].as<int64_t>();
            r.success = row["success"].as<bool>();
            r.resultMessage = row["result_message"].as<std::string>();
            r.timestamp = domain::Timestamp::fromMillis(row["ts_ms"].as<int64_t>());
            records.push_back(std::move(r));
        }
        return records;
    }
};

/**
 * @brief Сессия записи: все изменения идут в одну pqxx::work
 */
class PostgresLedgerSession : public PostgresLedgerReader<ports::output::ILedgerSession> {
public:
    PostgresLedgerSession(pqxx::work& txn, std::set<std::string> locked)
        : PostgresLedgerReader<ports::output::ILedgerSession>(txn)
        , locked_(std::move(locked))
    {}

    domain::UserAccount ensureAccount(const std::string& userId,
                                      const std::string& displayName) override {
        requireLocked(userId);

        auto inserted = txn_.exec_params(
            "INSERT INTO users (user_id, username) VALUES ($1, $2) "
            "ON CONFLICT (user_id) DO NOTHING RETURNING user_id",
            userId, displayName
        );
        if (!inserted.empty()) {
            std::cout << "[PostgresLedgerStore] Created account " << userId << std::endl;
        } else if (!displayName.empty()) {
            txn_.exec_params(
                "UPDATE users SET username = $2, updated_at = NOW() "
                "WHERE user_id = $1 AND username <> $2",
                userId, displayName
            );
        }

        auto account = findAccount(userId);
        if (!account) {
            throw domain::InvariantViolationError("Account " + userId + " missing after upsert");
        }
        return *account;
    }

    void saveAccount(const domain::UserAccount& account) override {
        requireLocked(account.userId);

        auto before = findAccount(account.userId);
        if (!before) {
            throw domain::InvariantViolationError("saveAccount for unknown account " + account.userId);
        }
        domain::checkAccountTransition(*before, account);

        std::optional<std::string> lastCheckin;
        if (account.lastCheckinDate) {
            lastCheckin = domain::toString(*account.lastCheckinDate);
        }
        std::optional<int64_t> lastWorkMs;
        if (account.lastWorkTime) {
            lastWorkMs = account.lastWorkTime->toMillis();
        }

        txn_.exec_params(
            "UPDATE users SET username = $2, money = $3, bank_money = $4, total_earned = $5, "
            "level = $6, exp = $7, last_checkin = $8::date, checkin_streak = $9, total_checkin = $10, "
            "last_work_time = to_timestamp($11::double precision / 1000.0), "
            "updated_at = to_timestamp($12::double precision / 1000.0) "
            "WHERE user_id = $1",
            account.userId,
            account.displayName,
            account.cash,
            account.savings,
            account.totalEarned,
            account.level,
            account.experience,
            lastCheckin,
            account.checkinStreak,
            account.totalCheckins,
            lastWorkMs,
            account.updatedAt.toMillis()
        );
    }

    void appendTransaction(const domain::TransactionRecord& record) override {
        requireLocked(record.userId);
        if (record.amount <= 0) {
            throw domain::InvariantViolationError("Transaction amount must be positive for " + record.userId);
        }
        txn_.exec_params(
            "INSERT INTO bank_transactions "
            "(user_id, transaction_type, amount, balance_before, balance_after, created_at) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6::double precision / 1000.0))",
            record.userId,
            domain::toString(record.type),
            record.amount,
            record.balanceBefore,
            record.balanceAfter,
            record.timestamp.toMillis()
        );
    }

    void appendWork(const domain::WorkRecord& record) override {
        requireLocked(record.userId);
        txn_.exec_params(
            "INSERT INTO work_records (user_id, work_type, base_salary, bonus, total_earned, work_time) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6::double precision / 1000.0))",
            record.userId,
            record.jobName,
            record.baseSalary,
            record.bonus,
            record.totalEarned,
            record.timestamp.toMillis()
        );
    }

    void appendCheckin(const domain::CheckinRecord& record) override {
        requireLocked(record.userId);
        try {
            txn_.exec_params(
                "INSERT INTO checkin_records (user_id, checkin_date, reward_money, consecutive_days, created_at) "
                "VALUES ($1, $2::date, $3, $4, to_timestamp($5::double precision / 1000.0))",
                record.userId,
                domain::toString(record.date),
                record.rewardAmount,
                record.consecutiveDays,
                record.timestamp.toMillis()
            );
        } catch (const pqxx::unique_violation&) {
            throw domain::InvariantViolationError("Duplicate checkin for " + record.userId
                                                  + " on " + domain::toString(record.date));
        }
    }

    void appendRobbery(const domain::RobberyRecord& record) override {
        requireLocked(record.robberId);
        requireLocked(record.victimId);
        txn_.exec_params(
            "INSERT INTO robbery_records (robber_id, victim_id, amount, success, result_message, created_at) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6::double precision / 1000.0))",
            record.robberId,
            record.victimId,
            record.amount,
            record.success,
            record.resultMessage,
            record.timestamp.toMillis()
        );
    }

private:
    std::set<std::string> locked_;

    void requireLocked(const std::string& userId) const {
        if (locked_.count(userId) == 0) {
            throw domain::InvariantViolationError("Write to unlocked account " + userId);
        }
    }
};

/**
 * @brief PostgreSQL реализация леджера
 *
 * Таблицы (имена колонок как у чат-плагина):
 * - users: user_id TEXT PRIMARY KEY, username, money, bank_money, total_earned,
 *   level, exp, last_checkin DATE, checkin_streak, total_checkin, last_work_time,
 *   created_at, updated_at
 * - bank_transactions, work_records, checkin_records (UNIQUE user_id + checkin_date),
 *   robbery_records: только добавление
 *
 * Единица работы = одна pqxx::work:
 * - SET LOCAL statement_timeout
 * - pg_advisory_xact_lock(hashtext(user_id)) по каждому id в каноническом порядке
 * - commit в конце, откат при любом исключении
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void execute(const std::vector<std::string>& accountIds,
                 const std::function<void(ports::output::ILedgerSession&)>& work) override {
        auto ordered = ports::output::canonicalLockOrder(accountIds);
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));
            for (const auto& id : ordered) {
                txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", id);
            }

            PostgresLedgerSession session(txn, std::set<std::string>(ordered.begin(), ordered.end()));
            work(session);

            txn.commit();

        } catch (const pqxx::serialization_failure& e) {
            std::cerr << "[PostgresLedgerStore] Serialization failure: " << e.what() << std::endl;
            throw domain::TransactionConflictError(e.what());
        } catch (const pqxx::deadlock_detected& e) {
            std::cerr << "[PostgresLedgerStore] Deadlock detected: " << e.what() << std::endl;
            throw domain::TransactionConflictError(e.what());
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLedgerStore] Connection lost: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const pqxx::query_canceled& e) {
            std::cerr << "[PostgresLedgerStore] Statement timeout: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] execute error: " << e.what() << std::endl;
            throw;
        }
    }

    void read(const std::function<void(ports::output::ILedgerReader&)>& work) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::transaction<pqxx::isolation_level::repeatable_read, pqxx::write_policy::read_only> txn(conn);

            txn.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));

            PostgresLedgerReader<ports::output::ILedgerReader> reader(txn);
            work(reader);

            txn.commit();

        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLedgerStore] Connection lost: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const pqxx::query_canceled& e) {
            std::cerr << "[PostgresLedgerStore] Statement timeout: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] read error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS users (
                    user_id TEXT PRIMARY KEY,
                    username TEXT NOT NULL,
                    money BIGINT NOT NULL DEFAULT 0 CHECK (money >= 0),
                    bank_money BIGINT NOT NULL DEFAULT 0 CHECK (bank_money >= 0),
                    total_earned BIGINT NOT NULL DEFAULT 0,
                    level INTEGER NOT NULL DEFAULT 1,
                    exp BIGINT NOT NULL DEFAULT 0,
                    last_checkin DATE,
                    checkin_streak INTEGER NOT NULL DEFAULT 0,
                    total_checkin BIGINT NOT NULL DEFAULT 0,
                    last_work_time TIMESTAMPTZ,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS bank_transactions (
                    id BIGSERIAL PRIMARY KEY,
                    user_id TEXT NOT NULL REFERENCES users(user_id),
                    transaction_type TEXT NOT NULL,
                    amount BIGINT NOT NULL CHECK (amount > 0),
                    balance_before BIGINT NOT NULL,
                    balance_after BIGINT NOT NULL,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS work_records (
                    id BIGSERIAL PRIMARY KEY,
                    user_id TEXT NOT NULL REFERENCES users(user_id),
                    work_type TEXT NOT NULL,
                    base_salary BIGINT NOT NULL,
                    bonus BIGINT NOT NULL DEFAULT 0,
                    total_earned BIGINT NOT NULL,
                    work_time TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS checkin_records (
                    id BIGSERIAL PRIMARY KEY,
                    user_id TEXT NOT NULL REFERENCES users(user_id),
                    checkin_date DATE NOT NULL,
                    reward_money BIGINT NOT NULL,
                    consecutive_days INTEGER NOT NULL,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    UNIQUE (user_id, checkin_date)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS robbery_records (
                    id BIGSERIAL PRIMARY KEY,
                    robber_id TEXT NOT NULL REFERENCES users(user_id),
                    victim_id TEXT NOT NULL REFERENCES users(user_id),
                    amount BIGINT NOT NULL,
                    success BOOLEAN NOT NULL,
                    result_message TEXT,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_users_money ON users(money DESC)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_bank_transactions_user_time ON bank_transactions(user_id, created_at)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_work_records_user_time ON work_records(user_id, work_time)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_robbery_records_robber_time ON robbery_records(robber_id, created_at)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_robbery_records_victim_time ON robbery_records(victim_id, created_at)");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLedgerStore] initSchema: connection failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace economy::adapters::secondary
