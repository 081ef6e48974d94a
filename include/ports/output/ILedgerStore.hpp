// include/ports/output/ILedgerStore.hpp
#pragma once

#include "domain/UserAccount.hpp"
#include "domain/LedgerRecords.hpp"
#include "domain/Calendar.hpp"
#include "domain/enums/TransactionType.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace economy::ports::output {

/**
 * @brief Чтение состояния леджера
 *
 * Все списки возвращаются от новых к старым. limit = 0 означает "без ограничения".
 */
class ILedgerReader {
public:
    virtual ~ILedgerReader() = default;

    virtual std::optional<domain::UserAccount> findAccount(const std::string& userId) = 0;
    virtual std::vector<domain::UserAccount> listAccounts() = 0;

    /**
     * @brief Сумма операций заданного типа в окне (например, снято сегодня)
     */
    virtual int64_t sumTransactions(const std::string& userId,
                                    domain::TransactionType type,
                                    const domain::TimeWindow& window) = 0;

    virtual int64_t countTransactions(const std::string& userId,
                                      domain::TransactionType type,
                                      const domain::TimeWindow& window) = 0;

    virtual int64_t countWorkRecords(const std::string& userId,
                                     const domain::TimeWindow& window) = 0;

    /**
     * @brief Время последней работы пользователя на конкретной работе
     */
    virtual std::optional<domain::Timestamp> lastWorkAt(const std::string& userId,
                                                        const std::string& jobName) = 0;

    /**
     * @brief Время последнего ограбления, где пользователь был грабителем
     */
    virtual std::optional<domain::Timestamp> lastRobberyAt(const std::string& robberId) = 0;

    virtual std::optional<domain::CheckinRecord> findCheckin(const std::string& userId,
                                                             domain::CalendarDate date) = 0;

    virtual std::vector<domain::TransactionRecord> transactionsOf(const std::string& userId,
                                                                  std::size_t limit) = 0;
    virtual std::vector<domain::WorkRecord> workRecordsOf(const std::string& userId,
                                                          std::size_t limit) = 0;
    virtual std::vector<domain::CheckinRecord> checkinsOf(const std::string& userId,
                                                          std::size_t limit) = 0;
    virtual std::vector<domain::RobberyRecord> robberiesBy(const std::string& robberId,
                                                           std::size_t limit) = 0;
    virtual std::vector<domain::RobberyRecord> robberiesAgainst(const std::string& victimId,
                                                                std::size_t limit) = 0;
};

/**
 * @brief Атомарная единица работы над заблокированными аккаунтами
 *
 * Читает с учётом собственных незакоммиченных записей. Изменять можно
 * только аккаунты, переданные в ILedgerStore::execute; запись в чужой
 * аккаунт: InvariantViolationError.
 */
class ILedgerSession : public ILedgerReader {
public:
    /**
     * @brief Идемпотентный upsert: вернуть аккаунт, создав его при отсутствии
     *
     * Непустое displayName, отличное от сохранённого, обновляет имя.
     */
    virtual domain::UserAccount ensureAccount(const std::string& userId,
                                              const std::string& displayName) = 0;

    /**
     * @throws domain::InvariantViolationError при нарушении инвариантов аккаунта
     */
    virtual void saveAccount(const domain::UserAccount& account) = 0;

    virtual void appendTransaction(const domain::TransactionRecord& record) = 0;
    virtual void appendWork(const domain::WorkRecord& record) = 0;
    virtual void appendCheckin(const domain::CheckinRecord& record) = 0;
    virtual void appendRobbery(const domain::RobberyRecord& record) = 0;
};

/**
 * @brief Хранилище леджера: единственный общий изменяемый ресурс
 *
 * @throws domain::StoreUnavailableError при таймауте или потере соединения
 * @throws domain::TransactionConflictError при конфликте сериализации
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Выполнить work атомарно
     *
     * Блокирует accountIds в каноническом (отсортированном) порядке,
     * затем фиксирует все записи work или ни одной (если work бросил).
     */
    virtual void execute(const std::vector<std::string>& accountIds,
                         const std::function<void(ILedgerSession&)>& work) = 0;

    /**
     * @brief Согласованный снимок только для чтения
     */
    virtual void read(const std::function<void(ILedgerReader&)>& work) = 0;
};

/**
 * @brief Канонический порядок блокировки: по возрастанию, без дублей и пустых id
 */
inline std::vector<std::string> canonicalLockOrder(std::vector<std::string> accountIds) {
    accountIds.erase(std::remove(accountIds.begin(), accountIds.end(), std::string()), accountIds.end());
    std::sort(accountIds.begin(), accountIds.end());
    accountIds.erase(std::unique(accountIds.begin(), accountIds.end()), accountIds.end());
    return accountIds;
}

} // namespace economy::ports::output
