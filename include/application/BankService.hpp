// include/application/BankService.hpp
#pragma once

#include "ports/input/IBankService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IClock.hpp"
#include "settings/EconomySettings.hpp"
#include "application/AtomicUnit.hpp"
#include "domain/Calendar.hpp"
#include <memory>
#include <cmath>
#include <algorithm>
#include <iostream>

namespace economy::application {

/**
 * @brief Банк
 *
 * Каждое изменение вклада пишется вместе с записью bank_transactions в одной
 * единице работы, поэтому savings всегда восстанавливается проигрыванием журнала.
 *
 * Дневной лимит снятия считается суммой сегодняшних записей withdraw,
 * отдельного счётчика нет.
 */
class BankService : public ports::input::IBankService {
public:
    BankService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::EconomySettings> settings
    ) : store_(std::move(store))
      , clock_(std::move(clock))
      , rules_(settings->getBankRules())
      , dayOffset_(settings->getDayOffset())
      , maxRetries_(settings->getStoreMaxRetries())
    {
        std::cout << "[BankService] Created" << std::endl;
    }

    domain::ActionResult<domain::BankReceipt> deposit(
        const std::string& userId,
        const std::string& displayName,
        int64_t amount) override
    {
        using Result = domain::ActionResult<domain::BankReceipt>;

        return runAtomically(*store_, {userId}, maxRetries_, "BankService",
            [&](ports::output::ILedgerSession& session) -> Result {
                auto now = clock_->now();
                auto account = session.ensureAccount(userId, displayName);

                if (auto rejection = checkBounds(amount, rules_.minDeposit, rules_.maxDeposit, "Deposit")) {
                    return Result::rejected(*rejection);
                }
                if (amount > account.cash) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::INSUFFICIENT_CASH,
                        "Not enough cash: have " + std::to_string(account.cash))
                        .withShortfall(amount - account.cash));
                }

                int64_t before = account.savings;
                account.cash -= amount;
                account.savings += amount;
                account.updatedAt = now;
                session.saveAccount(account);
                session.appendTransaction(makeRecord(userId, domain::TransactionType::DEPOSIT,
                                                     amount, before, account.savings, now));

                std::cout << "[BankService] " << userId << " deposited " << amount << std::endl;

                domain::BankReceipt receipt;
                receipt.type = domain::TransactionType::DEPOSIT;
                receipt.amount = amount;
                receipt.newCash = account.cash;
                receipt.newSavings = account.savings;
                return Result::accepted(receipt);
            });
    }

    domain::ActionResult<domain::BankReceipt> withdraw(
        const std::string& userId,
        const std::string& displayName,
        int64_t amount) override
    {
        using Result = domain::ActionResult<domain::BankReceipt>;

        return runAtomically(*store_, {userId}, maxRetries_, "BankService",
            [&](ports::output::ILedgerSession& session) -> Result {
                auto now = clock_->now();
                auto account = session.ensureAccount(userId, displayName);

                if (auto rejection = checkBounds(amount, rules_.minWithdraw, rules_.maxWithdraw, "Withdraw")) {
                    return Result::rejected(*rejection);
                }

                int64_t withdrawnToday = session.sumTransactions(
                    userId, domain::TransactionType::WITHDRAW, domain::dayWindowOf(now, dayOffset_));
                if (withdrawnToday + amount > rules_.dailyWithdrawLimit) {
                    int64_t remaining = std::max<int64_t>(0, rules_.dailyWithdrawLimit - withdrawnToday);
                    std::cout << "[BankService] REJECTED: " << userId << " daily withdraw limit, remaining "
                              << remaining << std::endl;
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::DAILY_LIMIT_EXCEEDED,
                        "Daily withdraw limit exceeded, remaining " + std::to_string(remaining))
                        .withLimit(rules_.dailyWithdrawLimit)
                        .withRemaining(remaining));
                }

                if (amount > account.savings) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::INSUFFICIENT_SAVINGS,
                        "Not enough savings: have " + std::to_string(account.savings))
                        .withShortfall(amount - account.savings));
                }

                int64_t before = account.savings;
                account.savings -= amount;
                account.cash += amount;
                account.updatedAt = now;
                session.saveAccount(account);
                session.appendTransaction(makeRecord(userId, domain::TransactionType::WITHDRAW,
                                                     amount, before, account.savings, now));

                std::cout << "[BankService] " << userId << " withdrew " << amount << std::endl;

                domain::BankReceipt receipt;
                receipt.type = domain::TransactionType::WITHDRAW;
                receipt.amount = amount;
                receipt.newCash = account.cash;
                receipt.newSavings = account.savings;
                receipt.withdrawnToday = withdrawnToday + amount;
                receipt.remainingDailyLimit = rules_.dailyWithdrawLimit - receipt.withdrawnToday;
                return Result::accepted(receipt);
            });
    }

    domain::ActionResult<domain::TransferReceipt> transfer(
        const std::string& fromUserId,
        const std::string& fromDisplayName,
        const std::string& toUserId,
        int64_t amount) override
    {
        using Result = domain::ActionResult<domain::TransferReceipt>;

        return runAtomically(*store_, {fromUserId, toUserId}, maxRetries_, "BankService",
            [&](ports::output::ILedgerSession& session) -> Result {
                auto now = clock_->now();
                auto from = session.ensureAccount(fromUserId, fromDisplayName);

                if (fromUserId == toUserId) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::SELF_TRANSFER,
                        "Cannot transfer to yourself"));
                }
                if (auto rejection = checkBounds(amount, rules_.minDeposit, rules_.maxDeposit, "Transfer")) {
                    return Result::rejected(*rejection);
                }
                if (amount > from.savings) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::INSUFFICIENT_SAVINGS,
                        "Not enough savings: have " + std::to_string(from.savings))
                        .withShortfall(amount - from.savings));
                }

                auto to = session.findAccount(toUserId);
                if (!to) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::RECIPIENT_NOT_FOUND,
                        "Recipient not found: " + toUserId));
                }

                int64_t fromBefore = from.savings;
                int64_t toBefore = to->savings;

                from.savings -= amount;
                from.updatedAt = now;
                to->savings += amount;
                to->updatedAt = now;

                session.saveAccount(from);
                session.saveAccount(*to);
                session.appendTransaction(makeRecord(fromUserId, domain::TransactionType::TRANSFER_OUT,
                                                     amount, fromBefore, from.savings, now));
                session.appendTransaction(makeRecord(toUserId, domain::TransactionType::TRANSFER_IN,
                                                     amount, toBefore, to->savings, now));

                std::cout << "[BankService] Transfer " << amount << " from " << fromUserId
                          << " to " << toUserId << std::endl;

                domain::TransferReceipt receipt;
                receipt.fromUserId = fromUserId;
                receipt.toUserId = toUserId;
                receipt.toDisplayName = to->displayName;
                receipt.amount = amount;
                receipt.fromSavings = from.savings;
                receipt.toSavings = to->savings;
                return Result::accepted(receipt);
            });
    }

    /**
     * @brief Пакетное начисление процентов
     *
     * Список кандидатов берётся из снимка, затем каждый аккаунт обрабатывается
     * отдельной единицей работы с повторной проверкой внутри неё:
     * - вклад всё ещё положительный;
     * - запись interest за сегодня ещё не сделана (маркер идемпотентности).
     *
     * Ошибка на одном аккаунте логируется и учитывается в failedAccounts,
     * остальные аккаунты обрабатываются дальше.
     */
    domain::InterestReport accrueDailyInterest() override {
        auto accounts = readSnapshot(*store_, [](ports::output::ILedgerReader& reader) {
            return reader.listAccounts();
        });

        std::cout << "[BankService] Interest accrual started, " << accounts.size() << " accounts" << std::endl;

        domain::InterestReport report;
        for (const auto& candidate : accounts) {
            if (candidate.savings <= 0) {
                continue;
            }
            try {
                auto interest = accrueFor(candidate.userId);
                if (interest) {
                    report.processedAccounts++;
                    report.totalInterest += *interest;
                } else {
                    report.skippedAccounts++;
                }
            } catch (const std::exception& e) {
                std::cerr << "[BankService] Interest accrual failed for " << candidate.userId
                          << ": " << e.what() << std::endl;
                report.failedAccounts++;
            }
        }

        std::cout << "[BankService] Interest accrual done: processed=" << report.processedAccounts
                  << " skipped=" << report.skippedAccounts
                  << " failed=" << report.failedAccounts
                  << " total=" << report.totalInterest << std::endl;
        return report;
    }

    domain::ActionResult<domain::BankInfo> getBankInfo(const std::string& userId) override {
        using Result = domain::ActionResult<domain::BankInfo>;

        auto now = clock_->now();
        auto today = domain::dayWindowOf(now, dayOffset_);

        return readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) -> Result {
            auto account = reader.findAccount(userId);
            if (!account) {
                return Result::rejected(domain::Rejection::of(
                    domain::RejectReason::ACCOUNT_NOT_FOUND,
                    "Account not found: " + userId));
            }

            domain::BankInfo info;
            info.cash = account->cash;
            info.savings = account->savings;
            info.isVip = account->savings >= rules_.vipThreshold;
            info.dailyRate = rules_.rateFor(account->savings);
            info.dailyInterestPreview = interestOn(account->savings);
            info.withdrawnToday = reader.sumTransactions(userId, domain::TransactionType::WITHDRAW, today);
            info.remainingDailyLimit = std::max<int64_t>(0, rules_.dailyWithdrawLimit - info.withdrawnToday);

            info.minDeposit = rules_.minDeposit;
            info.maxDeposit = rules_.maxDeposit;
            info.minWithdraw = rules_.minWithdraw;
            info.maxWithdraw = rules_.maxWithdraw;
            info.dailyWithdrawLimit = rules_.dailyWithdrawLimit;
            info.vipThreshold = rules_.vipThreshold;

            auto history = reader.transactionsOf(userId, 0);
            info.totalTransactions = static_cast<int64_t>(history.size());
            for (const auto& r : history) {
                if (r.type == domain::TransactionType::DEPOSIT) {
                    info.totalDeposits += r.amount;
                } else if (r.type == domain::TransactionType::WITHDRAW) {
                    info.totalWithdrawals += r.amount;
                }
            }

            if (history.size() > kRecentTransactions) {
                history.resize(kRecentTransactions);
            }
            info.recent = std::move(history);
            return Result::accepted(info);
        });
    }

private:
    static constexpr std::size_t kRecentTransactions = 5;

    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    const settings::BankRules rules_;
    const std::chrono::minutes dayOffset_;
    const int maxRetries_;

    int64_t interestOn(int64_t savings) const {
        return static_cast<int64_t>(std::floor(static_cast<double>(savings) * rules_.rateFor(savings)));
    }

    /**
     * @return начисленная сумма или nullopt, если аккаунт пропущен
     */
    std::optional<int64_t> accrueFor(const std::string& userId) {
        return runAtomically(*store_, {userId}, maxRetries_, "BankService",
            [&](ports::output::ILedgerSession& session) -> std::optional<int64_t> {
                auto now = clock_->now();
                auto account = session.findAccount(userId);
                if (!account || account->savings <= 0) {
                    return std::nullopt;
                }

                auto today = domain::dayWindowOf(now, dayOffset_);
                if (session.countTransactions(userId, domain::TransactionType::INTEREST, today) > 0) {
                    return std::nullopt;
                }

                int64_t interest = interestOn(account->savings);
                if (interest <= 0) {
                    return std::nullopt;
                }

                int64_t before = account->savings;
                account->savings += interest;
                account->updatedAt = now;
                session.saveAccount(*account);
                session.appendTransaction(makeRecord(userId, domain::TransactionType::INTEREST,
                                                     interest, before, account->savings, now));
                return interest;
            });
    }

    // Недостача для неположительной суммы считается от нуля
    static std::optional<domain::Rejection> checkBounds(int64_t amount, int64_t min, int64_t max,
                                                        const std::string& operation) {
        if (amount < min) {
            return domain::Rejection::of(
                domain::RejectReason::BELOW_MINIMUM,
                operation + " amount must be at least " + std::to_string(min))
                .withLimit(min)
                .withShortfall(min - std::max<int64_t>(amount, 0));
        }
        if (amount > max) {
            return domain::Rejection::of(
                domain::RejectReason::ABOVE_MAXIMUM,
                operation + " amount must not exceed " + std::to_string(max))
                .withLimit(max);
        }
        return std::nullopt;
    }

    static domain::TransactionRecord makeRecord(const std::string& userId,
                                                domain::TransactionType type,
                                                int64_t amount,
                                                int64_t before,
                                                int64_t after,
                                                const domain::Timestamp& now) {
        domain::TransactionRecord record;
        record.userId = userId;
        record.type = type;
        record.amount = amount;
        record.balanceBefore = before;
        record.balanceAfter = after;
        record.timestamp = now;
        return record;
    }
};

} // namespace economy::application
