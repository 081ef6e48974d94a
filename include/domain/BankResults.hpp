#pragma once

#include "LedgerRecords.hpp"
#include "enums/TransactionType.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Результат пополнения вклада или снятия
 */
struct BankReceipt {
    TransactionType type = TransactionType::DEPOSIT;
    int64_t amount = 0;
    int64_t newCash = 0;
    int64_t newSavings = 0;
    int64_t withdrawnToday = 0;        ///< Только для снятия
    int64_t remainingDailyLimit = 0;   ///< Только для снятия

    int64_t totalAssets() const {
        return newCash + newSavings;
    }
};

struct TransferReceipt {
    std::string fromUserId;
    std::string toUserId;
    std::string toDisplayName;
    int64_t amount = 0;
    int64_t fromSavings = 0;
    int64_t toSavings = 0;
};

/**
 * @brief Итог пакетного начисления процентов
 */
struct InterestReport {
    int64_t processedAccounts = 0;   ///< Начислено
    int64_t skippedAccounts = 0;     ///< Уже начислено сегодня или процент = 0
    int64_t failedAccounts = 0;
    int64_t totalInterest = 0;
};

struct BankInfo {
    int64_t cash = 0;
    int64_t savings = 0;
    bool isVip = false;
    double dailyRate = 0.0;
    int64_t dailyInterestPreview = 0;
    int64_t withdrawnToday = 0;
    int64_t remainingDailyLimit = 0;

    int64_t minDeposit = 0;
    int64_t maxDeposit = 0;
    int64_t minWithdraw = 0;
    int64_t maxWithdraw = 0;
    int64_t dailyWithdrawLimit = 0;
    int64_t vipThreshold = 0;

    int64_t totalTransactions = 0;
    int64_t totalDeposits = 0;
    int64_t totalWithdrawals = 0;
    std::vector<TransactionRecord> recent;

    int64_t totalAssets() const {
        return cash + savings;
    }
};

} // namespace economy::domain
