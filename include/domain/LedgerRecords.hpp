#pragma once

#include "Timestamp.hpp"
#include "Calendar.hpp"
#include "enums/TransactionType.hpp"
#include <string>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Запись банковского журнала (append-only)
 *
 * balanceBefore / balanceAfter: состояние вклада. Проигрывание всех записей
 * пользователя с нуля даёт текущий savings.
 */
struct TransactionRecord {
    int64_t id = 0;
    std::string userId;
    TransactionType type = TransactionType::DEPOSIT;
    int64_t amount = 0;
    int64_t balanceBefore = 0;
    int64_t balanceAfter = 0;
    Timestamp timestamp;

    int64_t savingsDelta() const {
        return savingsSign(type) * amount;
    }
};

/**
 * @brief Запись о выполненной работе
 */
struct WorkRecord {
    int64_t id = 0;
    std::string userId;
    std::string jobName;
    int64_t baseSalary = 0;   ///< Выпавшая случайная зарплата
    int64_t bonus = 0;        ///< Бонус за уровень + бонус удачи
    int64_t totalEarned = 0;
    Timestamp timestamp;
};

/**
 * @brief Ежедневная отметка, уникальна по (userId, date)
 */
struct CheckinRecord {
    int64_t id = 0;
    std::string userId;
    CalendarDate date;
    int64_t rewardAmount = 0;
    int consecutiveDays = 0;
    Timestamp timestamp;
};

/**
 * @brief Попытка ограбления
 *
 * При успехе amount: сумма, отнятая у жертвы; при провале: штраф,
 * выплаченный грабителем жертве.
 */
struct RobberyRecord {
    int64_t id = 0;
    std::string robberId;
    std::string victimId;
    int64_t amount = 0;
    bool success = false;
    std::string resultMessage;
    Timestamp timestamp;
};

} // namespace economy::domain
