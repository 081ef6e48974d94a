#pragma once

#include "Calendar.hpp"
#include "LedgerRecords.hpp"
#include <vector>
#include <optional>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Разбивка награды за отметку
 */
struct CheckinReward {
    int64_t base = 0;
    int64_t random = 0;
    int64_t consecutive = 0;   ///< Бонус за наивысший достигнутый порог серии

    int64_t total() const {
        return base + random + consecutive;
    }
};

/**
 * @brief Результат успешной отметки
 */
struct CheckinReceipt {
    CheckinReward reward;
    CalendarDate date;
    int streak = 0;
    int64_t totalCheckins = 0;
    int64_t newCash = 0;
};

/**
 * @brief Состояние отметок пользователя
 */
struct CheckinInfo {
    int64_t cash = 0;
    int streak = 0;
    int64_t totalCheckins = 0;
    std::optional<CalendarDate> lastCheckinDate;
    bool checkedInToday = false;
    int64_t todayReward = 0;
    int nextStreak = 1;              ///< Какую серию даст следующая отметка
    int64_t nextConsecutiveBonus = 0;
    std::vector<CheckinRecord> recent;
};

} // namespace economy::domain
