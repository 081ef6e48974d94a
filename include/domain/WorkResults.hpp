#pragma once

#include "Job.hpp"
#include "LedgerRecords.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Расчёт выплаты за работу
 */
struct WorkPayout {
    std::string jobName;
    int64_t randomSalary = 0;
    int64_t levelBonus = 0;
    int64_t luckBonus = 0;
    bool luckTriggered = false;
    int64_t expGain = 0;

    int64_t total() const {
        return randomSalary + levelBonus + luckBonus;
    }
};

struct WorkReceipt {
    WorkPayout payout;
    int64_t newCash = 0;
    int64_t newExperience = 0;
    int oldLevel = 1;
    int newLevel = 1;
    bool leveledUp = false;
    int64_t worksToday = 0;
    int64_t remainingToday = 0;
};

/**
 * @brief Доступность одной работы для пользователя
 */
struct JobAvailability {
    Job job;
    bool levelOk = false;
    bool onCooldown = false;
    std::optional<Timestamp> cooldownEndsAt;
    double effectiveCooldownHours = 0.0;

    bool available() const {
        return levelOk && !onCooldown;
    }
};

struct JobBoard {
    int userLevel = 1;
    std::vector<JobAvailability> jobs;
    int64_t worksToday = 0;
    int64_t dailyLimit = 0;

    bool canWorkToday() const {
        return worksToday < dailyLimit;
    }
};

struct JobStatistics {
    std::string jobName;
    int64_t count = 0;
    int64_t totalIncome = 0;
    int64_t maxIncome = 0;
};

struct WorkStatistics {
    int64_t totalWorks = 0;
    int64_t totalIncome = 0;
    double averageIncome = 0.0;
    int64_t todayWorks = 0;
    int64_t todayIncome = 0;
    int64_t remainingToday = 0;
    std::vector<JobStatistics> perJob;   ///< По убыванию дохода
    std::vector<WorkRecord> recent;
};

} // namespace economy::domain
