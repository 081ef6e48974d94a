// include/adapters/primary/JsonMapping.hpp
#pragma once

#include "domain/Rejection.hpp"
#include "domain/UserAccount.hpp"
#include "domain/Leveling.hpp"
#include "domain/CheckinResults.hpp"
#include "domain/WorkResults.hpp"
#include "domain/BankResults.hpp"
#include "domain/RobberyResults.hpp"
#include "domain/RankingResults.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace economy::adapters::primary {

/**
 * @brief Преобразования результатов движка в JSON ответа
 *
 * Имена полей: snake_case, время: ISO-8601 UTC, даты: YYYY-MM-DD.
 */

inline nlohmann::json toJson(const domain::Rejection& r) {
    nlohmann::json j;
    j["reason"] = domain::toString(r.reason);
    j["message"] = r.message;

    nlohmann::json details = nlohmann::json::object();
    if (r.remainingMinutes) details["remaining_minutes"] = *r.remainingMinutes;
    if (r.remaining) details["remaining"] = *r.remaining;
    if (r.shortfall) details["shortfall"] = *r.shortfall;
    if (r.limit) details["limit"] = *r.limit;
    if (r.requiredLevel) details["required_level"] = *r.requiredLevel;
    if (r.currentLevel) details["current_level"] = *r.currentLevel;
    j["details"] = details;
    return j;
}

inline nlohmann::json toJson(const domain::LevelProgress& p) {
    nlohmann::json j;
    j["current_level"] = p.currentLevel;
    j["next_level"] = p.nextLevel;
    j["experience"] = p.experience;
    j["progress"] = p.progressWithinLevel;
    j["needed"] = p.xpNeededForNext;
    j["span"] = p.xpSpanOfCurrentLevel;
    j["percent"] = p.percentComplete;
    return j;
}

inline nlohmann::json toJson(const domain::UserAccount& a) {
    nlohmann::json j;
    j["user_id"] = a.userId;
    j["display_name"] = a.displayName;
    j["cash"] = a.cash;
    j["savings"] = a.savings;
    j["total_assets"] = a.totalAssets();
    j["total_earned"] = a.totalEarned;
    j["level"] = a.level;
    j["experience"] = a.experience;
    j["checkin_streak"] = a.checkinStreak;
    j["total_checkins"] = a.totalCheckins;
    j["last_checkin_date"] = a.lastCheckinDate ? nlohmann::json(domain::toString(*a.lastCheckinDate)) : nlohmann::json();
    j["last_work_time"] = a.lastWorkTime ? nlohmann::json(a.lastWorkTime->toString()) : nlohmann::json();
    j["created_at"] = a.createdAt.toString();
    return j;
}

// ---------------------------------------------------------------------------
// Журналы
// ---------------------------------------------------------------------------

inline nlohmann::json toJson(const domain::TransactionRecord& r) {
    nlohmann::json j;
    j["id"] = r.id;
    j["type"] = domain::toString(r.type);
    j["amount"] = r.amount;
    j["balance_before"] = r.balanceBefore;
    j["balance_after"] = r.balanceAfter;
    j["timestamp"] = r.timestamp.toString();
    return j;
}

inline nlohmann::json toJson(const domain::WorkRecord& r) {
    nlohmann::json j;
    j["id"] = r.id;
    j["job"] = r.jobName;
    j["base_salary"] = r.baseSalary;
    j["bonus"] = r.bonus;
    j["total"] = r.totalEarned;
    j["timestamp"] = r.timestamp.toString();
    return j;
}

inline nlohmann::json toJson(const domain::CheckinRecord& r) {
    nlohmann::json j;
    j["id"] = r.id;
    j["date"] = domain::toString(r.date);
    j["reward"] = r.rewardAmount;
    j["consecutive_days"] = r.consecutiveDays;
    return j;
}

inline nlohmann::json toJson(const domain::RobberyRecord& r) {
    nlohmann::json j;
    j["id"] = r.id;
    j["robber_id"] = r.robberId;
    j["victim_id"] = r.victimId;
    j["amount"] = r.amount;
    j["success"] = r.success;
    j["message"] = r.resultMessage;
    j["timestamp"] = r.timestamp.toString();
    return j;
}

template <typename T>
nlohmann::json toJsonArray(const std::vector<T>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back(toJson(item));
    }
    return arr;
}

// ---------------------------------------------------------------------------
// Отметки
// ---------------------------------------------------------------------------

inline nlohmann::json toJson(const domain::CheckinReceipt& r) {
    nlohmann::json j;
    j["date"] = domain::toString(r.date);
    j["reward"] = {
        {"base", r.reward.base},
        {"random", r.reward.random},
        {"consecutive", r.reward.consecutive},
        {"total", r.reward.total()}
    };
    j["streak"] = r.streak;
    j["total_checkins"] = r.totalCheckins;
    j["cash"] = r.newCash;
    return j;
}

inline nlohmann::json toJson(const domain::CheckinInfo& info) {
    nlohmann::json j;
    j["cash"] = info.cash;
    j["streak"] = info.streak;
    j["total_checkins"] = info.totalCheckins;
    j["last_checkin_date"] = info.lastCheckinDate ? nlohmann::json(domain::toString(*info.lastCheckinDate)) : nlohmann::json();
    j["checked_in_today"] = info.checkedInToday;
    j["today_reward"] = info.todayReward;
    j["next_streak"] = info.nextStreak;
    j["next_consecutive_bonus"] = info.nextConsecutiveBonus;
    j["recent"] = toJsonArray(info.recent);
    return j;
}

// ---------------------------------------------------------------------------
// Работа
// ---------------------------------------------------------------------------

inline nlohmann::json toJson(const domain::WorkReceipt& r) {
    nlohmann::json j;
    j["job"] = r.payout.jobName;
    j["payout"] = {
        {"salary", r.payout.randomSalary},
        {"level_bonus", r.payout.levelBonus},
        {"luck_bonus", r.payout.luckBonus},
        {"lucky", r.payout.luckTriggered},
        {"total", r.payout.total()}
    };
    j["exp_gain"] = r.payout.expGain;
    j["cash"] = r.newCash;
    j["experience"] = r.newExperience;
    j["old_level"] = r.oldLevel;
    j["new_level"] = r.newLevel;
    j["leveled_up"] = r.leveledUp;
    j["works_today"] = r.worksToday;
    j["remaining_today"] = r.remainingToday;
    return j;
}

inline nlohmann::json toJson(const domain::JobBoard& board) {
    nlohmann::json j;
    j["level"] = board.userLevel;
    j["works_today"] = board.worksToday;
    j["daily_limit"] = board.dailyLimit;
    j["can_work_today"] = board.canWorkToday();

    nlohmann::json jobs = nlohmann::json::array();
    for (const auto& item : board.jobs) {
        nlohmann::json job;
        job["name"] = item.job.name;
        job["description"] = item.job.description;
        job["salary_min"] = item.job.salaryMin;
        job["salary_max"] = item.job.salaryMax;
        job["level_required"] = item.job.levelRequired;
        job["cooldown_hours"] = item.effectiveCooldownHours;
        job["exp_reward"] = item.job.expReward;
        job["level_ok"] = item.levelOk;
        job["on_cooldown"] = item.onCooldown;
        job["available"] = item.available();
        if (item.cooldownEndsAt) {
            job["cooldown_ends_at"] = item.cooldownEndsAt->toString();
        }
        jobs.push_back(job);
    }
    j["jobs"] = jobs;
    return j;
}

inline nlohmann::json toJson(const domain::WorkStatistics& s) {
    nlohmann::json j;
    j["total_works"] = s.totalWorks;
    j["total_income"] = s.totalIncome;
    j["average_income"] = s.averageIncome;
    j["today_works"] = s.todayWorks;
    j["today_income"] = s.todayIncome;
    j["remaining_today"] = s.remainingToday;

    nlohmann::json perJob = nlohmann::json::array();
    for (const auto& js : s.perJob) {
        perJob.push_back({
            {"job", js.jobName},
            {"count", js.count},
            {"total_income", js.totalIncome},
            {"max_income", js.maxIncome}
        });
    }
    j["per_job"] = perJob;
    j["recent"] = toJsonArray(s.recent);
    return j;
}

// ---------------------------------------------------------------------------
// Банк
// ---------------------------------------------------------------------------

inline nlohmann::json toJson(const domain::BankReceipt& r) {
    nlohmann::json j;
    j["type"] = domain::toString(r.type);
    j["amount"] = r.amount;
    j["cash"] = r.newCash;
    j["savings"] = r.newSavings;
    j["total_assets"] = r.totalAssets();
    if (r.type == domain::TransactionType::WITHDRAW) {
        j["withdrawn_today"] = r.withdrawnToday;
        j["remaining_daily_limit"] = r.remainingDailyLimit;
    }
    return j;
}

inline nlohmann::json toJson(const domain::TransferReceipt& r) {
    nlohmann::json j;
    j["from_user_id"] = r.fromUserId;
    j["to_user_id"] = r.toUserId;
    j["to_display_name"] = r.toDisplayName;
    j["amount"] = r.amount;
    j["from_savings"] = r.fromSavings;
    j["to_savings"] = r.toSavings;
    return j;
}

inline nlohmann::json toJson(const domain::InterestReport& r) {
    nlohmann::json j;
    j["processed_accounts"] = r.processedAccounts;
    j["skipped_accounts"] = r.skippedAccounts;
    j["failed_accounts"] = r.failedAccounts;
    j["total_interest"] = r.totalInterest;
    return j;
}

inline nlohmann::json toJson(const domain::BankInfo& info) {
    nlohmann::json j;
    j["cash"] = info.cash;
    j["savings"] = info.savings;
    j["total_assets"] = info.totalAssets();
    j["vip"] = info.isVip;
    j["daily_rate"] = info.dailyRate;
    j["daily_interest_preview"] = info.dailyInterestPreview;
    j["withdrawn_today"] = info.withdrawnToday;
    j["remaining_daily_limit"] = info.remainingDailyLimit;
    j["limits"] = {
        {"min_deposit", info.minDeposit},
        {"max_deposit", info.maxDeposit},
        {"min_withdraw", info.minWithdraw},
        {"max_withdraw", info.maxWithdraw},
        {"daily_withdraw_limit", info.dailyWithdrawLimit},
        {"vip_threshold", info.vipThreshold}
    };
    j["total_transactions"] = info.totalTransactions;
    j["total_deposits"] = info.totalDeposits;
    j["total_withdrawals"] = info.totalWithdrawals;
    j["recent"] = toJsonArray(info.recent);
    return j;
}

// ---------------------------------------------------------------------------
// Ограбления
// ---------------------------------------------------------------------------

inline nlohmann::json toJson(const domain::RobberyReceipt& r) {
    nlohmann::json j;
    j["success"] = r.success;
    j["amount"] = r.amount;
    j["victim_id"] = r.victimId;
    j["victim_display_name"] = r.victimDisplayName;
    j["cash"] = r.robberCash;
    j["victim_cash"] = r.victimCash;
    j["message"] = r.message;
    return j;
}

inline nlohmann::json toJson(const domain::RobberyStats& s) {
    nlohmann::json j;
    j["level"] = s.level;
    j["cash"] = s.cash;
    j["level_requirement"] = s.levelRequirement;
    j["can_rob"] = s.canRob;
    j["cooldown_remaining_minutes"] = s.cooldownRemainingMinutes
        ? nlohmann::json(*s.cooldownRemainingMinutes) : nlohmann::json();
    j["robberies_today"] = s.robberiesToday;
    j["robbed_today"] = s.robbedToday;
    j["total_robberies"] = s.totalRobberies;
    j["successful_robberies"] = s.successfulRobberies;
    j["success_rate_percent"] = s.successRatePercent;
    j["total_gained"] = s.totalGained;
    j["times_robbed"] = s.timesRobbed;
    j["times_robbed_successfully"] = s.timesRobbedSuccessfully;
    j["total_lost"] = s.totalLost;
    j["recent_as_robber"] = toJsonArray(s.recentAsRobber);
    j["recent_as_victim"] = toJsonArray(s.recentAsVictim);
    return j;
}

inline nlohmann::json toJson(const domain::RobberyTarget& t) {
    nlohmann::json j;
    j["user_id"] = t.userId;
    j["display_name"] = t.displayName;
    j["cash"] = t.cash;
    j["level"] = t.level;
    j["total_assets"] = t.totalAssets;
    j["min_take"] = t.minTake;
    j["max_take"] = t.maxTake;
    return j;
}

// ---------------------------------------------------------------------------
// Рейтинги и профиль
// ---------------------------------------------------------------------------

inline nlohmann::json toJson(const domain::RankingEntry& e) {
    nlohmann::json j;
    j["rank"] = e.rank;
    j["user_id"] = e.userId;
    j["display_name"] = e.displayName;
    j["value"] = e.value;
    j["level"] = e.level;
    j["cash"] = e.cash;
    j["savings"] = e.savings;
    j["total_checkins"] = e.totalCheckins;
    return j;
}

inline nlohmann::json toJson(const domain::Leaderboard& board) {
    nlohmann::json j;
    j["metric"] = domain::toString(board.metric);
    j["total_accounts"] = board.totalAccounts;
    j["entries"] = toJsonArray(board.entries);
    return j;
}

inline nlohmann::json toJson(const domain::RankInfo& info) {
    nlohmann::json j;
    j["metric"] = domain::toString(info.metric);
    j["rank"] = info.rank;
    j["value"] = info.value;
    j["total_accounts"] = info.totalAccounts;
    return j;
}

inline nlohmann::json toJson(const domain::Profile& p) {
    nlohmann::json j = toJson(p.account);
    j["progress"] = toJson(p.progress);
    return j;
}

inline nlohmann::json toJson(const domain::Activity& a) {
    nlohmann::json j;
    j["kind"] = a.kind;
    j["detail"] = a.detail;
    j["amount"] = a.amount;
    j["timestamp"] = a.timestamp.toString();
    return j;
}

} // namespace economy::adapters::primary
