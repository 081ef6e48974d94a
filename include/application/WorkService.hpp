// include/application/WorkService.hpp
#pragma once

#include "ports/input/IWorkService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IRandomSource.hpp"
#include "settings/EconomySettings.hpp"
#include "application/AtomicUnit.hpp"
#include "domain/Job.hpp"
#include "domain/Leveling.hpp"
#include "domain/Calendar.hpp"
#include <memory>
#include <map>
#include <cmath>
#include <algorithm>
#include <iostream>

namespace economy::application {

/**
 * @brief Сервис работ
 *
 * Выплата:
 * - randomSalary = random(job.min..job.max)
 * - levelBonus = floor(job.baseSalary × (level-1) × levelBonusRate)
 * - с шансом luckChance: luckBonus = floor(randomSalary × luckBonusRatio)
 *
 * Дневная квота и кулдаун считаются по work_records в той же единице работы.
 */
class WorkService : public ports::input::IWorkService {
public:
    WorkService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IRandomSource> random,
        std::shared_ptr<settings::EconomySettings> settings
    ) : store_(std::move(store))
      , clock_(std::move(clock))
      , random_(std::move(random))
      , rules_(settings->getWorkRules())
      , dayOffset_(settings->getDayOffset())
      , maxRetries_(settings->getStoreMaxRetries())
    {
        std::cout << "[WorkService] Created with " << catalog_.all().size() << " jobs" << std::endl;
    }

    domain::ActionResult<domain::WorkReceipt> work(
        const std::string& userId,
        const std::string& displayName,
        const std::string& jobName) override
    {
        using Result = domain::ActionResult<domain::WorkReceipt>;

        auto job = catalog_.find(jobName);

        return runAtomically(*store_, {userId}, maxRetries_, "WorkService",
            [&](ports::output::ILedgerSession& session) -> Result {
                auto now = clock_->now();
                auto account = session.ensureAccount(userId, displayName);

                if (!job) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::UNKNOWN_JOB,
                        "Unknown job: " + jobName));
                }

                if (account.level < job->levelRequired) {
                    std::cout << "[WorkService] REJECTED: " << userId << " level " << account.level
                              << " < " << job->levelRequired << " for " << job->name << std::endl;
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::LEVEL_TOO_LOW,
                        "Job " + job->name + " requires level " + std::to_string(job->levelRequired))
                        .withLevels(job->levelRequired, account.level));
                }

                auto today = domain::dayWindowOf(now, dayOffset_);
                int64_t worksToday = session.countWorkRecords(userId, today);
                if (worksToday >= rules_.dailyLimit) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::DAILY_QUOTA_EXCEEDED,
                        "Daily work limit reached")
                        .withLimit(rules_.dailyLimit)
                        .withRemaining(0));
                }

                auto last = session.lastWorkAt(userId, job->name);
                if (last) {
                    auto readyAt = *last + cooldownOf(*job);
                    if (now < readyAt) {
                        int64_t minutes = domain::minutesUntil(now, readyAt);
                        return Result::rejected(domain::Rejection::of(
                            domain::RejectReason::ON_COOLDOWN,
                            job->name + " is on cooldown for " + std::to_string(minutes) + " more minutes")
                            .withRemainingMinutes(minutes));
                    }
                }

                auto payout = computePayout(*job, account.level);
                int oldLevel = account.level;

                account.cash += payout.total();
                account.totalEarned += payout.total();
                account.experience += payout.expGain;
                account.level = domain::levelForExperience(account.experience);
                account.lastWorkTime = now;
                account.updatedAt = now;
                session.saveAccount(account);

                domain::WorkRecord record;
                record.userId = userId;
                record.jobName = job->name;
                record.baseSalary = payout.randomSalary;
                record.bonus = payout.levelBonus + payout.luckBonus;
                record.totalEarned = payout.total();
                record.timestamp = now;
                session.appendWork(record);

                std::cout << "[WorkService] " << userId << " worked as " << job->name
                          << ", earned " << payout.total() << std::endl;

                domain::WorkReceipt receipt;
                receipt.payout = payout;
                receipt.newCash = account.cash;
                receipt.newExperience = account.experience;
                receipt.oldLevel = oldLevel;
                receipt.newLevel = account.level;
                receipt.leveledUp = account.level > oldLevel;
                receipt.worksToday = worksToday + 1;
                receipt.remainingToday = std::max<int64_t>(0, rules_.dailyLimit - receipt.worksToday);
                return Result::accepted(receipt);
            });
    }

    domain::ActionResult<domain::JobBoard> getJobBoard(const std::string& userId) override {
        using Result = domain::ActionResult<domain::JobBoard>;

        auto now = clock_->now();

        return readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) -> Result {
            auto account = reader.findAccount(userId);
            if (!account) {
                return Result::rejected(domain::Rejection::of(
                    domain::RejectReason::ACCOUNT_NOT_FOUND,
                    "Account not found: " + userId));
            }

            domain::JobBoard board;
            board.userLevel = account->level;
            board.dailyLimit = rules_.dailyLimit;
            board.worksToday = reader.countWorkRecords(userId, domain::dayWindowOf(now, dayOffset_));

            for (const auto& job : catalog_.all()) {
                domain::JobAvailability item;
                item.job = job;
                item.levelOk = account->level >= job.levelRequired;
                item.effectiveCooldownHours = job.cooldownHours * rules_.cooldownMultiplier;

                auto last = reader.lastWorkAt(userId, job.name);
                if (last) {
                    auto readyAt = *last + cooldownOf(job);
                    if (now < readyAt) {
                        item.onCooldown = true;
                        item.cooldownEndsAt = readyAt;
                    }
                }
                board.jobs.push_back(std::move(item));
            }
            return Result::accepted(board);
        });
    }

    domain::ActionResult<domain::WorkStatistics> getWorkStatistics(const std::string& userId) override {
        using Result = domain::ActionResult<domain::WorkStatistics>;

        auto now = clock_->now();
        auto today = domain::dayWindowOf(now, dayOffset_);

        return readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) -> Result {
            if (!reader.findAccount(userId)) {
                return Result::rejected(domain::Rejection::of(
                    domain::RejectReason::ACCOUNT_NOT_FOUND,
                    "Account not found: " + userId));
            }

            auto records = reader.workRecordsOf(userId, 0);

            domain::WorkStatistics stats;
            std::map<std::string, domain::JobStatistics> perJob;

            for (const auto& r : records) {
                stats.totalWorks++;
                stats.totalIncome += r.totalEarned;
                if (today.contains(r.timestamp)) {
                    stats.todayWorks++;
                    stats.todayIncome += r.totalEarned;
                }

                auto& js = perJob[r.jobName];
                js.jobName = r.jobName;
                js.count++;
                js.totalIncome += r.totalEarned;
                js.maxIncome = std::max(js.maxIncome, r.totalEarned);
            }

            if (stats.totalWorks > 0) {
                stats.averageIncome = static_cast<double>(stats.totalIncome) / static_cast<double>(stats.totalWorks);
            }
            stats.remainingToday = std::max<int64_t>(0, rules_.dailyLimit - stats.todayWorks);

            for (auto& [name, js] : perJob) {
                stats.perJob.push_back(js);
            }
            std::stable_sort(stats.perJob.begin(), stats.perJob.end(),
                [](const domain::JobStatistics& a, const domain::JobStatistics& b) {
                    return a.totalIncome > b.totalIncome;
                });

            if (records.size() > kRecentRecords) {
                records.resize(kRecentRecords);
            }
            stats.recent = std::move(records);
            return Result::accepted(stats);
        });
    }

private:
    static constexpr std::size_t kRecentRecords = 5;

    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IRandomSource> random_;
    const domain::JobCatalog catalog_;
    const settings::WorkRules rules_;
    const std::chrono::minutes dayOffset_;
    const int maxRetries_;

    std::chrono::milliseconds cooldownOf(const domain::Job& job) const {
        return domain::durationFromHours(job.cooldownHours * rules_.cooldownMultiplier);
    }

    // Порядок розыгрышей фиксирован: зарплата, затем удача
    domain::WorkPayout computePayout(const domain::Job& job, int level) {
        domain::WorkPayout payout;
        payout.jobName = job.name;
        payout.randomSalary = random_->uniformInt(job.salaryMin, job.salaryMax);
        payout.levelBonus = static_cast<int64_t>(std::floor(
            static_cast<double>(job.baseSalary) * (level - 1) * rules_.levelBonusRate));

        if (random_->uniformUnit() < rules_.luckChance) {
            payout.luckTriggered = true;
            payout.luckBonus = static_cast<int64_t>(std::floor(
                static_cast<double>(payout.randomSalary) * rules_.luckBonusRatio));
        }

        payout.expGain = static_cast<int64_t>(std::floor(
            static_cast<double>(job.expReward) * rules_.expMultiplier));
        return payout;
    }
};

} // namespace economy::application
