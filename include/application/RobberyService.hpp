// include/application/RobberyService.hpp
#pragma once

#include "ports/input/IRobberyService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IRandomSource.hpp"
#include "settings/EconomySettings.hpp"
#include "application/AtomicUnit.hpp"
#include "domain/Calendar.hpp"
#include <memory>
#include <algorithm>
#include <iostream>

namespace economy::application {

/**
 * @brief Сервис ограблений
 *
 * Проверки по порядку: SELF_TARGET, LEVEL_TOO_LOW, ON_COOLDOWN (по журналу
 * ограблений), ACCOUNT_NOT_FOUND (жертва), VICTIM_PROTECTED.
 *
 * Исход: один розыгрыш uniformUnit() < successRate:
 * - успех: cap = min(maxAmount, victim.cash - protectionAmount);
 *   сумма = cap, если cap < minAmount, иначе random(minAmount..cap);
 * - провал: грабитель платит жертве min(failurePenalty, robber.cash).
 */
class RobberyService : public ports::input::IRobberyService {
public:
    RobberyService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IRandomSource> random,
        std::shared_ptr<settings::EconomySettings> settings
    ) : store_(std::move(store))
      , clock_(std::move(clock))
      , random_(std::move(random))
      , rules_(settings->getRobberyRules())
      , dayOffset_(settings->getDayOffset())
      , maxRetries_(settings->getStoreMaxRetries())
    {
        std::cout << "[RobberyService] Created" << std::endl;
    }

    domain::ActionResult<domain::RobberyReceipt> rob(
        const std::string& robberId,
        const std::string& robberDisplayName,
        const std::string& victimId) override
    {
        using Result = domain::ActionResult<domain::RobberyReceipt>;

        return runAtomically(*store_, {robberId, victimId}, maxRetries_, "RobberyService",
            [&](ports::output::ILedgerSession& session) -> Result {
                auto now = clock_->now();
                auto robber = session.ensureAccount(robberId, robberDisplayName);

                if (robberId == victimId) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::SELF_TARGET,
                        "Cannot rob yourself"));
                }

                if (robber.level < rules_.levelRequirement) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::LEVEL_TOO_LOW,
                        "Robbery requires level " + std::to_string(rules_.levelRequirement))
                        .withLevels(rules_.levelRequirement, robber.level));
                }

                if (auto minutes = cooldownRemaining(session, robberId, now)) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::ON_COOLDOWN,
                        "Robbery on cooldown for " + std::to_string(*minutes) + " more minutes")
                        .withRemainingMinutes(*minutes));
                }

                auto victim = session.findAccount(victimId);
                if (!victim) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::ACCOUNT_NOT_FOUND,
                        "Target not found: " + victimId));
                }

                if (victim->cash < rules_.protectionAmount) {
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::VICTIM_PROTECTED,
                        victim->displayName + " has less than " + std::to_string(rules_.protectionAmount)
                            + " cash and is protected")
                        .withLimit(rules_.protectionAmount));
                }

                domain::RobberyRecord record;
                record.robberId = robberId;
                record.victimId = victimId;
                record.timestamp = now;

                record.success = random_->uniformUnit() < rules_.successRate;
                if (record.success) {
                    int64_t cap = std::min(rules_.maxAmount, victim->cash - rules_.protectionAmount);
                    record.amount = cap < rules_.minAmount ? cap : random_->uniformInt(rules_.minAmount, cap);
                    robber.cash += record.amount;
                    victim->cash -= record.amount;
                    record.resultMessage = "Robbed " + std::to_string(record.amount) + " from " + victim->displayName;
                } else {
                    record.amount = std::min(rules_.failurePenalty, robber.cash);
                    robber.cash -= record.amount;
                    victim->cash += record.amount;
                    record.resultMessage = "Caught, paid " + std::to_string(record.amount)
                        + " to " + victim->displayName;
                }

                robber.updatedAt = now;
                victim->updatedAt = now;
                session.saveAccount(robber);
                session.saveAccount(*victim);
                session.appendRobbery(record);

                std::cout << "[RobberyService] " << robberId << " -> " << victimId << ": "
                          << (record.success ? "SUCCESS " : "FAILED ") << record.amount << std::endl;

                domain::RobberyReceipt receipt;
                receipt.success = record.success;
                receipt.amount = record.amount;
                receipt.victimId = victimId;
                receipt.victimDisplayName = victim->displayName;
                receipt.robberCash = robber.cash;
                receipt.victimCash = victim->cash;
                receipt.message = record.resultMessage;
                return Result::accepted(receipt);
            });
    }

    domain::ActionResult<domain::RobberyStats> getRobberyStats(const std::string& userId) override {
        using Result = domain::ActionResult<domain::RobberyStats>;

        auto now = clock_->now();
        auto today = domain::dayWindowOf(now, dayOffset_);

        return readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) -> Result {
            auto account = reader.findAccount(userId);
            if (!account) {
                return Result::rejected(domain::Rejection::of(
                    domain::RejectReason::ACCOUNT_NOT_FOUND,
                    "Account not found: " + userId));
            }

            domain::RobberyStats stats;
            stats.level = account->level;
            stats.cash = account->cash;
            stats.levelRequirement = rules_.levelRequirement;
            stats.cooldownRemainingMinutes = cooldownRemaining(reader, userId, now);
            stats.canRob = account->level >= rules_.levelRequirement && !stats.cooldownRemainingMinutes;

            auto asRobber = reader.robberiesBy(userId, 0);
            for (const auto& r : asRobber) {
                stats.totalRobberies++;
                if (today.contains(r.timestamp)) {
                    stats.robberiesToday++;
                }
                if (r.success) {
                    stats.successfulRobberies++;
                    stats.totalGained += r.amount;
                }
            }
            if (stats.totalRobberies > 0) {
                stats.successRatePercent = 100.0 * static_cast<double>(stats.successfulRobberies)
                                           / static_cast<double>(stats.totalRobberies);
            }

            auto asVictim = reader.robberiesAgainst(userId, 0);
            for (const auto& r : asVictim) {
                stats.timesRobbed++;
                if (today.contains(r.timestamp)) {
                    stats.robbedToday++;
                }
                if (r.success) {
                    stats.timesRobbedSuccessfully++;
                    stats.totalLost += r.amount;
                }
            }

            if (asRobber.size() > kRecentRecords) {
                asRobber.resize(kRecentRecords);
            }
            if (asVictim.size() > kRecentRecords) {
                asVictim.resize(kRecentRecords);
            }
            stats.recentAsRobber = std::move(asRobber);
            stats.recentAsVictim = std::move(asVictim);
            return Result::accepted(stats);
        });
    }

    std::vector<domain::RobberyTarget> getRobberyTargets(const std::string& robberId,
                                                         std::size_t limit) override {
        auto accounts = readSnapshot(*store_, [](ports::output::ILedgerReader& reader) {
            return reader.listAccounts();
        });

        std::vector<domain::RobberyTarget> targets;
        for (const auto& account : accounts) {
            if (account.userId == robberId || account.cash < rules_.protectionAmount) {
                continue;
            }
            domain::RobberyTarget target;
            target.userId = account.userId;
            target.displayName = account.displayName;
            target.cash = account.cash;
            target.level = account.level;
            target.totalAssets = account.totalAssets();
            target.maxTake = std::min(rules_.maxAmount, account.cash - rules_.protectionAmount);
            target.minTake = target.maxTake < rules_.minAmount ? target.maxTake : rules_.minAmount;
            targets.push_back(std::move(target));
        }

        std::sort(targets.begin(), targets.end(),
            [](const domain::RobberyTarget& a, const domain::RobberyTarget& b) {
                if (a.cash != b.cash) {
                    return a.cash > b.cash;
                }
                return a.userId < b.userId;
            });

        if (limit > 0 && targets.size() > limit) {
            targets.resize(limit);
        }
        return targets;
    }

private:
    static constexpr std::size_t kRecentRecords = 5;

    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IRandomSource> random_;
    const settings::RobberyRules rules_;
    const std::chrono::minutes dayOffset_;
    const int maxRetries_;

    std::optional<int64_t> cooldownRemaining(ports::output::ILedgerReader& reader,
                                             const std::string& robberId,
                                             const domain::Timestamp& now) const {
        auto last = reader.lastRobberyAt(robberId);
        if (!last) {
            return std::nullopt;
        }
        auto readyAt = *last + domain::durationFromHours(rules_.cooldownHours);
        if (now >= readyAt) {
            return std::nullopt;
        }
        return domain::minutesUntil(now, readyAt);
    }
};

} // namespace economy::application
