// include/application/CheckinService.hpp
#pragma once

#include "ports/input/ICheckinService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IRandomSource.hpp"
#include "settings/EconomySettings.hpp"
#include "application/AtomicUnit.hpp"
#include "domain/Calendar.hpp"
#include <memory>
#include <iostream>

namespace economy::application {

/**
 * @brief Сервис ежедневных отметок
 *
 * Награда = base + random(min..max) + бонус наивысшего достигнутого порога серии.
 * Серия растёт, только если прошлая отметка была ровно вчера.
 * Опыт и totalEarned отметка не меняет.
 */
class CheckinService : public ports::input::ICheckinService {
public:
    CheckinService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IRandomSource> random,
        std::shared_ptr<settings::EconomySettings> settings
    ) : store_(std::move(store))
      , clock_(std::move(clock))
      , random_(std::move(random))
      , rules_(settings->getCheckinRules())
      , dayOffset_(settings->getDayOffset())
      , maxRetries_(settings->getStoreMaxRetries())
    {
        std::cout << "[CheckinService] Created" << std::endl;
    }

    domain::ActionResult<domain::CheckinReceipt> checkin(
        const std::string& userId,
        const std::string& displayName) override
    {
        using Result = domain::ActionResult<domain::CheckinReceipt>;

        return runAtomically(*store_, {userId}, maxRetries_, "CheckinService",
            [&](ports::output::ILedgerSession& session) -> Result {
                auto now = clock_->now();
                auto today = domain::calendarDateOf(now, dayOffset_);
                auto account = session.ensureAccount(userId, displayName);

                if (session.findCheckin(userId, today)) {
                    std::cout << "[CheckinService] REJECTED: " << userId << " already checked in on "
                              << domain::toString(today) << std::endl;
                    return Result::rejected(domain::Rejection::of(
                        domain::RejectReason::ALREADY_CHECKED_IN,
                        "Already checked in today"));
                }

                int newStreak = nextStreak(account, today);

                domain::CheckinReward reward;
                reward.base = rules_.baseReward;
                reward.random = random_->uniformInt(rules_.randomMin, rules_.randomMax);
                reward.consecutive = rules_.bonusForStreak(newStreak);

                account.cash += reward.total();
                account.checkinStreak = newStreak;
                account.totalCheckins += 1;
                account.lastCheckinDate = today;
                account.updatedAt = now;
                session.saveAccount(account);

                domain::CheckinRecord record;
                record.userId = userId;
                record.date = today;
                record.rewardAmount = reward.total();
                record.consecutiveDays = newStreak;
                record.timestamp = now;
                session.appendCheckin(record);

                std::cout << "[CheckinService] " << userId << " checked in, streak " << newStreak
                          << ", reward " << reward.total() << std::endl;

                domain::CheckinReceipt receipt;
                receipt.reward = reward;
                receipt.date = today;
                receipt.streak = newStreak;
                receipt.totalCheckins = account.totalCheckins;
                receipt.newCash = account.cash;
                return Result::accepted(receipt);
            });
    }

    domain::ActionResult<domain::CheckinInfo> getCheckinInfo(const std::string& userId) override {
        using Result = domain::ActionResult<domain::CheckinInfo>;

        auto now = clock_->now();
        auto today = domain::calendarDateOf(now, dayOffset_);

        return readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) -> Result {
            auto account = reader.findAccount(userId);
            if (!account) {
                return Result::rejected(domain::Rejection::of(
                    domain::RejectReason::ACCOUNT_NOT_FOUND,
                    "Account not found: " + userId));
            }

            domain::CheckinInfo info;
            info.cash = account->cash;
            info.streak = account->checkinStreak;
            info.totalCheckins = account->totalCheckins;
            info.lastCheckinDate = account->lastCheckinDate;

            auto todayRecord = reader.findCheckin(userId, today);
            info.checkedInToday = todayRecord.has_value();
            info.todayReward = todayRecord ? todayRecord->rewardAmount : 0;

            // Серия продолжится, если последняя отметка сегодня (следующая: завтра) или вчера
            bool continues = account->lastCheckinDate
                && (*account->lastCheckinDate == today
                    || domain::daysBetween(*account->lastCheckinDate, today) == 1);
            info.nextStreak = continues ? account->checkinStreak + 1 : 1;
            info.nextConsecutiveBonus = rules_.bonusForStreak(info.nextStreak);

            info.recent = reader.checkinsOf(userId, kRecentCheckins);
            return Result::accepted(info);
        });
    }

private:
    static constexpr std::size_t kRecentCheckins = 7;

    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IRandomSource> random_;
    const settings::CheckinRules rules_;
    const std::chrono::minutes dayOffset_;
    const int maxRetries_;

    /**
     * @throws domain::InvariantViolationError если прошлая отметка не раньше сегодняшнего дня,
     *         хотя записи за сегодня нет
     */
    int nextStreak(const domain::UserAccount& account, domain::CalendarDate today) const {
        if (!account.lastCheckinDate) {
            return 1;
        }
        auto gap = domain::daysBetween(*account.lastCheckinDate, today);
        if (gap <= 0) {
            std::cerr << "[CheckinService] Invariant violation: " << account.userId
                      << " last checkin " << domain::toString(*account.lastCheckinDate)
                      << " but no record for " << domain::toString(today) << std::endl;
            throw domain::InvariantViolationError("Checkin gap of " + std::to_string(gap)
                                                  + " days for " + account.userId);
        }
        return gap == 1 ? account.checkinStreak + 1 : 1;
    }
};

} // namespace economy::application
