#pragma once

#include "ports/input/IProfileService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/AtomicUnit.hpp"
#include "domain/Leveling.hpp"
#include <memory>
#include <algorithm>
#include <iostream>

namespace economy::application {

/**
 * @brief Профиль и лента активности (только чтение)
 */
class ProfileService : public ports::input::IProfileService {
public:
    explicit ProfileService(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[ProfileService] Created" << std::endl;
    }

    domain::ActionResult<domain::Profile> getProfile(const std::string& userId) override {
        using Result = domain::ActionResult<domain::Profile>;

        auto account = readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) {
            return reader.findAccount(userId);
        });
        if (!account) {
            return Result::rejected(domain::Rejection::of(
                domain::RejectReason::ACCOUNT_NOT_FOUND,
                "Account not found: " + userId));
        }

        domain::Profile profile;
        profile.account = *account;
        profile.progress = domain::levelProgress(account->experience);
        return Result::accepted(profile);
    }

    /**
     * @brief Отметки, банк, работы и ограбления (в обеих ролях), новые сверху
     *
     * amount со знаком: плюс: пользователь получил, минус: отдал.
     * Для банка знак: изменение вклада.
     */
    domain::ActionResult<std::vector<domain::Activity>> getRecentActivities(
        const std::string& userId,
        std::size_t limit) override
    {
        using Result = domain::ActionResult<std::vector<domain::Activity>>;

        return readSnapshot(*store_, [&](ports::output::ILedgerReader& reader) -> Result {
            if (!reader.findAccount(userId)) {
                return Result::rejected(domain::Rejection::of(
                    domain::RejectReason::ACCOUNT_NOT_FOUND,
                    "Account not found: " + userId));
            }

            std::vector<domain::Activity> feed;

            for (const auto& r : reader.checkinsOf(userId, limit)) {
                feed.push_back({"checkin", "day " + std::to_string(r.consecutiveDays), r.rewardAmount, r.timestamp});
            }
            for (const auto& r : reader.transactionsOf(userId, limit)) {
                feed.push_back({"bank", domain::toString(r.type), r.savingsDelta(), r.timestamp});
            }
            for (const auto& r : reader.workRecordsOf(userId, limit)) {
                feed.push_back({"work", r.jobName, r.totalEarned, r.timestamp});
            }
            for (const auto& r : reader.robberiesBy(userId, limit)) {
                feed.push_back({"robbery", r.success ? "robbed " + r.victimId : "caught robbing " + r.victimId,
                                r.success ? r.amount : -r.amount, r.timestamp});
            }
            for (const auto& r : reader.robberiesAgainst(userId, limit)) {
                feed.push_back({"robbery", r.success ? "robbed by " + r.robberId : "fought off " + r.robberId,
                                r.success ? -r.amount : r.amount, r.timestamp});
            }

            std::stable_sort(feed.begin(), feed.end(),
                [](const domain::Activity& a, const domain::Activity& b) {
                    return a.timestamp > b.timestamp;
                });

            if (limit > 0 && feed.size() > limit) {
                feed.resize(limit);
            }
            return Result::accepted(feed);
        });
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
};

} // namespace economy::application
