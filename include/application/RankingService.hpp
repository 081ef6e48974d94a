// include/application/RankingService.hpp
#pragma once

#include "ports/input/IRankingService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/AtomicUnit.hpp"
#include <memory>
#include <algorithm>
#include <utility>
#include <iostream>

namespace economy::application {

/**
 * @brief Рейтинги по снимку всех аккаунтов
 *
 * EXPERIENCE сравнивается по паре (level, experience).
 */
class RankingService : public ports::input::IRankingService {
public:
    explicit RankingService(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[RankingService] Created" << std::endl;
    }

    domain::ActionResult<domain::RankInfo> rank(const std::string& userId,
                                                 domain::RankingMetric metric) override {
        using Result = domain::ActionResult<domain::RankInfo>;

        auto accounts = snapshot();

        auto self = std::find_if(accounts.begin(), accounts.end(),
            [&](const domain::UserAccount& a) { return a.userId == userId; });
        if (self == accounts.end()) {
            return Result::rejected(domain::Rejection::of(
                domain::RejectReason::ACCOUNT_NOT_FOUND,
                "Account not found: " + userId));
        }

        auto key = keyOf(*self, metric);
        int greater = 0;
        for (const auto& a : accounts) {
            if (keyOf(a, metric) > key) {
                ++greater;
            }
        }

        domain::RankInfo info;
        info.metric = metric;
        info.rank = greater + 1;
        info.value = valueOf(*self, metric);
        info.totalAccounts = static_cast<int64_t>(accounts.size());
        return Result::accepted(info);
    }

    domain::Leaderboard topN(domain::RankingMetric metric, std::size_t n) override {
        auto accounts = snapshot();

        domain::Leaderboard board;
        board.metric = metric;
        board.totalAccounts = static_cast<int64_t>(accounts.size());

        accounts.erase(std::remove_if(accounts.begin(), accounts.end(),
            [&](const domain::UserAccount& a) { return valueOf(a, metric) <= 0; }),
            accounts.end());

        std::sort(accounts.begin(), accounts.end(),
            [&](const domain::UserAccount& a, const domain::UserAccount& b) {
                auto ka = keyOf(a, metric);
                auto kb = keyOf(b, metric);
                if (ka != kb) {
                    return ka > kb;
                }
                return a.userId < b.userId;
            });

        if (accounts.size() > n) {
            accounts.resize(n);
        }

        int position = 0;
        for (const auto& a : accounts) {
            domain::RankingEntry entry;
            entry.rank = ++position;
            entry.userId = a.userId;
            entry.displayName = a.displayName;
            entry.value = valueOf(a, metric);
            entry.level = a.level;
            entry.cash = a.cash;
            entry.savings = a.savings;
            entry.totalCheckins = a.totalCheckins;
            board.entries.push_back(std::move(entry));
        }
        return board;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;

    std::vector<domain::UserAccount> snapshot() {
        return readSnapshot(*store_, [](ports::output::ILedgerReader& reader) {
            return reader.listAccounts();
        });
    }

    static int64_t valueOf(const domain::UserAccount& a, domain::RankingMetric metric) {
        switch (metric) {
            case domain::RankingMetric::CASH:           return a.cash;
            case domain::RankingMetric::TOTAL_ASSETS:   return a.totalAssets();
            case domain::RankingMetric::TOTAL_EARNED:   return a.totalEarned;
            case domain::RankingMetric::EXPERIENCE:     return a.experience;
            case domain::RankingMetric::TOTAL_CHECKINS: return a.totalCheckins;
        }
        return 0;
    }

    static std::pair<int64_t, int64_t> keyOf(const domain::UserAccount& a, domain::RankingMetric metric) {
        if (metric == domain::RankingMetric::EXPERIENCE) {
            return {a.level, a.experience};
        }
        return {valueOf(a, metric), 0};
    }
};

} // namespace economy::application
