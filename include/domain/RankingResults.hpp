#pragma once

#include "UserAccount.hpp"
#include "Leveling.hpp"
#include "enums/RankingMetric.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace economy::domain {

struct RankingEntry {
    int rank = 0;
    std::string userId;
    std::string displayName;
    int64_t value = 0;
    int level = 1;
    int64_t cash = 0;
    int64_t savings = 0;
    int64_t totalCheckins = 0;
};

struct Leaderboard {
    RankingMetric metric = RankingMetric::CASH;
    std::vector<RankingEntry> entries;
    int64_t totalAccounts = 0;
};

struct RankInfo {
    RankingMetric metric = RankingMetric::CASH;
    int rank = 0;
    int64_t value = 0;
    int64_t totalAccounts = 0;
};

/**
 * @brief Профиль: аккаунт + прогресс уровня
 */
struct Profile {
    UserAccount account;
    LevelProgress progress;
};

/**
 * @brief Элемент ленты активности
 */
struct Activity {
    std::string kind;        ///< checkin / bank / work / robbery
    std::string detail;      ///< Тип операции, работа или роль в ограблении
    int64_t amount = 0;      ///< Со знаком относительно пользователя
    Timestamp timestamp;
};

} // namespace economy::domain
