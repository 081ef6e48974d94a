#pragma once

#include "LedgerRecords.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace economy::domain {

struct RobberyReceipt {
    bool success = false;
    int64_t amount = 0;          ///< Добыча при успехе, штраф при провале
    std::string victimId;
    std::string victimDisplayName;
    int64_t robberCash = 0;
    int64_t victimCash = 0;
    std::string message;
};

struct RobberyStats {
    int level = 1;
    int64_t cash = 0;
    int levelRequirement = 0;
    bool canRob = false;
    std::optional<int64_t> cooldownRemainingMinutes;

    int64_t robberiesToday = 0;      ///< Выведено из журнала
    int64_t robbedToday = 0;         ///< Выведено из журнала

    int64_t totalRobberies = 0;
    int64_t successfulRobberies = 0;
    double successRatePercent = 0.0;
    int64_t totalGained = 0;
    int64_t timesRobbed = 0;
    int64_t timesRobbedSuccessfully = 0;
    int64_t totalLost = 0;

    std::vector<RobberyRecord> recentAsRobber;
    std::vector<RobberyRecord> recentAsVictim;
};

struct RobberyTarget {
    std::string userId;
    std::string displayName;
    int64_t cash = 0;
    int level = 1;
    int64_t totalAssets = 0;
    int64_t minTake = 0;
    int64_t maxTake = 0;
};

} // namespace economy::domain
