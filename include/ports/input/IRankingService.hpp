#pragma once

#include "domain/ActionResult.hpp"
#include "domain/RankingResults.hpp"
#include "domain/enums/RankingMetric.hpp"
#include <string>
#include <cstddef>

namespace economy::ports::input {

/**
 * @brief Рейтинги (только чтение)
 */
class IRankingService {
public:
    virtual ~IRankingService() = default;

    /**
     * @brief Место пользователя: 1 + число аккаунтов строго выше
     */
    virtual domain::ActionResult<domain::RankInfo> rank(
        const std::string& userId,
        domain::RankingMetric metric
    ) = 0;

    /**
     * @brief Первые n аккаунтов с положительным значением показателя
     *
     * При равенстве порядок по userId по возрастанию.
     */
    virtual domain::Leaderboard topN(domain::RankingMetric metric, std::size_t n) = 0;
};

} // namespace economy::ports::input
