#pragma once

#include "domain/ActionResult.hpp"
#include "domain/RankingResults.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace economy::ports::input {

class IProfileService {
public:
    virtual ~IProfileService() = default;

    virtual domain::ActionResult<domain::Profile> getProfile(const std::string& userId) = 0;

    /**
     * @brief Лента последних действий пользователя (новые сверху)
     */
    virtual domain::ActionResult<std::vector<domain::Activity>> getRecentActivities(
        const std::string& userId,
        std::size_t limit
    ) = 0;
};

} // namespace economy::ports::input
