#pragma once

#include "domain/ActionResult.hpp"
#include "domain/RobberyResults.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace economy::ports::input {

/**
 * @brief Интерфейс сервиса ограблений
 */
class IRobberyService {
public:
    virtual ~IRobberyService() = default;

    /**
     * @brief Попытаться ограбить другого пользователя
     *
     * Оба аккаунта блокируются и изменяются в одной атомарной единице.
     */
    virtual domain::ActionResult<domain::RobberyReceipt> rob(
        const std::string& robberId,
        const std::string& robberDisplayName,
        const std::string& victimId
    ) = 0;

    virtual domain::ActionResult<domain::RobberyStats> getRobberyStats(const std::string& userId) = 0;

    /**
     * @brief Кого можно ограбить: наличные не ниже порога защиты, по убыванию наличных
     */
    virtual std::vector<domain::RobberyTarget> getRobberyTargets(
        const std::string& robberId,
        std::size_t limit
    ) = 0;
};

} // namespace economy::ports::input
