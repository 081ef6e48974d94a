#pragma once

#include "domain/ActionResult.hpp"
#include "domain/WorkResults.hpp"
#include <string>

namespace economy::ports::input {

/**
 * @brief Интерфейс сервиса работ
 */
class IWorkService {
public:
    virtual ~IWorkService() = default;

    /**
     * @brief Выполнить работу из каталога
     *
     * Проверки по порядку: UNKNOWN_JOB, LEVEL_TOO_LOW, DAILY_QUOTA_EXCEEDED, ON_COOLDOWN.
     */
    virtual domain::ActionResult<domain::WorkReceipt> work(
        const std::string& userId,
        const std::string& displayName,
        const std::string& jobName
    ) = 0;

    /**
     * @brief Каталог работ с доступностью для пользователя
     */
    virtual domain::ActionResult<domain::JobBoard> getJobBoard(const std::string& userId) = 0;

    virtual domain::ActionResult<domain::WorkStatistics> getWorkStatistics(const std::string& userId) = 0;
};

} // namespace economy::ports::input
