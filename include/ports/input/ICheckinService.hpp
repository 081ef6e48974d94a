#pragma once

#include "domain/ActionResult.hpp"
#include "domain/CheckinResults.hpp"
#include <string>

namespace economy::ports::input {

/**
 * @brief Ежедневные отметки
 */
class ICheckinService {
public:
    virtual ~ICheckinService() = default;

    /**
     * @brief Отметиться за сегодня
     *
     * Создаёт аккаунт при первом обращении. Повторная отметка в тот же
     * календарный день отклоняется с ALREADY_CHECKED_IN.
     */
    virtual domain::ActionResult<domain::CheckinReceipt> checkin(
        const std::string& userId,
        const std::string& displayName
    ) = 0;

    /**
     * @brief Состояние отметок (серия, последние записи, бонус следующей отметки)
     */
    virtual domain::ActionResult<domain::CheckinInfo> getCheckinInfo(const std::string& userId) = 0;
};

} // namespace economy::ports::input
