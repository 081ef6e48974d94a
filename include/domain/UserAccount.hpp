#pragma once

#include "Timestamp.hpp"
#include "Calendar.hpp"
#include "EconomyErrors.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Экономический профиль пользователя чата
 *
 * Создаётся лениво при первом действии (upsert), никогда не удаляется движком.
 * Суточные счётчики ограблений не хранятся: они выводятся из robbery_records.
 */
struct UserAccount {
    std::string userId;                     ///< Внешний ID пользователя чата
    std::string displayName;                ///< Последнее увиденное имя
    int64_t cash = 0;                       ///< Наличные (можно ограбить)
    int64_t savings = 0;                    ///< Вклад в банке (защищён от ограбления)
    int64_t totalEarned = 0;                ///< Доход за всё время (только растёт)
    int level = 1;
    int64_t experience = 0;
    int checkinStreak = 0;
    int64_t totalCheckins = 0;
    std::optional<CalendarDate> lastCheckinDate;
    std::optional<Timestamp> lastWorkTime;  ///< Информационно, кулдаун считается по work_records
    Timestamp createdAt;
    Timestamp updatedAt;

    int64_t totalAssets() const {
        return cash + savings;
    }

    static UserAccount create(const std::string& userId,
                              const std::string& displayName,
                              const Timestamp& now) {
        UserAccount account;
        account.userId = userId;
        account.displayName = displayName;
        account.createdAt = now;
        account.updatedAt = now;
        return account;
    }
};

/**
 * @brief Проверить переход состояния аккаунта перед записью
 *
 * @throws InvariantViolationError при отрицательном балансе или уменьшении
 *         монотонных счётчиков
 */
inline void checkAccountTransition(const UserAccount& before, const UserAccount& after) {
    if (after.cash < 0 || after.savings < 0) {
        throw InvariantViolationError("Negative balance for " + after.userId
            + ": cash=" + std::to_string(after.cash)
            + " savings=" + std::to_string(after.savings));
    }
    if (after.totalEarned < before.totalEarned
        || after.experience < before.experience
        || after.totalCheckins < before.totalCheckins) {
        throw InvariantViolationError("Monotonic counter decreased for " + after.userId);
    }
    if (after.level < 1) {
        throw InvariantViolationError("Level below 1 for " + after.userId);
    }
}

} // namespace economy::domain
