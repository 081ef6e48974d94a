#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Причина отказа в действии (бизнес-правило, не системная ошибка)
 */
enum class RejectReason {
    BELOW_MINIMUM,
    ABOVE_MAXIMUM,
    INSUFFICIENT_CASH,
    INSUFFICIENT_SAVINGS,
    DAILY_LIMIT_EXCEEDED,
    DAILY_QUOTA_EXCEEDED,
    ON_COOLDOWN,
    LEVEL_TOO_LOW,
    SELF_TRANSFER,
    SELF_TARGET,
    VICTIM_PROTECTED,
    RECIPIENT_NOT_FOUND,
    UNKNOWN_JOB,
    ALREADY_CHECKED_IN,
    ACCOUNT_NOT_FOUND
};

inline std::string toString(RejectReason reason) {
    switch (reason) {
        case RejectReason::BELOW_MINIMUM:        return "BELOW_MINIMUM";
        case RejectReason::ABOVE_MAXIMUM:        return "ABOVE_MAXIMUM";
        case RejectReason::INSUFFICIENT_CASH:    return "INSUFFICIENT_CASH";
        case RejectReason::INSUFFICIENT_SAVINGS: return "INSUFFICIENT_SAVINGS";
        case RejectReason::DAILY_LIMIT_EXCEEDED: return "DAILY_LIMIT_EXCEEDED";
        case RejectReason::DAILY_QUOTA_EXCEEDED: return "DAILY_QUOTA_EXCEEDED";
        case RejectReason::ON_COOLDOWN:          return "ON_COOLDOWN";
        case RejectReason::LEVEL_TOO_LOW:        return "LEVEL_TOO_LOW";
        case RejectReason::SELF_TRANSFER:        return "SELF_TRANSFER";
        case RejectReason::SELF_TARGET:          return "SELF_TARGET";
        case RejectReason::VICTIM_PROTECTED:     return "VICTIM_PROTECTED";
        case RejectReason::RECIPIENT_NOT_FOUND:  return "RECIPIENT_NOT_FOUND";
        case RejectReason::UNKNOWN_JOB:          return "UNKNOWN_JOB";
        case RejectReason::ALREADY_CHECKED_IN:   return "ALREADY_CHECKED_IN";
        case RejectReason::ACCOUNT_NOT_FOUND:    return "ACCOUNT_NOT_FOUND";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Отказ с причиной, сообщением и количественными подробностями
 *
 * Заполняются только относящиеся к причине поля: сколько минут до конца
 * кулдауна, сколько осталось от дневного лимита, сколько не хватает и т.д.
 *
 * @example
 * ```cpp
 * return Rejection::of(RejectReason::INSUFFICIENT_CASH, "Not enough cash")
 *     .withShortfall(amount - account.cash);
 * ```
 */
struct Rejection {
    RejectReason reason = RejectReason::ACCOUNT_NOT_FOUND;
    std::string message;

    std::optional<int64_t> remainingMinutes;  ///< До конца кулдауна
    std::optional<int64_t> remaining;         ///< Остаток дневного лимита / квоты
    std::optional<int64_t> shortfall;         ///< Сколько не хватает
    std::optional<int64_t> limit;             ///< Нарушенная граница (min/max/лимит)
    std::optional<int> requiredLevel;
    std::optional<int> currentLevel;

    static Rejection of(RejectReason reason, const std::string& message) {
        Rejection r;
        r.reason = reason;
        r.message = message;
        return r;
    }

    Rejection& withRemainingMinutes(int64_t v) { remainingMinutes = v; return *this; }
    Rejection& withRemaining(int64_t v) { remaining = v; return *this; }
    Rejection& withShortfall(int64_t v) { shortfall = v; return *this; }
    Rejection& withLimit(int64_t v) { limit = v; return *this; }

    Rejection& withLevels(int required, int current) {
        requiredLevel = required;
        currentLevel = current;
        return *this;
    }
};

} // namespace economy::domain
