#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace economy::settings {

/**
 * @brief Настройки фонового начисления процентов
 *
 * - ECONOMY_INTEREST_SCHEDULER_ENABLED: true / false
 * - ECONOMY_INTEREST_INTERVAL_SEC: интервал между запусками (по умолчанию час)
 *
 * Запуски чаще раза в сутки безопасны: уже начисленные сегодня аккаунты пропускаются.
 */
class SchedulerSettings {
public:
    SchedulerSettings() {
        enabled_ = getEnvOrDefault("ECONOMY_INTEREST_SCHEDULER_ENABLED", "true") == "true";
        intervalSec_ = std::stoi(getEnvOrDefault("ECONOMY_INTEREST_INTERVAL_SEC", "3600"));
        if (intervalSec_ <= 0) {
            throw std::invalid_argument("ECONOMY_INTEREST_INTERVAL_SEC must be positive");
        }
    }

    bool isEnabled() const { return enabled_; }
    int getIntervalSec() const { return intervalSec_; }

private:
    bool enabled_;
    int intervalSec_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace economy::settings
