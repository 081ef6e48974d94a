// include/settings/EconomySettings.hpp
#pragma once

#include <string>
#include <map>
#include <cstdlib>
#include <cstdint>
#include <chrono>
#include <stdexcept>
#include <iostream>

namespace economy::settings {

/**
 * @brief Правила ежедневной отметки
 */
struct CheckinRules {
    int64_t baseReward = 100;
    int64_t randomMin = 0;
    int64_t randomMax = 50;
    std::map<int, int64_t> streakBonuses = {{3, 50}, {7, 200}, {15, 500}, {30, 1000}};

    /**
     * @brief Бонус наивысшего достигнутого порога серии
     */
    int64_t bonusForStreak(int streak) const {
        int64_t bonus = 0;
        for (const auto& [days, amount] : streakBonuses) {
            if (streak >= days) {
                bonus = amount;
            }
        }
        return bonus;
    }
};

struct WorkRules {
    int64_t dailyLimit = 10;
    double cooldownMultiplier = 1.0;
    double expMultiplier = 1.0;
    double luckChance = 0.10;
    double luckBonusRatio = 0.5;
    double levelBonusRate = 0.02;   ///< Доля baseSalary за каждый уровень выше первого
};

/**
 * @brief Лимиты и ставки банка (ставки: дневные доли, не проценты)
 */
struct BankRules {
    int64_t minDeposit = 10;
    int64_t maxDeposit = 100000;
    int64_t minWithdraw = 10;
    int64_t maxWithdraw = 50000;
    int64_t dailyWithdrawLimit = 200000;
    double baseRate = 0.001;
    double vipRate = 0.0015;
    int64_t vipThreshold = 10000;

    double rateFor(int64_t savings) const {
        return savings >= vipThreshold ? vipRate : baseRate;
    }
};

struct RobberyRules {
    double successRate = 0.30;
    int64_t minAmount = 50;
    int64_t maxAmount = 300;
    double cooldownHours = 6.0;
    int levelRequirement = 5;
    int64_t protectionAmount = 100;   ///< Наличные ниже этого порога не грабят
    int64_t failurePenalty = 20;
};

/**
 * @brief Настройки экономики
 *
 * Читает правила из переменных окружения (K8s ENV). Ставки и шансы задаются
 * в процентах, как в конфиге чат-плагина:
 * - ECONOMY_BANK_INTEREST_RATE=0.1      → baseRate 0.001
 * - ECONOMY_BANK_VIP_INTEREST_RATE=0.15 → vipRate 0.0015
 * - ECONOMY_ROBBERY_SUCCESS_RATE=30     → successRate 0.30
 *
 * Календарные сутки считаются со сдвигом ECONOMY_DAY_OFFSET_MINUTES от UTC
 * (по умолчанию 480, UTC+8).
 *
 * После создания не меняется: каждый сервис копирует свои правила.
 *
 * @throws std::invalid_argument при нечисловых или недопустимых значениях
 */
class EconomySettings {
public:
    /**
     * @brief Конструктор - читает настройки из ENV
     */
    EconomySettings() {
        checkin_.baseReward = getInt("ECONOMY_CHECKIN_BASE_REWARD", "100");
        checkin_.randomMin = getInt("ECONOMY_CHECKIN_RANDOM_MIN", "0");
        checkin_.randomMax = getInt("ECONOMY_CHECKIN_RANDOM_MAX", "50");

        work_.dailyLimit = getInt("ECONOMY_WORK_DAILY_LIMIT", "10");
        work_.cooldownMultiplier = getDouble("ECONOMY_WORK_COOLDOWN_MULTIPLIER", "1.0");
        work_.expMultiplier = getDouble("ECONOMY_WORK_EXP_MULTIPLIER", "1.0");

        bank_.minDeposit = getInt("ECONOMY_BANK_MIN_DEPOSIT", "10");
        bank_.maxDeposit = getInt("ECONOMY_BANK_MAX_DEPOSIT", "100000");
        bank_.minWithdraw = getInt("ECONOMY_BANK_MIN_WITHDRAW", "10");
        bank_.maxWithdraw = getInt("ECONOMY_BANK_MAX_WITHDRAW", "50000");
        bank_.dailyWithdrawLimit = getInt("ECONOMY_BANK_DAILY_WITHDRAW_LIMIT", "200000");
        bank_.baseRate = getDouble("ECONOMY_BANK_INTEREST_RATE", "0.1") / 100.0;
        bank_.vipRate = getDouble("ECONOMY_BANK_VIP_INTEREST_RATE", "0.15") / 100.0;
        bank_.vipThreshold = getInt("ECONOMY_BANK_VIP_THRESHOLD", "10000");

        robbery_.successRate = getDouble("ECONOMY_ROBBERY_SUCCESS_RATE", "30") / 100.0;
        robbery_.minAmount = getInt("ECONOMY_ROBBERY_MIN_AMOUNT", "50");
        robbery_.maxAmount = getInt("ECONOMY_ROBBERY_MAX_AMOUNT", "300");
        robbery_.cooldownHours = getDouble("ECONOMY_ROBBERY_COOLDOWN_HOURS", "6");
        robbery_.levelRequirement = static_cast<int>(getInt("ECONOMY_ROBBERY_LEVEL_REQUIREMENT", "5"));
        robbery_.protectionAmount = getInt("ECONOMY_ROBBERY_PROTECTION_AMOUNT", "100");
        robbery_.failurePenalty = getInt("ECONOMY_ROBBERY_FAILURE_PENALTY", "20");

        dayOffset_ = std::chrono::minutes(getInt("ECONOMY_DAY_OFFSET_MINUTES", "480"));
        storeMaxRetries_ = static_cast<int>(getInt("ECONOMY_STORE_MAX_RETRIES", "3"));

        validate();
        std::cout << "[EconomySettings] Loaded, day offset " << dayOffset_.count()
                  << " min, store retries " << storeMaxRetries_ << std::endl;
    }

    /**
     * @brief Явные правила (тесты, альтернативные конфигурации)
     */
    EconomySettings(CheckinRules checkin,
                    WorkRules work,
                    BankRules bank,
                    RobberyRules robbery,
                    std::chrono::minutes dayOffset = std::chrono::minutes(480),
                    int storeMaxRetries = 3)
        : checkin_(std::move(checkin))
        , work_(work)
        , bank_(bank)
        , robbery_(robbery)
        , dayOffset_(dayOffset)
        , storeMaxRetries_(storeMaxRetries)
    {
        validate();
    }

    const CheckinRules& getCheckinRules() const { return checkin_; }
    const WorkRules& getWorkRules() const { return work_; }
    const BankRules& getBankRules() const { return bank_; }
    const RobberyRules& getRobberyRules() const { return robbery_; }

    /**
     * @brief Сдвиг календарных суток от UTC
     */
    std::chrono::minutes getDayOffset() const { return dayOffset_; }

    /**
     * @brief Сколько раз движок повторяет единицу при TransactionConflictError
     */
    int getStoreMaxRetries() const { return storeMaxRetries_; }

private:
    CheckinRules checkin_;
    WorkRules work_;
    BankRules bank_;
    RobberyRules robbery_;
    std::chrono::minutes dayOffset_{480};
    int storeMaxRetries_ = 3;

    void validate() const {
        if (checkin_.baseReward < 0 || checkin_.randomMin < 0 || checkin_.randomMax < checkin_.randomMin) {
            throw std::invalid_argument("Invalid checkin reward settings");
        }
        if (work_.dailyLimit <= 0 || work_.cooldownMultiplier < 0 || work_.expMultiplier < 0) {
            throw std::invalid_argument("Invalid work settings");
        }
        if (bank_.minDeposit <= 0 || bank_.maxDeposit < bank_.minDeposit
            || bank_.minWithdraw <= 0 || bank_.maxWithdraw < bank_.minWithdraw
            || bank_.dailyWithdrawLimit <= 0) {
            throw std::invalid_argument("Invalid bank limits");
        }
        if (bank_.baseRate < 0 || bank_.vipRate < 0 || bank_.vipThreshold < 0) {
            throw std::invalid_argument("Invalid bank interest settings");
        }
        if (robbery_.successRate < 0 || robbery_.successRate > 1
            || robbery_.minAmount <= 0 || robbery_.maxAmount < robbery_.minAmount
            || robbery_.cooldownHours < 0 || robbery_.protectionAmount < 0
            || robbery_.failurePenalty < 0) {
            throw std::invalid_argument("Invalid robbery settings");
        }
        if (storeMaxRetries_ < 0) {
            throw std::invalid_argument("ECONOMY_STORE_MAX_RETRIES must be >= 0");
        }
    }

    static int64_t getInt(const char* name, const char* defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        try {
            std::size_t pos = 0;
            int64_t value = std::stoll(raw, &pos);
            if (pos != raw.size()) {
                throw std::invalid_argument(raw);
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string("Invalid integer in ") + name + ": " + raw);
        }
    }

    static double getDouble(const char* name, const char* defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        try {
            std::size_t pos = 0;
            double value = std::stod(raw, &pos);
            if (pos != raw.size()) {
                throw std::invalid_argument(raw);
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string("Invalid number in ") + name + ": " + raw);
        }
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace economy::settings
