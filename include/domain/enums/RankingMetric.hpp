#pragma once

#include <string>
#include <stdexcept>

namespace economy::domain {

/**
 * @brief Показатель для рейтингов
 */
enum class RankingMetric {
    CASH,            ///< Наличные
    TOTAL_ASSETS,    ///< Наличные + вклад
    TOTAL_EARNED,    ///< Заработано за всё время
    EXPERIENCE,      ///< Уровень, затем опыт
    TOTAL_CHECKINS   ///< Количество отметок
};

inline std::string toString(RankingMetric metric) {
    switch (metric) {
        case RankingMetric::CASH:           return "cash";
        case RankingMetric::TOTAL_ASSETS:   return "assets";
        case RankingMetric::TOTAL_EARNED:   return "earned";
        case RankingMetric::EXPERIENCE:     return "level";
        case RankingMetric::TOTAL_CHECKINS: return "checkin";
        default: return "unknown";
    }
}

/**
 * @brief Разобрать имя показателя (принимает и короткие имена из чат-команд)
 * @throws std::invalid_argument если строка не распознана
 */
inline RankingMetric parseRankingMetric(const std::string& str) {
    if (str == "cash" || str == "money")                 return RankingMetric::CASH;
    if (str == "assets" || str == "total_assets")        return RankingMetric::TOTAL_ASSETS;
    if (str == "earned" || str == "total_earned")        return RankingMetric::TOTAL_EARNED;
    if (str == "level" || str == "experience" || str == "exp") return RankingMetric::EXPERIENCE;
    if (str == "checkin" || str == "total_checkins")     return RankingMetric::TOTAL_CHECKINS;
    throw std::invalid_argument("Unknown ranking metric: " + str);
}

} // namespace economy::domain
