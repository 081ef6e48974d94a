#pragma once

#include <cstdint>
#include <algorithm>

namespace economy::domain {

/**
 * @brief Прогресс внутри уровня
 */
struct LevelProgress {
    int currentLevel = 1;
    int nextLevel = 2;
    int64_t experience = 0;
    int64_t progressWithinLevel = 0;   ///< Опыт, набранный с начала текущего уровня
    int64_t xpNeededForNext = 0;       ///< Сколько осталось до следующего уровня
    int64_t xpSpanOfCurrentLevel = 0;  ///< Ширина текущего уровня
    int percentComplete = 0;           ///< 0..99
};

/**
 * @brief Суммарный опыт, с которого начинается уровень
 *
 * Четыре ступени:
 * - 1–5:   100 XP на уровень
 * - 6–10:  200 XP
 * - 11–15: 500 XP
 * - 16+:   1000 XP
 */
inline int64_t levelThreshold(int level) {
    if (level <= 1) return 0;
    if (level <= 5) return static_cast<int64_t>(level - 1) * 100;
    if (level <= 10) return 500 + static_cast<int64_t>(level - 6) * 200;
    if (level <= 15) return 1500 + static_cast<int64_t>(level - 11) * 500;
    return 4000 + static_cast<int64_t>(level - 16) * 1000;
}

/**
 * @brief Уровень по накопленному опыту
 *
 * Чистая монотонная функция: от неё зависят допуски к работам и ограблениям,
 * поэтому любые изменения ступеней меняют поведение всей экономики.
 */
inline int levelForExperience(int64_t exp) {
    exp = std::max<int64_t>(exp, 0);
    if (exp < 500) {
        return static_cast<int>(exp / 100) + 1;
    }
    if (exp < 1500) {
        return 6 + static_cast<int>((exp - 500) / 200);
    }
    if (exp < 4000) {
        return 11 + static_cast<int>((exp - 1500) / 500);
    }
    return 16 + static_cast<int>((exp - 4000) / 1000);
}

inline LevelProgress levelProgress(int64_t exp) {
    exp = std::max<int64_t>(exp, 0);

    LevelProgress p;
    p.experience = exp;
    p.currentLevel = levelForExperience(exp);
    p.nextLevel = p.currentLevel + 1;

    int64_t start = levelThreshold(p.currentLevel);
    int64_t next = levelThreshold(p.nextLevel);

    p.progressWithinLevel = exp - start;
    p.xpNeededForNext = next - exp;
    p.xpSpanOfCurrentLevel = next - start;
    p.percentComplete = static_cast<int>(p.progressWithinLevel * 100 / p.xpSpanOfCurrentLevel);
    return p;
}

} // namespace economy::domain
