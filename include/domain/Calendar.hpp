#pragma once

#include "Timestamp.hpp"
#include <chrono>
#include <cstdio>
#include <cmath>
#include <string>
#include <stdexcept>

namespace economy::domain {

/**
 * @brief Календарный день (без времени)
 *
 * Все "дневные" окна (лимит снятий, квота работы, начисление процентов)
 * считаются в календарных днях со сдвигом от UTC, заданным в настройках.
 */
using CalendarDate = std::chrono::sys_days;

/**
 * @brief Полуоткрытый интервал [from, to)
 */
struct TimeWindow {
    Timestamp from;
    Timestamp to;

    bool contains(const Timestamp& ts) const {
        return ts >= from && ts < to;
    }
};

inline CalendarDate calendarDateOf(const Timestamp& ts, std::chrono::minutes utcOffset) {
    return std::chrono::floor<std::chrono::days>(ts.value + utcOffset);
}

inline Timestamp startOfDay(CalendarDate date, std::chrono::minutes utcOffset) {
    return Timestamp(std::chrono::system_clock::time_point(date) - utcOffset);
}

/**
 * @brief Окно календарного дня, в который попадает ts
 */
inline TimeWindow dayWindowOf(const Timestamp& ts, std::chrono::minutes utcOffset) {
    auto date = calendarDateOf(ts, utcOffset);
    return TimeWindow{startOfDay(date, utcOffset), startOfDay(date + std::chrono::days{1}, utcOffset)};
}

inline int64_t daysBetween(CalendarDate from, CalendarDate to) {
    return (to - from).count();
}

/**
 * @brief Длительность из часов конфигурации (допускаются дробные)
 */
inline std::chrono::milliseconds durationFromHours(double hours) {
    return std::chrono::milliseconds(std::llround(hours * 3600.0 * 1000.0));
}

/**
 * @brief Сколько полных или начатых минут осталось до until (0, если уже наступило)
 */
inline int64_t minutesUntil(const Timestamp& now, const Timestamp& until) {
    if (until <= now) {
        return 0;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(until.value - now.value).count();
    return (ms + 59999) / 60000;
}

/**
 * @brief YYYY-MM-DD
 */
inline std::string toString(CalendarDate date) {
    std::chrono::year_month_day ymd{date};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

/**
 * @brief Разобрать дату в формате YYYY-MM-DD
 * @throws std::invalid_argument если формат неверный
 */
inline CalendarDate parseCalendarDate(const std::string& str) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (std::sscanf(str.c_str(), "%d-%u-%u", &y, &m, &d) != 3) {
        throw std::invalid_argument("Invalid date: " + str);
    }
    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) {
        throw std::invalid_argument("Invalid date: " + str);
    }
    return std::chrono::sys_days{ymd};
}

} // namespace economy::domain
