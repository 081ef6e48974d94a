/**
 * @file CalendarTest.cpp
 * @brief Тесты календарных суток со сдвигом и длительностей
 */

#include <gtest/gtest.h>
#include "domain/Calendar.hpp"

using namespace economy::domain;
using namespace std::chrono;

namespace {

Timestamp utc(int y, unsigned m, unsigned d, int h, int min = 0)
{
    return Timestamp(system_clock::time_point(sys_days{year{y} / month{m} / day{d}}) + hours{h} + minutes{min});
}

const minutes kOffset{480};

} // namespace

TEST(CalendarTest, CalendarDate_UsesOffset)
{
    // 15:59 UTC = 23:59 UTC+8, ещё 9 марта
    EXPECT_EQ(toString(calendarDateOf(utc(2024, 3, 9, 15, 59), kOffset)), "2024-03-09");
    // 16:00 UTC = полночь 10 марта по UTC+8
    EXPECT_EQ(toString(calendarDateOf(utc(2024, 3, 9, 16, 0), kOffset)), "2024-03-10");
}

TEST(CalendarTest, DayWindow_IsHalfOpen)
{
    auto window = dayWindowOf(utc(2024, 3, 10, 4), kOffset);

    EXPECT_TRUE(window.from == utc(2024, 3, 9, 16));
    EXPECT_TRUE(window.to == utc(2024, 3, 10, 16));
    EXPECT_TRUE(window.contains(window.from));
    EXPECT_FALSE(window.contains(window.to));
}

TEST(CalendarTest, DaysBetween)
{
    auto a = parseCalendarDate("2024-02-28");
    auto b = parseCalendarDate("2024-03-01");

    EXPECT_EQ(daysBetween(a, b), 2);
    EXPECT_EQ(daysBetween(b, a), -2);
}

TEST(CalendarTest, ParseAndFormat)
{
    EXPECT_EQ(toString(parseCalendarDate("2024-02-29")), "2024-02-29");
    EXPECT_THROW(parseCalendarDate("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(parseCalendarDate("yesterday"), std::invalid_argument);
}

TEST(CalendarTest, MinutesUntil_RoundsUp)
{
    auto now = utc(2024, 3, 10, 4);

    EXPECT_EQ(minutesUntil(now, now + seconds{90}), 2);
    EXPECT_EQ(minutesUntil(now, now + seconds{60}), 1);
    EXPECT_EQ(minutesUntil(now, now + milliseconds{1}), 1);
    EXPECT_EQ(minutesUntil(now, now), 0);
    EXPECT_EQ(minutesUntil(now, now - hours{1}), 0);
}

TEST(CalendarTest, DurationFromFractionalHours)
{
    EXPECT_EQ(durationFromHours(1.5).count(), 5400000);
    EXPECT_EQ(durationFromHours(0).count(), 0);
}
