#include <gtest/gtest.h>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/time_utils.hpp"

using namespace market_ingest;

TEST(DateTest, ParseAndFormat) {
    auto date = Date::parse("2024-02-29");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year, 2024);
    EXPECT_EQ(date->month, 2);
    EXPECT_EQ(date->day, 29);
    EXPECT_EQ(date->to_string(), "2024-02-29");
}

TEST(DateTest, ParseRejectsInvalidText) {
    EXPECT_FALSE(Date::parse("2023-02-29").has_value());
    EXPECT_FALSE(Date::parse("2024-13-01").has_value());
    EXPECT_FALSE(Date::parse("2024-1-01").has_value());
    EXPECT_FALSE(Date::parse("2024-01-01x").has_value());
    EXPECT_FALSE(Date::parse("").has_value());
}

TEST(DateTest, DayArithmeticCrossesMonthsAndYears) {
    EXPECT_EQ(Date(2024, 2, 28).add_days(1), Date(2024, 2, 29));
    EXPECT_EQ(Date(2024, 2, 29).add_days(1), Date(2024, 3, 1));
    EXPECT_EQ(Date(2023, 12, 31).add_days(1), Date(2024, 1, 1));
    EXPECT_EQ(Date(2024, 1, 1).add_days(-1), Date(2023, 12, 31));
    EXPECT_EQ(Date::from_days(Date(2024, 6, 15).to_days()), Date(2024, 6, 15));
}

TEST(DateTest, AddYearsClampsLeapDay) {
    EXPECT_EQ(Date(2024, 2, 29).add_years(-1), Date(2023, 2, 28));
    EXPECT_EQ(Date(2024, 5, 10).add_years(-5), Date(2019, 5, 10));
}

TEST(DateTest, WeekdaysAndWeekends) {
    EXPECT_EQ(Date(1970, 1, 1).weekday(), 4);  // Thursday
    EXPECT_EQ(Date(2024, 6, 15).weekday(), 6);
    EXPECT_TRUE(Date(2024, 6, 16).is_weekend());
    EXPECT_FALSE(Date(2024, 6, 17).is_weekend());
}

TEST(DateTest, Ordering) {
    EXPECT_LT(Date(2024, 1, 31), Date(2024, 2, 1));
    EXPECT_GT(Date(2025, 1, 1), Date(2024, 12, 31));
    EXPECT_LE(Date(2024, 1, 1), Date(2024, 1, 1));
}

TEST(DateTest, FromTimestampAppliesOffset) {
    // 2024-03-01 20:30 UTC is already 2024-03-02 in UTC+8
    auto ts = std::chrono::system_clock::time_point(
        std::chrono::seconds(Date(2024, 3, 1).to_days() * 86400 + 20 * 3600 + 30 * 60));
    EXPECT_EQ(Date::from_timestamp(ts, 0), Date(2024, 3, 1));
    EXPECT_EQ(Date::from_timestamp(ts, 480), Date(2024, 3, 2));
    EXPECT_EQ(core::minutes_of_day(ts, 480), (4 * 60) + 30);
}

TEST(YearMonthTest, Helpers) {
    YearMonth ym = make_year_month(2024, 1);
    EXPECT_EQ(ym, 202401);
    EXPECT_EQ(year_of(ym), 2024);
    EXPECT_EQ(month_of(ym), 1);
    EXPECT_EQ(previous_month(ym), 202312);
    EXPECT_EQ(previous_month(202405), 202404);
    EXPECT_TRUE(is_valid_year_month(202412));
    EXPECT_FALSE(is_valid_year_month(202413));
    EXPECT_EQ(Date(2024, 7, 9).year_month(), 202407);
}

TEST(TimeOfDayTest, ParsesClockTimes) {
    EXPECT_EQ(core::parse_time_of_day("00:00"), 0);
    EXPECT_EQ(core::parse_time_of_day("15:00"), 900);
    EXPECT_EQ(core::parse_time_of_day("23:59"), 1439);
    EXPECT_FALSE(core::parse_time_of_day("24:00").has_value());
    EXPECT_FALSE(core::parse_time_of_day("7:30").has_value());
    EXPECT_FALSE(core::parse_time_of_day("07-30").has_value());
}
