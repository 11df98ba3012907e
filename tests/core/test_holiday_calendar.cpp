#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "market_ingest/core/holiday_calendar.hpp"

using namespace market_ingest;

namespace {

const char* kHolidays = R"({
    "2024": [
        {"date": "2024-10-10", "name": "National Day", "type": "national", "note": ""},
        {"date": "2024-02-09", "name": "Lunar New Year's Eve", "type": "national"}
    ],
    "2025": [
        {"date": "2025-01-01", "name": "New Year's Day", "type": "national", "note": ""}
    ]
})";

}  // namespace

TEST(HolidayCalendarTest, AnswersHolidayAndTradingDayQueries) {
    auto calendar = HolidayCalendar::from_json(nlohmann::json::parse(kHolidays));
    ASSERT_TRUE(calendar.is_ok());

    EXPECT_EQ(calendar.value().size(), 3u);
    EXPECT_TRUE(calendar.value().is_holiday(Date(2024, 10, 10)));
    EXPECT_FALSE(calendar.value().is_trading_day(Date(2024, 10, 10)));
    EXPECT_FALSE(calendar.value().is_trading_day(Date(2024, 10, 12)));  // Saturday
    EXPECT_TRUE(calendar.value().is_trading_day(Date(2024, 10, 11)));

    auto info = calendar.value().get_holiday_info(Date(2024, 2, 9));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "Lunar New Year's Eve");
    EXPECT_TRUE(info->note.empty());
}

TEST(HolidayCalendarTest, HolidaysInYearAreOrdered) {
    auto calendar = HolidayCalendar::from_json(nlohmann::json::parse(kHolidays)).take();
    auto holidays = calendar.holidays_in_year(2024);
    ASSERT_EQ(holidays.size(), 2u);
    EXPECT_EQ(holidays[0].date, Date(2024, 2, 9));
    EXPECT_EQ(holidays[1].date, Date(2024, 10, 10));
    EXPECT_TRUE(calendar.holidays_in_year(2030).empty());
}

TEST(HolidayCalendarTest, InvalidDateIsAnError) {
    auto calendar = HolidayCalendar::from_json(
        nlohmann::json::parse(R"({"2024": [{"date": "2024-02-30", "name": "x"}]})"));
    ASSERT_TRUE(calendar.is_error());
    EXPECT_EQ(calendar.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST(HolidayCalendarTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "market_ingest_holidays.json";
    {
        std::ofstream file(path);
        file << kHolidays;
    }
    auto calendar = HolidayCalendar::load(path.string());
    ASSERT_TRUE(calendar.is_ok());
    EXPECT_TRUE(calendar.value().is_holiday(Date(2025, 1, 1)));
    std::filesystem::remove(path);

    auto missing = HolidayCalendar::load(path.string());
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_NOT_FOUND);
}
