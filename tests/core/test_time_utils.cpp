#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/time_utils.hpp"

using namespace market_ingest;
using namespace market_ingest::core;

TEST(TimeUtilsTest, SafeGmtimeMatchesEpoch) {
    std::time_t epoch = 0;
    std::tm result;
    ASSERT_NE(safe_gmtime(&epoch, &result), nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST(TimeUtilsTest, FormattedTimeFollowsPattern) {
    std::string stamp = get_formatted_time("%Y%m%d_%H%M%S", false);
    EXPECT_TRUE(std::regex_match(stamp, std::regex(R"(\d{8}_\d{6})"))) << stamp;
}

TEST(TimeUtilsTest, ParsesTimeOfDay) {
    EXPECT_EQ(parse_time_of_day("00:00").value_or(-1), 0);
    EXPECT_EQ(parse_time_of_day("15:00").value_or(-1), 900);
    EXPECT_EQ(parse_time_of_day("23:59").value_or(-1), 1439);

    EXPECT_FALSE(parse_time_of_day("24:00").has_value());
    EXPECT_FALSE(parse_time_of_day("12:60").has_value());
    EXPECT_FALSE(parse_time_of_day("9:30").has_value());
    EXPECT_FALSE(parse_time_of_day("09-30").has_value());
    EXPECT_FALSE(parse_time_of_day("ab:cd").has_value());
}

TEST(TimeUtilsTest, MinutesOfDayWrapsAroundMidnight) {
    const int64_t monday = Date(2024, 6, 3).to_days() * 24 * 60;
    Timestamp utc_0700{std::chrono::minutes(monday + 7 * 60)};
    EXPECT_EQ(minutes_of_day(utc_0700, 0), 420);
    EXPECT_EQ(minutes_of_day(utc_0700, 480), 900);

    Timestamp utc_2330{std::chrono::minutes(monday + 23 * 60 + 30)};
    EXPECT_EQ(minutes_of_day(utc_2330, 480), 450);
    EXPECT_EQ(minutes_of_day(utc_0700, -480), 1380);
}
