// src/core/date.cpp

#include "market_ingest/core/date.hpp"
#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace market_ingest {

namespace {

// Civil-from-days conversions over the proleptic Gregorian calendar,
// with 400-year eras starting on March 1st.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

}  // namespace

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12)
        return 0;
    if (month == 2 && is_leap(year))
        return 29;
    return kDays[month - 1];
}

std::optional<Date> Date::parse(const std::string& text) {
    int y = 0, m = 0, d = 0;
    char extra = 0;
    if (text.size() != 10 || std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &extra) != 3) {
        return std::nullopt;
    }
    Date date(y, m, d);
    if (!date.valid())
        return std::nullopt;
    return date;
}

Date Date::from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m),
                static_cast<int>(d));
}

Date Date::from_timestamp(Timestamp ts, int utc_offset_minutes) {
    auto minutes =
        std::chrono::duration_cast<std::chrono::minutes>(ts.time_since_epoch()).count() +
        utc_offset_minutes;
    int64_t days = minutes / (24 * 60);
    if (minutes % (24 * 60) < 0)
        --days;
    return from_days(days);
}

int64_t Date::to_days() const {
    return days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

Date Date::add_days(int64_t n) const {
    return from_days(to_days() + n);
}

Date Date::add_years(int n) const {
    int y = year + n;
    int d = std::min(day, days_in_month(y, month));
    return Date(y, month, d);
}

int Date::weekday() const {
    const int64_t days = to_days();
    // 1970-01-01 was a Thursday
    return static_cast<int>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
}

bool Date::is_weekend() const {
    int wd = weekday();
    return wd == 0 || wd == 6;
}

bool Date::valid() const {
    return year >= 1900 && year <= 9999 && month >= 1 && month <= 12 && day >= 1 &&
           day <= days_in_month(year, month);
}

std::string Date::to_string() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-'
       << std::setw(2) << day;
    return ss.str();
}

}  // namespace market_ingest
