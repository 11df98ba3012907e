// include/market_ingest/core/date.hpp

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "market_ingest/core/types.hpp"

namespace market_ingest {

/**
 * @brief Calendar date (proleptic Gregorian), the key unit of every daily table
 */
struct Date {
    int year{0};
    int month{0};
    int day{0};

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Parse a date in YYYY-MM-DD form
     * @return The date, or nullopt if the text is not a valid calendar date
     */
    static std::optional<Date> parse(const std::string& text);

    /**
     * @brief Build a date from a day count relative to 1970-01-01
     */
    static Date from_days(int64_t days);

    /**
     * @brief Calendar date of a timestamp shifted by a UTC offset
     */
    static Date from_timestamp(Timestamp ts, int utc_offset_minutes = 0);

    int64_t to_days() const;
    Date add_days(int64_t n) const;
    Date add_years(int n) const;

    /**
     * @brief Day of week, 0 = Sunday ... 6 = Saturday
     */
    int weekday() const;
    bool is_weekend() const;

    bool valid() const;
    YearMonth year_month() const {
        return make_year_month(year, month);
    }
    std::string to_string() const;

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const {
        return !(*this == other);
    }
    bool operator<(const Date& other) const {
        if (year != other.year)
            return year < other.year;
        if (month != other.month)
            return month < other.month;
        return day < other.day;
    }
    bool operator>(const Date& other) const {
        return other < *this;
    }
    bool operator<=(const Date& other) const {
        return !(other < *this);
    }
    bool operator>=(const Date& other) const {
        return !(*this < other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

int days_in_month(int year, int month);

}  // namespace market_ingest
