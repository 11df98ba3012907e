// include/market_ingest/core/holiday_calendar.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/error.hpp"

namespace market_ingest {

/**
 * @brief Holiday information structure
 */
struct HolidayInfo {
    Date date;
    std::string name;
    std::string type;
    std::string note;
};

/**
 * @brief Exchange holiday calendar loaded from JSON reference data
 *
 * File layout: { "2024": [ { "date": "2024-01-01", "name": "...",
 * "type": "...", "note": "..." }, ... ], ... }
 */
class HolidayCalendar {
public:
    HolidayCalendar() = default;

    /**
     * @brief Load a calendar from a JSON file
     * @param json_path Path to holidays.json
     */
    static Result<HolidayCalendar> load(const std::string& json_path);

    /**
     * @brief Build a calendar from an already parsed JSON document
     */
    static Result<HolidayCalendar> from_json(const nlohmann::json& j);

    bool is_holiday(const Date& date) const {
        return holidays_.find(date) != holidays_.end();
    }

    /**
     * @brief A weekday that is not an exchange holiday
     */
    bool is_trading_day(const Date& date) const {
        return !date.is_weekend() && !is_holiday(date);
    }

    std::optional<HolidayInfo> get_holiday_info(const Date& date) const {
        auto it = holidays_.find(date);
        if (it != holidays_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /**
     * @brief All holidays in a calendar year, ordered by date
     */
    std::vector<HolidayInfo> holidays_in_year(int year) const;

    size_t size() const {
        return holidays_.size();
    }

private:
    std::map<Date, HolidayInfo> holidays_;
};

}  // namespace market_ingest
