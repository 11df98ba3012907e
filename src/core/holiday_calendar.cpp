// src/core/holiday_calendar.cpp
#include "market_ingest/core/holiday_calendar.hpp"
#include <fstream>
#include "market_ingest/core/logger.hpp"

namespace market_ingest {

Result<HolidayCalendar> HolidayCalendar::load(const std::string& json_path) {
    std::ifstream file(json_path);
    if (!file.is_open()) {
        return make_error<HolidayCalendar>(ErrorCode::FILE_NOT_FOUND,
                                           "Could not open holidays file: " + json_path,
                                           "HolidayCalendar");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return make_error<HolidayCalendar>(ErrorCode::JSON_PARSE_ERROR,
                                           "Invalid holidays file " + json_path + ": " + e.what(),
                                           "HolidayCalendar");
    }

    auto calendar = from_json(j);
    if (calendar.is_ok()) {
        INFO("Loaded " << calendar.value().size() << " holidays from " << json_path);
    }
    return calendar;
}

Result<HolidayCalendar> HolidayCalendar::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<HolidayCalendar>(ErrorCode::JSON_PARSE_ERROR,
                                           "Holiday calendar must be an object keyed by year",
                                           "HolidayCalendar");
    }

    HolidayCalendar calendar;
    try {
        for (const auto& [year, holidays_array] : j.items()) {
            for (const auto& holiday : holidays_array) {
                auto date = Date::parse(holiday.at("date").get<std::string>());
                if (!date) {
                    return make_error<HolidayCalendar>(
                        ErrorCode::JSON_PARSE_ERROR,
                        "Invalid holiday date in year " + year + ": " +
                            holiday.at("date").get<std::string>(),
                        "HolidayCalendar");
                }

                HolidayInfo info;
                info.date = *date;
                info.name = holiday.value("name", std::string());
                info.type = holiday.value("type", std::string());
                info.note = holiday.value("note", std::string());
                calendar.holidays_[info.date] = info;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<HolidayCalendar>(ErrorCode::JSON_PARSE_ERROR,
                                           std::string("Malformed holiday entry: ") + e.what(),
                                           "HolidayCalendar");
    }
    return Result<HolidayCalendar>(std::move(calendar));
}

std::vector<HolidayInfo> HolidayCalendar::holidays_in_year(int year) const {
    std::vector<HolidayInfo> result;
    auto it = holidays_.lower_bound(Date(year, 1, 1));
    for (; it != holidays_.end() && it->first.year == year; ++it) {
        result.push_back(it->second);
    }
    return result;
}

}  // namespace market_ingest
