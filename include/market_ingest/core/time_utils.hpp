// include/market_ingest/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <optional>
#include <string>
#include "market_ingest/core/types.hpp"

namespace market_ingest {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Minutes elapsed since local midnight for a UTC offset
 */
inline int minutes_of_day(Timestamp ts, int utc_offset_minutes) {
    auto minutes =
        std::chrono::duration_cast<std::chrono::minutes>(ts.time_since_epoch()).count() +
        utc_offset_minutes;
    auto in_day = minutes % (24 * 60);
    if (in_day < 0)
        in_day += 24 * 60;
    return static_cast<int>(in_day);
}

/**
 * @brief Parse "HH:MM" into minutes since midnight
 * @return nullopt when the text is not a valid time of day
 */
inline std::optional<int> parse_time_of_day(const std::string& text) {
    if (text.size() != 5 || text[2] != ':')
        return std::nullopt;
    for (size_t i : {0u, 1u, 3u, 4u}) {
        if (text[i] < '0' || text[i] > '9')
            return std::nullopt;
    }
    int hours = (text[0] - '0') * 10 + (text[1] - '0');
    int minutes = (text[3] - '0') * 10 + (text[4] - '0');
    if (hours > 23 || minutes > 59)
        return std::nullopt;
    return hours * 60 + minutes;
}

}  // namespace core
}  // namespace market_ingest
