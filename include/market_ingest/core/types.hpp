// include/market_ingest/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace market_ingest {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Share count type
 */
using Shares = int64_t;

/**
 * @brief Month key encoded as YYYYMM (e.g. 202403)
 */
using YearMonth = int;

inline YearMonth make_year_month(int year, int month) {
    return year * 100 + month;
}

inline int year_of(YearMonth ym) {
    return ym / 100;
}

inline int month_of(YearMonth ym) {
    return ym % 100;
}

inline bool is_valid_year_month(YearMonth ym) {
    return year_of(ym) >= 1900 && month_of(ym) >= 1 && month_of(ym) <= 12;
}

/**
 * @brief The month immediately before ym
 */
inline YearMonth previous_month(YearMonth ym) {
    return month_of(ym) == 1 ? make_year_month(year_of(ym) - 1, 12) : ym - 1;
}

}  // namespace market_ingest
