// include/market_ingest/metrics/statistics.hpp
#pragma once

#include <Eigen/Dense>
#include <optional>
#include <vector>
#include "market_ingest/core/error.hpp"

namespace market_ingest {
namespace statistics {

/**
 * @brief Copy a series into an Eigen vector
 */
Eigen::VectorXd to_vector(const std::vector<double>& values);

/**
 * @brief Percentile by linear interpolation between order statistics
 *
 * For n sorted values the rank is p * (n - 1) and the result interpolates
 * between the two neighbouring order statistics (Hyndman-Fan type 7, the
 * same definition as PostgreSQL PERCENTILE_CONT). The input order does not
 * affect the result.
 *
 * @param values Observations, any order
 * @param p Fraction in [0, 1]
 * @return COMPUTATION_SKIPPED for an empty series, INVALID_ARGUMENT for p
 * outside [0, 1]
 */
Result<double> percentile(const Eigen::VectorXd& values, double p);

/**
 * @brief Mean of the last window values
 * @return nullopt unless at least window values exist
 */
std::optional<double> trailing_mean(const Eigen::VectorXd& values, Eigen::Index window);

/**
 * @brief Extremes of the trailing window with their positions in values
 *
 * Ties resolve to the earliest position. Non-positive values are ignored
 * when skip_non_positive is set (unknown ratios are stored as 0).
 */
struct WindowExtrema {
    double max{0.0};
    Eigen::Index max_index{-1};
    double min{0.0};
    Eigen::Index min_index{-1};
    double mean{0.0};
};

std::optional<WindowExtrema> trailing_extrema(const Eigen::VectorXd& values, Eigen::Index window,
                                              bool skip_non_positive = false);

}  // namespace statistics
}  // namespace market_ingest
