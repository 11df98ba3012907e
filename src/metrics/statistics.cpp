// src/metrics/statistics.cpp
#include "market_ingest/metrics/statistics.hpp"
#include <algorithm>
#include <cmath>

namespace market_ingest {
namespace statistics {

Eigen::VectorXd to_vector(const std::vector<double>& values) {
    Eigen::VectorXd result(static_cast<Eigen::Index>(values.size()));
    for (size_t i = 0; i < values.size(); ++i) {
        result(static_cast<Eigen::Index>(i)) = values[i];
    }
    return result;
}

Result<double> percentile(const Eigen::VectorXd& values, double p) {
    if (values.size() == 0) {
        return make_error<double>(ErrorCode::COMPUTATION_SKIPPED,
                                  "Percentile of an empty series", "statistics");
    }
    if (!(p >= 0.0 && p <= 1.0)) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Percentile fraction must lie in [0, 1]", "statistics");
    }

    std::vector<double> sorted(values.data(), values.data() + values.size());
    std::sort(sorted.begin(), sorted.end());

    const double rank = p * static_cast<double>(sorted.size() - 1);
    const auto lower = static_cast<size_t>(std::floor(rank));
    const auto upper = static_cast<size_t>(std::ceil(rank));
    const double fraction = rank - static_cast<double>(lower);
    return Result<double>(sorted[lower] + (sorted[upper] - sorted[lower]) * fraction);
}

std::optional<double> trailing_mean(const Eigen::VectorXd& values, Eigen::Index window) {
    if (window <= 0 || values.size() < window) {
        return std::nullopt;
    }
    return values.tail(window).mean();
}

std::optional<WindowExtrema> trailing_extrema(const Eigen::VectorXd& values, Eigen::Index window,
                                              bool skip_non_positive) {
    if (window <= 0 || values.size() == 0) {
        return std::nullopt;
    }
    const Eigen::Index start = std::max<Eigen::Index>(0, values.size() - window);
    const auto tail = values.segment(start, values.size() - start);

    WindowExtrema result;
    Eigen::Index counted = 0;
    double sum = 0.0;
    for (Eigen::Index i = 0; i < tail.size(); ++i) {
        const double value = tail(i);
        if (skip_non_positive && value <= 0.0) {
            continue;
        }
        if (counted == 0 || value > result.max) {
            result.max = value;
            result.max_index = start + i;
        }
        if (counted == 0 || value < result.min) {
            result.min = value;
            result.min_index = start + i;
        }
        sum += value;
        ++counted;
    }
    if (counted == 0) {
        return std::nullopt;
    }
    result.mean = sum / static_cast<double>(counted);
    return result;
}

}  // namespace statistics
}  // namespace market_ingest
