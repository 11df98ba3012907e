#include <gtest/gtest.h>
#include "market_ingest/metrics/statistics.hpp"

using namespace market_ingest;
using namespace market_ingest::statistics;

TEST(StatisticsTest, PercentileInterpolatesBetweenOrderStatistics) {
    auto values = to_vector({10.0, 20.0, 30.0, 40.0, 50.0});
    EXPECT_DOUBLE_EQ(percentile(values, 0.0).value(), 10.0);
    EXPECT_DOUBLE_EQ(percentile(values, 0.5).value(), 30.0);
    EXPECT_DOUBLE_EQ(percentile(values, 1.0).value(), 50.0);
    // rank 0.2 * 4 = 0.8
    EXPECT_DOUBLE_EQ(percentile(values, 0.2).value(), 18.0);
    // rank 0.8 * 4 = 3.2
    EXPECT_DOUBLE_EQ(percentile(values, 0.8).value(), 42.0);
}

TEST(StatisticsTest, PercentileIgnoresInputOrder) {
    auto ordered = to_vector({1.0, 2.0, 3.0, 4.0, 7.0, 9.0});
    auto shuffled = to_vector({9.0, 3.0, 1.0, 7.0, 2.0, 4.0});
    for (double p : {0.1, 0.2, 0.5, 0.8}) {
        EXPECT_EQ(percentile(ordered, p).value(), percentile(shuffled, p).value()) << "p=" << p;
    }
}

TEST(StatisticsTest, PercentileOfSingleValue) {
    EXPECT_DOUBLE_EQ(percentile(to_vector({42.0}), 0.8).value(), 42.0);
}

TEST(StatisticsTest, PercentileErrors) {
    auto empty = percentile(Eigen::VectorXd(), 0.5);
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::COMPUTATION_SKIPPED);

    auto bad_fraction = percentile(to_vector({1.0, 2.0}), 1.5);
    ASSERT_TRUE(bad_fraction.is_error());
    EXPECT_EQ(bad_fraction.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(StatisticsTest, TrailingMeanNeedsFullWindow) {
    auto values = to_vector({1.0, 2.0, 3.0, 4.0, 5.0});
    EXPECT_DOUBLE_EQ(*trailing_mean(values, 5), 3.0);
    EXPECT_DOUBLE_EQ(*trailing_mean(values, 2), 4.5);
    EXPECT_FALSE(trailing_mean(values, 6).has_value());
    EXPECT_FALSE(trailing_mean(values, 0).has_value());
}

TEST(StatisticsTest, TrailingExtremaTracksPositions) {
    auto values = to_vector({50.0, 12.0, 15.0, 8.0, 15.0, 9.0});
    auto extrema = trailing_extrema(values, 5);
    ASSERT_TRUE(extrema.has_value());
    EXPECT_DOUBLE_EQ(extrema->max, 15.0);
    EXPECT_EQ(extrema->max_index, 2);  // earliest of the tied maxima
    EXPECT_DOUBLE_EQ(extrema->min, 8.0);
    EXPECT_EQ(extrema->min_index, 3);
    EXPECT_DOUBLE_EQ(extrema->mean, 11.8);
}

TEST(StatisticsTest, TrailingExtremaSkipsUnknownRatios) {
    auto values = to_vector({0.0, 1.5, 0.0, 1.2});
    auto extrema = trailing_extrema(values, 4, true);
    ASSERT_TRUE(extrema.has_value());
    EXPECT_DOUBLE_EQ(extrema->min, 1.2);
    EXPECT_EQ(extrema->min_index, 3);
    EXPECT_DOUBLE_EQ(extrema->mean, 1.35);

    EXPECT_FALSE(trailing_extrema(to_vector({0.0, -1.0}), 2, true).has_value());
}
