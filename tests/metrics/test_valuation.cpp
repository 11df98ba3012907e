#include <gtest/gtest.h>
#include "market_ingest/metrics/valuation.hpp"

using namespace market_ingest;

TEST(ValuationTest, PriceBandUsesPercentiles) {
    auto band = valuation::price_band({10.0, 20.0, 30.0, 40.0, 50.0});
    EXPECT_DOUBLE_EQ(band.cheap, 18.0);
    EXPECT_DOUBLE_EQ(band.fair, 30.0);
    EXPECT_DOUBLE_EQ(band.expensive, 42.0);
    EXPECT_FALSE(valuation::price_band({}).valid());
}

TEST(ValuationTest, DividendBandScalesAverageDividend) {
    auto band = valuation::dividend_band({2.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(band.cheap, 45.0);
    EXPECT_DOUBLE_EQ(band.fair, 60.0);
    EXPECT_DOUBLE_EQ(band.expensive, 90.0);
    EXPECT_FALSE(valuation::dividend_band({0.0}).valid());
}

TEST(ValuationTest, EpsBandFallsBackToDefaultPayout) {
    auto with_history = valuation::eps_band(10.0, {40.0, 60.0, 0.0}, 70.0);
    EXPECT_DOUBLE_EQ(with_history.fair, 10.0 * 0.5 * 20.0);

    auto without_history = valuation::eps_band(10.0, {}, 70.0);
    EXPECT_DOUBLE_EQ(without_history.cheap, 10.0 * 0.7 * 15.0);

    EXPECT_FALSE(valuation::eps_band(-2.0, {50.0}, 70.0).valid());
}

TEST(ValuationTest, PbrAndPerBands) {
    auto pbr = valuation::pbr_band({1.0, 2.0, 3.0, 4.0, 5.0}, 10.0);
    EXPECT_DOUBLE_EQ(pbr.cheap, 18.0);
    EXPECT_DOUBLE_EQ(pbr.fair, 30.0);
    EXPECT_FALSE(valuation::pbr_band({1.0}, 0.0).valid());

    // P10 of 11 values at rank 1.0
    auto per = valuation::per_band({10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20}, {2.0, 4.0});
    EXPECT_DOUBLE_EQ(per.cheap, 11.0 * 3.0);
    EXPECT_DOUBLE_EQ(per.fair, 15.0 * 3.0);
    EXPECT_DOUBLE_EQ(per.expensive, 18.0 * 3.0);
}

TEST(ValuationTest, CombineRenormalisesOverValidEstimators) {
    EstimateBand band;
    band.price = Triplet{10.0, 20.0, 30.0};
    band.pbr = Triplet{20.0, 40.0, 60.0};
    // Only price (0.2) and pbr (0.2) are valid, so each counts half
    auto combined = valuation::combine(band, EstimatorWeights{});
    EXPECT_DOUBLE_EQ(combined.cheap, 15.0);
    EXPECT_DOUBLE_EQ(combined.fair, 30.0);
    EXPECT_DOUBLE_EQ(combined.expensive, 45.0);

    EXPECT_FALSE(valuation::combine(EstimateBand{}, EstimatorWeights{}).valid());
}

TEST(ValuationTest, PriceDistance) {
    Triplet band{100.0, 150.0, 200.0};
    EXPECT_DOUBLE_EQ(valuation::price_distance(125.0, band), 50.0);
    EXPECT_DOUBLE_EQ(valuation::price_distance(90.0, band), -20.0);
    EXPECT_DOUBLE_EQ(valuation::price_distance(90.0, Triplet{100.0, 100.0, 100.0}), 0.0);
}

TEST(ValuationTest, ClassifyAgainstBand) {
    Triplet band{100.0, 150.0, 200.0};
    EXPECT_EQ(classify(100.0, band), ValuationClass::UNDERVALUED);
    EXPECT_EQ(classify(150.0, band), ValuationClass::FAIR);
    EXPECT_EQ(classify(180.0, band), ValuationClass::OVERVALUED);
    EXPECT_EQ(classify(250.0, band), ValuationClass::HIGHLY_OVERVALUED);
    EXPECT_EQ(classify(120.0, Triplet{}), ValuationClass::UNKNOWN);
}

TEST(ValuationTest, EstimateAssemblesEveryBand) {
    ValuationInputs inputs;
    inputs.closing_prices = {10.0, 20.0, 30.0, 40.0, 50.0};
    inputs.annual_dividends = {1.0, 1.0};
    inputs.eps_last_four_quarters = 2.0;
    inputs.payout_ratios = {50.0};
    inputs.year_count = 5;

    auto band = valuation::estimate("2330", Date(2024, 6, 3), 30.0, inputs, EstimatorWeights{},
                                    70.0);
    EXPECT_EQ(band.code, "2330");
    EXPECT_EQ(band.year_count, 5);
    EXPECT_TRUE(band.price.valid());
    EXPECT_TRUE(band.dividend.valid());
    EXPECT_TRUE(band.eps.valid());
    EXPECT_FALSE(band.pbr.valid());
    EXPECT_FALSE(band.per.valid());

    // price 0.2, dividend 0.29, eps 0.3 -> weights sum 0.79
    const double fair = (30.0 * 0.2 + 20.0 * 0.29 + 20.0 * 0.3) / 0.79;
    EXPECT_NEAR(band.combined.fair, fair, 1e-9);
    EXPECT_NEAR(band.percentage, valuation::price_distance(30.0, band.combined), 1e-12);
}
