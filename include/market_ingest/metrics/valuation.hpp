// include/market_ingest/metrics/valuation.hpp
#pragma once

#include <vector>
#include "market_ingest/data/entities.hpp"

namespace market_ingest {

/**
 * @brief Share of each estimator in the combined band
 */
struct EstimatorWeights {
    double price{0.2};
    double dividend{0.29};
    double eps{0.3};
    double pbr{0.2};
    double per{0.01};
};

/**
 * @brief Historical inputs of one security's valuation, already windowed
 * to the lookback period
 */
struct ValuationInputs {
    std::vector<double> closing_prices;
    std::vector<double> price_to_book_ratios;   // positive observations only
    std::vector<double> price_earning_ratios;   // positive observations only
    std::vector<double> annual_dividends;       // one total per distribution year
    std::vector<double> annual_eps;             // one total per fiscal year
    std::vector<double> payout_ratios;          // percent, one per dividend year
    double eps_last_four_quarters{0.0};
    double book_value_per_share{0.0};
    int year_count{0};
};

namespace valuation {

/// Multiples approximating target yields of 6.6%, 5% and 3.3%
constexpr double CHEAP_MULTIPLE = 15.0;
constexpr double FAIR_MULTIPLE = 20.0;
constexpr double EXPENSIVE_MULTIPLE = 30.0;

/**
 * @brief P20 / P50 / P80 of historical closing prices
 */
Triplet price_band(const std::vector<double>& closing_prices);

/**
 * @brief Average annual dividend times 15 / 20 / 30
 */
Triplet dividend_band(const std::vector<double>& annual_dividends);

/**
 * @brief Trailing four-quarter EPS times average payout ratio times 15 / 20 / 30
 * @param default_payout_ratio Percent used when no payout history exists
 */
Triplet eps_band(double eps_last_four_quarters, const std::vector<double>& payout_ratios,
                 double default_payout_ratio);

/**
 * @brief P20 / P50 / P80 of historical P/B times current book value per share
 */
Triplet pbr_band(const std::vector<double>& price_to_book_ratios, double book_value_per_share);

/**
 * @brief P10 / P50 / P80 of historical P/E times historical average annual EPS
 */
Triplet per_band(const std::vector<double>& price_earning_ratios,
                 const std::vector<double>& annual_eps);

/**
 * @brief Weighted combination over the estimators that produced a valid band
 *
 * Weights are renormalised over the valid estimators; with none valid the
 * result is all zero.
 */
Triplet combine(const EstimateBand& band, const EstimatorWeights& weights);

/**
 * @brief (close - cheap) / (fair - cheap) as a percentage, 0 when undefined
 */
double price_distance(Price close, const Triplet& band);

/**
 * @brief Full band for one security on one date
 */
EstimateBand estimate(const std::string& code, const Date& date, Price close,
                      const ValuationInputs& inputs, const EstimatorWeights& weights,
                      double default_payout_ratio);

}  // namespace valuation
}  // namespace market_ingest
