// src/metrics/valuation.cpp
#include "market_ingest/metrics/valuation.hpp"
#include <numeric>
#include "market_ingest/metrics/statistics.hpp"

namespace market_ingest {
namespace valuation {

namespace {

Triplet percentile_band(const std::vector<double>& values, double low, double mid, double high,
                        double scale) {
    if (values.empty() || scale <= 0.0) {
        return Triplet{};
    }
    auto vec = statistics::to_vector(values);
    auto cheap = statistics::percentile(vec, low);
    auto fair = statistics::percentile(vec, mid);
    auto expensive = statistics::percentile(vec, high);
    if (cheap.is_error() || fair.is_error() || expensive.is_error()) {
        return Triplet{};
    }
    return Triplet{cheap.value() * scale, fair.value() * scale, expensive.value() * scale};
}

Triplet multiple_band(double base) {
    if (base <= 0.0) {
        return Triplet{};
    }
    return Triplet{base * CHEAP_MULTIPLE, base * FAIR_MULTIPLE, base * EXPENSIVE_MULTIPLE};
}

double average(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

}  // namespace

Triplet price_band(const std::vector<double>& closing_prices) {
    return percentile_band(closing_prices, 0.2, 0.5, 0.8, 1.0);
}

Triplet dividend_band(const std::vector<double>& annual_dividends) {
    return multiple_band(average(annual_dividends));
}

Triplet eps_band(double eps_last_four_quarters, const std::vector<double>& payout_ratios,
                 double default_payout_ratio) {
    std::vector<double> positive;
    for (double ratio : payout_ratios) {
        if (ratio > 0.0) {
            positive.push_back(ratio);
        }
    }
    double payout = positive.empty() ? default_payout_ratio : average(positive);
    return multiple_band(eps_last_four_quarters * payout / 100.0);
}

Triplet pbr_band(const std::vector<double>& price_to_book_ratios, double book_value_per_share) {
    return percentile_band(price_to_book_ratios, 0.2, 0.5, 0.8, book_value_per_share);
}

Triplet per_band(const std::vector<double>& price_earning_ratios,
                 const std::vector<double>& annual_eps) {
    return percentile_band(price_earning_ratios, 0.1, 0.5, 0.8, average(annual_eps));
}

Triplet combine(const EstimateBand& band, const EstimatorWeights& weights) {
    const std::pair<const Triplet*, double> parts[] = {{&band.price, weights.price},
                                                       {&band.dividend, weights.dividend},
                                                       {&band.eps, weights.eps},
                                                       {&band.pbr, weights.pbr},
                                                       {&band.per, weights.per}};
    Triplet combined;
    double total_weight = 0.0;
    for (const auto& [triplet, weight] : parts) {
        if (!triplet->valid() || weight <= 0.0) {
            continue;
        }
        combined.cheap += triplet->cheap * weight;
        combined.fair += triplet->fair * weight;
        combined.expensive += triplet->expensive * weight;
        total_weight += weight;
    }
    if (total_weight <= 0.0) {
        return Triplet{};
    }
    combined.cheap /= total_weight;
    combined.fair /= total_weight;
    combined.expensive /= total_weight;
    return combined;
}

double price_distance(Price close, const Triplet& band) {
    if (band.fair == band.cheap) {
        return 0.0;
    }
    return (close - band.cheap) / (band.fair - band.cheap) * 100.0;
}

EstimateBand estimate(const std::string& code, const Date& date, Price close,
                      const ValuationInputs& inputs, const EstimatorWeights& weights,
                      double default_payout_ratio) {
    EstimateBand band;
    band.code = code;
    band.date = date;
    band.closing_price = close;
    band.year_count = inputs.year_count;
    band.price = price_band(inputs.closing_prices);
    band.dividend = dividend_band(inputs.annual_dividends);
    band.eps =
        eps_band(inputs.eps_last_four_quarters, inputs.payout_ratios, default_payout_ratio);
    band.pbr = pbr_band(inputs.price_to_book_ratios, inputs.book_value_per_share);
    band.per = per_band(inputs.price_earning_ratios, inputs.annual_eps);
    band.combined = combine(band, weights);
    band.percentage = band.combined.valid() ? price_distance(close, band.combined) : 0.0;
    return band;
}

}  // namespace valuation
}  // namespace market_ingest
