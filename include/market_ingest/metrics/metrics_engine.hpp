// include/market_ingest/metrics/metrics_engine.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "market_ingest/core/config_base.hpp"
#include "market_ingest/data/canonical_store.hpp"
#include "market_ingest/ingest/security_lock.hpp"
#include "market_ingest/metrics/valuation.hpp"

namespace market_ingest {

struct MetricsConfig : public ConfigBase {
    int valuation_lookback_years{5};
    std::vector<int> moving_average_windows{5, 10, 20, 60, 120, 240};
    int extrema_window{240};
    double default_payout_ratio{70.0};
    int dividend_max_age_years{1};
    int workers{4};
    EstimatorWeights estimator_weights;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Counts of one metrics pass over a set of securities
 */
struct MetricsReport {
    size_t processed{0};
    size_t updated{0};
    size_t unchanged{0};
    size_t skipped{0};  // COMPUTATION_SKIPPED, not an error
    size_t failed{0};
    std::vector<std::string> failures;

    void add(const MetricsReport& other);
};

/**
 * @brief Annual EPS of a fiscal year: the "A" statement, else the sum of
 * Q1..Q4 when all four quarters are stored
 */
std::optional<double> annual_eps(const std::vector<FinancialStatement>& statements, int year);

/**
 * @brief Order yields for reporting: descending yield, then code
 */
std::vector<YieldRecord> rank_yields(std::vector<YieldRecord> yields);

/**
 * @brief Derived numeric fields computed from committed store data
 *
 * Reads source entities and writes only derived tables (quote metrics,
 * quote history, estimates, yields, payout ratios, market stats). Missing
 * inputs produce COMPUTATION_SKIPPED or zero fields, never a batch failure.
 */
class MetricsEngine {
public:
    MetricsEngine(std::shared_ptr<CanonicalStore> store, std::shared_ptr<SecurityLockTable> locks,
                  MetricsConfig config);
    ~MetricsEngine();

    /**
     * @brief Moving averages, 52-week extrema and P/B for a stored quote
     * @return COMPUTATION_SKIPPED when no quote exists for the date
     */
    Result<QuoteMetrics> compute_quote_metrics(const std::string& code, const Date& date) const;

    /**
     * @brief Compute, store and fold the day into the all-time history record
     *
     * Holds the security lock so the history read cannot race a quote merge.
     */
    Result<MergeAction> refresh_quote_metrics(const std::string& code, const Date& date,
                                              const MergeContext& ctx);

    /**
     * @brief Recompute the stored quotes whose trailing windows reach a quote
     * written out of date order
     *
     * Per security, the earliest written date and the rows after it, up to
     * the longest window, are refreshed oldest first under one hold of the
     * security lock. A security whose only affected row is `date` itself is
     * left to run_quote_metrics.
     */
    MetricsReport run_dependent_quote_metrics(const std::vector<QuoteKey>& written,
                                              const Date& date, const MergeContext& ctx);

    Result<ValuationInputs> collect_valuation_inputs(const std::string& code,
                                                     const Date& date) const;
    Result<EstimateBand> compute_estimate(const std::string& code, const Date& date) const;

    /**
     * @brief Yield of the latest annual dividend over that date's close
     * @return COMPUTATION_SKIPPED for a suspended security, or without a
     * quote on the date or an annual dividend within dividend_max_age_years
     */
    Result<YieldRecord> compute_yield(const std::string& code, const Date& date) const;

    Result<std::vector<PayoutRatio>> compute_payout_ratios(const std::string& code) const;

    Result<std::vector<DailyMarketStats>> compute_market_stats(const Date& date) const;

    // Batch passes over many securities on the configured worker count
    MetricsReport run_quote_metrics(const std::vector<std::string>& codes, const Date& date,
                                    const MergeContext& ctx);
    MetricsReport run_estimates(const std::vector<std::string>& codes, const Date& date,
                                const MergeContext& ctx);
    MetricsReport run_yields(const std::vector<std::string>& codes, const Date& date,
                             const MergeContext& ctx);
    MetricsReport run_payout_ratios(const std::vector<std::string>& codes,
                                    const MergeContext& ctx);
    Result<std::vector<DailyMarketStats>> run_market_stats(const Date& date,
                                                           const MergeContext& ctx);

    const MetricsConfig& config() const {
        return config_;
    }

private:
    size_t history_rows() const;
    Result<MergeAction> refresh_locked(const std::string& code, const Date& date,
                                       const MergeContext& ctx);

    std::shared_ptr<CanonicalStore> store_;
    std::shared_ptr<SecurityLockTable> locks_;
    MetricsConfig config_;
    std::string component_id_;
};

}  // namespace market_ingest
