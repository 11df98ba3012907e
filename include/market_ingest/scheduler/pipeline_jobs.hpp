// include/market_ingest/scheduler/pipeline_jobs.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "market_ingest/ingest/fetch_orchestrator.hpp"
#include "market_ingest/ingest/upsert_merger.hpp"
#include "market_ingest/metrics/metrics_engine.hpp"
#include "market_ingest/portfolio/snapshot_engine.hpp"
#include "market_ingest/scheduler/scheduler.hpp"

namespace market_ingest {

namespace jobs {
constexpr const char* CLOSING_AGGREGATE = "closing_aggregate";
constexpr const char* REFRESH_EMERGING_BOOK_VALUE = "refresh_emerging_book_value";
constexpr const char* REFRESH_PAYOUT_RATIO = "refresh_payout_ratio";
constexpr const char* REFRESH_QUARTER_FINANCIALS = "refresh_quarter_financials";
constexpr const char* REFRESH_ANNUAL_FINANCIALS = "refresh_annual_financials";
constexpr const char* REFRESH_TRAILING_EPS = "refresh_trailing_eps";
constexpr const char* REFRESH_REVENUE = "refresh_revenue";
constexpr const char* REFRESH_SECURITY_WEIGHTS = "refresh_security_weights";
constexpr const char* REFRESH_DIVIDENDS = "refresh_dividends";
constexpr const char* REFRESH_FOREIGN_HOLDINGS = "refresh_foreign_holdings";
}  // namespace jobs

namespace datasets {
constexpr const char* QUOTES = "quotes";
constexpr const char* INDICES = "indices";
constexpr const char* EMERGING_BOOK_VALUE = "emerging_book_value";
constexpr const char* QUARTER_FINANCIALS = "quarter_financials";
constexpr const char* ANNUAL_FINANCIALS = "annual_financials";
constexpr const char* REVENUES = "revenues";
constexpr const char* SECURITY_WEIGHTS = "security_weights";
constexpr const char* DIVIDENDS = "dividends";
constexpr const char* FOREIGN_HOLDINGS = "foreign_holdings";
}  // namespace datasets

/**
 * @brief Last-quarter and trailing four-quarter EPS from stored statements
 */
struct TrailingEps {
    double last_quarter{0.0};
    std::optional<double> last_four_quarters;  // set only with four quarters stored
};

/**
 * @brief Derive trailing EPS from the quarterly statements of one security
 * @return nullopt without any quarterly statement
 */
std::optional<TrailingEps> trailing_eps(std::vector<FinancialStatement> statements);

/**
 * @brief Fetch and merge counts of one dataset refresh
 */
struct IngestSummary {
    std::string dataset;
    size_t targets{0};
    size_t fetch_failures{0};
    MergeReport merge;

    std::string to_string() const;
};

/**
 * @brief The daily jobs of the pipeline, wired over one store
 *
 * Sources are bound per dataset. A dataset bound per security fans out one
 * fetch target per listed, non-suspended security; otherwise a single
 * whole-market target is fetched for the business date.
 */
class IngestPipeline {
public:
    IngestPipeline(std::shared_ptr<CanonicalStore> store, FetchConfig fetch_config,
                   MetricsConfig metrics_config);

    void bind_source(const std::string& dataset, SourceAdapter source, bool per_security = false);
    bool has_source(const std::string& dataset) const;

    /**
     * @brief Fetch a dataset for the date and merge everything it returns
     * @return NOT_INITIALIZED when no source is bound, FETCH_ERROR when every
     * target failed
     */
    Result<IngestSummary> ingest(const std::string& dataset, const Date& date,
                                 const MergeContext& ctx);

    /**
     * @brief 15:00 closing run
     *
     * Quotes and indices are merged first; with no quote stored for the date
     * the run stops there. Otherwise quote metrics, valuation bands, yields,
     * portfolio snapshots and market breadth follow in that order. Quotes
     * merged for earlier dates also refresh the metrics of the stored days
     * after them.
     */
    Result<std::string> closing_aggregate(const Date& date, const MergeContext& ctx);

    Result<std::string> refresh_payout_ratios(const Date& date, const MergeContext& ctx);
    Result<std::string> refresh_trailing_eps(const Date& date, const MergeContext& ctx);

    /**
     * @brief Register every job of the timetable with a scheduler
     */
    Result<void> register_jobs(Scheduler& scheduler);

    const std::shared_ptr<CanonicalStore>& store() const {
        return store_;
    }
    MetricsEngine& metrics() {
        return metrics_;
    }
    SnapshotEngine& snapshots() {
        return snapshots_;
    }

private:
    struct SourceBinding {
        SourceAdapter source;
        bool per_security{false};
    };

    Result<std::vector<std::string>> active_codes() const;
    Result<std::string> refresh(const std::string& dataset, const Date& date,
                                const MergeContext& ctx);

    std::shared_ptr<CanonicalStore> store_;
    std::shared_ptr<SecurityLockTable> locks_;
    FetchOrchestrator orchestrator_;
    UpsertMerger merger_;
    MetricsEngine metrics_;
    SnapshotEngine snapshots_;

    std::map<std::string, SourceBinding> sources_;
    mutable std::mutex sources_mutex_;
};

}  // namespace market_ingest
