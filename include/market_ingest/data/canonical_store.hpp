// include/market_ingest/data/canonical_store.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/error.hpp"
#include "market_ingest/data/entities.hpp"
#include "market_ingest/ingest/merge_policy.hpp"

namespace market_ingest {

struct MergeOutcome {
    MergeAction action{MergeAction::UNCHANGED};
    std::string reason;
};

/**
 * @brief Durable keyed tables of the pipeline
 *
 * Every merge_* call is one atomic per-key read-modify-write that applies the
 * matching function from merge_policy.hpp. put_* calls overwrite derived rows
 * on their natural key. Natural keys are unique in every backend.
 */
class CanonicalStore {
public:
    virtual ~CanonicalStore() = default;

    virtual Result<void> connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
    virtual std::string backend_name() const = 0;

    // Source entities
    virtual Result<MergeOutcome> merge_security(const SecurityPatch& patch,
                                                const MergeContext& ctx) = 0;
    virtual Result<MergeOutcome> merge_daily_quote(const DailyQuote& quote,
                                                   const MergeContext& ctx) = 0;
    virtual Result<MergeOutcome> merge_dividend(const Dividend& dividend,
                                                const MergeContext& ctx) = 0;
    virtual Result<MergeOutcome> merge_financial_statement(const FinancialStatement& statement,
                                                           const MergeContext& ctx) = 0;
    virtual Result<MergeOutcome> merge_revenue(const RevenueRecord& revenue,
                                               const MergeContext& ctx) = 0;
    virtual Result<MergeOutcome> merge_market_index(const MarketIndex& index,
                                                    const MergeContext& ctx) = 0;
    virtual Result<MergeOutcome> merge_quote_history(const HistoryCandidate& candidate,
                                                     const MergeContext& ctx) = 0;

    /**
     * @brief Insert a holding lot, or overwrite it when lot.id is set
     * @return The lot id
     */
    virtual Result<int64_t> put_ownership(const StockOwnership& lot) = 0;

    // Derived tables
    virtual Result<MergeAction> update_quote_metrics(const QuoteKey& key,
                                                     const QuoteMetrics& metrics,
                                                     Timestamp now) = 0;
    virtual Result<void> put_estimate(const EstimateBand& band) = 0;
    virtual Result<void> put_yield(const YieldRecord& record) = 0;
    virtual Result<void> put_payout_ratio(const PayoutRatio& ratio) = 0;

    /**
     * @brief Replace a member's snapshot and its per-security details atomically
     */
    virtual Result<void> put_money_snapshot(const DailyMoneyHistory& summary,
                                            const std::vector<DailyMoneyHistoryDetail>& details) = 0;
    virtual Result<void> put_market_stats(const DailyMarketStats& stats) = 0;

    // Readers
    virtual Result<std::optional<Security>> get_security(const std::string& code) const = 0;
    virtual Result<std::vector<Security>> list_securities() const = 0;

    virtual Result<std::optional<DailyQuote>> get_daily_quote(const QuoteKey& key) const = 0;

    /**
     * @brief Up to limit most recent quotes dated on or before up_to, oldest first
     */
    virtual Result<std::vector<DailyQuote>> get_recent_quotes(const std::string& code,
                                                              const Date& up_to,
                                                              size_t limit) const = 0;

    /**
     * @brief Quotes with from <= date <= to, oldest first
     */
    virtual Result<std::vector<DailyQuote>> get_quotes_between(const std::string& code,
                                                               const Date& from,
                                                               const Date& to) const = 0;
    virtual Result<std::vector<DailyQuote>> get_quotes_on(const Date& date) const = 0;

    /**
     * @brief Most recent quote per requested code; unknown codes are omitted
     */
    virtual Result<std::vector<DailyQuote>> get_latest_quotes(
        const std::vector<std::string>& codes) const = 0;
    virtual Result<std::optional<DailyQuote>> get_latest_quote_on_or_before(
        const std::string& code, const Date& date) const = 0;

    virtual Result<std::optional<Dividend>> get_dividend(const DividendKey& key) const = 0;
    virtual Result<std::vector<Dividend>> get_dividends(const std::string& code) const = 0;
    virtual Result<std::vector<Dividend>> list_dividends() const = 0;

    virtual Result<std::vector<FinancialStatement>> get_financial_statements(
        const std::string& code) const = 0;

    virtual Result<std::optional<RevenueRecord>> get_revenue(const std::string& code,
                                                             YearMonth month) const = 0;
    virtual Result<std::optional<RevenueCursor>> get_revenue_cursor(
        const std::string& code) const = 0;

    virtual Result<std::optional<MarketIndex>> get_market_index(const std::string& code,
                                                                const Date& date) const = 0;
    virtual Result<std::optional<QuoteHistoryRecord>> get_quote_history_record(
        const std::string& code) const = 0;

    virtual Result<std::optional<EstimateBand>> get_estimate(const std::string& code,
                                                             const Date& date) const = 0;
    virtual Result<std::vector<EstimateBand>> get_estimates_on(const Date& date) const = 0;
    virtual Result<std::optional<YieldRecord>> get_yield(const Date& date,
                                                         const std::string& code) const = 0;
    virtual Result<std::vector<YieldRecord>> get_yields_on(const Date& date) const = 0;
    virtual Result<std::vector<PayoutRatio>> get_payout_ratios(const std::string& code) const = 0;

    /**
     * @brief Unsold lots purchased on or before the date
     */
    virtual Result<std::vector<StockOwnership>> list_open_lots(const Date& as_of) const = 0;

    virtual Result<std::optional<DailyMoneyHistory>> get_money_history(
        const std::string& member_id, const Date& date) const = 0;

    /**
     * @brief Latest snapshot of every member dated strictly before the date
     */
    virtual Result<std::vector<DailyMoneyHistory>> get_latest_money_histories_before(
        const Date& date) const = 0;
    virtual Result<std::vector<DailyMoneyHistoryDetail>> get_money_history_details(
        const std::string& member_id, const Date& date) const = 0;

    /**
     * @brief Latest per-security detail row of a member dated strictly before the date
     */
    virtual Result<std::optional<DailyMoneyHistoryDetail>> get_previous_money_history_detail(
        const std::string& member_id, const std::string& code, const Date& date) const = 0;

    virtual Result<std::optional<DailyMarketStats>> get_market_stats(const Date& date,
                                                                     int market_id) const = 0;

    // Job-run ledger
    virtual Result<void> record_job_run(const JobRun& run) = 0;
    virtual Result<std::optional<JobRun>> get_job_run(const std::string& job_name,
                                                      const Date& business_date) const = 0;
};

}  // namespace market_ingest
