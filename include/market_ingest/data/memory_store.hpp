// include/market_ingest/data/memory_store.hpp
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include "market_ingest/data/canonical_store.hpp"

namespace market_ingest {

/**
 * @brief Canonical store kept in process memory
 *
 * One mutex serialises every operation, so each merge is atomic. Natural
 * keys are the map keys, which makes duplicates unrepresentable.
 */
class MemoryStore : public CanonicalStore {
public:
    MemoryStore();
    ~MemoryStore() override;

    Result<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;
    std::string backend_name() const override {
        return "memory";
    }

    Result<MergeOutcome> merge_security(const SecurityPatch& patch,
                                        const MergeContext& ctx) override;
    Result<MergeOutcome> merge_daily_quote(const DailyQuote& quote,
                                           const MergeContext& ctx) override;
    Result<MergeOutcome> merge_dividend(const Dividend& dividend, const MergeContext& ctx) override;
    Result<MergeOutcome> merge_financial_statement(const FinancialStatement& statement,
                                                   const MergeContext& ctx) override;
    Result<MergeOutcome> merge_revenue(const RevenueRecord& revenue,
                                       const MergeContext& ctx) override;
    Result<MergeOutcome> merge_market_index(const MarketIndex& index,
                                            const MergeContext& ctx) override;
    Result<MergeOutcome> merge_quote_history(const HistoryCandidate& candidate,
                                             const MergeContext& ctx) override;
    Result<int64_t> put_ownership(const StockOwnership& lot) override;

    Result<MergeAction> update_quote_metrics(const QuoteKey& key, const QuoteMetrics& metrics,
                                             Timestamp now) override;
    Result<void> put_estimate(const EstimateBand& band) override;
    Result<void> put_yield(const YieldRecord& record) override;
    Result<void> put_payout_ratio(const PayoutRatio& ratio) override;
    Result<void> put_money_snapshot(const DailyMoneyHistory& summary,
                                    const std::vector<DailyMoneyHistoryDetail>& details) override;
    Result<void> put_market_stats(const DailyMarketStats& stats) override;

    Result<std::optional<Security>> get_security(const std::string& code) const override;
    Result<std::vector<Security>> list_securities() const override;
    Result<std::optional<DailyQuote>> get_daily_quote(const QuoteKey& key) const override;
    Result<std::vector<DailyQuote>> get_recent_quotes(const std::string& code, const Date& up_to,
                                                      size_t limit) const override;
    Result<std::vector<DailyQuote>> get_quotes_between(const std::string& code, const Date& from,
                                                       const Date& to) const override;
    Result<std::vector<DailyQuote>> get_quotes_on(const Date& date) const override;
    Result<std::vector<DailyQuote>> get_latest_quotes(
        const std::vector<std::string>& codes) const override;
    Result<std::optional<DailyQuote>> get_latest_quote_on_or_before(
        const std::string& code, const Date& date) const override;
    Result<std::optional<Dividend>> get_dividend(const DividendKey& key) const override;
    Result<std::vector<Dividend>> get_dividends(const std::string& code) const override;
    Result<std::vector<Dividend>> list_dividends() const override;
    Result<std::vector<FinancialStatement>> get_financial_statements(
        const std::string& code) const override;
    Result<std::optional<RevenueRecord>> get_revenue(const std::string& code,
                                                     YearMonth month) const override;
    Result<std::optional<RevenueCursor>> get_revenue_cursor(
        const std::string& code) const override;
    Result<std::optional<MarketIndex>> get_market_index(const std::string& code,
                                                        const Date& date) const override;
    Result<std::optional<QuoteHistoryRecord>> get_quote_history_record(
        const std::string& code) const override;
    Result<std::optional<EstimateBand>> get_estimate(const std::string& code,
                                                     const Date& date) const override;
    Result<std::vector<EstimateBand>> get_estimates_on(const Date& date) const override;
    Result<std::optional<YieldRecord>> get_yield(const Date& date,
                                                 const std::string& code) const override;
    Result<std::vector<YieldRecord>> get_yields_on(const Date& date) const override;
    Result<std::vector<PayoutRatio>> get_payout_ratios(const std::string& code) const override;
    Result<std::vector<StockOwnership>> list_open_lots(const Date& as_of) const override;
    Result<std::optional<DailyMoneyHistory>> get_money_history(const std::string& member_id,
                                                               const Date& date) const override;
    Result<std::vector<DailyMoneyHistory>> get_latest_money_histories_before(
        const Date& date) const override;
    Result<std::vector<DailyMoneyHistoryDetail>> get_money_history_details(
        const std::string& member_id, const Date& date) const override;
    Result<std::optional<DailyMoneyHistoryDetail>> get_previous_money_history_detail(
        const std::string& member_id, const std::string& code, const Date& date) const override;
    Result<std::optional<DailyMarketStats>> get_market_stats(const Date& date,
                                                             int market_id) const override;
    Result<void> record_job_run(const JobRun& run) override;
    Result<std::optional<JobRun>> get_job_run(const std::string& job_name,
                                              const Date& business_date) const override;

private:
    mutable std::mutex mutex_;
    bool connected_{false};
    std::string component_id_;

    std::map<std::string, Security> securities_;
    std::map<std::string, std::map<Date, DailyQuote>> quotes_;
    std::map<DividendKey, Dividend> dividends_;
    std::map<StatementKey, FinancialStatement> statements_;
    std::map<std::pair<std::string, YearMonth>, RevenueRecord> revenues_;
    std::map<std::string, RevenueCursor> revenue_cursors_;
    std::map<std::pair<std::string, Date>, MarketIndex> indices_;
    std::map<std::string, QuoteHistoryRecord> history_records_;
    std::map<std::pair<std::string, Date>, EstimateBand> estimates_;
    std::map<std::pair<Date, std::string>, YieldRecord> yields_;
    std::map<std::tuple<std::string, int, std::string>, PayoutRatio> payout_ratios_;
    std::map<int64_t, StockOwnership> lots_;
    int64_t next_lot_id_{1};
    std::map<std::pair<std::string, Date>, DailyMoneyHistory> money_history_;
    std::map<std::tuple<std::string, Date, std::string>, DailyMoneyHistoryDetail> money_details_;
    std::map<std::pair<Date, int>, DailyMarketStats> market_stats_;
    std::map<std::pair<std::string, Date>, JobRun> job_runs_;
};

}  // namespace market_ingest
