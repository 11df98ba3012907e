// include/market_ingest/data/postgres_store.hpp
#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "market_ingest/core/config_base.hpp"
#include "market_ingest/data/canonical_store.hpp"
#include "market_ingest/data/connection_pool.hpp"

namespace market_ingest {

/**
 * @brief PostgreSQL connection settings
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    int port{5432};
    std::string user{"postgres"};
    std::string password;
    std::string database{"market_ingest"};
    size_t pool_size{8};
    int connect_timeout_seconds{10};
    int max_retries{3};

    /**
     * @brief libpq keyword/value connection string
     */
    std::string connection_string() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Canonical store backed by PostgreSQL (see sql/schema.sql)
 *
 * Each merge runs in its own transaction: a transaction-scoped advisory lock
 * on the natural key, SELECT ... FOR UPDATE of the stored row, the shared
 * merge function, then INSERT ... ON CONFLICT DO UPDATE. Transient failures
 * are retried as DATABASE_ERROR; unique violations surface as CONFLICT_ERROR.
 */
class PostgresStore : public CanonicalStore {
public:
    explicit PostgresStore(DatabaseConfig config);
    ~PostgresStore() override;

    Result<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;
    std::string backend_name() const override {
        return "postgres";
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
    /**
     * @brief Run body inside one transaction on a pooled connection
     *
     * Retries DATABASE_ERROR up to config_.max_retries times. body receives
     * the open pqxx::work and returns the value to wrap; the transaction is
     * committed only when body returns normally.
     */
    template <typename T, typename Body>
    Result<T> with_transaction(const std::string& operation, Body body) const;

    Result<void> validate_connection() const;

    DatabaseConfig config_;
    std::unique_ptr<ConnectionPool> pool_;
    std::string component_id_;
    mutable std::mutex mutex_;
};

}  // namespace market_ingest
