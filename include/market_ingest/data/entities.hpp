// include/market_ingest/data/entities.hpp
#pragma once

#include <optional>
#include <string>
#include <tuple>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/types.hpp"

namespace market_ingest {

/**
 * @brief Listed or OTC instrument, keyed by its stable code
 */
struct Security {
    std::string code;
    std::string name;
    int market_id{0};
    int industry_id{0};
    bool suspended{false};
    Shares issued_shares{0};
    double book_value_per_share{0.0};
    double eps_last_quarter{0.0};
    double eps_last_four_quarters{0.0};
    double return_on_equity{0.0};
    Shares foreign_shares_held{0};
    double foreign_holding_percentage{0.0};
    double weight{0.0};
    Timestamp created_time{};
    Timestamp updated_time{};
};

/**
 * @brief Partial security update delivered by a refresh source
 *
 * Only engaged fields overwrite the stored row.
 */
struct SecurityPatch {
    std::string code;
    std::optional<std::string> name;
    std::optional<int> market_id;
    std::optional<int> industry_id;
    std::optional<bool> suspended;
    std::optional<Shares> issued_shares;
    std::optional<double> book_value_per_share;
    std::optional<double> eps_last_quarter;
    std::optional<double> eps_last_four_quarters;
    std::optional<double> return_on_equity;
    std::optional<Shares> foreign_shares_held;
    std::optional<double> foreign_holding_percentage;
    std::optional<double> weight;
};

struct QuoteKey {
    std::string code;
    Date date;

    bool operator<(const QuoteKey& other) const {
        return std::tie(code, date) < std::tie(other.code, other.date);
    }
    bool operator==(const QuoteKey& other) const {
        return code == other.code && date == other.date;
    }
};

/**
 * @brief Fields of a daily quote derived from the stored quote history
 */
struct QuoteMetrics {
    double moving_average_5{0.0};
    double moving_average_10{0.0};
    double moving_average_20{0.0};
    double moving_average_60{0.0};
    double moving_average_120{0.0};
    double moving_average_240{0.0};
    double year_high{0.0};
    std::optional<Date> year_high_date;
    double year_low{0.0};
    std::optional<Date> year_low_date;
    double year_average{0.0};
    double year_high_pbr{0.0};
    std::optional<Date> year_high_pbr_date;
    double year_low_pbr{0.0};
    std::optional<Date> year_low_pbr_date;
    double price_to_book_ratio{0.0};

    /**
     * @brief Storage slot of the moving average for a window
     * @return nullptr for a window without a column
     */
    double* moving_average_slot(int window);
    double moving_average(int window) const;
};

/**
 * @brief One trading day of a security
 */
struct DailyQuote {
    std::string code;
    Date date;
    Shares trading_volume{0};
    int64_t transactions{0};
    double trade_value{0.0};
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    Price change{0.0};
    double change_range{0.0};
    Price last_bid_price{0.0};
    Shares last_bid_volume{0};
    Price last_ask_price{0.0};
    Shares last_ask_volume{0};
    double price_earning_ratio{0.0};
    QuoteMetrics metrics;
    Timestamp created_time{};
    Timestamp updated_time{};

    QuoteKey key() const {
        return QuoteKey{code, date};
    }
};

/**
 * @brief Dividend period: "A" for the full year, Q1..Q4 or H1..H2
 */
bool is_valid_dividend_period(const std::string& period);

struct DividendKey {
    std::string code;
    int year{0};
    std::string period;

    bool operator<(const DividendKey& other) const {
        return std::tie(code, year, period) < std::tie(other.code, other.year, other.period);
    }
    bool operator==(const DividendKey& other) const {
        return code == other.code && year == other.year && period == other.period;
    }
};

struct Dividend {
    std::string code;
    int year{0};              // year the dividend is distributed
    int year_of_dividend{0};  // fiscal year whose earnings are distributed
    std::string period{"A"};
    double earnings_cash{0.0};
    double capital_reserve_cash{0.0};
    double cash_dividend{0.0};
    double earnings_stock{0.0};
    double capital_reserve_stock{0.0};
    double stock_dividend{0.0};
    double sum{0.0};
    std::optional<Date> ex_dividend_date;
    std::optional<Date> ex_rights_date;
    std::optional<Date> payable_date_cash;
    std::optional<Date> payable_date_stock;
    double payout_ratio_cash{0.0};
    double payout_ratio_stock{0.0};
    double payout_ratio{0.0};
    bool correction{false};  // source marks a corrective restatement
    Timestamp created_time{};
    Timestamp updated_time{};

    DividendKey key() const {
        return DividendKey{code, year, period};
    }

    /**
     * @brief Latest payable date, if any payable date is known
     */
    std::optional<Date> last_payable_date() const;
};

struct StatementKey {
    std::string code;
    int year{0};
    std::string quarter;

    bool operator<(const StatementKey& other) const {
        return std::tie(code, year, quarter) < std::tie(other.code, other.year, other.quarter);
    }
};

/**
 * @brief Quarter of a financial statement: Q1..Q4, or "A" for the annual report
 */
bool is_valid_statement_quarter(const std::string& quarter);

struct FinancialStatement {
    std::string code;
    int year{0};
    std::string quarter;
    double gross_profit{0.0};
    double operating_profit_margin{0.0};
    double pre_tax_income{0.0};
    double net_income{0.0};
    double book_value_per_share{0.0};
    double sales_per_share{0.0};
    double earnings_per_share{0.0};
    double profit_before_tax{0.0};
    double return_on_equity{0.0};
    double return_on_assets{0.0};
    Timestamp created_time{};
    Timestamp updated_time{};

    StatementKey key() const {
        return StatementKey{code, year, quarter};
    }
};

struct RevenueRecord {
    std::string code;
    YearMonth month{0};
    double monthly{0.0};
    double last_month{0.0};
    double last_year_this_month{0.0};
    double monthly_accumulated{0.0};
    double last_year_monthly_accumulated{0.0};
    double compared_with_last_month{0.0};            // %
    double compared_with_last_year_same_month{0.0};  // %
    double accumulated_compared_with_last_year{0.0};  // %
    Price avg_price{0.0};
    Price lowest_price{0.0};
    Price highest_price{0.0};
    Timestamp created_time{};
    Timestamp updated_time{};
};

/**
 * @brief Last month of revenue applied for a security
 */
struct RevenueCursor {
    std::string code;
    YearMonth month{0};
};

struct MarketIndex {
    std::string code;  // e.g. TAIEX
    Date date;
    double value{0.0};
    double change{0.0};
    double change_range{0.0};
    Shares trade_volume{0};
    double trade_value{0.0};
    int64_t transactions{0};
    Timestamp created_time{};
    Timestamp updated_time{};
};

/**
 * @brief All-time extremes of a security, merged monotonically
 */
struct QuoteHistoryRecord {
    std::string code;
    Price max_price{0.0};
    std::optional<Date> max_price_date;
    Price min_price{0.0};
    std::optional<Date> min_price_date;
    double max_price_to_book{0.0};
    std::optional<Date> max_price_to_book_date;
    double min_price_to_book{0.0};
    std::optional<Date> min_price_to_book_date;
    Timestamp created_time{};
    Timestamp updated_time{};
};

struct Triplet {
    Price cheap{0.0};
    Price fair{0.0};
    Price expensive{0.0};

    bool valid() const {
        return cheap > 0.0 && fair > 0.0 && expensive > 0.0;
    }
};

/**
 * @brief Valuation band of a security on a date
 */
struct EstimateBand {
    std::string code;
    Date date;
    Price closing_price{0.0};
    double percentage{0.0};
    Triplet combined;
    Triplet price;
    Triplet dividend;
    Triplet eps;
    Triplet pbr;
    Triplet per;
    int year_count{0};
    Timestamp updated_time{};
};

enum class ValuationClass { UNKNOWN, UNDERVALUED, FAIR, OVERVALUED, HIGHLY_OVERVALUED };

/**
 * @brief Classify a closing price against a valuation band
 */
ValuationClass classify(Price close, const Triplet& band);

struct YieldRecord {
    Date date;
    std::string code;
    double yield{0.0};  // cash dividend / closing price
    QuoteKey quote;
    DividendKey dividend;
    Timestamp updated_time{};
};

struct PayoutRatio {
    std::string code;
    int year{0};
    std::string period;
    double eps{0.0};
    double payout_ratio_cash{0.0};
    double payout_ratio_stock{0.0};
    double payout_ratio{0.0};
    Timestamp updated_time{};
};

/**
 * @brief A member's holding lot of one security
 */
struct StockOwnership {
    int64_t id{0};
    std::string member_id;
    std::string code;
    Shares share_quantity{0};
    Price share_price_average{0.0};  // unit cost
    double holding_cost{0.0};        // negative of shares * unit cost
    bool is_sold{false};
    double cumulate_dividends_cash{0.0};
    double cumulate_dividends_stock{0.0};
    double cumulate_dividends_stock_money{0.0};
    double cumulate_dividends_total{0.0};
    Date purchase_date;
    Timestamp created_time{};
    Timestamp updated_time{};
};

struct DailyMoneyHistory {
    std::string member_id;
    Date date;
    double market_value{0.0};
    double cost{0.0};
    double profit_and_loss{0.0};
    double profit_and_loss_percentage{0.0};
    double previous_day_market_value{0.0};
    double previous_day_profit_and_loss{0.0};
    double previous_day_profit_and_loss_percentage{0.0};
    Timestamp updated_time{};
};

struct DailyMoneyHistoryDetail {
    std::string member_id;
    Date date;
    std::string code;
    Price closing_price{0.0};
    Shares total_shares{0};
    double cost{0.0};
    double average_unit_price_per_share{0.0};
    double market_value{0.0};
    double ratio{0.0};  // share of the member's market value, %
    double profit_and_loss{0.0};
    double profit_and_loss_percentage{0.0};
    double previous_day_market_value{0.0};
    double previous_day_profit_and_loss{0.0};
    double previous_day_profit_and_loss_percentage{0.0};
    Timestamp updated_time{};
};

/**
 * @brief Market breadth counts for a date; market_id 0 aggregates all markets
 */
struct DailyMarketStats {
    Date date;
    int market_id{0};
    int total{0};
    int undervalued{0};
    int fair_valued{0};
    int overvalued{0};
    int highly_overvalued{0};
    int above_ma5{0};
    int below_ma5{0};
    int above_ma20{0};
    int below_ma20{0};
    int above_ma60{0};
    int below_ma60{0};
    int above_ma120{0};
    int below_ma120{0};
    int above_ma240{0};
    int below_ma240{0};
    int stocks_up{0};
    int stocks_down{0};
    int stocks_unchanged{0};
    Timestamp updated_time{};
};

enum class JobRunStatus { RUNNING, SUCCEEDED, FAILED };

std::string job_run_status_to_string(JobRunStatus status);
JobRunStatus string_to_job_run_status(const std::string& status);

/**
 * @brief Ledger row for one (job, business date) run
 */
struct JobRun {
    std::string job_name;
    Date business_date;
    JobRunStatus status{JobRunStatus::RUNNING};
    int attempts{0};
    Timestamp started_at{};
    Timestamp finished_at{};
    std::string summary;
};

}  // namespace market_ingest
