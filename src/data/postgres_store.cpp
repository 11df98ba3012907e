// src/data/postgres_store.cpp
#include "market_ingest/data/postgres_store.hpp"
#include <algorithm>
#include <sstream>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/retry.hpp"
#include "market_ingest/core/state_manager.hpp"

namespace market_ingest {

namespace {

const char* const COMPONENT = "PostgresStore";

// Thrown from inside a transaction body to abort it with a specific code
class StoreAbort : public std::runtime_error {
public:
    StoreAbort(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    ErrorCode code() const {
        return code_;
    }

private:
    ErrorCode code_;
};

double epoch_seconds(Timestamp ts) {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(double seconds) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(seconds)));
}

std::optional<std::string> date_param(const std::optional<Date>& date) {
    if (!date) {
        return std::nullopt;
    }
    return date->to_string();
}

Date read_date(const pqxx::field& field) {
    auto parsed = Date::parse(field.as<std::string>());
    if (!parsed) {
        throw StoreAbort(ErrorCode::PARSE_ERROR, "Unreadable date " + field.as<std::string>());
    }
    return *parsed;
}

std::optional<Date> read_optional_date(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return read_date(field);
}

Timestamp read_epoch(const pqxx::field& field) {
    if (field.is_null()) {
        return Timestamp{};
    }
    return from_epoch_seconds(field.as<double>());
}

void lock_key(pqxx::work& txn, const std::string& key) {
    txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", key);
}

template <typename Row, typename Reader>
std::optional<Row> first_row(const pqxx::result& result, Reader reader) {
    if (result.empty()) {
        return std::nullopt;
    }
    return reader(result[0]);
}

template <typename Row, typename Reader>
std::vector<Row> all_rows(const pqxx::result& result, Reader reader) {
    std::vector<Row> rows;
    rows.reserve(result.size());
    for (const auto& row : result) {
        rows.push_back(reader(row));
    }
    return rows;
}

const std::string TIMESTAMP_COLUMNS =
    "EXTRACT(EPOCH FROM created_time)::float8 AS created_epoch, "
    "EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch";

// ---- securities ----

const std::string SECURITY_SELECT =
    "SELECT code, name, market_id, industry_id, suspended, issued_shares, "
    "book_value_per_share, eps_last_quarter, eps_last_four_quarters, return_on_equity, "
    "foreign_shares_held, foreign_holding_percentage, weight, " +
    TIMESTAMP_COLUMNS + " FROM securities";

Security read_security(const pqxx::row& row) {
    Security s;
    s.code = row["code"].as<std::string>();
    s.name = row["name"].as<std::string>();
    s.market_id = row["market_id"].as<int>();
    s.industry_id = row["industry_id"].as<int>();
    s.suspended = row["suspended"].as<bool>();
    s.issued_shares = row["issued_shares"].as<int64_t>();
    s.book_value_per_share = row["book_value_per_share"].as<double>();
    s.eps_last_quarter = row["eps_last_quarter"].as<double>();
    s.eps_last_four_quarters = row["eps_last_four_quarters"].as<double>();
    s.return_on_equity = row["return_on_equity"].as<double>();
    s.foreign_shares_held = row["foreign_shares_held"].as<int64_t>();
    s.foreign_holding_percentage = row["foreign_holding_percentage"].as<double>();
    s.weight = row["weight"].as<double>();
    s.created_time = read_epoch(row["created_epoch"]);
    s.updated_time = read_epoch(row["updated_epoch"]);
    return s;
}

void write_security(pqxx::work& txn, const Security& s) {
    txn.exec_params(
        "INSERT INTO securities (code, name, market_id, industry_id, suspended, issued_shares, "
        "book_value_per_share, eps_last_quarter, eps_last_four_quarters, return_on_equity, "
        "foreign_shares_held, foreign_holding_percentage, weight, created_time, updated_time) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, to_timestamp($14), "
        "to_timestamp($15)) "
        "ON CONFLICT (code) DO UPDATE SET name = EXCLUDED.name, market_id = EXCLUDED.market_id, "
        "industry_id = EXCLUDED.industry_id, suspended = EXCLUDED.suspended, "
        "issued_shares = EXCLUDED.issued_shares, "
        "book_value_per_share = EXCLUDED.book_value_per_share, "
        "eps_last_quarter = EXCLUDED.eps_last_quarter, "
        "eps_last_four_quarters = EXCLUDED.eps_last_four_quarters, "
        "return_on_equity = EXCLUDED.return_on_equity, "
        "foreign_shares_held = EXCLUDED.foreign_shares_held, "
        "foreign_holding_percentage = EXCLUDED.foreign_holding_percentage, "
        "weight = EXCLUDED.weight, updated_time = EXCLUDED.updated_time",
        s.code, s.name, s.market_id, s.industry_id, s.suspended, s.issued_shares,
        s.book_value_per_share, s.eps_last_quarter, s.eps_last_four_quarters, s.return_on_equity,
        s.foreign_shares_held, s.foreign_holding_percentage, s.weight,
        epoch_seconds(s.created_time), epoch_seconds(s.updated_time));
}

// ---- daily quotes ----

const std::string METRIC_COLUMNS =
    "moving_average_5, moving_average_10, moving_average_20, moving_average_60, "
    "moving_average_120, moving_average_240, year_high, year_high_date, year_low, "
    "year_low_date, year_average, year_high_pbr, year_high_pbr_date, year_low_pbr, "
    "year_low_pbr_date, price_to_book_ratio";

const std::string QUOTE_SELECT =
    "SELECT security_code, date, trading_volume, transactions, trade_value, open_price, "
    "high_price, low_price, closing_price, change, change_range, last_bid_price, "
    "last_bid_volume, last_ask_price, last_ask_volume, price_earning_ratio, " +
    METRIC_COLUMNS + ", " + TIMESTAMP_COLUMNS + " FROM daily_quotes";

QuoteMetrics read_metrics(const pqxx::row& row) {
    QuoteMetrics m;
    m.moving_average_5 = row["moving_average_5"].as<double>();
    m.moving_average_10 = row["moving_average_10"].as<double>();
    m.moving_average_20 = row["moving_average_20"].as<double>();
    m.moving_average_60 = row["moving_average_60"].as<double>();
    m.moving_average_120 = row["moving_average_120"].as<double>();
    m.moving_average_240 = row["moving_average_240"].as<double>();
    m.year_high = row["year_high"].as<double>();
    m.year_high_date = read_optional_date(row["year_high_date"]);
    m.year_low = row["year_low"].as<double>();
    m.year_low_date = read_optional_date(row["year_low_date"]);
    m.year_average = row["year_average"].as<double>();
    m.year_high_pbr = row["year_high_pbr"].as<double>();
    m.year_high_pbr_date = read_optional_date(row["year_high_pbr_date"]);
    m.year_low_pbr = row["year_low_pbr"].as<double>();
    m.year_low_pbr_date = read_optional_date(row["year_low_pbr_date"]);
    m.price_to_book_ratio = row["price_to_book_ratio"].as<double>();
    return m;
}

DailyQuote read_quote(const pqxx::row& row) {
    DailyQuote q;
    q.code = row["security_code"].as<std::string>();
    q.date = read_date(row["date"]);
    q.trading_volume = row["trading_volume"].as<int64_t>();
    q.transactions = row["transactions"].as<int64_t>();
    q.trade_value = row["trade_value"].as<double>();
    q.open = row["open_price"].as<double>();
    q.high = row["high_price"].as<double>();
    q.low = row["low_price"].as<double>();
    q.close = row["closing_price"].as<double>();
    q.change = row["change"].as<double>();
    q.change_range = row["change_range"].as<double>();
    q.last_bid_price = row["last_bid_price"].as<double>();
    q.last_bid_volume = row["last_bid_volume"].as<int64_t>();
    q.last_ask_price = row["last_ask_price"].as<double>();
    q.last_ask_volume = row["last_ask_volume"].as<int64_t>();
    q.price_earning_ratio = row["price_earning_ratio"].as<double>();
    q.metrics = read_metrics(row);
    q.created_time = read_epoch(row["created_epoch"]);
    q.updated_time = read_epoch(row["updated_epoch"]);
    return q;
}

void write_quote(pqxx::work& txn, const DailyQuote& q) {
    const auto& m = q.metrics;
    txn.exec_params(
        "INSERT INTO daily_quotes (security_code, date, trading_volume, transactions, "
        "trade_value, open_price, high_price, low_price, closing_price, change, change_range, "
        "last_bid_price, last_bid_volume, last_ask_price, last_ask_volume, price_earning_ratio, " +
            METRIC_COLUMNS +
            ", created_time, updated_time) "
            "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, "
            "$17, $18, $19, $20, $21, $22, $23, $24::date, $25, $26::date, $27, $28, "
            "$29::date, $30, $31::date, $32, to_timestamp($33), to_timestamp($34)) "
            "ON CONFLICT (security_code, date) DO UPDATE SET "
            "trading_volume = EXCLUDED.trading_volume, transactions = EXCLUDED.transactions, "
            "trade_value = EXCLUDED.trade_value, open_price = EXCLUDED.open_price, "
            "high_price = EXCLUDED.high_price, low_price = EXCLUDED.low_price, "
            "closing_price = EXCLUDED.closing_price, change = EXCLUDED.change, "
            "change_range = EXCLUDED.change_range, last_bid_price = EXCLUDED.last_bid_price, "
            "last_bid_volume = EXCLUDED.last_bid_volume, "
            "last_ask_price = EXCLUDED.last_ask_price, "
            "last_ask_volume = EXCLUDED.last_ask_volume, "
            "price_earning_ratio = EXCLUDED.price_earning_ratio, "
            "moving_average_5 = EXCLUDED.moving_average_5, "
            "moving_average_10 = EXCLUDED.moving_average_10, "
            "moving_average_20 = EXCLUDED.moving_average_20, "
            "moving_average_60 = EXCLUDED.moving_average_60, "
            "moving_average_120 = EXCLUDED.moving_average_120, "
            "moving_average_240 = EXCLUDED.moving_average_240, "
            "year_high = EXCLUDED.year_high, year_high_date = EXCLUDED.year_high_date, "
            "year_low = EXCLUDED.year_low, year_low_date = EXCLUDED.year_low_date, "
            "year_average = EXCLUDED.year_average, year_high_pbr = EXCLUDED.year_high_pbr, "
            "year_high_pbr_date = EXCLUDED.year_high_pbr_date, "
            "year_low_pbr = EXCLUDED.year_low_pbr, "
            "year_low_pbr_date = EXCLUDED.year_low_pbr_date, "
            "price_to_book_ratio = EXCLUDED.price_to_book_ratio, "
            "updated_time = EXCLUDED.updated_time",
        q.code, q.date.to_string(), q.trading_volume, q.transactions, q.trade_value, q.open,
        q.high, q.low, q.close, q.change, q.change_range, q.last_bid_price, q.last_bid_volume,
        q.last_ask_price, q.last_ask_volume, q.price_earning_ratio, m.moving_average_5,
        m.moving_average_10, m.moving_average_20, m.moving_average_60, m.moving_average_120,
        m.moving_average_240, m.year_high, date_param(m.year_high_date), m.year_low,
        date_param(m.year_low_date), m.year_average, m.year_high_pbr,
        date_param(m.year_high_pbr_date), m.year_low_pbr, date_param(m.year_low_pbr_date),
        m.price_to_book_ratio, epoch_seconds(q.created_time), epoch_seconds(q.updated_time));
}

// ---- dividends ----

const std::string DIVIDEND_SELECT =
    "SELECT security_code, year, period, year_of_dividend, earnings_cash, capital_reserve_cash, "
    "cash_dividend, earnings_stock, capital_reserve_stock, stock_dividend, sum, "
    "ex_dividend_date, ex_rights_date, payable_date_cash, payable_date_stock, "
    "payout_ratio_cash, payout_ratio_stock, payout_ratio, " +
    TIMESTAMP_COLUMNS + " FROM dividends";

Dividend read_dividend(const pqxx::row& row) {
    Dividend d;
    d.code = row["security_code"].as<std::string>();
    d.year = row["year"].as<int>();
    d.period = row["period"].as<std::string>();
    d.year_of_dividend = row["year_of_dividend"].as<int>();
    d.earnings_cash = row["earnings_cash"].as<double>();
    d.capital_reserve_cash = row["capital_reserve_cash"].as<double>();
    d.cash_dividend = row["cash_dividend"].as<double>();
    d.earnings_stock = row["earnings_stock"].as<double>();
    d.capital_reserve_stock = row["capital_reserve_stock"].as<double>();
    d.stock_dividend = row["stock_dividend"].as<double>();
    d.sum = row["sum"].as<double>();
    d.ex_dividend_date = read_optional_date(row["ex_dividend_date"]);
    d.ex_rights_date = read_optional_date(row["ex_rights_date"]);
    d.payable_date_cash = read_optional_date(row["payable_date_cash"]);
    d.payable_date_stock = read_optional_date(row["payable_date_stock"]);
    d.payout_ratio_cash = row["payout_ratio_cash"].as<double>();
    d.payout_ratio_stock = row["payout_ratio_stock"].as<double>();
    d.payout_ratio = row["payout_ratio"].as<double>();
    d.created_time = read_epoch(row["created_epoch"]);
    d.updated_time = read_epoch(row["updated_epoch"]);
    return d;
}

void write_dividend(pqxx::work& txn, const Dividend& d) {
    txn.exec_params(
        "INSERT INTO dividends (security_code, year, period, year_of_dividend, earnings_cash, "
        "capital_reserve_cash, cash_dividend, earnings_stock, capital_reserve_stock, "
        "stock_dividend, sum, ex_dividend_date, ex_rights_date, payable_date_cash, "
        "payable_date_stock, payout_ratio_cash, payout_ratio_stock, payout_ratio, created_time, "
        "updated_time) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12::date, $13::date, $14::date, "
        "$15::date, $16, $17, $18, to_timestamp($19), to_timestamp($20)) "
        "ON CONFLICT (security_code, year, period) DO UPDATE SET "
        "year_of_dividend = EXCLUDED.year_of_dividend, earnings_cash = EXCLUDED.earnings_cash, "
        "capital_reserve_cash = EXCLUDED.capital_reserve_cash, "
        "cash_dividend = EXCLUDED.cash_dividend, earnings_stock = EXCLUDED.earnings_stock, "
        "capital_reserve_stock = EXCLUDED.capital_reserve_stock, "
        "stock_dividend = EXCLUDED.stock_dividend, sum = EXCLUDED.sum, "
        "ex_dividend_date = EXCLUDED.ex_dividend_date, ex_rights_date = EXCLUDED.ex_rights_date, "
        "payable_date_cash = EXCLUDED.payable_date_cash, "
        "payable_date_stock = EXCLUDED.payable_date_stock, "
        "payout_ratio_cash = EXCLUDED.payout_ratio_cash, "
        "payout_ratio_stock = EXCLUDED.payout_ratio_stock, "
        "payout_ratio = EXCLUDED.payout_ratio, updated_time = EXCLUDED.updated_time",
        d.code, d.year, d.period, d.year_of_dividend, d.earnings_cash, d.capital_reserve_cash,
        d.cash_dividend, d.earnings_stock, d.capital_reserve_stock, d.stock_dividend, d.sum,
        date_param(d.ex_dividend_date), date_param(d.ex_rights_date),
        date_param(d.payable_date_cash), date_param(d.payable_date_stock), d.payout_ratio_cash,
        d.payout_ratio_stock, d.payout_ratio, epoch_seconds(d.created_time),
        epoch_seconds(d.updated_time));
}

// ---- financial statements ----

const std::string STATEMENT_SELECT =
    "SELECT security_code, year, quarter, gross_profit, operating_profit_margin, "
    "pre_tax_income, net_income, book_value_per_share, sales_per_share, earnings_per_share, "
    "profit_before_tax, return_on_equity, return_on_assets, " +
    TIMESTAMP_COLUMNS + " FROM financial_statements";

FinancialStatement read_statement(const pqxx::row& row) {
    FinancialStatement f;
    f.code = row["security_code"].as<std::string>();
    f.year = row["year"].as<int>();
    f.quarter = row["quarter"].as<std::string>();
    f.gross_profit = row["gross_profit"].as<double>();
    f.operating_profit_margin = row["operating_profit_margin"].as<double>();
    f.pre_tax_income = row["pre_tax_income"].as<double>();
    f.net_income = row["net_income"].as<double>();
    f.book_value_per_share = row["book_value_per_share"].as<double>();
    f.sales_per_share = row["sales_per_share"].as<double>();
    f.earnings_per_share = row["earnings_per_share"].as<double>();
    f.profit_before_tax = row["profit_before_tax"].as<double>();
    f.return_on_equity = row["return_on_equity"].as<double>();
    f.return_on_assets = row["return_on_assets"].as<double>();
    f.created_time = read_epoch(row["created_epoch"]);
    f.updated_time = read_epoch(row["updated_epoch"]);
    return f;
}

void write_statement(pqxx::work& txn, const FinancialStatement& f) {
    txn.exec_params(
        "INSERT INTO financial_statements (security_code, year, quarter, gross_profit, "
        "operating_profit_margin, pre_tax_income, net_income, book_value_per_share, "
        "sales_per_share, earnings_per_share, profit_before_tax, return_on_equity, "
        "return_on_assets, created_time, updated_time) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, to_timestamp($14), "
        "to_timestamp($15)) "
        "ON CONFLICT (security_code, year, quarter) DO UPDATE SET "
        "gross_profit = EXCLUDED.gross_profit, "
        "operating_profit_margin = EXCLUDED.operating_profit_margin, "
        "pre_tax_income = EXCLUDED.pre_tax_income, net_income = EXCLUDED.net_income, "
        "book_value_per_share = EXCLUDED.book_value_per_share, "
        "sales_per_share = EXCLUDED.sales_per_share, "
        "earnings_per_share = EXCLUDED.earnings_per_share, "
        "profit_before_tax = EXCLUDED.profit_before_tax, "
        "return_on_equity = EXCLUDED.return_on_equity, "
        "return_on_assets = EXCLUDED.return_on_assets, updated_time = EXCLUDED.updated_time",
        f.code, f.year, f.quarter, f.gross_profit, f.operating_profit_margin, f.pre_tax_income,
        f.net_income, f.book_value_per_share, f.sales_per_share, f.earnings_per_share,
        f.profit_before_tax, f.return_on_equity, f.return_on_assets,
        epoch_seconds(f.created_time), epoch_seconds(f.updated_time));
}

// ---- revenues ----

const std::string REVENUE_SELECT =
    "SELECT security_code, month, monthly, last_month, last_year_this_month, "
    "monthly_accumulated, last_year_monthly_accumulated, compared_with_last_month, "
    "compared_with_last_year_same_month, accumulated_compared_with_last_year, avg_price, "
    "lowest_price, highest_price, " +
    TIMESTAMP_COLUMNS + " FROM revenues";

RevenueRecord read_revenue(const pqxx::row& row) {
    RevenueRecord r;
    r.code = row["security_code"].as<std::string>();
    r.month = row["month"].as<int>();
    r.monthly = row["monthly"].as<double>();
    r.last_month = row["last_month"].as<double>();
    r.last_year_this_month = row["last_year_this_month"].as<double>();
    r.monthly_accumulated = row["monthly_accumulated"].as<double>();
    r.last_year_monthly_accumulated = row["last_year_monthly_accumulated"].as<double>();
    r.compared_with_last_month = row["compared_with_last_month"].as<double>();
    r.compared_with_last_year_same_month = row["compared_with_last_year_same_month"].as<double>();
    r.accumulated_compared_with_last_year =
        row["accumulated_compared_with_last_year"].as<double>();
    r.avg_price = row["avg_price"].as<double>();
    r.lowest_price = row["lowest_price"].as<double>();
    r.highest_price = row["highest_price"].as<double>();
    r.created_time = read_epoch(row["created_epoch"]);
    r.updated_time = read_epoch(row["updated_epoch"]);
    return r;
}

void write_revenue(pqxx::work& txn, const RevenueRecord& r) {
    txn.exec_params(
        "INSERT INTO revenues (security_code, month, monthly, last_month, last_year_this_month, "
        "monthly_accumulated, last_year_monthly_accumulated, compared_with_last_month, "
        "compared_with_last_year_same_month, accumulated_compared_with_last_year, avg_price, "
        "lowest_price, highest_price, created_time, updated_time) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, to_timestamp($14), "
        "to_timestamp($15)) "
        "ON CONFLICT (security_code, month) DO UPDATE SET monthly = EXCLUDED.monthly, "
        "last_month = EXCLUDED.last_month, last_year_this_month = EXCLUDED.last_year_this_month, "
        "monthly_accumulated = EXCLUDED.monthly_accumulated, "
        "last_year_monthly_accumulated = EXCLUDED.last_year_monthly_accumulated, "
        "compared_with_last_month = EXCLUDED.compared_with_last_month, "
        "compared_with_last_year_same_month = EXCLUDED.compared_with_last_year_same_month, "
        "accumulated_compared_with_last_year = EXCLUDED.accumulated_compared_with_last_year, "
        "avg_price = EXCLUDED.avg_price, lowest_price = EXCLUDED.lowest_price, "
        "highest_price = EXCLUDED.highest_price, updated_time = EXCLUDED.updated_time",
        r.code, r.month, r.monthly, r.last_month, r.last_year_this_month, r.monthly_accumulated,
        r.last_year_monthly_accumulated, r.compared_with_last_month,
        r.compared_with_last_year_same_month, r.accumulated_compared_with_last_year, r.avg_price,
        r.lowest_price, r.highest_price, epoch_seconds(r.created_time),
        epoch_seconds(r.updated_time));
}

// ---- market indices ----

const std::string INDEX_SELECT =
    "SELECT index_code, date, value, change, change_range, trade_volume, trade_value, "
    "transactions, " +
    TIMESTAMP_COLUMNS + " FROM market_indices";

MarketIndex read_index(const pqxx::row& row) {
    MarketIndex i;
    i.code = row["index_code"].as<std::string>();
    i.date = read_date(row["date"]);
    i.value = row["value"].as<double>();
    i.change = row["change"].as<double>();
    i.change_range = row["change_range"].as<double>();
    i.trade_volume = row["trade_volume"].as<int64_t>();
    i.trade_value = row["trade_value"].as<double>();
    i.transactions = row["transactions"].as<int64_t>();
    i.created_time = read_epoch(row["created_epoch"]);
    i.updated_time = read_epoch(row["updated_epoch"]);
    return i;
}

void write_index(pqxx::work& txn, const MarketIndex& i) {
    txn.exec_params(
        "INSERT INTO market_indices (index_code, date, value, change, change_range, "
        "trade_volume, trade_value, transactions, created_time, updated_time) "
        "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, to_timestamp($9), to_timestamp($10)) "
        "ON CONFLICT (index_code, date) DO UPDATE SET value = EXCLUDED.value, "
        "change = EXCLUDED.change, change_range = EXCLUDED.change_range, "
        "trade_volume = EXCLUDED.trade_volume, trade_value = EXCLUDED.trade_value, "
        "transactions = EXCLUDED.transactions, updated_time = EXCLUDED.updated_time",
        i.code, i.date.to_string(), i.value, i.change, i.change_range, i.trade_volume,
        i.trade_value, i.transactions, epoch_seconds(i.created_time),
        epoch_seconds(i.updated_time));
}

// ---- quote history ----

const std::string HISTORY_SELECT =
    "SELECT security_code, max_price, max_price_date, min_price, min_price_date, "
    "max_price_to_book, max_price_to_book_date, min_price_to_book, min_price_to_book_date, " +
    TIMESTAMP_COLUMNS + " FROM quote_history_records";

QuoteHistoryRecord read_history(const pqxx::row& row) {
    QuoteHistoryRecord h;
    h.code = row["security_code"].as<std::string>();
    h.max_price = row["max_price"].as<double>();
    h.max_price_date = read_optional_date(row["max_price_date"]);
    h.min_price = row["min_price"].as<double>();
    h.min_price_date = read_optional_date(row["min_price_date"]);
    h.max_price_to_book = row["max_price_to_book"].as<double>();
    h.max_price_to_book_date = read_optional_date(row["max_price_to_book_date"]);
    h.min_price_to_book = row["min_price_to_book"].as<double>();
    h.min_price_to_book_date = read_optional_date(row["min_price_to_book_date"]);
    h.created_time = read_epoch(row["created_epoch"]);
    h.updated_time = read_epoch(row["updated_epoch"]);
    return h;
}

void write_history(pqxx::work& txn, const QuoteHistoryRecord& h) {
    txn.exec_params(
        "INSERT INTO quote_history_records (security_code, max_price, max_price_date, "
        "min_price, min_price_date, max_price_to_book, max_price_to_book_date, "
        "min_price_to_book, min_price_to_book_date, created_time, updated_time) "
        "VALUES ($1, $2, $3::date, $4, $5::date, $6, $7::date, $8, $9::date, "
        "to_timestamp($10), to_timestamp($11)) "
        "ON CONFLICT (security_code) DO UPDATE SET max_price = EXCLUDED.max_price, "
        "max_price_date = EXCLUDED.max_price_date, min_price = EXCLUDED.min_price, "
        "min_price_date = EXCLUDED.min_price_date, "
        "max_price_to_book = EXCLUDED.max_price_to_book, "
        "max_price_to_book_date = EXCLUDED.max_price_to_book_date, "
        "min_price_to_book = EXCLUDED.min_price_to_book, "
        "min_price_to_book_date = EXCLUDED.min_price_to_book_date, "
        "updated_time = EXCLUDED.updated_time",
        h.code, h.max_price, date_param(h.max_price_date), h.min_price,
        date_param(h.min_price_date), h.max_price_to_book, date_param(h.max_price_to_book_date),
        h.min_price_to_book, date_param(h.min_price_to_book_date), epoch_seconds(h.created_time),
        epoch_seconds(h.updated_time));
}

// ---- derived tables ----

const std::string ESTIMATE_SELECT =
    "SELECT security_code, date, closing_price, percentage, cheap, fair, expensive, "
    "price_cheap, price_fair, price_expensive, dividend_cheap, dividend_fair, "
    "dividend_expensive, eps_cheap, eps_fair, eps_expensive, pbr_cheap, pbr_fair, "
    "pbr_expensive, per_cheap, per_fair, per_expensive, year_count, "
    "EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch FROM estimates";

Triplet read_triplet(const pqxx::row& row, const std::string& prefix) {
    Triplet t;
    t.cheap = row[prefix + "cheap"].as<double>();
    t.fair = row[prefix + "fair"].as<double>();
    t.expensive = row[prefix + "expensive"].as<double>();
    return t;
}

EstimateBand read_estimate(const pqxx::row& row) {
    EstimateBand e;
    e.code = row["security_code"].as<std::string>();
    e.date = read_date(row["date"]);
    e.closing_price = row["closing_price"].as<double>();
    e.percentage = row["percentage"].as<double>();
    e.combined = read_triplet(row, "");
    e.price = read_triplet(row, "price_");
    e.dividend = read_triplet(row, "dividend_");
    e.eps = read_triplet(row, "eps_");
    e.pbr = read_triplet(row, "pbr_");
    e.per = read_triplet(row, "per_");
    e.year_count = row["year_count"].as<int>();
    e.updated_time = read_epoch(row["updated_epoch"]);
    return e;
}

const std::string YIELD_SELECT =
    "SELECT date, security_code, yield, quote_date, dividend_year, dividend_period, "
    "EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch FROM yield_ranks";

YieldRecord read_yield(const pqxx::row& row) {
    YieldRecord y;
    y.date = read_date(row["date"]);
    y.code = row["security_code"].as<std::string>();
    y.yield = row["yield"].as<double>();
    y.quote = QuoteKey{y.code, read_date(row["quote_date"])};
    y.dividend =
        DividendKey{y.code, row["dividend_year"].as<int>(), row["dividend_period"].as<std::string>()};
    y.updated_time = read_epoch(row["updated_epoch"]);
    return y;
}

PayoutRatio read_payout_ratio(const pqxx::row& row) {
    PayoutRatio p;
    p.code = row["security_code"].as<std::string>();
    p.year = row["year"].as<int>();
    p.period = row["period"].as<std::string>();
    p.eps = row["eps"].as<double>();
    p.payout_ratio_cash = row["payout_ratio_cash"].as<double>();
    p.payout_ratio_stock = row["payout_ratio_stock"].as<double>();
    p.payout_ratio = row["payout_ratio"].as<double>();
    p.updated_time = read_epoch(row["updated_epoch"]);
    return p;
}

const std::string LOT_SELECT =
    "SELECT id, member_id, security_code, share_quantity, share_price_average, holding_cost, "
    "is_sold, cumulate_dividends_cash, cumulate_dividends_stock, "
    "cumulate_dividends_stock_money, cumulate_dividends_total, purchase_date, " +
    TIMESTAMP_COLUMNS + " FROM stock_ownership_details";

StockOwnership read_lot(const pqxx::row& row) {
    StockOwnership o;
    o.id = row["id"].as<int64_t>();
    o.member_id = row["member_id"].as<std::string>();
    o.code = row["security_code"].as<std::string>();
    o.share_quantity = row["share_quantity"].as<int64_t>();
    o.share_price_average = row["share_price_average"].as<double>();
    o.holding_cost = row["holding_cost"].as<double>();
    o.is_sold = row["is_sold"].as<bool>();
    o.cumulate_dividends_cash = row["cumulate_dividends_cash"].as<double>();
    o.cumulate_dividends_stock = row["cumulate_dividends_stock"].as<double>();
    o.cumulate_dividends_stock_money = row["cumulate_dividends_stock_money"].as<double>();
    o.cumulate_dividends_total = row["cumulate_dividends_total"].as<double>();
    o.purchase_date = read_date(row["purchase_date"]);
    o.created_time = read_epoch(row["created_epoch"]);
    o.updated_time = read_epoch(row["updated_epoch"]);
    return o;
}

const std::string MONEY_SELECT =
    "SELECT member_id, date, market_value, cost, profit_and_loss, profit_and_loss_percentage, "
    "previous_day_market_value, previous_day_profit_and_loss, "
    "previous_day_profit_and_loss_percentage, "
    "EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch FROM daily_money_history";

DailyMoneyHistory read_money(const pqxx::row& row) {
    DailyMoneyHistory h;
    h.member_id = row["member_id"].as<std::string>();
    h.date = read_date(row["date"]);
    h.market_value = row["market_value"].as<double>();
    h.cost = row["cost"].as<double>();
    h.profit_and_loss = row["profit_and_loss"].as<double>();
    h.profit_and_loss_percentage = row["profit_and_loss_percentage"].as<double>();
    h.previous_day_market_value = row["previous_day_market_value"].as<double>();
    h.previous_day_profit_and_loss = row["previous_day_profit_and_loss"].as<double>();
    h.previous_day_profit_and_loss_percentage =
        row["previous_day_profit_and_loss_percentage"].as<double>();
    h.updated_time = read_epoch(row["updated_epoch"]);
    return h;
}

const std::string MONEY_DETAIL_SELECT =
    "SELECT member_id, date, security_code, closing_price, total_shares, cost, "
    "average_unit_price_per_share, market_value, ratio, profit_and_loss, "
    "profit_and_loss_percentage, previous_day_market_value, previous_day_profit_and_loss, "
    "previous_day_profit_and_loss_percentage, "
    "EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch "
    "FROM daily_money_history_details";

DailyMoneyHistoryDetail read_money_detail(const pqxx::row& row) {
    DailyMoneyHistoryDetail d;
    d.member_id = row["member_id"].as<std::string>();
    d.date = read_date(row["date"]);
    d.code = row["security_code"].as<std::string>();
    d.closing_price = row["closing_price"].as<double>();
    d.total_shares = row["total_shares"].as<int64_t>();
    d.cost = row["cost"].as<double>();
    d.average_unit_price_per_share = row["average_unit_price_per_share"].as<double>();
    d.market_value = row["market_value"].as<double>();
    d.ratio = row["ratio"].as<double>();
    d.profit_and_loss = row["profit_and_loss"].as<double>();
    d.profit_and_loss_percentage = row["profit_and_loss_percentage"].as<double>();
    d.previous_day_market_value = row["previous_day_market_value"].as<double>();
    d.previous_day_profit_and_loss = row["previous_day_profit_and_loss"].as<double>();
    d.previous_day_profit_and_loss_percentage =
        row["previous_day_profit_and_loss_percentage"].as<double>();
    d.updated_time = read_epoch(row["updated_epoch"]);
    return d;
}

const std::string STATS_SELECT =
    "SELECT date, market_id, total, undervalued, fair_valued, overvalued, highly_overvalued, "
    "above_ma5, below_ma5, above_ma20, below_ma20, above_ma60, below_ma60, above_ma120, "
    "below_ma120, above_ma240, below_ma240, stocks_up, stocks_down, stocks_unchanged, "
    "EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch FROM daily_market_stats";

DailyMarketStats read_stats(const pqxx::row& row) {
    DailyMarketStats s;
    s.date = read_date(row["date"]);
    s.market_id = row["market_id"].as<int>();
    s.total = row["total"].as<int>();
    s.undervalued = row["undervalued"].as<int>();
    s.fair_valued = row["fair_valued"].as<int>();
    s.overvalued = row["overvalued"].as<int>();
    s.highly_overvalued = row["highly_overvalued"].as<int>();
    s.above_ma5 = row["above_ma5"].as<int>();
    s.below_ma5 = row["below_ma5"].as<int>();
    s.above_ma20 = row["above_ma20"].as<int>();
    s.below_ma20 = row["below_ma20"].as<int>();
    s.above_ma60 = row["above_ma60"].as<int>();
    s.below_ma60 = row["below_ma60"].as<int>();
    s.above_ma120 = row["above_ma120"].as<int>();
    s.below_ma120 = row["below_ma120"].as<int>();
    s.above_ma240 = row["above_ma240"].as<int>();
    s.below_ma240 = row["below_ma240"].as<int>();
    s.stocks_up = row["stocks_up"].as<int>();
    s.stocks_down = row["stocks_down"].as<int>();
    s.stocks_unchanged = row["stocks_unchanged"].as<int>();
    s.updated_time = read_epoch(row["updated_epoch"]);
    return s;
}

JobRun read_job_run(const pqxx::row& row) {
    JobRun r;
    r.job_name = row["job_name"].as<std::string>();
    r.business_date = read_date(row["business_date"]);
    r.status = string_to_job_run_status(row["status"].as<std::string>());
    r.attempts = row["attempts"].as<int>();
    r.started_at = read_epoch(row["started_epoch"]);
    r.finished_at = read_epoch(row["finished_epoch"]);
    r.summary = row["summary"].as<std::string>();
    return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// DatabaseConfig

std::string DatabaseConfig::connection_string() const {
    std::ostringstream os;
    os << "host=" << host << " port=" << port << " dbname=" << database << " user=" << user
       << " connect_timeout=" << connect_timeout_seconds;
    if (!password.empty()) {
        os << " password=" << password;
    }
    return os.str();
}

nlohmann::json DatabaseConfig::to_json() const {
    return nlohmann::json{{"host", host},
                          {"port", port},
                          {"user", user},
                          {"password", password},
                          {"database", database},
                          {"pool_size", pool_size},
                          {"connect_timeout_seconds", connect_timeout_seconds},
                          {"max_retries", max_retries}};
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    if (j.contains("host"))
        host = j.at("host").get<std::string>();
    if (j.contains("port"))
        port = j.at("port").get<int>();
    if (j.contains("user"))
        user = j.at("user").get<std::string>();
    if (j.contains("password"))
        password = j.at("password").get<std::string>();
    if (j.contains("database"))
        database = j.at("database").get<std::string>();
    if (j.contains("pool_size"))
        pool_size = j.at("pool_size").get<size_t>();
    if (j.contains("connect_timeout_seconds"))
        connect_timeout_seconds = j.at("connect_timeout_seconds").get<int>();
    if (j.contains("max_retries"))
        max_retries = j.at("max_retries").get<int>();
}

// ---------------------------------------------------------------------------
// PostgresStore

PostgresStore::PostgresStore(DatabaseConfig config)
    : config_(std::move(config)), component_id_(StateManager::make_component_id(COMPONENT)) {}

PostgresStore::~PostgresStore() {
    disconnect();
}

Result<void> PostgresStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return Result<void>();
    }

    auto pool = std::make_unique<ConnectionPool>(config_.connection_string(), config_.pool_size);
    auto init = pool->initialize(std::min<size_t>(2, config_.pool_size));
    if (init.is_error()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(init.error()->what()),
                                COMPONENT);
    }
    pool_ = std::move(pool);

    ComponentInfo info{ComponentType::STORE,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register store with StateManager: " << registered.error()->what());
    } else {
        auto running = StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
        if (running.is_error()) {
            WARN("Failed to mark store running: " << running.error()->what());
        }
    }

    INFO("Connected to PostgreSQL " << config_.host << ":" << config_.port << "/"
                                    << config_.database << " as " << component_id_);
    return Result<void>();
}

void PostgresStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        return;
    }
    pool_->close_all();
    pool_.reset();

    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Store was not registered: " << unregistered.error()->what());
    }
    INFO("Disconnected from PostgreSQL database");
}

bool PostgresStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ != nullptr;
}

Result<void> PostgresStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Store is not connected", COMPONENT);
    }
    return Result<void>();
}

template <typename T, typename Body>
Result<T> PostgresStore::with_transaction(const std::string& operation, Body body) const {
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<T>(validation);
    }

    auto attempt = [&]() -> Result<T> {
        ConnectionPool* pool = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pool = pool_.get();
        }
        if (!pool) {
            return make_error<T>(ErrorCode::NOT_INITIALIZED, "Store is not connected", COMPONENT);
        }
        auto guard = pool->acquire_connection(
            std::chrono::seconds(std::max(1, config_.connect_timeout_seconds)));
        if (!guard) {
            return make_error<T>(ErrorCode::DATABASE_ERROR,
                                 operation + ": no database connection available", COMPONENT);
        }

        try {
            pqxx::work txn(*guard.get());
            T value = body(txn);
            txn.commit();
            return Result<T>(std::move(value));
        } catch (const StoreAbort& e) {
            return make_error<T>(e.code(), operation + ": " + e.what(), COMPONENT);
        } catch (const pqxx::unique_violation& e) {
            return make_error<T>(ErrorCode::CONFLICT_ERROR, operation + ": " + e.what(),
                                 COMPONENT);
        } catch (const pqxx::integrity_constraint_violation& e) {
            return make_error<T>(ErrorCode::VALIDATION_ERROR, operation + ": " + e.what(),
                                 COMPONENT);
        } catch (const pqxx::broken_connection& e) {
            return make_error<T>(ErrorCode::DATABASE_ERROR,
                                 operation + ": connection lost: " + e.what(), COMPONENT);
        } catch (const pqxx::sql_error& e) {
            return make_error<T>(ErrorCode::DATABASE_ERROR,
                                 operation + ": " + e.what() + " [" + e.query() + "]",
                                 COMPONENT);
        } catch (const std::exception& e) {
            return make_error<T>(ErrorCode::DATABASE_ERROR, operation + ": " + e.what(),
                                 COMPONENT);
        }
    };

    auto result = utils::retry_database_operation(attempt, std::max(1, config_.max_retries));
    if (result.is_error()) {
        ERROR(result.error()->to_string());
    }
    return result;
}

// ---- merges ----

Result<MergeOutcome> PostgresStore::merge_security(const SecurityPatch& patch,
                                                   const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_security", [&](pqxx::work& txn) {
        lock_key(txn, "securities:" + patch.code);
        auto existing = first_row<Security>(
            txn.exec_params(SECURITY_SELECT + " WHERE code = $1 FOR UPDATE", patch.code),
            read_security);
        auto decision = market_ingest::merge_security(existing, patch, ctx);
        if (decision.writes()) {
            write_security(txn, decision.row);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<MergeOutcome> PostgresStore::merge_daily_quote(const DailyQuote& quote,
                                                      const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_daily_quote", [&](pqxx::work& txn) {
        lock_key(txn, "daily_quotes:" + quote.code + ":" + quote.date.to_string());
        auto existing = first_row<DailyQuote>(
            txn.exec_params(QUOTE_SELECT + " WHERE security_code = $1 AND date = $2::date FOR UPDATE",
                            quote.code, quote.date.to_string()),
            read_quote);
        auto decision = market_ingest::merge_daily_quote(existing, quote, ctx);
        if (decision.writes()) {
            write_quote(txn, decision.row);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<MergeOutcome> PostgresStore::merge_dividend(const Dividend& dividend,
                                                   const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_dividend", [&](pqxx::work& txn) {
        lock_key(txn, "dividends:" + dividend.code + ":" + std::to_string(dividend.year) + ":" +
                          dividend.period);
        auto existing = first_row<Dividend>(
            txn.exec_params(DIVIDEND_SELECT +
                                " WHERE security_code = $1 AND year = $2 AND period = $3 "
                                "FOR UPDATE",
                            dividend.code, dividend.year, dividend.period),
            read_dividend);
        auto decision = market_ingest::merge_dividend(existing, dividend, ctx);
        if (decision.writes()) {
            write_dividend(txn, decision.row);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<MergeOutcome> PostgresStore::merge_financial_statement(const FinancialStatement& statement,
                                                              const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_financial_statement", [&](pqxx::work& txn) {
        lock_key(txn, "financial_statements:" + statement.code + ":" +
                          std::to_string(statement.year) + ":" + statement.quarter);
        auto existing = first_row<FinancialStatement>(
            txn.exec_params(STATEMENT_SELECT +
                                " WHERE security_code = $1 AND year = $2 AND quarter = $3 "
                                "FOR UPDATE",
                            statement.code, statement.year, statement.quarter),
            read_statement);
        auto decision = market_ingest::merge_financial_statement(existing, statement, ctx);
        if (decision.writes()) {
            write_statement(txn, decision.row);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<MergeOutcome> PostgresStore::merge_revenue(const RevenueRecord& revenue,
                                                  const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_revenue", [&](pqxx::work& txn) {
        // Cursor and row move together, so the lock covers the whole security
        lock_key(txn, "revenues:" + revenue.code);

        std::optional<RevenueCursor> cursor;
        auto cursor_rows = txn.exec_params(
            "SELECT month FROM revenue_cursors WHERE security_code = $1 FOR UPDATE", revenue.code);
        if (!cursor_rows.empty()) {
            cursor = RevenueCursor{revenue.code, cursor_rows[0]["month"].as<int>()};
        }

        auto existing = first_row<RevenueRecord>(
            txn.exec_params(REVENUE_SELECT + " WHERE security_code = $1 AND month = $2 FOR UPDATE",
                            revenue.code, revenue.month),
            read_revenue);

        auto decision = market_ingest::merge_revenue(existing, cursor, revenue, ctx);
        if (decision.action != MergeAction::SKIPPED) {
            if (decision.writes()) {
                write_revenue(txn, decision.row);
            }
            auto advanced = advance_cursor(cursor, decision);
            txn.exec_params(
                "INSERT INTO revenue_cursors (security_code, month) VALUES ($1, $2) "
                "ON CONFLICT (security_code) DO UPDATE SET month = EXCLUDED.month",
                advanced.code, advanced.month);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<MergeOutcome> PostgresStore::merge_market_index(const MarketIndex& index,
                                                       const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_market_index", [&](pqxx::work& txn) {
        lock_key(txn, "market_indices:" + index.code + ":" + index.date.to_string());
        auto existing = first_row<MarketIndex>(
            txn.exec_params(INDEX_SELECT + " WHERE index_code = $1 AND date = $2::date FOR UPDATE",
                            index.code, index.date.to_string()),
            read_index);
        auto decision = market_ingest::merge_market_index(existing, index, ctx);
        if (decision.writes()) {
            write_index(txn, decision.row);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<MergeOutcome> PostgresStore::merge_quote_history(const HistoryCandidate& candidate,
                                                        const MergeContext& ctx) {
    return with_transaction<MergeOutcome>("merge_quote_history", [&](pqxx::work& txn) {
        lock_key(txn, "quote_history_records:" + candidate.code);
        auto existing = first_row<QuoteHistoryRecord>(
            txn.exec_params(HISTORY_SELECT + " WHERE security_code = $1 FOR UPDATE",
                            candidate.code),
            read_history);
        auto decision = market_ingest::merge_quote_history(existing, candidate, ctx);
        if (decision.writes()) {
            write_history(txn, decision.row);
        }
        return MergeOutcome{decision.action, decision.reason};
    });
}

Result<int64_t> PostgresStore::put_ownership(const StockOwnership& lot) {
    return with_transaction<int64_t>("put_ownership", [&](pqxx::work& txn) {
        const std::string columns =
            "member_id, security_code, share_quantity, share_price_average, holding_cost, "
            "is_sold, cumulate_dividends_cash, cumulate_dividends_stock, "
            "cumulate_dividends_stock_money, cumulate_dividends_total, purchase_date";
        if (lot.id == 0) {
            auto rows = txn.exec_params(
                "INSERT INTO stock_ownership_details (" + columns +
                    ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::date) RETURNING id",
                lot.member_id, lot.code, lot.share_quantity, lot.share_price_average,
                lot.holding_cost, lot.is_sold, lot.cumulate_dividends_cash,
                lot.cumulate_dividends_stock, lot.cumulate_dividends_stock_money,
                lot.cumulate_dividends_total, lot.purchase_date.to_string());
            return rows[0]["id"].as<int64_t>();
        }

        txn.exec_params(
            "INSERT INTO stock_ownership_details (id, " + columns +
                ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12::date) "
                "ON CONFLICT (id) DO UPDATE SET member_id = EXCLUDED.member_id, "
                "security_code = EXCLUDED.security_code, "
                "share_quantity = EXCLUDED.share_quantity, "
                "share_price_average = EXCLUDED.share_price_average, "
                "holding_cost = EXCLUDED.holding_cost, is_sold = EXCLUDED.is_sold, "
                "cumulate_dividends_cash = EXCLUDED.cumulate_dividends_cash, "
                "cumulate_dividends_stock = EXCLUDED.cumulate_dividends_stock, "
                "cumulate_dividends_stock_money = EXCLUDED.cumulate_dividends_stock_money, "
                "cumulate_dividends_total = EXCLUDED.cumulate_dividends_total, "
                "purchase_date = EXCLUDED.purchase_date, updated_time = now()",
            lot.id, lot.member_id, lot.code, lot.share_quantity, lot.share_price_average,
            lot.holding_cost, lot.is_sold, lot.cumulate_dividends_cash,
            lot.cumulate_dividends_stock, lot.cumulate_dividends_stock_money,
            lot.cumulate_dividends_total, lot.purchase_date.to_string());
        return lot.id;
    });
}

// ---- derived writes ----

Result<MergeAction> PostgresStore::update_quote_metrics(const QuoteKey& key,
                                                        const QuoteMetrics& computed,
                                                        Timestamp now) {
    const QuoteMetrics metrics = round_to_scale(computed);
    return with_transaction<MergeAction>("update_quote_metrics", [&](pqxx::work& txn) {
        lock_key(txn, "daily_quotes:" + key.code + ":" + key.date.to_string());
        auto rows = txn.exec_params("SELECT " + METRIC_COLUMNS +
                                        " FROM daily_quotes WHERE security_code = $1 AND "
                                        "date = $2::date FOR UPDATE",
                                    key.code, key.date.to_string());
        if (rows.empty()) {
            throw StoreAbort(ErrorCode::NOT_FOUND,
                             "No quote for " + key.code + " on " + key.date.to_string());
        }
        if (same_metrics(read_metrics(rows[0]), metrics)) {
            return MergeAction::UNCHANGED;
        }
        txn.exec_params(
            "UPDATE daily_quotes SET moving_average_5 = $3, moving_average_10 = $4, "
            "moving_average_20 = $5, moving_average_60 = $6, moving_average_120 = $7, "
            "moving_average_240 = $8, year_high = $9, year_high_date = $10::date, "
            "year_low = $11, year_low_date = $12::date, year_average = $13, "
            "year_high_pbr = $14, year_high_pbr_date = $15::date, year_low_pbr = $16, "
            "year_low_pbr_date = $17::date, price_to_book_ratio = $18, "
            "updated_time = to_timestamp($19) "
            "WHERE security_code = $1 AND date = $2::date",
            key.code, key.date.to_string(), metrics.moving_average_5, metrics.moving_average_10,
            metrics.moving_average_20, metrics.moving_average_60, metrics.moving_average_120,
            metrics.moving_average_240, metrics.year_high, date_param(metrics.year_high_date),
            metrics.year_low, date_param(metrics.year_low_date), metrics.year_average,
            metrics.year_high_pbr, date_param(metrics.year_high_pbr_date), metrics.year_low_pbr,
            date_param(metrics.year_low_pbr_date), metrics.price_to_book_ratio,
            epoch_seconds(now));
        return MergeAction::UPDATED;
    });
}

namespace {
Result<void> to_void(Result<bool> result) {
    if (result.is_error()) {
        return forward_error<void>(result);
    }
    return Result<void>();
}
}  // namespace

Result<void> PostgresStore::put_estimate(const EstimateBand& e) {
    return to_void(with_transaction<bool>("put_estimate", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO estimates (security_code, date, closing_price, percentage, cheap, fair, "
            "expensive, price_cheap, price_fair, price_expensive, dividend_cheap, dividend_fair, "
            "dividend_expensive, eps_cheap, eps_fair, eps_expensive, pbr_cheap, pbr_fair, "
            "pbr_expensive, per_cheap, per_fair, per_expensive, year_count, updated_time) "
            "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, "
            "$17, $18, $19, $20, $21, $22, $23, to_timestamp($24)) "
            "ON CONFLICT (security_code, date) DO UPDATE SET "
            "closing_price = EXCLUDED.closing_price, percentage = EXCLUDED.percentage, "
            "cheap = EXCLUDED.cheap, fair = EXCLUDED.fair, expensive = EXCLUDED.expensive, "
            "price_cheap = EXCLUDED.price_cheap, price_fair = EXCLUDED.price_fair, "
            "price_expensive = EXCLUDED.price_expensive, "
            "dividend_cheap = EXCLUDED.dividend_cheap, dividend_fair = EXCLUDED.dividend_fair, "
            "dividend_expensive = EXCLUDED.dividend_expensive, eps_cheap = EXCLUDED.eps_cheap, "
            "eps_fair = EXCLUDED.eps_fair, eps_expensive = EXCLUDED.eps_expensive, "
            "pbr_cheap = EXCLUDED.pbr_cheap, pbr_fair = EXCLUDED.pbr_fair, "
            "pbr_expensive = EXCLUDED.pbr_expensive, per_cheap = EXCLUDED.per_cheap, "
            "per_fair = EXCLUDED.per_fair, per_expensive = EXCLUDED.per_expensive, "
            "year_count = EXCLUDED.year_count, updated_time = EXCLUDED.updated_time",
            e.code, e.date.to_string(), e.closing_price, e.percentage, e.combined.cheap,
            e.combined.fair, e.combined.expensive, e.price.cheap, e.price.fair, e.price.expensive,
            e.dividend.cheap, e.dividend.fair, e.dividend.expensive, e.eps.cheap, e.eps.fair,
            e.eps.expensive, e.pbr.cheap, e.pbr.fair, e.pbr.expensive, e.per.cheap, e.per.fair,
            e.per.expensive, e.year_count, epoch_seconds(e.updated_time));
        return true;
    }));
}

Result<void> PostgresStore::put_yield(const YieldRecord& y) {
    return to_void(with_transaction<bool>("put_yield", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO yield_ranks (date, security_code, yield, quote_date, dividend_year, "
            "dividend_period, updated_time) "
            "VALUES ($1::date, $2, $3, $4::date, $5, $6, to_timestamp($7)) "
            "ON CONFLICT (date, security_code) DO UPDATE SET yield = EXCLUDED.yield, "
            "quote_date = EXCLUDED.quote_date, dividend_year = EXCLUDED.dividend_year, "
            "dividend_period = EXCLUDED.dividend_period, updated_time = EXCLUDED.updated_time",
            y.date.to_string(), y.code, y.yield, y.quote.date.to_string(), y.dividend.year,
            y.dividend.period, epoch_seconds(y.updated_time));
        return true;
    }));
}

Result<void> PostgresStore::put_payout_ratio(const PayoutRatio& p) {
    return to_void(with_transaction<bool>("put_payout_ratio", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO payout_ratios (security_code, year, period, eps, payout_ratio_cash, "
            "payout_ratio_stock, payout_ratio, updated_time) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, to_timestamp($8)) "
            "ON CONFLICT (security_code, year, period) DO UPDATE SET eps = EXCLUDED.eps, "
            "payout_ratio_cash = EXCLUDED.payout_ratio_cash, "
            "payout_ratio_stock = EXCLUDED.payout_ratio_stock, "
            "payout_ratio = EXCLUDED.payout_ratio, updated_time = EXCLUDED.updated_time",
            p.code, p.year, p.period, p.eps, p.payout_ratio_cash, p.payout_ratio_stock,
            p.payout_ratio, epoch_seconds(p.updated_time));
        return true;
    }));
}

Result<void> PostgresStore::put_money_snapshot(
    const DailyMoneyHistory& s, const std::vector<DailyMoneyHistoryDetail>& details) {
    return to_void(with_transaction<bool>("put_money_snapshot", [&](pqxx::work& txn) {
        lock_key(txn, "daily_money_history:" + s.member_id + ":" + s.date.to_string());
        txn.exec_params(
            "INSERT INTO daily_money_history (member_id, date, market_value, cost, "
            "profit_and_loss, profit_and_loss_percentage, previous_day_market_value, "
            "previous_day_profit_and_loss, previous_day_profit_and_loss_percentage, "
            "updated_time) "
            "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10)) "
            "ON CONFLICT (member_id, date) DO UPDATE SET market_value = EXCLUDED.market_value, "
            "cost = EXCLUDED.cost, profit_and_loss = EXCLUDED.profit_and_loss, "
            "profit_and_loss_percentage = EXCLUDED.profit_and_loss_percentage, "
            "previous_day_market_value = EXCLUDED.previous_day_market_value, "
            "previous_day_profit_and_loss = EXCLUDED.previous_day_profit_and_loss, "
            "previous_day_profit_and_loss_percentage = "
            "EXCLUDED.previous_day_profit_and_loss_percentage, "
            "updated_time = EXCLUDED.updated_time",
            s.member_id, s.date.to_string(), s.market_value, s.cost, s.profit_and_loss,
            s.profit_and_loss_percentage, s.previous_day_market_value,
            s.previous_day_profit_and_loss, s.previous_day_profit_and_loss_percentage,
            epoch_seconds(s.updated_time));

        txn.exec_params(
            "DELETE FROM daily_money_history_details WHERE member_id = $1 AND date = $2::date",
            s.member_id, s.date.to_string());

        for (const auto& d : details) {
            txn.exec_params(
                "INSERT INTO daily_money_history_details (member_id, date, security_code, "
                "closing_price, total_shares, cost, average_unit_price_per_share, market_value, "
                "ratio, profit_and_loss, profit_and_loss_percentage, previous_day_market_value, "
                "previous_day_profit_and_loss, previous_day_profit_and_loss_percentage, "
                "updated_time) "
                "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, "
                "to_timestamp($15))",
                d.member_id, d.date.to_string(), d.code, d.closing_price, d.total_shares, d.cost,
                d.average_unit_price_per_share, d.market_value, d.ratio, d.profit_and_loss,
                d.profit_and_loss_percentage, d.previous_day_market_value,
                d.previous_day_profit_and_loss, d.previous_day_profit_and_loss_percentage,
                epoch_seconds(d.updated_time));
        }
        return true;
    }));
}

Result<void> PostgresStore::put_market_stats(const DailyMarketStats& s) {
    return to_void(with_transaction<bool>("put_market_stats", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO daily_market_stats (date, market_id, total, undervalued, fair_valued, "
            "overvalued, highly_overvalued, above_ma5, below_ma5, above_ma20, below_ma20, "
            "above_ma60, below_ma60, above_ma120, below_ma120, above_ma240, below_ma240, "
            "stocks_up, stocks_down, stocks_unchanged, updated_time) "
            "VALUES ($1::date, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, "
            "$17, $18, $19, $20, to_timestamp($21)) "
            "ON CONFLICT (date, market_id) DO UPDATE SET total = EXCLUDED.total, "
            "undervalued = EXCLUDED.undervalued, fair_valued = EXCLUDED.fair_valued, "
            "overvalued = EXCLUDED.overvalued, highly_overvalued = EXCLUDED.highly_overvalued, "
            "above_ma5 = EXCLUDED.above_ma5, below_ma5 = EXCLUDED.below_ma5, "
            "above_ma20 = EXCLUDED.above_ma20, below_ma20 = EXCLUDED.below_ma20, "
            "above_ma60 = EXCLUDED.above_ma60, below_ma60 = EXCLUDED.below_ma60, "
            "above_ma120 = EXCLUDED.above_ma120, below_ma120 = EXCLUDED.below_ma120, "
            "above_ma240 = EXCLUDED.above_ma240, below_ma240 = EXCLUDED.below_ma240, "
            "stocks_up = EXCLUDED.stocks_up, stocks_down = EXCLUDED.stocks_down, "
            "stocks_unchanged = EXCLUDED.stocks_unchanged, updated_time = EXCLUDED.updated_time",
            s.date.to_string(), s.market_id, s.total, s.undervalued, s.fair_valued, s.overvalued,
            s.highly_overvalued, s.above_ma5, s.below_ma5, s.above_ma20, s.below_ma20,
            s.above_ma60, s.below_ma60, s.above_ma120, s.below_ma120, s.above_ma240,
            s.below_ma240, s.stocks_up, s.stocks_down, s.stocks_unchanged,
            epoch_seconds(s.updated_time));
        return true;
    }));
}

// ---- readers ----

Result<std::optional<Security>> PostgresStore::get_security(const std::string& code) const {
    return with_transaction<std::optional<Security>>("get_security", [&](pqxx::work& txn) {
        return first_row<Security>(txn.exec_params(SECURITY_SELECT + " WHERE code = $1", code),
                                   read_security);
    });
}

Result<std::vector<Security>> PostgresStore::list_securities() const {
    return with_transaction<std::vector<Security>>("list_securities", [&](pqxx::work& txn) {
        return all_rows<Security>(txn.exec(SECURITY_SELECT + " ORDER BY code"), read_security);
    });
}

Result<std::optional<DailyQuote>> PostgresStore::get_daily_quote(const QuoteKey& key) const {
    return with_transaction<std::optional<DailyQuote>>("get_daily_quote", [&](pqxx::work& txn) {
        return first_row<DailyQuote>(
            txn.exec_params(QUOTE_SELECT + " WHERE security_code = $1 AND date = $2::date",
                            key.code, key.date.to_string()),
            read_quote);
    });
}

Result<std::vector<DailyQuote>> PostgresStore::get_recent_quotes(const std::string& code,
                                                                 const Date& up_to,
                                                                 size_t limit) const {
    return with_transaction<std::vector<DailyQuote>>("get_recent_quotes", [&](pqxx::work& txn) {
        auto rows = all_rows<DailyQuote>(
            txn.exec_params(QUOTE_SELECT +
                                " WHERE security_code = $1 AND date <= $2::date "
                                "ORDER BY date DESC LIMIT $3",
                            code, up_to.to_string(), static_cast<int64_t>(limit)),
            read_quote);
        std::reverse(rows.begin(), rows.end());
        return rows;
    });
}

Result<std::vector<DailyQuote>> PostgresStore::get_quotes_between(const std::string& code,
                                                                  const Date& from,
                                                                  const Date& to) const {
    return with_transaction<std::vector<DailyQuote>>("get_quotes_between", [&](pqxx::work& txn) {
        return all_rows<DailyQuote>(
            txn.exec_params(QUOTE_SELECT +
                                " WHERE security_code = $1 AND date BETWEEN $2::date AND "
                                "$3::date ORDER BY date",
                            code, from.to_string(), to.to_string()),
            read_quote);
    });
}

Result<std::vector<DailyQuote>> PostgresStore::get_quotes_on(const Date& date) const {
    return with_transaction<std::vector<DailyQuote>>("get_quotes_on", [&](pqxx::work& txn) {
        return all_rows<DailyQuote>(
            txn.exec_params(QUOTE_SELECT + " WHERE date = $1::date ORDER BY security_code",
                            date.to_string()),
            read_quote);
    });
}

Result<std::vector<DailyQuote>> PostgresStore::get_latest_quotes(
    const std::vector<std::string>& codes) const {
    return with_transaction<std::vector<DailyQuote>>("get_latest_quotes", [&](pqxx::work& txn) {
        std::vector<DailyQuote> quotes;
        for (const auto& code : codes) {
            auto latest = first_row<DailyQuote>(
                txn.exec_params(QUOTE_SELECT +
                                    " WHERE security_code = $1 ORDER BY date DESC LIMIT 1",
                                code),
                read_quote);
            if (latest) {
                quotes.push_back(std::move(*latest));
            }
        }
        return quotes;
    });
}

Result<std::optional<DailyQuote>> PostgresStore::get_latest_quote_on_or_before(
    const std::string& code, const Date& date) const {
    return with_transaction<std::optional<DailyQuote>>(
        "get_latest_quote_on_or_before", [&](pqxx::work& txn) {
            return first_row<DailyQuote>(
                txn.exec_params(QUOTE_SELECT +
                                    " WHERE security_code = $1 AND date <= $2::date "
                                    "ORDER BY date DESC LIMIT 1",
                                code, date.to_string()),
                read_quote);
        });
}

Result<std::optional<Dividend>> PostgresStore::get_dividend(const DividendKey& key) const {
    return with_transaction<std::optional<Dividend>>("get_dividend", [&](pqxx::work& txn) {
        return first_row<Dividend>(
            txn.exec_params(DIVIDEND_SELECT +
                                " WHERE security_code = $1 AND year = $2 AND period = $3",
                            key.code, key.year, key.period),
            read_dividend);
    });
}

Result<std::vector<Dividend>> PostgresStore::get_dividends(const std::string& code) const {
    return with_transaction<std::vector<Dividend>>("get_dividends", [&](pqxx::work& txn) {
        return all_rows<Dividend>(
            txn.exec_params(DIVIDEND_SELECT + " WHERE security_code = $1 ORDER BY year, period",
                            code),
            read_dividend);
    });
}

Result<std::vector<Dividend>> PostgresStore::list_dividends() const {
    return with_transaction<std::vector<Dividend>>("list_dividends", [&](pqxx::work& txn) {
        return all_rows<Dividend>(
            txn.exec(DIVIDEND_SELECT + " ORDER BY security_code, year, period"), read_dividend);
    });
}

Result<std::vector<FinancialStatement>> PostgresStore::get_financial_statements(
    const std::string& code) const {
    return with_transaction<std::vector<FinancialStatement>>(
        "get_financial_statements", [&](pqxx::work& txn) {
            return all_rows<FinancialStatement>(
                txn.exec_params(STATEMENT_SELECT +
                                    " WHERE security_code = $1 ORDER BY year, quarter",
                                code),
                read_statement);
        });
}

Result<std::optional<RevenueRecord>> PostgresStore::get_revenue(const std::string& code,
                                                                YearMonth month) const {
    return with_transaction<std::optional<RevenueRecord>>("get_revenue", [&](pqxx::work& txn) {
        return first_row<RevenueRecord>(
            txn.exec_params(REVENUE_SELECT + " WHERE security_code = $1 AND month = $2", code,
                            month),
            read_revenue);
    });
}

Result<std::optional<RevenueCursor>> PostgresStore::get_revenue_cursor(
    const std::string& code) const {
    return with_transaction<std::optional<RevenueCursor>>(
        "get_revenue_cursor", [&](pqxx::work& txn) -> std::optional<RevenueCursor> {
            auto rows = txn.exec_params(
                "SELECT month FROM revenue_cursors WHERE security_code = $1", code);
            if (rows.empty()) {
                return std::nullopt;
            }
            return RevenueCursor{code, rows[0]["month"].as<int>()};
        });
}

Result<std::optional<MarketIndex>> PostgresStore::get_market_index(const std::string& code,
                                                                   const Date& date) const {
    return with_transaction<std::optional<MarketIndex>>("get_market_index", [&](pqxx::work& txn) {
        return first_row<MarketIndex>(
            txn.exec_params(INDEX_SELECT + " WHERE index_code = $1 AND date = $2::date", code,
                            date.to_string()),
            read_index);
    });
}

Result<std::optional<QuoteHistoryRecord>> PostgresStore::get_quote_history_record(
    const std::string& code) const {
    return with_transaction<std::optional<QuoteHistoryRecord>>(
        "get_quote_history_record", [&](pqxx::work& txn) {
            return first_row<QuoteHistoryRecord>(
                txn.exec_params(HISTORY_SELECT + " WHERE security_code = $1", code),
                read_history);
        });
}

Result<std::optional<EstimateBand>> PostgresStore::get_estimate(const std::string& code,
                                                                const Date& date) const {
    return with_transaction<std::optional<EstimateBand>>("get_estimate", [&](pqxx::work& txn) {
        return first_row<EstimateBand>(
            txn.exec_params(ESTIMATE_SELECT + " WHERE security_code = $1 AND date = $2::date",
                            code, date.to_string()),
            read_estimate);
    });
}

Result<std::vector<EstimateBand>> PostgresStore::get_estimates_on(const Date& date) const {
    return with_transaction<std::vector<EstimateBand>>("get_estimates_on", [&](pqxx::work& txn) {
        return all_rows<EstimateBand>(
            txn.exec_params(ESTIMATE_SELECT + " WHERE date = $1::date ORDER BY security_code",
                            date.to_string()),
            read_estimate);
    });
}

Result<std::optional<YieldRecord>> PostgresStore::get_yield(const Date& date,
                                                            const std::string& code) const {
    return with_transaction<std::optional<YieldRecord>>("get_yield", [&](pqxx::work& txn) {
        return first_row<YieldRecord>(
            txn.exec_params(YIELD_SELECT + " WHERE date = $1::date AND security_code = $2",
                            date.to_string(), code),
            read_yield);
    });
}

Result<std::vector<YieldRecord>> PostgresStore::get_yields_on(const Date& date) const {
    return with_transaction<std::vector<YieldRecord>>("get_yields_on", [&](pqxx::work& txn) {
        return all_rows<YieldRecord>(
            txn.exec_params(YIELD_SELECT + " WHERE date = $1::date ORDER BY security_code",
                            date.to_string()),
            read_yield);
    });
}

Result<std::vector<PayoutRatio>> PostgresStore::get_payout_ratios(const std::string& code) const {
    return with_transaction<std::vector<PayoutRatio>>("get_payout_ratios", [&](pqxx::work& txn) {
        return all_rows<PayoutRatio>(
            txn.exec_params(
                "SELECT security_code, year, period, eps, payout_ratio_cash, payout_ratio_stock, "
                "payout_ratio, EXTRACT(EPOCH FROM updated_time)::float8 AS updated_epoch "
                "FROM payout_ratios WHERE security_code = $1 ORDER BY year, period",
                code),
            read_payout_ratio);
    });
}

Result<std::vector<StockOwnership>> PostgresStore::list_open_lots(const Date& as_of) const {
    return with_transaction<std::vector<StockOwnership>>("list_open_lots", [&](pqxx::work& txn) {
        return all_rows<StockOwnership>(
            txn.exec_params(LOT_SELECT +
                                " WHERE NOT is_sold AND purchase_date <= $1::date ORDER BY id",
                            as_of.to_string()),
            read_lot);
    });
}

Result<std::optional<DailyMoneyHistory>> PostgresStore::get_money_history(
    const std::string& member_id, const Date& date) const {
    return with_transaction<std::optional<DailyMoneyHistory>>(
        "get_money_history", [&](pqxx::work& txn) {
            return first_row<DailyMoneyHistory>(
                txn.exec_params(MONEY_SELECT + " WHERE member_id = $1 AND date = $2::date",
                                member_id, date.to_string()),
                read_money);
        });
}

Result<std::vector<DailyMoneyHistory>> PostgresStore::get_latest_money_histories_before(
    const Date& date) const {
    return with_transaction<std::vector<DailyMoneyHistory>>(
        "get_latest_money_histories_before", [&](pqxx::work& txn) {
            auto query = MONEY_SELECT;
            query.replace(0, 6, "SELECT DISTINCT ON (member_id)");
            return all_rows<DailyMoneyHistory>(
                txn.exec_params(query + " WHERE date < $1::date ORDER BY member_id, date DESC",
                                date.to_string()),
                read_money);
        });
}

Result<std::vector<DailyMoneyHistoryDetail>> PostgresStore::get_money_history_details(
    const std::string& member_id, const Date& date) const {
    return with_transaction<std::vector<DailyMoneyHistoryDetail>>(
        "get_money_history_details", [&](pqxx::work& txn) {
            return all_rows<DailyMoneyHistoryDetail>(
                txn.exec_params(MONEY_DETAIL_SELECT +
                                    " WHERE member_id = $1 AND date = $2::date "
                                    "ORDER BY security_code",
                                member_id, date.to_string()),
                read_money_detail);
        });
}

Result<std::optional<DailyMoneyHistoryDetail>> PostgresStore::get_previous_money_history_detail(
    const std::string& member_id, const std::string& code, const Date& date) const {
    return with_transaction<std::optional<DailyMoneyHistoryDetail>>(
        "get_previous_money_history_detail", [&](pqxx::work& txn) {
            return first_row<DailyMoneyHistoryDetail>(
                txn.exec_params(MONEY_DETAIL_SELECT +
                                    " WHERE member_id = $1 AND security_code = $2 AND "
                                    "date < $3::date ORDER BY date DESC LIMIT 1",
                                member_id, code, date.to_string()),
                read_money_detail);
        });
}

Result<std::optional<DailyMarketStats>> PostgresStore::get_market_stats(const Date& date,
                                                                        int market_id) const {
    return with_transaction<std::optional<DailyMarketStats>>(
        "get_market_stats", [&](pqxx::work& txn) {
            return first_row<DailyMarketStats>(
                txn.exec_params(STATS_SELECT + " WHERE date = $1::date AND market_id = $2",
                                date.to_string(), market_id),
                read_stats);
        });
}

// ---- job-run ledger ----

Result<void> PostgresStore::record_job_run(const JobRun& run) {
    return to_void(with_transaction<bool>("record_job_run", [&](pqxx::work& txn) {
        std::optional<double> finished;
        if (run.finished_at != Timestamp{}) {
            finished = epoch_seconds(run.finished_at);
        }
        txn.exec_params(
            "INSERT INTO job_runs (job_name, business_date, status, attempts, started_at, "
            "finished_at, summary) "
            "VALUES ($1, $2::date, $3, $4, to_timestamp($5), to_timestamp($6), $7) "
            "ON CONFLICT (job_name, business_date) DO UPDATE SET status = EXCLUDED.status, "
            "attempts = EXCLUDED.attempts, started_at = EXCLUDED.started_at, "
            "finished_at = EXCLUDED.finished_at, summary = EXCLUDED.summary",
            run.job_name, run.business_date.to_string(), job_run_status_to_string(run.status),
            run.attempts, epoch_seconds(run.started_at), finished, run.summary);
        return true;
    }));
}

Result<std::optional<JobRun>> PostgresStore::get_job_run(const std::string& job_name,
                                                         const Date& business_date) const {
    return with_transaction<std::optional<JobRun>>("get_job_run", [&](pqxx::work& txn) {
        return first_row<JobRun>(
            txn.exec_params(
                "SELECT job_name, business_date, status, attempts, summary, "
                "EXTRACT(EPOCH FROM started_at)::float8 AS started_epoch, "
                "EXTRACT(EPOCH FROM finished_at)::float8 AS finished_epoch "
                "FROM job_runs WHERE job_name = $1 AND business_date = $2::date",
                job_name, business_date.to_string()),
            read_job_run);
    });
}

}  // namespace market_ingest
