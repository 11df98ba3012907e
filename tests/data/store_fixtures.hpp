// tests/data/store_fixtures.hpp
#pragma once

#include <chrono>
#include <string>
#include "market_ingest/data/entities.hpp"
#include "market_ingest/ingest/merge_policy.hpp"

namespace market_ingest {
namespace testing {

// Fixed wall clock so that timestamps compare equal across runs
inline Timestamp fixed_now(int offset_seconds = 0) {
    return Timestamp(std::chrono::seconds(1735689600 + offset_seconds));  // 2025-01-01 00:00 UTC
}

inline MergeContext make_context(const Date& as_of, int offset_seconds = 0) {
    return MergeContext{fixed_now(offset_seconds), as_of};
}

inline SecurityPatch make_security(const std::string& code, int market_id = 1,
                                   double book_value_per_share = 10.0) {
    SecurityPatch patch;
    patch.code = code;
    patch.name = "Security " + code;
    patch.market_id = market_id;
    patch.industry_id = 24;
    patch.suspended = false;
    patch.book_value_per_share = book_value_per_share;
    return patch;
}

inline DailyQuote make_quote(const std::string& code, const Date& date, Price close,
                             Price change = 0.0) {
    DailyQuote quote;
    quote.code = code;
    quote.date = date;
    quote.open = close - change;
    quote.high = close;
    quote.low = close - change;
    quote.close = close;
    quote.change = change;
    quote.change_range = close - change != 0.0 ? change / (close - change) * 100.0 : 0.0;
    quote.trading_volume = 1000000;
    quote.transactions = 500;
    quote.trade_value = close * 1000000;
    return quote;
}

inline Dividend make_dividend(const std::string& code, int year, double cash,
                              std::optional<Date> payable = std::nullopt) {
    Dividend dividend;
    dividend.code = code;
    dividend.year = year;
    dividend.year_of_dividend = year - 1;
    dividend.period = "A";
    dividend.earnings_cash = cash;
    dividend.payable_date_cash = payable;
    return dividend;
}

inline FinancialStatement make_statement(const std::string& code, int year,
                                         const std::string& quarter, double eps) {
    FinancialStatement statement;
    statement.code = code;
    statement.year = year;
    statement.quarter = quarter;
    statement.earnings_per_share = eps;
    statement.book_value_per_share = 50.0;
    statement.return_on_equity = 12.5;
    return statement;
}

inline RevenueRecord make_revenue(const std::string& code, YearMonth month, double monthly) {
    RevenueRecord revenue;
    revenue.code = code;
    revenue.month = month;
    revenue.monthly = monthly;
    return revenue;
}

inline StockOwnership make_lot(const std::string& member_id, const std::string& code,
                               Shares shares, Price unit_cost, const Date& purchase_date) {
    StockOwnership lot;
    lot.member_id = member_id;
    lot.code = code;
    lot.share_quantity = shares;
    lot.share_price_average = unit_cost;
    lot.holding_cost = -static_cast<double>(shares) * unit_cost;
    lot.purchase_date = purchase_date;
    return lot;
}

}  // namespace testing
}  // namespace market_ingest
