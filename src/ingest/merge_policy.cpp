// src/ingest/merge_policy.cpp
#include "market_ingest/ingest/merge_policy.hpp"
#include <cmath>
#include <tuple>

namespace market_ingest {

namespace {

template <typename T>
MergeDecision<T> overwrite(const std::optional<T>& existing, T incoming, const MergeContext& ctx) {
    MergeDecision<T> decision;
    if (!existing) {
        incoming.created_time = ctx.now;
        incoming.updated_time = ctx.now;
        decision.action = MergeAction::INSERTED;
        decision.row = std::move(incoming);
        return decision;
    }

    if (same_payload(*existing, incoming)) {
        decision.action = MergeAction::UNCHANGED;
        decision.row = *existing;
        return decision;
    }

    incoming.created_time = existing->created_time;
    incoming.updated_time = ctx.now;
    decision.action = MergeAction::UPDATED;
    decision.row = std::move(incoming);
    return decision;
}

template <typename... Fields>
void round_fields(Fields&... fields) {
    ((fields = round_to_scale(fields)), ...);
}

void round_optional(std::optional<double>& field) {
    if (field) {
        *field = round_to_scale(*field);
    }
}

DailyQuote scaled(DailyQuote q) {
    round_fields(q.trade_value, q.open, q.high, q.low, q.close, q.change, q.change_range,
                 q.last_bid_price, q.last_ask_price, q.price_earning_ratio);
    return q;
}

Dividend scaled(Dividend d) {
    round_fields(d.earnings_cash, d.capital_reserve_cash, d.cash_dividend, d.earnings_stock,
                 d.capital_reserve_stock, d.stock_dividend, d.sum, d.payout_ratio_cash,
                 d.payout_ratio_stock, d.payout_ratio);
    return d;
}

FinancialStatement scaled(FinancialStatement f) {
    round_fields(f.gross_profit, f.operating_profit_margin, f.pre_tax_income, f.net_income,
                 f.book_value_per_share, f.sales_per_share, f.earnings_per_share,
                 f.profit_before_tax, f.return_on_equity, f.return_on_assets);
    return f;
}

RevenueRecord scaled(RevenueRecord r) {
    round_fields(r.monthly, r.last_month, r.last_year_this_month, r.monthly_accumulated,
                 r.last_year_monthly_accumulated, r.compared_with_last_month,
                 r.compared_with_last_year_same_month, r.accumulated_compared_with_last_year,
                 r.avg_price, r.lowest_price, r.highest_price);
    return r;
}

MarketIndex scaled(MarketIndex i) {
    round_fields(i.value, i.change, i.change_range, i.trade_value);
    return i;
}

SecurityPatch scaled(SecurityPatch p) {
    round_optional(p.book_value_per_share);
    round_optional(p.eps_last_quarter);
    round_optional(p.eps_last_four_quarters);
    round_optional(p.return_on_equity);
    round_optional(p.foreign_holding_percentage);
    round_optional(p.weight);
    return p;
}

template <typename V>
bool apply_field(const std::optional<V>& patch, V& target) {
    if (!patch || *patch == target) {
        return false;
    }
    target = *patch;
    return true;
}

// Returns true when the stored extreme changed
template <typename Better>
bool merge_extreme(double value, const Date& date, double& stored,
                   std::optional<Date>& stored_date, Better better) {
    if (value <= 0.0) {
        return false;
    }
    if (!stored_date || better(value, stored)) {
        stored = value;
        stored_date = date;
        return true;
    }
    if (value == stored && date < *stored_date) {
        stored_date = date;
        return true;
    }
    return false;
}

}  // namespace

double round_to_scale(double value) {
    constexpr double factor = 10000.0;
    return std::round(value * factor) / factor;
}

QuoteMetrics round_to_scale(QuoteMetrics m) {
    round_fields(m.moving_average_5, m.moving_average_10, m.moving_average_20,
                 m.moving_average_60, m.moving_average_120, m.moving_average_240, m.year_high,
                 m.year_low, m.year_average, m.year_high_pbr, m.year_low_pbr,
                 m.price_to_book_ratio);
    return m;
}

std::string merge_action_to_string(MergeAction action) {
    switch (action) {
        case MergeAction::INSERTED:
            return "INSERTED";
        case MergeAction::UPDATED:
            return "UPDATED";
        case MergeAction::UNCHANGED:
            return "UNCHANGED";
        case MergeAction::SKIPPED:
            return "SKIPPED";
        default:
            return "UNKNOWN";
    }
}

MergeDecision<Security> merge_security(const std::optional<Security>& existing,
                                       const SecurityPatch& patch, const MergeContext& ctx) {
    const SecurityPatch incoming = scaled(patch);
    Security row;
    if (existing) {
        row = *existing;
    } else {
        row.code = incoming.code;
    }

    bool changed = false;
    changed |= apply_field(incoming.name, row.name);
    changed |= apply_field(incoming.market_id, row.market_id);
    changed |= apply_field(incoming.industry_id, row.industry_id);
    changed |= apply_field(incoming.suspended, row.suspended);
    changed |= apply_field(incoming.issued_shares, row.issued_shares);
    changed |= apply_field(incoming.book_value_per_share, row.book_value_per_share);
    changed |= apply_field(incoming.eps_last_quarter, row.eps_last_quarter);
    changed |= apply_field(incoming.eps_last_four_quarters, row.eps_last_four_quarters);
    changed |= apply_field(incoming.return_on_equity, row.return_on_equity);
    changed |= apply_field(incoming.foreign_shares_held, row.foreign_shares_held);
    changed |= apply_field(incoming.foreign_holding_percentage, row.foreign_holding_percentage);
    changed |= apply_field(incoming.weight, row.weight);

    MergeDecision<Security> decision;
    if (!existing) {
        row.created_time = ctx.now;
        row.updated_time = ctx.now;
        decision.action = MergeAction::INSERTED;
    } else if (changed) {
        row.updated_time = ctx.now;
        decision.action = MergeAction::UPDATED;
    } else {
        decision.action = MergeAction::UNCHANGED;
    }
    decision.row = std::move(row);
    return decision;
}

MergeDecision<DailyQuote> merge_daily_quote(const std::optional<DailyQuote>& existing,
                                            const DailyQuote& incoming, const MergeContext& ctx) {
    DailyQuote row = scaled(incoming);
    if (existing) {
        // Derived columns belong to the metrics engine
        row.metrics = existing->metrics;
    } else {
        row.metrics = QuoteMetrics{};
    }
    return overwrite(existing, std::move(row), ctx);
}

MergeDecision<Dividend> merge_dividend(const std::optional<Dividend>& existing,
                                       const Dividend& incoming, const MergeContext& ctx) {
    Dividend row = scaled(incoming);
    if (row.cash_dividend == 0.0) {
        row.cash_dividend = row.earnings_cash + row.capital_reserve_cash;
    }
    if (row.stock_dividend == 0.0) {
        row.stock_dividend = row.earnings_stock + row.capital_reserve_stock;
    }
    if (row.sum == 0.0) {
        row.sum = row.cash_dividend + row.stock_dividend;
    }

    if (existing && !row.correction && !same_payload(*existing, row)) {
        auto payable = existing->last_payable_date();
        if (payable && *payable < ctx.as_of) {
            MergeDecision<Dividend> decision;
            decision.action = MergeAction::SKIPPED;
            decision.row = *existing;
            decision.reason = "payable date " + payable->to_string() +
                              " has passed; only corrections may overwrite";
            return decision;
        }
    }
    return overwrite(existing, std::move(row), ctx);
}

MergeDecision<FinancialStatement> merge_financial_statement(
    const std::optional<FinancialStatement>& existing, const FinancialStatement& incoming,
    const MergeContext& ctx) {
    return overwrite(existing, scaled(incoming), ctx);
}

MergeDecision<MarketIndex> merge_market_index(const std::optional<MarketIndex>& existing,
                                              const MarketIndex& incoming,
                                              const MergeContext& ctx) {
    return overwrite(existing, scaled(incoming), ctx);
}

MergeDecision<RevenueRecord> merge_revenue(const std::optional<RevenueRecord>& existing,
                                           const std::optional<RevenueCursor>& cursor,
                                           const RevenueRecord& incoming,
                                           const MergeContext& ctx) {
    if (cursor && incoming.month <= cursor->month) {
        MergeDecision<RevenueRecord> decision;
        decision.action = MergeAction::SKIPPED;
        decision.row = existing ? *existing : incoming;
        decision.reason = "month " + std::to_string(incoming.month) +
                          " is not after cursor " + std::to_string(cursor->month);
        return decision;
    }
    return overwrite(existing, scaled(incoming), ctx);
}

RevenueCursor advance_cursor(const std::optional<RevenueCursor>& cursor,
                             const MergeDecision<RevenueRecord>& decision) {
    RevenueCursor next = cursor ? *cursor : RevenueCursor{decision.row.code, 0};
    if (decision.action != MergeAction::SKIPPED && decision.row.month > next.month) {
        next.code = decision.row.code;
        next.month = decision.row.month;
    }
    return next;
}

MergeDecision<QuoteHistoryRecord> merge_quote_history(
    const std::optional<QuoteHistoryRecord>& existing, const HistoryCandidate& candidate,
    const MergeContext& ctx) {
    QuoteHistoryRecord row;
    if (existing) {
        row = *existing;
    } else {
        row.code = candidate.code;
    }

    const double close = round_to_scale(candidate.close);
    const double price_to_book = round_to_scale(candidate.price_to_book);
    bool changed = false;
    changed |= merge_extreme(close, candidate.date, row.max_price, row.max_price_date,
                             [](double v, double s) { return v > s; });
    changed |= merge_extreme(close, candidate.date, row.min_price, row.min_price_date,
                             [](double v, double s) { return v < s; });
    changed |= merge_extreme(price_to_book, candidate.date, row.max_price_to_book,
                             row.max_price_to_book_date, [](double v, double s) { return v > s; });
    changed |= merge_extreme(price_to_book, candidate.date, row.min_price_to_book,
                             row.min_price_to_book_date, [](double v, double s) { return v < s; });

    MergeDecision<QuoteHistoryRecord> decision;
    if (!changed) {
        decision.action = existing ? MergeAction::UNCHANGED : MergeAction::SKIPPED;
        decision.reason = existing ? "" : "no positive price or price-to-book";
        decision.row = std::move(row);
        return decision;
    }

    if (!existing) {
        row.created_time = ctx.now;
        decision.action = MergeAction::INSERTED;
    } else {
        decision.action = MergeAction::UPDATED;
    }
    row.updated_time = ctx.now;
    decision.row = std::move(row);
    return decision;
}

bool same_payload(const Security& a, const Security& b) {
    return std::tie(a.code, a.name, a.market_id, a.industry_id, a.suspended, a.issued_shares,
                    a.book_value_per_share, a.eps_last_quarter, a.eps_last_four_quarters,
                    a.return_on_equity, a.foreign_shares_held, a.foreign_holding_percentage,
                    a.weight) ==
           std::tie(b.code, b.name, b.market_id, b.industry_id, b.suspended, b.issued_shares,
                    b.book_value_per_share, b.eps_last_quarter, b.eps_last_four_quarters,
                    b.return_on_equity, b.foreign_shares_held, b.foreign_holding_percentage,
                    b.weight);
}

bool same_payload(const DailyQuote& a, const DailyQuote& b) {
    return std::tie(a.code, a.date, a.trading_volume, a.transactions, a.trade_value, a.open,
                    a.high, a.low, a.close, a.change, a.change_range, a.last_bid_price,
                    a.last_bid_volume, a.last_ask_price, a.last_ask_volume,
                    a.price_earning_ratio) ==
               std::tie(b.code, b.date, b.trading_volume, b.transactions, b.trade_value, b.open,
                        b.high, b.low, b.close, b.change, b.change_range, b.last_bid_price,
                        b.last_bid_volume, b.last_ask_price, b.last_ask_volume,
                        b.price_earning_ratio) &&
           same_metrics(a.metrics, b.metrics);
}

bool same_payload(const Dividend& a, const Dividend& b) {
    return std::tie(a.code, a.year, a.year_of_dividend, a.period, a.earnings_cash,
                    a.capital_reserve_cash, a.cash_dividend, a.earnings_stock,
                    a.capital_reserve_stock, a.stock_dividend, a.sum, a.ex_dividend_date,
                    a.ex_rights_date, a.payable_date_cash, a.payable_date_stock,
                    a.payout_ratio_cash, a.payout_ratio_stock, a.payout_ratio) ==
           std::tie(b.code, b.year, b.year_of_dividend, b.period, b.earnings_cash,
                    b.capital_reserve_cash, b.cash_dividend, b.earnings_stock,
                    b.capital_reserve_stock, b.stock_dividend, b.sum, b.ex_dividend_date,
                    b.ex_rights_date, b.payable_date_cash, b.payable_date_stock,
                    b.payout_ratio_cash, b.payout_ratio_stock, b.payout_ratio);
}

bool same_payload(const FinancialStatement& a, const FinancialStatement& b) {
    return std::tie(a.code, a.year, a.quarter, a.gross_profit, a.operating_profit_margin,
                    a.pre_tax_income, a.net_income, a.book_value_per_share, a.sales_per_share,
                    a.earnings_per_share, a.profit_before_tax, a.return_on_equity,
                    a.return_on_assets) ==
           std::tie(b.code, b.year, b.quarter, b.gross_profit, b.operating_profit_margin,
                    b.pre_tax_income, b.net_income, b.book_value_per_share, b.sales_per_share,
                    b.earnings_per_share, b.profit_before_tax, b.return_on_equity,
                    b.return_on_assets);
}

bool same_payload(const RevenueRecord& a, const RevenueRecord& b) {
    return std::tie(a.code, a.month, a.monthly, a.last_month, a.last_year_this_month,
                    a.monthly_accumulated, a.last_year_monthly_accumulated,
                    a.compared_with_last_month, a.compared_with_last_year_same_month,
                    a.accumulated_compared_with_last_year, a.avg_price, a.lowest_price,
                    a.highest_price) ==
           std::tie(b.code, b.month, b.monthly, b.last_month, b.last_year_this_month,
                    b.monthly_accumulated, b.last_year_monthly_accumulated,
                    b.compared_with_last_month, b.compared_with_last_year_same_month,
                    b.accumulated_compared_with_last_year, b.avg_price, b.lowest_price,
                    b.highest_price);
}

bool same_payload(const MarketIndex& a, const MarketIndex& b) {
    return std::tie(a.code, a.date, a.value, a.change, a.change_range, a.trade_volume,
                    a.trade_value, a.transactions) ==
           std::tie(b.code, b.date, b.value, b.change, b.change_range, b.trade_volume,
                    b.trade_value, b.transactions);
}

bool same_payload(const QuoteHistoryRecord& a, const QuoteHistoryRecord& b) {
    return std::tie(a.code, a.max_price, a.max_price_date, a.min_price, a.min_price_date,
                    a.max_price_to_book, a.max_price_to_book_date, a.min_price_to_book,
                    a.min_price_to_book_date) ==
           std::tie(b.code, b.max_price, b.max_price_date, b.min_price, b.min_price_date,
                    b.max_price_to_book, b.max_price_to_book_date, b.min_price_to_book,
                    b.min_price_to_book_date);
}

bool same_metrics(const QuoteMetrics& a, const QuoteMetrics& b) {
    return std::tie(a.moving_average_5, a.moving_average_10, a.moving_average_20,
                    a.moving_average_60, a.moving_average_120, a.moving_average_240, a.year_high,
                    a.year_high_date, a.year_low, a.year_low_date, a.year_average,
                    a.year_high_pbr, a.year_high_pbr_date, a.year_low_pbr, a.year_low_pbr_date,
                    a.price_to_book_ratio) ==
           std::tie(b.moving_average_5, b.moving_average_10, b.moving_average_20,
                    b.moving_average_60, b.moving_average_120, b.moving_average_240, b.year_high,
                    b.year_high_date, b.year_low, b.year_low_date, b.year_average,
                    b.year_high_pbr, b.year_high_pbr_date, b.year_low_pbr, b.year_low_pbr_date,
                    b.price_to_book_ratio);
}

}  // namespace market_ingest
