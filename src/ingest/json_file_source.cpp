// src/ingest/json_file_source.cpp
#include "market_ingest/ingest/json_file_source.hpp"
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include "market_ingest/core/logger.hpp"

namespace market_ingest {

namespace {

Date date_field(const nlohmann::json& j, const char* name) {
    auto parsed = Date::parse(j.at(name).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("invalid date in field ") + name);
    }
    return *parsed;
}

std::optional<Date> optional_date_field(const nlohmann::json& j, const char* name) {
    if (!j.contains(name) || j.at(name).is_null()) {
        return std::nullopt;
    }
    return date_field(j, name);
}

template <typename T>
void read_if_present(const nlohmann::json& j, const char* name, T& out) {
    if (j.contains(name) && !j.at(name).is_null()) {
        out = j.at(name).get<T>();
    }
}

template <typename T>
void read_optional(const nlohmann::json& j, const char* name, std::optional<T>& out) {
    if (j.contains(name) && !j.at(name).is_null()) {
        out = j.at(name).get<T>();
    }
}

SecurityPatch parse_security(const nlohmann::json& j) {
    SecurityPatch p;
    p.code = j.at("code").get<std::string>();
    read_optional(j, "name", p.name);
    read_optional(j, "market_id", p.market_id);
    read_optional(j, "industry_id", p.industry_id);
    read_optional(j, "suspended", p.suspended);
    read_optional(j, "issued_shares", p.issued_shares);
    read_optional(j, "book_value_per_share", p.book_value_per_share);
    read_optional(j, "eps_last_quarter", p.eps_last_quarter);
    read_optional(j, "eps_last_four_quarters", p.eps_last_four_quarters);
    read_optional(j, "return_on_equity", p.return_on_equity);
    read_optional(j, "foreign_shares_held", p.foreign_shares_held);
    read_optional(j, "foreign_holding_percentage", p.foreign_holding_percentage);
    read_optional(j, "weight", p.weight);
    return p;
}

DailyQuote parse_quote(const nlohmann::json& j) {
    DailyQuote q;
    q.code = j.at("code").get<std::string>();
    q.date = date_field(j, "date");
    read_if_present(j, "trading_volume", q.trading_volume);
    read_if_present(j, "transactions", q.transactions);
    read_if_present(j, "trade_value", q.trade_value);
    read_if_present(j, "open", q.open);
    read_if_present(j, "high", q.high);
    read_if_present(j, "low", q.low);
    q.close = j.at("close").get<double>();
    read_if_present(j, "change", q.change);
    read_if_present(j, "change_range", q.change_range);
    read_if_present(j, "last_bid_price", q.last_bid_price);
    read_if_present(j, "last_bid_volume", q.last_bid_volume);
    read_if_present(j, "last_ask_price", q.last_ask_price);
    read_if_present(j, "last_ask_volume", q.last_ask_volume);
    read_if_present(j, "price_earning_ratio", q.price_earning_ratio);
    return q;
}

Dividend parse_dividend(const nlohmann::json& j) {
    Dividend d;
    d.code = j.at("code").get<std::string>();
    d.year = j.at("year").get<int>();
    read_if_present(j, "period", d.period);
    d.year_of_dividend = d.year - 1;
    read_if_present(j, "year_of_dividend", d.year_of_dividend);
    read_if_present(j, "earnings_cash", d.earnings_cash);
    read_if_present(j, "capital_reserve_cash", d.capital_reserve_cash);
    read_if_present(j, "cash_dividend", d.cash_dividend);
    read_if_present(j, "earnings_stock", d.earnings_stock);
    read_if_present(j, "capital_reserve_stock", d.capital_reserve_stock);
    read_if_present(j, "stock_dividend", d.stock_dividend);
    read_if_present(j, "sum", d.sum);
    d.ex_dividend_date = optional_date_field(j, "ex_dividend_date");
    d.ex_rights_date = optional_date_field(j, "ex_rights_date");
    d.payable_date_cash = optional_date_field(j, "payable_date_cash");
    d.payable_date_stock = optional_date_field(j, "payable_date_stock");
    read_if_present(j, "payout_ratio_cash", d.payout_ratio_cash);
    read_if_present(j, "payout_ratio_stock", d.payout_ratio_stock);
    read_if_present(j, "payout_ratio", d.payout_ratio);
    read_if_present(j, "correction", d.correction);
    return d;
}

FinancialStatement parse_statement(const nlohmann::json& j) {
    FinancialStatement f;
    f.code = j.at("code").get<std::string>();
    f.year = j.at("year").get<int>();
    f.quarter = j.at("quarter").get<std::string>();
    read_if_present(j, "gross_profit", f.gross_profit);
    read_if_present(j, "operating_profit_margin", f.operating_profit_margin);
    read_if_present(j, "pre_tax_income", f.pre_tax_income);
    read_if_present(j, "net_income", f.net_income);
    read_if_present(j, "book_value_per_share", f.book_value_per_share);
    read_if_present(j, "sales_per_share", f.sales_per_share);
    read_if_present(j, "earnings_per_share", f.earnings_per_share);
    read_if_present(j, "profit_before_tax", f.profit_before_tax);
    read_if_present(j, "return_on_equity", f.return_on_equity);
    read_if_present(j, "return_on_assets", f.return_on_assets);
    return f;
}

RevenueRecord parse_revenue(const nlohmann::json& j) {
    RevenueRecord r;
    r.code = j.at("code").get<std::string>();
    r.month = j.at("month").get<int>();
    r.monthly = j.at("monthly").get<double>();
    read_if_present(j, "last_month", r.last_month);
    read_if_present(j, "last_year_this_month", r.last_year_this_month);
    read_if_present(j, "monthly_accumulated", r.monthly_accumulated);
    read_if_present(j, "last_year_monthly_accumulated", r.last_year_monthly_accumulated);
    read_if_present(j, "compared_with_last_month", r.compared_with_last_month);
    read_if_present(j, "compared_with_last_year_same_month", r.compared_with_last_year_same_month);
    read_if_present(j, "accumulated_compared_with_last_year",
                    r.accumulated_compared_with_last_year);
    return r;
}

MarketIndex parse_index(const nlohmann::json& j) {
    MarketIndex i;
    i.code = j.at("code").get<std::string>();
    i.date = date_field(j, "date");
    i.value = j.at("value").get<double>();
    read_if_present(j, "change", i.change);
    read_if_present(j, "change_range", i.change_range);
    read_if_present(j, "trade_volume", i.trade_volume);
    read_if_present(j, "trade_value", i.trade_value);
    read_if_present(j, "transactions", i.transactions);
    return i;
}

// An item whose fields cannot be read keeps its code when that is a string,
// with the natural key left invalid so the merger rejects it
NormalizedRecord unreadable_record(const nlohmann::json& j, RecordKind kind) {
    std::string code;
    if (j.is_object() && j.contains("code") && j.at("code").is_string()) {
        code = j.at("code").get<std::string>();
    }
    switch (kind) {
        case RecordKind::DAILY_QUOTE: {
            DailyQuote q;
            q.code = code;
            return q;
        }
        case RecordKind::DIVIDEND: {
            Dividend d;
            d.code = code;
            return d;
        }
        case RecordKind::FINANCIAL_STATEMENT: {
            FinancialStatement f;
            f.code = code;
            return f;
        }
        case RecordKind::REVENUE: {
            RevenueRecord r;
            r.code = code;
            return r;
        }
        case RecordKind::MARKET_INDEX: {
            MarketIndex i;
            i.code = code;
            return i;
        }
        case RecordKind::SECURITY:
            break;
    }
    // A security is keyed by its code alone
    return SecurityPatch{};
}

bool matches_code(const NormalizedRecord& record, const std::string& code) {
    return std::visit([&](const auto& r) { return r.code == code; }, record);
}

}  // namespace

JsonFileSource::JsonFileSource(std::filesystem::path root, std::string dataset, RecordKind kind)
    : root_(std::move(root)), dataset_(std::move(dataset)), kind_(kind) {}

std::filesystem::path JsonFileSource::file_for(const Date& date) const {
    return root_ / dataset_ / (date.to_string() + ".json");
}

NormalizedRecord JsonFileSource::parse_record(const nlohmann::json& j, RecordKind kind) {
    switch (kind) {
        case RecordKind::SECURITY:
            return parse_security(j);
        case RecordKind::DAILY_QUOTE:
            return parse_quote(j);
        case RecordKind::DIVIDEND:
            return parse_dividend(j);
        case RecordKind::FINANCIAL_STATEMENT:
            return parse_statement(j);
        case RecordKind::REVENUE:
            return parse_revenue(j);
        case RecordKind::MARKET_INDEX:
            return parse_index(j);
    }
    throw std::invalid_argument("unknown record kind");
}

Result<std::vector<NormalizedRecord>> JsonFileSource::fetch(const FetchTarget& target) const {
    auto path = file_for(target.date);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error<std::vector<NormalizedRecord>>(
            ErrorCode::FETCH_ERROR, "No " + dataset_ + " data published at " + path.string(),
            "JsonFileSource");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::vector<NormalizedRecord>>(
            ErrorCode::FETCH_ERROR, "Cannot open " + path.string(), "JsonFileSource");
    }

    std::vector<NormalizedRecord> records;
    try {
        nlohmann::json document;
        file >> document;
        if (!document.is_array()) {
            return make_error<std::vector<NormalizedRecord>>(
                ErrorCode::PARSE_ERROR, path.string() + " does not hold a record array",
                "JsonFileSource");
        }
        records.reserve(document.size());
        for (size_t i = 0; i < document.size(); ++i) {
            const auto& item = document[i];
            std::optional<NormalizedRecord> record;
            try {
                record = parse_record(item, kind_);
            } catch (const nlohmann::json::exception& e) {
                WARN("Unreadable item " << i << " of " << path.string() << ": " << e.what());
                record = unreadable_record(item, kind_);
            } catch (const std::invalid_argument& e) {
                WARN("Unreadable item " << i << " of " << path.string() << ": " << e.what());
                record = unreadable_record(item, kind_);
            }
            if (target.code.empty() || matches_code(*record, target.code)) {
                records.push_back(std::move(*record));
            }
        }
    } catch (const std::exception& e) {
        return make_error<std::vector<NormalizedRecord>>(
            ErrorCode::PARSE_ERROR, "Malformed " + path.string() + ": " + e.what(),
            "JsonFileSource");
    }

    DEBUG("Read " << records.size() << " " << dataset_ << " records for "
                  << target.to_string());
    return Result<std::vector<NormalizedRecord>>(std::move(records));
}

SourceAdapter make_json_file_adapter(const std::filesystem::path& root,
                                     const std::string& dataset, RecordKind kind) {
    return make_source_adapter(dataset, kind,
                               std::make_shared<JsonFileSource>(root, dataset, kind));
}

}  // namespace market_ingest
