// src/ingest/source_adapter.cpp
#include "market_ingest/ingest/source_adapter.hpp"
#include <type_traits>

namespace market_ingest {

std::string record_kind_to_string(RecordKind kind) {
    switch (kind) {
        case RecordKind::SECURITY:
            return "SECURITY";
        case RecordKind::DAILY_QUOTE:
            return "DAILY_QUOTE";
        case RecordKind::DIVIDEND:
            return "DIVIDEND";
        case RecordKind::FINANCIAL_STATEMENT:
            return "FINANCIAL_STATEMENT";
        case RecordKind::REVENUE:
            return "REVENUE";
        case RecordKind::MARKET_INDEX:
            return "MARKET_INDEX";
    }
    return "UNKNOWN";
}

RecordKind record_kind(const NormalizedRecord& record) {
    return std::visit(
        [](const auto& r) -> RecordKind {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SecurityPatch>) {
                return RecordKind::SECURITY;
            } else if constexpr (std::is_same_v<T, DailyQuote>) {
                return RecordKind::DAILY_QUOTE;
            } else if constexpr (std::is_same_v<T, Dividend>) {
                return RecordKind::DIVIDEND;
            } else if constexpr (std::is_same_v<T, FinancialStatement>) {
                return RecordKind::FINANCIAL_STATEMENT;
            } else if constexpr (std::is_same_v<T, RevenueRecord>) {
                return RecordKind::REVENUE;
            } else {
                return RecordKind::MARKET_INDEX;
            }
        },
        record);
}

std::string record_key(const NormalizedRecord& record) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SecurityPatch>) {
                return r.code;
            } else if constexpr (std::is_same_v<T, DailyQuote> || std::is_same_v<T, MarketIndex>) {
                return r.code + "/" + r.date.to_string();
            } else if constexpr (std::is_same_v<T, Dividend>) {
                return r.code + "/" + std::to_string(r.year) + "/" + r.period;
            } else if constexpr (std::is_same_v<T, FinancialStatement>) {
                return r.code + "/" + std::to_string(r.year) + "/" + r.quarter;
            } else {
                return r.code + "/" + std::to_string(r.month);
            }
        },
        record);
}

Result<std::vector<NormalizedRecord>> SourceAdapter::fetch(const FetchTarget& target) const {
    if (!fetch_) {
        return make_error<std::vector<NormalizedRecord>>(
            ErrorCode::NOT_INITIALIZED, "Source has no fetch behaviour", name_);
    }
    try {
        return fetch_(target);
    } catch (const std::exception& e) {
        return make_error<std::vector<NormalizedRecord>>(
            ErrorCode::FETCH_ERROR, "Source threw for " + target.to_string() + ": " + e.what(),
            name_);
    }
}

}  // namespace market_ingest
