// include/market_ingest/ingest/source_adapter.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/error.hpp"
#include "market_ingest/data/entities.hpp"

namespace market_ingest {

enum class RecordKind {
    SECURITY,
    DAILY_QUOTE,
    DIVIDEND,
    FINANCIAL_STATEMENT,
    REVENUE,
    MARKET_INDEX
};

std::string record_kind_to_string(RecordKind kind);

/**
 * @brief One record as delivered by a source, already in canonical shape
 */
using NormalizedRecord = std::variant<SecurityPatch, DailyQuote, Dividend, FinancialStatement,
                                      RevenueRecord, MarketIndex>;

RecordKind record_kind(const NormalizedRecord& record);

/**
 * @brief Natural key of a record as text, for reports and logs
 */
std::string record_key(const NormalizedRecord& record);

/**
 * @brief Unit of work handed to a source
 *
 * An empty code asks for the whole market on that date.
 */
struct FetchTarget {
    std::string code;
    Date date;

    std::string to_string() const {
        return (code.empty() ? std::string("*") : code) + "@" + date.to_string();
    }
};

/**
 * @brief Uniform capability over any external data source
 *
 * Holds the fetch behaviour as a callable so that sources need no common
 * base class; anything with a matching fetch() can be adapted.
 */
class SourceAdapter {
public:
    using FetchFn = std::function<Result<std::vector<NormalizedRecord>>(const FetchTarget&)>;

    SourceAdapter(std::string name, RecordKind kind, FetchFn fetch)
        : name_(std::move(name)), kind_(kind), fetch_(std::move(fetch)) {}

    const std::string& name() const {
        return name_;
    }

    RecordKind kind() const {
        return kind_;
    }

    /**
     * @brief Fetch records for one target
     *
     * Exceptions escaping the source are reported as FETCH_ERROR.
     */
    Result<std::vector<NormalizedRecord>> fetch(const FetchTarget& target) const;

private:
    std::string name_;
    RecordKind kind_;
    FetchFn fetch_;
};

/**
 * @brief Adapt a shared source object exposing
 * Result<std::vector<NormalizedRecord>> fetch(const FetchTarget&) const
 */
template <typename Source>
SourceAdapter make_source_adapter(std::string name, RecordKind kind,
                                  std::shared_ptr<Source> source) {
    return SourceAdapter(std::move(name), kind,
                         [source](const FetchTarget& target) { return source->fetch(target); });
}

}  // namespace market_ingest
