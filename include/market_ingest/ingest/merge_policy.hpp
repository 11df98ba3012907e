// include/market_ingest/ingest/merge_policy.hpp
#pragma once

#include <optional>
#include <string>
#include "market_ingest/core/date.hpp"
#include "market_ingest/core/types.hpp"
#include "market_ingest/data/entities.hpp"

namespace market_ingest {

/**
 * @brief Outcome of applying one incoming record to its stored counterpart
 */
enum class MergeAction {
    INSERTED,   // no stored row existed
    UPDATED,    // stored row changed
    UNCHANGED,  // incoming values already stored, timestamps untouched
    SKIPPED     // policy refused the write (cursor, locked dividend, no improvement)
};

std::string merge_action_to_string(MergeAction action);

/**
 * @brief Wall clock and business date a merge is evaluated against
 */
struct MergeContext {
    Timestamp now{};
    Date as_of;
};

template <typename T>
struct MergeDecision {
    MergeAction action{MergeAction::UNCHANGED};
    T row;
    std::string reason;

    bool writes() const {
        return action == MergeAction::INSERTED || action == MergeAction::UPDATED;
    }
};

/**
 * @brief Candidate extremes observed on one quote date
 */
struct HistoryCandidate {
    std::string code;
    Date date;
    Price close{0.0};
    double price_to_book{0.0};
};

/**
 * Merge functions are pure: the caller supplies the stored row (if any) read
 * inside its atomic section and persists the returned row when writes().
 * Each one is idempotent: merging the same incoming value twice yields
 * UNCHANGED the second time with an identical row.
 */

/**
 * @brief Field-by-field overwrite of the engaged patch fields
 */
MergeDecision<Security> merge_security(const std::optional<Security>& existing,
                                       const SecurityPatch& incoming, const MergeContext& ctx);

/**
 * @brief Overwrite source fields of a quote, keeping stored derived metrics
 */
MergeDecision<DailyQuote> merge_daily_quote(const std::optional<DailyQuote>& existing,
                                            const DailyQuote& incoming, const MergeContext& ctx);

/**
 * @brief Overwrite a dividend unless its payable date has passed and the
 * incoming record is not flagged as a correction
 */
MergeDecision<Dividend> merge_dividend(const std::optional<Dividend>& existing,
                                       const Dividend& incoming, const MergeContext& ctx);

MergeDecision<FinancialStatement> merge_financial_statement(
    const std::optional<FinancialStatement>& existing, const FinancialStatement& incoming,
    const MergeContext& ctx);

MergeDecision<MarketIndex> merge_market_index(const std::optional<MarketIndex>& existing,
                                              const MarketIndex& incoming,
                                              const MergeContext& ctx);

/**
 * @brief Cursor-gated revenue write
 *
 * A month not strictly after the stored cursor is SKIPPED. On a write the
 * caller must persist the advanced cursor in the same atomic section.
 */
MergeDecision<RevenueRecord> merge_revenue(const std::optional<RevenueRecord>& existing,
                                           const std::optional<RevenueCursor>& cursor,
                                           const RevenueRecord& incoming,
                                           const MergeContext& ctx);

/**
 * @brief Cursor value after a revenue merge decision
 */
RevenueCursor advance_cursor(const std::optional<RevenueCursor>& cursor,
                             const MergeDecision<RevenueRecord>& decision);

/**
 * @brief Monotonic-extremes merge of one observation
 *
 * A value replaces a stored extreme only when strictly better; an equal value
 * observed on an earlier date moves the occurrence date back, so the result
 * does not depend on the order observations arrive in.
 */
MergeDecision<QuoteHistoryRecord> merge_quote_history(
    const std::optional<QuoteHistoryRecord>& existing, const HistoryCandidate& candidate,
    const MergeContext& ctx);

/**
 * @brief Round to the four decimal places of the stored numeric columns
 *
 * Merges compare incoming values against rows read back from the store, so
 * both sides carry the stored precision.
 */
double round_to_scale(double value);
QuoteMetrics round_to_scale(QuoteMetrics metrics);

bool same_payload(const Security& a, const Security& b);
bool same_payload(const DailyQuote& a, const DailyQuote& b);
bool same_payload(const Dividend& a, const Dividend& b);
bool same_payload(const FinancialStatement& a, const FinancialStatement& b);
bool same_payload(const RevenueRecord& a, const RevenueRecord& b);
bool same_payload(const MarketIndex& a, const MarketIndex& b);
bool same_payload(const QuoteHistoryRecord& a, const QuoteHistoryRecord& b);
bool same_metrics(const QuoteMetrics& a, const QuoteMetrics& b);

}  // namespace market_ingest
