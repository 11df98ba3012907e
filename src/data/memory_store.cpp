// src/data/memory_store.cpp
#include "market_ingest/data/memory_store.hpp"
#include <algorithm>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"

namespace market_ingest {

namespace {

template <typename Map, typename Key, typename Decide>
MergeOutcome apply_merge(Map& map, const Key& key, Decide decide) {
    std::optional<typename Map::mapped_type> existing;
    auto it = map.find(key);
    if (it != map.end()) {
        existing = it->second;
    }
    auto decision = decide(existing);
    if (decision.writes()) {
        map[key] = decision.row;
    }
    return MergeOutcome{decision.action, decision.reason};
}

template <typename Map, typename Key>
std::optional<typename Map::mapped_type> find_optional(const Map& map, const Key& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

MemoryStore::MemoryStore() : component_id_(StateManager::make_component_id("MemoryStore")) {}

MemoryStore::~MemoryStore() {
    disconnect();
}

Result<void> MemoryStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_) {
        return Result<void>();
    }

    ComponentInfo info{ComponentType::STORE,
                       ComponentState::RUNNING,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Store state registration failed: " << registered.error()->what());
    }
    connected_ = true;
    return Result<void>();
}

void MemoryStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return;
    }
    connected_ = false;
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Store was not registered: " << unregistered.error()->what());
    }
}

bool MemoryStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

Result<MergeOutcome> MemoryStore::merge_security(const SecurityPatch& patch,
                                                 const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_merge(securities_, patch.code, [&](const std::optional<Security>& existing) {
        return market_ingest::merge_security(existing, patch, ctx);
    });
}

Result<MergeOutcome> MemoryStore::merge_daily_quote(const DailyQuote& quote,
                                                    const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_merge(quotes_[quote.code], quote.date,
                       [&](const std::optional<DailyQuote>& existing) {
                           return market_ingest::merge_daily_quote(existing, quote, ctx);
                       });
}

Result<MergeOutcome> MemoryStore::merge_dividend(const Dividend& dividend,
                                                 const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_merge(dividends_, dividend.key(), [&](const std::optional<Dividend>& existing) {
        return market_ingest::merge_dividend(existing, dividend, ctx);
    });
}

Result<MergeOutcome> MemoryStore::merge_financial_statement(const FinancialStatement& statement,
                                                            const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_merge(statements_, statement.key(),
                       [&](const std::optional<FinancialStatement>& existing) {
                           return market_ingest::merge_financial_statement(existing, statement,
                                                                           ctx);
                       });
}

Result<MergeOutcome> MemoryStore::merge_revenue(const RevenueRecord& revenue,
                                                const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cursor = find_optional(revenue_cursors_, revenue.code);
    auto existing = find_optional(revenues_, std::make_pair(revenue.code, revenue.month));

    auto decision = market_ingest::merge_revenue(existing, cursor, revenue, ctx);
    if (decision.action != MergeAction::SKIPPED) {
        if (decision.writes()) {
            revenues_[std::make_pair(revenue.code, revenue.month)] = decision.row;
        }
        revenue_cursors_[revenue.code] = advance_cursor(cursor, decision);
    }
    return MergeOutcome{decision.action, decision.reason};
}

Result<MergeOutcome> MemoryStore::merge_market_index(const MarketIndex& index,
                                                     const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_merge(indices_, std::make_pair(index.code, index.date),
                       [&](const std::optional<MarketIndex>& existing) {
                           return market_ingest::merge_market_index(existing, index, ctx);
                       });
}

Result<MergeOutcome> MemoryStore::merge_quote_history(const HistoryCandidate& candidate,
                                                      const MergeContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_merge(history_records_, candidate.code,
                       [&](const std::optional<QuoteHistoryRecord>& existing) {
                           return market_ingest::merge_quote_history(existing, candidate, ctx);
                       });
}

Result<int64_t> MemoryStore::put_ownership(const StockOwnership& lot) {
    std::lock_guard<std::mutex> lock(mutex_);
    StockOwnership row = lot;
    if (row.id == 0) {
        row.id = next_lot_id_++;
    } else {
        next_lot_id_ = std::max(next_lot_id_, row.id + 1);
    }
    lots_[row.id] = row;
    return Result<int64_t>(row.id);
}

Result<MergeAction> MemoryStore::update_quote_metrics(const QuoteKey& key,
                                                      const QuoteMetrics& computed,
                                                      Timestamp now) {
    const QuoteMetrics metrics = round_to_scale(computed);
    std::lock_guard<std::mutex> lock(mutex_);
    auto code_it = quotes_.find(key.code);
    if (code_it == quotes_.end() || code_it->second.count(key.date) == 0) {
        return make_error<MergeAction>(ErrorCode::NOT_FOUND,
                                       "No quote for " + key.code + " on " + key.date.to_string(),
                                       "MemoryStore");
    }
    auto& quote = code_it->second[key.date];
    if (same_metrics(quote.metrics, metrics)) {
        return Result<MergeAction>(MergeAction::UNCHANGED);
    }
    quote.metrics = metrics;
    quote.updated_time = now;
    return Result<MergeAction>(MergeAction::UPDATED);
}

Result<void> MemoryStore::put_estimate(const EstimateBand& band) {
    std::lock_guard<std::mutex> lock(mutex_);
    estimates_[std::make_pair(band.code, band.date)] = band;
    return Result<void>();
}

Result<void> MemoryStore::put_yield(const YieldRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    yields_[std::make_pair(record.date, record.code)] = record;
    return Result<void>();
}

Result<void> MemoryStore::put_payout_ratio(const PayoutRatio& ratio) {
    std::lock_guard<std::mutex> lock(mutex_);
    payout_ratios_[std::make_tuple(ratio.code, ratio.year, ratio.period)] = ratio;
    return Result<void>();
}

Result<void> MemoryStore::put_money_snapshot(const DailyMoneyHistory& summary,
                                             const std::vector<DailyMoneyHistoryDetail>& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    money_history_[std::make_pair(summary.member_id, summary.date)] = summary;

    auto first = money_details_.lower_bound(std::make_tuple(summary.member_id, summary.date,
                                                            std::string()));
    auto last = first;
    while (last != money_details_.end() && std::get<0>(last->first) == summary.member_id &&
           std::get<1>(last->first) == summary.date) {
        ++last;
    }
    money_details_.erase(first, last);

    for (const auto& detail : details) {
        money_details_[std::make_tuple(detail.member_id, detail.date, detail.code)] = detail;
    }
    return Result<void>();
}

Result<void> MemoryStore::put_market_stats(const DailyMarketStats& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    market_stats_[std::make_pair(stats.date, stats.market_id)] = stats;
    return Result<void>();
}

Result<std::optional<Security>> MemoryStore::get_security(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<Security>>(find_optional(securities_, code));
}

Result<std::vector<Security>> MemoryStore::list_securities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Security> result;
    result.reserve(securities_.size());
    for (const auto& [_, security] : securities_) {
        result.push_back(security);
    }
    return Result<std::vector<Security>>(std::move(result));
}

Result<std::optional<DailyQuote>> MemoryStore::get_daily_quote(const QuoteKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(key.code);
    if (it == quotes_.end()) {
        return Result<std::optional<DailyQuote>>(std::nullopt);
    }
    return Result<std::optional<DailyQuote>>(find_optional(it->second, key.date));
}

Result<std::vector<DailyQuote>> MemoryStore::get_recent_quotes(const std::string& code,
                                                               const Date& up_to,
                                                               size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyQuote> result;
    auto it = quotes_.find(code);
    if (it == quotes_.end() || limit == 0) {
        return Result<std::vector<DailyQuote>>(std::move(result));
    }

    auto end = it->second.upper_bound(up_to);
    auto begin = end;
    for (size_t n = 0; n < limit && begin != it->second.begin(); ++n) {
        --begin;
    }
    for (auto cur = begin; cur != end; ++cur) {
        result.push_back(cur->second);
    }
    return Result<std::vector<DailyQuote>>(std::move(result));
}

Result<std::vector<DailyQuote>> MemoryStore::get_quotes_between(const std::string& code,
                                                                const Date& from,
                                                                const Date& to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyQuote> result;
    auto it = quotes_.find(code);
    if (it != quotes_.end()) {
        for (auto cur = it->second.lower_bound(from);
             cur != it->second.end() && cur->first <= to; ++cur) {
            result.push_back(cur->second);
        }
    }
    return Result<std::vector<DailyQuote>>(std::move(result));
}

Result<std::vector<DailyQuote>> MemoryStore::get_quotes_on(const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyQuote> result;
    for (const auto& [_, by_date] : quotes_) {
        auto it = by_date.find(date);
        if (it != by_date.end()) {
            result.push_back(it->second);
        }
    }
    return Result<std::vector<DailyQuote>>(std::move(result));
}

Result<std::vector<DailyQuote>> MemoryStore::get_latest_quotes(
    const std::vector<std::string>& codes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyQuote> result;
    for (const auto& code : codes) {
        auto it = quotes_.find(code);
        if (it != quotes_.end() && !it->second.empty()) {
            result.push_back(it->second.rbegin()->second);
        }
    }
    return Result<std::vector<DailyQuote>>(std::move(result));
}

Result<std::optional<DailyQuote>> MemoryStore::get_latest_quote_on_or_before(
    const std::string& code, const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(code);
    if (it == quotes_.end()) {
        return Result<std::optional<DailyQuote>>(std::nullopt);
    }
    auto upper = it->second.upper_bound(date);
    if (upper == it->second.begin()) {
        return Result<std::optional<DailyQuote>>(std::nullopt);
    }
    --upper;
    return Result<std::optional<DailyQuote>>(upper->second);
}

Result<std::optional<Dividend>> MemoryStore::get_dividend(const DividendKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<Dividend>>(find_optional(dividends_, key));
}

Result<std::vector<Dividend>> MemoryStore::get_dividends(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Dividend> result;
    for (auto it = dividends_.lower_bound(DividendKey{code, 0, ""});
         it != dividends_.end() && it->first.code == code; ++it) {
        result.push_back(it->second);
    }
    return Result<std::vector<Dividend>>(std::move(result));
}

Result<std::vector<Dividend>> MemoryStore::list_dividends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Dividend> result;
    result.reserve(dividends_.size());
    for (const auto& [_, dividend] : dividends_) {
        result.push_back(dividend);
    }
    return Result<std::vector<Dividend>>(std::move(result));
}

Result<std::vector<FinancialStatement>> MemoryStore::get_financial_statements(
    const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FinancialStatement> result;
    for (auto it = statements_.lower_bound(StatementKey{code, 0, ""});
         it != statements_.end() && it->first.code == code; ++it) {
        result.push_back(it->second);
    }
    return Result<std::vector<FinancialStatement>>(std::move(result));
}

Result<std::optional<RevenueRecord>> MemoryStore::get_revenue(const std::string& code,
                                                              YearMonth month) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<RevenueRecord>>(
        find_optional(revenues_, std::make_pair(code, month)));
}

Result<std::optional<RevenueCursor>> MemoryStore::get_revenue_cursor(
    const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<RevenueCursor>>(find_optional(revenue_cursors_, code));
}

Result<std::optional<MarketIndex>> MemoryStore::get_market_index(const std::string& code,
                                                                 const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<MarketIndex>>(
        find_optional(indices_, std::make_pair(code, date)));
}

Result<std::optional<QuoteHistoryRecord>> MemoryStore::get_quote_history_record(
    const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<QuoteHistoryRecord>>(find_optional(history_records_, code));
}

Result<std::optional<EstimateBand>> MemoryStore::get_estimate(const std::string& code,
                                                              const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<EstimateBand>>(
        find_optional(estimates_, std::make_pair(code, date)));
}

Result<std::vector<EstimateBand>> MemoryStore::get_estimates_on(const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EstimateBand> result;
    for (const auto& [key, band] : estimates_) {
        if (key.second == date) {
            result.push_back(band);
        }
    }
    return Result<std::vector<EstimateBand>>(std::move(result));
}

Result<std::optional<YieldRecord>> MemoryStore::get_yield(const Date& date,
                                                          const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<YieldRecord>>(find_optional(yields_, std::make_pair(date, code)));
}

Result<std::vector<YieldRecord>> MemoryStore::get_yields_on(const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<YieldRecord> result;
    for (auto it = yields_.lower_bound(std::make_pair(date, std::string()));
         it != yields_.end() && it->first.first == date; ++it) {
        result.push_back(it->second);
    }
    return Result<std::vector<YieldRecord>>(std::move(result));
}

Result<std::vector<PayoutRatio>> MemoryStore::get_payout_ratios(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PayoutRatio> result;
    for (auto it = payout_ratios_.lower_bound(std::make_tuple(code, 0, std::string()));
         it != payout_ratios_.end() && std::get<0>(it->first) == code; ++it) {
        result.push_back(it->second);
    }
    return Result<std::vector<PayoutRatio>>(std::move(result));
}

Result<std::vector<StockOwnership>> MemoryStore::list_open_lots(const Date& as_of) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StockOwnership> result;
    for (const auto& [_, lot] : lots_) {
        if (!lot.is_sold && lot.purchase_date <= as_of) {
            result.push_back(lot);
        }
    }
    return Result<std::vector<StockOwnership>>(std::move(result));
}

Result<std::optional<DailyMoneyHistory>> MemoryStore::get_money_history(
    const std::string& member_id, const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<DailyMoneyHistory>>(
        find_optional(money_history_, std::make_pair(member_id, date)));
}

Result<std::vector<DailyMoneyHistory>> MemoryStore::get_latest_money_histories_before(
    const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, DailyMoneyHistory> latest;
    for (const auto& [key, history] : money_history_) {
        if (key.second < date) {
            // Keys are ordered by (member, date), so later rows win
            latest[key.first] = history;
        }
    }
    std::vector<DailyMoneyHistory> result;
    result.reserve(latest.size());
    for (auto& [_, history] : latest) {
        result.push_back(std::move(history));
    }
    return Result<std::vector<DailyMoneyHistory>>(std::move(result));
}

Result<std::vector<DailyMoneyHistoryDetail>> MemoryStore::get_money_history_details(
    const std::string& member_id, const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyMoneyHistoryDetail> result;
    for (auto it = money_details_.lower_bound(std::make_tuple(member_id, date, std::string()));
         it != money_details_.end() && std::get<0>(it->first) == member_id &&
         std::get<1>(it->first) == date;
         ++it) {
        result.push_back(it->second);
    }
    return Result<std::vector<DailyMoneyHistoryDetail>>(std::move(result));
}

Result<std::optional<DailyMoneyHistoryDetail>> MemoryStore::get_previous_money_history_detail(
    const std::string& member_id, const std::string& code, const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<DailyMoneyHistoryDetail> latest;
    for (const auto& [key, detail] : money_details_) {
        if (std::get<0>(key) == member_id && std::get<2>(key) == code && std::get<1>(key) < date &&
            (!latest || latest->date < std::get<1>(key))) {
            latest = detail;
        }
    }
    return Result<std::optional<DailyMoneyHistoryDetail>>(std::move(latest));
}

Result<std::optional<DailyMarketStats>> MemoryStore::get_market_stats(const Date& date,
                                                                      int market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<DailyMarketStats>>(
        find_optional(market_stats_, std::make_pair(date, market_id)));
}

Result<void> MemoryStore::record_job_run(const JobRun& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    job_runs_[std::make_pair(run.job_name, run.business_date)] = run;
    return Result<void>();
}

Result<std::optional<JobRun>> MemoryStore::get_job_run(const std::string& job_name,
                                                       const Date& business_date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::optional<JobRun>>(
        find_optional(job_runs_, std::make_pair(job_name, business_date)));
}

}  // namespace market_ingest
