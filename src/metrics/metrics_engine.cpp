// src/metrics/metrics_engine.cpp
#include "market_ingest/metrics/metrics_engine.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"
#include "market_ingest/metrics/statistics.hpp"

namespace market_ingest {

namespace {

const char* const COMPONENT = "MetricsEngine";

template <typename T>
Result<T> skipped(const std::string& message) {
    return make_error<T>(ErrorCode::COMPUTATION_SKIPPED, message, COMPONENT);
}

/**
 * Run fn for every code on up to `workers` threads. fn must be safe to call
 * concurrently for different codes.
 */
template <typename Fn>
void for_each_code(const std::vector<std::string>& codes, int workers, Fn fn) {
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        Logger::register_component(COMPONENT);
        while (true) {
            size_t index = next_index.fetch_add(1);
            if (index >= codes.size()) {
                break;
            }
            fn(codes[index]);
        }
    };

    size_t count = std::min(codes.size(), static_cast<size_t>(std::max(1, workers)));
    if (count <= 1) {
        worker();
        return;
    }
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

// Tallies one per-security result into a report shared by the workers
class ReportCollector {
public:
    void success(bool changed) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++report_.processed;
        if (changed) {
            ++report_.updated;
        } else {
            ++report_.unchanged;
        }
    }

    void failure(const std::string& code, const PipelineError& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++report_.processed;
        if (error.code() == ErrorCode::COMPUTATION_SKIPPED) {
            ++report_.skipped;
            DEBUG("Skipped " << code << ": " << error.what());
            return;
        }
        ++report_.failed;
        report_.failures.push_back(code + ": " + error.what());
        ERROR("Metrics failed for " << code << ": " << error.to_string());
    }

    MetricsReport take() {
        std::lock_guard<std::mutex> lock(mutex_);
        return report_;
    }

private:
    std::mutex mutex_;
    MetricsReport report_;
};

void add_annual(std::map<int, double>& totals, int year, double amount) {
    totals[year] += amount;
}

}  // namespace

nlohmann::json MetricsConfig::to_json() const {
    return nlohmann::json{{"valuation_lookback_years", valuation_lookback_years},
                          {"moving_average_windows", moving_average_windows},
                          {"extrema_window", extrema_window},
                          {"default_payout_ratio", default_payout_ratio},
                          {"dividend_max_age_years", dividend_max_age_years},
                          {"workers", workers},
                          {"estimator_weights",
                           {{"price", estimator_weights.price},
                            {"dividend", estimator_weights.dividend},
                            {"eps", estimator_weights.eps},
                            {"pbr", estimator_weights.pbr},
                            {"per", estimator_weights.per}}}};
}

void MetricsConfig::from_json(const nlohmann::json& j) {
    if (j.contains("valuation_lookback_years"))
        valuation_lookback_years = j.at("valuation_lookback_years").get<int>();
    if (j.contains("moving_average_windows"))
        moving_average_windows = j.at("moving_average_windows").get<std::vector<int>>();
    if (j.contains("extrema_window"))
        extrema_window = j.at("extrema_window").get<int>();
    if (j.contains("default_payout_ratio"))
        default_payout_ratio = j.at("default_payout_ratio").get<double>();
    if (j.contains("dividend_max_age_years"))
        dividend_max_age_years = j.at("dividend_max_age_years").get<int>();
    if (j.contains("workers"))
        workers = j.at("workers").get<int>();
    if (j.contains("estimator_weights")) {
        const auto& w = j.at("estimator_weights");
        if (w.contains("price"))
            estimator_weights.price = w.at("price").get<double>();
        if (w.contains("dividend"))
            estimator_weights.dividend = w.at("dividend").get<double>();
        if (w.contains("eps"))
            estimator_weights.eps = w.at("eps").get<double>();
        if (w.contains("pbr"))
            estimator_weights.pbr = w.at("pbr").get<double>();
        if (w.contains("per"))
            estimator_weights.per = w.at("per").get<double>();
    }
}

void MetricsReport::add(const MetricsReport& other) {
    processed += other.processed;
    updated += other.updated;
    unchanged += other.unchanged;
    skipped += other.skipped;
    failed += other.failed;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
}

std::optional<double> annual_eps(const std::vector<FinancialStatement>& statements, int year) {
    double quarters_sum = 0.0;
    int quarters = 0;
    for (const auto& s : statements) {
        if (s.year != year) {
            continue;
        }
        if (s.quarter == "A") {
            return s.earnings_per_share;
        }
        quarters_sum += s.earnings_per_share;
        ++quarters;
    }
    if (quarters == 4) {
        return quarters_sum;
    }
    return std::nullopt;
}

std::vector<YieldRecord> rank_yields(std::vector<YieldRecord> yields) {
    std::sort(yields.begin(), yields.end(), [](const YieldRecord& a, const YieldRecord& b) {
        if (a.yield != b.yield) {
            return a.yield > b.yield;
        }
        return a.code < b.code;
    });
    return yields;
}

MetricsEngine::MetricsEngine(std::shared_ptr<CanonicalStore> store,
                             std::shared_ptr<SecurityLockTable> locks, MetricsConfig config)
    : store_(std::move(store)),
      locks_(locks ? std::move(locks) : std::make_shared<SecurityLockTable>()),
      config_(std::move(config)),
      component_id_(StateManager::make_component_id(COMPONENT)) {
    ComponentInfo info{ComponentType::METRICS_ENGINE,
                       ComponentState::RUNNING,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Metrics engine state registration failed: " << registered.error()->what());
    }
}

MetricsEngine::~MetricsEngine() {
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Metrics engine was not registered: " << unregistered.error()->what());
    }
}

// ---------------------------------------------------------------------------
// Per-quote metrics

size_t MetricsEngine::history_rows() const {
    size_t history = static_cast<size_t>(std::max(1, config_.extrema_window));
    for (int window : config_.moving_average_windows) {
        history = std::max(history, static_cast<size_t>(std::max(1, window)));
    }
    return history;
}

Result<QuoteMetrics> MetricsEngine::compute_quote_metrics(const std::string& code,
                                                          const Date& date) const {
    auto recent = store_->get_recent_quotes(code, date, history_rows());
    if (recent.is_error()) {
        return forward_error<QuoteMetrics>(recent);
    }
    const auto& quotes = recent.value();
    if (quotes.empty() || quotes.back().date != date) {
        return skipped<QuoteMetrics>("no quote for " + code + " on " + date.to_string());
    }

    auto security = store_->get_security(code);
    if (security.is_error()) {
        return forward_error<QuoteMetrics>(security);
    }
    const double book_value = security.value() ? security.value()->book_value_per_share : 0.0;

    const auto n = static_cast<Eigen::Index>(quotes.size());
    Eigen::VectorXd closes(n);
    Eigen::VectorXd pbr(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& q = quotes[static_cast<size_t>(i)];
        closes(i) = q.close;
        pbr(i) = q.metrics.price_to_book_ratio;
    }

    QuoteMetrics metrics = quotes.back().metrics;
    for (int window : config_.moving_average_windows) {
        double* slot = metrics.moving_average_slot(window);
        if (!slot) {
            continue;
        }
        // Fewer rows than the window leaves the average at its default
        *slot = statistics::trailing_mean(closes, window).value_or(0.0);
    }

    const double close = quotes.back().close;
    metrics.price_to_book_ratio = (close > 0.0 && book_value > 0.0) ? close / book_value : 0.0;
    pbr(n - 1) = metrics.price_to_book_ratio;

    auto price_extrema = statistics::trailing_extrema(closes, config_.extrema_window);
    if (price_extrema) {
        metrics.year_high = price_extrema->max;
        metrics.year_high_date = quotes[static_cast<size_t>(price_extrema->max_index)].date;
        metrics.year_low = price_extrema->min;
        metrics.year_low_date = quotes[static_cast<size_t>(price_extrema->min_index)].date;
        metrics.year_average = price_extrema->mean;
    }

    auto pbr_extrema = statistics::trailing_extrema(pbr, config_.extrema_window, true);
    if (pbr_extrema) {
        metrics.year_high_pbr = pbr_extrema->max;
        metrics.year_high_pbr_date = quotes[static_cast<size_t>(pbr_extrema->max_index)].date;
        metrics.year_low_pbr = pbr_extrema->min;
        metrics.year_low_pbr_date = quotes[static_cast<size_t>(pbr_extrema->min_index)].date;
    } else {
        metrics.year_high_pbr = 0.0;
        metrics.year_high_pbr_date.reset();
        metrics.year_low_pbr = 0.0;
        metrics.year_low_pbr_date.reset();
    }
    return Result<QuoteMetrics>(std::move(metrics));
}

Result<MergeAction> MetricsEngine::refresh_quote_metrics(const std::string& code,
                                                         const Date& date,
                                                         const MergeContext& ctx) {
    auto lock = locks_->acquire(code);
    return refresh_locked(code, date, ctx);
}

Result<MergeAction> MetricsEngine::refresh_locked(const std::string& code, const Date& date,
                                                  const MergeContext& ctx) {
    auto metrics = compute_quote_metrics(code, date);
    if (metrics.is_error()) {
        return forward_error<MergeAction>(metrics);
    }

    auto action = store_->update_quote_metrics(QuoteKey{code, date}, metrics.value(), ctx.now);
    if (action.is_error()) {
        return action;
    }

    auto quote = store_->get_daily_quote(QuoteKey{code, date});
    if (quote.is_error()) {
        return forward_error<MergeAction>(quote);
    }
    if (quote.value()) {
        HistoryCandidate candidate{code, date, quote.value()->close,
                                   metrics.value().price_to_book_ratio};
        auto history = store_->merge_quote_history(candidate, ctx);
        if (history.is_error()) {
            return forward_error<MergeAction>(history);
        }
    }
    return action;
}

// ---------------------------------------------------------------------------
// Valuation

Result<ValuationInputs> MetricsEngine::collect_valuation_inputs(const std::string& code,
                                                                const Date& date) const {
    ValuationInputs inputs;
    const int lookback = std::max(1, config_.valuation_lookback_years);
    const Date from = date.add_years(-lookback).add_days(1);
    const int first_year = date.year - lookback + 1;

    auto quotes = store_->get_quotes_between(code, from, date);
    if (quotes.is_error()) {
        return forward_error<ValuationInputs>(quotes);
    }
    std::set<int> years;
    for (const auto& q : quotes.value()) {
        if (q.close > 0.0) {
            inputs.closing_prices.push_back(q.close);
            years.insert(q.date.year);
        }
        if (q.metrics.price_to_book_ratio > 0.0) {
            inputs.price_to_book_ratios.push_back(q.metrics.price_to_book_ratio);
        }
        if (q.price_earning_ratio > 0.0) {
            inputs.price_earning_ratios.push_back(q.price_earning_ratio);
        }
    }
    inputs.year_count = static_cast<int>(years.size());

    auto dividends = store_->get_dividends(code);
    if (dividends.is_error()) {
        return forward_error<ValuationInputs>(dividends);
    }
    auto ratios = store_->get_payout_ratios(code);
    if (ratios.is_error()) {
        return forward_error<ValuationInputs>(ratios);
    }

    std::map<int, double> dividend_totals;
    std::map<int, double> payout_by_year;
    for (const auto& d : dividends.value()) {
        if (d.year < first_year || d.year > date.year) {
            continue;
        }
        add_annual(dividend_totals, d.year, d.sum);
        if (d.payout_ratio > 0.0) {
            payout_by_year[d.year] = std::max(payout_by_year[d.year], d.payout_ratio);
        }
    }
    for (const auto& r : ratios.value()) {
        if (r.year >= first_year && r.year <= date.year && r.period == "A" &&
            r.payout_ratio > 0.0) {
            payout_by_year[r.year] = r.payout_ratio;
        }
    }
    for (const auto& [year, total] : dividend_totals) {
        if (total > 0.0) {
            inputs.annual_dividends.push_back(total);
        }
    }
    for (const auto& [year, ratio] : payout_by_year) {
        inputs.payout_ratios.push_back(ratio);
    }

    auto statements = store_->get_financial_statements(code);
    if (statements.is_error()) {
        return forward_error<ValuationInputs>(statements);
    }
    for (int year = first_year - 1; year < date.year; ++year) {
        auto eps = annual_eps(statements.value(), year);
        if (eps) {
            inputs.annual_eps.push_back(*eps);
        }
    }

    auto security = store_->get_security(code);
    if (security.is_error()) {
        return forward_error<ValuationInputs>(security);
    }
    if (security.value()) {
        inputs.eps_last_four_quarters = security.value()->eps_last_four_quarters;
        inputs.book_value_per_share = security.value()->book_value_per_share;
    }
    return Result<ValuationInputs>(std::move(inputs));
}

Result<EstimateBand> MetricsEngine::compute_estimate(const std::string& code,
                                                     const Date& date) const {
    auto quote = store_->get_daily_quote(QuoteKey{code, date});
    if (quote.is_error()) {
        return forward_error<EstimateBand>(quote);
    }
    if (!quote.value()) {
        return skipped<EstimateBand>("no quote for " + code + " on " + date.to_string());
    }

    auto inputs = collect_valuation_inputs(code, date);
    if (inputs.is_error()) {
        return forward_error<EstimateBand>(inputs);
    }
    return Result<EstimateBand>(valuation::estimate(code, date, quote.value()->close,
                                                    inputs.value(), config_.estimator_weights,
                                                    config_.default_payout_ratio));
}

// ---------------------------------------------------------------------------
// Yield and payout ratios

Result<YieldRecord> MetricsEngine::compute_yield(const std::string& code,
                                                 const Date& date) const {
    auto quote = store_->get_daily_quote(QuoteKey{code, date});
    if (quote.is_error()) {
        return forward_error<YieldRecord>(quote);
    }
    if (!quote.value() || quote.value()->close <= 0.0) {
        return skipped<YieldRecord>("no closing price for " + code + " on " + date.to_string());
    }

    auto security = store_->get_security(code);
    if (security.is_error()) {
        return forward_error<YieldRecord>(security);
    }
    if (security.value() && security.value()->suspended) {
        return skipped<YieldRecord>(code + " is suspended");
    }

    auto dividends = store_->get_dividends(code);
    if (dividends.is_error()) {
        return forward_error<YieldRecord>(dividends);
    }

    const Dividend* latest = nullptr;
    for (const auto& d : dividends.value()) {
        if (d.period != "A" || d.year > date.year ||
            d.year < date.year - config_.dividend_max_age_years) {
            continue;
        }
        if (!latest || d.year > latest->year) {
            latest = &d;
        }
    }
    if (!latest) {
        return skipped<YieldRecord>("no recent annual dividend for " + code);
    }

    YieldRecord record;
    record.date = date;
    record.code = code;
    record.yield = latest->cash_dividend / quote.value()->close;
    record.quote = QuoteKey{code, date};
    record.dividend = latest->key();
    return Result<YieldRecord>(std::move(record));
}

Result<std::vector<PayoutRatio>> MetricsEngine::compute_payout_ratios(
    const std::string& code) const {
    auto dividends = store_->get_dividends(code);
    if (dividends.is_error()) {
        return forward_error<std::vector<PayoutRatio>>(dividends);
    }
    auto statements = store_->get_financial_statements(code);
    if (statements.is_error()) {
        return forward_error<std::vector<PayoutRatio>>(statements);
    }

    std::vector<PayoutRatio> ratios;
    for (const auto& d : dividends.value()) {
        PayoutRatio ratio;
        ratio.code = code;
        ratio.year = d.year;
        ratio.period = d.period;
        ratio.eps = annual_eps(statements.value(), d.year_of_dividend).value_or(0.0);

        const double eps = ratio.eps;
        ratio.payout_ratio_cash = d.payout_ratio_cash > 0.0
                                      ? d.payout_ratio_cash
                                      : (eps > 0.0 ? d.cash_dividend / eps * 100.0 : 0.0);
        ratio.payout_ratio_stock = d.payout_ratio_stock > 0.0
                                       ? d.payout_ratio_stock
                                       : (eps > 0.0 ? d.stock_dividend / eps * 100.0 : 0.0);
        ratio.payout_ratio =
            d.payout_ratio > 0.0 ? d.payout_ratio : (eps > 0.0 ? d.sum / eps * 100.0 : 0.0);

        if (ratio.payout_ratio > 0.0 || ratio.payout_ratio_cash > 0.0 ||
            ratio.payout_ratio_stock > 0.0) {
            ratios.push_back(std::move(ratio));
        }
    }
    return Result<std::vector<PayoutRatio>>(std::move(ratios));
}

// ---------------------------------------------------------------------------
// Market breadth

Result<std::vector<DailyMarketStats>> MetricsEngine::compute_market_stats(const Date& date) const {
    auto securities = store_->list_securities();
    if (securities.is_error()) {
        return forward_error<std::vector<DailyMarketStats>>(securities);
    }
    auto quotes = store_->get_quotes_on(date);
    if (quotes.is_error()) {
        return forward_error<std::vector<DailyMarketStats>>(quotes);
    }
    auto estimates = store_->get_estimates_on(date);
    if (estimates.is_error()) {
        return forward_error<std::vector<DailyMarketStats>>(estimates);
    }

    std::map<std::string, int> market_of;
    for (const auto& s : securities.value()) {
        market_of[s.code] = s.market_id;
    }
    std::map<std::string, const EstimateBand*> estimate_of;
    for (const auto& e : estimates.value()) {
        estimate_of[e.code] = &e;
    }

    std::map<int, DailyMarketStats> stats;
    auto tally = [&](DailyMarketStats& s, const DailyQuote& q) {
        ++s.total;
        auto it = estimate_of.find(q.code);
        if (it != estimate_of.end()) {
            switch (classify(q.close, it->second->combined)) {
                case ValuationClass::UNDERVALUED:
                    ++s.undervalued;
                    break;
                case ValuationClass::FAIR:
                    ++s.fair_valued;
                    break;
                case ValuationClass::OVERVALUED:
                    ++s.overvalued;
                    break;
                case ValuationClass::HIGHLY_OVERVALUED:
                    ++s.highly_overvalued;
                    break;
                case ValuationClass::UNKNOWN:
                    break;
            }
        }

        const std::pair<int, std::pair<int*, int*>> windows[] = {
            {5, {&s.above_ma5, &s.below_ma5}},
            {20, {&s.above_ma20, &s.below_ma20}},
            {60, {&s.above_ma60, &s.below_ma60}},
            {120, {&s.above_ma120, &s.below_ma120}},
            {240, {&s.above_ma240, &s.below_ma240}}};
        for (const auto& [window, counters] : windows) {
            double average = q.metrics.moving_average(window);
            if (average <= 0.0) {
                continue;
            }
            if (q.close > average) {
                ++*counters.first;
            } else if (q.close < average) {
                ++*counters.second;
            }
        }

        if (q.change > 0.0) {
            ++s.stocks_up;
        } else if (q.change < 0.0) {
            ++s.stocks_down;
        } else {
            ++s.stocks_unchanged;
        }
    };

    stats[0].market_id = 0;
    for (const auto& q : quotes.value()) {
        tally(stats[0], q);
        auto market = market_of.find(q.code);
        if (market != market_of.end() && market->second != 0) {
            auto& s = stats[market->second];
            s.market_id = market->second;
            tally(s, q);
        }
    }

    std::vector<DailyMarketStats> result;
    for (auto& [market_id, s] : stats) {
        s.date = date;
        result.push_back(s);
    }
    return Result<std::vector<DailyMarketStats>>(std::move(result));
}

// ---------------------------------------------------------------------------
// Batch passes

MetricsReport MetricsEngine::run_quote_metrics(const std::vector<std::string>& codes,
                                               const Date& date, const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    ReportCollector collector;
    for_each_code(codes, config_.workers, [&](const std::string& code) {
        auto action = refresh_quote_metrics(code, date, ctx);
        if (action.is_error()) {
            collector.failure(code, *action.error());
        } else {
            collector.success(action.value() != MergeAction::UNCHANGED);
        }
    });
    auto report = collector.take();
    INFO("Quote metrics for " << date << ": " << report.updated << " updated, "
                              << report.unchanged << " unchanged, " << report.skipped
                              << " skipped, " << report.failed << " failed");
    return report;
}

MetricsReport MetricsEngine::run_dependent_quote_metrics(const std::vector<QuoteKey>& written,
                                                         const Date& date,
                                                         const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    std::map<std::string, Date> earliest;
    for (const auto& key : written) {
        auto it = earliest.find(key.code);
        if (it == earliest.end()) {
            earliest.emplace(key.code, key.date);
        } else if (key.date < it->second) {
            it->second = key.date;
        }
    }
    std::vector<std::string> codes;
    codes.reserve(earliest.size());
    for (const auto& entry : earliest) {
        codes.push_back(entry.first);
    }

    const size_t horizon = history_rows();
    ReportCollector collector;
    for_each_code(codes, config_.workers, [&](const std::string& code) {
        const Date& from = earliest.at(code);
        auto lock = locks_->acquire(code);

        // At most five trading rows in seven calendar days, holidays aside
        const Date to = from.add_days(static_cast<int64_t>(horizon) * 2 + 31);
        auto rows = store_->get_quotes_between(code, from, to);
        if (rows.is_error()) {
            collector.failure(code, *rows.error());
            return;
        }
        auto affected = rows.take();
        if (affected.size() > horizon) {
            affected.resize(horizon);
        }
        if (affected.empty() || (affected.size() == 1 && affected.front().date == date)) {
            return;
        }

        bool changed = false;
        for (const auto& quote : affected) {
            auto action = refresh_locked(code, quote.date, ctx);
            if (action.is_error()) {
                collector.failure(code, *action.error());
                return;
            }
            changed = changed || action.value() != MergeAction::UNCHANGED;
        }
        DEBUG("Recomputed " << affected.size() << " quote(s) of " << code << " from " << from);
        collector.success(changed);
    });

    auto report = collector.take();
    if (report.processed > 0) {
        INFO("Out-of-order quotes refreshed for " << report.processed << " securities: "
                                                 << report.updated << " updated, "
                                                 << report.failed << " failed");
    }
    return report;
}

MetricsReport MetricsEngine::run_estimates(const std::vector<std::string>& codes,
                                           const Date& date, const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    ReportCollector collector;
    for_each_code(codes, config_.workers, [&](const std::string& code) {
        auto band = compute_estimate(code, date);
        if (band.is_error()) {
            collector.failure(code, *band.error());
            return;
        }
        EstimateBand row = band.value();
        row.updated_time = ctx.now;
        auto stored = store_->put_estimate(row);
        if (stored.is_error()) {
            collector.failure(code, *stored.error());
        } else {
            collector.success(true);
        }
    });
    auto report = collector.take();
    INFO("Valuation bands for " << date << ": " << report.updated << " written, "
                                << report.skipped << " skipped, " << report.failed
                                << " failed");
    return report;
}

MetricsReport MetricsEngine::run_yields(const std::vector<std::string>& codes, const Date& date,
                                        const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    ReportCollector collector;
    std::mutex yields_mutex;
    std::vector<YieldRecord> yields;

    for_each_code(codes, config_.workers, [&](const std::string& code) {
        auto record = compute_yield(code, date);
        if (record.is_error()) {
            collector.failure(code, *record.error());
            return;
        }
        YieldRecord row = record.value();
        row.updated_time = ctx.now;
        auto stored = store_->put_yield(row);
        if (stored.is_error()) {
            collector.failure(code, *stored.error());
            return;
        }
        collector.success(true);
        std::lock_guard<std::mutex> lock(yields_mutex);
        yields.push_back(std::move(row));
    });

    auto ranked = rank_yields(std::move(yields));
    if (!ranked.empty()) {
        INFO("Top yield on " << date << ": " << ranked.front().code << " at "
                             << ranked.front().yield * 100.0 << "%");
    }
    return collector.take();
}

MetricsReport MetricsEngine::run_payout_ratios(const std::vector<std::string>& codes,
                                               const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    ReportCollector collector;
    for_each_code(codes, config_.workers, [&](const std::string& code) {
        auto ratios = compute_payout_ratios(code);
        if (ratios.is_error()) {
            collector.failure(code, *ratios.error());
            return;
        }
        if (ratios.value().empty()) {
            collector.success(false);
            return;
        }
        for (auto ratio : ratios.value()) {
            ratio.updated_time = ctx.now;
            auto stored = store_->put_payout_ratio(ratio);
            if (stored.is_error()) {
                collector.failure(code, *stored.error());
                return;
            }
        }
        collector.success(true);
    });
    return collector.take();
}

Result<std::vector<DailyMarketStats>> MetricsEngine::run_market_stats(const Date& date,
                                                                      const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    auto stats = compute_market_stats(date);
    if (stats.is_error()) {
        return stats;
    }
    auto rows = stats.take();
    for (auto& s : rows) {
        s.updated_time = ctx.now;
        auto stored = store_->put_market_stats(s);
        if (stored.is_error()) {
            return forward_error<std::vector<DailyMarketStats>>(stored);
        }
    }
    INFO("Market stats for " << date << " written for " << rows.size() << " market(s)");
    return Result<std::vector<DailyMarketStats>>(std::move(rows));
}

}  // namespace market_ingest
