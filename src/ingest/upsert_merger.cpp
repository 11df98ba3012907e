// src/ingest/upsert_merger.cpp
#include "market_ingest/ingest/upsert_merger.hpp"
#include <algorithm>
#include <sstream>
#include <type_traits>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"

namespace market_ingest {

namespace {

Result<void> reject(const std::string& message) {
    return make_error<void>(ErrorCode::VALIDATION_ERROR, message, "UpsertMerger");
}

double percent_change(double current, double previous) {
    if (previous == 0.0) {
        return 0.0;
    }
    return (current - previous) / previous * 100.0;
}

}  // namespace

void MergeReport::count(MergeAction action) {
    switch (action) {
        case MergeAction::INSERTED:
            ++inserted;
            break;
        case MergeAction::UPDATED:
            ++updated;
            break;
        case MergeAction::UNCHANGED:
            ++unchanged;
            break;
        case MergeAction::SKIPPED:
            ++skipped;
            break;
    }
}

void MergeReport::add(const MergeReport& other) {
    inserted += other.inserted;
    updated += other.updated;
    unchanged += other.unchanged;
    skipped += other.skipped;
    rejected += other.rejected;
    conflicts += other.conflicts;
    store_errors += other.store_errors;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
    written_quotes.insert(written_quotes.end(), other.written_quotes.begin(),
                          other.written_quotes.end());
}

std::string MergeReport::summary() const {
    std::ostringstream os;
    os << "inserted=" << inserted << " updated=" << updated << " unchanged=" << unchanged
       << " skipped=" << skipped << " rejected=" << rejected << " conflicts=" << conflicts
       << " store_errors=" << store_errors;
    return os.str();
}

Result<void> validate_record(const NormalizedRecord& record) {
    return std::visit(
        [](const auto& r) -> Result<void> {
            using T = std::decay_t<decltype(r)>;
            if (r.code.empty()) {
                return reject("missing security code");
            }
            if constexpr (std::is_same_v<T, DailyQuote>) {
                if (!r.date.valid()) {
                    return reject(r.code + ": invalid quote date");
                }
                if (r.close < 0.0) {
                    return reject(r.code + ": negative closing price");
                }
            } else if constexpr (std::is_same_v<T, MarketIndex>) {
                if (!r.date.valid()) {
                    return reject(r.code + ": invalid index date");
                }
            } else if constexpr (std::is_same_v<T, Dividend>) {
                if (r.year <= 0) {
                    return reject(r.code + ": invalid dividend year");
                }
                if (!is_valid_dividend_period(r.period)) {
                    return reject(r.code + ": invalid dividend period '" + r.period + "'");
                }
            } else if constexpr (std::is_same_v<T, FinancialStatement>) {
                if (r.year <= 0) {
                    return reject(r.code + ": invalid statement year");
                }
                if (!is_valid_statement_quarter(r.quarter)) {
                    return reject(r.code + ": invalid statement quarter '" + r.quarter + "'");
                }
            } else if constexpr (std::is_same_v<T, RevenueRecord>) {
                if (!is_valid_year_month(r.month)) {
                    return reject(r.code + ": invalid revenue month " + std::to_string(r.month));
                }
            }
            return Result<void>();
        },
        record);
}

UpsertMerger::UpsertMerger(std::shared_ptr<CanonicalStore> store,
                           std::shared_ptr<SecurityLockTable> locks)
    : store_(std::move(store)),
      locks_(locks ? std::move(locks) : std::make_shared<SecurityLockTable>()),
      component_id_(StateManager::make_component_id("UpsertMerger")) {
    ComponentInfo info{ComponentType::MERGER,
                       ComponentState::RUNNING,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Merger state registration failed: " << registered.error()->what());
    }
}

UpsertMerger::~UpsertMerger() {
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Merger was not registered: " << unregistered.error()->what());
    }
}

MergeReport UpsertMerger::merge(const std::vector<NormalizedRecord>& records,
                                const MergeContext& ctx) {
    ScopedLogComponent log_component("UpsertMerger");
    MergeReport report;
    for (const auto& record : records) {
        report.add(merge_one(record, ctx));
    }
    if (!records.empty()) {
        INFO("Merged " << records.size() << " "
                       << record_kind_to_string(record_kind(records.front()))
                       << " records: " << report.summary());
    }
    return report;
}

MergeReport UpsertMerger::merge_one(const NormalizedRecord& record, const MergeContext& ctx) {
    MergeReport report;
    auto kind = record_kind(record);

    auto validation = validate_record(record);
    if (validation.is_error()) {
        WARN("Rejected " << record_kind_to_string(kind) << " " << record_key(record) << ": "
                         << validation.error()->what());
        ++report.rejected;
        report.failures.push_back(
            {kind, record_key(record), ErrorCode::VALIDATION_ERROR, validation.error()->what()});
        return report;
    }

    auto outcome = apply(record, ctx);
    if (outcome.is_ok()) {
        const MergeAction action = outcome.value().action;
        report.count(action);
        if (kind == RecordKind::DAILY_QUOTE &&
            (action == MergeAction::INSERTED || action == MergeAction::UPDATED)) {
            const auto& quote = std::get<DailyQuote>(record);
            report.written_quotes.push_back(QuoteKey{quote.code, quote.date});
        }
        if (action == MergeAction::SKIPPED) {
            DEBUG("Skipped " << record_key(record) << ": " << outcome.value().reason);
        }
        return report;
    }

    const auto* error = outcome.error();
    if (error->code() == ErrorCode::CONFLICT_ERROR) {
        ERROR("Conflict merging " << record_kind_to_string(kind) << " " << record_key(record)
                                  << ": " << error->what());
        ++report.conflicts;
    } else if (error->code() == ErrorCode::VALIDATION_ERROR) {
        WARN("Store rejected " << record_key(record) << ": " << error->what());
        ++report.rejected;
    } else {
        ERROR("Failed to merge " << record_key(record) << ": " << error->to_string());
        ++report.store_errors;
    }
    report.failures.push_back({kind, record_key(record), error->code(), error->what()});
    return report;
}

Result<MergeOutcome> UpsertMerger::apply(const NormalizedRecord& record,
                                         const MergeContext& ctx) {
    auto lock = locks_->acquire(std::visit([](const auto& r) { return r.code; }, record));

    return std::visit(
        [&](const auto& r) -> Result<MergeOutcome> {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SecurityPatch>) {
                return store_->merge_security(r, ctx);
            } else if constexpr (std::is_same_v<T, DailyQuote>) {
                return store_->merge_daily_quote(r, ctx);
            } else if constexpr (std::is_same_v<T, Dividend>) {
                return store_->merge_dividend(r, ctx);
            } else if constexpr (std::is_same_v<T, FinancialStatement>) {
                return store_->merge_financial_statement(r, ctx);
            } else if constexpr (std::is_same_v<T, RevenueRecord>) {
                auto enriched = enrich_revenue(r);
                if (enriched.is_error()) {
                    return forward_error<MergeOutcome>(enriched);
                }
                return store_->merge_revenue(enriched.value(), ctx);
            } else {
                return store_->merge_market_index(r, ctx);
            }
        },
        record);
}

Result<RevenueRecord> UpsertMerger::enrich_revenue(const RevenueRecord& revenue) const {
    RevenueRecord r = revenue;
    const int year = year_of(r.month);
    const int month = month_of(r.month);
    const YearMonth same_month_last_year = make_year_month(year - 1, month);

    if (r.last_month == 0.0 || (r.monthly_accumulated == 0.0 && month > 1)) {
        auto previous = store_->get_revenue(r.code, previous_month(r.month));
        if (previous.is_error()) {
            return forward_error<RevenueRecord>(previous);
        }
        if (previous.value()) {
            if (r.last_month == 0.0) {
                r.last_month = previous.value()->monthly;
            }
            if (r.monthly_accumulated == 0.0 && month > 1 &&
                previous.value()->monthly_accumulated > 0.0) {
                r.monthly_accumulated = previous.value()->monthly_accumulated + r.monthly;
            }
        }
    }
    if (r.monthly_accumulated == 0.0 && month == 1) {
        r.monthly_accumulated = r.monthly;
    }

    if (r.last_year_this_month == 0.0 || r.last_year_monthly_accumulated == 0.0) {
        auto last_year = store_->get_revenue(r.code, same_month_last_year);
        if (last_year.is_error()) {
            return forward_error<RevenueRecord>(last_year);
        }
        if (last_year.value()) {
            if (r.last_year_this_month == 0.0) {
                r.last_year_this_month = last_year.value()->monthly;
            }
            if (r.last_year_monthly_accumulated == 0.0) {
                r.last_year_monthly_accumulated = last_year.value()->monthly_accumulated;
            }
        }
    }

    if (r.compared_with_last_month == 0.0) {
        r.compared_with_last_month = percent_change(r.monthly, r.last_month);
    }
    if (r.compared_with_last_year_same_month == 0.0) {
        r.compared_with_last_year_same_month = percent_change(r.monthly, r.last_year_this_month);
    }
    if (r.accumulated_compared_with_last_year == 0.0) {
        r.accumulated_compared_with_last_year =
            percent_change(r.monthly_accumulated, r.last_year_monthly_accumulated);
    }

    if (r.avg_price == 0.0 || r.lowest_price == 0.0 || r.highest_price == 0.0) {
        Date first(year, month, 1);
        Date last(year, month, days_in_month(year, month));
        auto quotes = store_->get_quotes_between(r.code, first, last);
        if (quotes.is_error()) {
            return forward_error<RevenueRecord>(quotes);
        }
        const auto& rows = quotes.value();
        if (!rows.empty()) {
            double sum = 0.0;
            double low = rows.front().close;
            double high = rows.front().close;
            for (const auto& q : rows) {
                sum += q.close;
                low = std::min(low, q.close);
                high = std::max(high, q.close);
            }
            if (r.avg_price == 0.0)
                r.avg_price = sum / static_cast<double>(rows.size());
            if (r.lowest_price == 0.0)
                r.lowest_price = low;
            if (r.highest_price == 0.0)
                r.highest_price = high;
        }
    }
    return Result<RevenueRecord>(std::move(r));
}

}  // namespace market_ingest
