// src/scheduler/pipeline_jobs.cpp
#include "market_ingest/scheduler/pipeline_jobs.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <tuple>
#include "market_ingest/core/logger.hpp"

namespace market_ingest {

namespace {

const char* const COMPONENT = "IngestPipeline";

std::string metrics_summary(const std::string& label, const MetricsReport& report) {
    std::ostringstream os;
    os << label << " updated=" << report.updated << " unchanged=" << report.unchanged
       << " skipped=" << report.skipped << " failed=" << report.failed;
    return os.str();
}

}  // namespace

std::optional<TrailingEps> trailing_eps(std::vector<FinancialStatement> statements) {
    statements.erase(std::remove_if(statements.begin(), statements.end(),
                                    [](const FinancialStatement& s) {
                                        return s.quarter.size() != 2 || s.quarter[0] != 'Q';
                                    }),
                     statements.end());
    if (statements.empty()) {
        return std::nullopt;
    }
    // "Q1" < "Q4" lexically, so (year, quarter) orders chronologically
    std::sort(statements.begin(), statements.end(),
              [](const FinancialStatement& a, const FinancialStatement& b) {
                  return std::tie(a.year, a.quarter) > std::tie(b.year, b.quarter);
              });

    TrailingEps eps;
    eps.last_quarter = statements.front().earnings_per_share;
    if (statements.size() >= 4) {
        double sum = 0.0;
        for (size_t i = 0; i < 4; ++i) {
            sum += statements[i].earnings_per_share;
        }
        eps.last_four_quarters = sum;
    }
    return eps;
}

std::string IngestSummary::to_string() const {
    std::ostringstream os;
    os << dataset << ": targets=" << targets << " fetch_failures=" << fetch_failures << " "
       << merge.summary();
    return os.str();
}

IngestPipeline::IngestPipeline(std::shared_ptr<CanonicalStore> store, FetchConfig fetch_config,
                               MetricsConfig metrics_config)
    : store_(std::move(store)),
      locks_(std::make_shared<SecurityLockTable>()),
      orchestrator_(std::move(fetch_config)),
      merger_(store_, locks_),
      metrics_(store_, locks_, std::move(metrics_config)),
      snapshots_(store_) {}

void IngestPipeline::bind_source(const std::string& dataset, SourceAdapter source,
                                 bool per_security) {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    sources_.erase(dataset);
    sources_.emplace(dataset, SourceBinding{std::move(source), per_security});
    INFO("Bound source " << sources_.at(dataset).source.name() << " to dataset " << dataset
                         << (per_security ? " (per security)" : ""));
}

bool IngestPipeline::has_source(const std::string& dataset) const {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    return sources_.count(dataset) > 0;
}

Result<std::vector<std::string>> IngestPipeline::active_codes() const {
    auto securities = store_->list_securities();
    if (securities.is_error()) {
        return forward_error<std::vector<std::string>>(securities);
    }
    std::vector<std::string> codes;
    for (const auto& security : securities.value()) {
        if (!security.suspended) {
            codes.push_back(security.code);
        }
    }
    return Result<std::vector<std::string>>(std::move(codes));
}

Result<IngestSummary> IngestPipeline::ingest(const std::string& dataset, const Date& date,
                                             const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);

    std::optional<SourceBinding> binding;
    {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        auto it = sources_.find(dataset);
        if (it != sources_.end()) {
            binding = it->second;
        }
    }
    if (!binding) {
        return make_error<IngestSummary>(ErrorCode::NOT_INITIALIZED,
                                         "No source bound for dataset " + dataset, COMPONENT);
    }

    std::vector<FetchTarget> targets;
    if (binding->per_security) {
        auto codes = active_codes();
        if (codes.is_error()) {
            return forward_error<IngestSummary>(codes);
        }
        for (const auto& code : codes.value()) {
            targets.push_back(FetchTarget{code, date});
        }
    } else {
        targets.push_back(FetchTarget{"", date});
    }

    IngestSummary summary;
    summary.dataset = dataset;
    summary.targets = targets.size();

    // Merge each target as soon as it arrives; workers share the report
    std::mutex report_mutex;
    auto handler = [&](const FetchTarget&, const std::vector<NormalizedRecord>& records) {
        auto merged = merger_.merge(records, ctx);
        std::lock_guard<std::mutex> lock(report_mutex);
        summary.merge.add(merged);
    };
    auto fetched = orchestrator_.run(binding->source, targets, handler);
    summary.fetch_failures = fetched.failures.size();

    if (!targets.empty() && fetched.failures.size() == targets.size()) {
        const auto& first = fetched.failures.front();
        return make_error<IngestSummary>(
            ErrorCode::FETCH_ERROR,
            "Every target of " + dataset + " failed, first: " + first.target.to_string() + ": " +
                first.reason,
            COMPONENT);
    }

    INFO("Ingested " << summary.to_string());
    return Result<IngestSummary>(std::move(summary));
}

Result<std::string> IngestPipeline::refresh(const std::string& dataset, const Date& date,
                                            const MergeContext& ctx) {
    auto ingested = ingest(dataset, date, ctx);
    if (ingested.is_error()) {
        return forward_error<std::string>(ingested);
    }
    return Result<std::string>(ingested.value().to_string());
}

Result<std::string> IngestPipeline::closing_aggregate(const Date& date,
                                                      const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    std::ostringstream summary;

    auto quotes = ingest(datasets::QUOTES, date, ctx);
    if (quotes.is_error()) {
        return forward_error<std::string>(quotes);
    }
    summary << quotes.value().to_string();

    if (has_source(datasets::INDICES)) {
        auto indices = ingest(datasets::INDICES, date, ctx);
        if (indices.is_error()) {
            WARN("Index refresh failed for " << date << ": " << indices.error()->what());
            summary << "; indices failed";
        } else {
            summary << "; " << indices.value().to_string();
        }
    }

    auto stored = store_->get_quotes_on(date);
    if (stored.is_error()) {
        return forward_error<std::string>(stored);
    }
    if (stored.value().empty()) {
        INFO("No quotes stored for " << date << ", closing run stops after fetch");
        summary << "; no quotes for " << date.to_string();
        return Result<std::string>(summary.str());
    }

    std::vector<std::string> codes;
    codes.reserve(stored.value().size());
    for (const auto& quote : stored.value()) {
        codes.push_back(quote.code);
    }

    summary << "; " << metrics_summary("quote_metrics", metrics_.run_quote_metrics(codes, date, ctx));
    auto dependent = metrics_.run_dependent_quote_metrics(quotes.value().merge.written_quotes,
                                                          date, ctx);
    if (dependent.processed > 0) {
        summary << "; " << metrics_summary("dependent_quote_metrics", dependent);
    }
    summary << "; " << metrics_summary("estimates", metrics_.run_estimates(codes, date, ctx));
    summary << "; " << metrics_summary("yields", metrics_.run_yields(codes, date, ctx));

    auto snapshots = snapshots_.run(date, ctx);
    if (snapshots.is_error()) {
        return forward_error<std::string>(snapshots);
    }
    summary << "; snapshots members=" << snapshots.value().members
            << " failures=" << snapshots.value().failures.size();

    auto stats = metrics_.run_market_stats(date, ctx);
    if (stats.is_error()) {
        return forward_error<std::string>(stats);
    }
    summary << "; market_stats markets=" << stats.value().size();

    return Result<std::string>(summary.str());
}

Result<std::string> IngestPipeline::refresh_payout_ratios(const Date&, const MergeContext& ctx) {
    auto codes = active_codes();
    if (codes.is_error()) {
        return forward_error<std::string>(codes);
    }
    auto report = metrics_.run_payout_ratios(codes.value(), ctx);
    return Result<std::string>(metrics_summary("payout_ratios", report));
}

Result<std::string> IngestPipeline::refresh_trailing_eps(const Date&, const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);
    auto codes = active_codes();
    if (codes.is_error()) {
        return forward_error<std::string>(codes);
    }

    std::vector<NormalizedRecord> patches;
    for (const auto& code : codes.value()) {
        auto statements = store_->get_financial_statements(code);
        if (statements.is_error()) {
            return forward_error<std::string>(statements);
        }
        auto eps = trailing_eps(statements.value());
        if (!eps) {
            continue;
        }
        SecurityPatch patch;
        patch.code = code;
        patch.eps_last_quarter = eps->last_quarter;
        if (eps->last_four_quarters) {
            patch.eps_last_four_quarters = *eps->last_four_quarters;
        }
        patches.emplace_back(std::move(patch));
    }

    auto merged = merger_.merge(patches, ctx);
    return Result<std::string>("trailing_eps: " + merged.summary());
}

Result<void> IngestPipeline::register_jobs(Scheduler& scheduler) {
    auto bind = [this](const char* dataset) {
        return [this, dataset](const Date& date, const MergeContext& ctx) {
            return refresh(dataset, date, ctx);
        };
    };

    const std::vector<std::pair<const char*, JobFunction>> table = {
        {jobs::CLOSING_AGGREGATE,
         [this](const Date& date, const MergeContext& ctx) {
             return closing_aggregate(date, ctx);
         }},
        {jobs::REFRESH_EMERGING_BOOK_VALUE, bind(datasets::EMERGING_BOOK_VALUE)},
        {jobs::REFRESH_PAYOUT_RATIO,
         [this](const Date& date, const MergeContext& ctx) {
             return refresh_payout_ratios(date, ctx);
         }},
        {jobs::REFRESH_QUARTER_FINANCIALS, bind(datasets::QUARTER_FINANCIALS)},
        {jobs::REFRESH_ANNUAL_FINANCIALS, bind(datasets::ANNUAL_FINANCIALS)},
        {jobs::REFRESH_TRAILING_EPS,
         [this](const Date& date, const MergeContext& ctx) {
             return refresh_trailing_eps(date, ctx);
         }},
        {jobs::REFRESH_REVENUE, bind(datasets::REVENUES)},
        {jobs::REFRESH_SECURITY_WEIGHTS, bind(datasets::SECURITY_WEIGHTS)},
        {jobs::REFRESH_DIVIDENDS, bind(datasets::DIVIDENDS)},
        {jobs::REFRESH_FOREIGN_HOLDINGS, bind(datasets::FOREIGN_HOLDINGS)}};

    for (const auto& [name, fn] : table) {
        auto registered = scheduler.register_job(name, fn);
        if (registered.is_error()) {
            return registered;
        }
    }
    return Result<void>();
}

}  // namespace market_ingest
