// tests/data/mock_canonical_store.hpp
#pragma once

#include <gmock/gmock.h>
#include "market_ingest/data/memory_store.hpp"

namespace market_ingest {
namespace testing {

/**
 * @brief In-memory store whose fallible calls can be scripted per test
 *
 * Every mocked call delegates to MemoryStore unless a test overrides it.
 */
class MockCanonicalStore : public MemoryStore {
public:
    MockCanonicalStore() {
        using ::testing::_;
        ON_CALL(*this, merge_daily_quote(_, _))
            .WillByDefault([this](const DailyQuote& quote, const MergeContext& ctx) {
                return MemoryStore::merge_daily_quote(quote, ctx);
            });
        ON_CALL(*this, get_revenue(_, _))
            .WillByDefault([this](const std::string& code, YearMonth month) {
                return MemoryStore::get_revenue(code, month);
            });
        ON_CALL(*this, put_money_snapshot(_, _))
            .WillByDefault([this](const DailyMoneyHistory& summary,
                                  const std::vector<DailyMoneyHistoryDetail>& details) {
                return MemoryStore::put_money_snapshot(summary, details);
            });
        ON_CALL(*this, record_job_run(_))
            .WillByDefault([this](const JobRun& run) { return MemoryStore::record_job_run(run); });
        ON_CALL(*this, get_job_run(_, _))
            .WillByDefault([this](const std::string& job_name, const Date& business_date) {
                return MemoryStore::get_job_run(job_name, business_date);
            });
    }

    MOCK_METHOD(Result<MergeOutcome>, merge_daily_quote,
                (const DailyQuote& quote, const MergeContext& ctx), (override));
    MOCK_METHOD(Result<std::optional<RevenueRecord>>, get_revenue,
                (const std::string& code, YearMonth month), (const, override));
    MOCK_METHOD(Result<void>, put_money_snapshot,
                (const DailyMoneyHistory& summary,
                 const std::vector<DailyMoneyHistoryDetail>& details),
                (override));
    MOCK_METHOD(Result<void>, record_job_run, (const JobRun& run), (override));
    MOCK_METHOD(Result<std::optional<JobRun>>, get_job_run,
                (const std::string& job_name, const Date& business_date), (const, override));
};

}  // namespace testing
}  // namespace market_ingest
