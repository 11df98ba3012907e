#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "data/store_fixtures.hpp"
#include "market_ingest/data/memory_store.hpp"
#include "market_ingest/ingest/json_file_source.hpp"
#include "market_ingest/scheduler/pipeline_jobs.hpp"

using namespace market_ingest;
using namespace market_ingest::testing;

class PipelineJobsTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        root = std::filesystem::temp_directory_path() / "market_ingest_pipeline";
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / datasets::QUOTES);

        store = std::make_shared<MemoryStore>();
        ASSERT_TRUE(store->connect().is_ok());

        FetchConfig fetch;
        fetch.workers = 2;
        fetch.max_attempts = 1;
        fetch.attempt_timeout_ms = 0;
        pipeline = std::make_unique<IngestPipeline>(store, fetch, MetricsConfig());
    }

    void TearDown() override {
        pipeline.reset();
        store->disconnect();
        store.reset();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        TestBase::TearDown();
    }

    void write_quotes(const std::string& content) {
        write_quotes(content, date);
    }

    void write_quotes(const std::string& content, const Date& day) {
        std::ofstream file(root / datasets::QUOTES / (day.to_string() + ".json"));
        file << content;
    }

    void close_day(const Date& day, double close) {
        write_quotes(R"([{"code": "2330", "date": ")" + day.to_string() +
                         R"(", "close": )" + std::to_string(close) + "}]",
                     day);
        auto result = pipeline->closing_aggregate(day, make_context(day));
        ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    }

    void bind_quotes() {
        pipeline->bind_source(
            datasets::QUOTES,
            make_json_file_adapter(root, datasets::QUOTES, RecordKind::DAILY_QUOTE));
    }

    std::filesystem::path root;
    std::shared_ptr<MemoryStore> store;
    std::unique_ptr<IngestPipeline> pipeline;
    const Date date{2024, 6, 3};
};

TEST(TrailingEpsTest, SumsLatestFourQuarters) {
    std::vector<FinancialStatement> statements{
        make_statement("2330", 2023, "Q3", 8.1), make_statement("2330", 2024, "Q1", 8.7),
        make_statement("2330", 2023, "Q2", 7.0), make_statement("2330", 2023, "Q4", 9.2),
        make_statement("2330", 2023, "Q1", 5.0), make_statement("2330", 2023, "A", 32.3)};

    auto eps = trailing_eps(statements);
    ASSERT_TRUE(eps.has_value());
    EXPECT_DOUBLE_EQ(eps->last_quarter, 8.7);
    ASSERT_TRUE(eps->last_four_quarters.has_value());
    EXPECT_NEAR(*eps->last_four_quarters, 8.7 + 9.2 + 8.1 + 7.0, 1e-9);
}

TEST(TrailingEpsTest, FewerThanFourQuartersLeaveTrailingUnset) {
    auto eps = trailing_eps({make_statement("2330", 2024, "Q1", 8.7),
                             make_statement("2330", 2023, "Q4", 9.2)});
    ASSERT_TRUE(eps.has_value());
    EXPECT_DOUBLE_EQ(eps->last_quarter, 8.7);
    EXPECT_FALSE(eps->last_four_quarters.has_value());

    EXPECT_FALSE(trailing_eps({make_statement("2330", 2023, "A", 32.3)}).has_value());
}

TEST_F(PipelineJobsTest, UnboundDatasetIsNotInitialized) {
    auto result = pipeline->ingest(datasets::REVENUES, date, make_context(date));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(PipelineJobsTest, IngestMergesWholeMarketFile) {
    write_quotes(R"([
        {"code": "2330", "date": "2024-06-03", "close": 580.0},
        {"code": "2317", "date": "2024-06-03", "close": 160.5}
    ])");
    bind_quotes();
    EXPECT_TRUE(pipeline->has_source(datasets::QUOTES));

    auto summary = pipeline->ingest(datasets::QUOTES, date, make_context(date));
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().targets, 1u);
    EXPECT_EQ(summary.value().fetch_failures, 0u);
    EXPECT_EQ(summary.value().merge.inserted, 2u);
    EXPECT_EQ(store->get_quotes_on(date).value().size(), 2u);

    auto again = pipeline->ingest(datasets::QUOTES, date, make_context(date, 60));
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().merge.unchanged, 2u);
}

TEST_F(PipelineJobsTest, EveryTargetFailingIsFetchError) {
    bind_quotes();
    auto result = pipeline->ingest(datasets::QUOTES, date, make_context(date));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FETCH_ERROR);
}

TEST_F(PipelineJobsTest, PerSecurityBindingFansOutOverActiveSecurities) {
    ASSERT_TRUE(store->merge_security(make_security("2330"), make_context(date)).is_ok());
    ASSERT_TRUE(store->merge_security(make_security("2317"), make_context(date)).is_ok());
    auto suspended = make_security("1101");
    suspended.suspended = true;
    ASSERT_TRUE(store->merge_security(suspended, make_context(date)).is_ok());

    std::atomic<int> calls{0};
    pipeline->bind_source(
        datasets::REVENUES,
        SourceAdapter("revenues", RecordKind::REVENUE,
                      [&calls](const FetchTarget& target) {
                          ++calls;
                          EXPECT_FALSE(target.code.empty());
                          std::vector<NormalizedRecord> records{
                              make_revenue(target.code, 202405, 100.0)};
                          return Result<std::vector<NormalizedRecord>>(std::move(records));
                      }),
        true);

    auto summary = pipeline->ingest(datasets::REVENUES, date, make_context(date));
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().targets, 2u);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_TRUE(store->get_revenue("2330", 202405).value().has_value());
    EXPECT_FALSE(store->get_revenue("1101", 202405).value().has_value());
}

TEST_F(PipelineJobsTest, ClosingRunStopsWithoutQuotes) {
    write_quotes("[]");
    bind_quotes();
    auto result = pipeline->closing_aggregate(date, make_context(date));
    ASSERT_TRUE(result.is_ok());
    EXPECT_NE(result.value().find("no quotes for 2024-06-03"), std::string::npos);
    EXPECT_FALSE(store->get_market_stats(date, 0).value().has_value());
}

TEST_F(PipelineJobsTest, ClosingRunComputesDerivedData) {
    ASSERT_TRUE(store->merge_security(make_security("2330", 1, 100.0), make_context(date)).is_ok());
    store->put_ownership(make_lot("m1", "2330", 1000, 500.0, Date(2024, 5, 2)));
    write_quotes(R"([{"code": "2330", "date": "2024-06-03", "close": 580.0, "change": 5.0}])");
    bind_quotes();

    auto result = pipeline->closing_aggregate(date, make_context(date));
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    EXPECT_NE(result.value().find("snapshots members=1"), std::string::npos);

    auto quote = store->get_daily_quote({"2330", date}).value();
    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->metrics.price_to_book_ratio, 5.8);

    auto snapshot = store->get_money_history("m1", date).value();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_DOUBLE_EQ(snapshot->market_value, 580000.0);
    EXPECT_DOUBLE_EQ(snapshot->profit_and_loss, 80000.0);

    auto stats = store->get_market_stats(date, 0).value();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 1);
    EXPECT_EQ(stats->stocks_up, 1);
}

TEST_F(PipelineJobsTest, LateQuoteRefreshesLaterMovingAverages) {
    bind_quotes();
    for (const Date& day : {Date(2024, 6, 3), Date(2024, 6, 4), Date(2024, 6, 6),
                            Date(2024, 6, 7), Date(2024, 6, 10)}) {
        close_day(day, 10.0);
    }
    auto before = store->get_daily_quote({"2330", Date(2024, 6, 10)}).value();
    ASSERT_TRUE(before.has_value());
    EXPECT_DOUBLE_EQ(before->metrics.moving_average_5, 10.0);

    close_day(Date(2024, 6, 5), 40.0);

    auto latest = store->get_daily_quote({"2330", Date(2024, 6, 10)}).value();
    ASSERT_TRUE(latest.has_value());
    EXPECT_DOUBLE_EQ(latest->metrics.moving_average_5, 16.0);
    EXPECT_DOUBLE_EQ(latest->metrics.year_high, 40.0);
    ASSERT_TRUE(latest->metrics.year_high_date.has_value());
    EXPECT_EQ(*latest->metrics.year_high_date, Date(2024, 6, 5));

    auto friday = store->get_daily_quote({"2330", Date(2024, 6, 7)}).value();
    ASSERT_TRUE(friday.has_value());
    EXPECT_DOUBLE_EQ(friday->metrics.year_average, 16.0);

    // Replaying the late day leaves every row as it is
    auto replay = pipeline->closing_aggregate(Date(2024, 6, 5), make_context(Date(2024, 6, 5), 60));
    ASSERT_TRUE(replay.is_ok());
    EXPECT_EQ(replay.value().find("dependent_quote_metrics"), std::string::npos);
    EXPECT_EQ(store->get_daily_quote({"2330", Date(2024, 6, 10)}).value()->updated_time,
              latest->updated_time);
}

TEST_F(PipelineJobsTest, TrailingEpsRefreshPatchesSecurities) {
    ASSERT_TRUE(store->merge_security(make_security("2330"), make_context(date)).is_ok());
    for (const auto& s : {make_statement("2330", 2023, "Q2", 7.0),
                          make_statement("2330", 2023, "Q3", 8.1),
                          make_statement("2330", 2023, "Q4", 9.2),
                          make_statement("2330", 2024, "Q1", 8.7)}) {
        ASSERT_TRUE(store->merge_financial_statement(s, make_context(date)).is_ok());
    }

    auto result = pipeline->refresh_trailing_eps(date, make_context(date, 60));
    ASSERT_TRUE(result.is_ok());
    auto security = store->get_security("2330").value();
    ASSERT_TRUE(security.has_value());
    EXPECT_DOUBLE_EQ(security->eps_last_quarter, 8.7);
    EXPECT_NEAR(security->eps_last_four_quarters, 33.0, 1e-9);
}

TEST_F(PipelineJobsTest, RegistersEveryScheduledJob) {
    ScheduleConfig config;
    Scheduler scheduler(store, config, HolidayCalendar());
    ASSERT_TRUE(pipeline->register_jobs(scheduler).is_ok());

    for (const char* name :
         {jobs::CLOSING_AGGREGATE, jobs::REFRESH_EMERGING_BOOK_VALUE, jobs::REFRESH_PAYOUT_RATIO,
          jobs::REFRESH_QUARTER_FINANCIALS, jobs::REFRESH_ANNUAL_FINANCIALS,
          jobs::REFRESH_TRAILING_EPS, jobs::REFRESH_REVENUE, jobs::REFRESH_SECURITY_WEIGHTS,
          jobs::REFRESH_DIVIDENDS, jobs::REFRESH_FOREIGN_HOLDINGS}) {
        EXPECT_TRUE(scheduler.has_job(name)) << name;
    }

    // A second registration collides with the first
    EXPECT_TRUE(pipeline->register_jobs(scheduler).is_error());

    // Unbound datasets fail as a recorded run rather than an error
    auto run = scheduler.run_job(jobs::REFRESH_DIVIDENDS, date);
    ASSERT_TRUE(run.is_ok());
    EXPECT_EQ(run.value().status, JobRunStatus::FAILED);
}
