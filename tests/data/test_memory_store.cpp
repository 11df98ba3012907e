#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "data/store_fixtures.hpp"
#include "market_ingest/core/state_manager.hpp"
#include "market_ingest/data/memory_store.hpp"

using namespace market_ingest;
using namespace market_ingest::testing;

class MemoryStoreTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<MemoryStore>();
        ASSERT_TRUE(store->connect().is_ok());
    }

    void TearDown() override {
        store.reset();
        TestBase::TearDown();
    }

    std::shared_ptr<MemoryStore> store;
    const Date today{2024, 6, 3};
};

TEST_F(MemoryStoreTest, ConnectRegistersWithStateManager) {
    EXPECT_TRUE(store->is_connected());
    EXPECT_EQ(StateManager::instance().get_all_components().size(), 1u);

    store->disconnect();
    EXPECT_FALSE(store->is_connected());
    EXPECT_TRUE(StateManager::instance().get_all_components().empty());
}

TEST_F(MemoryStoreTest, SecurityPatchOverwritesOnlyEngagedFields) {
    auto first = store->merge_security(make_security("2330", 1, 95.0), make_context(today));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().action, MergeAction::INSERTED);

    SecurityPatch patch;
    patch.code = "2330";
    patch.eps_last_quarter = 8.7;
    auto second = store->merge_security(patch, make_context(today, 60));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().action, MergeAction::UPDATED);

    auto stored = store->get_security("2330");
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->name, "Security 2330");
    EXPECT_DOUBLE_EQ(stored.value()->book_value_per_share, 95.0);
    EXPECT_DOUBLE_EQ(stored.value()->eps_last_quarter, 8.7);
    EXPECT_EQ(stored.value()->created_time, fixed_now());
    EXPECT_EQ(stored.value()->updated_time, fixed_now(60));
}

TEST_F(MemoryStoreTest, QuoteMergeIsIdempotent) {
    auto quote = make_quote("2330", today, 580.0, 5.0);
    ASSERT_EQ(store->merge_daily_quote(quote, make_context(today)).value().action,
              MergeAction::INSERTED);

    auto again = store->merge_daily_quote(quote, make_context(today, 3600));
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().action, MergeAction::UNCHANGED);

    auto stored = store->get_daily_quote(quote.key()).value();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->updated_time, fixed_now());
}

TEST_F(MemoryStoreTest, QuoteMergeKeepsDerivedMetrics) {
    auto quote = make_quote("2330", today, 580.0);
    store->merge_daily_quote(quote, make_context(today));

    QuoteMetrics metrics;
    metrics.moving_average_5 = 575.0;
    auto updated = store->update_quote_metrics(quote.key(), metrics, fixed_now(10));
    ASSERT_TRUE(updated.is_ok());
    EXPECT_EQ(updated.value(), MergeAction::UPDATED);
    EXPECT_EQ(store->update_quote_metrics(quote.key(), metrics, fixed_now(20)).value(),
              MergeAction::UNCHANGED);

    // A corrected close from the source must not wipe the computed columns
    quote.close = 582.0;
    EXPECT_EQ(store->merge_daily_quote(quote, make_context(today, 30)).value().action,
              MergeAction::UPDATED);
    auto stored = store->get_daily_quote(quote.key()).value();
    EXPECT_DOUBLE_EQ(stored->close, 582.0);
    EXPECT_DOUBLE_EQ(stored->metrics.moving_average_5, 575.0);
}

TEST_F(MemoryStoreTest, RecomputedMetricsAreUnchangedAtStoredScale) {
    auto quote = make_quote("2330", today, 11.0);
    ASSERT_TRUE(store->merge_daily_quote(quote, make_context(today)).is_ok());

    QuoteMetrics metrics;
    metrics.moving_average_5 = 31.0 / 3.0;
    metrics.price_to_book_ratio = 11.0 / 3.0;
    EXPECT_EQ(store->update_quote_metrics(quote.key(), metrics, fixed_now(10)).value(),
              MergeAction::UPDATED);
    auto stored = store->get_daily_quote(quote.key()).value();
    EXPECT_DOUBLE_EQ(stored->metrics.moving_average_5, 10.3333);
    EXPECT_DOUBLE_EQ(stored->metrics.price_to_book_ratio, 3.6667);

    EXPECT_EQ(store->update_quote_metrics(quote.key(), metrics, fixed_now(20)).value(),
              MergeAction::UNCHANGED);
    EXPECT_EQ(store->get_daily_quote(quote.key()).value()->updated_time, fixed_now(10));
}

TEST_F(MemoryStoreTest, UpdateMetricsOfMissingQuoteIsNotFound) {
    auto result = store->update_quote_metrics(QuoteKey{"9999", today}, QuoteMetrics{}, fixed_now());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_FOUND);
}

TEST_F(MemoryStoreTest, RecentQuotesAreOldestFirstAndBounded) {
    for (int d = 1; d <= 7; ++d) {
        store->merge_daily_quote(make_quote("2330", Date(2024, 6, d), 500.0 + d),
                                 make_context(today));
    }
    auto recent = store->get_recent_quotes("2330", Date(2024, 6, 5), 3);
    ASSERT_TRUE(recent.is_ok());
    ASSERT_EQ(recent.value().size(), 3u);
    EXPECT_EQ(recent.value().front().date, Date(2024, 6, 3));
    EXPECT_EQ(recent.value().back().date, Date(2024, 6, 5));

    auto between = store->get_quotes_between("2330", Date(2024, 6, 2), Date(2024, 6, 4));
    EXPECT_EQ(between.value().size(), 3u);

    auto latest = store->get_latest_quotes({"2330", "0000"});
    ASSERT_EQ(latest.value().size(), 1u);
    EXPECT_EQ(latest.value().front().date, Date(2024, 6, 7));

    auto on_or_before = store->get_latest_quote_on_or_before("2330", Date(2024, 5, 31));
    EXPECT_FALSE(on_or_before.value().has_value());
}

TEST_F(MemoryStoreTest, HistoryExtremesAreMonotonic) {
    const double closes[] = {10.0, 15.0, 8.0, 20.0};
    for (int i = 0; i < 4; ++i) {
        HistoryCandidate candidate{"2330", Date(2024, 6, 3 + i), closes[i], 0.0};
        ASSERT_TRUE(store->merge_quote_history(candidate, make_context(today)).is_ok());
    }

    auto record = store->get_quote_history_record("2330").value();
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->max_price, 20.0);
    EXPECT_EQ(*record->max_price_date, Date(2024, 6, 6));
    EXPECT_DOUBLE_EQ(record->min_price, 8.0);
    EXPECT_EQ(*record->min_price_date, Date(2024, 6, 5));

    // A later, less extreme value never regresses the record
    HistoryCandidate mild{"2330", Date(2024, 6, 10), 12.0, 0.0};
    EXPECT_EQ(store->merge_quote_history(mild, make_context(today)).value().action,
              MergeAction::UNCHANGED);
}

TEST_F(MemoryStoreTest, RevenueCursorGatesOlderMonths) {
    ASSERT_EQ(store->merge_revenue(make_revenue("2330", 202404, 100.0), make_context(today))
                  .value()
                  .action,
              MergeAction::INSERTED);
    EXPECT_EQ(store->get_revenue_cursor("2330").value()->month, 202404);

    auto older = store->merge_revenue(make_revenue("2330", 202403, 90.0), make_context(today));
    EXPECT_EQ(older.value().action, MergeAction::SKIPPED);
    EXPECT_FALSE(store->get_revenue("2330", 202403).value().has_value());

    auto same = store->merge_revenue(make_revenue("2330", 202404, 105.0), make_context(today));
    EXPECT_EQ(same.value().action, MergeAction::SKIPPED);
    EXPECT_DOUBLE_EQ(store->get_revenue("2330", 202404).value()->monthly, 100.0);

    store->merge_revenue(make_revenue("2330", 202405, 110.0), make_context(today));
    EXPECT_EQ(store->get_revenue_cursor("2330").value()->month, 202405);
}

TEST_F(MemoryStoreTest, PaidDividendAcceptsOnlyCorrections) {
    auto dividend = make_dividend("2330", 2024, 3.0, Date(2024, 5, 10));
    ASSERT_EQ(store->merge_dividend(dividend, make_context(Date(2024, 4, 1))).value().action,
              MergeAction::INSERTED);

    dividend.earnings_cash = 3.5;
    auto late = store->merge_dividend(dividend, make_context(today));
    EXPECT_EQ(late.value().action, MergeAction::SKIPPED);
    EXPECT_DOUBLE_EQ(store->get_dividend({"2330", 2024, "A"}).value()->cash_dividend, 3.0);

    dividend.correction = true;
    EXPECT_EQ(store->merge_dividend(dividend, make_context(today)).value().action,
              MergeAction::UPDATED);
    auto stored = store->get_dividend({"2330", 2024, "A"}).value();
    EXPECT_DOUBLE_EQ(stored->cash_dividend, 3.5);
    EXPECT_DOUBLE_EQ(stored->sum, 3.5);
}

TEST_F(MemoryStoreTest, MoneySnapshotReplacesDetails) {
    DailyMoneyHistory summary;
    summary.member_id = "m1";
    summary.date = today;
    DailyMoneyHistoryDetail a;
    a.member_id = "m1";
    a.date = today;
    a.code = "2330";
    DailyMoneyHistoryDetail b = a;
    b.code = "2317";

    ASSERT_TRUE(store->put_money_snapshot(summary, {a, b}).is_ok());
    EXPECT_EQ(store->get_money_history_details("m1", today).value().size(), 2u);

    summary.market_value = 100.0;
    ASSERT_TRUE(store->put_money_snapshot(summary, {a}).is_ok());
    auto details = store->get_money_history_details("m1", today).value();
    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details.front().code, "2330");
    EXPECT_DOUBLE_EQ(store->get_money_history("m1", today).value()->market_value, 100.0);

    auto previous = store->get_previous_money_history_detail("m1", "2330", today.add_days(1));
    ASSERT_TRUE(previous.value().has_value());
    EXPECT_EQ(previous.value()->date, today);
    EXPECT_EQ(store->get_latest_money_histories_before(today.add_days(1)).value().size(), 1u);
    EXPECT_TRUE(store->get_latest_money_histories_before(today).value().empty());
}

TEST_F(MemoryStoreTest, OwnershipIdsAndOpenLots) {
    auto first = store->put_ownership(make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 1)));
    auto second = store->put_ownership(make_lot("m1", "2317", 500, 100.0, Date(2024, 6, 10)));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());

    EXPECT_EQ(store->list_open_lots(today).value().size(), 1u);

    auto sold = make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 1));
    sold.id = first.value();
    sold.is_sold = true;
    EXPECT_EQ(store->put_ownership(sold).value(), first.value());
    EXPECT_TRUE(store->list_open_lots(today).value().empty());
}

TEST_F(MemoryStoreTest, JobLedgerRoundTrip) {
    JobRun run;
    run.job_name = "closing_aggregate";
    run.business_date = today;
    run.status = JobRunStatus::SUCCEEDED;
    run.attempts = 2;
    ASSERT_TRUE(store->record_job_run(run).is_ok());

    auto stored = store->get_job_run("closing_aggregate", today);
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->status, JobRunStatus::SUCCEEDED);
    EXPECT_EQ(stored.value()->attempts, 2);
    EXPECT_FALSE(store->get_job_run("closing_aggregate", today.add_days(1)).value().has_value());
}
