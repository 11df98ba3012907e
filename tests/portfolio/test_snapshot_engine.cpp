#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "data/mock_canonical_store.hpp"
#include "data/store_fixtures.hpp"
#include "market_ingest/portfolio/snapshot_engine.hpp"

using namespace market_ingest;
using namespace market_ingest::testing;
using ::testing::_;
using ::testing::NiceMock;

class SnapshotEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<NiceMock<MockCanonicalStore>>();
        engine = std::make_unique<SnapshotEngine>(store);
    }

    void TearDown() override {
        engine.reset();
        store.reset();
        TestBase::TearDown();
    }

    void add_close(const std::string& code, const Date& date, Price close) {
        ASSERT_TRUE(store->merge_daily_quote(make_quote(code, date, close), make_context(date))
                        .is_ok());
    }

    std::shared_ptr<NiceMock<MockCanonicalStore>> store;
    std::unique_ptr<SnapshotEngine> engine;
    const Date day1{2024, 6, 3};
    const Date day2{2024, 6, 4};
};

TEST_F(SnapshotEngineTest, ValuesHoldingAndCarriesPreviousDay) {
    store->put_ownership(make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 20)));
    add_close("2330", day1, 12.0);

    auto first = engine->run(day1, make_context(day1));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().members, 1u);
    EXPECT_TRUE(first.value().succeeded());

    auto summary = store->get_money_history("m1", day1).value();
    ASSERT_TRUE(summary.has_value());
    EXPECT_DOUBLE_EQ(summary->market_value, 12000.0);
    EXPECT_DOUBLE_EQ(summary->cost, -10000.0);
    EXPECT_DOUBLE_EQ(summary->profit_and_loss, 2000.0);
    EXPECT_DOUBLE_EQ(summary->profit_and_loss_percentage, 20.0);
    EXPECT_DOUBLE_EQ(summary->previous_day_market_value, 0.0);

    auto details = store->get_money_history_details("m1", day1).value();
    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details[0].total_shares, 1000);
    EXPECT_DOUBLE_EQ(details[0].average_unit_price_per_share, 10.0);
    EXPECT_DOUBLE_EQ(details[0].ratio, 100.0);

    add_close("2330", day2, 13.0);
    ASSERT_TRUE(engine->run(day2, make_context(day2)).is_ok());
    auto next = store->get_money_history("m1", day2).value();
    ASSERT_TRUE(next.has_value());
    EXPECT_DOUBLE_EQ(next->market_value, 13000.0);
    EXPECT_DOUBLE_EQ(next->previous_day_market_value, 12000.0);
    EXPECT_DOUBLE_EQ(next->previous_day_profit_and_loss, 2000.0);
    EXPECT_DOUBLE_EQ(next->previous_day_profit_and_loss_percentage, 20.0);

    auto next_details = store->get_money_history_details("m1", day2).value();
    ASSERT_EQ(next_details.size(), 1u);
    EXPECT_DOUBLE_EQ(next_details[0].previous_day_market_value, 12000.0);
}

TEST_F(SnapshotEngineTest, LotsOfOneCodeAreFolded) {
    store->put_ownership(make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 20)));
    store->put_ownership(make_lot("m1", "2330", 1000, 14.0, Date(2024, 5, 21)));
    store->put_ownership(make_lot("m1", "2317", 500, 100.0, Date(2024, 5, 21)));
    add_close("2330", day1, 12.0);
    add_close("2317", day1, 96.0);

    auto snapshots = engine->compute(day1);
    ASSERT_TRUE(snapshots.is_ok());
    ASSERT_EQ(snapshots.value().size(), 1u);
    const auto& snapshot = snapshots.value()[0];
    ASSERT_EQ(snapshot.details.size(), 2u);

    // Details are ordered by code
    const auto& foxconn = snapshot.details[0];
    const auto& tsmc = snapshot.details[1];
    EXPECT_EQ(tsmc.code, "2330");
    EXPECT_EQ(tsmc.total_shares, 2000);
    EXPECT_DOUBLE_EQ(tsmc.cost, -24000.0);
    EXPECT_DOUBLE_EQ(tsmc.average_unit_price_per_share, 12.0);
    EXPECT_DOUBLE_EQ(tsmc.profit_and_loss, 0.0);
    EXPECT_DOUBLE_EQ(foxconn.market_value, 48000.0);
    EXPECT_DOUBLE_EQ(foxconn.profit_and_loss_percentage, -4.0);

    EXPECT_DOUBLE_EQ(snapshot.summary.market_value, 72000.0);
    EXPECT_NEAR(tsmc.ratio + foxconn.ratio, 100.0, 1e-9);
}

TEST_F(SnapshotEngineTest, SoldOutMemberGetsZeroSnapshot) {
    auto lot = make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 20));
    lot.id = store->put_ownership(lot).value();
    add_close("2330", day1, 12.0);
    ASSERT_TRUE(engine->run(day1, make_context(day1)).is_ok());

    lot.is_sold = true;
    store->put_ownership(lot);
    auto report = engine->run(day2, make_context(day2));
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().closed_out, 1u);

    auto summary = store->get_money_history("m1", day2).value();
    ASSERT_TRUE(summary.has_value());
    EXPECT_DOUBLE_EQ(summary->market_value, 0.0);
    EXPECT_DOUBLE_EQ(summary->previous_day_market_value, 12000.0);
    EXPECT_TRUE(store->get_money_history_details("m1", day2).value().empty());

    // Once zeroed the member drops out of later runs
    auto later = engine->run(day2.add_days(1), make_context(day2.add_days(1)));
    EXPECT_EQ(later.value().members, 0u);
}

TEST_F(SnapshotEngineTest, MissingCloseIsValuedAtZero) {
    store->put_ownership(make_lot("m1", "9999", 100, 50.0, Date(2024, 5, 20)));
    auto report = engine->run(day1, make_context(day1));
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().missing_prices, 1u);

    auto summary = store->get_money_history("m1", day1).value();
    EXPECT_DOUBLE_EQ(summary->market_value, 0.0);
    EXPECT_DOUBLE_EQ(summary->profit_and_loss, -5000.0);
    EXPECT_DOUBLE_EQ(summary->profit_and_loss_percentage, -100.0);
}

TEST_F(SnapshotEngineTest, RerunOverwritesInPlace) {
    store->put_ownership(make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 20)));
    add_close("2330", day1, 12.0);
    ASSERT_TRUE(engine->run(day1, make_context(day1)).is_ok());

    auto corrected = make_quote("2330", day1, 11.0);
    store->merge_daily_quote(corrected, make_context(day1, 60));
    ASSERT_TRUE(engine->run(day1, make_context(day1, 120)).is_ok());

    auto summary = store->get_money_history("m1", day1).value();
    EXPECT_DOUBLE_EQ(summary->market_value, 11000.0);
    EXPECT_EQ(store->get_money_history_details("m1", day1).value().size(), 1u);
}

TEST_F(SnapshotEngineTest, WriteFailureIsReportedPerMember) {
    store->put_ownership(make_lot("m1", "2330", 1000, 10.0, Date(2024, 5, 20)));
    store->put_ownership(make_lot("m2", "2330", 10, 10.0, Date(2024, 5, 20)));
    add_close("2330", day1, 12.0);

    EXPECT_CALL(*store, put_money_snapshot(_, _))
        .WillOnce([](const DailyMoneyHistory&, const std::vector<DailyMoneyHistoryDetail>&) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "disk full");
        })
        .WillOnce([this](const DailyMoneyHistory& summary,
                         const std::vector<DailyMoneyHistoryDetail>& details) {
            return store->MemoryStore::put_money_snapshot(summary, details);
        });

    auto report = engine->run(day1, make_context(day1));
    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().succeeded());
    EXPECT_EQ(report.value().members, 1u);
    ASSERT_EQ(report.value().failures.size(), 1u);
    EXPECT_NE(report.value().failures[0].find("m1"), std::string::npos);
    EXPECT_TRUE(store->get_money_history("m2", day1).value().has_value());
}

TEST(ProfitAndLossTest, PercentageOfAbsoluteCost) {
    EXPECT_DOUBLE_EQ(profit_and_loss_percentage(2000.0, -10000.0), 20.0);
    EXPECT_DOUBLE_EQ(profit_and_loss_percentage(-500.0, -10000.0), -5.0);
    EXPECT_DOUBLE_EQ(profit_and_loss_percentage(100.0, 0.0), 0.0);
}
