#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "data/store_fixtures.hpp"
#include "market_ingest/core/state_manager.hpp"
#include "market_ingest/data/memory_store.hpp"
#include "market_ingest/service/quote_service.hpp"

using namespace market_ingest;
using namespace market_ingest::testing;

class QuoteServiceTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<MemoryStore>();
        auto calendar = HolidayCalendar::from_json(nlohmann::json::parse(R"({
            "2024": [
                {"date": "2024-10-10", "name": "National Day", "type": "national"},
                {"date": "2024-02-08", "name": "Lunar New Year Holiday", "type": "national"}
            ],
            "2025": [{"date": "2025-01-01", "name": "New Year's Day", "type": "national"}]
        })"));
        ASSERT_TRUE(calendar.is_ok());
        service = std::make_unique<QuoteService>(
            store, std::make_shared<SecurityLockTable>(),
            std::make_shared<const HolidayCalendar>(calendar.take()));
    }

    void TearDown() override {
        service.reset();
        store.reset();
        TestBase::TearDown();
    }

    SecurityInfoUpdate tsmc() const {
        SecurityInfoUpdate update;
        update.code = "2330";
        update.name = "TSMC";
        update.market_id = 1;
        update.industry_id = 24;
        update.book_value_per_share = 115.6;
        return update;
    }

    std::shared_ptr<MemoryStore> store;
    std::unique_ptr<QuoteService> service;
    const Date date{2024, 6, 3};
};

TEST_F(QuoteServiceTest, RegistersAsServiceComponent) {
    auto components = StateManager::instance().get_all_components();
    bool found = false;
    for (const auto& id : components) {
        auto info = StateManager::instance().get_state(id);
        if (info.is_ok() && info.value().type == ComponentType::SERVICE) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(QuoteServiceTest, SecurityInfoFollowsMergeRule) {
    auto inserted = service->update_security_info(tsmc(), make_context(date));
    ASSERT_TRUE(inserted.is_ok());
    EXPECT_EQ(inserted.value(), MergeAction::INSERTED);

    auto same = service->update_security_info(tsmc(), make_context(date, 60));
    ASSERT_TRUE(same.is_ok());
    EXPECT_EQ(same.value(), MergeAction::UNCHANGED);

    auto suspended = tsmc();
    suspended.suspended = true;
    auto updated = service->update_security_info(suspended, make_context(date, 120));
    ASSERT_TRUE(updated.is_ok());
    EXPECT_EQ(updated.value(), MergeAction::UPDATED);

    auto security = store->get_security("2330").value();
    ASSERT_TRUE(security.has_value());
    EXPECT_EQ(security->name, "TSMC");
    EXPECT_TRUE(security->suspended);
    EXPECT_DOUBLE_EQ(security->book_value_per_share, 115.6);
    EXPECT_EQ(security->updated_time, fixed_now(120));
}

TEST_F(QuoteServiceTest, SecurityInfoWithoutCodeIsRejected) {
    auto update = tsmc();
    update.code.clear();
    auto result = service->update_security_info(update, make_context(date));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_TRUE(store->list_securities().value().empty());
}

TEST_F(QuoteServiceTest, CurrentQuotesUseLatestStoredDay) {
    store->merge_daily_quote(make_quote("2330", Date(2024, 5, 31), 570.0, -3.0),
                             make_context(date));
    store->merge_daily_quote(make_quote("2330", date, 580.0, 10.0), make_context(date));
    store->merge_daily_quote(make_quote("2317", date, 160.5, 1.5), make_context(date));

    auto quotes = service->fetch_current_quotes({"2317", "9999", "2330"});
    ASSERT_TRUE(quotes.is_ok());
    ASSERT_EQ(quotes.value().size(), 2u);
    EXPECT_EQ(quotes.value()[0].code, "2317");
    EXPECT_DOUBLE_EQ(quotes.value()[0].price, 160.5);
    EXPECT_EQ(quotes.value()[1].code, "2330");
    EXPECT_DOUBLE_EQ(quotes.value()[1].price, 580.0);
    EXPECT_DOUBLE_EQ(quotes.value()[1].change, 10.0);
    EXPECT_NEAR(quotes.value()[1].change_range, 10.0 / 570.0 * 100.0, 1e-9);
}

TEST_F(QuoteServiceTest, HolidayScheduleIsOrderedPerYear) {
    auto holidays = service->fetch_holiday_schedule(2024);
    ASSERT_EQ(holidays.size(), 2u);
    EXPECT_EQ(holidays[0].date, Date(2024, 2, 8));
    EXPECT_EQ(holidays[1].reason, "National Day");

    EXPECT_EQ(service->fetch_holiday_schedule(2025).size(), 1u);
    EXPECT_TRUE(service->fetch_holiday_schedule(2023).empty());
}

TEST_F(QuoteServiceTest, MissingCalendarServesEmptySchedule) {
    QuoteService without_calendar(store, std::make_shared<SecurityLockTable>(), nullptr);
    EXPECT_TRUE(without_calendar.fetch_holiday_schedule(2024).empty());
}
