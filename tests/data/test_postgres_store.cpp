#include <gtest/gtest.h>
#include <cstdlib>
#include "core/test_base.hpp"
#include "data/store_fixtures.hpp"
#include "market_ingest/data/postgres_store.hpp"

using namespace market_ingest;
using namespace market_ingest::testing;

class PostgresStoreTest : public TestBase {
protected:
    // Points at a port nothing listens on so connecting fails fast
    DatabaseConfig unreachable_config() {
        DatabaseConfig config;
        config.host = "127.0.0.1";
        config.port = 1;
        config.connect_timeout_seconds = 1;
        config.pool_size = 1;
        return config;
    }

    // Live tests run only against a scratch database named in the environment
    std::optional<DatabaseConfig> live_config() {
        const char* host = std::getenv("MARKET_INGEST_TEST_DB_HOST");
        if (!host) {
            return std::nullopt;
        }
        DatabaseConfig config;
        config.host = host;
        if (const char* name = std::getenv("MARKET_INGEST_TEST_DB_NAME"))
            config.database = name;
        if (const char* user = std::getenv("MARKET_INGEST_TEST_DB_USER"))
            config.user = user;
        if (const char* password = std::getenv("MARKET_INGEST_TEST_DB_PASSWORD"))
            config.password = password;
        config.pool_size = 2;
        return config;
    }
};

TEST_F(PostgresStoreTest, ConnectionStringCarriesAllSettings) {
    DatabaseConfig config;
    config.host = "db.internal";
    config.port = 5433;
    config.database = "quotes";
    config.user = "ingest";
    config.connect_timeout_seconds = 5;
    EXPECT_EQ(config.connection_string(),
              "host=db.internal port=5433 dbname=quotes user=ingest connect_timeout=5");

    config.password = "secret";
    EXPECT_EQ(config.connection_string(),
              "host=db.internal port=5433 dbname=quotes user=ingest connect_timeout=5 "
              "password=secret");
}

TEST_F(PostgresStoreTest, ConfigJsonRoundTrip) {
    DatabaseConfig config;
    config.from_json(nlohmann::json{{"host", "10.0.0.5"}, {"port", 6432}, {"pool_size", 4}});
    EXPECT_EQ(config.host, "10.0.0.5");
    EXPECT_EQ(config.port, 6432);
    EXPECT_EQ(config.pool_size, 4u);
    EXPECT_EQ(config.user, "postgres");

    DatabaseConfig copy;
    copy.from_json(config.to_json());
    EXPECT_EQ(copy.connection_string(), config.connection_string());
}

TEST_F(PostgresStoreTest, OperationsBeforeConnectAreNotInitialized) {
    PostgresStore store(unreachable_config());
    EXPECT_FALSE(store.is_connected());
    EXPECT_EQ(store.backend_name(), "postgres");

    auto result = store.get_security("2330");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);

    auto merge = store.merge_daily_quote(make_quote("2330", Date(2024, 6, 3), 580.0),
                                         make_context(Date(2024, 6, 3)));
    ASSERT_TRUE(merge.is_error());
    EXPECT_EQ(merge.error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(PostgresStoreTest, UnreachableServerIsConnectionError) {
    PostgresStore store(unreachable_config());
    auto result = store.connect();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONNECTION_ERROR);
    EXPECT_FALSE(store.is_connected());
}

TEST_F(PostgresStoreTest, LiveQuoteMergeIsIdempotent) {
    auto config = live_config();
    if (!config) {
        GTEST_SKIP() << "MARKET_INGEST_TEST_DB_HOST not set";
    }
    PostgresStore store(*config);
    ASSERT_TRUE(store.connect().is_ok());

    const Date date(2024, 6, 3);
    ASSERT_TRUE(store.merge_security(make_security("TEST1"), make_context(date)).is_ok());
    auto quote = make_quote("TEST1", date, 101.5, 1.5);
    auto first = store.merge_daily_quote(quote, make_context(date));
    ASSERT_TRUE(first.is_ok()) << first.error()->to_string();

    auto second = store.merge_daily_quote(quote, make_context(date, 60));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().action, MergeAction::UNCHANGED);

    auto stored = store.get_daily_quote(quote.key());
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_DOUBLE_EQ(stored.value()->close, 101.5);

    // Derived values with more digits than the columns hold
    QuoteMetrics metrics;
    metrics.moving_average_5 = 304.0 / 3.0;
    metrics.year_average = 304.0 / 3.0;
    metrics.price_to_book_ratio = 101.5 / 9.7;
    auto metrics_first = store.update_quote_metrics(quote.key(), metrics, fixed_now(120));
    ASSERT_TRUE(metrics_first.is_ok()) << metrics_first.error()->to_string();
    auto metrics_again = store.update_quote_metrics(quote.key(), metrics, fixed_now(180));
    ASSERT_TRUE(metrics_again.is_ok());
    EXPECT_EQ(metrics_again.value(), MergeAction::UNCHANGED);

    HistoryCandidate candidate{"TEST1", date, 101.5, 101.5 / 9.7};
    auto history_first = store.merge_quote_history(candidate, make_context(date, 120));
    ASSERT_TRUE(history_first.is_ok()) << history_first.error()->to_string();
    auto history_again = store.merge_quote_history(candidate, make_context(date, 180));
    ASSERT_TRUE(history_again.is_ok());
    EXPECT_EQ(history_again.value().action, MergeAction::UNCHANGED);

    store.disconnect();
}
