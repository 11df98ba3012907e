#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "market_ingest/core/config_manager.hpp"
#include "market_ingest/data/postgres_store.hpp"
#include "market_ingest/ingest/fetch_orchestrator.hpp"
#include "market_ingest/metrics/metrics_engine.hpp"
#include "market_ingest/scheduler/scheduler.hpp"

using namespace market_ingest;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::reset_instance();
        unsetenv("MARKET_INGEST_DB_HOST");
        unsetenv("MARKET_INGEST_DB_PORT");

        test_config_dir = std::filesystem::temp_directory_path() / "market_ingest_config_test";
        std::filesystem::remove_all(test_config_dir);
        std::filesystem::create_directories(test_config_dir);

        std::ofstream fetch_config(test_config_dir / "fetch.json");
        fetch_config << R"({
        "workers": 8,
        "max_attempts": 5,
        "initial_backoff_ms": 100,
        "backoff_multiplier": 3.0,
        "max_backoff_ms": 5000,
        "attempt_timeout_ms": 2000,
        "version": "1.0.0"
    })";
    }

    void TearDown() override {
        unsetenv("MARKET_INGEST_DB_HOST");
        unsetenv("MARKET_INGEST_DB_PORT");
        ConfigManager::reset_instance();
        std::filesystem::remove_all(test_config_dir);
    }

    void write(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_config_dir;
};

TEST_F(ConfigManagerTest, InitializeWritesMissingDefaults) {
    auto result = ConfigManager::instance().initialize(test_config_dir);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    EXPECT_TRUE(std::filesystem::exists(test_config_dir / "database.json"));
    EXPECT_TRUE(std::filesystem::exists(test_config_dir / "metrics.json"));
    EXPECT_TRUE(std::filesystem::exists(test_config_dir / "scheduler.json"));
    EXPECT_TRUE(std::filesystem::exists(test_config_dir / "logging.json"));
}

TEST_F(ConfigManagerTest, TypedConfigsReadFileValues) {
    ASSERT_TRUE(ConfigManager::instance().initialize(test_config_dir).is_ok());

    auto fetch = ConfigManager::instance().get_config<FetchConfig>(ConfigType::FETCH);
    ASSERT_TRUE(fetch.is_ok());
    EXPECT_EQ(fetch.value().workers, 8);
    EXPECT_EQ(fetch.value().max_attempts, 5);
    EXPECT_DOUBLE_EQ(fetch.value().backoff_multiplier, 3.0);

    auto policy = fetch.value().retry_policy();
    EXPECT_EQ(policy.max_attempts, 5);
    EXPECT_EQ(policy.initial_delay, std::chrono::milliseconds(100));
    EXPECT_EQ(policy.max_delay, std::chrono::milliseconds(5000));

    auto metrics = ConfigManager::instance().get_config<MetricsConfig>(ConfigType::METRICS);
    ASSERT_TRUE(metrics.is_ok());
    EXPECT_EQ(metrics.value().valuation_lookback_years, 5);
    EXPECT_EQ(metrics.value().moving_average_windows.size(), 6u);
    EXPECT_DOUBLE_EQ(metrics.value().estimator_weights.dividend, 0.29);

    auto schedule = ConfigManager::instance().get_config<ScheduleConfig>(ConfigType::SCHEDULER);
    ASSERT_TRUE(schedule.is_ok());
    EXPECT_EQ(schedule.value().utc_offset_minutes, 480);
    ASSERT_FALSE(schedule.value().jobs.empty());
    EXPECT_EQ(schedule.value().jobs.front().name, "refresh_emerging_book_value");
}

TEST_F(ConfigManagerTest, EnvironmentOverrideDirectoryIsMerged) {
    write(test_config_dir / "production" / "database.json",
          R"({"host": "db.internal", "pool_size": 32})");

    ASSERT_TRUE(
        ConfigManager::instance().initialize(test_config_dir, Environment::PRODUCTION).is_ok());
    auto db = ConfigManager::instance().get_config<DatabaseConfig>(ConfigType::DATABASE);
    ASSERT_TRUE(db.is_ok());
    EXPECT_EQ(db.value().host, "db.internal");
    EXPECT_EQ(db.value().pool_size, 32u);
    EXPECT_EQ(db.value().port, 5432);
}

TEST_F(ConfigManagerTest, EnvironmentVariablesOverrideCredentials) {
    setenv("MARKET_INGEST_DB_HOST", "10.0.0.5", 1);
    setenv("MARKET_INGEST_DB_PORT", "6543", 1);

    ASSERT_TRUE(ConfigManager::instance().initialize(test_config_dir).is_ok());
    auto db = ConfigManager::instance().get_config<DatabaseConfig>(ConfigType::DATABASE);
    ASSERT_TRUE(db.is_ok());
    EXPECT_EQ(db.value().host, "10.0.0.5");
    EXPECT_EQ(db.value().port, 6543);
}

TEST_F(ConfigManagerTest, InvalidValuesAreRejected) {
    write(test_config_dir / "metrics.json",
          R"({"valuation_lookback_years": 0, "estimator_weights": {"price": -1.0}})");

    auto result = ConfigManager::instance().initialize(test_config_dir);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    std::string message = result.error()->what();
    EXPECT_NE(message.find("valuation_lookback_years"), std::string::npos);
    EXPECT_NE(message.find("estimator_weights.price"), std::string::npos);
}

TEST_F(ConfigManagerTest, MalformedJobTimeIsRejected) {
    write(test_config_dir / "scheduler.json",
          R"({"jobs": [{"name": "closing_aggregate", "at": "25:00"}]})");

    auto result = ConfigManager::instance().initialize(test_config_dir);
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(std::string(result.error()->what()).find("jobs.closing_aggregate.at"),
              std::string::npos);
}

TEST_F(ConfigManagerTest, InvalidJsonIsReported) {
    write(test_config_dir / "database.json", "{ not json");

    auto result = ConfigManager::instance().initialize(test_config_dir);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigManagerTest, UpdateConfigValidatesAndPersists) {
    ASSERT_TRUE(ConfigManager::instance().initialize(test_config_dir).is_ok());

    auto json = ConfigManager::instance().get_json(ConfigType::FETCH).take();
    json["workers"] = 0;
    EXPECT_TRUE(ConfigManager::instance().update_config(ConfigType::FETCH, json).is_error());

    json["workers"] = 16;
    ASSERT_TRUE(ConfigManager::instance().update_config(ConfigType::FETCH, json).is_ok());

    std::ifstream file(test_config_dir / "fetch.json");
    nlohmann::json stored;
    file >> stored;
    EXPECT_EQ(stored["workers"], 16);
}

TEST(ConfigBaseTest, ScheduleConfigRoundTripsThroughFile) {
    ScheduleConfig config;
    config.utc_offset_minutes = 540;
    config.jobs = {{"closing_aggregate", "15:30", true}};

    auto path = std::filesystem::temp_directory_path() / "market_ingest_schedule.json";
    ASSERT_TRUE(config.save_to_file(path.string()).is_ok());

    ScheduleConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path.string()).is_ok());
    EXPECT_EQ(loaded.utc_offset_minutes, 540);
    ASSERT_EQ(loaded.jobs.size(), 1u);
    EXPECT_EQ(loaded.jobs[0].at, "15:30");
    EXPECT_TRUE(loaded.jobs[0].trading_days_only);
    std::filesystem::remove(path);
}
