#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "market_ingest/core/logger.hpp"

using namespace market_ingest;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Close any file left open by a previous test
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_TRUE(Logger::instance().initialize(config).is_ok());
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));
    Logger::instance().log(LogLevel::INFO, "Console message");
    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));
    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::DEBUG, "Debug");
    Logger::instance().log(LogLevel::INFO, "Info");
    Logger::instance().log(LogLevel::WARNING, "Warning");
    Logger::instance().log(LogLevel::ERR, "Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "Warning\nError\n");
}

TEST_F(LoggerTest, MessageCarriesLevelAndComponent) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.include_level = true;
    Logger::instance().initialize(config);

    {
        ScopedLogComponent scope("MetricsEngine");
        INFO("computed 12 estimates");
    }
    WARN("untagged");

    EXPECT_EQ(cout_buffer.str(),
              "[INFO] [MetricsEngine] computed 12 estimates\n[WARNING] untagged\n");
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 2;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "12345678");  // 9 bytes
    Logger::instance().log(LogLevel::INFO, "12345678");  // crosses the limit

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }
    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationDoesNotWrite) {
    Logger::instance().log(LogLevel::INFO, "Test");
    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.from_json(nlohmann::json{{"min_level", "WARN"},
                                    {"destination", "BOTH"},
                                    {"filename_prefix", "ingest"},
                                    {"max_files", 3}});
    EXPECT_EQ(config.min_level, LogLevel::WARNING);
    EXPECT_EQ(config.destination, LogDestination::BOTH);
    EXPECT_EQ(config.to_json()["filename_prefix"], "ingest");
    EXPECT_EQ(config.to_json()["max_files"], 3);
}
