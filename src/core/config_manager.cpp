// src/core/config_manager.cpp
#include "market_ingest/core/config_manager.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "market_ingest/core/time_utils.hpp"

namespace market_ingest {

namespace {

constexpr ConfigType kAllTypes[] = {ConfigType::DATABASE, ConfigType::FETCH, ConfigType::METRICS,
                                    ConfigType::SCHEDULER, ConfigType::LOGGING};

}  // namespace

void ConfigValidator::require_number_in_range(const nlohmann::json& config,
                                              const std::string& field, double min_val,
                                              double max_val,
                                              std::vector<ConfigValidationError>& errors) {
    if (!config.contains(field)) {
        return;
    }
    if (!config[field].is_number()) {
        errors.push_back({field, "Must be a number"});
        return;
    }
    double val = config[field].get<double>();
    if (val < min_val || val > max_val) {
        std::stringstream ss;
        ss << "Must be between " << min_val << " and " << max_val;
        errors.push_back({field, ss.str()});
    }
}

// DatabaseValidator Implementation
std::vector<ConfigValidationError> DatabaseValidator::validate(const nlohmann::json& config) const {
    std::vector<ConfigValidationError> errors;

    std::vector<std::string> required = {"host", "port", "database", "user"};
    for (const auto& field : required) {
        if (!config.contains(field)) {
            errors.push_back({field, "Required field missing"});
            continue;
        }

        if (field == "port") {
            if (!config[field].is_number_integer() || config[field].get<int>() <= 0 ||
                config[field].get<int>() > 65535) {
                errors.push_back({field, "Must be a valid port number (1-65535)"});
            }
        } else if (!config[field].is_string() || config[field].get<std::string>().empty()) {
            errors.push_back({field, "Must be a non-empty string"});
        }
    }

    require_number_in_range(config, "pool_size", 1, 256, errors);
    require_number_in_range(config, "connect_timeout_seconds", 1, 600, errors);
    require_number_in_range(config, "max_retries", 0, 20, errors);

    return errors;
}

// FetchValidator Implementation
std::vector<ConfigValidationError> FetchValidator::validate(const nlohmann::json& config) const {
    std::vector<ConfigValidationError> errors;

    if (!config.contains("workers")) {
        errors.push_back({"workers", "Required field missing"});
    }
    require_number_in_range(config, "workers", 1, 128, errors);
    require_number_in_range(config, "max_attempts", 1, 20, errors);
    require_number_in_range(config, "initial_backoff_ms", 0, 600000, errors);
    require_number_in_range(config, "backoff_multiplier", 1.0, 10.0, errors);
    require_number_in_range(config, "max_backoff_ms", 0, 3600000, errors);
    require_number_in_range(config, "attempt_timeout_ms", 1, 3600000, errors);
    require_number_in_range(config, "drain_timeout_ms", 0, 3600000, errors);

    if (config.contains("initial_backoff_ms") && config.contains("max_backoff_ms") &&
        config["initial_backoff_ms"].is_number() && config["max_backoff_ms"].is_number() &&
        config["initial_backoff_ms"].get<double>() > config["max_backoff_ms"].get<double>()) {
        errors.push_back({"max_backoff_ms", "Must not be smaller than initial_backoff_ms"});
    }

    return errors;
}

// MetricsValidator Implementation
std::vector<ConfigValidationError> MetricsValidator::validate(const nlohmann::json& config) const {
    std::vector<ConfigValidationError> errors;

    require_number_in_range(config, "valuation_lookback_years", 1, 50, errors);
    require_number_in_range(config, "extrema_window", 1, 2000, errors);
    require_number_in_range(config, "default_payout_ratio", 0, 200, errors);
    require_number_in_range(config, "dividend_max_age_years", 0, 10, errors);
    require_number_in_range(config, "workers", 1, 128, errors);

    if (config.contains("moving_average_windows")) {
        const auto& windows = config["moving_average_windows"];
        if (!windows.is_array() || windows.empty()) {
            errors.push_back({"moving_average_windows", "Must be a non-empty array"});
        } else {
            for (const auto& w : windows) {
                if (!w.is_number_integer() || w.get<int>() < 1 || w.get<int>() > 2000) {
                    errors.push_back(
                        {"moving_average_windows", "Windows must be integers between 1 and 2000"});
                    break;
                }
            }
        }
    }

    if (config.contains("estimator_weights")) {
        validate_weights(config["estimator_weights"], errors);
    }

    return errors;
}

void MetricsValidator::validate_weights(const nlohmann::json& weights,
                                        std::vector<ConfigValidationError>& errors) const {
    if (!weights.is_object()) {
        errors.push_back({"estimator_weights", "Must be an object of estimator -> weight"});
        return;
    }
    double total = 0.0;
    for (const auto& item : weights.items()) {
        if (!item.value().is_number() || item.value().get<double>() < 0.0) {
            errors.push_back({"estimator_weights." + item.key(), "Must be a non-negative number"});
            continue;
        }
        total += item.value().get<double>();
    }
    if (total <= 0.0) {
        errors.push_back({"estimator_weights", "At least one weight must be positive"});
    }
}

// SchedulerValidator Implementation
std::vector<ConfigValidationError> SchedulerValidator::validate(
    const nlohmann::json& config) const {
    std::vector<ConfigValidationError> errors;

    require_number_in_range(config, "utc_offset_minutes", -14 * 60, 14 * 60, errors);
    require_number_in_range(config, "poll_interval_seconds", 1, 3600, errors);

    if (!config.contains("jobs")) {
        return errors;
    }
    if (!config["jobs"].is_array()) {
        errors.push_back({"jobs", "Must be an array"});
        return errors;
    }
    for (const auto& job : config["jobs"]) {
        if (!job.contains("name") || !job["name"].is_string() ||
            job["name"].get<std::string>().empty()) {
            errors.push_back({"jobs.name", "Each job needs a non-empty name"});
            continue;
        }
        const std::string name = job["name"].get<std::string>();
        if (!job.contains("at") || !job["at"].is_string() ||
            !core::parse_time_of_day(job["at"].get<std::string>())) {
            errors.push_back({"jobs." + name + ".at", "Must be a time of day in HH:MM form"});
        }
    }

    return errors;
}

// LoggingValidator Implementation
std::vector<ConfigValidationError> LoggingValidator::validate(const nlohmann::json& config) const {
    std::vector<ConfigValidationError> errors;

    if (config.contains("min_level")) {
        static const std::vector<std::string> levels = {"TRACE",   "DEBUG", "INFO",
                                                        "WARNING", "ERROR", "FATAL"};
        if (!config["min_level"].is_string() ||
            std::find(levels.begin(), levels.end(), config["min_level"].get<std::string>()) ==
                levels.end()) {
            errors.push_back({"min_level", "Must be one of TRACE, DEBUG, INFO, WARNING, ERROR, FATAL"});
        }
    }
    if (config.contains("destination")) {
        const auto& dest = config["destination"];
        if (!dest.is_string() || (dest != "CONSOLE" && dest != "FILE" && dest != "BOTH")) {
            errors.push_back({"destination", "Must be CONSOLE, FILE or BOTH"});
        }
    }
    require_number_in_range(config, "max_files", 1, 1000, errors);

    return errors;
}

void ConfigManager::initialize_validators() {
    validators_[ConfigType::DATABASE] = std::make_unique<DatabaseValidator>();
    validators_[ConfigType::FETCH] = std::make_unique<FetchValidator>();
    validators_[ConfigType::METRICS] = std::make_unique<MetricsValidator>();
    validators_[ConfigType::SCHEDULER] = std::make_unique<SchedulerValidator>();
    validators_[ConfigType::LOGGING] = std::make_unique<LoggingValidator>();
}

Result<void> ConfigManager::initialize(const std::filesystem::path& base_path, Environment env) {
    std::lock_guard<std::mutex> lock(mutex_);

    config_path_ = base_path;
    current_env_ = env;
    config_ = nlohmann::json::object();

    initialize_validators();

    auto result = load_config_files();
    if (result.is_error()) {
        return result;
    }

    auto overrides = apply_environment_overrides();
    if (overrides.is_error()) {
        return overrides;
    }
    apply_variable_overrides();

    for (auto type : kAllTypes) {
        auto validation = validate_config(type, config_[get_component_name(type)]);
        if (validation.is_error()) {
            return validation;
        }
    }
    return Result<void>();
}

Result<void> ConfigManager::load_config_files() {
    std::error_code ec;
    if (!std::filesystem::exists(config_path_, ec)) {
        std::filesystem::create_directories(config_path_, ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create config directory: " + config_path_.string(),
                                    "ConfigManager");
        }
    }

    for (auto type : kAllTypes) {
        std::string component = get_component_name(type);
        std::filesystem::path config_file = config_path_ / (component + ".json");

        if (!std::filesystem::exists(config_file, ec)) {
            config_[component] = create_default_config(type);

            std::ofstream file(config_file);
            if (!file.is_open()) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to create config file: " + config_file.string(),
                                        "ConfigManager");
            }
            file << std::setw(4) << config_[component] << std::endl;
            continue;
        }

        std::ifstream file(config_file);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open config file: " + config_file.string(),
                                    "ConfigManager");
        }

        try {
            nlohmann::json loaded;
            file >> loaded;
            // Missing keys fall back to defaults
            nlohmann::json merged = create_default_config(type);
            merged.merge_patch(loaded);
            config_[component] = merged;
        } catch (const nlohmann::json::exception& e) {
            return make_error<void>(
                ErrorCode::JSON_PARSE_ERROR,
                "Invalid JSON in config file: " + config_file.string() + " - " + e.what(),
                "ConfigManager");
        }
    }

    return Result<void>();
}

Result<void> ConfigManager::apply_environment_overrides() {
    std::filesystem::path env_dir = config_path_ / environment_to_string(current_env_);

    std::error_code ec;
    if (!std::filesystem::exists(env_dir, ec)) {
        return Result<void>();  // No overrides, not an error
    }

    for (const auto& entry : std::filesystem::directory_iterator(env_dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::string component = entry.path().stem().string();

        std::ifstream file(entry.path());
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open override file: " + entry.path().string(),
                                    "ConfigManager");
        }

        nlohmann::json override_config;
        try {
            file >> override_config;
        } catch (const nlohmann::json::exception& e) {
            return make_error<void>(
                ErrorCode::JSON_PARSE_ERROR,
                "Invalid JSON in override file: " + entry.path().string() + " - " + e.what(),
                "ConfigManager");
        }

        if (config_.contains(component)) {
            config_[component].merge_patch(override_config);
        } else {
            config_[component] = override_config;
        }
    }

    return Result<void>();
}

void ConfigManager::apply_variable_overrides() {
    auto& db = config_[get_component_name(ConfigType::DATABASE)];
    const std::pair<const char*, const char*> string_vars[] = {
        {"MARKET_INGEST_DB_HOST", "host"},
        {"MARKET_INGEST_DB_USER", "user"},
        {"MARKET_INGEST_DB_PASSWORD", "password"},
        {"MARKET_INGEST_DB_NAME", "database"}};
    for (const auto& [var, field] : string_vars) {
        if (const char* value = std::getenv(var)) {
            db[field] = std::string(value);
        }
    }
    if (const char* port = std::getenv("MARKET_INGEST_DB_PORT")) {
        char* end = nullptr;
        long parsed = std::strtol(port, &end, 10);
        if (end != port && *end == '\0') {
            db["port"] = static_cast<int>(parsed);
        }
    }
}

Result<nlohmann::json> ConfigManager::get_json(ConfigType component_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string component = get_component_name(component_type);
    if (!config_.contains(component)) {
        return make_error<nlohmann::json>(ErrorCode::NOT_FOUND,
                                          "Component not found: " + component, "ConfigManager");
    }
    return Result<nlohmann::json>(config_[component]);
}

Result<void> ConfigManager::update_config(ConfigType component_type, const nlohmann::json& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string component = get_component_name(component_type);

    auto validation = validate_config(component_type, config);
    if (validation.is_error()) {
        return validation;
    }

    config_[component] = config;

    std::filesystem::path config_file = config_path_ / (component + ".json");
    std::ofstream file(config_file);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open config file for writing: " + config_file.string(),
                                "ConfigManager");
    }
    file << std::setw(4) << config << std::endl;
    return Result<void>();
}

Result<void> ConfigManager::validate_config(ConfigType component_type,
                                            const nlohmann::json& config) const {
    auto it = validators_.find(component_type);
    if (it == validators_.end()) {
        return make_error<void>(
            ErrorCode::NOT_INITIALIZED,
            "No validator found for component: " + get_component_name(component_type),
            "ConfigManager");
    }

    auto errors = it->second->validate(config);
    if (!errors.empty()) {
        std::stringstream ss;
        ss << "Configuration validation failed for " << get_component_name(component_type) << ":";
        for (const auto& error : errors) {
            ss << "\n - " << error.field << ": " << error.message;
        }
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, ss.str(), "ConfigManager");
    }

    return Result<void>();
}

Result<void> ConfigManager::save_configs() {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_configs_unlocked();
}

Result<void> ConfigManager::save_configs_unlocked() {
    for (const auto& item : config_.items()) {
        std::filesystem::path config_file = config_path_ / (item.key() + ".json");
        std::ofstream file(config_file);
        if (!file.is_open()) {
            return make_error<void>(
                ErrorCode::FILE_IO_ERROR,
                "Failed to open config file for writing: " + config_file.string(),
                "ConfigManager");
        }
        file << std::setw(4) << item.value() << std::endl;
    }
    return Result<void>();
}

nlohmann::json ConfigManager::create_default_config(ConfigType component_type) const {
    nlohmann::json config;
    switch (component_type) {
        case ConfigType::DATABASE:
            config["host"] = "localhost";
            config["port"] = 5432;
            config["user"] = "postgres";
            config["password"] = "";
            config["database"] = "market_ingest";
            config["pool_size"] = 8;
            config["connect_timeout_seconds"] = 10;
            config["max_retries"] = 3;
            break;
        case ConfigType::FETCH:
            config["workers"] = 4;
            config["max_attempts"] = 3;
            config["initial_backoff_ms"] = 500;
            config["backoff_multiplier"] = 2.0;
            config["max_backoff_ms"] = 30000;
            config["attempt_timeout_ms"] = 30000;
            config["drain_timeout_ms"] = 60000;
            break;
        case ConfigType::METRICS:
            config["valuation_lookback_years"] = 5;
            config["moving_average_windows"] = {5, 10, 20, 60, 120, 240};
            config["extrema_window"] = 240;
            config["default_payout_ratio"] = 70.0;
            config["dividend_max_age_years"] = 1;
            config["workers"] = 4;
            config["estimator_weights"] = {{"price", 0.2},
                                           {"dividend", 0.29},
                                           {"eps", 0.3},
                                           {"pbr", 0.2},
                                           {"per", 0.01}};
            break;
        case ConfigType::SCHEDULER:
            config["utc_offset_minutes"] = 480;
            config["poll_interval_seconds"] = 30;
            config["holiday_file"] = "holidays.json";
            config["jobs"] = nlohmann::json::array(
                {{{"name", "refresh_emerging_book_value"}, {"at", "01:00"}, {"trading_days_only", false}},
                 {{"name", "refresh_payout_ratio"}, {"at", "02:30"}, {"trading_days_only", false}},
                 {{"name", "refresh_quarter_financials"}, {"at", "04:00"}, {"trading_days_only", false}},
                 {{"name", "refresh_annual_financials"}, {"at", "05:00"}, {"trading_days_only", false}},
                 {{"name", "refresh_trailing_eps"}, {"at", "05:00"}, {"trading_days_only", false}},
                 {{"name", "refresh_revenue"}, {"at", "05:00"}, {"trading_days_only", false}},
                 {{"name", "refresh_security_weights"}, {"at", "05:00"}, {"trading_days_only", false}},
                 {{"name", "closing_aggregate"}, {"at", "15:00"}, {"trading_days_only", true}},
                 {{"name", "refresh_dividends"}, {"at", "21:00"}, {"trading_days_only", false}},
                 {{"name", "refresh_foreign_holdings"}, {"at", "22:00"}, {"trading_days_only", true}}});
            break;
        case ConfigType::LOGGING:
            config["min_level"] = "INFO";
            config["destination"] = "CONSOLE";
            config["log_directory"] = "logs";
            config["filename_prefix"] = "market_ingest";
            config["include_timestamp"] = true;
            config["include_level"] = true;
            config["max_file_size"] = 52428800;  // 50 MB
            config["max_files"] = 10;
            break;
    }
    config["version"] = "1.0.0";
    return config;
}

std::string ConfigManager::get_component_name(ConfigType type) {
    switch (type) {
        case ConfigType::DATABASE:
            return "database";
        case ConfigType::FETCH:
            return "fetch";
        case ConfigType::METRICS:
            return "metrics";
        case ConfigType::SCHEDULER:
            return "scheduler";
        case ConfigType::LOGGING:
            return "logging";
        default:
            return "unknown";
    }
}

std::string ConfigManager::environment_to_string(Environment env) {
    switch (env) {
        case Environment::DEVELOPMENT:
            return "development";
        case Environment::STAGING:
            return "staging";
        case Environment::PRODUCTION:
            return "production";
        case Environment::TEST:
            return "test";
        default:
            return "unknown";
    }
}

Environment ConfigManager::string_to_environment(const std::string& env_str) {
    if (env_str == "staging")
        return Environment::STAGING;
    if (env_str == "production")
        return Environment::PRODUCTION;
    if (env_str == "test")
        return Environment::TEST;
    return Environment::DEVELOPMENT;
}

}  // namespace market_ingest
