// include/market_ingest/core/config_manager.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include "market_ingest/core/config_base.hpp"
#include "market_ingest/core/error.hpp"

namespace market_ingest {

/**
 * @brief Deployment environment, selects the override directory
 */
enum class Environment { DEVELOPMENT, STAGING, PRODUCTION, TEST };

/**
 * @brief Configuration validation error
 */
struct ConfigValidationError {
    std::string field;
    std::string message;
};

/**
 * @brief One JSON file per configured component
 */
enum class ConfigType { DATABASE, FETCH, METRICS, SCHEDULER, LOGGING };

/**
 * @brief Base configuration validator interface
 */
class ConfigValidator {
public:
    virtual ~ConfigValidator() = default;
    virtual std::vector<ConfigValidationError> validate(const nlohmann::json& config) const = 0;
    virtual ConfigType get_type() const = 0;

protected:
    static void require_number_in_range(const nlohmann::json& config, const std::string& field,
                                        double min_val, double max_val,
                                        std::vector<ConfigValidationError>& errors);
};

class DatabaseValidator : public ConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const nlohmann::json& config) const override;
    ConfigType get_type() const override {
        return ConfigType::DATABASE;
    }
};

class FetchValidator : public ConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const nlohmann::json& config) const override;
    ConfigType get_type() const override {
        return ConfigType::FETCH;
    }
};

class MetricsValidator : public ConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const nlohmann::json& config) const override;
    ConfigType get_type() const override {
        return ConfigType::METRICS;
    }

private:
    void validate_weights(const nlohmann::json& weights,
                          std::vector<ConfigValidationError>& errors) const;
};

class SchedulerValidator : public ConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const nlohmann::json& config) const override;
    ConfigType get_type() const override {
        return ConfigType::SCHEDULER;
    }
};

class LoggingValidator : public ConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const nlohmann::json& config) const override;
    ConfigType get_type() const override {
        return ConfigType::LOGGING;
    }
};

/**
 * @brief Configuration manager for process-wide settings
 *
 * Loads <base>/<component>.json for every ConfigType, writing defaults for
 * missing files, then applies <base>/<environment>/<component>.json as a JSON
 * merge patch and finally MARKET_INGEST_DB_* environment variables.
 */
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    /**
     * @brief Initialize configuration from files
     * @param base_path Base path to config files
     * @param env Environment to load overrides for
     * @return Result indicating success or failure
     */
    Result<void> initialize(const std::filesystem::path& base_path,
                            Environment env = Environment::DEVELOPMENT);

    /**
     * @brief Get the typed configuration for a component
     */
    template <typename T>
    Result<T> get_config(ConfigType component_type) const;

    /**
     * @brief Raw JSON for a component
     */
    Result<nlohmann::json> get_json(ConfigType component_type) const;

    /**
     * @brief Validate and replace a component configuration, persisting it
     */
    Result<void> update_config(ConfigType component_type, const nlohmann::json& config);

    Result<void> save_configs();

    nlohmann::json create_default_config(ConfigType component_type) const;

    Environment get_environment() const {
        return current_env_;
    }

    static std::string get_component_name(ConfigType type);
    static std::string environment_to_string(Environment env);
    static Environment string_to_environment(const std::string& env_str);

    /**
     * @brief Drop all loaded state (tests only)
     */
    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.config_ = nlohmann::json::object();
        inst.config_path_.clear();
        inst.validators_.clear();
    }

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void initialize_validators();
    Result<void> load_config_files();
    Result<void> validate_config(ConfigType component_type, const nlohmann::json& config) const;
    Result<void> apply_environment_overrides();
    void apply_variable_overrides();
    Result<void> save_configs_unlocked();

    Environment current_env_{Environment::DEVELOPMENT};
    std::filesystem::path config_path_;
    nlohmann::json config_ = nlohmann::json::object();
    std::unordered_map<ConfigType, std::unique_ptr<ConfigValidator>> validators_;
    mutable std::mutex mutex_;
};

template <typename T>
Result<T> ConfigManager::get_config(ConfigType component_type) const {
    static_assert(std::is_base_of<ConfigBase, T>::value, "T must derive from ConfigBase");
    std::lock_guard<std::mutex> lock(mutex_);

    std::string component = get_component_name(component_type);
    if (!config_.contains(component)) {
        return make_error<T>(ErrorCode::NOT_FOUND, "Component not found: " + component,
                             "ConfigManager");
    }

    const auto& component_config = config_[component];
    auto validation = validate_config(component_type, component_config);
    if (validation.is_error()) {
        return forward_error<T>(validation);
    }

    try {
        T config;
        config.from_json(component_config);
        return Result<T>(std::move(config));
    } catch (const nlohmann::json::exception& e) {
        return make_error<T>(ErrorCode::JSON_PARSE_ERROR,
                             "Error reading " + component + " config: " + e.what(),
                             "ConfigManager");
    }
}

}  // namespace market_ingest
