// include/market_ingest/core/state_manager.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "market_ingest/core/error.hpp"
#include "market_ingest/core/types.hpp"

namespace market_ingest {

enum class ComponentState { INITIALIZED, RUNNING, ERR_STATE, STOPPED };

enum class ComponentType {
    STORE,
    FETCH_ORCHESTRATOR,
    MERGER,
    METRICS_ENGINE,
    SNAPSHOT_ENGINE,
    SCHEDULER,
    SERVICE
};

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Registry of long-lived pipeline components and their health
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");
    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

    /**
     * @brief Process-unique component id such as "PostgresStore#3"
     */
    static std::string make_component_id(const std::string& prefix);

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state, ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace market_ingest
