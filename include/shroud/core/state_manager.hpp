// include/shroud/core/state_manager.hpp
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"

namespace shroud {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    PRICE_FEED,
    TRIGGER_MONITOR,
    EXECUTION_COORDINATOR,
    BUNDLE_SUBMITTER,
    SHIELD_ORCHESTRATOR
};

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of component lifecycle state and metrics
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
}  // namespace shroud
