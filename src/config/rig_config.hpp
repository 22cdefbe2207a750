// src/config/rig_config.hpp
#pragma once

#include "commands/action_dispatcher.hpp"
#include "commands/command_queue.hpp"
#include "controls/combo_executor.hpp"
#include "controls/control_bindings.hpp"
#include "state/state_reconciler.hpp"
#include "state/timed_session.hpp"
#include <string>

namespace config {

/**
 * RigConfig - Loads service settings from a YAML file
 *
 * Usage:
 *   auto cfg = RigConfig::load("config/rig_service.yaml");
 *   service::RigService svc(cfg, telemetry, injector);
 *
 * Every key is optional. Falls back to defaults if the file is not found.
 */
class RigConfig {
public:
    struct Device {
        std::string id;
        std::string api_key;
    };

    struct Backend {
        std::string url = "http://localhost:3000";
        std::string transport = "rest";     // "rest" or "table"
        double timeout_s = 10.0;
    };

    struct Controls {
        std::string override_path = "config/controls.yaml";
        std::string app_ini_path;
        std::string controls_cfg_path;
    };

    struct Logging {
        std::string level = "info";
        std::string file;
    };

    Device device;
    Backend backend;
    Controls controls;
    Logging logging;

    double telemetry_poll_hz = 10.0;
    int state_verify_attempts = 3;          // forced push after reset_car
    double state_verify_settle_s = 0.5;

    std::string bench_lua_script = "config/lua/bench_rig.lua";

    commands::CommandQueue::Config queue;
    commands::ActionDispatcher::Config dispatcher;
    controls::ControlBindingStore::Config bindings;
    controls::ComboExecutor::Config executor;
    state::StateReconciler::Config state;
    state::TimedSessionTracker::Config timed_session;

    /**
     * Load service config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/rig_service.yaml")
     * @return RigConfig with loaded settings
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static RigConfig load(const std::string& yaml_path);

    static RigConfig get_default();

    /**
     * Validate loaded settings
     * @throws std::runtime_error if any setting is invalid
     */
    void validate() const;

    /**
     * Print summary of configuration to the log
     */
    void print_summary() const;

    RigConfig() = default;
};

} // namespace config
