// src/config/rig_config.cpp
#include "config/rig_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

RigConfig RigConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[RigConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[RigConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[RigConfig] Loading service config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        RigConfig cfg = get_default();

        // ====================================================================
        // Device identity and backend
        // ====================================================================
        if (root["device"]) {
            auto d = root["device"];
            cfg.device.id = d["id"].as<std::string>(cfg.device.id);
            cfg.device.api_key = d["api_key"].as<std::string>(cfg.device.api_key);
        }

        if (root["backend"]) {
            auto b = root["backend"];
            cfg.backend.url = b["url"].as<std::string>(cfg.backend.url);
            cfg.backend.transport = b["transport"].as<std::string>(cfg.backend.transport);
            cfg.backend.timeout_s = b["timeout_s"].as<double>(cfg.backend.timeout_s);
        }

        // ====================================================================
        // Command queue
        // ====================================================================
        if (root["commands"]) {
            auto c = root["commands"];
            cfg.queue.poll_interval_s = c["poll_interval_s"].as<double>(cfg.queue.poll_interval_s);
            cfg.queue.stale_grace_s = c["stale_grace_s"].as<double>(cfg.queue.stale_grace_s);
            cfg.queue.error_log_window_s = c["error_log_window_s"].as<double>(cfg.queue.error_log_window_s);
            cfg.queue.cancel_pending_on_start =
                c["cancel_pending_on_start"].as<bool>(cfg.queue.cancel_pending_on_start);
            if (c["always_allowed"]) {
                if (!c["always_allowed"].IsSequence()) {
                    throw std::runtime_error("commands.always_allowed must be a list");
                }
                cfg.queue.always_allowed.clear();
                for (const auto& item : c["always_allowed"]) {
                    cfg.queue.always_allowed.insert(item.as<std::string>());
                }
            }
        }

        // ====================================================================
        // State reporting
        // ====================================================================
        if (root["state"]) {
            auto s = root["state"];
            cfg.state.min_push_interval_s = s["min_push_interval_s"].as<double>(cfg.state.min_push_interval_s);
            cfg.state.resync_interval_s = s["resync_interval_s"].as<double>(cfg.state.resync_interval_s);
            cfg.state_verify_attempts = s["verify_attempts"].as<int>(cfg.state_verify_attempts);
            cfg.state_verify_settle_s = s["verify_settle_s"].as<double>(cfg.state_verify_settle_s);
        }

        if (root["telemetry"]) {
            cfg.telemetry_poll_hz = root["telemetry"]["poll_hz"].as<double>(cfg.telemetry_poll_hz);
        }

        if (root["timed_session"]) {
            auto t = root["timed_session"];
            cfg.timed_session.movement_speed_kph =
                t["movement_speed_kph"].as<double>(cfg.timed_session.movement_speed_kph);
            cfg.timed_session.stop_speed_kph = t["stop_speed_kph"].as<double>(cfg.timed_session.stop_speed_kph);
        }

        // ====================================================================
        // Controls
        // ====================================================================
        if (root["controls"]) {
            auto c = root["controls"];
            cfg.controls.override_path = c["override_path"].as<std::string>(cfg.controls.override_path);
            cfg.controls.app_ini_path = c["app_ini_path"].as<std::string>(cfg.controls.app_ini_path);
            cfg.controls.controls_cfg_path = c["controls_cfg_path"].as<std::string>(cfg.controls.controls_cfg_path);
            cfg.bindings.reload_cooldown_s = c["reload_cooldown_s"].as<double>(cfg.bindings.reload_cooldown_s);
        }

        if (root["executor"]) {
            auto e = root["executor"];
            cfg.executor.modifier_gap_s = e["modifier_gap_s"].as<double>(cfg.executor.modifier_gap_s);
            cfg.executor.tap_hold_s = e["tap_hold_s"].as<double>(cfg.executor.tap_hold_s);
            cfg.executor.check_interval_s = e["check_interval_s"].as<double>(cfg.executor.check_interval_s);
            cfg.executor.focus_settle_s = e["focus_settle_s"].as<double>(cfg.executor.focus_settle_s);
        }

        // ====================================================================
        // Dispatcher timing
        // ====================================================================
        if (root["dispatcher"]) {
            auto d = root["dispatcher"];
            auto& dc = cfg.dispatcher;
            dc.engine_running_rpm = d["engine_running_rpm"].as<double>(dc.engine_running_rpm);
            dc.stop_speed_kph = d["stop_speed_kph"].as<double>(dc.stop_speed_kph);
            dc.stop_wait_timeout_s = d["stop_wait_timeout_s"].as<double>(dc.stop_wait_timeout_s);
            dc.poll_interval_s = d["poll_interval_s"].as<double>(dc.poll_interval_s);
            dc.ignition_settle_s = d["ignition_settle_s"].as<double>(dc.ignition_settle_s);
            dc.reset_max_hold_s = d["reset_max_hold_s"].as<double>(dc.reset_max_hold_s);
            dc.enter_hold_s = d["enter_hold_s"].as<double>(dc.enter_hold_s);
            dc.enter_verify_delay_s = d["enter_verify_delay_s"].as<double>(dc.enter_verify_delay_s);
            dc.starter_hold_s = d["starter_hold_s"].as<double>(dc.starter_hold_s);
            dc.post_reset_settle_s = d["post_reset_settle_s"].as<double>(dc.post_reset_settle_s);
            dc.timed_reset_lap_factor = d["timed_reset_lap_factor"].as<double>(dc.timed_reset_lap_factor);
            dc.default_timed_reset_interval_s =
                d["default_timed_reset_interval_s"].as<double>(dc.default_timed_reset_interval_s);
        }
        // Reported engine state and the starter guard use one threshold.
        cfg.state.rpm_threshold = cfg.dispatcher.engine_running_rpm;
        cfg.state.error_log_window_s = cfg.queue.error_log_window_s;

        // ====================================================================
        // Logging and bench
        // ====================================================================
        if (root["logging"]) {
            cfg.logging.level = root["logging"]["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = root["logging"]["file"].as<std::string>(cfg.logging.file);
        }

        if (root["bench"]) {
            cfg.bench_lua_script = root["bench"]["lua_script"].as<std::string>(cfg.bench_lua_script);
        }

        cfg.validate();

        LOG_INFO("[RigConfig] Successfully loaded: device '%s'", cfg.device.id.c_str());
        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[RigConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[RigConfig] Load error: ") + e.what()
        );
    }
}

RigConfig RigConfig::get_default() {
    RigConfig cfg;
    cfg.device.id = "rig-dev";
    return cfg;
}

void RigConfig::validate() const {
    if (device.id.empty()) {
        throw std::runtime_error("Invalid device.id: must not be empty");
    }
    if (backend.url.empty()) {
        throw std::runtime_error("Invalid backend.url: must not be empty");
    }
    if (backend.transport != "rest" && backend.transport != "table") {
        throw std::runtime_error("Invalid backend.transport: must be 'rest' or 'table'");
    }
    if (backend.timeout_s <= 0.0) {
        throw std::runtime_error("Invalid backend.timeout_s: must be > 0");
    }

    if (queue.poll_interval_s <= 0.0) {
        throw std::runtime_error("Invalid commands.poll_interval_s: must be > 0");
    }
    if (queue.stale_grace_s < 0.0) {
        throw std::runtime_error("Invalid commands.stale_grace_s: must be >= 0");
    }
    if (queue.error_log_window_s < 0.0) {
        throw std::runtime_error("Invalid commands.error_log_window_s: must be >= 0");
    }

    if (state.min_push_interval_s < 0.0) {
        throw std::runtime_error("Invalid state.min_push_interval_s: must be >= 0");
    }
    if (state.resync_interval_s <= state.min_push_interval_s) {
        throw std::runtime_error("Invalid state.resync_interval_s: must be > min_push_interval_s");
    }
    if (state_verify_attempts < 1) {
        throw std::runtime_error("Invalid state.verify_attempts: must be >= 1");
    }

    if (telemetry_poll_hz <= 0.0 || telemetry_poll_hz > 120.0) {
        throw std::runtime_error("Invalid telemetry.poll_hz: must be 0 < hz <= 120");
    }
    if (bindings.reload_cooldown_s < 0.0) {
        throw std::runtime_error("Invalid controls.reload_cooldown_s: must be >= 0");
    }

    if (dispatcher.reset_max_hold_s <= 0.0) {
        throw std::runtime_error("Invalid dispatcher.reset_max_hold_s: must be > 0");
    }
    if (dispatcher.stop_wait_timeout_s <= 0.0) {
        throw std::runtime_error("Invalid dispatcher.stop_wait_timeout_s: must be > 0");
    }
    if (dispatcher.poll_interval_s <= 0.0) {
        throw std::runtime_error("Invalid dispatcher.poll_interval_s: must be > 0");
    }

    utils::LogLevel lvl;
    if (!utils::parse_level(logging.level, lvl)) {
        throw std::runtime_error("Invalid logging.level: " + logging.level);
    }

    LOG_DEBUG("[RigConfig] Validation passed");
}

void RigConfig::print_summary() const {
    std::string allowed;
    for (const auto& a : queue.always_allowed) {
        if (!allowed.empty()) allowed += ",";
        allowed += a;
    }

    LOG_INFO("========================================");
    LOG_INFO("Rig Service Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Device: %s", device.id.c_str());
    LOG_INFO("Backend: %s (%s)", backend.url.c_str(), backend.transport.c_str());
    LOG_INFO("----------------------------------------");
    LOG_INFO("Command poll: %.1f s, stale grace: %.0f s", queue.poll_interval_s, queue.stale_grace_s);
    LOG_INFO("Cancel pending on start: %s", queue.cancel_pending_on_start ? "yes" : "no");
    LOG_INFO("Always allowed: %s", allowed.empty() ? "(none)" : allowed.c_str());
    LOG_INFO("State push: min %.1f s, resync %.0f s", state.min_push_interval_s, state.resync_interval_s);
    LOG_INFO("Telemetry: %.0f Hz", telemetry_poll_hz);
    if (!controls.override_path.empty()) {
        LOG_INFO("Binding override: %s", controls.override_path.c_str());
    }
    LOG_INFO("========================================");
}

} // namespace config
