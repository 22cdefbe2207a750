// src/commands/action_dispatcher.hpp
#pragma once

#include "commands/action_result.hpp"
#include "commands/command_executor.hpp"
#include "commands/timed_reset.hpp"
#include "controls/action_executor.hpp"
#include "controls/action_log.hpp"
#include "controls/control_bindings.hpp"
#include "telemetry/telemetry_source.hpp"
#include "utils/clock.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace commands {

/**
 * RemoteDesktopHandler - screen-sharing collaborator. webrtc_offer and
 * remote_desktop_input commands are routed here untouched.
 */
class RemoteDesktopHandler {
public:
    virtual ~RemoteDesktopHandler() = default;

    virtual ActionResult handle_offer(const nlohmann::json& params) = 0;
    virtual ActionResult handle_input(const nlohmann::json& params) = 0;
};

// Forced, verified state push after a reset. Returns true once confirmed.
using StateResyncFn = std::function<bool()>;

// Arms the timed rental when enter_car carries timed_session = true.
using TimedSessionArmFn = std::function<void(double duration_s, const std::string& driver_user_id)>;

/**
 * ActionDispatcher - turns an action name into key presses on the simulator.
 *
 * One dispatch runs at a time: two key sequences against the same window
 * would corrupt each other's modifier state. Every top-level dispatch is
 * recorded in the action log.
 */
class ActionDispatcher : public CommandExecutor {
public:
    struct Config {
        double engine_running_rpm = 500.0;
        double stop_speed_kph = 1.5;
        double stop_wait_timeout_s = 6.0;
        double poll_interval_s = 0.2;
        double ignition_settle_s = 0.3;
        double reset_max_hold_s = 3.0;
        double enter_hold_s = 0.15;
        double enter_verify_delay_s = 0.5;
        double starter_hold_s = 0.5;
        double post_reset_settle_s = 0.5;
        double timed_reset_lap_factor = 1.5;      // grace = factor x last lap time
        double default_timed_reset_interval_s = 600.0;
    };

    ActionDispatcher(controls::ActionExecutor& executor,
                     controls::ControlBindingStore& bindings,
                     const telemetry::TelemetrySource& telemetry,
                     controls::ActionLog& action_log,
                     utils::Clock& clock,
                     Config config);
    ~ActionDispatcher() override;

    ActionDispatcher(const ActionDispatcher&) = delete;
    ActionDispatcher& operator=(const ActionDispatcher&) = delete;

    // Optional collaborators; set before the first dispatch.
    void set_remote_desktop(RemoteDesktopHandler* handler) { remote_desktop_ = handler; }
    void set_state_resync(StateResyncFn fn) { state_resync_ = std::move(fn); }
    void set_timed_session_arm(TimedSessionArmFn fn) { arm_timed_session_ = std::move(fn); }

    // CommandExecutor: dispatch a remote command (log source "remote").
    ActionResult execute(const Command& cmd) override;

    // Dispatch by name, e.g. from the timed session or a local trigger.
    ActionResult execute_action(const std::string& action,
                                const nlohmann::json& params,
                                const std::string& source);

    bool timed_reset_active() const { return timed_reset_.active(); }
    double timed_reset_interval_s() const { return timed_reset_.interval_s(); }

    // Shutdown path: stops the loop without taking the dispatch lock.
    void stop_timed_reset() { timed_reset_.stop(); }

private:
    controls::ActionExecutor& executor_;
    controls::ControlBindingStore& bindings_;
    const telemetry::TelemetrySource& telemetry_;
    controls::ActionLog& action_log_;
    utils::Clock& clock_;
    Config config_;

    RemoteDesktopHandler* remote_desktop_ = nullptr;
    StateResyncFn state_resync_;
    TimedSessionArmFn arm_timed_session_;

    // timed: the timed-reset thread must give up while a disable waits for it
    std::timed_mutex dispatch_mu_;
    TimedResetLoop timed_reset_;

    // All *_locked members require dispatch_mu_.
    ActionResult dispatch_locked(const std::string& action,
                                 const nlohmann::json& params,
                                 const std::string& source,
                                 int depth);
    ActionResult simple_toggle_locked(const std::string& action);
    ActionResult enter_car_locked(const nlohmann::json& params);
    ActionResult reset_car_locked(double grace_period_s);
    ActionResult enable_timed_reset_locked(const nlohmann::json& params);
    ActionResult disable_timed_reset_locked();
    ActionResult remote_desktop_locked(const std::string& action, const nlohmann::json& params);

    void run_timed_reset(const std::atomic<bool>& stop);
    void record(const std::string& action,
                const std::string& source,
                const std::optional<std::string>& combo,
                const ActionResult& result);
};

std::string no_binding_message(const std::string& label);

} // namespace commands
