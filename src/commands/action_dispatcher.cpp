// src/commands/action_dispatcher.cpp
#include "commands/action_dispatcher.hpp"
#include "controls/action_definitions.hpp"
#include "controls/key_combo.hpp"
#include "utils/logging.hpp"
#include "utils/wait.hpp"
#include <chrono>
#include <cstdlib>

namespace commands {

namespace {

// execute_action may name another action; one level of nesting is enough.
constexpr int kMaxNesting = 2;

double number_param(const nlohmann::json& params, const char* key, double def) {
    auto it = params.find(key);
    if (it == params.end()) return def;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str()) return v;
    }
    return def;
}

bool bool_param(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_string()) return it->get<std::string>() == "true";
    if (it->is_number()) return it->get<double>() != 0.0;
    return false;
}

std::string string_param(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it != params.end() && it->is_string()) return it->get<std::string>();
    return "";
}

bool is_simple_toggle(ActionKind k) {
    switch (k) {
        case ActionKind::Ignition:
        case ActionKind::Starter:
        case ActionKind::PitSpeedLimiter:
        case ActionKind::RequestPit:
        case ActionKind::QuickRepair:
        case ActionKind::ClearFlags:
            return true;
        default:
            return false;
    }
}

std::string label_for(const std::string& action) {
    const auto* def = controls::find_action_definition(action);
    return def ? def->label : action;
}

} // namespace

std::string no_binding_message(const std::string& label) {
    return "No key binding configured for " + label +
           ". Please configure this key in the simulator's control settings.";
}

ActionDispatcher::ActionDispatcher(controls::ActionExecutor& executor,
                                   controls::ControlBindingStore& bindings,
                                   const telemetry::TelemetrySource& telemetry,
                                   controls::ActionLog& action_log,
                                   utils::Clock& clock,
                                   Config config)
    : executor_(executor)
    , bindings_(bindings)
    , telemetry_(telemetry)
    , action_log_(action_log)
    , clock_(clock)
    , config_(config)
    , timed_reset_([this](const std::atomic<bool>& stop) { run_timed_reset(stop); })
{
}

ActionDispatcher::~ActionDispatcher() {
    timed_reset_.stop();
}

// ============================================================================
// Entry points
// ============================================================================

ActionResult ActionDispatcher::execute(const Command& cmd) {
    return execute_action(cmd.action, cmd.params, "remote");
}

ActionResult ActionDispatcher::execute_action(const std::string& action,
                                              const nlohmann::json& params,
                                              const std::string& source)
{
    std::lock_guard<std::timed_mutex> lock(dispatch_mu_);
    return dispatch_locked(action, params.is_object() ? params : nlohmann::json::object(), source, 0);
}

ActionResult ActionDispatcher::dispatch_locked(const std::string& action,
                                               const nlohmann::json& params,
                                               const std::string& source,
                                               int depth)
{
    const ActionKind kind = parse_action_kind(action);
    ActionResult result;

    if (is_simple_toggle(kind)) {
        result = simple_toggle_locked(action);
    } else {
        switch (kind) {
            case ActionKind::EnterCar:
                result = enter_car_locked(params);
                break;
            case ActionKind::ResetCar:
                result = reset_car_locked(number_param(params, "grace_period", 0.0));
                break;
            case ActionKind::EnableTimedReset:
                result = enable_timed_reset_locked(params);
                break;
            case ActionKind::DisableTimedReset:
                result = disable_timed_reset_locked();
                break;
            case ActionKind::WebrtcOffer:
            case ActionKind::RemoteDesktopInput:
                result = remote_desktop_locked(action, params);
                break;
            case ActionKind::ExecuteAction: {
                std::string nested = string_param(params, "action");
                if (nested.empty()) nested = string_param(params, "name");

                if (nested.empty()) {
                    result = ActionResult::fail(ErrorKind::InvalidCommand,
                                                "execute_action requires params.action");
                } else if (parse_action_kind(nested) == ActionKind::ExecuteAction || depth + 1 >= kMaxNesting) {
                    result = ActionResult::fail(ErrorKind::InvalidCommand,
                                                "execute_action cannot nest another execute_action");
                } else {
                    auto it = params.find("params");
                    const nlohmann::json nested_params =
                        (it != params.end() && it->is_object()) ? *it : params;
                    // The nested dispatch records its own log entry.
                    return dispatch_locked(nested, nested_params, source, depth + 1);
                }
                break;
            }
            default:
                result = ActionResult::fail(ErrorKind::UnknownAction, "Unknown action: " + action);
                break;
        }
    }

    std::optional<std::string> combo;
    auto it = result.result.find("combo");
    if (it != result.result.end() && it->is_string()) combo = it->get<std::string>();
    record(action, source, combo, result);
    return result;
}

void ActionDispatcher::record(const std::string& action,
                              const std::string& source,
                              const std::optional<std::string>& combo,
                              const ActionResult& result)
{
    controls::ActionLogEntry entry;
    entry.timestamp = clock_.wall_now();
    entry.action = action;
    entry.combo = combo;
    entry.key_message = controls::format_key_message(combo);
    entry.source = source;
    entry.success = result.success;
    entry.message = result.message;
    action_log_.append(std::move(entry));
}

// ============================================================================
// Simple toggles
// ============================================================================

ActionResult ActionDispatcher::simple_toggle_locked(const std::string& action) {
    const auto binding = bindings_.resolve(action);
    if (!binding.combo) {
        return ActionResult::fail(ErrorKind::NoBinding, no_binding_message(binding.label));
    }

    const auto snap = telemetry_.get_current();
    const ActionKind kind = parse_action_kind(action);
    if (snap && kind == ActionKind::Starter &&
        telemetry::engine_running(*snap, config_.engine_running_rpm)) {
        return ActionResult::fail(ErrorKind::PreconditionNotMet, "Engine already running");
    }
    if (snap && (kind == ActionKind::PitSpeedLimiter || kind == ActionKind::RequestPit) &&
        snap->in_pit_stall) {
        return ActionResult::fail(ErrorKind::PreconditionNotMet,
                                  binding.label + " not needed: car is already in the pit stall");
    }

    if (!executor_.focus_target_window()) {
        return ActionResult::fail(ErrorKind::WindowFocusFailed, "Unable to focus simulator window");
    }

    const std::string key_msg = controls::format_key_message(binding.combo);
    const double hold = kind == ActionKind::Starter ? config_.starter_hold_s : 0.0;
    if (!executor_.send_combo(*binding.combo, hold)) {
        auto r = ActionResult::fail(ErrorKind::ExecutionError, "Failed to send " + *binding.combo);
        r.result["combo"] = *binding.combo;
        return r;
    }

    return ActionResult::ok("Executed " + binding.label + " - " + key_msg,
                            {{"action", action}, {"combo", *binding.combo}, {"binding_source", binding.source}});
}

// ============================================================================
// enter_car
// ============================================================================

ActionResult ActionDispatcher::enter_car_locked(const nlohmann::json& params) {
    const auto binding = bindings_.resolve("enter_car");
    if (!binding.combo) {
        return ActionResult::fail(ErrorKind::NoBinding, no_binding_message(binding.label));
    }

    const auto before = telemetry_.get_current();
    const bool was_in_car = before && telemetry::in_car(*before);

    if (!executor_.focus_target_window()) {
        return ActionResult::fail(ErrorKind::WindowFocusFailed, "Unable to focus simulator window");
    }

    const std::string key_msg = controls::format_key_message(binding.combo);
    if (!executor_.send_combo(*binding.combo, config_.enter_hold_s)) {
        auto r = ActionResult::fail(ErrorKind::ExecutionError, "Failed to send " + *binding.combo);
        r.result["combo"] = *binding.combo;
        return r;
    }

    clock_.sleep_for(config_.enter_verify_delay_s);
    const auto after = telemetry_.get_current();
    const bool now_in_car = after && telemetry::in_car(*after);

    std::string outcome;
    std::string message;
    if (was_in_car) {
        outcome = "already_in_car";
        message = "Already in car - " + key_msg;
    } else if (now_in_car) {
        outcome = "entered";
        message = "Entered car - " + key_msg;
    } else {
        outcome = "sent_no_change";
        message = "Sent Enter Car but car state did not change (menu or garage?) - " + key_msg;
    }

    if (bool_param(params, "timed_session") && arm_timed_session_) {
        double duration = number_param(params, "duration_seconds", 0.0);
        if (duration <= 0.0) duration = number_param(params, "duration", 0.0);
        if (duration > 0.0) {
            arm_timed_session_(duration, string_param(params, "driver_user_id"));
        } else {
            LOG_WARN("[Dispatcher] timed_session requested without a duration; not armed");
        }
    }

    LOG_INFO("[Dispatcher] enter_car: %s", outcome.c_str());
    return ActionResult::ok(message, {{"action", "enter_car"},
                                      {"combo", *binding.combo},
                                      {"binding_source", binding.source},
                                      {"outcome", outcome},
                                      {"in_car", now_in_car}});
}

// ============================================================================
// reset_car
// ============================================================================

ActionResult ActionDispatcher::reset_car_locked(double grace_period_s) {
    const auto initial = telemetry_.get_current();
    if (!initial) {
        return ActionResult::fail(ErrorKind::SimulatorNotConnected, "Simulator not connected - reset skipped");
    }

    const bool was_in_car = telemetry::in_car(*initial);
    const int start_lap = initial->lap;
    nlohmann::json steps = nlohmann::json::object();

    if (!was_in_car && telemetry::is_stopped(*initial, config_.stop_speed_kph)) {
        return ActionResult::ok("Already in reset state", {{"action", "reset_car"}, {"already_reset", true}});
    }

    const auto reset = bindings_.resolve("reset_car");
    if (!reset.combo) {
        return ActionResult::fail(ErrorKind::NoBinding, no_binding_message(reset.label));
    }
    const auto ignition = bindings_.resolve("ignition");
    const auto starter = bindings_.resolve("starter");

    auto read = [this] { return telemetry_.get_current(); };

    // Let the current lap finish first.
    if (grace_period_s > 0.0) {
        LOG_INFO("[Dispatcher] Reset: waiting up to %.0fs for lap %d to finish", grace_period_s, start_lap);
        auto w = utils::wait_until(clock_, [&] {
            auto s = read();
            return s && s->lap > start_lap;
        }, grace_period_s, config_.poll_interval_s);
        steps["grace_lap_completed"] = w.satisfied;
        steps["grace_waited_s"] = w.elapsed_s;
    }

    if (!executor_.focus_target_window()) {
        return ActionResult::fail(ErrorKind::WindowFocusFailed, "Unable to focus simulator window");
    }

    // Ignition off brings the car to a halt; not verified.
    bool ignition_cut = false;
    if (ignition.combo) {
        ignition_cut = executor_.send_combo(*ignition.combo);
        clock_.sleep_for(config_.ignition_settle_s);
    }
    steps["ignition_off"] = ignition.combo ? (ignition_cut ? "sent" : "failed") : "unbound";

    auto stop_wait = utils::wait_until(clock_, [&] {
        auto s = read();
        return !s || telemetry::is_stopped(*s, config_.stop_speed_kph);
    }, config_.stop_wait_timeout_s, config_.poll_interval_s);
    steps["stopped"] = stop_wait.satisfied;
    if (!stop_wait.satisfied) {
        LOG_WARN("[Dispatcher] Reset: car still moving after %.1fs, resetting anyway", stop_wait.elapsed_s);
    }

    std::string note;
    const auto first = executor_.hold_combo_until(
        *reset.combo,
        [was_in_car](const telemetry::Snapshot& s) {
            // Pit road is not the stall: a car parked there still needs the tow.
            return s.in_pit_stall || (was_in_car && !telemetry::in_car(s));
        },
        config_.reset_max_hold_s);
    steps["reset_hold"] = {{"sent", first.sent}, {"reached", first.reached}, {"held_s", first.elapsed_s}};
    if (!first.sent) {
        auto r = ActionResult::fail(ErrorKind::ExecutionError,
                                    "Failed to send " + *reset.combo);
        r.result = {{"action", "reset_car"}, {"combo", *reset.combo}, {"steps", steps}};
        return r;
    }
    if (!first.reached) {
        LOG_WARN("[Dispatcher] Reset: key held %.1fs without reaching the pits", first.elapsed_s);
        note = "reset key held to the cap without reaching the pits";
    }

    // Some simulators need a second press to leave the car once in the pits.
    auto mid = read();
    bool second_hold = false;
    if (mid && telemetry::in_car(*mid)) {
        second_hold = true;
        const auto second = executor_.hold_combo_until(
            *reset.combo,
            [](const telemetry::Snapshot& s) { return !telemetry::in_car(s); },
            config_.reset_max_hold_s);
        steps["exit_hold"] = {{"sent", second.sent}, {"reached", second.reached}, {"held_s", second.elapsed_s}};
        if (!second.reached) {
            LOG_WARN("[Dispatcher] Reset: still in car after second hold (%.1fs)", second.elapsed_s);
            if (!note.empty()) note += "; ";
            note += "still in car after second press";
        }
    }

    // Back to ready-to-drive for the next driver.
    if (ignition_cut) {
        steps["ignition_on"] = executor_.send_combo(*ignition.combo);
        if (starter.combo) {
            steps["starter"] = executor_.send_combo(*starter.combo, config_.starter_hold_s);
        }
    }

    const auto final_state = read();
    const bool moved = final_state &&
        (!telemetry::in_car(*final_state) || final_state->in_pit_stall);

    if (state_resync_) {
        clock_.sleep_for(config_.post_reset_settle_s);
        steps["state_pushed"] = state_resync_();
    }

    nlohmann::json detail = {{"action", "reset_car"},
                             {"combo", *reset.combo},
                             {"second_press", second_hold},
                             {"steps", steps}};

    if (!moved && !first.reached) {
        auto r = ActionResult::fail(ErrorKind::Timeout,
                                    "Reset key sent but the car never reached the pits or left the car");
        r.result = detail;
        return r;
    }

    std::string message = "Car reset - " + controls::format_key_message(reset.combo);
    if (!note.empty()) message += " (" + note + ")";
    return ActionResult::ok(message, detail);
}

// ============================================================================
// Timed reset
// ============================================================================

ActionResult ActionDispatcher::enable_timed_reset_locked(const nlohmann::json& params) {
    double interval = number_param(params, "interval_seconds", 0.0);
    if (interval <= 0.0) interval = number_param(params, "interval", 0.0);
    if (interval <= 0.0) interval = config_.default_timed_reset_interval_s;

    timed_reset_.start(interval);
    return ActionResult::ok("Timed reset enabled every " + std::to_string(static_cast<int>(interval)) + "s",
                            {{"interval_seconds", interval}});
}

ActionResult ActionDispatcher::disable_timed_reset_locked() {
    const bool was_active = timed_reset_.active();
    timed_reset_.stop();
    return ActionResult::ok(was_active ? "Timed reset disabled" : "Timed reset was not active",
                            {{"was_active", was_active}});
}

void ActionDispatcher::run_timed_reset(const std::atomic<bool>& stop) {
    std::unique_lock<std::timed_mutex> lock(dispatch_mu_, std::defer_lock);
    while (!lock.try_lock_for(std::chrono::milliseconds(100))) {
        if (stop) return;
    }
    if (stop) return;

    double grace = 0.0;
    if (auto snap = telemetry_.get_current()) {
        if (snap->lap_last_time_s > 0.0) {
            grace = config_.timed_reset_lap_factor * snap->lap_last_time_s;
        }
    }

    nlohmann::json params = {{"grace_period", grace}};
    const auto r = dispatch_locked("reset_car", params, "timed_reset", 0);
    LOG_INFO("[TimedReset] Reset %s: %s", r.success ? "done" : "failed", r.message.c_str());
}

// ============================================================================
// Remote desktop
// ============================================================================

ActionResult ActionDispatcher::remote_desktop_locked(const std::string& action, const nlohmann::json& params) {
    if (!remote_desktop_) {
        return ActionResult::fail(ErrorKind::Unavailable, "Remote desktop not available");
    }
    if (parse_action_kind(action) == ActionKind::WebrtcOffer) {
        if (!params.contains("offer")) {
            return ActionResult::fail(ErrorKind::InvalidCommand, "Missing offer SDP");
        }
        return remote_desktop_->handle_offer(params);
    }
    if (string_param(params, "input_type").empty()) {
        return ActionResult::fail(ErrorKind::InvalidCommand, "Missing input_type");
    }
    return remote_desktop_->handle_input(params);
}

} // namespace commands
