// src/commands/action_result.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace commands {

enum class ErrorKind {
    None,
    NoBinding,              // action has no key combo configured
    WindowFocusFailed,      // simulator window could not be focused
    Timeout,                // a hold/wait cap was reached
    PreconditionNotMet,     // e.g. starter while the engine already runs
    SimulatorNotConnected,
    StaleCommand,           // queued too long before the simulator connected
    UnknownAction,
    InvalidCommand,
    Unavailable,            // optional collaborator not present
    TransportUnavailable,
    BackendWriteFailed,
    ExecutionError          // unexpected exception during dispatch
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                  return "none";
        case ErrorKind::NoBinding:             return "no_binding";
        case ErrorKind::WindowFocusFailed:     return "window_focus_failed";
        case ErrorKind::Timeout:               return "timeout";
        case ErrorKind::PreconditionNotMet:    return "precondition_not_met";
        case ErrorKind::SimulatorNotConnected: return "simulator_not_connected";
        case ErrorKind::StaleCommand:          return "stale_command";
        case ErrorKind::UnknownAction:         return "unknown_action";
        case ErrorKind::InvalidCommand:        return "invalid_command";
        case ErrorKind::Unavailable:           return "unavailable";
        case ErrorKind::TransportUnavailable:  return "transport_unavailable";
        case ErrorKind::BackendWriteFailed:    return "backend_write_failed";
        case ErrorKind::ExecutionError:        return "execution_error";
    }
    return "none";
}

// Outcome of one dispatch. result carries action-specific detail.
struct ActionResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string message;
    nlohmann::json result = nlohmann::json::object();

    static ActionResult ok(std::string msg, nlohmann::json detail = nlohmann::json::object()) {
        ActionResult r;
        r.success = true;
        r.message = std::move(msg);
        r.result = std::move(detail);
        return r;
    }

    static ActionResult fail(ErrorKind kind, std::string msg) {
        ActionResult r;
        r.success = false;
        r.error = kind;
        r.message = std::move(msg);
        return r;
    }

    // Body reported to the backend with the terminal status.
    nlohmann::json to_json() const {
        nlohmann::json j = result.is_object() ? result : nlohmann::json::object();
        j["success"] = success;
        j["message"] = message;
        if (error != ErrorKind::None) j["error"] = to_string(error);
        return j;
    }
};

} // namespace commands
