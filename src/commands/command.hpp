// src/commands/command.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace commands {

enum class CommandStatus {
    Pending,
    Processing,
    Completed,
    Failed,
    Ignored
};

enum class ActionKind {
    ResetCar,
    EnterCar,
    Ignition,
    Starter,
    PitSpeedLimiter,
    RequestPit,
    QuickRepair,
    ClearFlags,
    WebrtcOffer,
    RemoteDesktopInput,
    EnableTimedReset,
    DisableTimedReset,
    ExecuteAction,
    Unknown
};

const char* to_string(CommandStatus s);
std::optional<CommandStatus> parse_status(const std::string& s);

const char* to_string(ActionKind k);
ActionKind parse_action_kind(const std::string& action);

using WallTime = std::chrono::system_clock::time_point;

/**
 * Command - one remote instruction addressed to this device.
 *
 * Backends disagree on field names; from_json() accepts both
 *   {id, command_action, command_type, command_params, created_at, status}
 * and the short {id, action, type, params, ...} form.
 */
struct Command {
    std::string id;
    std::string action;                 // raw action name as delivered
    ActionKind kind = ActionKind::Unknown;
    std::string type;                   // "driver", "owner", ... (attribution only)
    nlohmann::json params = nlohmann::json::object();
    std::optional<WallTime> created_at;
    CommandStatus status = CommandStatus::Pending;

    /**
     * Build from a backend row.
     * @return nullopt when the payload is not an object or has no usable id
     *         (nothing can be reported back for it). A missing action is kept
     *         so the queue can report the command as invalid.
     */
    static std::optional<Command> from_json(const nlohmann::json& j, std::string* error = nullptr);

    nlohmann::json to_json() const;
};

// "2024-05-01T12:30:00Z", "2024-05-01 12:30:00.123456+02:00", no zone = UTC
std::optional<WallTime> parse_iso8601(const std::string& text);
std::string format_iso8601(WallTime t);

} // namespace commands
