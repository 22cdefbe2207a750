// src/commands/command.cpp
#include "commands/command.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace commands {

namespace {

struct ActionName {
    const char* name;
    ActionKind kind;
};

const ActionName kActionNames[] = {
    {"reset_car", ActionKind::ResetCar},
    {"enter_car", ActionKind::EnterCar},
    {"ignition", ActionKind::Ignition},
    {"starter", ActionKind::Starter},
    {"pit_speed_limiter", ActionKind::PitSpeedLimiter},
    {"request_pit", ActionKind::RequestPit},
    {"quick_repair", ActionKind::QuickRepair},
    {"clear_flags", ActionKind::ClearFlags},
    {"webrtc_offer", ActionKind::WebrtcOffer},
    {"remote_desktop_input", ActionKind::RemoteDesktopInput},
    {"enable_timed_reset", ActionKind::EnableTimedReset},
    {"disable_timed_reset", ActionKind::DisableTimedReset},
    {"execute_action", ActionKind::ExecuteAction},
};

// First string-valued field among the given names.
std::string string_field(const nlohmann::json& j, const char* a, const char* b) {
    for (const char* key : {a, b}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) return it->get<std::string>();
    }
    return "";
}

} // namespace

const char* to_string(CommandStatus s) {
    switch (s) {
        case CommandStatus::Pending:    return "pending";
        case CommandStatus::Processing: return "processing";
        case CommandStatus::Completed:  return "completed";
        case CommandStatus::Failed:     return "failed";
        case CommandStatus::Ignored:    return "ignored";
    }
    return "pending";
}

std::optional<CommandStatus> parse_status(const std::string& s) {
    if (s == "pending")    return CommandStatus::Pending;
    if (s == "processing") return CommandStatus::Processing;
    if (s == "completed")  return CommandStatus::Completed;
    if (s == "failed")     return CommandStatus::Failed;
    if (s == "ignored")    return CommandStatus::Ignored;
    return std::nullopt;
}

const char* to_string(ActionKind k) {
    for (const auto& a : kActionNames) {
        if (a.kind == k) return a.name;
    }
    return "unknown";
}

ActionKind parse_action_kind(const std::string& action) {
    for (const auto& a : kActionNames) {
        if (action == a.name) return a.kind;
    }
    return ActionKind::Unknown;
}

std::optional<Command> Command::from_json(const nlohmann::json& j, std::string* error) {
    auto fail = [&](const char* why) -> std::optional<Command> {
        if (error) *error = why;
        return std::nullopt;
    };

    if (!j.is_object()) return fail("command is not an object");

    Command cmd;
    auto id = j.find("id");
    if (id == j.end()) return fail("command has no id");
    if (id->is_string()) {
        cmd.id = id->get<std::string>();
    } else if (id->is_number_integer()) {
        cmd.id = std::to_string(id->get<long long>());
    }
    if (cmd.id.empty()) return fail("command id is empty");

    cmd.action = string_field(j, "command_action", "action");
    cmd.kind = parse_action_kind(cmd.action);
    cmd.type = string_field(j, "command_type", "type");

    for (const char* key : {"command_params", "params"}) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (it->is_object()) {
            cmd.params = *it;
        } else if (it->is_string()) {
            // Some table gateways return jsonb columns as text.
            auto parsed = nlohmann::json::parse(it->get<std::string>(), nullptr, false);
            if (parsed.is_object()) cmd.params = parsed;
        }
        break;
    }

    const std::string created = string_field(j, "created_at", "createdAt");
    if (!created.empty()) cmd.created_at = parse_iso8601(created);

    const std::string status = string_field(j, "status", "command_status");
    if (!status.empty()) {
        auto parsed = parse_status(status);
        if (!parsed) return fail("command has unknown status");
        cmd.status = *parsed;
    }

    return cmd;
}

nlohmann::json Command::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["command_action"] = action;
    j["command_type"] = type;
    j["command_params"] = params;
    j["status"] = to_string(status);
    if (created_at) j["created_at"] = format_iso8601(*created_at);
    return j;
}

std::optional<WallTime> parse_iso8601(const std::string& text) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*1[T ]%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 6; ++digits) micros *= 10;
    }

    long offset_s = 0;
    if (pos < text.size()) {
        const char c = text[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) < 1 &&
                std::sscanf(text.c_str() + pos + 1, "%2d%2d", &oh, &om) < 1) {
                return std::nullopt;
            }
            offset_s = (oh * 3600L + om * 60L) * (c == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const std::time_t utc = timegm(&tm) - offset_s;

    return std::chrono::system_clock::from_time_t(utc) + std::chrono::microseconds(micros);
}

std::string format_iso8601(WallTime t) {
    using namespace std::chrono;
    const std::time_t tt = system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    const long long ms =
        duration_cast<milliseconds>(t.time_since_epoch()).count() % 1000;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms < 0 ? 0 : ms);
    return buf;
}

} // namespace commands
