// src/state/timed_session_state.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace state {

/**
 * TimedSessionState - a timed rental in progress.
 *
 * Persisted on the device record as
 *   {active, waitingForMovement, startTime (epoch ms), duration (s), driverUserId, expired}
 * so it survives a restart of the service.
 */
struct TimedSessionState {
    bool active = false;
    bool waiting_for_movement = false;
    long long start_time_ms = 0;
    double duration_seconds = 0.0;
    std::string driver_user_id;
    bool expired = false;

    bool armed() const { return active || waiting_for_movement || expired; }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["active"] = active;
        j["waitingForMovement"] = waiting_for_movement;
        j["startTime"] = start_time_ms > 0 ? nlohmann::json(start_time_ms) : nlohmann::json(nullptr);
        j["duration"] = duration_seconds;
        j["driverUserId"] = driver_user_id;
        j["expired"] = expired;
        return j;
    }

    // Accepts camelCase and snake_case keys; null or non-object means no session.
    static std::optional<TimedSessionState> from_json(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;

        auto pick = [&](const char* a, const char* b) -> const nlohmann::json* {
            if (j.contains(a) && !j[a].is_null()) return &j[a];
            if (j.contains(b) && !j[b].is_null()) return &j[b];
            return nullptr;
        };

        TimedSessionState s;
        if (auto v = pick("active", "active"); v && v->is_boolean()) s.active = v->get<bool>();
        if (auto v = pick("waitingForMovement", "waiting_for_movement"); v && v->is_boolean())
            s.waiting_for_movement = v->get<bool>();
        if (auto v = pick("startTime", "start_time"); v && v->is_number())
            s.start_time_ms = v->get<long long>();
        if (auto v = pick("duration", "duration_seconds"); v && v->is_number())
            s.duration_seconds = v->get<double>();
        if (auto v = pick("driverUserId", "driver_user_id"); v && v->is_string())
            s.driver_user_id = v->get<std::string>();
        if (auto v = pick("expired", "expired"); v && v->is_boolean()) s.expired = v->get<bool>();

        if (!s.armed() || s.duration_seconds <= 0.0) return std::nullopt;
        return s;
    }
};

} // namespace state
