// src/state/state_publisher.cpp
#include "state/state_publisher.hpp"
#include "commands/command.hpp"
#include "utils/logging.hpp"

namespace state {

namespace {

std::string describe_failure(const utils::HttpResponse& resp) {
    return resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error;
}

nlohmann::json session_json(const std::optional<TimedSessionState>& s) {
    return s ? s->to_json() : nlohmann::json(nullptr);
}

} // namespace

// ============================================================================
// REST
// ============================================================================

RestStatePublisher::RestStatePublisher(utils::HttpSession& http, std::string device_id)
    : http_(http)
    , device_id_(std::move(device_id))
{
}

std::string RestStatePublisher::status_path() const {
    return "/api/device/" + utils::url_encode(device_id_) + "/status";
}

bool RestStatePublisher::put(const nlohmann::json& body) {
    const auto resp = http_.request("PUT", status_path(), body.dump());
    if (!resp.ok()) {
        LOG_DEBUG("[REST] Status push failed: %s", describe_failure(resp).c_str());
        return false;
    }
    return true;
}

bool RestStatePublisher::push_state(const DeviceState& s, PushReason reason) {
    nlohmann::json body = {
        {"status", s.in_car ? "online" : "idle"},
        {"in_car", s.in_car},
        {"in_pit", s.in_pit},
        {"engine_running", s.engine_running},
        {"current_track", s.track_name},
        {"current_car", s.car_name},
        {"current_lap", s.current_lap},
        {"reason", to_string(reason)},
    };
    return put(body);
}

bool RestStatePublisher::push_timed_session(const std::optional<TimedSessionState>& s) {
    return put({{"timed_session_state", session_json(s)}});
}

std::optional<TimedSessionState> RestStatePublisher::fetch_timed_session() {
    const auto resp = http_.request("GET", status_path());
    if (!resp.ok()) {
        LOG_WARN("[REST] Could not read device status: %s", describe_failure(resp).c_str());
        return std::nullopt;
    }
    auto body = nlohmann::json::parse(resp.body, nullptr, false);
    if (!body.is_object()) return std::nullopt;

    const nlohmann::json& record = (body.contains("data") && body["data"].is_object()) ? body["data"] : body;
    if (!record.contains("timed_session_state")) return std::nullopt;
    return TimedSessionState::from_json(record["timed_session_state"]);
}

// ============================================================================
// Table gateway
// ============================================================================

TableStatePublisher::TableStatePublisher(utils::HttpSession& http, utils::Clock& clock,
                                         std::string device_id, std::string table)
    : http_(http)
    , clock_(clock)
    , device_id_(std::move(device_id))
    , table_(std::move(table))
{
}

bool TableStatePublisher::patch(const nlohmann::json& body) {
    const std::string path = "/rest/v1/" + table_ + "?device_id=eq." + utils::url_encode(device_id_);
    const auto resp = http_.request("PATCH", path, body.dump());
    if (!resp.ok()) {
        LOG_DEBUG("[Table] Device update failed: %s", describe_failure(resp).c_str());
        return false;
    }
    return true;
}

bool TableStatePublisher::push_state(const DeviceState& s, PushReason /*reason*/) {
    nlohmann::json body = {
        {"in_car", s.in_car},
        {"in_pit", s.in_pit},
        {"engine_running", s.engine_running},
        {"track_name", s.track_name},
        {"car_name", s.car_name},
        {"current_lap", s.current_lap},
        {"last_seen", commands::format_iso8601(clock_.wall_now())},
    };
    return patch(body);
}

bool TableStatePublisher::push_timed_session(const std::optional<TimedSessionState>& s) {
    return patch({{"timed_session_state", session_json(s)}});
}

std::optional<TimedSessionState> TableStatePublisher::fetch_timed_session() {
    const std::string path = "/rest/v1/" + table_ + "?select=timed_session_state&device_id=eq." +
                             utils::url_encode(device_id_);
    const auto resp = http_.request("GET", path);
    if (!resp.ok()) {
        LOG_WARN("[Table] Could not read device record: %s", describe_failure(resp).c_str());
        return std::nullopt;
    }
    auto rows = nlohmann::json::parse(resp.body, nullptr, false);
    if (!rows.is_array() || rows.empty() || !rows[0].is_object()) return std::nullopt;
    if (!rows[0].contains("timed_session_state")) return std::nullopt;
    return TimedSessionState::from_json(rows[0]["timed_session_state"]);
}

} // namespace state
