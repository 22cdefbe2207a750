// src/state/state_publisher.hpp
#pragma once

#include "state/device_state.hpp"
#include "state/timed_session_state.hpp"
#include "utils/clock.hpp"
#include "utils/http_client.hpp"
#include <optional>
#include <string>

namespace state {

/**
 * StatePublisher - writes rig state to the backend device record.
 * Every call reports failure by return value; nothing here throws.
 */
class StatePublisher {
public:
    virtual ~StatePublisher() = default;

    virtual bool push_state(const DeviceState& s, PushReason reason) = 0;

    // nullopt clears the stored session
    virtual bool push_timed_session(const std::optional<TimedSessionState>& s) = 0;
    virtual std::optional<TimedSessionState> fetch_timed_session() = 0;
};

/**
 * RestStatePublisher
 *   PUT /api/device/{device}/status  {status, in_car, in_pit, engine_running,
 *                                     current_track, current_car, current_lap}
 *   PUT /api/device/{device}/status  {timed_session_state}
 *   GET /api/device/{device}/status  -> {timed_session_state, ...}
 */
class RestStatePublisher : public StatePublisher {
public:
    RestStatePublisher(utils::HttpSession& http, std::string device_id);

    bool push_state(const DeviceState& s, PushReason reason) override;
    bool push_timed_session(const std::optional<TimedSessionState>& s) override;
    std::optional<TimedSessionState> fetch_timed_session() override;

private:
    utils::HttpSession& http_;
    std::string device_id_;

    std::string status_path() const;
    bool put(const nlohmann::json& body);
};

// Same semantics against the device table through the REST table gateway.
class TableStatePublisher : public StatePublisher {
public:
    TableStatePublisher(utils::HttpSession& http, utils::Clock& clock,
                        std::string device_id, std::string table = "irc_devices");

    bool push_state(const DeviceState& s, PushReason reason) override;
    bool push_timed_session(const std::optional<TimedSessionState>& s) override;
    std::optional<TimedSessionState> fetch_timed_session() override;

private:
    utils::HttpSession& http_;
    utils::Clock& clock_;
    std::string device_id_;
    std::string table_;

    bool patch(const nlohmann::json& body);
};

} // namespace state
