// src/state/timed_session.hpp
#pragma once

#include "state/state_publisher.hpp"
#include "state/timed_session_state.hpp"
#include "telemetry/snapshot.hpp"
#include "utils/clock.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace state {

/**
 * TimedSessionTracker - auto-expiring rental layered on enter_car/reset_car.
 *
 *   armed, car not moving    -> waiting_for_movement
 *   speed > movement_speed   -> active, timer starts (wall clock)
 *   elapsed >= duration      -> expired, lap at expiry remembered
 *   expired and (lap advanced or car stopped) -> cleared, then reset_fn()
 *
 * Each transition is written through the publisher so a restarted service
 * can restore() the session.
 */
class TimedSessionTracker {
public:
    struct Config {
        double movement_speed_kph = 5.0;
        double stop_speed_kph = telemetry::kStoppedSpeedKph;
    };

    using ResetFn = std::function<void()>;

    TimedSessionTracker(StatePublisher& publisher, utils::Clock& clock, Config config);

    void set_reset_fn(ResetFn fn) { reset_fn_ = std::move(fn); }

    // Starts a new session waiting for the car to move. Replaces any current one.
    void arm(double duration_s, const std::string& driver_user_id);

    // Adopt a session read back from the backend (no write).
    void restore(const std::optional<TimedSessionState>& s);

    void tick(const std::optional<telemetry::Snapshot>& snap);

    void clear();

    std::optional<TimedSessionState> state() const;

private:
    StatePublisher& publisher_;
    utils::Clock& clock_;
    Config config_;
    ResetFn reset_fn_;

    mutable std::mutex mu_;
    std::optional<TimedSessionState> state_;
    std::optional<int> expired_lap_;

    long long wall_ms() const;
    void persist_locked();
};

} // namespace state
