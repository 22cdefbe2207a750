// src/state/timed_session.cpp
#include "state/timed_session.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace state {

TimedSessionTracker::TimedSessionTracker(StatePublisher& publisher, utils::Clock& clock, Config config)
    : publisher_(publisher)
    , clock_(clock)
    , config_(config)
{
}

long long TimedSessionTracker::wall_ms() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(clock_.wall_now().time_since_epoch()).count();
}

void TimedSessionTracker::persist_locked() {
    if (!publisher_.push_timed_session(state_)) {
        LOG_WARN("[TimedSession] Could not persist session state");
    }
}

void TimedSessionTracker::arm(double duration_s, const std::string& driver_user_id) {
    if (duration_s <= 0.0) {
        LOG_WARN("[TimedSession] Ignoring arm with duration %.1f s", duration_s);
        return;
    }

    std::lock_guard<std::mutex> lock(mu_);
    TimedSessionState s;
    s.waiting_for_movement = true;
    s.duration_seconds = duration_s;
    s.driver_user_id = driver_user_id;
    state_ = s;
    expired_lap_.reset();

    LOG_INFO("[TimedSession] Armed: %.0f s for driver '%s', waiting for movement",
             duration_s, driver_user_id.c_str());
    persist_locked();
}

void TimedSessionTracker::restore(const std::optional<TimedSessionState>& s) {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = s;
    expired_lap_.reset();
    if (state_) {
        LOG_INFO("[TimedSession] Restored session (%s, %.0f s)",
                 state_->expired ? "expired" : state_->active ? "active" : "waiting",
                 state_->duration_seconds);
    }
}

void TimedSessionTracker::tick(const std::optional<telemetry::Snapshot>& snap) {
    if (!snap) return;

    bool fire_reset = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!state_) return;
        TimedSessionState& s = *state_;

        if (s.waiting_for_movement && !s.active && snap->speed_kph > config_.movement_speed_kph) {
            s.active = true;
            s.waiting_for_movement = false;
            s.start_time_ms = wall_ms();
            LOG_INFO("[TimedSession] Car moving, timer started");
            persist_locked();
        }

        if (s.active && !s.expired && s.start_time_ms > 0) {
            const double elapsed_s = (wall_ms() - s.start_time_ms) / 1000.0;
            if (elapsed_s >= s.duration_seconds) {
                s.expired = true;
                expired_lap_ = snap->lap;
                LOG_INFO("[TimedSession] Time up after %.0f s, waiting for lap end or stop", elapsed_s);
                persist_locked();
                return;
            }
        }

        if (s.expired) {
            if (!expired_lap_) expired_lap_ = snap->lap;   // restored as expired
            const bool lap_done = snap->lap > *expired_lap_;
            const bool stopped = telemetry::is_stopped(*snap, config_.stop_speed_kph);
            if (lap_done || stopped) {
                LOG_INFO("[TimedSession] Ending session (%s)", lap_done ? "lap completed" : "car stopped");
                state_.reset();
                expired_lap_.reset();
                persist_locked();
                fire_reset = true;
            }
        }
    }

    // Cleared before the reset: a session armed while it runs must survive.
    // The reset goes through the dispatcher; never hold mu_ across it.
    if (fire_reset && reset_fn_) {
        reset_fn_();
    }
}

void TimedSessionTracker::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!state_) return;
    state_.reset();
    expired_lap_.reset();
    LOG_INFO("[TimedSession] Cleared");
    persist_locked();
}

std::optional<TimedSessionState> TimedSessionTracker::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

} // namespace state
