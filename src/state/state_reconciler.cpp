// src/state/state_reconciler.cpp
#include "state/state_reconciler.hpp"
#include "utils/logging.hpp"

namespace state {

StateReconciler::StateReconciler(StatePublisher& publisher, utils::Clock& clock, Config config)
    : publisher_(publisher)
    , clock_(clock)
    , config_(config)
    , failure_log_(config.error_log_window_s)
{
}

PushReason StateReconciler::on_tick(const std::optional<telemetry::Snapshot>& snap) {
    const DeviceState derived = DeviceState::derive(snap, config_.rpm_threshold);
    const double now = clock_.now();

    std::lock_guard<std::mutex> lock(mu_);

    PushReason reason = PushReason::None;
    if (!reported_) {
        reason = PushReason::Initial;
    } else if (derived != *reported_) {
        reason = PushReason::Changed;
    } else if (now - last_success_s_ >= config_.resync_interval_s) {
        reason = PushReason::Resync;
    }

    if (reason == PushReason::None) return PushReason::None;
    if (last_attempt_s_ >= 0.0 && (now - last_attempt_s_) < config_.min_push_interval_s) {
        return PushReason::None;
    }

    return push_locked(derived, reason) ? reason : PushReason::None;
}

bool StateReconciler::push_locked(const DeviceState& derived, PushReason reason) {
    const double now = clock_.now();
    last_attempt_s_ = now;

    if (!publisher_.push_state(derived, reason)) {
        if (failure_log_.should_log(now)) {
            LOG_WARN("[State] State push (%s) failed; will retry", to_string(reason));
        }
        return false;
    }

    switch (reason) {
        case PushReason::Changed:
            LOG_INFO("[State] Changed: %s", derived.describe_changes(*reported_).c_str());
            break;
        case PushReason::Resync:
            LOG_DEBUG("[State] Periodic resync");
            break;
        default:
            LOG_INFO("[State] Pushed (%s): in_car=%d in_pit=%d engine=%d lap=%d",
                     to_string(reason), derived.in_car, derived.in_pit, derived.engine_running,
                     derived.current_lap);
            break;
    }

    reported_ = derived;
    last_success_s_ = now;
    ++pushes_;
    return true;
}

bool StateReconciler::force_push(const std::optional<telemetry::Snapshot>& snap) {
    const DeviceState derived = DeviceState::derive(snap, config_.rpm_threshold);
    std::lock_guard<std::mutex> lock(mu_);
    return push_locked(derived, PushReason::Forced);
}

bool StateReconciler::force_push_verified(const SnapshotReader& read, int attempts, double settle_s) {
    for (int i = 1; i <= attempts; ++i) {
        const DeviceState pushed = DeviceState::derive(read(), config_.rpm_threshold);
        bool ok = false;
        {
            std::lock_guard<std::mutex> lock(mu_);
            ok = push_locked(pushed, PushReason::Forced);
        }

        clock_.sleep_for(settle_s);
        const DeviceState check = DeviceState::derive(read(), config_.rpm_threshold);
        if (ok && check == pushed) {
            return true;
        }
        LOG_DEBUG("[State] Forced push attempt %d/%d not confirmed (%s)", i, attempts,
                  ok ? "state still changing" : "push failed");
    }
    LOG_WARN("[State] Forced push not confirmed after %d attempts", attempts);
    return false;
}

std::optional<DeviceState> StateReconciler::reported() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reported_;
}

size_t StateReconciler::push_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
}

} // namespace state
