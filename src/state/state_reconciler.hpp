// src/state/state_reconciler.hpp
#pragma once

#include "state/device_state.hpp"
#include "state/state_publisher.hpp"
#include "telemetry/snapshot.hpp"
#include "utils/clock.hpp"
#include "utils/log_throttle.hpp"
#include <functional>
#include <mutex>
#include <optional>

namespace state {

/**
 * StateReconciler - keeps the backend's view of the rig current.
 *
 * Called on every telemetry tick. Pushes on the first tick, when the derived
 * state differs from the last successful push, or when resync_interval_s has
 * passed since that push. Pushes are spaced at least min_push_interval_s
 * apart (measured from the last attempt); changes inside that window are
 * coalesced into the next push. A failed push leaves the reported state as
 * it was, so the next eligible tick retries.
 */
class StateReconciler {
public:
    struct Config {
        double min_push_interval_s = 1.0;
        double resync_interval_s = 30.0;
        double rpm_threshold = telemetry::kEngineRunningRpm;
        double error_log_window_s = 30.0;
    };

    using SnapshotReader = std::function<std::optional<telemetry::Snapshot>()>;

    StateReconciler(StatePublisher& publisher, utils::Clock& clock, Config config);

    // Returns why a push happened, or None when nothing was pushed.
    PushReason on_tick(const std::optional<telemetry::Snapshot>& snap);

    // Push now regardless of throttle. Returns the publisher's result.
    bool force_push(const std::optional<telemetry::Snapshot>& snap);

    /**
     * Forced push confirmed by a second read: push, wait settle_s, read again
     * and compare. Retries up to attempts times while the push fails or the
     * state is still moving.
     */
    bool force_push_verified(const SnapshotReader& read, int attempts = 3, double settle_s = 0.5);

    std::optional<DeviceState> reported() const;
    size_t push_count() const;

private:
    StatePublisher& publisher_;
    utils::Clock& clock_;
    Config config_;
    utils::LogThrottle failure_log_;

    mutable std::mutex mu_;
    std::optional<DeviceState> reported_;
    double last_attempt_s_ = -1.0;
    double last_success_s_ = -1.0;
    size_t pushes_ = 0;

    bool push_locked(const DeviceState& derived, PushReason reason);
};

} // namespace state
