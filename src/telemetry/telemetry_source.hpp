// src/telemetry/telemetry_source.hpp
#pragma once

#include "telemetry/snapshot.hpp"
#include <optional>

namespace telemetry {

/**
 * TelemetrySource - polled view of the simulator SDK.
 *
 * Implementations must be safe to call from several threads at once: the
 * telemetry loop and the dispatcher's wait points read concurrently.
 */
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    /**
     * True while the simulator is running and its data is live
     */
    virtual bool is_connected() const = 0;

    /**
     * Latest snapshot, or nullopt when not connected
     */
    virtual std::optional<Snapshot> get_current() const = 0;
};

} // namespace telemetry
