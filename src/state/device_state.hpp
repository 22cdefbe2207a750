// src/state/device_state.hpp
#pragma once

#include "telemetry/snapshot.hpp"
#include <optional>
#include <string>

namespace state {

// What the backend is told about the rig. Derived from telemetry each tick.
struct DeviceState {
    bool in_car = false;
    bool in_pit = false;
    bool engine_running = false;
    std::string track_name;
    std::string car_name;
    int current_lap = 0;

    bool operator==(const DeviceState& o) const {
        return in_car == o.in_car && in_pit == o.in_pit && engine_running == o.engine_running &&
               track_name == o.track_name && car_name == o.car_name && current_lap == o.current_lap;
    }
    bool operator!=(const DeviceState& o) const { return !(*this == o); }

    // Disconnected simulator derives to the default (idle, nothing loaded).
    static DeviceState derive(const std::optional<telemetry::Snapshot>& snap,
                              double rpm_threshold = telemetry::kEngineRunningRpm)
    {
        DeviceState s;
        if (!snap) return s;
        s.in_car = telemetry::in_car(*snap);
        s.in_pit = telemetry::in_pit(*snap);
        s.engine_running = telemetry::engine_running(*snap, rpm_threshold);
        s.track_name = snap->track_name;
        s.car_name = snap->car_name;
        s.current_lap = snap->lap;
        return s;
    }

    // Comma-separated "field old->new" list of differences from prev.
    std::string describe_changes(const DeviceState& prev) const {
        std::string out;
        auto add = [&](const std::string& item) {
            if (!out.empty()) out += ", ";
            out += item;
        };
        auto b = [](bool v) { return v ? "true" : "false"; };
        if (in_car != prev.in_car) add(std::string("in_car ") + b(prev.in_car) + "->" + b(in_car));
        if (in_pit != prev.in_pit) add(std::string("in_pit ") + b(prev.in_pit) + "->" + b(in_pit));
        if (engine_running != prev.engine_running)
            add(std::string("engine ") + b(prev.engine_running) + "->" + b(engine_running));
        if (track_name != prev.track_name) add("track '" + track_name + "'");
        if (car_name != prev.car_name) add("car '" + car_name + "'");
        if (current_lap != prev.current_lap)
            add("lap " + std::to_string(prev.current_lap) + "->" + std::to_string(current_lap));
        return out;
    }
};

enum class PushReason {
    None,
    Initial,    // first push since startup
    Changed,    // derived state differs from what was reported
    Resync,     // nothing changed but the resync interval elapsed
    Forced      // explicit request, throttle bypassed
};

inline const char* to_string(PushReason r) {
    switch (r) {
        case PushReason::None:    return "none";
        case PushReason::Initial: return "initial";
        case PushReason::Changed: return "changed";
        case PushReason::Resync:  return "resync";
        case PushReason::Forced:  return "forced";
    }
    return "none";
}

} // namespace state
