// src/telemetry/snapshot.hpp
#pragma once

#include <string>

namespace telemetry {

// Point-in-time read of the simulator. Never mutated after it is produced.
// Units are embedded in field names.
struct Snapshot {
    bool connected = false;

    // --- Raw SDK flags
    bool is_on_track_car = false;   // stays true while parked in a menu
    bool is_on_track = false;
    bool on_pit_road = false;
    bool in_garage = false;
    bool in_pit_stall = false;

    // --- Motion
    double speed_kph = 0.0;
    double rpm = 0.0;

    // --- Lap / session
    int lap = 0;
    double lap_last_time_s = 0.0;     // <= 0 when no lap has been completed
    double lap_current_time_s = 0.0;
    long long session_unique_id = 0;
    double session_time_s = 0.0;

    std::string track_name;
    std::string car_name;
    std::string driver_name;

    double timestamp_s = 0.0;         // monotonic read time
};

constexpr double kEngineRunningRpm = 500.0;
constexpr double kStoppedSpeedKph = 1.5;

// on_track_car alone is unreliable: it remains set in the garage menu.
inline bool in_car(const Snapshot& s) { return s.is_on_track_car && s.is_on_track; }

inline bool in_pit(const Snapshot& s) { return s.on_pit_road || s.in_garage; }

inline bool engine_running(const Snapshot& s, double rpm_threshold = kEngineRunningRpm) {
    return s.rpm > rpm_threshold;
}

inline bool is_stopped(const Snapshot& s, double threshold_kph = kStoppedSpeedKph) {
    return s.speed_kph <= threshold_kph;
}

} // namespace telemetry
