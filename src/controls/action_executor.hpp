// src/controls/action_executor.hpp
#pragma once

#include "telemetry/snapshot.hpp"
#include <functional>
#include <string>

namespace controls {

using SnapshotPredicate = std::function<bool(const telemetry::Snapshot&)>;

struct HoldResult {
    bool sent = false;       // combo was pressed and released
    bool reached = false;    // predicate became true before the cap
    double elapsed_s = 0.0;  // time the combo was held
};

/**
 * ActionExecutor - sends key combos to the simulator window.
 *
 * Only one sequence may be in flight at a time; callers serialize (the
 * dispatcher holds its dispatch lock around every use).
 */
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;

    virtual bool focus_target_window() = 0;

    // Press, hold for hold_s (a short tap when 0), release.
    virtual bool send_combo(const std::string& combo, double hold_s = 0.0) = 0;

    // Press and hold until pred(snapshot) is true or max_s elapses, then release.
    virtual HoldResult hold_combo_until(const std::string& combo,
                                        const SnapshotPredicate& pred,
                                        double max_s) = 0;
};

/**
 * KeyInjector - raw input primitives of the host platform.
 * Key names are the KeyCombo tokens ("CTRL", "R", "F3", "Button4").
 */
class KeyInjector {
public:
    virtual ~KeyInjector() = default;

    virtual bool focus_window() = 0;
    virtual bool press(const std::string& key) = 0;
    virtual bool release(const std::string& key) = 0;
};

} // namespace controls
