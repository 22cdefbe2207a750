// src/controls/combo_executor.hpp
#pragma once

#include "controls/action_executor.hpp"
#include "controls/key_combo.hpp"
#include "telemetry/telemetry_source.hpp"
#include "utils/clock.hpp"

namespace controls {

/**
 * ComboExecutor - ActionExecutor built on a KeyInjector.
 *
 * Modifiers go down in order with a short gap, then the main key; release is
 * the reverse. Every pressed key is released on every exit path, including
 * an exception thrown by the hold predicate.
 */
class ComboExecutor : public ActionExecutor {
public:
    struct Config {
        double modifier_gap_s = 0.01;
        double tap_hold_s = 0.05;         // hold used when send_combo gets 0
        double check_interval_s = 0.1;    // predicate poll period while holding
        double focus_settle_s = 0.15;
    };

    ComboExecutor(KeyInjector& injector,
                  const telemetry::TelemetrySource& telemetry,
                  utils::Clock& clock,
                  Config config);

    bool focus_target_window() override;
    bool send_combo(const std::string& combo, double hold_s = 0.0) override;
    HoldResult hold_combo_until(const std::string& combo,
                                const SnapshotPredicate& pred,
                                double max_s) override;

private:
    class PressedKeys;

    KeyInjector& injector_;
    const telemetry::TelemetrySource& telemetry_;
    utils::Clock& clock_;
    Config config_;

    bool press_all(const KeyCombo& combo, PressedKeys& pressed);
};

} // namespace controls
