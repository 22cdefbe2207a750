// src/controls/combo_executor.cpp
#include "controls/combo_executor.hpp"
#include "utils/logging.hpp"
#include "utils/wait.hpp"
#include <vector>

namespace controls {

// Releases whatever was pressed, last key first.
class ComboExecutor::PressedKeys {
public:
    explicit PressedKeys(KeyInjector& injector) : injector_(injector) {}
    ~PressedKeys() { release_all(); }

    PressedKeys(const PressedKeys&) = delete;
    PressedKeys& operator=(const PressedKeys&) = delete;

    void add(const std::string& key) { keys_.push_back(key); }

    bool release_all() {
        bool ok = true;
        while (!keys_.empty()) {
            if (!injector_.release(keys_.back())) {
                LOG_WARN("[Keys] Failed to release %s", keys_.back().c_str());
                ok = false;
            }
            keys_.pop_back();
        }
        return ok;
    }

private:
    KeyInjector& injector_;
    std::vector<std::string> keys_;
};

ComboExecutor::ComboExecutor(KeyInjector& injector,
                             const telemetry::TelemetrySource& telemetry,
                             utils::Clock& clock,
                             Config config)
    : injector_(injector)
    , telemetry_(telemetry)
    , clock_(clock)
    , config_(config)
{
}

bool ComboExecutor::focus_target_window() {
    if (!injector_.focus_window()) {
        LOG_WARN("[Keys] Could not focus simulator window");
        return false;
    }
    clock_.sleep_for(config_.focus_settle_s);
    return true;
}

bool ComboExecutor::press_all(const KeyCombo& combo, PressedKeys& pressed) {
    for (const auto& mod : combo.modifiers) {
        if (!injector_.press(mod)) {
            LOG_WARN("[Keys] Failed to press modifier %s", mod.c_str());
            return false;
        }
        pressed.add(mod);
        clock_.sleep_for(config_.modifier_gap_s);
    }
    if (!injector_.press(combo.key)) {
        LOG_WARN("[Keys] Failed to press %s", combo.key.c_str());
        return false;
    }
    pressed.add(combo.key);
    return true;
}

bool ComboExecutor::send_combo(const std::string& combo_text, double hold_s) {
    auto combo = KeyCombo::parse(combo_text);
    if (!combo) {
        LOG_WARN("[Keys] Unparseable combo '%s'", combo_text.c_str());
        return false;
    }

    PressedKeys pressed(injector_);
    if (!press_all(*combo, pressed)) {
        return false;
    }
    clock_.sleep_for(hold_s > 0.0 ? hold_s : config_.tap_hold_s);

    const bool released = pressed.release_all();
    LOG_DEBUG("[Keys] Sent %s (hold %.2fs)", combo->to_string().c_str(), hold_s);
    return released;
}

HoldResult ComboExecutor::hold_combo_until(const std::string& combo_text,
                                           const SnapshotPredicate& pred,
                                           double max_s)
{
    HoldResult result;
    auto combo = KeyCombo::parse(combo_text);
    if (!combo) {
        LOG_WARN("[Keys] Unparseable combo '%s'", combo_text.c_str());
        return result;
    }

    PressedKeys pressed(injector_);
    if (!press_all(*combo, pressed)) {
        return result;
    }

    auto wait = utils::wait_until(
        clock_,
        [&] {
            auto snap = telemetry_.get_current();
            return snap && pred(*snap);
        },
        max_s, config_.check_interval_s);

    result.sent = pressed.release_all();
    result.reached = wait.satisfied;
    result.elapsed_s = wait.elapsed_s;

    LOG_DEBUG("[Keys] Held %s for %.2fs (%s)", combo->to_string().c_str(), wait.elapsed_s,
              wait.satisfied ? "condition met" : "cap reached");
    return result;
}

} // namespace controls
