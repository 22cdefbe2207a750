// src/bench/lua_rig_sim.hpp
#pragma once

#include <mutex>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "controls/action_executor.hpp"
#include "telemetry/telemetry_source.hpp"
#include "utils/clock.hpp"

namespace bench {

/**
 * LuaRigSim - scripted stand-in for the simulator on a bench machine.
 *
 * The script provides:
 *   rig_init()               optional, called once after load
 *   rig_step(t_s) -> table   snapshot fields (connected, speed_kph, rpm, lap, ...)
 *   rig_key(key, pressed)    key events from the executor
 *   rig_focus() -> bool      optional, defaults to true
 *
 * Telemetry is stepped lazily on each read using the clock, so no extra
 * thread is needed. The Lua state is used from several threads and every
 * call into it holds mu_.
 */
class LuaRigSim : public telemetry::TelemetrySource, public controls::KeyInjector {
public:
    explicit LuaRigSim(utils::Clock& clock) : clock_(clock) {}
    ~LuaRigSim() override;

    LuaRigSim(const LuaRigSim&) = delete;
    LuaRigSim& operator=(const LuaRigSim&) = delete;

    bool init(const std::string& lua_script_path);

    // TelemetrySource
    bool is_connected() const override;
    std::optional<telemetry::Snapshot> get_current() const override;

    // KeyInjector
    bool focus_window() override;
    bool press(const std::string& key) override;
    bool release(const std::string& key) override;

private:
    utils::Clock& clock_;
    double start_s_ = 0.0;

    mutable std::mutex mu_;
    lua_State* L_{nullptr};

    bool call_key_(const std::string& key, bool pressed);
    bool read_snapshot_table_(int idx, telemetry::Snapshot& out) const;
};

} // namespace bench
