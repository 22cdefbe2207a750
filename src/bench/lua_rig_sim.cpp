// src/bench/lua_rig_sim.cpp
#include "bench/lua_rig_sim.hpp"
#include "utils/logging.hpp"

namespace bench {

LuaRigSim::~LuaRigSim() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaRigSim::init(const std::string& lua_script_path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    lua_getglobal(L_, "rig_step");
    const bool has_step = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_step) {
        LOG_ERROR("[Lua] rig_step() missing in %s", lua_script_path.c_str());
        return false;
    }

    // Optional rig_init()
    lua_getglobal(L_, "rig_init");
    if (lua_isfunction(L_, -1)) {
        if (lua_pcall(L_, 0, 0, 0) != LUA_OK) {
            LOG_ERROR("[Lua] rig_init failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            return false;
        }
    } else {
        lua_pop(L_, 1);
    }

    start_s_ = clock_.now();
    LOG_INFO("[Lua] Bench rig loaded: %s", lua_script_path.c_str());
    return true;
}

bool LuaRigSim::read_snapshot_table_(int idx, telemetry::Snapshot& out) const {
    if (!lua_istable(L_, idx)) return false;

    auto get_bool = [&](const char* k, bool def) -> bool {
        lua_getfield(L_, idx, k);
        bool v = def;
        if (lua_isboolean(L_, -1)) v = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    auto get_str = [&](const char* k) -> std::string {
        lua_getfield(L_, idx, k);
        std::string v;
        if (lua_isstring(L_, -1)) v = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    out.connected = get_bool("connected", true);
    out.is_on_track_car = get_bool("is_on_track_car", false);
    out.is_on_track = get_bool("is_on_track", false);
    out.on_pit_road = get_bool("on_pit_road", false);
    out.in_garage = get_bool("in_garage", false);
    out.in_pit_stall = get_bool("in_pit_stall", false);
    out.speed_kph = get_num("speed_kph", 0.0);
    out.rpm = get_num("rpm", 0.0);
    out.lap = static_cast<int>(get_num("lap", 0.0));
    out.lap_last_time_s = get_num("lap_last_time_s", 0.0);
    out.lap_current_time_s = get_num("lap_current_time_s", 0.0);
    out.session_unique_id = static_cast<long long>(get_num("session_unique_id", 0.0));
    out.session_time_s = get_num("session_time_s", 0.0);
    out.track_name = get_str("track_name");
    out.car_name = get_str("car_name");
    out.driver_name = get_str("driver_name");

    return true;
}

std::optional<telemetry::Snapshot> LuaRigSim::get_current() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!L_) return std::nullopt;

    const double t = clock_.now() - start_s_;

    lua_getglobal(L_, "rig_step");
    lua_pushnumber(L_, t);
    if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] rig_step failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return std::nullopt;
    }

    telemetry::Snapshot snap;
    const bool ok = read_snapshot_table_(-1, snap);
    lua_pop(L_, 1);
    if (!ok || !snap.connected) return std::nullopt;

    snap.timestamp_s = clock_.now();
    return snap;
}

bool LuaRigSim::is_connected() const {
    return get_current().has_value();
}

bool LuaRigSim::focus_window() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!L_) return false;

    lua_getglobal(L_, "rig_focus");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return true;
    }
    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] rig_focus failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }
    const bool ok = lua_toboolean(L_, -1);
    lua_pop(L_, 1);
    return ok;
}

bool LuaRigSim::call_key_(const std::string& key, bool pressed) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!L_) return false;

    lua_getglobal(L_, "rig_key");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] rig_key() missing");
        return false;
    }
    lua_pushstring(L_, key.c_str());
    lua_pushboolean(L_, pressed ? 1 : 0);
    if (lua_pcall(L_, 2, 0, 0) != LUA_OK) {
        LOG_ERROR("[Lua] rig_key failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

bool LuaRigSim::press(const std::string& key) {
    LOG_TRACE("[Lua] key down %s", key.c_str());
    return call_key_(key, true);
}

bool LuaRigSim::release(const std::string& key) {
    LOG_TRACE("[Lua] key up %s", key.c_str());
    return call_key_(key, false);
}

} // namespace bench
