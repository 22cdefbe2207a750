// test/fakes.hpp
// Deterministic stand-ins for the simulator, backend and clock
#pragma once

#include "commands/command.hpp"
#include "commands/command_executor.hpp"
#include "commands/command_transport.hpp"
#include "controls/action_executor.hpp"
#include "state/state_publisher.hpp"
#include "telemetry/telemetry_source.hpp"
#include "utils/clock.hpp"
#include "utils/http_client.hpp"
#include "utils/wait.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fakes {

// ============================================================================
// ManualClock - sleep_for() advances virtual time instead of blocking
// ============================================================================

class ManualClock : public utils::Clock {
public:
    // 2026-01-01T00:00:00Z
    static std::chrono::system_clock::time_point default_epoch() {
        return std::chrono::system_clock::from_time_t(1767225600);
    }

    explicit ManualClock(double start_s = 0.0) : now_s_(start_s), wall_epoch_(default_epoch()) {}

    double now() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return now_s_;
    }

    std::chrono::system_clock::time_point wall_now() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return wall_epoch_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                 std::chrono::duration<double>(now_s_));
    }

    void sleep_for(double seconds) override {
        if (seconds > 0.0) advance(seconds);
    }

    void advance(double seconds) {
        std::lock_guard<std::mutex> lock(mu_);
        now_s_ += seconds;
    }

private:
    mutable std::mutex mu_;
    double now_s_;
    std::chrono::system_clock::time_point wall_epoch_;
};

// ============================================================================
// FakeRig - time-driven simulator model that is also the ActionExecutor
// ============================================================================

/**
 * Keys: "I" toggles ignition, "S" starts the engine, "E" enters the car,
 * "SHIFT+R" is the reset key. Holding reset for tow_hold_s on track tows the
 * car to the pit stall; in the pit stall it takes the driver out of the car.
 *
 *   SinglePress: releasing the key after a tow also leaves the car
 *   TwoPress:    a second hold is needed to leave the car
 *   Stuck:       the reset key does nothing
 */
class FakeRig : public telemetry::TelemetrySource, public controls::ActionExecutor {
public:
    enum class Phase { Garage, Stall, PitRoad, Track };
    enum class ResetMode { SinglePress, TwoPress, Stuck };

    struct Call {
        std::string kind;     // "focus", "send", "hold"
        std::string combo;
        double arg_s = 0.0;   // hold time for send, cap for hold
        double at_s = 0.0;
        double elapsed_s = 0.0;
    };

    static constexpr const char* kIgnition = "I";
    static constexpr const char* kStarter = "S";
    static constexpr const char* kEnter = "E";
    static constexpr const char* kReset = "SHIFT+R";

    explicit FakeRig(ManualClock& clock) : clock_(clock), last_s_(clock.now()) {}

    // --- Scripting -----------------------------------------------------------

    void place(Phase phase, double speed_kph, bool ignition) {
        std::lock_guard<std::mutex> lock(mu_);
        advance_locked();
        phase_ = phase;
        speed_ = speed_kph;
        ignition_ = ignition;
        rpm_ = ignition ? 3000.0 : 0.0;
    }

    void set_connected(bool v) { std::lock_guard<std::mutex> lock(mu_); connected_ = v; }
    void set_reset_mode(ResetMode m) { std::lock_guard<std::mutex> lock(mu_); mode_ = m; }
    void set_focus_ok(bool v) { std::lock_guard<std::mutex> lock(mu_); focus_ok_ = v; }
    void set_send_ok(bool v) { std::lock_guard<std::mutex> lock(mu_); send_ok_ = v; }
    void set_enter_works(bool v) { std::lock_guard<std::mutex> lock(mu_); enter_works_ = v; }
    void set_rpm(double v) { std::lock_guard<std::mutex> lock(mu_); rpm_ = v; }

    void set_lap(int lap, double last_lap_s) {
        std::lock_guard<std::mutex> lock(mu_);
        lap_ = lap;
        last_lap_s_ = last_lap_s;
    }

    // Laps complete every lap_time_s while driving on track (0 disables).
    void set_lap_time(double lap_time_s, double progress_s = 0.0) {
        std::lock_guard<std::mutex> lock(mu_);
        lap_time_s_ = lap_time_s;
        lap_progress_s_ = progress_s;
    }

    // --- Inspection ----------------------------------------------------------

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_;
    }

    int count(const std::string& kind, const std::string& combo = "") const {
        std::lock_guard<std::mutex> lock(mu_);
        return static_cast<int>(std::count_if(calls_.begin(), calls_.end(), [&](const Call& c) {
            return c.kind == kind && (combo.empty() || c.combo == combo);
        }));
    }

    int executor_calls() const {
        std::lock_guard<std::mutex> lock(mu_);
        return static_cast<int>(calls_.size());
    }

    Phase phase() const {
        std::lock_guard<std::mutex> lock(mu_);
        return phase_;
    }

    bool ignition() const {
        std::lock_guard<std::mutex> lock(mu_);
        return ignition_;
    }

    // --- TelemetrySource -----------------------------------------------------

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return connected_;
    }

    std::optional<telemetry::Snapshot> get_current() const override {
        std::lock_guard<std::mutex> lock(mu_);
        advance_locked();
        if (!connected_) return std::nullopt;

        telemetry::Snapshot s;
        s.connected = true;
        s.is_on_track_car = phase_ != Phase::Garage;
        s.is_on_track = phase_ != Phase::Garage;
        s.on_pit_road = phase_ == Phase::PitRoad || phase_ == Phase::Stall;
        s.in_garage = phase_ == Phase::Garage;
        s.in_pit_stall = phase_ == Phase::Stall;
        s.speed_kph = speed_;
        s.rpm = rpm_;
        s.lap = lap_;
        s.lap_last_time_s = last_lap_s_;
        s.lap_current_time_s = lap_progress_s_;
        s.session_unique_id = 42;
        s.track_name = "Test Track";
        s.car_name = "Test Car";
        s.timestamp_s = clock_.now();
        return s;
    }

    // --- ActionExecutor ------------------------------------------------------

    bool focus_target_window() override {
        std::lock_guard<std::mutex> lock(mu_);
        calls_.push_back({"focus", "", 0.0, clock_.now(), 0.0});
        return focus_ok_;
    }

    bool send_combo(const std::string& combo, double hold_s = 0.0) override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            calls_.push_back({"send", combo, hold_s, clock_.now(), 0.0});
            if (!send_ok_) return false;
            key_down_locked(combo);
        }
        clock_.sleep_for(hold_s > 0.0 ? hold_s : 0.05);
        std::lock_guard<std::mutex> lock(mu_);
        key_up_locked(combo);
        return true;
    }

    controls::HoldResult hold_combo_until(const std::string& combo,
                                          const controls::SnapshotPredicate& pred,
                                          double max_s) override
    {
        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(mu_);
            index = calls_.size();
            calls_.push_back({"hold", combo, max_s, clock_.now(), 0.0});
            if (!send_ok_) return {};
            key_down_locked(combo);
        }

        auto w = utils::wait_until(clock_, [&] {
            auto s = get_current();
            return s && pred(*s);
        }, max_s, 0.1);

        std::lock_guard<std::mutex> lock(mu_);
        key_up_locked(combo);
        calls_[index].elapsed_s = w.elapsed_s;
        return {true, w.satisfied, w.elapsed_s};
    }

private:
    ManualClock& clock_;

    mutable std::mutex mu_;
    mutable double last_s_;
    mutable Phase phase_ = Phase::Garage;
    mutable double speed_ = 0.0;
    mutable double rpm_ = 0.0;
    mutable bool ignition_ = false;
    mutable int lap_ = 1;
    mutable double last_lap_s_ = 0.0;
    mutable double lap_time_s_ = 0.0;
    mutable double lap_progress_s_ = 0.0;
    mutable bool reset_down_ = false;
    mutable double reset_down_at_ = 0.0;
    mutable bool reset_acted_ = false;
    mutable bool towed_this_hold_ = false;

    bool connected_ = true;
    ResetMode mode_ = ResetMode::SinglePress;
    bool focus_ok_ = true;
    bool send_ok_ = true;
    bool enter_works_ = true;
    double decel_kph_s_ = 40.0;
    double tow_hold_s_ = 1.0;

    std::vector<Call> calls_;

    bool in_car_locked() const { return phase_ != Phase::Garage; }

    void leave_car_locked() const {
        phase_ = Phase::Garage;
        speed_ = 0.0;
        ignition_ = false;
        rpm_ = 0.0;
    }

    void advance_locked() const {
        const double now = clock_.now();
        const double dt = std::max(0.0, now - last_s_);
        last_s_ = now;

        if (!ignition_) rpm_ = 0.0;

        const bool driving = ignition_ && rpm_ > 500.0 && (phase_ == Phase::Track || phase_ == Phase::PitRoad);
        if (driving) {
            if (phase_ == Phase::Track && lap_time_s_ > 0.0) {
                lap_progress_s_ += dt;
                while (lap_progress_s_ >= lap_time_s_) {
                    lap_progress_s_ -= lap_time_s_;
                    ++lap_;
                    last_lap_s_ = lap_time_s_;
                }
            }
        } else {
            speed_ = std::max(0.0, speed_ - decel_kph_s_ * dt);
        }

        if (reset_down_ && !reset_acted_ && mode_ != ResetMode::Stuck && now - reset_down_at_ >= tow_hold_s_) {
            if (phase_ == Phase::Track || phase_ == Phase::PitRoad) {
                phase_ = Phase::Stall;
                speed_ = 0.0;
                towed_this_hold_ = true;
            } else if (phase_ == Phase::Stall) {
                leave_car_locked();
            }
            reset_acted_ = true;
        }
    }

    void key_down_locked(const std::string& combo) {
        advance_locked();
        if (combo == kIgnition) {
            if (in_car_locked()) {
                ignition_ = !ignition_;
                if (!ignition_) rpm_ = 0.0;
            }
        } else if (combo == kStarter) {
            if (in_car_locked() && ignition_) rpm_ = 900.0;
        } else if (combo == kEnter) {
            if (phase_ == Phase::Garage && enter_works_) phase_ = Phase::Stall;
        } else if (combo == kReset) {
            if (phase_ == Phase::Garage && enter_works_) {
                // Reset key doubles as enter in the garage
                phase_ = Phase::Stall;
                return;
            }
            reset_down_ = true;
            reset_down_at_ = clock_.now();
            reset_acted_ = false;
            towed_this_hold_ = false;
        }
    }

    void key_up_locked(const std::string& combo) {
        advance_locked();
        if (combo == kReset && reset_down_) {
            if (mode_ == ResetMode::SinglePress && towed_this_hold_ && phase_ == Phase::Stall) {
                leave_car_locked();
            }
            reset_down_ = false;
        }
    }
};

// ============================================================================
// ScriptedTelemetry - returns whatever snapshot the test set last
// ============================================================================

class ScriptedTelemetry : public telemetry::TelemetrySource {
public:
    void set(std::optional<telemetry::Snapshot> s) {
        std::lock_guard<std::mutex> lock(mu_);
        snap_ = std::move(s);
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return snap_.has_value();
    }

    std::optional<telemetry::Snapshot> get_current() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return snap_;
    }

private:
    mutable std::mutex mu_;
    std::optional<telemetry::Snapshot> snap_;
};

inline telemetry::Snapshot make_snapshot(bool in_car, double speed_kph = 0.0, double rpm = 0.0, int lap = 1) {
    telemetry::Snapshot s;
    s.connected = true;
    s.is_on_track_car = in_car;
    s.is_on_track = in_car;
    s.in_garage = !in_car;
    s.speed_kph = speed_kph;
    s.rpm = rpm;
    s.lap = lap;
    s.track_name = "Test Track";
    s.car_name = "Test Car";
    return s;
}

// ============================================================================
// FakeTransport - in-memory command table
// ============================================================================

struct CompleteCall {
    std::string id;
    bool success = false;
    nlohmann::json result;
    std::string message;
};

class FakeTransport : public commands::CommandTransport {
public:
    std::string name() const override { return "fake"; }

    void add_pending(commands::Command cmd) {
        std::lock_guard<std::mutex> lock(mu_);
        cmd.status = commands::CommandStatus::Pending;
        rows_.push_back(std::move(cmd));
    }

    void set_fetch_status(commands::FetchStatus s, std::string error = "") {
        std::lock_guard<std::mutex> lock(mu_);
        fetch_status_ = s;
        fetch_error_ = std::move(error);
    }

    void set_push_supported(bool v) { std::lock_guard<std::mutex> lock(mu_); push_supported_ = v; }
    void set_fail_writes(bool v) { std::lock_guard<std::mutex> lock(mu_); fail_writes_ = v; }

    // Push delivery, as a realtime feed would. False when nobody subscribed.
    bool deliver(const commands::Command& cmd) {
        commands::CommandCallback cb;
        {
            std::lock_guard<std::mutex> lock(mu_);
            cb = callback_;
        }
        if (!cb) return false;
        cb(cmd);
        return true;
    }

    commands::FetchResult fetch_pending() override {
        std::lock_guard<std::mutex> lock(mu_);
        ++fetch_calls_;
        commands::FetchResult fr;
        fr.status = fetch_status_;
        fr.error = fetch_error_;
        if (fetch_status_ != commands::FetchStatus::Ok) return fr;
        for (const auto& row : rows_) {
            if (row.status == commands::CommandStatus::Pending) fr.commands.push_back(row);
        }
        return fr;
    }

    bool mark_processing(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mu_);
        processing_.push_back(id);
        if (fail_writes_) return false;
        set_status_locked(id, commands::CommandStatus::Processing);
        return true;
    }

    bool mark_complete(const std::string& id,
                       bool success,
                       const nlohmann::json& result,
                       const std::string& message) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        completes_.push_back({id, success, result, message});
        if (fail_writes_) return false;
        set_status_locked(id, success ? commands::CommandStatus::Completed : commands::CommandStatus::Failed);
        return true;
    }

    bool subscribe(commands::CommandCallback on_command) override {
        std::lock_guard<std::mutex> lock(mu_);
        if (!push_supported_) return false;
        callback_ = std::move(on_command);
        return true;
    }

    void unsubscribe() override {
        std::lock_guard<std::mutex> lock(mu_);
        callback_ = nullptr;
        ++unsubscribes_;
    }

    std::vector<CompleteCall> completes() const {
        std::lock_guard<std::mutex> lock(mu_);
        return completes_;
    }

    std::vector<CompleteCall> completes_for(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<CompleteCall> out;
        for (const auto& c : completes_) {
            if (c.id == id) out.push_back(c);
        }
        return out;
    }

    std::vector<std::string> processing() const {
        std::lock_guard<std::mutex> lock(mu_);
        return processing_;
    }

    std::optional<commands::CommandStatus> status_of(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& row : rows_) {
            if (row.id == id) return row.status;
        }
        return std::nullopt;
    }

    int fetch_calls() const { std::lock_guard<std::mutex> lock(mu_); return fetch_calls_; }
    int unsubscribes() const { std::lock_guard<std::mutex> lock(mu_); return unsubscribes_; }

private:
    mutable std::mutex mu_;
    std::vector<commands::Command> rows_;
    commands::FetchStatus fetch_status_ = commands::FetchStatus::Ok;
    std::string fetch_error_;
    bool push_supported_ = false;
    bool fail_writes_ = false;
    commands::CommandCallback callback_;
    std::vector<CompleteCall> completes_;
    std::vector<std::string> processing_;
    int fetch_calls_ = 0;
    int unsubscribes_ = 0;

    void set_status_locked(const std::string& id, commands::CommandStatus s) {
        for (auto& row : rows_) {
            if (row.id == id) row.status = s;
        }
    }
};

inline commands::Command make_command(const std::string& id,
                                      const std::string& action,
                                      std::optional<commands::WallTime> created_at = std::nullopt,
                                      nlohmann::json params = nlohmann::json::object())
{
    commands::Command cmd;
    cmd.id = id;
    cmd.action = action;
    cmd.kind = commands::parse_action_kind(action);
    cmd.type = "control";
    cmd.params = std::move(params);
    cmd.created_at = created_at;
    cmd.status = commands::CommandStatus::Pending;
    return cmd;
}

// ============================================================================
// RecordingExecutor - CommandExecutor that records and returns a canned result
// ============================================================================

class RecordingExecutor : public commands::CommandExecutor {
public:
    commands::ActionResult execute(const commands::Command& cmd) override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            executed_.push_back(cmd);
        }
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        if (throw_) {
            throw std::runtime_error("injected failure");
        }
        std::lock_guard<std::mutex> lock(mu_);
        return result_;
    }

    void set_result(commands::ActionResult r) { std::lock_guard<std::mutex> lock(mu_); result_ = std::move(r); }
    void set_throw(bool v) { throw_ = v; }
    void set_delay_ms(int ms) { delay_ms_ = ms; }

    int count() const {
        std::lock_guard<std::mutex> lock(mu_);
        return static_cast<int>(executed_.size());
    }

    std::vector<commands::Command> executed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return executed_;
    }

private:
    mutable std::mutex mu_;
    std::vector<commands::Command> executed_;
    commands::ActionResult result_ = commands::ActionResult::ok("done");
    bool throw_ = false;
    int delay_ms_ = 0;
};

// ============================================================================
// RecordingInjector - KeyInjector that logs "down:KEY" / "up:KEY"
// ============================================================================

class RecordingInjector : public controls::KeyInjector {
public:
    bool focus_window() override {
        std::unique_lock<std::mutex> lock(mu_);
        events_.push_back("focus");
        ++focus_waiting_;
        gate_cv_.wait(lock, [this] { return !focus_gated_; });
        --focus_waiting_;
        return focus_ok_;
    }

    // While gated, focus_window() blocks; the caller keeps the dispatch lock.
    void gate_focus() { std::lock_guard<std::mutex> lock(mu_); focus_gated_ = true; }
    void open_focus() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            focus_gated_ = false;
        }
        gate_cv_.notify_all();
    }
    int focus_waiting() const { std::lock_guard<std::mutex> lock(mu_); return focus_waiting_; }

    bool press(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mu_);
        events_.push_back("down:" + key);
        return key != fail_press_;
    }

    bool release(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mu_);
        events_.push_back("up:" + key);
        return true;
    }

    void set_focus_ok(bool v) { std::lock_guard<std::mutex> lock(mu_); focus_ok_ = v; }
    void set_fail_press(const std::string& key) { std::lock_guard<std::mutex> lock(mu_); fail_press_ = key; }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mu_);
        return events_;
    }

private:
    mutable std::mutex mu_;
    std::vector<std::string> events_;
    bool focus_ok_ = true;
    std::string fail_press_;
    std::condition_variable gate_cv_;
    bool focus_gated_ = false;
    int focus_waiting_ = 0;
};

// ============================================================================
// FakePublisher - StatePublisher that records pushes
// ============================================================================

class FakePublisher : public state::StatePublisher {
public:
    bool push_state(const state::DeviceState& s, state::PushReason reason) override {
        std::lock_guard<std::mutex> lock(mu_);
        ++attempts_;
        if (fail_) return false;
        pushes_.push_back({s, reason});
        return true;
    }

    bool push_timed_session(const std::optional<state::TimedSessionState>& s) override {
        std::lock_guard<std::mutex> lock(mu_);
        sessions_.push_back(s);
        stored_session_ = s;
        return !fail_;
    }

    std::optional<state::TimedSessionState> fetch_timed_session() override {
        std::lock_guard<std::mutex> lock(mu_);
        return stored_session_;
    }

    void set_fail(bool v) { std::lock_guard<std::mutex> lock(mu_); fail_ = v; }
    void set_stored_session(std::optional<state::TimedSessionState> s) {
        std::lock_guard<std::mutex> lock(mu_);
        stored_session_ = std::move(s);
    }

    std::vector<std::pair<state::DeviceState, state::PushReason>> pushes() const {
        std::lock_guard<std::mutex> lock(mu_);
        return pushes_;
    }

    int count(state::PushReason reason) const {
        std::lock_guard<std::mutex> lock(mu_);
        return static_cast<int>(std::count_if(pushes_.begin(), pushes_.end(),
                                              [&](const auto& p) { return p.second == reason; }));
    }

    int attempts() const { std::lock_guard<std::mutex> lock(mu_); return attempts_; }

    std::vector<std::optional<state::TimedSessionState>> sessions() const {
        std::lock_guard<std::mutex> lock(mu_);
        return sessions_;
    }

private:
    mutable std::mutex mu_;
    bool fail_ = false;
    int attempts_ = 0;
    std::vector<std::pair<state::DeviceState, state::PushReason>> pushes_;
    std::vector<std::optional<state::TimedSessionState>> sessions_;
    std::optional<state::TimedSessionState> stored_session_;
};

// ============================================================================
// FakeHttpSession - canned responses, recorded requests
// ============================================================================

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
};

inline utils::HttpResponse http_response(long status, std::string body = "", std::string error = "") {
    utils::HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    r.error = std::move(error);
    return r;
}

class FakeHttpSession : public utils::HttpSession {
public:
    utils::HttpResponse request(const std::string& method,
                                const std::string& path,
                                const std::string& body = "") override
    {
        std::lock_guard<std::mutex> lock(mu_);
        requests_.push_back({method, path, body});
        if (!queued_.empty()) {
            auto r = queued_.front();
            queued_.pop_front();
            return r;
        }
        return default_;
    }

    // Responses are returned in order; the default answers once they run out.
    void enqueue(utils::HttpResponse r) { std::lock_guard<std::mutex> lock(mu_); queued_.push_back(std::move(r)); }
    void set_default(utils::HttpResponse r) { std::lock_guard<std::mutex> lock(mu_); default_ = std::move(r); }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

private:
    mutable std::mutex mu_;
    std::deque<utils::HttpResponse> queued_;
    utils::HttpResponse default_ = http_response(200, "{}");
    std::vector<HttpRequest> requests_;
};

} // namespace fakes
