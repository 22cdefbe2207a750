// src/service/rig_service.hpp
#pragma once

#include "commands/action_dispatcher.hpp"
#include "commands/command_queue.hpp"
#include "commands/command_transport.hpp"
#include "config/rig_config.hpp"
#include "controls/action_log.hpp"
#include "controls/combo_executor.hpp"
#include "controls/control_bindings.hpp"
#include "state/state_publisher.hpp"
#include "state/state_reconciler.hpp"
#include "state/timed_session.hpp"
#include "telemetry/telemetry_source.hpp"
#include "utils/clock.hpp"
#include "utils/http_client.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace service {

/**
 * RigService - owns and wires the command, control and state components.
 *
 *   telemetry thread (poll_hz): connected_at, state reconcile, timed session
 *   command thread:             CommandQueue poll loop (or push callbacks)
 *   timed reset thread:         owned by the dispatcher while enabled
 *   session reset thread:       runs the timed-session reset off the telemetry thread
 *
 * The telemetry source and key injector are platform collaborators supplied
 * by the caller and must outlive the service.
 */
class RigService {
public:
    /**
     * @param http   backend session; a CurlHttpSession is built from the config when null
     * @param clock  time source; a SteadyClock when null
     * @throws std::runtime_error on invalid configuration
     */
    RigService(const config::RigConfig& cfg,
               telemetry::TelemetrySource& telemetry,
               controls::KeyInjector& injector,
               std::unique_ptr<utils::HttpSession> http = nullptr,
               std::unique_ptr<utils::Clock> clock = nullptr);
    ~RigService();

    RigService(const RigService&) = delete;
    RigService& operator=(const RigService&) = delete;

    // Loads bindings, restores the timed session, starts the queue and the
    // telemetry thread.
    void start();
    void stop();

    bool is_running() const { return running_; }

    // One telemetry pass; the telemetry thread calls this every period.
    void telemetry_tick();

    commands::ActionDispatcher& dispatcher() { return *dispatcher_; }
    commands::CommandQueue& queue() { return *queue_; }
    state::StateReconciler& reconciler() { return *reconciler_; }
    state::TimedSessionTracker& timed_session() { return *tracker_; }
    controls::ControlBindingStore& bindings() { return *bindings_; }
    const controls::ActionLog& action_log() const { return action_log_; }

private:
    config::RigConfig cfg_;
    telemetry::TelemetrySource& telemetry_;

    std::unique_ptr<utils::Clock> clock_;
    std::unique_ptr<utils::HttpSession> http_;
    std::unique_ptr<commands::CommandTransport> transport_;
    std::unique_ptr<state::StatePublisher> publisher_;
    std::unique_ptr<controls::ControlBindingStore> bindings_;
    controls::ActionLog action_log_;
    std::unique_ptr<controls::ComboExecutor> executor_;
    std::unique_ptr<commands::ActionDispatcher> dispatcher_;
    std::unique_ptr<commands::CommandQueue> queue_;
    std::unique_ptr<state::StateReconciler> reconciler_;
    std::unique_ptr<state::TimedSessionTracker> tracker_;

    bool seen_connected_ = false;     // telemetry thread only

    std::mutex lifecycle_mu_;
    std::atomic<bool> running_{false};
    std::thread telemetry_thread_;
    std::mutex wake_mu_;
    std::condition_variable wake_cv_;
    bool stop_requested_ = false;

    // Lives from construction to destruction so a reset requested by a
    // telemetry_tick() outside start()/stop() still runs.
    std::thread session_reset_thread_;
    std::mutex reset_mu_;
    std::condition_variable reset_cv_;
    bool reset_pending_ = false;       // coalesces repeated requests
    bool reset_shutdown_ = false;

    void telemetry_loop();
    void session_reset_loop();
    void request_session_reset();
    void build_backend(controls::KeyInjector& injector);
};

} // namespace service
