// src/commands/command_queue.hpp
#pragma once

#include "commands/action_result.hpp"
#include "commands/command_executor.hpp"
#include "commands/command_transport.hpp"
#include "commands/processed_id_ledger.hpp"
#include "telemetry/telemetry_source.hpp"
#include "utils/clock.hpp"
#include "utils/log_throttle.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace commands {

struct CommandEvent {
    enum class Phase {
        Started,     // accepted and about to be dispatched
        Finished     // terminal result known (dispatched or rejected)
    };

    Phase phase;
    Command command;
    std::optional<ActionResult> result;   // set for Finished
};

using CommandEventFn = std::function<void(const CommandEvent&)>;
using PostCommandFn = std::function<void(const Command&, const ActionResult&)>;

/**
 * CommandQueue - delivers each remote command to the executor at most once.
 *
 * Candidates from the push feed and from polling go through the same gate:
 *   1. status must be pending
 *   2. id must be new to the ledger (inserted here, before anything else)
 *   3. connectivity and staleness guards (always_allowed actions skip them)
 *   4. mark_processing (best effort), execute, mark_complete (once, no retry)
 *
 * start() first cancels every command already pending so nothing queued
 * while the process was down gets replayed.
 */
class CommandQueue {
public:
    struct Config {
        double poll_interval_s = 10.0;
        double error_log_window_s = 30.0;
        double stale_grace_s = 300.0;
        bool cancel_pending_on_start = true;
        std::set<std::string> always_allowed = {"enter_car"};
    };

    struct Stats {
        size_t dispatched = 0;
        size_t rejected = 0;          // not connected, stale, invalid
        size_t cancelled_on_start = 0;
        size_t write_failures = 0;    // mark_processing / mark_complete
    };

    static constexpr const char* kStartupCancelMessage =
        "Command queued before service started - cancelled on startup";

    CommandQueue(CommandTransport& transport,
                 CommandExecutor& executor,
                 const telemetry::TelemetrySource& telemetry,
                 utils::Clock& clock,
                 Config config);
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Set before start().
    void set_event_callback(CommandEventFn fn) { on_event_ = std::move(fn); }
    void set_post_command_hook(PostCommandFn fn) { post_command_ = std::move(fn); }

    /**
     * Startup reconciliation, then push subscription or the poll thread.
     * Returns after reconciliation has finished. Calling twice is a no-op.
     */
    void start();

    // Stops delivery and joins the poll thread. Safe to call repeatedly.
    void stop();

    bool is_running() const { return running_; }
    bool using_push() const { return push_active_; }

    // Time the simulator was first seen connected; staleness is measured from it.
    void set_connected_at(std::optional<WallTime> t);

    // Gate one delivered command. Thread-safe.
    void handle_candidate(const Command& cmd);

    // One fetch + handle pass.
    void poll_once();

    // Cancels everything currently pending. Returns the number cancelled.
    size_t reconcile_startup();

    const ProcessedIdLedger& ledger() const { return ledger_; }
    Stats stats() const;

private:
    CommandTransport& transport_;
    CommandExecutor& executor_;
    const telemetry::TelemetrySource& telemetry_;
    utils::Clock& clock_;
    Config config_;

    ProcessedIdLedger ledger_;
    utils::LogThrottle fetch_warn_;

    CommandEventFn on_event_;
    PostCommandFn post_command_;

    mutable std::mutex state_mu_;          // connected_at_ and stats_
    std::optional<WallTime> connected_at_;
    Stats stats_;

    std::mutex lifecycle_mu_;
    std::atomic<bool> running_{false};
    std::atomic<bool> push_active_{false};
    std::thread poll_thread_;
    std::mutex wake_mu_;
    std::condition_variable wake_cv_;
    bool stop_requested_ = false;

    void poll_loop();
    std::optional<ActionResult> guard(const Command& cmd) const;
    void finish(const Command& cmd, const ActionResult& result);
    void emit(CommandEvent::Phase phase, const Command& cmd, const ActionResult* result);
};

} // namespace commands
