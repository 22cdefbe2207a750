// src/commands/command_queue.cpp
#include "commands/command_queue.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <exception>

namespace commands {

namespace {
// Rows stay pending when a cancel write fails; bound the re-fetches.
constexpr int kMaxStartupRounds = 20;
}

CommandQueue::CommandQueue(CommandTransport& transport,
                           CommandExecutor& executor,
                           const telemetry::TelemetrySource& telemetry,
                           utils::Clock& clock,
                           Config config)
    : transport_(transport)
    , executor_(executor)
    , telemetry_(telemetry)
    , clock_(clock)
    , config_(std::move(config))
    , fetch_warn_(config_.error_log_window_s)
{
}

CommandQueue::~CommandQueue() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void CommandQueue::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (running_) return;

    if (config_.cancel_pending_on_start) {
        const size_t n = reconcile_startup();
        if (n > 0) {
            LOG_INFO("[CommandQueue] Cancelled %zu command(s) queued before start", n);
        }
    }

    {
        std::lock_guard<std::mutex> wake_lock(wake_mu_);
        stop_requested_ = false;
    }
    running_ = true;

    if (transport_.subscribe([this](const Command& cmd) { handle_candidate(cmd); })) {
        push_active_ = true;
        LOG_INFO("[CommandQueue] Listening for %s push commands", transport_.name().c_str());
        return;
    }

    push_active_ = false;
    LOG_INFO("[CommandQueue] Push unavailable on %s transport, polling every %.1fs",
             transport_.name().c_str(), config_.poll_interval_s);
    poll_thread_ = std::thread(&CommandQueue::poll_loop, this);
}

void CommandQueue::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (!running_) return;
    running_ = false;

    if (push_active_) {
        transport_.unsubscribe();
        push_active_ = false;
    }

    {
        std::lock_guard<std::mutex> wake_lock(wake_mu_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
    LOG_INFO("[CommandQueue] Stopped");
}

void CommandQueue::poll_loop() {
    while (true) {
        poll_once();

        std::unique_lock<std::mutex> lock(wake_mu_);
        wake_cv_.wait_for(lock, std::chrono::duration<double>(config_.poll_interval_s),
                          [this] { return stop_requested_; });
        if (stop_requested_) break;
    }
}

size_t CommandQueue::reconcile_startup() {
    size_t cancelled = 0;

    for (int round = 0; round < kMaxStartupRounds; ++round) {
        const FetchResult fr = transport_.fetch_pending();
        if (fr.status == FetchStatus::NotAvailable) break;
        if (fr.status == FetchStatus::Error) {
            LOG_WARN("[CommandQueue] Startup check for pending commands failed: %s", fr.error.c_str());
            break;
        }

        size_t fresh = 0;
        for (const auto& cmd : fr.commands) {
            if (cmd.status != CommandStatus::Pending) continue;
            if (!ledger_.try_insert(cmd.id)) continue;
            ++fresh;

            nlohmann::json detail = {{"success", false},
                                     {"cancelled", true},
                                     {"message", kStartupCancelMessage},
                                     {"error", to_string(ErrorKind::StaleCommand)}};
            if (transport_.mark_complete(cmd.id, false, detail, kStartupCancelMessage)) {
                ++cancelled;
                LOG_DEBUG("[CommandQueue] Cancelled stale %s (id: %s)", cmd.action.c_str(), cmd.id.c_str());
            } else {
                std::lock_guard<std::mutex> lock(state_mu_);
                ++stats_.write_failures;
            }
        }
        if (fresh == 0) break;
    }

    std::lock_guard<std::mutex> lock(state_mu_);
    stats_.cancelled_on_start += cancelled;
    return cancelled;
}

// ============================================================================
// Delivery
// ============================================================================

void CommandQueue::poll_once() {
    const FetchResult fr = transport_.fetch_pending();

    switch (fr.status) {
        case FetchStatus::NotAvailable:
            return;
        case FetchStatus::Error:
            if (fetch_warn_.should_log(clock_.now())) {
                const int dropped = fetch_warn_.take_suppressed();
                LOG_WARN("[CommandQueue] Command poll failed: %s (%d similar suppressed)",
                         fr.error.c_str(), dropped);
            }
            return;
        case FetchStatus::Ok:
            break;
    }

    for (const auto& cmd : fr.commands) {
        handle_candidate(cmd);
    }
}

void CommandQueue::set_connected_at(std::optional<WallTime> t) {
    std::lock_guard<std::mutex> lock(state_mu_);
    connected_at_ = t;
}

std::optional<ActionResult> CommandQueue::guard(const Command& cmd) const {
    if (cmd.action.empty()) {
        return ActionResult::fail(ErrorKind::InvalidCommand, "Invalid command format: missing action");
    }
    if (config_.always_allowed.count(cmd.action)) {
        return std::nullopt;
    }

    if (!telemetry_.is_connected()) {
        return ActionResult::fail(ErrorKind::SimulatorNotConnected,
                                  "Simulator not connected - " + cmd.action + " skipped");
    }

    std::optional<WallTime> connected_at;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        connected_at = connected_at_;
    }
    if (connected_at && cmd.created_at) {
        const double age_s =
            std::chrono::duration<double>(*connected_at - *cmd.created_at).count();
        if (age_s > config_.stale_grace_s) {
            return ActionResult::fail(ErrorKind::StaleCommand,
                                      "Stale command ignored - queued before the simulator connected");
        }
    }
    return std::nullopt;
}

void CommandQueue::handle_candidate(const Command& cmd) {
    if (cmd.status != CommandStatus::Pending) {
        LOG_TRACE("[CommandQueue] Ignoring %s command %s", to_string(cmd.status), cmd.id.c_str());
        return;
    }
    if (!ledger_.try_insert(cmd.id)) {
        return;
    }

    if (auto rejected = guard(cmd)) {
        LOG_INFO("[CommandQueue] Skipping %s (id: %s): %s",
                 cmd.action.c_str(), cmd.id.c_str(), rejected->message.c_str());
        {
            std::lock_guard<std::mutex> lock(state_mu_);
            ++stats_.rejected;
        }
        finish(cmd, *rejected);
        return;
    }

    LOG_INFO("[CommandQueue] Executing %s (id: %s, type: %s)",
             cmd.action.c_str(), cmd.id.c_str(), cmd.type.empty() ? "-" : cmd.type.c_str());

    if (!transport_.mark_processing(cmd.id)) {
        std::lock_guard<std::mutex> lock(state_mu_);
        ++stats_.write_failures;
    }
    emit(CommandEvent::Phase::Started, cmd, nullptr);

    ActionResult result;
    try {
        result = executor_.execute(cmd);
    } catch (const std::exception& e) {
        LOG_ERROR("[CommandQueue] %s (id: %s) threw: %s", cmd.action.c_str(), cmd.id.c_str(), e.what());
        result = ActionResult::fail(ErrorKind::ExecutionError, std::string("Execution error: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mu_);
        ++stats_.dispatched;
    }
    LOG_INFO("[CommandQueue] %s (id: %s) %s: %s", cmd.action.c_str(), cmd.id.c_str(),
             result.success ? "succeeded" : "failed", result.message.c_str());

    finish(cmd, result);

    if (post_command_) {
        post_command_(cmd, result);
    }
}

void CommandQueue::finish(const Command& cmd, const ActionResult& result) {
    if (!transport_.mark_complete(cmd.id, result.success, result.to_json(), result.message)) {
        LOG_WARN("[CommandQueue] Could not report result for %s (id: %s); left for manual follow-up",
                 cmd.action.c_str(), cmd.id.c_str());
        std::lock_guard<std::mutex> lock(state_mu_);
        ++stats_.write_failures;
    }
    emit(CommandEvent::Phase::Finished, cmd, &result);
}

void CommandQueue::emit(CommandEvent::Phase phase, const Command& cmd, const ActionResult* result) {
    if (!on_event_) return;
    CommandEvent ev{phase, cmd, std::nullopt};
    if (result) ev.result = *result;
    on_event_(ev);
}

CommandQueue::Stats CommandQueue::stats() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return stats_;
}

} // namespace commands
