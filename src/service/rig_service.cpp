// src/service/rig_service.cpp
#include "service/rig_service.hpp"
#include "commands/rest_command_transport.hpp"
#include "commands/table_command_transport.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace service {

namespace {

utils::CurlHttpSession::Config http_config(const config::RigConfig& cfg) {
    utils::CurlHttpSession::Config hc;
    hc.base_url = cfg.backend.url;
    hc.timeout_s = cfg.backend.timeout_s;
    if (!cfg.device.api_key.empty()) {
        if (cfg.backend.transport == "table") {
            hc.headers["apikey"] = cfg.device.api_key;
            hc.headers["Authorization"] = "Bearer " + cfg.device.api_key;
        } else {
            hc.headers["X-Device-Key"] = cfg.device.api_key;
        }
    }
    return hc;
}

std::vector<std::unique_ptr<controls::BindingSource>> binding_sources(const config::RigConfig& cfg) {
    // Lowest precedence first.
    std::vector<std::unique_ptr<controls::BindingSource>> sources;
    if (!cfg.controls.app_ini_path.empty()) {
        sources.push_back(std::make_unique<controls::IniBindingSource>(cfg.controls.app_ini_path));
    }
    if (!cfg.controls.controls_cfg_path.empty()) {
        sources.push_back(std::make_unique<controls::ControlsCfgBindingSource>(cfg.controls.controls_cfg_path));
    }
    if (!cfg.controls.override_path.empty()) {
        sources.push_back(std::make_unique<controls::YamlBindingSource>(cfg.controls.override_path));
    }
    return sources;
}

} // namespace

RigService::RigService(const config::RigConfig& cfg,
                       telemetry::TelemetrySource& telemetry,
                       controls::KeyInjector& injector,
                       std::unique_ptr<utils::HttpSession> http,
                       std::unique_ptr<utils::Clock> clock)
    : cfg_(cfg)
    , telemetry_(telemetry)
    , clock_(std::move(clock))
    , http_(std::move(http))
{
    cfg_.validate();

    if (!clock_) clock_ = std::make_unique<utils::SteadyClock>();
    if (!http_) http_ = std::make_unique<utils::CurlHttpSession>(http_config(cfg_));

    build_backend(injector);
    session_reset_thread_ = std::thread(&RigService::session_reset_loop, this);
}

RigService::~RigService() {
    stop();

    {
        std::lock_guard<std::mutex> lock(reset_mu_);
        reset_shutdown_ = true;
    }
    reset_cv_.notify_all();
    if (session_reset_thread_.joinable()) {
        session_reset_thread_.join();
    }
}

void RigService::build_backend(controls::KeyInjector& injector) {
    utils::Clock& clock = *clock_;

    // ========================================================================
    // Backend adapters
    // ========================================================================
    if (cfg_.backend.transport == "table") {
        commands::TableCommandTransport::Config tc;
        tc.device_id = cfg_.device.id;
        transport_ = std::make_unique<commands::TableCommandTransport>(*http_, clock, tc);
        publisher_ = std::make_unique<state::TableStatePublisher>(*http_, clock, cfg_.device.id);
    } else {
        transport_ = std::make_unique<commands::RestCommandTransport>(*http_, cfg_.device.id);
        publisher_ = std::make_unique<state::RestStatePublisher>(*http_, cfg_.device.id);
    }

    // ========================================================================
    // Controls
    // ========================================================================
    bindings_ = std::make_unique<controls::ControlBindingStore>(binding_sources(cfg_), clock, cfg_.bindings);
    executor_ = std::make_unique<controls::ComboExecutor>(injector, telemetry_, clock, cfg_.executor);

    // ========================================================================
    // Commands and state
    // ========================================================================
    dispatcher_ = std::make_unique<commands::ActionDispatcher>(
        *executor_, *bindings_, telemetry_, action_log_, clock, cfg_.dispatcher);
    queue_ = std::make_unique<commands::CommandQueue>(*transport_, *dispatcher_, telemetry_, clock, cfg_.queue);
    reconciler_ = std::make_unique<state::StateReconciler>(*publisher_, clock, cfg_.state);
    tracker_ = std::make_unique<state::TimedSessionTracker>(*publisher_, clock, cfg_.timed_session);

    // Wiring
    dispatcher_->set_state_resync([this] {
        return reconciler_->force_push_verified([this] { return telemetry_.get_current(); },
                                                cfg_.state_verify_attempts,
                                                cfg_.state_verify_settle_s);
    });
    dispatcher_->set_timed_session_arm([this](double duration_s, const std::string& driver) {
        tracker_->arm(duration_s, driver);
    });
    // Runs on the telemetry thread: hand off, never wait on the dispatch lock here.
    tracker_->set_reset_fn([this] { request_session_reset(); });
    queue_->set_post_command_hook([this](const commands::Command& cmd, const commands::ActionResult&) {
        // reset_car already pushed a verified state from inside the dispatch.
        // Anything else goes through the normal throttle.
        if (cmd.kind == commands::ActionKind::ResetCar) return;
        reconciler_->on_tick(telemetry_.get_current());
    });
    queue_->set_event_callback([](const commands::CommandEvent& ev) {
        if (ev.phase == commands::CommandEvent::Phase::Started) {
            LOG_INFO("[Service] Running %s (id: %s)", ev.command.action.c_str(), ev.command.id.c_str());
        } else if (ev.result) {
            LOG_INFO("[Service] %s %s: %s", ev.command.action.c_str(),
                     ev.result->success ? "completed" : "failed", ev.result->message.c_str());
        }
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

void RigService::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (running_) return;

    LOG_INFO("[Service] Starting for device %s (%s backend)", cfg_.device.id.c_str(), transport_->name().c_str());

    bindings_->reload(true);
    tracker_->restore(publisher_->fetch_timed_session());

    // Connectivity must be known before the first command is gated.
    telemetry_tick();
    queue_->start();

    {
        std::lock_guard<std::mutex> wake_lock(wake_mu_);
        stop_requested_ = false;
    }
    running_ = true;
    telemetry_thread_ = std::thread(&RigService::telemetry_loop, this);
}

void RigService::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (!running_) return;
    running_ = false;

    queue_->stop();
    dispatcher_->stop_timed_reset();

    {
        std::lock_guard<std::mutex> wake_lock(wake_mu_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (telemetry_thread_.joinable()) {
        telemetry_thread_.join();
    }
    LOG_INFO("[Service] Stopped");
}

void RigService::telemetry_loop() {
    const double period_s = 1.0 / cfg_.telemetry_poll_hz;
    while (true) {
        std::unique_lock<std::mutex> lock(wake_mu_);
        wake_cv_.wait_for(lock, std::chrono::duration<double>(period_s), [this] { return stop_requested_; });
        if (stop_requested_) break;
        lock.unlock();

        telemetry_tick();
    }
}

void RigService::telemetry_tick() {
    const auto snap = telemetry_.get_current();

    if (snap && !seen_connected_) {
        seen_connected_ = true;
        queue_->set_connected_at(clock_->wall_now());
        LOG_INFO("[Service] Simulator connected: %s / %s", snap->track_name.c_str(), snap->car_name.c_str());
    }

    reconciler_->on_tick(snap);
    tracker_->tick(snap);
}

// ============================================================================
// Timed session reset worker
// ============================================================================

void RigService::request_session_reset() {
    {
        std::lock_guard<std::mutex> lock(reset_mu_);
        reset_pending_ = true;
    }
    reset_cv_.notify_one();
}

void RigService::session_reset_loop() {
    while (true) {
        std::unique_lock<std::mutex> lock(reset_mu_);
        reset_cv_.wait(lock, [this] { return reset_pending_ || reset_shutdown_; });
        if (reset_shutdown_) break;
        reset_pending_ = false;
        lock.unlock();

        const auto r = dispatcher_->execute_action("reset_car", nlohmann::json::object(), "timed_session");
        if (!r.success) {
            LOG_WARN("[Service] Timed session reset failed: %s", r.message.c_str());
        }
    }
}

} // namespace service
