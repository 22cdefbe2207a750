// src/commands/timed_reset.cpp
#include "commands/timed_reset.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace commands {

void TimedResetLoop::start(double interval_s) {
    stop();

    interval_s_ = interval_s;
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = false;
    }
    active_ = true;
    thread_ = std::thread(&TimedResetLoop::run, this);
    LOG_INFO("[TimedReset] Enabled, every %.0fs", interval_s);
}

void TimedResetLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        LOG_INFO("[TimedReset] Disabled");
    }
    active_ = false;
}

void TimedResetLoop::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait_for(lock, std::chrono::duration<double>(interval_s_.load()),
                         [this] { return stop_.load(); });
            if (stop_) break;
        }
        LOG_INFO("[TimedReset] Interval elapsed, resetting car");
        fn_(stop_);
        ++runs_;
    }
}

} // namespace commands
