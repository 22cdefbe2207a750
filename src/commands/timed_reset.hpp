// src/commands/timed_reset.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace commands {

/**
 * TimedResetLoop - runs a reset callback every interval_s on its own thread.
 *
 * The callback receives the loop's stop flag and must return promptly once it
 * is set; stop() joins the thread, so the callback must never wait on
 * something held by the caller of stop() without watching the flag.
 */
class TimedResetLoop {
public:
    using ResetFn = std::function<void(const std::atomic<bool>& stop)>;

    explicit TimedResetLoop(ResetFn fn) : fn_(std::move(fn)) {}
    ~TimedResetLoop() { stop(); }

    TimedResetLoop(const TimedResetLoop&) = delete;
    TimedResetLoop& operator=(const TimedResetLoop&) = delete;

    // (Re)starts with a new interval.
    void start(double interval_s);
    void stop();

    bool active() const { return active_; }
    double interval_s() const { return interval_s_; }
    int runs() const { return runs_; }

private:
    ResetFn fn_;
    std::thread thread_;
    std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> active_{false};
    std::atomic<double> interval_s_{0.0};
    std::atomic<int> runs_{0};

    void run();
};

} // namespace commands
