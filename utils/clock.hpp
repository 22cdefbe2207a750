// utils/clock.hpp
#pragma once

#include <chrono>
#include <thread>

namespace utils {

/**
 * Clock - time source used by every wait point in the service.
 *
 * now() is monotonic seconds (throttles, timeouts, hold caps).
 * wall_now() is calendar time (command staleness, persisted session start).
 * Tests substitute a manual clock whose sleep_for() advances virtual time.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual double now() const = 0;
    virtual std::chrono::system_clock::time_point wall_now() const = 0;
    virtual void sleep_for(double seconds) = 0;
};

class SteadyClock : public Clock {
public:
    SteadyClock() : epoch_(std::chrono::steady_clock::now()) {}

    double now() const override {
        using namespace std::chrono;
        return duration_cast<duration<double>>(steady_clock::now() - epoch_).count();
    }

    std::chrono::system_clock::time_point wall_now() const override {
        return std::chrono::system_clock::now();
    }

    void sleep_for(double seconds) override {
        if (seconds <= 0.0) return;
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }

private:
    std::chrono::steady_clock::time_point epoch_;
};

} // namespace utils
