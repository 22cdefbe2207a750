// utils/log_throttle.hpp
#pragma once

#include <mutex>

namespace utils {

// Allows one message per window. Callers pass the current monotonic time.
class LogThrottle {
public:
    explicit LogThrottle(double window_s) : window_s_(window_s) {}

    bool should_log(double now_s) {
        std::lock_guard<std::mutex> lock(mu_);
        if (last_s_ >= 0.0 && (now_s - last_s_) < window_s_) {
            ++suppressed_;
            return false;
        }
        last_s_ = now_s;
        return true;
    }

    // Number of messages dropped since the last one allowed through; resets.
    int take_suppressed() {
        std::lock_guard<std::mutex> lock(mu_);
        int n = suppressed_;
        suppressed_ = 0;
        return n;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mu_);
        last_s_ = -1.0;
        suppressed_ = 0;
    }

private:
    std::mutex mu_;
    double window_s_;
    double last_s_ = -1.0;
    int suppressed_ = 0;
};

} // namespace utils
