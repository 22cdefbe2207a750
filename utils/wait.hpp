// utils/wait.hpp
#pragma once

#include "utils/clock.hpp"
#include <algorithm>
#include <functional>

namespace utils {

struct WaitResult {
    bool satisfied = false;
    double elapsed_s = 0.0;
};

/**
 * Poll pred() every interval_s until it returns true or timeout_s elapses.
 *
 * The predicate is evaluated once before the first sleep, so an already-true
 * condition costs no wait. The last sleep is clipped to the deadline, so the
 * call returns within timeout_s (plus the cost of one predicate evaluation).
 */
inline WaitResult wait_until(Clock& clock,
                             const std::function<bool()>& pred,
                             double timeout_s,
                             double interval_s)
{
    const double start = clock.now();
    const double deadline = start + std::max(0.0, timeout_s);
    if (interval_s <= 0.0) interval_s = 0.01;

    while (true) {
        if (pred()) {
            return {true, clock.now() - start};
        }
        const double now = clock.now();
        if (now >= deadline) {
            return {false, now - start};
        }
        clock.sleep_for(std::min(interval_s, deadline - now));
    }
}

} // namespace utils
