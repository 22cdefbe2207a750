// src/controls/action_log.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace controls {

struct ActionLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string action;
    std::optional<std::string> combo;
    std::string key_message;
    std::string source;       // "remote", "timed_session", "timed_reset", "manual", ...
    bool success = false;
    std::string message;
};

// Bounded record of dispatched actions for display. Oldest entries drop first.
class ActionLog {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit ActionLog(size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    void append(ActionLogEntry entry);

    // Newest last; limit 0 returns everything.
    std::vector<ActionLogEntry> recent(size_t limit = 0) const;

    size_t size() const;
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mu_;
    std::deque<ActionLogEntry> entries_;
};

} // namespace controls
