// src/controls/action_log.cpp
#include "controls/action_log.hpp"

namespace controls {

void ActionLog::append(ActionLogEntry entry) {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<ActionLogEntry> ActionLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = entries_.size();
    if (limit > 0 && limit < n) n = limit;
    return std::vector<ActionLogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
}

size_t ActionLog::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

void ActionLog::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
}

} // namespace controls
