// src/commands/processed_id_ledger.hpp
#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace commands {

// Ids of every command this process has accepted. Lives as long as the process.
class ProcessedIdLedger {
public:
    // True only for the first caller with this id.
    bool try_insert(const std::string& id) {
        std::lock_guard<std::mutex> lock(mu_);
        return ids_.insert(id).second;
    }

    bool contains(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mu_);
        return ids_.count(id) != 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return ids_.size();
    }

private:
    mutable std::mutex mu_;
    std::unordered_set<std::string> ids_;
};

} // namespace commands
