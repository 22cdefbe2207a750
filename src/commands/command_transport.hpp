// src/commands/command_transport.hpp
#pragma once

#include "commands/command.hpp"
#include <functional>
#include <string>
#include <vector>

namespace commands {

enum class FetchStatus {
    Ok,
    NotAvailable,   // backend does not offer commands (404); not an error
    Error           // transient failure, retry later
};

struct FetchResult {
    FetchStatus status = FetchStatus::Ok;
    std::vector<Command> commands;
    std::string error;
};

using CommandCallback = std::function<void(const Command&)>;

/**
 * CommandTransport - delivery and status write-back for remote commands.
 *
 * Writes return false on failure instead of throwing; the queue logs and
 * moves on. Push delivery is optional: subscribe() returns false when the
 * realization has no change feed, and the queue then polls.
 */
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    virtual std::string name() const = 0;

    virtual FetchResult fetch_pending() = 0;

    virtual bool mark_processing(const std::string& id) = 0;

    /**
     * Terminal write-back.
     * @param result  structured detail (see ActionResult::to_json)
     * @param message error_message sent when success is false
     */
    virtual bool mark_complete(const std::string& id,
                               bool success,
                               const nlohmann::json& result,
                               const std::string& message) = 0;

    virtual bool subscribe(CommandCallback /*on_command*/) { return false; }
    virtual void unsubscribe() {}
};

} // namespace commands
