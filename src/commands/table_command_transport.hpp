// src/commands/table_command_transport.hpp
#pragma once

#include "commands/command_transport.hpp"
#include "utils/clock.hpp"
#include "utils/http_client.hpp"

namespace commands {

/**
 * TableCommandTransport - reads and updates the command table directly
 * through the backend's REST table gateway (PostgREST query syntax).
 *
 * Pending rows are fetched oldest first, at most batch_limit per call.
 * This build has no realtime client, so subscribe() reports unsupported
 * and the queue polls.
 */
class TableCommandTransport : public CommandTransport {
public:
    struct Config {
        std::string device_id;
        std::string table = "irc_device_commands";
        int batch_limit = 10;
    };

    TableCommandTransport(utils::HttpSession& http, utils::Clock& clock, Config config);

    std::string name() const override { return "table"; }

    FetchResult fetch_pending() override;
    bool mark_processing(const std::string& id) override;
    bool mark_complete(const std::string& id,
                       bool success,
                       const nlohmann::json& result,
                       const std::string& message) override;

private:
    utils::HttpSession& http_;
    utils::Clock& clock_;
    Config config_;

    bool patch_row(const std::string& id, const nlohmann::json& body);
};

} // namespace commands
