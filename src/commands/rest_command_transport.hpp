// src/commands/rest_command_transport.hpp
#pragma once

#include "commands/command_transport.hpp"
#include "utils/http_client.hpp"

namespace commands {

/**
 * RestCommandTransport - polls the device command endpoint.
 *
 *   GET  /api/device/{device}/commands?status=pending      -> {commands: [...]}
 *   POST /api/device/{device}/commands/{id}/complete       {status: "processing"}
 *   POST /api/device/{device}/commands/{id}/complete       {status, result, error_message?}
 *
 * A 404 on the list endpoint means the backend has no command feature.
 * No push feed; subscribe() keeps the default (false).
 */
class RestCommandTransport : public CommandTransport {
public:
    RestCommandTransport(utils::HttpSession& http, std::string device_id);

    std::string name() const override { return "rest"; }

    FetchResult fetch_pending() override;
    bool mark_processing(const std::string& id) override;
    bool mark_complete(const std::string& id,
                       bool success,
                       const nlohmann::json& result,
                       const std::string& message) override;

    // Shared with the table transport: decode a JSON array of rows.
    static std::vector<Command> parse_rows(const nlohmann::json& rows);

private:
    utils::HttpSession& http_;
    std::string device_id_;

    std::string complete_path(const std::string& id) const;
    bool post_status(const std::string& id, const nlohmann::json& body);
};

} // namespace commands
