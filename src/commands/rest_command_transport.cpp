// src/commands/rest_command_transport.cpp
#include "commands/rest_command_transport.hpp"
#include "utils/logging.hpp"

namespace commands {

RestCommandTransport::RestCommandTransport(utils::HttpSession& http, std::string device_id)
    : http_(http)
    , device_id_(std::move(device_id))
{
}

std::vector<Command> RestCommandTransport::parse_rows(const nlohmann::json& rows) {
    std::vector<Command> out;
    if (!rows.is_array()) return out;

    for (const auto& row : rows) {
        std::string why;
        auto cmd = Command::from_json(row, &why);
        if (cmd) {
            out.push_back(std::move(*cmd));
        } else {
            LOG_WARN("[Commands] Dropping malformed command row: %s", why.c_str());
        }
    }
    return out;
}

FetchResult RestCommandTransport::fetch_pending() {
    FetchResult fr;
    const std::string path = "/api/device/" + utils::url_encode(device_id_) + "/commands?status=pending";

    const auto resp = http_.request("GET", path);
    if (!resp.error.empty()) {
        fr.status = FetchStatus::Error;
        fr.error = resp.error;
        return fr;
    }
    if (resp.status == 404) {
        fr.status = FetchStatus::NotAvailable;
        return fr;
    }
    if (!resp.ok()) {
        fr.status = FetchStatus::Error;
        fr.error = "HTTP " + std::to_string(resp.status);
        return fr;
    }

    auto body = nlohmann::json::parse(resp.body, nullptr, false);
    if (body.is_discarded()) {
        fr.status = FetchStatus::Error;
        fr.error = "invalid JSON in command list";
        return fr;
    }

    // {commands: [...]}, {data: {commands: [...]}} or a bare array
    const nlohmann::json* list = &body;
    if (body.is_object()) {
        if (body.contains("commands")) {
            list = &body["commands"];
        } else if (body.contains("data") && body["data"].is_object() && body["data"].contains("commands")) {
            list = &body["data"]["commands"];
        }
    }
    fr.commands = parse_rows(*list);
    return fr;
}

std::string RestCommandTransport::complete_path(const std::string& id) const {
    return "/api/device/" + utils::url_encode(device_id_) + "/commands/" + utils::url_encode(id) + "/complete";
}

bool RestCommandTransport::post_status(const std::string& id, const nlohmann::json& body) {
    const auto resp = http_.request("POST", complete_path(id), body.dump());
    if (!resp.ok()) {
        const std::string detail = resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error;
        LOG_WARN("[REST] Status update for command %s failed: %s", id.c_str(), detail.c_str());
        return false;
    }
    return true;
}

bool RestCommandTransport::mark_processing(const std::string& id) {
    return post_status(id, {{"status", "processing"}});
}

bool RestCommandTransport::mark_complete(const std::string& id,
                                         bool success,
                                         const nlohmann::json& result,
                                         const std::string& message)
{
    nlohmann::json body;
    body["status"] = success ? "completed" : "failed";
    body["result"] = result;
    if (!success && !message.empty()) {
        body["error_message"] = message;
    }
    return post_status(id, body);
}

} // namespace commands
