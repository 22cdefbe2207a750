// src/commands/table_command_transport.cpp
#include "commands/table_command_transport.hpp"
#include "commands/rest_command_transport.hpp"
#include "utils/logging.hpp"

namespace commands {

TableCommandTransport::TableCommandTransport(utils::HttpSession& http,
                                             utils::Clock& clock,
                                             Config config)
    : http_(http)
    , clock_(clock)
    , config_(std::move(config))
{
}

FetchResult TableCommandTransport::fetch_pending() {
    FetchResult fr;
    const std::string path = "/rest/v1/" + config_.table +
                             "?select=*" +
                             "&device_id=eq." + utils::url_encode(config_.device_id) +
                             "&status=eq.pending" +
                             "&order=created_at.asc" +
                             "&limit=" + std::to_string(config_.batch_limit);

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

    auto rows = nlohmann::json::parse(resp.body, nullptr, false);
    if (!rows.is_array()) {
        fr.status = FetchStatus::Error;
        fr.error = "expected a JSON array of rows";
        return fr;
    }
    fr.commands = RestCommandTransport::parse_rows(rows);
    return fr;
}

bool TableCommandTransport::patch_row(const std::string& id, const nlohmann::json& body) {
    const std::string path = "/rest/v1/" + config_.table + "?id=eq." + utils::url_encode(id);
    const auto resp = http_.request("PATCH", path, body.dump());
    if (!resp.ok()) {
        const std::string detail = resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error;
        LOG_WARN("[Table] Update of command %s failed: %s", id.c_str(), detail.c_str());
        return false;
    }
    return true;
}

bool TableCommandTransport::mark_processing(const std::string& id) {
    return patch_row(id, {{"status", "processing"}});
}

bool TableCommandTransport::mark_complete(const std::string& id,
                                          bool success,
                                          const nlohmann::json& result,
                                          const std::string& message)
{
    nlohmann::json body;
    body["status"] = success ? "completed" : "failed";
    body["result"] = result;
    body["completed_at"] = format_iso8601(clock_.wall_now());
    if (!success && !message.empty()) {
        body["error_message"] = message;
    }
    return patch_row(id, body);
}

} // namespace commands
