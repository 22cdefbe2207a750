// utils/http_client.hpp
#pragma once

#include <map>
#include <memory>
#include <string>

namespace utils {

struct HttpResponse {
    long status = 0;        // HTTP status code, 0 when no response arrived
    std::string body;
    std::string error;      // transport-level error text (DNS, timeout, ...)

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

/**
 * HttpSession - minimal request interface the backend adapters speak.
 *
 * Paths are relative to the session's base URL. Implementations never throw
 * for network or HTTP failures; those come back in HttpResponse.
 */
class HttpSession {
public:
    virtual ~HttpSession() = default;

    virtual HttpResponse request(const std::string& method,
                                 const std::string& path,
                                 const std::string& body = "") = 0;
};

/**
 * CurlHttpSession - libcurl-backed HttpSession.
 *
 * One easy handle per session, guarded by a mutex: the command thread and the
 * telemetry thread share the session for status pushes and command polls.
 */
class CurlHttpSession : public HttpSession {
public:
    struct Config {
        std::string base_url;                         // e.g. https://api.example.com
        std::map<std::string, std::string> headers;   // extra headers, sent on every request
        double timeout_s = 10.0;
    };

    /**
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit CurlHttpSession(const Config& config);
    ~CurlHttpSession() override;

    CurlHttpSession(const CurlHttpSession&) = delete;
    CurlHttpSession& operator=(const CurlHttpSession&) = delete;

    HttpResponse request(const std::string& method,
                         const std::string& path,
                         const std::string& body = "") override;

    const Config& get_config() const { return config_; }

private:
    Config config_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Percent-encode a path segment or query value (RFC 3986 unreserved kept).
std::string url_encode(const std::string& value);

} // namespace utils
