// utils/http_client.cpp
#include "http_client.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct CurlHttpSession::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::mutex mu;

    Impl() {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("[HTTP] Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

static size_t collect_body(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

CurlHttpSession::CurlHttpSession(const Config& config)
    : config_(config)
    , impl_(std::make_unique<Impl>())
{
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: application/json");
    impl_->headers = curl_slist_append(impl_->headers, "Accept: application/json");
    for (const auto& kv : config_.headers) {
        const std::string line = kv.first + ": " + kv.second;
        impl_->headers = curl_slist_append(impl_->headers, line.c_str());
    }

    LOG_DEBUG("[HTTP] Session ready: base=%s headers=%zu timeout=%.1fs",
              config_.base_url.c_str(), config_.headers.size(), config_.timeout_s);
}

CurlHttpSession::~CurlHttpSession() = default;

// ============================================================================
// Public Interface
// ============================================================================

HttpResponse CurlHttpSession::request(const std::string& method,
                                      const std::string& path,
                                      const std::string& body)
{
    HttpResponse resp;
    const std::string url = config_.base_url + path;

    std::lock_guard<std::mutex> lock(impl_->mu);
    CURL* curl = impl_->curl;
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.timeout_s * 1000.0));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        LOG_TRACE("[HTTP] %s %s failed: %s", method.c_str(), path.c_str(), resp.error.c_str());
        return resp;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    LOG_TRACE("[HTTP] %s %s -> %ld (%zu bytes)",
              method.c_str(), path.c_str(), resp.status, resp.body.size());
    return resp;
}

std::string url_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace utils
