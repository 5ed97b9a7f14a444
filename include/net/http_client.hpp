#pragma once

/**
 * HttpClient - blocking libcurl JSON poster shared by the service clients
 *
 * One CURL handle per client, reused across calls for keep-alive.
 * Not thread-safe: each service client owns its own HttpClient and calls
 * it from the cycle context only.
 */

#include "../core/service_error.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <string>
#include <vector>

namespace chartagent {
namespace net {

struct HttpResponse {
    bool success = false; // Transport ok and HTTP 2xx
    long http_code = 0;
    uint32_t latency_ms = 0;
    std::string body;
    ServiceError error;
};

class HttpClient {
public:
    explicit HttpClient(uint32_t timeout_ms);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    bool is_valid() const { return curl_ != nullptr; }

    void set_timeout_ms(uint32_t timeout_ms) { timeout_ms_ = timeout_ms; }
    uint32_t timeout_ms() const { return timeout_ms_; }

    /**
     * POST a JSON body. Headers are full "Name: value" lines.
     * Content-Type: application/json is always sent.
     */
    HttpResponse post_json(const std::string& url, const std::string& body,
                           const std::vector<std::string>& headers = {});

    /**
     * Map a non-2xx status (and its body text) to a ServiceError.
     */
    static ServiceError classify_http_failure(long http_code, const std::string& body);

private:
    CURL* curl_ = nullptr;
    uint32_t timeout_ms_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

} // namespace net
} // namespace chartagent
