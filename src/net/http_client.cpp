#include "../../include/net/http_client.hpp"
#include "../../include/safety/circuit_breaker.hpp"

#include <chrono>
#include <mutex>

namespace chartagent::net {

namespace {
std::once_flag g_curl_init;
}

HttpClient::HttpClient(uint32_t timeout_ms) : timeout_ms_(timeout_ms) {
    // curl_global_init is not thread-safe; run it once per process
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    curl_ = curl_easy_init();
    if (curl_) {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        // Reuse connections
        curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl_, CURLOPT_TCP_KEEPIDLE, 120L);
        curl_easy_setopt(curl_, CURLOPT_TCP_KEEPINTVL, 60L);
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& body,
                                   const std::vector<std::string>& headers) {
    HttpResponse response;
    if (!curl_) {
        response.error = ServiceError::transient("HTTP client not initialized");
        return response;
    }

    auto start = std::chrono::steady_clock::now();

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    for (const auto& h : headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl_);

    auto end = std::chrono::steady_clock::now();
    response.latency_ms =
        static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

    curl_slist_free_all(header_list);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        response.error = ServiceError::timeout(std::string("Request timed out: ") + curl_easy_strerror(res));
        return response;
    }
    if (res != CURLE_OK) {
        response.error = ServiceError::transient(curl_easy_strerror(res));
        return response;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.http_code);

    if (response.http_code < 200 || response.http_code >= 300) {
        response.error = classify_http_failure(response.http_code, response.body);
        return response;
    }

    response.success = true;
    return response;
}

ServiceError HttpClient::classify_http_failure(long http_code, const std::string& body) {
    std::string message = "HTTP " + std::to_string(http_code);
    if (!body.empty()) {
        message += ": " + body.substr(0, 200);
    }

    if (http_code == 401 || http_code == 403) {
        return ServiceError{ErrorCategory::CredentialInvalid, message};
    }
    if (http_code == 408 || http_code == 504) {
        return ServiceError{ErrorCategory::Timeout, message};
    }

    // Venues report balance and broker-link problems in the body
    ErrorCategory category = safety::classify_error_message(body);
    if (category == ErrorCategory::Timeout) {
        category = ErrorCategory::Transient;
    }
    return ServiceError{category, message};
}

} // namespace chartagent::net
