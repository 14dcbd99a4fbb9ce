#pragma once

#include <string>
#include <map>
#include <memory>
#include <stdexcept>
#include <chrono>
#include <vector>

namespace finesse {
namespace currency {

/**
 * A completed HTTP exchange
 */
struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds elapsed;
};

/**
 * HTTP failure
 *
 * status_code() is the HTTP status, or 0 when no response arrived
 * (DNS failure, refused connection, timeout).
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

    // No response at all
    bool is_transport_error() const { return status_code_ == 0; }

private:
    int status_code_;
};

/**
 * Which failed responses are retried, and how long to wait before each retry
 */
struct RetryPolicy {
    std::vector<std::chrono::milliseconds> backoff;

    RetryPolicy();

    // 408, 429 and 5xx
    static bool is_retryable(int status_code);

    int max_attempts() const { return static_cast<int>(backoff.size()) + 1; }
};

/**
 * Blocking JSON-over-HTTP GET client built on libcurl
 *
 * Retries throttled and server-error responses with the backoff of its
 * RetryPolicy (1s, 2s, 4s by default). Transport errors and 4xx responses
 * fail immediately. One instance owns one curl handle and is not shared
 * between threads.
 */
class HttpClient {
public:
    /**
     * @param base_url Prefix for all request paths; a trailing '/' is dropped
     * @param timeout_ms Per-attempt timeout
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * GET base_url + path
     *
     * @throws HttpClientError on transport failure or a status >= 400
     */
    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    void set_retry_policy(const RetryPolicy& policy) { retry_ = policy; }

    // Trace requests and retries to stderr
    void set_verbose(bool verbose) { verbose_ = verbose; }

    const std::string& base_url() const { return base_url_; }

private:
    struct CurlHandle;
    std::unique_ptr<CurlHandle> handle_;
    std::string base_url_;
    int timeout_ms_;
    RetryPolicy retry_;
    bool verbose_;

    // One request, no retries
    HttpResponse perform(const std::string& url, const std::map<std::string, std::string>& headers);
};

} // namespace currency
} // namespace finesse
