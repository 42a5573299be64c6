#pragma once

#include "venue/errors.hpp"

#include <curl/curl.h>

#include <string>
#include <utility>
#include <vector>

namespace venue {

struct RequestTimings {
    double name_lookup_ms = 0.0;
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    RequestTimings timings;
    long retry_after_s = 0;
    int attempts = 1;
};

// Only reads are retried; a repeated order POST could open a second order.
struct RetryPolicy {
    int max_attempts = 3;
    long base_delay_ms = 250;
    long max_delay_ms = 2000;
};

// No response, request timeout, rate limit, or a server-side failure.
[[nodiscard]] bool is_transient_status(long status_code) noexcept;

// Doubles per attempt up to the cap; a server Retry-After (at most 30s) wins when it is longer.
[[nodiscard]] long retry_delay_ms(const RetryPolicy& policy, int attempt, long retry_after_s) noexcept;

// "GET /api/v1/futures/market/tickers" without the query string.
std::string describe_request(const HttpRequest& request);

class HttpClient {
public:
    explicit HttpClient(long timeout_ms = 5000, long connect_timeout_ms = 3000, RetryPolicy retry = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    // Throws HttpError once retries are spent or on a non-transient status >= 400.
    // status_code() is 0 when no response arrived at all.
    HttpResponse request(const HttpRequest& request) const;

private:
    HttpResponse perform_once(const HttpRequest& request) const;

    long timeout_ms_;
    long connect_timeout_ms_;
    RetryPolicy retry_;
    bool global_initialized_;
};

} // namespace venue
