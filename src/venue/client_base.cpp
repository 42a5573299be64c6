#include "venue/client_base.hpp"

#include <stdexcept>
#include <utility>

namespace venue {

std::string sign_request(const std::string& nonce,
                         const std::string& timestamp,
                         const std::string& api_key,
                         const std::string& query_payload,
                         const std::string& body,
                         const std::string& api_secret) {
    const auto digest = sha256_hex(nonce + timestamp + api_key + query_payload + body);
    return sha256_hex(digest + api_secret);
}

ClientBase::ClientBase(Credentials credentials, std::string base_url, long timeout_ms)
    : credentials_(std::move(credentials)),
      base_url_(std::move(base_url)),
      http_client_(timeout_ms),
      last_timings_{} {}

RequestTimings ClientBase::last_request_timings() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_timings_;
}

bool ClientBase::has_credentials() const noexcept {
    return !credentials_.api_key.empty() && !credentials_.api_secret.empty();
}

HttpResponse ClientBase::public_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    const HttpHeaders headers = {
        {"Content-Type", "application/json"}
    };
    return perform(method, url, headers, "");
}

HttpResponse ClientBase::signed_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params,
    const std::string& body) const {

    if (!has_credentials()) {
        throw std::invalid_argument("API key and secret are required for signed requests");
    }

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    const auto nonce = random_nonce(32);
    const auto timestamp = std::to_string(current_timestamp_ms());
    const auto signature = sign_request(nonce, timestamp, credentials_.api_key,
                                        build_sign_payload(params), body, credentials_.api_secret);

    const HttpHeaders headers = {
        {"Content-Type", "application/json"},
        {"api-key", credentials_.api_key},
        {"nonce", nonce},
        {"timestamp", timestamp},
        {"sign", signature},
        {"language", "en-US"}
    };
    return perform(method, url, headers, body);
}

HttpResponse ClientBase::perform(const std::string& method,
                                 const std::string& url,
                                 const HttpHeaders& headers,
                                 const std::string& body) const {
    auto response = http_client_.request(HttpRequest{method, url, headers, body});
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        last_timings_ = response.timings;
    }
    return response;
}

} // namespace venue
