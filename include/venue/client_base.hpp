#pragma once

#include "venue/http_client.hpp"
#include "venue/util.hpp"

#include <mutex>
#include <string>

namespace venue {

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

// sha256hex(sha256hex(nonce + timestamp + api_key + query_payload + body) + secret)
std::string sign_request(const std::string& nonce,
                         const std::string& timestamp,
                         const std::string& api_key,
                         const std::string& query_payload,
                         const std::string& body,
                         const std::string& api_secret);

class ClientBase {
public:
    explicit ClientBase(Credentials credentials,
                        std::string base_url = "https://fapi.bitunix.com",
                        long timeout_ms = 5000);

    [[nodiscard]] RequestTimings last_request_timings() const;
    [[nodiscard]] bool has_credentials() const noexcept;

protected:
    HttpResponse public_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    HttpResponse signed_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {},
        const std::string& body = "") const;

    const Credentials& credentials() const noexcept { return credentials_; }

private:
    HttpResponse perform(const std::string& method,
                         const std::string& url,
                         const HttpHeaders& headers,
                         const std::string& body) const;

    Credentials credentials_;
    std::string base_url_;
    HttpClient http_client_;
    mutable RequestTimings last_timings_;
    mutable std::mutex request_mutex_;
};

} // namespace venue
