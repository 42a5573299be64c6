#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace venue {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

// Keys sorted ascending, key and value concatenated with no separators.
std::string build_sign_payload(const QueryParams& params);

std::string to_upper_copy(std::string value);

std::string sha256_hex(const std::string& input);

std::string random_nonce(std::size_t length = 32);

int64_t current_timestamp_ms();

// Fixed-point rendering without trailing zeros, e.g. 0.0952 -> "0.0952", 105 -> "105".
std::string format_decimal(double value, int precision);

int decimals_from_step(double step);

struct WsEndpoint {
    std::string host;
    std::string path = "/";
    int port = 443;
    bool ssl = true;
};

std::optional<WsEndpoint> parse_ws_url(const std::string& url);

} // namespace venue
