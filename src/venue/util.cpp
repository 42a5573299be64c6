#include "venue/util.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace venue {

std::string url_encode(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped.push_back(static_cast<char>(c));
        } else {
            escaped.push_back('%');
            constexpr char hex_chars[] = "0123456789ABCDEF";
            escaped.push_back(hex_chars[(c >> 4) & 0x0F]);
            escaped.push_back(hex_chars[c & 0x0F]);
        }
    }
    return escaped;
}

QueryParams filter_empty(const QueryParams& params) {
    QueryParams filtered;
    filtered.reserve(params.size());
    for (const auto& [key, value] : params) {
        if (!value.empty()) {
            filtered.emplace_back(key, value);
        }
    }
    return filtered;
}

std::string build_query_string(const QueryParams& params) {
    const auto filtered = filter_empty(params);
    std::ostringstream oss;
    for (std::size_t i = 0; i < filtered.size(); ++i) {
        if (i != 0) {
            oss << '&';
        }
        oss << url_encode(filtered[i].first) << '=' << url_encode(filtered[i].second);
    }
    return oss.str();
}

std::string build_sign_payload(const QueryParams& params) {
    auto sorted = filter_empty(params);
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });
    std::string payload;
    for (const auto& [key, value] : sorted) {
        payload += key;
        payload += value;
    }
    return payload;
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string sha256_hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string random_nonce(std::size_t length) {
    std::vector<unsigned char> bytes((length + 1) / 2);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("Failed to generate random nonce");
    }
    std::ostringstream oss;
    for (unsigned char b : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    return oss.str().substr(0, length);
}

int64_t current_timestamp_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(std::max(precision, 0)) << value;
    auto text = oss.str();
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

int decimals_from_step(double step) {
    if (step <= 0.0) {
        return 8;
    }
    int decimals = 0;
    double scaled = step;
    while (decimals < 12 && std::fabs(scaled - std::round(scaled)) > 1e-9) {
        scaled *= 10.0;
        ++decimals;
    }
    return decimals;
}

std::optional<WsEndpoint> parse_ws_url(const std::string& url) {
    WsEndpoint endpoint;
    std::size_t start = 0;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.ssl = true;
        endpoint.port = 443;
        start = 6;
    } else if (url.rfind("ws://", 0) == 0) {
        endpoint.ssl = false;
        endpoint.port = 80;
        start = 5;
    } else {
        return std::nullopt;
    }

    const auto slash = url.find('/', start);
    if (slash == std::string::npos) {
        endpoint.host = url.substr(start);
    } else {
        endpoint.host = url.substr(start, slash - start);
        endpoint.path = url.substr(slash);
    }

    const auto colon = endpoint.host.find(':');
    if (colon != std::string::npos) {
        const auto port_text = endpoint.host.substr(colon + 1);
        if (port_text.empty() ||
            !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        endpoint.port = std::stoi(port_text);
        endpoint.host = endpoint.host.substr(0, colon);
    }

    if (endpoint.host.empty()) {
        return std::nullopt;
    }
    return endpoint;
}

} // namespace venue
