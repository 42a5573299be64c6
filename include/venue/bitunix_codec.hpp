#pragma once

#include "venue/client_base.hpp"
#include "venue/stream_codec.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace venue {

enum class BitunixEndpoint { Public, Private };

// Frames for wss://fapi.bitunix.com/public/ and /private/.
class BitunixStreamCodec : public StreamCodec {
public:
    explicit BitunixStreamCodec(BitunixEndpoint endpoint, Credentials credentials = {});

    std::vector<std::string> encode_subscribe(const std::vector<Channel>& channels) const override;
    std::vector<std::string> encode_unsubscribe(const std::vector<Channel>& channels) const override;
    std::string encode_ping() const override;
    std::optional<std::string> encode_login() const override;
    StreamEvent decode(const std::string& frame) const override;
    std::size_t max_channels_per_frame() const override { return 250; }

    // sha256hex(sha256hex(nonce + timestamp + api_key) + secret)
    static std::string login_signature(const std::string& nonce,
                                       const std::string& timestamp,
                                       const std::string& api_key,
                                       const std::string& api_secret);

private:
    std::string encode_channels(const char* op, const std::vector<Channel>& channels) const;
    static StreamEvent decode_ticker(const nlohmann::json& frame);
    static StreamEvent decode_order(const nlohmann::json& frame);
    static StreamEvent decode_position(const nlohmann::json& frame);
    static StreamEvent decode_balance(const nlohmann::json& frame);

    BitunixEndpoint endpoint_;
    Credentials credentials_;
};

} // namespace venue
