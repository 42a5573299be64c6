#pragma once

#include "venue/stream_events.hpp"

#include <optional>
#include <string>
#include <vector>

namespace venue {

// Per-exchange wire format for a streaming endpoint.
class StreamCodec {
public:
    virtual ~StreamCodec() = default;

    // One frame per batch of at most max_channels_per_frame() channels.
    virtual std::vector<std::string> encode_subscribe(const std::vector<Channel>& channels) const = 0;
    virtual std::vector<std::string> encode_unsubscribe(const std::vector<Channel>& channels) const = 0;
    virtual std::string encode_ping() const = 0;

    // Login frame for private endpoints; nullopt when none is required.
    virtual std::optional<std::string> encode_login() const { return std::nullopt; }

    virtual StreamEvent decode(const std::string& frame) const = 0;

    virtual std::size_t max_channels_per_frame() const { return 50; }
};

} // namespace venue
