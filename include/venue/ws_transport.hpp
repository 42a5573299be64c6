#pragma once

#include "venue/transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace venue {

// libwebsockets client. One service thread per instance is the read loop;
// outbound frames go through a bounded queue drained on LWS_CALLBACK_CLIENT_WRITEABLE.
class WsTransport : public Transport {
public:
    explicit WsTransport(std::size_t max_queued_frames = 256);
    ~WsTransport() override;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;
    WsTransport(WsTransport&&) noexcept = delete;
    WsTransport& operator=(WsTransport&&) noexcept = delete;

    void open(const std::string& url, TransportHandlers handlers) override;
    bool send(const std::string& frame, std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const noexcept override;

    // Public for callback access (implementation detail)
    struct Impl;

private:
    std::unique_ptr<Impl> pimpl_;
};

} // namespace venue
