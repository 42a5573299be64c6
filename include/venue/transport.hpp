#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace venue {

struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string& frame)> on_frame;
    std::function<void(const std::string& reason)> on_close;
    std::function<void(const std::string& error)> on_error;
};

// Text-frame transport. Handlers fire on the transport's own read thread.
// on_close fires at most once per open() and is not fired by close().
class Transport {
public:
    virtual ~Transport() = default;

    // Starts connecting; throws TransportError when the attempt cannot begin.
    virtual void open(const std::string& url, TransportHandlers handlers) = 0;

    // Returns false when the frame could not be queued within the timeout.
    virtual bool send(const std::string& frame, std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool is_open() const noexcept = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace venue
