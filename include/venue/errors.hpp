#pragma once

#include <stdexcept>
#include <string>

namespace venue {

class VenueError : public std::runtime_error {
public:
    explicit VenueError(const std::string& message)
        : std::runtime_error(message) {}
};

class HttpError : public VenueError {
public:
    explicit HttpError(const std::string& message, long status_code = 0)
        : VenueError(message), status_code_(status_code) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }

private:
    long status_code_;
};

// Exchange answered with a non-zero business code.
class ExchangeError : public VenueError {
public:
    ExchangeError(const std::string& message, int code)
        : VenueError(message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

class OrderRejected : public ExchangeError {
public:
    OrderRejected(const std::string& message, int code)
        : ExchangeError(message, code) {}
};

class TransportError : public VenueError {
public:
    explicit TransportError(const std::string& message)
        : VenueError(message) {}
};

class NotConnected : public TransportError {
public:
    NotConnected()
        : TransportError("stream is not connected") {}
};

class SubscriptionLimit : public VenueError {
public:
    SubscriptionLimit(std::size_t rejected, std::size_t limit)
        : VenueError("subscription limit of " + std::to_string(limit) + " reached, " +
                     std::to_string(rejected) + " channel(s) rejected"),
          rejected_(rejected) {}

    [[nodiscard]] std::size_t rejected() const noexcept { return rejected_; }

private:
    std::size_t rejected_;
};

} // namespace venue
