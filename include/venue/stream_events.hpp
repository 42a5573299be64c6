#pragma once

#include "venue/types.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace venue {

// A channel on a streaming endpoint. Symbol is empty for account-wide channels.
struct Channel {
    std::string name;
    std::string symbol;

    [[nodiscard]] std::string key() const { return symbol.empty() ? name : name + ":" + symbol; }

    bool operator==(const Channel& other) const {
        return name == other.name && symbol == other.symbol;
    }
};

struct TickerEvent {
    std::string symbol;
    double last = 0.0;
    double bid = 0.0;
    double ask = 0.0;
    int64_t timestamp_ms = 0;
};

struct OrderEvent {
    std::string symbol;
    std::string order_id;
    std::string client_order_id;
    Side side = Side::Buy;
    OrderType type = OrderType::Limit;
    OrderStatus status = OrderStatus::Unknown;
    double price = 0.0;
    double qty = 0.0;
    double filled_qty = 0.0;
    double avg_fill_price = 0.0;
    int64_t timestamp_ms = 0;
};

struct PositionEvent {
    PositionInfo position;
    int64_t timestamp_ms = 0;
};

struct BalanceEvent {
    std::string asset;
    double available = 0.0;
    double frozen = 0.0;
    int64_t timestamp_ms = 0;
};

struct PongEvent {
    int64_t timestamp_ms = 0;
};

struct AuthAck {
    bool success = false;
    std::string message;
};

struct SubscribeAck {
    bool success = false;
    std::string message;
};

struct UnknownFrame {
    std::string raw;
};

using StreamEvent = std::variant<TickerEvent,
                                 OrderEvent,
                                 PositionEvent,
                                 BalanceEvent,
                                 PongEvent,
                                 AuthAck,
                                 SubscribeAck,
                                 UnknownFrame>;

} // namespace venue
