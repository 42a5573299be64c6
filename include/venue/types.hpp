#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace venue {

enum class Side { Buy, Sell };

enum class OrderType { Limit, Market };

enum class TimeInForce { GTC, IOC, FOK, PostOnly };

enum class OrderStatus { New, PartiallyFilled, Filled, Cancelled, Rejected, Unknown };

const char* to_string(Side side) noexcept;
const char* to_string(OrderType type) noexcept;
const char* to_string(TimeInForce tif) noexcept;
const char* to_string(OrderStatus status) noexcept;

std::optional<Side> parse_side(const std::string& text);
OrderStatus parse_order_status(const std::string& text);

inline Side opposite(Side side) noexcept {
    return side == Side::Buy ? Side::Sell : Side::Buy;
}

struct Ticker {
    std::string symbol;
    double last = 0.0;
    double bid = 0.0;
    double ask = 0.0;
};

struct InstrumentSpec {
    std::string symbol;
    double tick_size = 0.01;
    double qty_step = 0.0001;
    double min_qty = 0.0001;
    int max_leverage = 125;
};

struct ExchangeOrder {
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    Side side = Side::Buy;
    OrderType type = OrderType::Limit;
    double price = 0.0;
    double qty = 0.0;
    double filled_qty = 0.0;
    OrderStatus status = OrderStatus::New;
    int64_t created_ms = 0;
};

struct OrderRequest {
    std::string symbol;
    Side side = Side::Buy;
    OrderType type = OrderType::Limit;
    TimeInForce time_in_force = TimeInForce::GTC;
    double qty = 0.0;
    double price = 0.0;     // ignored for market orders
    std::string client_order_id;
    bool reduce_only = false;
};

struct PlaceResult {
    std::string order_id;
    std::string client_order_id;
};

// Signed size: positive long, negative short.
struct PositionInfo {
    std::string symbol;
    double signed_size = 0.0;
    double entry_price = 0.0;
    double mark_price = 0.0;
    double unrealized_pnl = 0.0;
};

struct FillRecord {
    std::string order_id;
    std::string client_order_id;
    Side side = Side::Buy;
    double price = 0.0;
    double qty = 0.0;
    double fee = 0.0;
    int64_t timestamp_ms = 0;
};

} // namespace venue
