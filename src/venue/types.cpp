#include "venue/types.hpp"

#include "venue/util.hpp"

namespace venue {

const char* to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

const char* to_string(OrderType type) noexcept {
    return type == OrderType::Limit ? "LIMIT" : "MARKET";
}

const char* to_string(TimeInForce tif) noexcept {
    switch (tif) {
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
        case TimeInForce::PostOnly: return "POST_ONLY";
    }
    return "GTC";
}

const char* to_string(OrderStatus status) noexcept {
    switch (status) {
        case OrderStatus::New: return "NEW";
        case OrderStatus::PartiallyFilled: return "PART_FILLED";
        case OrderStatus::Filled: return "FILLED";
        case OrderStatus::Cancelled: return "CANCELED";
        case OrderStatus::Rejected: return "REJECTED";
        case OrderStatus::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::optional<Side> parse_side(const std::string& text) {
    const auto upper = to_upper_copy(text);
    if (upper == "BUY" || upper == "LONG" || upper == "B") {
        return Side::Buy;
    }
    if (upper == "SELL" || upper == "SHORT" || upper == "S") {
        return Side::Sell;
    }
    return std::nullopt;
}

OrderStatus parse_order_status(const std::string& text) {
    const auto upper = to_upper_copy(text);
    if (upper == "NEW" || upper == "INIT" || upper == "OPEN") {
        return OrderStatus::New;
    }
    if (upper == "PART_FILLED" || upper == "PARTIALLY_FILLED") {
        return OrderStatus::PartiallyFilled;
    }
    if (upper == "FILLED") {
        return OrderStatus::Filled;
    }
    if (upper == "CANCELED" || upper == "CANCELLED" || upper == "PART_FILLED_CANCELED") {
        return OrderStatus::Cancelled;
    }
    if (upper == "REJECTED" || upper == "EXPIRED") {
        return OrderStatus::Rejected;
    }
    return OrderStatus::Unknown;
}

} // namespace venue
