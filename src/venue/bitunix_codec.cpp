#include "venue/bitunix_codec.hpp"

#include "venue/json_util.hpp"
#include "venue/util.hpp"

#include <utility>

namespace venue {
namespace {

bool ack_result(const nlohmann::json& json) {
    const auto data = json.find("data");
    if (data != json.end() && data->is_object()) {
        return get_bool(*data, "result", false);
    }
    return get_int(json, {"code"}, -1) == 0;
}

const nlohmann::json& payload(const nlohmann::json& frame) {
    static const nlohmann::json empty = nlohmann::json::object();
    const auto it = frame.find("data");
    if (it == frame.end()) {
        return empty;
    }
    if (it->is_array()) {
        return it->empty() ? empty : it->front();
    }
    return *it;
}

} // namespace

BitunixStreamCodec::BitunixStreamCodec(BitunixEndpoint endpoint, Credentials credentials)
    : endpoint_(endpoint),
      credentials_(std::move(credentials)) {}

std::string BitunixStreamCodec::login_signature(const std::string& nonce,
                                                const std::string& timestamp,
                                                const std::string& api_key,
                                                const std::string& api_secret) {
    return sha256_hex(sha256_hex(nonce + timestamp + api_key) + api_secret);
}

std::vector<std::string> BitunixStreamCodec::encode_subscribe(const std::vector<Channel>& channels) const {
    if (channels.empty()) {
        return {};
    }
    return {encode_channels("subscribe", channels)};
}

std::vector<std::string> BitunixStreamCodec::encode_unsubscribe(const std::vector<Channel>& channels) const {
    if (channels.empty()) {
        return {};
    }
    return {encode_channels("unsubscribe", channels)};
}

std::string BitunixStreamCodec::encode_channels(const char* op, const std::vector<Channel>& channels) const {
    nlohmann::json args = nlohmann::json::array();
    for (const auto& channel : channels) {
        nlohmann::json arg;
        if (!channel.symbol.empty()) {
            arg["symbol"] = channel.symbol;
        }
        arg["ch"] = channel.name;
        args.push_back(std::move(arg));
    }
    nlohmann::json frame;
    frame["op"] = op;
    frame["args"] = std::move(args);
    return frame.dump();
}

std::string BitunixStreamCodec::encode_ping() const {
    nlohmann::json frame;
    frame["op"] = "ping";
    frame["ping"] = current_timestamp_ms() / 1000;
    return frame.dump();
}

std::optional<std::string> BitunixStreamCodec::encode_login() const {
    if (endpoint_ != BitunixEndpoint::Private) {
        return std::nullopt;
    }

    const auto nonce = random_nonce(32);
    const auto timestamp = current_timestamp_ms() / 1000;
    nlohmann::json arg;
    arg["apiKey"] = credentials_.api_key;
    arg["timestamp"] = timestamp;
    arg["nonce"] = nonce;
    arg["sign"] = login_signature(nonce, std::to_string(timestamp), credentials_.api_key, credentials_.api_secret);

    nlohmann::json frame;
    frame["op"] = "login";
    frame["args"] = nlohmann::json::array({arg});
    return frame.dump();
}

StreamEvent BitunixStreamCodec::decode(const std::string& frame) const {
    const auto json = nlohmann::json::parse(frame, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return UnknownFrame{frame};
    }

    const auto op = get_string(json, {"op"});
    if (op == "ping" || op == "pong") {
        return PongEvent{get_int(json, {"pong", "ping"}) * 1000};
    }
    if (op == "login") {
        return AuthAck{ack_result(json), get_string(json, {"msg"})};
    }
    if (op == "subscribe" || op == "unsubscribe") {
        return SubscribeAck{ack_result(json), get_string(json, {"msg"})};
    }

    const auto channel = get_string(json, {"ch"});
    if (channel == "ticker") {
        return decode_ticker(json);
    }
    if (channel == "order") {
        return decode_order(json);
    }
    if (channel == "position") {
        return decode_position(json);
    }
    if (channel == "balance") {
        return decode_balance(json);
    }
    return UnknownFrame{frame};
}

StreamEvent BitunixStreamCodec::decode_ticker(const nlohmann::json& frame) {
    const auto& data = payload(frame);
    TickerEvent event;
    event.symbol = get_string(frame, {"symbol"});
    if (event.symbol.empty()) {
        event.symbol = get_string(data, {"symbol", "s"});
    }
    event.last = get_double(data, {"la", "lastPrice", "last"});
    event.bid = get_double(data, {"bd", "bidPrice", "bid"});
    event.ask = get_double(data, {"ak", "askPrice", "ask"});
    event.timestamp_ms = get_int(frame, {"ts"});
    return event;
}

StreamEvent BitunixStreamCodec::decode_order(const nlohmann::json& frame) {
    const auto& data = payload(frame);
    OrderEvent event;
    event.symbol = get_string(data, {"symbol"});
    event.order_id = get_string(data, {"orderId"});
    event.client_order_id = get_string(data, {"clientId"});
    event.side = parse_side(get_string(data, {"side"})).value_or(Side::Buy);
    event.type = to_upper_copy(get_string(data, {"type", "orderType"})) == "MARKET" ? OrderType::Market : OrderType::Limit;
    event.status = parse_order_status(get_string(data, {"orderStatus", "status"}));
    event.price = get_double(data, {"price"});
    event.qty = get_double(data, {"qty"});
    event.filled_qty = get_double(data, {"tradeQty", "dealQty", "executedQty"});
    event.avg_fill_price = get_double(data, {"avgPrice", "averagePrice"});
    if (event.status == OrderStatus::Filled && event.filled_qty <= 0.0) {
        event.filled_qty = event.qty;
    }
    if (event.avg_fill_price <= 0.0) {
        event.avg_fill_price = event.price;
    }
    event.timestamp_ms = get_int(data, {"mtime", "ctime"}, get_int(frame, {"ts"}));
    return event;
}

StreamEvent BitunixStreamCodec::decode_position(const nlohmann::json& frame) {
    const auto& data = payload(frame);
    PositionEvent event;
    event.position.symbol = get_string(data, {"symbol"});
    const double qty = get_double(data, {"qty"});
    const auto side = parse_side(get_string(data, {"side"})).value_or(Side::Buy);
    const bool closed = to_upper_copy(get_string(data, {"event"})) == "CLOSE";
    event.position.signed_size = closed ? 0.0 : (side == Side::Buy ? qty : -qty);
    const double entry_value = get_double(data, {"entryValue"});
    event.position.entry_price = get_double(data, {"avgOpenPrice", "entryPrice"},
                                            qty > 0.0 ? entry_value / qty : 0.0);
    event.position.mark_price = get_double(data, {"markPrice"});
    event.position.unrealized_pnl = closed ? 0.0 : get_double(data, {"unrealizedPNL", "unrealizedPnl"});
    event.timestamp_ms = get_int(frame, {"ts"});
    return event;
}

StreamEvent BitunixStreamCodec::decode_balance(const nlohmann::json& frame) {
    const auto& data = payload(frame);
    BalanceEvent event;
    event.asset = get_string(data, {"coin", "marginCoin"});
    event.available = get_double(data, {"available"});
    event.frozen = get_double(data, {"frozen"});
    event.timestamp_ms = get_int(frame, {"ts"});
    return event;
}

} // namespace venue
