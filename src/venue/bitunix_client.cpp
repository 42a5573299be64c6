#include "venue/bitunix_client.hpp"

#include "venue/errors.hpp"
#include "venue/json_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace venue {
namespace {

constexpr const char* kTickersPath = "/api/v1/futures/market/tickers";
constexpr const char* kTradingPairsPath = "/api/v1/futures/market/trading_pairs";
constexpr const char* kPendingOrdersPath = "/api/v1/futures/trade/get_pending_orders";
constexpr const char* kPlaceOrderPath = "/api/v1/futures/trade/place_order";
constexpr const char* kCancelOrdersPath = "/api/v1/futures/trade/cancel_orders";
constexpr const char* kPendingPositionsPath = "/api/v1/futures/position/get_pending_positions";
constexpr const char* kHistoryTradesPath = "/api/v1/futures/trade/get_history_trades";

double step_from_precision(int64_t decimals) {
    return std::pow(10.0, -static_cast<double>(std::clamp<int64_t>(decimals, 0, 12)));
}

const nlohmann::json& list_field(const nlohmann::json& data, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    if (data.is_array()) {
        return data;
    }
    if (data.is_object()) {
        const auto it = data.find(key);
        if (it != data.end() && it->is_array()) {
            return *it;
        }
    }
    return empty;
}

} // namespace

BitunixClient::BitunixClient(Credentials credentials, std::string base_url, long timeout_ms)
    : ClientBase(std::move(credentials), std::move(base_url), timeout_ms) {}

nlohmann::json BitunixClient::unwrap(const std::string& body, const std::string& what, bool order_endpoint) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ExchangeError(what + ": malformed response: " + ex.what(), -1);
    }

    const auto code = static_cast<int>(get_int(json, {"code"}, -1));
    if (code != 0) {
        const auto message = what + ": " + get_string(json, {"msg", "message"}) + " (code " + std::to_string(code) + ")";
        if (order_endpoint) {
            throw OrderRejected(message, code);
        }
        throw ExchangeError(message, code);
    }

    const auto it = json.find("data");
    return it == json.end() ? nlohmann::json() : *it;
}

std::vector<Ticker> BitunixClient::parse_tickers(const nlohmann::json& data) {
    std::vector<Ticker> tickers;
    for (const auto& item : list_field(data, "list")) {
        Ticker ticker;
        ticker.symbol = get_string(item, {"symbol"});
        ticker.last = get_double(item, {"lastPrice", "last", "markPrice"});
        ticker.bid = get_double(item, {"bestBid", "bidPrice", "bid"});
        ticker.ask = get_double(item, {"bestAsk", "askPrice", "ask"});
        if (!ticker.symbol.empty()) {
            tickers.push_back(std::move(ticker));
        }
    }
    return tickers;
}

InstrumentSpec BitunixClient::parse_instrument(const nlohmann::json& item) {
    InstrumentSpec spec;
    spec.symbol = get_string(item, {"symbol"});
    spec.qty_step = step_from_precision(get_int(item, {"basePrecision"}, 4));
    spec.tick_size = step_from_precision(get_int(item, {"quotePrecision"}, 2));
    spec.min_qty = get_double(item, {"minTradeVolume"}, spec.qty_step);
    spec.max_leverage = static_cast<int>(get_int(item, {"maxLeverage"}, 125));
    return spec;
}

ExchangeOrder BitunixClient::parse_order(const nlohmann::json& item) {
    ExchangeOrder order;
    order.order_id = get_string(item, {"orderId"});
    order.client_order_id = get_string(item, {"clientId"});
    order.symbol = get_string(item, {"symbol"});
    order.side = parse_side(get_string(item, {"side"})).value_or(Side::Buy);
    order.type = to_upper_copy(get_string(item, {"orderType", "type"})) == "MARKET" ? OrderType::Market : OrderType::Limit;
    order.price = get_double(item, {"price"});
    order.qty = get_double(item, {"qty"});
    order.filled_qty = get_double(item, {"tradeQty", "executedQty", "dealAmount"});
    order.status = parse_order_status(get_string(item, {"status", "orderStatus"}));
    order.created_ms = get_int(item, {"ctime", "createTime"});
    return order;
}

PositionInfo BitunixClient::parse_position(const std::string& symbol, const nlohmann::json& data) {
    PositionInfo info;
    info.symbol = symbol;
    double largest = 0.0;
    for (const auto& item : list_field(data, "positionList")) {
        if (get_string(item, {"symbol"}) != symbol) {
            continue;
        }
        const double qty = get_double(item, {"qty"});
        const auto side = parse_side(get_string(item, {"side"})).value_or(Side::Buy);
        const double entry_value = get_double(item, {"entryValue"});

        // Hedge mode reports one row per side; net them and keep the dominant entry.
        info.signed_size += side == Side::Buy ? qty : -qty;
        if (qty > largest) {
            largest = qty;
            info.entry_price = get_double(item, {"avgOpenPrice", "entryPrice"},
                                          qty > 0.0 ? entry_value / qty : 0.0);
        }
        info.mark_price = get_double(item, {"markPrice"}, info.mark_price);
        info.unrealized_pnl += get_double(item, {"unrealizedPNL", "unrealizedPnl"});
    }
    return info;
}

FillRecord BitunixClient::parse_fill(const nlohmann::json& item) {
    FillRecord fill;
    fill.order_id = get_string(item, {"orderId"});
    fill.client_order_id = get_string(item, {"clientId"});
    fill.side = parse_side(get_string(item, {"side"})).value_or(Side::Buy);
    fill.price = get_double(item, {"price"});
    fill.qty = get_double(item, {"qty"});
    fill.fee = get_double(item, {"fee"});
    fill.timestamp_ms = get_int(item, {"ctime", "createTime", "time"});
    return fill;
}

nlohmann::json BitunixClient::build_order_body(const OrderRequest& request, const InstrumentSpec& spec) {
    nlohmann::json body;
    body["symbol"] = request.symbol;
    body["side"] = to_string(request.side);
    body["qty"] = format_decimal(request.qty, decimals_from_step(spec.qty_step));
    body["orderType"] = to_string(request.type);
    if (request.type == OrderType::Limit) {
        body["price"] = format_decimal(request.price, decimals_from_step(spec.tick_size));
        body["effect"] = to_string(request.time_in_force);
    }
    body["tradeSide"] = "OPEN";
    body["reduceOnly"] = request.reduce_only;
    if (!request.client_order_id.empty()) {
        body["clientId"] = request.client_order_id;
    }
    return body;
}

std::vector<Ticker> BitunixClient::fetch_tickers() {
    const auto response = public_request("GET", kTickersPath);
    return parse_tickers(unwrap(response.body, "fetch_tickers"));
}

InstrumentSpec BitunixClient::fetch_instrument(const std::string& symbol) {
    const auto response = public_request("GET", kTradingPairsPath, {{"symbols", symbol}});
    const auto data = unwrap(response.body, "fetch_instrument");
    for (const auto& item : list_field(data, "list")) {
        if (get_string(item, {"symbol"}) == symbol) {
            auto spec = parse_instrument(item);
            std::lock_guard<std::mutex> lock(instruments_mutex_);
            instruments_[symbol] = spec;
            return spec;
        }
    }
    throw ExchangeError("fetch_instrument: unknown symbol " + symbol, -1);
}

std::vector<ExchangeOrder> BitunixClient::fetch_open_orders(const std::string& symbol) {
    const auto response = signed_request("GET", kPendingOrdersPath, {{"symbol", symbol}, {"limit", "100"}});
    const auto data = unwrap(response.body, "fetch_open_orders");

    std::vector<ExchangeOrder> orders;
    for (const auto& item : list_field(data, "orderList")) {
        auto order = parse_order(item);
        if (order.symbol.empty()) {
            order.symbol = symbol;
        }
        if (order.symbol == symbol) {
            orders.push_back(std::move(order));
        }
    }
    return orders;
}

PlaceResult BitunixClient::place_order(const OrderRequest& request) {
    const auto spec = instrument_cached(request.symbol);
    const auto body = build_order_body(request, spec).dump();
    const auto response = signed_request("POST", kPlaceOrderPath, {}, body);
    const auto data = unwrap(response.body, "place_order " + request.client_order_id, true);

    PlaceResult result;
    result.order_id = get_string(data, {"orderId"});
    result.client_order_id = get_string(data, {"clientId"});
    if (result.client_order_id.empty()) {
        result.client_order_id = request.client_order_id;
    }
    if (result.order_id.empty()) {
        throw OrderRejected("place_order: response carried no orderId", -1);
    }
    return result;
}

void BitunixClient::cancel_order(const std::string& symbol,
                                 const std::string& order_id,
                                 const std::string& client_order_id) {
    if (order_id.empty() && client_order_id.empty()) {
        throw std::invalid_argument("cancel_order requires an order id or a client order id");
    }

    nlohmann::json item;
    if (!order_id.empty()) {
        item["orderId"] = order_id;
    } else {
        item["clientId"] = client_order_id;
    }
    nlohmann::json body;
    body["symbol"] = symbol;
    body["orderList"] = nlohmann::json::array({item});

    const auto response = signed_request("POST", kCancelOrdersPath, {}, body.dump());
    const auto data = unwrap(response.body, "cancel_order", true);

    const auto& failures = list_field(data, "failureList");
    if (!failures.empty() && data.is_object()) {
        const auto& failure = failures.front();
        throw OrderRejected("cancel_order: " + get_string(failure, {"errorMsg", "msg"}),
                            static_cast<int>(get_int(failure, {"errorCode", "code"}, -1)));
    }
}

PositionInfo BitunixClient::fetch_position(const std::string& symbol) {
    const auto response = signed_request("GET", kPendingPositionsPath, {{"symbol", symbol}});
    return parse_position(symbol, unwrap(response.body, "fetch_position"));
}

std::vector<FillRecord> BitunixClient::fetch_fills(const std::string& symbol, int64_t since_ms) {
    QueryParams params = {{"symbol", symbol}, {"limit", "100"}};
    if (since_ms > 0) {
        params.emplace_back("startTime", std::to_string(since_ms));
    }
    const auto response = signed_request("GET", kHistoryTradesPath, params);
    const auto data = unwrap(response.body, "fetch_fills");

    std::vector<FillRecord> fills;
    for (const auto& item : list_field(data, "tradeList")) {
        fills.push_back(parse_fill(item));
    }
    std::sort(fills.begin(), fills.end(), [](const FillRecord& a, const FillRecord& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return fills;
}

InstrumentSpec BitunixClient::instrument_cached(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(instruments_mutex_);
        const auto it = instruments_.find(symbol);
        if (it != instruments_.end()) {
            return it->second;
        }
    }
    spdlog::info("[Bitunix] loading trading pair rules for {}", symbol);
    return fetch_instrument(symbol);
}

} // namespace venue
