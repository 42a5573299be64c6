#pragma once

#include "venue/errors.hpp"
#include "venue/exchange_gateway.hpp"
#include "venue/stream_codec.hpp"
#include "venue/transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fakes {

inline bool eventually(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// In-memory exchange. Placed limit orders rest until fill() or cancel.
class FakeGateway : public venue::ExchangeGateway {
public:
    FakeGateway() {
        instrument_.symbol = "BTCUSDT";
        instrument_.tick_size = 0.01;
        instrument_.qty_step = 0.0001;
        instrument_.min_qty = 0.0001;
        instrument_.max_leverage = 125;
    }

    std::vector<venue::Ticker> fetch_tickers() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return {venue::Ticker{instrument_.symbol, last_price_, last_price_, last_price_}};
    }

    venue::InstrumentSpec fetch_instrument(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (symbol != instrument_.symbol) {
            throw venue::ExchangeError("unknown symbol " + symbol, 2);
        }
        return instrument_;
    }

    std::vector<venue::ExchangeOrder> fetch_open_orders(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<venue::ExchangeOrder> open;
        for (const auto& order : orders_) {
            if (order.symbol == symbol && order.status == venue::OrderStatus::New) {
                open.push_back(order);
            }
        }
        return open;
    }

    venue::PlaceResult place_order(const venue::OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        placed_.push_back(request);
        if (reject_places_ > 0) {
            --reject_places_;
            throw venue::OrderRejected("insufficient margin", 20003);
        }

        venue::ExchangeOrder order;
        order.order_id = "ex" + std::to_string(next_id_++);
        order.client_order_id = request.client_order_id;
        order.symbol = request.symbol;
        order.side = request.side;
        order.type = request.type;
        order.price = request.price;
        order.qty = request.qty;
        if (request.type == venue::OrderType::Market) {
            order.status = venue::OrderStatus::Filled;
            order.filled_qty = request.qty;
            const double signed_qty = request.side == venue::Side::Buy ? request.qty : -request.qty;
            position_.signed_size += signed_qty;
        }
        orders_.push_back(order);
        return venue::PlaceResult{order.order_id, order.client_order_id};
    }

    void cancel_order(const std::string& symbol,
                      const std::string& order_id,
                      const std::string& client_order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.push_back(order_id.empty() ? client_order_id : order_id);
        if (fail_cancels_) {
            throw venue::OrderRejected("cancel failed", 30001);
        }
        for (auto& order : orders_) {
            if (order.symbol == symbol && (order.order_id == order_id ||
                                           (order_id.empty() && order.client_order_id == client_order_id))) {
                order.status = venue::OrderStatus::Cancelled;
            }
        }
    }

    venue::PositionInfo fetch_position(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto position = position_;
        position.symbol = symbol;
        return position;
    }

    std::vector<venue::FillRecord> fetch_fills(const std::string&, int64_t since_ms) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<venue::FillRecord> fills;
        if (fill_history_lags_) {
            return fills;
        }
        for (const auto& fill : fills_) {
            if (fill.timestamp_ms >= since_ms) {
                fills.push_back(fill);
            }
        }
        return fills;
    }

    // Seeds an order that already rests on the exchange.
    std::string add_open_order(venue::Side side, double price, double qty, const std::string& client_id = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        venue::ExchangeOrder order;
        order.order_id = "ex" + std::to_string(next_id_++);
        order.client_order_id = client_id;
        order.symbol = instrument_.symbol;
        order.side = side;
        order.price = price;
        order.qty = qty;
        orders_.push_back(order);
        return order.order_id;
    }

    // Marks a resting order filled and moves the position.
    std::optional<venue::ExchangeOrder> fill(const std::string& order_id, int64_t timestamp_ms = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& order : orders_) {
            if (order.order_id == order_id && order.status == venue::OrderStatus::New) {
                order.status = venue::OrderStatus::Filled;
                order.filled_qty = order.qty;
                position_.signed_size += order.side == venue::Side::Buy ? order.qty : -order.qty;
                fills_.push_back(venue::FillRecord{order.order_id, order.client_order_id, order.side, order.price,
                                                   order.qty, 0.0, timestamp_ms});
                return order;
            }
        }
        return std::nullopt;
    }

    std::optional<venue::ExchangeOrder> open_order_at(venue::Side side, double price) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& order : orders_) {
            if (order.status == venue::OrderStatus::New && order.side == side &&
                std::abs(order.price - price) < 1e-6) {
                return order;
            }
        }
        return std::nullopt;
    }

    void set_last_price(double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_price_ = price;
    }

    void set_instrument(venue::InstrumentSpec instrument) {
        std::lock_guard<std::mutex> lock(mutex_);
        instrument_ = std::move(instrument);
    }

    void set_position(double signed_size) {
        std::lock_guard<std::mutex> lock(mutex_);
        position_.signed_size = signed_size;
    }

    void reject_next_places(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        reject_places_ = count;
    }

    void fail_cancels(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_cancels_ = fail;
    }

    // Trades stay out of fetch_fills until this is cleared.
    void delay_fill_history(bool lags) {
        std::lock_guard<std::mutex> lock(mutex_);
        fill_history_lags_ = lags;
    }

    std::vector<venue::OrderRequest> placed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed_;
    }

    std::vector<std::string> cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    std::size_t open_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(orders_.begin(), orders_.end(), [](const auto& order) {
            return order.status == venue::OrderStatus::New;
        }));
    }

    double position() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return position_.signed_size;
    }

private:
    mutable std::mutex mutex_;
    venue::InstrumentSpec instrument_;
    double last_price_ = 105.0;
    venue::PositionInfo position_;
    std::vector<venue::ExchangeOrder> orders_;
    std::vector<venue::FillRecord> fills_;
    std::vector<venue::OrderRequest> placed_;
    std::vector<std::string> cancelled_;
    int next_id_ = 1;
    int reject_places_ = 0;
    bool fail_cancels_ = false;
    bool fill_history_lags_ = false;
};

// Plain-text wire format: "sub:a,b", "unsub:a", "ping", "login";
// inbound "tick:SYMBOL:price", "pong", "auth:ok", "auth:fail".
class LineCodec : public venue::StreamCodec {
public:
    explicit LineCodec(bool requires_login = false, std::size_t batch = 50)
        : requires_login_(requires_login), batch_(batch) {}

    std::vector<std::string> encode_subscribe(const std::vector<venue::Channel>& channels) const override {
        return {"sub:" + join(channels)};
    }

    std::vector<std::string> encode_unsubscribe(const std::vector<venue::Channel>& channels) const override {
        return {"unsub:" + join(channels)};
    }

    std::string encode_ping() const override { return "ping"; }

    std::optional<std::string> encode_login() const override {
        if (!requires_login_) {
            return std::nullopt;
        }
        return std::string("login");
    }

    venue::StreamEvent decode(const std::string& frame) const override {
        if (frame == "pong") {
            return venue::PongEvent{};
        }
        if (frame == "auth:ok" || frame == "auth:fail") {
            return venue::AuthAck{frame == "auth:ok", frame};
        }
        if (frame.rfind("tick:", 0) == 0) {
            const auto colon = frame.find(':', 5);
            venue::TickerEvent ticker;
            ticker.symbol = frame.substr(5, colon - 5);
            ticker.last = std::stod(frame.substr(colon + 1));
            return ticker;
        }
        return venue::UnknownFrame{frame};
    }

    std::size_t max_channels_per_frame() const override { return batch_; }

private:
    static std::string join(const std::vector<venue::Channel>& channels) {
        std::string text;
        for (const auto& channel : channels) {
            if (!text.empty()) {
                text += ",";
            }
            text += channel.key();
        }
        return text;
    }

    bool requires_login_;
    std::size_t batch_;
};

class FakeTransport;

// Shared view of every transport a factory has produced.
class TransportHub {
public:
    venue::TransportFactory factory();

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    void clear_sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    int opened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    // Delivers a frame on the most recent open transport.
    bool emit(const std::string& frame);

    // Simulates the remote end closing the most recent transport.
    bool drop(const std::string& reason = "remote closed");

    std::atomic<bool> auto_open{true};
    std::atomic<bool> fail_open{false};

private:
    friend class FakeTransport;

    void record(const std::string& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(frame);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    std::vector<FakeTransport*> live_;
    int opened_ = 0;
};

class FakeTransport : public venue::Transport {
public:
    explicit FakeTransport(TransportHub& hub) : hub_(hub) {
        std::lock_guard<std::mutex> lock(hub_.mutex_);
        hub_.live_.push_back(this);
    }

    ~FakeTransport() override {
        std::lock_guard<std::mutex> lock(hub_.mutex_);
        hub_.live_.erase(std::remove(hub_.live_.begin(), hub_.live_.end(), this), hub_.live_.end());
    }

    void open(const std::string&, venue::TransportHandlers handlers) override {
        if (hub_.fail_open) {
            throw venue::TransportError("connection refused");
        }
        handlers_ = std::move(handlers);
        open_ = true;
        {
            std::lock_guard<std::mutex> lock(hub_.mutex_);
            ++hub_.opened_;
        }
        if (hub_.auto_open && handlers_.on_open) {
            handlers_.on_open();
        }
    }

    bool send(const std::string& frame, std::chrono::milliseconds) override {
        if (!open_) {
            return false;
        }
        hub_.record(frame);
        return true;
    }

    void close() override { open_ = false; }

    bool is_open() const noexcept override { return open_; }

    void deliver(const std::string& frame) {
        if (open_ && handlers_.on_frame) {
            handlers_.on_frame(frame);
        }
    }

    void remote_close(const std::string& reason) {
        if (!open_) {
            return;
        }
        open_ = false;
        if (handlers_.on_close) {
            handlers_.on_close(reason);
        }
    }

private:
    TransportHub& hub_;
    venue::TransportHandlers handlers_;
    std::atomic<bool> open_{false};
};

inline venue::TransportFactory TransportHub::factory() {
    return [this]() { return std::make_unique<FakeTransport>(*this); };
}

inline bool TransportHub::emit(const std::string& frame) {
    FakeTransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = live_.rbegin(); it != live_.rend(); ++it) {
            if ((*it)->is_open()) {
                transport = *it;
                break;
            }
        }
    }
    if (transport == nullptr) {
        return false;
    }
    transport->deliver(frame);
    return true;
}

inline bool TransportHub::drop(const std::string& reason) {
    FakeTransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = live_.rbegin(); it != live_.rend(); ++it) {
            if ((*it)->is_open()) {
                transport = *it;
                break;
            }
        }
    }
    if (transport == nullptr) {
        return false;
    }
    transport->remote_close(reason);
    return true;
}

} // namespace fakes
