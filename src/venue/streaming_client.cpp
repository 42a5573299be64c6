#include "venue/streaming_client.hpp"

#include "venue/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace venue {
namespace {

constexpr auto kHeartbeatTick = std::chrono::milliseconds(250);

template <typename T>
std::vector<std::vector<T>> chunk(const std::vector<T>& items, std::size_t size) {
    std::vector<std::vector<T>> chunks;
    size = std::max<std::size_t>(size, 1);
    for (std::size_t i = 0; i < items.size(); i += size) {
        const auto end = std::min(items.size(), i + size);
        chunks.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(i),
                            items.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

} // namespace

const char* to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Disconnected: return "DISCONNECTED";
        case StreamState::Connecting: return "CONNECTING";
        case StreamState::Connected: return "CONNECTED";
        case StreamState::Authenticated: return "AUTHENTICATED";
        case StreamState::Reconnecting: return "RECONNECTING";
    }
    return "UNKNOWN";
}

std::chrono::milliseconds backoff_delay(const ReconnectOptions& options, int attempt) {
    const double raw = options.initial_delay_s * std::pow(options.multiplier, std::max(attempt, 0));
    const double capped = std::min(raw, options.max_delay_s);
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(std::max(capped, 0.0) * 1000.0)));
}

StreamingClient::StreamingClient(std::shared_ptr<const StreamCodec> codec,
                                 TransportFactory transport_factory,
                                 StreamOptions options)
    : codec_(std::move(codec)),
      transport_factory_(std::move(transport_factory)),
      options_(std::move(options)),
      requires_auth_(false) {
    if (!codec_ || !transport_factory_) {
        throw std::invalid_argument("StreamingClient requires a codec and a transport factory");
    }
    requires_auth_ = codec_->encode_login().has_value();
}

StreamingClient::~StreamingClient() {
    disconnect();
}

void StreamingClient::connect(const std::string& url) {
    if (dispatch_running_) {
        spdlog::warn("[Stream:{}] connect called while already running", options_.name);
        return;
    }

    url_ = url;
    stopping_ = false;
    should_reconnect_ = true;
    reconnect_attempt_ = 0;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_pending_ = false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dispatch_running_ = true;
    }
    dispatch_thread_ = std::thread(&StreamingClient::dispatch_loop, this);
    heartbeat_thread_ = std::thread(&StreamingClient::heartbeat_loop, this);
    supervisor_thread_ = std::thread(&StreamingClient::supervisor_loop, this);

    try {
        open_transport();
    } catch (const TransportError& ex) {
        report_error(ex.what());
        disconnect();
        throw;
    }
}

void StreamingClient::disconnect() {
    if (is_dispatch_thread()) {
        throw std::logic_error("StreamingClient::disconnect called from the dispatch thread");
    }

    should_reconnect_ = false;
    stopping_ = true;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_pending_ = false;
    }
    reconnect_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    }
    heartbeat_cv_.notify_all();

    if (supervisor_thread_.joinable()) {
        supervisor_thread_.join();
    }
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }

    ++generation_;
    close_transport();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dispatch_running_ = false;
    }
    queue_cv_.notify_all();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        sent_keys_.clear();
    }
    set_state(StreamState::Disconnected);
}

void StreamingClient::subscribe(const std::vector<Channel>& channels) {
    std::size_t rejected = 0;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& channel : channels) {
            const auto exists = std::any_of(active_.begin(), active_.end(), [&](const Channel& c) {
                return c == channel;
            });
            if (exists) {
                continue;
            }
            if (active_.size() >= options_.max_subscriptions) {
                ++rejected;
                continue;
            }
            active_.push_back(channel);
        }
    }

    flush_subscriptions();

    if (rejected > 0) {
        throw SubscriptionLimit(rejected, options_.max_subscriptions);
    }
}

void StreamingClient::unsubscribe(const std::vector<Channel>& channels) {
    std::vector<Channel> to_send;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& channel : channels) {
            const auto it = std::find(active_.begin(), active_.end(), channel);
            if (it == active_.end()) {
                continue;
            }
            active_.erase(it);
            if (sent_keys_.erase(channel.key()) > 0) {
                to_send.push_back(channel);
            }
        }
    }

    if (to_send.empty() || !is_ready()) {
        return;
    }

    for (const auto& batch : chunk(to_send, codec_->max_channels_per_frame())) {
        for (const auto& frame : codec_->encode_unsubscribe(batch)) {
            send_frame(frame);
        }
    }
}

void StreamingClient::send(const std::string& message) {
    send_frame(message);
}

bool StreamingClient::post(DispatchTask task) {
    return enqueue(DispatchItem{std::in_place_type<DispatchTask>, std::move(task)});
}

bool StreamingClient::inject(StreamEvent event) {
    return enqueue(DispatchItem{std::in_place_type<StreamEvent>, std::move(event)});
}

bool StreamingClient::wait_until_ready(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return is_ready(); });
}

void StreamingClient::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    message_handler_ = std::move(handler);
}

void StreamingClient::set_state_handler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    state_handler_ = std::move(handler);
}

void StreamingClient::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    error_handler_ = std::move(handler);
}

bool StreamingClient::is_ready() const noexcept {
    const auto current = state_.load();
    if (requires_auth_) {
        return current == StreamState::Authenticated;
    }
    return current == StreamState::Connected;
}

bool StreamingClient::is_dispatch_thread() const noexcept {
    return dispatch_thread_.joinable() && std::this_thread::get_id() == dispatch_thread_.get_id();
}

std::vector<Channel> StreamingClient::active_channels() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return active_;
}

std::size_t StreamingClient::unsent_channel_count() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return static_cast<std::size_t>(std::count_if(active_.begin(), active_.end(), [this](const Channel& c) {
        return sent_keys_.count(c.key()) == 0;
    }));
}

std::chrono::milliseconds StreamingClient::last_scheduled_delay() const {
    std::lock_guard<std::mutex> lock(reconnect_mutex_);
    return last_delay_;
}

void StreamingClient::open_transport() {
    set_state(StreamState::Connecting);
    const auto generation = ++generation_;

    std::shared_ptr<Transport> transport = transport_factory_();
    if (!transport) {
        throw TransportError("transport factory returned no transport");
    }
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = transport;
    }
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        sent_keys_.clear();
    }

    spdlog::info("[Stream:{}] connecting to {}", options_.name, url_);
    transport->open(url_, make_handlers(generation));
}

TransportHandlers StreamingClient::make_handlers(uint64_t generation) {
    TransportHandlers handlers;
    handlers.on_open = [this, generation]() { handle_open(generation); };
    handlers.on_frame = [this, generation](const std::string& frame) { handle_frame(generation, frame); };
    handlers.on_close = [this, generation](const std::string& reason) { handle_close(generation, reason); };
    handlers.on_error = [this, generation](const std::string& error) { handle_transport_error(generation, error); };
    return handlers;
}

void StreamingClient::handle_open(uint64_t generation) {
    if (generation != generation_) {
        return;
    }

    reconnect_attempt_ = 0;
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        last_ping_ = std::chrono::steady_clock::now();
    }
    set_state(StreamState::Connected);

    if (requires_auth_) {
        const auto login = codec_->encode_login();
        try {
            send_frame(*login);
        } catch (const TransportError& ex) {
            report_error(std::string("failed to send login: ") + ex.what());
        }
        return;
    }

    flush_subscriptions();
}

void StreamingClient::handle_frame(uint64_t generation, const std::string& frame) {
    if (generation != generation_) {
        return;
    }

    StreamEvent event;
    try {
        event = codec_->decode(frame);
    } catch (const std::exception& ex) {
        spdlog::debug("[Stream:{}] dropping undecodable frame: {}", options_.name, ex.what());
        return;
    }

    if (const auto* ack = std::get_if<AuthAck>(&event)) {
        if (ack->success) {
            set_state(StreamState::Authenticated);
            flush_subscriptions();
        } else {
            report_error("authentication rejected: " + ack->message);
        }
        return;
    }
    if (std::holds_alternative<PongEvent>(event)) {
        spdlog::debug("[Stream:{}] pong", options_.name);
        return;
    }
    if (const auto* ack = std::get_if<SubscribeAck>(&event)) {
        if (!ack->success) {
            report_error("subscription rejected: " + ack->message);
        }
        return;
    }
    if (const auto* unknown = std::get_if<UnknownFrame>(&event)) {
        spdlog::debug("[Stream:{}] ignoring frame: {}", options_.name, unknown->raw.substr(0, 256));
        return;
    }

    if (!enqueue(DispatchItem{std::in_place_type<StreamEvent>, std::move(event)})) {
        spdlog::debug("[Stream:{}] dispatch stopped, event dropped", options_.name);
    }
}

void StreamingClient::handle_close(uint64_t generation, const std::string& reason) {
    if (generation != generation_) {
        return;
    }

    spdlog::warn("[Stream:{}] transport closed: {}", options_.name, reason);
    if (should_reconnect_ && !stopping_) {
        schedule_reconnect();
    } else {
        set_state(StreamState::Disconnected);
    }
}

void StreamingClient::handle_transport_error(uint64_t generation, const std::string& error) {
    if (generation != generation_) {
        return;
    }
    report_error(error);
}

void StreamingClient::flush_subscriptions() {
    if (!is_ready()) {
        return;
    }

    std::vector<Channel> unsent;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& channel : active_) {
            if (sent_keys_.count(channel.key()) == 0) {
                unsent.push_back(channel);
            }
        }
    }
    if (unsent.empty()) {
        return;
    }

    for (const auto& batch : chunk(unsent, codec_->max_channels_per_frame())) {
        try {
            for (const auto& frame : codec_->encode_subscribe(batch)) {
                send_frame(frame);
            }
        } catch (const TransportError& ex) {
            report_error(std::string("subscription flush interrupted: ") + ex.what());
            return;
        }

        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& channel : batch) {
            sent_keys_.insert(channel.key());
        }
    }
    spdlog::info("[Stream:{}] subscribed {} channel(s)", options_.name, unsent.size());
}

void StreamingClient::send_frame(const std::string& frame) {
    const auto transport = current_transport();
    if (!transport || !transport->is_open()) {
        throw NotConnected();
    }
    if (!transport->send(frame, std::chrono::milliseconds(options_.send_timeout_ms))) {
        if (!transport->is_open()) {
            throw NotConnected();
        }
        throw TransportError("send timed out after " + std::to_string(options_.send_timeout_ms) + " ms");
    }
}

void StreamingClient::schedule_reconnect() {
    const auto& reconnect = options_.reconnect;
    const int attempt = reconnect_attempt_.load();
    if (reconnect.max_attempts >= 0 && attempt >= reconnect.max_attempts) {
        should_reconnect_ = false;
        set_state(StreamState::Disconnected);
        report_error("reconnect attempts exhausted after " + std::to_string(attempt) + " tries");
        return;
    }

    const auto delay = backoff_delay(reconnect, attempt);
    reconnect_attempt_ = attempt + 1;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_pending_ = true;
        reconnect_at_ = std::chrono::steady_clock::now() + delay;
        last_delay_ = delay;
    }
    set_state(StreamState::Reconnecting);
    reconnect_cv_.notify_all();
    spdlog::info("[Stream:{}] reconnect attempt {} in {} ms", options_.name, attempt + 1, delay.count());
}

void StreamingClient::set_state(StreamState state) {
    StreamState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_.exchange(state);
    }
    state_cv_.notify_all();
    if (previous == state) {
        return;
    }

    spdlog::info("[Stream:{}] {} -> {}", options_.name, to_string(previous), to_string(state));
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = state_handler_;
    }
    if (handler) {
        handler(state);
    }
}

void StreamingClient::report_error(const std::string& error) {
    spdlog::error("[Stream:{}] {}", options_.name, error);
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = error_handler_;
    }
    if (handler) {
        handler(error);
    }
}

bool StreamingClient::enqueue(DispatchItem item) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!dispatch_running_) {
            return false;
        }
        queue_.push_back(std::move(item));
    }
    queue_cv_.notify_one();
    return true;
}

std::shared_ptr<Transport> StreamingClient::current_transport() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return transport_;
}

void StreamingClient::close_transport() {
    std::shared_ptr<Transport> old;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        old = std::move(transport_);
    }
    if (old) {
        old->close();
    }
}

void StreamingClient::dispatch_loop() {
    while (true) {
        DispatchItem item;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !dispatch_running_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            if (auto* task = std::get_if<DispatchTask>(&item)) {
                if (*task) {
                    (*task)();
                }
                continue;
            }
            MessageHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlers_mutex_);
                handler = message_handler_;
            }
            if (handler) {
                handler(std::get<StreamEvent>(item));
            }
        } catch (const std::exception& ex) {
            spdlog::error("[Stream:{}] dispatch handler threw: {}", options_.name, ex.what());
        }
    }
}

void StreamingClient::heartbeat_loop() {
    const auto interval = std::chrono::milliseconds(options_.heartbeat_interval_ms);
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    while (!stopping_) {
        heartbeat_cv_.wait_for(lock, kHeartbeatTick, [this] { return stopping_.load(); });
        if (stopping_) {
            break;
        }
        if (interval.count() <= 0) {
            continue;
        }

        const auto current = state_.load();
        const auto now = std::chrono::steady_clock::now();
        if ((current != StreamState::Connected && current != StreamState::Authenticated) ||
            now - last_ping_ < interval) {
            continue;
        }
        last_ping_ = now;

        lock.unlock();
        try {
            send_frame(codec_->encode_ping());
            spdlog::debug("[Stream:{}] ping sent", options_.name);
        } catch (const TransportError& ex) {
            spdlog::warn("[Stream:{}] heartbeat failed: {}", options_.name, ex.what());
        }
        lock.lock();
    }
}

void StreamingClient::supervisor_loop() {
    std::unique_lock<std::mutex> lock(reconnect_mutex_);
    while (!stopping_) {
        reconnect_cv_.wait(lock, [this] { return stopping_ || reconnect_pending_; });
        if (stopping_) {
            break;
        }
        if (reconnect_cv_.wait_until(lock, reconnect_at_, [this] { return stopping_.load(); })) {
            break;
        }
        reconnect_pending_ = false;
        lock.unlock();

        close_transport();
        if (!stopping_) {
            try {
                open_transport();
            } catch (const TransportError& ex) {
                report_error(std::string("reconnect failed: ") + ex.what());
                if (should_reconnect_ && !stopping_) {
                    schedule_reconnect();
                }
            }
        }

        lock.lock();
    }
}

} // namespace venue
