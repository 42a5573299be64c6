#pragma once

#include "venue/stream_codec.hpp"
#include "venue/stream_events.hpp"
#include "venue/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <variant>
#include <vector>

namespace venue {

enum class StreamState {
    Disconnected,
    Connecting,
    Connected,
    Authenticated,
    Reconnecting
};

const char* to_string(StreamState state) noexcept;

struct ReconnectOptions {
    double initial_delay_s = 1.0;
    double max_delay_s = 30.0;
    double multiplier = 1.5;
    int max_attempts = -1;      // -1 retries forever
};

struct StreamOptions {
    std::string name = "stream";
    ReconnectOptions reconnect;
    int heartbeat_interval_ms = 30000;
    std::size_t max_subscriptions = 250;
    int send_timeout_ms = 1000;
};

// min(initial * multiplier^attempt, max)
std::chrono::milliseconds backoff_delay(const ReconnectOptions& options, int attempt);

using MessageHandler = std::function<void(const StreamEvent& event)>;
using StateHandler = std::function<void(StreamState state)>;
using ErrorHandler = std::function<void(const std::string& error)>;
using DispatchTask = std::function<void()>;

// Reconnecting streaming client, independent of the wire format.
//
// Contexts per connection: the transport read loop decodes frames and
// enqueues them; one dispatch thread invokes the message handler once per
// event in arrival order; a heartbeat thread sends protocol pings. A
// separate supervisor thread performs scheduled reconnects.
class StreamingClient {
public:
    StreamingClient(std::shared_ptr<const StreamCodec> codec,
                    TransportFactory transport_factory,
                    StreamOptions options = {});
    ~StreamingClient();

    StreamingClient(const StreamingClient&) = delete;
    StreamingClient& operator=(const StreamingClient&) = delete;
    StreamingClient(StreamingClient&&) noexcept = delete;
    StreamingClient& operator=(StreamingClient&&) noexcept = delete;

    // Throws TransportError when the first attempt cannot be started.
    void connect(const std::string& url);

    // Terminal; cancels any scheduled reconnect. Must not be called from a handler.
    void disconnect();

    // Throws SubscriptionLimit after admitting the channels that fit.
    void subscribe(const std::vector<Channel>& channels);
    void unsubscribe(const std::vector<Channel>& channels);

    // Throws NotConnected, or TransportError when the write times out.
    void send(const std::string& message);

    // Runs a task on the dispatch thread, ordered with stream events.
    bool post(DispatchTask task);
    bool inject(StreamEvent event);

    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    void set_message_handler(MessageHandler handler);
    void set_state_handler(StateHandler handler);
    void set_error_handler(ErrorHandler handler);

    StreamState state() const noexcept { return state_.load(); }
    bool is_ready() const noexcept;
    bool requires_auth() const noexcept { return requires_auth_; }
    bool is_dispatch_thread() const noexcept;

    std::vector<Channel> active_channels() const;
    std::size_t unsent_channel_count() const;
    int reconnect_attempt() const noexcept { return reconnect_attempt_.load(); }
    std::chrono::milliseconds last_scheduled_delay() const;

private:
    using DispatchItem = std::variant<StreamEvent, DispatchTask>;

    void open_transport();
    TransportHandlers make_handlers(uint64_t generation);
    void handle_open(uint64_t generation);
    void handle_frame(uint64_t generation, const std::string& frame);
    void handle_close(uint64_t generation, const std::string& reason);
    void handle_transport_error(uint64_t generation, const std::string& error);

    void flush_subscriptions();
    void send_frame(const std::string& frame);
    void schedule_reconnect();
    void set_state(StreamState state);
    void report_error(const std::string& error);
    bool enqueue(DispatchItem item);
    std::shared_ptr<Transport> current_transport() const;
    void close_transport();

    void dispatch_loop();
    void heartbeat_loop();
    void supervisor_loop();

    std::shared_ptr<const StreamCodec> codec_;
    TransportFactory transport_factory_;
    StreamOptions options_;
    bool requires_auth_;
    std::string url_;

    std::atomic<StreamState> state_{StreamState::Disconnected};
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;

    mutable std::mutex transport_mutex_;
    std::shared_ptr<Transport> transport_;
    std::atomic<uint64_t> generation_{0};

    mutable std::mutex subscriptions_mutex_;
    std::vector<Channel> active_;
    std::unordered_set<std::string> sent_keys_;

    std::mutex handlers_mutex_;
    MessageHandler message_handler_;
    StateHandler state_handler_;
    ErrorHandler error_handler_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<DispatchItem> queue_;
    std::atomic<bool> dispatch_running_{false};
    std::thread dispatch_thread_;

    std::atomic<bool> stopping_{false};
    std::atomic<bool> should_reconnect_{false};
    std::thread heartbeat_thread_;
    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    std::chrono::steady_clock::time_point last_ping_;

    std::thread supervisor_thread_;
    mutable std::mutex reconnect_mutex_;
    std::condition_variable reconnect_cv_;
    bool reconnect_pending_ = false;
    std::chrono::steady_clock::time_point reconnect_at_;
    std::chrono::milliseconds last_delay_{0};
    std::atomic<int> reconnect_attempt_{0};
};

} // namespace venue
