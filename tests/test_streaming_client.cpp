#include "fakes.hpp"

#include "venue/errors.hpp"
#include "venue/streaming_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

venue::StreamOptions quick_options(int max_attempts = -1) {
    venue::StreamOptions options;
    options.name = "test";
    options.reconnect.initial_delay_s = 0.05;
    options.reconnect.max_delay_s = 0.2;
    options.reconnect.multiplier = 2.0;
    options.reconnect.max_attempts = max_attempts;
    options.heartbeat_interval_ms = 0;
    return options;
}

std::shared_ptr<const venue::StreamCodec> line_codec(bool login = false, std::size_t batch = 50) {
    return std::make_shared<fakes::LineCodec>(login, batch);
}

bool contains(const std::vector<std::string>& frames, const std::string& frame) {
    return std::find(frames.begin(), frames.end(), frame) != frames.end();
}

std::size_t count_prefix(const std::vector<std::string>& frames, const std::string& prefix) {
    return static_cast<std::size_t>(std::count_if(frames.begin(), frames.end(), [&](const std::string& f) {
        return f.rfind(prefix, 0) == 0;
    }));
}

// Collects ticker prices and dispatch tasks in the order the dispatch thread sees them.
struct Recorder {
    std::mutex mutex;
    std::vector<std::string> seen;

    void add(const std::string& item) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(item);
    }

    std::vector<std::string> items() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen;
    }
};

} // namespace

TEST_CASE("backoff grows geometrically and is capped", "[stream]") {
    venue::ReconnectOptions options;
    CHECK(venue::backoff_delay(options, 0) == 1000ms);
    CHECK(venue::backoff_delay(options, 1) == 1500ms);
    CHECK(venue::backoff_delay(options, 2) == 2250ms);
    CHECK(venue::backoff_delay(options, 20) == 30000ms);
    CHECK(venue::backoff_delay(options, -3) == 1000ms);
}

TEST_CASE("stream states have readable names", "[stream]") {
    CHECK(std::string(venue::to_string(venue::StreamState::Reconnecting)) == "RECONNECTING");
    CHECK(std::string(venue::to_string(venue::StreamState::Authenticated)) == "AUTHENTICATED");
}

TEST_CASE("subscriptions made before connect are flushed once ready", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    client.subscribe({{"ticker", "BTCUSDT"}, {"ticker", "ETHUSDT"}});
    CHECK(client.unsent_channel_count() == 2);
    CHECK(hub.sent().empty());

    client.connect("ws://fake");
    REQUIRE(client.wait_until_ready(1s));
    CHECK(client.state() == venue::StreamState::Connected);
    CHECK(contains(hub.sent(), "sub:ticker:BTCUSDT,ticker:ETHUSDT"));
    CHECK(client.unsent_channel_count() == 0);

    client.disconnect();
    CHECK(client.state() == venue::StreamState::Disconnected);
}

TEST_CASE("duplicate subscriptions are sent once", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());
    client.connect("ws://fake");

    client.subscribe({{"ticker", "BTCUSDT"}});
    client.subscribe({{"ticker", "BTCUSDT"}, {"order", ""}});
    client.subscribe({{"order", ""}});

    const auto sent = hub.sent();
    CHECK(sent == std::vector<std::string>{"sub:ticker:BTCUSDT", "sub:order"});
    CHECK(client.active_channels().size() == 2);

    client.unsubscribe({{"order", ""}, {"balance", ""}});
    CHECK(hub.sent().back() == "unsub:order");
    CHECK(client.active_channels().size() == 1);
}

TEST_CASE("large subscription sets are split into frames", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(false, 2), hub.factory(), quick_options());
    client.connect("ws://fake");

    client.subscribe({{"ticker", "A"}, {"ticker", "B"}, {"ticker", "C"}, {"ticker", "D"}, {"ticker", "E"}});

    const auto sent = hub.sent();
    REQUIRE(count_prefix(sent, "sub:") == 3);
    CHECK(sent[0] == "sub:ticker:A,ticker:B");
    CHECK(sent[1] == "sub:ticker:C,ticker:D");
    CHECK(sent[2] == "sub:ticker:E");
}

TEST_CASE("subscriptions beyond the limit are rejected after admitting what fits", "[stream]") {
    fakes::TransportHub hub;
    auto options = quick_options();
    options.max_subscriptions = 3;
    venue::StreamingClient client(line_codec(), hub.factory(), options);
    client.connect("ws://fake");

    try {
        client.subscribe({{"ticker", "A"}, {"ticker", "B"}, {"ticker", "C"}, {"ticker", "D"}, {"ticker", "E"}});
        FAIL("expected SubscriptionLimit");
    } catch (const venue::SubscriptionLimit& ex) {
        CHECK(ex.rejected() == 2);
    }
    CHECK(client.active_channels().size() == 3);
    CHECK(contains(hub.sent(), "sub:ticker:A,ticker:B,ticker:C"));
}

TEST_CASE("sending without a connection raises NotConnected", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    CHECK_THROWS_AS(client.send("hello"), venue::NotConnected);

    client.connect("ws://fake");
    client.send("hello");
    CHECK(hub.sent().back() == "hello");

    client.disconnect();
    CHECK_THROWS_AS(client.send("again"), venue::NotConnected);
}

TEST_CASE("a refused first connection surfaces as TransportError", "[stream]") {
    fakes::TransportHub hub;
    hub.fail_open = true;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    std::vector<std::string> errors;
    client.set_error_handler([&](const std::string& error) { errors.push_back(error); });

    CHECK_THROWS_AS(client.connect("ws://fake"), venue::TransportError);
    CHECK(client.state() == venue::StreamState::Disconnected);
    CHECK(hub.opened() == 0);
    REQUIRE_FALSE(errors.empty());
    CHECK(errors.front() == "connection refused");

    hub.fail_open = false;
    client.connect("ws://fake");
    CHECK(client.wait_until_ready(1s));
}

TEST_CASE("events are dispatched one at a time in arrival order", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    Recorder recorder;
    client.set_message_handler([&](const venue::StreamEvent& event) {
        if (const auto* ticker = std::get_if<venue::TickerEvent>(&event)) {
            recorder.add(ticker->symbol + "@" + std::to_string(static_cast<int>(ticker->last)));
        }
    });
    client.connect("ws://fake");

    for (int i = 1; i <= 50; ++i) {
        REQUIRE(hub.emit("tick:BTCUSDT:" + std::to_string(i)));
    }
    hub.emit("pong");
    hub.emit("garbage");

    REQUIRE(fakes::eventually([&] { return recorder.items().size() == 50; }));
    const auto seen = recorder.items();
    for (int i = 0; i < 50; ++i) {
        CHECK(seen[static_cast<std::size_t>(i)] == "BTCUSDT@" + std::to_string(i + 1));
    }
}

TEST_CASE("posted tasks interleave with events in enqueue order", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    Recorder recorder;
    client.set_message_handler([&](const venue::StreamEvent& event) {
        if (const auto* ticker = std::get_if<venue::TickerEvent>(&event)) {
            recorder.add("event:" + ticker->symbol);
        }
    });

    CHECK_FALSE(client.post([&] { recorder.add("too early"); }));
    client.connect("ws://fake");

    venue::TickerEvent first;
    first.symbol = "A";
    venue::TickerEvent second;
    second.symbol = "B";

    CHECK(client.inject(first));
    CHECK(client.post([&] {
        recorder.add(client.is_dispatch_thread() ? "task:on-dispatch" : "task:elsewhere");
    }));
    CHECK(client.inject(second));

    REQUIRE(fakes::eventually([&] { return recorder.items().size() == 3; }));
    CHECK(recorder.items() == std::vector<std::string>{"event:A", "task:on-dispatch", "event:B"});
    CHECK_FALSE(client.is_dispatch_thread());
}

TEST_CASE("a throwing handler does not stop dispatch", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    Recorder recorder;
    client.set_message_handler([&](const venue::StreamEvent& event) {
        const auto& ticker = std::get<venue::TickerEvent>(event);
        if (ticker.symbol == "BAD") {
            throw std::runtime_error("handler failure");
        }
        recorder.add(ticker.symbol);
    });
    client.connect("ws://fake");

    hub.emit("tick:BAD:1");
    hub.emit("tick:GOOD:2");
    CHECK(fakes::eventually([&] { return recorder.items() == std::vector<std::string>{"GOOD"}; }));
}

TEST_CASE("disconnect is refused from inside the dispatch thread", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());
    client.connect("ws://fake");

    std::atomic<bool> refused{false};
    REQUIRE(client.post([&] {
        try {
            client.disconnect();
        } catch (const std::logic_error&) {
            refused = true;
        }
    }));
    CHECK(fakes::eventually([&] { return refused.load(); }));
    CHECK(client.is_ready());
}

TEST_CASE("a login frame gates subscriptions until it is acknowledged", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(true), hub.factory(), quick_options());
    REQUIRE(client.requires_auth());

    client.subscribe({{"order", ""}});
    client.connect("ws://fake");

    CHECK(client.state() == venue::StreamState::Connected);
    CHECK_FALSE(client.is_ready());
    CHECK(hub.sent() == std::vector<std::string>{"login"});

    hub.emit("auth:ok");
    CHECK(client.state() == venue::StreamState::Authenticated);
    CHECK(client.is_ready());
    CHECK(contains(hub.sent(), "sub:order"));
}

TEST_CASE("a rejected login is reported and keeps the stream unready", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(true), hub.factory(), quick_options());

    std::vector<std::string> errors;
    client.set_error_handler([&](const std::string& error) { errors.push_back(error); });
    client.subscribe({{"order", ""}});
    client.connect("ws://fake");

    hub.emit("auth:fail");
    CHECK_FALSE(client.is_ready());
    CHECK_FALSE(client.wait_until_ready(50ms));
    REQUIRE(errors.size() == 1);
    CHECK(errors.front().find("authentication rejected") == 0);
    CHECK_FALSE(contains(hub.sent(), "sub:order"));
}

TEST_CASE("a dropped connection reconnects and resubscribes", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options());

    std::mutex states_mutex;
    std::vector<venue::StreamState> states;
    client.set_state_handler([&](venue::StreamState state) {
        std::lock_guard<std::mutex> lock(states_mutex);
        states.push_back(state);
    });

    client.connect("ws://fake");
    client.subscribe({{"ticker", "BTCUSDT"}});
    hub.clear_sent();

    REQUIRE(hub.drop());
    CHECK(client.reconnect_attempt() == 1);
    CHECK(client.last_scheduled_delay() == 50ms);

    REQUIRE(fakes::eventually([&] { return hub.opened() == 2 && contains(hub.sent(), "sub:ticker:BTCUSDT"); }));
    CHECK(client.is_ready());
    CHECK(client.reconnect_attempt() == 0);

    std::lock_guard<std::mutex> lock(states_mutex);
    CHECK(std::find(states.begin(), states.end(), venue::StreamState::Reconnecting) != states.end());
    CHECK(states.back() == venue::StreamState::Connected);
}

TEST_CASE("reconnect gives up after the configured attempts", "[stream]") {
    fakes::TransportHub hub;
    venue::StreamingClient client(line_codec(), hub.factory(), quick_options(2));

    std::atomic<bool> exhausted{false};
    client.set_error_handler([&](const std::string& error) {
        if (error.find("reconnect attempts exhausted") != std::string::npos) {
            exhausted = true;
        }
    });

    client.connect("ws://fake");
    hub.fail_open = true;
    REQUIRE(hub.drop());

    REQUIRE(fakes::eventually([&] { return exhausted.load(); }));
    CHECK(client.state() == venue::StreamState::Disconnected);
    CHECK(client.reconnect_attempt() == 2);
    CHECK(client.last_scheduled_delay() == 100ms);
    CHECK(hub.opened() == 1);
}

TEST_CASE("heartbeats are sent while connected", "[stream]") {
    fakes::TransportHub hub;
    auto options = quick_options();
    options.heartbeat_interval_ms = 50;
    venue::StreamingClient client(line_codec(), hub.factory(), options);
    client.connect("ws://fake");

    CHECK(fakes::eventually([&] { return contains(hub.sent(), "ping"); }));
}
