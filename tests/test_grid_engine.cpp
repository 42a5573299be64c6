#include "fakes.hpp"

#include "grid/errors.hpp"
#include "grid/grid_engine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <thread>

using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

grid::GridConfig ladder_config() {
    grid::GridConfig config;
    config.symbol = "BTCUSDT";
    config.direction = grid::Direction::Long;
    config.lower_price = 100.0;
    config.upper_price = 110.0;
    config.grid_count = 11;
    config.total_investment = 110.0;
    config.leverage = 1;
    return config;
}

// One engine on the fake exchange with a single account stream carrying tickers.
struct EngineHarness {
    fakes::TransportHub hub;
    fakes::FakeGateway gateway;
    grid::GridConfig config = ladder_config();
    grid::EngineOptions options;
    std::shared_ptr<grid::SnapshotStore> store;
    venue::StreamingClient* account = nullptr;
    std::unique_ptr<grid::GridEngine> engine;

    EngineHarness() {
        options.open_initial_position = false;
        options.connect_timeout_ms = 1000;
        options.stop_timeout_ms = 1000;
    }

    ~EngineHarness() { engine.reset(); }

    grid::GridEngine& build(venue::StreamOptions stream_options = {}) {
        stream_options.name = "account";
        stream_options.heartbeat_interval_ms = 0;
        auto client = std::make_unique<venue::StreamingClient>(std::make_shared<fakes::LineCodec>(), hub.factory(),
                                                               stream_options);
        account = client.get();
        engine = std::make_unique<grid::GridEngine>(config, options, gateway, std::move(client), nullptr,
                                                    grid::StreamEndpoints{"ws://fake", ""}, store);
        return *engine;
    }

    void inject_fill(const venue::ExchangeOrder& order) {
        venue::OrderEvent event;
        event.symbol = order.symbol;
        event.order_id = order.order_id;
        event.client_order_id = order.client_order_id;
        event.side = order.side;
        event.status = venue::OrderStatus::Filled;
        event.price = order.price;
        event.qty = order.qty;
        event.filled_qty = order.qty;
        event.avg_fill_price = order.price;
        REQUIRE(account->inject(event));
    }

    // Fills the resting order at (side, price) on the exchange and reports it on the stream.
    venue::ExchangeOrder fill_at(venue::Side side, double price, int64_t timestamp_ms = 0) {
        const auto resting = gateway.open_order_at(side, price);
        REQUIRE(resting.has_value());
        const auto filled = gateway.fill(resting->order_id, timestamp_ms);
        REQUIRE(filled.has_value());
        inject_fill(*filled);
        return *filled;
    }
};

// The exchange fills a buy, a reconcile pass runs, and only then does the stream report the fill.
void reconcile_ahead_of_fill(bool fill_history_lags) {
    EngineHarness harness;
    auto& engine = harness.build();
    REQUIRE(engine.start());
    harness.gateway.delay_fill_history(fill_history_lags);

    const auto resting = harness.gateway.open_order_at(venue::Side::Buy, 104.0);
    REQUIRE(resting.has_value());
    const auto filled = harness.gateway.fill(resting->order_id, 1000);
    REQUIRE(filled.has_value());

    engine.reconcile_now();
    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(harness.gateway.open_order_at(venue::Side::Buy, 104.0).has_value());

    harness.inject_fill(*filled);
    REQUIRE(fakes::eventually([&] { return harness.gateway.open_order_at(venue::Side::Sell, 105.0).has_value(); }));
    REQUIRE(fakes::eventually([&] { return engine.stats().total_trades == 1; }));
    std::this_thread::sleep_for(50ms);

    const auto placed = harness.gateway.placed();
    const auto buys_at_104 = std::count_if(placed.begin(), placed.end(), [](const venue::OrderRequest& request) {
        return request.side == venue::Side::Buy && std::fabs(request.price - 104.0) < 1e-9;
    });
    CHECK(buys_at_104 == 1);
    CHECK(harness.gateway.open_count() == 10);
    CHECK(engine.stats().total_trades == 1);
    CHECK(engine.ledger().entry_at(4)->status == grid::EntryStatus::Filled);
    CHECK_THAT(engine.position().expected_position(), WithinAbs(0.0952, 1e-12));

    // Later passes leave the filled level to its closing sell.
    engine.reconcile_now();
    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(harness.gateway.open_order_at(venue::Side::Buy, 104.0).has_value());
}

struct ScratchDir {
    std::filesystem::path path;

    explicit ScratchDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("gridbot_" + name)) {
        std::filesystem::remove_all(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("start places one order per sided level", "[engine]") {
    EngineHarness harness;
    auto& engine = harness.build();

    REQUIRE(engine.start());
    CHECK(engine.state() == grid::EngineState::Running);
    CHECK(engine.error_reason().empty());
    CHECK_THAT(engine.last_price(), WithinAbs(105.0, 1e-12));
    CHECK(engine.epoch() > 0);

    CHECK(harness.gateway.open_count() == 10);
    CHECK(engine.ledger().active_count() == 10);
    CHECK_FALSE(engine.ledger().entry_at(5).has_value());

    const auto buy = harness.gateway.open_order_at(venue::Side::Buy, 104.0);
    REQUIRE(buy.has_value());
    CHECK_THAT(buy->qty, WithinAbs(0.0952, 1e-12));
    CHECK(buy->client_order_id.find("-BTCUSDT-4B-") != std::string::npos);
    CHECK(harness.gateway.open_order_at(venue::Side::Sell, 106.0).has_value());
    CHECK_FALSE(harness.gateway.open_order_at(venue::Side::Buy, 106.0).has_value());

    const auto channels = harness.account->active_channels();
    CHECK(channels.size() == 4);
    CHECK(std::find(channels.begin(), channels.end(), venue::Channel{"ticker", "BTCUSDT"}) != channels.end());

    // A second start is a no-op on a running grid.
    const auto placed = harness.gateway.placed().size();
    CHECK(engine.start());
    CHECK(harness.gateway.placed().size() == placed);
}

TEST_CASE("a failed risk check leaves the engine in error", "[engine]") {
    EngineHarness harness;
    harness.gateway.set_last_price(120.0);
    auto& engine = harness.build();

    CHECK_FALSE(engine.start());
    CHECK(engine.state() == grid::EngineState::Error);
    CHECK(engine.error_reason().find("risk check failed") == 0);
    CHECK(engine.error_reason().find("outside the grid range") != std::string::npos);
    CHECK(harness.gateway.placed().empty());
}

TEST_CASE("accepting high risk starts anyway", "[engine]") {
    EngineHarness harness;
    harness.gateway.set_last_price(109.5);
    harness.config.max_position_size = 5.0;
    harness.options.accept_high_risk = true;
    auto& engine = harness.build();

    REQUIRE(engine.start());
    CHECK(engine.state() == grid::EngineState::Running);
}

TEST_CASE("an unreachable stream fails the start", "[engine]") {
    EngineHarness harness;
    harness.hub.fail_open = true;
    auto& engine = harness.build();

    CHECK_FALSE(engine.start());
    CHECK(engine.state() == grid::EngineState::Error);
    CHECK(engine.error_reason() == "connection refused");
}

TEST_CASE("invalid configuration is refused at construction", "[engine]") {
    EngineHarness harness;
    harness.config.upper_price = 90.0;
    CHECK_THROWS_AS(harness.build(), grid::ConfigInvalid);
}

TEST_CASE("a long grid opens the position its sell levels need", "[engine]") {
    EngineHarness harness;
    harness.gateway.set_last_price(103.0);
    harness.options.open_initial_position = true;
    auto& engine = harness.build();

    REQUIRE(engine.start());
    const auto placed = harness.gateway.placed();
    REQUIRE_FALSE(placed.empty());
    CHECK(placed.front().type == venue::OrderType::Market);
    CHECK(placed.front().side == venue::Side::Buy);
    CHECK(placed.front().client_order_id.find("-BTCUSDT-init") != std::string::npos);
    CHECK_THAT(placed.front().qty, WithinAbs(0.388, 1e-3));

    CHECK_THAT(engine.position().expected_position(), WithinAbs(harness.gateway.position(), 1e-12));
    CHECK(harness.gateway.open_count() == 10);
}

TEST_CASE("fills are replenished on the neighbouring level", "[engine]") {
    EngineHarness harness;
    auto& engine = harness.build();
    REQUIRE(engine.start());

    harness.fill_at(venue::Side::Buy, 104.0, 1000);
    REQUIRE(fakes::eventually([&] { return harness.gateway.open_order_at(venue::Side::Sell, 105.0).has_value(); }));
    REQUIRE(fakes::eventually([&] {
        const auto entry = engine.ledger().entry_at(5);
        return entry && entry->status == grid::EntryStatus::Open;
    }));

    const auto sell = engine.ledger().entry_at(5);
    CHECK(sell->side == venue::Side::Sell);
    REQUIRE(sell->open_price.has_value());
    CHECK_THAT(*sell->open_price, WithinAbs(104.0, 1e-12));
    CHECK(engine.ledger().entry_at(4)->status == grid::EntryStatus::Filled);
    CHECK_THAT(engine.position().expected_position(), WithinAbs(0.0952, 1e-12));

    SECTION("closing the round trip books profit and re-arms the buy") {
        const auto closed = harness.fill_at(venue::Side::Sell, 105.0, 2000);
        REQUIRE(fakes::eventually([&] { return harness.gateway.open_order_at(venue::Side::Buy, 104.0).has_value(); }));
        REQUIRE(fakes::eventually([&] { return engine.stats().round_trips == 1; }));

        const auto stats = engine.stats();
        CHECK(stats.total_trades == 2);
        CHECK_THAT(stats.realized_profit, WithinAbs(0.0952, 1e-9));

        // The same fill reported again changes nothing.
        harness.inject_fill(closed);
        std::this_thread::sleep_for(50ms);
        CHECK(engine.stats().total_trades == 2);
    }

    SECTION("a sell next to an occupied level is not replenished") {
        harness.fill_at(venue::Side::Sell, 110.0, 3000);
        REQUIRE(fakes::eventually([&] { return engine.stats().total_trades == 2; }));
        std::this_thread::sleep_for(50ms);
        CHECK(harness.gateway.open_count() == 9);
    }
}

TEST_CASE("a fill already in the trade history is booked by reconcile", "[engine]") {
    reconcile_ahead_of_fill(false);
}

TEST_CASE("a reconcile that misses a lagging fill keeps the order for it", "[engine]") {
    reconcile_ahead_of_fill(true);
}

TEST_CASE("duplicate orders found at startup are cancelled", "[engine]") {
    EngineHarness harness;
    const auto first = harness.gateway.add_open_order(venue::Side::Buy, 104.0, 0.0952);
    const auto twin = harness.gateway.add_open_order(venue::Side::Buy, 104.0, 0.0952);
    auto& engine = harness.build();

    REQUIRE(engine.start());
    CHECK(harness.gateway.cancelled() == std::vector<std::string>{twin});
    CHECK(harness.gateway.open_count() == 10);
    REQUIRE(engine.ledger().entry_at(4).has_value());
    CHECK(engine.ledger().entry_at(4)->exchange_order_id == first);

    const auto duplicates = engine.duplicate_events();
    REQUIRE(duplicates.size() == 1);
    CHECK(duplicates.front().order_id == twin);
    CHECK(engine.stats().duplicates_cancelled == 1);
}

TEST_CASE("a position that drifts from the fills is reported", "[engine]") {
    EngineHarness harness;
    auto& engine = harness.build();
    REQUIRE(engine.start());

    venue::PositionEvent drift;
    drift.position.symbol = "BTCUSDT";
    drift.position.signed_size = 0.5;
    drift.timestamp_ms = 77;
    REQUIRE(harness.account->inject(drift));

    REQUIRE(fakes::eventually([&] { return engine.imbalance_events().size() == 1; }));
    const auto imbalance = engine.imbalance_events().front();
    CHECK_THAT(imbalance.expected, WithinAbs(0.0, 1e-12));
    CHECK_THAT(imbalance.actual, WithinAbs(0.5, 1e-12));
    CHECK(imbalance.timestamp_ms == 77);
    CHECK(engine.stats().imbalances_detected == 1);
    CHECK(engine.state() == grid::EngineState::Running);
}

TEST_CASE("pause and unpause only move between running and paused", "[engine]") {
    EngineHarness harness;
    auto& engine = harness.build();

    CHECK_FALSE(engine.pause());
    REQUIRE(engine.start());

    CHECK(engine.pause());
    CHECK(engine.state() == grid::EngineState::Paused);
    CHECK_FALSE(engine.pause());

    // Fills while paused are booked but not replenished.
    harness.fill_at(venue::Side::Buy, 103.0, 500);
    REQUIRE(fakes::eventually([&] { return engine.stats().total_trades == 1; }));
    std::this_thread::sleep_for(50ms);
    CHECK(harness.gateway.open_count() == 9);

    CHECK(engine.unpause());
    CHECK(engine.state() == grid::EngineState::Running);
    CHECK_FALSE(engine.unpause());

    // The requested reconcile re-arms the empty buy level.
    CHECK(fakes::eventually([&] { return harness.gateway.open_count() == 10; }));
}

TEST_CASE("stop cancels resting orders and is terminal", "[engine]") {
    EngineHarness harness;
    auto& engine = harness.build();
    REQUIRE(engine.start());

    engine.stop("test over");
    CHECK(engine.state() == grid::EngineState::Stopped);
    CHECK(engine.wait_until_terminal(10ms));
    CHECK(harness.gateway.open_count() == 0);
    CHECK(harness.gateway.cancelled().size() == 10);
    CHECK(engine.ledger().open_entries().empty());

    const auto trigger = engine.stop_trigger();
    REQUIRE(trigger.has_value());
    CHECK(trigger->reason == grid::StopReason::Manual);
    CHECK(trigger->message == "test over");

    CHECK_FALSE(engine.pause());
    engine.stop("again");
    CHECK(engine.stop_trigger()->message == "test over");
}

TEST_CASE("stop can leave orders and flatten the position", "[engine]") {
    EngineHarness harness;
    harness.config.cancel_orders_on_stop = false;
    harness.config.close_position_on_stop = true;
    auto& engine = harness.build();
    REQUIRE(engine.start());

    harness.fill_at(venue::Side::Buy, 104.0, 1000);
    REQUIRE(fakes::eventually([&] { return harness.gateway.open_order_at(venue::Side::Sell, 105.0).has_value(); }));

    engine.stop();
    CHECK(engine.state() == grid::EngineState::Stopped);
    CHECK(harness.gateway.cancelled().empty());
    CHECK(harness.gateway.open_count() == 10);

    const auto close = harness.gateway.placed().back();
    CHECK(close.type == venue::OrderType::Market);
    CHECK(close.side == venue::Side::Sell);
    CHECK(close.reduce_only);
    CHECK_THAT(close.qty, WithinAbs(0.0952, 1e-12));
    CHECK_THAT(harness.gateway.position(), WithinAbs(0.0, 1e-12));
}

TEST_CASE("a stop loss on the ticker stops the grid", "[engine]") {
    EngineHarness harness;
    harness.config.stop_loss = 98.0;
    auto& engine = harness.build();
    REQUIRE(engine.start());

    harness.fill_at(venue::Side::Buy, 104.0, 1000);
    REQUIRE(fakes::eventually([&] { return engine.stats().total_trades == 1; }));

    REQUIRE(harness.hub.emit("tick:BTCUSDT:97.5"));
    REQUIRE(engine.wait_until_terminal(3s));
    CHECK(engine.state() == grid::EngineState::Stopped);
    REQUIRE(engine.stop_trigger().has_value());
    CHECK(engine.stop_trigger()->reason == grid::StopReason::StopLoss);
    CHECK(harness.gateway.open_count() == 0);
}

TEST_CASE("tickers beyond the range trail the grid when enabled", "[engine]") {
    EngineHarness harness;
    harness.config.trailing_up = true;
    auto& engine = harness.build();
    REQUIRE(engine.start());

    REQUIRE(harness.hub.emit("tick:BTCUSDT:116"));

    REQUIRE(fakes::eventually([&] {
        const auto open = harness.gateway.fetch_open_orders("BTCUSDT");
        return open.size() == 10 && std::all_of(open.begin(), open.end(), [](const venue::ExchangeOrder& order) {
                   return order.price >= 112.0 - 1e-9 && order.price <= 122.0 + 1e-9;
               });
    }, 5000ms));

    const auto config = engine.config();
    CHECK_THAT(config.lower_price, WithinAbs(112.0, 1e-9));
    CHECK_THAT(config.upper_price, WithinAbs(122.0, 1e-9));
    CHECK(harness.gateway.cancelled().size() == 10);
    CHECK(harness.gateway.open_order_at(venue::Side::Buy, 115.0).has_value());
    CHECK(harness.gateway.open_order_at(venue::Side::Sell, 117.0).has_value());
}

TEST_CASE("fills missed while the stream is down are recovered by polling", "[engine]") {
    EngineHarness harness;
    venue::StreamOptions slow_reconnect;
    slow_reconnect.reconnect.initial_delay_s = 30.0;
    auto& engine = harness.build(slow_reconnect);
    REQUIRE(engine.start());

    const auto resting = harness.gateway.open_order_at(venue::Side::Buy, 104.0);
    REQUIRE(resting.has_value());
    REQUIRE(harness.gateway.fill(resting->order_id, 1000).has_value());
    REQUIRE(harness.hub.drop());
    CHECK(harness.account->state() == venue::StreamState::Reconnecting);

    CHECK(fakes::eventually([&] { return harness.gateway.open_order_at(venue::Side::Sell, 105.0).has_value(); }));
    CHECK(fakes::eventually([&] { return engine.stats().total_trades == 1; }));
    CHECK(engine.ledger().fill_processed(resting->order_id));
}

TEST_CASE("a stopped grid resumes from its snapshot without re-placing", "[engine][snapshot]") {
    ScratchDir dir("engine_resume");
    fakes::FakeGateway gateway;
    auto store = std::make_shared<grid::SnapshotStore>(dir.path, "default");

    uint64_t first_epoch = 0;
    {
        fakes::TransportHub hub;
        auto config = ladder_config();
        config.cancel_orders_on_stop = false;
        grid::EngineOptions options;
        options.open_initial_position = false;
        auto client = std::make_unique<venue::StreamingClient>(std::make_shared<fakes::LineCodec>(), hub.factory());
        grid::GridEngine engine(config, options, gateway, std::move(client), nullptr,
                                grid::StreamEndpoints{"ws://fake", ""}, store);
        REQUIRE(engine.start());
        first_epoch = engine.epoch();
        engine.stop("restart");
    }
    REQUIRE(gateway.open_count() == 10);
    const auto placed_before = gateway.placed().size();

    const auto snapshot = store->load("BTCUSDT");
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->state == grid::EngineState::Stopped);
    CHECK(snapshot->ledger.size() == 10);

    // A fill while the grid was down is picked up during resume.
    const auto resting = gateway.open_order_at(venue::Side::Buy, 104.0);
    REQUIRE(resting.has_value());
    REQUIRE(gateway.fill(resting->order_id, 5000).has_value());

    fakes::TransportHub hub;
    grid::EngineOptions options;
    options.open_initial_position = false;
    auto client = std::make_unique<venue::StreamingClient>(std::make_shared<fakes::LineCodec>(), hub.factory());
    grid::GridEngine engine(snapshot->config, options, gateway, std::move(client), nullptr,
                            grid::StreamEndpoints{"ws://fake", ""}, store);

    REQUIRE(engine.resume(*snapshot));
    CHECK(engine.state() == grid::EngineState::Running);
    CHECK(engine.epoch() > first_epoch);
    CHECK(engine.stats().total_trades == 1);
    CHECK_THAT(engine.position().expected_position(), WithinAbs(0.0952, 1e-12));

    // Nine orders adopted, the filled buy level re-armed once.
    CHECK(gateway.placed().size() == placed_before + 1);
    CHECK(gateway.open_count() == 10);
    CHECK(engine.imbalance_events().empty());

    engine.stop();
}

TEST_CASE("resume refuses a snapshot for another symbol", "[engine][snapshot]") {
    EngineHarness harness;
    auto& engine = harness.build();

    grid::PersistedSnapshot snapshot;
    snapshot.config = ladder_config();
    snapshot.config.symbol = "ETHUSDT";

    CHECK_FALSE(engine.resume(snapshot));
    CHECK(engine.state() == grid::EngineState::Error);
    CHECK(engine.error_reason().find("snapshot is for ETHUSDT") != std::string::npos);
}
