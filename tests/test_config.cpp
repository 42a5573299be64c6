#include "grid/errors.hpp"
#include "grid/settings.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

using Catch::Matchers::WithinAbs;
using nlohmann::json;

namespace {

json minimal_settings() {
    return json{{"grid",
                 {{"symbol", "ETHUSDT"},
                  {"direction", "short"},
                  {"lower_price", 3000.0},
                  {"upper_price", 3500.0},
                  {"grid_count", 10},
                  {"total_investment", 400.0},
                  {"leverage", 2},
                  {"stop_loss", 3700.0}}}};
}

bool mentions(const std::vector<std::string>& reasons, const std::string& needle) {
    return std::any_of(reasons.begin(), reasons.end(), [&](const std::string& reason) {
        return reason.find(needle) != std::string::npos;
    });
}

std::filesystem::path scratch_file(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "gridbot_config_tests";
    std::filesystem::create_directories(dir);
    return dir / name;
}

} // namespace

TEST_CASE("parse_settings fills defaults around the grid section", "[config]") {
    const auto settings = grid::parse_settings(minimal_settings());

    CHECK(settings.grid.symbol == "ETHUSDT");
    CHECK(settings.grid.direction == grid::Direction::Short);
    CHECK(settings.grid.grid_type == grid::GridType::Arithmetic);
    CHECK(settings.grid.grid_count == 10);
    REQUIRE(settings.grid.stop_loss.has_value());
    CHECK_THAT(*settings.grid.stop_loss, WithinAbs(3700.0, 1e-12));
    CHECK_FALSE(settings.grid.take_profit.has_value());
    CHECK(settings.grid.cancel_orders_on_stop);

    CHECK_THAT(settings.engine.price_buffer_pct, WithinAbs(0.1, 1e-12));
    CHECK(settings.engine.replenish_step == 1);
    CHECK(settings.engine.instance_id == "default");
    CHECK_THAT(settings.stream.reconnect.multiplier, WithinAbs(1.5, 1e-12));
    CHECK(settings.stream.name == "ETHUSDT");
    CHECK(settings.exchange.private_stream_url == "wss://fapi.bitunix.com/private/");
    CHECK(settings.logging.level == "info");
    CHECK(settings.persistence.enabled);
    CHECK(settings.persistence.io_budget_ms == 50);
}

TEST_CASE("parse_settings reads every section", "[config]") {
    auto root = minimal_settings();
    root["grid"]["grid_type"] = "GEOMETRIC";
    root["grid"]["post_only"] = true;
    root["engine"] = {{"price_tolerance", 0.5}, {"instance_id", "eth-a"}, {"worker_threads", 4}};
    root["stream"] = {{"initial_delay_s", 2.0}, {"max_delay_s", 60.0}, {"max_attempts", 5}};
    root["exchange"] = {{"http_timeout_ms", 2500}};
    root["logging"] = {{"level", "debug"}, {"trades_log", false}};
    root["persistence"] = {{"directory", "/var/lib/gridbot"}, {"io_budget_ms", 20}};

    const auto settings = grid::parse_settings(root);
    CHECK(settings.grid.grid_type == grid::GridType::Geometric);
    CHECK(settings.grid.effective_time_in_force() == venue::TimeInForce::PostOnly);
    CHECK_THAT(settings.engine.price_tolerance, WithinAbs(0.5, 1e-12));
    CHECK(settings.engine.instance_id == "eth-a");
    CHECK(settings.engine.worker_threads == 4);
    CHECK_THAT(settings.stream.reconnect.initial_delay_s, WithinAbs(2.0, 1e-12));
    CHECK(settings.stream.reconnect.max_attempts == 5);
    CHECK(settings.exchange.http_timeout_ms == 2500);
    CHECK(settings.logging.level == "debug");
    CHECK_FALSE(settings.logging.trades_log);
    CHECK(settings.persistence.directory == "/var/lib/gridbot");
    CHECK(settings.persistence.io_budget_ms == 20);
}

TEST_CASE("every configuration problem is reported at once", "[config]") {
    auto root = minimal_settings();
    root["grid"]["upper_price"] = 2900.0;
    root["grid"]["grid_count"] = "ten";
    root["grid"]["direction"] = "sideways";
    root["grid"]["leverage"] = 0;
    root["engine"] = {{"worker_threads", 0}};
    root["stream"] = {{"multiplier", 0.5}};

    try {
        grid::parse_settings(root);
        FAIL("expected ConfigInvalid");
    } catch (const grid::ConfigInvalid& ex) {
        const auto& reasons = ex.reasons();
        CHECK(mentions(reasons, "grid.grid_count has the wrong type"));
        CHECK(mentions(reasons, "grid.direction has unknown value 'sideways'"));
        CHECK(mentions(reasons, "must be greater than lower price"));
        CHECK(mentions(reasons, "leverage must be between 1 and 125"));
        CHECK(mentions(reasons, "worker threads must be at least 1"));
        CHECK(mentions(reasons, "stream.multiplier must be at least 1"));
        CHECK(std::string(ex.what()).find("invalid configuration: ") == 0);
    }
}

TEST_CASE("stop loss on the wrong side of the range is rejected", "[config]") {
    auto root = minimal_settings();
    root["grid"]["stop_loss"] = 3400.0;

    REQUIRE_THROWS_AS(grid::parse_settings(root), grid::ConfigInvalid);
}

TEST_CASE("a non-object section is an error, not a silent default", "[config]") {
    auto root = minimal_settings();
    root["engine"] = json::array({1, 2});

    try {
        grid::parse_settings(root);
        FAIL("expected ConfigInvalid");
    } catch (const grid::ConfigInvalid& ex) {
        CHECK(mentions(ex.reasons(), "engine must be an object"));
    }
    REQUIRE_THROWS_AS(grid::parse_settings(json::array()), grid::ConfigInvalid);
}

TEST_CASE("load_settings reports unreadable and malformed files", "[config]") {
    CHECK_THROWS_AS(grid::load_settings(scratch_file("does-not-exist.json")), grid::ConfigInvalid);

    const auto broken = scratch_file("broken.json");
    {
        std::ofstream out(broken);
        out << "{ \"grid\": { \"symbol\": ";
    }
    try {
        grid::load_settings(broken);
        FAIL("expected ConfigInvalid");
    } catch (const grid::ConfigInvalid& ex) {
        CHECK(std::string(ex.what()).find("is not valid JSON") != std::string::npos);
    }
    std::filesystem::remove(broken);
}

TEST_CASE("the shipped sample configuration is valid", "[config]") {
    const auto sample = std::filesystem::path(__FILE__).parent_path().parent_path() / "config" / "gridbot.json";
    if (!std::filesystem::exists(sample)) {
        WARN("sample configuration not found next to the sources; skipping");
        return;
    }

    const auto settings = grid::load_settings(sample);
    CHECK(settings.grid.symbol == "BTCUSDT");
    CHECK(settings.grid.direction == grid::Direction::Long);
    CHECK(settings.grid.grid_count == 20);
    CHECK_THAT(settings.grid.max_drawdown_pct, WithinAbs(25.0, 1e-12));
}

TEST_CASE("grid configuration survives a json round trip", "[config]") {
    grid::GridConfig config;
    config.symbol = "SOLUSDT";
    config.direction = grid::Direction::Neutral;
    config.grid_type = grid::GridType::Geometric;
    config.lower_price = 120.0;
    config.upper_price = 180.0;
    config.grid_count = 30;
    config.total_investment = 1000.0;
    config.leverage = 5;
    config.take_profit = 200.0;
    config.time_in_force = venue::TimeInForce::IOC;
    config.trailing_up = true;

    std::vector<std::string> errors;
    const auto restored = grid::grid_config_from_json(grid::grid_config_to_json(config), errors);
    CHECK(errors.empty());
    CHECK(restored.symbol == "SOLUSDT");
    CHECK(restored.direction == grid::Direction::Neutral);
    CHECK(restored.grid_type == grid::GridType::Geometric);
    CHECK(restored.grid_count == 30);
    CHECK_FALSE(restored.stop_loss.has_value());
    REQUIRE(restored.take_profit.has_value());
    CHECK_THAT(*restored.take_profit, WithinAbs(200.0, 1e-12));
    CHECK(restored.time_in_force == venue::TimeInForce::IOC);
    CHECK(restored.trailing_up);
    CHECK_FALSE(restored.trailing_down);
}
