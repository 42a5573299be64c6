#pragma once

#include "venue/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace grid {

enum class Direction { Long, Short, Neutral };

enum class GridType { Arithmetic, Geometric };

const char* to_string(Direction direction) noexcept;
const char* to_string(GridType type) noexcept;
std::optional<Direction> parse_direction(const std::string& text);
std::optional<GridType> parse_grid_type(const std::string& text);
std::optional<venue::OrderType> parse_order_type(const std::string& text);
std::optional<venue::TimeInForce> parse_time_in_force(const std::string& text);

// Immutable for the lifetime of a run.
struct GridConfig {
    std::string symbol = "BTCUSDT";
    Direction direction = Direction::Long;
    GridType grid_type = GridType::Arithmetic;
    double lower_price = 0.0;
    double upper_price = 0.0;
    int grid_count = 10;
    double total_investment = 0.0;   // quote currency
    int leverage = 1;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    double max_position_size = 0.0;  // per-level notional cap, 0 disables
    double max_drawdown_pct = 0.0;   // 0 disables
    venue::OrderType order_type = venue::OrderType::Limit;
    venue::TimeInForce time_in_force = venue::TimeInForce::GTC;
    bool post_only = false;
    bool trailing_up = false;
    bool trailing_down = false;
    bool cancel_orders_on_stop = true;
    bool close_position_on_stop = false;

    // Every failed rule, not just the first.
    [[nodiscard]] std::vector<std::string> validate() const;

    // Throws ConfigInvalid.
    void ensure_valid() const;

    [[nodiscard]] double spacing() const noexcept;
    [[nodiscard]] venue::TimeInForce effective_time_in_force() const noexcept;
};

struct EngineOptions {
    double price_buffer_pct = 0.1;        // percent of the reference price
    double price_tolerance = 1.0;         // quote currency
    int replenish_step = 1;
    bool accept_high_risk = false;
    bool accept_out_of_range = false;
    bool open_initial_position = true;
    double maintenance_margin_rate = 0.005;
    double imbalance_tolerance = 0.0;     // 0 uses half of one level quantity
    int connect_timeout_ms = 10000;
    int stop_timeout_ms = 5000;
    int reconcile_interval_ms = 60000;
    int rest_poll_interval_ms = 5000;
    int worker_threads = 2;
    int worker_queue_limit = 64;
    std::string instance_id = "default";

    [[nodiscard]] std::vector<std::string> validate() const;
};

} // namespace grid
