#include "grid/grid_config.hpp"

#include "grid/errors.hpp"
#include "venue/util.hpp"

#include <sstream>

namespace grid {
namespace {

std::string describe(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

const char* to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Long: return "LONG";
        case Direction::Short: return "SHORT";
        case Direction::Neutral: return "NEUTRAL";
    }
    return "LONG";
}

const char* to_string(GridType type) noexcept {
    return type == GridType::Geometric ? "GEOMETRIC" : "ARITHMETIC";
}

std::optional<Direction> parse_direction(const std::string& text) {
    const auto upper = venue::to_upper_copy(text);
    if (upper == "LONG") {
        return Direction::Long;
    }
    if (upper == "SHORT") {
        return Direction::Short;
    }
    if (upper == "NEUTRAL") {
        return Direction::Neutral;
    }
    return std::nullopt;
}

std::optional<GridType> parse_grid_type(const std::string& text) {
    const auto upper = venue::to_upper_copy(text);
    if (upper == "ARITHMETIC") {
        return GridType::Arithmetic;
    }
    if (upper == "GEOMETRIC") {
        return GridType::Geometric;
    }
    return std::nullopt;
}

std::optional<venue::OrderType> parse_order_type(const std::string& text) {
    const auto upper = venue::to_upper_copy(text);
    if (upper == "LIMIT") {
        return venue::OrderType::Limit;
    }
    if (upper == "MARKET") {
        return venue::OrderType::Market;
    }
    return std::nullopt;
}

std::optional<venue::TimeInForce> parse_time_in_force(const std::string& text) {
    const auto upper = venue::to_upper_copy(text);
    if (upper == "GTC") {
        return venue::TimeInForce::GTC;
    }
    if (upper == "IOC") {
        return venue::TimeInForce::IOC;
    }
    if (upper == "FOK") {
        return venue::TimeInForce::FOK;
    }
    if (upper == "POST_ONLY") {
        return venue::TimeInForce::PostOnly;
    }
    return std::nullopt;
}

std::vector<std::string> GridConfig::validate() const {
    std::vector<std::string> reasons;

    if (symbol.empty()) {
        reasons.emplace_back("symbol must not be empty");
    }
    if (lower_price <= 0.0 || upper_price <= 0.0) {
        reasons.emplace_back("lower and upper prices must be positive");
    }
    if (upper_price <= lower_price) {
        reasons.emplace_back("upper price " + describe(upper_price) +
                             " must be greater than lower price " + describe(lower_price));
    }
    if (grid_count < 2) {
        reasons.emplace_back("grid count must be at least 2, got " + std::to_string(grid_count));
    }
    if (total_investment <= 0.0) {
        reasons.emplace_back("total investment must be positive");
    }
    if (leverage < 1 || leverage > 125) {
        reasons.emplace_back("leverage must be between 1 and 125, got " + std::to_string(leverage));
    }
    if (stop_loss) {
        if (direction == Direction::Long && *stop_loss >= lower_price) {
            reasons.emplace_back("stop loss " + describe(*stop_loss) +
                                 " must be below the lower price for a LONG grid");
        }
        if (direction == Direction::Short && *stop_loss <= upper_price) {
            reasons.emplace_back("stop loss " + describe(*stop_loss) +
                                 " must be above the upper price for a SHORT grid");
        }
    }
    if (take_profit) {
        if (direction == Direction::Long && *take_profit <= lower_price) {
            reasons.emplace_back("take profit must be above the lower price for a LONG grid");
        }
        if (direction == Direction::Short && *take_profit >= upper_price) {
            reasons.emplace_back("take profit must be below the upper price for a SHORT grid");
        }
    }
    if (max_position_size < 0.0) {
        reasons.emplace_back("max position size must not be negative");
    }
    if (max_drawdown_pct < 0.0 || max_drawdown_pct > 100.0) {
        reasons.emplace_back("max drawdown percent must be within [0, 100]");
    }
    if (post_only && order_type == venue::OrderType::Market) {
        reasons.emplace_back("post-only cannot be combined with market orders");
    }

    return reasons;
}

void GridConfig::ensure_valid() const {
    auto reasons = validate();
    if (!reasons.empty()) {
        throw ConfigInvalid(std::move(reasons));
    }
}

double GridConfig::spacing() const noexcept {
    if (grid_count < 2) {
        return 0.0;
    }
    return (upper_price - lower_price) / static_cast<double>(grid_count - 1);
}

venue::TimeInForce GridConfig::effective_time_in_force() const noexcept {
    return post_only ? venue::TimeInForce::PostOnly : time_in_force;
}

std::vector<std::string> EngineOptions::validate() const {
    std::vector<std::string> reasons;
    if (price_buffer_pct < 0.0 || price_buffer_pct >= 50.0) {
        reasons.emplace_back("price buffer percent must be within [0, 50)");
    }
    if (price_tolerance < 0.0) {
        reasons.emplace_back("price tolerance must not be negative");
    }
    if (replenish_step < 0) {
        reasons.emplace_back("replenish step must not be negative");
    }
    if (maintenance_margin_rate <= 0.0 || maintenance_margin_rate >= 1.0) {
        reasons.emplace_back("maintenance margin rate must be within (0, 1)");
    }
    if (worker_threads < 1) {
        reasons.emplace_back("worker threads must be at least 1");
    }
    if (worker_queue_limit < 1) {
        reasons.emplace_back("worker queue limit must be at least 1");
    }
    if (connect_timeout_ms <= 0 || stop_timeout_ms <= 0) {
        reasons.emplace_back("timeouts must be positive");
    }
    if (instance_id.empty()) {
        reasons.emplace_back("instance id must not be empty");
    }
    return reasons;
}

} // namespace grid
