#include "grid/grid_calculator.hpp"

#include "grid/errors.hpp"

#include <cmath>

namespace grid {
namespace {

constexpr double kEpsilon = 1e-9;
constexpr double kTrailTrigger = 0.05;
constexpr double kTrailLeadShare = 0.6;

} // namespace

double GridCalculator::round_to_tick(double price, double tick_size) {
    if (tick_size <= 0.0) {
        return price;
    }
    return std::round(price / tick_size) * tick_size;
}

double GridCalculator::floor_to_step(double value, double step) {
    if (step <= 0.0) {
        return value;
    }
    return std::floor(value / step + kEpsilon) * step;
}

std::vector<double> GridCalculator::level_prices(const GridConfig& config, double tick_size) {
    std::vector<double> prices;
    if (config.grid_count < 2) {
        return prices;
    }
    prices.reserve(static_cast<std::size_t>(config.grid_count));

    const auto last = static_cast<double>(config.grid_count - 1);
    if (config.grid_type == GridType::Geometric) {
        const double ratio = std::pow(config.upper_price / config.lower_price, 1.0 / last);
        for (int i = 0; i < config.grid_count; ++i) {
            prices.push_back(round_to_tick(config.lower_price * std::pow(ratio, i), tick_size));
        }
    } else {
        const double spacing = config.spacing();
        for (int i = 0; i < config.grid_count; ++i) {
            prices.push_back(round_to_tick(config.lower_price + spacing * i, tick_size));
        }
    }
    return prices;
}

double GridCalculator::level_quantity(const GridConfig& config,
                                      double reference_price,
                                      const venue::InstrumentSpec& instrument) {
    if (reference_price <= 0.0 || config.grid_count < 1) {
        return 0.0;
    }
    const double per_grid = config.total_investment * config.leverage / config.grid_count;
    return floor_to_step(per_grid / reference_price, instrument.qty_step);
}

std::optional<venue::Side> GridCalculator::assign_side(double price, double reference_price, double buffer) {
    if (price < reference_price - buffer) {
        return venue::Side::Buy;
    }
    if (price > reference_price + buffer) {
        return venue::Side::Sell;
    }
    return std::nullopt;
}

std::vector<GridLevel> GridCalculator::levels(const GridConfig& config,
                                              double reference_price,
                                              const venue::InstrumentSpec& instrument,
                                              double buffer_pct) {
    config.ensure_valid();

    const double quantity = level_quantity(config, reference_price, instrument);
    if (quantity + kEpsilon < instrument.min_qty || quantity <= 0.0) {
        throw InsufficientGridResolution(quantity, instrument.min_qty);
    }

    const double buffer = reference_price * buffer_pct / 100.0;
    const auto prices = level_prices(config, instrument.tick_size);

    std::vector<GridLevel> result;
    result.reserve(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        GridLevel level;
        level.index = static_cast<int>(i);
        level.price = prices[i];
        level.side = assign_side(prices[i], reference_price, buffer);
        level.quantity = quantity;
        result.push_back(level);
    }
    return result;
}

std::vector<GridLevel> GridCalculator::initial_orders(const std::vector<GridLevel>& levels) {
    std::vector<GridLevel> orders;
    for (const auto& level : levels) {
        if (level.side) {
            orders.push_back(level);
        }
    }
    return orders;
}

std::optional<std::pair<double, double>> GridCalculator::trailed_range(const GridConfig& config, double price) {
    const double range = config.upper_price - config.lower_price;
    if (range <= 0.0 || price <= 0.0) {
        return std::nullopt;
    }

    if (config.trailing_up && price > config.upper_price * (1.0 + kTrailTrigger)) {
        return std::make_pair(price - (1.0 - kTrailLeadShare) * range, price + kTrailLeadShare * range);
    }
    if (config.trailing_down && price < config.lower_price * (1.0 - kTrailTrigger)) {
        const double lower = price - kTrailLeadShare * range;
        if (lower <= 0.0) {
            return std::nullopt;
        }
        return std::make_pair(lower, price + (1.0 - kTrailLeadShare) * range);
    }
    return std::nullopt;
}

} // namespace grid
