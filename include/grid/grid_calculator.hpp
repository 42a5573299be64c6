#pragma once

#include "grid/grid_config.hpp"
#include "venue/types.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace grid {

struct GridLevel {
    int index = 0;
    double price = 0.0;
    std::optional<venue::Side> side;   // empty when the level sits inside the buffer
    double quantity = 0.0;
};

// Pure grid math; no I/O.
class GridCalculator {
public:
    // One entry per grid index, ascending by price. Throws InsufficientGridResolution.
    static std::vector<GridLevel> levels(const GridConfig& config,
                                         double reference_price,
                                         const venue::InstrumentSpec& instrument,
                                         double buffer_pct = 0.1);

    // Levels that carry a side; these are placed at start.
    static std::vector<GridLevel> initial_orders(const std::vector<GridLevel>& levels);

    static std::vector<double> level_prices(const GridConfig& config, double tick_size);
    static double level_quantity(const GridConfig& config,
                                 double reference_price,
                                 const venue::InstrumentSpec& instrument);

    // BUY strictly below reference - buffer, SELL strictly above reference + buffer.
    static std::optional<venue::Side> assign_side(double price, double reference_price, double buffer);

    // Re-centred (lower, upper) when a trailing boundary is crossed.
    static std::optional<std::pair<double, double>> trailed_range(const GridConfig& config, double price);

    static double round_to_tick(double price, double tick_size);
    static double floor_to_step(double value, double step);
};

} // namespace grid
