#pragma once

#include "grid/grid_config.hpp"
#include "grid/grid_stats.hpp"
#include "venue/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace grid {

struct RiskReport {
    bool ok = true;
    std::vector<std::string> reasons;
    std::vector<std::string> warnings;
    double liquidation_price = 0.0;
    double liquidation_distance_pct = 0.0;
};

enum class StopReason { Manual, StopLoss, TakeProfit, MaxDrawdown, Fatal };

const char* to_string(StopReason reason) noexcept;

struct StopTrigger {
    StopReason reason = StopReason::Manual;
    std::string message;
    double price = 0.0;
};

class RiskGate {
public:
    RiskGate(GridConfig config, double maintenance_margin_rate = 0.005, bool accept_out_of_range = false);

    // Every failing check is listed; callers decide whether an override applies.
    [[nodiscard]] RiskReport pre_start_check(double reference_price, const venue::InstrumentSpec& instrument) const;

    // First breached stop among stop loss, take profit and drawdown.
    [[nodiscard]] std::optional<StopTrigger> evaluate(double price,
                                                      double signed_position,
                                                      const GridStats& stats) const;

    // Percent move from entry that wipes the initial margin net of maintenance.
    [[nodiscard]] double liquidation_distance_pct() const noexcept;

    void update_config(GridConfig config);

private:
    GridConfig config_;
    double maintenance_margin_rate_;
    bool accept_out_of_range_;
};

} // namespace grid
