#include "grid/risk_gate.hpp"

#include "grid/grid_calculator.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <utility>

namespace grid {
namespace {

constexpr int kHighLeverageWarning = 10;
constexpr int kHighLeverageLimit = 20;

// Which way the position is exposed: true when a falling price hurts.
bool long_exposure(Direction direction, double signed_position) {
    if (direction == Direction::Long) {
        return true;
    }
    if (direction == Direction::Short) {
        return false;
    }
    return signed_position >= 0.0;
}

} // namespace

const char* to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::Manual: return "manual";
        case StopReason::StopLoss: return "stop_loss";
        case StopReason::TakeProfit: return "take_profit";
        case StopReason::MaxDrawdown: return "max_drawdown";
        case StopReason::Fatal: return "fatal";
    }
    return "manual";
}

RiskGate::RiskGate(GridConfig config, double maintenance_margin_rate, bool accept_out_of_range)
    : config_(std::move(config)),
      maintenance_margin_rate_(maintenance_margin_rate),
      accept_out_of_range_(accept_out_of_range) {}

void RiskGate::update_config(GridConfig config) {
    config_ = std::move(config);
}

double RiskGate::liquidation_distance_pct() const noexcept {
    if (config_.leverage <= 0) {
        return 100.0;
    }
    return (100.0 - maintenance_margin_rate_ * 100.0) / config_.leverage;
}

RiskReport RiskGate::pre_start_check(double reference_price, const venue::InstrumentSpec& instrument) const {
    RiskReport report;
    if (reference_price <= 0.0) {
        report.reasons.push_back("reference price must be positive");
        report.ok = false;
        return report;
    }

    const double quantity = GridCalculator::level_quantity(config_, reference_price, instrument);
    if (quantity + 1e-12 < instrument.min_qty || quantity <= 0.0) {
        report.reasons.push_back(fmt::format("per-grid quantity {} is below the exchange minimum {}",
                                             quantity, instrument.min_qty));
    }

    report.liquidation_distance_pct = liquidation_distance_pct();
    const bool below = config_.direction != Direction::Short;
    report.liquidation_price = below ? reference_price * (1.0 - report.liquidation_distance_pct / 100.0)
                                     : reference_price * (1.0 + report.liquidation_distance_pct / 100.0);

    if (config_.stop_loss) {
        const double stop_distance_pct = std::fabs(reference_price - *config_.stop_loss) / reference_price * 100.0;
        if (stop_distance_pct >= report.liquidation_distance_pct) {
            report.reasons.push_back(fmt::format(
                "liquidation risk: stop loss {} is {:.2f}% away but liquidation is estimated {:.2f}% away at {:.2f}",
                *config_.stop_loss, stop_distance_pct, report.liquidation_distance_pct, report.liquidation_price));
        }
    } else {
        report.warnings.push_back("no stop loss configured");
    }

    if (config_.leverage > 1 && report.liquidation_price >= config_.lower_price &&
        report.liquidation_price <= config_.upper_price) {
        report.reasons.push_back(fmt::format("estimated liquidation price {:.2f} lies inside the grid range [{}, {}]",
                                             report.liquidation_price, config_.lower_price, config_.upper_price));
    }

    const double per_level = config_.total_investment * config_.leverage / config_.grid_count;
    if (config_.max_position_size > 0.0 && per_level > config_.max_position_size) {
        report.reasons.push_back(fmt::format("per-level notional {:.2f} exceeds max position size {:.2f}",
                                             per_level, config_.max_position_size));
    }

    if ((reference_price < config_.lower_price || reference_price > config_.upper_price) && !accept_out_of_range_) {
        report.reasons.push_back(fmt::format("reference price {} is outside the grid range [{}, {}]",
                                             reference_price, config_.lower_price, config_.upper_price));
    }

    if (config_.leverage > instrument.max_leverage) {
        report.reasons.push_back(fmt::format("leverage {}x exceeds the exchange maximum {}x",
                                             config_.leverage, instrument.max_leverage));
    }
    if (config_.leverage > kHighLeverageLimit) {
        report.reasons.push_back(fmt::format("leverage {}x is above the {}x limit", config_.leverage,
                                             kHighLeverageLimit));
    } else if (config_.leverage > kHighLeverageWarning) {
        report.warnings.push_back(fmt::format("high leverage {}x", config_.leverage));
    }

    report.ok = report.reasons.empty();
    return report;
}

std::optional<StopTrigger> RiskGate::evaluate(double price, double signed_position, const GridStats& stats) const {
    if (price <= 0.0) {
        return std::nullopt;
    }

    const bool exposed_long = long_exposure(config_.direction, signed_position);
    const bool flat_neutral = config_.direction == Direction::Neutral && signed_position == 0.0;

    if (config_.stop_loss && !flat_neutral) {
        const bool hit = exposed_long ? price <= *config_.stop_loss : price >= *config_.stop_loss;
        if (hit) {
            return StopTrigger{StopReason::StopLoss,
                               fmt::format("stop loss {} breached at {}", *config_.stop_loss, price), price};
        }
    }

    if (config_.take_profit && !flat_neutral) {
        const bool hit = exposed_long ? price >= *config_.take_profit : price <= *config_.take_profit;
        if (hit) {
            return StopTrigger{StopReason::TakeProfit,
                               fmt::format("take profit {} reached at {}", *config_.take_profit, price), price};
        }
    }

    if (config_.max_drawdown_pct > 0.0 && stats.current_drawdown_pct >= config_.max_drawdown_pct) {
        return StopTrigger{StopReason::MaxDrawdown,
                           fmt::format("drawdown {:.2f}% exceeds the {:.2f}% limit", stats.current_drawdown_pct,
                                       config_.max_drawdown_pct),
                           price};
    }
    return std::nullopt;
}

} // namespace grid
