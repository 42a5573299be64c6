#include "grid/grid_stats.hpp"

#include <algorithm>

namespace grid {

void GridStats::record(const GridTrade& trade) {
    ++total_trades;
    if (trade.side == venue::Side::Buy) {
        ++buy_fills;
    } else {
        ++sell_fills;
    }
    volume_quote += trade.fill_price * trade.quantity;

    if (trade.realized_profit) {
        ++round_trips;
        realized_profit += *trade.realized_profit;
        if (*trade.realized_profit > 0.0) {
            ++winning_round_trips;
        } else if (*trade.realized_profit < 0.0) {
            ++losing_round_trips;
        }
    }
}

void GridStats::update_equity(double investment, double unrealized_pnl) {
    const double equity = investment + realized_profit + unrealized_pnl;
    peak_equity = std::max(peak_equity, equity);
    if (peak_equity <= 0.0) {
        current_drawdown_pct = 0.0;
        return;
    }
    current_drawdown_pct = std::max(0.0, (peak_equity - equity) / peak_equity * 100.0);
    max_drawdown_pct = std::max(max_drawdown_pct, current_drawdown_pct);
}

double GridStats::win_rate() const noexcept {
    if (round_trips == 0) {
        return 0.0;
    }
    return static_cast<double>(winning_round_trips) / static_cast<double>(round_trips) * 100.0;
}

} // namespace grid
