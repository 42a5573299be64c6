#pragma once

#include "grid/order_ledger.hpp"

#include <cstdint>

namespace grid {

struct GridStats {
    int64_t total_trades = 0;
    int64_t buy_fills = 0;
    int64_t sell_fills = 0;
    int64_t round_trips = 0;
    int64_t winning_round_trips = 0;
    int64_t losing_round_trips = 0;
    double volume_quote = 0.0;
    double realized_profit = 0.0;
    double peak_equity = 0.0;
    double current_drawdown_pct = 0.0;
    double max_drawdown_pct = 0.0;
    int64_t duplicates_cancelled = 0;
    int64_t imbalances_detected = 0;
    int64_t started_ms = 0;

    void record(const GridTrade& trade);

    // Equity = investment + realized + unrealized. Tracks peak and drawdown from it.
    void update_equity(double investment, double unrealized_pnl);

    [[nodiscard]] double win_rate() const noexcept;
};

} // namespace grid
