#include "grid/position_reconciler.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace grid {

PositionReconciler::PositionReconciler(double tolerance)
    : tolerance_(tolerance) {}

void PositionReconciler::set_tolerance(double tolerance) {
    std::lock_guard<std::mutex> lock(mutex_);
    tolerance_ = tolerance;
}

double PositionReconciler::tolerance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tolerance_;
}

void PositionReconciler::set_baseline(double signed_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    baseline_ = signed_size;
    filled_net_ = 0.0;
}

double PositionReconciler::baseline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return baseline_;
}

void PositionReconciler::record_fill(venue::Side side, double quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    filled_net_ += side == venue::Side::Buy ? quantity : -quantity;
}

double PositionReconciler::expected_position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return baseline_ + filled_net_;
}

double PositionReconciler::expected_net(const std::vector<LedgerEntry>& entries) {
    double net = 0.0;
    for (const auto& entry : entries) {
        if (!entry.is_active()) {
            continue;
        }
        net += entry.side == venue::Side::Buy ? entry.quantity : -entry.quantity;
    }
    return net;
}

double PositionReconciler::expected_net(const std::vector<GridLevel>& levels) {
    double net = 0.0;
    for (const auto& level : levels) {
        if (level.side) {
            net += *level.side == venue::Side::Buy ? level.quantity : -level.quantity;
        }
    }
    return net;
}

std::optional<ImbalanceDetected> PositionReconciler::on_position_update(const venue::PositionInfo& position,
                                                                        int64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = PositionSnapshot{position, timestamp_ms};

    const double expected = baseline_ + filled_net_;
    if (std::fabs(position.signed_size - expected) <= tolerance_ + 1e-12) {
        return std::nullopt;
    }
    ImbalanceDetected event;
    event.expected = expected;
    event.actual = position.signed_size;
    event.tolerance = tolerance_;
    event.timestamp_ms = timestamp_ms;
    return event;
}

void PositionReconciler::on_mark_price(double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot_ || price <= 0.0) {
        return;
    }
    auto& position = snapshot_->position;
    position.mark_price = price;
    if (position.entry_price > 0.0) {
        position.unrealized_pnl = (price - position.entry_price) * position.signed_size;
    }
}

std::optional<PositionSnapshot> PositionReconciler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

void PositionReconciler::restore(double baseline, std::optional<PositionSnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    baseline_ = baseline;
    filled_net_ = 0.0;
    snapshot_ = std::move(snapshot);
}

InitialPosition PositionReconciler::initial_position_needed(const std::vector<GridLevel>& levels,
                                                            double reference_price,
                                                            Direction direction,
                                                            const venue::InstrumentSpec& instrument) {
    int buys = 0;
    int sells = 0;
    double buy_qty = 0.0;
    double sell_qty = 0.0;
    for (const auto& level : levels) {
        if (!level.side) {
            continue;
        }
        if (*level.side == venue::Side::Buy && level.price < reference_price) {
            ++buys;
            buy_qty += level.quantity;
        } else if (*level.side == venue::Side::Sell && level.price > reference_price) {
            ++sells;
            sell_qty += level.quantity;
        }
    }

    InitialPosition result;
    double raw = 0.0;
    switch (direction) {
        case Direction::Long:
            result.side = venue::Side::Buy;
            raw = std::max(sell_qty - buy_qty, 0.0);
            break;
        case Direction::Short:
            result.side = venue::Side::Sell;
            raw = std::max(buy_qty - sell_qty, 0.0);
            break;
        case Direction::Neutral:
            result.side = sell_qty >= buy_qty ? venue::Side::Buy : venue::Side::Sell;
            raw = std::fabs(sell_qty - buy_qty);
            break;
    }
    result.quantity = GridCalculator::floor_to_step(raw, instrument.qty_step);
    if (result.quantity + 1e-12 < instrument.min_qty) {
        result.quantity = 0.0;
    }

    if (result.quantity <= 0.0) {
        result.explanation = fmt::format("{} SELL levels above and {} BUY levels below {}: no initial position needed",
                                         sells, buys, reference_price);
    } else {
        result.explanation = fmt::format("{} SELL levels above and {} BUY levels below {}: {} {} so every {} has inventory",
                                         sells, buys, reference_price, venue::to_string(result.side),
                                         result.quantity,
                                         result.side == venue::Side::Buy ? "SELL" : "BUY");
    }
    return result;
}

} // namespace grid
