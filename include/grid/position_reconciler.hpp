#pragma once

#include "grid/grid_calculator.hpp"
#include "grid/grid_config.hpp"
#include "grid/order_ledger.hpp"
#include "venue/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace grid {

struct InitialPosition {
    venue::Side side = venue::Side::Buy;
    double quantity = 0.0;
    std::string explanation;
};

// Observability only; the engine never corrects the position itself.
struct ImbalanceDetected {
    double expected = 0.0;
    double actual = 0.0;
    double tolerance = 0.0;
    int64_t timestamp_ms = 0;

    [[nodiscard]] double difference() const noexcept { return actual - expected; }
};

struct PositionSnapshot {
    venue::PositionInfo position;
    int64_t updated_ms = 0;
};

class PositionReconciler {
public:
    explicit PositionReconciler(double tolerance = 0.0);

    void set_tolerance(double tolerance);
    [[nodiscard]] double tolerance() const;

    // Position before the first grid fill (initial market order included).
    void set_baseline(double signed_size);
    [[nodiscard]] double baseline() const;

    void record_fill(venue::Side side, double quantity);

    // baseline + filled buys - filled sells
    [[nodiscard]] double expected_position() const;

    // BUY minus SELL quantity still resting in the ladder.
    static double expected_net(const std::vector<LedgerEntry>& entries);
    static double expected_net(const std::vector<GridLevel>& levels);

    std::optional<ImbalanceDetected> on_position_update(const venue::PositionInfo& position, int64_t timestamp_ms);
    void on_mark_price(double price);

    [[nodiscard]] std::optional<PositionSnapshot> snapshot() const;
    void restore(double baseline, std::optional<PositionSnapshot> snapshot);

    static InitialPosition initial_position_needed(const std::vector<GridLevel>& levels,
                                                   double reference_price,
                                                   Direction direction,
                                                   const venue::InstrumentSpec& instrument);

private:
    mutable std::mutex mutex_;
    double tolerance_;
    double baseline_ = 0.0;
    double filled_net_ = 0.0;
    std::optional<PositionSnapshot> snapshot_;
};

} // namespace grid
