#pragma once

#include "grid/grid_calculator.hpp"
#include "venue/exchange_gateway.hpp"
#include "venue/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace grid {

enum class EntryStatus { Pending, Open, Filled, Cancelled };

const char* to_string(EntryStatus status) noexcept;
std::optional<EntryStatus> parse_entry_status(const std::string& text);

struct LedgerEntry {
    int level_index = 0;
    venue::Side side = venue::Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
    std::string client_order_id;
    std::optional<std::string> exchange_order_id;
    EntryStatus status = EntryStatus::Pending;
    bool in_flight = false;
    std::string last_error;
    std::optional<double> open_price;   // fill price of the leg this order closes
    uint64_t token = 0;
    int missed_reconciles = 0;          // consecutive passes the exchange did not list it

    [[nodiscard]] bool is_active() const noexcept {
        return status == EntryStatus::Pending || status == EntryStatus::Open;
    }
};

// Emitted once per filled ledger entry.
struct GridTrade {
    int level_index = 0;
    venue::Side side = venue::Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
    double fill_price = 0.0;
    std::string exchange_order_id;
    std::string client_order_id;
    std::optional<double> open_price;
    std::optional<double> realized_profit;
    int64_t timestamp_ms = 0;
};

struct ReconcileResult {
    std::vector<venue::ExchangeOrder> duplicates_to_cancel;
    std::vector<GridLevel> missing_levels;
    std::vector<venue::ExchangeOrder> unmatched;
    std::vector<LedgerEntry> unresolved;
    std::size_t adopted = 0;
    std::size_t dropped = 0;
};

// Startup runs after fills since the last snapshot were applied, so an order
// missing from the exchange is gone. A periodic pass can race a fill that is
// still queued, so a missing order is only dropped after repeated misses.
enum class ReconcilePass { Startup, Periodic };

struct PlacementTicket {
    int level_index = 0;
    uint64_t token = 0;
    venue::OrderRequest request;
};

enum class PlaceOutcome { Placed, LevelBusy, Failed, Closed };

struct LedgerOptions {
    std::string symbol;
    double tick_size = 0.01;
    double price_tolerance = 1.0;
    venue::OrderType order_type = venue::OrderType::Limit;
    venue::TimeInForce time_in_force = venue::TimeInForce::GTC;
    uint64_t epoch = 1;
    int replenish_step = 1;
};

// Level -> client id -> exchange id bookkeeping. At most one non-terminal
// entry per level. Network calls happen outside the ledger mutex: an entry is
// marked in flight, the lock is released for the call, then re-taken to finalize.
class OrderLedger {
public:
    OrderLedger(venue::ExchangeGateway& gateway, LedgerOptions options);

    void configure(LedgerOptions options);
    [[nodiscard]] LedgerOptions options() const;

    void set_levels(std::vector<GridLevel> levels);
    [[nodiscard]] std::vector<GridLevel> levels() const;

    // Idempotent: missing levels are reserved as PENDING entries and duplicates
    // are remembered, so an immediate second call reports neither again.
    ReconcileResult reconcile(const std::vector<venue::ExchangeOrder>& exchange_open_orders,
                              ReconcilePass pass = ReconcilePass::Periodic);

    // Synchronous forms, used while no dispatch thread is running.
    PlaceOutcome place(const GridLevel& level,
                       venue::Side side,
                       std::optional<double> open_price = std::nullopt);
    std::size_t place_missing();

    // Two-phase forms for callers that run the network call elsewhere.
    std::optional<PlacementTicket> begin_place(const GridLevel& level,
                                               venue::Side side,
                                               std::optional<double> open_price = std::nullopt);
    std::vector<PlacementTicket> begin_place_missing();
    void complete_place(const PlacementTicket& ticket, const venue::PlaceResult& result);
    void fail_place(const PlacementTicket& ticket, const std::string& error);

    // Unknown ids are logged and ignored; repeated fills for one order are ignored.
    std::optional<GridTrade> on_fill(const std::string& exchange_order_id,
                                     double filled_qty,
                                     double filled_price,
                                     const std::string& client_order_id = "",
                                     int64_t timestamp_ms = 0);
    [[nodiscard]] bool fill_processed(const std::string& exchange_order_id) const;

    // Cancels are counted as in flight so stop can wait for them.
    void begin_cancel();
    void finish_cancel(const std::string& exchange_order_id, bool cancelled);
    void on_cancelled(const std::string& exchange_order_id, const std::string& client_order_id = "");

    void close();
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] std::size_t in_flight() const;
    bool wait_idle(std::chrono::milliseconds timeout) const;
    std::size_t drop_unsubmitted();

    [[nodiscard]] std::vector<LedgerEntry> entries() const;
    [[nodiscard]] std::vector<LedgerEntry> open_entries() const;
    [[nodiscard]] std::optional<LedgerEntry> entry_at(int level_index) const;
    [[nodiscard]] std::size_t active_count() const;
    void restore(const std::vector<LedgerEntry>& entries);
    void clear();

    static std::string make_client_order_id(const std::string& symbol,
                                            int level_index,
                                            venue::Side side,
                                            uint64_t epoch,
                                            uint64_t token);

private:
    PlacementTicket start_flight(LedgerEntry& entry);
    LedgerEntry* find_by_exchange_id(const std::string& exchange_order_id);
    LedgerEntry* find_by_client_id(const std::string& client_order_id);
    std::optional<int> match_level(const venue::ExchangeOrder& order, double tolerance) const;
    double match_tolerance() const;
    bool closed_by_counter_order(const LedgerEntry& entry) const;
    void remember_fill(const std::string& exchange_order_id);
    void finish_flight();

    venue::ExchangeGateway& gateway_;
    LedgerOptions options_;
    std::vector<GridLevel> levels_;
    std::map<int, LedgerEntry> entries_;
    std::unordered_set<std::string> cancel_requested_;
    std::unordered_set<std::string> processed_fills_;
    std::deque<std::string> processed_order_;
    uint64_t next_token_ = 1;
    std::size_t in_flight_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;
};

} // namespace grid
