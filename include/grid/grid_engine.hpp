#pragma once

#include "grid/grid_calculator.hpp"
#include "grid/grid_config.hpp"
#include "grid/grid_stats.hpp"
#include "grid/order_ledger.hpp"
#include "grid/position_reconciler.hpp"
#include "grid/risk_gate.hpp"
#include "grid/snapshot_store.hpp"
#include "grid/worker_pool.hpp"
#include "venue/exchange_gateway.hpp"
#include "venue/streaming_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace grid {

// Extra order at an occupied (side, price); the engine cancels it.
struct DuplicateOrderDetected {
    std::string order_id;
    venue::Side side = venue::Side::Buy;
    double price = 0.0;
    int64_t timestamp_ms = 0;
};

struct StreamEndpoints {
    std::string account_url;
    std::string market_url;     // ignored when no market stream is supplied
};

// Owns one grid on one symbol. The account stream's dispatch thread is the
// single writer for ledger and position state once RUNNING; while
// INITIALIZING the thread calling start()/resume() is.
class GridEngine {
public:
    // Throws ConfigInvalid.
    GridEngine(GridConfig config,
               EngineOptions options,
               venue::ExchangeGateway& gateway,
               std::unique_ptr<venue::StreamingClient> account_stream,
               std::unique_ptr<venue::StreamingClient> market_stream,
               StreamEndpoints endpoints,
               std::shared_ptr<SnapshotStore> store = nullptr);
    ~GridEngine();

    GridEngine(const GridEngine&) = delete;
    GridEngine& operator=(const GridEngine&) = delete;

    // INITIALIZING -> RUNNING, or ERROR with error_reason() set.
    bool start();
    bool resume(const PersistedSnapshot& snapshot);

    // Blocking. From a dispatch handler this only schedules the stop.
    void stop(const std::string& reason = "manual stop");
    void request_stop(StopTrigger trigger);
    bool wait_until_terminal(std::chrono::milliseconds timeout) const;

    bool pause();
    bool unpause();

    // Runs one fetch/reconcile/cancel/place pass through the dispatch path.
    void reconcile_now();

    [[nodiscard]] EngineState state() const;
    [[nodiscard]] std::string error_reason() const;
    [[nodiscard]] GridStats stats() const;
    [[nodiscard]] GridConfig config() const;
    [[nodiscard]] double last_price() const;
    [[nodiscard]] uint64_t epoch() const;
    [[nodiscard]] std::optional<StopTrigger> stop_trigger() const;
    [[nodiscard]] std::vector<DuplicateOrderDetected> duplicate_events() const;
    [[nodiscard]] std::vector<ImbalanceDetected> imbalance_events() const;
    [[nodiscard]] PersistedSnapshot snapshot() const;

    [[nodiscard]] const OrderLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const PositionReconciler& position() const noexcept { return reconciler_; }

private:
    void initialize(bool resuming);
    double fetch_reference_price();
    void connect_streams();
    void open_initial_position(const std::vector<GridLevel>& levels, double reference_price);
    void cancel_duplicates_sync(const std::vector<venue::ExchangeOrder>& duplicates);
    void fail(const std::string& reason);

    void on_stream_event(const venue::StreamEvent& event);
    void handle_event(const venue::StreamEvent& event);
    void handle_ticker(const venue::TickerEvent& ticker);
    void handle_order(const venue::OrderEvent& order);
    void handle_position(const venue::PositionInfo& position, int64_t timestamp_ms);
    void handle_fill(const std::string& order_id,
                     const std::string& client_order_id,
                     double qty,
                     double price,
                     int64_t timestamp_ms,
                     bool replenish);
    void replenish(const GridTrade& trade);
    void retrail(double lower, double upper, double price);

    void apply_reconcile(const std::vector<venue::ExchangeOrder>& open_orders,
                         const std::vector<venue::FillRecord>& fills);
    void refresh_sides(double price);
    void submit_placement(PlacementTicket ticket);
    void submit_cancel(const std::string& order_id, std::function<void(bool)> done);
    void poll_rest();
    void deliver(std::function<void()> task);
    void replay_early_events();

    void monitor_loop();
    void stop_with(const StopTrigger& trigger);
    void shutdown(const StopTrigger& trigger);
    void stop_monitor();
    void set_state(EngineState state);
    void persist();
    void record_duplicate(const venue::ExchangeOrder& order);
    bool streams_ready() const;
    double imbalance_tolerance(const std::vector<GridLevel>& levels) const;

    venue::ExchangeGateway& gateway_;
    EngineOptions options_;
    std::unique_ptr<venue::StreamingClient> account_;
    std::unique_ptr<venue::StreamingClient> market_;
    StreamEndpoints endpoints_;
    std::shared_ptr<SnapshotStore> store_;

    OrderLedger ledger_;
    PositionReconciler reconciler_;
    std::unique_ptr<WorkerPool> pool_;
    venue::InstrumentSpec instrument_;

    mutable std::mutex mutex_;
    mutable std::condition_variable state_cv_;
    GridConfig config_;
    RiskGate risk_gate_;
    EngineState state_ = EngineState::Initializing;
    std::string error_reason_;
    GridStats stats_;
    double last_price_ = 0.0;
    uint64_t epoch_ = 0;
    int64_t last_fill_ms_ = 0;
    std::optional<StopTrigger> stop_trigger_;
    std::deque<DuplicateOrderDetected> duplicates_;
    std::deque<ImbalanceDetected> imbalances_;
    std::vector<venue::StreamEvent> early_events_;
    bool early_pending_ = false;
    bool started_ = false;
    bool retrail_active_ = false;
    int retrail_cancels_ = 0;

    std::mutex stop_mutex_;
    std::mutex persist_mutex_;
    std::thread monitor_thread_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;
    std::optional<StopTrigger> pending_stop_;
    std::atomic<bool> reconcile_requested_{false};
    std::atomic<bool> reconcile_in_progress_{false};
    std::atomic<bool> poll_in_progress_{false};
    std::atomic<bool> stream_dropped_{false};
};

} // namespace grid
