#include "grid/grid_engine.hpp"

#include "grid/errors.hpp"
#include "grid/logging.hpp"
#include "venue/errors.hpp"
#include "venue/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace grid {
namespace {

constexpr auto kMonitorTick = std::chrono::milliseconds(200);
constexpr std::size_t kEventHistory = 100;

struct MergedFill {
    std::string order_id;
    std::string client_order_id;
    double qty = 0.0;
    double notional = 0.0;
    int64_t timestamp_ms = 0;

    double price() const { return qty > 0.0 ? notional / qty : 0.0; }
};

// One entry per exchange order, ordered by the exchange timestamp of its last trade.
std::vector<MergedFill> merge_fills(const std::vector<venue::FillRecord>& fills) {
    std::map<std::string, MergedFill> by_order;
    for (const auto& fill : fills) {
        auto& merged = by_order[fill.order_id];
        merged.order_id = fill.order_id;
        if (merged.client_order_id.empty()) {
            merged.client_order_id = fill.client_order_id;
        }
        merged.qty += fill.qty;
        merged.notional += fill.qty * fill.price;
        merged.timestamp_ms = std::max(merged.timestamp_ms, fill.timestamp_ms);
    }

    std::vector<MergedFill> ordered;
    ordered.reserve(by_order.size());
    for (auto& [id, merged] : by_order) {
        ordered.push_back(std::move(merged));
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const MergedFill& a, const MergedFill& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return ordered;
}

template <typename T>
void push_bounded(std::deque<T>& events, T event) {
    events.push_back(std::move(event));
    while (events.size() > kEventHistory) {
        events.pop_front();
    }
}

bool is_terminal(EngineState state) {
    return state == EngineState::Stopped || state == EngineState::Error;
}

} // namespace

GridEngine::GridEngine(GridConfig config,
                       EngineOptions options,
                       venue::ExchangeGateway& gateway,
                       std::unique_ptr<venue::StreamingClient> account_stream,
                       std::unique_ptr<venue::StreamingClient> market_stream,
                       StreamEndpoints endpoints,
                       std::shared_ptr<SnapshotStore> store)
    : gateway_(gateway),
      options_(std::move(options)),
      account_(std::move(account_stream)),
      market_(std::move(market_stream)),
      endpoints_(std::move(endpoints)),
      store_(std::move(store)),
      ledger_(gateway, LedgerOptions{}),
      config_(std::move(config)),
      risk_gate_(config_, options_.maintenance_margin_rate, options_.accept_out_of_range) {
    auto reasons = config_.validate();
    for (auto& reason : options_.validate()) {
        reasons.push_back(std::move(reason));
    }
    if (!account_) {
        reasons.emplace_back("an account stream is required");
    }
    if (!reasons.empty()) {
        throw ConfigInvalid(std::move(reasons));
    }

    account_->set_message_handler([this](const venue::StreamEvent& event) { on_stream_event(event); });
    account_->set_state_handler([this](venue::StreamState state) {
        if (state == venue::StreamState::Reconnecting) {
            stream_dropped_ = true;
        } else if (account_->is_ready() && stream_dropped_.exchange(false)) {
            // Events may have been missed while the stream was down.
            reconcile_requested_ = true;
            monitor_cv_.notify_all();
        }
    });

    if (market_) {
        market_->set_message_handler([this](const venue::StreamEvent& event) {
            if (!account_->post([this, event]() { on_stream_event(event); })) {
                spdlog::debug("[Engine] account dispatch stopped, market event dropped");
            }
        });
    }
}

GridEngine::~GridEngine() {
    const auto current = state();
    if (current == EngineState::Running || current == EngineState::Paused) {
        stop("engine destroyed");
    }
    stop_monitor();
    if (pool_) {
        pool_->shutdown();
    }
    if (market_) {
        market_->disconnect();
    }
    account_->disconnect();
}

bool GridEngine::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            spdlog::warn("[Engine] start called twice");
            return !is_terminal(state_);
        }
        started_ = true;
        epoch_ = std::max<uint64_t>(epoch_ + 1, static_cast<uint64_t>(venue::current_timestamp_ms() / 1000));
    }

    try {
        initialize(false);
        return true;
    } catch (const GridError& ex) {
        fail(ex.what());
    } catch (const venue::VenueError& ex) {
        fail(ex.what());
    }
    return false;
}

bool GridEngine::resume(const PersistedSnapshot& snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            spdlog::warn("[Engine] resume called on a started engine");
            return !is_terminal(state_);
        }
        started_ = true;
    }

    try {
        const auto symbol = config().symbol;
        if (snapshot.config.symbol != symbol) {
            throw ConfigInvalid({"snapshot is for " + snapshot.config.symbol + ", engine runs " + symbol});
        }

        ledger_.restore(snapshot.ledger);
        reconciler_.restore(snapshot.baseline_position, snapshot.position);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_ = snapshot.stats;
            last_fill_ms_ = snapshot.last_fill_ms;
            epoch_ = std::max<uint64_t>(snapshot.epoch + 1,
                                        static_cast<uint64_t>(venue::current_timestamp_ms() / 1000));
        }
        spdlog::info("[Engine] resuming {} from snapshot saved at {} ({} ledger rows, state {})", symbol,
                     snapshot.saved_at_ms, snapshot.ledger.size(), to_string(snapshot.state));

        for (const auto& fill : merge_fills(gateway_.fetch_fills(symbol, snapshot.last_fill_ms))) {
            if (!ledger_.fill_processed(fill.order_id)) {
                handle_fill(fill.order_id, fill.client_order_id, fill.qty, fill.price(), fill.timestamp_ms, false);
            }
        }

        initialize(true);
        return true;
    } catch (const GridError& ex) {
        fail(ex.what());
    } catch (const venue::VenueError& ex) {
        fail(ex.what());
    }
    return false;
}

void GridEngine::initialize(bool resuming) {
    set_state(EngineState::Initializing);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        early_pending_ = true;
    }

    const auto config = this->config();
    instrument_ = gateway_.fetch_instrument(config.symbol);
    const double reference = fetch_reference_price();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_price_ = reference;
    }

    RiskReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report = risk_gate_.pre_start_check(reference, instrument_);
    }
    spdlog::info("[Risk] estimated liquidation {:.2f} ({:.2f}% from {})", report.liquidation_price,
                 report.liquidation_distance_pct, reference);
    for (const auto& warning : report.warnings) {
        spdlog::warn("[Risk] {}", warning);
    }
    if (!report.ok) {
        if (!options_.accept_high_risk) {
            throw RiskCheckFailed(report.reasons);
        }
        for (const auto& reason : report.reasons) {
            spdlog::warn("[Risk] accepted high risk: {}", reason);
        }
    }

    const auto levels = GridCalculator::levels(config, reference, instrument_, options_.price_buffer_pct);
    LedgerOptions ledger_options;
    ledger_options.symbol = config.symbol;
    ledger_options.tick_size = instrument_.tick_size;
    ledger_options.price_tolerance = options_.price_tolerance;
    ledger_options.order_type = config.order_type;
    ledger_options.time_in_force = config.effective_time_in_force();
    ledger_options.epoch = epoch();
    ledger_options.replenish_step = options_.replenish_step;
    ledger_.configure(ledger_options);
    ledger_.set_levels(levels);
    reconciler_.set_tolerance(imbalance_tolerance(levels));
    spdlog::info("[Engine] {} grid {} levels [{}, {}] qty {} ref {}", config.symbol, levels.size(),
                 config.lower_price, config.upper_price, levels.empty() ? 0.0 : levels.front().quantity, reference);

    if (!pool_) {
        pool_ = std::make_unique<WorkerPool>(static_cast<std::size_t>(options_.worker_threads),
                                             static_cast<std::size_t>(options_.worker_queue_limit));
    }
    connect_streams();

    const auto position = gateway_.fetch_position(config.symbol);
    if (!resuming) {
        reconciler_.set_baseline(position.signed_size);
    }
    handle_position(position, venue::current_timestamp_ms());
    if (!resuming && options_.open_initial_position && std::fabs(position.signed_size) < instrument_.min_qty) {
        open_initial_position(levels, reference);
    }

    const auto result = ledger_.reconcile(gateway_.fetch_open_orders(config.symbol), ReconcilePass::Startup);
    cancel_duplicates_sync(result.duplicates_to_cancel);
    const auto placed = ledger_.place_missing();
    spdlog::info("[Engine] placed {} of {} missing levels, adopted {} existing orders", placed,
                 result.missing_levels.size(), result.adopted);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stats_.started_ms == 0) {
            stats_.started_ms = venue::current_timestamp_ms();
        }
    }
    set_state(EngineState::Running);
    persist();

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = false;
        pending_stop_.reset();
    }
    monitor_thread_ = std::thread(&GridEngine::monitor_loop, this);

    if (!account_->post([this]() { replay_early_events(); })) {
        spdlog::warn("[Engine] account dispatch not running, buffered events dropped");
    }
}

double GridEngine::fetch_reference_price() {
    const auto symbol = config().symbol;
    for (const auto& ticker : gateway_.fetch_tickers()) {
        if (ticker.symbol != symbol) {
            continue;
        }
        if (ticker.last > 0.0) {
            return ticker.last;
        }
        if (ticker.bid > 0.0 && ticker.ask > 0.0) {
            return (ticker.bid + ticker.ask) / 2.0;
        }
    }
    throw GridError("no ticker price available for " + symbol);
}

void GridEngine::connect_streams() {
    const auto symbol = config().symbol;
    std::vector<venue::Channel> account_channels{{"order", ""}, {"position", ""}, {"balance", ""}};
    if (market_) {
        market_->subscribe({{"ticker", symbol}});
    } else {
        account_channels.push_back({"ticker", symbol});
    }
    account_->subscribe(account_channels);

    account_->connect(endpoints_.account_url);
    if (market_) {
        market_->connect(endpoints_.market_url);
    }

    const auto timeout = std::chrono::milliseconds(options_.connect_timeout_ms);
    if (!account_->wait_until_ready(timeout)) {
        throw venue::TransportError("account stream not ready within " + std::to_string(options_.connect_timeout_ms) +
                                    " ms");
    }
    if (market_ && !market_->wait_until_ready(timeout)) {
        throw venue::TransportError("market stream not ready within " + std::to_string(options_.connect_timeout_ms) +
                                    " ms");
    }
}

void GridEngine::open_initial_position(const std::vector<GridLevel>& levels, double reference_price) {
    const auto config = this->config();
    const auto needed = PositionReconciler::initial_position_needed(levels, reference_price, config.direction,
                                                                    instrument_);
    spdlog::info("[Engine] initial position: {}", needed.explanation);
    if (needed.quantity <= 0.0) {
        return;
    }

    venue::OrderRequest request;
    request.symbol = config.symbol;
    request.side = needed.side;
    request.type = venue::OrderType::Market;
    request.qty = needed.quantity;
    request.client_order_id = "g" + std::to_string(epoch()) + "-" + config.symbol + "-init";
    const auto result = gateway_.place_order(request);

    const double signed_qty = needed.side == venue::Side::Buy ? needed.quantity : -needed.quantity;
    reconciler_.set_baseline(reconciler_.baseline() + signed_qty);
    spdlog::info("[Engine] opened initial {} {} as order {}", venue::to_string(needed.side), needed.quantity,
                 result.order_id);
}

void GridEngine::cancel_duplicates_sync(const std::vector<venue::ExchangeOrder>& duplicates) {
    const auto symbol = config().symbol;
    for (const auto& duplicate : duplicates) {
        record_duplicate(duplicate);
        ledger_.begin_cancel();
        bool cancelled = false;
        try {
            gateway_.cancel_order(symbol, duplicate.order_id, "");
            cancelled = true;
        } catch (const venue::VenueError& ex) {
            spdlog::warn("[Engine] cancel of duplicate {} failed: {}", duplicate.order_id, ex.what());
        }
        ledger_.finish_cancel(duplicate.order_id, cancelled);
    }
}

void GridEngine::fail(const std::string& reason) {
    spdlog::error("[Engine] {}", reason);
    ledger_.close();
    stop_monitor();
    if (market_) {
        market_->disconnect();
    }
    account_->disconnect();
    if (pool_) {
        pool_->shutdown();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_reason_ = reason;
    }
    set_state(EngineState::Error);
    if (!ledger_.entries().empty()) {
        persist();
    }
}

void GridEngine::on_stream_event(const venue::StreamEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == EngineState::Initializing || early_pending_) {
            early_events_.push_back(event);
            return;
        }
        if (is_terminal(state_)) {
            return;
        }
    }
    handle_event(event);
}

void GridEngine::replay_early_events() {
    while (true) {
        std::vector<venue::StreamEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (early_events_.empty()) {
                early_pending_ = false;
                return;
            }
            events.swap(early_events_);
        }
        spdlog::debug("[Engine] replaying {} event(s) received during startup", events.size());
        for (const auto& event : events) {
            handle_event(event);
        }
    }
}

void GridEngine::handle_event(const venue::StreamEvent& event) {
    if (const auto* ticker = std::get_if<venue::TickerEvent>(&event)) {
        handle_ticker(*ticker);
    } else if (const auto* order = std::get_if<venue::OrderEvent>(&event)) {
        handle_order(*order);
    } else if (const auto* position = std::get_if<venue::PositionEvent>(&event)) {
        handle_position(position->position, position->timestamp_ms);
    } else if (const auto* balance = std::get_if<venue::BalanceEvent>(&event)) {
        spdlog::debug("[Engine] balance {} available {} frozen {}", balance->asset, balance->available,
                      balance->frozen);
    }
}

void GridEngine::handle_ticker(const venue::TickerEvent& ticker) {
    double price = ticker.last;
    if (price <= 0.0 && ticker.bid > 0.0 && ticker.ask > 0.0) {
        price = (ticker.bid + ticker.ask) / 2.0;
    }
    if (price <= 0.0 || (!ticker.symbol.empty() && ticker.symbol != config().symbol)) {
        return;
    }

    reconciler_.on_mark_price(price);
    const auto snapshot = reconciler_.snapshot();
    const double unrealized = snapshot ? snapshot->position.unrealized_pnl : 0.0;
    const double signed_position = snapshot ? snapshot->position.signed_size : reconciler_.expected_position();

    std::optional<StopTrigger> trigger;
    std::optional<std::pair<double, double>> trail;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_price_ = price;
        stats_.update_equity(config_.total_investment, unrealized);
        if (state_ != EngineState::Running && state_ != EngineState::Paused) {
            return;
        }
        trigger = risk_gate_.evaluate(price, signed_position, stats_);
        if (!trigger && state_ == EngineState::Running && !retrail_active_) {
            trail = GridCalculator::trailed_range(config_, price);
        }
    }

    if (trigger) {
        spdlog::warn("[Risk] {}", trigger->message);
        request_stop(*trigger);
        return;
    }
    if (trail) {
        retrail(trail->first, trail->second, price);
    }
}

void GridEngine::handle_order(const venue::OrderEvent& order) {
    if (!order.symbol.empty() && order.symbol != config().symbol) {
        return;
    }
    switch (order.status) {
        case venue::OrderStatus::Filled:
            handle_fill(order.order_id, order.client_order_id, order.filled_qty > 0.0 ? order.filled_qty : order.qty,
                        order.avg_fill_price > 0.0 ? order.avg_fill_price : order.price, order.timestamp_ms, true);
            break;
        case venue::OrderStatus::Cancelled:
        case venue::OrderStatus::Rejected:
            ledger_.on_cancelled(order.order_id, order.client_order_id);
            persist();
            break;
        default:
            spdlog::debug("[Engine] order {} {} {}/{}", order.order_id, venue::to_string(order.status),
                          order.filled_qty, order.qty);
            break;
    }
}

void GridEngine::handle_position(const venue::PositionInfo& position, int64_t timestamp_ms) {
    if (!position.symbol.empty() && position.symbol != config().symbol) {
        return;
    }
    const auto imbalance = reconciler_.on_position_update(position, timestamp_ms);
    if (imbalance) {
        spdlog::warn("[Engine] position imbalance: exchange {} expected {} (tolerance {})", imbalance->actual,
                     imbalance->expected, imbalance->tolerance);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.imbalances_detected;
        push_bounded(imbalances_, *imbalance);
    }
    persist();
}

void GridEngine::handle_fill(const std::string& order_id,
                             const std::string& client_order_id,
                             double qty,
                             double price,
                             int64_t timestamp_ms,
                             bool replenish_ladder) {
    const auto trade = ledger_.on_fill(order_id, qty, price, client_order_id, timestamp_ms);
    if (!trade) {
        return;
    }
    reconciler_.record_fill(trade->side, trade->quantity);

    std::string symbol;
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.record(*trade);
        last_fill_ms_ = std::max(last_fill_ms_, timestamp_ms);
        symbol = config_.symbol;
        running = state_ == EngineState::Running;
    }
    log_trade(symbol, *trade);
    if (trade->realized_profit) {
        spdlog::info("[Engine] round trip closed at level {}: profit {:.4f}", trade->level_index,
                     *trade->realized_profit);
    }

    if (replenish_ladder && running) {
        replenish(*trade);
    }
    persist();
}

void GridEngine::replenish(const GridTrade& trade) {
    const int step = options_.replenish_step;
    const int target = trade.side == venue::Side::Buy ? trade.level_index + step : trade.level_index - step;

    const auto levels = ledger_.levels();
    const auto it = std::find_if(levels.begin(), levels.end(),
                                 [target](const GridLevel& level) { return level.index == target; });
    if (it == levels.end()) {
        spdlog::info("[Engine] no level {} to replenish beyond the grid edge", target);
        return;
    }

    auto ticket = ledger_.begin_place(*it, venue::opposite(trade.side), trade.fill_price);
    if (!ticket) {
        spdlog::debug("[Engine] level {} already occupied, no replenishment", target);
        return;
    }
    submit_placement(std::move(*ticket));
}

void GridEngine::retrail(double lower, double upper, double price) {
    GridConfig next = config();
    next.lower_price = lower;
    next.upper_price = upper;

    std::vector<GridLevel> levels;
    try {
        levels = GridCalculator::levels(next, price, instrument_, options_.price_buffer_pct);
    } catch (const GridError& ex) {
        spdlog::warn("[Engine] trailing skipped: {}", ex.what());
        return;
    }

    const auto open = ledger_.open_entries();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = next;
        risk_gate_.update_config(next);
        retrail_active_ = !open.empty();
        retrail_cancels_ = static_cast<int>(open.size());
    }
    spdlog::info("[Engine] trailing grid to [{:.2f}, {:.2f}] at {}, cancelling {} order(s)", lower, upper, price,
                 open.size());

    const auto dropped = ledger_.drop_unsubmitted();
    if (dropped > 0) {
        spdlog::debug("[Engine] dropped {} unsubmitted reservation(s)", dropped);
    }
    ledger_.set_levels(levels);

    if (open.empty()) {
        reconcile_now();
        persist();
        return;
    }
    for (const auto& entry : open) {
        submit_cancel(*entry.exchange_order_id, [this](bool) {
            bool finished = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                finished = --retrail_cancels_ <= 0;
                if (finished) {
                    retrail_active_ = false;
                }
            }
            if (finished) {
                reconcile_now();
            }
        });
    }
    persist();
}

void GridEngine::reconcile_now() {
    if (reconcile_in_progress_.exchange(true)) {
        return;
    }
    std::string symbol;
    int64_t since = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        symbol = config_.symbol;
        since = last_fill_ms_;
    }
    const bool accepted = pool_ && pool_->submit([this, symbol, since]() {
        try {
            // Open orders first: anything that leaves the list before the fill
            // query is already in the fill history.
            auto orders = gateway_.fetch_open_orders(symbol);
            auto fills = gateway_.fetch_fills(symbol, since);
            deliver([this, orders, fills]() {
                apply_reconcile(orders, fills);
                reconcile_in_progress_ = false;
            });
        } catch (const venue::VenueError& ex) {
            spdlog::warn("[Engine] reconcile fetch failed: {}", ex.what());
            reconcile_in_progress_ = false;
        }
    });
    if (!accepted) {
        reconcile_in_progress_ = false;
    }
}

void GridEngine::apply_reconcile(const std::vector<venue::ExchangeOrder>& open_orders,
                                 const std::vector<venue::FillRecord>& fills) {
    double price = 0.0;
    EngineState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = state_;
        price = last_price_;
    }
    if (ledger_.is_closed() || (current != EngineState::Running && current != EngineState::Paused)) {
        return;
    }

    // Book fills the stream has not delivered yet, so their orders are not mistaken for gaps.
    for (const auto& fill : merge_fills(fills)) {
        if (!ledger_.fill_processed(fill.order_id)) {
            handle_fill(fill.order_id, fill.client_order_id, fill.qty, fill.price(), fill.timestamp_ms, true);
        }
    }
    if (current != EngineState::Running) {
        return;
    }
    if (price > 0.0) {
        refresh_sides(price);
    }

    const auto result = ledger_.reconcile(open_orders, ReconcilePass::Periodic);
    for (const auto& duplicate : result.duplicates_to_cancel) {
        record_duplicate(duplicate);
        submit_cancel(duplicate.order_id, nullptr);
    }
    for (auto& ticket : ledger_.begin_place_missing()) {
        submit_placement(std::move(ticket));
    }
    persist();
}

void GridEngine::refresh_sides(double price) {
    auto levels = ledger_.levels();
    const double buffer = price * options_.price_buffer_pct / 100.0;
    for (auto& level : levels) {
        level.side = GridCalculator::assign_side(level.price, price, buffer);
    }
    ledger_.set_levels(std::move(levels));
}

void GridEngine::submit_placement(PlacementTicket ticket) {
    const bool accepted = pool_ && pool_->submit([this, ticket]() {
        try {
            const auto result = gateway_.place_order(ticket.request);
            deliver([this, ticket, result]() {
                ledger_.complete_place(ticket, result);
                persist();
            });
        } catch (const venue::VenueError& ex) {
            const std::string error = ex.what();
            deliver([this, ticket, error]() {
                ledger_.fail_place(ticket, error);
                persist();
            });
        }
    });
    if (!accepted) {
        ledger_.fail_place(ticket, "worker pool unavailable");
    }
}

void GridEngine::submit_cancel(const std::string& order_id, std::function<void(bool)> done) {
    ledger_.begin_cancel();
    const auto symbol = config().symbol;
    const bool accepted = pool_ && pool_->submit([this, order_id, symbol, done]() {
        bool cancelled = false;
        try {
            gateway_.cancel_order(symbol, order_id, "");
            cancelled = true;
        } catch (const venue::VenueError& ex) {
            spdlog::warn("[Engine] cancel {} failed: {}", order_id, ex.what());
        }
        deliver([this, order_id, cancelled, done]() {
            ledger_.finish_cancel(order_id, cancelled);
            if (done) {
                done(cancelled);
            }
            persist();
        });
    });
    if (!accepted) {
        ledger_.finish_cancel(order_id, false);
        if (done) {
            done(false);
        }
    }
}

void GridEngine::poll_rest() {
    if (poll_in_progress_.exchange(true)) {
        return;
    }
    std::string symbol;
    int64_t since = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        symbol = config_.symbol;
        since = last_fill_ms_;
    }

    const bool accepted = pool_ && pool_->submit([this, symbol, since]() {
        try {
            std::optional<venue::TickerEvent> ticker;
            for (const auto& t : gateway_.fetch_tickers()) {
                if (t.symbol == symbol) {
                    ticker = venue::TickerEvent{t.symbol, t.last, t.bid, t.ask, venue::current_timestamp_ms()};
                }
            }
            auto fills = merge_fills(gateway_.fetch_fills(symbol, since));
            const auto position = gateway_.fetch_position(symbol);

            deliver([this, ticker, fills, position]() {
                if (!is_terminal(state())) {
                    if (ticker) {
                        handle_ticker(*ticker);
                    }
                    for (const auto& fill : fills) {
                        if (!ledger_.fill_processed(fill.order_id)) {
                            handle_fill(fill.order_id, fill.client_order_id, fill.qty, fill.price(),
                                        fill.timestamp_ms, true);
                        }
                    }
                    handle_position(position, venue::current_timestamp_ms());
                }
                poll_in_progress_ = false;
            });
        } catch (const venue::VenueError& ex) {
            spdlog::warn("[Engine] REST fallback poll failed: {}", ex.what());
            poll_in_progress_ = false;
        }
    });
    if (!accepted) {
        poll_in_progress_ = false;
    }
}

void GridEngine::deliver(std::function<void()> task) {
    // Once the dispatch thread is gone the engine is stopping and nothing else writes.
    if (!account_->post(task)) {
        task();
    }
}

void GridEngine::monitor_loop() {
    const auto reconcile_interval = std::chrono::milliseconds(options_.reconcile_interval_ms);
    const auto poll_interval = std::chrono::milliseconds(options_.rest_poll_interval_ms);
    auto next_reconcile = std::chrono::steady_clock::now() + reconcile_interval;
    auto next_poll = std::chrono::steady_clock::now();

    while (true) {
        std::optional<StopTrigger> trigger;
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_cv_.wait_for(lock, kMonitorTick, [this] {
                return monitor_stop_ || pending_stop_.has_value() || reconcile_requested_.load();
            });
            if (monitor_stop_) {
                return;
            }
            trigger = pending_stop_;
            pending_stop_.reset();
        }

        if (trigger) {
            stop_with(*trigger);
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        const auto current = state();
        const bool requested = reconcile_requested_.exchange(false);
        if (current == EngineState::Running && (requested || now >= next_reconcile)) {
            reconcile_now();
            next_reconcile = now + reconcile_interval;
        }
        if ((current == EngineState::Running || current == EngineState::Paused) && !streams_ready() &&
            now >= next_poll) {
            poll_rest();
            next_poll = now + poll_interval;
        }
    }
}

void GridEngine::request_stop(StopTrigger trigger) {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (!pending_stop_) {
            pending_stop_ = std::move(trigger);
        }
    }
    monitor_cv_.notify_all();
}

void GridEngine::stop(const std::string& reason) {
    const StopTrigger trigger{StopReason::Manual, reason, last_price()};
    if (account_->is_dispatch_thread() || (market_ && market_->is_dispatch_thread())) {
        request_stop(trigger);
        return;
    }
    stop_with(trigger);
    stop_monitor();
}

void GridEngine::stop_with(const StopTrigger& trigger) {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    shutdown(trigger);
}

void GridEngine::shutdown(const StopTrigger& trigger) {
    GridConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        stop_trigger_ = trigger;
        config = config_;
    }
    spdlog::info("[Engine] stopping {} ({}): {}", config.symbol, to_string(trigger.reason), trigger.message);

    ledger_.close();
    if (!ledger_.wait_idle(std::chrono::milliseconds(options_.stop_timeout_ms))) {
        for (const auto& entry : ledger_.entries()) {
            if (entry.in_flight) {
                spdlog::warn("[Engine] orphaned placement {} at level {}, reconciled on next resume",
                             entry.client_order_id, entry.level_index);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();

    if (market_) {
        market_->disconnect();
    }
    account_->disconnect();
    if (pool_) {
        pool_->shutdown();
    }

    if (config.cancel_orders_on_stop) {
        for (const auto& entry : ledger_.open_entries()) {
            try {
                gateway_.cancel_order(config.symbol, *entry.exchange_order_id, entry.client_order_id);
                ledger_.on_cancelled(*entry.exchange_order_id, entry.client_order_id);
            } catch (const venue::VenueError& ex) {
                spdlog::warn("[Engine] cancel of level {} order {} failed: {}", entry.level_index,
                             *entry.exchange_order_id, ex.what());
            }
        }
    }
    ledger_.drop_unsubmitted();

    if (config.close_position_on_stop) {
        try {
            const auto position = gateway_.fetch_position(config.symbol);
            const double size = GridCalculator::floor_to_step(std::fabs(position.signed_size), instrument_.qty_step);
            if (size >= instrument_.min_qty && size > 0.0) {
                venue::OrderRequest request;
                request.symbol = config.symbol;
                request.side = position.signed_size > 0.0 ? venue::Side::Sell : venue::Side::Buy;
                request.type = venue::OrderType::Market;
                request.qty = size;
                request.reduce_only = true;
                request.client_order_id = "g" + std::to_string(epoch()) + "-" + config.symbol + "-close";
                const auto result = gateway_.place_order(request);
                spdlog::info("[Engine] closed position {} with order {}", position.signed_size, result.order_id);
            }
        } catch (const venue::VenueError& ex) {
            spdlog::error("[Engine] closing position failed: {}", ex.what());
        }
    }

    if (trigger.reason == StopReason::Fatal) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error_reason_ = trigger.message;
        }
        set_state(EngineState::Error);
    } else {
        set_state(EngineState::Stopped);
    }
    persist();
}

void GridEngine::stop_monitor() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_thread_.joinable() && monitor_thread_.get_id() != std::this_thread::get_id()) {
        monitor_thread_.join();
    }
}

bool GridEngine::wait_until_terminal(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return is_terminal(state_); });
}

bool GridEngine::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != EngineState::Running) {
            return false;
        }
    }
    set_state(EngineState::Paused);
    persist();
    return true;
}

bool GridEngine::unpause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != EngineState::Paused) {
            return false;
        }
    }
    set_state(EngineState::Running);
    reconcile_requested_ = true;
    monitor_cv_.notify_all();
    persist();
    return true;
}

void GridEngine::set_state(EngineState state) {
    EngineState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        state_ = state;
    }
    state_cv_.notify_all();
    if (previous != state) {
        spdlog::info("[Engine] {} -> {}", to_string(previous), to_string(state));
    }
}

void GridEngine::persist() {
    if (!store_) {
        return;
    }
    // Built under the same lock as the write, so the file ends on the newest state.
    std::lock_guard<std::mutex> lock(persist_mutex_);
    try {
        store_->save(snapshot());
    } catch (const PersistenceError& ex) {
        spdlog::warn("[Store] snapshot not saved: {}", ex.what());
    }
}

void GridEngine::record_duplicate(const venue::ExchangeOrder& order) {
    spdlog::warn("[Engine] duplicate {} order {} at {}, cancelling", venue::to_string(order.side), order.order_id,
                 order.price);
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.duplicates_cancelled;
    push_bounded(duplicates_, DuplicateOrderDetected{order.order_id, order.side, order.price,
                                                     venue::current_timestamp_ms()});
}

bool GridEngine::streams_ready() const {
    return account_->is_ready() && (!market_ || market_->is_ready());
}

double GridEngine::imbalance_tolerance(const std::vector<GridLevel>& levels) const {
    if (options_.imbalance_tolerance > 0.0) {
        return options_.imbalance_tolerance;
    }
    return levels.empty() ? 0.0 : levels.front().quantity / 2.0;
}

EngineState GridEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string GridEngine::error_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_reason_;
}

GridStats GridEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

GridConfig GridEngine::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

double GridEngine::last_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_price_;
}

uint64_t GridEngine::epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

std::optional<StopTrigger> GridEngine::stop_trigger() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_trigger_;
}

std::vector<DuplicateOrderDetected> GridEngine::duplicate_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {duplicates_.begin(), duplicates_.end()};
}

std::vector<ImbalanceDetected> GridEngine::imbalance_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {imbalances_.begin(), imbalances_.end()};
}

PersistedSnapshot GridEngine::snapshot() const {
    PersistedSnapshot snapshot;
    snapshot.saved_at_ms = venue::current_timestamp_ms();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.state = state_;
        snapshot.epoch = epoch_;
        snapshot.config = config_;
        snapshot.stats = stats_;
        snapshot.last_fill_ms = last_fill_ms_;
    }
    snapshot.ledger = ledger_.entries();
    snapshot.position = reconciler_.snapshot();
    snapshot.baseline_position = reconciler_.expected_position();
    return snapshot;
}

} // namespace grid
