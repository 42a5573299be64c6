#include "grid/order_ledger.hpp"

#include "venue/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <utility>

namespace grid {
namespace {

constexpr std::size_t kProcessedFillLimit = 10000;
constexpr int kStaleAfterMisses = 2;

bool is_open_on_exchange(venue::OrderStatus status) {
    return status == venue::OrderStatus::New || status == venue::OrderStatus::PartiallyFilled ||
           status == venue::OrderStatus::Unknown;
}

long long tick_key(double price, double tick_size) {
    if (tick_size <= 0.0) {
        return std::llround(price * 1e8);
    }
    return std::llround(price / tick_size);
}

} // namespace

const char* to_string(EntryStatus status) noexcept {
    switch (status) {
        case EntryStatus::Pending: return "PENDING";
        case EntryStatus::Open: return "OPEN";
        case EntryStatus::Filled: return "FILLED";
        case EntryStatus::Cancelled: return "CANCELLED";
    }
    return "PENDING";
}

std::optional<EntryStatus> parse_entry_status(const std::string& text) {
    if (text == "PENDING") return EntryStatus::Pending;
    if (text == "OPEN") return EntryStatus::Open;
    if (text == "FILLED") return EntryStatus::Filled;
    if (text == "CANCELLED") return EntryStatus::Cancelled;
    return std::nullopt;
}

OrderLedger::OrderLedger(venue::ExchangeGateway& gateway, LedgerOptions options)
    : gateway_(gateway), options_(std::move(options)) {}

void OrderLedger::configure(LedgerOptions options) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = std::move(options);
    closed_ = false;
}

LedgerOptions OrderLedger::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

void OrderLedger::set_levels(std::vector<GridLevel> levels) {
    std::lock_guard<std::mutex> lock(mutex_);
    levels_ = std::move(levels);
}

std::vector<GridLevel> OrderLedger::levels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return levels_;
}

std::string OrderLedger::make_client_order_id(const std::string& symbol,
                                              int level_index,
                                              venue::Side side,
                                              uint64_t epoch,
                                              uint64_t token) {
    return "g" + std::to_string(epoch) + "-" + symbol + "-" + std::to_string(level_index) +
           (side == venue::Side::Buy ? "B" : "S") + "-" + std::to_string(token);
}

double OrderLedger::match_tolerance() const {
    double spacing = std::numeric_limits<double>::max();
    for (std::size_t i = 1; i < levels_.size(); ++i) {
        spacing = std::min(spacing, std::fabs(levels_[i].price - levels_[i - 1].price));
    }
    if (levels_.size() < 2) {
        return options_.price_tolerance;
    }
    return std::min(options_.price_tolerance, spacing / 2.0);
}

std::optional<int> OrderLedger::match_level(const venue::ExchangeOrder& order, double tolerance) const {
    std::optional<int> best;
    double best_distance = std::numeric_limits<double>::max();
    for (const auto& level : levels_) {
        if (!level.side || *level.side != order.side) {
            continue;
        }
        const double distance = std::fabs(level.price - order.price);
        if (distance <= tolerance + 1e-9 && distance < best_distance) {
            best_distance = distance;
            best = level.index;
        }
    }
    return best;
}

LedgerEntry* OrderLedger::find_by_exchange_id(const std::string& exchange_order_id) {
    if (exchange_order_id.empty()) {
        return nullptr;
    }
    for (auto& [index, entry] : entries_) {
        if (entry.exchange_order_id && *entry.exchange_order_id == exchange_order_id) {
            return &entry;
        }
    }
    return nullptr;
}

LedgerEntry* OrderLedger::find_by_client_id(const std::string& client_order_id) {
    if (client_order_id.empty()) {
        return nullptr;
    }
    for (auto& [index, entry] : entries_) {
        if (entry.client_order_id == client_order_id) {
            return &entry;
        }
    }
    return nullptr;
}

bool OrderLedger::closed_by_counter_order(const LedgerEntry& entry) const {
    if (entry.status != EntryStatus::Filled) {
        return false;
    }
    const int step = options_.replenish_step;
    const int target = entry.side == venue::Side::Buy ? entry.level_index + step : entry.level_index - step;
    const auto it = entries_.find(target);
    return it != entries_.end() && it->second.is_active() && it->second.side == venue::opposite(entry.side) &&
           it->second.open_price.has_value();
}

ReconcileResult OrderLedger::reconcile(const std::vector<venue::ExchangeOrder>& exchange_open_orders,
                                       ReconcilePass pass) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReconcileResult result;

    std::vector<const venue::ExchangeOrder*> live;
    std::unordered_set<std::string> live_ids;
    for (const auto& order : exchange_open_orders) {
        if (!is_open_on_exchange(order.status) || (!order.symbol.empty() && order.symbol != options_.symbol)) {
            continue;
        }
        live_ids.insert(order.order_id);
        if (cancel_requested_.count(order.order_id) > 0) {
            continue;
        }
        live.push_back(&order);
    }

    // Forget cancel requests the exchange has already honoured.
    for (auto it = cancel_requested_.begin(); it != cancel_requested_.end();) {
        it = live_ids.count(*it) == 0 ? cancel_requested_.erase(it) : std::next(it);
    }

    // Group by (side, price in ticks). Keep the order the ledger already tracks, else the first seen.
    std::map<std::pair<int, long long>, std::vector<const venue::ExchangeOrder*>> groups;
    std::vector<std::pair<int, long long>> group_order;
    for (const auto* order : live) {
        const auto key = std::make_pair(static_cast<int>(order->side), tick_key(order->price, options_.tick_size));
        auto& bucket = groups[key];
        if (bucket.empty()) {
            group_order.push_back(key);
        }
        bucket.push_back(order);
    }

    std::vector<const venue::ExchangeOrder*> kept;
    for (const auto& key : group_order) {
        auto& bucket = groups[key];
        auto tracked = std::find_if(bucket.begin(), bucket.end(), [this](const venue::ExchangeOrder* order) {
            return find_by_exchange_id(order->order_id) != nullptr;
        });
        const auto* keeper = tracked != bucket.end() ? *tracked : bucket.front();
        kept.push_back(keeper);
        for (const auto* order : bucket) {
            if (order != keeper) {
                result.duplicates_to_cancel.push_back(*order);
                cancel_requested_.insert(order->order_id);
            }
        }
    }

    // Ledger rows the exchange no longer reports have filled or been cancelled.
    const int allowed_misses = pass == ReconcilePass::Startup ? 1 : kStaleAfterMisses;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto& entry = it->second;
        if (entry.status != EntryStatus::Open || entry.in_flight || !entry.exchange_order_id) {
            ++it;
            continue;
        }
        if (live_ids.count(*entry.exchange_order_id) > 0) {
            entry.missed_reconciles = 0;
            ++it;
            continue;
        }
        if (++entry.missed_reconciles < allowed_misses) {
            spdlog::info("[Ledger] level {} order {} not listed as open, waiting for its fill or cancel",
                         entry.level_index, *entry.exchange_order_id);
            result.unresolved.push_back(entry);
            ++it;
            continue;
        }
        spdlog::info("[Ledger] level {} order {} no longer open on exchange, dropping", entry.level_index,
                     *entry.exchange_order_id);
        ++result.dropped;
        it = entries_.erase(it);
    }

    const double tolerance = match_tolerance();
    for (const auto* order : kept) {
        if (find_by_exchange_id(order->order_id) != nullptr) {
            continue;
        }
        if (auto* entry = find_by_client_id(order->client_order_id)) {
            // Placement went through but its acknowledgement was lost.
            entry->exchange_order_id = order->order_id;
            if (entry->status == EntryStatus::Pending) {
                entry->status = EntryStatus::Open;
                entry->last_error.clear();
            }
            continue;
        }

        const auto level = match_level(*order, tolerance);
        if (!level) {
            spdlog::info("[Ledger] order {} {} @ {} matches no grid level, leaving it alone",
                         order->order_id, venue::to_string(order->side), order->price);
            result.unmatched.push_back(*order);
            continue;
        }

        auto existing = entries_.find(*level);
        if (existing != entries_.end() && existing->second.is_active() &&
            !(existing->second.status == EntryStatus::Pending && !existing->second.in_flight)) {
            result.duplicates_to_cancel.push_back(*order);
            cancel_requested_.insert(order->order_id);
            continue;
        }

        const auto& grid_level = *std::find_if(levels_.begin(), levels_.end(),
                                               [&](const GridLevel& l) { return l.index == *level; });
        LedgerEntry adopted;
        adopted.level_index = *level;
        adopted.side = order->side;
        adopted.price = grid_level.price;
        adopted.quantity = order->qty > 0.0 ? order->qty : grid_level.quantity;
        adopted.client_order_id = order->client_order_id;
        adopted.exchange_order_id = order->order_id;
        adopted.status = EntryStatus::Open;
        if (existing != entries_.end()) {
            adopted.open_price = existing->second.open_price;
        }
        entries_[*level] = std::move(adopted);
        ++result.adopted;
    }

    for (const auto& level : levels_) {
        if (!level.side) {
            continue;
        }
        auto it = entries_.find(level.index);
        if (it != entries_.end() && (it->second.is_active() || closed_by_counter_order(it->second))) {
            continue;
        }
        LedgerEntry reserved;
        reserved.level_index = level.index;
        reserved.side = *level.side;
        reserved.price = level.price;
        reserved.quantity = level.quantity;
        reserved.token = next_token_++;
        reserved.client_order_id =
            make_client_order_id(options_.symbol, level.index, *level.side, options_.epoch, reserved.token);
        entries_[level.index] = std::move(reserved);
        result.missing_levels.push_back(level);
    }

    if (!result.duplicates_to_cancel.empty() || !result.missing_levels.empty() || result.adopted > 0 ||
        result.dropped > 0 || !result.unresolved.empty()) {
        spdlog::info("[Ledger] reconcile: {} duplicates, {} missing, {} adopted, {} dropped, {} unresolved, "
                     "{} unmatched",
                     result.duplicates_to_cancel.size(), result.missing_levels.size(), result.adopted,
                     result.dropped, result.unresolved.size(), result.unmatched.size());
    }
    return result;
}

PlacementTicket OrderLedger::start_flight(LedgerEntry& entry) {
    entry.in_flight = true;
    ++in_flight_;

    PlacementTicket ticket;
    ticket.level_index = entry.level_index;
    ticket.token = entry.token;
    ticket.request.symbol = options_.symbol;
    ticket.request.side = entry.side;
    ticket.request.type = options_.order_type;
    ticket.request.time_in_force = options_.time_in_force;
    ticket.request.qty = entry.quantity;
    ticket.request.price = entry.price;
    ticket.request.client_order_id = entry.client_order_id;
    return ticket;
}

std::optional<PlacementTicket> OrderLedger::begin_place(const GridLevel& level,
                                                        venue::Side side,
                                                        std::optional<double> open_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }

    auto it = entries_.find(level.index);
    if (it != entries_.end() && it->second.is_active()) {
        auto& entry = it->second;
        // An unsubmitted or failed reservation for the same side is retried under its own id.
        if (entry.status == EntryStatus::Pending && !entry.in_flight && entry.side == side) {
            if (open_price) {
                entry.open_price = open_price;
            }
            return start_flight(entry);
        }
        return std::nullopt;
    }

    LedgerEntry entry;
    entry.level_index = level.index;
    entry.side = side;
    entry.price = level.price;
    entry.quantity = level.quantity;
    entry.open_price = open_price;
    entry.token = next_token_++;
    entry.client_order_id = make_client_order_id(options_.symbol, level.index, side, options_.epoch, entry.token);
    auto& stored = entries_[level.index];
    stored = std::move(entry);
    return start_flight(stored);
}

std::vector<PlacementTicket> OrderLedger::begin_place_missing() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PlacementTicket> tickets;
    if (closed_) {
        return tickets;
    }
    for (auto& [index, entry] : entries_) {
        if (entry.status == EntryStatus::Pending && !entry.in_flight) {
            tickets.push_back(start_flight(entry));
        }
    }
    return tickets;
}

void OrderLedger::finish_flight() {
    if (in_flight_ > 0) {
        --in_flight_;
    }
    if (in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

void OrderLedger::complete_place(const PlacementTicket& ticket, const venue::PlaceResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_flight();

    auto it = entries_.find(ticket.level_index);
    if (it == entries_.end() || it->second.client_order_id != ticket.request.client_order_id) {
        spdlog::warn("[Ledger] placement {} acknowledged after its entry was removed (order {})",
                     ticket.request.client_order_id, result.order_id);
        return;
    }
    auto& entry = it->second;
    entry.in_flight = false;
    entry.last_error.clear();
    if (!result.order_id.empty()) {
        entry.exchange_order_id = result.order_id;
    }
    // A fill may have raced ahead of the acknowledgement.
    if (entry.status == EntryStatus::Pending) {
        entry.status = EntryStatus::Open;
    }
    spdlog::info("[Ledger] level {} {} {} @ {} open as {}", entry.level_index, venue::to_string(entry.side),
                 entry.quantity, entry.price, result.order_id);
}

void OrderLedger::fail_place(const PlacementTicket& ticket, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_flight();

    auto it = entries_.find(ticket.level_index);
    if (it == entries_.end() || it->second.client_order_id != ticket.request.client_order_id) {
        return;
    }
    auto& entry = it->second;
    entry.in_flight = false;
    entry.last_error = error;
    spdlog::warn("[Ledger] level {} {} @ {} rejected, retry on next reconcile: {}", entry.level_index,
                 venue::to_string(entry.side), entry.price, error);
}

PlaceOutcome OrderLedger::place(const GridLevel& level, venue::Side side, std::optional<double> open_price) {
    if (is_closed()) {
        return PlaceOutcome::Closed;
    }
    auto ticket = begin_place(level, side, open_price);
    if (!ticket) {
        return is_closed() ? PlaceOutcome::Closed : PlaceOutcome::LevelBusy;
    }
    try {
        complete_place(*ticket, gateway_.place_order(ticket->request));
        return PlaceOutcome::Placed;
    } catch (const venue::VenueError& ex) {
        fail_place(*ticket, ex.what());
    }
    return PlaceOutcome::Failed;
}

std::size_t OrderLedger::place_missing() {
    std::size_t placed = 0;
    for (const auto& ticket : begin_place_missing()) {
        try {
            complete_place(ticket, gateway_.place_order(ticket.request));
            ++placed;
        } catch (const venue::VenueError& ex) {
            fail_place(ticket, ex.what());
        }
    }
    return placed;
}

void OrderLedger::remember_fill(const std::string& exchange_order_id) {
    if (!processed_fills_.insert(exchange_order_id).second) {
        return;
    }
    processed_order_.push_back(exchange_order_id);
    while (processed_order_.size() > kProcessedFillLimit) {
        processed_fills_.erase(processed_order_.front());
        processed_order_.pop_front();
    }
}

bool OrderLedger::fill_processed(const std::string& exchange_order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_fills_.count(exchange_order_id) > 0;
}

std::optional<GridTrade> OrderLedger::on_fill(const std::string& exchange_order_id,
                                              double filled_qty,
                                              double filled_price,
                                              const std::string& client_order_id,
                                              int64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exchange_order_id.empty() && processed_fills_.count(exchange_order_id) > 0) {
        spdlog::debug("[Ledger] fill for {} already processed", exchange_order_id);
        return std::nullopt;
    }

    LedgerEntry* entry = find_by_exchange_id(exchange_order_id);
    if (entry == nullptr) {
        entry = find_by_client_id(client_order_id);
    }
    if (entry == nullptr) {
        spdlog::info("[Ledger] fill for unknown order {} ({}), ignoring", exchange_order_id, client_order_id);
        return std::nullopt;
    }
    if (entry->status == EntryStatus::Filled || entry->status == EntryStatus::Cancelled) {
        return std::nullopt;
    }

    entry->status = EntryStatus::Filled;
    if (!exchange_order_id.empty()) {
        entry->exchange_order_id = exchange_order_id;
        remember_fill(exchange_order_id);
    }

    GridTrade trade;
    trade.level_index = entry->level_index;
    trade.side = entry->side;
    trade.price = entry->price;
    trade.quantity = filled_qty > 0.0 ? filled_qty : entry->quantity;
    trade.fill_price = filled_price > 0.0 ? filled_price : entry->price;
    trade.exchange_order_id = entry->exchange_order_id.value_or("");
    trade.client_order_id = entry->client_order_id;
    trade.open_price = entry->open_price;
    trade.timestamp_ms = timestamp_ms;
    if (entry->open_price) {
        const double move = trade.side == venue::Side::Sell ? trade.fill_price - *entry->open_price
                                                            : *entry->open_price - trade.fill_price;
        trade.realized_profit = move * trade.quantity;
    }
    spdlog::info("[Ledger] level {} {} filled {} @ {}", trade.level_index, venue::to_string(trade.side),
                 trade.quantity, trade.fill_price);
    return trade;
}

void OrderLedger::begin_cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++in_flight_;
}

void OrderLedger::finish_cancel(const std::string& exchange_order_id, bool cancelled) {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_flight();
    if (!cancelled) {
        // Let the next reconcile pass report it again.
        cancel_requested_.erase(exchange_order_id);
        return;
    }
    if (auto* entry = find_by_exchange_id(exchange_order_id)) {
        entries_.erase(entry->level_index);
    }
}

void OrderLedger::on_cancelled(const std::string& exchange_order_id, const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_requested_.erase(exchange_order_id);
    LedgerEntry* entry = find_by_exchange_id(exchange_order_id);
    if (entry == nullptr) {
        entry = find_by_client_id(client_order_id);
    }
    if (entry == nullptr || !entry->is_active()) {
        return;
    }
    spdlog::info("[Ledger] level {} order {} cancelled", entry->level_index, exchange_order_id);
    entries_.erase(entry->level_index);
}

void OrderLedger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool OrderLedger::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t OrderLedger::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

bool OrderLedger::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

std::size_t OrderLedger::drop_unsubmitted() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.status == EntryStatus::Pending && !it->second.in_flight) {
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::vector<LedgerEntry> OrderLedger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEntry> rows;
    rows.reserve(entries_.size());
    for (const auto& [index, entry] : entries_) {
        rows.push_back(entry);
    }
    return rows;
}

std::vector<LedgerEntry> OrderLedger::open_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEntry> rows;
    for (const auto& [index, entry] : entries_) {
        if (entry.status == EntryStatus::Open && entry.exchange_order_id) {
            rows.push_back(entry);
        }
    }
    return rows;
}

std::optional<LedgerEntry> OrderLedger::entry_at(int level_index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(level_index);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t OrderLedger::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                  [](const auto& kv) { return kv.second.is_active(); }));
}

void OrderLedger::restore(const std::vector<LedgerEntry>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    for (auto row : rows) {
        if (row.status == EntryStatus::Cancelled) {
            continue;
        }
        if (row.in_flight) {
            row.in_flight = false;
            row.last_error = "interrupted before acknowledgement";
        }
        next_token_ = std::max(next_token_, row.token + 1);
        entries_[row.level_index] = std::move(row);
    }
}

void OrderLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    cancel_requested_.clear();
}

} // namespace grid
