#include "grid/snapshot_store.hpp"

#include "grid/errors.hpp"
#include "grid/settings.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace grid {
namespace {

using nlohmann::json;

template <typename T>
T json_value_or(const json& j, const char* key, T fallback) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const json::exception&) {
        return fallback;
    }
}

std::optional<double> optional_double(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

json entry_to_json(const LedgerEntry& entry) {
    json row;
    row["level"] = entry.level_index;
    row["side"] = venue::to_string(entry.side);
    row["price"] = entry.price;
    row["qty"] = entry.quantity;
    row["client_id"] = entry.client_order_id;
    row["order_id"] = entry.exchange_order_id ? json(*entry.exchange_order_id) : json(nullptr);
    row["status"] = to_string(entry.status);
    row["open_price"] = entry.open_price ? json(*entry.open_price) : json(nullptr);
    row["error"] = entry.last_error;
    row["in_flight"] = entry.in_flight;
    row["token"] = entry.token;
    return row;
}

std::optional<LedgerEntry> entry_from_json(const json& row) {
    if (!row.is_object() || !row.contains("level")) {
        return std::nullopt;
    }
    LedgerEntry entry;
    entry.level_index = json_value_or<int>(row, "level", 0);
    entry.side = venue::parse_side(json_value_or<std::string>(row, "side", "BUY")).value_or(venue::Side::Buy);
    entry.price = json_value_or<double>(row, "price", 0.0);
    entry.quantity = json_value_or<double>(row, "qty", 0.0);
    entry.client_order_id = json_value_or<std::string>(row, "client_id", "");
    const auto order_id = json_value_or<std::string>(row, "order_id", "");
    if (!order_id.empty()) {
        entry.exchange_order_id = order_id;
    }
    entry.status = parse_entry_status(json_value_or<std::string>(row, "status", "PENDING")).value_or(EntryStatus::Pending);
    entry.open_price = optional_double(row, "open_price");
    entry.last_error = json_value_or<std::string>(row, "error", "");
    entry.in_flight = json_value_or<bool>(row, "in_flight", false);
    entry.token = json_value_or<uint64_t>(row, "token", 0);
    return entry;
}

json stats_to_json(const GridStats& stats) {
    return json{{"total_trades", stats.total_trades},
                {"buy_fills", stats.buy_fills},
                {"sell_fills", stats.sell_fills},
                {"round_trips", stats.round_trips},
                {"winning_round_trips", stats.winning_round_trips},
                {"losing_round_trips", stats.losing_round_trips},
                {"volume_quote", stats.volume_quote},
                {"realized_profit", stats.realized_profit},
                {"peak_equity", stats.peak_equity},
                {"current_drawdown_pct", stats.current_drawdown_pct},
                {"max_drawdown_pct", stats.max_drawdown_pct},
                {"duplicates_cancelled", stats.duplicates_cancelled},
                {"imbalances_detected", stats.imbalances_detected},
                {"started_ms", stats.started_ms}};
}

GridStats stats_from_json(const json& node) {
    GridStats stats;
    stats.total_trades = json_value_or<int64_t>(node, "total_trades", 0);
    stats.buy_fills = json_value_or<int64_t>(node, "buy_fills", 0);
    stats.sell_fills = json_value_or<int64_t>(node, "sell_fills", 0);
    stats.round_trips = json_value_or<int64_t>(node, "round_trips", 0);
    stats.winning_round_trips = json_value_or<int64_t>(node, "winning_round_trips", 0);
    stats.losing_round_trips = json_value_or<int64_t>(node, "losing_round_trips", 0);
    stats.volume_quote = json_value_or<double>(node, "volume_quote", 0.0);
    stats.realized_profit = json_value_or<double>(node, "realized_profit", 0.0);
    stats.peak_equity = json_value_or<double>(node, "peak_equity", 0.0);
    stats.current_drawdown_pct = json_value_or<double>(node, "current_drawdown_pct", 0.0);
    stats.max_drawdown_pct = json_value_or<double>(node, "max_drawdown_pct", 0.0);
    stats.duplicates_cancelled = json_value_or<int64_t>(node, "duplicates_cancelled", 0);
    stats.imbalances_detected = json_value_or<int64_t>(node, "imbalances_detected", 0);
    stats.started_ms = json_value_or<int64_t>(node, "started_ms", 0);
    return stats;
}

} // namespace

const char* to_string(EngineState state) noexcept {
    switch (state) {
        case EngineState::Initializing: return "INITIALIZING";
        case EngineState::Running: return "RUNNING";
        case EngineState::Paused: return "PAUSED";
        case EngineState::Stopped: return "STOPPED";
        case EngineState::Error: return "ERROR";
    }
    return "ERROR";
}

std::optional<EngineState> parse_engine_state(const std::string& text) {
    if (text == "INITIALIZING") return EngineState::Initializing;
    if (text == "RUNNING") return EngineState::Running;
    if (text == "PAUSED") return EngineState::Paused;
    if (text == "STOPPED") return EngineState::Stopped;
    if (text == "ERROR") return EngineState::Error;
    return std::nullopt;
}

json snapshot_to_json(const PersistedSnapshot& snapshot) {
    json root;
    root["version"] = snapshot.version;
    root["saved_at_ms"] = snapshot.saved_at_ms;
    root["state"] = to_string(snapshot.state);
    root["epoch"] = snapshot.epoch;
    root["config"] = grid_config_to_json(snapshot.config);

    json rows = json::array();
    for (const auto& entry : snapshot.ledger) {
        rows.push_back(entry_to_json(entry));
    }
    root["ledger"] = std::move(rows);

    if (snapshot.position) {
        const auto& p = snapshot.position->position;
        root["position"] = json{{"signed_size", p.signed_size},
                                {"entry_price", p.entry_price},
                                {"mark_price", p.mark_price},
                                {"unrealized_pnl", p.unrealized_pnl},
                                {"updated_ms", snapshot.position->updated_ms}};
    } else {
        root["position"] = nullptr;
    }
    root["baseline_position"] = snapshot.baseline_position;
    root["stats"] = stats_to_json(snapshot.stats);
    root["last_fill_ms"] = snapshot.last_fill_ms;
    return root;
}

PersistedSnapshot snapshot_from_json(const json& root) {
    if (!root.is_object()) {
        throw PersistenceError("snapshot root is not a JSON object");
    }

    PersistedSnapshot snapshot;
    snapshot.version = json_value_or<int>(root, "version", 1);
    snapshot.saved_at_ms = json_value_or<int64_t>(root, "saved_at_ms", 0);
    snapshot.state = parse_engine_state(json_value_or<std::string>(root, "state", "")).value_or(EngineState::Stopped);
    snapshot.epoch = json_value_or<uint64_t>(root, "epoch", 0);

    if (root.contains("config") && root["config"].is_object()) {
        std::vector<std::string> errors;
        snapshot.config = grid_config_from_json(root["config"], errors);
        for (const auto& error : errors) {
            spdlog::warn("[Store] snapshot config: {}", error);
        }
    }

    if (root.contains("ledger") && root["ledger"].is_array()) {
        for (const auto& row : root["ledger"]) {
            if (auto entry = entry_from_json(row)) {
                snapshot.ledger.push_back(std::move(*entry));
            }
        }
    }

    if (root.contains("position") && root["position"].is_object()) {
        const auto& node = root["position"];
        PositionSnapshot position;
        position.position.symbol = snapshot.config.symbol;
        position.position.signed_size = json_value_or<double>(node, "signed_size", 0.0);
        position.position.entry_price = json_value_or<double>(node, "entry_price", 0.0);
        position.position.mark_price = json_value_or<double>(node, "mark_price", 0.0);
        position.position.unrealized_pnl = json_value_or<double>(node, "unrealized_pnl", 0.0);
        position.updated_ms = json_value_or<int64_t>(node, "updated_ms", 0);
        snapshot.position = position;
    }

    snapshot.baseline_position = json_value_or<double>(root, "baseline_position", 0.0);
    if (root.contains("stats") && root["stats"].is_object()) {
        snapshot.stats = stats_from_json(root["stats"]);
    }
    snapshot.last_fill_ms = json_value_or<int64_t>(root, "last_fill_ms", 0);
    return snapshot;
}

SnapshotStore::SnapshotStore(std::filesystem::path directory,
                             std::string instance_id,
                             std::chrono::milliseconds io_budget)
    : directory_(std::move(directory)),
      instance_id_(std::move(instance_id)),
      io_budget_(io_budget) {}

std::filesystem::path SnapshotStore::path_for(const std::string& symbol) const {
    return directory_ / (symbol + "_" + instance_id_ + ".json");
}

bool SnapshotStore::exists(const std::string& symbol) const {
    std::error_code ec;
    return std::filesystem::exists(path_for(symbol), ec);
}

void SnapshotStore::ensure_directory() const {
    if (directory_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceError("cannot create snapshot directory " + directory_.string() + ": " + ec.message());
    }
}

void SnapshotStore::save(const PersistedSnapshot& snapshot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto started = std::chrono::steady_clock::now();
    ensure_directory();

    const auto target = path_for(snapshot.config.symbol);
    auto temp = target;
    temp += ".tmp." + std::to_string(++write_sequence_);

    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.good()) {
            throw PersistenceError("cannot open " + temp.string() + " for writing");
        }
        output << snapshot_to_json(snapshot).dump(2) << '\n';
        output.flush();
        if (!output.good()) {
            throw PersistenceError("failed writing " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        if (cleanup) {
            spdlog::debug("[Store] temp file {} left behind: {}", temp.string(), cleanup.message());
        }
        throw PersistenceError("cannot replace " + target.string() + ": " + ec.message());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    if (elapsed > io_budget_) {
        spdlog::warn("[Store] snapshot write took {} ms (budget {} ms)", elapsed.count(), io_budget_.count());
    }
}

std::optional<PersistedSnapshot> SnapshotStore::load(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = path_for(symbol);
    std::ifstream input(path);
    if (!input.good()) {
        return std::nullopt;
    }
    json root;
    try {
        input >> root;
    } catch (const json::parse_error& ex) {
        throw PersistenceError("snapshot " + path.string() + " is corrupt: " + ex.what());
    }
    return snapshot_from_json(root);
}

void SnapshotStore::remove(const std::string& symbol) const {
    std::error_code ec;
    std::filesystem::remove(path_for(symbol), ec);
    if (ec) {
        spdlog::warn("[Store] cannot remove {}: {}", path_for(symbol).string(), ec.message());
    }
}

} // namespace grid
