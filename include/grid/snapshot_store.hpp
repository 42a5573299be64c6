#pragma once

#include "grid/grid_config.hpp"
#include "grid/grid_stats.hpp"
#include "grid/order_ledger.hpp"
#include "grid/position_reconciler.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace grid {

enum class EngineState { Initializing, Running, Paused, Stopped, Error };

const char* to_string(EngineState state) noexcept;
std::optional<EngineState> parse_engine_state(const std::string& text);

struct PersistedSnapshot {
    int version = 1;
    int64_t saved_at_ms = 0;
    EngineState state = EngineState::Initializing;
    uint64_t epoch = 0;
    GridConfig config;
    std::vector<LedgerEntry> ledger;
    std::optional<PositionSnapshot> position;
    double baseline_position = 0.0;
    GridStats stats;
    int64_t last_fill_ms = 0;
};

nlohmann::json snapshot_to_json(const PersistedSnapshot& snapshot);
// Unknown keys are ignored, missing keys keep their defaults.
PersistedSnapshot snapshot_from_json(const nlohmann::json& node);

// One JSON file per (symbol, instance), replaced atomically on every save.
// Saves are serialized; each writes its own temp file before the rename.
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path directory,
                  std::string instance_id,
                  std::chrono::milliseconds io_budget = std::chrono::milliseconds(50));

    [[nodiscard]] std::filesystem::path path_for(const std::string& symbol) const;
    [[nodiscard]] bool exists(const std::string& symbol) const;

    // Throw PersistenceError.
    void save(const PersistedSnapshot& snapshot) const;
    [[nodiscard]] std::optional<PersistedSnapshot> load(const std::string& symbol) const;

    void remove(const std::string& symbol) const;

private:
    void ensure_directory() const;

    std::filesystem::path directory_;
    std::string instance_id_;
    std::chrono::milliseconds io_budget_;
    mutable std::mutex mutex_;
    mutable uint64_t write_sequence_ = 0;
};

} // namespace grid
