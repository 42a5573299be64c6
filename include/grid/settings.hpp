#pragma once

#include "grid/grid_config.hpp"
#include "venue/streaming_client.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace grid {

struct LoggingConfig {
    std::string level = "info";
    std::string directory = "logs";
    bool trades_log = true;
};

struct PersistenceConfig {
    bool enabled = true;
    std::string directory = "state";
    int io_budget_ms = 50;
};

struct ExchangeConfig {
    std::string rest_url = "https://fapi.bitunix.com";
    std::string public_stream_url = "wss://fapi.bitunix.com/public/";
    std::string private_stream_url = "wss://fapi.bitunix.com/private/";
    int http_timeout_ms = 5000;
};

struct BotSettings {
    GridConfig grid;
    EngineOptions engine;
    venue::StreamOptions stream;
    ExchangeConfig exchange;
    LoggingConfig logging;
    PersistenceConfig persistence;
};

// Both throw ConfigInvalid listing every bad field.
BotSettings parse_settings(const nlohmann::json& root);
BotSettings load_settings(const std::filesystem::path& path);

nlohmann::json grid_config_to_json(const GridConfig& config);
GridConfig grid_config_from_json(const nlohmann::json& node, std::vector<std::string>& errors);

} // namespace grid
