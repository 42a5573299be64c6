#include "grid/settings.hpp"

#include "grid/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>

namespace grid {
namespace {

using nlohmann::json;

template <typename T>
void read_field(const json& node, const char* section, const char* key, T& out, std::vector<std::string>& errors) {
    if (!node.is_object() || !node.contains(key) || node.at(key).is_null()) {
        return;
    }
    try {
        out = node.at(key).get<T>();
    } catch (const json::exception&) {
        errors.push_back(std::string(section) + "." + key + " has the wrong type");
    }
}

void read_optional(const json& node,
                   const char* section,
                   const char* key,
                   std::optional<double>& out,
                   std::vector<std::string>& errors) {
    if (!node.is_object() || !node.contains(key) || node.at(key).is_null()) {
        return;
    }
    try {
        out = node.at(key).get<double>();
    } catch (const json::exception&) {
        errors.push_back(std::string(section) + "." + key + " has the wrong type");
    }
}

template <typename Enum, typename Parser>
void read_enum(const json& node,
               const char* section,
               const char* key,
               Enum& out,
               Parser parse,
               std::vector<std::string>& errors) {
    std::string text;
    read_field(node, section, key, text, errors);
    if (text.empty()) {
        return;
    }
    if (const auto parsed = parse(text)) {
        out = *parsed;
    } else {
        errors.push_back(std::string(section) + "." + key + " has unknown value '" + text + "'");
    }
}

const json& section_of(const json& root, const char* name, std::vector<std::string>& errors) {
    static const json empty = json::object();
    if (!root.contains(name)) {
        return empty;
    }
    const auto& node = root.at(name);
    if (!node.is_object()) {
        errors.push_back(std::string(name) + " must be an object");
        return empty;
    }
    return node;
}

EngineOptions engine_options_from_json(const json& node, std::vector<std::string>& errors) {
    EngineOptions options;
    const char* s = "engine";
    read_field(node, s, "price_buffer_pct", options.price_buffer_pct, errors);
    read_field(node, s, "price_tolerance", options.price_tolerance, errors);
    read_field(node, s, "replenish_step", options.replenish_step, errors);
    read_field(node, s, "accept_high_risk", options.accept_high_risk, errors);
    read_field(node, s, "accept_out_of_range", options.accept_out_of_range, errors);
    read_field(node, s, "open_initial_position", options.open_initial_position, errors);
    read_field(node, s, "maintenance_margin_rate", options.maintenance_margin_rate, errors);
    read_field(node, s, "imbalance_tolerance", options.imbalance_tolerance, errors);
    read_field(node, s, "connect_timeout_ms", options.connect_timeout_ms, errors);
    read_field(node, s, "stop_timeout_ms", options.stop_timeout_ms, errors);
    read_field(node, s, "reconcile_interval_ms", options.reconcile_interval_ms, errors);
    read_field(node, s, "rest_poll_interval_ms", options.rest_poll_interval_ms, errors);
    read_field(node, s, "worker_threads", options.worker_threads, errors);
    read_field(node, s, "worker_queue_limit", options.worker_queue_limit, errors);
    read_field(node, s, "instance_id", options.instance_id, errors);
    return options;
}

venue::StreamOptions stream_options_from_json(const json& node, std::vector<std::string>& errors) {
    venue::StreamOptions options;
    const char* s = "stream";
    read_field(node, s, "initial_delay_s", options.reconnect.initial_delay_s, errors);
    read_field(node, s, "max_delay_s", options.reconnect.max_delay_s, errors);
    read_field(node, s, "multiplier", options.reconnect.multiplier, errors);
    read_field(node, s, "max_attempts", options.reconnect.max_attempts, errors);
    read_field(node, s, "heartbeat_interval_ms", options.heartbeat_interval_ms, errors);
    read_field(node, s, "max_subscriptions", options.max_subscriptions, errors);
    read_field(node, s, "send_timeout_ms", options.send_timeout_ms, errors);

    if (options.reconnect.initial_delay_s <= 0.0 || options.reconnect.max_delay_s < options.reconnect.initial_delay_s) {
        errors.emplace_back("stream reconnect delays must satisfy 0 < initial_delay_s <= max_delay_s");
    }
    if (options.reconnect.multiplier < 1.0) {
        errors.emplace_back("stream.multiplier must be at least 1");
    }
    if (options.heartbeat_interval_ms <= 0 || options.send_timeout_ms <= 0) {
        errors.emplace_back("stream heartbeat and send timeouts must be positive");
    }
    if (options.max_subscriptions == 0) {
        errors.emplace_back("stream.max_subscriptions must be positive");
    }
    return options;
}

} // namespace

GridConfig grid_config_from_json(const json& node, std::vector<std::string>& errors) {
    GridConfig config;
    const char* s = "grid";
    read_field(node, s, "symbol", config.symbol, errors);
    read_enum(node, s, "direction", config.direction, parse_direction, errors);
    read_enum(node, s, "grid_type", config.grid_type, parse_grid_type, errors);
    read_field(node, s, "lower_price", config.lower_price, errors);
    read_field(node, s, "upper_price", config.upper_price, errors);
    read_field(node, s, "grid_count", config.grid_count, errors);
    read_field(node, s, "total_investment", config.total_investment, errors);
    read_field(node, s, "leverage", config.leverage, errors);
    read_optional(node, s, "stop_loss", config.stop_loss, errors);
    read_optional(node, s, "take_profit", config.take_profit, errors);
    read_field(node, s, "max_position_size", config.max_position_size, errors);
    read_field(node, s, "max_drawdown_pct", config.max_drawdown_pct, errors);
    read_enum(node, s, "order_type", config.order_type, parse_order_type, errors);
    read_enum(node, s, "time_in_force", config.time_in_force, parse_time_in_force, errors);
    read_field(node, s, "post_only", config.post_only, errors);
    read_field(node, s, "trailing_up", config.trailing_up, errors);
    read_field(node, s, "trailing_down", config.trailing_down, errors);
    read_field(node, s, "cancel_orders_on_stop", config.cancel_orders_on_stop, errors);
    read_field(node, s, "close_position_on_stop", config.close_position_on_stop, errors);
    return config;
}

json grid_config_to_json(const GridConfig& config) {
    json node;
    node["symbol"] = config.symbol;
    node["direction"] = to_string(config.direction);
    node["grid_type"] = to_string(config.grid_type);
    node["lower_price"] = config.lower_price;
    node["upper_price"] = config.upper_price;
    node["grid_count"] = config.grid_count;
    node["total_investment"] = config.total_investment;
    node["leverage"] = config.leverage;
    node["stop_loss"] = config.stop_loss ? json(*config.stop_loss) : json(nullptr);
    node["take_profit"] = config.take_profit ? json(*config.take_profit) : json(nullptr);
    node["max_position_size"] = config.max_position_size;
    node["max_drawdown_pct"] = config.max_drawdown_pct;
    node["order_type"] = venue::to_string(config.order_type);
    node["time_in_force"] = venue::to_string(config.time_in_force);
    node["post_only"] = config.post_only;
    node["trailing_up"] = config.trailing_up;
    node["trailing_down"] = config.trailing_down;
    node["cancel_orders_on_stop"] = config.cancel_orders_on_stop;
    node["close_position_on_stop"] = config.close_position_on_stop;
    return node;
}

BotSettings parse_settings(const json& root) {
    std::vector<std::string> errors;
    if (!root.is_object()) {
        throw ConfigInvalid({"configuration root must be a JSON object"});
    }

    BotSettings settings;
    settings.grid = grid_config_from_json(section_of(root, "grid", errors), errors);
    settings.engine = engine_options_from_json(section_of(root, "engine", errors), errors);
    settings.stream = stream_options_from_json(section_of(root, "stream", errors), errors);

    const auto& exchange = section_of(root, "exchange", errors);
    read_field(exchange, "exchange", "rest_url", settings.exchange.rest_url, errors);
    read_field(exchange, "exchange", "public_stream_url", settings.exchange.public_stream_url, errors);
    read_field(exchange, "exchange", "private_stream_url", settings.exchange.private_stream_url, errors);
    read_field(exchange, "exchange", "http_timeout_ms", settings.exchange.http_timeout_ms, errors);

    const auto& logging = section_of(root, "logging", errors);
    read_field(logging, "logging", "level", settings.logging.level, errors);
    read_field(logging, "logging", "directory", settings.logging.directory, errors);
    read_field(logging, "logging", "trades_log", settings.logging.trades_log, errors);

    const auto& persistence = section_of(root, "persistence", errors);
    read_field(persistence, "persistence", "enabled", settings.persistence.enabled, errors);
    read_field(persistence, "persistence", "directory", settings.persistence.directory, errors);
    read_field(persistence, "persistence", "io_budget_ms", settings.persistence.io_budget_ms, errors);

    for (auto& reason : settings.grid.validate()) {
        errors.push_back(std::move(reason));
    }
    for (auto& reason : settings.engine.validate()) {
        errors.push_back(std::move(reason));
    }
    if (settings.persistence.io_budget_ms <= 0) {
        errors.emplace_back("persistence.io_budget_ms must be positive");
    }

    if (!errors.empty()) {
        throw ConfigInvalid(std::move(errors));
    }
    settings.stream.name = settings.grid.symbol;
    return settings;
}

BotSettings load_settings(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.good()) {
        throw ConfigInvalid({"cannot open configuration file " + path.string()});
    }
    json root;
    try {
        input >> root;
    } catch (const json::parse_error& ex) {
        throw ConfigInvalid({"configuration file " + path.string() + " is not valid JSON: " + ex.what()});
    }
    return parse_settings(root);
}

} // namespace grid
