#include "grid/errors.hpp"
#include "grid/grid_engine.hpp"
#include "grid/logging.hpp"
#include "grid/settings.hpp"
#include "grid/snapshot_store.hpp"
#include "venue/bitunix_client.hpp"
#include "venue/bitunix_codec.hpp"
#include "venue/errors.hpp"
#include "venue/streaming_client.hpp"
#include "venue/ws_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

venue::Credentials load_credentials_from_env() {
    const char* api_key = std::getenv("BITUNIX_API_KEY");
    const char* api_secret = std::getenv("BITUNIX_API_SECRET");
    return venue::Credentials{api_key ? api_key : "", api_secret ? api_secret : ""};
}

std::unique_ptr<venue::StreamingClient> make_stream(std::shared_ptr<const venue::StreamCodec> codec,
                                                    venue::StreamOptions options,
                                                    const std::string& name) {
    options.name = name;
    return std::make_unique<venue::StreamingClient>(
        std::move(codec), []() { return std::make_unique<venue::WsTransport>(); }, std::move(options));
}

} // namespace

int main(int argc, char** argv) {
    load_env_file(".env");
    const std::string config_path = argc > 1 ? argv[1] : "config/gridbot.json";

    grid::BotSettings settings;
    try {
        settings = grid::load_settings(config_path);
        grid::init_logging(settings.logging);
    } catch (const grid::ConfigInvalid& ex) {
        std::cerr << ex.what() << std::endl;
        return 2;
    } catch (const std::runtime_error& ex) {
        std::cerr << ex.what() << std::endl;
        return 2;
    }

    const auto credentials = load_credentials_from_env();
    venue::BitunixClient client{credentials, settings.exchange.rest_url, settings.exchange.http_timeout_ms};
    if (!client.has_credentials()) {
        spdlog::error("BITUNIX_API_KEY and BITUNIX_API_SECRET must be set (environment or .env)");
        return 2;
    }

    auto account = make_stream(
        std::make_shared<venue::BitunixStreamCodec>(venue::BitunixEndpoint::Private, credentials),
        settings.stream, settings.grid.symbol + ":account");
    auto market = make_stream(std::make_shared<venue::BitunixStreamCodec>(venue::BitunixEndpoint::Public),
                              settings.stream, settings.grid.symbol + ":market");

    std::shared_ptr<grid::SnapshotStore> store;
    if (settings.persistence.enabled) {
        store = std::make_shared<grid::SnapshotStore>(settings.persistence.directory, settings.engine.instance_id,
                                                      std::chrono::milliseconds(settings.persistence.io_budget_ms));
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        grid::GridEngine engine{settings.grid,
                                settings.engine,
                                client,
                                std::move(account),
                                std::move(market),
                                grid::StreamEndpoints{settings.exchange.private_stream_url,
                                                      settings.exchange.public_stream_url},
                                store};

        std::optional<grid::PersistedSnapshot> snapshot;
        if (store && store->exists(settings.grid.symbol)) {
            snapshot = store->load(settings.grid.symbol);
        }

        const bool started = snapshot ? engine.resume(*snapshot) : engine.start();
        if (!started) {
            spdlog::error("Engine failed to start: {}", engine.error_reason());
            return 1;
        }

        while (!engine.wait_until_terminal(std::chrono::milliseconds(500))) {
            if (g_stop_requested) {
                engine.stop("signal received");
            }
        }

        const auto stats = engine.stats();
        spdlog::info("Engine finished in state {}: {} trades, {} round trips, realized {:.4f}",
                     grid::to_string(engine.state()), stats.total_trades, stats.round_trips, stats.realized_profit);
        return engine.state() == grid::EngineState::Error ? 1 : 0;
    } catch (const grid::GridError& ex) {
        spdlog::error("{}", ex.what());
    } catch (const venue::VenueError& ex) {
        spdlog::error("{}", ex.what());
    }
    return 1;
}
