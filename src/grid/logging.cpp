#include "grid/logging.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace grid {
namespace {

constexpr std::size_t kMaxLogBytes = 10 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kTradesLogger = "trades";

} // namespace

void init_logging(const LoggingConfig& config) {
    const std::filesystem::path dir = config.directory.empty() ? "." : config.directory;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create log directory " + dir.string() + ": " + ec.message());
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (dir / "gridbot.log").string(), kMaxLogBytes, kMaxLogFiles);

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("gridbot", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);

        if (config.trades_log && !spdlog::get(kTradesLogger)) {
            auto trades = spdlog::daily_logger_mt(kTradesLogger, (dir / "trades.log").string());
            trades->set_pattern("%v");
            trades->flush_on(spdlog::level::info);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("log init failed: ") + ex.what());
    }

    spdlog::info("[Log] logging to {}", dir.string());
}

void log_trade(const std::string& symbol, const GridTrade& trade) {
    auto trades = spdlog::get(kTradesLogger);
    if (!trades) {
        return;
    }
    trades->info("{},{},{},{:.8f},{:.8f},{:.4f}", symbol, trade.level_index, venue::to_string(trade.side),
                 trade.fill_price, trade.quantity, trade.realized_profit.value_or(0.0));
}

} // namespace grid
