#pragma once

#include "grid/order_ledger.hpp"
#include "grid/settings.hpp"

#include <string>

namespace grid {

// Installs the "gridbot" default logger (console + rotating file) and the
// "trades" CSV logger. Throws std::runtime_error if the sinks cannot be created.
void init_logging(const LoggingConfig& config);

// symbol,level,side,price,qty,profit. No-op until init_logging has run.
void log_trade(const std::string& symbol, const GridTrade& trade);

} // namespace grid
