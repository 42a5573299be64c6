#pragma once

#include "venue/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace venue {

// Narrow capability surface the trading core needs from an exchange.
// Calls block on network I/O and report failures by throwing VenueError
// subclasses (HttpError, ExchangeError, OrderRejected).
class ExchangeGateway {
public:
    virtual ~ExchangeGateway() = default;

    virtual std::vector<Ticker> fetch_tickers() = 0;
    virtual InstrumentSpec fetch_instrument(const std::string& symbol) = 0;
    virtual std::vector<ExchangeOrder> fetch_open_orders(const std::string& symbol) = 0;
    virtual PlaceResult place_order(const OrderRequest& request) = 0;

    // Either id may be empty, not both.
    virtual void cancel_order(const std::string& symbol,
                              const std::string& order_id,
                              const std::string& client_order_id) = 0;

    virtual PositionInfo fetch_position(const std::string& symbol) = 0;
    virtual std::vector<FillRecord> fetch_fills(const std::string& symbol, int64_t since_ms) = 0;
};

} // namespace venue
