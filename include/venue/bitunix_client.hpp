#pragma once

#include "venue/client_base.hpp"
#include "venue/exchange_gateway.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace venue {

// BitUnix USDT-margined futures REST adapter.
class BitunixClient : public ClientBase, public ExchangeGateway {
public:
    explicit BitunixClient(Credentials credentials,
                           std::string base_url = "https://fapi.bitunix.com",
                           long timeout_ms = 5000);

    std::vector<Ticker> fetch_tickers() override;
    InstrumentSpec fetch_instrument(const std::string& symbol) override;
    std::vector<ExchangeOrder> fetch_open_orders(const std::string& symbol) override;
    PlaceResult place_order(const OrderRequest& request) override;
    void cancel_order(const std::string& symbol,
                      const std::string& order_id,
                      const std::string& client_order_id) override;
    PositionInfo fetch_position(const std::string& symbol) override;
    std::vector<FillRecord> fetch_fills(const std::string& symbol, int64_t since_ms) override;

    // Exposed for tests: decode payloads without a network round trip.
    static std::vector<Ticker> parse_tickers(const nlohmann::json& data);
    static InstrumentSpec parse_instrument(const nlohmann::json& item);
    static ExchangeOrder parse_order(const nlohmann::json& item);
    static PositionInfo parse_position(const std::string& symbol, const nlohmann::json& data);
    static FillRecord parse_fill(const nlohmann::json& item);
    static nlohmann::json build_order_body(const OrderRequest& request, const InstrumentSpec& spec);

    // Returns "data"; throws ExchangeError (OrderRejected when order_endpoint) for code != 0.
    static nlohmann::json unwrap(const std::string& body, const std::string& what, bool order_endpoint = false);

private:
    InstrumentSpec instrument_cached(const std::string& symbol);

    std::mutex instruments_mutex_;
    std::unordered_map<std::string, InstrumentSpec> instruments_;
};

} // namespace venue
