#ifndef GATEWAY_CLIENT_HPP
#define GATEWAY_CLIENT_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "api/general/broker_interfaces.hpp"
#include "configs/broker_config.hpp"
#include "utils/http_utils.hpp"
#include "utils/session_clock.hpp"

namespace SellManager {
namespace API {

/**
 * REST adapter for a locally running broker gateway.
 * Authentication and session keep-alive belong to the gateway process; this client only
 * issues requests and maps HTTP failures onto the broker error types.
 */
class GatewayClient : public HistoricalDataSource, public PositionSource, public OrderSink {
public:
    GatewayClient(const Config::BrokerConfig& broker_config, const Core::ExchangeSessionClock& session_clock);

    // No default constructor - the client is meaningless without gateway configuration
    GatewayClient() = delete;
    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    std::vector<Core::Bar> get_historical_bars(const Core::HistoricalBarsRequest& request) override;

    std::vector<Core::Position> get_positions() override;
    std::vector<Core::Order> get_open_orders() override;

    Core::OrderResult place_order(const std::string& instrument_key, Core::OrderSide side, double quantity) override;
    bool cancel_order(const std::string& order_id) override;

    // Contract ids are looked up once per instrument and cached.
    std::string resolve_conid(const std::string& instrument_key);

private:
    Config::BrokerConfig config;
    const Core::ExchangeSessionClock& clock;

    std::mutex conid_mutex;
    std::map<std::string, std::string> conid_by_instrument;

    std::string build_url(const std::string& endpoint_path) const;
    HttpResponse send_request(HttpMethod method, const std::string& endpoint_path, int timeout_seconds,
                              const std::string& request_body = "") const;
};

} // namespace API
} // namespace SellManager

#endif // GATEWAY_CLIENT_HPP
