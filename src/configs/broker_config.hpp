#ifndef BROKER_CONFIG_HPP
#define BROKER_CONFIG_HPP

#include <string>

namespace SellManager {
namespace Config {

struct BrokerConfig {
    std::string base_url = "https://127.0.0.1:5000/v1/api";   // Local gateway REST root
    std::string account_id;
    bool enable_ssl_verification = false;            // Gateway serves a self-signed certificate
    int request_timeout_seconds = 30;
    int http_retries = 1;
    bool outside_regular_trading_hours = false;
    bool live_mode = false;                          // Orders are transmitted only when true
};

} // namespace Config
} // namespace SellManager

#endif // BROKER_CONFIG_HPP
