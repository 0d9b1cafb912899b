#ifndef GATEWAY_LOGS_HPP
#define GATEWAY_LOGS_HPP

#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Logging {

class GatewayLogs {
public:
    static void log_conid_resolved(const std::string& instrument_key, const std::string& conid);
    static void log_history_response(const std::string& instrument_key, const std::string& bar_size, int requested_count, size_t received_count);

    // Orders
    static void log_order_submission(const std::string& instrument_key, const std::string& side, double quantity);
    static void log_order_confirmation(const std::string& instrument_key, const std::vector<std::string>& gateway_messages);
    static void log_order_result(const std::string& instrument_key, const Core::OrderResult& order_result);
    static void log_order_cancelled(const std::string& order_id);
};

} // namespace Logging
} // namespace SellManager

#endif // GATEWAY_LOGS_HPP
