#ifndef GATEWAY_RESPONSE_PARSER_HPP
#define GATEWAY_RESPONSE_PARSER_HPP

#include <optional>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"
#include "utils/session_clock.hpp"

namespace SellManager {
namespace API {

// Answer to an order submission; the gateway may ask for a confirmation reply first.
struct OrderSubmissionReply {
    std::optional<std::string> order_id;
    std::string order_status;
    std::optional<std::string> confirmation_reply_id;
    std::vector<std::string> messages;
    std::string error_message;
};

// Contract id of the first search hit on the requested exchange, else of the first hit.
std::optional<std::string> parse_conid_search_response(const std::string& response_body, const std::string& exchange);

/**
 * Bars from a marketdata/history response.
 * Gateway millisecond stamps become epoch seconds; daily bars are stamped 00:00 UTC of their
 * exchange-local trading date. Bars at or after end_time (when non-zero) are dropped and only
 * the most recent max_count are kept.
 */
Core::Series parse_history_response(const std::string& response_body, Core::Granularity granularity,
                                    Core::Timestamp end_time, int max_count, const Core::ExchangeSessionClock& session_clock);

std::vector<Core::Position> parse_positions_response(const std::string& response_body);
std::vector<Core::Order> parse_orders_response(const std::string& response_body);
OrderSubmissionReply parse_order_submission_response(const std::string& response_body);

std::string build_order_payload(const std::string& conid, Core::OrderSide side, double quantity, bool outside_regular_trading_hours);

std::string history_bar_size(Core::Granularity granularity);
// Calendar span that holds at least max_count bars of the granularity.
std::string history_period(Core::Granularity granularity, int max_count);

// "EXCHANGE:TICKER" from a gateway row
std::string make_instrument_key(const std::string& exchange, const std::string& ticker);

} // namespace API
} // namespace SellManager

#endif // GATEWAY_RESPONSE_PARSER_HPP
