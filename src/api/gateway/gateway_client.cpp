#include "gateway_client.hpp"
#include "gateway_response_parser.hpp"
#include "logging/logs/gateway_logs.hpp"
#include "utils/time_utils.hpp"
#include <stdexcept>

namespace SellManager {
namespace API {

using Logging::GatewayLogs;

namespace {
    constexpr int MAX_ORDER_CONFIRMATION_REPLIES = 3;
}

GatewayClient::GatewayClient(const Config::BrokerConfig& broker_config, const Core::ExchangeSessionClock& session_clock)
    : config(broker_config), clock(session_clock) {
    if (config.base_url.empty()) {
        throw std::runtime_error("Broker gateway base URL is required but not provided");
    }
}

std::string GatewayClient::build_url(const std::string& endpoint_path) const {
    std::string base_url = config.base_url;
    if (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    return base_url + endpoint_path;
}

HttpResponse GatewayClient::send_request(HttpMethod method, const std::string& endpoint_path, int timeout_seconds,
                                         const std::string& request_body) const {
    HttpRequest http_request(method, build_url(endpoint_path), timeout_seconds, config.enable_ssl_verification,
                             config.http_retries, request_body);
    HttpResponse http_response = perform_http_request(http_request);
    raise_for_http_status(http_response, endpoint_path);
    return http_response;
}

std::string GatewayClient::resolve_conid(const std::string& instrument_key) {
    {
        std::lock_guard<std::mutex> lock(conid_mutex);
        auto conid_iterator = conid_by_instrument.find(instrument_key);
        if (conid_iterator != conid_by_instrument.end()) {
            return conid_iterator->second;
        }
    }

    Core::InstrumentKey parsed_key = Core::parse_instrument_key(instrument_key);
    HttpResponse search_response = send_request(HttpMethod::GET, "/iserver/secdef/search?symbol=" + url_encode(parsed_key.ticker),
                                                config.request_timeout_seconds);
    std::optional<std::string> resolved_conid = parse_conid_search_response(search_response.body, parsed_key.exchange);
    if (!resolved_conid) {
        throw std::runtime_error("No contract found for " + instrument_key);
    }
    GatewayLogs::log_conid_resolved(instrument_key, *resolved_conid);

    std::lock_guard<std::mutex> lock(conid_mutex);
    conid_by_instrument[instrument_key] = *resolved_conid;
    return *resolved_conid;
}

std::vector<Core::Bar> GatewayClient::get_historical_bars(const Core::HistoricalBarsRequest& request) {
    if (request.instrument_key.empty()) {
        throw std::runtime_error("Instrument key is required for history request");
    }
    if (request.max_count <= 0) {
        throw std::runtime_error("Bar count must be greater than 0 for history request");
    }

    std::string conid = resolve_conid(request.instrument_key);
    std::string endpoint_path = "/iserver/marketdata/history?conid=" + conid +
                                "&period=" + history_period(request.granularity, request.max_count) +
                                "&bar=" + history_bar_size(request.granularity) +
                                "&outsideRth=" + std::string(config.outside_regular_trading_hours ? "true" : "false");
    if (request.end_time > 0) {
        endpoint_path += "&startTime=" + url_encode(TimeUtils::format_epoch_with_pattern_utc(request.end_time, TimeUtils::GATEWAY_START_TIME));
    }

    HttpResponse history_response = send_request(HttpMethod::GET, endpoint_path, request.timeout_seconds);
    std::vector<Core::Bar> history_bars = parse_history_response(history_response.body, request.granularity, request.end_time,
                                                                 request.max_count, clock);
    GatewayLogs::log_history_response(request.instrument_key, Core::granularity_to_string(request.granularity),
                                      request.max_count, history_bars.size());
    return history_bars;
}

std::vector<Core::Position> GatewayClient::get_positions() {
    if (config.account_id.empty()) {
        throw std::runtime_error("Broker account id is required to read positions");
    }
    HttpResponse positions_response = send_request(HttpMethod::GET, "/portfolio/" + config.account_id + "/positions/0",
                                                   config.request_timeout_seconds);
    return parse_positions_response(positions_response.body);
}

std::vector<Core::Order> GatewayClient::get_open_orders() {
    HttpResponse orders_response = send_request(HttpMethod::GET, "/iserver/account/orders", config.request_timeout_seconds);
    return parse_orders_response(orders_response.body);
}

Core::OrderResult GatewayClient::place_order(const std::string& instrument_key, Core::OrderSide side, double quantity) {
    Core::OrderResult order_result;
    if (config.account_id.empty()) {
        order_result.error_message = "Broker account id is required to place orders";
        return order_result;
    }

    std::string conid = resolve_conid(instrument_key);
    std::string order_payload = build_order_payload(conid, side, quantity, config.outside_regular_trading_hours);
    GatewayLogs::log_order_submission(instrument_key, Core::order_side_to_string(side), quantity);

    HttpResponse submission_response = send_request(HttpMethod::POST, "/iserver/account/" + config.account_id + "/orders",
                                                    config.request_timeout_seconds, order_payload);
    OrderSubmissionReply submission_reply = parse_order_submission_response(submission_response.body);

    // The gateway may ask to confirm precautionary warnings before accepting the order.
    for (int reply_index = 0; reply_index < MAX_ORDER_CONFIRMATION_REPLIES && submission_reply.confirmation_reply_id; ++reply_index) {
        GatewayLogs::log_order_confirmation(instrument_key, submission_reply.messages);
        HttpResponse reply_response = send_request(HttpMethod::POST, "/iserver/reply/" + *submission_reply.confirmation_reply_id,
                                                   config.request_timeout_seconds, "{\"confirmed\":true}");
        submission_reply = parse_order_submission_response(reply_response.body);
    }

    if (submission_reply.order_id) {
        order_result.accepted = true;
        order_result.order_id = *submission_reply.order_id;
        order_result.status = submission_reply.order_status;
    } else if (submission_reply.confirmation_reply_id) {
        order_result.error_message = "Order still awaiting confirmation after " + std::to_string(MAX_ORDER_CONFIRMATION_REPLIES) + " replies";
    } else {
        order_result.error_message = submission_reply.error_message;
    }
    GatewayLogs::log_order_result(instrument_key, order_result);
    return order_result;
}

bool GatewayClient::cancel_order(const std::string& order_id) {
    if (config.account_id.empty() || order_id.empty()) {
        return false;
    }
    send_request(HttpMethod::DELETE_METHOD, "/iserver/account/" + config.account_id + "/order/" + url_encode(order_id),
                 config.request_timeout_seconds);
    GatewayLogs::log_order_cancelled(order_id);
    return true;
}

} // namespace API
} // namespace SellManager
