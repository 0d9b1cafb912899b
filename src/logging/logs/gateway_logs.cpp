#include "gateway_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

using namespace SellManager::Logging;

void GatewayLogs::log_conid_resolved(const std::string& instrument_key, const std::string& conid) {
    log_message("Gateway: " + instrument_key + " resolved to contract " + conid, "");
}

void GatewayLogs::log_history_response(const std::string& instrument_key, const std::string& bar_size, int requested_count, size_t received_count) {
    log_message("Gateway history " + instrument_key + " " + bar_size + ": " + std::to_string(received_count) + "/" +
                std::to_string(requested_count) + " bars", "");
}

void GatewayLogs::log_order_submission(const std::string& instrument_key, const std::string& side, double quantity) {
    TABLE_HEADER_48("ORDER SUBMISSION", "Market Order");
    TABLE_ROW_48("Instrument", instrument_key);
    TABLE_ROW_48("Side", side);
    TABLE_ROW_48("Quantity", std::to_string(quantity));
    TABLE_ROW_48("Type", "MKT");
    TABLE_FOOTER_48();
}

void GatewayLogs::log_order_confirmation(const std::string& instrument_key, const std::vector<std::string>& gateway_messages) {
    LOG_THREAD_SECTION_HEADER("ORDER CONFIRMATION - " + instrument_key);
    for (const auto& gateway_message : gateway_messages) {
        LOG_THREAD_CONTENT(gateway_message);
    }
    LOG_THREAD_SECTION_FOOTER();
}

void GatewayLogs::log_order_result(const std::string& instrument_key, const SellManager::Core::OrderResult& order_result) {
    if (order_result.accepted) {
        log_message("Order for " + instrument_key + " accepted: id=" + order_result.order_id + " status=" + order_result.status, "");
    } else {
        log_message("ERROR: Order for " + instrument_key + " rejected: " + order_result.error_message, "");
    }
}

void GatewayLogs::log_order_cancelled(const std::string& order_id) {
    log_message("Order " + order_id + " cancel requested", "");
}
