#include "signal_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

using namespace SellManager::Logging;
using namespace SellManager::Core;

namespace {
    std::string format_price(const std::optional<double>& price_value) {
        if (!price_value) {
            return "n/a";
        }
        std::ostringstream price_stream;
        price_stream << std::fixed << std::setprecision(4) << *price_value;
        return price_stream.str();
    }
}

void SignalLogs::log_evaluation_start(CadenceTrigger trigger, size_t hourly_count, size_t daily_count) {
    LOG_THREAD_SIGNAL_EVALUATION_HEADER(cadence_trigger_to_string(trigger));
    LOG_THREAD_CONTENT("Hourly assignments: " + std::to_string(hourly_count));
    LOG_THREAD_CONTENT("Daily assignments: " + std::to_string(daily_count));
    LOG_THREAD_SECTION_FOOTER();
}

void SignalLogs::log_positions_unavailable(const std::string& error_message) {
    log_message("WARNING: Positions unavailable for evaluation, instruments skipped: " + error_message, "");
}

void SignalLogs::log_decision(const SignalRecord& signal_record) {
    log_message(signal_record.instrument_key + " " + timeframe_to_string(signal_record.timeframe) + " " +
                signal_decision_to_string(signal_record.decision) + " (" + signal_record.reason + ") close=" +
                format_price(signal_record.close) + " " + moving_average_type_to_string(signal_record.ma_type) +
                std::to_string(signal_record.ma_length) + "=" + format_price(signal_record.ma_value), "");
}

void SignalLogs::log_sell_signal(const SignalRecord& signal_record) {
    TABLE_HEADER_48("SELL SIGNAL", signal_record.instrument_key);
    TABLE_ROW_48("Bar", TimeUtils::format_epoch_iso_utc(signal_record.bar_timestamp));
    TABLE_ROW_48("Close", format_price(signal_record.close));
    TABLE_ROW_48(moving_average_type_to_string(signal_record.ma_type) + std::to_string(signal_record.ma_length), format_price(signal_record.ma_value));
    TABLE_ROW_48("Average Cost", format_price(signal_record.average_cost));
    TABLE_ROW_48("Distance", format_price(signal_record.distance_pct) + "%");
    TABLE_FOOTER_48();
}

void SignalLogs::log_order_prepared(const PreparedOrder& prepared_order, bool transmit_enabled) {
    log_message("Prepared " + prepared_order.order_type + " " + order_side_to_string(prepared_order.side) + " " +
                std::to_string(prepared_order.quantity) + " " + prepared_order.instrument_key +
                (transmit_enabled ? " (transmitting)" : " (not transmitted, live mode off)"), "");
}

void SignalLogs::log_duplicate_order_blocked(const std::string& instrument_key) {
    log_message("WARNING: Open sell order already exists for " + instrument_key + ", not placing another", "");
}

void SignalLogs::log_audit_write_failed(const std::string& instrument_key, CadenceTrigger trigger, const std::string& error_message) {
    log_message("ERROR: Audit record for " + instrument_key + " (" + cadence_trigger_to_string(trigger) + ") not written: " + error_message, "");
}

void SignalLogs::log_evaluation_summary(CadenceTrigger trigger, size_t evaluated_count, size_t signal_count, size_t skipped_count) {
    log_message("Evaluation " + cadence_trigger_to_string(trigger) + " done: evaluated=" + std::to_string(evaluated_count) +
                " signals=" + std::to_string(signal_count) + " skipped=" + std::to_string(skipped_count), "");
}
