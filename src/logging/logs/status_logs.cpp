#include "status_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

using namespace SellManager::Logging;
using SellManager::Core::StatusRow;

void StatusLogs::log_minute_tick_start(size_t instrument_count, bool assignments_reloaded) {
    LOG_THREAD_MINUTE_REFRESH_HEADER();
    LOG_THREAD_CONTENT("Instruments: " + std::to_string(instrument_count));
    if (assignments_reloaded) {
        LOG_THREAD_CONTENT("Assignments reloaded");
    }
    LOG_THREAD_SECTION_FOOTER();
}

void StatusLogs::log_positions_unavailable(const std::string& error_message) {
    log_message("WARNING: Positions unavailable this tick, using last known: " + error_message, "");
}

void StatusLogs::log_connectivity_paused(const std::string& instrument_key, const std::string& status_string, int seconds_until_retry) {
    log_message("Refresh " + instrument_key + " paused: broker " + status_string + ", retry in " + std::to_string(seconds_until_retry) + "s", "");
}

void StatusLogs::log_instrument_refresh_failed(const std::string& instrument_key, const std::string& error_message) {
    log_message("ERROR: Refresh " + instrument_key + " failed: " + error_message, "");
}

void StatusLogs::log_minute_tick_summary(size_t refreshed_count, size_t failed_count, size_t skipped_count) {
    log_message("Minute tick done: refreshed=" + std::to_string(refreshed_count) + " failed=" + std::to_string(failed_count) +
                " skipped=" + std::to_string(skipped_count), "");
}

std::string StatusLogs::format_status_value(const StatusRow& status_row) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(2);
    if (!status_row.last_error.empty() && !status_row.close) {
        value_stream << "ERR " << status_row.last_error;
        return value_stream.str();
    }
    if (status_row.close) {
        value_stream << *status_row.close;
    } else {
        value_stream << "-";
    }
    value_stream << " " << status_row.indicator_label << " ";
    if (status_row.ma_value) {
        value_stream << *status_row.ma_value;
    } else {
        value_stream << "n/a";
    }
    if (status_row.distance_pct) {
        value_stream << " " << std::showpos << *status_row.distance_pct << std::noshowpos << "%";
    }
    if (status_row.above_break_even) {
        value_stream << (*status_row.above_break_even ? " BE+" : " BE-");
    }
    if (!status_row.last_error.empty()) {
        value_stream << " !";
    }
    return value_stream.str();
}

void StatusLogs::log_status_table(const std::vector<StatusRow>& status_rows) {
    TABLE_HEADER_48("STATUS", "Close  MA  Distance  Break-even");
    if (status_rows.empty()) {
        TABLE_ROW_48("-", "no instruments tracked");
    }
    for (const auto& status_row : status_rows) {
        TABLE_ROW_48(status_row.instrument_key, format_status_value(status_row));
    }
    TABLE_FOOTER_48();
}
