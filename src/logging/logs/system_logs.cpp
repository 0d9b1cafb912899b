#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager::Logging;

namespace {

std::string format_cadence_stats(const SellManager::Threads::CadenceStats& cadence_stats) {
    return "fired " + std::to_string(cadence_stats.fired_count) + ", skipped " +
           std::to_string(cadence_stats.skipped_count) + ", failed " + std::to_string(cadence_stats.failed_count);
}

std::string format_last_fired(const SellManager::Threads::CadenceStats& cadence_stats) {
    if (!cadence_stats.last_fired) {
        return "never";
    }
    return TimeUtils::format_epoch_iso_utc(TimeUtils::time_point_to_epoch_seconds(*cadence_stats.last_fired));
}

std::string enabled_string(bool enabled) {
    return enabled ? "ENABLED" : "DISABLED";
}

} // namespace

void SystemLogs::log_startup_configuration(const SellManager::Config::SystemConfig& config) {
    TABLE_HEADER_48("Sell Manager", "Startup Configuration");
    TABLE_ROW_48("Gateway", config.broker.base_url);
    TABLE_ROW_48("Account", config.broker.account_id.empty() ? std::string("(unset)") : config.broker.account_id);
    TABLE_ROW_48("Order Mode", config.broker.live_mode ? std::string("LIVE - orders transmitted") : std::string("DRY RUN - orders prepared only"));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Hourly Target", std::to_string(config.backfill.hourly_target_bars) + " bars");
    TABLE_ROW_48("Daily Target", std::to_string(config.backfill.daily_target_bars) + " bars");
    TABLE_ROW_48("Slice / Workers", std::to_string(config.backfill.slice_size) + " bars / " + std::to_string(config.backfill.worker_pool_size));
    TABLE_ROW_48("Rate Limit", std::to_string(config.backfill.rate_limit_max_requests) + " per " +
                 std::to_string(config.backfill.rate_limit_window_milliseconds) + "ms");
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("UTC Offset", std::to_string(config.session.utc_offset_hours) + "h" + (config.session.observe_us_dst ? " (US DST)" : ""));
    TABLE_ROW_48("Minute Cadence", enabled_string(config.timing.enable_minute_cadence));
    TABLE_ROW_48("Hour Cadence", enabled_string(config.timing.enable_hour_cadence));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Cache Directory", config.storage.cache_directory);
    TABLE_ROW_48("Assignments", config.storage.assignments_file);
    TABLE_ROW_48("Signal Audit", config.storage.signal_audit_file);
    TABLE_FOOTER_48();
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message(std::string("WARNING: ") + warning_message, "");
}

void SystemLogs::log_startup_complete(bool minute_cadence_enabled, bool hour_cadence_enabled) {
    log_message("SYSTEM_STARTUP: Startup complete (minute cadence " + enabled_string(minute_cadence_enabled) +
                ", hour cadence " + enabled_string(hour_cadence_enabled) + ")", "");
}

void SystemLogs::log_shutdown_requested() {
    log_message("SYSTEM_SHUTDOWN: Shutdown requested, waiting for in-flight handlers", "");
}

void SystemLogs::log_shutdown_complete() {
    log_message("SYSTEM_SHUTDOWN: All cadences stopped", "");
}

void SystemLogs::log_logger_totals(unsigned long written_count, unsigned long dropped_count) {
    std::string totals_message = "Log lines written: " + std::to_string(written_count);
    if (dropped_count > 0) {
        totals_message += ", dropped: " + std::to_string(dropped_count);
    }
    log_message(totals_message, "");
}

void SystemLogs::log_initial_backfill_start(size_t instrument_count) {
    log_message("Initial backfill for " + std::to_string(instrument_count) + " assigned instruments", "");
}

void SystemLogs::log_initial_backfill_skipped() {
    log_message("WARNING: No assignments loaded, initial backfill skipped", "");
}

void SystemLogs::log_main_loop_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error in main loop: ") + error_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_logging_context_error() {
    log_message("ERROR: Logging context not initialized - system must fail without context", "");
}

void SystemLogs::log_cadence_stats_table(const SellManager::Threads::CadenceStats& minute_stats,
                                         const SellManager::Threads::CadenceStats& hour_stats, long long uptime_seconds) {
    TABLE_HEADER_48("Cadences", "Run Statistics");
    TABLE_ROW_48("Minute", format_cadence_stats(minute_stats));
    TABLE_ROW_48("Minute Last Fire", format_last_fired(minute_stats));
    TABLE_ROW_48("Hour", format_cadence_stats(hour_stats));
    TABLE_ROW_48("Hour Last Fire", format_last_fired(hour_stats));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Uptime", std::to_string(uptime_seconds) + " seconds");
    TABLE_FOOTER_48();
}
