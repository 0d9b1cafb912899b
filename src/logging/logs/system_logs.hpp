#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>
#include "configs/system_config.hpp"
#include "threads/system_threads/cadence_thread.hpp"

namespace SellManager {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup_configuration(const Config::SystemConfig& config);
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_startup_complete(bool minute_cadence_enabled, bool hour_cadence_enabled);
    static void log_shutdown_requested();
    static void log_shutdown_complete();
    static void log_logger_totals(unsigned long written_count, unsigned long dropped_count);

    // Initial backfill pass before the cadences start
    static void log_initial_backfill_start(size_t instrument_count);
    static void log_initial_backfill_skipped();

    // Main loop
    static void log_main_loop_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
    static void log_logging_context_error();
    static void log_cadence_stats_table(const Threads::CadenceStats& minute_stats, const Threads::CadenceStats& hour_stats,
                                        long long uptime_seconds);
};

} // namespace Logging
} // namespace SellManager

#endif // SYSTEM_LOGS_HPP
