#ifndef STATUS_LOGS_HPP
#define STATUS_LOGS_HPP

#include <string>
#include <vector>
#include "trader/coordinators/status_board.hpp"

namespace SellManager {
namespace Logging {

class StatusLogs {
public:
    // Minute tick
    static void log_minute_tick_start(size_t instrument_count, bool assignments_reloaded);
    static void log_positions_unavailable(const std::string& error_message);
    static void log_connectivity_paused(const std::string& instrument_key, const std::string& status_string, int seconds_until_retry);
    static void log_instrument_refresh_failed(const std::string& instrument_key, const std::string& error_message);
    static void log_minute_tick_summary(size_t refreshed_count, size_t failed_count, size_t skipped_count);

    static void log_status_table(const std::vector<Core::StatusRow>& status_rows);
    static std::string format_status_value(const Core::StatusRow& status_row);
};

} // namespace Logging
} // namespace SellManager

#endif // STATUS_LOGS_HPP
