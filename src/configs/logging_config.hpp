// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace SellManager {
namespace Config {

struct LoggingConfig {
    std::string log_file = "sell_manager.log";
    std::string runtime_logs_directory = "runtime_logs";
    int logging_poll_interval_milliseconds = 200;   // Logging thread flush cadence
    bool log_status_table = true;                   // Render the status board after each minute tick
    bool console_output = true;                     // Echo log lines to stdout as well as the run log
    int max_queued_lines = 10000;                   // Oldest lines are dropped beyond this
};

} // namespace Config
} // namespace SellManager

#endif // LOGGING_CONFIG_HPP
