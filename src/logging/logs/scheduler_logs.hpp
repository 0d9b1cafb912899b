#ifndef SCHEDULER_LOGS_HPP
#define SCHEDULER_LOGS_HPP

#include <string>
#include "threads/scheduling/wall_clock.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Logging {

class SchedulerLogs {
public:
    // Thread lifecycle logging
    static void log_cadence_started(const std::string& cadence_name);
    static void log_cadence_stopped(const std::string& cadence_name, unsigned long fired_count, unsigned long skipped_count, unsigned long failed_count);
    static void log_next_fire(const std::string& cadence_name, Threads::WallTime fire_time, Core::CadenceTrigger trigger);

    // Fire outcomes
    static void log_fire_skipped_in_flight(const std::string& cadence_name, Core::CadenceTrigger trigger);
    static void log_fires_missed(const std::string& cadence_name, unsigned long missed_count, Threads::WallTime first_missed_fire);
    static void log_handler_exception(const std::string& cadence_name, Core::CadenceTrigger trigger, const std::string& error_message);
    static void log_handler_duration(const std::string& cadence_name, Core::CadenceTrigger trigger, long long duration_milliseconds);
};

} // namespace Logging
} // namespace SellManager

#endif // SCHEDULER_LOGS_HPP
