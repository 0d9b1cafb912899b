#include "scheduler_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager::Logging;
using SellManager::Core::CadenceTrigger;
using SellManager::Core::cadence_trigger_to_string;

namespace {
    std::string format_wall_time(SellManager::Threads::WallTime wall_time) {
        return TimeUtils::format_epoch_iso_utc(TimeUtils::time_point_to_epoch_seconds(wall_time));
    }
}

void SchedulerLogs::log_cadence_started(const std::string& cadence_name) {
    log_message("Cadence '" + cadence_name + "' started", "");
}

void SchedulerLogs::log_cadence_stopped(const std::string& cadence_name, unsigned long fired_count, unsigned long skipped_count, unsigned long failed_count) {
    log_message("Cadence '" + cadence_name + "' stopped: fired=" + std::to_string(fired_count) + " skipped=" +
                std::to_string(skipped_count) + " failed=" + std::to_string(failed_count), "");
}

void SchedulerLogs::log_next_fire(const std::string& cadence_name, SellManager::Threads::WallTime fire_time, CadenceTrigger trigger) {
    log_message("Cadence '" + cadence_name + "' next fire " + format_wall_time(fire_time) + " (" + cadence_trigger_to_string(trigger) + ")", "");
}

void SchedulerLogs::log_fire_skipped_in_flight(const std::string& cadence_name, CadenceTrigger trigger) {
    log_message("WARNING: Cadence '" + cadence_name + "' " + cadence_trigger_to_string(trigger) + " fire skipped, previous run still in flight", "");
}

void SchedulerLogs::log_fires_missed(const std::string& cadence_name, unsigned long missed_count, SellManager::Threads::WallTime first_missed_fire) {
    log_message("WARNING: Cadence '" + cadence_name + "' skipped " + std::to_string(missed_count) + " fire(s) from " +
                format_wall_time(first_missed_fire) + " while the handler was running", "");
}

void SchedulerLogs::log_handler_exception(const std::string& cadence_name, CadenceTrigger trigger, const std::string& error_message) {
    log_message("ERROR: Cadence '" + cadence_name + "' " + cadence_trigger_to_string(trigger) + " handler failed: " + error_message, "");
}

void SchedulerLogs::log_handler_duration(const std::string& cadence_name, CadenceTrigger trigger, long long duration_milliseconds) {
    log_message("Cadence '" + cadence_name + "' " + cadence_trigger_to_string(trigger) + " completed in " +
                std::to_string(duration_milliseconds) + "ms", "");
}
