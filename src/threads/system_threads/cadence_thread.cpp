/**
 * Cadence timer thread.
 * Sleeps until the next wall-clock aligned fire and runs its handler to completion.
 */
#include "cadence_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/scheduler_logs.hpp"
#include <stdexcept>

using namespace SellManager::Threads;
using namespace SellManager::Logging;
using SellManager::Core::CadenceTrigger;

namespace {
    // Clears the in-flight flag however the handler exits.
    struct InFlightRelease {
        std::atomic<bool>& flag;
        ~InFlightRelease() { flag.store(false); }
    };
}

CadenceTimer::CadenceTimer(std::string cadence_name, std::string thread_tag, WallClock& wall_clock,
                           NextFireFunction next_fire_function, CadenceHandler cadence_handler, StopSignal& stop_signal)
    : name(std::move(cadence_name)), tag(std::move(thread_tag)), clock(wall_clock),
      next_fire(std::move(next_fire_function)), handler(std::move(cadence_handler)), stop(stop_signal) {
    if (!next_fire || !handler) {
        throw std::invalid_argument("Cadence '" + name + "' requires a schedule and a handler");
    }
}

CadenceTimer::~CadenceTimer() {
    if (timer_thread.joinable()) {
        stop.request_stop();
        timer_thread.join();
    }
}

void CadenceTimer::start() {
    if (timer_thread.joinable()) {
        throw std::runtime_error("Cadence '" + name + "' already started");
    }
    LoggingContext* parent_logging_context_ptr = find_logging_context();
    timer_thread = std::thread([this, parent_logging_context_ptr]() {
        if (parent_logging_context_ptr) {
            set_logging_context(*parent_logging_context_ptr);
            set_log_thread_tag(tag);
        }
        (*this)();
    });
}

void CadenceTimer::join() {
    if (timer_thread.joinable()) {
        timer_thread.join();
    }
}

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void CadenceTimer::operator()() {
    SchedulerLogs::log_cadence_started(name);
    try {
        execute_timer_loop();
    } catch (const std::exception& exception) {
        SchedulerLogs::log_handler_exception(name, CadenceTrigger::MANUAL, std::string("timer loop: ") + exception.what());
    }
    CadenceStats final_stats = get_stats();
    SchedulerLogs::log_cadence_stopped(name, final_stats.fired_count, final_stats.skipped_count, final_stats.failed_count);
}

void CadenceTimer::execute_timer_loop() {
    while (!stop.stop_requested()) {
        CadenceFire upcoming_fire = next_fire(clock.now());
        if (!clock.sleep_until(upcoming_fire.fire_time, stop)) {
            return;
        }

        if (!execute_fire(upcoming_fire.trigger, upcoming_fire.fire_time)) {
            continue;
        }
        count_missed_fires(upcoming_fire.fire_time);

        if (iteration_counter) {
            iteration_counter->fetch_add(1);
        }
    }
}

bool CadenceTimer::trigger_now() {
    return execute_fire(CadenceTrigger::MANUAL, clock.now());
}

bool CadenceTimer::execute_fire(CadenceTrigger trigger, WallTime nominal_fire_time) {
    bool expected_idle = false;
    if (!in_flight.compare_exchange_strong(expected_idle, true)) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            ++stats.skipped_count;
        }
        SchedulerLogs::log_fire_skipped_in_flight(name, trigger);
        return false;
    }

    InFlightRelease in_flight_release{in_flight};
    {
        std::lock_guard<std::mutex> lock(stats_mutex);
        ++stats.fired_count;
        stats.last_fired = nominal_fire_time;
    }

    auto handler_start = std::chrono::steady_clock::now();
    try {
        handler(trigger, nominal_fire_time);
    } catch (const std::exception& exception) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            ++stats.failed_count;
        }
        SchedulerLogs::log_handler_exception(name, trigger, exception.what());
    }
    auto handler_duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - handler_start);
    SchedulerLogs::log_handler_duration(name, trigger, handler_duration.count());
    return true;
}

void CadenceTimer::count_missed_fires(WallTime handled_fire_time) {
    WallTime current_time = clock.now();
    unsigned long missed_count = 0;
    CadenceFire missed_fire = next_fire(handled_fire_time);
    WallTime first_missed_time = missed_fire.fire_time;
    while (missed_fire.fire_time <= current_time) {
        ++missed_count;
        missed_fire = next_fire(missed_fire.fire_time);
    }
    if (missed_count == 0) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex);
        stats.skipped_count += missed_count;
    }
    SchedulerLogs::log_fires_missed(name, missed_count, first_missed_time);
}

CadenceStats CadenceTimer::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex);
    return stats;
}
