#ifndef CADENCE_THREAD_HPP
#define CADENCE_THREAD_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "threads/scheduling/cadence_schedule.hpp"
#include "threads/scheduling/stop_signal.hpp"
#include "threads/scheduling/wall_clock.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Threads {

using NextFireFunction = std::function<CadenceFire(WallTime)>;
using CadenceHandler = std::function<void(Core::CadenceTrigger, WallTime)>;

struct CadenceStats {
    unsigned long fired_count = 0;
    unsigned long skipped_count = 0;
    unsigned long failed_count = 0;
    std::optional<WallTime> last_fired;
};

/**
 * Wall-clock aligned timer thread running one handler.
 *
 * The next fire is always computed from the current clock, so a slow handler never causes
 * drift. Runs of the same timer never overlap: nominal fires passed while the handler runs
 * are counted as skipped, and trigger_now() during a run is skipped too.
 */
class CadenceTimer {
public:
    CadenceTimer(std::string cadence_name, std::string thread_tag, WallClock& wall_clock,
                 NextFireFunction next_fire_function, CadenceHandler cadence_handler, StopSignal& stop_signal);
    ~CadenceTimer();

    CadenceTimer(const CadenceTimer&) = delete;
    CadenceTimer& operator=(const CadenceTimer&) = delete;

    void start();
    // Waits for the timer thread; the current handler run completes first.
    void join();

    // Runs the handler on the calling thread; false when a run was already in flight.
    bool trigger_now();

    CadenceStats get_stats() const;
    bool is_in_flight() const { return in_flight.load(); }
    const std::string& get_name() const { return name; }

    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }

private:
    std::string name;
    std::string tag;
    WallClock& clock;
    NextFireFunction next_fire;
    CadenceHandler handler;
    StopSignal& stop;

    std::thread timer_thread;
    std::atomic<bool> in_flight{false};
    mutable std::mutex stats_mutex;
    CadenceStats stats;
    std::atomic<unsigned long>* iteration_counter{nullptr};

    void operator()();
    void execute_timer_loop();
    bool execute_fire(Core::CadenceTrigger trigger, WallTime nominal_fire_time);
    void count_missed_fires(WallTime handled_fire_time);
};

} // namespace Threads
} // namespace SellManager

#endif // CADENCE_THREAD_HPP
