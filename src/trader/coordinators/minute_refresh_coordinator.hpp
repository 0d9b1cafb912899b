#ifndef MINUTE_REFRESH_COORDINATOR_HPP
#define MINUTE_REFRESH_COORDINATOR_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "api/general/broker_interfaces.hpp"
#include "configs/system_config.hpp"
#include "status_board.hpp"
#include "threads/scheduling/stop_signal.hpp"
#include "trader/assignments/assignment_store.hpp"
#include "trader/cache/bar_cache_store.hpp"
#include "trader/market_data/backfill_controller.hpp"
#include "trader/market_data/bar_aggregator.hpp"
#include "trader/strategy_analysis/indicator_cache.hpp"
#include "utils/connectivity_manager.hpp"

namespace SellManager {
namespace Core {

struct MinuteTickSummary {
    bool assignments_reloaded = false;
    bool positions_refreshed = false;
    size_t refreshed_count = 0;
    size_t failed_count = 0;
    size_t skipped_count = 0;
};

// Collaborators shared by the minute refresh handler.
struct MinuteRefreshDependencies {
    BackfillController& backfill_controller;
    BarCacheStore& cache_store;
    IndicatorCache& indicator_cache;
    const BarAggregator& bar_aggregator;
    AssignmentRegistry& assignment_registry;
    AssignmentStore& assignment_store;
    API::PositionSourcePtr position_source;
    ConnectivityManager& connectivity_manager;
    StatusBoard& status_board;
};

/**
 * Minute cadence handler.
 *
 * Picks up a pending assignment reload, refreshes positions best effort, then for each
 * assigned instrument tops up history, pulls the recent window, re-aggregates hourly bars,
 * advances the indicator and refreshes the status board. Instruments fail independently.
 */
class MinuteRefreshCoordinator {
public:
    MinuteRefreshCoordinator(const MinuteRefreshDependencies& dependencies, const Config::SystemConfig& system_config,
                             Threads::StopSignal& stop_signal);

    MinuteRefreshCoordinator(const MinuteRefreshCoordinator&) = delete;
    MinuteRefreshCoordinator& operator=(const MinuteRefreshCoordinator&) = delete;

    MinuteTickSummary run_tick(Timestamp tick_time);

    // Loads the assignment file and publishes it; the previous book stays on failure.
    bool reload_assignments();

    // Backfill targets for one assignment, on the granularity that is fetched.
    BackfillRequest coverage_request_for(const Assignment& assignment) const;

    std::optional<Position> last_known_position(const std::string& instrument_key) const;

private:
    MinuteRefreshDependencies deps;
    const Config::SystemConfig& config;
    Threads::StopSignal& stop;

    mutable std::mutex positions_mutex;
    std::map<std::string, Position> positions_by_instrument;

    bool refresh_positions();
    void refresh_instrument(const Assignment& assignment, Timestamp tick_time);
};

} // namespace Core
} // namespace SellManager

#endif // MINUTE_REFRESH_COORDINATOR_HPP
