#ifndef BACKFILL_CONTROLLER_HPP
#define BACKFILL_CONTROLLER_HPP

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "api/general/broker_interfaces.hpp"
#include "configs/backfill_config.hpp"
#include "request_pacer.hpp"
#include "threads/scheduling/stop_signal.hpp"
#include "trader/cache/bar_cache_store.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "utils/connectivity_manager.hpp"

namespace SellManager {
namespace Core {

struct BackfillRequest {
    std::string instrument_key;
    Granularity granularity;
    int target_count;

    BackfillRequest() : granularity(Granularity::HALF_HOUR), target_count(0) {}
    BackfillRequest(std::string key, Granularity request_granularity, int count)
        : instrument_key(std::move(key)), granularity(request_granularity), target_count(count) {}
};

enum class BackfillStatus {
    COVERED,      // Cache already held the target, no request issued
    FILLED,       // Target reached by fetching
    PARTIAL,      // Start of history reached before the target
    FAILED,
    CANCELLED
};

std::string backfill_status_to_string(BackfillStatus status);

struct BackfillResult {
    std::string instrument_key;
    std::string cache_key;
    BackfillStatus status;
    int target_count;
    int requests_issued;
    size_t bars_fetched;
    size_t final_count;
    std::optional<Timestamp> earliest_changed_timestamp;
    std::string message;

    BackfillResult() : status(BackfillStatus::FAILED), target_count(0), requests_issued(0), bars_fetched(0), final_count(0) {}
};

struct RecentRefreshResult {
    size_t fetched_count;
    MergeResult merge_result;

    RecentRefreshResult() : fetched_count(0) {}
};

/**
 * Fills the bar cache from the historical data source under the broker pacing contract.
 *
 * One instrument is fetched strictly sequentially: a fetch lease is held for the whole
 * coverage walk, so a concurrent refresh of the same instrument waits. Every request passes
 * the global sliding window and the adaptive concurrency gate. Slices walk backward from the
 * oldest cached bar and are merged as soon as they arrive.
 */
class BackfillController {
public:
    BackfillController(API::HistoricalDataSourcePtr data_source, BarCacheStore& cache_store,
                       const Config::BackfillConfig& backfill_config, ConnectivityManager& connectivity_manager,
                       Threads::StopSignal& stop_signal);

    BackfillController(const BackfillController&) = delete;
    BackfillController& operator=(const BackfillController&) = delete;

    BackfillResult ensure_coverage(const BackfillRequest& backfill_request);

    // Instruments run concurrently on a bounded pool; results keep request order.
    std::vector<BackfillResult> ensure_coverage_all(const std::vector<BackfillRequest>& backfill_requests);

    // Short fetch ending now. When the window does not reach the newest cached bar, further
    // slices walk back from the window start until they do. Throws BrokerConnectionError,
    // TransientNetworkError or PacingViolationError once retries are spent.
    RecentRefreshResult refresh_recent(const std::string& instrument_key, Granularity granularity, int max_count);

    bool is_history_exhausted(const std::string& cache_key) const;

    const SlidingWindowRateLimiter& get_rate_limiter() const { return rate_limiter; }
    const AdaptiveConcurrencyGate& get_concurrency_gate() const { return concurrency_gate; }
    InstrumentFetchGuard& get_fetch_guard() { return fetch_guard; }

private:
    API::HistoricalDataSourcePtr historical_data_source;
    BarCacheStore& cache;
    Config::BackfillConfig config;
    ConnectivityManager& connectivity;
    Threads::StopSignal& stop;

    SlidingWindowRateLimiter rate_limiter;
    AdaptiveConcurrencyGate concurrency_gate;
    InstrumentFetchGuard fetch_guard;

    mutable std::mutex exhausted_mutex;
    std::set<std::string> exhausted_cache_keys;

    BackfillResult ensure_coverage_locked(const BackfillRequest& backfill_request);

    // nullopt when shutdown interrupted the fetch.
    std::optional<Series> fetch_slice_with_retry(const HistoricalBarsRequest& bars_request, int& requests_issued);

    long long transient_backoff_milliseconds(int attempt_number) const;
    void mark_exhausted(const std::string& cache_key);
};

} // namespace Core
} // namespace SellManager

#endif // BACKFILL_CONTROLLER_HPP
