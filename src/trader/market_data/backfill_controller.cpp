#include "backfill_controller.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/backfill_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

namespace SellManager {
namespace Core {

using Logging::BackfillLogs;

namespace {

void accumulate_merge_result(MergeResult& total_result, const MergeResult& slice_result) {
    total_result.inserted_count += slice_result.inserted_count;
    total_result.replaced_count += slice_result.replaced_count;
    if (slice_result.earliest_changed_timestamp &&
        (!total_result.earliest_changed_timestamp || *slice_result.earliest_changed_timestamp < *total_result.earliest_changed_timestamp)) {
        total_result.earliest_changed_timestamp = slice_result.earliest_changed_timestamp;
    }
    total_result.bar_count = slice_result.bar_count;
    total_result.first_timestamp = slice_result.first_timestamp;
    total_result.last_timestamp = slice_result.last_timestamp;
}

} // namespace

std::string backfill_status_to_string(BackfillStatus status) {
    switch (status) {
        case BackfillStatus::COVERED:
            return "COVERED";
        case BackfillStatus::FILLED:
            return "FILLED";
        case BackfillStatus::PARTIAL:
            return "PARTIAL";
        case BackfillStatus::FAILED:
            return "FAILED";
        case BackfillStatus::CANCELLED:
            return "CANCELLED";
    }
    return "FAILED";
}

BackfillController::BackfillController(API::HistoricalDataSourcePtr data_source, BarCacheStore& cache_store,
                                       const Config::BackfillConfig& backfill_config, ConnectivityManager& connectivity_manager,
                                       Threads::StopSignal& stop_signal)
    : historical_data_source(std::move(data_source)), cache(cache_store), config(backfill_config),
      connectivity(connectivity_manager), stop(stop_signal),
      rate_limiter(backfill_config.rate_limit_max_requests, std::chrono::milliseconds(backfill_config.rate_limit_window_milliseconds)),
      concurrency_gate(backfill_config.worker_pool_size, backfill_config.concurrency_recovery_successes) {
    if (!historical_data_source) {
        throw std::invalid_argument("BackfillController requires a historical data source");
    }
}

BackfillResult BackfillController::ensure_coverage(const BackfillRequest& backfill_request) {
    InstrumentFetchGuard::Lease instrument_lease(fetch_guard, backfill_request.instrument_key);
    BackfillResult backfill_result = ensure_coverage_locked(backfill_request);
    if (backfill_result.status != BackfillStatus::COVERED) {
        BackfillLogs::log_coverage_result(backfill_result);
    }
    return backfill_result;
}

BackfillResult BackfillController::ensure_coverage_locked(const BackfillRequest& backfill_request) {
    BackfillResult backfill_result;
    backfill_result.instrument_key = backfill_request.instrument_key;
    backfill_result.cache_key = make_cache_key(backfill_request.instrument_key, backfill_request.granularity);
    backfill_result.target_count = backfill_request.target_count;

    SeriesExtent series_extent;
    try {
        series_extent = cache.describe(backfill_result.cache_key);
    } catch (const CacheCorruptionError& corruption_error) {
        backfill_result.status = BackfillStatus::FAILED;
        backfill_result.message = corruption_error.what();
        return backfill_result;
    }
    backfill_result.final_count = series_extent.bar_count;

    size_t target_bar_count = backfill_request.target_count > 0 ? static_cast<size_t>(backfill_request.target_count) : 0;
    if (series_extent.bar_count >= target_bar_count) {
        backfill_result.status = BackfillStatus::COVERED;
        BackfillLogs::log_coverage_already_satisfied(backfill_result.cache_key, series_extent.bar_count, backfill_request.target_count);
        return backfill_result;
    }
    if (is_history_exhausted(backfill_result.cache_key)) {
        backfill_result.status = BackfillStatus::PARTIAL;
        backfill_result.message = "history exhausted";
        BackfillLogs::log_known_exhausted(backfill_result.cache_key, series_extent.bar_count, backfill_request.target_count);
        return backfill_result;
    }

    BackfillLogs::log_coverage_start(backfill_result.cache_key, series_extent.bar_count, backfill_request.target_count);

    while (series_extent.bar_count < target_bar_count) {
        if (stop.stop_requested()) {
            backfill_result.status = BackfillStatus::CANCELLED;
            BackfillLogs::log_cancelled(backfill_request.instrument_key);
            return backfill_result;
        }

        size_t missing_bar_count = target_bar_count - series_extent.bar_count;
        HistoricalBarsRequest bars_request;
        bars_request.instrument_key = backfill_request.instrument_key;
        bars_request.granularity = backfill_request.granularity;
        bars_request.end_time = series_extent.first_timestamp ? *series_extent.first_timestamp : 0;
        bars_request.max_count = static_cast<int>(std::min(missing_bar_count, static_cast<size_t>(config.slice_size)));
        bars_request.timeout_seconds = config.request_timeout_seconds;

        std::optional<Series> slice_bars;
        try {
            slice_bars = fetch_slice_with_retry(bars_request, backfill_result.requests_issued);
        } catch (const std::exception& fetch_error) {
            backfill_result.status = BackfillStatus::FAILED;
            backfill_result.message = fetch_error.what();
            return backfill_result;
        }
        if (!slice_bars) {
            backfill_result.status = BackfillStatus::CANCELLED;
            BackfillLogs::log_cancelled(backfill_request.instrument_key);
            return backfill_result;
        }

        MergeResult merge_result;
        try {
            merge_result = cache.merge(backfill_result.cache_key, *slice_bars);
        } catch (const std::exception& merge_error) {
            backfill_result.status = BackfillStatus::FAILED;
            backfill_result.message = merge_error.what();
            return backfill_result;
        }
        backfill_result.bars_fetched += slice_bars->size();
        if (merge_result.earliest_changed_timestamp &&
            (!backfill_result.earliest_changed_timestamp || *merge_result.earliest_changed_timestamp < *backfill_result.earliest_changed_timestamp)) {
            backfill_result.earliest_changed_timestamp = merge_result.earliest_changed_timestamp;
        }

        size_t previous_count = series_extent.bar_count;
        series_extent.bar_count = merge_result.bar_count;
        series_extent.first_timestamp = merge_result.first_timestamp;
        series_extent.last_timestamp = merge_result.last_timestamp;
        backfill_result.final_count = merge_result.bar_count;
        BackfillLogs::log_slice_received(backfill_result.cache_key, bars_request.max_count, slice_bars->size(), merge_result.bar_count);

        bool short_slice = slice_bars->size() < static_cast<size_t>(bars_request.max_count);
        bool made_progress = merge_result.bar_count > previous_count;
        if (series_extent.bar_count < target_bar_count && (short_slice || !made_progress)) {
            mark_exhausted(backfill_result.cache_key);
            backfill_result.status = BackfillStatus::PARTIAL;
            backfill_result.message = "history exhausted";
            BackfillLogs::log_history_exhausted(backfill_result.cache_key, series_extent.bar_count, backfill_request.target_count);
            return backfill_result;
        }
    }

    backfill_result.status = BackfillStatus::FILLED;
    return backfill_result;
}

std::vector<BackfillResult> BackfillController::ensure_coverage_all(const std::vector<BackfillRequest>& backfill_requests) {
    std::vector<BackfillResult> backfill_results(backfill_requests.size());
    if (backfill_requests.empty()) {
        return backfill_results;
    }

    // Request indices grouped per instrument, in first-seen order.
    std::vector<std::vector<size_t>> instrument_groups;
    std::map<std::string, size_t> group_index_by_instrument;
    for (size_t request_index = 0; request_index < backfill_requests.size(); ++request_index) {
        const std::string& instrument_key = backfill_requests[request_index].instrument_key;
        auto group_iterator = group_index_by_instrument.find(instrument_key);
        if (group_iterator == group_index_by_instrument.end()) {
            group_index_by_instrument[instrument_key] = instrument_groups.size();
            instrument_groups.push_back({request_index});
        } else {
            instrument_groups[group_iterator->second].push_back(request_index);
        }
    }

    size_t worker_count = std::min(instrument_groups.size(), static_cast<size_t>(std::max(1, config.worker_pool_size)));
    BackfillLogs::log_batch_start(backfill_requests.size(), instrument_groups.size(), worker_count);

    Logging::LoggingContext* parent_logging_context_ptr = Logging::find_logging_context();

    std::atomic<size_t> next_group_index{0};
    auto worker_loop = [&]() {
        if (parent_logging_context_ptr) {
            Logging::set_logging_context(*parent_logging_context_ptr);
        }
        while (true) {
            size_t group_index = next_group_index.fetch_add(1);
            if (group_index >= instrument_groups.size()) {
                return;
            }
            for (size_t request_index : instrument_groups[group_index]) {
                const BackfillRequest& backfill_request = backfill_requests[request_index];
                if (stop.stop_requested()) {
                    backfill_results[request_index].instrument_key = backfill_request.instrument_key;
                    backfill_results[request_index].cache_key = make_cache_key(backfill_request.instrument_key, backfill_request.granularity);
                    backfill_results[request_index].target_count = backfill_request.target_count;
                    backfill_results[request_index].status = BackfillStatus::CANCELLED;
                    continue;
                }
                try {
                    backfill_results[request_index] = ensure_coverage(backfill_request);
                } catch (const std::exception& coverage_error) {
                    backfill_results[request_index].instrument_key = backfill_request.instrument_key;
                    backfill_results[request_index].cache_key = make_cache_key(backfill_request.instrument_key, backfill_request.granularity);
                    backfill_results[request_index].target_count = backfill_request.target_count;
                    backfill_results[request_index].status = BackfillStatus::FAILED;
                    backfill_results[request_index].message = coverage_error.what();
                }
            }
        }
    };

    std::vector<std::thread> worker_threads;
    worker_threads.reserve(worker_count);
    for (size_t worker_index = 0; worker_index < worker_count; ++worker_index) {
        worker_threads.emplace_back(worker_loop);
    }
    for (auto& worker_thread : worker_threads) {
        worker_thread.join();
    }

    BackfillLogs::log_batch_summary(backfill_results);
    return backfill_results;
}

RecentRefreshResult BackfillController::refresh_recent(const std::string& instrument_key, Granularity granularity, int max_count) {
    InstrumentFetchGuard::Lease instrument_lease(fetch_guard, instrument_key);

    HistoricalBarsRequest bars_request;
    bars_request.instrument_key = instrument_key;
    bars_request.granularity = granularity;
    bars_request.end_time = 0;
    bars_request.max_count = max_count;
    bars_request.timeout_seconds = config.request_timeout_seconds;

    std::string cache_key = make_cache_key(instrument_key, granularity);
    std::optional<Timestamp> cached_last_timestamp = cache.describe(cache_key).last_timestamp;

    RecentRefreshResult refresh_result;
    int requests_issued = 0;
    std::optional<Series> recent_bars = fetch_slice_with_retry(bars_request, requests_issued);
    if (!recent_bars) {
        return refresh_result;
    }

    refresh_result.fetched_count = recent_bars->size();
    refresh_result.merge_result = cache.merge(cache_key, *recent_bars);

    // A full window that starts after the cached tail leaves a hole; walk back until it closes.
    bool window_is_full = max_count > 0 && recent_bars->size() >= static_cast<size_t>(max_count);
    if (cached_last_timestamp && window_is_full && recent_bars->front().timestamp > *cached_last_timestamp) {
        BackfillLogs::log_refresh_gap(cache_key, *cached_last_timestamp, recent_bars->front().timestamp);
        Timestamp gap_end_time = recent_bars->front().timestamp;
        while (!stop.stop_requested()) {
            HistoricalBarsRequest gap_request = bars_request;
            gap_request.end_time = gap_end_time;
            gap_request.max_count = config.slice_size;

            std::optional<Series> gap_bars = fetch_slice_with_retry(gap_request, requests_issued);
            if (!gap_bars || gap_bars->empty()) {
                break;
            }
            MergeResult gap_merge_result = cache.merge(cache_key, *gap_bars);
            accumulate_merge_result(refresh_result.merge_result, gap_merge_result);
            refresh_result.fetched_count += gap_bars->size();

            bool reached_cache = gap_bars->front().timestamp <= *cached_last_timestamp;
            bool short_slice = gap_bars->size() < static_cast<size_t>(gap_request.max_count);
            if (reached_cache || short_slice) {
                break;
            }
            gap_end_time = gap_bars->front().timestamp;
        }
    }

    BackfillLogs::log_refresh_result(cache_key, refresh_result.fetched_count, refresh_result.merge_result.inserted_count,
                                     refresh_result.merge_result.replaced_count);
    return refresh_result;
}

bool BackfillController::is_history_exhausted(const std::string& cache_key) const {
    std::lock_guard<std::mutex> lock(exhausted_mutex);
    return exhausted_cache_keys.count(cache_key) > 0;
}

void BackfillController::mark_exhausted(const std::string& cache_key) {
    std::lock_guard<std::mutex> lock(exhausted_mutex);
    exhausted_cache_keys.insert(cache_key);
}

long long BackfillController::transient_backoff_milliseconds(int attempt_number) const {
    long long backoff_milliseconds = config.backoff_base_milliseconds;
    for (int doubling_index = 1; doubling_index < attempt_number && backoff_milliseconds < config.backoff_max_milliseconds; ++doubling_index) {
        backoff_milliseconds *= 2;
    }
    return std::min(backoff_milliseconds, static_cast<long long>(config.backoff_max_milliseconds));
}

std::optional<Series> BackfillController::fetch_slice_with_retry(const HistoricalBarsRequest& bars_request, int& requests_issued) {
    std::string last_error_message;

    for (int attempt_number = 1; attempt_number <= config.max_attempts_per_slice; ++attempt_number) {
        long long backoff_milliseconds = 0;
        {
            ConcurrencyPermit concurrency_permit(concurrency_gate, stop);
            if (!concurrency_permit.is_acquired() || !rate_limiter.acquire(stop)) {
                return std::nullopt;
            }

            try {
                ++requests_issued;
                Series fetched_bars = historical_data_source->get_historical_bars(bars_request);
                concurrency_gate.on_success();
                connectivity.report_success();
                return fetched_bars;
            } catch (const PacingViolationError& pacing_error) {
                concurrency_gate.on_pacing_violation();
                backoff_milliseconds = std::min(transient_backoff_milliseconds(attempt_number) * config.pacing_backoff_multiplier,
                                                static_cast<long long>(config.backoff_max_milliseconds));
                last_error_message = pacing_error.what();
                BackfillLogs::log_pacing_violation(bars_request.instrument_key, concurrency_gate.effective_limit(), backoff_milliseconds, last_error_message);
            } catch (const BrokerConnectionError& connection_error) {
                connectivity.report_failure(connection_error.what());
                BackfillLogs::log_connection_lost(bars_request.instrument_key, connection_error.what());
                throw;
            } catch (const std::exception& fetch_error) {
                backoff_milliseconds = transient_backoff_milliseconds(attempt_number);
                last_error_message = fetch_error.what();
                BackfillLogs::log_transient_failure(bars_request.instrument_key, attempt_number, config.max_attempts_per_slice,
                                                    backoff_milliseconds, last_error_message);
            }
        }

        // Permit released; backoff does not hold concurrency.
        if (attempt_number == config.max_attempts_per_slice) {
            break;
        }
        if (stop.wait_for(std::chrono::milliseconds(backoff_milliseconds))) {
            return std::nullopt;
        }
    }

    BackfillLogs::log_attempts_exhausted(bars_request.instrument_key, config.max_attempts_per_slice);
    throw TransientNetworkError("Fetch for " + bars_request.instrument_key + " failed after " +
                                std::to_string(config.max_attempts_per_slice) + " attempts: " + last_error_message);
}

} // namespace Core
} // namespace SellManager
