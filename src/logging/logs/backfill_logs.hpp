#ifndef BACKFILL_LOGS_HPP
#define BACKFILL_LOGS_HPP

#include <string>
#include <vector>
#include "trader/market_data/backfill_controller.hpp"

namespace SellManager {
namespace Logging {

class BackfillLogs {
public:
    // Coverage lifecycle
    static void log_coverage_already_satisfied(const std::string& cache_key, size_t cached_count, int target_count);
    static void log_coverage_start(const std::string& cache_key, size_t cached_count, int target_count);
    static void log_slice_received(const std::string& cache_key, int requested_count, size_t received_count, size_t merged_count);
    static void log_history_exhausted(const std::string& cache_key, size_t final_count, int target_count);
    static void log_known_exhausted(const std::string& cache_key, size_t cached_count, int target_count);
    static void log_coverage_result(const Core::BackfillResult& backfill_result);

    // Retry and pacing
    static void log_transient_failure(const std::string& instrument_key, int attempt_number, int max_attempts, long long backoff_milliseconds, const std::string& error_message);
    static void log_pacing_violation(const std::string& instrument_key, int effective_limit, long long backoff_milliseconds, const std::string& error_message);
    static void log_connection_lost(const std::string& instrument_key, const std::string& error_message);
    static void log_attempts_exhausted(const std::string& instrument_key, int max_attempts);
    static void log_cancelled(const std::string& instrument_key);

    // Batch
    static void log_batch_start(size_t request_count, size_t instrument_count, size_t worker_count);
    static void log_batch_summary(const std::vector<Core::BackfillResult>& backfill_results);
    static void log_refresh_result(const std::string& cache_key, size_t fetched_count, size_t inserted_count, size_t replaced_count);
    static void log_refresh_gap(const std::string& cache_key, Core::Timestamp cached_last_timestamp, Core::Timestamp window_first_timestamp);
};

} // namespace Logging
} // namespace SellManager

#endif // BACKFILL_LOGS_HPP
