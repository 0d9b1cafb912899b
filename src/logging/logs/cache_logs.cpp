#include "cache_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager::Logging;

void CacheLogs::log_cache_directory(const std::string& cache_directory) {
    log_message("Bar cache directory: " + cache_directory, "");
}

void CacheLogs::log_cache_corruption(const std::string& cache_key, const std::string& error_message) {
    log_message("ERROR: Cache key " + cache_key + " skipped this cycle: " + error_message, "");
}

void CacheLogs::log_aggregation_result(const std::string& instrument_key, const SellManager::Core::MergeResult& hourly_merge_result) {
    if (!hourly_merge_result.changed()) {
        return;
    }
    std::string aggregation_line = "Aggregated " + instrument_key + " 1h: " + std::to_string(hourly_merge_result.inserted_count) +
                                   " new, " + std::to_string(hourly_merge_result.replaced_count) + " updated";
    if (hourly_merge_result.earliest_changed_timestamp) {
        aggregation_line += " from " + TimeUtils::format_epoch_iso_utc(*hourly_merge_result.earliest_changed_timestamp);
    }
    log_message(aggregation_line, "");
}
