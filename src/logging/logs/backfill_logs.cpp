#include "backfill_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager::Logging;
using namespace SellManager::Core;

void BackfillLogs::log_coverage_already_satisfied(const std::string& cache_key, size_t cached_count, int target_count) {
    log_message("Backfill " + cache_key + ": covered (" + std::to_string(cached_count) + "/" + std::to_string(target_count) + " bars), no fetch", "");
}

void BackfillLogs::log_coverage_start(const std::string& cache_key, size_t cached_count, int target_count) {
    LOG_THREAD_BACKFILL_HEADER();
    LOG_THREAD_CONTENT("Cache key: " + cache_key);
    LOG_THREAD_CONTENT("Cached bars: " + std::to_string(cached_count));
    LOG_THREAD_CONTENT("Target bars: " + std::to_string(target_count));
    LOG_THREAD_SECTION_FOOTER();
}

void BackfillLogs::log_slice_received(const std::string& cache_key, int requested_count, size_t received_count, size_t merged_count) {
    log_message("Backfill " + cache_key + ": slice " + std::to_string(received_count) + "/" + std::to_string(requested_count) +
                " bars, cache now " + std::to_string(merged_count), "");
}

void BackfillLogs::log_history_exhausted(const std::string& cache_key, size_t final_count, int target_count) {
    log_message("WARNING: Backfill " + cache_key + ": start of history reached at " + std::to_string(final_count) + "/" +
                std::to_string(target_count) + " bars (partial coverage)", "");
}

void BackfillLogs::log_known_exhausted(const std::string& cache_key, size_t cached_count, int target_count) {
    log_message("Backfill " + cache_key + ": history already exhausted at " + std::to_string(cached_count) + "/" +
                std::to_string(target_count) + " bars, not re-requesting", "");
}

void BackfillLogs::log_coverage_result(const BackfillResult& backfill_result) {
    std::string result_line = "Backfill " + backfill_result.cache_key + ": " + backfill_status_to_string(backfill_result.status) +
                              " requests=" + std::to_string(backfill_result.requests_issued) +
                              " fetched=" + std::to_string(backfill_result.bars_fetched) +
                              " cached=" + std::to_string(backfill_result.final_count);
    if (!backfill_result.message.empty()) {
        result_line += " (" + backfill_result.message + ")";
    }
    log_message(result_line, "");
}

void BackfillLogs::log_transient_failure(const std::string& instrument_key, int attempt_number, int max_attempts, long long backoff_milliseconds, const std::string& error_message) {
    log_message("WARNING: Fetch for " + instrument_key + " failed (attempt " + std::to_string(attempt_number) + "/" +
                std::to_string(max_attempts) + "), retrying in " + std::to_string(backoff_milliseconds) + "ms: " + error_message, "");
}

void BackfillLogs::log_pacing_violation(const std::string& instrument_key, int effective_limit, long long backoff_milliseconds, const std::string& error_message) {
    TABLE_HEADER_48("PACING VIOLATION", "Broker rejected request rate");
    TABLE_ROW_48("Instrument", instrument_key);
    TABLE_ROW_48("Concurrency", std::to_string(effective_limit) + " permits");
    TABLE_ROW_48("Backoff", std::to_string(backoff_milliseconds) + " ms");
    TABLE_ROW_48("Error", error_message);
    TABLE_FOOTER_48();
}

void BackfillLogs::log_connection_lost(const std::string& instrument_key, const std::string& error_message) {
    log_message("ERROR: Broker connection lost while fetching " + instrument_key + ": " + error_message, "");
}

void BackfillLogs::log_attempts_exhausted(const std::string& instrument_key, int max_attempts) {
    log_message("ERROR: Fetch for " + instrument_key + " gave up after " + std::to_string(max_attempts) + " attempts", "");
}

void BackfillLogs::log_cancelled(const std::string& instrument_key) {
    log_message("Backfill for " + instrument_key + " cancelled by shutdown", "");
}

void BackfillLogs::log_batch_start(size_t request_count, size_t instrument_count, size_t worker_count) {
    LOG_THREAD_BACKFILL_HEADER();
    LOG_THREAD_CONTENT("Requests: " + std::to_string(request_count));
    LOG_THREAD_CONTENT("Instruments: " + std::to_string(instrument_count));
    LOG_THREAD_CONTENT("Workers: " + std::to_string(worker_count));
    LOG_THREAD_SECTION_FOOTER();
}

void BackfillLogs::log_batch_summary(const std::vector<BackfillResult>& backfill_results) {
    TABLE_HEADER_48("BACKFILL", "Coverage Summary");
    for (const auto& backfill_result : backfill_results) {
        TABLE_ROW_48(backfill_result.cache_key, backfill_status_to_string(backfill_result.status) + "  " +
                     std::to_string(backfill_result.final_count) + "/" + std::to_string(backfill_result.target_count) + " bars");
    }
    TABLE_FOOTER_48();
}

void BackfillLogs::log_refresh_result(const std::string& cache_key, size_t fetched_count, size_t inserted_count, size_t replaced_count) {
    log_message("Refresh " + cache_key + ": fetched " + std::to_string(fetched_count) + " new " + std::to_string(inserted_count) +
                " updated " + std::to_string(replaced_count), "");
}

void BackfillLogs::log_refresh_gap(const std::string& cache_key, Timestamp cached_last_timestamp, Timestamp window_first_timestamp) {
    log_message("Refresh " + cache_key + ": gap between cached " + TimeUtils::format_epoch_iso_utc(cached_last_timestamp) +
                " and window start " + TimeUtils::format_epoch_iso_utc(window_first_timestamp) + ", filling backward", "");
}
