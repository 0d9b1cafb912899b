#ifndef BACKFILL_CONFIG_HPP
#define BACKFILL_CONFIG_HPP

namespace SellManager {
namespace Config {

struct BackfillConfig {
    // Coverage targets
    int hourly_target_bars = 200;                    // Hourly bars the 30m history must back once aggregated
    int daily_target_bars = 260;

    // Request shaping
    int slice_size = 31;                             // Bars per historical request
    int worker_pool_size = 32;                       // Instruments backfilled concurrently
    int request_timeout_seconds = 30;

    // Global sliding-window pacing
    int rate_limit_max_requests = 50;
    int rate_limit_window_milliseconds = 10000;

    // Per-instrument retry
    int max_attempts_per_slice = 5;
    int backoff_base_milliseconds = 1000;
    int backoff_max_milliseconds = 60000;
    int pacing_backoff_multiplier = 4;               // Pacing violations back off this many times longer
    int concurrency_recovery_successes = 5;          // Successes before one throttled permit is restored
};

} // namespace Config
} // namespace SellManager

#endif // BACKFILL_CONFIG_HPP
