// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace SellManager {
namespace Config {

struct TimingConfig {
    // ========================================================================
    // CADENCE TIMERS
    // ========================================================================

    bool enable_minute_cadence = true;               // Minute refresh timer
    bool enable_hour_cadence = true;                 // Hour / end-of-day evaluation timer
    int thread_startup_sequence_delay_milliseconds = 100;
    int main_loop_poll_interval_seconds = 1;         // Main thread shutdown / health polling

    // ========================================================================
    // RECENT WINDOW REFRESH
    // ========================================================================

    int refresh_halfhour_bars = 14;                  // 30m bars pulled per minute tick for hourly assignments
    int refresh_daily_bars = 2;                      // Daily bars pulled per minute tick for daily assignments

    // ========================================================================
    // CONNECTIVITY RETRY CONFIGURATION
    // ========================================================================

    int connectivity_max_retry_delay_seconds = 60;
    int connectivity_degraded_threshold = 2;
    int connectivity_disconnected_threshold = 5;
    double connectivity_backoff_multiplier = 2.0;
};

} // namespace Config
} // namespace SellManager

#endif // TIMING_CONFIG_HPP
