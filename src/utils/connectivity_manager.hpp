#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <chrono>
#include <mutex>
#include <string>
#include "configs/timing_config.hpp"

namespace SellManager {

/**
 * Broker connectivity shared by every fetching thread.
 * Consecutive failures move the status to DEGRADED then DISCONNECTED and push the next
 * allowed attempt out with exponential backoff; one success restores CONNECTED.
 */
class ConnectivityManager {
public:
    enum class ConnectionStatus {
        CONNECTED,          // Gateway answering normally
        DEGRADED,           // Some failures but still attempting
        DISCONNECTED        // Multiple failures, backing off
    };

    struct ConnectivityState {
        ConnectionStatus status = ConnectionStatus::CONNECTED;
        std::chrono::steady_clock::time_point last_success;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::steady_clock::time_point next_retry_time;
        int consecutive_failures = 0;
        int retry_delay_seconds = 1;
        std::string last_error_message;
    };

    explicit ConnectivityManager(const Config::TimingConfig& timing_config);

    ConnectivityManager(const ConnectivityManager&) = delete;
    ConnectivityManager& operator=(const ConnectivityManager&) = delete;

    void report_success();
    void report_failure(const std::string& error_message);
    bool should_attempt_connection() const;
    int get_seconds_until_retry() const;
    ConnectionStatus get_status() const;
    ConnectivityState get_state() const;
    std::string get_status_string() const;

private:
    mutable std::mutex state_mutex;
    ConnectivityState state;
    int max_retry_delay_seconds;
    int degraded_threshold;
    int disconnected_threshold;
    double backoff_multiplier;
};

} // namespace SellManager

#endif // CONNECTIVITY_MANAGER_HPP
