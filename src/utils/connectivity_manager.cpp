#include "connectivity_manager.hpp"
#include <algorithm>
#include <stdexcept>

namespace SellManager {

ConnectivityManager::ConnectivityManager(const Config::TimingConfig& timing_config)
    : max_retry_delay_seconds(timing_config.connectivity_max_retry_delay_seconds),
      degraded_threshold(timing_config.connectivity_degraded_threshold),
      disconnected_threshold(timing_config.connectivity_disconnected_threshold),
      backoff_multiplier(timing_config.connectivity_backoff_multiplier) {
    if (max_retry_delay_seconds <= 0) {
        throw std::runtime_error("connectivity_max_retry_delay_seconds must be greater than 0");
    }
    if (degraded_threshold <= 0 || disconnected_threshold <= degraded_threshold) {
        throw std::runtime_error("connectivity thresholds must satisfy 0 < degraded < disconnected");
    }
    if (backoff_multiplier <= 1.0) {
        throw std::runtime_error("connectivity_backoff_multiplier must be greater than 1.0");
    }
    state.last_success = std::chrono::steady_clock::now();
    state.next_retry_time = state.last_success;
}

void ConnectivityManager::report_success() {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto now = std::chrono::steady_clock::now();

    state.status = ConnectionStatus::CONNECTED;
    state.last_success = now;
    state.consecutive_failures = 0;
    state.retry_delay_seconds = 1;
    state.next_retry_time = now;
    state.last_error_message.clear();
}

void ConnectivityManager::report_failure(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto now = std::chrono::steady_clock::now();

    state.last_failure = now;
    state.consecutive_failures++;
    state.last_error_message = error_message;

    if (state.consecutive_failures >= disconnected_threshold) {
        state.status = ConnectionStatus::DISCONNECTED;
    } else if (state.consecutive_failures >= degraded_threshold) {
        state.status = ConnectionStatus::DEGRADED;
    }

    state.retry_delay_seconds = std::min(
        std::max(1, static_cast<int>(state.retry_delay_seconds * backoff_multiplier)),
        max_retry_delay_seconds
    );
    state.next_retry_time = now + std::chrono::seconds(state.retry_delay_seconds);
}

bool ConnectivityManager::should_attempt_connection() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (state.status == ConnectionStatus::CONNECTED) {
        return true;
    }
    return std::chrono::steady_clock::now() >= state.next_retry_time;
}

int ConnectivityManager::get_seconds_until_retry() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto now = std::chrono::steady_clock::now();
    if (state.next_retry_time <= now) {
        return 0;
    }
    return static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(state.next_retry_time - now).count());
}

ConnectivityManager::ConnectionStatus ConnectivityManager::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state.status;
}

ConnectivityManager::ConnectivityState ConnectivityManager::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state;
}

std::string ConnectivityManager::get_status_string() const {
    switch (get_status()) {
        case ConnectionStatus::CONNECTED:
            return "CONNECTED";
        case ConnectionStatus::DEGRADED:
            return "DEGRADED";
        case ConnectionStatus::DISCONNECTED:
            return "DISCONNECTED";
    }
    return "UNKNOWN";
}

} // namespace SellManager
