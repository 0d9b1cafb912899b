#include "request_pacer.hpp"
#include <algorithm>
#include <stdexcept>

namespace SellManager {
namespace Core {

namespace {
    constexpr std::chrono::milliseconds GATE_STOP_POLL_INTERVAL(50);
}

SlidingWindowRateLimiter::SlidingWindowRateLimiter(int max_requests, std::chrono::milliseconds window_length)
    : max_requests_in_window(static_cast<size_t>(max_requests)), window(window_length) {
    if (max_requests <= 0 || window_length.count() <= 0) {
        throw std::invalid_argument("Rate limiter needs a positive request budget and window");
    }
}

void SlidingWindowRateLimiter::discard_expired(std::chrono::steady_clock::time_point now) const {
    while (!request_start_times.empty() && now - request_start_times.front() >= window) {
        request_start_times.pop_front();
    }
}

bool SlidingWindowRateLimiter::acquire(Threads::StopSignal& stop_signal) {
    while (!stop_signal.stop_requested()) {
        std::chrono::steady_clock::time_point slot_free_time;
        {
            std::lock_guard<std::mutex> lock(limiter_mutex);
            auto now = std::chrono::steady_clock::now();
            discard_expired(now);
            if (request_start_times.size() < max_requests_in_window) {
                request_start_times.push_back(now);
                return true;
            }
            slot_free_time = request_start_times.front() + window;
        }
        if (stop_signal.wait_until(slot_free_time)) {
            return false;
        }
    }
    return false;
}

size_t SlidingWindowRateLimiter::requests_in_window() const {
    std::lock_guard<std::mutex> lock(limiter_mutex);
    discard_expired(std::chrono::steady_clock::now());
    return request_start_times.size();
}

AdaptiveConcurrencyGate::AdaptiveConcurrencyGate(int max_permits, int recovery_successes)
    : maximum_permits(max_permits), current_limit(max_permits), in_use(0), success_streak(0),
      successes_per_recovery(recovery_successes) {
    if (max_permits <= 0 || recovery_successes <= 0) {
        throw std::invalid_argument("Concurrency gate needs positive permits and recovery threshold");
    }
}

bool AdaptiveConcurrencyGate::acquire(Threads::StopSignal& stop_signal) {
    std::unique_lock<std::mutex> lock(gate_mutex);
    while (in_use >= current_limit) {
        if (stop_signal.stop_requested()) {
            return false;
        }
        gate_cv.wait_for(lock, GATE_STOP_POLL_INTERVAL);
    }
    ++in_use;
    return true;
}

void AdaptiveConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        --in_use;
    }
    gate_cv.notify_all();
}

void AdaptiveConcurrencyGate::on_pacing_violation() {
    std::lock_guard<std::mutex> lock(gate_mutex);
    current_limit = std::max(1, current_limit / 2);
    success_streak = 0;
}

void AdaptiveConcurrencyGate::on_success() {
    bool limit_raised = false;
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        if (current_limit >= maximum_permits) {
            return;
        }
        if (++success_streak >= successes_per_recovery) {
            ++current_limit;
            success_streak = 0;
            limit_raised = true;
        }
    }
    if (limit_raised) {
        gate_cv.notify_all();
    }
}

int AdaptiveConcurrencyGate::effective_limit() const {
    std::lock_guard<std::mutex> lock(gate_mutex);
    return current_limit;
}

int AdaptiveConcurrencyGate::permits_in_use() const {
    std::lock_guard<std::mutex> lock(gate_mutex);
    return in_use;
}

InstrumentFetchGuard::Lease::Lease(InstrumentFetchGuard& fetch_guard, const std::string& instrument_key)
    : guard(fetch_guard), leased_instrument_key(instrument_key) {
    guard.acquire(leased_instrument_key);
}

InstrumentFetchGuard::Lease::~Lease() {
    guard.release(leased_instrument_key);
}

bool InstrumentFetchGuard::is_in_flight(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(guard_mutex);
    return in_flight_instruments.count(instrument_key) > 0;
}

void InstrumentFetchGuard::acquire(const std::string& instrument_key) {
    std::unique_lock<std::mutex> lock(guard_mutex);
    guard_cv.wait(lock, [&] { return in_flight_instruments.count(instrument_key) == 0; });
    in_flight_instruments.insert(instrument_key);
}

void InstrumentFetchGuard::release(const std::string& instrument_key) {
    {
        std::lock_guard<std::mutex> lock(guard_mutex);
        in_flight_instruments.erase(instrument_key);
    }
    guard_cv.notify_all();
}

} // namespace Core
} // namespace SellManager
