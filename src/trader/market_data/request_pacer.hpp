#ifndef REQUEST_PACER_HPP
#define REQUEST_PACER_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include "threads/scheduling/stop_signal.hpp"

namespace SellManager {
namespace Core {

// At most max_requests request starts inside any sliding window.
class SlidingWindowRateLimiter {
public:
    SlidingWindowRateLimiter(int max_requests, std::chrono::milliseconds window_length);

    // Blocks until a slot is free; false when stop was requested while waiting.
    bool acquire(Threads::StopSignal& stop_signal);
    size_t requests_in_window() const;

private:
    mutable std::mutex limiter_mutex;
    // Expired starts are dropped on read as well as on acquire
    mutable std::deque<std::chrono::steady_clock::time_point> request_start_times;
    size_t max_requests_in_window;
    std::chrono::milliseconds window;

    void discard_expired(std::chrono::steady_clock::time_point now) const;
};

/**
 * Concurrency limit that shrinks on pacing violations.
 * A violation halves the effective limit (never below one); every
 * recovery_successes consecutive successes restore one permit.
 */
class AdaptiveConcurrencyGate {
public:
    AdaptiveConcurrencyGate(int max_permits, int recovery_successes);

    bool acquire(Threads::StopSignal& stop_signal);
    void release();

    void on_pacing_violation();
    void on_success();

    int effective_limit() const;
    int permits_in_use() const;

private:
    mutable std::mutex gate_mutex;
    std::condition_variable gate_cv;
    int maximum_permits;
    int current_limit;
    int in_use;
    int success_streak;
    int successes_per_recovery;
};

class ConcurrencyPermit {
public:
    ConcurrencyPermit(AdaptiveConcurrencyGate& concurrency_gate, Threads::StopSignal& stop_signal)
        : gate(concurrency_gate), acquired(concurrency_gate.acquire(stop_signal)) {}
    ~ConcurrencyPermit() {
        if (acquired) {
            gate.release();
        }
    }
    ConcurrencyPermit(const ConcurrencyPermit&) = delete;
    ConcurrencyPermit& operator=(const ConcurrencyPermit&) = delete;

    bool is_acquired() const { return acquired; }

private:
    AdaptiveConcurrencyGate& gate;
    bool acquired;
};

// Never two requests in flight for the same instrument.
class InstrumentFetchGuard {
public:
    class Lease {
    public:
        Lease(InstrumentFetchGuard& fetch_guard, const std::string& instrument_key);
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

    private:
        InstrumentFetchGuard& guard;
        std::string leased_instrument_key;
    };

    bool is_in_flight(const std::string& instrument_key) const;

private:
    mutable std::mutex guard_mutex;
    std::condition_variable guard_cv;
    std::set<std::string> in_flight_instruments;

    void acquire(const std::string& instrument_key);
    void release(const std::string& instrument_key);
};

} // namespace Core
} // namespace SellManager

#endif // REQUEST_PACER_HPP
