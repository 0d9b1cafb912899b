#ifndef STOP_SIGNAL_HPP
#define STOP_SIGNAL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace SellManager {
namespace Threads {

// Shared cancellation flag that also wakes every interruptible wait.
class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(stop_mutex);
            stopped.store(true);
        }
        stop_cv.notify_all();
    }

    bool stop_requested() const { return stopped.load(); }

    // True when stop was requested before the deadline.
    template <typename Clock, typename Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(stop_mutex);
        return stop_cv.wait_until(lock, deadline, [this] { return stopped.load(); });
    }

    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(stop_mutex);
        return stop_cv.wait_for(lock, timeout, [this] { return stopped.load(); });
    }

private:
    std::mutex stop_mutex;
    std::condition_variable stop_cv;
    std::atomic<bool> stopped{false};
};

} // namespace Threads
} // namespace SellManager

#endif // STOP_SIGNAL_HPP
