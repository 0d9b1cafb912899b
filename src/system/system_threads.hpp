#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

/**
 * @brief System thread handles and performance monitoring
 *
 * The cadence timers own their threads; only the logging thread is held here.
 * Implements move semantics.
 */
struct SystemThreads {
    std::thread logger_thread;    // Logging system thread

    std::chrono::steady_clock::time_point start_time;  // System startup timestamp

    /// Thread iteration counters for performance monitoring
    std::atomic<unsigned long> minute_iterations{0};
    std::atomic<unsigned long> hour_iterations{0};
    std::atomic<unsigned long> logger_iterations{0};

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;

    SystemThreads(SystemThreads&& other) noexcept
        : logger_thread(std::move(other.logger_thread)),
          start_time(other.start_time),
          minute_iterations(other.minute_iterations.load()),
          hour_iterations(other.hour_iterations.load()),
          logger_iterations(other.logger_iterations.load()) {}

    SystemThreads& operator=(SystemThreads&& other) noexcept {
        if (this != &other) {
            logger_thread = std::move(other.logger_thread);
            start_time = other.start_time;
            minute_iterations.store(other.minute_iterations.load());
            hour_iterations.store(other.hour_iterations.load());
            logger_iterations.store(other.logger_iterations.load());
        }
        return *this;
    }
};

#endif // SYSTEM_THREADS_HPP
