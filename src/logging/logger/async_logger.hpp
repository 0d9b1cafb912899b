#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "configs/system_config.hpp"

namespace SellManager {
namespace Logging {

constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

/**
 * Queue of formatted log lines.
 *
 * Any thread enqueues; the logging thread takes batches and writes them to the run log
 * (and the console when echo is on). A full queue discards its oldest line and counts it.
 */
class AsyncLogger {
public:
    AsyncLogger(std::string log_file_path, size_t queue_capacity, bool console_echo);

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    const std::string& get_file_path() const { return file_path; }
    bool is_running() const { return running.load(); }

    void start();
    void stop();

    void enqueue(std::string formatted_line);

    // Waits up to poll_interval, then moves every queued line into line_buffer.
    // False once stopped with nothing left to take.
    bool wait_and_take(std::vector<std::string>& line_buffer, std::chrono::milliseconds poll_interval);

    // Writes and clears line_buffer; reports lines dropped since the last call first.
    void write_lines(std::vector<std::string>& line_buffer, std::ofstream& log_file);

    unsigned long get_dropped_count() const { return dropped_count.load(); }
    unsigned long get_written_count() const { return written_count.load(); }

private:
    std::string file_path;
    size_t capacity;
    bool echo_to_console;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};

    std::atomic<unsigned long> dropped_count{0};
    std::atomic<unsigned long> written_count{0};
    unsigned long reported_drop_count = 0;           // logging thread only

    void output_line(const std::string& log_line, std::ofstream& log_file);
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);
};

struct RunLogPaths {
    std::string run_folder;
    std::string log_file;
};

// <runtime_logs>/run_<YYYYMMDD-HHMMSS>_<revision>/<log stem>_<YYYYMMDD-HHMMSS>.log, stamped in UTC
RunLogPaths make_run_log_paths(const Config::LoggingConfig& logging_config, long long start_epoch_seconds,
                               const std::string& revision);

// Short git hash of the working directory, "unknown" outside a checkout
std::string current_source_revision();

// Thread-local log tag (6 characters, padded/truncated) shown after the timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function; log_file_path appends synchronously when the async logger is not running
void log_message(const std::string& message, const std::string& log_file_path);

// Global lifecycle helpers (use context internally)
void initialize_global_logger(AsyncLogger& logger);
void shutdown_global_logger(AsyncLogger& logger);

// Validates the configuration, creates the run folder and starts the queue
std::shared_ptr<AsyncLogger> initialize_application_foundation(const Config::SystemConfig& config);

// Throws when the current thread has no context
LoggingContext* get_logging_context();
// nullptr when the current thread has no context (worker pools inherit it only if present)
LoggingContext* find_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace SellManager

#endif // ASYNC_LOGGER_HPP
