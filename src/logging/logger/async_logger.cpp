#include "async_logger.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace SellManager {
namespace Logging {

namespace {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string pad_thread_tag(const std::string& tag_value) {
    std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
    tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
    return tag_string;
}

} // namespace

// =============================================================================
// ASYNC LOGGER
// =============================================================================

AsyncLogger::AsyncLogger(std::string log_file_path, size_t queue_capacity, bool console_echo)
    : file_path(std::move(log_file_path)), capacity(queue_capacity), echo_to_console(console_echo) {
    if (capacity == 0) {
        throw std::invalid_argument("Log queue capacity must be positive");
    }
}

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

void AsyncLogger::enqueue(std::string formatted_line) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (pending_lines.size() >= capacity) {
            pending_lines.pop_front();
            dropped_count.fetch_add(1);
        }
        pending_lines.push_back(std::move(formatted_line));
    }
    queue_cv.notify_one();
}

bool AsyncLogger::wait_and_take(std::vector<std::string>& line_buffer, std::chrono::milliseconds poll_interval) {
    std::unique_lock<std::mutex> lock(queue_mutex);
    queue_cv.wait_for(lock, poll_interval, [this] { return !pending_lines.empty() || !running.load(); });
    while (!pending_lines.empty()) {
        line_buffer.push_back(std::move(pending_lines.front()));
        pending_lines.pop_front();
    }
    return running.load() || !line_buffer.empty();
}

void AsyncLogger::write_lines(std::vector<std::string>& line_buffer, std::ofstream& log_file) {
    unsigned long dropped_total = dropped_count.load();
    if (dropped_total > reported_drop_count) {
        output_line("[LOGGER] " + std::to_string(dropped_total - reported_drop_count) + " log lines dropped (queue full)\n", log_file);
        reported_drop_count = dropped_total;
    }
    for (const auto& log_line : line_buffer) {
        output_line(log_line, log_file);
    }
    written_count.fetch_add(line_buffer.size());
    line_buffer.clear();
}

void AsyncLogger::output_line(const std::string& log_line, std::ofstream& log_file) {
    if (echo_to_console) {
        LoggingContext* thread_logging_context_ptr = find_logging_context();
        if (thread_logging_context_ptr) {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::cout << log_line << std::flush;
        } else {
            std::cout << log_line << std::flush;
        }
    }
    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

// =============================================================================
// CONTEXT AND THREAD TAGS
// =============================================================================

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    if (thread_tag_iterator != thread_tags.end()) {
        return thread_tag_iterator->second;
    }
    return pad_thread_tag("MAIN");
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = pad_thread_tag(tag_value);
}

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }
    return thread_logging_context_ptr;
}

LoggingContext* find_logging_context() {
    return thread_local_logging_context_pointer;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

// =============================================================================
// LOG MESSAGE
// =============================================================================

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* thread_logging_context_ptr = get_logging_context();
        std::string log_formatted_string = TimeUtils::get_current_human_readable_time() + " [" +
                                           thread_logging_context_ptr->get_thread_tag() + "]   " + message + "\n";

        std::shared_ptr<AsyncLogger> async_logger = thread_logging_context_ptr->async_logger;
        if (async_logger && async_logger->is_running()) {
            async_logger->enqueue(std::move(log_formatted_string));
            return;
        }

        // Before startup and after shutdown lines go straight out
        {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::cout << log_formatted_string << std::flush;
        }
        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (log_file_stream.is_open()) {
                log_file_stream << log_formatted_string;
            } else {
                log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
            }
        }
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
        log_message_to_stderr(message);
    }
}

// =============================================================================
// RUN LOG LAYOUT
// =============================================================================

std::string current_source_revision() {
    FILE* pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!pipe) {
        return "unknown";
    }

    char buffer[128];
    std::string revision;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        revision += buffer;
    }
    pclose(pipe);

    while (!revision.empty() && (revision.back() == '\n' || revision.back() == '\r')) {
        revision.pop_back();
    }
    return revision.empty() ? "unknown" : revision;
}

RunLogPaths make_run_log_paths(const Config::LoggingConfig& logging_config, long long start_epoch_seconds,
                               const std::string& revision) {
    std::string stamp = TimeUtils::format_epoch_with_pattern_utc(start_epoch_seconds, TimeUtils::RUN_FOLDER_STAMP);

    std::filesystem::path log_name = std::filesystem::path(logging_config.log_file).filename();
    std::string log_extension = log_name.has_extension() ? log_name.extension().string() : std::string(".log");

    RunLogPaths run_log_paths;
    run_log_paths.run_folder = (std::filesystem::path(logging_config.runtime_logs_directory) / ("run_" + stamp + "_" + revision)).string();
    run_log_paths.log_file = (std::filesystem::path(run_log_paths.run_folder) /
                              (log_name.stem().string() + "_" + stamp + log_extension)).string();
    return run_log_paths;
}

// =============================================================================
// LIFECYCLE
// =============================================================================

void initialize_global_logger(AsyncLogger& logger_instance) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    if (!thread_logging_context_ptr->async_logger) {
        throw std::runtime_error("Async logger not set in context before initialization");
    }
    if (thread_logging_context_ptr->async_logger.get() != &logger_instance) {
        throw std::runtime_error("Async logger mismatch in context");
    }
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const Config::SystemConfig& config) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        log_message_to_stderr("ERROR: Config error: " + configuration_error_message);
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    RunLogPaths run_log_paths = make_run_log_paths(config.logging, TimeUtils::current_epoch_seconds(), current_source_revision());
    std::error_code directory_error;
    std::filesystem::create_directories(run_log_paths.run_folder, directory_error);
    if (directory_error) {
        throw std::runtime_error("Failed to create run folder " + run_log_paths.run_folder + ": " + directory_error.message());
    }
    thread_logging_context_ptr->run_folder = run_log_paths.run_folder;

    auto logger_instance = std::make_shared<AsyncLogger>(run_log_paths.log_file,
                                                         static_cast<size_t>(config.logging.max_queued_lines),
                                                         config.logging.console_output);
    logger_instance->start();

    thread_logging_context_ptr->async_logger = logger_instance;
    initialize_global_logger(*logger_instance);
    set_log_thread_tag("MAIN");

    return logger_instance;
}

} // namespace Logging
} // namespace SellManager
