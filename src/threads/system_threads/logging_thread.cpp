/**
 * Logging thread.
 * Takes batches from the async logger and writes them to the run log until the logger is
 * stopped and its queue is empty.
 */
#include "logging_thread.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace SellManager::Threads;
using namespace SellManager::Logging;

void LoggingThread::operator()() {
    try {
        set_log_thread_tag("LOGGER");
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        std::cerr << "Logging thread exception: " << exception.what() << std::endl;
    }
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "ERROR: Failed to open log file: " << logger_ptr->get_file_path() << std::endl;
    }

    std::chrono::milliseconds poll_interval(config.logging.logging_poll_interval_milliseconds);
    std::vector<std::string> line_buffer;
    while (logger_ptr->wait_and_take(line_buffer, poll_interval)) {
        if (!line_buffer.empty()) {
            logger_ptr->write_lines(line_buffer, log_file);
            logger_iterations->fetch_add(1);
        }
    }
}
