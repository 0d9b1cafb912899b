#include <gtest/gtest.h>
#include <fstream>
#include <memory>
#include <stdexcept>
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "support/test_support.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager;
using namespace SellManager::Logging;

namespace {

const std::chrono::milliseconds SHORT_POLL(5);

} // namespace

TEST(AsyncLogger, TakesEveryQueuedLineInOrder) {
    AsyncLogger logger("unused.log", 16, false);
    logger.start();
    logger.enqueue("first\n");
    logger.enqueue("second\n");
    logger.enqueue("third\n");

    std::vector<std::string> line_buffer;
    ASSERT_TRUE(logger.wait_and_take(line_buffer, SHORT_POLL));
    EXPECT_EQ(line_buffer, (std::vector<std::string>{"first\n", "second\n", "third\n"}));

    line_buffer.clear();
    EXPECT_TRUE(logger.wait_and_take(line_buffer, SHORT_POLL));
    EXPECT_TRUE(line_buffer.empty());
}

TEST(AsyncLogger, FullQueueDropsOldestAndReportsIt) {
    Testing::TemporaryDirectory log_directory;
    std::string log_path = log_directory.file("run.log");
    AsyncLogger logger(log_path, 2, false);
    logger.start();
    logger.enqueue("a\n");
    logger.enqueue("b\n");
    logger.enqueue("c\n");
    EXPECT_EQ(logger.get_dropped_count(), 1u);

    std::vector<std::string> line_buffer;
    ASSERT_TRUE(logger.wait_and_take(line_buffer, SHORT_POLL));
    EXPECT_EQ(line_buffer, (std::vector<std::string>{"b\n", "c\n"}));

    {
        std::ofstream log_file(log_path, std::ios::app);
        logger.write_lines(line_buffer, log_file);
        EXPECT_TRUE(line_buffer.empty());

        // The drop is reported once
        logger.enqueue("d\n");
        ASSERT_TRUE(logger.wait_and_take(line_buffer, SHORT_POLL));
        logger.write_lines(line_buffer, log_file);
    }

    std::vector<std::string> written_lines = Testing::read_lines(log_path);
    ASSERT_EQ(written_lines.size(), 4u);
    EXPECT_EQ(written_lines[0], "[LOGGER] 1 log lines dropped (queue full)");
    EXPECT_EQ(written_lines[1], "b");
    EXPECT_EQ(written_lines[2], "c");
    EXPECT_EQ(written_lines[3], "d");
    EXPECT_EQ(logger.get_written_count(), 3u);
}

TEST(AsyncLogger, StopDrainsRemainingLinesThenEnds) {
    AsyncLogger logger("unused.log", 16, false);
    logger.start();
    logger.enqueue("last words\n");
    logger.stop();
    EXPECT_FALSE(logger.is_running());

    std::vector<std::string> line_buffer;
    EXPECT_TRUE(logger.wait_and_take(line_buffer, SHORT_POLL));
    EXPECT_EQ(line_buffer.size(), 1u);

    line_buffer.clear();
    EXPECT_FALSE(logger.wait_and_take(line_buffer, SHORT_POLL));
}

TEST(AsyncLogger, ZeroCapacityIsRejected) {
    EXPECT_THROW(AsyncLogger("unused.log", 0, false), std::invalid_argument);
}

TEST(AsyncLogger, LogMessageEnqueuesWhileRunning) {
    LoggingContext logging_context;
    logging_context.async_logger = std::make_shared<AsyncLogger>("unused.log", 16, false);
    logging_context.async_logger->start();
    set_logging_context(logging_context);
    set_log_thread_tag("TEST");

    log_message("hello", "");

    std::vector<std::string> line_buffer;
    logging_context.async_logger->wait_and_take(line_buffer, SHORT_POLL);
    Testing::install_test_logging_context();

    ASSERT_EQ(line_buffer.size(), 1u);
    EXPECT_NE(line_buffer[0].find(" [TEST  ]   hello\n"), std::string::npos);
}

TEST(LoggingContext, ThreadTagsArePaddedOrTruncated) {
    LoggingContext logging_context;
    EXPECT_EQ(logging_context.get_thread_tag(), "MAIN  ");

    logging_context.set_thread_tag("HOUR");
    EXPECT_EQ(logging_context.get_thread_tag(), "HOUR  ");

    logging_context.set_thread_tag("BACKFILL");
    EXPECT_EQ(logging_context.get_thread_tag(), "BACKFI");
}

TEST(RunLogPaths, StampedInUtcUnderRunFolder) {
    Config::LoggingConfig logging_config;
    logging_config.runtime_logs_directory = "runtime_logs";
    logging_config.log_file = "logs/sell_manager.log";

    RunLogPaths run_log_paths = make_run_log_paths(logging_config, TimeUtils::make_utc_timestamp(2024, 1, 8, 14, 30, 5), "abc123");
    EXPECT_EQ(run_log_paths.run_folder, "runtime_logs/run_20240108-143005_abc123");
    EXPECT_EQ(run_log_paths.log_file, "runtime_logs/run_20240108-143005_abc123/sell_manager_20240108-143005.log");

    logging_config.log_file = "trace";
    run_log_paths = make_run_log_paths(logging_config, TimeUtils::make_utc_timestamp(2024, 1, 8, 14, 30, 5), "unknown");
    EXPECT_EQ(run_log_paths.log_file, "runtime_logs/run_20240108-143005_unknown/trace_20240108-143005.log");
}

TEST(LoggingTables, RowsAreFittedToColumnWidths) {
    EXPECT_EQ(fit_table_cell("AAPL", 6), "AAPL  ");
    EXPECT_EQ(fit_table_cell("NASDAQ:AAPL", 6), "NASDAQ");
    EXPECT_EQ(format_table_row("KO", "ok"), "│ KO" + std::string(15, ' ') + " │ ok" + std::string(46, ' ') + " │");
}
