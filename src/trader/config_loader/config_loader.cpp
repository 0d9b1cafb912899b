#include "config_loader.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/logging_macros.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <vector>

using SellManager::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::runtime_error("Invalid boolean value: '" + input_value + "'");
    }

    inline int to_int(const std::string& input_value) {
        size_t parsed_characters = 0;
        int parsed_value = std::stoi(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::runtime_error("Trailing characters in integer value: '" + input_value + "'");
        }
        return parsed_value;
    }

    inline double to_double(const std::string& input_value) {
        size_t parsed_characters = 0;
        double parsed_value = std::stod(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::runtime_error("Trailing characters in numeric value: '" + input_value + "'");
        }
        return parsed_value;
    }

    bool apply_config_value(SellManager::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
        // Broker gateway
        if (config_key_string == "broker.base_url") cfg.broker.base_url = config_value_string;
        else if (config_key_string == "broker.account_id") cfg.broker.account_id = config_value_string;
        else if (config_key_string == "broker.enable_ssl_verification") cfg.broker.enable_ssl_verification = to_bool(config_value_string);
        else if (config_key_string == "broker.request_timeout_seconds") cfg.broker.request_timeout_seconds = to_int(config_value_string);
        else if (config_key_string == "broker.http_retries") cfg.broker.http_retries = to_int(config_value_string);
        else if (config_key_string == "broker.outside_regular_trading_hours") cfg.broker.outside_regular_trading_hours = to_bool(config_value_string);
        else if (config_key_string == "orders.live_mode") cfg.broker.live_mode = to_bool(config_value_string);

        // Historical backfill
        else if (config_key_string == "backfill.hourly_target_bars") cfg.backfill.hourly_target_bars = to_int(config_value_string);
        else if (config_key_string == "backfill.daily_target_bars") cfg.backfill.daily_target_bars = to_int(config_value_string);
        else if (config_key_string == "backfill.slice_size") cfg.backfill.slice_size = to_int(config_value_string);
        else if (config_key_string == "backfill.worker_pool_size") cfg.backfill.worker_pool_size = to_int(config_value_string);
        else if (config_key_string == "backfill.request_timeout_seconds") cfg.backfill.request_timeout_seconds = to_int(config_value_string);
        else if (config_key_string == "backfill.rate_limit_max_requests") cfg.backfill.rate_limit_max_requests = to_int(config_value_string);
        else if (config_key_string == "backfill.rate_limit_window_milliseconds") cfg.backfill.rate_limit_window_milliseconds = to_int(config_value_string);
        else if (config_key_string == "backfill.max_attempts_per_slice") cfg.backfill.max_attempts_per_slice = to_int(config_value_string);
        else if (config_key_string == "backfill.backoff_base_milliseconds") cfg.backfill.backoff_base_milliseconds = to_int(config_value_string);
        else if (config_key_string == "backfill.backoff_max_milliseconds") cfg.backfill.backoff_max_milliseconds = to_int(config_value_string);
        else if (config_key_string == "backfill.pacing_backoff_multiplier") cfg.backfill.pacing_backoff_multiplier = to_int(config_value_string);
        else if (config_key_string == "backfill.concurrency_recovery_successes") cfg.backfill.concurrency_recovery_successes = to_int(config_value_string);

        // Cadence timing
        else if (config_key_string == "timing.enable_minute_cadence") cfg.timing.enable_minute_cadence = to_bool(config_value_string);
        else if (config_key_string == "timing.enable_hour_cadence") cfg.timing.enable_hour_cadence = to_bool(config_value_string);
        else if (config_key_string == "timing.thread_startup_sequence_delay_milliseconds") cfg.timing.thread_startup_sequence_delay_milliseconds = to_int(config_value_string);
        else if (config_key_string == "timing.main_loop_poll_interval_seconds") cfg.timing.main_loop_poll_interval_seconds = to_int(config_value_string);
        else if (config_key_string == "timing.refresh_halfhour_bars") cfg.timing.refresh_halfhour_bars = to_int(config_value_string);
        else if (config_key_string == "timing.refresh_daily_bars") cfg.timing.refresh_daily_bars = to_int(config_value_string);
        else if (config_key_string == "timing.connectivity_max_retry_delay_seconds") cfg.timing.connectivity_max_retry_delay_seconds = to_int(config_value_string);
        else if (config_key_string == "timing.connectivity_degraded_threshold") cfg.timing.connectivity_degraded_threshold = to_int(config_value_string);
        else if (config_key_string == "timing.connectivity_disconnected_threshold") cfg.timing.connectivity_disconnected_threshold = to_int(config_value_string);
        else if (config_key_string == "timing.connectivity_backoff_multiplier") cfg.timing.connectivity_backoff_multiplier = to_double(config_value_string);

        // Exchange session
        else if (config_key_string == "session.utc_offset_hours") cfg.session.utc_offset_hours = to_int(config_value_string);
        else if (config_key_string == "session.observe_us_dst") cfg.session.observe_us_dst = to_bool(config_value_string);
        else if (config_key_string == "session.market_open_hour") cfg.session.market_open_hour = to_int(config_value_string);
        else if (config_key_string == "session.market_open_minute") cfg.session.market_open_minute = to_int(config_value_string);
        else if (config_key_string == "session.end_of_day_fire_hour") cfg.session.end_of_day_fire_hour = to_int(config_value_string);
        else if (config_key_string == "session.end_of_day_fire_minute") cfg.session.end_of_day_fire_minute = to_int(config_value_string);
        else if (config_key_string == "session.end_of_day_fire_second") cfg.session.end_of_day_fire_second = to_int(config_value_string);
        else if (config_key_string == "session.end_of_day_weekdays_only") cfg.session.end_of_day_weekdays_only = to_bool(config_value_string);
        else if (config_key_string == "session.hour_bucket_anchor_minutes") cfg.session.hour_bucket_anchor_minutes = to_int(config_value_string);

        // Storage
        else if (config_key_string == "storage.cache_directory") cfg.storage.cache_directory = config_value_string;
        else if (config_key_string == "storage.assignments_file") cfg.storage.assignments_file = config_value_string;
        else if (config_key_string == "storage.signal_audit_file") cfg.storage.signal_audit_file = config_value_string;

        // Logging
        else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
        else if (config_key_string == "logging.runtime_logs_directory") cfg.logging.runtime_logs_directory = config_value_string;
        else if (config_key_string == "logging.logging_poll_interval_milliseconds") cfg.logging.logging_poll_interval_milliseconds = to_int(config_value_string);
        else if (config_key_string == "logging.log_status_table") cfg.logging.log_status_table = to_bool(config_value_string);
        else if (config_key_string == "logging.console_output") cfg.logging.console_output = to_bool(config_value_string);
        else if (config_key_string == "logging.max_queued_lines") cfg.logging.max_queued_lines = to_int(config_value_string);
        else return false;
        return true;
    }
}

bool load_config_from_csv(SellManager::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        log_message("ERROR: Could not open config file: " + csv_path, "");
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        // "key,value"; an empty value after the comma is allowed
        size_t separator_position = config_line_string.find(',');
        if (separator_position == std::string::npos) {
            log_message("ERROR: Missing value for config key '" + config_line_string + "' in " + csv_path + ":" + std::to_string(line_number), "");
            return false;
        }
        std::string config_key_string = trim(config_line_string.substr(0, separator_position));
        std::string config_value_string = trim(config_line_string.substr(separator_position + 1));

        try {
            if (!apply_config_value(cfg, config_key_string, config_value_string)) {
                log_message("WARNING: Unknown config key '" + config_key_string + "' in " + csv_path, "");
            }
        } catch (const std::exception& line_exception_error) {
            // Fail hard on config parsing errors - no silent failures
            log_message("CRITICAL: Error parsing config line " + std::to_string(line_number) + " of " + csv_path + ": " +
                        config_line_string + " - " + std::string(line_exception_error.what()), "");
            return false;
        }
    }
    return true;
}

int load_system_config(SellManager::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/broker_config.csv",
        config_directory + "/backfill_config.csv",
        config_directory + "/timing_config.csv",
        config_directory + "/session_config.csv",
        config_directory + "/storage_config.csv",
        config_directory + "/logging_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}

bool validate_config(const SellManager::Config::SystemConfig& config, std::string& error_message) {
    if (config.broker.base_url.empty()) {
        error_message = "broker.base_url is required (provide via broker_config.csv)";
        return false;
    }
    if (config.broker.request_timeout_seconds <= 0 || config.backfill.request_timeout_seconds <= 0) {
        error_message = "Request timeouts must be > 0";
        return false;
    }
    if (config.broker.http_retries <= 0) {
        error_message = "broker.http_retries must be > 0";
        return false;
    }
    if (config.broker.live_mode && config.broker.account_id.empty()) {
        error_message = "orders.live_mode requires broker.account_id";
        return false;
    }

    if (config.backfill.slice_size <= 0) {
        error_message = "backfill.slice_size must be > 0";
        return false;
    }
    if (config.backfill.worker_pool_size <= 0) {
        error_message = "backfill.worker_pool_size must be > 0";
        return false;
    }
    if (config.backfill.hourly_target_bars <= 0 || config.backfill.daily_target_bars <= 0) {
        error_message = "Backfill coverage targets must be > 0";
        return false;
    }
    if (config.backfill.hourly_target_bars < SellManager::Core::maximum_supported_length() ||
        config.backfill.daily_target_bars < SellManager::Core::maximum_supported_length()) {
        error_message = "Backfill coverage targets must cover the longest supported indicator (" +
                        std::to_string(SellManager::Core::maximum_supported_length()) + " bars)";
        return false;
    }
    if (config.backfill.rate_limit_max_requests <= 0 || config.backfill.rate_limit_window_milliseconds <= 0) {
        error_message = "Backfill rate limit must allow at least one request per positive window";
        return false;
    }
    if (config.backfill.max_attempts_per_slice <= 0) {
        error_message = "backfill.max_attempts_per_slice must be > 0";
        return false;
    }
    if (config.backfill.backoff_base_milliseconds <= 0 || config.backfill.backoff_max_milliseconds < config.backfill.backoff_base_milliseconds) {
        error_message = "backfill.backoff_base_milliseconds must be > 0 and <= backfill.backoff_max_milliseconds";
        return false;
    }
    if (config.backfill.pacing_backoff_multiplier < 1 || config.backfill.concurrency_recovery_successes <= 0) {
        error_message = "backfill.pacing_backoff_multiplier must be >= 1 and backfill.concurrency_recovery_successes > 0";
        return false;
    }

    if (config.timing.refresh_halfhour_bars <= 0 || config.timing.refresh_daily_bars <= 0) {
        error_message = "Refresh windows must be > 0 bars";
        return false;
    }
    if (config.timing.main_loop_poll_interval_seconds <= 0) {
        error_message = "timing.main_loop_poll_interval_seconds must be > 0";
        return false;
    }
    if (config.timing.connectivity_disconnected_threshold <= config.timing.connectivity_degraded_threshold) {
        error_message = "timing.connectivity_disconnected_threshold must be greater than timing.connectivity_degraded_threshold";
        return false;
    }

    if (config.session.market_open_hour < 0 || config.session.market_open_hour > 23 ||
        config.session.market_open_minute < 0 || config.session.market_open_minute > 59) {
        error_message = "Invalid session.market_open time";
        return false;
    }
    if (config.session.end_of_day_fire_hour < 0 || config.session.end_of_day_fire_hour > 23 ||
        config.session.end_of_day_fire_minute < 0 || config.session.end_of_day_fire_minute > 59 ||
        config.session.end_of_day_fire_second < 0 || config.session.end_of_day_fire_second > 59) {
        error_message = "Invalid session.end_of_day_fire time";
        return false;
    }
    if (config.session.hour_bucket_anchor_minutes < 0 || config.session.hour_bucket_anchor_minutes > 59) {
        error_message = "session.hour_bucket_anchor_minutes must be within [0, 59]";
        return false;
    }

    if (config.storage.cache_directory.empty() || config.storage.assignments_file.empty() || config.storage.signal_audit_file.empty()) {
        error_message = "Storage paths are required (provide via storage_config.csv)";
        return false;
    }
    if (config.logging.log_file.empty() || config.logging.logging_poll_interval_milliseconds <= 0) {
        error_message = "logging.log_file is required and logging.logging_poll_interval_milliseconds must be > 0";
        return false;
    }
    if (config.logging.max_queued_lines <= 0) {
        error_message = "logging.max_queued_lines must be > 0";
        return false;
    }

    return true;
}
