#include "minute_refresh_coordinator.hpp"
#include "logging/logs/assignment_logs.hpp"
#include "logging/logs/cache_logs.hpp"
#include "logging/logs/status_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include "trader/signals/signal_evaluator.hpp"
#include <algorithm>
#include <cctype>

namespace SellManager {
namespace Core {

using Logging::AssignmentLogs;
using Logging::CacheLogs;
using Logging::StatusLogs;

namespace {

std::optional<Timestamp> earliest_of(std::optional<Timestamp> first_timestamp, std::optional<Timestamp> second_timestamp) {
    if (!first_timestamp) return second_timestamp;
    if (!second_timestamp) return first_timestamp;
    return std::min(*first_timestamp, *second_timestamp);
}

std::string position_lookup_key(std::string instrument_key) {
    std::transform(instrument_key.begin(), instrument_key.end(), instrument_key.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return instrument_key;
}

} // namespace

MinuteRefreshCoordinator::MinuteRefreshCoordinator(const MinuteRefreshDependencies& dependencies, const Config::SystemConfig& system_config,
                                                   Threads::StopSignal& stop_signal)
    : deps(dependencies), config(system_config), stop(stop_signal) {}

bool MinuteRefreshCoordinator::reload_assignments() {
    try {
        AssignmentLoadReport load_report = deps.assignment_store.load();
        if (!load_report.file_found) {
            AssignmentLogs::log_assignment_file_missing(deps.assignment_store.get_file_path());
        }
        AssignmentLogs::log_assignments_loaded(deps.assignment_store.get_file_path(), load_report);
        deps.assignment_registry.publish(load_report.book);
        deps.status_board.retain_only(load_report.book->instrument_keys());
        return true;
    } catch (const std::exception& reload_error) {
        AssignmentLogs::log_reload_failed(reload_error.what());
        return false;
    }
}

BackfillRequest MinuteRefreshCoordinator::coverage_request_for(const Assignment& assignment) const {
    if (assignment.timeframe == Timeframe::DAILY) {
        return BackfillRequest(assignment.instrument_key, Granularity::DAY, config.backfill.daily_target_bars);
    }
    // Two half-hour bars per hourly bar
    return BackfillRequest(assignment.instrument_key, Granularity::HALF_HOUR, 2 * config.backfill.hourly_target_bars);
}

std::optional<Position> MinuteRefreshCoordinator::last_known_position(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(positions_mutex);
    auto position_iterator = positions_by_instrument.find(position_lookup_key(instrument_key));
    if (position_iterator == positions_by_instrument.end()) {
        return std::nullopt;
    }
    return position_iterator->second;
}

bool MinuteRefreshCoordinator::refresh_positions() {
    if (!deps.position_source || !deps.connectivity_manager.should_attempt_connection()) {
        return false;
    }
    try {
        std::vector<Position> positions = deps.position_source->get_positions();
        std::lock_guard<std::mutex> lock(positions_mutex);
        positions_by_instrument.clear();
        for (const auto& position : positions) {
            positions_by_instrument[position_lookup_key(position.instrument_key)] = position;
        }
        return true;
    } catch (const BrokerConnectionError& connection_error) {
        deps.connectivity_manager.report_failure(connection_error.what());
        StatusLogs::log_positions_unavailable(connection_error.what());
    } catch (const std::exception& positions_error) {
        StatusLogs::log_positions_unavailable(positions_error.what());
    }
    return false;
}

MinuteTickSummary MinuteRefreshCoordinator::run_tick(Timestamp tick_time) {
    MinuteTickSummary tick_summary;
    if (deps.assignment_registry.take_reload_request()) {
        tick_summary.assignments_reloaded = reload_assignments();
    }

    AssignmentBookPtr assignment_book = deps.assignment_registry.snapshot();
    StatusLogs::log_minute_tick_start(assignment_book->size(), tick_summary.assignments_reloaded);
    tick_summary.positions_refreshed = refresh_positions();

    for (const auto& assignment : assignment_book->get_assignments()) {
        if (stop.stop_requested()) {
            break;
        }
        if (!deps.connectivity_manager.should_attempt_connection()) {
            StatusLogs::log_connectivity_paused(assignment.instrument_key, deps.connectivity_manager.get_status_string(),
                                                deps.connectivity_manager.get_seconds_until_retry());
            deps.status_board.record_error(assignment.instrument_key, "broker " + deps.connectivity_manager.get_status_string(), tick_time);
            ++tick_summary.skipped_count;
            continue;
        }

        try {
            refresh_instrument(assignment, tick_time);
            ++tick_summary.refreshed_count;
        } catch (const CacheCorruptionError& corruption_error) {
            CacheLogs::log_cache_corruption(corruption_error.cache_key(), corruption_error.what());
            deps.status_board.record_error(assignment.instrument_key, "cache corruption", tick_time);
            ++tick_summary.failed_count;
        } catch (const std::exception& refresh_error) {
            StatusLogs::log_instrument_refresh_failed(assignment.instrument_key, refresh_error.what());
            deps.status_board.record_error(assignment.instrument_key, refresh_error.what(), tick_time);
            ++tick_summary.failed_count;
        }
    }

    StatusLogs::log_minute_tick_summary(tick_summary.refreshed_count, tick_summary.failed_count, tick_summary.skipped_count);
    if (config.logging.log_status_table) {
        StatusLogs::log_status_table(deps.status_board.snapshot());
    }
    return tick_summary;
}

void MinuteRefreshCoordinator::refresh_instrument(const Assignment& assignment, Timestamp tick_time) {
    BackfillRequest coverage_request = coverage_request_for(assignment);
    BackfillResult coverage_result = deps.backfill_controller.ensure_coverage(coverage_request);
    if (coverage_result.status == BackfillStatus::FAILED) {
        throw TransientNetworkError("backfill failed: " + coverage_result.message);
    }
    if (coverage_result.status == BackfillStatus::CANCELLED) {
        return;
    }

    int refresh_count = assignment.timeframe == Timeframe::DAILY ? config.timing.refresh_daily_bars : config.timing.refresh_halfhour_bars;
    RecentRefreshResult refresh_result = deps.backfill_controller.refresh_recent(assignment.instrument_key, coverage_request.granularity, refresh_count);
    std::optional<Timestamp> fetched_changed = earliest_of(coverage_result.earliest_changed_timestamp,
                                                           refresh_result.merge_result.earliest_changed_timestamp);

    std::string evaluation_cache_key = make_cache_key(assignment.instrument_key, timeframe_granularity(assignment.timeframe));
    std::optional<Timestamp> indicator_changed = fetched_changed;
    if (assignment.timeframe == Timeframe::HOURLY) {
        indicator_changed = std::nullopt;
        bool hourly_cache_empty = deps.cache_store.describe(evaluation_cache_key).bar_count == 0;
        if (fetched_changed || hourly_cache_empty) {
            MergeResult hourly_merge_result = aggregate_and_merge(deps.cache_store, deps.bar_aggregator, assignment.instrument_key,
                                                                  hourly_cache_empty ? std::optional<Timestamp>() : fetched_changed);
            CacheLogs::log_aggregation_result(assignment.instrument_key, hourly_merge_result);
            indicator_changed = hourly_merge_result.earliest_changed_timestamp;
        }
    }

    Series evaluation_series = deps.cache_store.read(evaluation_cache_key);
    IndicatorUpdateResult indicator_result = deps.indicator_cache.update(evaluation_cache_key, evaluation_series, assignment.ma_type,
                                                                         assignment.length, indicator_changed);

    StatusRow status_row;
    status_row.instrument_key = assignment.instrument_key;
    status_row.indicator_label = assignment.indicator_label();
    status_row.timeframe = assignment.timeframe;
    status_row.updated_at = tick_time;
    if (!evaluation_series.empty()) {
        status_row.close = evaluation_series.back().close_price;
        status_row.bar_timestamp = evaluation_series.back().timestamp;
    }
    status_row.ma_value = indicator_result.latest_value;
    if (status_row.close && status_row.ma_value && *status_row.ma_value != 0.0) {
        status_row.distance_pct = distance_percent(*status_row.close, *status_row.ma_value);
    }
    std::optional<Position> position = last_known_position(assignment.instrument_key);
    if (position) {
        status_row.average_cost = position->average_cost;
        if (status_row.close) {
            status_row.above_break_even = *status_row.close > position->average_cost;
        }
    }
    if (coverage_result.status == BackfillStatus::PARTIAL && !indicator_result.latest_value) {
        status_row.last_error = "partial history";
    }
    deps.status_board.update(status_row);
}

} // namespace Core
} // namespace SellManager
