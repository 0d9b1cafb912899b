#include "signal_evaluation_coordinator.hpp"
#include "logging/logs/cache_logs.hpp"
#include "logging/logs/signal_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include "trader/signals/signal_evaluator.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace SellManager {
namespace Core {

using Logging::CacheLogs;
using Logging::SignalLogs;

namespace {

std::string normalized_instrument(std::string instrument_key) {
    std::transform(instrument_key.begin(), instrument_key.end(), instrument_key.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return instrument_key;
}

std::string no_signal_reason(double close_price, double ma_value, double average_cost) {
    if (!(close_price < ma_value)) return "close_not_below_ma";
    if (!(close_price > average_cost)) return "close_not_above_cost";
    return "ma_not_above_cost";
}

} // namespace

std::optional<size_t> select_evaluation_bar(const Series& series, Timeframe timeframe, Timestamp evaluation_time,
                                            const ExchangeSessionClock& session_clock) {
    auto after_iterator = std::upper_bound(series.begin(), series.end(), evaluation_time,
        [](Timestamp requested_time, const Bar& bar) { return requested_time < bar.timestamp; });
    if (after_iterator == series.begin()) {
        return std::nullopt;
    }
    size_t selected_index = static_cast<size_t>(after_iterator - series.begin()) - 1;

    if (timeframe == Timeframe::DAILY && evaluation_time < session_clock.market_open_utc_on_local_date(evaluation_time)) {
        Timestamp today_stamp = TimeUtils::floor_to_multiple(session_clock.to_local_seconds(evaluation_time), TimeUtils::SECONDS_PER_DAY);
        if (series[selected_index].timestamp == today_stamp) {
            if (selected_index == 0) {
                return std::nullopt;
            }
            --selected_index;
        }
    }
    return selected_index;
}

SignalEvaluationCoordinator::SignalEvaluationCoordinator(const SignalEvaluationDependencies& dependencies, Threads::StopSignal& stop_signal)
    : deps(dependencies), stop(stop_signal) {}

bool SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger trigger, Timeframe timeframe) {
    if (timeframe == Timeframe::HOURLY) {
        return trigger != CadenceTrigger::MINUTE;
    }
    return trigger == CadenceTrigger::END_OF_DAY || trigger == CadenceTrigger::MANUAL;
}

EvaluationSummary SignalEvaluationCoordinator::run_evaluation(CadenceTrigger trigger, Timestamp evaluation_time) {
    EvaluationSummary evaluation_summary;
    AssignmentBookPtr assignment_book = deps.assignment_registry.snapshot();

    std::vector<Assignment> due_assignments;
    size_t hourly_count = 0;
    size_t daily_count = 0;
    for (const auto& assignment : assignment_book->get_assignments()) {
        if (!evaluates_timeframe(trigger, assignment.timeframe)) {
            continue;
        }
        due_assignments.push_back(assignment);
        if (assignment.timeframe == Timeframe::DAILY) {
            ++daily_count;
        } else {
            ++hourly_count;
        }
    }
    SignalLogs::log_evaluation_start(trigger, hourly_count, daily_count);
    if (due_assignments.empty()) {
        return evaluation_summary;
    }

    std::optional<std::map<std::string, Position>> positions;
    std::string positions_error;
    if (!deps.position_source) {
        positions_error = "no position source";
    } else {
        try {
            std::map<std::string, Position> fetched_positions;
            for (const auto& position : deps.position_source->get_positions()) {
                fetched_positions[normalized_instrument(position.instrument_key)] = position;
            }
            positions = std::move(fetched_positions);
        } catch (const std::exception& positions_exception) {
            positions_error = positions_exception.what();
            SignalLogs::log_positions_unavailable(positions_error);
        }
    }

    for (const auto& assignment : due_assignments) {
        if (stop.stop_requested()) {
            break;
        }
        SignalRecord signal_record = evaluate_assignment(assignment, trigger, evaluation_time, positions, positions_error);
        ++evaluation_summary.evaluated_count;

        if (signal_record.decision == SignalDecision::SKIP) {
            ++evaluation_summary.skipped_count;
        } else if (signal_record.decision == SignalDecision::SELL_SIGNAL) {
            ++evaluation_summary.signal_count;
            const Position& position = positions->at(normalized_instrument(assignment.instrument_key));
            handle_sell_signal(signal_record, position, evaluation_summary);
        }

        SignalLogs::log_decision(signal_record);
        write_audit_record(signal_record, evaluation_summary);
        evaluation_summary.records.push_back(signal_record);
    }

    SignalLogs::log_evaluation_summary(trigger, evaluation_summary.evaluated_count, evaluation_summary.signal_count,
                                       evaluation_summary.skipped_count);
    return evaluation_summary;
}

SignalRecord SignalEvaluationCoordinator::evaluate_assignment(const Assignment& assignment, CadenceTrigger trigger, Timestamp evaluation_time,
                                                              const std::optional<std::map<std::string, Position>>& positions,
                                                              const std::string& positions_error) {
    SignalRecord signal_record;
    signal_record.evaluated_at = evaluation_time;
    signal_record.instrument_key = assignment.instrument_key;
    signal_record.trigger = trigger;
    signal_record.timeframe = assignment.timeframe;
    signal_record.ma_type = assignment.ma_type;
    signal_record.ma_length = assignment.length;
    signal_record.decision = SignalDecision::SKIP;

    if (!positions) {
        signal_record.reason = "positions_unavailable";
        signal_record.errors.push_back(positions_error);
        return signal_record;
    }
    auto position_iterator = positions->find(normalized_instrument(assignment.instrument_key));
    if (position_iterator == positions->end() || position_iterator->second.quantity == 0.0) {
        signal_record.reason = "no_position";
        return signal_record;
    }
    const Position& position = position_iterator->second;
    signal_record.average_cost = position.average_cost;
    signal_record.quantity = position.quantity;

    std::string cache_key = make_cache_key(assignment.instrument_key, timeframe_granularity(assignment.timeframe));
    Series series;
    try {
        series = deps.cache_store.read(cache_key);
    } catch (const CacheCorruptionError& corruption_error) {
        CacheLogs::log_cache_corruption(cache_key, corruption_error.what());
        signal_record.reason = "cache_corruption";
        signal_record.errors.push_back(corruption_error.what());
        return signal_record;
    }

    std::optional<size_t> bar_index = select_evaluation_bar(series, assignment.timeframe, evaluation_time, deps.session_clock);
    if (!bar_index) {
        signal_record.reason = "insufficient_data";
        return signal_record;
    }
    const Bar& evaluated_bar = series[*bar_index];
    signal_record.bar_timestamp = evaluated_bar.timestamp;
    signal_record.close = evaluated_bar.close_price;

    // The minute refresh keeps the track in step with the cache; before its first pass, compute directly.
    std::optional<double> ma_value = deps.indicator_cache.value_at(cache_key, assignment.ma_type, assignment.length, evaluated_bar.timestamp);
    if (!ma_value) {
        ma_value = compute_moving_average(series, assignment.ma_type, assignment.length, *bar_index);
    }
    if (!ma_value) {
        signal_record.reason = "insufficient_data";
        signal_record.errors.push_back(DataGapError("need " + std::to_string(assignment.length) + " bars, have " +
                                                    std::to_string(*bar_index + 1)).what());
        return signal_record;
    }
    signal_record.ma_value = ma_value;

    if (!std::isfinite(evaluated_bar.close_price) || !std::isfinite(*ma_value) || !std::isfinite(position.average_cost)) {
        signal_record.reason = "invalid_values";
        return signal_record;
    }
    if (*ma_value != 0.0) {
        signal_record.distance_pct = distance_percent(evaluated_bar.close_price, *ma_value);
    }

    EvaluationContext evaluation_context;
    evaluation_context.bar_timestamp = evaluated_bar.timestamp;
    evaluation_context.instrument_key = assignment.instrument_key;
    evaluation_context.ma_type = assignment.ma_type;
    evaluation_context.ma_length = assignment.length;

    std::optional<Signal> sell_signal = evaluate_sell_signal(evaluation_context, evaluated_bar.close_price, *ma_value, position.average_cost);
    if (sell_signal) {
        signal_record.decision = SignalDecision::SELL_SIGNAL;
        signal_record.reason = "close_below_ma_above_cost";
    } else {
        signal_record.decision = SignalDecision::NO_SIGNAL;
        signal_record.reason = no_signal_reason(evaluated_bar.close_price, *ma_value, position.average_cost);
    }
    return signal_record;
}

void SignalEvaluationCoordinator::handle_sell_signal(SignalRecord& signal_record, const Position& position,
                                                     EvaluationSummary& evaluation_summary) {
    SignalLogs::log_sell_signal(signal_record);
    PreparedOrder prepared_order = prepare_full_close_order(position);
    signal_record.action_prepared = true;
    SignalLogs::log_order_prepared(prepared_order, deps.order_sink != nullptr);
    if (!deps.order_sink) {
        return;
    }

    signal_record.action_executed = false;
    try {
        if (deps.position_source && has_open_sell_order(deps.position_source->get_open_orders(), position.instrument_key)) {
            SignalLogs::log_duplicate_order_blocked(position.instrument_key);
            signal_record.errors.push_back("open sell order already exists");
            return;
        }
        OrderResult order_result = deps.order_sink->place_order(prepared_order.instrument_key, prepared_order.side, prepared_order.quantity);
        signal_record.action_executed = order_result.accepted;
        if (!order_result.order_id.empty()) {
            signal_record.order_id = order_result.order_id;
        }
        if (order_result.accepted) {
            ++evaluation_summary.orders_transmitted;
        } else {
            signal_record.errors.push_back(order_result.error_message);
        }
    } catch (const std::exception& order_error) {
        signal_record.errors.push_back(order_error.what());
    }
}

void SignalEvaluationCoordinator::write_audit_record(const SignalRecord& signal_record, EvaluationSummary& evaluation_summary) {
    try {
        deps.audit_logger.append(signal_record);
    } catch (const AuditLogError& audit_error) {
        ++evaluation_summary.audit_failures;
        SignalLogs::log_audit_write_failed(signal_record.instrument_key, signal_record.trigger, audit_error.what());
    } catch (const std::exception& format_error) {
        ++evaluation_summary.audit_failures;
        SignalLogs::log_audit_write_failed(signal_record.instrument_key, signal_record.trigger,
                                           std::string("record not serializable: ") + format_error.what());
    }
}

} // namespace Core
} // namespace SellManager
