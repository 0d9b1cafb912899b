#ifndef SIGNAL_EVALUATION_COORDINATOR_HPP
#define SIGNAL_EVALUATION_COORDINATOR_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "api/general/broker_interfaces.hpp"
#include "logging/logger/signal_audit_logger.hpp"
#include "threads/scheduling/stop_signal.hpp"
#include "trader/assignments/assignment_store.hpp"
#include "trader/cache/bar_cache_store.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/indicator_cache.hpp"
#include "utils/session_clock.hpp"

namespace SellManager {
namespace Core {

struct EvaluationSummary {
    size_t evaluated_count = 0;
    size_t signal_count = 0;
    size_t skipped_count = 0;
    size_t orders_transmitted = 0;
    size_t audit_failures = 0;
    std::vector<SignalRecord> records;
};

struct SignalEvaluationDependencies {
    BarCacheStore& cache_store;
    AssignmentRegistry& assignment_registry;
    IndicatorCache& indicator_cache;                 // kept current by the minute refresh
    API::PositionSourcePtr position_source;
    API::OrderSinkPtr order_sink;                    // null unless orders are transmitted
    Logging::SignalAuditLogger& audit_logger;
    const ExchangeSessionClock& session_clock;
};

// Index of the bar to evaluate: the latest stamped at or before evaluation_time. For daily bars
// before the session open, a bar dated today is passed over for the previous day's.
std::optional<size_t> select_evaluation_bar(const Series& series, Timeframe timeframe, Timestamp evaluation_time,
                                            const ExchangeSessionClock& session_clock);

/**
 * Hour cadence handler.
 *
 * Hourly assignments are evaluated on every fire, daily assignments only on the end-of-day
 * fire (and manual triggers). Every decision, including skips, is written to the audit log.
 * A sell signal prepares a full-close market order, transmitted only when an order sink is wired.
 */
class SignalEvaluationCoordinator {
public:
    SignalEvaluationCoordinator(const SignalEvaluationDependencies& dependencies, Threads::StopSignal& stop_signal);

    SignalEvaluationCoordinator(const SignalEvaluationCoordinator&) = delete;
    SignalEvaluationCoordinator& operator=(const SignalEvaluationCoordinator&) = delete;

    EvaluationSummary run_evaluation(CadenceTrigger trigger, Timestamp evaluation_time);

    static bool evaluates_timeframe(CadenceTrigger trigger, Timeframe timeframe);

private:
    SignalEvaluationDependencies deps;
    Threads::StopSignal& stop;

    SignalRecord evaluate_assignment(const Assignment& assignment, CadenceTrigger trigger, Timestamp evaluation_time,
                                     const std::optional<std::map<std::string, Position>>& positions,
                                     const std::string& positions_error);
    void handle_sell_signal(SignalRecord& signal_record, const Position& position, EvaluationSummary& evaluation_summary);
    void write_audit_record(const SignalRecord& signal_record, EvaluationSummary& evaluation_summary);
};

} // namespace Core
} // namespace SellManager

#endif // SIGNAL_EVALUATION_COORDINATOR_HPP
