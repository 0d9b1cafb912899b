#ifndef SIGNAL_LOGS_HPP
#define SIGNAL_LOGS_HPP

#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Logging {

class SignalLogs {
public:
    static void log_evaluation_start(Core::CadenceTrigger trigger, size_t hourly_count, size_t daily_count);
    static void log_positions_unavailable(const std::string& error_message);
    static void log_decision(const Core::SignalRecord& signal_record);
    static void log_sell_signal(const Core::SignalRecord& signal_record);
    static void log_order_prepared(const Core::PreparedOrder& prepared_order, bool transmit_enabled);
    static void log_duplicate_order_blocked(const std::string& instrument_key);
    static void log_audit_write_failed(const std::string& instrument_key, Core::CadenceTrigger trigger, const std::string& error_message);
    static void log_evaluation_summary(Core::CadenceTrigger trigger, size_t evaluated_count, size_t signal_count, size_t skipped_count);
};

} // namespace Logging
} // namespace SellManager

#endif // SIGNAL_LOGS_HPP
