#ifndef ASSIGNMENT_LOGS_HPP
#define ASSIGNMENT_LOGS_HPP

#include <string>
#include "trader/assignments/assignment_store.hpp"

namespace SellManager {
namespace Logging {

class AssignmentLogs {
public:
    static void log_assignments_loaded(const std::string& file_path, const Core::AssignmentLoadReport& load_report);
    static void log_assignment_file_missing(const std::string& file_path);
    static void log_rejected_row(const Core::RejectedAssignmentRow& rejected_row);
    static void log_reconciliation(const Core::ReconciliationReport& reconciliation_report);
    static void log_reload_requested();
    static void log_reload_failed(const std::string& error_message);
};

} // namespace Logging
} // namespace SellManager

#endif // ASSIGNMENT_LOGS_HPP
