#include "assignment_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

using namespace SellManager::Logging;
using namespace SellManager::Core;

void AssignmentLogs::log_assignments_loaded(const std::string& file_path, const AssignmentLoadReport& load_report) {
    TABLE_HEADER_48("ASSIGNMENTS", file_path);
    for (const auto& assignment : load_report.book->get_assignments()) {
        TABLE_ROW_48(assignment.instrument_key, assignment.indicator_label() + " " + timeframe_to_string(assignment.timeframe));
    }
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Loaded", std::to_string(load_report.book->size()));
    TABLE_ROW_48("Rejected", std::to_string(load_report.rejected_rows.size()));
    TABLE_FOOTER_48();
    for (const auto& rejected_row : load_report.rejected_rows) {
        log_rejected_row(rejected_row);
    }
}

void AssignmentLogs::log_assignment_file_missing(const std::string& file_path) {
    log_message("WARNING: Assignment file not found: " + file_path + " (no instruments tracked)", "");
}

void AssignmentLogs::log_rejected_row(const RejectedAssignmentRow& rejected_row) {
    log_message("WARNING: Assignment row " + std::to_string(rejected_row.line_number) + " skipped: " + rejected_row.reason +
                " [" + rejected_row.raw_line + "]", "");
}

void AssignmentLogs::log_reconciliation(const ReconciliationReport& reconciliation_report) {
    LOG_THREAD_SECTION_HEADER("ASSIGNMENT RECONCILIATION");
    if (reconciliation_report.unassigned_positions.empty()) {
        LOG_THREAD_CONTENT("Every held position has an assignment");
    }
    for (const auto& position : reconciliation_report.unassigned_positions) {
        LOG_THREAD_CONTENT("UNASSIGNED: " + position.instrument_key + " qty=" + std::to_string(position.quantity) +
                           " (assign an MA in the assignment file)");
    }
    for (const auto& assignment : reconciliation_report.assignments_without_position) {
        LOG_THREAD_CONTENT("No position held for assigned " + assignment.instrument_key);
    }
    LOG_THREAD_SECTION_FOOTER();
}

void AssignmentLogs::log_reload_requested() {
    log_message("Assignment reload requested, applying at the next minute tick", "");
}

void AssignmentLogs::log_reload_failed(const std::string& error_message) {
    log_message("ERROR: Assignment reload failed, keeping previous assignments: " + error_message, "");
}
