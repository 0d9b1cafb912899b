#ifndef ASSIGNMENT_STORE_HPP
#define ASSIGNMENT_STORE_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

// Immutable once published; shared between threads by pointer.
class AssignmentBook {
public:
    AssignmentBook() = default;
    explicit AssignmentBook(std::vector<Assignment> assignment_rows);

    const Assignment* find(const std::string& instrument_key) const;
    const std::vector<Assignment>& get_assignments() const { return assignments; }
    std::vector<std::string> instrument_keys() const;
    size_t size() const { return assignments.size(); }
    bool empty() const { return assignments.empty(); }

private:
    std::vector<Assignment> assignments;
    std::map<std::string, size_t> index_by_instrument;
};

using AssignmentBookPtr = std::shared_ptr<const AssignmentBook>;

struct RejectedAssignmentRow {
    int line_number;
    std::string raw_line;
    std::string reason;
};

struct AssignmentLoadReport {
    AssignmentBookPtr book;
    std::vector<RejectedAssignmentRow> rejected_rows;
    bool file_found;

    AssignmentLoadReport() : file_found(false) {}
};

struct ReconciliationReport {
    std::vector<Position> unassigned_positions;          // held without an assignment
    std::vector<Assignment> assignments_without_position;
};

// Field parsers shared by the loader and set_assignment; they throw InvalidConfigurationError.
MovingAverageType parse_moving_average_type(const std::string& ma_type_string);
Timeframe parse_timeframe(const std::string& timeframe_string);
int parse_assignment_length(const std::string& length_string);

/**
 * CSV assignment table: ticker,type,length,timeframe.
 * Rows missing the timeframe column default to hourly. Malformed rows are skipped and
 * reported; they never abort a load.
 */
class AssignmentStore {
public:
    explicit AssignmentStore(const std::string& assignments_file_path);

    AssignmentLoadReport load() const;

    // Validates, replaces or appends the instrument's row and rewrites the file atomically.
    // Throws InvalidConfigurationError for an invalid assignment.
    void set_assignment(const Assignment& assignment);

    const std::string& get_file_path() const { return file_path; }

private:
    std::string file_path;
    mutable std::mutex file_mutex;

    AssignmentLoadReport load_locked() const;
};

ReconciliationReport reconcile(const AssignmentBook& assignment_book, const std::vector<Position>& positions);

// Current book plus a reload request flag checked at tick boundaries.
class AssignmentRegistry {
public:
    AssignmentRegistry() : current_book(std::make_shared<const AssignmentBook>()) {}

    AssignmentBookPtr snapshot() const;
    void publish(AssignmentBookPtr assignment_book);

    void request_reload() { reload_requested.store(true); }
    // Clears the flag; true when a reload was pending.
    bool take_reload_request() { return reload_requested.exchange(false); }

private:
    mutable std::mutex book_mutex;
    AssignmentBookPtr current_book;
    std::atomic<bool> reload_requested{false};
};

} // namespace Core
} // namespace SellManager

#endif // ASSIGNMENT_STORE_HPP
