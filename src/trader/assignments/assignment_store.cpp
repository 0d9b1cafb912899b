#include "assignment_store.hpp"
#include "trader/errors/trading_errors.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>

namespace SellManager {
namespace Core {

namespace {

std::string trim(const std::string& input_string) {
    const char* whitespace_chars = " \t\r\n";
    auto begin_position = input_string.find_first_not_of(whitespace_chars);
    auto end_position = input_string.find_last_not_of(whitespace_chars);
    if (begin_position == std::string::npos) return "";
    return input_string.substr(begin_position, end_position - begin_position + 1);
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return value;
}

std::vector<std::string> split_csv_row(const std::string& row_line) {
    std::vector<std::string> row_fields;
    std::stringstream row_stream(row_line);
    std::string field_value;
    while (std::getline(row_stream, field_value, ',')) {
        row_fields.push_back(trim(field_value));
    }
    if (!row_line.empty() && row_line.back() == ',') {
        row_fields.push_back("");
    }
    return row_fields;
}

const char* const ASSIGNMENT_CSV_HEADER = "ticker,type,length,timeframe";

} // namespace

AssignmentBook::AssignmentBook(std::vector<Assignment> assignment_rows) : assignments(std::move(assignment_rows)) {
    for (size_t row_index = 0; row_index < assignments.size(); ++row_index) {
        index_by_instrument[to_upper(assignments[row_index].instrument_key)] = row_index;
    }
}

const Assignment* AssignmentBook::find(const std::string& instrument_key) const {
    auto index_iterator = index_by_instrument.find(to_upper(instrument_key));
    if (index_iterator == index_by_instrument.end()) {
        return nullptr;
    }
    return &assignments[index_iterator->second];
}

std::vector<std::string> AssignmentBook::instrument_keys() const {
    std::vector<std::string> keys;
    keys.reserve(assignments.size());
    for (const auto& assignment : assignments) {
        keys.push_back(assignment.instrument_key);
    }
    return keys;
}

MovingAverageType parse_moving_average_type(const std::string& ma_type_string) {
    std::string normalized_type = to_upper(trim(ma_type_string));
    if (normalized_type == "SMA") return MovingAverageType::SMA;
    if (normalized_type == "EMA") return MovingAverageType::EMA;
    throw InvalidConfigurationError("type must be SMA or EMA, got '" + ma_type_string + "'");
}

Timeframe parse_timeframe(const std::string& timeframe_string) {
    std::string normalized_timeframe = to_upper(trim(timeframe_string));
    if (normalized_timeframe == "1H" || normalized_timeframe == "H" || normalized_timeframe == "HOURLY") return Timeframe::HOURLY;
    if (normalized_timeframe == "1D" || normalized_timeframe == "D" || normalized_timeframe == "DAILY") return Timeframe::DAILY;
    throw InvalidConfigurationError("timeframe must be 1H or 1D, got '" + timeframe_string + "'");
}

int parse_assignment_length(const std::string& length_string) {
    std::string trimmed_length = trim(length_string);
    int parsed_length = 0;
    try {
        size_t parsed_characters = 0;
        parsed_length = std::stoi(trimmed_length, &parsed_characters);
        if (parsed_characters != trimmed_length.size()) {
            throw InvalidConfigurationError("length is not an integer: '" + length_string + "'");
        }
    } catch (const std::invalid_argument&) {
        throw InvalidConfigurationError("length is not an integer: '" + length_string + "'");
    } catch (const std::out_of_range&) {
        throw InvalidConfigurationError("length out of range: '" + length_string + "'");
    }
    validate_indicator_length(parsed_length);
    return parsed_length;
}

AssignmentStore::AssignmentStore(const std::string& assignments_file_path) : file_path(assignments_file_path) {}

AssignmentLoadReport AssignmentStore::load() const {
    std::lock_guard<std::mutex> lock(file_mutex);
    return load_locked();
}

AssignmentLoadReport AssignmentStore::load_locked() const {
    AssignmentLoadReport load_report;
    std::vector<Assignment> loaded_assignments;

    std::ifstream assignments_file(file_path);
    if (!assignments_file.is_open()) {
        load_report.book = std::make_shared<const AssignmentBook>();
        return load_report;
    }
    load_report.file_found = true;

    std::set<std::string> seen_instruments;
    std::string row_line;
    int line_number = 0;
    while (std::getline(assignments_file, row_line)) {
        ++line_number;
        std::string trimmed_line = trim(row_line);
        if (trimmed_line.empty() || trimmed_line[0] == '#') {
            continue;
        }

        std::vector<std::string> row_fields = split_csv_row(trimmed_line);
        if (!row_fields.empty() && to_upper(row_fields[0]) == "TICKER") {
            continue;
        }

        auto reject_row = [&](const std::string& reason) {
            load_report.rejected_rows.push_back(RejectedAssignmentRow{line_number, trimmed_line, reason});
        };

        if (row_fields.size() != 3 && row_fields.size() != 4) {
            reject_row("expected 4 columns (ticker,type,length,timeframe), found " + std::to_string(row_fields.size()));
            continue;
        }
        if (row_fields[0].empty()) {
            reject_row("missing ticker");
            continue;
        }

        Assignment assignment;
        assignment.instrument_key = row_fields[0];
        try {
            assignment.ma_type = parse_moving_average_type(row_fields[1]);
            assignment.length = parse_assignment_length(row_fields[2]);
            assignment.timeframe = row_fields.size() == 4 && !row_fields[3].empty() ? parse_timeframe(row_fields[3]) : Timeframe::HOURLY;
        } catch (const InvalidConfigurationError& field_error) {
            reject_row(field_error.what());
            continue;
        }

        std::string instrument_identity = to_upper(assignment.instrument_key);
        if (seen_instruments.count(instrument_identity) > 0) {
            reject_row("duplicate ticker " + assignment.instrument_key);
            continue;
        }
        seen_instruments.insert(instrument_identity);
        loaded_assignments.push_back(assignment);
    }

    load_report.book = std::make_shared<const AssignmentBook>(std::move(loaded_assignments));
    return load_report;
}

void AssignmentStore::set_assignment(const Assignment& assignment) {
    if (trim(assignment.instrument_key).empty()) {
        throw InvalidConfigurationError("Assignment requires a ticker");
    }
    validate_indicator_length(assignment.length);

    std::lock_guard<std::mutex> lock(file_mutex);
    AssignmentLoadReport current_report = load_locked();

    std::vector<Assignment> updated_assignments = current_report.book->get_assignments();
    bool replaced_existing = false;
    for (auto& existing_assignment : updated_assignments) {
        if (to_upper(existing_assignment.instrument_key) == to_upper(assignment.instrument_key)) {
            existing_assignment = assignment;
            replaced_existing = true;
            break;
        }
    }
    if (!replaced_existing) {
        updated_assignments.push_back(assignment);
    }

    std::string temporary_path = file_path + ".tmp";
    {
        std::ofstream temporary_file(temporary_path, std::ios::out | std::ios::trunc);
        if (!temporary_file.is_open()) {
            throw CacheWriteError("Failed to open " + temporary_path + " for writing");
        }
        temporary_file << ASSIGNMENT_CSV_HEADER << "\n";
        for (const auto& updated_assignment : updated_assignments) {
            temporary_file << updated_assignment.instrument_key << ","
                           << moving_average_type_to_string(updated_assignment.ma_type) << ","
                           << updated_assignment.length << ","
                           << timeframe_to_string(updated_assignment.timeframe) << "\n";
        }
        temporary_file.flush();
        if (!temporary_file.good()) {
            throw CacheWriteError("Failed to write " + temporary_path);
        }
    }
    if (std::rename(temporary_path.c_str(), file_path.c_str()) != 0) {
        std::remove(temporary_path.c_str());
        throw CacheWriteError("Failed to replace " + file_path);
    }
}

ReconciliationReport reconcile(const AssignmentBook& assignment_book, const std::vector<Position>& positions) {
    ReconciliationReport reconciliation_report;
    std::set<std::string> held_instruments;

    for (const auto& position : positions) {
        if (position.quantity == 0.0) {
            continue;
        }
        held_instruments.insert(to_upper(position.instrument_key));
        if (!assignment_book.find(position.instrument_key)) {
            reconciliation_report.unassigned_positions.push_back(position);
        }
    }
    for (const auto& assignment : assignment_book.get_assignments()) {
        if (held_instruments.count(to_upper(assignment.instrument_key)) == 0) {
            reconciliation_report.assignments_without_position.push_back(assignment);
        }
    }
    return reconciliation_report;
}

AssignmentBookPtr AssignmentRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(book_mutex);
    return current_book;
}

void AssignmentRegistry::publish(AssignmentBookPtr assignment_book) {
    if (!assignment_book) {
        throw std::invalid_argument("Cannot publish a null assignment book");
    }
    std::lock_guard<std::mutex> lock(book_mutex);
    current_book = std::move(assignment_book);
}

} // namespace Core
} // namespace SellManager
