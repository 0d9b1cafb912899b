#include "status_board.hpp"
#include <set>

namespace SellManager {
namespace Core {

void StatusBoard::update(const StatusRow& status_row) {
    std::lock_guard<std::mutex> lock(rows_mutex);
    rows_by_instrument[status_row.instrument_key] = status_row;
}

void StatusBoard::record_error(const std::string& instrument_key, const std::string& error_message, Timestamp updated_at) {
    std::lock_guard<std::mutex> lock(rows_mutex);
    StatusRow& status_row = rows_by_instrument[instrument_key];
    status_row.instrument_key = instrument_key;
    status_row.last_error = error_message;
    status_row.updated_at = updated_at;
}

std::optional<StatusRow> StatusBoard::find(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(rows_mutex);
    auto row_iterator = rows_by_instrument.find(instrument_key);
    if (row_iterator == rows_by_instrument.end()) {
        return std::nullopt;
    }
    return row_iterator->second;
}

std::vector<StatusRow> StatusBoard::snapshot() const {
    std::lock_guard<std::mutex> lock(rows_mutex);
    std::vector<StatusRow> status_rows;
    status_rows.reserve(rows_by_instrument.size());
    for (const auto& row_entry : rows_by_instrument) {
        status_rows.push_back(row_entry.second);
    }
    return status_rows;
}

void StatusBoard::retain_only(const std::vector<std::string>& instrument_keys) {
    std::set<std::string> tracked_instruments(instrument_keys.begin(), instrument_keys.end());
    std::lock_guard<std::mutex> lock(rows_mutex);
    for (auto row_iterator = rows_by_instrument.begin(); row_iterator != rows_by_instrument.end();) {
        if (tracked_instruments.count(row_iterator->first) == 0) {
            row_iterator = rows_by_instrument.erase(row_iterator);
        } else {
            ++row_iterator;
        }
    }
}

} // namespace Core
} // namespace SellManager
