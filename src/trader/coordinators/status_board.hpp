#ifndef STATUS_BOARD_HPP
#define STATUS_BOARD_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

struct StatusRow {
    std::string instrument_key;
    std::string indicator_label;
    Timeframe timeframe = Timeframe::HOURLY;
    std::optional<double> close;
    std::optional<Timestamp> bar_timestamp;
    std::optional<double> ma_value;
    std::optional<double> distance_pct;
    std::optional<double> average_cost;
    std::optional<bool> above_break_even;
    std::string last_error;
    Timestamp updated_at = 0;
};

// Latest row per instrument, written by the minute cadence and read for display.
class StatusBoard {
public:
    void update(const StatusRow& status_row);
    void record_error(const std::string& instrument_key, const std::string& error_message, Timestamp updated_at);

    std::optional<StatusRow> find(const std::string& instrument_key) const;
    std::vector<StatusRow> snapshot() const;

    // Drops rows of instruments no longer tracked.
    void retain_only(const std::vector<std::string>& instrument_keys);

private:
    mutable std::mutex rows_mutex;
    std::map<std::string, StatusRow> rows_by_instrument;
};

} // namespace Core
} // namespace SellManager

#endif // STATUS_BOARD_HPP
