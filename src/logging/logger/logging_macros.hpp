#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace SellManager {
namespace Logging {

constexpr size_t TABLE_LABEL_WIDTH = 17;
constexpr size_t TABLE_VALUE_WIDTH = 48;

// Truncates or pads to exactly column_width characters
inline std::string fit_table_cell(const std::string& cell_text, size_t column_width) {
    std::string fitted_text = cell_text.substr(0, column_width);
    fitted_text.append(column_width - fitted_text.size(), ' ');
    return fitted_text;
}

inline std::string format_table_row(const std::string& label, const std::string& value) {
    return "│ " + fit_table_cell(label, TABLE_LABEL_WIDTH) + " │ " + fit_table_cell(value, TABLE_VALUE_WIDTH) + " │";
}

} // namespace Logging
} // namespace SellManager

// Section blocks shared by the cadence handlers
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SEPARATOR() log_message("|", "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

#define LOG_THREAD_BACKFILL_HEADER() LOG_THREAD_SECTION_HEADER("HISTORICAL BACKFILL")
#define LOG_THREAD_MINUTE_REFRESH_HEADER() LOG_THREAD_SECTION_HEADER("MINUTE REFRESH")
#define LOG_THREAD_SIGNAL_EVALUATION_HEADER(trigger) LOG_THREAD_SECTION_HEADER("SIGNAL EVALUATION - " + std::string(trigger))

// Two-column tables: 17-character label, 48-character value
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬──────────────────────────────────────────────────┐"); \
    LOG_THREAD_CONTENT(SellManager::Logging::format_table_row(title, subtitle)); \
    LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while(0)

#define TABLE_ROW_48(label, value) LOG_THREAD_CONTENT(SellManager::Logging::format_table_row(label, value))

#define TABLE_SEPARATOR_48() LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤")

#define TABLE_FOOTER_48() LOG_THREAD_CONTENT("└───────────────────┴──────────────────────────────────────────────────┘")

#endif // LOGGING_MACROS_HPP
