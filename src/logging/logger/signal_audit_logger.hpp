#ifndef SIGNAL_AUDIT_LOGGER_HPP
#define SIGNAL_AUDIT_LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Logging {

/**
 * Append-only signal audit log, one JSON object per line.
 * Each record is flushed before append() returns. A file left without a trailing newline
 * by an interrupted write gets one before the next record, so earlier lines stay parseable.
 */
class SignalAuditLogger {
private:
    std::string file_path;
    std::ofstream file_stream;
    std::mutex file_mutex;
    bool needs_leading_newline = false;

    void open_stream();

public:
    explicit SignalAuditLogger(const std::string& audit_file_path);
    ~SignalAuditLogger();

    SignalAuditLogger() = delete;
    SignalAuditLogger(const SignalAuditLogger&) = delete;
    SignalAuditLogger& operator=(const SignalAuditLogger&) = delete;

    // Throws AuditLogError when the record cannot be written.
    void append(const Core::SignalRecord& signal_record);

    const std::string& get_file_path() const { return file_path; }
};

// Single-line JSON form of a record, without the trailing newline.
std::string format_signal_record(const Core::SignalRecord& signal_record);

} // namespace Logging
} // namespace SellManager

#endif // SIGNAL_AUDIT_LOGGER_HPP
