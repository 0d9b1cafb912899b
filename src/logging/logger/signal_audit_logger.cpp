#include "signal_audit_logger.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace SellManager {
namespace Logging {

namespace {

bool file_ends_without_newline(const std::string& path) {
    std::ifstream existing_file(path, std::ios::binary | std::ios::ate);
    if (!existing_file.is_open()) {
        return false;
    }
    std::streamoff file_size = existing_file.tellg();
    if (file_size <= 0) {
        return false;
    }
    existing_file.seekg(file_size - 1);
    char last_character = '\n';
    existing_file.get(last_character);
    return last_character != '\n';
}

template <typename ValueType>
json optional_to_json(const std::optional<ValueType>& optional_value) {
    if (optional_value) {
        return json(*optional_value);
    }
    return json(nullptr);
}

} // namespace

SignalAuditLogger::SignalAuditLogger(const std::string& audit_file_path) : file_path(audit_file_path) {
    std::filesystem::path parent_directory = std::filesystem::path(file_path).parent_path();
    if (!parent_directory.empty()) {
        std::error_code directory_error;
        std::filesystem::create_directories(parent_directory, directory_error);
        if (directory_error) {
            throw Core::AuditLogError("Failed to create audit log directory " + parent_directory.string() + ": " + directory_error.message());
        }
    }
    needs_leading_newline = file_ends_without_newline(file_path);
    open_stream();
}

SignalAuditLogger::~SignalAuditLogger() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}

void SignalAuditLogger::open_stream() {
    file_stream.open(file_path, std::ios::out | std::ios::app);
    if (!file_stream.is_open()) {
        throw Core::AuditLogError("Failed to open signal audit log: " + file_path);
    }
}

void SignalAuditLogger::append(const Core::SignalRecord& signal_record) {
    std::string record_line = format_signal_record(signal_record);

    std::lock_guard<std::mutex> lock(file_mutex);
    if (!file_stream.is_open() || !file_stream.good()) {
        file_stream.close();
        file_stream.clear();
        needs_leading_newline = file_ends_without_newline(file_path);
        open_stream();
    }
    if (needs_leading_newline) {
        file_stream << '\n';
    }
    file_stream << record_line << '\n';
    file_stream.flush();
    if (!file_stream.good()) {
        needs_leading_newline = true;
        throw Core::AuditLogError("Failed to write signal record for " + signal_record.instrument_key + " to " + file_path);
    }
    needs_leading_newline = false;
}

std::string format_signal_record(const Core::SignalRecord& signal_record) {
    json record_json;
    record_json["timestamp"] = TimeUtils::format_epoch_iso_utc(signal_record.evaluated_at);
    record_json["bar_timestamp"] = signal_record.bar_timestamp > 0 ? json(TimeUtils::format_epoch_iso_utc(signal_record.bar_timestamp)) : json(nullptr);
    record_json["instrument_key"] = signal_record.instrument_key;
    record_json["decision"] = Core::signal_decision_to_string(signal_record.decision);
    record_json["reason"] = signal_record.reason;
    record_json["cadence"] = "hour";
    record_json["trigger"] = Core::cadence_trigger_to_string(signal_record.trigger);
    record_json["timeframe"] = Core::timeframe_to_string(signal_record.timeframe);
    record_json["ma_type"] = Core::moving_average_type_to_string(signal_record.ma_type);
    record_json["ma_length"] = signal_record.ma_length;
    record_json["close"] = optional_to_json(signal_record.close);
    record_json["ma_value"] = optional_to_json(signal_record.ma_value);
    record_json["distance_pct"] = optional_to_json(signal_record.distance_pct);
    record_json["average_cost"] = optional_to_json(signal_record.average_cost);
    record_json["quantity"] = optional_to_json(signal_record.quantity);
    record_json["action_prepared"] = signal_record.action_prepared;
    record_json["action_executed"] = optional_to_json(signal_record.action_executed);
    record_json["order_id"] = optional_to_json(signal_record.order_id);
    record_json["errors"] = signal_record.errors;
    // Broker messages may carry truncated UTF-8; invalid bytes become U+FFFD
    return record_json.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace Logging
} // namespace SellManager
