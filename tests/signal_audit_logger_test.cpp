#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "logging/logger/signal_audit_logger.hpp"
#include "support/test_support.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"

using json = nlohmann::json;
using namespace SellManager;
using namespace SellManager::Core;
using SellManager::Logging::SignalAuditLogger;
using SellManager::Logging::format_signal_record;

namespace {

SignalRecord make_sell_record() {
    SignalRecord signal_record;
    signal_record.evaluated_at = TimeUtils::make_utc_timestamp(2024, 1, 8, 16, 0, 0);
    signal_record.bar_timestamp = TimeUtils::make_utc_timestamp(2024, 1, 8, 15, 0, 0);
    signal_record.instrument_key = "NASDAQ:AAPL";
    signal_record.decision = SignalDecision::SELL_SIGNAL;
    signal_record.reason = "close_below_ma_above_cost";
    signal_record.trigger = CadenceTrigger::TOP_OF_HOUR;
    signal_record.timeframe = Timeframe::HOURLY;
    signal_record.ma_type = MovingAverageType::SMA;
    signal_record.ma_length = 50;
    signal_record.close = 105.0;
    signal_record.ma_value = 110.0;
    signal_record.distance_pct = -4.5;
    signal_record.average_cost = 100.0;
    signal_record.quantity = 12.0;
    signal_record.action_prepared = true;
    return signal_record;
}

} // namespace

TEST(SignalAuditLoggerTest, RecordCarriesEveryField) {
    json record_json = json::parse(format_signal_record(make_sell_record()));

    EXPECT_EQ(record_json["timestamp"], "2024-01-08T16:00:00Z");
    EXPECT_EQ(record_json["bar_timestamp"], "2024-01-08T15:00:00Z");
    EXPECT_EQ(record_json["instrument_key"], "NASDAQ:AAPL");
    EXPECT_EQ(record_json["decision"], "SellSignal");
    EXPECT_EQ(record_json["reason"], "close_below_ma_above_cost");
    EXPECT_EQ(record_json["cadence"], "hour");
    EXPECT_EQ(record_json["trigger"], "top_of_hour");
    EXPECT_EQ(record_json["timeframe"], "1H");
    EXPECT_EQ(record_json["ma_type"], "SMA");
    EXPECT_EQ(record_json["ma_length"], 50);
    EXPECT_DOUBLE_EQ(record_json["close"].get<double>(), 105.0);
    EXPECT_DOUBLE_EQ(record_json["ma_value"].get<double>(), 110.0);
    EXPECT_DOUBLE_EQ(record_json["average_cost"].get<double>(), 100.0);
    EXPECT_DOUBLE_EQ(record_json["quantity"].get<double>(), 12.0);
    EXPECT_EQ(record_json["action_prepared"], true);
    EXPECT_TRUE(record_json["action_executed"].is_null());
    EXPECT_TRUE(record_json["order_id"].is_null());
    EXPECT_TRUE(record_json["errors"].is_array());
    EXPECT_TRUE(record_json["errors"].empty());
}

TEST(SignalAuditLoggerTest, InvalidUtf8InErrorsIsReplaced) {
    SignalRecord signal_record = make_sell_record();
    signal_record.errors.push_back("HTTP 503: caf\xC3");

    json record_json = json::parse(format_signal_record(signal_record));

    ASSERT_EQ(record_json["errors"].size(), 1u);
    EXPECT_EQ(record_json["errors"][0], "HTTP 503: caf\xEF\xBF\xBD");
}

TEST(SignalAuditLoggerTest, SkipRecordLeavesMissingValuesNull) {
    SignalRecord skip_record;
    skip_record.evaluated_at = TimeUtils::make_utc_timestamp(2024, 1, 8, 16, 0, 0);
    skip_record.instrument_key = "NYSE:KO";
    skip_record.reason = "no_position";

    json record_json = json::parse(format_signal_record(skip_record));

    EXPECT_EQ(record_json["decision"], "Skip");
    EXPECT_TRUE(record_json["bar_timestamp"].is_null());
    EXPECT_TRUE(record_json["close"].is_null());
    EXPECT_TRUE(record_json["distance_pct"].is_null());
    EXPECT_EQ(record_json["action_prepared"], false);
}

TEST(SignalAuditLoggerTest, AppendsOneLinePerRecord) {
    Testing::TemporaryDirectory audit_directory;
    std::string audit_path = audit_directory.file("audit/signals.jsonl");

    {
        SignalAuditLogger audit_logger(audit_path);
        audit_logger.append(make_sell_record());
        SignalRecord executed_record = make_sell_record();
        executed_record.action_executed = true;
        executed_record.order_id = std::string("1001");
        audit_logger.append(executed_record);
    }

    std::vector<std::string> audit_lines = Testing::read_lines(audit_path);
    ASSERT_EQ(audit_lines.size(), 2u);
    json second_record = json::parse(audit_lines[1]);
    EXPECT_EQ(second_record["action_executed"], true);
    EXPECT_EQ(second_record["order_id"], "1001");
}

TEST(SignalAuditLoggerTest, RepairsTruncatedLastLineBeforeAppending) {
    Testing::TemporaryDirectory audit_directory;
    std::string audit_path = audit_directory.file("signals.jsonl");
    Testing::write_text_file(audit_path, format_signal_record(make_sell_record()) + "\n{\"timestamp\":\"2024-01");

    SignalAuditLogger audit_logger(audit_path);
    audit_logger.append(make_sell_record());

    std::vector<std::string> audit_lines = Testing::read_lines(audit_path);
    ASSERT_EQ(audit_lines.size(), 3u);
    EXPECT_NO_THROW(json::parse(audit_lines[0]));
    EXPECT_NO_THROW(json::parse(audit_lines[2]));
    EXPECT_EQ(audit_lines[1], "{\"timestamp\":\"2024-01");
}

TEST(SignalAuditLoggerTest, UnwritableLocationThrows) {
    Testing::TemporaryDirectory audit_directory;
    std::string blocking_file = audit_directory.file("not_a_directory");
    Testing::write_text_file(blocking_file, "x");

    EXPECT_THROW(SignalAuditLogger(blocking_file + "/signals.jsonl"), AuditLogError);
}
