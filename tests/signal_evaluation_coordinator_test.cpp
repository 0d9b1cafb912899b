#include <gtest/gtest.h>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "logging/logger/signal_audit_logger.hpp"
#include "support/test_support.hpp"
#include "trader/coordinators/signal_evaluation_coordinator.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager;
using namespace SellManager::Core;
using SellManager::Testing::make_series;
using TimeUtils::make_utc_timestamp;

namespace {

const Timestamp FIRST_HOURLY_BAR = 1704726000;    // 2024-01-08 15:00 UTC
const Timestamp LAST_HOURLY_BAR = FIRST_HOURLY_BAR + 9 * 3600;
const Timestamp TOP_OF_HOUR_TIME = 1704762000;    // 2024-01-09 01:00 UTC

class SignalEvaluationCoordinatorTest : public ::testing::Test {
protected:
    SignalEvaluationCoordinatorTest()
        : session_clock(Testing::eastern_session_config()),
          position_source(std::make_shared<Testing::FakePositionSource>()),
          cache_store(work_directory.file("cache")),
          audit_logger(work_directory.file("logs/signals.jsonl")) {
        Testing::install_test_logging_context();

        // Falling closes 120 .. 111; SMA5 of the last five is 113
        cache_store.merge(make_cache_key("NASDAQ:AAPL", Granularity::HOUR), make_series(FIRST_HOURLY_BAR, 3600, 10, 120.0, -1.0));
        // Rising closes 50 .. 59 dated 2024-01-01 .. 2024-01-10
        cache_store.merge(make_cache_key("NYSE:KO", Granularity::DAY), make_series(make_utc_timestamp(2024, 1, 1, 0, 0, 0), 86400, 10, 50.0, 1.0));

        publish({Assignment("NASDAQ:AAPL", MovingAverageType::SMA, 5, Timeframe::HOURLY),
                 Assignment("NYSE:KO", MovingAverageType::SMA, 5, Timeframe::DAILY)});
        position_source->set_positions({Position("NASDAQ:AAPL", 10.0, 100.0), Position("NYSE:KO", 4.0, 40.0)});
    }

    void publish(const std::vector<Assignment>& assignments) {
        assignment_registry.publish(std::make_shared<const AssignmentBook>(assignments));
    }

    std::unique_ptr<SignalEvaluationCoordinator> make_coordinator(API::OrderSinkPtr order_sink = nullptr,
                                                                  Logging::SignalAuditLogger* logger = nullptr) {
        SignalEvaluationDependencies dependencies{
            cache_store,
            assignment_registry,
            indicator_cache,
            position_source,
            order_sink,
            logger ? *logger : audit_logger,
            session_clock
        };
        return std::make_unique<SignalEvaluationCoordinator>(dependencies, stop_signal);
    }

    std::vector<nlohmann::json> audit_records() const {
        std::vector<nlohmann::json> records;
        for (const auto& line : Testing::read_lines(audit_logger.get_file_path())) {
            records.push_back(nlohmann::json::parse(line));
        }
        return records;
    }

    Testing::TemporaryDirectory work_directory;
    ExchangeSessionClock session_clock;
    std::shared_ptr<Testing::FakePositionSource> position_source;
    Threads::StopSignal stop_signal;
    BarCacheStore cache_store;
    AssignmentRegistry assignment_registry;
    IndicatorCache indicator_cache;
    Logging::SignalAuditLogger audit_logger;
};

} // namespace

TEST(SignalEvaluationSchedule, TimeframesFollowTheTrigger) {
    EXPECT_FALSE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::MINUTE, Timeframe::HOURLY));
    EXPECT_FALSE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::MINUTE, Timeframe::DAILY));
    EXPECT_TRUE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::TOP_OF_HOUR, Timeframe::HOURLY));
    EXPECT_FALSE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::TOP_OF_HOUR, Timeframe::DAILY));
    EXPECT_TRUE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::END_OF_DAY, Timeframe::HOURLY));
    EXPECT_TRUE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::END_OF_DAY, Timeframe::DAILY));
    EXPECT_TRUE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::MANUAL, Timeframe::HOURLY));
    EXPECT_TRUE(SignalEvaluationCoordinator::evaluates_timeframe(CadenceTrigger::MANUAL, Timeframe::DAILY));
}

TEST(SelectEvaluationBar, PicksLatestBarAtOrBeforeEvaluationTime) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());
    Series hourly_series = make_series(FIRST_HOURLY_BAR, 3600, 10);

    EXPECT_EQ(select_evaluation_bar(hourly_series, Timeframe::HOURLY, TOP_OF_HOUR_TIME, session_clock), std::optional<size_t>(9));
    EXPECT_EQ(select_evaluation_bar(hourly_series, Timeframe::HOURLY, LAST_HOURLY_BAR, session_clock), std::optional<size_t>(9));
    EXPECT_EQ(select_evaluation_bar(hourly_series, Timeframe::HOURLY, LAST_HOURLY_BAR - 1, session_clock), std::optional<size_t>(8));
    EXPECT_FALSE(select_evaluation_bar(hourly_series, Timeframe::HOURLY, FIRST_HOURLY_BAR - 1, session_clock).has_value());
    EXPECT_FALSE(select_evaluation_bar(Series(), Timeframe::HOURLY, TOP_OF_HOUR_TIME, session_clock).has_value());
}

TEST(SelectEvaluationBar, DailyBarDatedTodayIsPassedOverBeforeTheOpen) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());
    Series daily_series = make_series(make_utc_timestamp(2024, 1, 1, 0, 0, 0), 86400, 10);

    // 08:00 and 16:00 New York on 2024-01-10
    Timestamp before_open = make_utc_timestamp(2024, 1, 10, 13, 0, 0);
    Timestamp after_open = make_utc_timestamp(2024, 1, 10, 21, 0, 0);

    EXPECT_EQ(select_evaluation_bar(daily_series, Timeframe::DAILY, before_open, session_clock), std::optional<size_t>(8));
    EXPECT_EQ(select_evaluation_bar(daily_series, Timeframe::DAILY, after_open, session_clock), std::optional<size_t>(9));
    // The same rule does not touch hourly series
    EXPECT_EQ(select_evaluation_bar(daily_series, Timeframe::HOURLY, before_open, session_clock), std::optional<size_t>(9));

    Series only_today(daily_series.end() - 1, daily_series.end());
    EXPECT_FALSE(select_evaluation_bar(only_today, Timeframe::DAILY, before_open, session_clock).has_value());
}

TEST_F(SignalEvaluationCoordinatorTest, MinuteTriggerEvaluatesNothing) {
    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::MINUTE, TOP_OF_HOUR_TIME);

    EXPECT_EQ(evaluation_summary.evaluated_count, 0u);
    EXPECT_TRUE(evaluation_summary.records.empty());
    EXPECT_EQ(position_source->position_calls(), 0);
    EXPECT_TRUE(audit_records().empty());
}

TEST_F(SignalEvaluationCoordinatorTest, SellSignalWithoutSinkIsOnlyPrepared) {
    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.evaluated_count, 1u);
    EXPECT_EQ(evaluation_summary.signal_count, 1u);
    EXPECT_EQ(evaluation_summary.orders_transmitted, 0u);

    const SignalRecord& signal_record = evaluation_summary.records[0];
    EXPECT_EQ(signal_record.instrument_key, "NASDAQ:AAPL");
    EXPECT_EQ(signal_record.decision, SignalDecision::SELL_SIGNAL);
    EXPECT_EQ(signal_record.reason, "close_below_ma_above_cost");
    EXPECT_EQ(signal_record.bar_timestamp, LAST_HOURLY_BAR);
    EXPECT_DOUBLE_EQ(*signal_record.close, 111.0);
    EXPECT_DOUBLE_EQ(*signal_record.ma_value, 113.0);
    EXPECT_NEAR(*signal_record.distance_pct, -200.0 / 113.0, 1e-9);
    EXPECT_DOUBLE_EQ(*signal_record.average_cost, 100.0);
    EXPECT_DOUBLE_EQ(*signal_record.quantity, 10.0);
    EXPECT_TRUE(signal_record.action_prepared);
    EXPECT_FALSE(signal_record.action_executed.has_value());
    EXPECT_FALSE(signal_record.order_id.has_value());

    std::vector<nlohmann::json> records = audit_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["decision"], "SellSignal");
    EXPECT_EQ(records[0]["trigger"], "top_of_hour");
    EXPECT_EQ(records[0]["instrument_key"], "NASDAQ:AAPL");
    EXPECT_EQ(records[0]["bar_timestamp"], "2024-01-09T00:00:00Z");
    EXPECT_TRUE(records[0]["action_prepared"].get<bool>());
    EXPECT_TRUE(records[0]["action_executed"].is_null());
}

TEST_F(SignalEvaluationCoordinatorTest, SellSignalIsTransmittedThroughSink) {
    // Position keys from the broker may differ in case
    position_source->set_positions({Position("nasdaq:aapl", 10.0, 100.0)});
    auto order_sink = std::make_shared<Testing::FakeOrderSink>();

    EvaluationSummary evaluation_summary = make_coordinator(order_sink)->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    const SignalRecord& signal_record = evaluation_summary.records[0];
    EXPECT_EQ(signal_record.decision, SignalDecision::SELL_SIGNAL);
    EXPECT_EQ(signal_record.action_executed, std::optional<bool>(true));
    EXPECT_EQ(signal_record.order_id, std::optional<std::string>("1001"));
    EXPECT_EQ(evaluation_summary.orders_transmitted, 1u);

    std::vector<Testing::PlacedOrder> placed_orders = order_sink->get_placed_orders();
    ASSERT_EQ(placed_orders.size(), 1u);
    EXPECT_EQ(placed_orders[0].side, OrderSide::SELL);
    EXPECT_DOUBLE_EQ(placed_orders[0].quantity, 10.0);

    std::vector<nlohmann::json> records = audit_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0]["action_executed"].get<bool>());
    EXPECT_EQ(records[0]["order_id"], "1001");
}

TEST_F(SignalEvaluationCoordinatorTest, OpenSellOrderBlocksDuplicate) {
    Order open_order;
    open_order.order_id = "77";
    open_order.instrument_key = "NASDAQ:AAPL";
    open_order.side = OrderSide::SELL;
    open_order.quantity = 10.0;
    open_order.status = "Submitted";
    position_source->set_open_orders({open_order});
    auto order_sink = std::make_shared<Testing::FakeOrderSink>();

    EvaluationSummary evaluation_summary = make_coordinator(order_sink)->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    const SignalRecord& signal_record = evaluation_summary.records[0];
    EXPECT_EQ(signal_record.decision, SignalDecision::SELL_SIGNAL);
    EXPECT_EQ(signal_record.action_executed, std::optional<bool>(false));
    ASSERT_EQ(signal_record.errors.size(), 1u);
    EXPECT_EQ(signal_record.errors[0], "open sell order already exists");
    EXPECT_TRUE(order_sink->get_placed_orders().empty());
    EXPECT_EQ(evaluation_summary.orders_transmitted, 0u);
}

TEST_F(SignalEvaluationCoordinatorTest, FilledSellOrderDoesNotBlock) {
    Order filled_order;
    filled_order.instrument_key = "NASDAQ:AAPL";
    filled_order.side = OrderSide::SELL;
    filled_order.status = "Filled";
    position_source->set_open_orders({filled_order});
    auto order_sink = std::make_shared<Testing::FakeOrderSink>();

    EvaluationSummary evaluation_summary = make_coordinator(order_sink)->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    EXPECT_EQ(evaluation_summary.orders_transmitted, 1u);
    EXPECT_EQ(order_sink->get_placed_orders().size(), 1u);
}

TEST_F(SignalEvaluationCoordinatorTest, RejectedOrderIsRecorded) {
    auto order_sink = std::make_shared<Testing::FakeOrderSink>();
    OrderResult rejected_result;
    rejected_result.accepted = false;
    rejected_result.error_message = "rejected by broker";
    order_sink->set_result(rejected_result);

    EvaluationSummary evaluation_summary = make_coordinator(order_sink)->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    const SignalRecord& signal_record = evaluation_summary.records[0];
    EXPECT_EQ(signal_record.action_executed, std::optional<bool>(false));
    EXPECT_FALSE(signal_record.order_id.has_value());
    ASSERT_EQ(signal_record.errors.size(), 1u);
    EXPECT_EQ(signal_record.errors[0], "rejected by broker");
    EXPECT_EQ(evaluation_summary.orders_transmitted, 0u);
}

TEST_F(SignalEvaluationCoordinatorTest, NoSignalReasonsNameTheFailedCondition) {
    position_source->set_positions({Position("NASDAQ:AAPL", 10.0, 115.0), Position("NYSE:KO", 4.0, 40.0)});

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::END_OF_DAY, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 2u);
    EXPECT_EQ(evaluation_summary.signal_count, 0u);
    EXPECT_EQ(evaluation_summary.records[0].decision, SignalDecision::NO_SIGNAL);
    EXPECT_EQ(evaluation_summary.records[0].reason, "close_not_above_cost");
    EXPECT_EQ(evaluation_summary.records[1].instrument_key, "NYSE:KO");
    EXPECT_EQ(evaluation_summary.records[1].decision, SignalDecision::NO_SIGNAL);
    EXPECT_EQ(evaluation_summary.records[1].reason, "close_not_below_ma");
    EXPECT_FALSE(evaluation_summary.records[1].action_prepared);

    std::vector<nlohmann::json> records = audit_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["decision"], "NoSignal");
    EXPECT_EQ(records[1]["trigger"], "end_of_day");
    EXPECT_EQ(records[1]["timeframe"], "1D");
}

TEST_F(SignalEvaluationCoordinatorTest, DailyEvaluationBeforeOpenUsesPreviousDay) {
    // 08:00 New York on 2024-01-10; the 2024-01-10 bar is still forming
    Timestamp before_open = make_utc_timestamp(2024, 1, 10, 13, 0, 0);
    publish({Assignment("NYSE:KO", MovingAverageType::SMA, 5, Timeframe::DAILY)});

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::MANUAL, before_open);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    EXPECT_EQ(evaluation_summary.records[0].bar_timestamp, make_utc_timestamp(2024, 1, 9, 0, 0, 0));
    EXPECT_DOUBLE_EQ(*evaluation_summary.records[0].close, 58.0);
    EXPECT_DOUBLE_EQ(*evaluation_summary.records[0].ma_value, 56.0);
}

TEST_F(SignalEvaluationCoordinatorTest, UnavailablePositionsSkipEveryAssignment) {
    position_source->fail_with(std::make_exception_ptr(BrokerConnectionError("gateway unreachable")));

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::MANUAL, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 2u);
    EXPECT_EQ(evaluation_summary.skipped_count, 2u);
    for (const auto& signal_record : evaluation_summary.records) {
        EXPECT_EQ(signal_record.decision, SignalDecision::SKIP);
        EXPECT_EQ(signal_record.reason, "positions_unavailable");
        ASSERT_EQ(signal_record.errors.size(), 1u);
        EXPECT_EQ(signal_record.errors[0], "gateway unreachable");
    }

    std::vector<nlohmann::json> records = audit_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["decision"], "Skip");
    EXPECT_TRUE(records[0]["close"].is_null());
    EXPECT_EQ(records[0]["errors"][0], "gateway unreachable");
}

TEST_F(SignalEvaluationCoordinatorTest, BrokerMessageWithBrokenUtf8IsStillAudited) {
    publish({Assignment("NASDAQ:AAPL", MovingAverageType::SMA, 5, Timeframe::HOURLY),
             Assignment("NASDAQ:MSFT", MovingAverageType::SMA, 5, Timeframe::HOURLY)});
    position_source->fail_with(std::make_exception_ptr(std::runtime_error("HTTP 503: caf\xC3")));

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    EXPECT_EQ(evaluation_summary.evaluated_count, 2u);
    EXPECT_EQ(evaluation_summary.audit_failures, 0u);
    std::vector<nlohmann::json> records = audit_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["reason"], "positions_unavailable");
    EXPECT_EQ(records[1]["instrument_key"], "NASDAQ:MSFT");
    EXPECT_EQ(records[1]["errors"][0], "HTTP 503: caf\xEF\xBF\xBD");
}

TEST_F(SignalEvaluationCoordinatorTest, MovingAverageIsReadFromTheIndicatorTrack) {
    // Track built from closes 130 .. 121, so its SMA5 at the last bar is 123 rather than 113
    indicator_cache.update(make_cache_key("NASDAQ:AAPL", Granularity::HOUR), make_series(FIRST_HOURLY_BAR, 3600, 10, 130.0, -1.0),
                           MovingAverageType::SMA, 5, std::nullopt);

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    EXPECT_DOUBLE_EQ(*evaluation_summary.records[0].ma_value, 123.0);
    EXPECT_EQ(evaluation_summary.records[0].decision, SignalDecision::SELL_SIGNAL);
}

TEST_F(SignalEvaluationCoordinatorTest, TrackWithoutTheEvaluatedBarFallsBackToTheSeries) {
    Series lagging_series = make_series(FIRST_HOURLY_BAR, 3600, 9, 130.0, -1.0);
    indicator_cache.update(make_cache_key("NASDAQ:AAPL", Granularity::HOUR), lagging_series, MovingAverageType::SMA, 5, std::nullopt);

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    EXPECT_DOUBLE_EQ(*evaluation_summary.records[0].ma_value, 113.0);
}

TEST_F(SignalEvaluationCoordinatorTest, MissingOrFlatPositionIsSkipped) {
    position_source->set_positions({Position("NASDAQ:AAPL", 0.0, 100.0)});

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::MANUAL, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 2u);
    EXPECT_EQ(evaluation_summary.records[0].reason, "no_position");
    EXPECT_EQ(evaluation_summary.records[1].reason, "no_position");
    EXPECT_FALSE(evaluation_summary.records[0].quantity.has_value());
}

TEST_F(SignalEvaluationCoordinatorTest, ShortHistoryIsInsufficientData) {
    publish({Assignment("NASDAQ:AAPL", MovingAverageType::SMA, 20, Timeframe::HOURLY),
             Assignment("NASDAQ:MSFT", MovingAverageType::EMA, 5, Timeframe::HOURLY)});
    position_source->set_positions({Position("NASDAQ:AAPL", 10.0, 100.0), Position("NASDAQ:MSFT", 3.0, 300.0)});

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 2u);
    const SignalRecord& short_record = evaluation_summary.records[0];
    EXPECT_EQ(short_record.reason, "insufficient_data");
    EXPECT_EQ(short_record.bar_timestamp, LAST_HOURLY_BAR);
    EXPECT_FALSE(short_record.ma_value.has_value());
    ASSERT_EQ(short_record.errors.size(), 1u);
    EXPECT_EQ(short_record.errors[0], "need 20 bars, have 10");

    // Nothing cached at all
    EXPECT_EQ(evaluation_summary.records[1].reason, "insufficient_data");
    EXPECT_EQ(evaluation_summary.records[1].bar_timestamp, 0);
}

TEST_F(SignalEvaluationCoordinatorTest, CorruptCacheIsSkippedAndOthersContinue) {
    Testing::write_text_file(cache_store.cache_file_path(make_cache_key("NASDAQ:AAPL", Granularity::HOUR)), "not a bar\n");

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::MANUAL, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 2u);
    EXPECT_EQ(evaluation_summary.records[0].reason, "cache_corruption");
    EXPECT_FALSE(evaluation_summary.records[0].errors.empty());
    EXPECT_EQ(evaluation_summary.records[1].decision, SignalDecision::NO_SIGNAL);
}

TEST_F(SignalEvaluationCoordinatorTest, NonFiniteCostIsInvalidValues) {
    position_source->set_positions({Position("NASDAQ:AAPL", 10.0, std::numeric_limits<double>::quiet_NaN())});
    publish({Assignment("NASDAQ:AAPL", MovingAverageType::SMA, 5, Timeframe::HOURLY)});

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::TOP_OF_HOUR, TOP_OF_HOUR_TIME);

    ASSERT_EQ(evaluation_summary.records.size(), 1u);
    EXPECT_EQ(evaluation_summary.records[0].decision, SignalDecision::SKIP);
    EXPECT_EQ(evaluation_summary.records[0].reason, "invalid_values");
}

TEST_F(SignalEvaluationCoordinatorTest, StopRequestEndsTheRun) {
    stop_signal.request_stop();

    EvaluationSummary evaluation_summary = make_coordinator()->run_evaluation(CadenceTrigger::MANUAL, TOP_OF_HOUR_TIME);

    EXPECT_EQ(evaluation_summary.evaluated_count, 0u);
    EXPECT_TRUE(audit_records().empty());
}

TEST_F(SignalEvaluationCoordinatorTest, AuditWriteFailureIsCountedNotFatal) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    Logging::SignalAuditLogger full_device_logger("/dev/full");

    EvaluationSummary evaluation_summary = make_coordinator(nullptr, &full_device_logger)->run_evaluation(CadenceTrigger::MANUAL, TOP_OF_HOUR_TIME);

    EXPECT_EQ(evaluation_summary.evaluated_count, 2u);
    EXPECT_EQ(evaluation_summary.audit_failures, 2u);
    EXPECT_EQ(evaluation_summary.signal_count, 1u);
}
