#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace SellManager {
namespace Core {

// Epoch seconds, UTC.
using Timestamp = long long;

struct Bar {
    Timestamp timestamp;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    Bar() : timestamp(0), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}
    Bar(Timestamp ts, double open_value, double high_value, double low_value, double close_value, double volume_value)
        : timestamp(ts), open_price(open_value), high_price(high_value), low_price(low_value),
          close_price(close_value), volume(volume_value) {}

    bool operator==(const Bar& other) const {
        return timestamp == other.timestamp && open_price == other.open_price && high_price == other.high_price &&
               low_price == other.low_price && close_price == other.close_price && volume == other.volume;
    }
    bool operator!=(const Bar& other) const { return !(*this == other); }
};

// Ordered bars of one (instrument, granularity), strictly increasing timestamps.
using Series = std::vector<Bar>;

enum class Granularity {
    HALF_HOUR,
    HOUR,
    DAY
};

std::string granularity_to_string(Granularity granularity);
Granularity parse_granularity(const std::string& granularity_string);
long long granularity_seconds(Granularity granularity);

// "EXCHANGE:TICKER:granularity"
std::string make_cache_key(const std::string& instrument_key, Granularity granularity);

struct InstrumentKey {
    std::string exchange;
    std::string ticker;

    std::string to_string() const { return exchange.empty() ? ticker : exchange + ":" + ticker; }
};

InstrumentKey parse_instrument_key(const std::string& instrument_key_string);

enum class MovingAverageType {
    SMA,
    EMA
};

std::string moving_average_type_to_string(MovingAverageType ma_type);

enum class Timeframe {
    HOURLY,
    DAILY
};

std::string timeframe_to_string(Timeframe timeframe);
Granularity timeframe_granularity(Timeframe timeframe);

struct Assignment {
    std::string instrument_key;
    MovingAverageType ma_type;
    int length;
    Timeframe timeframe;

    Assignment() : ma_type(MovingAverageType::SMA), length(0), timeframe(Timeframe::HOURLY) {}
    Assignment(std::string key, MovingAverageType type, int ma_length, Timeframe frame)
        : instrument_key(std::move(key)), ma_type(type), length(ma_length), timeframe(frame) {}

    std::string indicator_label() const { return moving_average_type_to_string(ma_type) + std::to_string(length); }
};

struct Position {
    std::string instrument_key;
    double quantity;
    double average_cost;

    Position() : quantity(0.0), average_cost(0.0) {}
    Position(std::string key, double position_quantity, double cost)
        : instrument_key(std::move(key)), quantity(position_quantity), average_cost(cost) {}
};

enum class OrderSide {
    BUY,
    SELL
};

std::string order_side_to_string(OrderSide side);

struct Order {
    std::string order_id;
    std::string instrument_key;
    OrderSide side;
    double quantity;
    std::string status;

    Order() : side(OrderSide::SELL), quantity(0.0) {}
};

struct OrderResult {
    bool accepted;
    std::string order_id;
    std::string status;
    std::string error_message;

    OrderResult() : accepted(false) {}
};

// Order built from a positive signal; transmission is decided separately.
struct PreparedOrder {
    std::string instrument_key;
    OrderSide side;
    double quantity;
    std::string order_type;

    PreparedOrder() : side(OrderSide::SELL), quantity(0.0), order_type("MKT") {}
};

struct Signal {
    Timestamp timestamp;
    std::string instrument_key;
    double close;
    MovingAverageType ma_type;
    int ma_length;
    double ma_value;
    double average_cost;
    double distance_pct;
    bool action_prepared;
    std::optional<bool> action_executed;
    std::optional<std::string> order_id;

    Signal() : timestamp(0), close(0.0), ma_type(MovingAverageType::SMA), ma_length(0), ma_value(0.0),
               average_cost(0.0), distance_pct(0.0), action_prepared(false) {}
};

enum class SignalDecision {
    SELL_SIGNAL,
    NO_SIGNAL,
    SKIP
};

std::string signal_decision_to_string(SignalDecision decision);

enum class CadenceTrigger {
    MINUTE,
    TOP_OF_HOUR,
    END_OF_DAY,
    MANUAL
};

std::string cadence_trigger_to_string(CadenceTrigger trigger);

// One line of the signal audit log.
struct SignalRecord {
    Timestamp evaluated_at;
    Timestamp bar_timestamp;
    std::string instrument_key;
    SignalDecision decision;
    std::string reason;
    CadenceTrigger trigger;
    Timeframe timeframe;
    MovingAverageType ma_type;
    int ma_length;
    std::optional<double> close;
    std::optional<double> ma_value;
    std::optional<double> distance_pct;
    std::optional<double> average_cost;
    std::optional<double> quantity;
    bool action_prepared;
    std::optional<bool> action_executed;
    std::optional<std::string> order_id;
    std::vector<std::string> errors;

    SignalRecord() : evaluated_at(0), bar_timestamp(0), decision(SignalDecision::SKIP), trigger(CadenceTrigger::MANUAL),
                     timeframe(Timeframe::HOURLY), ma_type(MovingAverageType::SMA), ma_length(0),
                     action_prepared(false) {}
};

struct HistoricalBarsRequest {
    std::string instrument_key;
    Granularity granularity;
    Timestamp end_time;              // 0 = now
    int max_count;
    int timeout_seconds;

    HistoricalBarsRequest() : granularity(Granularity::HALF_HOUR), end_time(0), max_count(0), timeout_seconds(30) {}
};

} // namespace Core
} // namespace SellManager

#endif // DATA_STRUCTURES_HPP
