#include "data_structures.hpp"
#include "trader/errors/trading_errors.hpp"
#include <algorithm>
#include <cctype>

namespace SellManager {
namespace Core {

std::string granularity_to_string(Granularity granularity) {
    switch (granularity) {
        case Granularity::HALF_HOUR:
            return "30m";
        case Granularity::HOUR:
            return "1h";
        case Granularity::DAY:
            return "1d";
    }
    throw std::runtime_error("Unknown granularity value");
}

Granularity parse_granularity(const std::string& granularity_string) {
    std::string normalized_value = granularity_string;
    std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (normalized_value == "30m" || normalized_value == "30min") return Granularity::HALF_HOUR;
    if (normalized_value == "1h" || normalized_value == "60m") return Granularity::HOUR;
    if (normalized_value == "1d") return Granularity::DAY;
    throw InvalidConfigurationError("Unsupported granularity: '" + granularity_string + "' (must be 30m, 1h or 1d)");
}

long long granularity_seconds(Granularity granularity) {
    switch (granularity) {
        case Granularity::HALF_HOUR:
            return 30LL * 60LL;
        case Granularity::HOUR:
            return 60LL * 60LL;
        case Granularity::DAY:
            return 24LL * 60LL * 60LL;
    }
    throw std::runtime_error("Unknown granularity value");
}

std::string make_cache_key(const std::string& instrument_key, Granularity granularity) {
    return instrument_key + ":" + granularity_to_string(granularity);
}

InstrumentKey parse_instrument_key(const std::string& instrument_key_string) {
    InstrumentKey parsed_key;
    size_t separator_position = instrument_key_string.find(':');
    if (separator_position == std::string::npos) {
        parsed_key.ticker = instrument_key_string;
        return parsed_key;
    }
    parsed_key.exchange = instrument_key_string.substr(0, separator_position);
    parsed_key.ticker = instrument_key_string.substr(separator_position + 1);
    return parsed_key;
}

std::string moving_average_type_to_string(MovingAverageType ma_type) {
    return ma_type == MovingAverageType::EMA ? "EMA" : "SMA";
}

std::string timeframe_to_string(Timeframe timeframe) {
    return timeframe == Timeframe::DAILY ? "1D" : "1H";
}

Granularity timeframe_granularity(Timeframe timeframe) {
    return timeframe == Timeframe::DAILY ? Granularity::DAY : Granularity::HOUR;
}

std::string order_side_to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

std::string signal_decision_to_string(SignalDecision decision) {
    switch (decision) {
        case SignalDecision::SELL_SIGNAL:
            return "SellSignal";
        case SignalDecision::NO_SIGNAL:
            return "NoSignal";
        case SignalDecision::SKIP:
            return "Skip";
    }
    return "Skip";
}

std::string cadence_trigger_to_string(CadenceTrigger trigger) {
    switch (trigger) {
        case CadenceTrigger::MINUTE:
            return "minute";
        case CadenceTrigger::TOP_OF_HOUR:
            return "top_of_hour";
        case CadenceTrigger::END_OF_DAY:
            return "end_of_day";
        case CadenceTrigger::MANUAL:
            return "manual";
    }
    return "manual";
}

} // namespace Core
} // namespace SellManager
