#include "signal_evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace SellManager {
namespace Core {

std::optional<Signal> evaluate_sell_signal(const EvaluationContext& evaluation_context, double close_price,
                                           double ma_value, double average_cost) {
    if (!std::isfinite(close_price) || !std::isfinite(ma_value) || !std::isfinite(average_cost)) {
        return std::nullopt;
    }

    bool close_below_average = close_price < ma_value;
    bool close_above_cost = close_price > average_cost;
    bool average_above_cost = ma_value > average_cost;
    if (!(close_below_average && close_above_cost && average_above_cost)) {
        return std::nullopt;
    }

    Signal sell_signal;
    sell_signal.timestamp = evaluation_context.bar_timestamp;
    sell_signal.instrument_key = evaluation_context.instrument_key;
    sell_signal.close = close_price;
    sell_signal.ma_type = evaluation_context.ma_type;
    sell_signal.ma_length = evaluation_context.ma_length;
    sell_signal.ma_value = ma_value;
    sell_signal.average_cost = average_cost;
    sell_signal.distance_pct = distance_percent(close_price, ma_value);
    return sell_signal;
}

double distance_percent(double close_price, double ma_value) {
    return (close_price - ma_value) / ma_value * 100.0;
}

PreparedOrder prepare_full_close_order(const Position& position) {
    PreparedOrder prepared_order;
    prepared_order.instrument_key = position.instrument_key;
    prepared_order.side = OrderSide::SELL;
    prepared_order.quantity = std::fabs(position.quantity);
    prepared_order.order_type = "MKT";
    return prepared_order;
}

bool is_open_order_status(const std::string& order_status) {
    std::string normalized_status = order_status;
    std::transform(normalized_status.begin(), normalized_status.end(), normalized_status.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return normalized_status != "filled" && normalized_status != "cancelled" && normalized_status != "inactive" &&
           normalized_status != "apicancelled";
}

bool has_open_sell_order(const std::vector<Order>& open_orders, const std::string& instrument_key) {
    for (const auto& open_order : open_orders) {
        if (open_order.instrument_key == instrument_key && open_order.side == OrderSide::SELL && is_open_order_status(open_order.status)) {
            return true;
        }
    }
    return false;
}

} // namespace Core
} // namespace SellManager
