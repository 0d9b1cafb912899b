#ifndef SIGNAL_EVALUATOR_HPP
#define SIGNAL_EVALUATOR_HPP

#include <optional>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

struct EvaluationContext {
    Timestamp bar_timestamp;
    std::string instrument_key;
    MovingAverageType ma_type;
    int ma_length;

    EvaluationContext() : bar_timestamp(0), ma_type(MovingAverageType::SMA), ma_length(0) {}
};

/**
 * Break-even sell gate.
 * A signal is raised only when the close has dropped below the moving average while both
 * the close and the average are still above the average cost. All comparisons are strict,
 * and a non-finite input never raises a signal.
 */
std::optional<Signal> evaluate_sell_signal(const EvaluationContext& evaluation_context, double close_price,
                                           double ma_value, double average_cost);

double distance_percent(double close_price, double ma_value);

// Market order selling the whole position.
PreparedOrder prepare_full_close_order(const Position& position);

bool is_open_order_status(const std::string& order_status);
bool has_open_sell_order(const std::vector<Order>& open_orders, const std::string& instrument_key);

} // namespace Core
} // namespace SellManager

#endif // SIGNAL_EVALUATOR_HPP
