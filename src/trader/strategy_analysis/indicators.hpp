#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <optional>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

// Moving-average lengths an assignment may use.
const std::vector<int>& supported_indicator_lengths();
bool is_supported_indicator_length(int length);
int maximum_supported_length();

// Throws InvalidConfigurationError for lengths outside the supported set.
void validate_indicator_length(int length);

double ema_smoothing_factor(int length);

// Mean of the closes in [index - length + 1, index]; absent with fewer than length bars.
std::optional<double> compute_sma_at(const Series& series, int length, size_t index);

// Indicator value at bar index, computed from the start of the series.
// EMA is seeded with the SMA at the first index holding length bars.
std::optional<double> compute_moving_average(const Series& series, MovingAverageType ma_type, int length, size_t index);

// Every value of the series in one pass; same arithmetic as the incremental path.
std::vector<std::optional<double>> compute_moving_average_series(const Series& series, MovingAverageType ma_type, int length);

// One EMA step.
double next_ema_value(double close_price, double previous_ema, int length);

} // namespace Core
} // namespace SellManager

#endif // INDICATORS_HPP
