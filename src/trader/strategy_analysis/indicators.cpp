#include "indicators.hpp"
#include "trader/errors/trading_errors.hpp"
#include <algorithm>

namespace SellManager {
namespace Core {

const std::vector<int>& supported_indicator_lengths() {
    static const std::vector<int> supported_lengths = {5, 10, 20, 50, 100, 150, 200};
    return supported_lengths;
}

bool is_supported_indicator_length(int length) {
    const std::vector<int>& supported_lengths = supported_indicator_lengths();
    return std::find(supported_lengths.begin(), supported_lengths.end(), length) != supported_lengths.end();
}

int maximum_supported_length() {
    return supported_indicator_lengths().back();
}

void validate_indicator_length(int length) {
    if (!is_supported_indicator_length(length)) {
        throw InvalidConfigurationError("Unsupported moving average length: " + std::to_string(length) +
                                        " (must be one of 5, 10, 20, 50, 100, 150, 200)");
    }
}

double ema_smoothing_factor(int length) {
    return 2.0 / (static_cast<double>(length) + 1.0);
}

double next_ema_value(double close_price, double previous_ema, int length) {
    double smoothing_factor = ema_smoothing_factor(length);
    return close_price * smoothing_factor + previous_ema * (1.0 - smoothing_factor);
}

std::optional<double> compute_sma_at(const Series& series, int length, size_t index) {
    if (length <= 0 || index >= series.size() || index + 1 < static_cast<size_t>(length)) {
        return std::nullopt;
    }
    double close_sum = 0.0;
    for (size_t window_index = index + 1 - static_cast<size_t>(length); window_index <= index; ++window_index) {
        close_sum += series[window_index].close_price;
    }
    return close_sum / static_cast<double>(length);
}

std::optional<double> compute_moving_average(const Series& series, MovingAverageType ma_type, int length, size_t index) {
    validate_indicator_length(length);
    if (index >= series.size()) {
        return std::nullopt;
    }
    if (ma_type == MovingAverageType::SMA) {
        return compute_sma_at(series, length, index);
    }

    size_t seed_index = static_cast<size_t>(length) - 1;
    if (index < seed_index) {
        return std::nullopt;
    }
    std::optional<double> seed_value = compute_sma_at(series, length, seed_index);
    if (!seed_value) {
        return std::nullopt;
    }
    double ema_value = *seed_value;
    for (size_t bar_index = seed_index + 1; bar_index <= index; ++bar_index) {
        ema_value = next_ema_value(series[bar_index].close_price, ema_value, length);
    }
    return ema_value;
}

std::vector<std::optional<double>> compute_moving_average_series(const Series& series, MovingAverageType ma_type, int length) {
    validate_indicator_length(length);
    std::vector<std::optional<double>> values(series.size());
    if (ma_type == MovingAverageType::SMA) {
        for (size_t bar_index = 0; bar_index < series.size(); ++bar_index) {
            values[bar_index] = compute_sma_at(series, length, bar_index);
        }
        return values;
    }

    size_t seed_index = static_cast<size_t>(length) - 1;
    if (series.size() <= seed_index) {
        return values;
    }
    values[seed_index] = compute_sma_at(series, length, seed_index);
    for (size_t bar_index = seed_index + 1; bar_index < series.size(); ++bar_index) {
        values[bar_index] = next_ema_value(series[bar_index].close_price, *values[bar_index - 1], length);
    }
    return values;
}

} // namespace Core
} // namespace SellManager
