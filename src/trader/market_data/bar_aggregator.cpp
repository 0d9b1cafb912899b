#include "bar_aggregator.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <tuple>

namespace SellManager {
namespace Core {

BarAggregator::BarAggregator(const ExchangeSessionClock& session_clock, int anchor_minutes)
    : clock(session_clock), anchor_seconds(static_cast<long long>(anchor_minutes) * TimeUtils::SECONDS_PER_MINUTE) {
    if (anchor_minutes < 0 || anchor_minutes >= TimeUtils::MINUTES_PER_HOUR) {
        throw InvalidConfigurationError("Hour bucket anchor must be within [0, 59] minutes, got " + std::to_string(anchor_minutes));
    }
}

Timestamp BarAggregator::hour_bucket_label(Timestamp bar_timestamp) const {
    long long shifted_local = clock.to_local_seconds(bar_timestamp) + anchor_seconds;
    long long label_local = TimeUtils::floor_to_multiple(shifted_local, TimeUtils::SECONDS_PER_HOUR);
    return clock.local_seconds_to_utc(label_local);
}

Timestamp BarAggregator::hour_bucket_start(Timestamp bar_timestamp) const {
    long long shifted_local = clock.to_local_seconds(bar_timestamp) + anchor_seconds;
    long long label_local = TimeUtils::floor_to_multiple(shifted_local, TimeUtils::SECONDS_PER_HOUR);
    return clock.local_seconds_to_utc(label_local - anchor_seconds);
}

Series BarAggregator::aggregate_to_hour(const Series& half_hour_bars) const {
    Series ordered_bars = half_hour_bars;
    std::sort(ordered_bars.begin(), ordered_bars.end(), [](const Bar& left_bar, const Bar& right_bar) {
        return std::tie(left_bar.timestamp, left_bar.open_price, left_bar.high_price, left_bar.low_price, left_bar.close_price, left_bar.volume) <
               std::tie(right_bar.timestamp, right_bar.open_price, right_bar.high_price, right_bar.low_price, right_bar.close_price, right_bar.volume);
    });

    Series hourly_bars;
    for (const Bar& half_hour_bar : ordered_bars) {
        Timestamp bucket_label = hour_bucket_label(half_hour_bar.timestamp);
        if (hourly_bars.empty() || hourly_bars.back().timestamp != bucket_label) {
            hourly_bars.emplace_back(bucket_label, half_hour_bar.open_price, half_hour_bar.high_price,
                                     half_hour_bar.low_price, half_hour_bar.close_price, half_hour_bar.volume);
            continue;
        }
        Bar& hourly_bar = hourly_bars.back();
        hourly_bar.high_price = std::max(hourly_bar.high_price, half_hour_bar.high_price);
        hourly_bar.low_price = std::min(hourly_bar.low_price, half_hour_bar.low_price);
        hourly_bar.close_price = half_hour_bar.close_price;
        hourly_bar.volume += half_hour_bar.volume;
    }
    return hourly_bars;
}

MergeResult aggregate_and_merge(BarCacheStore& cache_store, const BarAggregator& aggregator,
                                const std::string& instrument_key, std::optional<Timestamp> earliest_changed_timestamp) {
    std::string half_hour_key = make_cache_key(instrument_key, Granularity::HALF_HOUR);
    std::string hourly_key = make_cache_key(instrument_key, Granularity::HOUR);

    // Start on a bucket boundary so the first hourly bar is never built from half a bucket
    CacheReadWindow read_window;
    if (earliest_changed_timestamp) {
        read_window = CacheReadWindow::from(aggregator.hour_bucket_start(*earliest_changed_timestamp));
    }
    Series half_hour_bars = cache_store.read(half_hour_key, read_window);
    return cache_store.merge(hourly_key, aggregator.aggregate_to_hour(half_hour_bars));
}

} // namespace Core
} // namespace SellManager
