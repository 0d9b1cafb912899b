#include "indicator_cache.hpp"
#include "indicators.hpp"
#include <algorithm>

namespace SellManager {
namespace Core {

IndicatorTrack::IndicatorTrack(MovingAverageType ma_type, int length)
    : track_ma_type(ma_type), track_length(length) {
    validate_indicator_length(length);
}

size_t IndicatorTrack::reusable_prefix_length(const Series& series, std::optional<Timestamp> earliest_changed_timestamp) const {
    size_t keep_count = std::min(points.size(), series.size());
    if (earliest_changed_timestamp) {
        auto first_changed_iterator = std::lower_bound(points.begin(), points.end(), *earliest_changed_timestamp,
            [](const IndicatorPoint& point, Timestamp changed_timestamp) { return point.timestamp < changed_timestamp; });
        keep_count = std::min(keep_count, static_cast<size_t>(first_changed_iterator - points.begin()));
    }
    if (keep_count == 0) {
        return 0;
    }
    // History prepended or replaced underneath us: start over
    if (points.front().timestamp != series.front().timestamp || points[keep_count - 1].timestamp != series[keep_count - 1].timestamp) {
        return 0;
    }
    return keep_count;
}

size_t IndicatorTrack::apply(const Series& series, std::optional<Timestamp> earliest_changed_timestamp) {
    size_t keep_count = reusable_prefix_length(series, earliest_changed_timestamp);
    points.resize(keep_count);
    points.reserve(series.size());

    size_t seed_index = static_cast<size_t>(track_length) - 1;
    for (size_t bar_index = keep_count; bar_index < series.size(); ++bar_index) {
        IndicatorPoint point;
        point.timestamp = series[bar_index].timestamp;
        if (track_ma_type == MovingAverageType::SMA || bar_index == seed_index) {
            point.value = compute_sma_at(series, track_length, bar_index);
        } else if (bar_index > seed_index && points[bar_index - 1].value) {
            point.value = next_ema_value(series[bar_index].close_price, *points[bar_index - 1].value, track_length);
        }
        points.push_back(point);
    }
    return series.size() - keep_count;
}

std::optional<double> IndicatorTrack::value_at(Timestamp bar_timestamp) const {
    auto point_iterator = std::lower_bound(points.begin(), points.end(), bar_timestamp,
        [](const IndicatorPoint& point, Timestamp requested_timestamp) { return point.timestamp < requested_timestamp; });
    if (point_iterator == points.end() || point_iterator->timestamp != bar_timestamp) {
        return std::nullopt;
    }
    return point_iterator->value;
}

std::optional<double> IndicatorTrack::latest_value() const {
    if (points.empty()) {
        return std::nullopt;
    }
    return points.back().value;
}

IndicatorUpdateResult IndicatorCache::update(const std::string& cache_key, const Series& series, MovingAverageType ma_type, int length,
                                             std::optional<Timestamp> earliest_changed_timestamp) {
    validate_indicator_length(length);
    std::lock_guard<std::mutex> tracks_lock(tracks_mutex);

    TrackKey track_key(cache_key, ma_type, length);
    auto track_iterator = tracks.find(track_key);
    if (track_iterator == tracks.end()) {
        track_iterator = tracks.emplace(track_key, IndicatorTrack(ma_type, length)).first;
    }

    IndicatorUpdateResult update_result;
    update_result.recomputed_count = track_iterator->second.apply(series, earliest_changed_timestamp);
    update_result.latest_value = track_iterator->second.latest_value();
    if (!series.empty()) {
        update_result.latest_timestamp = series.back().timestamp;
    }
    return update_result;
}

std::optional<double> IndicatorCache::value_at(const std::string& cache_key, MovingAverageType ma_type, int length, Timestamp bar_timestamp) const {
    std::lock_guard<std::mutex> tracks_lock(tracks_mutex);
    auto track_iterator = tracks.find(TrackKey(cache_key, ma_type, length));
    if (track_iterator == tracks.end()) {
        return std::nullopt;
    }
    return track_iterator->second.value_at(bar_timestamp);
}

void IndicatorCache::invalidate(const std::string& cache_key) {
    std::lock_guard<std::mutex> tracks_lock(tracks_mutex);
    for (auto track_iterator = tracks.begin(); track_iterator != tracks.end();) {
        if (std::get<0>(track_iterator->first) == cache_key) {
            track_iterator = tracks.erase(track_iterator);
        } else {
            ++track_iterator;
        }
    }
}

} // namespace Core
} // namespace SellManager
