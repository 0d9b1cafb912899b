#ifndef INDICATOR_CACHE_HPP
#define INDICATOR_CACHE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

struct IndicatorPoint {
    Timestamp timestamp;
    std::optional<double> value;
};

/**
 * Computed values of one (series, type, length), kept aligned bar-for-bar with the series.
 * apply() keeps every value before the earliest changed bar and computes forward from there,
 * so an appended bar costs one new value.
 */
class IndicatorTrack {
public:
    IndicatorTrack(MovingAverageType ma_type, int length);

    // Returns how many values were (re)computed.
    size_t apply(const Series& series, std::optional<Timestamp> earliest_changed_timestamp);

    std::optional<double> value_at(Timestamp bar_timestamp) const;
    std::optional<double> latest_value() const;
    size_t size() const { return points.size(); }

private:
    MovingAverageType track_ma_type;
    int track_length;
    std::vector<IndicatorPoint> points;

    size_t reusable_prefix_length(const Series& series, std::optional<Timestamp> earliest_changed_timestamp) const;
};

struct IndicatorUpdateResult {
    std::optional<double> latest_value;
    std::optional<Timestamp> latest_timestamp;
    size_t recomputed_count;

    IndicatorUpdateResult() : recomputed_count(0) {}
};

// Thread-safe registry of tracks keyed by (cache key, type, length).
class IndicatorCache {
public:
    IndicatorCache() = default;
    IndicatorCache(const IndicatorCache&) = delete;
    IndicatorCache& operator=(const IndicatorCache&) = delete;

    IndicatorUpdateResult update(const std::string& cache_key, const Series& series, MovingAverageType ma_type, int length,
                                 std::optional<Timestamp> earliest_changed_timestamp);

    std::optional<double> value_at(const std::string& cache_key, MovingAverageType ma_type, int length, Timestamp bar_timestamp) const;

    void invalidate(const std::string& cache_key);

private:
    using TrackKey = std::tuple<std::string, MovingAverageType, int>;

    mutable std::mutex tracks_mutex;
    std::map<TrackKey, IndicatorTrack> tracks;
};

} // namespace Core
} // namespace SellManager

#endif // INDICATOR_CACHE_HPP
