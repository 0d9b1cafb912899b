#ifndef BAR_AGGREGATOR_HPP
#define BAR_AGGREGATOR_HPP

#include <optional>
#include <string>
#include "trader/cache/bar_cache_store.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "utils/session_clock.hpp"

namespace SellManager {
namespace Core {

/**
 * Combines 30 minute bars into hourly bars.
 *
 * Buckets are hours of exchange-local time shifted by the session anchor: with a 30 minute
 * anchor the 09:30 and 10:00 bars form the bar stamped 10:00. Each hourly bar takes the first
 * open, highest high, lowest low, last close and summed volume of its bucket. A bucket with a
 * single bar still produces a bar.
 */
class BarAggregator {
public:
    BarAggregator(const ExchangeSessionClock& session_clock, int anchor_minutes);

    Timestamp hour_bucket_label(Timestamp bar_timestamp) const;
    // First instant that belongs to the bucket containing bar_timestamp.
    Timestamp hour_bucket_start(Timestamp bar_timestamp) const;

    // Pure; the result does not depend on input order.
    Series aggregate_to_hour(const Series& half_hour_bars) const;

private:
    const ExchangeSessionClock& clock;
    long long anchor_seconds;
};

// Re-aggregates the 30m cache of an instrument from the bucket holding earliest_changed_timestamp
// (or from the start when absent) and merges the hourly bars into its 1h cache.
MergeResult aggregate_and_merge(BarCacheStore& cache_store, const BarAggregator& aggregator,
                                const std::string& instrument_key, std::optional<Timestamp> earliest_changed_timestamp);

} // namespace Core
} // namespace SellManager

#endif // BAR_AGGREGATOR_HPP
