#ifndef BAR_CACHE_STORE_HPP
#define BAR_CACHE_STORE_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "trader/data_structures/data_structures.hpp"

namespace SellManager {
namespace Core {

// Inclusive timestamp bounds plus an optional cap keeping only the most recent bars.
struct CacheReadWindow {
    std::optional<Timestamp> start_timestamp;
    std::optional<Timestamp> end_timestamp;
    size_t last_count;   // 0 = no cap

    CacheReadWindow() : last_count(0) {}

    static CacheReadWindow all() { return CacheReadWindow(); }
    static CacheReadWindow last(size_t bar_count) {
        CacheReadWindow read_window;
        read_window.last_count = bar_count;
        return read_window;
    }
    static CacheReadWindow from(Timestamp start_timestamp_value) {
        CacheReadWindow read_window;
        read_window.start_timestamp = start_timestamp_value;
        return read_window;
    }
    static CacheReadWindow between(Timestamp start_timestamp_value, Timestamp end_timestamp_value) {
        CacheReadWindow read_window;
        read_window.start_timestamp = start_timestamp_value;
        read_window.end_timestamp = end_timestamp_value;
        return read_window;
    }
};

struct MergeResult {
    size_t bar_count;
    size_t inserted_count;
    size_t replaced_count;
    std::optional<Timestamp> earliest_changed_timestamp;
    std::optional<Timestamp> first_timestamp;
    std::optional<Timestamp> last_timestamp;

    MergeResult() : bar_count(0), inserted_count(0), replaced_count(0) {}
    bool changed() const { return inserted_count > 0 || replaced_count > 0; }
};

struct SeriesExtent {
    size_t bar_count;
    std::optional<Timestamp> first_timestamp;
    std::optional<Timestamp> last_timestamp;

    SeriesExtent() : bar_count(0) {}
};

/**
 * Keyed on-disk bar series, one newline-delimited JSON file per cache key.
 *
 * merge() unions incoming bars into the stored series by timestamp; on a collision the
 * incoming bar wins. The stored file is streamed against the sorted batch, written to a
 * temporary file and renamed over the original, so readers see either the old or the new
 * series. Operations on the same key are serialized; different keys never block each other.
 */
class BarCacheStore {
public:
    explicit BarCacheStore(const std::string& cache_directory);

    BarCacheStore(const BarCacheStore&) = delete;
    BarCacheStore& operator=(const BarCacheStore&) = delete;

    MergeResult merge(const std::string& cache_key, const Series& incoming_bars);

    // Merge, then read the merged series under the same key lock.
    Series merge_and_read(const std::string& cache_key, const Series& incoming_bars, const CacheReadWindow& read_window);

    Series read(const std::string& cache_key, const CacheReadWindow& read_window = CacheReadWindow::all()) const;
    SeriesExtent describe(const std::string& cache_key) const;

    std::string cache_file_path(const std::string& cache_key) const;
    const std::string& get_cache_directory() const { return cache_directory_path; }

private:
    std::string cache_directory_path;
    mutable std::mutex key_locks_mutex;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_locks;

    std::shared_ptr<std::mutex> lock_for_key(const std::string& cache_key) const;
    MergeResult merge_locked(const std::string& cache_key, const Series& incoming_bars);
    Series read_locked(const std::string& cache_key, const CacheReadWindow& read_window) const;
};

// Sorted by timestamp; for repeated timestamps the last occurrence in input order is kept.
Series normalize_incoming_bars(const Series& incoming_bars);

} // namespace Core
} // namespace SellManager

#endif // BAR_CACHE_STORE_HPP
