#include "bar_cache_store.hpp"
#include "bar_record_codec.hpp"
#include "trader/errors/trading_errors.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace SellManager {
namespace Core {

namespace {

    // Streams bars out of a cache file, enforcing strictly increasing timestamps.
    class CacheFileReader {
    public:
        CacheFileReader(const std::string& file_path, const std::string& cache_key)
            : key(cache_key), line_number(0) {
            if (std::filesystem::exists(file_path)) {
                input_stream.open(file_path);
                if (!input_stream.is_open()) {
                    throw CacheCorruptionError(cache_key, "cannot open " + file_path);
                }
            }
        }

        std::optional<Bar> next() {
            if (!input_stream.is_open()) {
                return std::nullopt;
            }
            std::string record_line;
            while (std::getline(input_stream, record_line)) {
                ++line_number;
                if (record_line.empty()) {
                    continue;
                }
                std::optional<Bar> decoded_bar = decode_bar_record(record_line);
                if (!decoded_bar) {
                    throw CacheCorruptionError(key, "unparsable record at line " + std::to_string(line_number));
                }
                if (previous_timestamp && decoded_bar->timestamp <= *previous_timestamp) {
                    throw CacheCorruptionError(key, "timestamps not strictly increasing at line " + std::to_string(line_number));
                }
                previous_timestamp = decoded_bar->timestamp;
                return decoded_bar;
            }
            if (input_stream.bad()) {
                throw CacheCorruptionError(key, "read failure after line " + std::to_string(line_number));
            }
            return std::nullopt;
        }

    private:
        std::string key;
        std::ifstream input_stream;
        size_t line_number;
        std::optional<Timestamp> previous_timestamp;
    };

    void record_written_bar(MergeResult& merge_result, const Bar& written_bar) {
        if (!merge_result.first_timestamp) {
            merge_result.first_timestamp = written_bar.timestamp;
        }
        merge_result.last_timestamp = written_bar.timestamp;
        ++merge_result.bar_count;
    }

    void record_changed_bar(MergeResult& merge_result, Timestamp changed_timestamp) {
        if (!merge_result.earliest_changed_timestamp || changed_timestamp < *merge_result.earliest_changed_timestamp) {
            merge_result.earliest_changed_timestamp = changed_timestamp;
        }
    }

    bool is_finite_bar(const Bar& bar) {
        return std::isfinite(bar.open_price) && std::isfinite(bar.high_price) && std::isfinite(bar.low_price) &&
               std::isfinite(bar.close_price) && std::isfinite(bar.volume);
    }
}

Series normalize_incoming_bars(const Series& incoming_bars) {
    Series sorted_bars = incoming_bars;
    std::stable_sort(sorted_bars.begin(), sorted_bars.end(),
        [](const Bar& left_bar, const Bar& right_bar) { return left_bar.timestamp < right_bar.timestamp; });

    Series normalized_bars;
    normalized_bars.reserve(sorted_bars.size());
    for (const Bar& sorted_bar : sorted_bars) {
        if (!normalized_bars.empty() && normalized_bars.back().timestamp == sorted_bar.timestamp) {
            normalized_bars.back() = sorted_bar;
        } else {
            normalized_bars.push_back(sorted_bar);
        }
    }
    return normalized_bars;
}

BarCacheStore::BarCacheStore(const std::string& cache_directory)
    : cache_directory_path(cache_directory) {
    if (cache_directory_path.empty()) {
        throw InvalidConfigurationError("Cache directory must not be empty");
    }
    std::filesystem::create_directories(cache_directory_path);
}

std::string BarCacheStore::cache_file_path(const std::string& cache_key) const {
    return (std::filesystem::path(cache_directory_path) / (cache_key_to_file_stem(cache_key) + ".ndjson")).string();
}

std::shared_ptr<std::mutex> BarCacheStore::lock_for_key(const std::string& cache_key) const {
    std::lock_guard<std::mutex> registry_lock(key_locks_mutex);
    std::shared_ptr<std::mutex>& key_mutex_ptr = key_locks[cache_key];
    if (!key_mutex_ptr) {
        key_mutex_ptr = std::make_shared<std::mutex>();
    }
    return key_mutex_ptr;
}

MergeResult BarCacheStore::merge(const std::string& cache_key, const Series& incoming_bars) {
    std::shared_ptr<std::mutex> key_mutex_ptr = lock_for_key(cache_key);
    std::lock_guard<std::mutex> key_lock(*key_mutex_ptr);
    return merge_locked(cache_key, incoming_bars);
}

Series BarCacheStore::merge_and_read(const std::string& cache_key, const Series& incoming_bars, const CacheReadWindow& read_window) {
    std::shared_ptr<std::mutex> key_mutex_ptr = lock_for_key(cache_key);
    std::lock_guard<std::mutex> key_lock(*key_mutex_ptr);
    merge_locked(cache_key, incoming_bars);
    return read_locked(cache_key, read_window);
}

Series BarCacheStore::read(const std::string& cache_key, const CacheReadWindow& read_window) const {
    std::shared_ptr<std::mutex> key_mutex_ptr = lock_for_key(cache_key);
    std::lock_guard<std::mutex> key_lock(*key_mutex_ptr);
    return read_locked(cache_key, read_window);
}

SeriesExtent BarCacheStore::describe(const std::string& cache_key) const {
    std::shared_ptr<std::mutex> key_mutex_ptr = lock_for_key(cache_key);
    std::lock_guard<std::mutex> key_lock(*key_mutex_ptr);

    SeriesExtent series_extent;
    CacheFileReader cache_reader(cache_file_path(cache_key), cache_key);
    for (std::optional<Bar> cached_bar = cache_reader.next(); cached_bar; cached_bar = cache_reader.next()) {
        if (!series_extent.first_timestamp) {
            series_extent.first_timestamp = cached_bar->timestamp;
        }
        series_extent.last_timestamp = cached_bar->timestamp;
        ++series_extent.bar_count;
    }
    return series_extent;
}

MergeResult BarCacheStore::merge_locked(const std::string& cache_key, const Series& incoming_bars) {
    for (const Bar& incoming_bar : incoming_bars) {
        if (!is_finite_bar(incoming_bar)) {
            throw std::invalid_argument("Non-finite bar for '" + cache_key + "' at " + std::to_string(incoming_bar.timestamp));
        }
    }
    Series normalized_bars = normalize_incoming_bars(incoming_bars);

    std::string target_path = cache_file_path(cache_key);
    std::string temporary_path = target_path + ".tmp";

    MergeResult merge_result;
    {
        CacheFileReader cache_reader(target_path, cache_key);
        std::ofstream output_stream(temporary_path, std::ios::out | std::ios::trunc);
        if (!output_stream.is_open()) {
            throw CacheWriteError("Cannot open temporary cache file: " + temporary_path);
        }

        try {
            std::optional<Bar> existing_bar = cache_reader.next();
            size_t incoming_index = 0;
            while (existing_bar || incoming_index < normalized_bars.size()) {
                bool has_incoming = incoming_index < normalized_bars.size();
                if (has_incoming && (!existing_bar || normalized_bars[incoming_index].timestamp < existing_bar->timestamp)) {
                    const Bar& inserted_bar = normalized_bars[incoming_index++];
                    output_stream << encode_bar_record(inserted_bar) << '\n';
                    ++merge_result.inserted_count;
                    record_changed_bar(merge_result, inserted_bar.timestamp);
                    record_written_bar(merge_result, inserted_bar);
                } else if (has_incoming && normalized_bars[incoming_index].timestamp == existing_bar->timestamp) {
                    const Bar& replacing_bar = normalized_bars[incoming_index++];
                    if (replacing_bar != *existing_bar) {
                        ++merge_result.replaced_count;
                        record_changed_bar(merge_result, replacing_bar.timestamp);
                    }
                    output_stream << encode_bar_record(replacing_bar) << '\n';
                    record_written_bar(merge_result, replacing_bar);
                    existing_bar = cache_reader.next();
                } else {
                    output_stream << encode_bar_record(*existing_bar) << '\n';
                    record_written_bar(merge_result, *existing_bar);
                    existing_bar = cache_reader.next();
                }
            }
        } catch (const CacheCorruptionError&) {
            output_stream.close();
            std::filesystem::remove(temporary_path);
            throw;
        }

        output_stream.flush();
        if (!output_stream.good()) {
            output_stream.close();
            std::filesystem::remove(temporary_path);
            throw CacheWriteError("Failed writing temporary cache file: " + temporary_path);
        }
    }

    if (!merge_result.changed()) {
        std::filesystem::remove(temporary_path);
        return merge_result;
    }

    std::error_code rename_error;
    std::filesystem::rename(temporary_path, target_path, rename_error);
    if (rename_error) {
        std::filesystem::remove(temporary_path);
        throw CacheWriteError("Failed to replace cache file " + target_path + ": " + rename_error.message());
    }
    return merge_result;
}

Series BarCacheStore::read_locked(const std::string& cache_key, const CacheReadWindow& read_window) const {
    std::deque<Bar> window_bars;
    CacheFileReader cache_reader(cache_file_path(cache_key), cache_key);
    for (std::optional<Bar> cached_bar = cache_reader.next(); cached_bar; cached_bar = cache_reader.next()) {
        if (read_window.start_timestamp && cached_bar->timestamp < *read_window.start_timestamp) {
            continue;
        }
        if (read_window.end_timestamp && cached_bar->timestamp > *read_window.end_timestamp) {
            break;
        }
        window_bars.push_back(*cached_bar);
        if (read_window.last_count > 0 && window_bars.size() > read_window.last_count) {
            window_bars.pop_front();
        }
    }
    return Series(window_bars.begin(), window_bars.end());
}

} // namespace Core
} // namespace SellManager
