#ifndef CACHE_LOGS_HPP
#define CACHE_LOGS_HPP

#include <string>
#include "trader/cache/bar_cache_store.hpp"

namespace SellManager {
namespace Logging {

class CacheLogs {
public:
    static void log_cache_directory(const std::string& cache_directory);
    static void log_cache_corruption(const std::string& cache_key, const std::string& error_message);
    static void log_aggregation_result(const std::string& instrument_key, const Core::MergeResult& hourly_merge_result);
};

} // namespace Logging
} // namespace SellManager

#endif // CACHE_LOGS_HPP
