#ifndef STORAGE_CONFIG_HPP
#define STORAGE_CONFIG_HPP

#include <string>

namespace SellManager {
namespace Config {

struct StorageConfig {
    std::string cache_directory = "data/cache";
    std::string assignments_file = "config/assigned_ma.csv";
    std::string signal_audit_file = "data/signals.jsonl";
};

} // namespace Config
} // namespace SellManager

#endif // STORAGE_CONFIG_HPP
