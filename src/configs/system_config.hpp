#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "backfill_config.hpp"
#include "broker_config.hpp"
#include "logging_config.hpp"
#include "session_config.hpp"
#include "storage_config.hpp"
#include "timing_config.hpp"

namespace SellManager {
namespace Config {

/**
 * Main sell manager configuration.
 * Each section is loaded from its own CSV file under config/.
 */
struct SystemConfig {
    SystemConfig() {}

    BrokerConfig broker;               // Gateway endpoint, account and live-mode gate
    BackfillConfig backfill;           // Coverage targets, slicing and pacing
    TimingConfig timing;               // Cadences, refresh windows and connectivity retry
    SessionConfig session;             // Exchange timezone and end-of-day fire time
    StorageConfig storage;             // Cache, assignment and audit file locations
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace SellManager

#endif // SYSTEM_CONFIG_HPP
