#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <memory>
#include "system/system_modules.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "threads/scheduling/stop_signal.hpp"
#include "utils/connectivity_manager.hpp"

/**
 * @brief Central system state container
 *
 * Owns the configuration, the shared stop signal and every runtime module.
 */
struct SystemState {
    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> shutdown_requested{false};      // Set from the signal handler, acted on by the main loop
    std::atomic<bool> assignment_reload_requested{false};  // SIGHUP, forwarded to the assignment registry
    SellManager::Threads::StopSignal stop_signal;     // Wakes every cadence and backoff wait on shutdown

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    SellManager::Config::SystemConfig config;
    SellManager::ConnectivityManager connectivity_manager;
    std::shared_ptr<SellManager::Logging::LoggingContext> logging_context;
    std::unique_ptr<SystemModules> modules;           // Destroyed first: timers join before the state they use goes away

    explicit SystemState(const SellManager::Config::SystemConfig& initial)
        : config(initial), connectivity_manager(config.timing) {}
};

#endif // SYSTEM_STATE_HPP
