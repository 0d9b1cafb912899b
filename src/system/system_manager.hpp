#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace SellManager {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<SellManager::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// System initialization - config loading, validation and the logging foundation
SystemInitializationResult initialize(const std::string& config_directory = "config");

// System lifecycle management
// Counters in thread_handles are wired into the cadence timers, so it must outlive them.
void startup(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<SellManager::Logging::AsyncLogger> logger);
void run(SystemState& system_state, const SystemThreads& thread_handles);
void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<SellManager::Logging::AsyncLogger> logger);

} // namespace System
} // namespace SellManager

#endif // SYSTEM_MANAGER_HPP
