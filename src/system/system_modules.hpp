#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/gateway/gateway_client.hpp"
#include "logging/logger/signal_audit_logger.hpp"
#include "threads/scheduling/wall_clock.hpp"
#include "threads/system_threads/cadence_thread.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "trader/assignments/assignment_store.hpp"
#include "trader/cache/bar_cache_store.hpp"
#include "trader/coordinators/minute_refresh_coordinator.hpp"
#include "trader/coordinators/signal_evaluation_coordinator.hpp"
#include "trader/coordinators/status_board.hpp"
#include "trader/market_data/backfill_controller.hpp"
#include "trader/market_data/bar_aggregator.hpp"
#include "trader/strategy_analysis/indicator_cache.hpp"
#include "utils/session_clock.hpp"

/**
 * @brief Runtime module container
 *
 * Holds active system modules as smart pointers for centralized ownership. Members are
 * declared in dependency order, so the cadence timers are torn down before anything they call.
 */
struct SystemModules {
    // =========================================================================
    // CLOCKS AND BROKER ACCESS
    // =========================================================================
    std::unique_ptr<SellManager::Core::ExchangeSessionClock> session_clock;
    std::unique_ptr<SellManager::Threads::SystemWallClock> wall_clock;
    std::shared_ptr<SellManager::API::GatewayClient> gateway_client;

    // =========================================================================
    // DATA PIPELINE
    // =========================================================================
    std::unique_ptr<SellManager::Core::BarCacheStore> cache_store;
    std::unique_ptr<SellManager::Core::BarAggregator> bar_aggregator;
    std::unique_ptr<SellManager::Core::IndicatorCache> indicator_cache;
    std::unique_ptr<SellManager::Core::BackfillController> backfill_controller;

    // =========================================================================
    // ASSIGNMENTS, STATUS AND AUDIT
    // =========================================================================
    std::unique_ptr<SellManager::Core::AssignmentStore> assignment_store;
    std::unique_ptr<SellManager::Core::AssignmentRegistry> assignment_registry;
    std::unique_ptr<SellManager::Core::StatusBoard> status_board;
    std::unique_ptr<SellManager::Logging::SignalAuditLogger> signal_audit_logger;

    // =========================================================================
    // CADENCE HANDLERS
    // =========================================================================
    std::unique_ptr<SellManager::Core::MinuteRefreshCoordinator> minute_refresh_coordinator;
    std::unique_ptr<SellManager::Core::SignalEvaluationCoordinator> signal_evaluation_coordinator;

    // =========================================================================
    // THREADING COMPONENTS
    // =========================================================================
    std::unique_ptr<SellManager::Threads::LoggingThread> logging_thread;
    std::unique_ptr<SellManager::Threads::CadenceTimer> minute_cadence;
    std::unique_ptr<SellManager::Threads::CadenceTimer> hour_cadence;
};

#endif // SYSTEM_MODULES_HPP
