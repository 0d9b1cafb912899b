#include "system_manager.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include "configs/system_config.hpp"
#include "logging/logs/assignment_logs.hpp"
#include "logging/logs/cache_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "threads/scheduling/cadence_schedule.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager::Logging;
using namespace SellManager::Threads;

namespace SellManager {
namespace System {

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    try {
        // Initialize minimal logging context early - required before any logging calls
        auto early_logging_context = std::make_shared<LoggingContext>();
        set_logging_context(*early_logging_context);

        Config::SystemConfig initial_config;
        int config_load_result = load_system_config(initial_config, config_directory);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error("Config load failed with result: " + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->logging_context = early_logging_context;

        // Validates the configuration and opens the run log
        initialization_result.logger = initialize_application_foundation(initialization_result.system_state->config);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

namespace {

void create_system_modules(SystemState& state, std::shared_ptr<AsyncLogger> logger, SystemThreads& thread_handles) {
    const Config::SystemConfig& config = state.config;
    state.modules = std::make_unique<SystemModules>();
    SystemModules& modules = *state.modules;

    modules.session_clock = std::make_unique<Core::ExchangeSessionClock>(config.session);
    modules.wall_clock = std::make_unique<SystemWallClock>();
    modules.gateway_client = std::make_shared<API::GatewayClient>(config.broker, *modules.session_clock);

    modules.cache_store = std::make_unique<Core::BarCacheStore>(config.storage.cache_directory);
    CacheLogs::log_cache_directory(modules.cache_store->get_cache_directory());
    modules.bar_aggregator = std::make_unique<Core::BarAggregator>(*modules.session_clock, config.session.hour_bucket_anchor_minutes);
    modules.indicator_cache = std::make_unique<Core::IndicatorCache>();
    modules.backfill_controller = std::make_unique<Core::BackfillController>(
        modules.gateway_client, *modules.cache_store, config.backfill, state.connectivity_manager, state.stop_signal);

    modules.assignment_store = std::make_unique<Core::AssignmentStore>(config.storage.assignments_file);
    modules.assignment_registry = std::make_unique<Core::AssignmentRegistry>();
    modules.status_board = std::make_unique<Core::StatusBoard>();
    modules.signal_audit_logger = std::make_unique<SignalAuditLogger>(config.storage.signal_audit_file);

    Core::MinuteRefreshDependencies minute_dependencies{
        *modules.backfill_controller,
        *modules.cache_store,
        *modules.indicator_cache,
        *modules.bar_aggregator,
        *modules.assignment_registry,
        *modules.assignment_store,
        modules.gateway_client,
        state.connectivity_manager,
        *modules.status_board
    };
    modules.minute_refresh_coordinator = std::make_unique<Core::MinuteRefreshCoordinator>(minute_dependencies, config, state.stop_signal);

    // Orders leave the process only in live mode; otherwise signals stop at a prepared order.
    API::OrderSinkPtr order_sink;
    if (config.broker.live_mode) {
        order_sink = modules.gateway_client;
    }
    Core::SignalEvaluationDependencies evaluation_dependencies{
        *modules.cache_store,
        *modules.assignment_registry,
        *modules.indicator_cache,
        modules.gateway_client,
        order_sink,
        *modules.signal_audit_logger,
        *modules.session_clock
    };
    modules.signal_evaluation_coordinator = std::make_unique<Core::SignalEvaluationCoordinator>(evaluation_dependencies, state.stop_signal);

    modules.logging_thread = std::make_unique<LoggingThread>(logger, thread_handles.logger_iterations, config);

    Core::MinuteRefreshCoordinator& minute_coordinator = *modules.minute_refresh_coordinator;
    modules.minute_cadence = std::make_unique<CadenceTimer>(
        "minute", "MINUTE", *modules.wall_clock,
        [](WallTime after_time) { return next_minute_fire(after_time); },
        [&minute_coordinator](Core::CadenceTrigger, WallTime fire_time) {
            minute_coordinator.run_tick(TimeUtils::time_point_to_epoch_seconds(fire_time));
        },
        state.stop_signal);
    modules.minute_cadence->set_iteration_counter(thread_handles.minute_iterations);

    const Core::ExchangeSessionClock& session_clock = *modules.session_clock;
    Core::SignalEvaluationCoordinator& evaluation_coordinator = *modules.signal_evaluation_coordinator;
    modules.hour_cadence = std::make_unique<CadenceTimer>(
        "hour", "HOUR", *modules.wall_clock,
        [&session_clock](WallTime after_time) { return next_hour_cadence_fire(after_time, session_clock); },
        [&evaluation_coordinator](Core::CadenceTrigger trigger, WallTime fire_time) {
            evaluation_coordinator.run_evaluation(trigger, TimeUtils::time_point_to_epoch_seconds(fire_time));
        },
        state.stop_signal);
    modules.hour_cadence->set_iteration_counter(thread_handles.hour_iterations);
}

// Positions are compared against the book once at startup; a failure only costs the report.
void reconcile_assignments_with_positions(SystemModules& modules) {
    try {
        Core::AssignmentBookPtr assignment_book = modules.assignment_registry->snapshot();
        Core::ReconciliationReport reconciliation_report = Core::reconcile(*assignment_book, modules.gateway_client->get_positions());
        AssignmentLogs::log_reconciliation(reconciliation_report);
    } catch (const std::exception& reconcile_error) {
        SystemLogs::log_system_warning(std::string("Position reconciliation skipped: ") + reconcile_error.what());
    }
}

void run_initial_backfill(SystemModules& modules) {
    Core::AssignmentBookPtr assignment_book = modules.assignment_registry->snapshot();
    if (assignment_book->empty()) {
        SystemLogs::log_initial_backfill_skipped();
        return;
    }

    std::vector<Core::BackfillRequest> backfill_requests;
    for (const auto& assignment : assignment_book->get_assignments()) {
        backfill_requests.push_back(modules.minute_refresh_coordinator->coverage_request_for(assignment));
    }
    SystemLogs::log_initial_backfill_start(backfill_requests.size());
    modules.backfill_controller->ensure_coverage_all(backfill_requests);
}

} // namespace

void startup(SystemState& system_state, SystemThreads& handles, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        SystemLogs::log_logging_context_error();
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }
    initialize_global_logger(*logger);

    try {
        create_system_modules(system_state, logger, handles);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }
    SystemModules& modules = *system_state.modules;

    // Logging thread first so startup output is drained while the backfill runs
    LoggingContext& logging_context = *system_state.logging_context;
    LoggingThread& logging_thread = *modules.logging_thread;
    handles.logger_thread = std::thread([&logging_context, &logging_thread]() {
        set_logging_context(logging_context);
        logging_thread();
    });

    SystemLogs::log_startup_configuration(system_state.config);

    modules.minute_refresh_coordinator->reload_assignments();
    reconcile_assignments_with_positions(modules);
    run_initial_backfill(modules);

    std::chrono::milliseconds startup_delay(system_state.config.timing.thread_startup_sequence_delay_milliseconds);
    if (system_state.config.timing.enable_minute_cadence) {
        modules.minute_cadence->start();
        std::this_thread::sleep_for(startup_delay);
    }
    if (system_state.config.timing.enable_hour_cadence) {
        modules.hour_cadence->start();
    }
    SystemLogs::log_startup_complete(system_state.config.timing.enable_minute_cadence, system_state.config.timing.enable_hour_cadence);
}

void run(SystemState& system_state, const SystemThreads& thread_handles) {
    std::chrono::seconds poll_interval(system_state.config.timing.main_loop_poll_interval_seconds);

    while (!system_state.shutdown_requested.load() && !system_state.stop_signal.stop_requested()) {
        try {
            if (system_state.assignment_reload_requested.exchange(false)) {
                AssignmentLogs::log_reload_requested();
                system_state.modules->assignment_registry->request_reload();
            }
            system_state.stop_signal.wait_for(poll_interval);
        } catch (const std::exception& exception_error) {
            SystemLogs::log_main_loop_error(exception_error.what());
        }
    }

    SystemLogs::log_shutdown_requested();
    long long uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - thread_handles.start_time).count();
    SystemLogs::log_cadence_stats_table(system_state.modules->minute_cadence->get_stats(),
                                        system_state.modules->hour_cadence->get_stats(), uptime_seconds);
}

void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    try {
        system_state.stop_signal.request_stop();

        if (system_state.modules && system_state.modules->minute_cadence) {
            system_state.modules->minute_cadence->join();
        }
        if (system_state.modules && system_state.modules->hour_cadence) {
            system_state.modules->hour_cadence->join();
        }
        SystemLogs::log_shutdown_complete();
        if (logger) {
            SystemLogs::log_logger_totals(logger->get_written_count(), logger->get_dropped_count());
            // Logging thread drains the queue once running drops
            shutdown_global_logger(*logger);
        }
        if (thread_handles.logger_thread.joinable()) {
            thread_handles.logger_thread.join();
        }
    } catch (const std::exception& shutdown_exception_error) {
        SystemLogs::log_system_shutdown_error("Exception in shutdown: " + std::string(shutdown_exception_error.what()));
    }
}

} // namespace System
} // namespace SellManager
