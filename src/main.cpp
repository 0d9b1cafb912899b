// main.cpp
#include "system/system_manager.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <string>

using namespace SellManager::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    // Only atomic stores here; the main loop turns them into a stop or a reload.
    void signal_handler(int signal_number) {
        SystemState* system_state = system_state_pointer.load();
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            if (system_state) {
                system_state->shutdown_requested.store(true);
            }
        } else if (signal_number == SIGHUP) {
            if (system_state) {
                system_state->assignment_reload_requested.store(true);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

// Usage: sell_manager [config_directory]   (default: config)
int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config_directory]" << std::endl;
        return 2;
    }
    std::string config_directory = argc == 2 ? argv[1] : "config";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    SystemInitializationResult initialization_result;
    try {
        initialization_result = initialize(config_directory);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error during initialization: " << exception_error.what() << std::endl;
        return 1;
    }

    SystemState& system_state = *initialization_result.system_state;
    ShutdownHandler::get_instance().set_system_state(&system_state);
    if (ShutdownHandler::get_instance().is_shutdown_requested()) {
        system_state.shutdown_requested.store(true);
    }

    // Outlives the cadence timers, which count iterations into it
    SystemThreads thread_handles;
    int exit_code = 0;
    try {
        startup(system_state, thread_handles, initialization_result.logger);
        run(system_state, thread_handles);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        exit_code = 1;
    }

    shutdown(system_state, thread_handles, initialization_result.logger);
    ShutdownHandler::get_instance().set_system_state(nullptr);
    return exit_code;
}
