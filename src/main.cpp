/**
 * @file main.cpp
 * @brief Main entry point for the native application.
 *
 * Creates a SimManager, initializes it, and runs the main loop.
 */

#include <iostream>
#include <stdexcept>

#include "swarm/core/profile.hpp"
#include "swarm/core/sim_manager.hpp"

int main() {
    try {
        SimulationConfig config;

        SimManager simManager(config);
        if (!simManager.init()) {
            std::cerr << "Initialization failed." << std::endl;
            return 1;
        }

        {
            SWARM_PROFILE_SCOPE("main");
            simManager.run();
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    Profiling::Profiler::printStats(std::cout);
    return 0;
}
