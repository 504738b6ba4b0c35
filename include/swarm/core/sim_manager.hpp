/**
 * @file sim_manager.hpp
 * @brief Native host: SFML window, keyboard/mouse translation and frame pacing
 */

#pragma once

#include <SFML/Window/Keyboard.hpp>

#include "swarm/core/frame_scheduler.hpp"
#include "swarm/core/parameter_controls.hpp"
#include "swarm/core/simulation.hpp"
#include "swarm/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Owns the window and the simulation and runs the main loop
 *
 * Keys:
 * - Up/Down:    attraction radius
 * - Right/Left: attraction strength
 * - W/S:        push radius
 * - D/A:        push strength
 * - E/Q:        particle radius (rebuilds the particles)
 * - =/-:        particle count (rebuilds the particles)
 * - C:          next fill colour
 * - Escape:     quit
 */
class SimManager {
public:
    explicit SimManager(const SimulationConfig& config);

    /**
     * @brief Opens the window and starts the simulation
     * @return true on success, false otherwise.
     */
    bool init();

    /**
     * @brief Runs until the window is closed, then disposes the simulation
     */
    void run();

private:
    /**
     * @brief Translates pending window events into simulation input
     * @return false if the application should quit
     */
    bool handleEvents();
    void handleKey(sf::Keyboard::Key key);
    void render();

    Rendering::Renderer renderer;
    ManualFrameScheduler scheduler;
    Simulation simulation;
    ParameterControls controls;
    std::size_t colorIndex = 0;
    bool running = true;
};
