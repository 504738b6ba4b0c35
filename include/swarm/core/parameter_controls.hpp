/**
 * @file parameter_controls.hpp
 * @brief Stepwise user controls for the simulation parameters
 */

#pragma once

#include "swarm/core/input_inbox.hpp"
#include "swarm/core/sim_config.hpp"

enum class Control {
    AttractionRadius,
    AttractionStrength,
    PushRadius,
    PushStrength,
    ParticleRadius,
    ParticleCount
};

/**
 * @class ParameterControls
 * @brief Tracks the most recently requested parameter set
 *
 * Steps build on the last requested values rather than on the simulation's
 * applied config, so several steps taken before the next frame drains the
 * inbox all take effect.
 */
class ParameterControls {
public:
    explicit ParameterControls(const SimulationConfig& config);

    /**
     * @brief Moves one control by a whole number of steps within its range
     * @return The full parameter set to post
     */
    Input::ParametersChanged step(Control control, int steps);

    const Input::ParametersChanged& requested() const { return latest; }

private:
    Input::ParametersChanged latest;
};
