/**
 * @file sim_config.hpp
 * @brief Runtime configuration of one simulation instance
 */

#pragma once

#include <string>

#include "swarm/core/world.hpp"
#include "swarm/math/vector_math.hpp"
#include "swarm/systems/force_model.hpp"

/**
 * @struct Viewport
 * @brief Extent of the drawing surface in world units, centred on the origin
 */
struct Viewport {
    double width = 0.0;
    double height = 0.0;

    double halfWidth() const { return 0.5 * width; }
    double halfHeight() const { return 0.5 * height; }

    /**
     * @brief Throws std::invalid_argument unless both extents are finite and > 0
     */
    void validate() const;

    bool operator==(const Viewport& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Viewport& o) const { return !(*this == o); }
};

/**
 * @struct ParticleConfig
 * @brief What every particle of a batch is created with
 */
struct ParticleConfig {
    int count = 0;
    double radius = 1.0;
    std::string color;

    /**
     * @brief Throws std::invalid_argument on count < 0, radius <= 0 or a
     *        colour that is not #RRGGBB
     */
    void validate() const;
};

/**
 * @struct ParameterRange
 * @brief Range and step of one user-facing control
 */
struct ParameterRange {
    double min;
    double max;
    double step;

    double clamp(double value) const;

    /**
     * @brief Moves value by a whole number of steps, clamped to the range
     */
    double stepBy(double value, int steps) const;

    static ParameterRange attractionRadius();
    static ParameterRange attractionStrength();
    static ParameterRange pushRadius();
    static ParameterRange pushStrength();
    static ParameterRange particleRadius();
    static ParameterRange particleCount();
};

/**
 * @struct SimulationConfig
 * @brief Everything a Simulation is built from
 *
 * forces.particleRadius is the radius of every particle body. Changing it
 * or particleCount requires a full rebuild of the particles; the other
 * force tunables and the colour apply on the next frame.
 */
struct SimulationConfig {
    int particleCount;
    std::string particleColor;
    Vector gravity;
    BroadphaseType broadphase = BroadphaseType::SweepAndPrune;
    Systems::ForceConfig forces;

    SimulationConfig();

    ParticleConfig particles() const;

    /**
     * @brief Throws std::invalid_argument on a negative particle count,
     *        an unparsable colour, a non-finite gravity or invalid forces
     */
    void validate() const;
};
