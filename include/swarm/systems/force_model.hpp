/**
 * @file force_model.hpp
 * @brief Per-frame external forces on particles
 *
 * This system handles:
 * - Pointer repulsion: particles within pushRadius of the pointer are pushed
 *   away from it, with a force falling off linearly to zero at pushRadius
 * - Pairwise attraction: every pair of particles further apart than two
 *   radii and no further than attractionRadius attracts with an
 *   inverse-square force attractionStrength / d^2
 *
 * Forces are added to each particle's Components::Force accumulator; the
 * physics step of the same frame consumes and clears them.
 *
 * The pairwise pass visits all n(n-1)/2 pairs. That quadratic cost is the
 * scalability bound of the simulation: interactive frame budgets cap the
 * particle count at a few thousand. A cutoff grid or spatial hash could
 * replace the pair loop as long as it keeps the force on B the exact
 * negation of the force on A, and zero outside (2 * radius, attractionRadius].
 *
 * Required components:
 * - Particle, Position, Force
 *
 * Reads:
 * - SimulatorState::pointer
 */

#pragma once

#include <optional>

#include <entt/entt.hpp>
#include "swarm/math/vector_math.hpp"
#include "swarm/systems/i_system.hpp"

namespace Systems {

/**
 * @struct ForceConfig
 * @brief Tunables of the force model
 *
 * particleRadius is also the radius every particle body is created with;
 * changing it requires rebuilding the particles.
 */
struct ForceConfig {
    double particleRadius = 7.0;
    double pushRadius = 80.0;
    double pushStrength = 30000.0;
    double attractionRadius = 150.0;
    double attractionStrength = 25000.0;

    /**
     * @brief Throws std::invalid_argument unless particleRadius > 0 and
     *        every other value is finite and non-negative
     */
    void validate() const;
};

/**
 * @brief Repulsion exerted by the pointer on one particle
 *
 * Zero when the distance d to the pointer is <= 1 or >= pushRadius.
 * Otherwise the magnitude is pushStrength * (pushRadius - d) / pushRadius,
 * directed from the pointer towards the particle.
 */
Vector pointerForce(const Position& particle, const Position& pointer, const ForceConfig& config);

/**
 * @brief Pairwise attraction between particles A and B
 *
 * @return The force on A (pointing towards B), or std::nullopt when the
 *         pair is out of range. The force on B is the exact negation.
 */
std::optional<Vector> pairForce(const Position& a, const Position& b, const ForceConfig& config);

/**
 * @class ForceModel
 * @brief Accumulates pointer and pairwise forces into every particle
 */
class ForceModel : public ConfigurableSystem<ForceConfig> {
public:
    ForceModel();
    ~ForceModel() override = default;

    /**
     * @brief Adds this frame's forces to every particle's accumulator
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry& registry) override;
};

} // namespace Systems
