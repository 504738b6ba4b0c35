/**
 * @file integration.hpp
 * @brief Velocity update from accumulated forces and uniform gravity
 *
 * Applies v += (F / m + g) * dt to every dynamic body, where F is the
 * body's Components::Force accumulator. Static bodies are skipped.
 *
 * Required components:
 * - RigidBody, Velocity, Force
 *
 * Reads:
 * - SimulatorState::timeStep
 */

#ifndef SWARM_INTEGRATION_SYSTEM_HPP
#define SWARM_INTEGRATION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "swarm/math/vector_math.hpp"
#include "swarm/systems/i_system.hpp"

namespace Systems {

/**
 * @struct IntegrationConfig
 * @brief Configuration parameters specific to the integration system
 */
struct IntegrationConfig {
    // Uniform acceleration applied to every dynamic body
    Vector gravity;
};

class ForceIntegrationSystem : public ConfigurableSystem<IntegrationConfig> {
public:
    ForceIntegrationSystem();
    ~ForceIntegrationSystem() override = default;

    /**
     * @brief Integrates forces and gravity into velocities
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry& registry) override;

    /**
     * @brief Zeroes every force accumulator
     */
    static void clearForces(entt::registry& registry);
};

} // namespace Systems

#endif
