/**
 * @file dampening.hpp
 * @brief System for applying linear and angular velocity damping
 *
 * Each body loses the fraction given by its Damping component per second
 * of simulated time: v *= (1 - linear)^dt and omega *= (1 - angular)^dt,
 * so the attenuation does not depend on how the time is split into steps.
 *
 * Required components:
 * - Velocity, AngularVelocity, Damping
 */

#ifndef SWARM_DAMPENING_SYSTEM_HPP
#define SWARM_DAMPENING_SYSTEM_HPP

#include <entt/entt.hpp>
#include "swarm/systems/i_system.hpp"

namespace Systems {

class DampeningSystem : public ISystem {
public:
    DampeningSystem();
    ~DampeningSystem() override = default;

    /**
     * @brief Applies velocity and angular velocity damping
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif
