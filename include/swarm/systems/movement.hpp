/**
 * @file movement.hpp
 * @brief System for updating positions based on velocity
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 * - RigidBody (static bodies never move)
 */

#ifndef SWARM_MOVEMENT_SYSTEM_HPP
#define SWARM_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "swarm/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Advances every dynamic body by velocity * dt
 */
class MovementSystem : public ISystem {
public:
    MovementSystem();
    ~MovementSystem() override = default;

    /**
     * @brief Updates positions for all dynamic bodies
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif
