/**
 * @file rotation.hpp
 * @brief System for updating rotations based on angular velocity
 *
 * Required components:
 * - AngularPosition (to modify)
 * - AngularVelocity (to read)
 * - RigidBody (static bodies never rotate)
 */

#pragma once

#include <entt/entt.hpp>
#include "swarm/systems/i_system.hpp"

namespace Systems {

/**
 * @struct RotationConfig
 * @brief Configuration parameters specific to the rotation system
 */
struct RotationConfig {
    // Maximum allowed angular velocity in radians per second (<= 0 disables)
    double maxAngularSpeed = 0.0;
};

/**
 * @class RotationSystem
 * @brief Integrates angular velocity and keeps angles in [0, 2*pi)
 */
class RotationSystem : public ConfigurableSystem<RotationConfig> {
public:
    RotationSystem();
    ~RotationSystem() override = default;

    /**
     * @brief Updates rotations for all dynamic bodies
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems
