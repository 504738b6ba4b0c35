/**
 * @file rotation.cpp
 * @brief Implementation of rotational motion system
 */

#include "swarm/systems/rotation.hpp"
#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/core/constants.hpp"
#include "swarm/core/profile.hpp"

#include <algorithm>
#include <cmath>

namespace Systems {

RotationSystem::RotationSystem() {
    // Initialize with default configurations
}

void RotationSystem::update(entt::registry &registry) {
    SWARM_PROFILE_SCOPE("RotationSystem");

    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.empty()) {
        return;
    }
    double const dt = registry.get<Components::SimulatorState>(stateView.front()).timeStep;
    double const twoPi = 2.0 * SwarmConstants::Pi;

    auto view = registry.view<Components::AngularPosition, Components::AngularVelocity,
                              Components::RigidBody>();
    for (auto [entity, angPos, angVel, body] : view.each()) {
        if (body.isStatic()) {
            continue;
        }

        // Clamp angular velocity (if configured)
        if (specificConfig.maxAngularSpeed > 0) {
            angVel.omega = std::clamp(angVel.omega, -specificConfig.maxAngularSpeed,
                                      specificConfig.maxAngularSpeed);
        }

        angPos.angle = std::fmod(angPos.angle + angVel.omega * dt, twoPi);
        if (angPos.angle < 0.0) {
            angPos.angle += twoPi;
        }
    }
}

} // namespace Systems
