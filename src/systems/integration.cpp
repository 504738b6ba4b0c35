/**
 * @file integration.cpp
 * @brief Implementation of force and gravity integration
 */

#include "swarm/systems/integration.hpp"
#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/core/profile.hpp"

namespace Systems {

ForceIntegrationSystem::ForceIntegrationSystem() {
    // Initialize with default configurations
}

void ForceIntegrationSystem::update(entt::registry& registry) {
    SWARM_PROFILE_SCOPE("ForceIntegrationSystem");

    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.empty()) {
        return;
    }
    double const dt = registry.get<Components::SimulatorState>(stateView.front()).timeStep;
    const Vector& gravity = specificConfig.gravity;

    auto view = registry.view<Components::RigidBody, Components::Velocity, Components::Force>();
    for (auto [entity, body, vel, force] : view.each()) {
        if (body.isStatic()) {
            continue;
        }
        vel.x += (force.x * body.invMass + gravity.x) * dt;
        vel.y += (force.y * body.invMass + gravity.y) * dt;
    }
}

void ForceIntegrationSystem::clearForces(entt::registry& registry) {
    auto view = registry.view<Components::Force>();
    for (auto entity : view) {
        auto& force = view.get<Components::Force>(entity);
        force.x = 0.0;
        force.y = 0.0;
    }
}

} // namespace Systems
