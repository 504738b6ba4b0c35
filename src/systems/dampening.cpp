/**
 * @file dampening.cpp
 * @brief Implementation of velocity dampening system
 */

#include "swarm/systems/dampening.hpp"
#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/core/profile.hpp"

#include <cmath>

namespace Systems {

DampeningSystem::DampeningSystem() {
    // Initialize with default configurations
}

void DampeningSystem::update(entt::registry &registry) {
    SWARM_PROFILE_SCOPE("DampeningSystem");

    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.empty()) {
        return;
    }
    double const dt = registry.get<Components::SimulatorState>(stateView.front()).timeStep;

    auto view = registry.view<Components::Velocity, Components::AngularVelocity, Components::Damping>();

    for (auto [entity, vel, angVel, damping] : view.each()) {
        if (damping.linear > 0.0) {
            vel *= std::pow(1.0 - damping.linear, dt);
        }
        if (damping.angular > 0.0) {
            angVel.omega *= std::pow(1.0 - damping.angular, dt);
        }
    }
}

} // namespace Systems
