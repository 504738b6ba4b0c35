#include "swarm/systems/movement.hpp"
#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/core/profile.hpp"

namespace Systems {

MovementSystem::MovementSystem() {
    // Initialize with default configurations
}

void MovementSystem::update(entt::registry &registry) {
    SWARM_PROFILE_SCOPE("MovementSystem");

    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.empty()) {
        return;
    }
    double const dt = registry.get<Components::SimulatorState>(stateView.front()).timeStep;

    auto view = registry.view<Components::Position, Components::Velocity, Components::RigidBody>();

    for (auto [entity, pos, vel, body] : view.each()) {
        if (body.isStatic()) {
            continue;
        }
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }
}

} // namespace Systems
