#include "swarm/systems/physics_stepper.hpp"

#include <algorithm>
#include <cmath>

#include "swarm/components/sim.hpp"
#include "swarm/core/constants.hpp"
#include "swarm/core/debug.hpp"
#include "swarm/core/profile.hpp"

namespace Systems {

PhysicsStepper::PhysicsStepper(World& world)
    : world(world)
    , collision(world.materials())
{
}

double PhysicsStepper::clampTimeStep(double dt) {
    if (!std::isfinite(dt) || dt < 0.0) {
        return 0.0;
    }
    return std::min(dt, SwarmConstants::MaxTimeStep);
}

void PhysicsStepper::step(double dt) {
    SWARM_PROFILE_SCOPE("PhysicsStepper::step");

    auto& registry = world.getRegistry();
    if (!registry.valid(world.stateEntity())) {
        return;
    }

    lastStep = clampTimeStep(dt);
    auto& state = registry.get<Components::SimulatorState>(world.stateEntity());
    state.timeStep = lastStep;

    // World settings may change between frames
    IntegrationConfig integrationConfig = integration.getSpecificConfig();
    integrationConfig.gravity = world.gravity();
    integration.setSpecificConfig(integrationConfig);

    CollisionConfig collisionConfig = collision.getSpecificConfig();
    collisionConfig.broadphase = world.broadphase();
    collision.setSpecificConfig(collisionConfig);

    integration.update(registry);
    dampening.update(registry);
    collision.update(registry);
    movement.update(registry);
    rotation.update(registry);
    collision.correctPositions(registry);
    ForceIntegrationSystem::clearForces(registry);

    state.frame++;
    DebugStats::printFrameStats();
}

} // namespace Systems
