/**
 * @file physics_stepper.hpp
 * @brief Advances every body of a World by one time step
 *
 * One call to step(dt), in order:
 * 1. clamp dt to SwarmConstants::MaxTimeStep and publish it in SimulatorState
 * 2. integrate accumulated forces and gravity into velocities
 * 3. apply linear/angular damping
 * 4. detect contacts and resolve them with velocity impulses
 * 5. integrate positions and rotations
 * 6. correct residual penetration
 * 7. clear every force accumulator
 *
 * Forces written before step() in a frame are consumed by that same step
 * and are gone afterwards.
 */

#pragma once

#include "swarm/core/world.hpp"
#include "swarm/systems/dampening.hpp"
#include "swarm/systems/integration.hpp"
#include "swarm/systems/movement.hpp"
#include "swarm/systems/rigid_body_collision.hpp"
#include "swarm/systems/rotation.hpp"

namespace Systems {

class PhysicsStepper {
public:
    explicit PhysicsStepper(World& world);

    /**
     * @brief Advances the world by dt seconds (clamped to MaxTimeStep)
     */
    void step(double dt);

    /**
     * @brief dt limited to [0, MaxTimeStep]; non-finite input yields 0
     */
    static double clampTimeStep(double dt);

    /** @brief Effective time step used by the last call to step() */
    double lastTimeStep() const { return lastStep; }

    /** @brief Contacts found during the last step */
    const CollisionManifold& lastContacts() const { return collision.lastManifold(); }

private:
    World& world;
    ForceIntegrationSystem integration;
    DampeningSystem dampening;
    RigidBodyCollisionSystem collision;
    MovementSystem movement;
    RotationSystem rotation;
    double lastStep = 0.0;
};

} // namespace Systems
