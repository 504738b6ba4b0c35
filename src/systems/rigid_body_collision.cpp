/**
 * @file rigid_body_collision.cpp
 * @brief Implementation of the collision pipeline
 */

#include "swarm/systems/rigid_body_collision.hpp"

#include "swarm/core/profile.hpp"
#include "swarm/systems/collision/broadphase.hpp"
#include "swarm/systems/collision/narrowphase.hpp"

namespace Systems
{

RigidBodyCollisionSystem::RigidBodyCollisionSystem(const MaterialTable& materials)
    : materials(materials)
{
}

void RigidBodyCollisionSystem::update(entt::registry &registry)
{
    SWARM_PROFILE_SCOPE("RigidBodyCollisionSystem");
    using namespace RigidBodyCollision;

    // 1) Broad-phase
    candidatePairs = Broadphase::detectCollisions(registry, specificConfig.broadphase);

    // 2) Narrow-phase
    manifold = narrowPhase(registry, candidatePairs);
    if (manifold.collisions.empty()) {
        return;
    }

    // 3) Contact solver (iterative velocity constraints)
    ContactSolver::solveContactConstraints(registry, manifold, materials, specificConfig.contactSolver);
}

void RigidBodyCollisionSystem::correctPositions(entt::registry &registry)
{
    if (candidatePairs.empty()) {
        return;
    }
    RigidBodyCollision::PositionSolver::positionalSolver(registry, candidatePairs,
                                                         specificConfig.positionSolver);
}

} // namespace Systems
