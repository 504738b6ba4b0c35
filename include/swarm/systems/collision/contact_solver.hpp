/**
 * @file contact_solver.hpp
 * @brief Velocity-based constraint solver for body contacts
 *
 * This module implements an iterative sequential-impulse solver that
 * resolves contacts through velocity corrections. Each contact gets a
 * normal impulse (non-negative, with a restitution bias computed from the
 * approach speed before solving) and a Coulomb friction impulse bounded by
 * friction * normal impulse. Friction and restitution come from the
 * contact material registered for the two bodies' materials.
 */

#pragma once

#include <entt/entt.hpp>
#include "swarm/core/materials.hpp"
#include "swarm/systems/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @struct ContactSolverConfig
 * @brief Configuration parameters specific to the contact solver
 */
struct ContactSolverConfig {
    // Number of velocity solver iterations
    int iterations = 10;

    // Approach speeds below this do not bounce
    double restitutionThreshold = 1.0;
};

class ContactSolver {
public:
    /**
     * @brief Resolves all contacts in the manifold
     *
     * @param registry   ECS registry containing physics components
     * @param manifold   Contacts from the narrow phase
     * @param materials  Material and contact-material table
     * @param config     Contact solver configuration parameters
     */
    static void solveContactConstraints(
        entt::registry &registry,
        const CollisionManifold &manifold,
        const MaterialTable &materials,
        const ContactSolverConfig &config = ContactSolverConfig()
    );
};

} // namespace RigidBodyCollision
