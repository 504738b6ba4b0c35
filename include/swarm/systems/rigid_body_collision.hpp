/**
 * @file rigid_body_collision.hpp
 * @brief Collision detection and resolution for particles and boundaries
 *
 * This module orchestrates the collision pipeline:
 * 1. Broad-phase: bounding-box filtering with the selected strategy
 * 2. Narrow-phase: exact circle/circle and circle/box tests
 * 3. Contact solving: iterative velocity impulses using contact materials
 * 4. Position correction (separate call, after positions are integrated)
 */

#ifndef SWARM_RIGID_BODY_COLLISION_HPP
#define SWARM_RIGID_BODY_COLLISION_HPP

#include <vector>

#include <entt/entt.hpp>
#include "swarm/core/materials.hpp"
#include "swarm/core/world.hpp"
#include "swarm/systems/i_system.hpp"
#include "swarm/systems/collision/collision_data.hpp"
#include "swarm/systems/collision/contact_solver.hpp"
#include "swarm/systems/collision/position_solver.hpp"

namespace Systems {

struct CollisionConfig {
    BroadphaseType broadphase = BroadphaseType::SweepAndPrune;
    RigidBodyCollision::ContactSolverConfig contactSolver;
    RigidBodyCollision::PositionSolverConfig positionSolver;
};

/**
 * @brief Detects contacts and resolves them with velocity impulses
 *
 * The candidate pairs found by update() are kept for correctPositions(),
 * which the stepper calls once positions have been advanced.
 */
class RigidBodyCollisionSystem : public ConfigurableSystem<CollisionConfig> {
public:
    explicit RigidBodyCollisionSystem(const MaterialTable& materials);
    ~RigidBodyCollisionSystem() override = default;

    /**
     * @brief Broad phase, narrow phase and contact solver
     * @param registry ECS registry containing physics components
     */
    void update(entt::registry& registry) override;

    /**
     * @brief Removes residual penetration among this step's candidate pairs
     */
    void correctPositions(entt::registry& registry);

    /** @brief Contacts found by the last update() */
    const CollisionManifold& lastManifold() const { return manifold; }

private:
    const MaterialTable& materials;
    std::vector<CandidatePair> candidatePairs;
    CollisionManifold manifold;
};

} // namespace Systems

#endif // SWARM_RIGID_BODY_COLLISION_HPP
