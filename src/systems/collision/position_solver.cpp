#include "swarm/systems/collision/position_solver.hpp"
#include "swarm/systems/collision/narrowphase.hpp"
#include "swarm/components/basic.hpp"
#include "swarm/core/profile.hpp"


namespace RigidBodyCollision {

void PositionSolver::positionalSolver(entt::registry &registry,
                                      const std::vector<CandidatePair> &candidatePairs,
                                      const PositionSolverConfig &config)
{
    SWARM_PROFILE_SCOPE("PositionSolver");

    for (int iter = 0; iter < config.iterations; ++iter) {
        bool corrected = false;

        for (const auto &pair : candidatePairs) {
            auto col = collide(registry, pair.eA, pair.eB);
            if (!col || col->penetration <= config.slop) continue;

            const auto &bodyA = registry.get<Components::RigidBody>(col->a);
            const auto &bodyB = registry.get<Components::RigidBody>(col->b);
            double const invSum = bodyA.invMass + bodyB.invMass;
            if (invSum <= 0.0) continue;

            double const corr = (col->penetration - config.slop) * config.baumgarte / invSum;
            Vector const step = col->normal * corr;

            registry.get<Components::Position>(col->a) -= step * bodyA.invMass;
            registry.get<Components::Position>(col->b) += step * bodyB.invMass;
            corrected = true;
        }

        if (!corrected) {
            break;
        }
    }
}

} // namespace RigidBodyCollision
