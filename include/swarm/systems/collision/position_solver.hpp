/**
 * @file position_solver.hpp
 * @brief Position-based correction of residual penetration
 *
 * Runs after positions have been integrated. Each pass recomputes the
 * contacts of the broadphase candidate pairs and moves the bodies apart
 * along the contact normal in proportion to their inverse masses, so
 * particles pushed into a wall by a large force are returned to the
 * enclosure instead of drifting through it.
 */

#pragma once

#include <vector>
#include <entt/entt.hpp>
#include "swarm/systems/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @struct PositionSolverConfig
 * @brief Configuration for position-based constraint solving
 */
struct PositionSolverConfig {
    // Number of position correction iterations
    int iterations = 3;

    // Fraction of the penetration removed per iteration
    double baumgarte = 0.8;

    // Penetration tolerated without correction
    double slop = 0.01;
};

class PositionSolver {
public:
    /**
     * @brief Separates overlapping bodies among the candidate pairs
     *
     * @param registry ECS registry containing physics components
     * @param candidatePairs Pairs reported by the broad phase this step
     * @param config Position solver configuration
     */
    static void positionalSolver(entt::registry &registry,
                                 const std::vector<CandidatePair> &candidatePairs,
                                 const PositionSolverConfig &config = PositionSolverConfig());
};

} // namespace RigidBodyCollision
