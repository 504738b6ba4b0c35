/**
 * @file collision_data.hpp
 * @brief Declaration of collision data structures
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "swarm/math/vector_math.hpp"

// CandidatePair used by broad phase and narrow phase
struct CandidatePair {
    entt::entity eA;
    entt::entity eB;
};

// CollisionInfo used by narrow phase and response systems.
// normal is unit length and points from a towards b.
struct CollisionInfo {
    entt::entity a;
    entt::entity b;
    Vector normal;
    double penetration;
    Vector contactPoint;
};

// CollisionManifold used by response systems
struct CollisionManifold {
    std::vector<CollisionInfo> collisions;
};
