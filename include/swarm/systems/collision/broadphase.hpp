/**
 * @file broadphase.hpp
 * @brief Broad-phase collision detection over axis-aligned bounding boxes
 *
 * Filters body pairs down to those whose bounding boxes overlap. Two
 * strategies are available and report the same pairs:
 * - Naive: tests every pair
 * - SweepAndPrune: sorts boxes by their minimum x and only tests boxes
 *   whose x intervals overlap
 *
 * Pairs of two static bodies are never reported. Each reported pair has
 * eA < eB.
 */

#pragma once

#include <vector>
#include <entt/entt.hpp>
#include "swarm/core/world.hpp"
#include "swarm/systems/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief Bounding box of one body
 */
struct AABBEntity {
    entt::entity entity;
    double minx, miny, maxx, maxy;
    bool isStatic;
};

class Broadphase {
public:
    /**
     * @brief Collects the bounding box of every body with a shape
     */
    static std::vector<AABBEntity> gatherBounds(const entt::registry& registry);

    /**
     * @brief Performs broad-phase collision detection and returns candidate pairs
     * @param registry EnTT registry containing entities and components
     * @param type Strategy to use
     * @return Entity pairs whose bounding boxes overlap
     */
    static std::vector<CandidatePair> detectCollisions(const entt::registry& registry,
                                                       BroadphaseType type);
};

} // namespace RigidBodyCollision
