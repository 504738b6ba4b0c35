/**
 * @file narrowphase.hpp
 * @brief Exact contact tests between circles and axis-aligned boxes
 */

#pragma once

#include <optional>
#include <vector>

#include <entt/entt.hpp>
#include "swarm/math/vector_math.hpp"
#include "swarm/systems/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief Contact between two circles
 *
 * @return Collision with normal from A to B, or std::nullopt if the circles
 *         do not overlap. Coincident centres use the +x axis as normal.
 */
std::optional<CollisionInfo> collideCircles(const Position& centerA, double radiusA,
                                            const Position& centerB, double radiusB);

/**
 * @brief Contact between a circle and an axis-aligned box
 *
 * @return Collision with normal from the circle towards the box, or
 *         std::nullopt if they do not touch. A centre inside the box is
 *         pushed out through the nearest face.
 */
std::optional<CollisionInfo> collideCircleBox(const Position& center, double radius,
                                              const Position& boxCenter,
                                              double halfWidth, double halfHeight);

/**
 * @brief Contact between two bodies in the registry, with entities filled in
 *
 * Box-box pairs produce no contact.
 */
std::optional<CollisionInfo> collide(const entt::registry& registry, entt::entity a, entt::entity b);

/**
 * @brief Runs exact tests over the broadphase candidates
 */
CollisionManifold narrowPhase(const entt::registry& registry,
                              const std::vector<CandidatePair>& candidatePairs);

} // namespace RigidBodyCollision
