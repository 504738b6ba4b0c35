/**
 * @file broadphase.cpp
 * @brief Implementation of the broad-phase collision detection strategies
 */

#include <algorithm>
#include <utility>
#include <vector>

#include "swarm/components/basic.hpp"
#include "swarm/core/profile.hpp"
#include "swarm/systems/collision/broadphase.hpp"

namespace RigidBodyCollision
{

/**
 * @brief Tests if two AABBs overlap
 */
static bool boxesOverlap(const AABBEntity &a, const AABBEntity &b) {
    if (a.maxx < b.minx || a.minx > b.maxx) return false;
    if (a.maxy < b.miny || a.miny > b.maxy) return false;
    return true;
}

static CandidatePair orderedPair(entt::entity a, entt::entity b) {
    if (b < a) {
        std::swap(a, b);
    }
    return CandidatePair{a, b};
}

std::vector<AABBEntity> Broadphase::gatherBounds(const entt::registry &registry)
{
    std::vector<AABBEntity> bounds;

    auto view = registry.view<Components::Position, Components::RigidBody>();
    for (auto [entity, pos, body] : view.each()) {
        double hx = 0.0;
        double hy = 0.0;
        if (const auto *circle = registry.try_get<Components::CircleShape>(entity)) {
            hx = hy = circle->radius;
        } else if (const auto *box = registry.try_get<Components::BoxShape>(entity)) {
            hx = box->halfWidth;
            hy = box->halfHeight;
        } else {
            continue;  // no collision shape
        }
        bounds.push_back(AABBEntity{entity, pos.x - hx, pos.y - hy, pos.x + hx, pos.y + hy,
                                    body.isStatic()});
    }
    return bounds;
}

static std::vector<CandidatePair> naivePairs(const std::vector<AABBEntity> &bounds)
{
    std::vector<CandidatePair> pairs;
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        for (std::size_t j = i + 1; j < bounds.size(); ++j) {
            if (bounds[i].isStatic && bounds[j].isStatic) continue;
            if (boxesOverlap(bounds[i], bounds[j])) {
                pairs.push_back(orderedPair(bounds[i].entity, bounds[j].entity));
            }
        }
    }
    return pairs;
}

static std::vector<CandidatePair> sweepAndPrunePairs(std::vector<AABBEntity> bounds)
{
    std::sort(bounds.begin(), bounds.end(),
              [](const AABBEntity &a, const AABBEntity &b) { return a.minx < b.minx; });

    std::vector<CandidatePair> pairs;
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        const auto &a = bounds[i];
        for (std::size_t j = i + 1; j < bounds.size(); ++j) {
            const auto &b = bounds[j];
            if (b.minx > a.maxx) break;  // sorted: nothing further along x can overlap
            if (a.isStatic && b.isStatic) continue;
            if (a.maxy < b.miny || a.miny > b.maxy) continue;
            pairs.push_back(orderedPair(a.entity, b.entity));
        }
    }
    return pairs;
}

std::vector<CandidatePair> Broadphase::detectCollisions(const entt::registry &registry,
                                                        BroadphaseType type)
{
    SWARM_PROFILE_SCOPE("Broadphase");

    auto bounds = gatherBounds(registry);
    if (type == BroadphaseType::Naive) {
        return naivePairs(bounds);
    }
    return sweepAndPrunePairs(std::move(bounds));
}

} // namespace RigidBodyCollision
