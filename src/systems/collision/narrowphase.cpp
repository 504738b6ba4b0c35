#include "swarm/systems/collision/narrowphase.hpp"

#include <algorithm>
#include <cmath>

#include "swarm/components/basic.hpp"
#include "swarm/core/profile.hpp"

namespace RigidBodyCollision {

std::optional<CollisionInfo> collideCircles(const Position& centerA, double radiusA,
                                            const Position& centerB, double radiusB)
{
    Vector const delta = centerB - centerA;
    double const distSq = delta.lengthSquared();
    double const radii = radiusA + radiusB;
    if (distSq >= radii * radii) {
        return std::nullopt;
    }

    double const dist = std::sqrt(distSq);
    Vector const normal = (dist > EPSILON) ? delta / dist : Vector(1.0, 0.0);

    CollisionInfo info;
    info.a = entt::null;
    info.b = entt::null;
    info.normal = normal;
    info.penetration = radii - dist;
    info.contactPoint = static_cast<Vector>(centerA) + normal * (radiusA - info.penetration * 0.5);
    return info;
}

std::optional<CollisionInfo> collideCircleBox(const Position& center, double radius,
                                              const Position& boxCenter,
                                              double halfWidth, double halfHeight)
{
    Vector const local = center - boxCenter;
    bool const inside = std::fabs(local.x) <= halfWidth && std::fabs(local.y) <= halfHeight;

    CollisionInfo info;
    info.a = entt::null;
    info.b = entt::null;

    if (!inside) {
        Vector const closest(std::clamp(local.x, -halfWidth, halfWidth),
                             std::clamp(local.y, -halfHeight, halfHeight));
        Vector const away = local - closest;  // from box surface to circle centre
        double const distSq = away.lengthSquared();
        if (distSq >= radius * radius) {
            return std::nullopt;
        }
        double const dist = std::sqrt(distSq);
        Vector const outward = (dist > EPSILON) ? away / dist : Vector(0.0, 1.0);

        info.normal = -outward;
        info.penetration = radius - dist;
        info.contactPoint = static_cast<Vector>(boxCenter) + closest;
        return info;
    }

    // Centre inside the box: leave through the face with the least overlap
    double const overlapX = halfWidth - std::fabs(local.x);
    double const overlapY = halfHeight - std::fabs(local.y);
    Vector outward;
    Vector surface;
    if (overlapX < overlapY) {
        double const sign = local.x < 0.0 ? -1.0 : 1.0;
        outward = Vector(sign, 0.0);
        surface = Vector(sign * halfWidth, local.y);
        info.penetration = radius + overlapX;
    } else {
        double const sign = local.y < 0.0 ? -1.0 : 1.0;
        outward = Vector(0.0, sign);
        surface = Vector(local.x, sign * halfHeight);
        info.penetration = radius + overlapY;
    }
    info.normal = -outward;
    info.contactPoint = static_cast<Vector>(boxCenter) + surface;
    return info;
}

std::optional<CollisionInfo> collide(const entt::registry& registry, entt::entity a, entt::entity b)
{
    if (!registry.valid(a) || !registry.valid(b)) {
        return std::nullopt;
    }

    const auto& posA = registry.get<Components::Position>(a);
    const auto& posB = registry.get<Components::Position>(b);
    const auto* circleA = registry.try_get<Components::CircleShape>(a);
    const auto* circleB = registry.try_get<Components::CircleShape>(b);
    const auto* boxA = registry.try_get<Components::BoxShape>(a);
    const auto* boxB = registry.try_get<Components::BoxShape>(b);

    std::optional<CollisionInfo> result;
    if (circleA && circleB) {
        result = collideCircles(posA, circleA->radius, posB, circleB->radius);
    } else if (circleA && boxB) {
        result = collideCircleBox(posA, circleA->radius, posB, boxB->halfWidth, boxB->halfHeight);
    } else if (boxA && circleB) {
        result = collideCircleBox(posB, circleB->radius, posA, boxA->halfWidth, boxA->halfHeight);
        if (result) {
            result->normal = -result->normal;  // report from a towards b
        }
    }

    if (result) {
        result->a = a;
        result->b = b;
    }
    return result;
}

CollisionManifold narrowPhase(const entt::registry& registry,
                              const std::vector<CandidatePair>& candidatePairs)
{
    SWARM_PROFILE_SCOPE("Narrowphase");

    CollisionManifold manifold;
    manifold.collisions.reserve(candidatePairs.size());
    for (const auto& pair : candidatePairs) {
        if (auto info = collide(registry, pair.eA, pair.eB)) {
            manifold.collisions.push_back(*info);
        }
    }
    return manifold;
}

} // namespace RigidBodyCollision
