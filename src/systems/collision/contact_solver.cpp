/**
 * @fileoverview contact_solver.cpp
 * @brief Sequential-impulse contact solver
 */

#include <algorithm>
#include <cmath>
#include <vector>

#include "swarm/systems/collision/contact_solver.hpp"
#include "swarm/components/basic.hpp"
#include "swarm/core/debug.hpp"
#include "swarm/core/profile.hpp"

namespace RigidBodyCollision
{

namespace {

/**
 * @brief Pre-computed solver state for one contact
 */
struct ContactConstraint
{
    entt::entity a;
    entt::entity b;
    Vector normal;
    Vector tangent;
    Vector rA;           ///< Contact offset from A
    Vector rB;           ///< Contact offset from B
    double invMassA;
    double invMassB;
    double invIA;
    double invIB;
    double normalMass;   ///< Effective mass along the normal
    double tangentMass;  ///< Effective mass along the tangent
    double bias;         ///< Restitution target velocity
    double friction;
    double normalImpulse = 0.0;
    double tangentImpulse = 0.0;
};

// 2D angular velocity crossed with an offset: w x r
Vector crossScalar(double w, const Vector &r)
{
    return Vector(-w * r.y, w * r.x);
}

Vector relativeVelocity(const entt::registry &registry, const ContactConstraint &c)
{
    const auto &vA = registry.get<Components::Velocity>(c.a);
    const auto &vB = registry.get<Components::Velocity>(c.b);
    double const wA = registry.get<Components::AngularVelocity>(c.a).omega;
    double const wB = registry.get<Components::AngularVelocity>(c.b).omega;
    return (vB + crossScalar(wB, c.rB)) - (vA + crossScalar(wA, c.rA));
}

void applyImpulse(entt::registry &registry, const ContactConstraint &c, const Vector &impulse)
{
    auto &vA = registry.get<Components::Velocity>(c.a);
    auto &vB = registry.get<Components::Velocity>(c.b);
    auto &wA = registry.get<Components::AngularVelocity>(c.a);
    auto &wB = registry.get<Components::AngularVelocity>(c.b);

    vA -= impulse * c.invMassA;
    wA.omega -= c.invIA * c.rA.cross(impulse);
    vB += impulse * c.invMassB;
    wB.omega += c.invIB * c.rB.cross(impulse);
}

std::vector<ContactConstraint> buildConstraints(
    const entt::registry &registry,
    const CollisionManifold &manifold,
    const MaterialTable &materials,
    const ContactSolverConfig &config)
{
    std::vector<ContactConstraint> constraints;
    constraints.reserve(manifold.collisions.size());

    for (const auto &col : manifold.collisions) {
        if (!registry.valid(col.a) || !registry.valid(col.b)) continue;

        const auto &bodyA = registry.get<Components::RigidBody>(col.a);
        const auto &bodyB = registry.get<Components::RigidBody>(col.b);
        if (bodyA.isStatic() && bodyB.isStatic()) continue;

        ContactConstraint c;
        c.a = col.a;
        c.b = col.b;
        c.normal = col.normal;
        c.tangent = col.normal.perp();
        c.rA = col.contactPoint - static_cast<Vector>(registry.get<Components::Position>(col.a));
        c.rB = col.contactPoint - static_cast<Vector>(registry.get<Components::Position>(col.b));
        c.invMassA = bodyA.invMass;
        c.invMassB = bodyB.invMass;
        c.invIA = bodyA.invInertia;
        c.invIB = bodyB.invInertia;

        double const rnA = c.rA.cross(c.normal);
        double const rnB = c.rB.cross(c.normal);
        double const kNormal = c.invMassA + c.invMassB + c.invIA * rnA * rnA + c.invIB * rnB * rnB;
        c.normalMass = kNormal > 0.0 ? 1.0 / kNormal : 0.0;

        double const rtA = c.rA.cross(c.tangent);
        double const rtB = c.rB.cross(c.tangent);
        double const kTangent = c.invMassA + c.invMassB + c.invIA * rtA * rtA + c.invIB * rtB * rtB;
        c.tangentMass = kTangent > 0.0 ? 1.0 / kTangent : 0.0;

        MaterialId const matA = registry.get<Components::MaterialRef>(col.a).id;
        MaterialId const matB = registry.get<Components::MaterialRef>(col.b).id;
        ContactProperties const props = materials.resolve(matA, matB);
        c.friction = props.friction;

        double const approach = relativeVelocity(registry, c).dotProduct(c.normal);
        c.bias = (approach < -config.restitutionThreshold) ? -props.restitution * approach : 0.0;

        constraints.push_back(c);
    }
    return constraints;
}

} // namespace

void ContactSolver::solveContactConstraints(
    entt::registry &registry,
    const CollisionManifold &manifold,
    const MaterialTable &materials,
    const ContactSolverConfig &config)
{
    SWARM_PROFILE_SCOPE("ContactSolver");

    auto constraints = buildConstraints(registry, manifold, materials, config);
    DebugStats::updateContacts(constraints.size());
    if (constraints.empty()) {
        return;
    }

    for (int iter = 0; iter < config.iterations; ++iter) {
        for (auto &c : constraints) {
            // Friction first so the normal impulse of this pass has the final say
            {
                double const vt = relativeVelocity(registry, c).dotProduct(c.tangent);
                double const maxFriction = c.friction * c.normalImpulse;
                double const lambda = -vt * c.tangentMass;
                double const accumulated = std::clamp(c.tangentImpulse + lambda, -maxFriction, maxFriction);
                double const applied = accumulated - c.tangentImpulse;
                c.tangentImpulse = accumulated;
                applyImpulse(registry, c, c.tangent * applied);
            }

            {
                double const vn = relativeVelocity(registry, c).dotProduct(c.normal);
                double const lambda = -(vn - c.bias) * c.normalMass;
                double const accumulated = std::max(c.normalImpulse + lambda, 0.0);
                double const applied = accumulated - c.normalImpulse;
                c.normalImpulse = accumulated;
                applyImpulse(registry, c, c.normal * applied);
            }
        }
    }
}

} // namespace RigidBodyCollision
