#include "swarm/core/world.hpp"

#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/core/constants.hpp"

#include <iostream>

World::World()
    : gravityVector(SwarmConstants::DefaultGravityX, SwarmConstants::DefaultGravityY)
{
    state = registry.create();
    registry.emplace<Components::SimulatorState>(state);
}

World::~World() = default;

entt::entity World::createBody(const BodyDefinition& def) {
    auto entity = registry.create();

    Components::RigidBody body;
    body.mass = def.mass;
    if (def.mass > 0.0) {
        body.invMass = 1.0 / def.mass;
        if (def.isCircle) {
            body.inertia = 0.5 * def.mass * def.radius * def.radius;
        } else {
            double const w = 2.0 * def.halfWidth;
            double const h = 2.0 * def.halfHeight;
            body.inertia = def.mass * (w * w + h * h) / 12.0;
        }
        body.invInertia = body.inertia > 0.0 ? 1.0 / body.inertia : 0.0;
    }

    registry.emplace<Components::Position>(entity, def.position.x, def.position.y);
    registry.emplace<Components::Velocity>(entity, 0.0, 0.0);
    registry.emplace<Components::Force>(entity, 0.0, 0.0);
    registry.emplace<Components::RigidBody>(entity, body);
    registry.emplace<Components::AngularPosition>(entity, 0.0);
    registry.emplace<Components::AngularVelocity>(entity, 0.0);
    registry.emplace<Components::Damping>(entity, def.linearDamping, def.angularDamping);
    registry.emplace<Components::MaterialRef>(entity, def.material);

    if (def.isCircle) {
        registry.emplace<Components::CircleShape>(entity, def.radius);
    } else {
        registry.emplace<Components::BoxShape>(entity, def.halfWidth, def.halfHeight);
    }

    return entity;
}

void World::destroyBody(entt::entity body) {
    if (!registry.valid(body) || !registry.all_of<Components::RigidBody>(body)) {
        return;
    }
    registry.destroy(body);
}

std::size_t World::bodyCount() const {
    return registry.view<Components::RigidBody>().size();
}

MaterialId World::addMaterial(const Material& material) {
    return materialTable.addMaterial(material);
}

MaterialId World::ensureMaterial(const Material& material) {
    MaterialId const existing = materialTable.findByName(material.name);
    if (existing != NoMaterial) {
        return existing;
    }
    return materialTable.addMaterial(material);
}

bool World::addContactMaterial(MaterialId a, MaterialId b, const ContactProperties& props) {
    bool const added = materialTable.addContactMaterial(a, b, props);
    if (added) {
        const Material* ma = materialTable.find(a);
        const Material* mb = materialTable.find(b);
        std::cerr << "Registered contact material "
                  << (ma ? ma->name : "?") << " <-> " << (mb ? mb->name : "?")
                  << " (friction " << props.friction
                  << ", restitution " << props.restitution << ")\n";
    }
    return added;
}

bool World::hasContactMaterial(MaterialId a, MaterialId b) const {
    return materialTable.hasContactMaterial(a, b);
}

ContactProperties World::resolveContact(MaterialId a, MaterialId b) const {
    return materialTable.resolve(a, b);
}
