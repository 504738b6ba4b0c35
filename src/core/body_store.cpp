#include "swarm/core/body_store.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "swarm/components/basic.hpp"
#include "swarm/core/constants.hpp"
#include "swarm/core/debug.hpp"

Material particleMaterialDefinition() {
    Material m;
    m.name = "particle";
    m.friction = SwarmConstants::ParticleFriction;
    m.restitution = SwarmConstants::ParticleRestitution;
    return m;
}

BodyStore::BodyStore(World& world, const ParticleConfig& config, const Viewport& viewport, std::uint32_t seed)
    : world(world)
    , particleConfig(config)
    , viewport(viewport)
    , rng(seed)
{
    particleConfig.validate();
    viewport.validate();

    baseColor = *Rendering::parseHexColor(particleConfig.color);
    baseColor.a = static_cast<std::uint8_t>(std::lround(SwarmConstants::ParticleOpacity * 255.0));

    particleMaterial = world.ensureMaterial(particleMaterialDefinition());
    ContactProperties contact;
    contact.friction = SwarmConstants::ParticleContactFriction;
    contact.restitution = SwarmConstants::ParticleContactRestitution;
    world.addContactMaterial(particleMaterial, particleMaterial, contact);

    addBatch(particleConfig.count);
}

BodyStore::~BodyStore() {
    removeAll();
}

void BodyStore::addBatch(int count) {
    if (count <= 0) {
        return;
    }

    auto& registry = world.getRegistry();
    double const maxDistance = SwarmConstants::SpawnRadiusFraction
                               * std::min(viewport.halfWidth(), viewport.halfHeight());

    std::uniform_real_distribution<double> angleDist(0.0, 2.0 * SwarmConstants::Pi);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> jitter(-SwarmConstants::ColorLightnessJitter,
                                                  SwarmConstants::ColorLightnessJitter);

    particles.reserve(particles.size() + static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        double const angle = angleDist(rng);
        double const distance = unit(rng) * maxDistance;

        BodyDefinition def;
        def.position = Position(std::cos(angle) * distance, std::sin(angle) * distance);
        def.mass = SwarmConstants::ParticleMass;
        def.isCircle = true;
        def.radius = particleConfig.radius;
        def.linearDamping = SwarmConstants::ParticleLinearDamping;
        def.angularDamping = SwarmConstants::ParticleAngularDamping;
        def.material = particleMaterial;

        entt::entity const entity = world.createBody(def);
        registry.emplace<Components::Particle>(entity, nextId++);

        Components::Renderable renderable;
        renderable.x = def.position.x;
        renderable.y = def.position.y;
        renderable.radius = particleConfig.radius;
        renderable.lightnessOffset = jitter(rng);
        renderable.color = Rendering::offsetLightness(baseColor, renderable.lightnessOffset);
        registry.emplace<Components::Renderable>(entity, renderable);

        particles.push_back(entity);
    }

    std::cerr << "Created " << count << " particles (radius " << particleConfig.radius
              << ", total " << particles.size() << ")\n";
}

void BodyStore::removeAll() {
    for (entt::entity entity : particles) {
        world.destroyBody(entity);
    }
    SWARM_DEBUG_MSG(SWARM_DEBUG_LEVEL_BASIC, "Removed " << particles.size() << " particles\n");
    particles.clear();
}

bool BodyStore::isParticle(entt::entity entity) const {
    const auto& registry = world.getRegistry();
    return registry.valid(entity) && registry.all_of<Components::Particle>(entity);
}

Position BodyStore::position(std::size_t index) const {
    return world.getRegistry().get<Components::Position>(entityAt(index));
}

void BodyStore::setPosition(std::size_t index, const Position& position) {
    world.getRegistry().get<Components::Position>(entityAt(index)) = position;
}

Vector BodyStore::velocity(std::size_t index) const {
    return world.getRegistry().get<Components::Velocity>(entityAt(index));
}

void BodyStore::setVelocity(std::size_t index, const Vector& velocity) {
    world.getRegistry().get<Components::Velocity>(entityAt(index)) = velocity;
}

Vector BodyStore::force(std::size_t index) const {
    return world.getRegistry().get<Components::Force>(entityAt(index));
}

void BodyStore::applyForce(std::size_t index, const Vector& force) {
    world.getRegistry().get<Components::Force>(entityAt(index)) += force;
}

void BodyStore::setColor(const Rendering::Rgba& color) {
    baseColor = color;
    baseColor.a = static_cast<std::uint8_t>(std::lround(SwarmConstants::ParticleOpacity * 255.0));

    auto& registry = world.getRegistry();
    for (entt::entity entity : particles) {
        auto& renderable = registry.get<Components::Renderable>(entity);
        renderable.color = Rendering::offsetLightness(baseColor, renderable.lightnessOffset);
    }
}
