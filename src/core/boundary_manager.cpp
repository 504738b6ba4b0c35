#include "swarm/core/boundary_manager.hpp"

#include <iostream>
#include <vector>

#include "swarm/components/basic.hpp"
#include "swarm/core/body_store.hpp"
#include "swarm/core/constants.hpp"

Material boundaryMaterialDefinition() {
    Material m;
    m.name = "boundary";
    m.friction = SwarmConstants::BoundaryFriction;
    m.restitution = SwarmConstants::BoundaryRestitution;
    return m;
}

BoundaryManager::BoundaryManager(World& world, const Viewport& viewport)
    : world(world)
{
    walls.fill(entt::null);

    boundaryMaterial = world.ensureMaterial(boundaryMaterialDefinition());
    MaterialId const particleMaterial = world.ensureMaterial(particleMaterialDefinition());

    ContactProperties contact;
    contact.friction = SwarmConstants::BoundaryFriction;
    contact.restitution = SwarmConstants::BoundaryRestitution;
    world.addContactMaterial(particleMaterial, boundaryMaterial, contact);

    rebuild(viewport.width, viewport.height);
}

BoundaryManager::~BoundaryManager() {
    removeBoundaries();
}

double BoundaryManager::thickness() const {
    return SwarmConstants::BoundaryThickness;
}

void BoundaryManager::removeBoundaries() {
    auto& registry = world.getRegistry();

    // Anything with a body that is not a particle is a wall
    std::vector<entt::entity> stale;
    auto view = registry.view<Components::RigidBody>(entt::exclude<Components::Particle>);
    for (auto entity : view) {
        stale.push_back(entity);
    }
    for (auto entity : stale) {
        world.destroyBody(entity);
    }
    walls.fill(entt::null);
}

void BoundaryManager::rebuild(double width, double height) {
    Viewport next{width, height};
    next.validate();

    removeBoundaries();
    current = next;

    double const t = thickness();
    double const hw = current.halfWidth();
    double const hh = current.halfHeight();

    struct WallSpec {
        Components::BoundarySide side;
        Position centre;
        double halfWidth;
        double halfHeight;
    };
    const WallSpec specs[4] = {
        {Components::BoundarySide::Top,    Position(0.0, hh + t / 2.0),  hw, t / 2.0},
        {Components::BoundarySide::Bottom, Position(0.0, -hh - t / 2.0), hw, t / 2.0},
        {Components::BoundarySide::Left,   Position(-hw - t / 2.0, 0.0), t / 2.0, hh},
        {Components::BoundarySide::Right,  Position(hw + t / 2.0, 0.0),  t / 2.0, hh},
    };

    auto& registry = world.getRegistry();
    for (std::size_t i = 0; i < 4; ++i) {
        BodyDefinition def;
        def.position = specs[i].centre;
        def.mass = 0.0;
        def.isCircle = false;
        def.halfWidth = specs[i].halfWidth;
        def.halfHeight = specs[i].halfHeight;
        def.material = boundaryMaterial;

        walls[i] = world.createBody(def);
        registry.emplace<Components::Boundary>(walls[i], specs[i].side);
    }

    std::cerr << "Rebuilt boundaries for " << current.width << "x" << current.height << " viewport\n";
}
