/**
 * @file world.hpp
 * @brief Container of every simulated body plus world-wide physical settings
 */

#pragma once

#include <entt/entt.hpp>

#include "swarm/core/materials.hpp"
#include "swarm/math/vector_math.hpp"

/**
 * @enum BroadphaseType
 * @brief Strategy used to narrow candidate collision pairs
 */
enum class BroadphaseType {
    Naive,          ///< every pair of bodies
    SweepAndPrune   ///< sort bounding boxes along x and sweep
};

/**
 * @struct BodyDefinition
 * @brief Everything needed to add one body to the world
 *
 * Exactly one of radius (circle) or halfWidth/halfHeight (box) is used,
 * depending on isCircle. A mass of zero creates a static body.
 */
struct BodyDefinition {
    Position position;
    double mass = 0.0;
    bool isCircle = true;
    double radius = 1.0;
    double halfWidth = 1.0;
    double halfHeight = 1.0;
    double linearDamping = 0.0;
    double angularDamping = 0.0;
    MaterialId material = NoMaterial;
};

/**
 * @class World
 * @brief Owns the registry holding all bodies, gravity, broadphase choice
 *        and the material/contact-material registry.
 *
 * One World exists per simulation instance. It also owns the single
 * Components::SimulatorState entity the systems read per-frame values from.
 */
class World {
public:
    World();
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /**
     * @brief Creates a body entity with position, velocity, force, shape,
     *        mass, damping and material components.
     */
    entt::entity createBody(const BodyDefinition& def);

    /**
     * @brief Destroys a body; entities that are not bodies are left alone
     */
    void destroyBody(entt::entity body);

    /** @brief Number of live bodies (particles and boundaries) */
    std::size_t bodyCount() const;

    MaterialId addMaterial(const Material& material);

    /**
     * @brief Returns the material registered under material.name, adding it
     *        first if no material of that name exists
     */
    MaterialId ensureMaterial(const Material& material);
    bool addContactMaterial(MaterialId a, MaterialId b, const ContactProperties& props);
    bool hasContactMaterial(MaterialId a, MaterialId b) const;
    ContactProperties resolveContact(MaterialId a, MaterialId b) const;
    const MaterialTable& materials() const { return materialTable; }

    const Vector& gravity() const { return gravityVector; }
    void setGravity(const Vector& g) { gravityVector = g; }

    BroadphaseType broadphase() const { return broadphaseType; }
    void setBroadphase(BroadphaseType type) { broadphaseType = type; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    entt::entity stateEntity() const { return state; }

private:
    entt::registry registry;
    entt::entity state;
    Vector gravityVector;
    BroadphaseType broadphaseType = BroadphaseType::SweepAndPrune;
    MaterialTable materialTable;
};
