/**
 * @file body_store.hpp
 * @brief Owns the particle bodies of a simulation
 *
 * Each particle is one entity carrying both its physical components and its
 * Components::Renderable, so a body and what is drawn for it can never drift
 * apart. The store keeps the particle entities in creation order; index i
 * always refers to the same particle until the next removeAll().
 */

#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include <entt/entt.hpp>

#include "swarm/core/sim_config.hpp"
#include "swarm/core/world.hpp"
#include "swarm/math/vector_math.hpp"
#include "swarm/rendering/color.hpp"

class BodyStore {
public:
    /**
     * @brief Registers the particle material and seeds config.count particles
     *
     * Throws std::invalid_argument if config or viewport are invalid.
     */
    BodyStore(World& world, const ParticleConfig& config, const Viewport& viewport, std::uint32_t seed);
    ~BodyStore();

    BodyStore(const BodyStore&) = delete;
    BodyStore& operator=(const BodyStore&) = delete;

    /**
     * @brief Creates count particles at random positions around the centre
     *
     * Each particle is placed at a uniformly random angle and a uniformly
     * random distance below SpawnRadiusFraction * min(halfWidth, halfHeight).
     */
    void addBatch(int count);

    /** @brief Destroys every particle body together with its renderable */
    void removeAll();

    std::size_t size() const { return particles.size(); }
    entt::entity entityAt(std::size_t index) const { return particles.at(index); }
    bool isParticle(entt::entity entity) const;

    Position position(std::size_t index) const;
    void setPosition(std::size_t index, const Position& position);
    Vector velocity(std::size_t index) const;
    void setVelocity(std::size_t index, const Vector& velocity);
    Vector force(std::size_t index) const;
    void applyForce(std::size_t index, const Vector& force);

    /**
     * @brief Re-tints every renderable; each particle keeps its own lightness offset
     */
    void setColor(const Rendering::Rgba& color);
    const Rendering::Rgba& color() const { return baseColor; }

    /** @brief Calls fn(index, entity) for every particle in index order */
    template<typename Fn>
    void forEach(Fn&& fn) const {
        for (std::size_t i = 0; i < particles.size(); ++i) {
            fn(i, particles[i]);
        }
    }

    const ParticleConfig& config() const { return particleConfig; }
    MaterialId material() const { return particleMaterial; }

private:
    World& world;
    ParticleConfig particleConfig;
    Viewport viewport;
    std::mt19937 rng;
    std::vector<entt::entity> particles;
    std::uint32_t nextId = 0;
    MaterialId particleMaterial = NoMaterial;
    Rendering::Rgba baseColor;
};

/**
 * @brief The material every particle body uses
 */
Material particleMaterialDefinition();
