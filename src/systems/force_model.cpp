/**
 * @file force_model.cpp
 * @brief Implementation of pointer repulsion and pairwise attraction
 */

#include "swarm/systems/force_model.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/core/debug.hpp"
#include "swarm/core/profile.hpp"

namespace Systems {

namespace {

void requireNonNegative(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(std::string(name) + " must be finite and non-negative");
    }
}

} // namespace

void ForceConfig::validate() const {
    if (!std::isfinite(particleRadius) || particleRadius <= 0.0) {
        throw std::invalid_argument("particleRadius must be finite and > 0");
    }
    requireNonNegative(pushRadius, "pushRadius");
    requireNonNegative(pushStrength, "pushStrength");
    requireNonNegative(attractionRadius, "attractionRadius");
    requireNonNegative(attractionStrength, "attractionStrength");
}

Vector pointerForce(const Position& particle, const Position& pointer, const ForceConfig& config) {
    Vector const delta = particle - pointer;
    double const distance = delta.length();

    // Near-singular or out of reach: no push
    if (distance <= 1.0 || distance >= config.pushRadius) {
        return Vector(0.0, 0.0);
    }

    double const forceScale = (config.pushRadius - distance) / config.pushRadius;
    return (delta / distance) * (forceScale * config.pushStrength);
}

std::optional<Vector> pairForce(const Position& a, const Position& b, const ForceConfig& config) {
    Vector const delta = b - a;
    double const distance = delta.length();

    // Overlapping pairs are left to collision resolution
    if (distance <= 2.0 * config.particleRadius || distance > config.attractionRadius) {
        return std::nullopt;
    }

    double const magnitude = config.attractionStrength / (distance * distance);
    return (delta / distance) * magnitude;
}

ForceModel::ForceModel() {
    specificConfig.validate();
}

void ForceModel::update(entt::registry& registry) {
    SWARM_PROFILE_SCOPE("ForceModel");

    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.empty()) {
        return;
    }
    const auto& state = registry.get<Components::SimulatorState>(stateView.front());

    auto view = registry.view<Components::Particle, Components::Position, Components::Force>();

    std::vector<entt::entity> entities;
    std::vector<Position> positions;
    for (auto [entity, particle, pos, force] : view.each()) {
        entities.push_back(entity);
        positions.push_back(pos);
    }

    std::vector<Vector> accumulated(entities.size());

    // Pointer repulsion
    for (std::size_t i = 0; i < positions.size(); ++i) {
        accumulated[i] += pointerForce(positions[i], state.pointer, specificConfig);
    }

    // Pairwise attraction, equal and opposite
    for (std::size_t i = 0; i < positions.size(); ++i) {
        for (std::size_t j = i + 1; j < positions.size(); ++j) {
            auto f = pairForce(positions[i], positions[j], specificConfig);
            DebugStats::updatePair(f.has_value(), f ? f->length() : 0.0);
            if (!f) {
                continue;
            }
            accumulated[i] += *f;
            accumulated[j] -= *f;
        }
    }

    for (std::size_t i = 0; i < entities.size(); ++i) {
        auto& force = view.get<Components::Force>(entities[i]);
        force += accumulated[i];
    }
}

} // namespace Systems
