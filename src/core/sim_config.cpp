#include "swarm/core/sim_config.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "swarm/core/constants.hpp"
#include "swarm/rendering/color.hpp"

namespace {

ParameterRange fromConstants(const double (&range)[3]) {
    return ParameterRange{range[0], range[1], range[2]};
}

} // namespace

double ParameterRange::clamp(double value) const {
    return std::clamp(value, min, max);
}

double ParameterRange::stepBy(double value, int steps) const {
    return clamp(value + step * steps);
}

ParameterRange ParameterRange::attractionRadius() {
    return fromConstants(SwarmConstants::AttractionRadiusRange);
}

ParameterRange ParameterRange::attractionStrength() {
    return fromConstants(SwarmConstants::AttractionStrengthRange);
}

ParameterRange ParameterRange::pushRadius() {
    return fromConstants(SwarmConstants::PushRadiusRange);
}

ParameterRange ParameterRange::pushStrength() {
    return fromConstants(SwarmConstants::PushStrengthRange);
}

ParameterRange ParameterRange::particleRadius() {
    return fromConstants(SwarmConstants::ParticleRadiusRange);
}

ParameterRange ParameterRange::particleCount() {
    return fromConstants(SwarmConstants::ParticleCountRange);
}

SimulationConfig::SimulationConfig()
    : particleCount(SwarmConstants::DefaultParticleCount)
    , particleColor(SwarmConstants::DefaultParticleColor)
    , gravity(SwarmConstants::DefaultGravityX, SwarmConstants::DefaultGravityY)
{
    forces.particleRadius = SwarmConstants::DefaultParticleRadius;
    forces.pushRadius = SwarmConstants::DefaultPushRadius;
    forces.pushStrength = SwarmConstants::DefaultPushStrength;
    forces.attractionRadius = SwarmConstants::DefaultAttractionRadius;
    forces.attractionStrength = SwarmConstants::DefaultAttractionStrength;
}

ParticleConfig SimulationConfig::particles() const {
    ParticleConfig out;
    out.count = particleCount;
    out.radius = forces.particleRadius;
    out.color = particleColor;
    return out;
}

void SimulationConfig::validate() const {
    particles().validate();
    if (!std::isfinite(gravity.x) || !std::isfinite(gravity.y)) {
        throw std::invalid_argument("gravity must be finite");
    }
    forces.validate();
}

void Viewport::validate() const {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0 || height <= 0.0) {
        throw std::invalid_argument("viewport extents must be finite and > 0");
    }
}

void ParticleConfig::validate() const {
    if (count < 0) {
        throw std::invalid_argument("particle count must be >= 0");
    }
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw std::invalid_argument("particle radius must be finite and > 0");
    }
    if (!Rendering::parseHexColor(color)) {
        throw std::invalid_argument("particle colour must be #RRGGBB, got '" + color + "'");
    }
}
