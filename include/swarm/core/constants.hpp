#ifndef SWARM_CONSTANTS_HPP
#define SWARM_CONSTANTS_HPP

#include <string>

namespace SwarmConstants {

    // Truly global constants
    extern const double Pi;
    extern const double Epsilon;

    // Time stepping (seconds)
    extern const double MaxTimeStep;      // clamp for long pauses between frames
    extern const double InitialTimeStep;  // used before any timestamp history exists

    // Enclosure
    extern const double BoundaryThickness;

    // World
    extern const double DefaultGravityX;
    extern const double DefaultGravityY;

    // Particle bodies
    extern const double ParticleMass;
    extern const double ParticleLinearDamping;
    extern const double ParticleAngularDamping;
    extern const double SpawnRadiusFraction;    // of min(halfWidth, halfHeight)
    extern const double ColorLightnessJitter;   // +/- HSL lightness per particle
    extern const double ParticleOpacity;

    // Materials
    extern const double ParticleFriction;
    extern const double ParticleRestitution;
    extern const double ParticleContactFriction;
    extern const double ParticleContactRestitution;
    extern const double BoundaryFriction;
    extern const double BoundaryRestitution;
    extern const double DefaultContactFriction;
    extern const double DefaultContactRestitution;

    // Default tunables
    extern const int    DefaultParticleCount;
    extern const double DefaultParticleRadius;
    extern const double DefaultPushRadius;
    extern const double DefaultPushStrength;
    extern const double DefaultAttractionRadius;
    extern const double DefaultAttractionStrength;
    extern const std::string DefaultParticleColor;

    // Slider ranges {min, max, step}
    extern const double AttractionRadiusRange[3];
    extern const double AttractionStrengthRange[3];
    extern const double PushRadiusRange[3];
    extern const double PushStrengthRange[3];
    extern const double ParticleRadiusRange[3];
    extern const double ParticleCountRange[3];

    // Native host
    extern const unsigned int WindowWidth;
    extern const unsigned int WindowHeight;
}

#endif // SWARM_CONSTANTS_HPP
