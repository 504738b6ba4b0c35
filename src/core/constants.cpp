#include "swarm/core/constants.hpp"

namespace SwarmConstants {

    const double Pi      = 3.141592653589793;
    const double Epsilon = 1e-9;

    const double MaxTimeStep     = 0.1;
    const double InitialTimeStep = 0.016;

    const double BoundaryThickness = 50.0;

    const double DefaultGravityX = 0.0;
    const double DefaultGravityY = -1000.0;

    const double ParticleMass           = 1.0;
    const double ParticleLinearDamping  = 0.3;
    const double ParticleAngularDamping = 0.5;
    const double SpawnRadiusFraction    = 0.8;
    const double ColorLightnessJitter   = 0.05;
    const double ParticleOpacity        = 0.75;

    const double ParticleFriction           = 0.05;
    const double ParticleRestitution        = 0.3;
    const double ParticleContactFriction    = 0.01;
    const double ParticleContactRestitution = 0.3;
    const double BoundaryFriction           = 0.0;
    const double BoundaryRestitution        = 0.5;
    const double DefaultContactFriction     = 0.3;
    const double DefaultContactRestitution  = 0.0;

    const int    DefaultParticleCount      = 1000;
    const double DefaultParticleRadius     = 7.0;
    const double DefaultPushRadius         = 80.0;
    const double DefaultPushStrength       = 30000.0;
    const double DefaultAttractionRadius   = 150.0;
    const double DefaultAttractionStrength = 25000.0;
    const std::string DefaultParticleColor = "#2ACBF3";

    const double AttractionRadiusRange[3]   = {50.0, 300.0, 10.0};
    const double AttractionStrengthRange[3] = {5000.0, 100000.0, 5000.0};
    const double PushRadiusRange[3]         = {0.0, 300.0, 10.0};
    const double PushStrengthRange[3]       = {0.0, 100000.0, 5000.0};
    const double ParticleRadiusRange[3]     = {2.0, 20.0, 1.0};
    const double ParticleCountRange[3]      = {0.0, 3000.0, 100.0};

    const unsigned int WindowWidth  = 1200;
    const unsigned int WindowHeight = 800;

} // namespace SwarmConstants
