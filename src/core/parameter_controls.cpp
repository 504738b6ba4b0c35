#include "swarm/core/parameter_controls.hpp"

ParameterControls::ParameterControls(const SimulationConfig& config) {
    latest.particleCount = config.particleCount;
    latest.forces = config.forces;
}

Input::ParametersChanged ParameterControls::step(Control control, int steps) {
    Systems::ForceConfig& f = latest.forces;

    switch (control) {
        case Control::AttractionRadius:
            f.attractionRadius = ParameterRange::attractionRadius().stepBy(f.attractionRadius, steps);
            break;
        case Control::AttractionStrength:
            f.attractionStrength = ParameterRange::attractionStrength().stepBy(f.attractionStrength, steps);
            break;
        case Control::PushRadius:
            f.pushRadius = ParameterRange::pushRadius().stepBy(f.pushRadius, steps);
            break;
        case Control::PushStrength:
            f.pushStrength = ParameterRange::pushStrength().stepBy(f.pushStrength, steps);
            break;
        case Control::ParticleRadius:
            f.particleRadius = ParameterRange::particleRadius().stepBy(f.particleRadius, steps);
            break;
        case Control::ParticleCount:
            latest.particleCount =
                static_cast<int>(ParameterRange::particleCount().stepBy(latest.particleCount, steps));
            break;
    }
    return latest;
}
