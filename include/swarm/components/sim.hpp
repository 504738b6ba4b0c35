#pragma once

#include <cstdint>
#include "swarm/math/vector_math.hpp"

namespace Components {
    // Per-frame values shared between systems; exactly one entity carries this
    struct SimulatorState {
        double timeStep = 0.0;
        Position pointer;
        std::uint64_t frame = 0;
    };
}
