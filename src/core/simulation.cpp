#include "swarm/core/simulation.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "swarm/components/sim.hpp"
#include "swarm/core/constants.hpp"
#include "swarm/core/debug.hpp"
#include "swarm/core/profile.hpp"
#include "swarm/rendering/color.hpp"

Simulation::Simulation(IFrameScheduler& scheduler, const SimulationConfig& config, std::uint32_t seed)
    : scheduler(scheduler)
    , simConfig(config)
    , seeder(seed)
{
    simConfig.validate();
    forceModel.setSpecificConfig(simConfig.forces);
}

Simulation::~Simulation() {
    dispose();
}

bool Simulation::start(double width, double height) {
    if (currentState != SimulationState::Uninitialized) {
        std::cerr << "Simulation::start ignored: already started or disposed\n";
        return false;
    }

    Viewport const viewport{width, height};
    viewport.validate();

    worldPtr = std::make_unique<World>();
    worldPtr->setGravity(simConfig.gravity);
    worldPtr->setBroadphase(simConfig.broadphase);

    bodyStore = std::make_unique<BodyStore>(*worldPtr, simConfig.particles(), viewport, seeder());
    boundaryManager = std::make_unique<BoundaryManager>(*worldPtr, viewport);
    physicsStepper = std::make_unique<Systems::PhysicsStepper>(*worldPtr);

    input.open();
    currentState = SimulationState::Running;
    std::cerr << "Simulation started with " << bodyStore->size() << " particles\n";

    requestNextFrame();
    return true;
}

void Simulation::requestNextFrame() {
    if (frameHandle != NoFrameRequest) {
        scheduler.cancelFrame(frameHandle);
    }
    frameHandle = scheduler.requestFrame([this](double timestampMs) {
        frameHandle = NoFrameRequest;
        advanceFrame(timestampMs);
    });
}

void Simulation::advanceFrame(double timestampMs) {
    if (currentState != SimulationState::Running) {
        return;
    }
    if (!worldPtr || !bodyStore || !boundaryManager || !physicsStepper) {
        return;
    }

    SWARM_PROFILE_SCOPE("Simulation::advanceFrame");

    processInput();

    double dt = SwarmConstants::InitialTimeStep;
    if (hasLastTimestamp) {
        dt = std::clamp((timestampMs - lastTimestampMs) / 1000.0, 0.0, SwarmConstants::MaxTimeStep);
    }
    hasLastTimestamp = true;
    lastTimestampMs = timestampMs;

    auto& registry = worldPtr->getRegistry();
    DebugStats::reset();
    forceModel.update(registry);
    physicsStepper->step(dt);
    renderSync.update(registry);
    ++frameCount;

    requestNextFrame();
}

void Simulation::processInput() {
    for (auto& event : input.drain()) {
        if (auto* moved = std::get_if<Input::PointerMoved>(&event)) {
            auto& registry = worldPtr->getRegistry();
            registry.get<Components::SimulatorState>(worldPtr->stateEntity()).pointer = moved->position;
        }
        else if (auto* resized = std::get_if<Input::ViewportResized>(&event)) {
            Viewport const next{resized->width, resized->height};
            if (!(next.width > 0.0 && next.height > 0.0 && std::isfinite(next.width) && std::isfinite(next.height))) {
                std::cerr << "Ignoring resize to " << next.width << "x" << next.height << "\n";
                continue;
            }
            if (next != boundaryManager->viewport()) {
                boundaryManager->rebuild(next.width, next.height);
            }
        }
        else if (auto* params = std::get_if<Input::ParametersChanged>(&event)) {
            applyParameters(*params);
        }
        else if (auto* color = std::get_if<Input::ColorChanged>(&event)) {
            auto parsed = Rendering::parseHexColor(color->hex);
            if (!parsed) {
                std::cerr << "Ignoring colour '" << color->hex << "'\n";
                continue;
            }
            simConfig.particleColor = color->hex;
            bodyStore->setColor(*parsed);
        }
    }
}

void Simulation::applyParameters(const Input::ParametersChanged& change) {
    SimulationConfig next = simConfig;
    next.particleCount = change.particleCount;
    next.forces = change.forces;
    try {
        next.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Ignoring parameter change: " << e.what() << "\n";
        return;
    }

    bool const structural = next.particleCount != simConfig.particleCount
                            || next.forces.particleRadius != simConfig.forces.particleRadius;
    simConfig = next;
    forceModel.setSpecificConfig(simConfig.forces);

    if (structural) {
        rebuildParticles();
    }
}

void Simulation::rebuildParticles() {
    // The old store must release its bodies before the new one creates any
    bodyStore.reset();
    bodyStore = std::make_unique<BodyStore>(*worldPtr, simConfig.particles(), boundaryManager->viewport(), seeder());
}

void Simulation::dispose() {
    if (currentState == SimulationState::Disposed) {
        return;
    }
    bool const wasRunning = currentState == SimulationState::Running;
    currentState = SimulationState::Disposed;

    if (frameHandle != NoFrameRequest) {
        scheduler.cancelFrame(frameHandle);
        frameHandle = NoFrameRequest;
    }
    input.close();

    physicsStepper.reset();
    boundaryManager.reset();
    bodyStore.reset();
    worldPtr.reset();

    if (wasRunning) {
        std::cerr << "Simulation disposed after " << frameCount << " frames\n";
    }
}
