/**
 * @file simulation.hpp
 * @brief Owns every piece of one running particle simulation
 *
 * Lifecycle: Uninitialized -> Running -> Disposed. Disposed is terminal.
 *
 * While Running, each display frame does, in order:
 * 1. drain the input inbox (pointer, resize, parameter and colour changes)
 * 2. compute dt from the frame timestamp (InitialTimeStep for the first
 *    frame, otherwise the elapsed seconds clamped to MaxTimeStep)
 * 3. run the force model, then the physics step, then render sync
 * 4. request the next frame
 *
 * Forces computed in a frame are consumed by that frame's physics step.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <random>

#include "swarm/core/body_store.hpp"
#include "swarm/core/boundary_manager.hpp"
#include "swarm/core/frame_scheduler.hpp"
#include "swarm/core/input_inbox.hpp"
#include "swarm/core/sim_config.hpp"
#include "swarm/core/world.hpp"
#include "swarm/systems/force_model.hpp"
#include "swarm/systems/physics_stepper.hpp"
#include "swarm/systems/render_sync.hpp"

enum class SimulationState {
    Uninitialized,
    Running,
    Disposed
};

class Simulation {
public:
    /**
     * @brief Throws std::invalid_argument if config is invalid
     */
    Simulation(IFrameScheduler& scheduler, const SimulationConfig& config,
               std::uint32_t seed = std::random_device{}());
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * @brief Builds world, particles and walls, opens the inbox and requests
     *        the first frame
     *
     * @return false if the simulation is not Uninitialized. Throws
     *         std::invalid_argument on a non-positive viewport.
     */
    bool start(double width, double height);

    /**
     * @brief Runs one frame; does nothing unless Running
     */
    void advanceFrame(double timestampMs);

    /**
     * @brief Cancels the pending frame, closes the inbox and releases the
     *        walls, particles and world. Safe to call more than once.
     */
    void dispose();

    SimulationState state() const { return currentState; }
    Input::InputInbox& inbox() { return input; }
    const SimulationConfig& config() const { return simConfig; }

    // Null unless Running
    World* world() { return worldPtr.get(); }
    BodyStore* bodies() { return bodyStore.get(); }
    BoundaryManager* boundaries() { return boundaryManager.get(); }
    Systems::PhysicsStepper* stepper() { return physicsStepper.get(); }

    FrameRequestId pendingFrame() const { return frameHandle; }
    std::uint64_t framesRun() const { return frameCount; }

private:
    void processInput();
    void applyParameters(const Input::ParametersChanged& change);
    void rebuildParticles();
    void requestNextFrame();

    IFrameScheduler& scheduler;
    SimulationConfig simConfig;
    std::mt19937 seeder;
    SimulationState currentState = SimulationState::Uninitialized;

    FrameRequestId frameHandle = NoFrameRequest;
    bool hasLastTimestamp = false;
    double lastTimestampMs = 0.0;
    std::uint64_t frameCount = 0;

    Input::InputInbox input;
    Systems::ForceModel forceModel;
    Systems::RenderSyncSystem renderSync;

    std::unique_ptr<World> worldPtr;
    std::unique_ptr<BodyStore> bodyStore;
    std::unique_ptr<BoundaryManager> boundaryManager;
    std::unique_ptr<Systems::PhysicsStepper> physicsStepper;
};
