#include <gtest/gtest.h>

#include "swarm/core/frame_scheduler.hpp"
#include "swarm/core/parameter_controls.hpp"
#include "swarm/core/simulation.hpp"

class ParameterControlsTest : public ::testing::Test {
protected:
    SimulationConfig config;

    void SetUp() override {
        config.particleCount = 40;
        config.gravity = Vector(0.0, 0.0);
        config.forces.attractionRadius = 150.0;
    }
};

TEST_F(ParameterControlsTest, StartsFromConfig) {
    ParameterControls controls(config);
    EXPECT_EQ(controls.requested().particleCount, 40);
    EXPECT_DOUBLE_EQ(controls.requested().forces.attractionRadius, 150.0);
}

TEST_F(ParameterControlsTest, ConsecutiveStepsAccumulate) {
    ParameterControls controls(config);
    controls.step(Control::AttractionRadius, 1);
    Input::ParametersChanged const change = controls.step(Control::AttractionRadius, 1);

    EXPECT_DOUBLE_EQ(change.forces.attractionRadius, 170.0);
    EXPECT_DOUBLE_EQ(controls.requested().forces.attractionRadius, 170.0);
}

TEST_F(ParameterControlsTest, StepsStayInsideRange) {
    ParameterControls controls(config);
    for (int i = 0; i < 100; ++i) {
        controls.step(Control::AttractionRadius, 1);
    }
    EXPECT_DOUBLE_EQ(controls.requested().forces.attractionRadius, 300.0);

    controls.step(Control::ParticleCount, -1);
    EXPECT_EQ(controls.requested().particleCount, 0);
    controls.step(Control::ParticleCount, -1);
    EXPECT_EQ(controls.requested().particleCount, 0);
}

TEST_F(ParameterControlsTest, StepsPostedBeforeAFrameAllApply) {
    ManualFrameScheduler scheduler;
    Simulation sim(scheduler, config, 1);
    ASSERT_TRUE(sim.start(800.0, 600.0));

    ParameterControls controls(sim.config());
    sim.inbox().post(controls.step(Control::PushRadius, 1));
    sim.inbox().post(controls.step(Control::PushRadius, 1));
    sim.inbox().post(controls.step(Control::ParticleCount, 1));
    scheduler.runFrame(0.0);

    EXPECT_DOUBLE_EQ(sim.config().forces.pushRadius, config.forces.pushRadius + 20.0);
    EXPECT_EQ(sim.config().particleCount, 140);
    EXPECT_EQ(sim.bodies()->size(), 140u);
}
