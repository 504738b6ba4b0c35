#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

#include "swarm/components/basic.hpp"
#include "swarm/components/sim.hpp"
#include "swarm/systems/force_model.hpp"

using namespace Systems;

class ForceModelTest : public ::testing::Test {
protected:
    entt::registry registry;
    ForceConfig config;
    entt::entity state;

    void SetUp() override {
        config.particleRadius = 7.0;
        config.pushRadius = 80.0;
        config.pushStrength = 30000.0;
        config.attractionRadius = 150.0;
        config.attractionStrength = 25000.0;

        state = registry.create();
        registry.emplace<Components::SimulatorState>(state);
        // Keep the pointer out of reach unless a test moves it
        registry.get<Components::SimulatorState>(state).pointer = Position(1e6, 1e6);
    }

    entt::entity createParticle(double x, double y, std::uint32_t id) {
        auto entity = registry.create();
        registry.emplace<Components::Particle>(entity, id);
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::Force>(entity, 0.0, 0.0);
        return entity;
    }
};

TEST_F(ForceModelTest, PairAtDistance100HasMagnitude2_5) {
    auto f = pairForce(Position(0.0, 0.0), Position(100.0, 0.0), config);
    ASSERT_TRUE(f.has_value());
    EXPECT_DOUBLE_EQ(f->length(), 2.5);
    EXPECT_GT(f->x, 0.0);   // A is pulled towards B
    EXPECT_DOUBLE_EQ(f->y, 0.0);
}

TEST_F(ForceModelTest, PairForceZeroWhenOverlappingOrOutOfRange) {
    // Exactly touching (d == 2r)
    EXPECT_FALSE(pairForce(Position(0.0, 0.0), Position(14.0, 0.0), config).has_value());
    EXPECT_FALSE(pairForce(Position(0.0, 0.0), Position(5.0, 0.0), config).has_value());
    EXPECT_FALSE(pairForce(Position(0.0, 0.0), Position(0.0, 0.0), config).has_value());
    EXPECT_FALSE(pairForce(Position(0.0, 0.0), Position(150.0001, 0.0), config).has_value());

    // Range bound is inclusive
    EXPECT_TRUE(pairForce(Position(0.0, 0.0), Position(150.0, 0.0), config).has_value());
    EXPECT_TRUE(pairForce(Position(0.0, 0.0), Position(14.001, 0.0), config).has_value());
}

TEST_F(ForceModelTest, PointerAtHalfRadiusGivesHalfStrength) {
    Vector f = pointerForce(Position(40.0, 0.0), Position(0.0, 0.0), config);
    EXPECT_DOUBLE_EQ(f.length(), 0.5 * config.pushStrength);
    EXPECT_GT(f.x, 0.0);    // pushed away from the pointer
}

TEST_F(ForceModelTest, PointerForceZeroOutsideRangeAndNearSingularity) {
    Vector at = pointerForce(Position(80.0, 0.0), Position(0.0, 0.0), config);
    EXPECT_EQ(at, Vector(0.0, 0.0));

    Vector beyond = pointerForce(Position(0.0, 200.0), Position(0.0, 0.0), config);
    EXPECT_EQ(beyond, Vector(0.0, 0.0));

    Vector close = pointerForce(Position(0.5, 0.5), Position(0.0, 0.0), config);
    EXPECT_EQ(close, Vector(0.0, 0.0));

    Vector same = pointerForce(Position(3.0, 3.0), Position(3.0, 3.0), config);
    EXPECT_EQ(same, Vector(0.0, 0.0));
}

TEST_F(ForceModelTest, PointerForceDecreasesWithDistance) {
    double previous = pointerForce(Position(1.5, 0.0), Position(0.0, 0.0), config).length();
    for (double d = 2.0; d < config.pushRadius; d += 1.0) {
        double const current = pointerForce(Position(0.0, d), Position(0.0, 0.0), config).length();
        EXPECT_LT(current, previous) << "at distance " << d;
        previous = current;
    }
}

TEST_F(ForceModelTest, UpdateAppliesEqualAndOppositePairForces) {
    auto a = createParticle(0.0, 0.0, 0);
    auto b = createParticle(60.0, 80.0, 1);

    ForceModel model;
    model.setSpecificConfig(config);
    model.update(registry);

    const auto& fa = registry.get<Components::Force>(a);
    const auto& fb = registry.get<Components::Force>(b);
    EXPECT_EQ(fa.x, -fb.x);
    EXPECT_EQ(fa.y, -fb.y);
    EXPECT_DOUBLE_EQ(fa.length(), 2.5);
    EXPECT_GT(fa.x, 0.0);
    EXPECT_GT(fa.y, 0.0);
}

TEST_F(ForceModelTest, NetPairForceCancelsExactlyForManyParticles) {
    // Every pair contributes +f and -f, so the total stays zero
    createParticle(0.0, 0.0, 0);
    createParticle(30.0, 0.0, 1);
    createParticle(70.0, 10.0, 2);
    createParticle(-40.0, 25.0, 3);

    ForceModel model;
    model.setSpecificConfig(config);
    model.update(registry);

    Vector total;
    for (auto [entity, force] : registry.view<Components::Force>().each()) {
        total += force;
    }
    EXPECT_NEAR(total.x, 0.0, 1e-12);
    EXPECT_NEAR(total.y, 0.0, 1e-12);
}

TEST_F(ForceModelTest, UpdateAddsPointerRepulsion) {
    auto p = createParticle(40.0, 0.0, 0);
    registry.get<Components::SimulatorState>(state).pointer = Position(0.0, 0.0);

    ForceModel model;
    model.setSpecificConfig(config);
    model.update(registry);

    const auto& f = registry.get<Components::Force>(p);
    EXPECT_DOUBLE_EQ(f.x, 15000.0);
    EXPECT_DOUBLE_EQ(f.y, 0.0);
}

TEST_F(ForceModelTest, UpdateAccumulatesOntoExistingForce) {
    auto p = createParticle(40.0, 0.0, 0);
    registry.get<Components::Force>(p) += Vector(1.0, 2.0);
    registry.get<Components::SimulatorState>(state).pointer = Position(0.0, 0.0);

    ForceModel model;
    model.setSpecificConfig(config);
    model.update(registry);

    const auto& f = registry.get<Components::Force>(p);
    EXPECT_DOUBLE_EQ(f.x, 15001.0);
    EXPECT_DOUBLE_EQ(f.y, 2.0);
}

TEST_F(ForceModelTest, UpdateWithoutStateEntityDoesNothing) {
    registry.destroy(state);
    auto p = createParticle(40.0, 0.0, 0);

    ForceModel model;
    model.update(registry);
    EXPECT_EQ(static_cast<const Vector&>(registry.get<Components::Force>(p)), Vector(0.0, 0.0));
}

TEST_F(ForceModelTest, ConfigChangeAppliesOnNextUpdate) {
    auto a = createParticle(0.0, 0.0, 0);
    createParticle(100.0, 0.0, 1);

    ForceModel model;
    config.attractionRadius = 50.0;
    model.setSpecificConfig(config);
    model.update(registry);
    EXPECT_DOUBLE_EQ(registry.get<Components::Force>(a).x, 0.0);

    config.attractionRadius = 150.0;
    model.setSpecificConfig(config);
    model.update(registry);
    EXPECT_DOUBLE_EQ(registry.get<Components::Force>(a).x, 2.5);
}

TEST(ForceConfigTest, ValidateRejectsBadValues) {
    ForceConfig config;
    EXPECT_NO_THROW(config.validate());

    ForceConfig zeroRadius = config;
    zeroRadius.particleRadius = 0.0;
    EXPECT_THROW(zeroRadius.validate(), std::invalid_argument);

    ForceConfig negativeStrength = config;
    negativeStrength.pushStrength = -1.0;
    EXPECT_THROW(negativeStrength.validate(), std::invalid_argument);

    ForceConfig nanRadius = config;
    nanRadius.attractionRadius = std::nan("");
    EXPECT_THROW(nanRadius.validate(), std::invalid_argument);
}
