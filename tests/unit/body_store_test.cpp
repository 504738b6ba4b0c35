#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

#include "swarm/components/basic.hpp"
#include "swarm/core/body_store.hpp"
#include "swarm/core/constants.hpp"
#include "swarm/core/world.hpp"

class BodyStoreTest : public ::testing::Test {
protected:
    World world;
    ParticleConfig config;
    Viewport viewport{800.0, 600.0};

    void SetUp() override {
        config.count = 100;
        config.radius = 7.0;
        config.color = "#2ACBF3";
    }
};

TEST_F(BodyStoreTest, SeedsConfiguredCount) {
    BodyStore store(world, config, viewport, 1);
    EXPECT_EQ(store.size(), 100u);
    EXPECT_EQ(world.bodyCount(), 100u);
    EXPECT_EQ(world.getRegistry().view<Components::Particle>().size(), 100u);
}

TEST_F(BodyStoreTest, ParticlesSpawnInsideSpawnDisc) {
    BodyStore store(world, config, viewport, 7);
    double const maxDistance = 0.8 * std::min(viewport.halfWidth(), viewport.halfHeight());

    for (std::size_t i = 0; i < store.size(); ++i) {
        Position const p = store.position(i);
        EXPECT_LT(p.dist(Position(0.0, 0.0)), maxDistance);
    }
}

TEST_F(BodyStoreTest, ParticlesCarryPhysicalProperties) {
    BodyStore store(world, config, viewport, 3);
    const auto& registry = world.getRegistry();
    entt::entity const e = store.entityAt(0);

    EXPECT_DOUBLE_EQ(registry.get<Components::RigidBody>(e).mass, 1.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::CircleShape>(e).radius, 7.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Damping>(e).linear, 0.3);
    EXPECT_DOUBLE_EQ(registry.get<Components::Damping>(e).angular, 0.5);
    EXPECT_EQ(registry.get<Components::MaterialRef>(e).id, store.material());
    EXPECT_DOUBLE_EQ(registry.get<Components::Renderable>(e).radius, 7.0);
}

TEST_F(BodyStoreTest, ParticleIdsAreUniqueAndRenderablesPaired) {
    BodyStore store(world, config, viewport, 5);
    const auto& registry = world.getRegistry();

    std::set<std::uint32_t> ids;
    store.forEach([&](std::size_t i, entt::entity e) {
        EXPECT_TRUE(store.isParticle(e));
        ids.insert(registry.get<Components::Particle>(e).id);

        const auto& r = registry.get<Components::Renderable>(e);
        Position const p = store.position(i);
        EXPECT_DOUBLE_EQ(r.x, p.x);
        EXPECT_DOUBLE_EQ(r.y, p.y);
    });
    EXPECT_EQ(ids.size(), store.size());
}

TEST_F(BodyStoreTest, RegistersParticleContactMaterialOnce) {
    BodyStore first(world, config, viewport, 1);
    first.removeAll();
    BodyStore second(world, config, viewport, 2);

    EXPECT_EQ(first.material(), second.material());
    EXPECT_TRUE(world.hasContactMaterial(first.material(), first.material()));
    EXPECT_EQ(world.materials().contactMaterialCount(), 1u);
    EXPECT_DOUBLE_EQ(world.resolveContact(first.material(), first.material()).friction, 0.01);
}

TEST_F(BodyStoreTest, RemoveAllDestroysBodiesAndRenderables) {
    BodyStore store(world, config, viewport, 1);
    store.removeAll();
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(world.bodyCount(), 0u);
    EXPECT_EQ(world.getRegistry().view<Components::Renderable>().size(), 0u);
}

TEST_F(BodyStoreTest, AddBatchAppends) {
    config.count = 10;
    BodyStore store(world, config, viewport, 1);
    store.addBatch(5);
    EXPECT_EQ(store.size(), 15u);
    store.addBatch(0);
    EXPECT_EQ(store.size(), 15u);
}

TEST_F(BodyStoreTest, PerBodyStateAccessors) {
    config.count = 2;
    BodyStore store(world, config, viewport, 1);

    store.setPosition(1, Position(3.0, 4.0));
    store.setVelocity(1, Vector(-1.0, 2.0));
    store.applyForce(1, Vector(5.0, 0.0));
    store.applyForce(1, Vector(0.0, 6.0));

    EXPECT_DOUBLE_EQ(store.position(1).x, 3.0);
    EXPECT_DOUBLE_EQ(store.position(1).y, 4.0);
    EXPECT_EQ(store.velocity(1), Vector(-1.0, 2.0));
    EXPECT_EQ(store.force(1), Vector(5.0, 6.0));
    EXPECT_EQ(store.force(0), Vector(0.0, 0.0));
}

TEST_F(BodyStoreTest, SetColorKeepsPerParticleLightness) {
    BodyStore store(world, config, viewport, 9);
    const auto& registry = world.getRegistry();

    auto red = Rendering::parseHexColor("#FF0000");
    ASSERT_TRUE(red.has_value());
    store.setColor(*red);

    store.forEach([&](std::size_t, entt::entity e) {
        const auto& r = registry.get<Components::Renderable>(e);
        EXPECT_LE(std::fabs(r.lightnessOffset), 0.05);
        Rendering::Rgba expected = *red;
        expected.a = static_cast<std::uint8_t>(std::lround(0.75 * 255.0));
        EXPECT_EQ(r.color, Rendering::offsetLightness(expected, r.lightnessOffset));
    });
    EXPECT_EQ(store.size(), 100u);
}

TEST_F(BodyStoreTest, InvalidConfigThrows) {
    ParticleConfig bad = config;
    bad.radius = 0.0;
    EXPECT_THROW(BodyStore(world, bad, viewport, 1), std::invalid_argument);

    bad = config;
    bad.count = -1;
    EXPECT_THROW(BodyStore(world, bad, viewport, 1), std::invalid_argument);

    EXPECT_THROW(BodyStore(world, config, Viewport{0.0, 600.0}, 1), std::invalid_argument);
}

TEST_F(BodyStoreTest, ZeroParticlesIsValid) {
    config.count = 0;
    BodyStore store(world, config, viewport, 1);
    EXPECT_EQ(store.size(), 0u);
}
