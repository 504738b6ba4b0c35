#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "swarm/components/basic.hpp"
#include "swarm/core/body_store.hpp"
#include "swarm/core/boundary_manager.hpp"
#include "swarm/core/world.hpp"

namespace {

struct WallGeometry {
    double x, y, halfWidth, halfHeight;
};

std::vector<WallGeometry> geometry(const World& world, const BoundaryManager& boundaries) {
    const auto& registry = world.getRegistry();
    std::vector<WallGeometry> out;
    for (entt::entity wall : boundaries.boundaries()) {
        const auto& pos = registry.get<Components::Position>(wall);
        const auto& box = registry.get<Components::BoxShape>(wall);
        out.push_back({pos.x, pos.y, box.halfWidth, box.halfHeight});
    }
    return out;
}

std::size_t wallCount(const World& world) {
    return world.getRegistry().view<Components::Boundary>().size();
}

} // namespace

class BoundaryManagerTest : public ::testing::Test {
protected:
    World world;
};

TEST_F(BoundaryManagerTest, FourWallsBorderTheViewport) {
    BoundaryManager boundaries(world, Viewport{800.0, 600.0});
    ASSERT_EQ(wallCount(world), 4u);

    auto walls = geometry(world, boundaries);
    double const t = boundaries.thickness();
    EXPECT_DOUBLE_EQ(t, 50.0);

    // Top
    EXPECT_DOUBLE_EQ(walls[0].x, 0.0);
    EXPECT_DOUBLE_EQ(walls[0].y, 300.0 + t / 2.0);
    EXPECT_DOUBLE_EQ(walls[0].halfWidth, 400.0);
    EXPECT_DOUBLE_EQ(walls[0].halfHeight, t / 2.0);
    // Bottom
    EXPECT_DOUBLE_EQ(walls[1].y, -300.0 - t / 2.0);
    // Left
    EXPECT_DOUBLE_EQ(walls[2].x, -400.0 - t / 2.0);
    EXPECT_DOUBLE_EQ(walls[2].y, 0.0);
    EXPECT_DOUBLE_EQ(walls[2].halfWidth, t / 2.0);
    EXPECT_DOUBLE_EQ(walls[2].halfHeight, 300.0);
    // Right
    EXPECT_DOUBLE_EQ(walls[3].x, 400.0 + t / 2.0);

    // Inner faces touch the viewport edges
    EXPECT_DOUBLE_EQ(walls[0].y - walls[0].halfHeight, 300.0);
    EXPECT_DOUBLE_EQ(walls[1].y + walls[1].halfHeight, -300.0);
    EXPECT_DOUBLE_EQ(walls[2].x + walls[2].halfWidth, -400.0);
    EXPECT_DOUBLE_EQ(walls[3].x - walls[3].halfWidth, 400.0);
}

TEST_F(BoundaryManagerTest, WallsAreStaticWithBoundaryMaterial) {
    BoundaryManager boundaries(world, Viewport{800.0, 600.0});
    const auto& registry = world.getRegistry();
    for (entt::entity wall : boundaries.boundaries()) {
        EXPECT_TRUE(registry.get<Components::RigidBody>(wall).isStatic());
        EXPECT_DOUBLE_EQ(registry.get<Components::RigidBody>(wall).mass, 0.0);
        EXPECT_EQ(registry.get<Components::MaterialRef>(wall).id, boundaries.material());
    }
}

TEST_F(BoundaryManagerTest, RebuildIsIdempotent) {
    BoundaryManager boundaries(world, Viewport{800.0, 600.0});
    boundaries.rebuild(1024.0, 768.0);
    auto first = geometry(world, boundaries);
    boundaries.rebuild(1024.0, 768.0);
    auto second = geometry(world, boundaries);

    ASSERT_EQ(wallCount(world), 4u);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_DOUBLE_EQ(first[i].x, second[i].x);
        EXPECT_DOUBLE_EQ(first[i].y, second[i].y);
        EXPECT_DOUBLE_EQ(first[i].halfWidth, second[i].halfWidth);
        EXPECT_DOUBLE_EQ(first[i].halfHeight, second[i].halfHeight);
    }
}

TEST_F(BoundaryManagerTest, ResizeKeepsParticlesUntouched) {
    ParticleConfig config;
    config.count = 50;
    config.radius = 7.0;
    config.color = "#2ACBF3";
    BodyStore store(world, config, Viewport{800.0, 600.0}, 11);
    BoundaryManager boundaries(world, Viewport{800.0, 600.0});

    std::vector<Position> before;
    for (std::size_t i = 0; i < store.size(); ++i) {
        before.push_back(store.position(i));
    }

    boundaries.rebuild(1200.0, 800.0);

    EXPECT_EQ(wallCount(world), 4u);
    EXPECT_EQ(world.bodyCount(), 54u);
    ASSERT_EQ(store.size(), 50u);
    for (std::size_t i = 0; i < store.size(); ++i) {
        EXPECT_TRUE(store.isParticle(store.entityAt(i)));
        EXPECT_DOUBLE_EQ(store.position(i).x, before[i].x);
        EXPECT_DOUBLE_EQ(store.position(i).y, before[i].y);
    }

    auto walls = geometry(world, boundaries);
    double const t = boundaries.thickness();
    EXPECT_DOUBLE_EQ(walls[0].y, 400.0 + t / 2.0);
    EXPECT_DOUBLE_EQ(walls[0].halfWidth, 600.0);
    EXPECT_DOUBLE_EQ(walls[3].x, 600.0 + t / 2.0);
    EXPECT_DOUBLE_EQ(walls[3].halfHeight, 400.0);
    EXPECT_EQ(boundaries.viewport(), (Viewport{1200.0, 800.0}));
}

TEST_F(BoundaryManagerTest, ParticleBoundaryContactRegisteredOnce) {
    BoundaryManager boundaries(world, Viewport{800.0, 600.0});
    boundaries.rebuild(640.0, 480.0);
    boundaries.rebuild(800.0, 600.0);

    MaterialId const particle = world.materials().findByName("particle");
    ASSERT_NE(particle, NoMaterial);
    EXPECT_TRUE(world.hasContactMaterial(particle, boundaries.material()));

    ContactProperties const contact = world.resolveContact(boundaries.material(), particle);
    EXPECT_DOUBLE_EQ(contact.friction, 0.0);
    EXPECT_DOUBLE_EQ(contact.restitution, 0.5);
    EXPECT_EQ(world.materials().contactMaterialCount(), 1u);
}

TEST_F(BoundaryManagerTest, RejectsEmptyViewport) {
    BoundaryManager boundaries(world, Viewport{800.0, 600.0});
    EXPECT_THROW(boundaries.rebuild(0.0, 600.0), std::invalid_argument);
    EXPECT_THROW(boundaries.rebuild(800.0, -1.0), std::invalid_argument);
    EXPECT_EQ(wallCount(world), 4u);
}
