#include <gtest/gtest.h>
#include "swarm/core/materials.hpp"
#include "swarm/core/world.hpp"

class MaterialTableTest : public ::testing::Test {
protected:
    MaterialTable table;
    MaterialId particle = NoMaterial;
    MaterialId boundary = NoMaterial;

    void SetUp() override {
        particle = table.addMaterial(Material{"particle", 0.05, 0.3});
        boundary = table.addMaterial(Material{"boundary", 0.0, 0.5});
    }
};

TEST_F(MaterialTableTest, FindsMaterialsByIdAndName) {
    ASSERT_NE(table.find(particle), nullptr);
    EXPECT_EQ(table.find(particle)->name, "particle");
    EXPECT_EQ(table.findByName("boundary"), boundary);
    EXPECT_EQ(table.findByName("glass"), NoMaterial);
    EXPECT_EQ(table.find(NoMaterial), nullptr);
}

TEST_F(MaterialTableTest, ContactRuleIsSymmetricAndRegisteredOnce) {
    EXPECT_TRUE(table.addContactMaterial(particle, boundary, ContactProperties{0.0, 0.5}));
    EXPECT_FALSE(table.addContactMaterial(boundary, particle, ContactProperties{0.9, 0.9}));
    EXPECT_EQ(table.contactMaterialCount(), 1u);

    ContactProperties ab = table.resolve(particle, boundary);
    ContactProperties ba = table.resolve(boundary, particle);
    EXPECT_DOUBLE_EQ(ab.friction, 0.0);
    EXPECT_DOUBLE_EQ(ab.restitution, 0.5);
    EXPECT_DOUBLE_EQ(ba.friction, ab.friction);
    EXPECT_DOUBLE_EQ(ba.restitution, ab.restitution);
}

TEST_F(MaterialTableTest, UnregisteredPairUsesProducts) {
    ContactProperties pp = table.resolve(particle, particle);
    EXPECT_DOUBLE_EQ(pp.friction, 0.05 * 0.05);
    EXPECT_DOUBLE_EQ(pp.restitution, 0.3 * 0.3);
}

TEST_F(MaterialTableTest, MissingMaterialUsesDefaultContact) {
    ContactProperties c = table.resolve(particle, NoMaterial);
    EXPECT_DOUBLE_EQ(c.friction, 0.3);
    EXPECT_DOUBLE_EQ(c.restitution, 0.0);
}

TEST(WorldMaterialTest, EnsureMaterialReusesExistingName) {
    World world;
    MaterialId first = world.ensureMaterial(Material{"particle", 0.05, 0.3});
    MaterialId second = world.ensureMaterial(Material{"particle", 0.9, 0.9});
    EXPECT_EQ(first, second);
    EXPECT_EQ(world.materials().materialCount(), 1u);
}

TEST(WorldMaterialTest, ContactMaterialRegisteredOnce) {
    World world;
    MaterialId a = world.addMaterial(Material{"a", 0.1, 0.1});
    MaterialId b = world.addMaterial(Material{"b", 0.2, 0.2});
    EXPECT_FALSE(world.hasContactMaterial(a, b));
    EXPECT_TRUE(world.addContactMaterial(a, b, ContactProperties{0.5, 0.5}));
    EXPECT_TRUE(world.hasContactMaterial(b, a));
    EXPECT_FALSE(world.addContactMaterial(a, b, ContactProperties{0.5, 0.5}));
    EXPECT_DOUBLE_EQ(world.resolveContact(b, a).friction, 0.5);
}
