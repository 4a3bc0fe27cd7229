/**
 * @file test_spatial_registry.cpp
 * @brief Unit tests for per-category index ownership
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "spatial/SpatialRegistry.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"

#include "mocks/MockSpatialAccess.hpp"
#include "utils/TestHelpers.hpp"
#include "utils/Generators.hpp"

#include <algorithm>
#include <functional>
#include <thread>
#include <vector>

using namespace Vicinity;
using namespace Vicinity::Test;

using ::testing::_;

namespace {

struct Enemy {};
struct Projectile {};
struct Pickup {};

} // namespace

// =============================================================================
// Registration Tests
// =============================================================================

class SpatialRegistryTest : public ::testing::Test {
protected:
    SpatialRegistry registry;
};

TEST_F(SpatialRegistryTest, StartsEmpty) {
    EXPECT_EQ(0u, registry.GetCategoryCount());
    EXPECT_FALSE(registry.IsRegistered<Enemy>());
    EXPECT_EQ(nullptr, registry.GetAccess<Enemy>());
    EXPECT_EQ(nullptr, registry.GetDriver<Enemy>());
}

TEST_F(SpatialRegistryTest, RegisterCreatesIndexPerConfig) {
    SpatialAccessConfig config;
    config.dimensions = 2;
    config.minMovedThreshold = 4.0f;
    config.recreateAfterCount = 10;

    ISpatialAccess& access = registry.Register<Enemy>(config, "enemies");

    EXPECT_TRUE(registry.IsRegistered<Enemy>());
    EXPECT_EQ(&access, registry.GetAccess<Enemy>());
    EXPECT_EQ(2, access.GetDimensions());
    EXPECT_FLOAT_EQ(4.0f, access.GetMinMovedThreshold());
    EXPECT_EQ(10u, access.GetRecreateAfterCount());
    EXPECT_EQ(std::vector<std::string>{"enemies"}, registry.GetCategoryNames());
}

TEST_F(SpatialRegistryTest, CategoriesAreIndependent) {
    registry.Register<Enemy>(SpatialAccessConfig());
    registry.Register<Projectile>(SpatialAccessConfig());

    registry.GetDriver<Enemy>()->Track(1, glm::vec3(0.0f));
    registry.GetDriver<Enemy>()->Track(2, glm::vec3(1.0f));
    registry.GetDriver<Projectile>()->Track(1, glm::vec3(50.0f));

    EXPECT_EQ(2u, registry.GetAccess<Enemy>()->Size());
    EXPECT_EQ(1u, registry.GetAccess<Projectile>()->Size());
    EXPECT_EQ(3u, registry.GetTotalPointCount());

    auto nearest = registry.GetAccess<Projectile>()->NearestNeighbour(glm::vec3(0.0f));
    ASSERT_TRUE(nearest.has_value());
    EXPECT_VEC3_EQ(glm::vec3(50.0f), nearest->position);
}

TEST_F(SpatialRegistryTest, RegisterReplacesExisting) {
    registry.Register<Enemy>(SpatialAccessConfig());
    registry.GetDriver<Enemy>()->Track(1, glm::vec3(0.0f));

    SpatialAccessConfig config;
    config.recreateAfterCount = 5;
    registry.Register<Enemy>(config);

    EXPECT_EQ(1u, registry.GetCategoryCount());
    EXPECT_EQ(0u, registry.GetAccess<Enemy>()->Size());
    EXPECT_EQ(5u, registry.GetAccess<Enemy>()->GetRecreateAfterCount());
    EXPECT_FALSE(registry.GetDriver<Enemy>()->IsTracked(1));
}

TEST_F(SpatialRegistryTest, RegisterCustomIndex) {
    auto mock = std::make_unique<NiceMockSpatialAccess>(1.0f, 100);
    auto* raw = mock.get();

    ISpatialAccess& access = registry.Register<Pickup>(std::move(mock));
    EXPECT_EQ(raw, &access);

    EXPECT_CALL(*raw, AddPoint(_)).Times(1);
    std::vector<MovementObservation> frame{{4, glm::vec3(0.0f), glm::vec3(3.0f)}};
    EXPECT_EQ(1u, registry.ApplyFrame<Pickup>(frame).patched);
}

TEST_F(SpatialRegistryTest, NullIndexFallsBackToDefault) {
    ISpatialAccess& access = registry.Register<Pickup>(std::unique_ptr<ISpatialAccess>());

    EXPECT_EQ(3, access.GetDimensions());
    EXPECT_EQ(0u, access.Size());
}

TEST_F(SpatialRegistryTest, Unregister) {
    registry.Register<Enemy>(SpatialAccessConfig());

    EXPECT_TRUE(registry.Unregister<Enemy>());
    EXPECT_FALSE(registry.IsRegistered<Enemy>());
    EXPECT_FALSE(registry.Unregister<Enemy>());
}

TEST_F(SpatialRegistryTest, Clear) {
    registry.Register<Enemy>(SpatialAccessConfig());
    registry.Register<Projectile>(SpatialAccessConfig());
    registry.Clear();

    EXPECT_EQ(0u, registry.GetCategoryCount());
    EXPECT_EQ(0u, registry.GetTotalPointCount());
}

// =============================================================================
// Frame Tests
// =============================================================================

TEST_F(SpatialRegistryTest, ApplyFrameRoutesToCategory) {
    SpatialAccessConfig config;
    config.recreateAfterCount = 1;
    registry.Register<Enemy>(config);
    registry.Register<Projectile>(SpatialAccessConfig());

    std::vector<MovementObservation> frame{
        {1, glm::vec3(0.0f), glm::vec3(5.0f)},
        {2, glm::vec3(0.0f), glm::vec3(-5.0f)},
    };

    FrameReport enemies = registry.ApplyFrame<Enemy>(frame);
    FrameReport projectiles = registry.ApplyFrame<Projectile>(frame);

    EXPECT_TRUE(enemies.recreated);
    EXPECT_FALSE(projectiles.recreated);
    EXPECT_EQ(2u, projectiles.patched);
    EXPECT_EQ(2u, registry.GetAccess<Enemy>()->Size());
    EXPECT_EQ(2u, registry.GetAccess<Projectile>()->Size());
}

TEST_F(SpatialRegistryTest, CategoriesMaintainedOnSeparateThreads) {
    SpatialAccessConfig rebuilding;
    rebuilding.recreateAfterCount = 5;
    registry.Register<Enemy>(rebuilding);
    registry.Register<Projectile>(SpatialAccessConfig{.dimensions = 2, .recreateAfterCount = 1000});

    MaintenanceDriver* enemyDriver = registry.GetDriver<Enemy>();
    MaintenanceDriver* projectileDriver = registry.GetDriver<Projectile>();
    ASSERT_NE(nullptr, enemyDriver);
    ASSERT_NE(nullptr, projectileDriver);

    // Both threads reach the library logger for the first time together
    Logger::Shutdown();

    auto run = [](MaintenanceDriver* driver, uint64_t seed, std::vector<SpatialEntry>& world) {
        RandomGenerator rng(seed);
        EntryGenerator entryGen(-50.0f, 50.0f);
        MovementGenerator movement(3.0f);
        world = entryGen.GenerateMany(rng, 200);
        driver->Load(world);
        for (int frame = 0; frame < 30; ++frame) {
            auto observations = movement.Step(rng, world);
            driver->ApplyFrame(observations, [&world] { return world; });
        }
    };

    std::vector<SpatialEntry> enemyWorld;
    std::vector<SpatialEntry> projectileWorld;
    std::thread enemyThread(run, enemyDriver, uint64_t{1}, std::ref(enemyWorld));
    std::thread projectileThread(run, projectileDriver, uint64_t{2}, std::ref(projectileWorld));
    enemyThread.join();
    projectileThread.join();

    Logger::Shutdown();
    Logger::Initialize("", false);
    Logger::SetLevel(spdlog::level::trace);

    EXPECT_EQ(200u, registry.GetAccess<Enemy>()->Size());
    EXPECT_EQ(200u, registry.GetAccess<Projectile>()->Size());
    EXPECT_GT(enemyDriver->GetStats().rebuilds, 0u);
    EXPECT_EQ(0u, projectileDriver->GetStats().rebuilds);

    // Every index entry sits within the threshold of the entity's true position
    for (const auto& entry : enemyWorld) {
        auto committed = enemyDriver->GetCommittedPosition(entry.entity);
        ASSERT_TRUE(committed.has_value());
        EXPECT_LT(registry.GetAccess<Enemy>()->DistanceSquared(*committed, entry.position), 1.0f);
    }
    for (const auto& entry : projectileWorld) {
        auto committed = projectileDriver->GetCommittedPosition(entry.entity);
        ASSERT_TRUE(committed.has_value());
        EXPECT_LT(registry.GetAccess<Projectile>()->DistanceSquared(*committed, entry.position), 1.0f);
    }
}

TEST_F(SpatialRegistryTest, ApplyFrameForUnregisteredCategory) {
    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(5.0f)}};
    FrameReport report = registry.ApplyFrame<Enemy>(frame);

    EXPECT_EQ(0u, report.observed);
    EXPECT_FALSE(report.recreated);
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_F(SpatialRegistryTest, RegisterFromConfig) {
    Config config;
    ASSERT_TRUE(config.LoadFromString(R"({
        "spatial": {
            "default": { "dimensions": 3, "min_moved_threshold": 1.0, "recreate_after_count": 100 },
            "categories": {
                "enemies": { "dimensions": 2, "recreate_after_count": 25 }
            }
        }
    })"));

    ISpatialAccess& enemies = registry.RegisterFromConfig<Enemy>(config, "enemies");
    ISpatialAccess& pickups = registry.RegisterFromConfig<Pickup>(config, "pickups");

    EXPECT_EQ(2, enemies.GetDimensions());
    EXPECT_EQ(25u, enemies.GetRecreateAfterCount());
    EXPECT_FLOAT_EQ(1.0f, enemies.GetMinMovedThreshold());

    EXPECT_EQ(3, pickups.GetDimensions());
    EXPECT_EQ(100u, pickups.GetRecreateAfterCount());

    auto names = registry.GetCategoryNames();
    std::sort(names.begin(), names.end());
    EXPECT_EQ((std::vector<std::string>{"enemies", "pickups"}), names);
}
