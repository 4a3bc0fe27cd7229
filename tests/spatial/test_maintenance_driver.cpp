/**
 * @file test_maintenance_driver.cpp
 * @brief Unit tests for the per-frame patch or rebuild policy
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "spatial/MaintenanceDriver.hpp"
#include "spatial/RTreeAccess.hpp"

#include "mocks/MockSpatialAccess.hpp"
#include "utils/TestHelpers.hpp"
#include "utils/Generators.hpp"

#include <algorithm>
#include <vector>

using namespace Vicinity;
using namespace Vicinity::Test;

using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::SizeIs;

// =============================================================================
// Policy Tests (mock index)
// =============================================================================

TEST(MaintenanceDriverPolicyTest, SmallMovementIsIgnored) {
    NiceMockSpatialAccess access(1.0f, 100);
    MaintenanceDriver driver(access);

    EXPECT_CALL(access, RemoveEntity(_)).Times(0);
    EXPECT_CALL(access, AddPoint(_)).Times(0);
    EXPECT_CALL(access, Recreate(_)).Times(0);

    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(0.5f, 0.0f, 0.0f)}};
    FrameReport report = driver.ApplyFrame(frame);

    EXPECT_EQ(1u, report.observed);
    EXPECT_EQ(1u, report.ignored);
    EXPECT_EQ(0u, report.moved);
    EXPECT_FALSE(report.recreated);
}

TEST(MaintenanceDriverPolicyTest, LargeMovementIsPatched) {
    NiceMockSpatialAccess access(1.0f, 100);
    MaintenanceDriver driver(access);

    {
        InSequence sequence;
        EXPECT_CALL(access, RemoveEntity(1));
        EXPECT_CALL(access, AddPoint(Field(&SpatialEntry::entity, 1u)));
    }
    EXPECT_CALL(access, Recreate(_)).Times(0);

    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f)}};
    FrameReport report = driver.ApplyFrame(frame);

    EXPECT_EQ(1u, report.moved);
    EXPECT_EQ(1u, report.patched);
}

TEST(MaintenanceDriverPolicyTest, ThresholdIsInclusive) {
    NiceMockSpatialAccess access(1.0f, 100);
    MaintenanceDriver driver(access);

    EXPECT_CALL(access, AddPoint(_)).Times(1);

    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f)}};
    EXPECT_EQ(1u, driver.ApplyFrame(frame).patched);
}

TEST(MaintenanceDriverPolicyTest, ManyMovedTriggersSingleRebuild) {
    NiceMockSpatialAccess access(1.0f, 2);
    MaintenanceDriver driver(access);

    EXPECT_CALL(access, RemoveEntity(_)).Times(0);
    EXPECT_CALL(access, AddPoint(_)).Times(0);
    EXPECT_CALL(access, Recreate(SizeIs(3))).Times(1);

    std::vector<MovementObservation> frame{
        {1, glm::vec3(0.0f), glm::vec3(5.0f, 0.0f, 0.0f)},
        {2, glm::vec3(0.0f), glm::vec3(0.0f, 5.0f, 0.0f)},
        {3, glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 5.0f)},
    };
    FrameReport report = driver.ApplyFrame(frame);

    EXPECT_TRUE(report.recreated);
    EXPECT_EQ(3u, report.moved);
    EXPECT_EQ(0u, report.patched);
    EXPECT_EQ(1u, driver.GetStats().rebuilds);
}

TEST(MaintenanceDriverPolicyTest, MovedEqualToLimitIsPatched) {
    NiceMockSpatialAccess access(1.0f, 2);
    MaintenanceDriver driver(access);

    EXPECT_CALL(access, Recreate(_)).Times(0);
    EXPECT_CALL(access, AddPoint(_)).Times(2);

    std::vector<MovementObservation> frame{
        {1, glm::vec3(0.0f), glm::vec3(5.0f, 0.0f, 0.0f)},
        {2, glm::vec3(0.0f), glm::vec3(0.0f, 5.0f, 0.0f)},
    };
    EXPECT_FALSE(driver.ApplyFrame(frame).recreated);
}

TEST(MaintenanceDriverPolicyTest, IgnoredMovementDoesNotCountTowardsRebuild) {
    NiceMockSpatialAccess access(1.0f, 2);
    MaintenanceDriver driver(access);

    EXPECT_CALL(access, Recreate(_)).Times(0);
    EXPECT_CALL(access, AddPoint(_)).Times(2);

    std::vector<MovementObservation> frame{
        {1, glm::vec3(0.0f), glm::vec3(5.0f, 0.0f, 0.0f)},
        {2, glm::vec3(0.0f), glm::vec3(0.0f, 5.0f, 0.0f)},
        {3, glm::vec3(0.0f), glm::vec3(0.1f, 0.0f, 0.0f)},
        {4, glm::vec3(0.0f), glm::vec3(0.0f, 0.2f, 0.0f)},
    };
    FrameReport report = driver.ApplyFrame(frame);

    EXPECT_EQ(2u, report.ignored);
    EXPECT_EQ(2u, report.patched);
}

TEST(MaintenanceDriverPolicyTest, RebuildUsesSuppliedSnapshot) {
    NiceMockSpatialAccess access(1.0f, 0);
    MaintenanceDriver driver(access);

    std::vector<SpatialEntry> world{
        {glm::vec3(5.0f), 1}, {glm::vec3(6.0f), 2}, {glm::vec3(7.0f), 3}, {glm::vec3(8.0f), 4}};
    EXPECT_CALL(access, Recreate(world)).Times(1);

    int calls = 0;
    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(5.0f)}};
    driver.ApplyFrame(frame, [&] {
        ++calls;
        return world;
    });

    EXPECT_EQ(1, calls);
    EXPECT_EQ(4u, driver.GetTrackedCount());
    EXPECT_VEC3_EQ(glm::vec3(8.0f), *driver.GetCommittedPosition(4));
}

TEST(MaintenanceDriverPolicyTest, SnapshotNotRequestedWhenPatching) {
    NiceMockSpatialAccess access(1.0f, 100);
    MaintenanceDriver driver(access);

    int calls = 0;
    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(5.0f)}};
    driver.ApplyFrame(frame, [&] {
        ++calls;
        return std::vector<SpatialEntry>{};
    });

    EXPECT_EQ(0, calls);
}

TEST(MaintenanceDriverPolicyTest, EmptyFrameDoesNothing) {
    NiceMockSpatialAccess access(1.0f, 0);
    MaintenanceDriver driver(access);

    EXPECT_CALL(access, Recreate(_)).Times(0);
    EXPECT_CALL(access, AddPoint(_)).Times(0);

    FrameReport report = driver.ApplyFrame({});
    EXPECT_EQ(0u, report.observed);
    EXPECT_FALSE(report.recreated);
    EXPECT_EQ(1u, driver.GetStats().frames);
}

// =============================================================================
// Integration Tests (real index)
// =============================================================================

class MaintenanceDriverTest : public ::testing::Test {
protected:
    RTreeAccess3D access{1.0f, 100};
    MaintenanceDriver driver{access};
};

TEST_F(MaintenanceDriverTest, TrackAndUntrack) {
    driver.Track(1, glm::vec3(1.0f));
    driver.Track(2, glm::vec3(2.0f));

    EXPECT_EQ(2u, access.Size());
    EXPECT_TRUE(driver.IsTracked(1));
    EXPECT_VEC3_EQ(glm::vec3(2.0f), *driver.GetCommittedPosition(2));

    EXPECT_TRUE(driver.Untrack(1));
    EXPECT_FALSE(driver.IsTracked(1));
    EXPECT_FALSE(driver.GetCommittedPosition(1).has_value());
    EXPECT_EQ(1u, access.Size());
    EXPECT_FALSE(driver.Untrack(1));
}

TEST_F(MaintenanceDriverTest, TrackTwiceMovesSingleEntry) {
    driver.Track(1, glm::vec3(0.0f));
    driver.Track(1, glm::vec3(10.0f));

    EXPECT_EQ(1u, access.Size());
    EXPECT_EQ(1u, driver.GetTrackedCount());
    EXPECT_VEC3_EQ(glm::vec3(10.0f), *driver.GetCommittedPosition(1));
    EXPECT_VEC3_EQ(glm::vec3(10.0f), access.NearestNeighbour(glm::vec3(0.0f))->position);
}

TEST_F(MaintenanceDriverTest, LoadCommitsSnapshot) {
    driver.Track(99, glm::vec3(100.0f));
    driver.Load({SpatialEntry{glm::vec3(0.0f), 1}, SpatialEntry{glm::vec3(10.0f), 2}});

    EXPECT_EQ(2u, access.Size());
    EXPECT_EQ(2u, driver.GetTrackedCount());
    EXPECT_FALSE(driver.IsTracked(99));
    EXPECT_VEC3_EQ(glm::vec3(10.0f), *driver.GetCommittedPosition(2));

    // Two half-unit steps add up to a squared displacement of 1.0
    std::vector<MovementObservation> first{{1, glm::vec3(0.0f), glm::vec3(0.5f, 0.0f, 0.0f)}};
    std::vector<MovementObservation> second{{1, glm::vec3(0.5f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f)}};
    EXPECT_EQ(1u, driver.ApplyFrame(first).ignored);
    EXPECT_EQ(1u, driver.ApplyFrame(second).patched);
}

TEST_F(MaintenanceDriverTest, SmallStepsAccumulateAgainstCommittedPosition) {
    driver.Track(1, glm::vec3(0.0f));

    std::vector<MovementObservation> first{{1, glm::vec3(0.0f), glm::vec3(0.5f, 0.0f, 0.0f)}};
    EXPECT_EQ(1u, driver.ApplyFrame(first).ignored);
    EXPECT_VEC3_EQ(glm::vec3(0.0f), access.NearestNeighbour(glm::vec3(0.0f))->position);

    // Each step is small, but the total displacement since the last commit is 4.0
    std::vector<MovementObservation> second{{1, glm::vec3(0.5f, 0.0f, 0.0f), glm::vec3(2.0f, 0.0f, 0.0f)}};
    EXPECT_EQ(1u, driver.ApplyFrame(second).patched);

    EXPECT_EQ(1u, access.Size());
    EXPECT_VEC3_EQ(glm::vec3(2.0f, 0.0f, 0.0f), access.NearestNeighbour(glm::vec3(0.0f))->position);
    EXPECT_VEC3_EQ(glm::vec3(2.0f, 0.0f, 0.0f), *driver.GetCommittedPosition(1));
}

TEST_F(MaintenanceDriverTest, UnknownEntityIsInserted) {
    std::vector<MovementObservation> frame{{9, glm::vec3(0.0f), glm::vec3(3.0f)}};
    FrameReport report = driver.ApplyFrame(frame);

    EXPECT_EQ(1u, report.patched);
    EXPECT_EQ(1u, access.Size());
    EXPECT_TRUE(driver.IsTracked(9));
}

TEST_F(MaintenanceDriverTest, RebuildWithoutSupplierUsesCommittedPositions) {
    RTreeAccess3D rebuilding(1.0f, 1);
    MaintenanceDriver rebuildDriver(rebuilding);
    rebuildDriver.Track(1, glm::vec3(0.0f));
    rebuildDriver.Track(2, glm::vec3(10.0f));
    rebuildDriver.Track(3, glm::vec3(20.0f));

    std::vector<MovementObservation> frame{
        {1, glm::vec3(0.0f), glm::vec3(-5.0f)},
        {2, glm::vec3(10.0f), glm::vec3(15.0f)},
    };
    FrameReport report = rebuildDriver.ApplyFrame(frame);

    ASSERT_TRUE(report.recreated);
    EXPECT_EQ(3u, rebuilding.Size());
    EXPECT_EQ((std::vector<EntityId>{1, 2, 3}), SortedEntities(rebuilding.GetAll()));
    EXPECT_EQ(1u, rebuilding.NearestNeighbour(glm::vec3(-5.0f))->entity);
    EXPECT_EQ(2u, rebuilding.NearestNeighbour(glm::vec3(15.0f))->entity);
    EXPECT_EQ(3u, rebuilding.NearestNeighbour(glm::vec3(21.0f))->entity);
}

TEST_F(MaintenanceDriverTest, IndexStaysConsistentOverManyFrames) {
    RandomGenerator rng(2024);
    EntryGenerator entryGen(-50.0f, 50.0f);
    MovementGenerator movement(1.5f);

    auto world = entryGen.GenerateMany(rng, 150);
    RTreeAccess3D walkers(1.0f, 40);
    MaintenanceDriver walkerDriver(walkers);
    for (const auto& entry : world) {
        walkerDriver.Track(entry.entity, entry.position);
    }

    for (int frame = 0; frame < 20; ++frame) {
        // Move a varying subset so some frames patch and others rebuild
        size_t movers = (frame % 2 == 0) ? 20 : world.size();
        std::vector<SpatialEntry> moving(world.begin(), world.begin() + static_cast<std::ptrdiff_t>(movers));
        auto observations = movement.Step(rng, moving);
        std::copy(moving.begin(), moving.end(), world.begin());

        walkerDriver.ApplyFrame(observations, [&world] { return world; });

        ASSERT_EQ(world.size(), walkers.Size());
        ASSERT_TRUE(walkers.GetTree().Validate());

        // Every indexed position is within the threshold of the true position
        for (const auto& entry : world) {
            auto committed = walkerDriver.GetCommittedPosition(entry.entity);
            ASSERT_TRUE(committed.has_value());
            EXPECT_LT(walkers.DistanceSquared(*committed, entry.position), 1.0f);
        }
    }

    const auto& stats = walkerDriver.GetStats();
    EXPECT_EQ(20u, stats.frames);
    EXPECT_GT(stats.rebuilds, 0u);
    EXPECT_GT(stats.patches, 0u);
}

TEST_F(MaintenanceDriverTest, ResetStats) {
    std::vector<MovementObservation> frame{{1, glm::vec3(0.0f), glm::vec3(3.0f)}};
    driver.ApplyFrame(frame);
    EXPECT_EQ(1u, driver.GetStats().patches);

    driver.ResetStats();
    EXPECT_EQ(0u, driver.GetStats().frames);
    EXPECT_EQ(0u, driver.GetStats().patches);
}
