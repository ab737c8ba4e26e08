/**
 * @file test_coverage.cpp
 * @brief Unit tests for coverage masks and hitbox hit counting
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "firestorm/sim/coverage.h"
#include "firestorm/sampling/disk_sampler.h"

using namespace firestorm;
using namespace firestorm::sim;
using ::testing::Each;
using ::testing::ElementsAre;

namespace {

PointCloud make_cloud(std::initializer_list<Vec2> points) {
    PointCloud cloud;
    for (const auto& p : points) {
        cloud.push_back(p);
    }
    return cloud;
}

} // anonymous namespace

// ============================================================================
// Coverage Mask Tests
// ============================================================================

TEST(CoverageMaskTest, NoImpactsCoversNothing) {
    PointCloud grid = make_cloud({{0.0, 0.0}, {1.0, 1.0}, {-2.0, 0.5}});
    PointCloud impacts;

    CoverageMask mask = compute_coverage_mask(grid, impacts, 1.0);

    ASSERT_EQ(mask.size(), 3u);
    EXPECT_THAT(mask, Each(false));
    EXPECT_DOUBLE_EQ(coverage_fraction(mask), 0.0);
}

TEST(CoverageMaskTest, BoundaryPointIsCovered) {
    PointCloud grid = make_cloud({{0.0, 0.0}, {0.5, 0.0}, {1.0, 0.0}, {1.5, 0.0}});
    PointCloud impacts = make_cloud({{0.0, 0.0}});

    CoverageMask mask = compute_coverage_mask(grid, impacts, 1.0);

    EXPECT_THAT(mask, ElementsAre(true, true, true, false));
    EXPECT_DOUBLE_EQ(coverage_fraction(mask), 0.75);
}

TEST(CoverageMaskTest, AnyImpactCovers) {
    PointCloud grid = make_cloud({{-3.0, 0.0}, {0.0, 0.0}, {3.0, 0.0}});
    PointCloud impacts = make_cloud({{-3.0, 0.5}, {3.0, -0.5}});

    CoverageMask mask = compute_coverage_mask(grid, impacts, 1.0);

    EXPECT_THAT(mask, ElementsAre(true, false, true));
}

TEST(CoverageMaskTest, BlastSpanningStormCoversEverything) {
    RandomEngine rng = make_random_engine(7);
    const Real storm = 5.6;
    PointCloud grid = sampling::sample_disk(500, storm, rng);
    PointCloud impacts = sampling::sample_disk(1, storm, rng);

    CoverageMask mask = compute_coverage_mask(grid, impacts, 2.0 * storm + 1e-9);

    EXPECT_THAT(mask, Each(true));
    EXPECT_DOUBLE_EQ(coverage_fraction(mask), 1.0);
}

TEST(CoverageFractionTest, EmptyMaskIsZero) {
    EXPECT_DOUBLE_EQ(coverage_fraction({}), 0.0);
}

TEST(CoverageFractionTest, CountsTrueEntries) {
    EXPECT_DOUBLE_EQ(coverage_fraction({true, false, true, false}), 0.5);
    EXPECT_DOUBLE_EQ(coverage_fraction({true, true, true}), 1.0);
}

// ============================================================================
// Hit Count Tests
// ============================================================================

TEST(HitCountTest, ThresholdIsHitboxPlusBlastRadius) {
    // Distances from the origin: 0.5, 1.5, 2.5
    PointCloud impacts = make_cloud({{0.5, 0.0}, {0.0, 1.5}, {-2.5, 0.0}});

    auto hits = count_hits(impacts, {0.5, 1.0, 1.5}, 1.0);

    EXPECT_THAT(hits, ElementsAre(2, 2, 3));
}

TEST(HitCountTest, BlastRadiusWidensHitbox) {
    PointCloud impacts = make_cloud({{3.0, 0.0}});

    EXPECT_THAT(count_hits(impacts, {1.0}, 1.0), ElementsAre(0));
    EXPECT_THAT(count_hits(impacts, {1.0}, 2.0), ElementsAre(1));
}

TEST(HitCountTest, NoImpactsNoHits) {
    PointCloud impacts;

    EXPECT_THAT(count_hits(impacts, {0.5, 1.0}, 1.8), ElementsAre(0, 0));
}

TEST(HitCountTest, LargerHitboxNeverScoresFewerHits) {
    RandomEngine rng = make_random_engine(2024);
    std::vector<Real> radii{0.1, 0.25, 0.5, 1.0, 2.0, 4.0};

    for (int trial = 0; trial < 50; ++trial) {
        PointCloud impacts = sampling::sample_disk(60, 5.6, rng);
        auto hits = count_hits(impacts, radii, 1.0);

        ASSERT_EQ(hits.size(), radii.size());
        for (SizeT i = 1; i < hits.size(); ++i) {
            EXPECT_LE(hits[i - 1], hits[i]);
        }
        EXPECT_LE(hits.back(), 60);
    }
}
