/**
 * @file test_disk_sampler.cpp
 * @brief Unit tests for area-uniform disk sampling
 */

#include <gtest/gtest.h>
#include "firestorm/sampling/disk_sampler.h"
#include "firestorm/core/error.h"
#include <algorithm>
#include <cmath>
#include <numeric>

using namespace firestorm;
using namespace firestorm::sampling;

// ============================================================================
// Disk Sampler Tests
// ============================================================================

class DiskSamplerTest : public ::testing::Test {
protected:
    RandomEngine rng = make_random_engine(12345);
};

TEST_F(DiskSamplerTest, ZeroCountReturnsEmptyCloud) {
    PointCloud points = sample_disk(0, 5.6, rng);

    EXPECT_TRUE(points.empty());
    EXPECT_EQ(points.x.size(), 0u);
    EXPECT_EQ(points.y.size(), 0u);
}

TEST_F(DiskSamplerTest, ProducesRequestedCount) {
    PointCloud points = sample_disk(257, 1.0, rng);

    EXPECT_EQ(points.size(), 257u);
    EXPECT_EQ(points.x.size(), points.y.size());
}

TEST_F(DiskSamplerTest, PointsStayInsideDisk) {
    const Real radius = 3.5;
    PointCloud points = sample_disk(20000, radius, rng);

    for (Real d : radial_distances(points)) {
        EXPECT_LE(d, radius * (1.0 + 1e-12));
    }
}

TEST_F(DiskSamplerTest, NonPositiveRadiusThrows) {
    EXPECT_THROW(sample_disk(5, 0.0, rng), InputValidationError);
    EXPECT_THROW(sample_disk(5, -1.0, rng), InputValidationError);
}

TEST_F(DiskSamplerTest, SameSeedSameSamples) {
    RandomEngine a = make_random_engine(99);
    RandomEngine b = make_random_engine(99);

    PointCloud pa = sample_disk(100, 2.0, a);
    PointCloud pb = sample_disk(100, 2.0, b);

    EXPECT_EQ(pa.x, pb.x);
    EXPECT_EQ(pa.y, pb.y);
}

TEST_F(DiskSamplerTest, DifferentSeedsDiffer) {
    RandomEngine a = make_random_engine(1);
    RandomEngine b = make_random_engine(2);

    EXPECT_NE(sample_disk(10, 2.0, a).x, sample_disk(10, 2.0, b).x);
}

TEST_F(DiskSamplerTest, SamplesAreCentred) {
    const Real radius = 2.0;
    PointCloud points = sample_disk(50000, radius, rng);

    Real mean_x = std::accumulate(points.x.begin(), points.x.end(), 0.0) / points.size();
    Real mean_y = std::accumulate(points.y.begin(), points.y.end(), 0.0) / points.size();

    // Coordinate std dev is R/2, so the standard error here is about 0.0045
    EXPECT_NEAR(mean_x, 0.0, 0.03);
    EXPECT_NEAR(mean_y, 0.0, 0.03);
}

TEST_F(DiskSamplerTest, InnerHalfRadiusHoldsQuarterOfSamples) {
    const Real radius = 4.0;
    const SizeT n = 100000;
    PointCloud points = sample_disk(n, radius, rng);

    auto distances = radial_distances(points);
    auto inner = std::count_if(distances.begin(), distances.end(),
                               [radius](Real d) { return d <= radius / 2.0; });

    // Radius-uniform sampling would put half of the points here
    EXPECT_NEAR(static_cast<Real>(inner) / n, 0.25, 0.01);
}

TEST_F(DiskSamplerTest, DistanceDistributionMatchesAreaUniformCdf) {
    const Real radius = 2.0;
    const SizeT n = 200000;
    PointCloud points = sample_disk(n, radius, rng);

    auto distances = radial_distances(points);
    std::sort(distances.begin(), distances.end());

    // Kolmogorov-Smirnov statistic against F(r) = r^2 / R^2
    Real ks = 0.0;
    for (SizeT i = 0; i < n; ++i) {
        Real f = disk_radius_cdf(distances[i], radius);
        Real lo = static_cast<Real>(i) / n;
        Real hi = static_cast<Real>(i + 1) / n;
        ks = std::max({ks, std::abs(f - lo), std::abs(hi - f)});
    }
    EXPECT_LT(ks, 0.01);
}

// ============================================================================
// Helper Function Tests
// ============================================================================

TEST(DiskRadiusCdfTest, Values) {
    EXPECT_DOUBLE_EQ(disk_radius_cdf(0.0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(disk_radius_cdf(1.0, 2.0), 0.25);
    EXPECT_DOUBLE_EQ(disk_radius_cdf(2.0, 2.0), 1.0);
    EXPECT_DOUBLE_EQ(disk_radius_cdf(3.0, 2.0), 1.0);
    EXPECT_DOUBLE_EQ(disk_radius_cdf(-1.0, 2.0), 0.0);
}

TEST(RadialDistancesTest, KnownPoints) {
    PointCloud points;
    points.push_back({3.0, 4.0});
    points.push_back({0.0, -2.0});
    points.push_back({0.0, 0.0});

    auto d = radial_distances(points);
    ASSERT_EQ(d.size(), 3u);
    EXPECT_DOUBLE_EQ(d[0], 5.0);
    EXPECT_DOUBLE_EQ(d[1], 2.0);
    EXPECT_DOUBLE_EQ(d[2], 0.0);
}

TEST(Vec2Test, LengthAndDistance) {
    Vec2 a{3.0, 4.0};
    Vec2 b{0.0, 0.0};

    EXPECT_DOUBLE_EQ(a.length(), 5.0);
    EXPECT_DOUBLE_EQ(a.length_squared(), 25.0);
    EXPECT_DOUBLE_EQ(math::distance(a, b), 5.0);
    EXPECT_DOUBLE_EQ(math::distance(a, a), 0.0);

    Vec2 d = Vec2{1.0, -2.0} - a;
    EXPECT_DOUBLE_EQ(d.x, -2.0);
    EXPECT_DOUBLE_EQ(d.y, -6.0);
    EXPECT_DOUBLE_EQ(math::distance(Vec2{1.0, 1.0}, Vec2{4.0, 5.0}), 5.0);
}
