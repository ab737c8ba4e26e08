/**
 * @file test_statistics.cpp
 * @brief Unit tests for mean / standard error reduction
 */

#include <gtest/gtest.h>
#include "firestorm/sim/statistics.h"
#include "firestorm/core/error.h"
#include <cmath>

using namespace firestorm;
using namespace firestorm::sim;

// ============================================================================
// Reduction Function Tests
// ============================================================================

TEST(SampleStatisticsTest, MeanOfKnownSamples) {
    EXPECT_DOUBLE_EQ(sample_mean({1.0, 2.0, 3.0, 4.0}), 2.5);
    EXPECT_DOUBLE_EQ(sample_mean({7.0}), 7.0);
}

TEST(SampleStatisticsTest, StdDevUsesBesselCorrection) {
    // Squared deviations sum to 5, divided by n - 1 = 3
    EXPECT_DOUBLE_EQ(sample_std_dev({1.0, 2.0, 3.0, 4.0}), std::sqrt(5.0 / 3.0));
}

TEST(SampleStatisticsTest, SemIsStdDevOverRootN) {
    MeanSem s = compute_mean_sem({1.0, 2.0, 3.0, 4.0});

    EXPECT_DOUBLE_EQ(s.mean, 2.5);
    EXPECT_DOUBLE_EQ(s.sem, std::sqrt(5.0 / 3.0) / 2.0);
}

TEST(SampleStatisticsTest, TwoSamples) {
    MeanSem s = compute_mean_sem({0.0, 2.0});

    EXPECT_DOUBLE_EQ(s.mean, 1.0);
    // sd = sqrt(2), sem = sqrt(2) / sqrt(2)
    EXPECT_DOUBLE_EQ(s.sem, 1.0);
}

TEST(SampleStatisticsTest, ConstantSamplesHaveZeroSem) {
    MeanSem s = compute_mean_sem({3.0, 3.0, 3.0, 3.0, 3.0});

    EXPECT_DOUBLE_EQ(s.mean, 3.0);
    EXPECT_DOUBLE_EQ(s.sem, 0.0);
}

TEST(SampleStatisticsTest, SingleSampleGivesNanSem) {
    MeanSem s = compute_mean_sem({4.0});

    EXPECT_DOUBLE_EQ(s.mean, 4.0);
    EXPECT_TRUE(std::isnan(s.sem));
    EXPECT_TRUE(std::isnan(sample_std_dev({4.0})));
}

TEST(SampleStatisticsTest, EmptySamplesViolateInvariant) {
    EXPECT_THROW(sample_mean({}), InternalInvariantViolation);
    EXPECT_THROW(sample_std_dev({}), InternalInvariantViolation);
    EXPECT_THROW(compute_mean_sem({}), InternalInvariantViolation);
}

// ============================================================================
// Trial Accumulator Tests
// ============================================================================

class TrialAccumulatorTest : public ::testing::Test {
protected:
    TrialAccumulator accumulator{2, 3};
    std::vector<Real> radii{0.5, 1.0};
};

TEST_F(TrialAccumulatorTest, StartsEmpty) {
    EXPECT_EQ(accumulator.trial_count(), 0u);
    EXPECT_EQ(accumulator.hitbox_count(), 2u);
}

TEST_F(TrialAccumulatorTest, ReduceBeforeAnyTrialViolatesInvariant) {
    EXPECT_THROW(accumulator.reduce(radii), InternalInvariantViolation);
}

TEST_F(TrialAccumulatorTest, MismatchedHitVectorViolatesInvariant) {
    EXPECT_THROW(accumulator.record_trial({1}, {1, 2}, 0.1, 0.2), InternalInvariantViolation);
    EXPECT_THROW(accumulator.record_trial({1, 2}, {1, 2, 3}, 0.1, 0.2), InternalInvariantViolation);
    EXPECT_EQ(accumulator.trial_count(), 0u);
}

TEST_F(TrialAccumulatorTest, MismatchedRadiusListViolatesInvariant) {
    accumulator.record_trial({1, 2}, {0, 0}, 0.1, 0.0);
    EXPECT_THROW(accumulator.reduce({0.5}), InternalInvariantViolation);
}

TEST_F(TrialAccumulatorTest, ReducesEveryQuantity) {
    accumulator.record_trial({1, 2}, {0, 4}, 0.25, 0.50);
    accumulator.record_trial({3, 4}, {0, 6}, 0.75, 0.50);
    EXPECT_EQ(accumulator.trial_count(), 2u);

    AggregateStatistics stats = accumulator.reduce(radii);
    ASSERT_EQ(stats.hitboxes.size(), 2u);

    EXPECT_DOUBLE_EQ(stats.hitboxes[0].radius, 0.5);
    EXPECT_DOUBLE_EQ(stats.hitboxes[0].ordinary.mean, 2.0);
    EXPECT_DOUBLE_EQ(stats.hitboxes[0].ordinary.sem, 1.0);
    EXPECT_DOUBLE_EQ(stats.hitboxes[0].improved.mean, 0.0);
    EXPECT_DOUBLE_EQ(stats.hitboxes[0].improved.sem, 0.0);

    EXPECT_DOUBLE_EQ(stats.hitboxes[1].radius, 1.0);
    EXPECT_DOUBLE_EQ(stats.hitboxes[1].ordinary.mean, 3.0);
    EXPECT_DOUBLE_EQ(stats.hitboxes[1].improved.mean, 5.0);
    EXPECT_DOUBLE_EQ(stats.hitboxes[1].improved.sem, 1.0);

    EXPECT_DOUBLE_EQ(stats.coverage.ordinary.mean, 0.5);
    EXPECT_DOUBLE_EQ(stats.coverage.ordinary.sem, 0.25);
    EXPECT_DOUBLE_EQ(stats.coverage.improved.mean, 0.5);
    EXPECT_DOUBLE_EQ(stats.coverage.improved.sem, 0.0);
}

TEST_F(TrialAccumulatorTest, FindHitboxByRadius) {
    accumulator.record_trial({1, 2}, {0, 0}, 0.0, 0.0);
    accumulator.record_trial({1, 2}, {0, 0}, 0.0, 0.0);
    AggregateStatistics stats = accumulator.reduce(radii);

    const HitboxStatistics* entry = stats.find_hitbox(1.0);
    ASSERT_NE(entry, nullptr);
    EXPECT_DOUBLE_EQ(entry->ordinary.mean, 2.0);

    EXPECT_NE(stats.find_hitbox(0.5 + 1e-12), nullptr);
    EXPECT_EQ(stats.find_hitbox(0.75), nullptr);
}
