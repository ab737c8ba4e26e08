/**
 * @file statistics.cpp
 * @brief Mean / standard error reduction implementation
 */

#include "firestorm/sim/statistics.h"
#include "firestorm/core/constants.h"
#include "firestorm/core/error.h"
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

namespace firestorm::sim {

// ============================================================================
// AggregateStatistics Implementation
// ============================================================================

const HitboxStatistics* AggregateStatistics::find_hitbox(Real radius) const {
    for (const auto& entry : hitboxes) {
        if (std::abs(entry.radius - radius) <= constants::HITBOX_RADIUS_TOLERANCE) {
            return &entry;
        }
    }
    return nullptr;
}

// ============================================================================
// Reduction Functions
// ============================================================================

Real sample_mean(const std::vector<Real>& samples) {
    if (samples.empty()) {
        throw InternalInvariantViolation("Mean of an empty sample set");
    }
    Real sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<Real>(samples.size());
}

Real sample_std_dev(const std::vector<Real>& samples) {
    Real mean = sample_mean(samples);
    if (samples.size() < 2) {
        return std::numeric_limits<Real>::quiet_NaN();
    }

    Real sum_sq = 0.0;
    for (Real s : samples) {
        Real d = s - mean;
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq / static_cast<Real>(samples.size() - 1));
}

MeanSem compute_mean_sem(const std::vector<Real>& samples) {
    MeanSem result;
    result.mean = sample_mean(samples);
    result.sem = sample_std_dev(samples) / std::sqrt(static_cast<Real>(samples.size()));
    return result;
}

// ============================================================================
// TrialAccumulator Implementation
// ============================================================================

TrialAccumulator::TrialAccumulator(SizeT hitbox_count, SizeT expected_trials)
    : ordinary_hits_(hitbox_count)
    , improved_hits_(hitbox_count) {
    for (SizeT i = 0; i < hitbox_count; ++i) {
        ordinary_hits_[i].reserve(expected_trials);
        improved_hits_[i].reserve(expected_trials);
    }
    ordinary_coverage_.reserve(expected_trials);
    improved_coverage_.reserve(expected_trials);
}

void TrialAccumulator::record_trial(const std::vector<Int64>& ordinary_hits,
                                    const std::vector<Int64>& improved_hits,
                                    Real ordinary_coverage,
                                    Real improved_coverage) {
    if (ordinary_hits.size() != hitbox_count() || improved_hits.size() != hitbox_count()) {
        throw InternalInvariantViolation(
            "Trial hit vectors do not match the " + std::to_string(hitbox_count()) +
            " tracked hitboxes");
    }

    for (SizeT i = 0; i < hitbox_count(); ++i) {
        ordinary_hits_[i].push_back(static_cast<Real>(ordinary_hits[i]));
        improved_hits_[i].push_back(static_cast<Real>(improved_hits[i]));
    }
    ordinary_coverage_.push_back(ordinary_coverage);
    improved_coverage_.push_back(improved_coverage);
}

AggregateStatistics TrialAccumulator::reduce(const std::vector<Real>& radii) const {
    if (trial_count() == 0) {
        throw InternalInvariantViolation("Reduction requested before any trial was recorded");
    }
    if (radii.size() != hitbox_count()) {
        throw InternalInvariantViolation("Radius list does not match the tracked hitboxes");
    }

    AggregateStatistics stats;
    stats.hitboxes.reserve(hitbox_count());
    for (SizeT i = 0; i < hitbox_count(); ++i) {
        HitboxStatistics entry;
        entry.radius = radii[i];
        entry.ordinary = compute_mean_sem(ordinary_hits_[i]);
        entry.improved = compute_mean_sem(improved_hits_[i]);
        stats.hitboxes.push_back(entry);
    }
    stats.coverage.ordinary = compute_mean_sem(ordinary_coverage_);
    stats.coverage.improved = compute_mean_sem(improved_coverage_);
    return stats;
}

} // namespace firestorm::sim
