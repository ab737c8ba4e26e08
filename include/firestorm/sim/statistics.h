#pragma once
/**
 * @file statistics.h
 * @brief Per-trial accumulation and reduction to mean and standard error
 *
 * The standard error of the mean is the Bessel-corrected sample standard
 * deviation divided by sqrt(n). It needs at least two samples: a single
 * sample reduces to a quiet NaN SEM rather than a silent zero.
 */

#include "firestorm/core/types.h"
#include <vector>

namespace firestorm::sim {

// ============================================================================
// Summary Types
// ============================================================================

/**
 * @brief Sample mean with its standard error
 */
struct MeanSem {
    Real mean{0.0};
    Real sem{0.0};
};

/**
 * @brief Hit statistics for one hitbox radius
 */
struct HitboxStatistics {
    Real radius{0.0};
    MeanSem ordinary;
    MeanSem improved;
};

/**
 * @brief Storm area coverage statistics (fractions in [0, 1])
 */
struct CoverageStatistics {
    MeanSem ordinary;
    MeanSem improved;
};

/**
 * @brief Reduced statistics of a complete simulation
 *
 * Hitbox entries follow the order of the radii handed to
 * TrialAccumulator::reduce (ascending for engine output).
 */
struct AggregateStatistics {
    std::vector<HitboxStatistics> hitboxes;
    CoverageStatistics coverage;

    /**
     * @brief Look up the entry for a radius
     * @return Matching entry within constants::HITBOX_RADIUS_TOLERANCE, or nullptr
     */
    const HitboxStatistics* find_hitbox(Real radius) const;
};

// ============================================================================
// Reduction Functions
// ============================================================================

/**
 * @brief Arithmetic mean
 * @throws InternalInvariantViolation on an empty sample set
 */
Real sample_mean(const std::vector<Real>& samples);

/**
 * @brief Sample standard deviation with Bessel's correction (divisor n - 1)
 * @return Quiet NaN for a single sample
 * @throws InternalInvariantViolation on an empty sample set
 */
Real sample_std_dev(const std::vector<Real>& samples);

/**
 * @brief Mean and standard error of the mean
 * @return SEM is a quiet NaN for a single sample
 * @throws InternalInvariantViolation on an empty sample set
 */
MeanSem compute_mean_sem(const std::vector<Real>& samples);

// ============================================================================
// Trial Accumulator
// ============================================================================

/**
 * @brief Owns the per-trial arrays of one simulation until reduction
 */
class TrialAccumulator {
public:
    /**
     * @param hitbox_count Number of tracked hitbox radii
     * @param expected_trials Capacity hint
     */
    TrialAccumulator(SizeT hitbox_count, SizeT expected_trials);

    /**
     * @brief Record the outcome of one trial
     *
     * @param ordinary_hits Hit count per hitbox for ordinary impacts
     * @param improved_hits Hit count per hitbox for improved impacts
     * @param ordinary_coverage Covered fraction of the storm by ordinary blasts
     * @param improved_coverage Covered fraction of the storm by improved blasts
     * @throws InternalInvariantViolation if a hit vector has the wrong length
     */
    void record_trial(const std::vector<Int64>& ordinary_hits,
                      const std::vector<Int64>& improved_hits,
                      Real ordinary_coverage,
                      Real improved_coverage);

    SizeT trial_count() const noexcept { return ordinary_coverage_.size(); }
    SizeT hitbox_count() const noexcept { return ordinary_hits_.size(); }

    /**
     * @brief Reduce every tracked quantity to mean and SEM
     * @param radii Hitbox radius per tracked index
     * @throws InternalInvariantViolation if no trial was recorded or
     *         radii.size() != hitbox_count()
     */
    AggregateStatistics reduce(const std::vector<Real>& radii) const;

private:
    // [hitbox][trial]
    std::vector<std::vector<Real>> ordinary_hits_;
    std::vector<std::vector<Real>> improved_hits_;

    // [trial]
    std::vector<Real> ordinary_coverage_;
    std::vector<Real> improved_coverage_;
};

} // namespace firestorm::sim
