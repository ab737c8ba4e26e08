#pragma once
/**
 * @file storm_config.h
 * @brief Simulation inputs and the quantities derived from them
 *
 * SimulationConfig is the immutable input of one engine invocation.
 * ScaledRadii and ProjectileAllocation are pure functions of it and are
 * computed once before sampling starts.
 */

#include "firestorm/core/types.h"
#include "firestorm/core/constants.h"
#include "firestorm/core/error.h"
#include <vector>

namespace firestorm::sim {

// ============================================================================
// Simulation Configuration
// ============================================================================

/**
 * @brief Input of a single firestorm simulation
 *
 * Hitbox radii form an ordered set: every radius must be positive and no two
 * may lie within constants::HITBOX_RADIUS_TOLERANCE of each other.
 */
struct SimulationConfig {
    // Control inputs
    Int64 ignites{constants::DEFAULT_IGNITES};
    std::vector<Real> hitbox_radii{0.5, 1.0};
    Real area_modifier{constants::DEFAULT_AREA_MODIFIER};  // fraction, -0.1 = 10% smaller
    Real duration{constants::DEFAULT_DURATION};            // s
    Int64 trials{constants::DEFAULT_TRIALS};

    // Storm model
    Real storm_radius{constants::DEFAULT_STORM_RADIUS};
    Real ordinary_blast_radius{constants::DEFAULT_ORDINARY_BLAST_RADIUS};
    Real improved_blast_radius{constants::DEFAULT_IMPROVED_BLAST_RADIUS};
    Real frequency{constants::DEFAULT_FREQUENCY};
    SizeT coverage_samples{constants::DEFAULT_COVERAGE_SAMPLES};

    // 0 = seed from std::random_device
    UInt64 seed{constants::RANDOM_SEED};

    /**
     * @brief Create default configuration
     */
    static SimulationConfig defaults();
};

// ============================================================================
// Derived Quantities
// ============================================================================

/**
 * @brief Storm and blast radii after applying the area modifier
 *
 * Each radius is its base value times sqrt(1 + area_modifier), so the
 * modifier scales areas linearly.
 */
struct ScaledRadii {
    Real storm{0.0};
    Real ordinary_blast{0.0};
    Real improved_blast{0.0};
};

/**
 * @brief Split of the scheduled projectiles between the two classes
 */
struct ProjectileAllocation {
    Int64 improved{0};
    Int64 ordinary{0};

    Int64 total() const noexcept { return improved + ordinary; }
};

/**
 * @brief Check a configuration before any sampling
 *
 * Input validation failures are reported before degenerate-configuration
 * failures, so a config that is both malformed and degenerate reports the
 * malformed field.
 *
 * @return StormResult::Success or the specific failure reason
 */
StormResult validate_config(const SimulationConfig& config);

/**
 * @brief Check a hitbox radius list (non-empty, positive, distinct)
 */
StormResult validate_hitbox_radii(const std::vector<Real>& radii);

/**
 * @brief Scale the configured base radii by the area modifier
 * @throws DegenerateConfigurationError if area_modifier <= -1
 */
ScaledRadii compute_scaled_radii(const SimulationConfig& config);

/**
 * @brief Area scale factor sqrt(1 + area_modifier)
 * @throws DegenerateConfigurationError if area_modifier <= -1
 */
Real area_scale_factor(Real area_modifier);

/**
 * @brief Number of projectiles scheduled over the storm duration,
 *        floor(duration * frequency)
 * @throws InputValidationError (ExcessiveProjectileCount) if the product is not
 *         finite or exceeds constants::MAX_PROJECTILES_PER_TRIAL in magnitude
 */
Int64 scheduled_projectiles(Real duration, Real frequency);

/**
 * @brief Allocate scheduled projectiles to the improved and ordinary classes
 *
 * improved = min(5 * ignites, scheduled), ordinary = scheduled - improved.
 * Any non-negative ignite count is accepted; large counts saturate at the
 * schedule.
 *
 * @throws InputValidationError if the schedule is out of range
 * @throws InternalInvariantViolation for negative ignites or a negative schedule
 */
ProjectileAllocation compute_allocation(Int64 ignites, Real duration, Real frequency);

/**
 * @brief Hitbox radii in canonical (ascending) order
 */
std::vector<Real> canonical_hitbox_radii(const std::vector<Real>& radii);

} // namespace firestorm::sim
