#pragma once
/**
 * @file constants.h
 * @brief Simulation configuration constants
 *
 * Centralizes the default storm geometry and sampling parameters.
 * Mathematical constants (PI, etc.) remain in types.h.
 */

#include "firestorm/core/types.h"

namespace firestorm::constants {

// ============================================================================
// Storm Geometry Defaults
// ============================================================================

/// Default storm radius before area scaling (m)
constexpr Real DEFAULT_STORM_RADIUS = 5.6;

/// Default ordinary blast radius before area scaling (m)
constexpr Real DEFAULT_ORDINARY_BLAST_RADIUS = 1.0;

/// Default improved blast radius before area scaling (m)
constexpr Real DEFAULT_IMPROVED_BLAST_RADIUS = 1.8;

/// Default projectile frequency (events/s)
constexpr Real DEFAULT_FREQUENCY = 10.0;

// ============================================================================
// Projectile Allocation
// ============================================================================

/// Improved projectiles granted per consumed ignite
constexpr Int64 IMPROVED_PER_IGNITE = 5;

/// Upper bound on floor(duration * frequency)
constexpr Int64 MAX_PROJECTILES_PER_TRIAL = 1'000'000;

// ============================================================================
// Sampling
// ============================================================================

/// Default number of points in the coverage integration grid
constexpr SizeT DEFAULT_COVERAGE_SAMPLES = 1000;

/// Default number of Monte Carlo trials
constexpr Int64 DEFAULT_TRIALS = 1000;

/// Minimum trial count for a finite standard error
constexpr Int64 MIN_TRIALS = 2;

/// Upper bound on the trial count
constexpr Int64 MAX_TRIALS = 10'000'000;

/// Upper bound on the coverage integration grid size
constexpr SizeT MAX_COVERAGE_SAMPLES = 1'000'000;

/// Seed value requesting a non-deterministic seed
constexpr UInt64 RANDOM_SEED = 0;

// ============================================================================
// Control Defaults
// ============================================================================

/// Default ignites consumed
constexpr Int64 DEFAULT_IGNITES = 3;

/// Default storm duration (s)
constexpr Real DEFAULT_DURATION = 6.0;

/// Default area modifier (fraction, 0 = unchanged)
constexpr Real DEFAULT_AREA_MODIFIER = 0.0;

/// Two hitbox radii closer than this are considered the same radius (m)
constexpr Real HITBOX_RADIUS_TOLERANCE = 1e-9;

// ============================================================================
// Parameter Scan
// ============================================================================

/// Default number of scan points
constexpr SizeT DEFAULT_SCAN_STEPS = 11;

/// Upper bound on the number of scan points
constexpr SizeT MAX_SCAN_STEPS = 1000;

/// Ignite scan range
constexpr Real SCAN_IGNITES_MIN = 0.0;
constexpr Real SCAN_IGNITES_MAX = 12.0;

/// Area modifier scan range (percent)
constexpr Real SCAN_AREA_PERCENT_MIN = -90.0;
constexpr Real SCAN_AREA_PERCENT_MAX = 100.0;

/// Duration scan range (s)
constexpr Real SCAN_DURATION_MIN = 1.0;
constexpr Real SCAN_DURATION_MAX = 12.0;

} // namespace firestorm::constants
