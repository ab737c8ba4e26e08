/**
 * @file storm_config.cpp
 * @brief Configuration validation and derived storm quantities
 */

#include "firestorm/sim/storm_config.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace firestorm::sim {

namespace {

bool is_positive(Real value) {
    return std::isfinite(value) && value > 0.0;
}

} // anonymous namespace

// ============================================================================
// SimulationConfig Implementation
// ============================================================================

SimulationConfig SimulationConfig::defaults() {
    return SimulationConfig{};
}

// ============================================================================
// Validation
// ============================================================================

StormResult validate_hitbox_radii(const std::vector<Real>& radii) {
    if (radii.empty()) {
        return StormResult::EmptyHitboxSet;
    }
    for (Real r : radii) {
        if (!is_positive(r)) {
            return StormResult::NonPositiveRadius;
        }
    }

    std::vector<Real> sorted = canonical_hitbox_radii(radii);
    for (SizeT i = 1; i < sorted.size(); ++i) {
        if (sorted[i] - sorted[i - 1] <= constants::HITBOX_RADIUS_TOLERANCE) {
            return StormResult::DuplicateHitboxRadius;
        }
    }
    return StormResult::Success;
}

StormResult validate_config(const SimulationConfig& config) {
    // Malformed input
    StormResult hitbox_result = validate_hitbox_radii(config.hitbox_radii);
    if (hitbox_result != StormResult::Success) {
        return hitbox_result;
    }
    if (config.ignites < 0) {
        return StormResult::NegativeIgnites;
    }
    if (!is_positive(config.duration)) {
        return StormResult::NonPositiveDuration;
    }
    if (!is_positive(config.frequency)) {
        return StormResult::NonPositiveFrequency;
    }
    if (!(std::floor(config.duration * config.frequency) <=
          static_cast<Real>(constants::MAX_PROJECTILES_PER_TRIAL))) {
        return StormResult::ExcessiveProjectileCount;
    }
    if (!is_positive(config.storm_radius) ||
        !is_positive(config.ordinary_blast_radius) ||
        !is_positive(config.improved_blast_radius)) {
        return StormResult::NonPositiveRadius;
    }
    if (config.coverage_samples == 0 ||
        config.coverage_samples > constants::MAX_COVERAGE_SAMPLES) {
        return StormResult::InvalidCoverageSamples;
    }
    if (config.trials < 1) {
        return StormResult::InvalidTrialCount;
    }
    if (config.trials > constants::MAX_TRIALS) {
        return StormResult::ExcessiveTrialCount;
    }
    if (!std::isfinite(config.area_modifier)) {
        return StormResult::InvalidNumber;
    }

    // Degenerate configurations
    if (config.area_modifier <= -1.0) {
        return StormResult::DegenerateAreaModifier;
    }
    if (config.trials < constants::MIN_TRIALS) {
        return StormResult::DegenerateTrialCount;
    }
    return StormResult::Success;
}

// ============================================================================
// Derived Quantities
// ============================================================================

Real area_scale_factor(Real area_modifier) {
    if (!(area_modifier > -1.0)) {
        throw DegenerateConfigurationError(
            StormResult::DegenerateAreaModifier,
            "Area modifier must exceed -1, got " + std::to_string(area_modifier));
    }
    return std::sqrt(1.0 + area_modifier);
}

ScaledRadii compute_scaled_radii(const SimulationConfig& config) {
    Real scale = area_scale_factor(config.area_modifier);

    ScaledRadii radii;
    radii.storm = config.storm_radius * scale;
    radii.ordinary_blast = config.ordinary_blast_radius * scale;
    radii.improved_blast = config.improved_blast_radius * scale;
    return radii;
}

Int64 scheduled_projectiles(Real duration, Real frequency) {
    Real scheduled = std::floor(duration * frequency);
    if (!(std::abs(scheduled) <= static_cast<Real>(constants::MAX_PROJECTILES_PER_TRIAL))) {
        throw InputValidationError(
            StormResult::ExcessiveProjectileCount,
            "Projectile schedule out of range: duration=" + std::to_string(duration) +
            " frequency=" + std::to_string(frequency));
    }
    return static_cast<Int64>(scheduled);
}

ProjectileAllocation compute_allocation(Int64 ignites, Real duration, Real frequency) {
    Int64 scheduled = scheduled_projectiles(duration, frequency);
    if (ignites < 0 || scheduled < 0) {
        throw InternalInvariantViolation(
            "Negative projectile allocation input: ignites=" + std::to_string(ignites) +
            " scheduled=" + std::to_string(scheduled));
    }

    // Ignites needed to fill the whole schedule; the product is only formed below it
    Int64 saturating_ignites =
        (scheduled + constants::IMPROVED_PER_IGNITE - 1) / constants::IMPROVED_PER_IGNITE;

    ProjectileAllocation allocation;
    allocation.improved = ignites >= saturating_ignites
        ? scheduled
        : ignites * constants::IMPROVED_PER_IGNITE;
    allocation.ordinary = scheduled - allocation.improved;
    return allocation;
}

std::vector<Real> canonical_hitbox_radii(const std::vector<Real>& radii) {
    std::vector<Real> sorted = radii;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

} // namespace firestorm::sim
