#pragma once
/**
 * @file simulator.h
 * @brief Monte Carlo firestorm trial engine
 *
 * One invocation validates its configuration, draws a fixed coverage
 * integration grid over the storm disk, runs the requested number of
 * independent trials and reduces them to mean and standard error. The
 * last trial is kept in full as a snapshot for rendering.
 *
 * Random draws per invocation happen in this order: grid, then for each
 * trial the ordinary impacts followed by the improved impacts. Two runs
 * with the same configuration and engine state therefore produce
 * bit-identical results.
 *
 * Usage:
 * @code
 * sim::SimulationConfig config;
 * config.ignites = 3;
 * config.hitbox_radii = {0.5, 1.0};
 * RandomEngine rng = make_random_engine(42);
 * sim::SimulationResult result = sim::simulate_firestorm(config, rng);
 * for (const auto& h : result.statistics.hitboxes) {
 *     std::cout << h.radius << ": " << h.ordinary.mean << "\n";
 * }
 * @endcode
 */

#include "firestorm/core/types.h"
#include "firestorm/core/random.h"
#include "firestorm/sim/storm_config.h"
#include "firestorm/sim/statistics.h"
#include <vector>

namespace firestorm::sim {

// ============================================================================
// Trial Data
// ============================================================================

/**
 * @brief Full outcome of one trial
 *
 * Hit vectors are indexed like FirestormSimulator::hitbox_radii().
 */
struct TrialOutcome {
    PointCloud ordinary_impacts;
    PointCloud improved_impacts;
    CoverageMask ordinary_coverage;
    CoverageMask improved_coverage;
    std::vector<Int64> ordinary_hits;
    std::vector<Int64> improved_hits;
};

/**
 * @brief Raw data of the final trial plus the shared integration grid
 */
struct TrialSnapshot {
    PointCloud ordinary_impacts;
    PointCloud improved_impacts;
    PointCloud coverage_grid;
    CoverageMask ordinary_coverage;
    CoverageMask improved_coverage;
};

/**
 * @brief Result of one engine invocation
 */
struct SimulationResult {
    AggregateStatistics statistics;
    ScaledRadii radii;
    ProjectileAllocation allocation;
    SizeT trials{0};
    TrialSnapshot snapshot;
};

// ============================================================================
// Firestorm Simulator
// ============================================================================

/**
 * @brief Trial engine bound to one validated configuration
 */
class FirestormSimulator {
public:
    /**
     * @brief Validate @p config and precompute the derived quantities
     * @throws DegenerateConfigurationError for area_modifier <= -1 or trials < 2
     * @throws InputValidationError for any other invalid field
     */
    explicit FirestormSimulator(const SimulationConfig& config);

    /**
     * @brief Run every trial and aggregate
     */
    SimulationResult run(RandomEngine& rng) const;

    /**
     * @brief Draw the coverage integration grid over the scaled storm disk
     */
    PointCloud sample_coverage_grid(RandomEngine& rng) const;

    /**
     * @brief Run a single trial against a given integration grid
     */
    TrialOutcome run_trial(const PointCloud& grid, RandomEngine& rng) const;

    const SimulationConfig& config() const noexcept { return config_; }
    const ScaledRadii& radii() const noexcept { return radii_; }
    const ProjectileAllocation& allocation() const noexcept { return allocation_; }

    /// Hitbox radii in ascending order
    const std::vector<Real>& hitbox_radii() const noexcept { return hitbox_radii_; }

private:
    SimulationConfig config_;
    ScaledRadii radii_;
    ProjectileAllocation allocation_;
    std::vector<Real> hitbox_radii_;
};

/**
 * @brief Run a simulation with a caller-owned random engine
 */
SimulationResult simulate_firestorm(const SimulationConfig& config, RandomEngine& rng);

/**
 * @brief Run a simulation seeded from SimulationConfig::seed
 */
SimulationResult simulate_firestorm(const SimulationConfig& config);

} // namespace firestorm::sim
