/**
 * @file simulator.cpp
 * @brief Monte Carlo firestorm trial engine implementation
 */

#include "firestorm/sim/simulator.h"
#include "firestorm/sim/coverage.h"
#include "firestorm/sampling/disk_sampler.h"
#include <utility>

namespace firestorm::sim {

// ============================================================================
// FirestormSimulator Implementation
// ============================================================================

FirestormSimulator::FirestormSimulator(const SimulationConfig& config)
    : config_(config) {
    throw_on_failure(validate_config(config_), "Invalid firestorm configuration");

    radii_ = compute_scaled_radii(config_);
    allocation_ = compute_allocation(config_.ignites, config_.duration, config_.frequency);
    hitbox_radii_ = canonical_hitbox_radii(config_.hitbox_radii);
}

PointCloud FirestormSimulator::sample_coverage_grid(RandomEngine& rng) const {
    return sampling::sample_disk(config_.coverage_samples, radii_.storm, rng);
}

TrialOutcome FirestormSimulator::run_trial(const PointCloud& grid, RandomEngine& rng) const {
    TrialOutcome outcome;

    // Impacts scatter over the whole storm; blast radii only enter the tests
    outcome.ordinary_impacts = sampling::sample_disk(
        static_cast<SizeT>(allocation_.ordinary), radii_.storm, rng);
    outcome.improved_impacts = sampling::sample_disk(
        static_cast<SizeT>(allocation_.improved), radii_.storm, rng);

    outcome.ordinary_coverage = compute_coverage_mask(grid, outcome.ordinary_impacts,
                                                      radii_.ordinary_blast);
    outcome.improved_coverage = compute_coverage_mask(grid, outcome.improved_impacts,
                                                      radii_.improved_blast);

    outcome.ordinary_hits = count_hits(outcome.ordinary_impacts, hitbox_radii_,
                                       radii_.ordinary_blast);
    outcome.improved_hits = count_hits(outcome.improved_impacts, hitbox_radii_,
                                       radii_.improved_blast);
    return outcome;
}

SimulationResult FirestormSimulator::run(RandomEngine& rng) const {
    const SizeT trials = static_cast<SizeT>(config_.trials);

    PointCloud grid = sample_coverage_grid(rng);
    TrialAccumulator accumulator(hitbox_radii_.size(), trials);

    SimulationResult result;
    result.radii = radii_;
    result.allocation = allocation_;
    result.trials = trials;

    for (SizeT t = 0; t < trials; ++t) {
        TrialOutcome outcome = run_trial(grid, rng);
        accumulator.record_trial(outcome.ordinary_hits, outcome.improved_hits,
                                 coverage_fraction(outcome.ordinary_coverage),
                                 coverage_fraction(outcome.improved_coverage));

        if (t + 1 == trials) {
            result.snapshot.ordinary_impacts = std::move(outcome.ordinary_impacts);
            result.snapshot.improved_impacts = std::move(outcome.improved_impacts);
            result.snapshot.ordinary_coverage = std::move(outcome.ordinary_coverage);
            result.snapshot.improved_coverage = std::move(outcome.improved_coverage);
        }
    }

    result.statistics = accumulator.reduce(hitbox_radii_);
    result.snapshot.coverage_grid = std::move(grid);
    return result;
}

// ============================================================================
// Free Functions
// ============================================================================

SimulationResult simulate_firestorm(const SimulationConfig& config, RandomEngine& rng) {
    FirestormSimulator simulator(config);
    return simulator.run(rng);
}

SimulationResult simulate_firestorm(const SimulationConfig& config) {
    RandomEngine rng = make_random_engine(config.seed);
    return simulate_firestorm(config, rng);
}

} // namespace firestorm::sim
