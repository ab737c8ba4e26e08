#pragma once
/**
 * @file parameter_scan.h
 * @brief One-dimensional parameter sweeps over the firestorm engine
 *
 * A scan varies one control input over a fixed range, runs a complete
 * simulation at each point with only the first hitbox radius, and keeps the
 * hit mean and SEM of both projectile classes.
 */

#include "firestorm/core/types.h"
#include "firestorm/core/constants.h"
#include "firestorm/core/random.h"
#include "firestorm/sim/storm_config.h"
#include "firestorm/sim/statistics.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace firestorm::sim {

// ============================================================================
// Scan Variable Enum
// ============================================================================

/**
 * @brief Control input swept by a scan
 */
enum class ScanVariable : UInt8 {
    Ignites,              ///< Ignites consumed, 0 to 12 (truncated to integers)
    AreaModifierPercent,  ///< Area modifier, -90% to +100%
    Duration              ///< Storm duration, 1 s to 12 s
};

/**
 * @brief Convert ScanVariable to its display label
 */
inline const char* scan_variable_to_string(ScanVariable variable) {
    switch (variable) {
        case ScanVariable::Ignites: return "Ignites consumed";
        case ScanVariable::AreaModifierPercent: return "Area mod (%)";
        case ScanVariable::Duration: return "Duration (s)";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a scan variable key ("ignites", "area_modifier", "duration")
 */
std::optional<ScanVariable> parse_scan_variable(const std::string& key);

// ============================================================================
// Scan Settings and Results
// ============================================================================

/**
 * @brief Scan request
 */
struct ScanSettings {
    ScanVariable variable{ScanVariable::Ignites};
    SizeT steps{constants::DEFAULT_SCAN_STEPS};
};

/**
 * @brief Statistics at one scan point
 */
struct ScanPoint {
    Real value{0.0};  // scanned value in display units (percent for area)
    MeanSem ordinary;
    MeanSem improved;
};

/**
 * @brief Complete scan output
 */
struct ScanResult {
    ScanVariable variable{ScanVariable::Ignites};
    Real hitbox_radius{0.0};
    std::vector<ScanPoint> points;
};

/**
 * @brief Inclusive range [min, max] scanned for a variable
 */
std::pair<Real, Real> scan_range(ScanVariable variable);

/**
 * @brief @p steps evenly spaced values from @p start to @p stop inclusive
 *
 * One step yields {start}; zero steps yield an empty vector.
 */
std::vector<Real> linspace(Real start, Real stop, SizeT steps);

/**
 * @brief Copy of @p base with the scanned variable set to @p value
 *
 * Ignite values are truncated toward zero; area values are percentages.
 */
SimulationConfig apply_scan_value(const SimulationConfig& base, ScanVariable variable, Real value);

/**
 * @brief Run a scan
 *
 * Every point runs with the first radius of base.hitbox_radii only. All
 * points share @p rng, drawing sequentially.
 *
 * @throws InputValidationError if settings.steps is zero or @p base is invalid
 * @throws DegenerateConfigurationError if a scan point is degenerate
 */
ScanResult run_parameter_scan(const SimulationConfig& base,
                              const ScanSettings& settings,
                              RandomEngine& rng);

/**
 * @brief Format a scan as CSV: value,Ord_mean,Ord_err,Imp_mean,Imp_err
 */
std::string format_scan_csv(const ScanResult& result);

} // namespace firestorm::sim
