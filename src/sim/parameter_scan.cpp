/**
 * @file parameter_scan.cpp
 * @brief Parameter sweep implementation
 */

#include "firestorm/sim/parameter_scan.h"
#include "firestorm/sim/simulator.h"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace firestorm::sim {

std::optional<ScanVariable> parse_scan_variable(const std::string& key) {
    if (key == "ignites") return ScanVariable::Ignites;
    if (key == "area_modifier" || key == "area") return ScanVariable::AreaModifierPercent;
    if (key == "duration") return ScanVariable::Duration;
    return std::nullopt;
}

std::pair<Real, Real> scan_range(ScanVariable variable) {
    switch (variable) {
        case ScanVariable::Ignites:
            return {constants::SCAN_IGNITES_MIN, constants::SCAN_IGNITES_MAX};
        case ScanVariable::AreaModifierPercent:
            return {constants::SCAN_AREA_PERCENT_MIN, constants::SCAN_AREA_PERCENT_MAX};
        case ScanVariable::Duration:
            return {constants::SCAN_DURATION_MIN, constants::SCAN_DURATION_MAX};
    }
    throw InternalInvariantViolation("Unhandled scan variable");
}

std::vector<Real> linspace(Real start, Real stop, SizeT steps) {
    std::vector<Real> values;
    values.reserve(steps);
    if (steps == 0) {
        return values;
    }
    if (steps == 1) {
        values.push_back(start);
        return values;
    }
    Real step = (stop - start) / static_cast<Real>(steps - 1);
    for (SizeT i = 0; i < steps; ++i) {
        values.push_back(start + step * static_cast<Real>(i));
    }
    values.back() = stop;
    return values;
}

SimulationConfig apply_scan_value(const SimulationConfig& base, ScanVariable variable, Real value) {
    SimulationConfig config = base;
    switch (variable) {
        case ScanVariable::Ignites:
            config.ignites = static_cast<Int64>(std::trunc(value));
            break;
        case ScanVariable::AreaModifierPercent:
            config.area_modifier = value / 100.0;
            break;
        case ScanVariable::Duration:
            config.duration = value;
            break;
    }
    return config;
}

ScanResult run_parameter_scan(const SimulationConfig& base,
                              const ScanSettings& settings,
                              RandomEngine& rng) {
    if (settings.steps == 0 || settings.steps > constants::MAX_SCAN_STEPS) {
        throw InputValidationError(StormResult::InvalidConfiguration,
                                   "Parameter scan needs 1 to " +
                                   std::to_string(constants::MAX_SCAN_STEPS) + " steps, got " +
                                   std::to_string(settings.steps));
    }
    throw_on_failure(validate_config(base), "Invalid scan base configuration");

    ScanResult result;
    result.variable = settings.variable;
    result.hitbox_radius = base.hitbox_radii.front();

    SimulationConfig single = base;
    single.hitbox_radii = {result.hitbox_radius};

    auto [lo, hi] = scan_range(settings.variable);
    for (Real value : linspace(lo, hi, settings.steps)) {
        SimulationConfig config = apply_scan_value(single, settings.variable, value);
        SimulationResult run = simulate_firestorm(config, rng);

        const HitboxStatistics& stats = run.statistics.hitboxes.front();
        ScanPoint point;
        point.value = value;
        point.ordinary = stats.ordinary;
        point.improved = stats.improved;
        result.points.push_back(point);
    }
    return result;
}

std::string format_scan_csv(const ScanResult& result) {
    std::ostringstream out;
    out << "value,Ord_mean,Ord_err,Imp_mean,Imp_err\n";
    out << std::fixed << std::setprecision(3);
    for (const auto& p : result.points) {
        out << p.value << ','
            << p.ordinary.mean << ',' << p.ordinary.sem << ','
            << p.improved.mean << ',' << p.improved.sem << '\n';
    }
    return out.str();
}

} // namespace firestorm::sim
