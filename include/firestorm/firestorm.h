#pragma once
/**
 * @file firestorm.h
 * @brief Main include file for FirestormSim
 *
 * FirestormSim - Monte Carlo estimation of bombardment hits and area coverage
 *
 * Include this single header to access all public FirestormSim APIs.
 */

#include "firestorm/core/types.h"
#include "firestorm/core/constants.h"
#include "firestorm/core/error.h"
#include "firestorm/core/random.h"

#include "firestorm/sampling/disk_sampler.h"

#include "firestorm/sim/storm_config.h"
#include "firestorm/sim/statistics.h"
#include "firestorm/sim/coverage.h"
#include "firestorm/sim/simulator.h"
#include "firestorm/sim/parameter_scan.h"

#include "firestorm/interface/input_parser.h"
#include "firestorm/interface/config.h"

/**
 * @namespace firestorm
 * @brief Root namespace for all FirestormSim components
 */
namespace firestorm {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace firestorm
