#pragma once
/**
 * @file random.h
 * @brief Explicit random engine used by the samplers and the trial engine
 *
 * Every sampling routine takes the engine by reference. Nothing in the
 * library holds a hidden global generator, so two runs seeded alike draw
 * identical sequences.
 */

#include "firestorm/core/types.h"
#include <random>

namespace firestorm {

/// Random engine threaded through all sampling code
using RandomEngine = std::mt19937_64;

/**
 * @brief Create a random engine
 *
 * @param seed Fixed seed, or constants::RANDOM_SEED (0) to seed from
 *             std::random_device
 */
RandomEngine make_random_engine(UInt64 seed);

} // namespace firestorm
