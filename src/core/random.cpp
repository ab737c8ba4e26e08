/**
 * @file random.cpp
 * @brief Random engine construction
 */

#include "firestorm/core/random.h"
#include "firestorm/core/constants.h"

namespace firestorm {

RandomEngine make_random_engine(UInt64 seed) {
    RandomEngine rng;
    if (seed != constants::RANDOM_SEED) {
        rng.seed(seed);
    } else {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        rng.seed(seq);
    }
    return rng;
}

} // namespace firestorm
