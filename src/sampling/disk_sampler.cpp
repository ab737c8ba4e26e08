/**
 * @file disk_sampler.cpp
 * @brief Area-uniform disk sampling implementation
 */

#include "firestorm/sampling/disk_sampler.h"
#include "firestorm/core/error.h"
#include <cmath>
#include <random>
#include <string>

namespace firestorm::sampling {

PointCloud sample_disk(SizeT count, Real radius, RandomEngine& rng) {
    if (!(radius > 0.0)) {
        throw InputValidationError(StormResult::NonPositiveRadius,
                                   "Disk radius must be positive, got " + std::to_string(radius));
    }

    std::uniform_real_distribution<Real> unit(0.0, 1.0);

    std::vector<Real> theta(count);
    for (auto& t : theta) {
        t = unit(rng) * constants::TWO_PI;
    }

    PointCloud points;
    points.reserve(count);
    for (SizeT i = 0; i < count; ++i) {
        Real r = std::sqrt(unit(rng)) * radius;
        points.push_back({r * std::cos(theta[i]), r * std::sin(theta[i])});
    }
    return points;
}

std::vector<Real> radial_distances(const PointCloud& points) {
    std::vector<Real> distances;
    distances.reserve(points.size());
    for (SizeT i = 0; i < points.size(); ++i) {
        distances.push_back(points[i].length());
    }
    return distances;
}

Real disk_radius_cdf(Real r, Real radius) noexcept {
    if (r <= 0.0) return 0.0;
    if (r >= radius) return 1.0;
    Real ratio = r / radius;
    return ratio * ratio;
}

} // namespace firestorm::sampling
