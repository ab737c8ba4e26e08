#pragma once
/**
 * @file disk_sampler.h
 * @brief Area-uniform random sampling inside a disk
 *
 * Points are drawn with theta ~ U(0, 2pi) and r = R * sqrt(U(0, 1)). The
 * square root keeps the density uniform per unit area; drawing r uniformly
 * in [0, R] would crowd samples toward the centre.
 */

#include "firestorm/core/types.h"
#include "firestorm/core/random.h"
#include <vector>

namespace firestorm::sampling {

/**
 * @brief Draw points uniformly over the disk of radius @p radius at the origin
 *
 * All @p count angles are drawn first, then all @p count radial fractions,
 * so the consumption order of @p rng is fixed for a given count.
 *
 * @param count Number of points (0 yields an empty cloud)
 * @param radius Disk radius, must be positive
 * @param rng Random engine
 * @throws InputValidationError if @p radius is not positive
 */
PointCloud sample_disk(SizeT count, Real radius, RandomEngine& rng);

/**
 * @brief Distance of every point from the origin
 */
std::vector<Real> radial_distances(const PointCloud& points);

/**
 * @brief Cumulative distribution of the distance of an area-uniform point
 *        from the centre of a disk: F(r) = r^2 / R^2, clamped to [0, 1]
 */
Real disk_radius_cdf(Real r, Real radius) noexcept;

} // namespace firestorm::sampling
