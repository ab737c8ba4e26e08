#pragma once
/**
 * @file coverage.h
 * @brief Per-trial blast coverage and hitbox hit counting
 */

#include "firestorm/core/types.h"
#include <vector>

namespace firestorm::sim {

/**
 * @brief Mark grid points lying within @p blast_radius of any impact
 *
 * With no impacts every entry is false.
 */
CoverageMask compute_coverage_mask(const PointCloud& grid,
                                   const PointCloud& impacts,
                                   Real blast_radius);

/**
 * @brief Fraction of true entries; 0 for an empty mask
 */
Real coverage_fraction(const CoverageMask& mask) noexcept;

/**
 * @brief Count impacts whose blast overlaps each hitbox
 *
 * A hitbox of radius h centred on the storm is hit by an impact when the
 * impact lies within h + blast_radius of the origin, i.e. when the blast
 * disk and the hitbox disk intersect.
 *
 * @return One count per entry of @p hitbox_radii, in the same order
 */
std::vector<Int64> count_hits(const PointCloud& impacts,
                              const std::vector<Real>& hitbox_radii,
                              Real blast_radius);

} // namespace firestorm::sim
