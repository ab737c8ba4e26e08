/**
 * @file coverage.cpp
 * @brief Coverage mask and hit count implementation
 */

#include "firestorm/sim/coverage.h"
#include "firestorm/sampling/disk_sampler.h"
#include <algorithm>

namespace firestorm::sim {

CoverageMask compute_coverage_mask(const PointCloud& grid,
                                   const PointCloud& impacts,
                                   Real blast_radius) {
    CoverageMask mask(grid.size(), false);
    if (impacts.empty()) {
        return mask;
    }

    for (SizeT i = 0; i < grid.size(); ++i) {
        Vec2 p = grid[i];
        for (SizeT j = 0; j < impacts.size(); ++j) {
            if (math::distance(p, impacts[j]) <= blast_radius) {
                mask[i] = true;
                break;
            }
        }
    }
    return mask;
}

Real coverage_fraction(const CoverageMask& mask) noexcept {
    if (mask.empty()) {
        return 0.0;
    }
    auto covered = std::count(mask.begin(), mask.end(), true);
    return static_cast<Real>(covered) / static_cast<Real>(mask.size());
}

std::vector<Int64> count_hits(const PointCloud& impacts,
                              const std::vector<Real>& hitbox_radii,
                              Real blast_radius) {
    std::vector<Real> distances = sampling::radial_distances(impacts);

    std::vector<Int64> hits;
    hits.reserve(hitbox_radii.size());
    for (Real h : hitbox_radii) {
        Real threshold = h + blast_radius;
        hits.push_back(static_cast<Int64>(
            std::count_if(distances.begin(), distances.end(),
                          [threshold](Real d) { return d <= threshold; })));
    }
    return hits;
}

} // namespace firestorm::sim
