/**
 * @file vector.cpp
 * @brief Planar vector math implementation
 */

#include "firestorm/core/types.h"
#include <cmath>

namespace firestorm {

// ============================================================================
// Vec2 Member Function Implementations
// ============================================================================

Real Vec2::length() const noexcept {
    return std::hypot(x, y);
}

// ============================================================================
// Free Function Utilities
// ============================================================================

namespace math {

Real distance(const Vec2& a, const Vec2& b) {
    return (a - b).length();
}

} // namespace math

} // namespace firestorm
