#pragma once
/**
 * @file types.h
 * @brief Core type definitions for FirestormSim
 *
 * This file defines fundamental types used throughout the library,
 * including numeric types, planar points and coordinate arrays.
 */

#include <cstdint>
#include <cstddef>
#include <limits>
#include <vector>

namespace firestorm {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for geometry and statistics
 */
using Real = double;

// Integer types
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Planar Geometry
// ============================================================================

/**
 * @brief 2D point in the storm plane (storm centre at the origin)
 */
struct Vec2 {
    Real x{0.0};
    Real y{0.0};

    constexpr Vec2() noexcept = default;
    constexpr Vec2(Real x_, Real y_) noexcept : x(x_), y(y_) {}

    constexpr Vec2 operator-(const Vec2& other) const noexcept {
        return {x - other.x, y - other.y};
    }

    // Magnitude squared (avoid sqrt when possible)
    constexpr Real length_squared() const noexcept {
        return x*x + y*y;
    }

    // Length (magnitude) - requires hypot, defined in cpp
    Real length() const noexcept;
};

/**
 * @brief Set of planar points stored as two parallel coordinate arrays
 *
 * Impact positions and the coverage integration grid both use this layout,
 * which keeps the x and y columns contiguous for the distance loops.
 */
struct PointCloud {
    std::vector<Real> x;
    std::vector<Real> y;

    SizeT size() const noexcept { return x.size(); }
    bool empty() const noexcept { return x.empty(); }

    void reserve(SizeT n) {
        x.reserve(n);
        y.reserve(n);
    }

    void push_back(const Vec2& p) {
        x.push_back(p.x);
        y.push_back(p.y);
    }

    Vec2 operator[](SizeT i) const noexcept { return {x[i], y[i]}; }
};

/**
 * @brief Boolean mask over the points of a PointCloud
 */
using CoverageMask = std::vector<bool>;

namespace math {

/**
 * @brief Euclidean distance between two points
 */
Real distance(const Vec2& a, const Vec2& b);

} // namespace math

// ============================================================================
// Mathematical Constants
// ============================================================================

namespace constants {

/// Pi
constexpr Real PI = 3.14159265358979323846;

/// Full turn in radians
constexpr Real TWO_PI = 2.0 * PI;

} // namespace constants

} // namespace firestorm
