#pragma once

/// @file constants.hpp
/// @brief Tolerances and limits for navkit_math

#include <limits>

namespace navkit_math {

namespace consts {

namespace d {

/// Relative tolerance for near-zero determinants
inline constexpr double EPSILON = 1e-10;

/// Tolerance for point coincidence in world units
inline constexpr double POINT_EPSILON = 1e-6;

/// Relative tolerance on |e1 x e2| / (|e1| |e2|) below which a triangle is degenerate
inline constexpr double DEGENERATE_TOLERANCE = 1e-9;

/// Tolerance on barycentric coordinates for containment tests
inline constexpr double BARYCENTRIC_EPSILON = 1e-9;

inline constexpr double INFINITY_D = std::numeric_limits<double>::infinity();

} // namespace d

} // namespace consts

} // namespace navkit_math
