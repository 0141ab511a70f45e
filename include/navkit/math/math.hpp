#pragma once

/// @file math.hpp
/// @brief Main include file for navkit_math
///
/// @code
/// #include <navkit/math/math.hpp>
/// using namespace navkit_math;
///
/// DVec3 c = triangle_centroid(a, b, c);
/// DVec3 p = closest_point_on_triangle(query, a, b, c);
/// @endcode

// Core type definitions and GLM integration
#include "types.hpp"

// Mathematical constants
#include "constants.hpp"

// Vector utilities
#include "vec.hpp"

// Triangle, segment and plane geometry
#include "triangle.hpp"
