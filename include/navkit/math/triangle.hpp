#pragma once

/// @file triangle.hpp
/// @brief Triangle, segment and plane geometry for navkit_math
///
/// All functions operate in double precision. Containment and barycentric
/// tests work on the projection of the query point onto the triangle plane,
/// so they behave identically for flat (z = 0) and general 3D meshes.

#include "types.hpp"
#include "vec.hpp"

#include <algorithm>
#include <cmath>

namespace navkit_math {

// =============================================================================
// Triangle Properties
// =============================================================================

/// Unit normal of triangle (a, b, c), counter-clockwise winding; zero if degenerate
[[nodiscard]] inline DVec3 triangle_normal(const DVec3& a, const DVec3& b, const DVec3& c) noexcept {
    return normalize_or_zero(glm::cross(b - a, c - a));
}

/// Area of triangle (a, b, c)
[[nodiscard]] inline double triangle_area(const DVec3& a, const DVec3& b, const DVec3& c) noexcept {
    return glm::length(glm::cross(b - a, c - a)) * 0.5;
}

/// Centroid of triangle (a, b, c)
[[nodiscard]] inline DVec3 triangle_centroid(const DVec3& a, const DVec3& b, const DVec3& c) noexcept {
    return (a + b + c) / 3.0;
}

/// Check whether three points are collinear within a relative tolerance
/// @param tolerance Bound on |e1 x e2| / (|e1| |e2|), i.e. the sine of the corner angle
/// @return true for collinear points and for zero-length edges
[[nodiscard]] inline bool is_degenerate_triangle(const DVec3& a, const DVec3& b, const DVec3& c,
                                                 double tolerance = consts::d::DEGENERATE_TOLERANCE) noexcept {
    const DVec3 e1 = b - a;
    const DVec3 e2 = c - a;
    const double cross_len = glm::length(glm::cross(e1, e2));
    return cross_len <= tolerance * glm::length(e1) * glm::length(e2);
}

/// Orientation of (a, b, c) seen from the side `up` points to
/// @return Positive for counter-clockwise, negative for clockwise, zero when collinear
[[nodiscard]] inline double signed_area(const DVec3& a, const DVec3& b, const DVec3& c,
                                        const DVec3& up) noexcept {
    return glm::dot(glm::cross(b - a, c - a), up);
}

// =============================================================================
// Plane Helpers
// =============================================================================

/// Signed distance of p from the plane through `origin` with unit `normal`
[[nodiscard]] inline double plane_distance(const DVec3& p, const DVec3& origin,
                                           const DVec3& normal) noexcept {
    return glm::dot(p - origin, normal);
}

/// Orthogonal projection of p onto the plane through `origin` with unit `normal`
[[nodiscard]] inline DVec3 project_on_plane(const DVec3& p, const DVec3& origin,
                                            const DVec3& normal) noexcept {
    return p - normal * plane_distance(p, origin, normal);
}

// =============================================================================
// Barycentric Coordinates
// =============================================================================

/// Barycentric weights (u, v, w) of p's projection onto the plane of (a, b, c)
/// such that projection = u*a + v*b + w*c. Returns (-1, -1, -1) if degenerate.
[[nodiscard]] inline DVec3 barycentric(const DVec3& p, const DVec3& a, const DVec3& b,
                                       const DVec3& c) noexcept {
    const DVec3 v0 = b - a;
    const DVec3 v1 = c - a;
    const DVec3 v2 = p - a;
    const double d00 = glm::dot(v0, v0);
    const double d01 = glm::dot(v0, v1);
    const double d11 = glm::dot(v1, v1);
    const double d20 = glm::dot(v2, v0);
    const double d21 = glm::dot(v2, v1);
    const double denom = d00 * d11 - d01 * d01;
    if (std::abs(denom) <= consts::d::EPSILON * d00 * d11) {
        return DVec3(-1.0);
    }
    const double v = (d11 * d20 - d01 * d21) / denom;
    const double w = (d00 * d21 - d01 * d20) / denom;
    return DVec3(1.0 - v - w, v, w);
}

/// Check whether p's projection onto the plane of (a, b, c) lies inside the triangle
[[nodiscard]] inline bool point_in_triangle(const DVec3& p, const DVec3& a, const DVec3& b,
                                            const DVec3& c,
                                            double epsilon = consts::d::BARYCENTRIC_EPSILON) noexcept {
    const DVec3 bary = barycentric(p, a, b, c);
    return bary.x >= -epsilon && bary.y >= -epsilon && bary.z >= -epsilon;
}

// =============================================================================
// Closest Point Queries
// =============================================================================

/// Parameter t in [0, 1] of the point on segment [a, b] closest to p
[[nodiscard]] inline double segment_parameter(const DVec3& p, const DVec3& a, const DVec3& b) noexcept {
    const DVec3 ab = b - a;
    const double len_sq = glm::length2(ab);
    if (len_sq <= 0.0) {
        return 0.0;
    }
    return std::clamp(glm::dot(p - a, ab) / len_sq, 0.0, 1.0);
}

/// Point on segment [a, b] closest to p
[[nodiscard]] inline DVec3 closest_point_on_segment(const DVec3& p, const DVec3& a,
                                                    const DVec3& b) noexcept {
    return a + (b - a) * segment_parameter(p, a, b);
}

/// Point of triangle (a, b, c), interior or boundary, closest to p
///
/// Voronoi-region walk: vertex regions first, then edge regions, then the face.
[[nodiscard]] inline DVec3 closest_point_on_triangle(const DVec3& p, const DVec3& a,
                                                     const DVec3& b, const DVec3& c) noexcept {
    const DVec3 ab = b - a;
    const DVec3 ac = c - a;
    const DVec3 ap = p - a;
    const double d1 = glm::dot(ab, ap);
    const double d2 = glm::dot(ac, ap);
    if (d1 <= 0.0 && d2 <= 0.0) {
        return a;
    }

    const DVec3 bp = p - b;
    const double d3 = glm::dot(ab, bp);
    const double d4 = glm::dot(ac, bp);
    if (d3 >= 0.0 && d4 <= d3) {
        return b;
    }

    const double vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0 && d1 >= 0.0 && d3 <= 0.0) {
        const double v = d1 / (d1 - d3);
        return a + ab * v;
    }

    const DVec3 cp = p - c;
    const double d5 = glm::dot(ab, cp);
    const double d6 = glm::dot(ac, cp);
    if (d6 >= 0.0 && d5 <= d6) {
        return c;
    }

    const double vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0 && d2 >= 0.0 && d6 <= 0.0) {
        const double w = d2 / (d2 - d6);
        return a + ac * w;
    }

    const double va = d3 * d6 - d5 * d4;
    if (va <= 0.0 && (d4 - d3) >= 0.0 && (d5 - d6) >= 0.0) {
        const double w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
        return b + (c - b) * w;
    }

    const double denom = 1.0 / (va + vb + vc);
    const double v = vb * denom;
    const double w = vc * denom;
    return a + ab * v + ac * w;
}

} // namespace navkit_math
