#pragma once

/// @file types.hpp
/// @brief Core type definitions for navkit_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"
#include "constants.hpp"

namespace navkit_math {

namespace dvec3 {
    inline constexpr DVec3 ZERO = DVec3(0.0, 0.0, 0.0);
    inline constexpr DVec3 Z    = DVec3(0.0, 0.0, 1.0);
}

// =============================================================================
// Axis-Aligned Bounding Box (double precision)
// =============================================================================

/// Axis-aligned bounding box
struct DAabb {
    DVec3 min{0.0};
    DVec3 max{0.0};

    DAabb() = default;
    DAabb(const DVec3& min_, const DVec3& max_) : min(min_), max(max_) {}

    /// Box enclosing three points
    [[nodiscard]] static DAabb from_points(const DVec3& a, const DVec3& b, const DVec3& c) noexcept {
        return DAabb(glm::min(a, glm::min(b, c)), glm::max(a, glm::max(b, c)));
    }

    /// Grow to include a point
    void expand(const DVec3& p) noexcept {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    /// Squared distance from a point to the box (zero inside)
    [[nodiscard]] double distance_squared(const DVec3& p) const noexcept {
        const DVec3 clamped = glm::clamp(p, min, max);
        return glm::length2(p - clamped);
    }

    [[nodiscard]] bool contains(const DVec3& p) const noexcept {
        return glm::all(glm::greaterThanEqual(p, min)) && glm::all(glm::lessThanEqual(p, max));
    }
};

} // namespace navkit_math
