#pragma once

/// @file vec.hpp
/// @brief DVec3 helpers not provided by GLM

#include "types.hpp"
#include <cmath>

namespace navkit_math {

[[nodiscard]] inline double length(const DVec3& v) noexcept {
    return glm::length(v);
}

/// a at t = 0, b at t = 1
[[nodiscard]] inline DVec3 lerp(const DVec3& a, const DVec3& b, double t) noexcept {
    return a + (b - a) * t;
}

/// Unit vector, or zero for vectors shorter than EPSILON
[[nodiscard]] inline DVec3 normalize_or_zero(const DVec3& v) noexcept {
    const double len_sq = glm::length2(v);
    if (len_sq < consts::d::EPSILON * consts::d::EPSILON) {
        return dvec3::ZERO;
    }
    return v / std::sqrt(len_sq);
}

/// False if any component is NaN or infinite
[[nodiscard]] inline bool is_finite(const DVec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace navkit_math
