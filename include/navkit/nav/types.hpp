/// @file types.hpp
/// @brief Common types for navkit_nav module

#pragma once

#include "fwd.hpp"
#include <navkit/math/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace navkit_nav {

/// @brief Navigation point type; 2D meshes use z = 0
using NavVec3 = navkit_math::DVec3;

// =============================================================================
// Query Modes
// =============================================================================

/// @brief Quality tier for snapping an arbitrary point onto the mesh
enum class NavQuery : std::uint8_t {
    Closest,    ///< Cheap plane projection, may land outside the mesh for far points
    Accuracy    ///< True closest in-mesh point
};

/// @brief Quality tier for path shape
enum class NavPathMode : std::uint8_t {
    Fast,       ///< Shared-edge midpoints
    Accuracy    ///< Funnel-tightened shortest path in the corridor
};

[[nodiscard]] inline const char* nav_query_name(NavQuery query) {
    switch (query) {
        case NavQuery::Closest: return "closest";
        case NavQuery::Accuracy: return "accuracy";
        default: return "unknown";
    }
}

[[nodiscard]] inline const char* nav_path_mode_name(NavPathMode mode) {
    switch (mode) {
        case NavPathMode::Fast: return "fast";
        case NavPathMode::Accuracy: return "accuracy";
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<NavQuery> parse_nav_query(std::string_view name) {
    if (name == "closest") return NavQuery::Closest;
    if (name == "accuracy") return NavQuery::Accuracy;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<NavPathMode> parse_nav_path_mode(std::string_view name) {
    if (name == "fast") return NavPathMode::Fast;
    if (name == "accuracy") return NavPathMode::Accuracy;
    return std::nullopt;
}

// =============================================================================
// Mesh Types
// =============================================================================

/// @brief Triangle as three indices into the vertex buffer
struct NavTriangle {
    std::uint32_t first{0};
    std::uint32_t second{0};
    std::uint32_t third{0};

    NavTriangle() = default;
    NavTriangle(std::uint32_t a, std::uint32_t b, std::uint32_t c)
        : first(a), second(b), third(c) {}

    [[nodiscard]] std::uint32_t operator[](std::size_t i) const {
        return i == 0 ? first : (i == 1 ? second : third);
    }

    [[nodiscard]] bool contains(std::uint32_t vertex) const {
        return first == vertex || second == vertex || third == vertex;
    }

    bool operator==(const NavTriangle&) const = default;
};

/// @brief A point on the mesh and the triangle that owns it
struct NavPoint {
    NavVec3 point{0.0};
    std::uint32_t triangle{0};
};

} // namespace navkit_nav
