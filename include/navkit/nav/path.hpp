/// @file path.hpp
/// @brief Navigation paths and the path-following query for navkit_nav

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <navkit/math/constants.hpp>

#include <optional>
#include <vector>

namespace navkit_nav {

// =============================================================================
// Path Projection
// =============================================================================

/// @brief Location of an arbitrary position relative to a path
struct PathProjection {
    NavVec3 point{0.0};         ///< Closest point on the polyline
    double progress{0};         ///< Arc length from the first point to `point`
    std::size_t segment{0};     ///< Index of the segment containing `point`
    double distance{0};         ///< Distance from the position to `point`
};

// =============================================================================
// NavPath
// =============================================================================

/// @brief Ordered polyline from start to destination, with cached arc lengths
class NavPath {
public:
    NavPath() = default;
    explicit NavPath(std::vector<NavVec3> points, std::vector<std::uint32_t> corridor = {});

    const std::vector<NavVec3>& points() const { return m_points; }
    std::size_t size() const { return m_points.size(); }
    bool empty() const { return m_points.empty(); }
    const NavVec3& front() const { return m_points.front(); }
    const NavVec3& back() const { return m_points.back(); }
    const NavVec3& operator[](std::size_t i) const { return m_points[i]; }

    /// Triangle sequence the path was built through (may be empty)
    const std::vector<std::uint32_t>& corridor() const { return m_corridor; }

    /// Total polyline length
    double length() const { return m_cumulative.empty() ? 0.0 : m_cumulative.back(); }

    /// Arc length at path point i
    double distance_to_point(std::size_t i) const { return m_cumulative[i]; }

    /// Arc length left after `progress`
    double remaining_distance(double progress) const;

    /// Point at arc length `distance`, clamped to the path ends
    NavVec3 point_at(double distance) const;

    /// @brief Project a position onto the path
    /// @param min_progress Only the part of the path at or beyond this arc length is considered
    /// @return nullopt for an empty path
    std::optional<PathProjection> project(const NavVec3& position, double min_progress = 0.0) const;

private:
    std::vector<NavVec3> m_points;
    std::vector<double> m_cumulative;
    std::vector<std::uint32_t> m_corridor;
};

// =============================================================================
// Path Following
// =============================================================================

/// @brief Tuning for advance()
struct AdvanceOptions {
    /// Maximum distance between the position and the path to count as "on" it.
    /// Unbounded unless set: by default any position is projected onto the path.
    double tolerance{navkit_math::consts::d::INFINITY_D};
    /// Last known progress; projection never falls behind it
    double min_progress{0};
    /// Distance under which a position counts as being at the final point
    double arrival_epsilon{navkit_math::consts::d::POINT_EPSILON};
};

/// @brief Result of advancing along a path
struct PathAdvance {
    NavVec3 point{0.0};             ///< Next target point
    double remaining_distance{0};   ///< Travel budget left over after reaching the final point
    double progress{0};             ///< Arc length of `point`
    bool arrived{false};            ///< `point` is the final path point
};

/// @brief Advance along a path by a travel budget
///
/// Locates the position on the path, walks exactly `max_distance` forward
/// across segment boundaries and returns the point reached. When the path
/// ends first, the final point is returned with the unused budget.
///
/// The off-path check only applies when `options.tolerance` is set to a
/// finite distance (NavConfig::path_follow_tolerance for system drivers).
///
/// @return nullopt if `max_distance <= 0`, the path is empty, the position is
///         off the path beyond `options.tolerance`, or the path is exhausted
[[nodiscard]] std::optional<PathAdvance> advance(const NavPath& path,
                                                 const NavVec3& position,
                                                 double max_distance,
                                                 const AdvanceOptions& options = {});

} // namespace navkit_nav
