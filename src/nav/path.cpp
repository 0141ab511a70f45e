/// @file path.cpp
/// @brief NavPath and advance() implementation for navkit_nav

#include <navkit/nav/path.hpp>
#include <navkit/math/math.hpp>

#include <algorithm>
#include <cmath>

namespace navkit_nav {

// =============================================================================
// NavPath
// =============================================================================

NavPath::NavPath(std::vector<NavVec3> points, std::vector<std::uint32_t> corridor)
    : m_points(std::move(points))
    , m_corridor(std::move(corridor)) {
    m_cumulative.reserve(m_points.size());
    double total = 0;
    for (std::size_t i = 0; i < m_points.size(); ++i) {
        if (i > 0) {
            total += glm::distance(m_points[i - 1], m_points[i]);
        }
        m_cumulative.push_back(total);
    }
}

double NavPath::remaining_distance(double progress) const {
    return std::max(0.0, length() - progress);
}

NavVec3 NavPath::point_at(double distance) const {
    if (m_points.empty()) {
        return NavVec3{0.0};
    }
    if (distance <= 0.0) {
        return m_points.front();
    }
    if (distance >= length()) {
        return m_points.back();
    }

    // First point whose arc length reaches the distance ends the segment
    const auto it = std::lower_bound(m_cumulative.begin(), m_cumulative.end(), distance);
    const auto end = static_cast<std::size_t>(std::distance(m_cumulative.begin(), it));
    const std::size_t start = end - 1;

    const double segment_length = m_cumulative[end] - m_cumulative[start];
    if (segment_length <= 0.0) {
        return m_points[end];
    }
    const double t = (distance - m_cumulative[start]) / segment_length;
    return navkit_math::lerp(m_points[start], m_points[end], t);
}

std::optional<PathProjection> NavPath::project(const NavVec3& position, double min_progress) const {
    if (m_points.empty()) {
        return std::nullopt;
    }

    const double floor = std::clamp(min_progress, 0.0, length());

    if (m_points.size() == 1) {
        return PathProjection{m_points.front(), 0.0, 0, glm::distance(position, m_points.front())};
    }

    std::optional<PathProjection> best;
    for (std::size_t i = 0; i + 1 < m_points.size(); ++i) {
        const double seg_start = m_cumulative[i];
        const double seg_end = m_cumulative[i + 1];
        if (seg_end < floor) {
            continue;
        }

        const double seg_length = seg_end - seg_start;
        double t = navkit_math::segment_parameter(position, m_points[i], m_points[i + 1]);
        if (seg_length > 0.0 && seg_start + t * seg_length < floor) {
            t = (floor - seg_start) / seg_length;
        }

        const NavVec3 point = navkit_math::lerp(m_points[i], m_points[i + 1], t);
        const double dist = glm::distance(position, point);

        // Strict comparison keeps the earliest segment on ties
        if (!best || dist < best->distance) {
            best = PathProjection{point, seg_start + t * seg_length, i, dist};
        }
    }
    return best;
}

// =============================================================================
// advance
// =============================================================================

std::optional<PathAdvance> advance(const NavPath& path,
                                   const NavVec3& position,
                                   double max_distance,
                                   const AdvanceOptions& options) {
    if (!(max_distance > 0.0) || path.empty()) {
        return std::nullopt;
    }

    const auto projection = path.project(position, options.min_progress);
    if (!projection || projection->distance > options.tolerance) {
        return std::nullopt;
    }

    const double total = path.length();
    const bool at_end = projection->progress >= total - options.arrival_epsilon;
    if (at_end && glm::distance(position, path.back()) <= options.arrival_epsilon) {
        return std::nullopt;
    }

    const double target = std::max(projection->progress, 0.0) + max_distance;
    if (target >= total) {
        return PathAdvance{path.back(), target - total, total, true};
    }
    return PathAdvance{path.point_at(target), 0.0, target, false};
}

} // namespace navkit_nav
