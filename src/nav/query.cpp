/// @file query.cpp
/// @brief A* corridor search and path construction for navkit_nav

#include <navkit/nav/query.hpp>
#include <navkit/nav/navmesh.hpp>
#include <navkit/math/math.hpp>

#include <algorithm>
#include <functional>
#include <string>

namespace navkit_nav {

using navkit_core::NavError;
using navkit_core::Result;

namespace {

constexpr double POINT_EPSILON = navkit_math::consts::d::POINT_EPSILON;

bool same_point(const NavVec3& a, const NavVec3& b) {
    return glm::distance2(a, b) <= POINT_EPSILON * POINT_EPSILON;
}

std::string describe(const NavVec3& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ", " + std::to_string(p.z) + ")";
}

} // anonymous namespace

void remove_consecutive_duplicates(std::vector<NavVec3>& points, double epsilon) {
    if (points.size() < 2) {
        return;
    }
    const double eps_sq = epsilon * epsilon;
    auto last = std::unique(points.begin(), points.end(), [eps_sq](const NavVec3& a, const NavVec3& b) {
        return glm::distance2(a, b) <= eps_sq;
    });
    points.erase(last, points.end());
}

// =============================================================================
// PathSearch
// =============================================================================

Result<void, NavError> PathSearch::init(const NavMesh& mesh,
                                        const NavVec3& start,
                                        const NavVec3& destination,
                                        NavQuery query,
                                        NavPathMode mode) {
    reset();
    m_mesh = &mesh;
    m_mode = mode;

    const auto snapped_start = mesh.closest_point(start, query);
    if (!snapped_start) {
        fail(NavError::point_outside_mesh("start " + describe(start)));
        return m_error;
    }

    const auto snapped_destination = mesh.closest_point(destination, query);
    if (!snapped_destination) {
        fail(NavError::point_outside_mesh("destination " + describe(destination)));
        return m_error;
    }

    init(mesh, *snapped_start, *snapped_destination, mode);
    return Result<void, NavError>();
}

void PathSearch::init(const NavMesh& mesh, const NavPoint& start, const NavPoint& destination,
                      NavPathMode mode) {
    reset();
    m_mesh = &mesh;
    m_mode = mode;
    m_start = start;
    m_destination = destination;

    if (start.triangle >= mesh.triangle_count() || destination.triangle >= mesh.triangle_count()) {
        fail(NavError::point_outside_mesh("triangle index out of range"));
        return;
    }

    if (start.triangle == destination.triangle) {
        m_corridor.push_back(start.triangle);
        m_status = PathSearchStatus::Succeeded;
        return;
    }

    if (!mesh.same_island(start.triangle, destination.triangle)) {
        fail(NavError::no_path(start.triangle, destination.triangle));
        return;
    }

    const std::size_t count = mesh.triangle_count();
    m_g_score.assign(count, navkit_math::consts::d::INFINITY_D);
    m_came_from.assign(count, NO_TRIANGLE);
    m_closed.assign(count, false);

    m_g_score[start.triangle] = 0.0;
    const double h = glm::distance(mesh.centroid(start.triangle), mesh.centroid(destination.triangle));
    m_open.push_back(OpenNode{h, start.triangle});
    m_status = PathSearchStatus::InProgress;
}

PathSearchStatus PathSearch::update(std::size_t max_iterations) {
    if (m_status != PathSearchStatus::InProgress) {
        return m_status;
    }

    const NavVec3& goal_center = m_mesh->centroid(m_destination.triangle);

    for (std::size_t step = 0; step < max_iterations; ++step) {
        if (m_open.empty()) {
            fail(NavError::no_path(m_start.triangle, m_destination.triangle));
            return m_status;
        }

        std::pop_heap(m_open.begin(), m_open.end(), std::greater<OpenNode>{});
        const OpenNode current = m_open.back();
        m_open.pop_back();

        if (m_closed[current.triangle]) {
            continue;  // stale entry
        }
        m_closed[current.triangle] = true;
        ++m_iterations;

        if (current.triangle == m_destination.triangle) {
            reconstruct_corridor();
            m_status = PathSearchStatus::Succeeded;
            return m_status;
        }

        const NavVec3& center = m_mesh->centroid(current.triangle);
        for (std::uint32_t neighbor : m_mesh->neighbors(current.triangle)) {
            if (m_closed[neighbor]) {
                continue;
            }

            const NavVec3& neighbor_center = m_mesh->centroid(neighbor);
            const double tentative_g = m_g_score[current.triangle] + glm::distance(center, neighbor_center);
            if (tentative_g < m_g_score[neighbor]) {
                m_g_score[neighbor] = tentative_g;
                m_came_from[neighbor] = current.triangle;

                const double f = tentative_g + glm::distance(neighbor_center, goal_center);
                m_open.push_back(OpenNode{f, neighbor});
                std::push_heap(m_open.begin(), m_open.end(), std::greater<OpenNode>{});
            }
        }
    }

    return m_status;
}

Result<NavPath, NavError> PathSearch::finish() {
    while (m_status == PathSearchStatus::InProgress) {
        update(std::numeric_limits<std::size_t>::max());
    }

    if (m_status != PathSearchStatus::Succeeded) {
        return m_error;
    }

    const NavVec3& start = m_start.point;
    const NavVec3& end = m_destination.point;

    if (m_corridor.size() == 1) {
        std::vector<NavVec3> points{start};
        if (!same_point(start, end)) {
            points.push_back(end);
        }
        return NavPath(std::move(points), m_corridor);
    }

    NavMeshQuery query(*m_mesh);
    std::vector<NavVec3> points = m_mode == NavPathMode::Accuracy
        ? query.funnel_path(m_corridor, start, end)
        : query.midpoint_path(m_corridor, start, end);
    return NavPath(std::move(points), m_corridor);
}

void PathSearch::reset() {
    m_mesh = nullptr;
    m_start = NavPoint{};
    m_destination = NavPoint{};
    m_open.clear();
    m_g_score.clear();
    m_came_from.clear();
    m_closed.clear();
    m_corridor.clear();
    m_status = PathSearchStatus::Idle;
    m_iterations = 0;
    m_error = NavError{NavError::Kind::PointOutsideMesh, "Path search not initialized", 0};
}

void PathSearch::fail(NavError error) {
    m_error = std::move(error);
    m_status = PathSearchStatus::Failed;
    m_open.clear();
}

void PathSearch::reconstruct_corridor() {
    m_corridor.clear();
    for (std::uint32_t t = m_destination.triangle; t != NO_TRIANGLE; t = m_came_from[t]) {
        m_corridor.push_back(t);
        if (t == m_start.triangle) {
            break;
        }
    }
    std::reverse(m_corridor.begin(), m_corridor.end());
}

// =============================================================================
// NavMeshQuery
// =============================================================================

Result<NavPath, NavError> NavMeshQuery::find_path(const NavVec3& start,
                                                  const NavVec3& destination,
                                                  NavQuery query,
                                                  NavPathMode mode) const {
    PathSearch search;
    auto seeded = search.init(*m_mesh, start, destination, query, mode);
    if (!seeded) {
        return seeded.error();
    }
    return search.finish();
}

Result<std::vector<std::uint32_t>, NavError> NavMeshQuery::find_triangle_path(std::uint32_t from,
                                                                             std::uint32_t to) const {
    if (from >= m_mesh->triangle_count() || to >= m_mesh->triangle_count()) {
        return NavError::point_outside_mesh("triangle " + std::to_string(std::max(from, to)) +
                                            " out of range");
    }

    PathSearch search;
    search.init(*m_mesh, NavPoint{m_mesh->centroid(from), from}, NavPoint{m_mesh->centroid(to), to},
                NavPathMode::Fast);
    auto path = search.finish();
    if (!path) {
        return path.error();
    }
    return search.corridor();
}

std::vector<Portal> NavMeshQuery::portals(const std::vector<std::uint32_t>& corridor,
                                          const NavVec3& start,
                                          const NavVec3& end) const {
    std::vector<Portal> result;
    result.reserve(corridor.size() + 1);
    result.push_back(Portal{start, start});

    const NavVec3& up = m_mesh->up();
    for (std::size_t i = 0; i + 1 < corridor.size(); ++i) {
        const auto edge = m_mesh->shared_edge(corridor[i], corridor[i + 1]);
        if (!edge) {
            continue;
        }

        const NavVec3& p = m_mesh->vertices()[edge->first];
        const NavVec3& q = m_mesh->vertices()[edge->second];

        // Seen from inside the current triangle, left is counter-clockwise of right
        const NavVec3& center = m_mesh->centroid(corridor[i]);
        if (navkit_math::signed_area(center, p, q, up) > 0.0) {
            result.push_back(Portal{q, p});
        } else {
            result.push_back(Portal{p, q});
        }
    }

    result.push_back(Portal{end, end});
    return result;
}

std::vector<NavVec3> NavMeshQuery::midpoint_path(const std::vector<std::uint32_t>& corridor,
                                                 const NavVec3& start,
                                                 const NavVec3& end) const {
    std::vector<NavVec3> points;
    points.reserve(corridor.size() + 1);
    points.push_back(start);

    for (std::size_t i = 0; i + 1 < corridor.size(); ++i) {
        const auto edge = m_mesh->shared_edge(corridor[i], corridor[i + 1]);
        if (!edge) {
            continue;
        }
        const NavVec3& p = m_mesh->vertices()[edge->first];
        const NavVec3& q = m_mesh->vertices()[edge->second];
        points.push_back((p + q) * 0.5);
    }

    points.push_back(end);
    remove_consecutive_duplicates(points, POINT_EPSILON);
    return points;
}

std::vector<NavVec3> NavMeshQuery::funnel_path(const std::vector<std::uint32_t>& corridor,
                                               const NavVec3& start,
                                               const NavVec3& end) const {
    const std::vector<Portal> gates = portals(corridor, start, end);
    const NavVec3& up = m_mesh->up();

    auto area = [&up](const NavVec3& a, const NavVec3& b, const NavVec3& c) {
        return navkit_math::signed_area(a, b, c, up);
    };

    std::vector<NavVec3> points;
    points.push_back(start);

    NavVec3 apex = start;
    NavVec3 left = gates[0].left;
    NavVec3 right = gates[0].right;
    std::size_t apex_index = 0;
    std::size_t left_index = 0;
    std::size_t right_index = 0;

    for (std::size_t i = 1; i < gates.size(); ++i) {
        const NavVec3& portal_left = gates[i].left;
        const NavVec3& portal_right = gates[i].right;

        // Narrow the right side
        if (area(apex, right, portal_right) >= 0.0) {
            if (same_point(apex, right) || area(apex, left, portal_right) < 0.0) {
                right = portal_right;
                right_index = i;
            } else {
                // Right crossed over left: left corner becomes the new apex
                apex = left;
                apex_index = left_index;
                points.push_back(apex);
                left = apex;
                right = apex;
                left_index = apex_index;
                right_index = apex_index;
                i = apex_index;
                continue;
            }
        }

        // Narrow the left side
        if (area(apex, left, portal_left) <= 0.0) {
            if (same_point(apex, left) || area(apex, right, portal_left) > 0.0) {
                left = portal_left;
                left_index = i;
            } else {
                apex = right;
                apex_index = right_index;
                points.push_back(apex);
                left = apex;
                right = apex;
                left_index = apex_index;
                right_index = apex_index;
                i = apex_index;
                continue;
            }
        }
    }

    points.push_back(end);
    remove_consecutive_duplicates(points, POINT_EPSILON);
    return points;
}

// =============================================================================
// Free Functions
// =============================================================================

Result<NavPath, NavError> find_path(const NavMesh& mesh,
                                    const NavVec3& start,
                                    const NavVec3& destination,
                                    NavQuery query,
                                    NavPathMode mode) {
    return NavMeshQuery(mesh).find_path(start, destination, query, mode);
}

Result<std::vector<std::uint32_t>, NavError> find_triangle_path(const NavMesh& mesh,
                                                               std::uint32_t from,
                                                               std::uint32_t to) {
    return NavMeshQuery(mesh).find_triangle_path(from, to);
}

} // namespace navkit_nav
