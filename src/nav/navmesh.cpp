/// @file navmesh.cpp
/// @brief Navigation mesh construction and spatial queries for navkit_nav

#include <navkit/nav/navmesh.hpp>
#include <navkit/math/math.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <string>
#include <unordered_map>

namespace navkit_nav {

namespace {

using navkit_core::NavError;

constexpr std::uint32_t NO_TRIANGLE = std::numeric_limits<std::uint32_t>::max();

std::uint64_t edge_key(std::uint32_t a, std::uint32_t b) {
    const std::uint64_t lo = std::min(a, b);
    const std::uint64_t hi = std::max(a, b);
    return (hi << 32) | lo;
}

std::string vertex_label(std::uint32_t index) {
    return "vertex " + std::to_string(index);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

navkit_core::Result<NavMesh, navkit_core::NavError> NavMesh::create(
    std::vector<NavVec3> vertices,
    std::vector<NavTriangle> triangles) {

    const auto vertex_count = static_cast<std::uint32_t>(vertices.size());

    for (std::uint32_t t = 0; t < triangles.size(); ++t) {
        const NavTriangle& tri = triangles[t];

        for (std::size_t i = 0; i < 3; ++i) {
            if (tri[i] >= vertex_count) {
                return NavError::invalid_triangle(t, vertex_label(tri[i]) + " out of range (" +
                                                  std::to_string(vertex_count) + " vertices)");
            }
        }

        if (tri.first == tri.second || tri.second == tri.third || tri.first == tri.third) {
            return NavError::invalid_triangle(t, "repeated vertex index");
        }

        const NavVec3& a = vertices[tri.first];
        const NavVec3& b = vertices[tri.second];
        const NavVec3& c = vertices[tri.third];

        if (!navkit_math::is_finite(a) || !navkit_math::is_finite(b) || !navkit_math::is_finite(c)) {
            return NavError::invalid_triangle(t, "non-finite vertex position");
        }

        if (navkit_math::is_degenerate_triangle(a, b, c)) {
            return NavError::invalid_triangle(t, "degenerate (collinear) vertices");
        }
    }

    NavMesh mesh;
    mesh.m_vertices = std::move(vertices);
    mesh.m_triangles = std::move(triangles);
    mesh.build_spatials();
    mesh.build_adjacency();
    mesh.build_islands();
    return mesh;
}

void NavMesh::build_spatials() {
    m_spatials.clear();
    m_spatials.reserve(m_triangles.size());
    m_total_area = 0;

    if (!m_vertices.empty()) {
        m_bounds = navkit_math::DAabb(m_vertices.front(), m_vertices.front());
        for (const auto& v : m_vertices) {
            m_bounds.expand(v);
        }
    }

    NavVec3 reference{0.0};
    NavVec3 normal_sum{0.0};

    for (const auto& tri : m_triangles) {
        const NavVec3& a = m_vertices[tri.first];
        const NavVec3& b = m_vertices[tri.second];
        const NavVec3& c = m_vertices[tri.third];

        TriangleSpatial spatial;
        spatial.centroid = navkit_math::triangle_centroid(a, b, c);
        spatial.normal = navkit_math::triangle_normal(a, b, c);
        spatial.area = navkit_math::triangle_area(a, b, c);
        spatial.bounds = navkit_math::DAabb::from_points(a, b, c);

        if (m_spatials.empty()) {
            reference = spatial.normal;
        }

        // Mixed windings must not cancel each other out
        const double sign = glm::dot(spatial.normal, reference) < 0.0 ? -1.0 : 1.0;
        normal_sum += spatial.normal * (spatial.area * sign);

        m_total_area += spatial.area;
        m_spatials.push_back(spatial);
    }

    m_up = navkit_math::normalize_or_zero(normal_sum);
    if (glm::length2(m_up) == 0.0) {
        m_up = navkit_math::dvec3::Z;
    }
}

void NavMesh::build_adjacency() {
    const std::size_t tri_count = m_triangles.size();

    m_neighbors.assign(tri_count, {});
    m_vertex_triangles.assign(m_vertices.size(), {});
    m_non_manifold_edges = 0;

    // Owners are appended in triangle order, so "first two owners" is stable
    std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> edge_owners;
    edge_owners.reserve(tri_count * 3);

    for (std::uint32_t t = 0; t < tri_count; ++t) {
        const NavTriangle& tri = m_triangles[t];
        for (std::size_t i = 0; i < 3; ++i) {
            m_vertex_triangles[tri[i]].push_back(t);
            edge_owners[edge_key(tri[i], tri[(i + 1) % 3])].push_back(t);
        }
    }

    for (const auto& [key, owners] : edge_owners) {
        (void)key;
        if (owners.size() < 2) {
            continue;
        }
        if (owners.size() > 2) {
            ++m_non_manifold_edges;
        }

        const std::uint32_t a = owners[0];
        const std::uint32_t b = owners[1];
        if (a == b || are_adjacent(a, b)) {
            continue;
        }
        m_neighbors[a].push_back(b);
        m_neighbors[b].push_back(a);
    }

    for (auto& list : m_neighbors) {
        std::sort(list.begin(), list.end());
    }
}

void NavMesh::build_islands() {
    const std::size_t tri_count = m_triangles.size();
    m_islands.assign(tri_count, NO_TRIANGLE);
    m_island_count = 0;

    std::queue<std::uint32_t> open;
    for (std::uint32_t seed = 0; seed < tri_count; ++seed) {
        if (m_islands[seed] != NO_TRIANGLE) {
            continue;
        }

        const std::uint32_t island = m_island_count++;
        m_islands[seed] = island;
        open.push(seed);

        while (!open.empty()) {
            const std::uint32_t current = open.front();
            open.pop();
            for (std::uint32_t neighbor : m_neighbors[current]) {
                if (m_islands[neighbor] == NO_TRIANGLE) {
                    m_islands[neighbor] = island;
                    open.push(neighbor);
                }
            }
        }
    }
}

// =============================================================================
// Accessors
// =============================================================================

std::array<NavVec3, 3> NavMesh::triangle_points(std::uint32_t triangle) const {
    const NavTriangle& tri = m_triangles[triangle];
    return {m_vertices[tri.first], m_vertices[tri.second], m_vertices[tri.third]};
}

bool NavMesh::are_adjacent(std::uint32_t a, std::uint32_t b) const {
    const auto& list = m_neighbors[a];
    return std::find(list.begin(), list.end(), b) != list.end();
}

std::optional<std::pair<std::uint32_t, std::uint32_t>> NavMesh::shared_edge(std::uint32_t a,
                                                                            std::uint32_t b) const {
    if (a == b || a >= m_triangles.size() || b >= m_triangles.size()) {
        return std::nullopt;
    }

    const NavTriangle& ta = m_triangles[a];
    const NavTriangle& tb = m_triangles[b];
    for (std::size_t i = 0; i < 3; ++i) {
        const std::uint32_t p = ta[i];
        const std::uint32_t q = ta[(i + 1) % 3];
        if (tb.contains(p) && tb.contains(q)) {
            return std::make_pair(p, q);
        }
    }
    return std::nullopt;
}

// =============================================================================
// Spatial Queries
// =============================================================================

std::optional<NavPoint> NavMesh::closest_point(const NavVec3& point, NavQuery query) const {
    if (m_triangles.empty()) {
        return std::nullopt;
    }
    if (query == NavQuery::Closest) {
        return closest_point_projected(point);
    }
    return closest_point_clamped(point);
}

std::optional<NavPoint> NavMesh::closest_point_projected(const NavVec3& point) const {
    std::uint32_t best = NO_TRIANGLE;
    double best_plane = navkit_math::consts::d::INFINITY_D;

    for (std::uint32_t t = 0; t < m_triangles.size(); ++t) {
        const auto [a, b, c] = triangle_points(t);
        if (!navkit_math::point_in_triangle(point, a, b, c)) {
            continue;
        }
        const double plane = std::abs(navkit_math::plane_distance(point, a, m_spatials[t].normal));
        if (plane < best_plane) {
            best_plane = plane;
            best = t;
            if (plane <= navkit_math::consts::d::POINT_EPSILON) {
                break;
            }
        }
    }

    if (best == NO_TRIANGLE) {
        double best_dist = navkit_math::consts::d::INFINITY_D;
        for (std::uint32_t t = 0; t < m_triangles.size(); ++t) {
            const double dist = glm::distance2(point, m_spatials[t].centroid);
            if (dist < best_dist) {
                best_dist = dist;
                best = t;
            }
        }
    }

    const NavVec3 origin = m_vertices[m_triangles[best].first];
    return NavPoint{navkit_math::project_on_plane(point, origin, m_spatials[best].normal), best};
}

std::optional<NavPoint> NavMesh::closest_point_clamped(const NavVec3& point) const {
    std::uint32_t best = NO_TRIANGLE;
    double best_dist = navkit_math::consts::d::INFINITY_D;
    NavVec3 best_point{0.0};

    auto consider = [&](std::uint32_t t) {
        const auto [a, b, c] = triangle_points(t);
        const NavVec3 candidate = navkit_math::closest_point_on_triangle(point, a, b, c);
        const double dist = glm::distance2(point, candidate);
        if (dist < best_dist || (dist == best_dist && t < best)) {
            best_dist = dist;
            best = t;
            best_point = candidate;
        }
    };

    // Seed with the fan around the nearest vertex that has triangles
    std::uint32_t seed_vertex = NO_TRIANGLE;
    double seed_dist = navkit_math::consts::d::INFINITY_D;
    for (std::uint32_t v = 0; v < m_vertices.size(); ++v) {
        if (m_vertex_triangles[v].empty()) {
            continue;
        }
        const double dist = glm::distance2(point, m_vertices[v]);
        if (dist < seed_dist) {
            seed_dist = dist;
            seed_vertex = v;
        }
    }
    if (seed_vertex != NO_TRIANGLE) {
        for (std::uint32_t t : m_vertex_triangles[seed_vertex]) {
            consider(t);
        }
    }

    for (std::uint32_t t = 0; t < m_triangles.size(); ++t) {
        if (m_spatials[t].bounds.distance_squared(point) > best_dist) {
            continue;
        }
        consider(t);
    }

    if (best == NO_TRIANGLE) {
        return std::nullopt;
    }
    return NavPoint{best_point, best};
}

std::optional<std::uint32_t> NavMesh::find_triangle(const NavVec3& point,
                                                    NavQuery query,
                                                    double plane_tolerance) const {
    std::optional<std::uint32_t> result;
    double best_plane = navkit_math::consts::d::INFINITY_D;

    for (std::uint32_t t = 0; t < m_triangles.size(); ++t) {
        if (query == NavQuery::Accuracy &&
            m_spatials[t].bounds.distance_squared(point) > plane_tolerance * plane_tolerance) {
            continue;
        }

        const auto [a, b, c] = triangle_points(t);
        if (!navkit_math::point_in_triangle(point, a, b, c)) {
            continue;
        }
        if (query == NavQuery::Closest) {
            return t;
        }

        const double plane = std::abs(navkit_math::plane_distance(point, a, m_spatials[t].normal));
        if (plane <= plane_tolerance && plane < best_plane) {
            best_plane = plane;
            result = t;
        }
    }
    return result;
}

bool NavMesh::is_point_on_mesh(const NavVec3& point, double tolerance) const {
    const auto snapped = closest_point_clamped(point);
    return snapped && glm::distance(snapped->point, point) <= tolerance;
}

} // namespace navkit_nav
