/// @file navmesh.hpp
/// @brief Navigation mesh: immutable triangle soup with adjacency and spatial queries

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <navkit/core/error.hpp>
#include <navkit/math/constants.hpp>

#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace navkit_nav {

// =============================================================================
// Navigation Mesh
// =============================================================================

/// @brief Navigation mesh built once from vertex and triangle buffers
///
/// Construction validates every triangle and derives the triangle adjacency
/// graph, the vertex-to-triangle membership index and per-triangle spatial
/// data. The mesh is immutable afterwards and safe for concurrent reads.
class NavMesh {
public:
    /// @brief Build a mesh, failing atomically with InvalidTriangle
    ///
    /// Triangles are checked in order: indices in range and distinct, finite
    /// vertices, non-degenerate geometry. Disjoint islands are legal. An edge
    /// owned by more than two triangles links only the first two owners.
    [[nodiscard]] static navkit_core::Result<NavMesh, navkit_core::NavError> create(
        std::vector<NavVec3> vertices,
        std::vector<NavTriangle> triangles);

    // Buffers
    const std::vector<NavVec3>& vertices() const { return m_vertices; }
    const std::vector<NavTriangle>& triangles() const { return m_triangles; }
    std::size_t vertex_count() const { return m_vertices.size(); }
    std::size_t triangle_count() const { return m_triangles.size(); }
    bool empty() const { return m_triangles.empty(); }

    /// Corners of a triangle
    std::array<NavVec3, 3> triangle_points(std::uint32_t triangle) const;

    // Adjacency
    const std::vector<std::uint32_t>& neighbors(std::uint32_t triangle) const { return m_neighbors[triangle]; }
    const std::vector<std::uint32_t>& vertex_triangles(std::uint32_t vertex) const { return m_vertex_triangles[vertex]; }
    bool are_adjacent(std::uint32_t a, std::uint32_t b) const;

    /// @brief Vertex indices of the edge shared by two triangles, in a's winding order
    std::optional<std::pair<std::uint32_t, std::uint32_t>> shared_edge(std::uint32_t a,
                                                                       std::uint32_t b) const;

    /// Number of edges that had more than two owning triangles
    std::size_t non_manifold_edge_count() const { return m_non_manifold_edges; }

    // Connectivity islands
    std::uint32_t island_count() const { return m_island_count; }
    std::uint32_t island(std::uint32_t triangle) const { return m_islands[triangle]; }
    bool same_island(std::uint32_t a, std::uint32_t b) const { return m_islands[a] == m_islands[b]; }

    // Per-triangle data
    const NavVec3& centroid(std::uint32_t triangle) const { return m_spatials[triangle].centroid; }
    const NavVec3& normal(std::uint32_t triangle) const { return m_spatials[triangle].normal; }
    double area(std::uint32_t triangle) const { return m_spatials[triangle].area; }

    // Whole-mesh data
    const NavVec3& bounds_min() const { return m_bounds.min; }
    const NavVec3& bounds_max() const { return m_bounds.max; }
    double total_area() const { return m_total_area; }

    /// Area-weighted mean normal, orientation-consistent; +Z for an empty mesh
    const NavVec3& up() const { return m_up; }

    // Spatial queries

    /// @brief Snap a point onto the mesh
    /// @return The snapped point and its triangle, or nullopt for an empty mesh
    std::optional<NavPoint> closest_point(const NavVec3& point, NavQuery query) const;

    /// @brief Find the triangle containing a point on or near the surface
    /// @param plane_tolerance Maximum plane distance accepted in Accuracy mode
    std::optional<std::uint32_t> find_triangle(
        const NavVec3& point,
        NavQuery query,
        double plane_tolerance = navkit_math::consts::d::POINT_EPSILON) const;

    /// Check whether a point lies on the walkable surface within tolerance
    bool is_point_on_mesh(const NavVec3& point,
                          double tolerance = navkit_math::consts::d::POINT_EPSILON) const;

private:
    NavMesh() = default;

    struct TriangleSpatial {
        NavVec3 centroid{0.0};
        NavVec3 normal{0.0};
        double area{0};
        navkit_math::DAabb bounds;
    };

    void build_spatials();
    void build_adjacency();
    void build_islands();

    std::optional<NavPoint> closest_point_projected(const NavVec3& point) const;
    std::optional<NavPoint> closest_point_clamped(const NavVec3& point) const;

    std::vector<NavVec3> m_vertices;
    std::vector<NavTriangle> m_triangles;
    std::vector<TriangleSpatial> m_spatials;
    std::vector<std::vector<std::uint32_t>> m_neighbors;
    std::vector<std::vector<std::uint32_t>> m_vertex_triangles;
    std::vector<std::uint32_t> m_islands;
    std::uint32_t m_island_count{0};
    std::size_t m_non_manifold_edges{0};
    navkit_math::DAabb m_bounds;
    NavVec3 m_up{0.0, 0.0, 1.0};
    double m_total_area{0};
};

} // namespace navkit_nav
