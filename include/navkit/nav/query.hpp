/// @file query.hpp
/// @brief Pathfinding over a navigation mesh for navkit_nav
///
/// Paths are found in two stages: an A* search over the triangle adjacency
/// graph yields a corridor of triangles, then the corridor is turned into a
/// polyline either through shared-edge midpoints (Fast) or with a funnel
/// pass that pulls the line taut against corridor corners (Accuracy).

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "path.hpp"

#include <navkit/core/error.hpp>

#include <cstdint>
#include <limits>
#include <vector>

namespace navkit_nav {

// =============================================================================
// Corridor Portals
// =============================================================================

/// @brief Shared edge between consecutive corridor triangles, oriented by travel direction
struct Portal {
    NavVec3 left{0.0};
    NavVec3 right{0.0};
};

// =============================================================================
// Path Search (time-sliced)
// =============================================================================

enum class PathSearchStatus : std::uint8_t {
    Idle,
    InProgress,
    Succeeded,
    Failed
};

[[nodiscard]] inline const char* path_search_status_name(PathSearchStatus status) {
    switch (status) {
        case PathSearchStatus::Idle: return "Idle";
        case PathSearchStatus::InProgress: return "InProgress";
        case PathSearchStatus::Succeeded: return "Succeeded";
        case PathSearchStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

/// @brief Resumable A* search, owned by the caller
///
/// The mesh passed to init() must outlive the search. A search that runs to
/// completion through update() or finish() yields the same path as
/// find_path() with the same arguments.
class PathSearch {
public:
    PathSearch() = default;

    /// @brief Snap both endpoints and seed the open list
    /// @return PointOutsideMesh if either endpoint cannot be snapped
    navkit_core::Result<void, navkit_core::NavError> init(const NavMesh& mesh,
                                                          const NavVec3& start,
                                                          const NavVec3& destination,
                                                          NavQuery query,
                                                          NavPathMode mode);

    /// @brief Seed the search from endpoints already snapped onto the mesh
    void init(const NavMesh& mesh, const NavPoint& start, const NavPoint& destination,
              NavPathMode mode);

    /// @brief Expand at most `max_iterations` triangles
    PathSearchStatus update(std::size_t max_iterations);

    /// @brief Complete the search if needed and build the path
    [[nodiscard]] navkit_core::Result<NavPath, navkit_core::NavError> finish();

    /// Drop all search state
    void reset();

    PathSearchStatus status() const { return m_status; }
    std::size_t iterations() const { return m_iterations; }

    /// Triangle corridor, valid once the search succeeded
    const std::vector<std::uint32_t>& corridor() const { return m_corridor; }

private:
    static constexpr std::uint32_t NO_TRIANGLE = std::numeric_limits<std::uint32_t>::max();

    struct OpenNode {
        double f_cost{0};
        std::uint32_t triangle{0};

        // Total order: cost first, then triangle index
        bool operator>(const OpenNode& other) const {
            if (f_cost != other.f_cost) return f_cost > other.f_cost;
            return triangle > other.triangle;
        }
    };

    void fail(navkit_core::NavError error);
    void reconstruct_corridor();

    const NavMesh* m_mesh{nullptr};
    NavPoint m_start;
    NavPoint m_destination;
    NavPathMode m_mode{NavPathMode::Accuracy};

    std::vector<OpenNode> m_open;   // min-heap
    std::vector<double> m_g_score;
    std::vector<std::uint32_t> m_came_from;
    std::vector<bool> m_closed;
    std::vector<std::uint32_t> m_corridor;

    PathSearchStatus m_status{PathSearchStatus::Idle};
    std::size_t m_iterations{0};
    navkit_core::NavError m_error{navkit_core::NavError::Kind::PointOutsideMesh,
                                  "Path search not initialized", 0};
};

// =============================================================================
// Navigation Query
// =============================================================================

/// @brief Pathfinding entry points bound to one mesh
class NavMeshQuery {
public:
    explicit NavMeshQuery(const NavMesh& mesh) : m_mesh(&mesh) {}

    /// @brief Find a path between two arbitrary points
    [[nodiscard]] navkit_core::Result<NavPath, navkit_core::NavError> find_path(
        const NavVec3& start,
        const NavVec3& destination,
        NavQuery query,
        NavPathMode mode) const;

    /// @brief A* corridor between two triangles, both ends included
    [[nodiscard]] navkit_core::Result<std::vector<std::uint32_t>, navkit_core::NavError>
    find_triangle_path(std::uint32_t from, std::uint32_t to) const;

    /// @brief Left/right portals of a corridor, bracketed by degenerate start and end portals
    std::vector<Portal> portals(const std::vector<std::uint32_t>& corridor,
                                const NavVec3& start,
                                const NavVec3& end) const;

    /// @brief Approximate path through shared-edge midpoints
    std::vector<NavVec3> midpoint_path(const std::vector<std::uint32_t>& corridor,
                                       const NavVec3& start,
                                       const NavVec3& end) const;

    /// @brief Shortest path inside the corridor (simple stupid funnel)
    std::vector<NavVec3> funnel_path(const std::vector<std::uint32_t>& corridor,
                                     const NavVec3& start,
                                     const NavVec3& end) const;

    const NavMesh& mesh() const { return *m_mesh; }

private:
    const NavMesh* m_mesh;
};

// =============================================================================
// Free Functions
// =============================================================================

[[nodiscard]] navkit_core::Result<NavPath, navkit_core::NavError> find_path(
    const NavMesh& mesh,
    const NavVec3& start,
    const NavVec3& destination,
    NavQuery query,
    NavPathMode mode);

[[nodiscard]] navkit_core::Result<std::vector<std::uint32_t>, navkit_core::NavError>
find_triangle_path(const NavMesh& mesh, std::uint32_t from, std::uint32_t to);

/// Remove consecutive points closer than `epsilon`
void remove_consecutive_duplicates(std::vector<NavVec3>& points, double epsilon);

} // namespace navkit_nav
