// Shared mesh fixtures for navkit_nav tests

#pragma once

#include <navkit/nav/navmesh.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

namespace navkit_test {

using navkit_nav::NavMesh;
using navkit_nav::NavTriangle;
using navkit_nav::NavVec3;

/// U-shaped corridor around a rectangular hole, 10 vertices and 8 triangles
inline std::vector<NavVec3> demo_vertices() {
    return {
        {50.0, 50.0, 0.0},   {500.0, 50.0, 0.0},  {500.0, 100.0, 0.0}, {100.0, 100.0, 0.0},
        {100.0, 300.0, 0.0}, {700.0, 300.0, 0.0}, {700.0, 50.0, 0.0},  {750.0, 50.0, 0.0},
        {750.0, 550.0, 0.0}, {50.0, 550.0, 0.0},
    };
}

inline std::vector<NavTriangle> demo_triangles() {
    return {
        {1, 2, 3}, {0, 1, 3}, {0, 3, 4}, {0, 4, 9},
        {4, 8, 9}, {4, 5, 8}, {5, 7, 8}, {5, 6, 7},
    };
}

inline NavMesh demo_mesh() {
    auto mesh = NavMesh::create(demo_vertices(), demo_triangles());
    REQUIRE(mesh.is_ok());
    return std::move(mesh).value();
}

/// Two unit squares far apart, two triangles each
inline NavMesh two_islands_mesh() {
    auto mesh = NavMesh::create(
        {
            {0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {10.0, 10.0, 0.0}, {0.0, 10.0, 0.0},
            {100.0, 0.0, 0.0}, {110.0, 0.0, 0.0}, {110.0, 10.0, 0.0}, {100.0, 10.0, 0.0},
        },
        {{0, 1, 2}, {0, 2, 3}, {4, 5, 6}, {4, 6, 7}});
    REQUIRE(mesh.is_ok());
    return std::move(mesh).value();
}

/// Strip of four triangles along +X, 40 long and 10 wide
inline NavMesh strip_mesh() {
    auto mesh = NavMesh::create(
        {
            {0.0, 0.0, 0.0}, {20.0, 0.0, 0.0}, {40.0, 0.0, 0.0},
            {0.0, 10.0, 0.0}, {20.0, 10.0, 0.0}, {40.0, 10.0, 0.0},
        },
        {{0, 1, 4}, {0, 4, 3}, {1, 2, 5}, {1, 5, 4}});
    REQUIRE(mesh.is_ok());
    return std::move(mesh).value();
}

/// Length of a polyline
inline double polyline_length(const std::vector<NavVec3>& points) {
    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        total += glm::distance(points[i - 1], points[i]);
    }
    return total;
}

} // namespace navkit_test
