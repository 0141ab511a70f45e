// navkit_nav NavMesh construction tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <navkit/nav/navmesh.hpp>

#include "test_meshes.hpp"

#include <limits>

using namespace navkit_nav;
using navkit_core::NavError;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("NavMesh construction succeeds for valid input", "[nav][navmesh]") {
    NavMesh mesh = navkit_test::demo_mesh();

    REQUIRE(mesh.vertex_count() == 10);
    REQUIRE(mesh.triangle_count() == 8);
    REQUIRE(mesh.island_count() == 1);
    REQUIRE(mesh.non_manifold_edge_count() == 0);
    REQUIRE(mesh.triangles()[5] == NavTriangle(4, 5, 8));
}

TEST_CASE("NavMesh construction rejects invalid triangles", "[nav][navmesh]") {
    auto vertices = navkit_test::demo_vertices();

    SECTION("index out of range") {
        auto result = NavMesh::create(vertices, {{0, 1, 3}, {0, 3, 42}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().kind == NavError::Kind::InvalidTriangle);
        REQUIRE(result.error().index == 1);
    }

    SECTION("repeated index") {
        auto result = NavMesh::create(vertices, {{0, 0, 3}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().kind == NavError::Kind::InvalidTriangle);
    }

    SECTION("collinear vertices") {
        // 0, 1 and 6 all lie on y = 50
        auto result = NavMesh::create(vertices, {{0, 1, 3}, {0, 1, 6}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().kind == NavError::Kind::InvalidTriangle);
        REQUIRE(result.error().index == 1);
        REQUIRE(result.error().message.find("1") != std::string::npos);
    }

    SECTION("non-finite vertex") {
        vertices[3].x = std::numeric_limits<double>::quiet_NaN();
        auto result = NavMesh::create(vertices, {{0, 1, 3}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().kind == NavError::Kind::InvalidTriangle);
    }

    SECTION("first failing triangle is reported") {
        auto result = NavMesh::create(vertices, {{0, 1, 99}, {0, 0, 1}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().index == 0);
    }
}

TEST_CASE("NavMesh allows an empty triangle list", "[nav][navmesh]") {
    auto result = NavMesh::create({}, {});
    REQUIRE(result.is_ok());
    REQUIRE(result->empty());
    REQUIRE(result->island_count() == 0);
    REQUIRE(result->up() == NavVec3(0.0, 0.0, 1.0));
}

// =============================================================================
// Adjacency
// =============================================================================

TEST_CASE("NavMesh adjacency", "[nav][navmesh]") {
    NavMesh mesh = navkit_test::demo_mesh();

    SECTION("demo corridor forms a chain") {
        REQUIRE(mesh.neighbors(0) == std::vector<std::uint32_t>{1});
        REQUIRE(mesh.neighbors(1) == std::vector<std::uint32_t>{0, 2});
        REQUIRE(mesh.neighbors(4) == std::vector<std::uint32_t>{3, 5});
        REQUIRE(mesh.neighbors(7) == std::vector<std::uint32_t>{6});
    }

    SECTION("adjacency is symmetric") {
        for (std::uint32_t a = 0; a < mesh.triangle_count(); ++a) {
            for (std::uint32_t b : mesh.neighbors(a)) {
                REQUIRE(mesh.are_adjacent(b, a));
            }
        }
    }

    SECTION("shared edge") {
        auto edge = mesh.shared_edge(4, 5);
        REQUIRE(edge.has_value());
        REQUIRE(edge->first == 4);
        REQUIRE(edge->second == 8);
        REQUIRE_FALSE(mesh.shared_edge(0, 7).has_value());
        REQUIRE_FALSE(mesh.shared_edge(3, 3).has_value());
    }

    SECTION("vertex membership") {
        REQUIRE(mesh.vertex_triangles(4) == std::vector<std::uint32_t>{2, 3, 4, 5});
        REQUIRE(mesh.vertex_triangles(6) == std::vector<std::uint32_t>{7});
    }
}

TEST_CASE("NavMesh non-manifold edges link the first two owners", "[nav][navmesh]") {
    auto result = NavMesh::create(
        {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {5.0, 5.0, 0.0}, {5.0, -5.0, 0.0}, {5.0, 0.0, 5.0}},
        {{0, 1, 2}, {1, 0, 3}, {0, 1, 4}});
    REQUIRE(result.is_ok());

    const NavMesh& mesh = *result;
    REQUIRE(mesh.non_manifold_edge_count() == 1);
    REQUIRE(mesh.are_adjacent(0, 1));
    REQUIRE(mesh.are_adjacent(1, 0));
    REQUIRE(mesh.neighbors(2).empty());
    REQUIRE(mesh.island_count() == 2);
}

TEST_CASE("NavMesh islands", "[nav][navmesh]") {
    NavMesh mesh = navkit_test::two_islands_mesh();

    REQUIRE(mesh.island_count() == 2);
    REQUIRE(mesh.same_island(0, 1));
    REQUIRE(mesh.same_island(2, 3));
    REQUIRE_FALSE(mesh.same_island(1, 2));
}

// =============================================================================
// Cached Geometry
// =============================================================================

TEST_CASE("NavMesh cached geometry", "[nav][navmesh]") {
    NavMesh mesh = navkit_test::strip_mesh();

    SECTION("per-triangle data") {
        REQUIRE_THAT(mesh.area(0), WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(mesh.centroid(0).x, WithinAbs(40.0 / 3.0, 1e-9));
        REQUIRE_THAT(mesh.normal(0).z, WithinAbs(1.0, 1e-12));
    }

    SECTION("whole mesh data") {
        REQUIRE_THAT(mesh.total_area(), WithinAbs(400.0, 1e-9));
        REQUIRE(mesh.bounds_min() == NavVec3(0.0, 0.0, 0.0));
        REQUIRE(mesh.bounds_max() == NavVec3(40.0, 10.0, 0.0));
        REQUIRE_THAT(mesh.up().z, WithinAbs(1.0, 1e-12));
    }

    SECTION("up axis ignores winding") {
        auto flipped = NavMesh::create(
            {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {10.0, 10.0, 0.0}, {0.0, 10.0, 0.0}},
            {{0, 1, 2}, {0, 3, 2}});
        REQUIRE(flipped.is_ok());
        REQUIRE_THAT(flipped->up().z, WithinAbs(1.0, 1e-12));
    }
}
