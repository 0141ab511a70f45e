// navkit_math triangle geometry tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <navkit/math/math.hpp>

#include <limits>

using namespace navkit_math;
using Catch::Matchers::WithinAbs;

namespace {

const DVec3 A(0.0, 0.0, 0.0);
const DVec3 B(4.0, 0.0, 0.0);
const DVec3 C(0.0, 4.0, 0.0);

} // namespace

// =============================================================================
// Triangle Properties
// =============================================================================

TEST_CASE("Triangle properties", "[math][triangle]") {
    SECTION("area") {
        REQUIRE_THAT(triangle_area(A, B, C), WithinAbs(8.0, 1e-12));
    }

    SECTION("centroid") {
        DVec3 c = triangle_centroid(A, B, C);
        REQUIRE_THAT(c.x, WithinAbs(4.0 / 3.0, 1e-12));
        REQUIRE_THAT(c.y, WithinAbs(4.0 / 3.0, 1e-12));
    }

    SECTION("normal follows winding") {
        REQUIRE_THAT(triangle_normal(A, B, C).z, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(triangle_normal(A, C, B).z, WithinAbs(-1.0, 1e-12));
    }

    SECTION("signed area against up axis") {
        REQUIRE(signed_area(A, B, C, dvec3::Z) > 0.0);
        REQUIRE(signed_area(A, C, B, dvec3::Z) < 0.0);
        REQUIRE(signed_area(A, B, DVec3(8.0, 0.0, 0.0), dvec3::Z) == 0.0);
    }
}

TEST_CASE("Degenerate triangles", "[math][triangle]") {
    SECTION("collinear points") {
        REQUIRE(is_degenerate_triangle(A, B, DVec3(2.0, 0.0, 0.0)));
    }

    SECTION("repeated point") {
        REQUIRE(is_degenerate_triangle(A, A, C));
    }

    SECTION("thin but valid triangle") {
        REQUIRE_FALSE(is_degenerate_triangle(A, DVec3(100.0, 0.0, 0.0), DVec3(50.0, 0.01, 0.0)));
    }

    SECTION("regular triangle") {
        REQUIRE_FALSE(is_degenerate_triangle(A, B, C));
    }
}

// =============================================================================
// Containment
// =============================================================================

TEST_CASE("Barycentric coordinates", "[math][triangle]") {
    SECTION("vertices map to unit weights") {
        DVec3 w = barycentric(B, A, B, C);
        REQUIRE_THAT(w.x, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(w.y, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(w.z, WithinAbs(0.0, 1e-12));
    }

    SECTION("weights sum to one") {
        DVec3 w = barycentric(DVec3(1.0, 1.0, 0.0), A, B, C);
        REQUIRE_THAT(w.x + w.y + w.z, WithinAbs(1.0, 1e-12));
    }

    SECTION("degenerate triangle") {
        DVec3 w = barycentric(DVec3(1.0, 0.0, 0.0), A, B, DVec3(2.0, 0.0, 0.0));
        REQUIRE(w.x == -1.0);
    }
}

TEST_CASE("Point in triangle", "[math][triangle]") {
    REQUIRE(point_in_triangle(DVec3(1.0, 1.0, 0.0), A, B, C));
    REQUIRE(point_in_triangle(DVec3(2.0, 0.0, 0.0), A, B, C));
    REQUIRE_FALSE(point_in_triangle(DVec3(3.0, 3.0, 0.0), A, B, C));

    SECTION("uses the projection onto the plane") {
        REQUIRE(point_in_triangle(DVec3(1.0, 1.0, 25.0), A, B, C));
    }
}

// =============================================================================
// Closest Point Queries
// =============================================================================

TEST_CASE("Closest point on segment", "[math][triangle]") {
    SECTION("interior projection") {
        DVec3 p = closest_point_on_segment(DVec3(2.0, 3.0, 0.0), A, B);
        REQUIRE_THAT(p.x, WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(p.y, WithinAbs(0.0, 1e-12));
    }

    SECTION("clamped to endpoint") {
        DVec3 p = closest_point_on_segment(DVec3(-5.0, 1.0, 0.0), A, B);
        REQUIRE(p == A);
    }

    SECTION("zero length segment") {
        REQUIRE(closest_point_on_segment(DVec3(1.0, 1.0, 1.0), A, A) == A);
    }
}

TEST_CASE("Closest point on triangle", "[math][triangle]") {
    SECTION("inside returns the projection") {
        DVec3 p = closest_point_on_triangle(DVec3(1.0, 1.0, 5.0), A, B, C);
        REQUIRE_THAT(p.x, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(p.y, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(p.z, WithinAbs(0.0, 1e-12));
    }

    SECTION("vertex region") {
        DVec3 p = closest_point_on_triangle(DVec3(-2.0, -2.0, 0.0), A, B, C);
        REQUIRE(p == A);
    }

    SECTION("edge region") {
        DVec3 p = closest_point_on_triangle(DVec3(3.0, 3.0, 0.0), A, B, C);
        REQUIRE_THAT(p.x, WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(p.y, WithinAbs(2.0, 1e-12));
    }

    SECTION("below the base edge") {
        DVec3 p = closest_point_on_triangle(DVec3(1.5, -3.0, 0.0), A, B, C);
        REQUIRE_THAT(p.x, WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(p.y, WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Plane helpers", "[math][triangle]") {
    REQUIRE_THAT(plane_distance(DVec3(1.0, 2.0, 3.0), A, dvec3::Z), WithinAbs(3.0, 1e-12));
    DVec3 p = project_on_plane(DVec3(1.0, 2.0, 3.0), A, dvec3::Z);
    REQUIRE(p == DVec3(1.0, 2.0, 0.0));
}

TEST_CASE("Vector helpers", "[math][vec]") {
    REQUIRE(normalize_or_zero(DVec3(0.0)) == DVec3(0.0));
    REQUIRE_THAT(length(normalize_or_zero(DVec3(3.0, 4.0, 0.0))), WithinAbs(1.0, 1e-12));
    REQUIRE(is_finite(DVec3(1.0, 2.0, 3.0)));
    REQUIRE_FALSE(is_finite(DVec3(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0)));
}
