// navkit_nav configuration and mesh description tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <navkit/nav/config.hpp>

#include <cmath>
#include <limits>

using namespace navkit_nav;
using navkit_core::ErrorCode;
using Catch::Matchers::WithinAbs;

namespace {

const std::string DATA_DIR = NAVKIT_TEST_DATA_DIR;

} // namespace

// =============================================================================
// NavConfig
// =============================================================================

TEST_CASE("NavConfig defaults", "[nav][config]") {
    NavConfig config;

    REQUIRE(config.default_query == NavQuery::Accuracy);
    REQUIRE(config.default_path_mode == NavPathMode::Accuracy);
    REQUIRE(config.agent_speed == 10.0);
    REQUIRE(std::isinf(config.path_follow_tolerance));
    REQUIRE(config.validate().is_ok());

    AdvanceOptions options = config.advance_options();
    REQUIRE(std::isinf(options.tolerance));
    REQUIRE(options.arrival_epsilon == config.arrival_epsilon);
    REQUIRE(options.min_progress == 0.0);
}

TEST_CASE("NavConfig parsing", "[nav][config]") {
    SECTION("full document") {
        auto config = NavConfig::from_json_string(R"({
            "navigation": { "query": "closest", "path_mode": "fast",
                            "arrival_epsilon": 0.01, "path_follow_tolerance": 5.0,
                            "replan_distance": 2.5 },
            "agent": { "speed": 42.0, "min_target_distance": 3 },
            "log": { "level": "debug", "file": true, "directory": "out" }
        })");
        REQUIRE(config.is_ok());
        REQUIRE(config->default_query == NavQuery::Closest);
        REQUIRE(config->default_path_mode == NavPathMode::Fast);
        REQUIRE_THAT(config->arrival_epsilon, WithinAbs(0.01, 1e-12));
        REQUIRE(config->path_follow_tolerance == 5.0);
        REQUIRE(config->replan_distance == 2.5);
        REQUIRE(config->agent_speed == 42.0);
        REQUIRE(config->agent_min_target_distance == 3.0);
        REQUIRE(config->log.level == spdlog::level::debug);
        REQUIRE(config->log.file_enabled);
        REQUIRE(config->log.log_directory == "out");
    }

    SECTION("missing keys keep defaults") {
        auto config = NavConfig::from_json_string(R"({ "agent": { "speed": 5 } })");
        REQUIRE(config.is_ok());
        REQUIRE(config->agent_speed == 5.0);
        REQUIRE(config->default_query == NavQuery::Accuracy);
        REQUIRE(config->replan_distance == 1.0);
    }

    SECTION("null tolerance means unlimited") {
        auto config = NavConfig::from_json_string(R"({ "navigation": { "path_follow_tolerance": null } })");
        REQUIRE(config.is_ok());
        REQUIRE(std::isinf(config->path_follow_tolerance));
    }

    SECTION("to_json feeds back into from_json") {
        NavConfig original;
        original.default_path_mode = NavPathMode::Fast;
        original.agent_speed = 7.5;
        auto parsed = NavConfig::from_json(original.to_json());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed->default_path_mode == NavPathMode::Fast);
        REQUIRE(parsed->agent_speed == 7.5);
        REQUIRE(std::isinf(parsed->path_follow_tolerance));
    }
}

TEST_CASE("NavConfig parse errors", "[nav][config]") {
    SECTION("malformed JSON") {
        auto config = NavConfig::from_json_string("{ not json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("unknown query mode") {
        auto config = NavConfig::from_json_string(R"({ "navigation": { "query": "nearest" } })");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong value type") {
        auto config = NavConfig::from_json_string(R"({ "agent": { "speed": "fast" } })");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("unknown log level") {
        auto config = NavConfig::from_json_string(R"({ "log": { "level": "loud" } })");
        REQUIRE(config.is_err());
    }

    SECTION("root is not an object") {
        REQUIRE(NavConfig::from_json_string("[1, 2]").is_err());
    }
}

TEST_CASE("NavConfig validation", "[nav][config]") {
    NavConfig config;

    SECTION("negative speed") {
        config.agent_speed = -1.0;
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("infinite speed") {
        config.agent_speed = std::numeric_limits<double>::infinity();
        REQUIRE(config.validate().is_err());
    }

    SECTION("NaN epsilon") {
        config.arrival_epsilon = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(config.validate().is_err());
    }
}

TEST_CASE("NavConfig loading from disk", "[nav][config]") {
    SECTION("sample configuration") {
        auto config = NavConfig::load(DATA_DIR + "/navkit.json");
        REQUIRE(config.is_ok());
        REQUIRE(config->agent_speed == 100.0);
        REQUIRE(config->path_follow_tolerance == 50.0);
        REQUIRE(config->validate().is_ok());
    }

    SECTION("missing file") {
        auto config = NavConfig::load(DATA_DIR + "/does_not_exist.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::NotFound);
    }
}

// =============================================================================
// Mesh Description
// =============================================================================

TEST_CASE("Mesh description parsing", "[nav][config]") {
    SECTION("2D and 3D vertices") {
        auto description = parse_mesh_description(R"({
            "name": "tri",
            "vertices": [[0, 0], [10, 0, 1], [0, 10]],
            "triangles": [[0, 1, 2]]
        })");
        REQUIRE(description.is_ok());
        REQUIRE(description->name == "tri");
        REQUIRE(description->vertices[1] == NavVec3(10.0, 0.0, 1.0));
        REQUIRE(description->vertices[2].z == 0.0);

        auto mesh = description->build();
        REQUIRE(mesh.is_ok());
        REQUIRE(mesh->triangle_count() == 1);
    }

    SECTION("bad triangle entry") {
        auto description = parse_mesh_description(R"({
            "vertices": [[0, 0], [10, 0], [0, 10]],
            "triangles": [[0, 1]]
        })");
        REQUIRE(description.is_err());
        REQUIRE(description.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative index") {
        auto description = parse_mesh_description(R"({
            "vertices": [[0, 0], [10, 0], [0, 10]],
            "triangles": [[0, 1, -2]]
        })");
        REQUIRE(description.is_err());
    }

    SECTION("missing vertices") {
        REQUIRE(parse_mesh_description(R"({ "triangles": [] })").is_err());
    }

    SECTION("invalid geometry is caught when building") {
        auto description = parse_mesh_description(R"({
            "vertices": [[0, 0], [10, 0], [20, 0]],
            "triangles": [[0, 1, 2]]
        })");
        REQUIRE(description.is_ok());
        auto mesh = description->build();
        REQUIRE(mesh.is_err());
        REQUIRE(mesh.error().kind == navkit_core::NavError::Kind::InvalidTriangle);
    }
}

TEST_CASE("Mesh description loading from disk", "[nav][config]") {
    auto description = load_mesh_description(DATA_DIR + "/demo_mesh.json");
    REQUIRE(description.is_ok());
    REQUIRE(description->name == "demo");
    REQUIRE(description->vertices.size() == 10);
    REQUIRE(description->triangles.size() == 8);

    auto mesh = description->build();
    REQUIRE(mesh.is_ok());
    REQUIRE(mesh->island_count() == 1);

    auto missing = load_mesh_description(DATA_DIR + "/missing_mesh.json");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code() == ErrorCode::NotFound);
}
