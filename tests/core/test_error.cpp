// navkit_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <navkit/core/error.hpp>
#include <string>
#include <vector>

using namespace navkit_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::ParseError, "Bad json");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message() == "Bad json");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("path", "mesh.json");
        auto* ctx = err.get_context("path");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "mesh.json");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("NavError factories", "[core][error]") {
    SECTION("invalid_triangle") {
        NavError err = NavError::invalid_triangle(3, "degenerate");
        REQUIRE(err.kind == NavError::Kind::InvalidTriangle);
        REQUIRE(err.index == 3);
        REQUIRE(err.message.find("3") != std::string::npos);
        REQUIRE(err.message.find("degenerate") != std::string::npos);
    }

    SECTION("no_path") {
        NavError err = NavError::no_path(0, 7);
        REQUIRE(err.kind == NavError::Kind::NoPath);
        REQUIRE(err.message.find("7") != std::string::npos);
    }

    SECTION("kind names") {
        REQUIRE(std::string(nav_error_kind_name(NavError::Kind::PointOutsideMesh)) == "PointOutsideMesh");
        REQUIRE(std::string(nav_error_kind_name(NavError::Kind::MeshNotFound)) == "MeshNotFound");
    }
}

TEST_CASE("NavError widens into Error", "[core][error]") {
    SECTION("error codes") {
        REQUIRE(Error(NavError::invalid_triangle(0, "x")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(NavError::point_outside_mesh("start")).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(NavError::no_path(0, 1)).code() == ErrorCode::NotFound);
        REQUIRE(Error(NavError::mesh_not_found(4)).code() == ErrorCode::NotFound);
        REQUIRE(Error(NavError::agent_not_found(9)).code() == ErrorCode::NotFound);
    }

    SECTION("typed access") {
        Error err = NavError::mesh_not_found(4);
        REQUIRE(err.is<NavError>());
        REQUIRE_FALSE(err.is<std::string>());
        REQUIRE(err.as<NavError>()->kind == NavError::Kind::MeshNotFound);
        REQUIRE(err.message().find("4") != std::string::npos);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err(NavError::no_path(1, 2));
    err.with_context("mesh", "demo");

    const std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotFound]") != std::string::npos);
    REQUIRE(chain.find("NavError:NoPath") != std::string::npos);
    REQUIRE(chain.find("mesh=demo") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with NavError as error type") {
        Result<double, NavError> r = NavError::no_path(0, 1);
        REQUIRE(r.is_err());
        REQUIRE(r.error().kind == NavError::Kind::NoPath);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
    }

    SECTION("map_err widens NavError") {
        Result<int, NavError> r = NavError::agent_not_found(5);
        auto widened = r.map_err([](NavError e) { return Error(std::move(e)); });
        REQUIRE(widened.is_err());
        REQUIRE(widened.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result with complex types", "[core][result]") {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r->size() == 3);
}
