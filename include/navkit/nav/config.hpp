/// @file config.hpp
/// @brief Navigation configuration and mesh description loading

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "navmesh.hpp"
#include "path.hpp"

#include <navkit/core/error.hpp>
#include <navkit/core/log.hpp>
#include <navkit/math/constants.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace navkit_nav {

// =============================================================================
// NavConfig
// =============================================================================

/// @brief Defaults for agents, planning and path following
///
/// JSON layout (every key optional):
/// @code
/// {
///   "navigation": { "query": "accuracy", "path_mode": "accuracy",
///                   "arrival_epsilon": 0.001, "path_follow_tolerance": 5.0,
///                   "replan_distance": 1.0 },
///   "agent": { "speed": 10.0, "min_target_distance": 1.0 },
///   "log": { "level": "info", "file": false, "directory": "logs" }
/// }
/// @endcode
struct NavConfig {
    NavQuery default_query{NavQuery::Accuracy};
    NavPathMode default_path_mode{NavPathMode::Accuracy};

    double agent_speed{10.0};
    double agent_min_target_distance{1.0};

    double arrival_epsilon{1e-3};
    double path_follow_tolerance{navkit_math::consts::d::INFINITY_D};

    /// Distance a followed agent must move before the follower re-plans
    double replan_distance{1.0};

    navkit_core::LogConfig log;

    /// Options for advance() derived from this configuration
    [[nodiscard]] AdvanceOptions advance_options() const;

    /// Reject negative or non-finite values
    [[nodiscard]] navkit_core::Result<void> validate() const;

    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] static navkit_core::Result<NavConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] static navkit_core::Result<NavConfig> from_json_string(const std::string& json_str);
    [[nodiscard]] static navkit_core::Result<NavConfig> load(const std::filesystem::path& path);
};

// =============================================================================
// Mesh Description
// =============================================================================

/// @brief Raw vertex and triangle buffers read from JSON
///
/// @code
/// { "name": "level", "vertices": [[x, y], [x, y, z], ...], "triangles": [[a, b, c], ...] }
/// @endcode
struct NavMeshDescription {
    std::string name;
    std::vector<NavVec3> vertices;
    std::vector<NavTriangle> triangles;

    /// Build and validate a mesh from these buffers
    [[nodiscard]] navkit_core::Result<NavMesh, navkit_core::NavError> build() const;
};

[[nodiscard]] navkit_core::Result<NavMeshDescription> parse_mesh_description(const std::string& json_str);
[[nodiscard]] navkit_core::Result<NavMeshDescription> load_mesh_description(const std::filesystem::path& path);

} // namespace navkit_nav
