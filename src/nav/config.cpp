/// @file config.cpp
/// @brief NavConfig and mesh description parsing

#include <navkit/nav/config.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace navkit_nav {

using navkit_core::Error;
using navkit_core::ErrorCode;
using navkit_core::Result;

namespace {

Error parse_error(const std::string& message) {
    return Error(ErrorCode::ParseError, message);
}

/// Read an optional number; absent keys keep the current value
Result<void> read_number(const nlohmann::json& section, const char* key,
                         const std::string& prefix, double& out) {
    if (!section.contains(key)) {
        return navkit_core::Ok();
    }
    const auto& value = section[key];
    if (!value.is_number()) {
        return parse_error(prefix + "." + key + " must be a number");
    }
    out = value.get<double>();
    return navkit_core::Ok();
}

Result<std::string> read_string(const nlohmann::json& section, const char* key,
                                const std::string& prefix) {
    const auto& value = section[key];
    if (!value.is_string()) {
        return parse_error(prefix + "." + key + " must be a string");
    }
    return value.get<std::string>();
}

Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorCode::NotFound, "File not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::IOError, "Failed to open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<NavVec3> parse_vertex(const nlohmann::json& j, std::size_t index) {
    if (!j.is_array() || j.size() < 2 || j.size() > 3) {
        return parse_error("vertices[" + std::to_string(index) + "] must be [x, y] or [x, y, z]");
    }
    NavVec3 vertex{0.0};
    for (std::size_t i = 0; i < j.size(); ++i) {
        if (!j[i].is_number()) {
            return parse_error("vertices[" + std::to_string(index) + "] has a non-numeric coordinate");
        }
        vertex[static_cast<glm::length_t>(i)] = j[i].get<double>();
    }
    return vertex;
}

Result<NavTriangle> parse_triangle(const nlohmann::json& j, std::size_t index) {
    if (!j.is_array() || j.size() != 3) {
        return parse_error("triangles[" + std::to_string(index) + "] must be [a, b, c]");
    }
    std::uint32_t indices[3]{};
    for (std::size_t i = 0; i < 3; ++i) {
        if (!j[i].is_number_unsigned()) {
            return parse_error("triangles[" + std::to_string(index) + "] has a non-index entry");
        }
        indices[i] = j[i].get<std::uint32_t>();
    }
    return NavTriangle{indices[0], indices[1], indices[2]};
}

} // anonymous namespace

// =============================================================================
// NavConfig
// =============================================================================

AdvanceOptions NavConfig::advance_options() const {
    AdvanceOptions options;
    options.tolerance = path_follow_tolerance;
    options.arrival_epsilon = arrival_epsilon;
    return options;
}

Result<void> NavConfig::validate() const {
    auto check = [](double value, const char* name) -> Result<void> {
        if (std::isnan(value) || value < 0.0) {
            return Error(ErrorCode::ValidationError, std::string(name) + " must be non-negative");
        }
        return navkit_core::Ok();
    };

    if (auto r = check(agent_speed, "agent.speed"); !r) return r;
    if (auto r = check(agent_min_target_distance, "agent.min_target_distance"); !r) return r;
    if (auto r = check(arrival_epsilon, "navigation.arrival_epsilon"); !r) return r;
    if (auto r = check(path_follow_tolerance, "navigation.path_follow_tolerance"); !r) return r;
    if (auto r = check(replan_distance, "navigation.replan_distance"); !r) return r;

    if (std::isinf(agent_speed)) {
        return Error(ErrorCode::ValidationError, "agent.speed must be finite");
    }
    return navkit_core::Ok();
}

nlohmann::json NavConfig::to_json() const {
    nlohmann::json j;
    j["navigation"]["query"] = nav_query_name(default_query);
    j["navigation"]["path_mode"] = nav_path_mode_name(default_path_mode);
    j["navigation"]["arrival_epsilon"] = arrival_epsilon;
    if (std::isfinite(path_follow_tolerance)) {
        j["navigation"]["path_follow_tolerance"] = path_follow_tolerance;
    } else {
        j["navigation"]["path_follow_tolerance"] = nullptr;
    }
    j["navigation"]["replan_distance"] = replan_distance;
    j["agent"]["speed"] = agent_speed;
    j["agent"]["min_target_distance"] = agent_min_target_distance;
    j["log"]["level"] = navkit_core::log_level_name(log.level);
    j["log"]["file"] = log.file_enabled;
    j["log"]["directory"] = log.log_directory;
    return j;
}

Result<NavConfig> NavConfig::from_json(const nlohmann::json& j) {
    NavConfig config;

    if (!j.is_object()) {
        return parse_error("configuration root must be an object");
    }

    if (j.contains("navigation")) {
        const auto& nav = j["navigation"];
        if (!nav.is_object()) {
            return parse_error("navigation must be an object");
        }

        if (nav.contains("query")) {
            auto name = read_string(nav, "query", "navigation");
            if (!name) return name.error();
            auto query = parse_nav_query(*name);
            if (!query) {
                return parse_error("navigation.query: unknown mode '" + *name + "'");
            }
            config.default_query = *query;
        }

        if (nav.contains("path_mode")) {
            auto name = read_string(nav, "path_mode", "navigation");
            if (!name) return name.error();
            auto mode = parse_nav_path_mode(*name);
            if (!mode) {
                return parse_error("navigation.path_mode: unknown mode '" + *name + "'");
            }
            config.default_path_mode = *mode;
        }

        if (auto r = read_number(nav, "arrival_epsilon", "navigation", config.arrival_epsilon); !r) {
            return r.error();
        }
        if (nav.contains("path_follow_tolerance") && nav["path_follow_tolerance"].is_null()) {
            config.path_follow_tolerance = navkit_math::consts::d::INFINITY_D;
        } else if (auto r = read_number(nav, "path_follow_tolerance", "navigation",
                                        config.path_follow_tolerance); !r) {
            return r.error();
        }
        if (auto r = read_number(nav, "replan_distance", "navigation", config.replan_distance); !r) {
            return r.error();
        }
    }

    if (j.contains("agent")) {
        const auto& agent = j["agent"];
        if (!agent.is_object()) {
            return parse_error("agent must be an object");
        }
        if (auto r = read_number(agent, "speed", "agent", config.agent_speed); !r) {
            return r.error();
        }
        if (auto r = read_number(agent, "min_target_distance", "agent",
                                 config.agent_min_target_distance); !r) {
            return r.error();
        }
    }

    if (j.contains("log")) {
        const auto& log = j["log"];
        if (!log.is_object()) {
            return parse_error("log must be an object");
        }
        if (log.contains("level")) {
            auto name = read_string(log, "level", "log");
            if (!name) return name.error();
            auto level = navkit_core::parse_log_level(*name);
            if (!level) {
                return parse_error("log.level: unknown level '" + *name + "'");
            }
            config.log.level = *level;
        }
        if (log.contains("file")) {
            if (!log["file"].is_boolean()) {
                return parse_error("log.file must be a boolean");
            }
            config.log.file_enabled = log["file"].get<bool>();
        }
        if (log.contains("directory")) {
            auto dir = read_string(log, "directory", "log");
            if (!dir) return dir.error();
            config.log.log_directory = *dir;
        }
    }

    return config;
}

Result<NavConfig> NavConfig::from_json_string(const std::string& json_str) {
    try {
        return from_json(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::exception& e) {
        return parse_error(std::string("JSON parse error: ") + e.what());
    }
}

Result<NavConfig> NavConfig::load(const std::filesystem::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return text.error();
    }

    auto config = from_json_string(*text);
    if (!config) {
        config.error().with_context("path", path.string());
    }
    return config;
}

// =============================================================================
// Mesh Description
// =============================================================================

Result<NavMesh, navkit_core::NavError> NavMeshDescription::build() const {
    return NavMesh::create(vertices, triangles);
}

Result<NavMeshDescription> parse_mesh_description(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        return parse_error(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        return parse_error("mesh description root must be an object");
    }
    if (!j.contains("vertices") || !j["vertices"].is_array()) {
        return parse_error("vertices is required and must be an array");
    }
    if (!j.contains("triangles") || !j["triangles"].is_array()) {
        return parse_error("triangles is required and must be an array");
    }

    NavMeshDescription description;
    if (j.contains("name")) {
        auto name = read_string(j, "name", "mesh");
        if (!name) return name.error();
        description.name = *name;
    }

    const auto& vertices = j["vertices"];
    description.vertices.reserve(vertices.size());
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        auto vertex = parse_vertex(vertices[i], i);
        if (!vertex) return vertex.error();
        description.vertices.push_back(*vertex);
    }

    const auto& triangles = j["triangles"];
    description.triangles.reserve(triangles.size());
    for (std::size_t i = 0; i < triangles.size(); ++i) {
        auto triangle = parse_triangle(triangles[i], i);
        if (!triangle) return triangle.error();
        description.triangles.push_back(*triangle);
    }

    return description;
}

Result<NavMeshDescription> load_mesh_description(const std::filesystem::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return text.error();
    }

    auto description = parse_mesh_description(*text);
    if (!description) {
        description.error().with_context("path", path.string());
        return description;
    }
    if (description->name.empty()) {
        description->name = path.stem().string();
    }
    return description;
}

} // namespace navkit_nav
