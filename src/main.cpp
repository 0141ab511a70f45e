/// @file main.cpp
/// @brief navkit_demo entry point - walks one agent across a navigation mesh
///
/// Builds the demo mesh (or loads one from JSON), registers it, plans an
/// agent from (400, 450) to (700, 500) and ticks the navigation system at
/// 60 Hz until the agent arrives.

#include <navkit/core/error.hpp>
#include <navkit/core/log.hpp>
#include <navkit/nav/nav.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr double TICK = 1.0 / 60.0;
constexpr int MAX_TICKS = 60 * 60;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <file>   Navigation configuration (JSON)\n"
              << "  --mesh <file>     Mesh description (JSON) instead of the built-in mesh\n"
              << "  --help, -h        Show this help\n";
}

navkit_nav::NavMeshDescription demo_mesh() {
    navkit_nav::NavMeshDescription description;
    description.name = "demo";
    description.vertices = {
        {50.0, 50.0, 0.0},   {500.0, 50.0, 0.0},  {500.0, 100.0, 0.0}, {100.0, 100.0, 0.0},
        {100.0, 300.0, 0.0}, {700.0, 300.0, 0.0}, {700.0, 50.0, 0.0},  {750.0, 50.0, 0.0},
        {750.0, 550.0, 0.0}, {50.0, 550.0, 0.0},
    };
    description.triangles = {
        {1, 2, 3}, {0, 1, 3}, {0, 3, 4}, {0, 4, 9},
        {4, 8, 9}, {4, 5, 8}, {5, 7, 8}, {5, 6, 7},
    };
    return description;
}

std::string format_point(const navkit_nav::NavVec3& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

/// Everything after argument parsing; logging is set up by the caller
int run_demo(const fs::path& config_path, const fs::path& mesh_path) {
    navkit_nav::NavConfig config;
    if (!config_path.empty()) {
        auto loaded = navkit_nav::NavConfig::load(config_path);
        if (!loaded) {
            NAVKIT_LOG_ERROR("Failed to load config: {}", navkit_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(*loaded);
    }

    if (auto valid = config.validate(); !valid) {
        NAVKIT_LOG_ERROR("Invalid config: {}", valid.error().message());
        return 1;
    }
    navkit_core::configure_logging(config.log);

    navkit_nav::NavMeshDescription description = demo_mesh();
    if (!mesh_path.empty()) {
        auto loaded = navkit_nav::load_mesh_description(mesh_path);
        if (!loaded) {
            NAVKIT_LOG_ERROR("Failed to load mesh: {}", navkit_core::build_error_chain(loaded.error()));
            return 1;
        }
        description = std::move(*loaded);
    }

    auto mesh = description.build();
    if (!mesh) {
        NAVKIT_LOG_ERROR("Failed to build mesh '{}': {}", description.name, mesh.error().message);
        return 1;
    }

    navkit_nav::NavMeshRegistry registry;
    const navkit_nav::NavMeshId mesh_id = registry.register_mesh(std::move(*mesh), description.name);

    navkit_nav::NavigationSystem system(registry, config);
    const navkit_nav::AgentId agent_id = system.create_agent({400.0, 450.0, 0.0});
    navkit_nav::NavAgent* agent = system.get_agent(agent_id);
    agent->set_speed(100.0);

    bool arrived = false;
    agent->on_path_found([](const navkit_nav::NavPath& path) {
        NAVKIT_LOG_INFO("Path found: {} points, length {:.2f}", path.size(), path.length());
        for (const auto& point : path.points()) {
            NAVKIT_LOG_INFO("  {}", format_point(point));
        }
    });
    agent->on_destination_reached([&arrived]() { arrived = true; });

    const navkit_nav::NavVec3 destination{700.0, 500.0, 0.0};
    auto planned = system.set_destination(agent_id, destination, navkit_nav::NavQuery::Accuracy,
                                          navkit_nav::NavPathMode::Accuracy, mesh_id);
    if (!planned) {
        NAVKIT_LOG_ERROR("Failed to plan path: {}", planned.error().message);
        return 1;
    }

    int tick = 0;
    for (; tick < MAX_TICKS && !arrived; ++tick) {
        system.update(TICK);
        if (tick % 60 == 0) {
            NAVKIT_LOG_DEBUG("t={:.2f}s agent at {}", tick * TICK, format_point(agent->position()));
        }
    }

    if (!arrived) {
        NAVKIT_LOG_ERROR("Agent did not arrive after {} ticks, stopped at {}", tick,
                      format_point(agent->position()));
        return 1;
    }

    NAVKIT_LOG_INFO("Agent arrived at {} after {:.2f}s", format_point(agent->position()), tick * TICK);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    fs::path config_path;
    fs::path mesh_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "--config" || arg == "--mesh") && i + 1 < argc) {
            (arg == "--config" ? config_path : mesh_path) = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    navkit_core::init_logging();
    const int code = run_demo(config_path, mesh_path);
    navkit_core::shutdown_logging();
    return code;
}
