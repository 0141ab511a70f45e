/// @file nav.hpp
/// @brief Main include file for navkit_nav
///
/// @code
/// #include <navkit/nav/nav.hpp>
/// using namespace navkit_nav;
///
/// auto mesh = NavMesh::create(vertices, triangles);
/// NavMeshRegistry registry;
/// NavMeshId id = registry.register_mesh(std::move(*mesh), "level");
///
/// NavigationSystem system(registry);
/// AgentId agent = system.create_agent({400.0, 450.0, 0.0});
/// system.set_destination(agent, NavVec3{700.0, 500.0, 0.0}, id);
/// system.update(1.0 / 60.0);
/// @endcode

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "navmesh.hpp"
#include "path.hpp"
#include "query.hpp"
#include "registry.hpp"
#include "agent.hpp"
#include "driver.hpp"
#include "config.hpp"
#include "system.hpp"
