/// @file registry.cpp
/// @brief NavMeshRegistry implementation

#include <navkit/nav/registry.hpp>
#include <navkit/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace navkit_nav {

NavMeshId NavMeshRegistry::register_mesh(NavMesh mesh, std::string_view name) {
    auto shared = std::make_shared<const NavMesh>(std::move(mesh));

    NavMeshId id;
    {
        std::unique_lock lock(m_mutex);
        id = NavMeshId{m_next_id++};
        m_meshes[id] = shared;
        if (!name.empty()) {
            m_names[std::string(name)] = id;
        }
    }

    auto logger = navkit_core::nav_logger();
    logger->info("Registered nav mesh {} '{}': {} vertices, {} triangles, {} islands",
                 id.value, name, shared->vertex_count(), shared->triangle_count(),
                 shared->island_count());
    if (shared->non_manifold_edge_count() > 0) {
        logger->warn("Nav mesh {} has {} non-manifold edges; only the first two owners are linked",
                     id.value, shared->non_manifold_edge_count());
    }
    return id;
}

bool NavMeshRegistry::unregister_mesh(NavMeshId id) {
    {
        std::unique_lock lock(m_mutex);
        if (m_meshes.erase(id) == 0) {
            return false;
        }
        for (auto it = m_names.begin(); it != m_names.end(); ) {
            if (it->second == id) {
                it = m_names.erase(it);
            } else {
                ++it;
            }
        }
    }

    navkit_core::nav_logger()->info("Unregistered nav mesh {}", id.value);
    return true;
}

std::shared_ptr<const NavMesh> NavMeshRegistry::lookup(NavMeshId id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_meshes.find(id);
    return it != m_meshes.end() ? it->second : nullptr;
}

navkit_core::Result<std::shared_ptr<const NavMesh>, navkit_core::NavError>
NavMeshRegistry::get(NavMeshId id) const {
    auto mesh = lookup(id);
    if (!mesh) {
        return navkit_core::NavError::mesh_not_found(id.value);
    }
    return mesh;
}

NavMeshId NavMeshRegistry::find(std::string_view name) const {
    std::shared_lock lock(m_mutex);
    auto it = m_names.find(std::string(name));
    return it != m_names.end() ? it->second : NavMeshId{};
}

bool NavMeshRegistry::contains(NavMeshId id) const {
    std::shared_lock lock(m_mutex);
    return m_meshes.count(id) > 0;
}

std::size_t NavMeshRegistry::size() const {
    std::shared_lock lock(m_mutex);
    return m_meshes.size();
}

std::vector<NavMeshId> NavMeshRegistry::ids() const {
    std::vector<NavMeshId> result;
    {
        std::shared_lock lock(m_mutex);
        result.reserve(m_meshes.size());
        for (const auto& [id, mesh] : m_meshes) {
            result.push_back(id);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void NavMeshRegistry::clear() {
    std::unique_lock lock(m_mutex);
    m_meshes.clear();
    m_names.clear();
}

} // namespace navkit_nav
