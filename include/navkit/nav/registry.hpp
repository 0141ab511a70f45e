/// @file registry.hpp
/// @brief Shared registry of navigation meshes for navkit_nav

#pragma once

#include "fwd.hpp"
#include "navmesh.hpp"

#include <navkit/core/error.hpp>

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace navkit_nav {

// =============================================================================
// NavMeshRegistry
// =============================================================================

/// @brief Owns navigation meshes by handle
///
/// Meshes are immutable once registered and handed out as shared pointers,
/// so a lookup stays valid after the mesh is unregistered. Many readers may
/// query concurrently with a single writer. Ids are never reused.
class NavMeshRegistry {
public:
    NavMeshRegistry() = default;

    NavMeshRegistry(const NavMeshRegistry&) = delete;
    NavMeshRegistry& operator=(const NavMeshRegistry&) = delete;

    /// @brief Take ownership of a mesh
    /// @param name Optional lookup name; a later mesh with the same name replaces the binding
    NavMeshId register_mesh(NavMesh mesh, std::string_view name = "");

    /// @brief Remove a mesh
    /// @return false if the id was not registered
    bool unregister_mesh(NavMeshId id);

    /// @brief Mesh for an id, or nullptr
    std::shared_ptr<const NavMesh> lookup(NavMeshId id) const;

    /// @brief Mesh for an id, or MeshNotFound
    navkit_core::Result<std::shared_ptr<const NavMesh>, navkit_core::NavError> get(NavMeshId id) const;

    /// @brief Id registered under a name, or an invalid id
    NavMeshId find(std::string_view name) const;

    bool contains(NavMeshId id) const;
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    /// Registered ids in ascending order
    std::vector<NavMeshId> ids() const;

    void clear();

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<NavMeshId, std::shared_ptr<const NavMesh>> m_meshes;
    std::unordered_map<std::string, NavMeshId> m_names;
    std::uint32_t m_next_id{1};
};

} // namespace navkit_nav
