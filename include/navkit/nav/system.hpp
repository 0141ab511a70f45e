/// @file system.hpp
/// @brief High-level navigation system: agents, re-planning and drivers

#pragma once

#include "fwd.hpp"
#include "agent.hpp"
#include "config.hpp"
#include "driver.hpp"

#include <navkit/core/error.hpp>

#include <map>
#include <memory>
#include <unordered_map>
#include <vector>

namespace navkit_nav {

// =============================================================================
// NavigationSystem
// =============================================================================

/// @brief Owns agents and ticks them against a mesh registry
///
/// Each update runs a maintain pass, which re-plans agents chasing another
/// agent once the target has moved more than `replan_distance`, followed by
/// a driver pass that moves every agent with a path using the driver
/// registered for its tag. Agents are visited in id order.
///
/// Agents destroyed from a callback during update() disappear from lookups
/// at once and are released when the update ends.
class NavigationSystem {
public:
    explicit NavigationSystem(const NavMeshRegistry& registry, NavConfig config = NavConfig{});
    ~NavigationSystem();

    NavigationSystem(const NavigationSystem&) = delete;
    NavigationSystem& operator=(const NavigationSystem&) = delete;

    // Agent management
    AgentId create_agent(const NavVec3& position);
    bool destroy_agent(AgentId id);
    NavAgent* get_agent(AgentId id);
    const NavAgent* get_agent(AgentId id) const;
    std::vector<AgentId> agent_ids() const;
    std::size_t agent_count() const { return m_agents.size() - m_pending_destroy.size(); }

    // Destinations

    /// @brief Plan an agent toward a point or another agent
    /// @return AgentNotFound for unknown agent ids, otherwise the planning error
    navkit_core::Result<void, navkit_core::NavError> set_destination(AgentId id,
                                                                     const NavAgentTarget& target,
                                                                     NavQuery query,
                                                                     NavPathMode mode,
                                                                     NavMeshId mesh);

    /// @brief Same as above with the configured default query and path mode
    navkit_core::Result<void, navkit_core::NavError> set_destination(AgentId id,
                                                                     const NavAgentTarget& target,
                                                                     NavMeshId mesh);

    // Drivers
    void register_driver(NavDriverTag tag, NavDriver driver);
    bool has_driver(NavDriverTag tag) const { return m_drivers.count(tag) > 0; }

    // Update
    void update(double dt);

    const NavConfig& config() const { return m_config; }
    const NavMeshRegistry& registry() const { return m_registry; }

private:
    void maintain();
    void drive(double dt);
    bool is_pending_destroy(AgentId id) const;
    void release_pending();

    const NavMeshRegistry& m_registry;
    NavConfig m_config;
    std::map<AgentId, std::unique_ptr<NavAgent>> m_agents;
    std::unordered_map<NavDriverTag, NavDriver> m_drivers;
    std::uint32_t m_next_agent_id{1};
    bool m_updating{false};
    std::vector<AgentId> m_pending_destroy;
};

} // namespace navkit_nav
