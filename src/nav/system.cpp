/// @file system.cpp
/// @brief NavigationSystem implementation

#include <navkit/nav/system.hpp>
#include <navkit/nav/registry.hpp>
#include <navkit/core/log.hpp>

#include <algorithm>

namespace navkit_nav {

using navkit_core::NavError;
using navkit_core::Result;

NavigationSystem::NavigationSystem(const NavMeshRegistry& registry, NavConfig config)
    : m_registry(registry)
    , m_config(std::move(config)) {
    register_driver(NavDriverTag::simple(), make_simple_nav_driver(m_config.advance_options()));
}

NavigationSystem::~NavigationSystem() = default;

// =============================================================================
// Agents
// =============================================================================

AgentId NavigationSystem::create_agent(const NavVec3& position) {
    AgentId id{m_next_agent_id++};
    auto agent = std::make_unique<NavAgent>(position, m_config.agent_speed);
    agent->set_min_target_distance(m_config.agent_min_target_distance);
    m_agents[id] = std::move(agent);
    return id;
}

bool NavigationSystem::destroy_agent(AgentId id) {
    if (m_agents.count(id) == 0 || is_pending_destroy(id)) {
        return false;
    }
    if (m_updating) {
        // The agent may be inside one of its own callbacks
        m_pending_destroy.push_back(id);
        return true;
    }
    m_agents.erase(id);
    return true;
}

NavAgent* NavigationSystem::get_agent(AgentId id) {
    auto it = m_agents.find(id);
    if (it == m_agents.end() || is_pending_destroy(id)) {
        return nullptr;
    }
    return it->second.get();
}

const NavAgent* NavigationSystem::get_agent(AgentId id) const {
    auto it = m_agents.find(id);
    if (it == m_agents.end() || is_pending_destroy(id)) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<AgentId> NavigationSystem::agent_ids() const {
    std::vector<AgentId> ids;
    ids.reserve(m_agents.size());
    for (const auto& [id, agent] : m_agents) {
        if (!is_pending_destroy(id)) {
            ids.push_back(id);
        }
    }
    return ids;
}

bool NavigationSystem::is_pending_destroy(AgentId id) const {
    return std::find(m_pending_destroy.begin(), m_pending_destroy.end(), id) != m_pending_destroy.end();
}

void NavigationSystem::release_pending() {
    for (AgentId id : m_pending_destroy) {
        m_agents.erase(id);
    }
    m_pending_destroy.clear();
}

// =============================================================================
// Destinations
// =============================================================================

Result<void, NavError> NavigationSystem::set_destination(AgentId id,
                                                         const NavAgentTarget& target,
                                                         NavQuery query,
                                                         NavPathMode mode,
                                                         NavMeshId mesh) {
    NavAgent* agent = get_agent(id);
    if (!agent) {
        return NavError::agent_not_found(id.value);
    }

    if (const auto* point = std::get_if<NavVec3>(&target)) {
        return agent->set_destination(*point, query, mode, mesh, m_registry);
    }

    const AgentId target_id = std::get<AgentId>(target);
    const NavAgent* target_agent = get_agent(target_id);
    if (!target_agent) {
        agent->clear_path();
        return NavError::agent_not_found(target_id.value);
    }
    return agent->set_destination(target_id, target_agent->position(), query, mode, mesh, m_registry);
}

Result<void, NavError> NavigationSystem::set_destination(AgentId id,
                                                         const NavAgentTarget& target,
                                                         NavMeshId mesh) {
    return set_destination(id, target, m_config.default_query, m_config.default_path_mode, mesh);
}

// =============================================================================
// Drivers
// =============================================================================

void NavigationSystem::register_driver(NavDriverTag tag, NavDriver driver) {
    if (driver) {
        m_drivers[tag] = std::move(driver);
    } else {
        m_drivers.erase(tag);
    }
}

// =============================================================================
// Update
// =============================================================================

void NavigationSystem::update(double dt) {
    struct UpdateScope {
        NavigationSystem& system;
        explicit UpdateScope(NavigationSystem& s) : system(s) { system.m_updating = true; }
        ~UpdateScope() {
            system.m_updating = false;
            system.release_pending();
        }
    } scope(*this);

    maintain();
    drive(dt);
}

void NavigationSystem::maintain() {
    for (auto& [id, agent] : m_agents) {
        if (is_pending_destroy(id)) {
            continue;
        }

        const auto& destination = agent->destination();
        if (!destination) {
            continue;
        }

        const auto* followed = std::get_if<AgentId>(&destination->target);
        if (!followed) {
            continue;
        }

        // Re-planning replaces the destination, so keep a copy of the id
        const AgentId target_id = *followed;
        const NavAgent* target = get_agent(target_id);
        if (!target) {
            navkit_core::nav_logger()->warn("Agent {} lost its target agent {}", id.value, target_id.value);
            agent->clear_path();
            continue;
        }

        if (glm::distance(target->position(), destination->point) <= m_config.replan_distance) {
            continue;
        }

        auto result = agent->replan(target->position(), m_registry);
        if (!result) {
            navkit_core::nav_logger()->warn("Agent {} failed to re-plan toward agent {}: {}",
                                            id.value, target_id.value, result.error().message);
        }
    }
}

void NavigationSystem::drive(double dt) {
    for (auto& [id, agent] : m_agents) {
        if (is_pending_destroy(id) || !agent->has_path()) {
            continue;
        }

        auto it = m_drivers.find(agent->driver());
        if (it == m_drivers.end()) {
            continue;
        }

        it->second(*agent, dt);
        if (agent->is_idle() && !is_pending_destroy(id)) {
            navkit_core::nav_logger()->debug("Agent {} stopped at ({}, {}, {})", id.value,
                                             agent->position().x, agent->position().y,
                                             agent->position().z);
        }
    }
}

} // namespace navkit_nav
