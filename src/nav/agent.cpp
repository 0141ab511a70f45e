/// @file agent.cpp
/// @brief NavAgent implementation

#include <navkit/nav/agent.hpp>
#include <navkit/nav/query.hpp>
#include <navkit/nav/registry.hpp>
#include <navkit/math/math.hpp>

namespace navkit_nav {

using navkit_core::NavError;
using navkit_core::Result;

NavAgent::NavAgent(const NavVec3& position, double speed)
    : m_position(position) {
    set_speed(speed);
}

void NavAgent::set_direction(const NavVec3& direction) {
    const NavVec3 unit = navkit_math::normalize_or_zero(direction);
    if (glm::length2(unit) > 0.0) {
        m_direction = unit;
    }
}

Result<void, NavError> NavAgent::set_destination(const NavVec3& point,
                                                 NavQuery query,
                                                 NavPathMode mode,
                                                 NavMeshId mesh,
                                                 const NavMeshRegistry& registry) {
    return plan(NavAgentDestination{point, point, query, mode, mesh}, registry);
}

Result<void, NavError> NavAgent::set_destination(AgentId target,
                                                 const NavVec3& target_position,
                                                 NavQuery query,
                                                 NavPathMode mode,
                                                 NavMeshId mesh,
                                                 const NavMeshRegistry& registry) {
    return plan(NavAgentDestination{target, target_position, query, mode, mesh}, registry);
}

Result<void, NavError> NavAgent::replan(const NavVec3& target_point, const NavMeshRegistry& registry) {
    if (!m_destination) {
        return Result<void, NavError>();
    }

    NavAgentDestination destination = *m_destination;
    destination.point = target_point;
    if (std::holds_alternative<NavVec3>(destination.target)) {
        destination.target = target_point;
    }
    return plan(std::move(destination), registry);
}

void NavAgent::clear_path() {
    m_state = NavAgentState::Idle;
    m_destination.reset();
    m_path = NavPath();
    m_progress = 0;
}

void NavAgent::finish_path() {
    clear_path();
    if (m_on_reached) {
        m_on_reached();
    }
}

Result<void, NavError> NavAgent::plan(NavAgentDestination destination, const NavMeshRegistry& registry) {
    m_state = NavAgentState::Seeking;
    m_destination = std::move(destination);
    m_path = NavPath();
    m_progress = 0;

    auto mesh = registry.lookup(m_destination->mesh);
    if (!mesh) {
        return fail(NavError::mesh_not_found(m_destination->mesh.value));
    }

    auto path = find_path(*mesh, m_position, m_destination->point,
                          m_destination->query, m_destination->mode);
    if (!path) {
        return fail(std::move(path.error()));
    }

    m_path = std::move(path).value();
    m_state = NavAgentState::Following;
    if (m_path.size() > 1) {
        set_direction(m_path[1] - m_path[0]);
    }
    if (m_on_path_found) {
        m_on_path_found(m_path);
    }
    return Result<void, NavError>();
}

NavError NavAgent::fail(NavError error) {
    clear_path();
    if (m_on_path_failed) {
        m_on_path_failed(error);
    }
    return error;
}

} // namespace navkit_nav
