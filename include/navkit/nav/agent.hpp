/// @file agent.hpp
/// @brief Navigation agent state for navkit_nav

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "path.hpp"

#include <navkit/core/error.hpp>

#include <functional>
#include <optional>
#include <variant>

namespace navkit_nav {

// =============================================================================
// Agent Types
// =============================================================================

enum class NavAgentState : std::uint8_t {
    Idle,       ///< No destination, no path
    Seeking,    ///< Destination set, path being computed
    Following   ///< Path available, driver moves the agent along it
};

[[nodiscard]] inline const char* nav_agent_state_name(NavAgentState state) {
    switch (state) {
        case NavAgentState::Idle: return "Idle";
        case NavAgentState::Seeking: return "Seeking";
        case NavAgentState::Following: return "Following";
        default: return "Unknown";
    }
}

/// @brief Where an agent is heading: a fixed point or another agent
using NavAgentTarget = std::variant<NavVec3, AgentId>;

/// @brief Destination with the settings used to plan toward it
struct NavAgentDestination {
    NavAgentTarget target;
    NavVec3 point{0.0};     ///< Point the current path was planned to
    NavQuery query{NavQuery::Accuracy};
    NavPathMode mode{NavPathMode::Accuracy};
    NavMeshId mesh;
};

// =============================================================================
// NavAgent
// =============================================================================

/// @brief Per-entity navigation state
///
/// The agent plans its own path but never moves itself; a driver advances
/// it along the path each tick.
class NavAgent {
public:
    NavAgent() = default;
    explicit NavAgent(const NavVec3& position, double speed = 10.0);

    // Destination

    /// @brief Plan a path to a fixed point
    ///
    /// On failure the agent is left Idle with no destination and no path.
    navkit_core::Result<void, navkit_core::NavError> set_destination(const NavVec3& point,
                                                                     NavQuery query,
                                                                     NavPathMode mode,
                                                                     NavMeshId mesh,
                                                                     const NavMeshRegistry& registry);

    /// @brief Plan a path toward another agent's current position
    navkit_core::Result<void, navkit_core::NavError> set_destination(AgentId target,
                                                                     const NavVec3& target_position,
                                                                     NavQuery query,
                                                                     NavPathMode mode,
                                                                     NavMeshId mesh,
                                                                     const NavMeshRegistry& registry);

    /// @brief Re-plan toward a new position of the current target
    ///
    /// Keeps the stored query, mode and mesh. No-op without a destination.
    navkit_core::Result<void, navkit_core::NavError> replan(const NavVec3& target_point,
                                                            const NavMeshRegistry& registry);

    /// Drop path and destination
    void clear_path();

    /// Drop path and destination after reaching the end
    void finish_path();

    // State
    NavAgentState state() const { return m_state; }
    bool is_idle() const { return m_state == NavAgentState::Idle; }
    bool has_path() const { return m_state == NavAgentState::Following && !m_path.empty(); }
    const NavPath& path() const { return m_path; }
    const std::optional<NavAgentDestination>& destination() const { return m_destination; }

    /// Arc length travelled along the current path
    double progress() const { return m_progress; }
    void set_progress(double progress) { m_progress = progress; }

    // Movement
    const NavVec3& position() const { return m_position; }
    void set_position(const NavVec3& position) { m_position = position; }

    const NavVec3& direction() const { return m_direction; }
    void set_direction(const NavVec3& direction);

    double speed() const { return m_speed; }
    void set_speed(double speed) { m_speed = speed > 0.0 ? speed : 0.0; }

    double min_target_distance() const { return m_min_target_distance; }
    void set_min_target_distance(double distance) {
        m_min_target_distance = distance > 0.0 ? distance : 0.0;
    }

    NavDriverTag driver() const { return m_driver; }
    void set_driver(NavDriverTag driver) { m_driver = driver; }

    // Events
    using PathFoundCallback = std::function<void(const NavPath&)>;
    using PathFailedCallback = std::function<void(const navkit_core::NavError&)>;
    void on_path_found(PathFoundCallback callback) { m_on_path_found = std::move(callback); }
    void on_path_failed(PathFailedCallback callback) { m_on_path_failed = std::move(callback); }
    void on_destination_reached(std::function<void()> callback) { m_on_reached = std::move(callback); }

private:
    navkit_core::Result<void, navkit_core::NavError> plan(NavAgentDestination destination,
                                                          const NavMeshRegistry& registry);
    navkit_core::NavError fail(navkit_core::NavError error);

    NavVec3 m_position{0.0};
    NavVec3 m_direction{1.0, 0.0, 0.0};
    double m_speed{10.0};
    double m_min_target_distance{0};
    NavDriverTag m_driver{NavDriverTag::simple()};

    NavAgentState m_state{NavAgentState::Idle};
    std::optional<NavAgentDestination> m_destination;
    NavPath m_path;
    double m_progress{0};

    PathFoundCallback m_on_path_found;
    PathFailedCallback m_on_path_failed;
    std::function<void()> m_on_reached;
};

} // namespace navkit_nav
