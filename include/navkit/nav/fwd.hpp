/// @file fwd.hpp
/// @brief Forward declarations for navkit_nav module

#pragma once

#include <compare>
#include <cstdint>
#include <functional>

namespace navkit_nav {

// =============================================================================
// Strong ID Types
// =============================================================================

/// @brief Strongly-typed navmesh ID (registry handle, never reused)
struct NavMeshId {
    std::uint32_t value{0};
    explicit operator bool() const { return value != 0; }
    bool operator==(const NavMeshId&) const = default;
    auto operator<=>(const NavMeshId&) const = default;
};

/// @brief Strongly-typed agent ID
struct AgentId {
    std::uint32_t value{0};
    explicit operator bool() const { return value != 0; }
    bool operator==(const AgentId&) const = default;
    auto operator<=>(const AgentId&) const = default;
};

/// @brief Tag selecting the movement driver of an agent
struct NavDriverTag {
    std::uint32_t value{0};
    bool operator==(const NavDriverTag&) const = default;
    auto operator<=>(const NavDriverTag&) const = default;

    /// No built-in movement; the host moves the agent itself
    static constexpr NavDriverTag manual() { return NavDriverTag{0}; }
    /// Built-in constant-speed path following
    static constexpr NavDriverTag simple() { return NavDriverTag{1}; }
};

// =============================================================================
// Forward Declarations
// =============================================================================

struct NavTriangle;
struct NavPoint;
struct PathProjection;
struct PathAdvance;
struct AdvanceOptions;
struct NavAgentDestination;
struct NavConfig;
struct NavMeshDescription;

enum class NavQuery : std::uint8_t;
enum class NavPathMode : std::uint8_t;
enum class NavAgentState : std::uint8_t;
enum class PathSearchStatus : std::uint8_t;

class NavMesh;
class NavPath;
class NavMeshQuery;
class PathSearch;
class NavMeshRegistry;
class NavAgent;
class NavigationSystem;

} // namespace navkit_nav

// =============================================================================
// Hash Specializations
// =============================================================================

namespace std {
    template<> struct hash<navkit_nav::NavMeshId> {
        std::size_t operator()(const navkit_nav::NavMeshId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };
    template<> struct hash<navkit_nav::AgentId> {
        std::size_t operator()(const navkit_nav::AgentId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };
    template<> struct hash<navkit_nav::NavDriverTag> {
        std::size_t operator()(const navkit_nav::NavDriverTag& tag) const noexcept {
            return std::hash<std::uint32_t>{}(tag.value);
        }
    };
}
