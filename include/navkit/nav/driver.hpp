/// @file driver.hpp
/// @brief Movement drivers that advance agents along their paths

#pragma once

#include "fwd.hpp"
#include "path.hpp"

#include <functional>

namespace navkit_nav {

/// @brief Moves one agent for one tick
using NavDriver = std::function<void(NavAgent& agent, double dt)>;

/// @brief Constant-speed path following
///
/// Looks ahead by max(speed * dt, min_target_distance) along the path from
/// the agent's progress and moves toward that point by at most speed * dt.
/// The agent finishes its path once it stands on the final point, and drops
/// the path when it has strayed beyond `options.tolerance`.
void simple_nav_driver(NavAgent& agent, double dt, const AdvanceOptions& options = {});

/// @brief Bind simple_nav_driver to a fixed set of options
NavDriver make_simple_nav_driver(AdvanceOptions options);

} // namespace navkit_nav
