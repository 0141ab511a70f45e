/// @file driver.cpp
/// @brief Built-in navigation drivers

#include <navkit/nav/driver.hpp>
#include <navkit/nav/agent.hpp>
#include <navkit/math/math.hpp>

#include <algorithm>

namespace navkit_nav {

void simple_nav_driver(NavAgent& agent, double dt, const AdvanceOptions& options) {
    if (!agent.has_path() || !(dt > 0.0)) {
        return;
    }

    const NavPath& path = agent.path();
    const NavVec3 position = agent.position();
    const double step = agent.speed() * dt;
    const double look_ahead = std::max(step, agent.min_target_distance());
    if (!(look_ahead > 0.0)) {
        // Paused agents keep their path
        return;
    }

    AdvanceOptions follow = options;
    follow.min_progress = agent.progress();

    const auto next = advance(path, position, look_ahead, follow);
    if (!next) {
        if (glm::distance(position, path.back()) <= options.arrival_epsilon) {
            agent.set_position(path.back());
            agent.finish_path();
        } else {
            agent.clear_path();
        }
        return;
    }

    const NavVec3 to_target = next->point - position;
    const double distance = glm::length(to_target);
    NavVec3 moved = position;
    if (distance > 0.0) {
        moved = position + to_target * (std::min(step, distance) / distance);
        agent.set_direction(to_target);
    }

    if (next->arrived && glm::distance(moved, path.back()) <= options.arrival_epsilon) {
        agent.set_position(path.back());
        agent.finish_path();
        return;
    }

    agent.set_position(moved);
    if (const auto projection = path.project(moved, follow.min_progress)) {
        agent.set_progress(projection->progress);
    }
}

NavDriver make_simple_nav_driver(AdvanceOptions options) {
    return [options](NavAgent& agent, double dt) {
        simple_nav_driver(agent, dt, options);
    };
}

} // namespace navkit_nav
