#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for navkit_math types

#include <glm/fwd.hpp>

namespace navkit_math {

/// All navigation geometry is double precision
using DVec3 = glm::dvec3;

struct DAabb;

} // namespace navkit_math
