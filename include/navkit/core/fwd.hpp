#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for navkit_core module

#include <cstdint>

namespace navkit_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct NavError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace navkit_core
