#pragma once

/// @file error.hpp
/// @brief Error and Result types shared by every navkit module

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace navkit_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Broad category of an Error
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        default: return "Unknown";
    }
}

// =============================================================================
// NavError
// =============================================================================

/// Failure of a mesh, query, registry or agent operation
struct NavError {
    enum class Kind : std::uint8_t {
        InvalidTriangle,    // Bad vertex index or degenerate triangle at mesh construction
        PointOutsideMesh,   // Query point could not be snapped onto the mesh
        NoPath,             // No route between the snapped start and destination
        MeshNotFound,       // Mesh id not present in the registry
        AgentNotFound,      // Agent id not present in the navigation system
    };

    Kind kind{Kind::NoPath};
    std::string message;
    std::uint32_t index{0};  // Triangle index for InvalidTriangle, raw id otherwise

    [[nodiscard]] static NavError invalid_triangle(std::uint32_t triangle, const std::string& reason) {
        return NavError{Kind::InvalidTriangle,
            "Invalid triangle " + std::to_string(triangle) + ": " + reason, triangle};
    }

    [[nodiscard]] static NavError point_outside_mesh(const std::string& what) {
        return NavError{Kind::PointOutsideMesh, "Point outside mesh: " + what, 0};
    }

    [[nodiscard]] static NavError no_path(std::uint32_t from_triangle, std::uint32_t to_triangle) {
        return NavError{Kind::NoPath,
            "No path from triangle " + std::to_string(from_triangle) +
            " to triangle " + std::to_string(to_triangle), to_triangle};
    }

    [[nodiscard]] static NavError mesh_not_found(std::uint32_t id) {
        return NavError{Kind::MeshNotFound, "Nav mesh not found: " + std::to_string(id), id};
    }

    [[nodiscard]] static NavError agent_not_found(std::uint32_t id) {
        return NavError{Kind::AgentNotFound, "Nav agent not found: " + std::to_string(id), id};
    }
};

[[nodiscard]] inline const char* nav_error_kind_name(NavError::Kind kind) {
    switch (kind) {
        case NavError::Kind::InvalidTriangle: return "InvalidTriangle";
        case NavError::Kind::PointOutsideMesh: return "PointOutsideMesh";
        case NavError::Kind::NoPath: return "NoPath";
        case NavError::Kind::MeshNotFound: return "MeshNotFound";
        case NavError::Kind::AgentNotFound: return "AgentNotFound";
        default: return "Unknown";
    }
}

// =============================================================================
// Error
// =============================================================================

/// @brief General error: a NavError or a plain message, with a code and context
///
/// Loaders and configuration code return this; a NavError converts
/// implicitly and keeps its kind reachable through as<NavError>().
class Error {
public:
    using Variant = std::variant<NavError, std::string>;

    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(NavError err) : m_code(code_for(err.kind)), m_error(std::move(err)) {}
    Error(std::string msg) : m_code(ErrorCode::Unknown), m_error(std::move(msg)) {}
    Error(const char* msg) : Error(std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_error(std::move(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] std::string message() const {
        if (const auto* nav = std::get_if<NavError>(&m_error)) {
            return nav->message;
        }
        return std::get<std::string>(m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Attach a key/value pair, e.g. the file being loaded
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode code_for(NavError::Kind kind) {
        switch (kind) {
            case NavError::Kind::InvalidTriangle: return ErrorCode::ValidationError;
            case NavError::Kind::PointOutsideMesh: return ErrorCode::InvalidArgument;
            default: return ErrorCode::NotFound;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// @brief Value or error
///
/// Both constructors are implicit so functions can `return value;` or
/// `return NavError::no_path(a, b);` directly.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Value access; undefined on error
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }
    [[nodiscard]] T* operator->() { return &*m_value; }
    [[nodiscard]] const T* operator->() const { return &*m_value; }

    /// Error access; undefined on success
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T fallback) const {
        return m_value.has_value() ? *m_value : std::move(fallback);
    }

    /// Value, or std::runtime_error on error
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
        return std::move(*m_value);
    }

    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Convert the error, e.g. a NavError into an Error
    template<typename F>
    auto map_err(F&& func) -> Result<T, decltype(func(std::declval<E>()))> {
        using U = decltype(func(std::declval<E>()));
        if (m_value.has_value()) {
            return Result<T, U>(std::move(*m_value));
        }
        return Result<T, U>(func(std::move(m_error)));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Success-or-error with no value
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_ok(true) {}
    Result(E error) : m_error(std::move(error)), m_ok(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_ok; }
    [[nodiscard]] bool is_err() const noexcept { return !m_ok; }
    explicit operator bool() const noexcept { return m_ok; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    void unwrap() const {
        if (!m_ok) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
    }

private:
    E m_error;
    bool m_ok;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

/// One-line description: code, NavError kind, message and context
std::string build_error_chain(const Error& error);

} // namespace navkit_core
