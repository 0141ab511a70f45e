/// @file error.cpp
/// @brief Error formatting and common Result instantiations

#include <navkit/core/error.hpp>
#include <sstream>

namespace navkit_core {

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    if (const auto* nav = error.as<NavError>()) {
        oss << "[NavError:" << nav_error_kind_name(nav->kind) << "] " << nav->message;
    } else {
        oss << error.message();
    }

    const auto& context = error.context();
    if (!context.empty()) {
        oss << " {";
        for (auto it = context.begin(); it != context.end(); ++it) {
            if (it != context.begin()) {
                oss << ", ";
            }
            oss << it->first << "=" << it->second;
        }
        oss << "}";
    }

    return oss.str();
}

template class Result<void, Error>;
template class Result<void, NavError>;
template class Result<std::string, Error>;

} // namespace navkit_core
