/// @file error.cpp
/// @brief Error formatting for xref_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error chain formatting used when logging edge failures
/// - Explicit template instantiations for common Result types

#include <xref_engine/core/error.hpp>
#include <sstream>

namespace xref_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format index error with full context
std::string format_index_error(const IndexError& err) {
    std::ostringstream oss;
    oss << "[IndexError] " << err.message;

    if (!err.type_name.empty()) {
        oss << " (type: " << err.type_name << ")";
    }
    if (!err.member_name.empty()) {
        oss << " (member: " << err.member_name << ")";
    }

    return oss.str();
}

/// Format configuration error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, IndexError>) {
            oss << detail::format_index_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

} // namespace xref_core
