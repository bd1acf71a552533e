#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for xref_core module

#include <cstdint>

namespace xref_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct IndexError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace xref_core
