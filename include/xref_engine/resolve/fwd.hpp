#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for xref_resolve module

#include <cstdint>

namespace xref_resolve {

// =============================================================================
// Configuration
// =============================================================================

struct ResolverConfig;

// =============================================================================
// Identity
// =============================================================================

struct ExportedMember;
struct ExportedMemberInfo;
struct ExportDerivation;

// =============================================================================
// State
// =============================================================================

struct BuildStats;
class StateBuilder;
class State;

// =============================================================================
// Query & Cache
// =============================================================================

enum class NavigationDirection : std::uint8_t;
struct Navigation;
struct StateCacheStats;
class StateCache;

} // namespace xref_resolve
