#pragma once

/// @file exported_member.hpp
/// @brief Canonical identity of an exported member

#include "fwd.hpp"
#include <xref_engine/core/hash.hpp>
#include <xref_engine/index/declaration.hpp>

#include <compare>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace xref_resolve {

/// Location used for statically scoped members
inline constexpr const char* STATIC_LOCATION = "<static>";

/// Member name that denotes a constructor in mixin relations
inline constexpr const char* CONSTRUCTOR_NAME = "<init>";

// =============================================================================
// ExportedMember
// =============================================================================

/// Identity (name, location) of a logical exported member. Location is the
/// static marker or the external API name of the owning type.
struct ExportedMember {
    std::string name;
    std::string location;

    [[nodiscard]] static ExportedMember of(std::string name, std::string location) {
        return ExportedMember{std::move(name), std::move(location)};
    }

    /// "location.name"
    [[nodiscard]] std::string to_string() const {
        return location + "." + name;
    }

    auto operator<=>(const ExportedMember&) const = default;
    bool operator==(const ExportedMember&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const ExportedMember& member) {
    return os << member.to_string();
}

// =============================================================================
// ExportedMemberInfo
// =============================================================================

/// Bookkeeping for one export: its declaration and who references it
struct ExportedMemberInfo {
    /// First declaration that exported this identity
    xref_index::DeclarationPtr export_decl;
    /// Referencing declarations in insertion order, each at most once
    std::vector<xref_index::DeclarationPtr> references;
};

} // namespace xref_resolve

/// Hash specialization
template<>
struct std::hash<xref_resolve::ExportedMember> {
    std::size_t operator()(const xref_resolve::ExportedMember& member) const noexcept {
        return static_cast<std::size_t>(xref_core::hash_string_pair(member.name, member.location));
    }
};
