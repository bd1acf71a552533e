#pragma once

/// @file identity.hpp
/// @brief Derivation of ExportedMember identities from annotated declarations
///
/// Every derivation degrades to "no identity" when annotations are missing,
/// incomplete or contradictory. Nothing here fails.

#include "fwd.hpp"
#include "config.hpp"
#include "exported_member.hpp"
#include "state.hpp"
#include <xref_engine/index/declaration.hpp>

#include <optional>
#include <string>
#include <vector>

namespace xref_resolve {

// =============================================================================
// Name helpers
// =============================================================================

/// Reduce a qualified or class-literal type name to its simple name:
/// "net.runelite.rs.api.RSNpc" and "RSNpc.class" both give "RSNpc"
[[nodiscard]] std::string simple_type_name(const std::string& type_name);

/// Strip the mirror prefix. Returns nullopt if the name does not carry it.
[[nodiscard]] std::optional<std::string> strip_mirror_prefix(const std::string& type_name,
                                                             const std::string& prefix);

/// First argument across the mixin relations, in priority order
[[nodiscard]] std::optional<std::string> mixin_relation_name(const xref_index::Declaration& decl);

/// Target types of a mixin type: the singular Mixin annotation if present,
/// otherwise the plural Mixins annotation, in declaration order
[[nodiscard]] std::vector<std::string> mixin_targets(const xref_index::TypeDecl& type);

// =============================================================================
// Derivation
// =============================================================================

/// Result of reading an export annotation without touching any state
struct ExportDerivation {
    ExportedMember member;
    /// Implements argument of the owning type, when present
    std::optional<std::string> implements;
    xref_index::TypeDeclPtr owner;
};

/// Identity of an export-annotated declaration. Pure: no side effects.
[[nodiscard]] std::optional<ExportDerivation> derive_export(const ResolverConfig& config,
                                                            const xref_index::Declaration& decl);

/// Identity of an export; records the owning type as implementer of its API name
[[nodiscard]] std::optional<ExportedMember> from_exported(StateBuilder& builder,
                                                          const xref_index::Declaration& decl);

/// Identity an import refers to. Instance identity first, then the static one.
/// The returned identity may still be unexported.
[[nodiscard]] std::optional<ExportedMember> from_imported(const StateBuilder& builder,
                                                          const xref_index::Declaration& decl);

/// Exported identities a mixin-relation declaration refers to. May register
/// a constructor export for a single-constructor implementer.
[[nodiscard]] MemberSet from_mixin(StateBuilder& builder, const xref_index::Declaration& decl);

} // namespace xref_resolve
