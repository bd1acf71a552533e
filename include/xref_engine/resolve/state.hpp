#pragma once

/// @file state.hpp
/// @brief Cross-reference state and the builder that produces it
///
/// A StateBuilder is the single mutable value threaded through the build
/// passes. finish() freezes it into a State, which is immutable and safe to
/// query from any thread.

#include "fwd.hpp"
#include "config.hpp"
#include "exported_member.hpp"
#include <xref_engine/index/declaration.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

namespace xref_resolve {

/// Identities a declaration references or originates, ordered
using MemberSet = std::set<ExportedMember>;

/// Exported identity -> export bookkeeping
using ExportTable = std::unordered_map<ExportedMember, ExportedMemberInfo>;

/// Recorded identities of one declaration
struct ReferenceEntry {
    xref_index::DeclarationPtr declaration;
    MemberSet members;
};

/// Declaration -> identities it references, keyed by handle address
using ReferenceTable = std::unordered_map<const xref_index::Declaration*, ReferenceEntry>;

/// External API type name -> type declaring it via Implements
using ImplementerTable = std::unordered_map<std::string, xref_index::TypeDeclPtr>;

// =============================================================================
// BuildStats
// =============================================================================

/// Counters collected while building a state
struct BuildStats {
    std::size_t exports = 0;                   ///< Distinct export identities
    std::size_t unresolved_exports = 0;        ///< Export declarations without an identity
    std::size_t duplicate_exports = 0;         ///< Export declarations whose identity was taken
    std::size_t imports_resolved = 0;
    std::size_t imports_dangling = 0;
    std::size_t mixins_resolved = 0;           ///< Mixin declarations with at least one match
    std::size_t mixins_unresolved = 0;
    std::size_t constructors_synthesized = 0;
    std::size_t implementer_conflicts = 0;     ///< Types re-declaring an API name
    std::int64_t build_us = 0;
};

// =============================================================================
// State
// =============================================================================

/// Resolved cross-reference graph of one codebase snapshot
class State {
    /// Constructor tag that only StateBuilder can create
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    explicit State(Passkey) {}

    /// Export bookkeeping for an identity
    [[nodiscard]] const ExportedMemberInfo* find_export(const ExportedMember& member) const;

    /// Identities recorded for a declaration
    [[nodiscard]] const MemberSet* find_members(const xref_index::Declaration& decl) const;

    /// Type implementing an external API name
    [[nodiscard]] xref_index::TypeDeclPtr find_implementer(const std::string& api_name) const;

    [[nodiscard]] const ExportTable& exports() const noexcept { return m_exports; }
    [[nodiscard]] const ReferenceTable& references() const noexcept { return m_references; }
    [[nodiscard]] const ImplementerTable& implementers() const noexcept { return m_implementers; }

    [[nodiscard]] const ResolverConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const BuildStats& stats() const noexcept { return m_stats; }

    /// Index modification count the state was built from
    [[nodiscard]] std::uint64_t version() const noexcept { return m_version; }

private:
    friend class StateBuilder;

    ResolverConfig m_config;
    ExportTable m_exports;
    ReferenceTable m_references;
    ImplementerTable m_implementers;
    BuildStats m_stats;
    std::uint64_t m_version = 0;
};

// =============================================================================
// StateBuilder
// =============================================================================

/// In-progress state for one build
class StateBuilder {
public:
    explicit StateBuilder(ResolverConfig config, std::uint64_t version = 0);

    // Non-copyable
    StateBuilder(const StateBuilder&) = delete;
    StateBuilder& operator=(const StateBuilder&) = delete;
    StateBuilder(StateBuilder&&) = default;
    StateBuilder& operator=(StateBuilder&&) = default;

    [[nodiscard]] const ResolverConfig& config() const noexcept { return m_state->m_config; }

    /// Register decl as an export of member. The first declaration of an
    /// identity is kept; member is always recorded for decl.
    /// @return true if the identity was new
    bool add_export(const ExportedMember& member, const xref_index::DeclarationPtr& decl);

    /// Record decl as referencing member. No-op if member is not exported.
    /// @return true if a new reference was recorded
    bool add_reference(const ExportedMember& member, const xref_index::DeclarationPtr& decl);

    [[nodiscard]] bool has_export(const ExportedMember& member) const;

    [[nodiscard]] const ExportedMemberInfo* find_export(const ExportedMember& member) const;

    /// Remember the type declaring api_name. The latest type wins; a change is logged.
    void record_implementer(const std::string& api_name, xref_index::TypeDeclPtr type);

    [[nodiscard]] xref_index::TypeDeclPtr find_implementer(const std::string& api_name) const;

    [[nodiscard]] BuildStats& stats() noexcept { return m_state->m_stats; }

    /// Freeze into an immutable state. The builder is empty afterwards.
    [[nodiscard]] std::shared_ptr<const State> finish() &&;

private:
    MemberSet& members_of(const xref_index::DeclarationPtr& decl);

    std::unique_ptr<State> m_state;
};

} // namespace xref_resolve
