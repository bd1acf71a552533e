#pragma once

/// @file query.hpp
/// @brief Read-only navigation queries against a published State
///
/// Queries never fail. An empty result means there is nothing to navigate to.

#include "fwd.hpp"
#include "state.hpp"
#include <xref_engine/index/declaration.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace xref_resolve {

/// Which way a navigation goes from the queried declaration
enum class NavigationDirection : std::uint8_t {
    None,           ///< Declaration carries no relevant annotation
    ToReferences,   ///< From an export to the members importing or mixing into it
    ToExports,      ///< From an import or mixin member to the exports it refers to
};

/// Get direction name
[[nodiscard]] const char* navigation_direction_name(NavigationDirection direction);

/// Navigation targets for one declaration
struct Navigation {
    NavigationDirection direction = NavigationDirection::None;
    std::vector<xref_index::DeclarationPtr> targets;

    [[nodiscard]] bool empty() const noexcept { return targets.empty(); }
};

/// Relation the declaration takes part in: Export, then Import, then the
/// mixin relations in priority order
[[nodiscard]] std::optional<xref_index::AnnotationKind> relation_of(const xref_index::Declaration& decl);

/// Declarations importing or mixing into the export decl, sorted by name
[[nodiscard]] std::vector<xref_index::DeclarationPtr> exports_referencing(
    const State& state, const xref_index::Declaration& decl);

/// Export declarations an import or mixin decl refers to, sorted by name
[[nodiscard]] std::vector<xref_index::DeclarationPtr> references_of(
    const State& state, const xref_index::Declaration& decl);

/// Navigate from decl in the direction its relation implies
[[nodiscard]] Navigation navigate(const State& state, const xref_index::Declaration& decl);

} // namespace xref_resolve
