#pragma once

/// @file builder.hpp
/// @brief Three-pass construction of the cross-reference state
///
/// 1. Export pass: every Export-annotated member registers its identity.
/// 2. Import pass: every Import-annotated member references an export.
/// 3. Mixin pass: every member with a mixin relation references the exports
///    of its target types, synthesizing constructor exports on the way.
///
/// Later passes depend on exports found earlier, so the order is fixed.

#include "fwd.hpp"
#include "config.hpp"
#include "state.hpp"
#include <xref_engine/index/declaration.hpp>

#include <memory>

namespace xref_resolve {

/// Build a fresh state from the index
[[nodiscard]] std::shared_ptr<const State> build_state(const xref_index::DeclarationIndex& index,
                                                       const ResolverConfig& config);

/// Run the export pass
void run_export_pass(StateBuilder& builder, const xref_index::DeclarationIndex& index);

/// Run the import pass
void run_import_pass(StateBuilder& builder, const xref_index::DeclarationIndex& index);

/// Run the mixin pass. A member carrying several mixin relations is visited once.
void run_mixin_pass(StateBuilder& builder, const xref_index::DeclarationIndex& index);

} // namespace xref_resolve
