/// @file builder.cpp
/// @brief Cross-reference state construction

#include <xref_engine/resolve/builder.hpp>
#include <xref_engine/resolve/identity.hpp>
#include <xref_engine/core/log.hpp>

#include <unordered_set>

namespace xref_resolve {

using xref_index::AnnotationKind;

void run_export_pass(StateBuilder& builder, const xref_index::DeclarationIndex& index) {
    auto annotated = index.find_annotated(AnnotationKind::Export);
    for (const auto& entry : annotated) {
        auto member = from_exported(builder, *entry.declaration);
        if (!member) {
            ++builder.stats().unresolved_exports;
            continue;
        }
        builder.add_export(*member, entry.declaration);
    }

    xref_core::resolve_logger()->debug("Export pass: {} declarations, {} identities",
        annotated.size(), builder.stats().exports);
}

void run_import_pass(StateBuilder& builder, const xref_index::DeclarationIndex& index) {
    auto annotated = index.find_annotated(AnnotationKind::Import);
    for (const auto& entry : annotated) {
        auto member = from_imported(builder, *entry.declaration);
        if (!member || !builder.has_export(*member)) {
            ++builder.stats().imports_dangling;
            xref_core::resolve_logger()->trace("Dangling import '{}' ({})", entry.argument,
                member ? member->to_string() : std::string("no identity"));
            continue;
        }
        builder.add_reference(*member, entry.declaration);
        ++builder.stats().imports_resolved;
    }

    xref_core::resolve_logger()->debug("Import pass: {} declarations, {} resolved, {} dangling",
        annotated.size(), builder.stats().imports_resolved, builder.stats().imports_dangling);
}

void run_mixin_pass(StateBuilder& builder, const xref_index::DeclarationIndex& index) {
    std::unordered_set<const xref_index::Declaration*> visited;
    std::size_t seen = 0;

    for (auto kind : xref_index::MIXIN_RELATION_KINDS) {
        for (const auto& entry : index.find_annotated(kind)) {
            if (!visited.insert(entry.declaration.get()).second) {
                continue;
            }
            ++seen;

            bool matched = false;
            for (const auto& member : from_mixin(builder, *entry.declaration)) {
                builder.add_reference(member, entry.declaration);
                matched = matched || builder.has_export(member);
            }
            if (matched) {
                ++builder.stats().mixins_resolved;
            } else {
                ++builder.stats().mixins_unresolved;
            }
        }
    }

    xref_core::resolve_logger()->debug("Mixin pass: {} declarations, {} resolved, {} constructors synthesized",
        seen, builder.stats().mixins_resolved, builder.stats().constructors_synthesized);
}

std::shared_ptr<const State> build_state(const xref_index::DeclarationIndex& index,
                                         const ResolverConfig& config) {
    xref_core::LogScope scope("build_state", "xref_resolve");

    StateBuilder builder(config, index.modification_count());
    run_export_pass(builder, index);
    run_import_pass(builder, index);
    run_mixin_pass(builder, index);

    auto& stats = builder.stats();
    stats.build_us = scope.elapsed_us();

    xref_core::resolve_logger()->info(
        "Built cross-reference state: {} exports, {} imports, {} mixins ({} dangling, {} unresolved) in {}us",
        stats.exports, stats.imports_resolved, stats.mixins_resolved,
        stats.imports_dangling, stats.mixins_unresolved, stats.build_us);

    return std::move(builder).finish();
}

} // namespace xref_resolve
