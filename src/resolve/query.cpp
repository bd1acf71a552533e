/// @file query.cpp
/// @brief Navigation queries

#include <xref_engine/resolve/query.hpp>
#include <xref_engine/resolve/identity.hpp>

#include <algorithm>

namespace xref_resolve {

using xref_index::AnnotationKind;
using xref_index::DeclarationPtr;

namespace {

void sort_by_name(std::vector<DeclarationPtr>& decls) {
    std::stable_sort(decls.begin(), decls.end(),
        [](const DeclarationPtr& a, const DeclarationPtr& b) {
            return a->name() < b->name();
        });
}

bool has_reference_relation(const xref_index::Declaration& decl) {
    for (auto kind : xref_index::RELEVANT_KINDS) {
        if (kind != AnnotationKind::Export && decl.has_annotation(kind)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

const char* navigation_direction_name(NavigationDirection direction) {
    switch (direction) {
        case NavigationDirection::None: return "none";
        case NavigationDirection::ToReferences: return "references";
        case NavigationDirection::ToExports: return "exports";
        default: return "unknown";
    }
}

std::optional<AnnotationKind> relation_of(const xref_index::Declaration& decl) {
    for (auto kind : xref_index::RELEVANT_KINDS) {
        if (decl.has_annotation(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::vector<DeclarationPtr> exports_referencing(const State& state, const xref_index::Declaration& decl) {
    if (!decl.has_annotation(AnnotationKind::Export)) {
        return {};
    }

    auto derived = derive_export(state.config(), decl);
    if (!derived) {
        return {};
    }

    const auto* info = state.find_export(derived->member);
    if (!info) {
        return {};
    }

    auto targets = info->references;
    sort_by_name(targets);
    return targets;
}

std::vector<DeclarationPtr> references_of(const State& state, const xref_index::Declaration& decl) {
    if (!has_reference_relation(decl)) {
        return {};
    }

    const auto* members = state.find_members(decl);
    if (!members) {
        return {};
    }

    std::vector<DeclarationPtr> targets;
    targets.reserve(members->size());
    for (const auto& member : *members) {
        const auto* info = state.find_export(member);
        if (info) {
            targets.push_back(info->export_decl);
        }
    }
    sort_by_name(targets);
    return targets;
}

Navigation navigate(const State& state, const xref_index::Declaration& decl) {
    auto relation = relation_of(decl);
    if (!relation) {
        return {};
    }

    if (*relation == AnnotationKind::Export) {
        return Navigation{NavigationDirection::ToReferences, exports_referencing(state, decl)};
    }
    return Navigation{NavigationDirection::ToExports, references_of(state, decl)};
}

} // namespace xref_resolve
