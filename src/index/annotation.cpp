/// @file annotation.cpp
/// @brief Annotation kind names

#include <xref_engine/index/annotation.hpp>

namespace xref_index {

const char* annotation_kind_name(AnnotationKind kind) {
    switch (kind) {
        case AnnotationKind::Export: return "Export";
        case AnnotationKind::Import: return "Import";
        case AnnotationKind::Implements: return "Implements";
        case AnnotationKind::Mixin: return "Mixin";
        case AnnotationKind::Mixins: return "Mixins";
        case AnnotationKind::Copy: return "Copy";
        case AnnotationKind::FieldHook: return "FieldHook";
        case AnnotationKind::MethodHook: return "MethodHook";
        case AnnotationKind::Replace: return "Replace";
        case AnnotationKind::Shadow: return "Shadow";
        default: return "Unknown";
    }
}

std::optional<AnnotationKind> parse_annotation_kind(const std::string& name) {
    for (std::size_t i = 0; i < ANNOTATION_KIND_COUNT; ++i) {
        auto kind = static_cast<AnnotationKind>(i);
        if (name == annotation_kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

// =============================================================================
// AnnotationNames
// =============================================================================

AnnotationNames::AnnotationNames() {
    set(AnnotationKind::Export, "net.runelite.mapping.Export");
    set(AnnotationKind::Import, "net.runelite.mapping.Import");
    set(AnnotationKind::Implements, "net.runelite.mapping.Implements");
    set(AnnotationKind::Mixin, "net.runelite.api.mixins.Mixin");
    set(AnnotationKind::Mixins, "net.runelite.api.mixins.Mixins");
    set(AnnotationKind::Copy, "net.runelite.api.mixins.Copy");
    set(AnnotationKind::FieldHook, "net.runelite.api.mixins.FieldHook");
    set(AnnotationKind::MethodHook, "net.runelite.api.mixins.MethodHook");
    set(AnnotationKind::Replace, "net.runelite.api.mixins.Replace");
    set(AnnotationKind::Shadow, "net.runelite.api.mixins.Shadow");
}

std::optional<AnnotationKind> AnnotationNames::find_kind(const std::string& qualified_name) const {
    for (std::size_t i = 0; i < m_names.size(); ++i) {
        if (m_names[i] == qualified_name) {
            return static_cast<AnnotationKind>(i);
        }
    }
    return std::nullopt;
}

} // namespace xref_index
