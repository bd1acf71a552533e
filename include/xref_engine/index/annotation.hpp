#pragma once

/// @file annotation.hpp
/// @brief The closed set of annotation kinds the resolver understands

#include "fwd.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace xref_index {

// =============================================================================
// AnnotationKind
// =============================================================================

/// Annotation kinds recognised on members and types
enum class AnnotationKind : std::uint8_t {
    Export = 0,     ///< Member is the definition of an exported name
    Import,         ///< Member of a mirror type imports an exported name
    Implements,     ///< Type implements an external API type (argument: API name)
    Mixin,          ///< Type mixes into one mirror type (argument: target type)
    Mixins,         ///< Type mixes into several mirror types (arguments: target types)
    Copy,           ///< Mixin relation: copy of the target member
    FieldHook,      ///< Mixin relation: hook on a field write
    MethodHook,     ///< Mixin relation: hook on a method call
    Replace,        ///< Mixin relation: replaces the target member
    Shadow,         ///< Mixin relation: shadows the target member
};

/// Number of annotation kinds
inline constexpr std::size_t ANNOTATION_KIND_COUNT = 10;

/// Mixin-relation kinds in lookup priority order. The first one present on a
/// member supplies the target name.
inline constexpr std::array<AnnotationKind, 5> MIXIN_RELATION_KINDS = {
    AnnotationKind::Copy,
    AnnotationKind::FieldHook,
    AnnotationKind::MethodHook,
    AnnotationKind::Replace,
    AnnotationKind::Shadow,
};

/// Kinds that place a member in the navigation graph, in priority order
inline constexpr std::array<AnnotationKind, 7> RELEVANT_KINDS = {
    AnnotationKind::Export,
    AnnotationKind::Import,
    AnnotationKind::Copy,
    AnnotationKind::FieldHook,
    AnnotationKind::MethodHook,
    AnnotationKind::Replace,
    AnnotationKind::Shadow,
};

/// Get the short name of an annotation kind ("Export", "Copy", ...)
[[nodiscard]] const char* annotation_kind_name(AnnotationKind kind);

/// Parse a short annotation name
[[nodiscard]] std::optional<AnnotationKind> parse_annotation_kind(const std::string& name);

/// Check whether the kind is one of the mixin relations
[[nodiscard]] constexpr bool is_mixin_relation(AnnotationKind kind) noexcept {
    for (auto k : MIXIN_RELATION_KINDS) {
        if (k == kind) return true;
    }
    return false;
}

/// Check whether the kind marks a member as export, import or mixin relation
[[nodiscard]] constexpr bool is_relevant(AnnotationKind kind) noexcept {
    for (auto k : RELEVANT_KINDS) {
        if (k == kind) return true;
    }
    return false;
}

// =============================================================================
// AnnotationNames
// =============================================================================

/// Qualified source-level names of the annotation kinds
class AnnotationNames {
public:
    /// Construct with the default runelite names
    AnnotationNames();

    /// Get the qualified name of a kind
    [[nodiscard]] const std::string& qualified_name(AnnotationKind kind) const {
        return m_names[static_cast<std::size_t>(kind)];
    }

    /// Override the qualified name of a kind
    void set(AnnotationKind kind, std::string qualified_name) {
        m_names[static_cast<std::size_t>(kind)] = std::move(qualified_name);
    }

    /// Find the kind a qualified name denotes
    [[nodiscard]] std::optional<AnnotationKind> find_kind(const std::string& qualified_name) const;

private:
    std::array<std::string, ANNOTATION_KIND_COUNT> m_names;
};

} // namespace xref_index
