#pragma once

/// @file declaration.hpp
/// @brief Declaration index interfaces consumed by the resolver
///
/// The resolver never parses source. A host supplies a DeclarationIndex that
/// reports annotated members, and Declaration / TypeDecl handles that answer
/// annotation lookups. Handles are shared so a resolved state can outlive the
/// index snapshot it was built from.

#include "fwd.hpp"
#include "annotation.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xref_index {

// =============================================================================
// MemberKind
// =============================================================================

/// Kind of a type member
enum class MemberKind : std::uint8_t {
    Field,
    Method,
    Constructor,
};

/// Get member kind name
[[nodiscard]] const char* member_kind_name(MemberKind kind);

/// Parse member kind name ("field", "method", "constructor")
[[nodiscard]] std::optional<MemberKind> parse_member_kind(const std::string& name);

// =============================================================================
// Annotated
// =============================================================================

/// Common interface of anything that carries annotations
class Annotated {
public:
    virtual ~Annotated() = default;

    /// Simple (unqualified) name
    [[nodiscard]] virtual const std::string& name() const = 0;

    /// True if the annotation is present, with or without a usable argument
    [[nodiscard]] virtual bool has_annotation(AnnotationKind kind) const = 0;

    /// String arguments of the annotation, in declaration order.
    /// Empty when the annotation is absent or its value is not a string literal.
    [[nodiscard]] virtual std::vector<std::string> annotation_arguments(AnnotationKind kind) const = 0;

    /// First string argument of the annotation, if any
    [[nodiscard]] std::optional<std::string> annotation_argument(AnnotationKind kind) const;
};

// =============================================================================
// TypeDecl
// =============================================================================

/// A type that owns members
class TypeDecl : public Annotated {
public:
    /// Constructors declared by this type, in declaration order
    [[nodiscard]] virtual std::vector<DeclarationPtr> constructors() const = 0;
};

// =============================================================================
// Declaration
// =============================================================================

/// A member (field, method, constructor) of a type
class Declaration : public Annotated {
public:
    [[nodiscard]] virtual MemberKind kind() const = 0;

    [[nodiscard]] virtual bool is_static() const = 0;

    /// Containing type, or null if it is unknown or no longer exists
    [[nodiscard]] virtual TypeDeclPtr owning_type() const = 0;
};

// =============================================================================
// DeclarationIndex
// =============================================================================

/// A declaration reported for an annotation kind, with that annotation's argument
struct AnnotatedDeclaration {
    std::string argument;
    DeclarationPtr declaration;
};

/// Source of annotated declarations for one codebase
class DeclarationIndex {
public:
    virtual ~DeclarationIndex() = default;

    /// All members carrying the annotation with a string argument, in an order
    /// that is stable for a given snapshot. A kind the index cannot resolve
    /// yields an empty sequence.
    [[nodiscard]] virtual std::vector<AnnotatedDeclaration> find_annotated(AnnotationKind kind) const = 0;

    /// Counter that changes whenever the indexed codebase changes. Values are
    /// never reused across index instances in one process, so (index address,
    /// count) identifies a snapshot even after the address is recycled.
    [[nodiscard]] virtual std::uint64_t modification_count() const = 0;
};

} // namespace xref_index
