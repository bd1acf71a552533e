#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for xref_index module

#include <cstdint>
#include <memory>

namespace xref_index {

// =============================================================================
// Annotations
// =============================================================================

enum class AnnotationKind : std::uint8_t;
class AnnotationNames;

// =============================================================================
// Declarations
// =============================================================================

enum class MemberKind : std::uint8_t;
class Annotated;
class TypeDecl;
class Declaration;
struct AnnotatedDeclaration;
class DeclarationIndex;

using DeclarationPtr = std::shared_ptr<const Declaration>;
using TypeDeclPtr = std::shared_ptr<const TypeDecl>;

// =============================================================================
// In-memory index
// =============================================================================

struct MemberSpec;
class MemoryType;
class MemoryMember;
class MemoryIndex;

} // namespace xref_index
