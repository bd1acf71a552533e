#pragma once

/// @file memory_index.hpp
/// @brief Thread-safe in-memory declaration index
///
/// MemoryIndex holds a snapshot of types and members pushed by a host (or
/// loaded from JSON). Every mutation bumps the modification counter, which is
/// what the state cache keys on.

#include "fwd.hpp"
#include "declaration.hpp"
#include <xref_engine/core/error.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace xref_index {

/// Annotations on a declaration: kind -> string arguments.
/// A kind mapped to an empty list is present without a usable argument.
using AnnotationSet = std::map<AnnotationKind, std::vector<std::string>>;

/// Description of a member to add to a MemoryIndex
struct MemberSpec {
    std::string name;
    MemberKind kind = MemberKind::Field;
    bool is_static = false;
    AnnotationSet annotations;
};

// =============================================================================
// MemoryType
// =============================================================================

/// Type stored in a MemoryIndex
class MemoryType final : public TypeDecl {
public:
    MemoryType(std::string name, AnnotationSet annotations)
        : m_name(std::move(name)), m_annotations(std::move(annotations)) {}

    [[nodiscard]] const std::string& name() const override { return m_name; }
    [[nodiscard]] bool has_annotation(AnnotationKind kind) const override;
    [[nodiscard]] std::vector<std::string> annotation_arguments(AnnotationKind kind) const override;
    [[nodiscard]] std::vector<DeclarationPtr> constructors() const override;

    /// Members in declaration order
    [[nodiscard]] std::vector<std::shared_ptr<const MemoryMember>> members() const;

private:
    friend class MemoryIndex;

    void add_member(std::shared_ptr<const MemoryMember> member);
    bool remove_member(const Declaration* member);

    std::string m_name;
    AnnotationSet m_annotations;
    mutable std::mutex m_members_mutex;
    std::vector<std::shared_ptr<const MemoryMember>> m_members;
};

// =============================================================================
// MemoryMember
// =============================================================================

/// Member stored in a MemoryIndex
class MemoryMember final : public Declaration {
public:
    MemoryMember(std::weak_ptr<const MemoryType> owner, MemberSpec spec)
        : m_owner(std::move(owner)), m_spec(std::move(spec)) {}

    [[nodiscard]] const std::string& name() const override { return m_spec.name; }
    [[nodiscard]] bool has_annotation(AnnotationKind kind) const override;
    [[nodiscard]] std::vector<std::string> annotation_arguments(AnnotationKind kind) const override;
    [[nodiscard]] MemberKind kind() const override { return m_spec.kind; }
    [[nodiscard]] bool is_static() const override { return m_spec.is_static; }
    [[nodiscard]] TypeDeclPtr owning_type() const override { return m_owner.lock(); }

private:
    std::weak_ptr<const MemoryType> m_owner;
    MemberSpec m_spec;
};

// =============================================================================
// MemoryIndex
// =============================================================================

/// In-memory DeclarationIndex
class MemoryIndex final : public DeclarationIndex {
public:
    MemoryIndex();

    // Non-copyable
    MemoryIndex(const MemoryIndex&) = delete;
    MemoryIndex& operator=(const MemoryIndex&) = delete;

    // -------------------------------------------------------------------------
    // DeclarationIndex
    // -------------------------------------------------------------------------

    [[nodiscard]] std::vector<AnnotatedDeclaration> find_annotated(AnnotationKind kind) const override;

    [[nodiscard]] std::uint64_t modification_count() const override {
        return m_modification_count.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // Mutation
    // -------------------------------------------------------------------------

    /// Add a type. Fails if a type with the same name exists.
    xref_core::Result<std::shared_ptr<const MemoryType>> add_type(
        std::string name, AnnotationSet annotations = {});

    /// Add a member to an existing type
    xref_core::Result<DeclarationPtr> add_member(const std::string& type_name, MemberSpec spec);

    /// Remove a member. Handles held elsewhere stay valid.
    bool remove_member(const Declaration& member);

    /// Remove a type with all its members
    bool remove_type(const std::string& name);

    /// Record an external change without altering the index contents
    void touch();

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    [[nodiscard]] std::shared_ptr<const MemoryType> find_type(const std::string& name) const;

    [[nodiscard]] std::size_t type_count() const;

    [[nodiscard]] std::size_t member_count() const;

private:
    /// Draw a fresh stamp from the process-wide modification clock.
    /// Caller holds the unique lock.
    void bump() noexcept;

    mutable std::shared_mutex m_mutex;
    std::vector<std::shared_ptr<MemoryType>> m_types;
    std::unordered_map<std::string, std::shared_ptr<MemoryType>> m_types_by_name;
    std::atomic<std::uint64_t> m_modification_count;
};

} // namespace xref_index
