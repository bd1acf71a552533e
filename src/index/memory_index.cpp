/// @file memory_index.cpp
/// @brief In-memory declaration index implementation

#include <xref_engine/index/memory_index.hpp>
#include <xref_engine/core/log.hpp>

#include <algorithm>

namespace xref_index {

namespace {

// Shared by all MemoryIndex instances so a count is never handed out twice
std::atomic<std::uint64_t> g_modification_clock{0};

std::uint64_t next_modification_stamp() noexcept {
    return g_modification_clock.fetch_add(1, std::memory_order_relaxed) + 1;
}

bool set_has(const AnnotationSet& set, AnnotationKind kind) {
    return set.find(kind) != set.end();
}

std::vector<std::string> set_arguments(const AnnotationSet& set, AnnotationKind kind) {
    auto it = set.find(kind);
    if (it == set.end()) {
        return {};
    }
    return it->second;
}

} // anonymous namespace

// =============================================================================
// MemoryType
// =============================================================================

bool MemoryType::has_annotation(AnnotationKind kind) const {
    return set_has(m_annotations, kind);
}

std::vector<std::string> MemoryType::annotation_arguments(AnnotationKind kind) const {
    return set_arguments(m_annotations, kind);
}

std::vector<DeclarationPtr> MemoryType::constructors() const {
    std::lock_guard<std::mutex> lock(m_members_mutex);
    std::vector<DeclarationPtr> result;
    for (const auto& member : m_members) {
        if (member->kind() == MemberKind::Constructor) {
            result.push_back(member);
        }
    }
    return result;
}

std::vector<std::shared_ptr<const MemoryMember>> MemoryType::members() const {
    std::lock_guard<std::mutex> lock(m_members_mutex);
    return m_members;
}

void MemoryType::add_member(std::shared_ptr<const MemoryMember> member) {
    std::lock_guard<std::mutex> lock(m_members_mutex);
    m_members.push_back(std::move(member));
}

bool MemoryType::remove_member(const Declaration* member) {
    std::lock_guard<std::mutex> lock(m_members_mutex);
    auto it = std::find_if(m_members.begin(), m_members.end(),
        [member](const std::shared_ptr<const MemoryMember>& m) {
            return m.get() == member;
        });
    if (it == m_members.end()) {
        return false;
    }
    m_members.erase(it);
    return true;
}

// =============================================================================
// MemoryMember
// =============================================================================

bool MemoryMember::has_annotation(AnnotationKind kind) const {
    return set_has(m_spec.annotations, kind);
}

std::vector<std::string> MemoryMember::annotation_arguments(AnnotationKind kind) const {
    return set_arguments(m_spec.annotations, kind);
}

// =============================================================================
// MemoryIndex
// =============================================================================

MemoryIndex::MemoryIndex()
    : m_modification_count(next_modification_stamp())
{}

void MemoryIndex::bump() noexcept {
    m_modification_count.store(next_modification_stamp(), std::memory_order_release);
}

void MemoryIndex::touch() {
    std::unique_lock lock(m_mutex);
    bump();
}

std::vector<AnnotatedDeclaration> MemoryIndex::find_annotated(AnnotationKind kind) const {
    std::shared_lock lock(m_mutex);

    std::vector<AnnotatedDeclaration> result;
    for (const auto& type : m_types) {
        for (const auto& member : type->members()) {
            auto argument = member->annotation_argument(kind);
            if (!argument) {
                continue;
            }
            result.push_back(AnnotatedDeclaration{std::move(*argument), member});
        }
    }
    return result;
}

xref_core::Result<std::shared_ptr<const MemoryType>> MemoryIndex::add_type(
    std::string name, AnnotationSet annotations)
{
    std::unique_lock lock(m_mutex);

    if (m_types_by_name.find(name) != m_types_by_name.end()) {
        return xref_core::Err<std::shared_ptr<const MemoryType>>(
            xref_core::IndexError::duplicate_type(name));
    }

    auto type = std::make_shared<MemoryType>(name, std::move(annotations));
    m_types.push_back(type);
    m_types_by_name.emplace(std::move(name), type);
    bump();

    return xref_core::Ok(std::shared_ptr<const MemoryType>(type));
}

xref_core::Result<DeclarationPtr> MemoryIndex::add_member(const std::string& type_name, MemberSpec spec) {
    std::unique_lock lock(m_mutex);

    auto it = m_types_by_name.find(type_name);
    if (it == m_types_by_name.end()) {
        return xref_core::Err<DeclarationPtr>(xref_core::IndexError::unknown_type(type_name));
    }
    if (spec.name.empty()) {
        return xref_core::Err<DeclarationPtr>(
            xref_core::IndexError::invalid_member(type_name, spec.name, "empty name"));
    }

    std::weak_ptr<const MemoryType> owner = it->second;
    auto member = std::make_shared<MemoryMember>(std::move(owner), std::move(spec));
    it->second->add_member(member);
    bump();

    return xref_core::Ok(DeclarationPtr(member));
}

bool MemoryIndex::remove_member(const Declaration& member) {
    std::unique_lock lock(m_mutex);

    auto owner = member.owning_type();
    if (!owner) {
        return false;
    }
    auto it = m_types_by_name.find(owner->name());
    if (it == m_types_by_name.end() || it->second.get() != owner.get()) {
        return false;
    }
    if (!it->second->remove_member(&member)) {
        return false;
    }

    bump();
    return true;
}

bool MemoryIndex::remove_type(const std::string& name) {
    std::unique_lock lock(m_mutex);

    auto it = m_types_by_name.find(name);
    if (it == m_types_by_name.end()) {
        return false;
    }

    auto type = it->second;
    m_types_by_name.erase(it);
    m_types.erase(std::remove(m_types.begin(), m_types.end(), type), m_types.end());
    bump();

    xref_core::index_logger()->debug("Removed type '{}'", name);
    return true;
}

std::shared_ptr<const MemoryType> MemoryIndex::find_type(const std::string& name) const {
    std::shared_lock lock(m_mutex);
    auto it = m_types_by_name.find(name);
    if (it == m_types_by_name.end()) {
        return nullptr;
    }
    return it->second;
}

std::size_t MemoryIndex::type_count() const {
    std::shared_lock lock(m_mutex);
    return m_types.size();
}

std::size_t MemoryIndex::member_count() const {
    std::shared_lock lock(m_mutex);
    std::size_t count = 0;
    for (const auto& type : m_types) {
        count += type->members().size();
    }
    return count;
}

} // namespace xref_index
