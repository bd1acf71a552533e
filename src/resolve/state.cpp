/// @file state.cpp
/// @brief Cross-reference state implementation

#include <xref_engine/resolve/state.hpp>
#include <xref_engine/core/log.hpp>

namespace xref_resolve {

// =============================================================================
// State
// =============================================================================

const ExportedMemberInfo* State::find_export(const ExportedMember& member) const {
    auto it = m_exports.find(member);
    return it != m_exports.end() ? &it->second : nullptr;
}

const MemberSet* State::find_members(const xref_index::Declaration& decl) const {
    auto it = m_references.find(&decl);
    return it != m_references.end() ? &it->second.members : nullptr;
}

xref_index::TypeDeclPtr State::find_implementer(const std::string& api_name) const {
    auto it = m_implementers.find(api_name);
    return it != m_implementers.end() ? it->second : nullptr;
}

// =============================================================================
// StateBuilder
// =============================================================================

StateBuilder::StateBuilder(ResolverConfig config, std::uint64_t version)
    : m_state(std::make_unique<State>(State::Passkey{}))
{
    m_state->m_config = std::move(config);
    m_state->m_version = version;
}

MemberSet& StateBuilder::members_of(const xref_index::DeclarationPtr& decl) {
    auto& entry = m_state->m_references[decl.get()];
    if (!entry.declaration) {
        entry.declaration = decl;
    }
    return entry.members;
}

bool StateBuilder::add_export(const ExportedMember& member, const xref_index::DeclarationPtr& decl) {
    auto [it, inserted] = m_state->m_exports.try_emplace(member);
    if (inserted) {
        it->second.export_decl = decl;
        ++m_state->m_stats.exports;
    } else if (it->second.export_decl != decl) {
        ++m_state->m_stats.duplicate_exports;
        xref_core::resolve_logger()->warn("Export {} already declared by '{}', ignoring '{}'",
            member.to_string(), it->second.export_decl->name(), decl->name());
    }

    members_of(decl).insert(member);
    return inserted;
}

bool StateBuilder::add_reference(const ExportedMember& member, const xref_index::DeclarationPtr& decl) {
    auto it = m_state->m_exports.find(member);
    if (it == m_state->m_exports.end()) {
        return false;
    }

    if (!members_of(decl).insert(member).second) {
        return false;
    }
    it->second.references.push_back(decl);
    return true;
}

bool StateBuilder::has_export(const ExportedMember& member) const {
    return m_state->m_exports.find(member) != m_state->m_exports.end();
}

const ExportedMemberInfo* StateBuilder::find_export(const ExportedMember& member) const {
    return m_state->find_export(member);
}

void StateBuilder::record_implementer(const std::string& api_name, xref_index::TypeDeclPtr type) {
    auto& slot = m_state->m_implementers[api_name];
    if (slot && slot != type) {
        ++m_state->m_stats.implementer_conflicts;
        xref_core::resolve_logger()->warn("API type '{}' implemented by both '{}' and '{}'",
            api_name, slot->name(), type->name());
    }
    slot = std::move(type);
}

xref_index::TypeDeclPtr StateBuilder::find_implementer(const std::string& api_name) const {
    return m_state->find_implementer(api_name);
}

std::shared_ptr<const State> StateBuilder::finish() && {
    return std::shared_ptr<const State>(std::move(m_state));
}

} // namespace xref_resolve
