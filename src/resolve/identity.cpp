/// @file identity.cpp
/// @brief Identity derivation rules

#include <xref_engine/resolve/identity.hpp>
#include <xref_engine/core/log.hpp>

namespace xref_resolve {

using xref_index::AnnotationKind;

// =============================================================================
// Name helpers
// =============================================================================

std::string simple_type_name(const std::string& type_name) {
    static const std::string class_suffix = ".class";

    std::string name = type_name;
    if (name.size() > class_suffix.size() &&
        name.compare(name.size() - class_suffix.size(), class_suffix.size(), class_suffix) == 0) {
        name.erase(name.size() - class_suffix.size());
    }

    auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name.erase(0, dot + 1);
    }
    return name;
}

std::optional<std::string> strip_mirror_prefix(const std::string& type_name, const std::string& prefix) {
    if (type_name.size() < prefix.size() || type_name.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return type_name.substr(prefix.size());
}

std::optional<std::string> mixin_relation_name(const xref_index::Declaration& decl) {
    for (auto kind : xref_index::MIXIN_RELATION_KINDS) {
        auto name = decl.annotation_argument(kind);
        if (name) {
            return name;
        }
    }
    return std::nullopt;
}

std::vector<std::string> mixin_targets(const xref_index::TypeDecl& type) {
    if (type.has_annotation(AnnotationKind::Mixin)) {
        auto target = type.annotation_argument(AnnotationKind::Mixin);
        if (!target) {
            return {};
        }
        return {*target};
    }
    return type.annotation_arguments(AnnotationKind::Mixins);
}

// =============================================================================
// Export
// =============================================================================

std::optional<ExportDerivation> derive_export(const ResolverConfig& config,
                                              const xref_index::Declaration& decl) {
    auto name = decl.annotation_argument(AnnotationKind::Export);
    if (!name) {
        return std::nullopt;
    }

    auto owner = decl.owning_type();
    if (!owner) {
        return std::nullopt;
    }

    auto api_name = owner->annotation_argument(AnnotationKind::Implements);
    bool is_static = decl.is_static();
    if (!api_name && !is_static) {
        return std::nullopt;
    }

    std::string location = is_static ? config.static_location : *api_name;
    return ExportDerivation{
        ExportedMember::of(std::move(*name), std::move(location)),
        std::move(api_name),
        std::move(owner),
    };
}

std::optional<ExportedMember> from_exported(StateBuilder& builder, const xref_index::Declaration& decl) {
    auto derived = derive_export(builder.config(), decl);
    if (!derived) {
        xref_core::resolve_logger()->trace("Export '{}' has no resolvable identity", decl.name());
        return std::nullopt;
    }

    if (derived->implements) {
        builder.record_implementer(*derived->implements, derived->owner);
    }
    return std::move(derived->member);
}

// =============================================================================
// Import
// =============================================================================

std::optional<ExportedMember> from_imported(const StateBuilder& builder, const xref_index::Declaration& decl) {
    auto name = decl.annotation_argument(AnnotationKind::Import);
    if (!name) {
        return std::nullopt;
    }

    auto owner = decl.owning_type();
    if (!owner) {
        return std::nullopt;
    }

    // Imports live in mirror types; the mirror name without prefix is the API name
    auto location = strip_mirror_prefix(owner->name(), builder.config().mirror_prefix);
    if (!location) {
        xref_core::resolve_logger()->trace("Import '{}' is declared outside a mirror type ('{}')",
            decl.name(), owner->name());
        return std::nullopt;
    }

    auto member = ExportedMember::of(*name, std::move(*location));
    if (!builder.has_export(member)) {
        member = ExportedMember::of(std::move(*name), builder.config().static_location);
    }
    return member;
}

// =============================================================================
// Mixin
// =============================================================================

MemberSet from_mixin(StateBuilder& builder, const xref_index::Declaration& decl) {
    const auto& config = builder.config();
    auto logger = xref_core::resolve_logger();

    auto name = mixin_relation_name(decl);
    if (!name) {
        return {};
    }

    auto owner = decl.owning_type();
    if (!owner) {
        return {};
    }

    if (decl.is_static()) {
        return {ExportedMember::of(*name, config.static_location)};
    }

    auto targets = mixin_targets(*owner);
    if (targets.empty()) {
        logger->trace("Mixin '{}' in '{}' has no target type", decl.name(), owner->name());
        return {};
    }

    MemberSet result;
    for (const auto& target : targets) {
        auto api_name = strip_mirror_prefix(simple_type_name(target), config.mirror_prefix);
        if (!api_name) {
            logger->trace("Skipping mixin target '{}' without mirror prefix", target);
            continue;
        }

        auto member = ExportedMember::of(*name, *api_name);

        // Constructors are never annotated, so a mixin onto one exports it
        if (*name == config.constructor_name) {
            auto implementer = builder.find_implementer(*api_name);
            if (implementer) {
                auto constructors = implementer->constructors();
                if (constructors.size() == 1) {
                    if (builder.add_export(member, constructors.front())) {
                        ++builder.stats().constructors_synthesized;
                    }
                } else {
                    logger->debug("Cannot map constructor of '{}': {} constructors",
                        implementer->name(), constructors.size());
                }
            }
        }

        if (builder.has_export(member)) {
            result.insert(std::move(member));
        }
    }
    return result;
}

} // namespace xref_resolve
