/// @file declaration.cpp
/// @brief Shared parts of the declaration interfaces

#include <xref_engine/index/declaration.hpp>

namespace xref_index {

const char* member_kind_name(MemberKind kind) {
    switch (kind) {
        case MemberKind::Field: return "field";
        case MemberKind::Method: return "method";
        case MemberKind::Constructor: return "constructor";
        default: return "unknown";
    }
}

std::optional<MemberKind> parse_member_kind(const std::string& name) {
    if (name == "field") return MemberKind::Field;
    if (name == "method") return MemberKind::Method;
    if (name == "constructor") return MemberKind::Constructor;
    return std::nullopt;
}

std::optional<std::string> Annotated::annotation_argument(AnnotationKind kind) const {
    auto args = annotation_arguments(kind);
    if (args.empty()) {
        return std::nullopt;
    }
    return std::move(args.front());
}

} // namespace xref_index
