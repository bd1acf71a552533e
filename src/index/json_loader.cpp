/// @file json_loader.cpp
/// @brief JSON index snapshot loading

#include <xref_engine/index/json_loader.hpp>
#include <xref_engine/core/log.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace xref_index {

namespace {

using IndexResult = xref_core::Result<std::unique_ptr<MemoryIndex>>;

/// Parse an "annotations" object into an AnnotationSet
AnnotationSet parse_annotations(const nlohmann::json& j, const AnnotationNames& names) {
    AnnotationSet set;
    if (!j.is_object()) {
        return set;
    }

    for (const auto& [qualified_name, value] : j.items()) {
        auto kind = names.find_kind(qualified_name);
        if (!kind) {
            xref_core::index_logger()->trace("Ignoring annotation '{}'", qualified_name);
            continue;
        }

        std::vector<std::string> arguments;
        if (value.is_string()) {
            arguments.push_back(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& item : value) {
                if (item.is_string()) {
                    arguments.push_back(item.get<std::string>());
                }
            }
        }
        set[*kind] = std::move(arguments);
    }
    return set;
}

/// Parse one member entry
xref_core::Result<MemberSpec> parse_member(const nlohmann::json& j, const std::string& type_name,
                                           const AnnotationNames& names) {
    if (!j.is_object()) {
        return xref_core::Err<MemberSpec>(
            xref_core::IndexError::invalid_member(type_name, "?", "member entry is not an object"));
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        return xref_core::Err<MemberSpec>(
            xref_core::IndexError::invalid_member(type_name, "?", "missing 'name'"));
    }

    MemberSpec spec;
    spec.name = j["name"].get<std::string>();

    if (j.contains("kind")) {
        if (!j["kind"].is_string()) {
            return xref_core::Err<MemberSpec>(
                xref_core::IndexError::invalid_member(type_name, spec.name, "'kind' must be a string"));
        }
        auto kind = parse_member_kind(j["kind"].get<std::string>());
        if (!kind) {
            return xref_core::Err<MemberSpec>(xref_core::IndexError::invalid_member(
                type_name, spec.name, "unknown kind '" + j["kind"].get<std::string>() + "'"));
        }
        spec.kind = *kind;
    }

    if (j.contains("static")) {
        if (!j["static"].is_boolean()) {
            return xref_core::Err<MemberSpec>(
                xref_core::IndexError::invalid_member(type_name, spec.name, "'static' must be a boolean"));
        }
        spec.is_static = j["static"].get<bool>();
    }

    if (j.contains("annotations")) {
        spec.annotations = parse_annotations(j["annotations"], names);
    }

    return xref_core::Ok(std::move(spec));
}

} // anonymous namespace

IndexResult load_index_json(const std::string& json_text, const AnnotationNames& names) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return xref_core::Err<std::unique_ptr<MemoryIndex>>(xref_core::IndexError::malformed(e.what()));
    }

    if (!j.is_object() || !j.contains("types") || !j["types"].is_array()) {
        return xref_core::Err<std::unique_ptr<MemoryIndex>>(
            xref_core::IndexError::malformed("expected an object with a 'types' array"));
    }

    auto index = std::make_unique<MemoryIndex>();

    for (const auto& type_json : j["types"]) {
        if (!type_json.is_object() || !type_json.contains("name") || !type_json["name"].is_string()) {
            return xref_core::Err<std::unique_ptr<MemoryIndex>>(
                xref_core::IndexError::malformed("type entry without a 'name'"));
        }
        auto type_name = type_json["name"].get<std::string>();

        AnnotationSet annotations;
        if (type_json.contains("annotations")) {
            annotations = parse_annotations(type_json["annotations"], names);
        }

        auto type_result = index->add_type(type_name, std::move(annotations));
        if (!type_result) {
            return xref_core::Err<std::unique_ptr<MemoryIndex>>(type_result.error());
        }

        if (!type_json.contains("members")) {
            continue;
        }
        if (!type_json["members"].is_array()) {
            return xref_core::Err<std::unique_ptr<MemoryIndex>>(
                xref_core::IndexError::malformed("'members' of '" + type_name + "' is not an array"));
        }

        for (const auto& member_json : type_json["members"]) {
            auto spec = parse_member(member_json, type_name, names);
            if (!spec) {
                return xref_core::Err<std::unique_ptr<MemoryIndex>>(spec.error());
            }
            auto member = index->add_member(type_name, std::move(*spec));
            if (!member) {
                return xref_core::Err<std::unique_ptr<MemoryIndex>>(member.error());
            }
        }
    }

    xref_core::index_logger()->debug("Loaded index snapshot: {} types, {} members",
        index->type_count(), index->member_count());

    return xref_core::Ok(std::move(index));
}

IndexResult load_index_file(const std::filesystem::path& path, const AnnotationNames& names) {
    std::ifstream file(path);
    if (!file) {
        return xref_core::Err<std::unique_ptr<MemoryIndex>>(
            xref_core::Error(xref_core::ErrorCode::IOError, "Cannot open index snapshot")
                .with_context("path", path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = load_index_json(buffer.str(), names);
    if (!result) {
        auto error = result.error();
        error.with_context("path", path.string());
        xref_core::index_logger()->error("{}", xref_core::build_error_chain(error));
        return xref_core::Err<std::unique_ptr<MemoryIndex>>(std::move(error));
    }
    return result;
}

} // namespace xref_index
