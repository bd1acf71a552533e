/// @file config.cpp
/// @brief Resolver configuration loading

#include <xref_engine/resolve/config.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace xref_resolve {

namespace {

using ConfigResult = xref_core::Result<ResolverConfig>;

ConfigResult invalid(const std::string& key, const std::string& reason) {
    return xref_core::Err<ResolverConfig>(xref_core::ConfigError::invalid_value(key, reason));
}

/// Read an optional string key into target. Returns false on a type mismatch.
bool read_string(const nlohmann::json& j, const char* key, std::string& target) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        return false;
    }
    target = j[key].get<std::string>();
    return true;
}

bool read_bool(const nlohmann::json& j, const char* key, bool& target) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_boolean()) {
        return false;
    }
    target = j[key].get<bool>();
    return true;
}

} // anonymous namespace

ConfigResult parse_resolver_config(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return xref_core::Err<ResolverConfig>(xref_core::ConfigError::malformed(e.what()));
    }

    if (!j.is_object()) {
        return xref_core::Err<ResolverConfig>(xref_core::ConfigError::malformed("expected an object"));
    }

    ResolverConfig config;

    if (!read_string(j, "mirror_prefix", config.mirror_prefix)) {
        return invalid("mirror_prefix", "expected a string");
    }
    if (config.mirror_prefix.size() != 2) {
        return invalid("mirror_prefix", "must be exactly two characters");
    }
    if (!read_string(j, "static_location", config.static_location) || config.static_location.empty()) {
        return invalid("static_location", "expected a non-empty string");
    }
    if (!read_string(j, "constructor_name", config.constructor_name) || config.constructor_name.empty()) {
        return invalid("constructor_name", "expected a non-empty string");
    }

    if (j.contains("annotations")) {
        const auto& annotations = j["annotations"];
        if (!annotations.is_object()) {
            return invalid("annotations", "expected an object");
        }
        for (const auto& [short_name, value] : annotations.items()) {
            auto kind = xref_index::parse_annotation_kind(short_name);
            if (!kind) {
                return invalid("annotations." + short_name, "unknown annotation kind");
            }
            if (!value.is_string() || value.get<std::string>().empty()) {
                return invalid("annotations." + short_name, "expected a qualified name");
            }
            config.annotations.set(*kind, value.get<std::string>());
        }
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (!logging.is_object()) {
            return invalid("logging", "expected an object");
        }

        std::string level_name = xref_core::log_level_name(config.logging.level);
        if (!read_string(logging, "level", level_name)) {
            return invalid("logging.level", "expected a string");
        }
        auto level = xref_core::parse_log_level(level_name);
        if (!level) {
            return invalid("logging.level", "unknown level '" + level_name + "'");
        }
        config.logging.level = *level;

        if (!read_bool(logging, "console", config.logging.console_enabled)) {
            return invalid("logging.console", "expected a boolean");
        }
        if (!read_bool(logging, "file", config.logging.file_enabled)) {
            return invalid("logging.file", "expected a boolean");
        }
        if (!read_string(logging, "directory", config.logging.log_directory)) {
            return invalid("logging.directory", "expected a string");
        }
    }

    return xref_core::Ok(std::move(config));
}

ConfigResult load_resolver_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return xref_core::Err<ResolverConfig>(xref_core::ConfigError::read_failed(path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_resolver_config(buffer.str());
    if (!result) {
        result.error().with_context("path", path.string());
        xref_core::core_logger()->error("{}", xref_core::build_error_chain(result.error()));
    }
    return result;
}

void apply_logging(const ResolverConfig& config) {
    xref_core::configure_logging(config.logging);
}

} // namespace xref_resolve
