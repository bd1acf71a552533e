#pragma once

/// @file config.hpp
/// @brief Resolver configuration
///
/// Example document:
/// @code
/// {
///   "mirror_prefix": "RS",
///   "static_location": "<static>",
///   "constructor_name": "<init>",
///   "annotations": { "Export": "net.runelite.mapping.Export" },
///   "logging": { "level": "debug", "console": true, "file": false, "directory": "" }
/// }
/// @endcode
/// Every key is optional; missing keys keep their defaults.

#include "fwd.hpp"
#include "exported_member.hpp"
#include <xref_engine/core/error.hpp>
#include <xref_engine/core/log.hpp>
#include <xref_engine/index/annotation.hpp>

#include <filesystem>
#include <string>

namespace xref_resolve {

/// Settings shared by the identity model, builder and queries
struct ResolverConfig {
    /// Two-character prefix marking a mirror of an external API type
    std::string mirror_prefix = "RS";
    /// Location of statically scoped exports
    std::string static_location = STATIC_LOCATION;
    /// Mixin target name that denotes the constructor
    std::string constructor_name = CONSTRUCTOR_NAME;
    /// Qualified names of the annotation kinds
    xref_index::AnnotationNames annotations;
    /// Logging setup applied by apply_logging()
    xref_core::LogConfig logging;
};

/// Parse configuration from a JSON document
[[nodiscard]] xref_core::Result<ResolverConfig> parse_resolver_config(const std::string& json_text);

/// Load configuration from a JSON file
[[nodiscard]] xref_core::Result<ResolverConfig> load_resolver_config(const std::filesystem::path& path);

/// Apply the logging section of a configuration
void apply_logging(const ResolverConfig& config);

} // namespace xref_resolve
