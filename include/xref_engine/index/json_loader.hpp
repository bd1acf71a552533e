#pragma once

/// @file json_loader.hpp
/// @brief Load a MemoryIndex snapshot from JSON
///
/// Format:
/// @code
/// {
///   "types": [
///     {
///       "name": "RSPlayerMixin",
///       "annotations": { "net.runelite.api.mixins.Mixin": "RSPlayer" },
///       "members": [
///         { "name": "tick", "kind": "method", "static": false,
///           "annotations": { "net.runelite.api.mixins.Replace": "tick" } }
///       ]
///     }
///   ]
/// }
/// @endcode
///
/// Annotation values may be a string or an array of strings. Any other value
/// marks the annotation as present without a usable argument. Annotations
/// whose qualified name is not configured are ignored.

#include "fwd.hpp"
#include "annotation.hpp"
#include "memory_index.hpp"
#include <xref_engine/core/error.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace xref_index {

/// Build an index from a JSON document
[[nodiscard]] xref_core::Result<std::unique_ptr<MemoryIndex>> load_index_json(
    const std::string& json_text, const AnnotationNames& names);

/// Build an index from a JSON file
[[nodiscard]] xref_core::Result<std::unique_ptr<MemoryIndex>> load_index_file(
    const std::filesystem::path& path, const AnnotationNames& names);

} // namespace xref_index
