#pragma once

/// @file resolve.hpp
/// @brief Main include file for xref_resolve module

#include "fwd.hpp"
#include "exported_member.hpp"
#include "config.hpp"
#include "state.hpp"
#include "identity.hpp"
#include "builder.hpp"
#include "query.hpp"
#include "cache.hpp"

/// @namespace xref_resolve
/// @brief Cross-reference resolution between exports and their references
///
/// - **Identity**: ExportedMember (name, location) derived from annotations
/// - **Builder**: export, import and mixin passes producing an immutable State
/// - **Queries**: navigation from an export to its references and back
/// - **Cache**: single-flight memo keyed on the index modification count
