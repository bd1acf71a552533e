#pragma once

/// @file index.hpp
/// @brief Main include file for xref_index module

#include "fwd.hpp"
#include "annotation.hpp"
#include "declaration.hpp"
#include "memory_index.hpp"
#include "json_loader.hpp"

/// @namespace xref_index
/// @brief Declaration index consumed by the resolver
///
/// - **Annotations**: closed set of annotation kinds and their qualified names
/// - **Declarations**: abstract Declaration / TypeDecl / DeclarationIndex
/// - **MemoryIndex**: thread-safe in-memory index with a modification counter
/// - **JSON loader**: builds a MemoryIndex from a snapshot document
