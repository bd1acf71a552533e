#pragma once

/// @file core.hpp
/// @brief Main include file for xref_core module
///
/// This header includes all xref_core components in dependency order.

#include "fwd.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "log.hpp"

/// @namespace xref_core
/// @brief Shared infrastructure for xref_engine
///
/// - **Error Handling**: Result<T> returned by index and configuration loaders
/// - **Logging**: spdlog-backed named loggers per subsystem
/// - **Hashing**: FNV-1a helpers for value identities
