#pragma once

/// @file log.hpp
/// @brief Logging utilities for xref_engine

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>

namespace xref_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options.
///
/// Loggers already handed out keep their old sinks; the registry gets fresh
/// logger objects, so later get_logger() calls (and the subsystem accessors
/// below) see the new configuration. Existing sinks are never modified, so
/// this may run while other threads log.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger. Callers that hold the returned pointer do
/// not observe a later configure_logging().
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Get the declaration index logger
std::shared_ptr<spdlog::logger> index_logger();

/// Get the resolution engine logger
std::shared_ptr<spdlog::logger> resolve_logger();

/// Get the state cache logger
std::shared_ptr<spdlog::logger> cache_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "xref_core");
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

    /// Microseconds elapsed since the scope was entered
    [[nodiscard]] std::int64_t elapsed_us() const;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace xref_core
