/// @file log.cpp
/// @brief Logging system implementation for xref_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers for the index, resolver and cache subsystems
/// - Log level configuration
/// - Optional rotating file output

#include <xref_engine/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <filesystem>
#include <vector>

namespace xref_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration. Caller holds the registry lock.
std::vector<spdlog::sink_ptr> create_sinks(const std::string& name) {
    auto& reg = get_registry();
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.file_enabled && !reg.log_directory.empty()) {
        try {
            std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

/// Create a logger and publish it to spdlog. Caller holds the registry lock.
std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    auto& reg = get_registry();
    auto sinks = create_sinks(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    spdlog::drop(name);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Old logger objects and their sinks stay as they are for current holders
    for (auto& [name, logger] : reg.loggers) {
        logger = create_logger(name);
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto logger = create_logger(name);
    reg.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("xref_core");
}

std::shared_ptr<spdlog::logger> index_logger() {
    return get_logger("xref_index");
}

std::shared_ptr<spdlog::logger> resolve_logger() {
    return get_logger("xref_resolve");
}

std::shared_ptr<spdlog::logger> cache_logger() {
    return get_logger("xref_cache");
}

// =============================================================================
// Log Level Management
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    m_logger->trace("<<< Exiting {} ({}us)", m_name, elapsed_us());
}

std::int64_t LogScope::elapsed_us() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(now - m_start).count();
}

} // namespace xref_core
