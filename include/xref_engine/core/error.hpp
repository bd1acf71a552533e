#pragma once

/// @file error.hpp
/// @brief Error handling types for xref_core
///
/// The resolution engine itself never fails. Errors only surface at the
/// edges where external input is read: index snapshots and resolver
/// configuration.

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace xref_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    IOError,
    ParseError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Errors raised while building a declaration index snapshot
struct IndexError {
    enum class Kind : std::uint8_t {
        Malformed,          // Snapshot document is not valid
        DuplicateType,      // Two types share a name
        UnknownType,        // Member refers to a type that does not exist
        InvalidMember,      // Member entry is missing required data
    };

    Kind kind;
    std::string message;
    std::string type_name;
    std::string member_name;

    [[nodiscard]] static IndexError malformed(const std::string& reason) {
        return IndexError{Kind::Malformed, "Malformed index snapshot: " + reason, {}, {}};
    }

    [[nodiscard]] static IndexError duplicate_type(const std::string& name) {
        return IndexError{Kind::DuplicateType, "Duplicate type: " + name, name, {}};
    }

    [[nodiscard]] static IndexError unknown_type(const std::string& name) {
        return IndexError{Kind::UnknownType, "Unknown type: " + name, name, {}};
    }

    [[nodiscard]] static IndexError invalid_member(const std::string& type, const std::string& member,
                                                   const std::string& reason) {
        return IndexError{Kind::InvalidMember,
            "Invalid member '" + member + "' in '" + type + "': " + reason, type, member};
    }
};

/// Errors raised while reading resolver configuration
struct ConfigError {
    enum class Kind : std::uint8_t {
        ReadFailed,     // Configuration file could not be read
        Malformed,      // Document is not valid JSON
        InvalidValue,   // A key holds a value of the wrong type or range
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError read_failed(const std::string& path) {
        return ConfigError{Kind::ReadFailed, "Cannot read configuration: " + path, {}};
    }

    [[nodiscard]] static ConfigError malformed(const std::string& reason) {
        return ConfigError{Kind::Malformed, "Malformed configuration: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        IndexError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(IndexError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(IndexError::Kind kind) {
        switch (kind) {
            case IndexError::Kind::Malformed: return ErrorCode::ParseError;
            case IndexError::Kind::DuplicateType: return ErrorCode::AlreadyExists;
            case IndexError::Kind::UnknownType: return ErrorCode::NotFound;
            case IndexError::Kind::InvalidMember: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ReadFailed: return ErrorCode::IOError;
            case ConfigError::Kind::Malformed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Err result
template<typename T>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including the error kind and attached context
std::string build_error_chain(const Error& error);

} // namespace xref_core
