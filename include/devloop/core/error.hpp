#pragma once

/// @file error.hpp
/// @brief Error handling types for devloop_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace devloop_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    CompileError,
    ValidationError,
    Rejected,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::CompileError: return "CompileError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Layer composition and element access errors
struct LayerError {
    enum class Kind : std::uint8_t {
        ElementOpenFailed,  // Archive or directory could not be opened
        MalformedArchive,   // Archive structure is invalid
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static LayerError open_failed(const std::string& p, const std::string& reason) {
        return LayerError{Kind::ElementOpenFailed, "Cannot open element '" + p + "': " + reason, p};
    }

    [[nodiscard]] static LayerError malformed_archive(const std::string& p, const std::string& reason) {
        return LayerError{Kind::MalformedArchive, "Malformed archive '" + p + "': " + reason, p};
    }
};

/// Compiler diagnostic (error, warning or note) attached to a CompileError
struct CompileDiagnostic {
    enum class Severity : std::uint8_t { Note, Warning, Error };

    Severity severity = Severity::Error;
    std::string file;
    int line = 0;
    int column = 0;
    std::string message;
};

/// Compilation failure reported by a compiler collaborator
struct CompileError {
    enum class Kind : std::uint8_t {
        Failed,          // Compiler ran and reported errors
        LaunchFailed,    // Compiler process could not be started
    };

    Kind kind;
    std::string message;
    std::string source_root;
    std::vector<std::string> files;
    std::vector<CompileDiagnostic> diagnostics;

    [[nodiscard]] static CompileError failed(const std::string& root, std::vector<std::string> inputs,
                                             std::vector<CompileDiagnostic> diags, const std::string& output) {
        return CompileError{Kind::Failed, "Compilation failed in " + root + (output.empty() ? "" : ":\n" + output),
                            root, std::move(inputs), std::move(diags)};
    }

    [[nodiscard]] static CompileError launch_failed(const std::string& command, const std::string& reason) {
        return CompileError{Kind::LaunchFailed, "Failed to run '" + command + "': " + reason, {}, {}, {}};
    }

    /// Count diagnostics of the given severity
    [[nodiscard]] std::size_t count(CompileDiagnostic::Severity severity) const {
        std::size_t n = 0;
        for (const auto& d : diagnostics) {
            if (d.severity == severity) ++n;
        }
        return n;
    }
};

/// Live redefinition errors
struct HotSwapError {
    enum class Kind : std::uint8_t {
        NoBaseline,        // No structural index from a successful start
        StructureChanged,  // A type's shape differs from the running one
        Vetoed,            // An index or type veto rejected the swap
        IndexFailed,       // A changed unit could not be indexed
        RedefineFailed,    // The redefinition facility rejected the request
    };

    Kind kind;
    std::string message;
    std::string type_name;

    [[nodiscard]] static HotSwapError no_baseline() {
        return HotSwapError{Kind::NoBaseline, "No structural index from a previous start", {}};
    }

    [[nodiscard]] static HotSwapError structure_changed(const std::string& type) {
        return HotSwapError{Kind::StructureChanged, "Structure of " + type + " changed", type};
    }

    [[nodiscard]] static HotSwapError vetoed(const std::string& type) {
        return HotSwapError{Kind::Vetoed, type.empty() ? "Swap vetoed" : "Swap vetoed for " + type, type};
    }

    [[nodiscard]] static HotSwapError index_failed(const std::string& unit, const std::string& reason) {
        return HotSwapError{Kind::IndexFailed, "Failed to index " + unit + ": " + reason, {}};
    }

    [[nodiscard]] static HotSwapError redefine_failed(const std::string& reason) {
        return HotSwapError{Kind::RedefineFailed, "Redefinition failed: " + reason, {}};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Config file missing
        ParseFailed,    // Not valid JSON
        InvalidValue,   // Field has the wrong type or an illegal value
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& name, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + name + "': " + reason, name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        LayerError,
        CompileError,
        HotSwapError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(LayerError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CompileError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(HotSwapError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(LayerError::Kind kind) {
        switch (kind) {
            case LayerError::Kind::ElementOpenFailed: return ErrorCode::IOError;
            case LayerError::Kind::MalformedArchive: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(CompileError::Kind kind) {
        switch (kind) {
            case CompileError::Kind::Failed: return ErrorCode::CompileError;
            case CompileError::Kind::LaunchFailed: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(HotSwapError::Kind kind) {
        switch (kind) {
            case HotSwapError::Kind::NoBaseline: return ErrorCode::InvalidState;
            case HotSwapError::Kind::StructureChanged: return ErrorCode::Rejected;
            case HotSwapError::Kind::Vetoed: return ErrorCode::Rejected;
            case HotSwapError::Kind::IndexFailed: return ErrorCode::ParseError;
            case HotSwapError::Kind::RedefineFailed: return ErrorCode::NotSupported;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
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

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace devloop_core
