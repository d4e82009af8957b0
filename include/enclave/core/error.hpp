#pragma once

/// @file error.hpp
/// @brief Error handling types for enclave_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace enclave_core {

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
    OutOfMemory,
    PermissionDenied,
    LimitExceeded,
    ParseError,
    ValidationError,
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
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::LimitExceeded: return "LimitExceeded";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Memory subsystem errors (allocator, protected regions, region registry)
struct MemoryError {
    enum class Kind : std::uint8_t {
        OutOfMemory,          // Request cannot be satisfied
        InvalidAlignment,     // Alignment is not a power of two
        InvalidAddress,       // Address range not inside a registered region
        PermissionDenied,     // Access not allowed by protection flags
        RegionAlreadyExists,  // Base taken or range overlaps a registered region
        RegionNotFound,       // No region registered at base
        InvalidSize,          // Zero-sized region
        General,              // Anything else (feature disabled, ...)
    };

    Kind kind;
    std::string message;
    std::uintptr_t address = 0;
    std::size_t size = 0;

    [[nodiscard]] static MemoryError out_of_memory(std::size_t requested) {
        return MemoryError{Kind::OutOfMemory,
            "Out of memory: " + std::to_string(requested) + " bytes requested", 0, requested};
    }

    [[nodiscard]] static MemoryError invalid_alignment(std::size_t alignment) {
        return MemoryError{Kind::InvalidAlignment,
            "Invalid alignment: " + std::to_string(alignment) + " is not a power of two", 0, alignment};
    }

    [[nodiscard]] static MemoryError invalid_address(std::uintptr_t addr, std::size_t len) {
        return MemoryError{Kind::InvalidAddress,
            "Invalid address range: base=" + std::to_string(addr) + ", length=" + std::to_string(len),
            addr, len};
    }

    [[nodiscard]] static MemoryError permission_denied(std::uintptr_t addr, const std::string& access) {
        return MemoryError{Kind::PermissionDenied,
            "Permission denied: " + access + " access at " + std::to_string(addr), addr, 0};
    }

    [[nodiscard]] static MemoryError region_already_exists(std::uintptr_t base) {
        return MemoryError{Kind::RegionAlreadyExists,
            "Region already exists at or overlapping " + std::to_string(base), base, 0};
    }

    [[nodiscard]] static MemoryError region_not_found(std::uintptr_t base) {
        return MemoryError{Kind::RegionNotFound,
            "Region not found: base=" + std::to_string(base), base, 0};
    }

    [[nodiscard]] static MemoryError invalid_size(std::size_t sz) {
        return MemoryError{Kind::InvalidSize, "Invalid size: " + std::to_string(sz), 0, sz};
    }

    [[nodiscard]] static MemoryError general(const std::string& reason) {
        return MemoryError{Kind::General, "General error: " + reason, 0, 0};
    }
};

/// Sandbox lifecycle and policy errors
struct SandboxError {
    enum class Kind : std::uint8_t {
        AlreadyRunning,         // start on an active sandbox
        NotRunning,             // pause/execute outside Running
        NotPaused,              // resume outside Paused
        AlreadyTerminated,      // terminate/start on a Terminated sandbox
        NotTerminated,          // restart outside Terminated
        NotFound,               // Unknown sandbox id
        CapabilityDenied,       // Required capability not granted
        ResourceLimitExceeded,  // Usage breached a configured limit
    };

    Kind kind;
    std::string message;
    std::uint64_t sandbox_id = 0;

    [[nodiscard]] static SandboxError already_running(std::uint64_t id) {
        return SandboxError{Kind::AlreadyRunning, "Sandbox " + std::to_string(id) + " is already running", id};
    }

    [[nodiscard]] static SandboxError not_running(std::uint64_t id) {
        return SandboxError{Kind::NotRunning, "Sandbox " + std::to_string(id) + " is not running", id};
    }

    [[nodiscard]] static SandboxError not_paused(std::uint64_t id) {
        return SandboxError{Kind::NotPaused, "Sandbox " + std::to_string(id) + " is not paused", id};
    }

    [[nodiscard]] static SandboxError already_terminated(std::uint64_t id) {
        return SandboxError{Kind::AlreadyTerminated,
            "Sandbox " + std::to_string(id) + " is already terminated", id};
    }

    [[nodiscard]] static SandboxError not_terminated(std::uint64_t id) {
        return SandboxError{Kind::NotTerminated, "Sandbox " + std::to_string(id) + " is not terminated", id};
    }

    [[nodiscard]] static SandboxError not_found(std::uint64_t id) {
        return SandboxError{Kind::NotFound, "Sandbox not found: " + std::to_string(id), id};
    }

    [[nodiscard]] static SandboxError capability_denied(std::uint64_t id, const std::string& capabilities) {
        return SandboxError{Kind::CapabilityDenied,
            "Sandbox " + std::to_string(id) + " lacks capability: " + capabilities, id};
    }

    [[nodiscard]] static SandboxError resource_limit_exceeded(std::uint64_t id, const std::string& resources) {
        return SandboxError{Kind::ResourceLimitExceeded,
            "Sandbox " + std::to_string(id) + " exceeded limit: " + resources, id};
    }
};

/// Get memory error kind name
[[nodiscard]] const char* to_string(MemoryError::Kind kind);

/// Get sandbox error kind name
[[nodiscard]] const char* to_string(SandboxError::Kind kind);

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        MemoryError,
        SandboxError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(MemoryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(SandboxError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// Check for a specific memory error kind
    [[nodiscard]] bool is(MemoryError::Kind kind) const {
        auto* err = as<MemoryError>();
        return err != nullptr && err->kind == kind;
    }

    /// Check for a specific sandbox error kind
    [[nodiscard]] bool is(SandboxError::Kind kind) const {
        auto* err = as<SandboxError>();
        return err != nullptr && err->kind == kind;
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

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(MemoryError::Kind kind) {
        switch (kind) {
            case MemoryError::Kind::OutOfMemory: return ErrorCode::OutOfMemory;
            case MemoryError::Kind::InvalidAlignment: return ErrorCode::InvalidArgument;
            case MemoryError::Kind::InvalidAddress: return ErrorCode::InvalidArgument;
            case MemoryError::Kind::PermissionDenied: return ErrorCode::PermissionDenied;
            case MemoryError::Kind::RegionAlreadyExists: return ErrorCode::AlreadyExists;
            case MemoryError::Kind::RegionNotFound: return ErrorCode::NotFound;
            case MemoryError::Kind::InvalidSize: return ErrorCode::InvalidArgument;
            case MemoryError::Kind::General: return ErrorCode::NotSupported;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SandboxError::Kind kind) {
        switch (kind) {
            case SandboxError::Kind::AlreadyRunning: return ErrorCode::InvalidState;
            case SandboxError::Kind::NotRunning: return ErrorCode::InvalidState;
            case SandboxError::Kind::NotPaused: return ErrorCode::InvalidState;
            case SandboxError::Kind::AlreadyTerminated: return ErrorCode::InvalidState;
            case SandboxError::Kind::NotTerminated: return ErrorCode::InvalidState;
            case SandboxError::Kind::NotFound: return ErrorCode::NotFound;
            case SandboxError::Kind::CapabilityDenied: return ErrorCode::PermissionDenied;
            case SandboxError::Kind::ResourceLimitExceeded: return ErrorCode::LimitExceeded;
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

/// Result type (similar to Rust's Result<T, E>)
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

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
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

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
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

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
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

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

/// Report a broken internal invariant and abort the process.
/// Never used for caller-supplied input.
[[noreturn]] void invariant_violation(const std::string& what);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace enclave_core
