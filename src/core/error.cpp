/// @file error.cpp
/// @brief Error handling implementation for enclave_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Kind names for the memory and sandbox taxonomies
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - The fatal path for broken internal invariants

#include <enclave/core/error.hpp>
#include <enclave/core/log.hpp>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace enclave_core {

// =============================================================================
// Kind Names
// =============================================================================

const char* to_string(MemoryError::Kind kind) {
    switch (kind) {
        case MemoryError::Kind::OutOfMemory: return "OutOfMemory";
        case MemoryError::Kind::InvalidAlignment: return "InvalidAlignment";
        case MemoryError::Kind::InvalidAddress: return "InvalidAddress";
        case MemoryError::Kind::PermissionDenied: return "PermissionDenied";
        case MemoryError::Kind::RegionAlreadyExists: return "RegionAlreadyExists";
        case MemoryError::Kind::RegionNotFound: return "RegionNotFound";
        case MemoryError::Kind::InvalidSize: return "InvalidSize";
        case MemoryError::Kind::General: return "General";
    }
    return "Unknown";
}

const char* to_string(SandboxError::Kind kind) {
    switch (kind) {
        case SandboxError::Kind::AlreadyRunning: return "AlreadyRunning";
        case SandboxError::Kind::NotRunning: return "NotRunning";
        case SandboxError::Kind::NotPaused: return "NotPaused";
        case SandboxError::Kind::AlreadyTerminated: return "AlreadyTerminated";
        case SandboxError::Kind::NotTerminated: return "NotTerminated";
        case SandboxError::Kind::NotFound: return "NotFound";
        case SandboxError::Kind::CapabilityDenied: return "CapabilityDenied";
        case SandboxError::Kind::ResourceLimitExceeded: return "ResourceLimitExceeded";
    }
    return "Unknown";
}

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

/// Format memory error with full context
std::string format_memory_error(const MemoryError& err) {
    std::ostringstream oss;
    oss << "[MemoryError:" << to_string(err.kind) << "] " << err.message;

    if (err.address != 0) {
        oss << " (address: 0x" << std::hex << err.address << std::dec << ")";
    }
    if (err.size != 0) {
        oss << " (size: " << err.size << ")";
    }

    return oss.str();
}

/// Format sandbox error with full context
std::string format_sandbox_error(const SandboxError& err) {
    std::ostringstream oss;
    oss << "[SandboxError:" << to_string(err.kind) << "] " << err.message;

    if (err.sandbox_id != 0) {
        oss << " (sandbox: " << err.sandbox_id << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, MemoryError>) {
            oss << detail::format_memory_error(err);
        } else if constexpr (std::is_same_v<T, SandboxError>) {
            oss << detail::format_sandbox_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " [" << key << "=" << value << "]";
    }

    return oss.str();
}

void invariant_violation(const std::string& what) {
    core_logger()->critical("Internal invariant violated: {}", what);
    flush_all_loggers();
    std::abort();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> memory_errors{0};
    std::atomic<std::uint64_t> sandbox_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<MemoryError>()) {
        s_error_stats.memory_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<SandboxError>()) {
        s_error_stats.sandbox_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.memory_errors.store(0, std::memory_order_relaxed);
    s_error_stats.sandbox_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Memory: " << s_error_stats.memory_errors.load() << "\n"
        << "  Sandbox: " << s_error_stats.sandbox_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace enclave_core
