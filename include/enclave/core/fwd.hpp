#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for enclave_core module

#include <cstdint>

namespace enclave_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct MemoryError;
struct SandboxError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace enclave_core
