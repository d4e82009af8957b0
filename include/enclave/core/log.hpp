#pragma once

/// @file log.hpp
/// @brief Subsystem loggers and structured sandbox/region log lines

#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// =============================================================================
// Logging Macros
// =============================================================================

#define ENCLAVE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define ENCLAVE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define ENCLAVE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define ENCLAVE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define ENCLAVE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define ENCLAVE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace enclave_core {

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

    /// Per-logger overrides of level, keyed by logger name ("enclave_memory", ...)
    std::map<std::string, spdlog::level::level_enum> logger_levels;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

/// Parse "name=level" into a logger_levels entry
std::optional<std::pair<std::string, spdlog::level::level_enum>> parse_logger_level(const std::string& str);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Get the memory subsystem logger (allocator, regions)
std::shared_ptr<spdlog::logger> memory_logger();

/// Get the sandbox subsystem logger
std::shared_ptr<spdlog::logger> sandbox_logger();

// =============================================================================
// Log Levels
// =============================================================================

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Extra key/value pairs, printed in the order given
using LogFields = std::vector<std::pair<std::string, std::string>>;

/// "<message> {sandbox=<id>, key="value", ...}" on the sandbox logger
void log_sandbox_event(
    spdlog::level::level_enum level,
    std::uint64_t sandbox_id,
    std::string_view message,
    const LogFields& fields = {});

/// "<message> {base=0x..., size=<n>, name="..."}" on the memory logger
void log_region_event(
    spdlog::level::level_enum level,
    std::string_view message,
    std::uintptr_t base,
    std::size_t size,
    std::string_view name);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a multi-step operation with its duration
class LogScope {
public:
    LogScope(std::shared_ptr<spdlog::logger> logger, std::string name);
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace enclave_core
