/// @file log.cpp
/// @brief Subsystem loggers for enclave
///
/// One spdlog logger per subsystem (core, memory, sandbox), each with an
/// optional level override, plus structured lines keyed by sandbox id or
/// region range.

#include <enclave/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <ios>
#include <mutex>
#include <sstream>

namespace enclave_core {

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Level for a logger: its override, else the global level (registry mutex held)
spdlog::level::level_enum level_for(const LoggerRegistry& reg, const std::string& name) {
    auto it = reg.config.logger_levels.find(name);
    return it != reg.config.logger_levels.end() ? it->second : reg.config.level;
}

/// Create sinks based on current configuration (registry mutex held)
std::vector<spdlog::sink_ptr> create_sinks(const LoggerRegistry& reg, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.config.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.config.file_enabled && !reg.config.log_directory.empty()) {
        try {
            auto log_path = std::filesystem::path(reg.config.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(), reg.config.max_file_size, reg.config.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Failed to create log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

void append_fields(std::ostringstream& oss, const LogFields& fields) {
    for (const auto& [key, value] : fields) {
        oss << ", " << key << "=\"" << value << "\"";
    }
    oss << "}";
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;

    // Existing loggers keep their sinks, only the level follows
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level_for(reg, name));
    }

    spdlog::set_level(reg.config.level);
}

std::optional<std::pair<std::string, spdlog::level::level_enum>> parse_logger_level(const std::string& str) {
    auto eq = str.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }
    auto level = parse_log_level(str.substr(eq + 1));
    if (!level) {
        return std::nullopt;
    }
    auto name = str.substr(0, eq);
    // "memory" is shorthand for "enclave_memory"
    if (name.rfind("enclave_", 0) != 0) {
        name = "enclave_" + name;
    }
    return std::make_pair(name, *level);
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = create_sinks(reg, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level_for(reg, name));

    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("enclave_core");
    return logger;
}

std::shared_ptr<spdlog::logger> memory_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("enclave_memory");
    return logger;
}

std::shared_ptr<spdlog::logger> sandbox_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("enclave_sandbox");
    return logger;
}

// =============================================================================
// Log Levels
// =============================================================================

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

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
// Structured Logging
// =============================================================================

void log_sandbox_event(
    spdlog::level::level_enum level,
    std::uint64_t sandbox_id,
    std::string_view message,
    const LogFields& fields)
{
    auto logger = sandbox_logger();
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream oss;
    oss << message << " {sandbox=" << sandbox_id;
    append_fields(oss, fields);
    logger->log(level, oss.str());
}

void log_region_event(
    spdlog::level::level_enum level,
    std::string_view message,
    std::uintptr_t base,
    std::size_t size,
    std::string_view name)
{
    auto logger = memory_logger();
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream oss;
    oss << message << " {base=0x" << std::hex << base << std::dec << ", size=" << size;
    append_fields(oss, {{"name", std::string(name)}});
    logger->log(level, oss.str());
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(std::shared_ptr<spdlog::logger> logger, std::string name)
    : m_logger(std::move(logger))
    , m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< Exiting {} ({}us)", m_name, duration.count());
}

// =============================================================================
// Shutdown
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();

    spdlog::shutdown();
}

} // namespace enclave_core
