/// @file main.cpp
/// @brief enclave_demo entry point - drives one sandbox through its lifecycle
///
/// Creates the region and sandbox registries, runs a filesystem-only sandbox
/// through start/pause/resume/terminate/restart, shows a denied network
/// workload, and prints the final status reports as JSON.

#include <enclave/core/log.hpp>
#include <enclave/memory/memory.hpp>
#include <enclave/sandbox/sandbox_registry.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [registry-config.json]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help      Show this help\n"
              << "  -v, --version   Show version\n"
              << "  --verbose       Enable debug logging\n"
              << "  --log-level L   trace, debug, info, warn, error, critical or off\n"
              << "  --log NAME=L    Level for one subsystem (core, memory, sandbox)\n";
}

void print_version() {
    std::cout << "enclave_demo 0.1.0\n";
}

/// Load a registry configuration file
enclave_core::Result<enclave_sandbox::RegistryConfig> load_config(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return enclave_core::Err<enclave_sandbox::RegistryConfig>(
            enclave_core::Error(enclave_core::ErrorCode::NotFound,
                "Cannot open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return enclave_core::Err<enclave_sandbox::RegistryConfig>(
            enclave_core::Error(enclave_core::ErrorCode::ParseError,
                "JSON parse error in " + path.string() + ": " + e.what()));
    }

    return enclave_sandbox::RegistryConfig::from_json(j);
}

bool report(const char* step, const enclave_core::Result<void>& result) {
    if (!result) {
        enclave_core::debug::record_error(result.error());
        ENCLAVE_LOG_ERROR("{} failed: {}", step, enclave_core::build_error_chain(result.error()));
        return false;
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path config_path;
    std::optional<spdlog::level::level_enum> level;
    std::map<std::string, spdlog::level::level_enum> logger_levels;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--verbose") {
            level = spdlog::level::debug;
        } else if (arg == "--log-level") {
            if (i + 1 >= argc || !(level = enclave_core::parse_log_level(argv[i + 1]))) {
                std::cerr << "--log-level requires one of: trace, debug, info, warn, error, critical, off\n";
                return 1;
            }
            ++i;
        } else if (arg == "--log") {
            auto entry = i + 1 < argc ? enclave_core::parse_logger_level(argv[i + 1]) : std::nullopt;
            if (!entry) {
                std::cerr << "--log requires NAME=LEVEL, e.g. memory=debug\n";
                return 1;
            }
            logger_levels[entry->first] = entry->second;
            ++i;
        } else if (arg[0] != '-') {
            config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    enclave_core::LogConfig log_config;
    log_config.level = level.value_or(spdlog::level::info);
    log_config.logger_levels = std::move(logger_levels);
    enclave_core::configure_logging(log_config);
    ENCLAVE_LOG_DEBUG("Log level: {}", enclave_core::log_level_name(enclave_core::get_global_log_level()));

    enclave_sandbox::RegistryConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded) {
            ENCLAVE_LOG_ERROR("{}", enclave_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(*loaded);
    }

    auto regions = enclave_memory::RegionRegistry::create();
    auto sandboxes = enclave_sandbox::SandboxRegistry::create(config, regions);

    sandboxes->set_event_callback([](const enclave_sandbox::SandboxEvent& event) {
        ENCLAVE_LOG_INFO("event: sandbox {} {} {}",
            event.id.value, enclave_sandbox::to_string(event.kind), event.details);
    });

    auto spec = enclave_sandbox::SandboxSpec{}
        .with_name("demo")
        .with_limits(enclave_sandbox::ResourceLimits{}.with_memory(64 * 1024 * 1024))
        .with_capability(enclave_sandbox::Capability::Filesystem)
        .with_mode(enclave_sandbox::SandboxMode::Isolated);

    auto created = sandboxes->create_sandbox(spec);
    if (!created) {
        ENCLAVE_LOG_ERROR("create_sandbox failed: {}", enclave_core::build_error_chain(created.error()));
        return 1;
    }
    auto id = *created;

    if (!report("start", sandboxes->start(id))) {
        return 1;
    }

    enclave_sandbox::Workload fetch{
        .name = "fetch",
        .required = enclave_sandbox::CapabilitySet(enclave_sandbox::Capability::Network),
        .body = [](enclave_sandbox::ExecutionContext&) -> enclave_core::Result<std::string> {
            return enclave_core::Ok(std::string("fetched"));
        },
    };
    auto denied = sandboxes->execute(id, fetch);
    if (denied) {
        ENCLAVE_LOG_ERROR("Network workload was not denied");
        return 1;
    }
    enclave_core::debug::record_error(denied.error());
    ENCLAVE_LOG_INFO("Network workload denied: {}", denied.error().message());

    enclave_sandbox::Workload scratch{
        .name = "scratch",
        .required = enclave_sandbox::CapabilitySet(enclave_sandbox::Capability::Filesystem),
        .body = [](enclave_sandbox::ExecutionContext& ctx) -> enclave_core::Result<std::string> {
            auto allocated = ctx.allocate_memory(4096);
            if (!allocated) {
                return enclave_core::Err<std::string>(allocated.error());
            }
            ctx.report_filesystem(512);
            return enclave_core::Ok("wrote scratch file in " + ctx.working_dir());
        },
    };
    auto ran = sandboxes->execute(id, scratch);
    if (!ran) {
        ENCLAVE_LOG_ERROR("Workload failed: {}", enclave_core::build_error_chain(ran.error()));
        return 1;
    }
    ENCLAVE_LOG_INFO("Workload output: {}", ran->output);

    if (!report("pause", sandboxes->pause(id)) ||
        !report("resume", sandboxes->resume(id)) ||
        !report("terminate", sandboxes->terminate(id)) ||
        !report("restart", sandboxes->restart(id))) {
        return 1;
    }

    auto snapshot = sandboxes->snapshot(id);
    if (snapshot) {
        std::cout << snapshot->to_json().dump(2) << "\n";
    }
    std::cout << sandboxes->status().to_json().dump(2) << "\n";
    std::cout << regions->status().to_json().dump(2) << "\n";

    sandboxes->shutdown();
    regions->shutdown();

    ENCLAVE_LOG_DEBUG("{}", enclave_core::debug::error_stats_summary());
    enclave_core::shutdown_logging();
    return 0;
}
