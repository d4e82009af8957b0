/// @file types.cpp
/// @brief Sandbox value types: names, validation and JSON conversion

#include <enclave/sandbox/types.hpp>

#include <array>
#include <utility>

namespace enclave_sandbox {

namespace {

constexpr std::array<std::pair<Capability, const char*>, 5> k_capability_names = {{
    {Capability::Network, "network"},
    {Capability::Filesystem, "filesystem"},
    {Capability::ProcessCreation, "process_creation"},
    {Capability::SystemCall, "system_call"},
    {Capability::Device, "device"},
}};

enclave_core::Error parse_error(const std::string& message) {
    return enclave_core::Error(enclave_core::ErrorCode::ParseError, message);
}

/// Read an optional unsigned integer field
enclave_core::Result<std::optional<std::uint64_t>> read_unsigned(
    const nlohmann::json& j, const char* key) {

    if (!j.contains(key) || j[key].is_null()) {
        return enclave_core::Ok(std::optional<std::uint64_t>{});
    }
    if (!j[key].is_number_unsigned()) {
        return enclave_core::Err<std::optional<std::uint64_t>>(
            parse_error(std::string("'") + key + "' must be a non-negative integer"));
    }
    return enclave_core::Ok(std::optional<std::uint64_t>(j[key].get<std::uint64_t>()));
}

} // anonymous namespace

// =============================================================================
// Names
// =============================================================================

const char* to_string(SandboxState state) {
    switch (state) {
        case SandboxState::Created: return "Created";
        case SandboxState::Running: return "Running";
        case SandboxState::Paused: return "Paused";
        case SandboxState::Terminated: return "Terminated";
        default: return "Unknown";
    }
}

const char* to_string(Capability capability) {
    for (const auto& [flag, name] : k_capability_names) {
        if (flag == capability) {
            return name;
        }
    }
    return capability == Capability::None ? "none" : "combined";
}

std::optional<Capability> parse_capability(const std::string& name) {
    for (const auto& [flag, flag_name] : k_capability_names) {
        if (name == flag_name) {
            return flag;
        }
    }
    return std::nullopt;
}

const char* to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Memory: return "memory";
        case ResourceKind::Cpu: return "cpu";
        case ResourceKind::NetworkBandwidth: return "network_bandwidth";
        case ResourceKind::FilesystemSpace: return "filesystem_space";
        case ResourceKind::ExecutionTime: return "execution_time";
        default: return "unknown";
    }
}

std::string join_resource_kinds(const std::vector<ResourceKind>& kinds) {
    std::string result;
    for (auto kind : kinds) {
        if (!result.empty()) {
            result += ", ";
        }
        result += to_string(kind);
    }
    return result;
}

const char* to_string(BreachPolicy policy) {
    switch (policy) {
        case BreachPolicy::Terminate: return "terminate";
        case BreachPolicy::Pause: return "pause";
        default: return "unknown";
    }
}

std::optional<BreachPolicy> parse_breach_policy(const std::string& str) {
    if (str == "terminate") return BreachPolicy::Terminate;
    if (str == "pause") return BreachPolicy::Pause;
    return std::nullopt;
}

const char* to_string(SandboxMode mode) {
    switch (mode) {
        case SandboxMode::Standard: return "standard";
        case SandboxMode::Isolated: return "isolated";
        default: return "unknown";
    }
}

std::optional<SandboxMode> parse_sandbox_mode(const std::string& str) {
    if (str == "standard") return SandboxMode::Standard;
    if (str == "isolated") return SandboxMode::Isolated;
    return std::nullopt;
}

const char* to_string(SandboxEventKind kind) {
    switch (kind) {
        case SandboxEventKind::Started: return "Started";
        case SandboxEventKind::Paused: return "Paused";
        case SandboxEventKind::Resumed: return "Resumed";
        case SandboxEventKind::Terminated: return "Terminated";
        case SandboxEventKind::Restarted: return "Restarted";
        case SandboxEventKind::LimitExceeded: return "LimitExceeded";
        default: return "Unknown";
    }
}

// =============================================================================
// CapabilitySet
// =============================================================================

std::vector<std::string> CapabilitySet::names() const {
    std::vector<std::string> result;
    for (const auto& [flag, name] : k_capability_names) {
        if (has(flag)) {
            result.emplace_back(name);
        }
    }
    return result;
}

std::string CapabilitySet::to_string() const {
    if (empty()) {
        return "none";
    }
    std::string result;
    for (const auto& name : names()) {
        if (!result.empty()) {
            result += ",";
        }
        result += name;
    }
    return result;
}

enclave_core::Result<CapabilitySet> CapabilitySet::from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        return enclave_core::Err<CapabilitySet>(parse_error("Capabilities must be an array of names"));
    }

    CapabilitySet set;
    for (const auto& item : j) {
        if (!item.is_string()) {
            return enclave_core::Err<CapabilitySet>(parse_error("Capability name must be a string"));
        }
        auto name = item.get<std::string>();
        auto capability = parse_capability(name);
        if (!capability) {
            return enclave_core::Err<CapabilitySet>(parse_error("Unknown capability: " + name));
        }
        set = set.with(*capability);
    }
    return enclave_core::Ok(set);
}

// =============================================================================
// ResourceLimits
// =============================================================================

enclave_core::Result<void> ResourceLimits::validate() const {
    auto invalid = [](const char* what) {
        return enclave_core::Err(enclave_core::Error(enclave_core::ErrorCode::InvalidArgument,
            std::string("Resource limit '") + what + "' must be positive"));
    };

    if (memory_bytes && *memory_bytes == 0) return invalid("memory_bytes");
    if (cpu_percent && !(*cpu_percent > 0.0)) return invalid("cpu_percent");
    if (network_bandwidth_bps && *network_bandwidth_bps == 0) return invalid("network_bandwidth_bps");
    if (filesystem_bytes && *filesystem_bytes == 0) return invalid("filesystem_bytes");
    if (execution_time && execution_time->count() <= 0) return invalid("execution_time_ms");
    return enclave_core::Ok();
}

enclave_core::Result<ResourceLimits> ResourceLimits::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return enclave_core::Err<ResourceLimits>(parse_error("Resource limits must be a JSON object"));
    }

    ResourceLimits limits;

    auto memory = read_unsigned(j, "memory_bytes");
    if (!memory) return enclave_core::Err<ResourceLimits>(memory.error());
    if (*memory) limits.memory_bytes = static_cast<std::size_t>(**memory);

    if (j.contains("cpu_percent") && !j["cpu_percent"].is_null()) {
        if (!j["cpu_percent"].is_number()) {
            return enclave_core::Err<ResourceLimits>(parse_error("'cpu_percent' must be a number"));
        }
        limits.cpu_percent = j["cpu_percent"].get<double>();
    }

    auto network = read_unsigned(j, "network_bandwidth_bps");
    if (!network) return enclave_core::Err<ResourceLimits>(network.error());
    limits.network_bandwidth_bps = *network;

    auto filesystem = read_unsigned(j, "filesystem_bytes");
    if (!filesystem) return enclave_core::Err<ResourceLimits>(filesystem.error());
    limits.filesystem_bytes = *filesystem;

    auto execution = read_unsigned(j, "execution_time_ms");
    if (!execution) return enclave_core::Err<ResourceLimits>(execution.error());
    if (*execution) {
        limits.execution_time = std::chrono::milliseconds(static_cast<std::int64_t>(**execution));
    }

    auto valid = limits.validate();
    if (!valid) {
        return enclave_core::Err<ResourceLimits>(valid.error());
    }
    return enclave_core::Ok(limits);
}

nlohmann::json ResourceLimits::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (memory_bytes) j["memory_bytes"] = *memory_bytes;
    if (cpu_percent) j["cpu_percent"] = *cpu_percent;
    if (network_bandwidth_bps) j["network_bandwidth_bps"] = *network_bandwidth_bps;
    if (filesystem_bytes) j["filesystem_bytes"] = *filesystem_bytes;
    if (execution_time) j["execution_time_ms"] = static_cast<std::uint64_t>(execution_time->count());
    return j;
}

// =============================================================================
// ResourceUsage
// =============================================================================

nlohmann::json ResourceUsage::to_json() const {
    return nlohmann::json{
        {"memory_bytes", memory_bytes},
        {"peak_memory_bytes", peak_memory_bytes},
        {"cpu_percent", cpu_percent},
        {"network_bandwidth_bps", network_bandwidth_bps},
        {"filesystem_bytes", filesystem_bytes},
        {"execution_time_ms", execution_time.count()}
    };
}

// =============================================================================
// SandboxSpec
// =============================================================================

enclave_core::Result<void> SandboxSpec::validate() const {
    if (limits) {
        auto valid = limits->validate();
        if (!valid) {
            return valid;
        }
    }
    if (mode == SandboxMode::Isolated && region_size == 0) {
        return enclave_core::Err(enclave_core::Error(enclave_core::ErrorCode::InvalidArgument,
            "Isolated sandbox '" + name + "' needs a non-zero region size"));
    }
    return enclave_core::Ok();
}

enclave_core::Result<SandboxSpec> SandboxSpec::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return enclave_core::Err<SandboxSpec>(parse_error("Sandbox spec must be a JSON object"));
    }

    SandboxSpec spec;

    if (j.contains("name")) {
        if (!j["name"].is_string()) {
            return enclave_core::Err<SandboxSpec>(parse_error("'name' must be a string"));
        }
        spec.name = j["name"].get<std::string>();
    }

    if (j.contains("limits") && !j["limits"].is_null()) {
        auto limits = ResourceLimits::from_json(j["limits"]);
        if (!limits) {
            return enclave_core::Err<SandboxSpec>(limits.error());
        }
        spec.limits = *limits;
    }

    if (j.contains("capabilities")) {
        auto caps = CapabilitySet::from_json(j["capabilities"]);
        if (!caps) {
            return enclave_core::Err<SandboxSpec>(caps.error());
        }
        spec.capabilities = *caps;
    }

    if (j.contains("working_dir") && !j["working_dir"].is_null()) {
        if (!j["working_dir"].is_string()) {
            return enclave_core::Err<SandboxSpec>(parse_error("'working_dir' must be a string"));
        }
        spec.working_dir = j["working_dir"].get<std::string>();
    }

    if (j.contains("mode")) {
        auto mode = j["mode"].is_string()
            ? parse_sandbox_mode(j["mode"].get<std::string>())
            : std::nullopt;
        if (!mode) {
            return enclave_core::Err<SandboxSpec>(parse_error("'mode' must be \"standard\" or \"isolated\""));
        }
        spec.mode = *mode;
    }

    auto region_size = read_unsigned(j, "region_size");
    if (!region_size) return enclave_core::Err<SandboxSpec>(region_size.error());
    if (*region_size) spec.region_size = static_cast<std::size_t>(**region_size);

    if (j.contains("breach_policy") && !j["breach_policy"].is_null()) {
        auto policy = j["breach_policy"].is_string()
            ? parse_breach_policy(j["breach_policy"].get<std::string>())
            : std::nullopt;
        if (!policy) {
            return enclave_core::Err<SandboxSpec>(
                parse_error("'breach_policy' must be \"terminate\" or \"pause\""));
        }
        spec.breach_policy = *policy;
    }

    auto valid = spec.validate();
    if (!valid) {
        return enclave_core::Err<SandboxSpec>(valid.error());
    }
    return enclave_core::Ok(std::move(spec));
}

// =============================================================================
// SandboxSnapshot
// =============================================================================

nlohmann::json SandboxSnapshot::to_json() const {
    return nlohmann::json{
        {"id", id.value},
        {"name", name},
        {"state", enclave_sandbox::to_string(state)},
        {"capabilities", capabilities.names()},
        {"limits", limits.to_json()},
        {"usage", usage.to_json()},
        {"working_dir", working_dir},
        {"mode", enclave_sandbox::to_string(mode)},
        {"breach_policy", enclave_sandbox::to_string(breach_policy)},
        {"epoch", epoch},
        {"region_count", region_count},
        {"region_bytes", region_bytes},
        {"uptime_ms", uptime.count()}
    };
}

} // namespace enclave_sandbox
