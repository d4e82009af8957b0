#pragma once

/// @file types.hpp
/// @brief Core value types for enclave_sandbox

#include "fwd.hpp"

#include <enclave/core/error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace enclave_sandbox {

// =============================================================================
// Sandbox Identity
// =============================================================================

/// Registry-assigned sandbox identifier (0 is invalid)
struct SandboxId {
    std::uint64_t value = 0;

    constexpr SandboxId() = default;
    explicit constexpr SandboxId(std::uint64_t v) : value(v) {}

    [[nodiscard]] constexpr bool is_valid() const { return value != 0; }

    constexpr bool operator==(const SandboxId& other) const { return value == other.value; }
    constexpr bool operator!=(const SandboxId& other) const { return value != other.value; }
    constexpr bool operator<(const SandboxId& other) const { return value < other.value; }
};

// =============================================================================
// Lifecycle State
// =============================================================================

/// Sandbox lifecycle state
enum class SandboxState : std::uint8_t {
    Created,
    Running,
    Paused,
    Terminated,
};

/// Convert sandbox state to string
[[nodiscard]] const char* to_string(SandboxState state);

// =============================================================================
// Capabilities
// =============================================================================

/// Capability flags (can be combined with bitwise OR)
enum class Capability : std::uint32_t {
    None            = 0,
    Network         = 1 << 0,
    Filesystem      = 1 << 1,
    ProcessCreation = 1 << 2,
    SystemCall      = 1 << 3,
    Device          = 1 << 4,

    All             = Network | Filesystem | ProcessCreation | SystemCall | Device,
};

/// Bitwise operators for Capability
constexpr Capability operator|(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}
constexpr Capability operator&(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
}
constexpr Capability operator~(Capability a) {
    return static_cast<Capability>(~static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(Capability::All));
}
constexpr Capability& operator|=(Capability& a, Capability b) {
    a = a | b;
    return a;
}

/// Name of a single capability flag
[[nodiscard]] const char* to_string(Capability capability);

/// Parse a single capability name ("network", "filesystem", ...)
[[nodiscard]] std::optional<Capability> parse_capability(const std::string& name);

/// Fixed set of capabilities granted to a sandbox
class CapabilitySet {
public:
    constexpr CapabilitySet() = default;
    constexpr explicit CapabilitySet(Capability bits) : m_bits(bits & Capability::All) {}

    /// Check if a single capability is granted
    [[nodiscard]] constexpr bool has(Capability c) const {
        return c != Capability::None && (m_bits & c) == c;
    }

    /// Check that every capability in caps is granted
    [[nodiscard]] constexpr bool has_all(CapabilitySet caps) const {
        return (m_bits & caps.m_bits) == caps.m_bits;
    }

    /// Capabilities in required that are not granted
    [[nodiscard]] constexpr CapabilitySet missing(CapabilitySet required) const {
        return CapabilitySet(required.m_bits & ~m_bits);
    }

    /// Copy with an extra capability granted
    [[nodiscard]] constexpr CapabilitySet with(Capability c) const {
        return CapabilitySet(m_bits | c);
    }

    /// Union of two sets
    [[nodiscard]] constexpr CapabilitySet merged(CapabilitySet other) const {
        return CapabilitySet(m_bits | other.m_bits);
    }

    [[nodiscard]] constexpr bool empty() const { return m_bits == Capability::None; }
    [[nodiscard]] constexpr Capability raw() const { return m_bits; }

    /// Names of granted capabilities in flag order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Comma-separated names, "none" when empty
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static constexpr CapabilitySet none() { return CapabilitySet(); }
    [[nodiscard]] static constexpr CapabilitySet all() { return CapabilitySet(Capability::All); }

    /// Build from a JSON array of capability names
    [[nodiscard]] static enclave_core::Result<CapabilitySet> from_json(const nlohmann::json& j);

    constexpr bool operator==(const CapabilitySet& other) const { return m_bits == other.m_bits; }
    constexpr bool operator!=(const CapabilitySet& other) const { return m_bits != other.m_bits; }

private:
    Capability m_bits = Capability::None;
};

// =============================================================================
// Resources
// =============================================================================

/// Kinds of bounded resources
enum class ResourceKind : std::uint8_t {
    Memory,
    Cpu,
    NetworkBandwidth,
    FilesystemSpace,
    ExecutionTime,
};

/// Convert resource kind to string
[[nodiscard]] const char* to_string(ResourceKind kind);

/// Join resource kind names with ", "
[[nodiscard]] std::string join_resource_kinds(const std::vector<ResourceKind>& kinds);

/// Per-sandbox resource bounds (absent = unbounded)
struct ResourceLimits {
    std::optional<std::size_t> memory_bytes;
    std::optional<double> cpu_percent;
    std::optional<std::uint64_t> network_bandwidth_bps;
    std::optional<std::uint64_t> filesystem_bytes;
    std::optional<std::chrono::milliseconds> execution_time;

    /// Builder pattern
    ResourceLimits& with_memory(std::size_t bytes) { memory_bytes = bytes; return *this; }
    ResourceLimits& with_cpu_percent(double percent) { cpu_percent = percent; return *this; }
    ResourceLimits& with_network_bandwidth(std::uint64_t bps) { network_bandwidth_bps = bps; return *this; }
    ResourceLimits& with_filesystem(std::uint64_t bytes) { filesystem_bytes = bytes; return *this; }
    ResourceLimits& with_execution_time(std::chrono::milliseconds t) { execution_time = t; return *this; }

    /// No bounds at all
    static ResourceLimits unlimited() { return ResourceLimits{}; }

    /// Every present bound must be positive (InvalidArgument otherwise)
    [[nodiscard]] enclave_core::Result<void> validate() const;

    [[nodiscard]] static enclave_core::Result<ResourceLimits> from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Snapshot of resource consumption for one execution epoch
struct ResourceUsage {
    std::size_t memory_bytes = 0;
    std::size_t peak_memory_bytes = 0;
    double cpu_percent = 0.0;
    std::uint64_t network_bandwidth_bps = 0;
    std::uint64_t filesystem_bytes = 0;
    std::chrono::milliseconds execution_time{0};

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Action taken when a sandbox exceeds a limit
enum class BreachPolicy : std::uint8_t {
    Terminate,
    Pause,
};

[[nodiscard]] const char* to_string(BreachPolicy policy);
[[nodiscard]] std::optional<BreachPolicy> parse_breach_policy(const std::string& str);

// =============================================================================
// Sandbox Configuration
// =============================================================================

/// Memory provisioning mode
enum class SandboxMode : std::uint8_t {
    Standard,   ///< No automatic region
    Isolated,   ///< Main protected region provisioned on start/restart
};

[[nodiscard]] const char* to_string(SandboxMode mode);
[[nodiscard]] std::optional<SandboxMode> parse_sandbox_mode(const std::string& str);

/// Per-sandbox configuration
struct SandboxSpec {
    /// Default size of the main region in Isolated mode
    static constexpr std::size_t default_region_size = 1024 * 1024;

    std::string name = "sandbox";
    std::optional<ResourceLimits> limits;       ///< Registry defaults when absent
    CapabilitySet capabilities;
    std::optional<std::string> working_dir;     ///< Registry default when absent
    SandboxMode mode = SandboxMode::Standard;
    std::size_t region_size = default_region_size;
    std::optional<BreachPolicy> breach_policy;  ///< Registry policy when absent

    /// Builder pattern
    SandboxSpec& with_name(std::string n) { name = std::move(n); return *this; }
    SandboxSpec& with_limits(const ResourceLimits& l) { limits = l; return *this; }
    SandboxSpec& with_capability(Capability c) { capabilities = capabilities.with(c); return *this; }
    SandboxSpec& with_capabilities(CapabilitySet caps) { capabilities = caps; return *this; }
    SandboxSpec& with_working_dir(std::string dir) { working_dir = std::move(dir); return *this; }
    SandboxSpec& with_mode(SandboxMode m) { mode = m; return *this; }
    SandboxSpec& with_region_size(std::size_t bytes) { region_size = bytes; return *this; }
    SandboxSpec& with_breach_policy(BreachPolicy p) { breach_policy = p; return *this; }

    /// Structural validation (InvalidArgument)
    [[nodiscard]] enclave_core::Result<void> validate() const;

    [[nodiscard]] static enclave_core::Result<SandboxSpec> from_json(const nlohmann::json& j);
};

// =============================================================================
// Events and Reports
// =============================================================================

/// Lifecycle event kinds
enum class SandboxEventKind : std::uint8_t {
    Started,
    Paused,
    Resumed,
    Terminated,
    Restarted,
    LimitExceeded,
};

[[nodiscard]] const char* to_string(SandboxEventKind kind);

/// Event delivered to the registry's observer
struct SandboxEvent {
    SandboxId id;
    SandboxEventKind kind = SandboxEventKind::Started;
    std::string details;
    std::chrono::system_clock::time_point timestamp;
};

/// Observer for sandbox events
using SandboxEventCallback = std::function<void(const SandboxEvent&)>;

/// Result of a limit check that found at least one bound exceeded
struct LimitBreach {
    std::vector<ResourceKind> exceeded;
    ResourceUsage usage;
    BreachPolicy applied = BreachPolicy::Terminate;

    /// Human-readable summary, e.g. "memory, cpu"
    [[nodiscard]] std::string describe() const { return join_resource_kinds(exceeded); }
};

/// Read-only view of a sandbox for security and monitoring consumers
struct SandboxSnapshot {
    SandboxId id;
    std::string name;
    SandboxState state = SandboxState::Created;
    CapabilitySet capabilities;
    ResourceLimits limits;
    ResourceUsage usage;
    std::string working_dir;
    SandboxMode mode = SandboxMode::Standard;
    BreachPolicy breach_policy = BreachPolicy::Terminate;
    std::uint64_t epoch = 0;
    std::size_t region_count = 0;
    std::size_t region_bytes = 0;
    std::chrono::milliseconds uptime{0};

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace enclave_sandbox

template<>
struct std::hash<enclave_sandbox::SandboxId> {
    std::size_t operator()(const enclave_sandbox::SandboxId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
