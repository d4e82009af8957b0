#pragma once

/// @file sandbox_registry.hpp
/// @brief Registry of sandboxes with lifecycle fan-out and resource monitoring

#include "fwd.hpp"
#include "types.hpp"
#include "sandbox.hpp"

#include <enclave/core/error.hpp>
#include <enclave/memory/fwd.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace enclave_sandbox {

// =============================================================================
// Configuration
// =============================================================================

/// Registry-wide defaults and feature switches
struct RegistryConfig {
    ResourceLimits default_limits{
        .memory_bytes = 100 * 1024 * 1024,  // 100 MB
        .cpu_percent = 10.0,
    };
    bool default_network_access = false;
    bool default_filesystem_access = false;
    std::string default_working_dir = "/tmp";
    BreachPolicy breach_policy = BreachPolicy::Terminate;
    bool enable_memory_isolation = true;
    bool enable_resource_limits = true;
    bool enable_capabilities = true;
    std::chrono::milliseconds sampling_interval{100};

    /// Upper bound accepted for sampling_interval
    static constexpr std::chrono::milliseconds max_sampling_interval{24 * 60 * 60 * 1000};

    /// Builder pattern
    RegistryConfig& with_default_limits(const ResourceLimits& l) { default_limits = l; return *this; }
    RegistryConfig& with_network_access(bool enable) { default_network_access = enable; return *this; }
    RegistryConfig& with_filesystem_access(bool enable) { default_filesystem_access = enable; return *this; }
    RegistryConfig& with_working_dir(std::string dir) { default_working_dir = std::move(dir); return *this; }
    RegistryConfig& with_breach_policy(BreachPolicy p) { breach_policy = p; return *this; }
    RegistryConfig& with_memory_isolation(bool enable) { enable_memory_isolation = enable; return *this; }
    RegistryConfig& with_resource_limits(bool enable) { enable_resource_limits = enable; return *this; }
    RegistryConfig& with_capabilities(bool enable) { enable_capabilities = enable; return *this; }
    RegistryConfig& with_sampling_interval(std::chrono::milliseconds i) { sampling_interval = i; return *this; }

    /// Capabilities every new sandbox receives
    [[nodiscard]] CapabilitySet default_capabilities() const;

    [[nodiscard]] static enclave_core::Result<RegistryConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Counts and aggregate usage across all sandboxes
struct RegistryStatus {
    std::size_t total = 0;
    std::size_t created = 0;
    std::size_t running = 0;
    std::size_t paused = 0;
    std::size_t terminated = 0;
    std::uint64_t removed = 0;

    std::size_t total_memory_bytes = 0;
    double total_cpu_percent = 0.0;
    std::uint64_t total_network_bandwidth_bps = 0;
    std::uint64_t total_filesystem_bytes = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Per-id outcome of a bulk operation
struct BulkOutcome {
    std::vector<SandboxId> succeeded;
    std::vector<std::pair<SandboxId, enclave_core::Error>> failed;

    [[nodiscard]] bool all_ok() const { return failed.empty(); }
};

// =============================================================================
// Sandbox Registry
// =============================================================================

/// Owns every sandbox and routes lifecycle calls by id.
///
/// The structural lock guards only the id map; transitions take the
/// per-sandbox lock. Bulk operations snapshot ids first.
class SandboxRegistry {
public:
    /// Create a registry; a default RegionRegistry is created when none is given
    [[nodiscard]] static SandboxRegistryPtr create(
        RegistryConfig config = {},
        enclave_memory::RegionRegistryPtr region_registry = nullptr);

    ~SandboxRegistry();

    // Non-copyable
    SandboxRegistry(const SandboxRegistry&) = delete;
    SandboxRegistry& operator=(const SandboxRegistry&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_config(const RegistryConfig& config);
    [[nodiscard]] RegistryConfig config() const;

    [[nodiscard]] const enclave_memory::RegionRegistryPtr& region_registry() const {
        return m_region_registry;
    }

    /// Observer for every sandbox event
    void set_event_callback(SandboxEventCallback callback);

    // =========================================================================
    // Creation and Lookup
    // =========================================================================

    /// Create a sandbox in the Created state
    [[nodiscard]] enclave_core::Result<SandboxId> create_sandbox(const SandboxSpec& spec);

    [[nodiscard]] enclave_core::Result<SandboxPtr> get_sandbox(SandboxId id) const;
    [[nodiscard]] enclave_core::Result<SandboxSnapshot> snapshot(SandboxId id) const;
    [[nodiscard]] enclave_core::Result<bool> has_capability(SandboxId id, Capability c) const;
    [[nodiscard]] enclave_core::Result<ResourceUsage> usage(SandboxId id) const;

    /// Terminate if needed, then drop the sandbox
    enclave_core::Result<void> remove_sandbox(SandboxId id);

    [[nodiscard]] std::vector<SandboxId> sandbox_ids() const;
    [[nodiscard]] std::size_t size() const;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    enclave_core::Result<void> start(SandboxId id);
    enclave_core::Result<void> pause(SandboxId id);
    enclave_core::Result<void> resume(SandboxId id);
    enclave_core::Result<void> terminate(SandboxId id);
    enclave_core::Result<void> restart(SandboxId id);

    /// Run a workload under the current capability/limit switches
    [[nodiscard]] enclave_core::Result<ExecutionResult> execute(SandboxId id, const Workload& workload);

    /// Start every sandbox, collecting failures
    BulkOutcome start_all();

    /// Terminate every sandbox; already terminated counts as success
    BulkOutcome stop_all();

    // =========================================================================
    // Resource Monitor
    // =========================================================================

    /// One sampling pass; returns the breaches acted on
    std::vector<std::pair<SandboxId, LimitBreach>> sample_all();

    /// Start the background sampler (no-op if running)
    void start_monitor();

    /// Stop and join the background sampler
    void stop_monitor();

    [[nodiscard]] bool monitor_running() const { return m_monitor_running.load(); }

    // =========================================================================
    // Status
    // =========================================================================

    [[nodiscard]] RegistryStatus status() const;

    /// Stop the monitor, terminate and drop all sandboxes
    void shutdown();

private:
    SandboxRegistry(RegistryConfig config, enclave_memory::RegionRegistryPtr region_registry);

    /// Snapshot of all sandboxes (structural lock taken briefly)
    [[nodiscard]] std::vector<SandboxPtr> snapshot_sandboxes() const;

    /// Observer slot shared with every sandbox's event callback
    struct EventSink {
        std::mutex mutex;
        SandboxEventCallback callback;

        void dispatch(const SandboxEvent& event);
    };

    enclave_memory::RegionRegistryPtr m_region_registry;

    mutable std::mutex m_config_mutex;
    RegistryConfig m_config;

    mutable std::mutex m_mutex;
    std::unordered_map<SandboxId, SandboxPtr> m_sandboxes;
    std::atomic<std::uint64_t> m_next_id{1};
    std::atomic<std::uint64_t> m_removed{0};

    std::shared_ptr<EventSink> m_events;

    std::mutex m_monitor_mutex;
    std::condition_variable m_monitor_cv;
    std::atomic<bool> m_monitor_running{false};
    std::thread m_monitor_thread;
};

} // namespace enclave_sandbox
