#pragma once

/// @file sandbox.hpp
/// @brief Sandbox for isolated workload execution
///
/// Provides lifecycle control and permission checks with:
/// - Exact Created/Running/Paused/Terminated state machine
/// - Capability gating fixed at creation
/// - Resource accounting and limit enforcement per execution epoch
/// - Protected memory regions owned for the sandbox's lifetime

#include "fwd.hpp"
#include "types.hpp"
#include "resource_tracker.hpp"

#include <enclave/core/error.hpp>
#include <enclave/memory/fwd.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace enclave_sandbox {

// =============================================================================
// Execution
// =============================================================================

/// Checks applied around a workload
struct ExecutionPolicy {
    bool check_capabilities = true;
    bool enforce_limits = true;
};

/// Handle given to a running workload body
class ExecutionContext {
public:
    ExecutionContext(Sandbox& sandbox, std::shared_ptr<const std::atomic<bool>> cancel, bool enforce_limits);

    [[nodiscard]] SandboxId sandbox_id() const;
    [[nodiscard]] const std::string& working_dir() const;

    /// Query a granted capability
    [[nodiscard]] bool has_capability(Capability c) const;

    /// Account memory; fails ResourceLimitExceeded instead of exceeding the bound
    /// and AlreadyTerminated once the epoch has ended
    [[nodiscard]] enclave_core::Result<void> allocate_memory(std::size_t bytes);

    // Dropped once the epoch has ended
    void release_memory(std::size_t bytes);

    void report_cpu(double percent);
    void report_network_rate(std::uint64_t bps);
    void report_filesystem(std::uint64_t bytes);

    /// True once the sandbox has been terminated or restarted
    [[nodiscard]] bool cancelled() const { return m_cancel->load(); }

private:
    Sandbox& m_sandbox;
    std::shared_ptr<const std::atomic<bool>> m_cancel;
    bool m_enforce_limits;
};

/// Unit of guest work
struct Workload {
    using Body = std::function<enclave_core::Result<std::string>(ExecutionContext&)>;

    std::string name;
    CapabilitySet required;
    Body body;
};

/// Outcome of a completed workload
struct ExecutionResult {
    std::string output;
    std::chrono::nanoseconds duration{0};
    std::uint64_t epoch = 0;
    ResourceUsage usage;
};

// =============================================================================
// Sandbox
// =============================================================================

/// Isolated execution context with lifecycle state, capabilities and limits.
///
/// Transitions are serialised by a per-sandbox mutex; state() reads an
/// atomic mirror. Lock order: sandbox mutex, then region registry mutex.
class Sandbox {
public:
    /// @param region_registry Source of the main region in Isolated mode (may be null)
    Sandbox(SandboxId id, SandboxSpec spec, enclave_memory::RegionRegistryPtr region_registry = nullptr);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] SandboxId id() const { return m_id; }
    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] const ResourceLimits& limits() const { return m_limits; }
    [[nodiscard]] CapabilitySet capabilities() const { return m_capabilities; }
    [[nodiscard]] const std::string& working_dir() const { return m_working_dir; }
    [[nodiscard]] SandboxMode mode() const { return m_mode; }
    [[nodiscard]] BreachPolicy breach_policy() const { return m_breach_policy; }

    /// Check a capability granted at creation
    [[nodiscard]] bool has_capability(Capability c) const { return m_capabilities.has(c); }

    /// Set the observer for lifecycle events
    void set_event_callback(SandboxEventCallback callback);

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] SandboxState state() const { return m_state.load(); }
    [[nodiscard]] std::uint64_t epoch() const { return m_epoch.load(); }

    [[nodiscard]] bool is_active() const {
        auto s = m_state.load();
        return s == SandboxState::Running || s == SandboxState::Paused;
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Created -> Running
    enclave_core::Result<void> start();

    /// Running -> Paused
    enclave_core::Result<void> pause();

    /// Paused -> Running
    enclave_core::Result<void> resume();

    /// Created/Running/Paused -> Terminated; cancels the workload and frees regions
    enclave_core::Result<void> terminate();

    /// Terminated -> Running in a fresh epoch
    enclave_core::Result<void> restart();

    // =========================================================================
    // Execution
    // =========================================================================

    /// Run a workload with the lifecycle lock released
    [[nodiscard]] enclave_core::Result<ExecutionResult> execute(
        const Workload& workload, ExecutionPolicy policy = {});

    // =========================================================================
    // Memory
    // =========================================================================

    /// Take ownership of an externally created region
    enclave_core::Result<void> attach_region(enclave_memory::ProtectedRegionPtr region);

    [[nodiscard]] std::size_t region_count() const;
    [[nodiscard]] std::size_t region_bytes() const { return m_region_bytes.load(); }

    /// Descriptors of owned regions
    [[nodiscard]] std::vector<enclave_memory::MemoryRegion> regions() const;

    // =========================================================================
    // Resources
    // =========================================================================

    /// Current usage (owned regions count toward memory)
    [[nodiscard]] ResourceUsage sample() const;

    /// Usage counters for the current epoch
    [[nodiscard]] ResourceUsageTracker& usage() { return m_usage; }
    [[nodiscard]] const ResourceUsageTracker& usage() const { return m_usage; }

    /// Compare usage to limits and apply the breach policy if exceeded
    std::optional<LimitBreach> enforce_limits();

    // =========================================================================
    // Reporting
    // =========================================================================

    [[nodiscard]] SandboxSnapshot snapshot() const;

    [[nodiscard]] std::chrono::steady_clock::time_point creation_time() const { return m_creation_time; }
    [[nodiscard]] std::chrono::nanoseconds uptime() const;

private:
    friend class ExecutionContext;

    using RegionList = std::vector<enclave_memory::ProtectedRegionPtr>;

    /// Apply a workload's usage update unless its epoch has ended
    template <typename Fn>
    bool update_usage(const std::atomic<bool>& cancel, Fn&& fn) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (cancel.load()) {
            return false;
        }
        fn(m_usage);
        return true;
    }

    /// enforce_limits() scoped to one epoch; a null token means the current one
    std::optional<LimitBreach> enforce_limits_for(const std::atomic<bool>* cancel);

    /// Create the main region in Isolated mode (lock held)
    enclave_core::Result<void> provision_locked();

    /// Move to Terminated and hand back the regions to release (lock held)
    RegionList terminate_locked();

    void set_state(SandboxState state) { m_state.store(state); }

    void emit(SandboxEventKind kind, std::string details = {});

    SandboxId m_id;
    std::string m_name;
    ResourceLimits m_limits;
    CapabilitySet m_capabilities;
    std::string m_working_dir;
    SandboxMode m_mode;
    std::size_t m_region_size;
    BreachPolicy m_breach_policy;
    enclave_memory::RegionRegistryPtr m_region_registry;

    mutable std::mutex m_mutex;
    std::atomic<SandboxState> m_state{SandboxState::Created};
    std::atomic<std::uint64_t> m_epoch{1};
    std::shared_ptr<std::atomic<bool>> m_cancel;
    RegionList m_regions;
    std::atomic<std::size_t> m_region_bytes{0};
    ResourceUsageTracker m_usage;
    std::chrono::steady_clock::time_point m_creation_time;

    std::mutex m_callback_mutex;
    SandboxEventCallback m_callback;
};

} // namespace enclave_sandbox
