#pragma once

/// @file resource_tracker.hpp
/// @brief Per-epoch resource accounting for a sandbox

#include "fwd.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace enclave_sandbox {

/// Tracks resource usage within a sandbox.
///
/// Counters are lock-free so a workload can report usage while the
/// sandbox lifecycle lock is released.
class ResourceUsageTracker {
public:
    ResourceUsageTracker() = default;
    explicit ResourceUsageTracker(const ResourceLimits& limits);

    // Non-copyable
    ResourceUsageTracker(const ResourceUsageTracker&) = delete;
    ResourceUsageTracker& operator=(const ResourceUsageTracker&) = delete;

    // =========================================================================
    // Memory Tracking
    // =========================================================================

    /// Record memory allocation; refuses if memory + reserved would exceed the bound
    [[nodiscard]] bool allocate(std::size_t bytes, std::size_t reserved = 0);

    /// Record memory allocation without checking the bound
    void record_allocation(std::size_t bytes);

    /// Record memory release (saturates at zero)
    void release(std::size_t bytes);

    [[nodiscard]] std::size_t memory_used() const { return m_memory_used.load(); }
    [[nodiscard]] std::size_t memory_peak() const { return m_memory_peak.load(); }

    // =========================================================================
    // Reported Rates
    // =========================================================================

    void set_cpu_percent(double percent) { m_cpu_percent.store(percent); }
    void set_network_bandwidth(std::uint64_t bps) { m_network_bps.store(bps); }
    void set_filesystem_bytes(std::uint64_t bytes) { m_filesystem_bytes.store(bytes); }

    [[nodiscard]] double cpu_percent() const { return m_cpu_percent.load(); }
    [[nodiscard]] std::uint64_t network_bandwidth() const { return m_network_bps.load(); }
    [[nodiscard]] std::uint64_t filesystem_bytes() const { return m_filesystem_bytes.load(); }

    // =========================================================================
    // Run Time
    // =========================================================================

    /// Start the run clock (no-op if already running)
    void begin_run();

    /// Stop the run clock and bank the elapsed time
    void pause_run();

    /// Banked time plus the current run, if any
    [[nodiscard]] std::chrono::milliseconds run_time() const;

    // =========================================================================
    // Limits
    // =========================================================================

    [[nodiscard]] const ResourceLimits& limits() const { return m_limits; }

    /// Usage snapshot; region bytes count toward memory
    [[nodiscard]] ResourceUsage snapshot(std::size_t region_bytes = 0) const;

    /// Bounds currently exceeded
    [[nodiscard]] std::vector<ResourceKind> exceeded(
        const ResourceLimits& limits, std::size_t region_bytes = 0) const;

    /// Zero every counter and stop the run clock
    void reset();

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] static std::int64_t now_ns();

    void update_peak(std::size_t value);

    ResourceLimits m_limits;

    std::atomic<std::size_t> m_memory_used{0};
    std::atomic<std::size_t> m_memory_peak{0};
    std::atomic<double> m_cpu_percent{0.0};
    std::atomic<std::uint64_t> m_network_bps{0};
    std::atomic<std::uint64_t> m_filesystem_bytes{0};

    std::atomic<std::int64_t> m_run_banked_ns{0};
    std::atomic<std::int64_t> m_run_started_ns{0};  ///< 0 when not running
};

} // namespace enclave_sandbox
