/// @file resource_tracker.cpp
/// @brief ResourceUsageTracker implementation

#include <enclave/sandbox/resource_tracker.hpp>

#include <algorithm>

namespace enclave_sandbox {

ResourceUsageTracker::ResourceUsageTracker(const ResourceLimits& limits) : m_limits(limits) {}

std::int64_t ResourceUsageTracker::now_ns() {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now().time_since_epoch()).count();
    // Keep 0 free as the "not running" marker
    return std::max<std::int64_t>(ns, 1);
}

bool ResourceUsageTracker::allocate(std::size_t bytes, std::size_t reserved) {
    std::size_t current = m_memory_used.load();
    std::size_t new_value = 0;

    do {
        new_value = current + bytes;
        if (new_value < current) {
            return false;
        }
        if (m_limits.memory_bytes) {
            std::size_t bound = *m_limits.memory_bytes;
            if (reserved > bound || new_value > bound - reserved) {
                return false;
            }
        }
    } while (!m_memory_used.compare_exchange_weak(current, new_value));

    update_peak(new_value);
    return true;
}

void ResourceUsageTracker::record_allocation(std::size_t bytes) {
    std::size_t new_value = m_memory_used.fetch_add(bytes) + bytes;
    update_peak(new_value);
}

void ResourceUsageTracker::release(std::size_t bytes) {
    std::size_t current = m_memory_used.load();
    std::size_t new_value = 0;
    do {
        new_value = current > bytes ? current - bytes : 0;
    } while (!m_memory_used.compare_exchange_weak(current, new_value));
}

void ResourceUsageTracker::update_peak(std::size_t value) {
    std::size_t peak = m_memory_peak.load();
    while (value > peak && !m_memory_peak.compare_exchange_weak(peak, value)) {
        // Retry
    }
}

void ResourceUsageTracker::begin_run() {
    std::int64_t expected = 0;
    m_run_started_ns.compare_exchange_strong(expected, now_ns());
}

void ResourceUsageTracker::pause_run() {
    std::int64_t started = m_run_started_ns.exchange(0);
    if (started != 0) {
        m_run_banked_ns.fetch_add(now_ns() - started);
    }
}

std::chrono::milliseconds ResourceUsageTracker::run_time() const {
    std::int64_t total = m_run_banked_ns.load();
    std::int64_t started = m_run_started_ns.load();
    if (started != 0) {
        total += now_ns() - started;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(total));
}

ResourceUsage ResourceUsageTracker::snapshot(std::size_t region_bytes) const {
    ResourceUsage usage;
    usage.memory_bytes = m_memory_used.load() + region_bytes;
    usage.peak_memory_bytes = std::max(m_memory_peak.load() + region_bytes, usage.memory_bytes);
    usage.cpu_percent = m_cpu_percent.load();
    usage.network_bandwidth_bps = m_network_bps.load();
    usage.filesystem_bytes = m_filesystem_bytes.load();
    usage.execution_time = run_time();
    return usage;
}

std::vector<ResourceKind> ResourceUsageTracker::exceeded(
    const ResourceLimits& limits, std::size_t region_bytes) const {

    std::vector<ResourceKind> result;

    if (limits.memory_bytes && m_memory_used.load() + region_bytes > *limits.memory_bytes) {
        result.push_back(ResourceKind::Memory);
    }
    if (limits.cpu_percent && m_cpu_percent.load() > *limits.cpu_percent) {
        result.push_back(ResourceKind::Cpu);
    }
    if (limits.network_bandwidth_bps && m_network_bps.load() > *limits.network_bandwidth_bps) {
        result.push_back(ResourceKind::NetworkBandwidth);
    }
    if (limits.filesystem_bytes && m_filesystem_bytes.load() > *limits.filesystem_bytes) {
        result.push_back(ResourceKind::FilesystemSpace);
    }
    if (limits.execution_time && run_time() > *limits.execution_time) {
        result.push_back(ResourceKind::ExecutionTime);
    }

    return result;
}

void ResourceUsageTracker::reset() {
    m_memory_used.store(0);
    m_memory_peak.store(0);
    m_cpu_percent.store(0.0);
    m_network_bps.store(0);
    m_filesystem_bytes.store(0);
    m_run_banked_ns.store(0);
    m_run_started_ns.store(0);
}

} // namespace enclave_sandbox
