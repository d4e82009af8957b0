#pragma once

/// @file region_registry.hpp
/// @brief Catalog of protected address ranges
///
/// Provides:
/// - Non-overlapping registration of memory regions
/// - Lookup of the region containing an address
/// - Protection changes on registered ranges
/// - Atomic allocate-and-register of isolated regions
/// - Runtime-switchable protection/isolation features

#include "fwd.hpp"
#include "allocator.hpp"
#include "protection.hpp"
#include "protected_region.hpp"

#include <enclave/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace enclave_memory {

// =============================================================================
// Configuration
// =============================================================================

/// Subsystem-wide memory configuration
struct MemoryConfig {
    /// Upper bound on the bytes held by isolated regions
    std::size_t memory_limit = std::numeric_limits<std::size_t>::max();
    /// When false, set_protection() always succeeds without checking bounds
    bool enable_protection = true;
    /// When false, create_isolated_region() is refused
    bool enable_isolation = true;

    /// Builder pattern
    MemoryConfig& with_memory_limit(std::size_t limit) { memory_limit = limit; return *this; }
    MemoryConfig& with_protection(bool enable) { enable_protection = enable; return *this; }
    MemoryConfig& with_isolation(bool enable) { enable_isolation = enable; return *this; }

    /// Build from an already-parsed JSON object; absent keys keep defaults
    [[nodiscard]] static enclave_core::Result<MemoryConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Snapshot of the memory subsystem
struct MemoryStatus {
    AllocatorStats stats;
    std::size_t region_count = 0;
    std::size_t registered_bytes = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

// =============================================================================
// Region Registry
// =============================================================================

/// Process-wide catalog of regions keyed by base address.
///
/// Invariant: no two registered ranges [base, base + size) overlap.
/// Created explicitly at subsystem init and shared by handle.
class RegionRegistry : public std::enable_shared_from_this<RegionRegistry> {
public:
    /// Create a registry; a SystemAllocator is used when none is given
    [[nodiscard]] static RegionRegistryPtr create(
        MemoryConfig config = {},
        AllocatorPtr allocator = nullptr);

    ~RegionRegistry();

    // Non-copyable
    RegionRegistry(const RegionRegistry&) = delete;
    RegionRegistry& operator=(const RegionRegistry&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Replace the configuration (effective on the next call)
    void set_config(const MemoryConfig& config);

    /// Get configuration
    [[nodiscard]] MemoryConfig config() const;

    /// Get the allocator backing isolated regions
    [[nodiscard]] const AllocatorPtr& allocator() const { return m_allocator; }

    // =========================================================================
    // Registration
    // =========================================================================

    /// Record a region (RegionAlreadyExists on same base or any overlap)
    enclave_core::Result<void> register_region(const MemoryRegion& region);

    /// Remove the region starting at base and return its descriptor
    enclave_core::Result<MemoryRegion> unregister_region(std::uintptr_t base);

    /// Find the region whose range contains address
    [[nodiscard]] std::optional<MemoryRegion> find_region(std::uintptr_t address) const;

    /// Replace the flags of the region containing [base, base + length)
    enclave_core::Result<void> set_protection(
        std::uintptr_t base, std::size_t length, ProtectionFlags protection);

    // =========================================================================
    // Isolated Regions
    // =========================================================================

    /// Allocate, register and attach a region in one step
    [[nodiscard]] enclave_core::Result<ProtectedRegionPtr> create_isolated_region(
        std::size_t size,
        ProtectionFlags protection,
        std::optional<std::string> name = std::nullopt);

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] std::size_t region_count() const;
    [[nodiscard]] std::size_t registered_bytes() const;

    /// Snapshot of all descriptors ordered by base
    [[nodiscard]] std::vector<MemoryRegion> regions() const;

    /// Allocator stats plus region totals
    [[nodiscard]] MemoryStatus status() const;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Drop every descriptor; live regions are released by their owners
    void shutdown();

private:
    RegionRegistry(MemoryConfig config, AllocatorPtr allocator);

    /// Region containing address (lock held)
    [[nodiscard]] std::map<std::uintptr_t, MemoryRegion>::const_iterator
    find_locked(std::uintptr_t address) const;

    /// Non-overlapping insert (exclusive lock held)
    enclave_core::Result<void> insert_locked(const MemoryRegion& region);

    AllocatorPtr m_allocator;

    mutable std::shared_mutex m_mutex;
    MemoryConfig m_config;
    std::map<std::uintptr_t, MemoryRegion> m_regions;
    std::size_t m_registered_bytes = 0;
};

} // namespace enclave_memory
