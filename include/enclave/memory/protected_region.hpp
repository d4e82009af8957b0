#pragma once

/// @file protected_region.hpp
/// @brief Owned, sized byte buffer tagged with access flags

#include "fwd.hpp"
#include "protection.hpp"

#include <enclave/core/error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace enclave_memory {

/// Sole owner of a backing buffer of exactly size() bytes.
///
/// Storage comes from an IAllocator and is returned to it on destruction.
/// A region created through RegionRegistry::create_isolated_region() stays
/// registered until its owner releases it; the destructor unregisters it.
class ProtectedRegion {
public:
    /// Default alignment of the backing storage
    static constexpr std::size_t default_alignment = alignof(std::max_align_t);

    /// Allocate a zero-filled region (InvalidSize when size == 0)
    [[nodiscard]] static enclave_core::Result<ProtectedRegionPtr> create(
        std::size_t size,
        ProtectionFlags protection,
        std::optional<std::string> name,
        AllocatorPtr allocator);

    ~ProtectedRegion();

    // Sole ownership through ProtectedRegionPtr
    ProtectedRegion(const ProtectedRegion&) = delete;
    ProtectedRegion& operator=(const ProtectedRegion&) = delete;
    ProtectedRegion(ProtectedRegion&&) = delete;
    ProtectedRegion& operator=(ProtectedRegion&&) = delete;

    // =========================================================================
    // Descriptor
    // =========================================================================

    /// Descriptor with the effective protection flags
    [[nodiscard]] MemoryRegion region() const;

    [[nodiscard]] std::uintptr_t base() const { return m_base; }
    [[nodiscard]] std::size_t size() const { return m_size; }
    [[nodiscard]] const std::optional<std::string>& name() const { return m_name; }

    /// Effective flags: the registry's copy once registered, local otherwise
    [[nodiscard]] ProtectionFlags protection() const;

    /// Change the flags of the whole region (also in the registry, if any)
    enclave_core::Result<void> set_protection(ProtectionFlags flags);

    /// Whether the region is currently attached to a live registry
    [[nodiscard]] bool is_registered() const;

    // =========================================================================
    // Views
    // =========================================================================

    [[nodiscard]] std::uint8_t* as_ptr() { return m_data; }
    [[nodiscard]] const std::uint8_t* as_ptr() const { return m_data; }

    [[nodiscard]] std::span<std::uint8_t> as_slice() { return {m_data, m_size}; }
    [[nodiscard]] std::span<const std::uint8_t> as_slice() const { return {m_data, m_size}; }

    // =========================================================================
    // Checked Access
    // =========================================================================

    /// Read [offset, offset + length); requires the read flag
    [[nodiscard]] enclave_core::Result<std::span<const std::uint8_t>> read(
        std::size_t offset, std::size_t length) const;

    /// Copy bytes to offset; requires the write flag
    enclave_core::Result<void> write(std::size_t offset, std::span<const std::uint8_t> bytes);

    /// Time of the last successful read or write
    [[nodiscard]] std::chrono::system_clock::time_point last_access() const;

    [[nodiscard]] std::chrono::system_clock::time_point created_at() const { return m_created_at; }

private:
    friend class RegionRegistry;

    ProtectedRegion(std::uint8_t* data, std::size_t size, ProtectionFlags protection,
                    std::optional<std::string> name, AllocatorPtr allocator);

    /// Bind to the registry that recorded this region
    void attach(std::weak_ptr<RegionRegistry> registry);

    [[nodiscard]] bool check_range(std::size_t offset, std::size_t length) const {
        return length <= m_size && offset <= m_size - length;
    }

    void touch() const;

    std::uint8_t* m_data;
    std::uintptr_t m_base;
    std::size_t m_size;
    std::optional<std::string> m_name;
    AllocatorPtr m_allocator;
    std::weak_ptr<RegionRegistry> m_registry;

    mutable std::mutex m_mutex;
    ProtectionFlags m_protection;
    std::chrono::system_clock::time_point m_created_at;
    mutable std::chrono::system_clock::time_point m_last_access;
};

} // namespace enclave_memory
