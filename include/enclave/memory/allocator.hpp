#pragma once

/// @file allocator.hpp
/// @brief Base allocator interface for enclave_memory

#include "fwd.hpp"

#include <enclave/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>

namespace enclave_memory {

// =============================================================================
// Alignment Utilities
// =============================================================================

/// Check if a value is a non-zero power of two
[[nodiscard]] constexpr bool is_power_of_two(std::size_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

/// Align a value up to the given alignment
[[nodiscard]] constexpr std::size_t align_up(std::size_t value, std::size_t align) noexcept {
    return (value + align - 1) & ~(align - 1);
}

/// Align a value down to the given alignment
[[nodiscard]] constexpr std::size_t align_down(std::size_t value, std::size_t align) noexcept {
    return value & ~(align - 1);
}

/// Check if a pointer is aligned
[[nodiscard]] inline bool is_aligned(const void* ptr, std::size_t align) noexcept {
    return (reinterpret_cast<std::uintptr_t>(ptr) & (align - 1)) == 0;
}

/// Pointer returned for zero-sized requests: non-null, equal to the alignment,
/// never backed by storage
[[nodiscard]] inline void* zero_size_sentinel(std::size_t align) noexcept {
    return reinterpret_cast<void*>(align);
}

// =============================================================================
// Allocator Statistics
// =============================================================================

/// Monotonic allocation counters
struct AllocatorStats {
    std::size_t total_allocated = 0;
    std::size_t total_deallocated = 0;
    std::size_t allocation_count = 0;
    std::size_t deallocation_count = 0;
    std::size_t reallocation_count = 0;

    /// Bytes currently held (never negative)
    [[nodiscard]] std::size_t current_usage() const noexcept {
        return total_allocated >= total_deallocated ? total_allocated - total_deallocated : 0;
    }
};

// =============================================================================
// Allocator Interface
// =============================================================================

/// Raw allocation primitive with usage statistics
class IAllocator {
public:
    virtual ~IAllocator() = default;

    /// Allocate memory with the given size and alignment
    [[nodiscard]] virtual enclave_core::Result<void*> allocate(std::size_t size, std::size_t align) = 0;

    /// Deallocate memory (no-op for null pointers and zero sizes)
    virtual void deallocate(void* ptr, std::size_t size, std::size_t align) = 0;

    /// Grow or shrink a block, moving it if needed
    [[nodiscard]] virtual enclave_core::Result<void*> reallocate(
        void* ptr, std::size_t old_size, std::size_t new_size, std::size_t align) = 0;

    /// Consistent snapshot of the counters
    [[nodiscard]] virtual AllocatorStats stats() const = 0;

    /// Byte bound (max size_t = unbounded)
    [[nodiscard]] virtual std::size_t capacity() const noexcept = 0;

    /// Get the currently used memory
    [[nodiscard]] std::size_t used() const {
        return stats().current_usage();
    }

    /// Get the available memory
    [[nodiscard]] std::size_t available() const {
        auto cap = capacity();
        auto in_use = used();
        return cap > in_use ? cap - in_use : 0;
    }

    /// Allocate typed memory
    template<typename T>
    [[nodiscard]] enclave_core::Result<T*> allocate_typed(std::size_t count = 1) {
        auto result = allocate(sizeof(T) * count, alignof(T));
        if (!result) {
            return enclave_core::Err<T*>(result.error());
        }
        return enclave_core::Ok(static_cast<T*>(*result));
    }
};

// =============================================================================
// System Allocator
// =============================================================================

/// Default allocator backed by the global aligned operator new/delete
class SystemAllocator : public IAllocator {
public:
    /// @param capacity Maximum bytes held at once (unbounded by default)
    explicit SystemAllocator(std::size_t capacity = std::numeric_limits<std::size_t>::max());
    ~SystemAllocator() override = default;

    // Non-copyable
    SystemAllocator(const SystemAllocator&) = delete;
    SystemAllocator& operator=(const SystemAllocator&) = delete;

    [[nodiscard]] enclave_core::Result<void*> allocate(std::size_t size, std::size_t align) override;
    void deallocate(void* ptr, std::size_t size, std::size_t align) override;
    [[nodiscard]] enclave_core::Result<void*> reallocate(
        void* ptr, std::size_t old_size, std::size_t new_size, std::size_t align) override;

    [[nodiscard]] AllocatorStats stats() const override;
    [[nodiscard]] std::size_t capacity() const noexcept override { return m_capacity; }

private:
    /// Obtain storage, honoring the capacity bound (stats mutex held)
    void* raw_allocate(std::size_t size, std::size_t align, std::size_t releasing);
    static void raw_deallocate(void* ptr, std::size_t size, std::size_t align);

    std::size_t m_capacity;
    mutable std::mutex m_mutex;
    AllocatorStats m_stats;
};

} // namespace enclave_memory
