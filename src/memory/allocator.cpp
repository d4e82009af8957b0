/// @file allocator.cpp
/// @brief SystemAllocator implementation

#include <enclave/memory/allocator.hpp>
#include <enclave/core/log.hpp>

#include <algorithm>
#include <cstring>
#include <new>

namespace enclave_memory {

SystemAllocator::SystemAllocator(std::size_t capacity)
    : m_capacity(capacity) {
}

void* SystemAllocator::raw_allocate(std::size_t size, std::size_t align, std::size_t releasing) {
    std::size_t in_use = m_stats.current_usage();
    in_use = in_use > releasing ? in_use - releasing : 0;
    if (size > m_capacity || in_use > m_capacity - size) {
        return nullptr;
    }
    return ::operator new(size, std::align_val_t{align}, std::nothrow);
}

void SystemAllocator::raw_deallocate(void* ptr, std::size_t size, std::size_t align) {
    ::operator delete(ptr, size, std::align_val_t{align});
}

enclave_core::Result<void*> SystemAllocator::allocate(std::size_t size, std::size_t align) {
    if (!is_power_of_two(align)) {
        return enclave_core::Err<void*>(enclave_core::MemoryError::invalid_alignment(align));
    }

    if (size == 0) {
        return enclave_core::Ok(zero_size_sentinel(align));
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    void* ptr = raw_allocate(size, align, 0);
    if (ptr == nullptr) {
        enclave_core::memory_logger()->warn("Allocation of {} bytes (align {}) failed", size, align);
        return enclave_core::Err<void*>(enclave_core::MemoryError::out_of_memory(size));
    }

    m_stats.total_allocated += size;
    m_stats.allocation_count += 1;
    return enclave_core::Ok(ptr);
}

void SystemAllocator::deallocate(void* ptr, std::size_t size, std::size_t align) {
    if (ptr == nullptr || size == 0 || ptr == zero_size_sentinel(align)) {
        return;
    }

    if (!is_power_of_two(align)) {
        // Such a block can never have been handed out
        enclave_core::memory_logger()->error("Deallocate with invalid alignment {} ignored", align);
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    raw_deallocate(ptr, size, align);
    m_stats.total_deallocated += size;
    m_stats.deallocation_count += 1;
}

enclave_core::Result<void*> SystemAllocator::reallocate(
    void* ptr, std::size_t old_size, std::size_t new_size, std::size_t align) {

    if (new_size == 0) {
        deallocate(ptr, old_size, align);
        return allocate(0, align);
    }

    if (!is_power_of_two(align)) {
        return enclave_core::Err<void*>(enclave_core::MemoryError::invalid_alignment(align));
    }

    bool has_block = ptr != nullptr && old_size != 0 && ptr != zero_size_sentinel(align);
    std::size_t releasing = has_block ? old_size : 0;

    std::lock_guard<std::mutex> lock(m_mutex);

    void* new_ptr = raw_allocate(new_size, align, releasing);
    if (new_ptr == nullptr) {
        enclave_core::memory_logger()->warn(
            "Reallocation {} -> {} bytes (align {}) failed", old_size, new_size, align);
        return enclave_core::Err<void*>(enclave_core::MemoryError::out_of_memory(new_size));
    }

    if (has_block) {
        std::memcpy(new_ptr, ptr, std::min(old_size, new_size));
        raw_deallocate(ptr, old_size, align);
    }

    m_stats.total_allocated += new_size;
    m_stats.total_deallocated += releasing;
    m_stats.reallocation_count += 1;
    return enclave_core::Ok(new_ptr);
}

AllocatorStats SystemAllocator::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace enclave_memory
