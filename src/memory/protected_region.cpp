/// @file protected_region.cpp
/// @brief ProtectedRegion implementation

#include <enclave/memory/protected_region.hpp>
#include <enclave/memory/allocator.hpp>
#include <enclave/memory/region_registry.hpp>
#include <enclave/core/log.hpp>

#include <cstring>

namespace enclave_memory {

enclave_core::Result<ProtectedRegionPtr> ProtectedRegion::create(
    std::size_t size,
    ProtectionFlags protection,
    std::optional<std::string> name,
    AllocatorPtr allocator) {

    if (size == 0) {
        return enclave_core::Err<ProtectedRegionPtr>(enclave_core::MemoryError::invalid_size(size));
    }
    if (!allocator) {
        allocator = std::make_shared<SystemAllocator>();
    }

    auto storage = allocator->allocate(size, default_alignment);
    if (!storage) {
        return enclave_core::Err<ProtectedRegionPtr>(storage.error());
    }

    auto* data = static_cast<std::uint8_t*>(*storage);
    std::memset(data, 0, size);

    return enclave_core::Ok(ProtectedRegionPtr(
        new ProtectedRegion(data, size, protection, std::move(name), std::move(allocator))));
}

ProtectedRegion::ProtectedRegion(std::uint8_t* data, std::size_t size, ProtectionFlags protection,
                                 std::optional<std::string> name, AllocatorPtr allocator)
    : m_data(data)
    , m_base(reinterpret_cast<std::uintptr_t>(data))
    , m_size(size)
    , m_name(std::move(name))
    , m_allocator(std::move(allocator))
    , m_protection(protection)
    , m_created_at(std::chrono::system_clock::now())
    , m_last_access(m_created_at) {
}

ProtectedRegion::~ProtectedRegion() {
    if (auto registry = m_registry.lock()) {
        auto removed = registry->unregister_region(m_base);
        if (!removed) {
            // Registry was shut down before the region was released
            enclave_core::memory_logger()->debug(
                "Region {:#x} already gone from registry: {}", m_base, removed.error().message());
        }
    }
    m_allocator->deallocate(m_data, m_size, default_alignment);
}

MemoryRegion ProtectedRegion::region() const {
    return MemoryRegion{m_base, m_size, protection(), m_name};
}

ProtectionFlags ProtectedRegion::protection() const {
    if (auto registry = m_registry.lock()) {
        if (auto found = registry->find_region(m_base); found && found->base == m_base) {
            return found->protection;
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_protection;
}

enclave_core::Result<void> ProtectedRegion::set_protection(ProtectionFlags flags) {
    if (auto registry = m_registry.lock()) {
        auto result = registry->set_protection(m_base, m_size, flags);
        if (!result) {
            return result;
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_protection = flags;
    return enclave_core::Ok();
}

bool ProtectedRegion::is_registered() const {
    auto registry = m_registry.lock();
    if (!registry) {
        return false;
    }
    auto found = registry->find_region(m_base);
    return found.has_value() && found->base == m_base;
}

enclave_core::Result<std::span<const std::uint8_t>> ProtectedRegion::read(
    std::size_t offset, std::size_t length) const {

    if (!check_range(offset, length)) {
        return enclave_core::Err<std::span<const std::uint8_t>>(
            enclave_core::MemoryError::invalid_address(m_base + offset, length));
    }
    if (!protection().read) {
        return enclave_core::Err<std::span<const std::uint8_t>>(
            enclave_core::MemoryError::permission_denied(m_base + offset, "read"));
    }

    touch();
    return enclave_core::Ok(std::span<const std::uint8_t>(m_data + offset, length));
}

enclave_core::Result<void> ProtectedRegion::write(std::size_t offset, std::span<const std::uint8_t> bytes) {
    if (!check_range(offset, bytes.size())) {
        return enclave_core::Err(enclave_core::MemoryError::invalid_address(m_base + offset, bytes.size()));
    }
    if (!protection().write) {
        return enclave_core::Err(enclave_core::MemoryError::permission_denied(m_base + offset, "write"));
    }

    if (!bytes.empty()) {
        std::memcpy(m_data + offset, bytes.data(), bytes.size());
    }
    touch();
    return enclave_core::Ok();
}

std::chrono::system_clock::time_point ProtectedRegion::last_access() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_access;
}

void ProtectedRegion::attach(std::weak_ptr<RegionRegistry> registry) {
    m_registry = std::move(registry);
}

void ProtectedRegion::touch() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_access = std::chrono::system_clock::now();
}

} // namespace enclave_memory
