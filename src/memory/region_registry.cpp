/// @file region_registry.cpp
/// @brief RegionRegistry implementation

#include <enclave/memory/region_registry.hpp>
#include <enclave/core/log.hpp>

#include <iterator>
#include <mutex>
#include <string>

namespace enclave_memory {

// =============================================================================
// MemoryConfig
// =============================================================================

enclave_core::Result<MemoryConfig> MemoryConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return enclave_core::Err<MemoryConfig>(
            enclave_core::Error(enclave_core::ErrorCode::ParseError,
                "Memory config must be a JSON object"));
    }

    MemoryConfig config;

    if (j.contains("memory_limit")) {
        if (!j["memory_limit"].is_number_unsigned()) {
            return enclave_core::Err<MemoryConfig>(
                enclave_core::Error(enclave_core::ErrorCode::ParseError,
                    "'memory_limit' must be a non-negative integer"));
        }
        config.memory_limit = j["memory_limit"].get<std::size_t>();
    }

    if (j.contains("enable_protection")) {
        if (!j["enable_protection"].is_boolean()) {
            return enclave_core::Err<MemoryConfig>(
                enclave_core::Error(enclave_core::ErrorCode::ParseError,
                    "'enable_protection' must be a boolean"));
        }
        config.enable_protection = j["enable_protection"].get<bool>();
    }

    if (j.contains("enable_isolation")) {
        if (!j["enable_isolation"].is_boolean()) {
            return enclave_core::Err<MemoryConfig>(
                enclave_core::Error(enclave_core::ErrorCode::ParseError,
                    "'enable_isolation' must be a boolean"));
        }
        config.enable_isolation = j["enable_isolation"].get<bool>();
    }

    return enclave_core::Ok(config);
}

nlohmann::json MemoryConfig::to_json() const {
    return nlohmann::json{
        {"memory_limit", memory_limit},
        {"enable_protection", enable_protection},
        {"enable_isolation", enable_isolation}
    };
}

nlohmann::json MemoryStatus::to_json() const {
    return nlohmann::json{
        {"total_allocated", stats.total_allocated},
        {"total_deallocated", stats.total_deallocated},
        {"allocation_count", stats.allocation_count},
        {"deallocation_count", stats.deallocation_count},
        {"reallocation_count", stats.reallocation_count},
        {"current_usage", stats.current_usage()},
        {"region_count", region_count},
        {"registered_bytes", registered_bytes}
    };
}

// =============================================================================
// RegionRegistry
// =============================================================================

RegionRegistryPtr RegionRegistry::create(MemoryConfig config, AllocatorPtr allocator) {
    if (!allocator) {
        allocator = std::make_shared<SystemAllocator>();
    }
    return RegionRegistryPtr(new RegionRegistry(config, std::move(allocator)));
}

RegionRegistry::RegionRegistry(MemoryConfig config, AllocatorPtr allocator)
    : m_allocator(std::move(allocator))
    , m_config(config) {
}

RegionRegistry::~RegionRegistry() {
    if (!m_regions.empty()) {
        enclave_core::memory_logger()->debug(
            "Region registry destroyed with {} region(s) still registered", m_regions.size());
    }
}

void RegionRegistry::set_config(const MemoryConfig& config) {
    {
        std::unique_lock lock(m_mutex);
        m_config = config;
    }
    enclave_core::memory_logger()->info(
        "Memory config updated: limit={} protection={} isolation={}",
        config.memory_limit, config.enable_protection, config.enable_isolation);
}

MemoryConfig RegionRegistry::config() const {
    std::shared_lock lock(m_mutex);
    return m_config;
}

std::map<std::uintptr_t, MemoryRegion>::const_iterator
RegionRegistry::find_locked(std::uintptr_t address) const {
    auto it = m_regions.upper_bound(address);
    if (it == m_regions.begin()) {
        return m_regions.end();
    }
    --it;
    return it->second.contains(address) ? it : m_regions.end();
}

enclave_core::Result<void> RegionRegistry::insert_locked(const MemoryRegion& region) {
    if (region.size == 0) {
        return enclave_core::Err(enclave_core::MemoryError::invalid_size(region.size));
    }
    if (!region.fits_address_space()) {
        return enclave_core::Err(enclave_core::MemoryError::invalid_address(region.base, region.size));
    }

    // Only the neighbors on either side can overlap in a disjoint ordered map
    auto next = m_regions.lower_bound(region.base);
    if (next != m_regions.end() && next->second.overlaps(region)) {
        return enclave_core::Err(enclave_core::MemoryError::region_already_exists(next->first));
    }
    if (next != m_regions.begin()) {
        auto prev = std::prev(next);
        if (prev->second.overlaps(region)) {
            return enclave_core::Err(enclave_core::MemoryError::region_already_exists(prev->first));
        }
    }

    m_regions.emplace(region.base, region);
    m_registered_bytes += region.size;
    return enclave_core::Ok();
}

enclave_core::Result<void> RegionRegistry::register_region(const MemoryRegion& region) {
    {
        std::unique_lock lock(m_mutex);
        auto result = insert_locked(region);
        if (!result) {
            return result;
        }
    }
    enclave_core::log_region_event(spdlog::level::debug,
        "Registered region " + region.protection.to_string(), region.base, region.size, region.display_name());
    return enclave_core::Ok();
}

enclave_core::Result<MemoryRegion> RegionRegistry::unregister_region(std::uintptr_t base) {
    MemoryRegion removed;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_regions.find(base);
        if (it == m_regions.end()) {
            return enclave_core::Err<MemoryRegion>(enclave_core::MemoryError::region_not_found(base));
        }
        removed = std::move(it->second);
        m_registered_bytes -= removed.size;
        m_regions.erase(it);
    }
    enclave_core::log_region_event(spdlog::level::debug,
        "Unregistered region", removed.base, removed.size, removed.display_name());
    return enclave_core::Ok(std::move(removed));
}

std::optional<MemoryRegion> RegionRegistry::find_region(std::uintptr_t address) const {
    std::shared_lock lock(m_mutex);
    auto it = find_locked(address);
    if (it == m_regions.end()) {
        return std::nullopt;
    }
    return it->second;
}

enclave_core::Result<void> RegionRegistry::set_protection(
    std::uintptr_t base, std::size_t length, ProtectionFlags protection) {

    std::unique_lock lock(m_mutex);
    if (!m_config.enable_protection) {
        return enclave_core::Ok();
    }

    auto it = find_locked(base);
    if (it == m_regions.end() || !it->second.contains(base, length)) {
        return enclave_core::Err(enclave_core::MemoryError::invalid_address(base, length));
    }

    // find_locked only hands out const iterators
    m_regions.at(it->first).protection = protection;
    return enclave_core::Ok();
}

enclave_core::Result<ProtectedRegionPtr> RegionRegistry::create_isolated_region(
    std::size_t size,
    ProtectionFlags protection,
    std::optional<std::string> name) {

    // Every failure names the region it was meant to create
    std::string label = name.value_or("<anonymous>");
    auto fail = [&](enclave_core::Error error) {
        error.with_context("region", label).with_context("size", std::to_string(size));
        return enclave_core::Err<ProtectedRegionPtr>(std::move(error));
    };

    if (!config().enable_isolation) {
        return fail(enclave_core::MemoryError::general("Memory isolation is disabled"));
    }
    if (size == 0) {
        return fail(enclave_core::MemoryError::invalid_size(size));
    }

    auto created = ProtectedRegion::create(size, protection, std::move(name), m_allocator);
    if (!created) {
        return fail(created.error());
    }
    ProtectedRegionPtr region = std::move(*created);

    {
        std::unique_lock lock(m_mutex);

        // Checked again under the lock so a concurrent set_config cannot slip past
        if (!m_config.enable_isolation) {
            lock.unlock();
            return fail(enclave_core::MemoryError::general("Memory isolation is disabled"));
        }
        if (size > m_config.memory_limit || m_registered_bytes > m_config.memory_limit - size) {
            auto registered = m_registered_bytes;
            auto limit = m_config.memory_limit;
            lock.unlock();
            enclave_core::memory_logger()->warn(
                "Isolated region '{}' of {} bytes refused: {} of {} bytes registered",
                label, size, registered, limit);
            return fail(enclave_core::MemoryError::out_of_memory(size));
        }

        auto inserted = insert_locked(MemoryRegion{region->base(), size, protection, region->name()});
        if (!inserted) {
            // Storage handed out by the allocator overlaps a foreign registration
            lock.unlock();
            return fail(inserted.error());
        }
        region->attach(weak_from_this());
    }

    enclave_core::log_region_event(spdlog::level::debug,
        "Created isolated region " + protection.to_string(), region->base(), size, label);
    return enclave_core::Ok(std::move(region));
}

std::size_t RegionRegistry::region_count() const {
    std::shared_lock lock(m_mutex);
    return m_regions.size();
}

std::size_t RegionRegistry::registered_bytes() const {
    std::shared_lock lock(m_mutex);
    return m_registered_bytes;
}

std::vector<MemoryRegion> RegionRegistry::regions() const {
    std::shared_lock lock(m_mutex);
    std::vector<MemoryRegion> result;
    result.reserve(m_regions.size());
    for (const auto& [base, region] : m_regions) {
        result.push_back(region);
    }
    return result;
}

MemoryStatus RegionRegistry::status() const {
    MemoryStatus status;
    status.stats = m_allocator->stats();
    std::shared_lock lock(m_mutex);
    status.region_count = m_regions.size();
    status.registered_bytes = m_registered_bytes;
    return status;
}

void RegionRegistry::shutdown() {
    enclave_core::LogScope scope(enclave_core::memory_logger(), "RegionRegistry::shutdown");
    std::size_t dropped = 0;
    {
        std::unique_lock lock(m_mutex);
        dropped = m_regions.size();
        m_regions.clear();
        m_registered_bytes = 0;
    }
    enclave_core::memory_logger()->info("Region registry shut down ({} descriptor(s) dropped)", dropped);
}

} // namespace enclave_memory
