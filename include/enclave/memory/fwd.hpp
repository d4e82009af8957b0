#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for enclave_memory

#include <memory>

namespace enclave_memory {

// Allocators
class IAllocator;
class SystemAllocator;
struct AllocatorStats;

// Regions
struct ProtectionFlags;
struct MemoryRegion;
class ProtectedRegion;

// Registry
struct MemoryConfig;
struct MemoryStatus;
class RegionRegistry;

using AllocatorPtr = std::shared_ptr<IAllocator>;
using ProtectedRegionPtr = std::unique_ptr<ProtectedRegion>;
using RegionRegistryPtr = std::shared_ptr<RegionRegistry>;

} // namespace enclave_memory
