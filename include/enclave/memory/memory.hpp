#pragma once

/// @file memory.hpp
/// @brief Main header for enclave_memory - protected memory regions
///
/// Bounded memory regions with explicit access flags:
/// - IAllocator / SystemAllocator: raw allocation with statistics
/// - ProtectedRegion: owned buffer with checked read/write
/// - RegionRegistry: non-overlapping catalog of registered ranges

#include "fwd.hpp"
#include "allocator.hpp"
#include "protection.hpp"
#include "protected_region.hpp"
#include "region_registry.hpp"

namespace enclave_memory {

/// Prelude namespace for commonly used types
namespace prelude {
    using enclave_memory::IAllocator;
    using enclave_memory::SystemAllocator;
    using enclave_memory::ProtectionFlags;
    using enclave_memory::MemoryRegion;
    using enclave_memory::ProtectedRegion;
    using enclave_memory::RegionRegistry;
    using enclave_memory::MemoryConfig;
    using enclave_memory::align_up;
    using enclave_memory::align_down;
    using enclave_memory::is_aligned;
}

} // namespace enclave_memory
