#pragma once

/// @file protection.hpp
/// @brief Access flags and region descriptors for enclave_memory

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace enclave_memory {

// =============================================================================
// ProtectionFlags
// =============================================================================

/// Read/write/execute access flags (immutable value type)
struct ProtectionFlags {
    bool read = false;
    bool write = false;
    bool execute = false;

    constexpr ProtectionFlags() = default;
    constexpr ProtectionFlags(bool r, bool w, bool x) : read(r), write(w), execute(x) {}

    [[nodiscard]] static constexpr ProtectionFlags read_only() { return {true, false, false}; }
    [[nodiscard]] static constexpr ProtectionFlags read_write() { return {true, true, false}; }
    [[nodiscard]] static constexpr ProtectionFlags read_execute() { return {true, false, true}; }
    [[nodiscard]] static constexpr ProtectionFlags no_access() { return {false, false, false}; }

    constexpr bool operator==(const ProtectionFlags& other) const {
        return read == other.read && write == other.write && execute == other.execute;
    }
    constexpr bool operator!=(const ProtectionFlags& other) const { return !(*this == other); }

    /// "rwx" form, '-' for missing flags
    [[nodiscard]] std::string to_string() const;

    /// Parse the "rwx" form (exactly three characters)
    [[nodiscard]] static std::optional<ProtectionFlags> parse(const std::string& str);
};

// =============================================================================
// MemoryRegion
// =============================================================================

/// Descriptor of an address range. Identity is the base address.
struct MemoryRegion {
    std::uintptr_t base = 0;
    std::size_t size = 0;
    ProtectionFlags protection;
    std::optional<std::string> name;

    /// One past the last byte
    [[nodiscard]] std::uintptr_t end() const { return base + size; }

    /// False when base + size wraps past the top of the address space
    [[nodiscard]] bool fits_address_space() const {
        return size <= std::numeric_limits<std::uintptr_t>::max() - base;
    }

    /// Check if address lies inside [base, base + size)
    [[nodiscard]] bool contains(std::uintptr_t address) const {
        return address >= base && address - base < size;
    }

    /// Check if [address, address + length) lies inside the region
    [[nodiscard]] bool contains(std::uintptr_t address, std::size_t length) const {
        return contains(address) && length <= size - (address - base);
    }

    /// Check if the two ranges share at least one byte
    [[nodiscard]] bool overlaps(const MemoryRegion& other) const {
        return base < other.end() && other.base < end();
    }

    /// Name or "<anonymous>"
    [[nodiscard]] std::string display_name() const {
        return name.value_or("<anonymous>");
    }
};

} // namespace enclave_memory
