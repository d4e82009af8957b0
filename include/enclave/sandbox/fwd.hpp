#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for enclave_sandbox

#include <cstdint>
#include <memory>

namespace enclave_sandbox {

// Identity
struct SandboxId;

// Enums
enum class SandboxState : std::uint8_t;
enum class Capability : std::uint32_t;
enum class ResourceKind : std::uint8_t;
enum class BreachPolicy : std::uint8_t;
enum class SandboxMode : std::uint8_t;
enum class SandboxEventKind : std::uint8_t;

// Values
class CapabilitySet;
struct ResourceLimits;
struct ResourceUsage;
struct SandboxSpec;
struct SandboxEvent;
struct LimitBreach;
struct SandboxSnapshot;

// Execution
class ResourceUsageTracker;
class ExecutionContext;
struct ExecutionPolicy;
struct Workload;
struct ExecutionResult;
class Sandbox;

// Registry
struct RegistryConfig;
struct RegistryStatus;
struct BulkOutcome;
class SandboxRegistry;

using SandboxPtr = std::shared_ptr<Sandbox>;
using SandboxRegistryPtr = std::shared_ptr<SandboxRegistry>;

} // namespace enclave_sandbox
