/// @file test_sandbox_registry.cpp
/// @brief Tests for SandboxRegistry and its configuration

#include <catch2/catch_test_macros.hpp>
#include <enclave/sandbox/sandbox_registry.hpp>
#include <enclave/memory/memory.hpp>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace enclave_sandbox;
using enclave_core::SandboxError;

namespace {

Workload network_workload() {
    return Workload{"fetch", CapabilitySet(Capability::Network),
        [](ExecutionContext&) -> enclave_core::Result<std::string> {
            return enclave_core::Ok(std::string("fetched"));
        }};
}

} // namespace

// =============================================================================
// Creation and Lookup
// =============================================================================

TEST_CASE("SandboxRegistry: create and look up", "[sandbox][registry]") {
    auto registry = SandboxRegistry::create();

    auto first = registry->create_sandbox(SandboxSpec{}.with_name("a"));
    auto second = registry->create_sandbox(SandboxSpec{}.with_name("b"));
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    REQUIRE(first->is_valid());
    REQUIRE(*first != *second);
    REQUIRE(registry->size() == 2);

    auto sandbox = registry->get_sandbox(*first);
    REQUIRE(sandbox.is_ok());
    REQUIRE((*sandbox)->name() == "a");
    REQUIRE((*sandbox)->state() == SandboxState::Created);

    REQUIRE(registry->sandbox_ids() == std::vector<SandboxId>{*first, *second});
}

TEST_CASE("SandboxRegistry: unknown ids", "[sandbox][registry]") {
    auto registry = SandboxRegistry::create();
    SandboxId missing(99);

    REQUIRE(registry->get_sandbox(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->snapshot(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->usage(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->has_capability(missing, Capability::Network).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->start(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->pause(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->resume(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->terminate(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->restart(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->remove_sandbox(missing).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->execute(missing, network_workload()).error().is(SandboxError::Kind::NotFound));
}

TEST_CASE("SandboxRegistry: registry defaults", "[sandbox][registry]") {
    SECTION("applied when the spec leaves them out") {
        auto registry = SandboxRegistry::create();
        auto id = registry->create_sandbox(SandboxSpec{});
        REQUIRE(id.is_ok());

        auto sandbox = *registry->get_sandbox(*id);
        REQUIRE(sandbox->working_dir() == "/tmp");
        REQUIRE(sandbox->limits().memory_bytes == 100u * 1024 * 1024);
        REQUIRE(sandbox->limits().cpu_percent == 10.0);
        REQUIRE(sandbox->capabilities().empty());
        REQUIRE(sandbox->breach_policy() == BreachPolicy::Terminate);
    }

    SECTION("spec values win") {
        auto registry = SandboxRegistry::create();
        auto id = registry->create_sandbox(SandboxSpec{}
            .with_working_dir("/srv/job")
            .with_limits(ResourceLimits{}.with_memory(4096))
            .with_breach_policy(BreachPolicy::Pause));
        REQUIRE(id.is_ok());

        auto sandbox = *registry->get_sandbox(*id);
        REQUIRE(sandbox->working_dir() == "/srv/job");
        REQUIRE(sandbox->limits().memory_bytes == 4096u);
        REQUIRE_FALSE(sandbox->limits().cpu_percent.has_value());
        REQUIRE(sandbox->breach_policy() == BreachPolicy::Pause);
    }

    SECTION("default access flags extend requested capabilities") {
        auto registry = SandboxRegistry::create(RegistryConfig{}.with_network_access(true));
        auto id = registry->create_sandbox(SandboxSpec{}.with_capability(Capability::Device));
        REQUIRE(id.is_ok());

        REQUIRE(*registry->has_capability(*id, Capability::Network));
        REQUIRE(*registry->has_capability(*id, Capability::Device));
        REQUIRE_FALSE(*registry->has_capability(*id, Capability::Filesystem));
    }

    SECTION("invalid specs are rejected") {
        auto registry = SandboxRegistry::create();
        auto bad_limits = registry->create_sandbox(SandboxSpec{}.with_limits(ResourceLimits{}.with_memory(0)));
        REQUIRE(bad_limits.is_err());
        REQUIRE(bad_limits.error().code() == enclave_core::ErrorCode::InvalidArgument);

        auto bad_region = registry->create_sandbox(
            SandboxSpec{}.with_mode(SandboxMode::Isolated).with_region_size(0));
        REQUIRE(bad_region.is_err());
        REQUIRE(registry->size() == 0);
    }
}

TEST_CASE("SandboxRegistry: remove", "[sandbox][registry]") {
    auto registry = SandboxRegistry::create();
    auto id = *registry->create_sandbox(SandboxSpec{});
    REQUIRE(registry->start(id).is_ok());
    auto sandbox = *registry->get_sandbox(id);

    REQUIRE(registry->remove_sandbox(id).is_ok());
    REQUIRE(sandbox->state() == SandboxState::Terminated);
    REQUIRE(registry->size() == 0);
    REQUIRE(registry->get_sandbox(id).error().is(SandboxError::Kind::NotFound));
    REQUIRE(registry->remove_sandbox(id).error().is(SandboxError::Kind::NotFound));

    SECTION("already terminated sandboxes can be removed") {
        auto other = *registry->create_sandbox(SandboxSpec{});
        REQUIRE(registry->terminate(other).is_ok());
        REQUIRE(registry->remove_sandbox(other).is_ok());
    }

    SECTION("ids are never reused") {
        auto next = *registry->create_sandbox(SandboxSpec{});
        REQUIRE(next != id);
        REQUIRE(id < next);
    }

    REQUIRE(registry->status().removed >= 1);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("SandboxRegistry: filesystem-only sandbox", "[sandbox][registry][execute]") {
    auto regions = enclave_memory::RegionRegistry::create();
    auto registry = SandboxRegistry::create(RegistryConfig{}, regions);

    auto id = registry->create_sandbox(SandboxSpec{}
        .with_limits(ResourceLimits{}.with_memory(64 * 1024 * 1024))
        .with_capability(Capability::Filesystem));
    REQUIRE(id.is_ok());

    REQUIRE(registry->start(*id).is_ok());

    auto denied = registry->execute(*id, network_workload());
    REQUIRE(denied.is_err());
    REQUIRE(denied.error().is(SandboxError::Kind::CapabilityDenied));
    REQUIRE((*registry->get_sandbox(*id))->state() == SandboxState::Running);

    REQUIRE(registry->pause(*id).is_ok());
    REQUIRE(registry->resume(*id).is_ok());
    REQUIRE(registry->terminate(*id).is_ok());
    REQUIRE(registry->restart(*id).is_ok());

    auto snap = registry->snapshot(*id);
    REQUIRE(snap.is_ok());
    REQUIRE(snap->state == SandboxState::Running);
    REQUIRE(snap->epoch == 2);
}

TEST_CASE("SandboxRegistry: isolated sandboxes use the shared region registry", "[sandbox][registry][memory]") {
    auto regions = enclave_memory::RegionRegistry::create();
    auto spec = SandboxSpec{}.with_mode(SandboxMode::Isolated).with_region_size(8192);

    SECTION("memory isolation enabled") {
        auto registry = SandboxRegistry::create(RegistryConfig{}, regions);
        auto id = *registry->create_sandbox(spec);
        REQUIRE(registry->start(id).is_ok());
        REQUIRE(regions->region_count() == 1);
        REQUIRE(regions->regions()[0].name == "sandbox_" + std::to_string(id.value) + "_main");

        REQUIRE(registry->remove_sandbox(id).is_ok());
        REQUIRE(regions->region_count() == 0);
    }

    SECTION("memory isolation disabled") {
        auto registry = SandboxRegistry::create(RegistryConfig{}.with_memory_isolation(false), regions);
        auto id = *registry->create_sandbox(spec);
        REQUIRE(registry->start(id).is_ok());
        REQUIRE(regions->region_count() == 0);
        REQUIRE((*registry->get_sandbox(id))->region_count() == 0);
    }
}

TEST_CASE("SandboxRegistry: bulk operations", "[sandbox][registry]") {
    auto registry = SandboxRegistry::create();
    auto a = *registry->create_sandbox(SandboxSpec{}.with_name("a"));
    auto b = *registry->create_sandbox(SandboxSpec{}.with_name("b"));
    auto c = *registry->create_sandbox(SandboxSpec{}.with_name("c"));

    REQUIRE(registry->start(b).is_ok());

    auto started = registry->start_all();
    REQUIRE_FALSE(started.all_ok());
    REQUIRE(started.succeeded == std::vector<SandboxId>{a, c});
    REQUIRE(started.failed.size() == 1);
    REQUIRE(started.failed[0].first == b);
    REQUIRE(started.failed[0].second.is(SandboxError::Kind::AlreadyRunning));

    REQUIRE(registry->terminate(c).is_ok());

    auto stopped = registry->stop_all();
    REQUIRE(stopped.all_ok());
    REQUIRE(stopped.succeeded.size() == 3);

    // Idempotent
    auto again = registry->stop_all();
    REQUIRE(again.all_ok());
    REQUIRE(again.succeeded.size() == 3);

    auto status = registry->status();
    REQUIRE(status.total == 3);
    REQUIRE(status.terminated == 3);
    REQUIRE(status.running == 0);
}

TEST_CASE("SandboxRegistry: capability switch", "[sandbox][registry][execute]") {
    auto registry = SandboxRegistry::create();
    auto id = *registry->create_sandbox(SandboxSpec{});
    REQUIRE(registry->start(id).is_ok());

    REQUIRE(registry->execute(id, network_workload()).error().is(SandboxError::Kind::CapabilityDenied));

    registry->set_config(RegistryConfig{}.with_capabilities(false));
    auto allowed = registry->execute(id, network_workload());
    REQUIRE(allowed.is_ok());
    REQUIRE(allowed->output == "fetched");
}

// =============================================================================
// Resource Monitor
// =============================================================================

TEST_CASE("SandboxRegistry: sample_all applies breach policies", "[sandbox][registry][limits]") {
    auto registry = SandboxRegistry::create();
    auto hog = *registry->create_sandbox(SandboxSpec{}.with_limits(ResourceLimits{}.with_cpu_percent(10.0)));
    auto polite = *registry->create_sandbox(SandboxSpec{}.with_limits(ResourceLimits{}.with_cpu_percent(10.0)));
    auto throttled = *registry->create_sandbox(SandboxSpec{}
        .with_limits(ResourceLimits{}.with_filesystem(1024))
        .with_breach_policy(BreachPolicy::Pause));
    REQUIRE(registry->start_all().all_ok());

    (*registry->get_sandbox(hog))->usage().set_cpu_percent(80.0);
    (*registry->get_sandbox(polite))->usage().set_cpu_percent(5.0);
    (*registry->get_sandbox(throttled))->usage().set_filesystem_bytes(4096);

    SECTION("limits enabled") {
        auto breaches = registry->sample_all();
        REQUIRE(breaches.size() == 2);
        REQUIRE(breaches[0].first == hog);
        REQUIRE(breaches[0].second.applied == BreachPolicy::Terminate);
        REQUIRE(breaches[1].first == throttled);
        REQUIRE(breaches[1].second.applied == BreachPolicy::Pause);

        REQUIRE((*registry->get_sandbox(hog))->state() == SandboxState::Terminated);
        REQUIRE((*registry->get_sandbox(polite))->state() == SandboxState::Running);
        REQUIRE((*registry->get_sandbox(throttled))->state() == SandboxState::Paused);

        REQUIRE(registry->sample_all().empty());
    }

    SECTION("limits disabled") {
        registry->set_config(RegistryConfig{}.with_resource_limits(false));
        REQUIRE(registry->sample_all().empty());
        REQUIRE((*registry->get_sandbox(hog))->state() == SandboxState::Running);
    }
}

TEST_CASE("SandboxRegistry: background monitor", "[sandbox][registry][limits]") {
    auto registry = SandboxRegistry::create(
        RegistryConfig{}.with_sampling_interval(std::chrono::milliseconds(5)));
    auto id = *registry->create_sandbox(SandboxSpec{}.with_limits(ResourceLimits{}.with_cpu_percent(1.0)));
    REQUIRE(registry->start(id).is_ok());

    registry->start_monitor();
    registry->start_monitor();
    REQUIRE(registry->monitor_running());

    (*registry->get_sandbox(id))->usage().set_cpu_percent(50.0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((*registry->get_sandbox(id))->state() != SandboxState::Terminated &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE((*registry->get_sandbox(id))->state() == SandboxState::Terminated);

    registry->stop_monitor();
    REQUIRE_FALSE(registry->monitor_running());
    registry->stop_monitor();
}

TEST_CASE("SandboxRegistry: monitor with an out-of-range interval", "[sandbox][registry][limits]") {
    auto run_monitor = [](std::chrono::milliseconds interval) {
        auto registry = SandboxRegistry::create(RegistryConfig{}.with_sampling_interval(interval));
        REQUIRE(registry->create_sandbox(SandboxSpec{}).is_ok());

        registry->start_monitor();
        REQUIRE(registry->monitor_running());

        // The clamped wait still wakes on stop
        auto started = std::chrono::steady_clock::now();
        registry->stop_monitor();
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
        REQUIRE_FALSE(registry->monitor_running());
    };

    SECTION("negative") {
        run_monitor(std::chrono::milliseconds(-1));
    }

    SECTION("far beyond the maximum") {
        run_monitor(std::chrono::hours(1000000));
    }
}

// =============================================================================
// Events and Status
// =============================================================================

TEST_CASE("SandboxRegistry: event observer", "[sandbox][registry]") {
    auto registry = SandboxRegistry::create();

    std::mutex mutex;
    std::vector<SandboxEvent> events;
    registry->set_event_callback([&](const SandboxEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });

    auto id = *registry->create_sandbox(SandboxSpec{});
    REQUIRE(registry->start(id).is_ok());
    REQUIRE(registry->terminate(id).is_ok());

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == SandboxEventKind::Started);
    REQUIRE(events[1].kind == SandboxEventKind::Terminated);
    REQUIRE(events[1].id == id);
}

TEST_CASE("SandboxRegistry: status", "[sandbox][registry]") {
    auto registry = SandboxRegistry::create();
    auto running = *registry->create_sandbox(SandboxSpec{});
    auto paused = *registry->create_sandbox(SandboxSpec{});
    auto created = *registry->create_sandbox(SandboxSpec{});
    (void)created;

    REQUIRE(registry->start(running).is_ok());
    REQUIRE(registry->start(paused).is_ok());
    REQUIRE(registry->pause(paused).is_ok());

    (*registry->get_sandbox(running))->usage().record_allocation(1000);
    (*registry->get_sandbox(paused))->usage().record_allocation(500);
    (*registry->get_sandbox(running))->usage().set_network_bandwidth(300);

    auto status = registry->status();
    REQUIRE(status.total == 3);
    REQUIRE(status.created == 1);
    REQUIRE(status.running == 1);
    REQUIRE(status.paused == 1);
    REQUIRE(status.total_memory_bytes == 1500);
    REQUIRE(status.total_network_bandwidth_bps == 300);

    auto j = status.to_json();
    REQUIRE(j["total"] == 3);
    REQUIRE(j["usage"]["memory_bytes"] == 1500);

    registry->shutdown();
    REQUIRE(registry->size() == 0);
    REQUIRE(registry->status().total == 0);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_CASE("RegistryConfig: JSON", "[sandbox][config]") {
    SECTION("defaults") {
        auto config = RegistryConfig::from_json(nlohmann::json::object());
        REQUIRE(config.is_ok());
        REQUIRE(config->default_working_dir == "/tmp");
        REQUIRE(config->default_limits.memory_bytes == 100u * 1024 * 1024);
        REQUIRE(config->sampling_interval == std::chrono::milliseconds(100));
        REQUIRE(config->default_capabilities().empty());
    }

    SECTION("values") {
        auto config = RegistryConfig::from_json(nlohmann::json::parse(R"({
            "default_limits": {"memory_bytes": 2048, "execution_time_ms": 500},
            "default_network_access": true,
            "default_working_dir": "/var/sandbox",
            "breach_policy": "pause",
            "enable_capabilities": false,
            "sampling_interval_ms": 25
        })"));
        REQUIRE(config.is_ok());
        REQUIRE(config->default_limits.memory_bytes == 2048u);
        REQUIRE(config->default_limits.execution_time == std::chrono::milliseconds(500));
        REQUIRE_FALSE(config->default_limits.cpu_percent.has_value());
        REQUIRE(config->default_capabilities() == CapabilitySet(Capability::Network));
        REQUIRE(config->default_working_dir == "/var/sandbox");
        REQUIRE(config->breach_policy == BreachPolicy::Pause);
        REQUIRE_FALSE(config->enable_capabilities);
        REQUIRE(config->sampling_interval == std::chrono::milliseconds(25));

        auto reparsed = RegistryConfig::from_json(config->to_json());
        REQUIRE(reparsed.is_ok());
        REQUIRE(reparsed->to_json() == config->to_json());
    }

    SECTION("errors") {
        auto parse_code = [](const char* text) {
            auto config = RegistryConfig::from_json(nlohmann::json::parse(text));
            return config.is_err() ? config.error().code() : enclave_core::ErrorCode::Unknown;
        };

        REQUIRE(parse_code(R"([1, 2])") == enclave_core::ErrorCode::ParseError);
        REQUIRE(parse_code(R"({"enable_capabilities": "yes"})") == enclave_core::ErrorCode::ParseError);
        REQUIRE(parse_code(R"({"breach_policy": "explode"})") == enclave_core::ErrorCode::ParseError);
        REQUIRE(parse_code(R"({"sampling_interval_ms": 0})") == enclave_core::ErrorCode::ParseError);
        REQUIRE(parse_code(R"({"default_limits": {"memory_bytes": -5}})") == enclave_core::ErrorCode::ParseError);
        REQUIRE(parse_code(R"({"default_limits": {"cpu_percent": 0}})") == enclave_core::ErrorCode::InvalidArgument);
    }

    SECTION("sampling interval bounds") {
        auto at_max = RegistryConfig::from_json(nlohmann::json::parse(R"({"sampling_interval_ms": 86400000})"));
        REQUIRE(at_max.is_ok());
        REQUIRE(at_max->sampling_interval == RegistryConfig::max_sampling_interval);

        auto above_max = RegistryConfig::from_json(nlohmann::json::parse(R"({"sampling_interval_ms": 86400001})"));
        REQUIRE(above_max.error().code() == enclave_core::ErrorCode::InvalidArgument);

        // Past the signed range of the interval type
        auto huge = RegistryConfig::from_json(
            nlohmann::json::parse(R"({"sampling_interval_ms": 18446744073709551615})"));
        REQUIRE(huge.error().code() == enclave_core::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("SandboxSpec: JSON", "[sandbox][config]") {
    SECTION("values") {
        auto spec = SandboxSpec::from_json(nlohmann::json::parse(R"({
            "name": "worker",
            "capabilities": ["network", "system_call"],
            "limits": {"memory_bytes": 1048576, "cpu_percent": 25.5},
            "working_dir": "/work",
            "mode": "isolated",
            "region_size": 65536,
            "breach_policy": "terminate"
        })"));
        REQUIRE(spec.is_ok());
        REQUIRE(spec->name == "worker");
        REQUIRE(spec->capabilities == CapabilitySet(Capability::Network | Capability::SystemCall));
        REQUIRE(spec->limits->memory_bytes == 1048576u);
        REQUIRE(spec->limits->cpu_percent == 25.5);
        REQUIRE(spec->working_dir == "/work");
        REQUIRE(spec->mode == SandboxMode::Isolated);
        REQUIRE(spec->region_size == 65536u);
        REQUIRE(spec->breach_policy == BreachPolicy::Terminate);
    }

    SECTION("absent fields fall back to the registry") {
        auto spec = SandboxSpec::from_json(nlohmann::json::object());
        REQUIRE(spec.is_ok());
        REQUIRE_FALSE(spec->limits.has_value());
        REQUIRE_FALSE(spec->working_dir.has_value());
        REQUIRE_FALSE(spec->breach_policy.has_value());
        REQUIRE(spec->region_size == SandboxSpec::default_region_size);
    }

    SECTION("errors") {
        REQUIRE(SandboxSpec::from_json(nlohmann::json::parse(R"({"capabilities": ["teleport"]})")).is_err());
        REQUIRE(SandboxSpec::from_json(nlohmann::json::parse(R"({"capabilities": "network"})")).is_err());
        REQUIRE(SandboxSpec::from_json(nlohmann::json::parse(R"({"mode": "jail"})")).is_err());

        auto zero_region = SandboxSpec::from_json(
            nlohmann::json::parse(R"({"mode": "isolated", "region_size": 0})"));
        REQUIRE(zero_region.is_err());
        REQUIRE(zero_region.error().code() == enclave_core::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("CapabilitySet: set operations", "[sandbox][capability]") {
    auto set = CapabilitySet(Capability::Network | Capability::Filesystem);

    REQUIRE(set.has(Capability::Network));
    REQUIRE_FALSE(set.has(Capability::Device));
    REQUIRE_FALSE(set.has(Capability::None));
    REQUIRE(set.has_all(CapabilitySet(Capability::Filesystem)));
    REQUIRE(set.missing(CapabilitySet(Capability::Network | Capability::Device)) == CapabilitySet(Capability::Device));
    REQUIRE(set.to_string() == "network,filesystem");
    REQUIRE(CapabilitySet::none().to_string() == "none");
    REQUIRE(CapabilitySet::all().names().size() == 5);
    REQUIRE(parse_capability("process_creation") == Capability::ProcessCreation);
    REQUIRE_FALSE(parse_capability("Network").has_value());
}
