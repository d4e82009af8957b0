/// @file sandbox_registry.cpp
/// @brief SandboxRegistry implementation

#include <enclave/sandbox/sandbox_registry.hpp>
#include <enclave/memory/region_registry.hpp>
#include <enclave/core/log.hpp>

#include <algorithm>

namespace enclave_sandbox {

namespace {

enclave_core::Error parse_error(const std::string& message) {
    return enclave_core::Error(enclave_core::ErrorCode::ParseError, message);
}

/// Read an optional boolean field into out
enclave_core::Result<void> read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return enclave_core::Ok();
    }
    if (!j[key].is_boolean()) {
        return enclave_core::Err(parse_error(std::string("'") + key + "' must be a boolean"));
    }
    out = j[key].get<bool>();
    return enclave_core::Ok();
}

} // anonymous namespace

// =============================================================================
// RegistryConfig
// =============================================================================

CapabilitySet RegistryConfig::default_capabilities() const {
    CapabilitySet caps;
    if (default_network_access) caps = caps.with(Capability::Network);
    if (default_filesystem_access) caps = caps.with(Capability::Filesystem);
    return caps;
}

enclave_core::Result<RegistryConfig> RegistryConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return enclave_core::Err<RegistryConfig>(parse_error("Registry config must be a JSON object"));
    }

    RegistryConfig config;

    if (j.contains("default_limits")) {
        auto limits = ResourceLimits::from_json(j["default_limits"]);
        if (!limits) {
            return enclave_core::Err<RegistryConfig>(limits.error());
        }
        config.default_limits = *limits;
    }

    const std::pair<const char*, bool*> flags[] = {
        {"default_network_access", &config.default_network_access},
        {"default_filesystem_access", &config.default_filesystem_access},
        {"enable_memory_isolation", &config.enable_memory_isolation},
        {"enable_resource_limits", &config.enable_resource_limits},
        {"enable_capabilities", &config.enable_capabilities},
    };
    for (const auto& [key, field] : flags) {
        auto read = read_bool(j, key, *field);
        if (!read) {
            return enclave_core::Err<RegistryConfig>(read.error());
        }
    }

    if (j.contains("default_working_dir")) {
        if (!j["default_working_dir"].is_string()) {
            return enclave_core::Err<RegistryConfig>(parse_error("'default_working_dir' must be a string"));
        }
        config.default_working_dir = j["default_working_dir"].get<std::string>();
    }

    if (j.contains("breach_policy")) {
        auto policy = j["breach_policy"].is_string()
            ? parse_breach_policy(j["breach_policy"].get<std::string>())
            : std::nullopt;
        if (!policy) {
            return enclave_core::Err<RegistryConfig>(
                parse_error("'breach_policy' must be \"terminate\" or \"pause\""));
        }
        config.breach_policy = *policy;
    }

    if (j.contains("sampling_interval_ms")) {
        const auto& interval = j["sampling_interval_ms"];
        if (!interval.is_number_unsigned() || interval.get<std::uint64_t>() == 0) {
            return enclave_core::Err<RegistryConfig>(
                parse_error("'sampling_interval_ms' must be a positive integer"));
        }
        auto ms = interval.get<std::uint64_t>();
        if (ms > static_cast<std::uint64_t>(max_sampling_interval.count())) {
            return enclave_core::Err<RegistryConfig>(enclave_core::Error(
                enclave_core::ErrorCode::InvalidArgument,
                "'sampling_interval_ms' exceeds " + std::to_string(max_sampling_interval.count())));
        }
        config.sampling_interval = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
    }

    return enclave_core::Ok(std::move(config));
}

nlohmann::json RegistryConfig::to_json() const {
    return nlohmann::json{
        {"default_limits", default_limits.to_json()},
        {"default_network_access", default_network_access},
        {"default_filesystem_access", default_filesystem_access},
        {"default_working_dir", default_working_dir},
        {"breach_policy", enclave_sandbox::to_string(breach_policy)},
        {"enable_memory_isolation", enable_memory_isolation},
        {"enable_resource_limits", enable_resource_limits},
        {"enable_capabilities", enable_capabilities},
        {"sampling_interval_ms", static_cast<std::uint64_t>(sampling_interval.count())}
    };
}

nlohmann::json RegistryStatus::to_json() const {
    return nlohmann::json{
        {"total", total},
        {"created", created},
        {"running", running},
        {"paused", paused},
        {"terminated", terminated},
        {"removed", removed},
        {"usage", {
            {"memory_bytes", total_memory_bytes},
            {"cpu_percent", total_cpu_percent},
            {"network_bandwidth_bps", total_network_bandwidth_bps},
            {"filesystem_bytes", total_filesystem_bytes}
        }}
    };
}

// =============================================================================
// SandboxRegistry
// =============================================================================

SandboxRegistryPtr SandboxRegistry::create(
    RegistryConfig config, enclave_memory::RegionRegistryPtr region_registry) {

    if (!region_registry) {
        region_registry = enclave_memory::RegionRegistry::create();
    }
    return SandboxRegistryPtr(new SandboxRegistry(std::move(config), std::move(region_registry)));
}

SandboxRegistry::SandboxRegistry(RegistryConfig config, enclave_memory::RegionRegistryPtr region_registry)
    : m_region_registry(std::move(region_registry))
    , m_config(std::move(config))
    , m_events(std::make_shared<EventSink>()) {
}

SandboxRegistry::~SandboxRegistry() {
    stop_monitor();
}

void SandboxRegistry::set_config(const RegistryConfig& config) {
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        m_config = config;
    }
    enclave_core::sandbox_logger()->info(
        "Sandbox registry config updated: isolation={} limits={} capabilities={} policy={}",
        config.enable_memory_isolation, config.enable_resource_limits,
        config.enable_capabilities, to_string(config.breach_policy));
}

RegistryConfig SandboxRegistry::config() const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    return m_config;
}

void SandboxRegistry::set_event_callback(SandboxEventCallback callback) {
    std::lock_guard<std::mutex> lock(m_events->mutex);
    m_events->callback = std::move(callback);
}

void SandboxRegistry::EventSink::dispatch(const SandboxEvent& event) {
    SandboxEventCallback observer;
    {
        std::lock_guard<std::mutex> lock(mutex);
        observer = callback;
    }
    if (observer) {
        observer(event);
    }
}

enclave_core::Result<SandboxId> SandboxRegistry::create_sandbox(const SandboxSpec& spec) {
    auto valid = spec.validate();
    if (!valid) {
        return enclave_core::Err<SandboxId>(valid.error());
    }

    auto cfg = config();

    SandboxSpec resolved = spec;
    resolved.limits = spec.limits.value_or(cfg.default_limits);
    resolved.capabilities = spec.capabilities.merged(cfg.default_capabilities());
    resolved.working_dir = spec.working_dir.value_or(cfg.default_working_dir);
    resolved.breach_policy = spec.breach_policy.value_or(cfg.breach_policy);

    SandboxId id(m_next_id.fetch_add(1));
    auto sandbox = std::make_shared<Sandbox>(
        id, std::move(resolved), cfg.enable_memory_isolation ? m_region_registry : nullptr);

    sandbox->set_event_callback([events = m_events](const SandboxEvent& event) {
        events->dispatch(event);
    });

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto [it, inserted] = m_sandboxes.emplace(id, sandbox);
        if (!inserted) {
            enclave_core::invariant_violation("Sandbox id " + std::to_string(id.value) + " issued twice");
        }
    }

    enclave_core::sandbox_logger()->info(
        "Created sandbox {} ('{}', {}, capabilities: {})",
        id.value, sandbox->name(), to_string(sandbox->mode()), sandbox->capabilities().to_string());
    return enclave_core::Ok(id);
}

enclave_core::Result<SandboxPtr> SandboxRegistry::get_sandbox(SandboxId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sandboxes.find(id);
    if (it == m_sandboxes.end()) {
        return enclave_core::Err<SandboxPtr>(enclave_core::SandboxError::not_found(id.value));
    }
    return enclave_core::Ok(it->second);
}

enclave_core::Result<SandboxSnapshot> SandboxRegistry::snapshot(SandboxId id) const {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err<SandboxSnapshot>(sandbox.error());
    }
    return enclave_core::Ok((*sandbox)->snapshot());
}

enclave_core::Result<bool> SandboxRegistry::has_capability(SandboxId id, Capability c) const {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err<bool>(sandbox.error());
    }
    return enclave_core::Ok((*sandbox)->has_capability(c));
}

enclave_core::Result<ResourceUsage> SandboxRegistry::usage(SandboxId id) const {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err<ResourceUsage>(sandbox.error());
    }
    return enclave_core::Ok((*sandbox)->sample());
}

enclave_core::Result<void> SandboxRegistry::remove_sandbox(SandboxId id) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err(sandbox.error());
    }

    auto terminated = (*sandbox)->terminate();
    if (!terminated && !terminated.error().is(enclave_core::SandboxError::Kind::AlreadyTerminated)) {
        return terminated;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sandboxes.erase(id) == 0) {
            // Lost a race with another remove
            return enclave_core::Err(enclave_core::SandboxError::not_found(id.value));
        }
    }
    m_removed.fetch_add(1);

    enclave_core::sandbox_logger()->info("Removed sandbox {}", id.value);
    return enclave_core::Ok();
}

std::vector<SandboxId> SandboxRegistry::sandbox_ids() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SandboxId> ids;
    ids.reserve(m_sandboxes.size());
    for (const auto& [id, sandbox] : m_sandboxes) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t SandboxRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sandboxes.size();
}

std::vector<SandboxPtr> SandboxRegistry::snapshot_sandboxes() const {
    std::vector<SandboxPtr> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.reserve(m_sandboxes.size());
        for (const auto& [id, sandbox] : m_sandboxes) {
            result.push_back(sandbox);
        }
    }
    std::sort(result.begin(), result.end(), [](const SandboxPtr& a, const SandboxPtr& b) {
        return a->id() < b->id();
    });
    return result;
}

// =============================================================================
// Lifecycle
// =============================================================================

enclave_core::Result<void> SandboxRegistry::start(SandboxId id) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err(sandbox.error());
    }
    return (*sandbox)->start();
}

enclave_core::Result<void> SandboxRegistry::pause(SandboxId id) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err(sandbox.error());
    }
    return (*sandbox)->pause();
}

enclave_core::Result<void> SandboxRegistry::resume(SandboxId id) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err(sandbox.error());
    }
    return (*sandbox)->resume();
}

enclave_core::Result<void> SandboxRegistry::terminate(SandboxId id) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err(sandbox.error());
    }
    return (*sandbox)->terminate();
}

enclave_core::Result<void> SandboxRegistry::restart(SandboxId id) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err(sandbox.error());
    }
    return (*sandbox)->restart();
}

enclave_core::Result<ExecutionResult> SandboxRegistry::execute(SandboxId id, const Workload& workload) {
    auto sandbox = get_sandbox(id);
    if (!sandbox) {
        return enclave_core::Err<ExecutionResult>(sandbox.error());
    }

    auto cfg = config();
    ExecutionPolicy policy{
        .check_capabilities = cfg.enable_capabilities,
        .enforce_limits = cfg.enable_resource_limits,
    };
    return (*sandbox)->execute(workload, policy);
}

BulkOutcome SandboxRegistry::start_all() {
    BulkOutcome outcome;
    for (const auto& sandbox : snapshot_sandboxes()) {
        auto result = sandbox->start();
        if (result) {
            outcome.succeeded.push_back(sandbox->id());
        } else {
            outcome.failed.emplace_back(sandbox->id(), result.error());
        }
    }

    if (!outcome.all_ok()) {
        enclave_core::sandbox_logger()->warn(
            "start_all: {} started, {} failed", outcome.succeeded.size(), outcome.failed.size());
    }
    return outcome;
}

BulkOutcome SandboxRegistry::stop_all() {
    BulkOutcome outcome;
    for (const auto& sandbox : snapshot_sandboxes()) {
        auto result = sandbox->terminate();
        if (result || result.error().is(enclave_core::SandboxError::Kind::AlreadyTerminated)) {
            outcome.succeeded.push_back(sandbox->id());
        } else {
            outcome.failed.emplace_back(sandbox->id(), result.error());
        }
    }

    if (!outcome.all_ok()) {
        enclave_core::sandbox_logger()->warn(
            "stop_all: {} stopped, {} failed", outcome.succeeded.size(), outcome.failed.size());
    }
    return outcome;
}

// =============================================================================
// Resource Monitor
// =============================================================================

std::vector<std::pair<SandboxId, LimitBreach>> SandboxRegistry::sample_all() {
    std::vector<std::pair<SandboxId, LimitBreach>> breaches;
    if (!config().enable_resource_limits) {
        return breaches;
    }

    for (const auto& sandbox : snapshot_sandboxes()) {
        if (auto breach = sandbox->enforce_limits()) {
            breaches.emplace_back(sandbox->id(), std::move(*breach));
        }
    }
    return breaches;
}

void SandboxRegistry::start_monitor() {
    std::lock_guard<std::mutex> lock(m_monitor_mutex);
    if (m_monitor_running.load()) {
        return;
    }

    m_monitor_running.store(true);
    m_monitor_thread = std::thread([this]() {
        while (m_monitor_running.load()) {
            sample_all();

            auto interval = std::clamp(config().sampling_interval,
                std::chrono::milliseconds(1), RegistryConfig::max_sampling_interval);
            std::unique_lock<std::mutex> wait_lock(m_monitor_mutex);
            m_monitor_cv.wait_for(wait_lock, interval, [this]() {
                return !m_monitor_running.load();
            });
        }
    });

    enclave_core::sandbox_logger()->info(
        "Resource monitor started ({} ms interval)", config().sampling_interval.count());
}

void SandboxRegistry::stop_monitor() {
    std::thread monitor;
    {
        std::lock_guard<std::mutex> lock(m_monitor_mutex);
        if (!m_monitor_running.exchange(false)) {
            return;
        }
        monitor = std::move(m_monitor_thread);
    }
    m_monitor_cv.notify_all();

    if (monitor.joinable()) {
        monitor.join();
    }

    enclave_core::sandbox_logger()->info("Resource monitor stopped");
}

// =============================================================================
// Status
// =============================================================================

RegistryStatus SandboxRegistry::status() const {
    RegistryStatus status;
    for (const auto& sandbox : snapshot_sandboxes()) {
        status.total += 1;
        switch (sandbox->state()) {
            case SandboxState::Created: status.created += 1; break;
            case SandboxState::Running: status.running += 1; break;
            case SandboxState::Paused: status.paused += 1; break;
            case SandboxState::Terminated: status.terminated += 1; break;
        }

        auto usage = sandbox->sample();
        status.total_memory_bytes += usage.memory_bytes;
        status.total_cpu_percent += usage.cpu_percent;
        status.total_network_bandwidth_bps += usage.network_bandwidth_bps;
        status.total_filesystem_bytes += usage.filesystem_bytes;
    }
    status.removed = m_removed.load();
    return status;
}

void SandboxRegistry::shutdown() {
    enclave_core::LogScope scope(enclave_core::sandbox_logger(), "SandboxRegistry::shutdown");
    stop_monitor();

    auto outcome = stop_all();
    for (const auto& [id, error] : outcome.failed) {
        enclave_core::sandbox_logger()->error(
            "Sandbox {} failed to stop during shutdown: {}", id.value, enclave_core::build_error_chain(error));
    }

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped = m_sandboxes.size();
        m_sandboxes.clear();
    }
    enclave_core::sandbox_logger()->info("Sandbox registry shut down ({} sandbox(es) dropped)", dropped);
}

} // namespace enclave_sandbox
