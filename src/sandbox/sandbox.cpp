/// @file sandbox.cpp
/// @brief Sandbox implementation for isolated execution

#include <enclave/sandbox/sandbox.hpp>
#include <enclave/memory/region_registry.hpp>
#include <enclave/core/log.hpp>

#include <utility>

namespace enclave_sandbox {

// =============================================================================
// ExecutionContext Implementation
// =============================================================================

ExecutionContext::ExecutionContext(
    Sandbox& sandbox, std::shared_ptr<const std::atomic<bool>> cancel, bool enforce_limits)
    : m_sandbox(sandbox)
    , m_cancel(std::move(cancel))
    , m_enforce_limits(enforce_limits) {
}

SandboxId ExecutionContext::sandbox_id() const {
    return m_sandbox.id();
}

const std::string& ExecutionContext::working_dir() const {
    return m_sandbox.working_dir();
}

bool ExecutionContext::has_capability(Capability c) const {
    return m_sandbox.has_capability(c);
}

enclave_core::Result<void> ExecutionContext::allocate_memory(std::size_t bytes) {
    bool granted = true;
    bool current = m_sandbox.update_usage(*m_cancel, [&](ResourceUsageTracker& usage) {
        if (!m_enforce_limits) {
            usage.record_allocation(bytes);
            return;
        }
        granted = usage.allocate(bytes, m_sandbox.region_bytes());
    });
    if (!current) {
        return enclave_core::Err(enclave_core::SandboxError::already_terminated(m_sandbox.id().value));
    }
    if (!granted) {
        enclave_core::sandbox_logger()->warn(
            "Sandbox {} refused {} bytes: memory limit reached", m_sandbox.id().value, bytes);
        return enclave_core::Err(
            enclave_core::SandboxError::resource_limit_exceeded(m_sandbox.id().value, "memory"));
    }
    return enclave_core::Ok();
}

void ExecutionContext::release_memory(std::size_t bytes) {
    (void)m_sandbox.update_usage(*m_cancel, [bytes](ResourceUsageTracker& usage) { usage.release(bytes); });
}

void ExecutionContext::report_cpu(double percent) {
    (void)m_sandbox.update_usage(*m_cancel, [percent](ResourceUsageTracker& usage) {
        usage.set_cpu_percent(percent);
    });
}

void ExecutionContext::report_network_rate(std::uint64_t bps) {
    (void)m_sandbox.update_usage(*m_cancel, [bps](ResourceUsageTracker& usage) {
        usage.set_network_bandwidth(bps);
    });
}

void ExecutionContext::report_filesystem(std::uint64_t bytes) {
    (void)m_sandbox.update_usage(*m_cancel, [bytes](ResourceUsageTracker& usage) {
        usage.set_filesystem_bytes(bytes);
    });
}

// =============================================================================
// Sandbox Implementation
// =============================================================================

Sandbox::Sandbox(SandboxId id, SandboxSpec spec, enclave_memory::RegionRegistryPtr region_registry)
    : m_id(id)
    , m_name(std::move(spec.name))
    , m_limits(spec.limits.value_or(ResourceLimits::unlimited()))
    , m_capabilities(spec.capabilities)
    , m_working_dir(spec.working_dir.value_or(""))
    , m_mode(spec.mode)
    , m_region_size(spec.region_size)
    , m_breach_policy(spec.breach_policy.value_or(BreachPolicy::Terminate))
    , m_region_registry(std::move(region_registry))
    , m_cancel(std::make_shared<std::atomic<bool>>(false))
    , m_usage(m_limits)
    , m_creation_time(std::chrono::steady_clock::now()) {
}

Sandbox::~Sandbox() {
    if (m_cancel) {
        m_cancel->store(true);
    }
}

void Sandbox::set_event_callback(SandboxEventCallback callback) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_callback = std::move(callback);
}

void Sandbox::emit(SandboxEventKind kind, std::string details) {
    SandboxEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        callback = m_callback;
    }
    if (callback) {
        callback(SandboxEvent{m_id, kind, std::move(details), std::chrono::system_clock::now()});
    }
}

enclave_core::Result<void> Sandbox::provision_locked() {
    if (m_mode != SandboxMode::Isolated || !m_region_registry) {
        return enclave_core::Ok();
    }
    if (!m_region_registry->config().enable_isolation) {
        enclave_core::sandbox_logger()->debug(
            "Sandbox {} runs without a main region: memory isolation is disabled", m_id.value);
        return enclave_core::Ok();
    }

    auto region = m_region_registry->create_isolated_region(
        m_region_size,
        enclave_memory::ProtectionFlags::read_write(),
        "sandbox_" + std::to_string(m_id.value) + "_main");
    if (!region) {
        enclave_core::Error error = region.error();
        error.with_context("sandbox", std::to_string(m_id.value));
        return enclave_core::Err(std::move(error));
    }

    m_region_bytes.fetch_add((*region)->size());
    m_regions.push_back(std::move(*region));
    return enclave_core::Ok();
}

Sandbox::RegionList Sandbox::terminate_locked() {
    set_state(SandboxState::Terminated);
    m_usage.pause_run();
    m_cancel->store(true);

    RegionList released;
    released.swap(m_regions);
    m_region_bytes.store(0);
    return released;
}

enclave_core::Result<void> Sandbox::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (m_state.load()) {
            case SandboxState::Created:
                break;
            case SandboxState::Terminated:
                return enclave_core::Err(enclave_core::SandboxError::already_terminated(m_id.value));
            default:
                return enclave_core::Err(enclave_core::SandboxError::already_running(m_id.value));
        }

        auto provisioned = provision_locked();
        if (!provisioned) {
            enclave_core::sandbox_logger()->error(
                "Sandbox {} failed to start: {}", m_id.value, provisioned.error().message());
            return provisioned;
        }

        m_usage.begin_run();
        set_state(SandboxState::Running);
    }

    enclave_core::sandbox_logger()->info("Sandbox {} ('{}') started", m_id.value, m_name);
    emit(SandboxEventKind::Started);
    return enclave_core::Ok();
}

enclave_core::Result<void> Sandbox::pause() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() != SandboxState::Running) {
            return enclave_core::Err(enclave_core::SandboxError::not_running(m_id.value));
        }
        m_usage.pause_run();
        set_state(SandboxState::Paused);
    }

    enclave_core::sandbox_logger()->info("Sandbox {} paused", m_id.value);
    emit(SandboxEventKind::Paused);
    return enclave_core::Ok();
}

enclave_core::Result<void> Sandbox::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() != SandboxState::Paused) {
            return enclave_core::Err(enclave_core::SandboxError::not_paused(m_id.value));
        }
        m_usage.begin_run();
        set_state(SandboxState::Running);
    }

    enclave_core::sandbox_logger()->info("Sandbox {} resumed", m_id.value);
    emit(SandboxEventKind::Resumed);
    return enclave_core::Ok();
}

enclave_core::Result<void> Sandbox::terminate() {
    RegionList released;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() == SandboxState::Terminated) {
            return enclave_core::Err(enclave_core::SandboxError::already_terminated(m_id.value));
        }
        released = terminate_locked();
    }

    // Unregisters from the region registry on destruction
    std::size_t region_count = released.size();
    released.clear();

    enclave_core::log_sandbox_event(spdlog::level::info, m_id.value, "Sandbox terminated", {
        {"regions_released", std::to_string(region_count)},
    });
    emit(SandboxEventKind::Terminated);
    return enclave_core::Ok();
}

enclave_core::Result<void> Sandbox::restart() {
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() != SandboxState::Terminated) {
            return enclave_core::Err(enclave_core::SandboxError::not_terminated(m_id.value));
        }

        auto provisioned = provision_locked();
        if (!provisioned) {
            enclave_core::sandbox_logger()->error(
                "Sandbox {} failed to restart: {}", m_id.value, provisioned.error().message());
            return provisioned;
        }

        m_usage.reset();
        m_cancel = std::make_shared<std::atomic<bool>>(false);
        epoch = m_epoch.fetch_add(1) + 1;
        m_usage.begin_run();
        set_state(SandboxState::Running);
    }

    enclave_core::sandbox_logger()->info("Sandbox {} restarted (epoch {})", m_id.value, epoch);
    emit(SandboxEventKind::Restarted, "epoch " + std::to_string(epoch));
    return enclave_core::Ok();
}

enclave_core::Result<ExecutionResult> Sandbox::execute(const Workload& workload, ExecutionPolicy policy) {
    if (!workload.body) {
        return enclave_core::Err<ExecutionResult>(enclave_core::Error(
            enclave_core::ErrorCode::InvalidArgument, "Workload '" + workload.name + "' has no body"));
    }

    std::shared_ptr<std::atomic<bool>> cancel;
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() != SandboxState::Running) {
            return enclave_core::Err<ExecutionResult>(enclave_core::SandboxError::not_running(m_id.value));
        }
        if (policy.check_capabilities) {
            auto missing = m_capabilities.missing(workload.required);
            if (!missing.empty()) {
                enclave_core::log_sandbox_event(spdlog::level::warn, m_id.value, "Workload denied", {
                    {"workload", workload.name},
                    {"missing", missing.to_string()},
                });
                return enclave_core::Err<ExecutionResult>(
                    enclave_core::SandboxError::capability_denied(m_id.value, missing.to_string()));
            }
        }
        cancel = m_cancel;
        epoch = m_epoch.load();
    }

    ExecutionContext context(*this, cancel, policy.enforce_limits);
    auto started = std::chrono::steady_clock::now();
    auto output = workload.body(context);
    auto duration = std::chrono::steady_clock::now() - started;

    if (cancel->load()) {
        return enclave_core::Err<ExecutionResult>(enclave_core::SandboxError::already_terminated(m_id.value));
    }

    if (policy.enforce_limits) {
        auto breach = enforce_limits_for(cancel.get());
        if (breach) {
            return enclave_core::Err<ExecutionResult>(
                enclave_core::SandboxError::resource_limit_exceeded(m_id.value, breach->describe()));
        }
        if (cancel->load()) {
            return enclave_core::Err<ExecutionResult>(enclave_core::SandboxError::already_terminated(m_id.value));
        }
    }
    if (!output) {
        enclave_core::sandbox_logger()->debug(
            "Workload '{}' in sandbox {} failed: {}", workload.name, m_id.value, output.error().message());
        return enclave_core::Err<ExecutionResult>(output.error());
    }

    ExecutionResult result;
    result.output = std::move(*output);
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(duration);
    result.epoch = epoch;
    result.usage = sample();
    return enclave_core::Ok(std::move(result));
}

enclave_core::Result<void> Sandbox::attach_region(enclave_memory::ProtectedRegionPtr region) {
    if (!region) {
        return enclave_core::Err(enclave_core::Error(
            enclave_core::ErrorCode::InvalidArgument, "Cannot attach a null region"));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.load() == SandboxState::Terminated) {
        return enclave_core::Err(enclave_core::SandboxError::already_terminated(m_id.value));
    }
    m_region_bytes.fetch_add(region->size());
    m_regions.push_back(std::move(region));
    return enclave_core::Ok();
}

std::size_t Sandbox::region_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_regions.size();
}

std::vector<enclave_memory::MemoryRegion> Sandbox::regions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<enclave_memory::MemoryRegion> result;
    result.reserve(m_regions.size());
    for (const auto& region : m_regions) {
        result.push_back(region->region());
    }
    return result;
}

ResourceUsage Sandbox::sample() const {
    return m_usage.snapshot(m_region_bytes.load());
}

std::optional<LimitBreach> Sandbox::enforce_limits() {
    return enforce_limits_for(nullptr);
}

std::optional<LimitBreach> Sandbox::enforce_limits_for(const std::atomic<bool>* cancel) {
    LimitBreach breach;
    RegionList released;
    SandboxEventKind transition = SandboxEventKind::Terminated;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (cancel != nullptr && cancel->load()) {
            return std::nullopt;
        }
        auto state = m_state.load();
        bool acts = m_breach_policy == BreachPolicy::Terminate
            ? (state == SandboxState::Running || state == SandboxState::Paused)
            : state == SandboxState::Running;
        if (!acts) {
            return std::nullopt;
        }

        breach.exceeded = m_usage.exceeded(m_limits, m_region_bytes.load());
        if (breach.exceeded.empty()) {
            return std::nullopt;
        }
        breach.usage = m_usage.snapshot(m_region_bytes.load());
        breach.applied = m_breach_policy;

        if (m_breach_policy == BreachPolicy::Terminate) {
            released = terminate_locked();
            transition = SandboxEventKind::Terminated;
        } else {
            m_usage.pause_run();
            set_state(SandboxState::Paused);
            transition = SandboxEventKind::Paused;
        }
    }
    released.clear();

    enclave_core::log_sandbox_event(spdlog::level::warn, m_id.value, "Resource limit exceeded", {
        {"exceeded", breach.describe()},
        {"policy", to_string(breach.applied)},
    });
    emit(SandboxEventKind::LimitExceeded, breach.describe());
    emit(transition, "limit exceeded: " + breach.describe());
    return breach;
}

SandboxSnapshot Sandbox::snapshot() const {
    SandboxSnapshot snap;
    snap.id = m_id;
    snap.name = m_name;
    snap.capabilities = m_capabilities;
    snap.limits = m_limits;
    snap.working_dir = m_working_dir;
    snap.mode = m_mode;
    snap.breach_policy = m_breach_policy;
    snap.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(uptime());

    std::lock_guard<std::mutex> lock(m_mutex);
    snap.state = m_state.load();
    snap.epoch = m_epoch.load();
    snap.region_count = m_regions.size();
    snap.region_bytes = m_region_bytes.load();
    snap.usage = m_usage.snapshot(snap.region_bytes);
    return snap;
}

std::chrono::nanoseconds Sandbox::uptime() const {
    return std::chrono::steady_clock::now() - m_creation_time;
}

} // namespace enclave_sandbox
