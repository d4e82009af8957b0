/// @file test_concurrency.cpp
/// @brief Concurrent access to sandboxes and the sandbox registry

#include <catch2/catch_test_macros.hpp>
#include <enclave/sandbox/sandbox_registry.hpp>
#include <enclave/memory/memory.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace enclave_sandbox;
using enclave_core::SandboxError;

namespace {

/// Release all waiting threads at once
class StartGate {
public:
    void wait() {
        while (!m_open.load()) {
            std::this_thread::yield();
        }
    }
    void open() { m_open.store(true); }

private:
    std::atomic<bool> m_open{false};
};

} // namespace

TEST_CASE("Concurrency: parallel creation issues distinct ids", "[sandbox][concurrency]") {
    auto registry = SandboxRegistry::create();
    constexpr int thread_count = 8;
    constexpr int per_thread = 25;

    StartGate gate;
    std::mutex mutex;
    std::vector<SandboxId> ids;
    std::vector<std::thread> threads;

    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&]() {
            gate.wait();
            for (int i = 0; i < per_thread; ++i) {
                auto id = registry->create_sandbox(SandboxSpec{});
                if (id) {
                    std::lock_guard<std::mutex> lock(mutex);
                    ids.push_back(*id);
                }
            }
        });
    }
    gate.open();
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(ids.size() == thread_count * per_thread);
    std::set<SandboxId> unique(ids.begin(), ids.end());
    REQUIRE(unique.size() == ids.size());
    REQUIRE(registry->size() == ids.size());
}

TEST_CASE("Concurrency: racing terminations", "[sandbox][concurrency]") {
    auto registry = SandboxRegistry::create();

    for (int round = 0; round < 50; ++round) {
        auto id = *registry->create_sandbox(SandboxSpec{});
        REQUIRE(registry->start(id).is_ok());

        std::atomic<int> terminated_events{0};
        (*registry->get_sandbox(id))->set_event_callback([&](const SandboxEvent& event) {
            if (event.kind == SandboxEventKind::Terminated) {
                terminated_events.fetch_add(1);
            }
        });

        StartGate gate;
        enclave_core::Result<void> results[2] = {enclave_core::Ok(), enclave_core::Ok()};
        std::thread first([&]() { gate.wait(); results[0] = registry->terminate(id); });
        std::thread second([&]() { gate.wait(); results[1] = registry->terminate(id); });
        gate.open();
        first.join();
        second.join();

        int ok = 0;
        int already = 0;
        for (const auto& result : results) {
            if (result) {
                ++ok;
            } else if (result.error().is(SandboxError::Kind::AlreadyTerminated)) {
                ++already;
            }
        }
        REQUIRE(ok == 1);
        REQUIRE(already == 1);
        REQUIRE(terminated_events.load() == 1);
    }
}

TEST_CASE("Concurrency: limit enforcement racing an explicit terminate", "[sandbox][concurrency][limits]") {
    for (int round = 0; round < 50; ++round) {
        Sandbox sandbox(SandboxId(1), SandboxSpec{}.with_limits(ResourceLimits{}.with_cpu_percent(5.0)));
        REQUIRE(sandbox.start().is_ok());
        sandbox.usage().set_cpu_percent(90.0);

        std::atomic<int> terminated_events{0};
        sandbox.set_event_callback([&](const SandboxEvent& event) {
            if (event.kind == SandboxEventKind::Terminated) {
                terminated_events.fetch_add(1);
            }
        });

        StartGate gate;
        bool breached = false;
        enclave_core::Result<void> explicit_result = enclave_core::Ok();
        std::thread monitor([&]() { gate.wait(); breached = sandbox.enforce_limits().has_value(); });
        std::thread caller([&]() { gate.wait(); explicit_result = sandbox.terminate(); });
        gate.open();
        monitor.join();
        caller.join();

        REQUIRE(sandbox.state() == SandboxState::Terminated);
        REQUIRE(terminated_events.load() == 1);
        // Exactly one of the two paths performed the transition
        REQUIRE(breached != explicit_result.is_ok());
    }
}

TEST_CASE("Concurrency: lifecycle calls from many threads keep a valid state", "[sandbox][concurrency]") {
    auto regions = enclave_memory::RegionRegistry::create();
    auto registry = SandboxRegistry::create(RegistryConfig{}, regions);
    auto id = *registry->create_sandbox(SandboxSpec{}.with_mode(SandboxMode::Isolated).with_region_size(1024));
    REQUIRE(registry->start(id).is_ok());

    StartGate gate;
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&, t]() {
            gate.wait();
            for (int i = 0; i < 200; ++i) {
                switch ((t + i) % 5) {
                    case 0: (void)registry->pause(id); break;
                    case 1: (void)registry->resume(id); break;
                    case 2: (void)registry->terminate(id); break;
                    case 3: (void)registry->restart(id); break;
                    default: (void)registry->snapshot(id); break;
                }
            }
        });
    }
    gate.open();
    for (auto& thread : threads) {
        thread.join();
    }

    auto sandbox = *registry->get_sandbox(id);
    auto state = sandbox->state();
    REQUIRE(state != SandboxState::Created);

    // Exactly one main region while active, none once terminated
    if (state == SandboxState::Terminated) {
        REQUIRE(sandbox->region_count() == 0);
        REQUIRE(regions->region_count() == 0);
    } else {
        REQUIRE(sandbox->region_count() == 1);
        REQUIRE(regions->region_count() == 1);
    }
}

TEST_CASE("Concurrency: workloads run while other sandboxes change state", "[sandbox][concurrency]") {
    auto registry = SandboxRegistry::create();
    auto worker = *registry->create_sandbox(SandboxSpec{}.with_limits(ResourceLimits{}.with_memory(1 << 20)));
    auto churn = *registry->create_sandbox(SandboxSpec{});
    REQUIRE(registry->start_all().all_ok());

    Workload workload{"count", {}, [](ExecutionContext& ctx) -> enclave_core::Result<std::string> {
        auto allocated = ctx.allocate_memory(64);
        if (!allocated) {
            return enclave_core::Err<std::string>(allocated.error());
        }
        ctx.release_memory(64);
        return enclave_core::Ok(std::string("ok"));
    }};

    StartGate gate;
    std::atomic<int> completed{0};
    std::thread executor([&]() {
        gate.wait();
        for (int i = 0; i < 500; ++i) {
            if (registry->execute(worker, workload)) {
                completed.fetch_add(1);
            }
        }
    });
    std::thread lifecycle([&]() {
        gate.wait();
        for (int i = 0; i < 100; ++i) {
            (void)registry->terminate(churn);
            (void)registry->restart(churn);
        }
    });
    gate.open();
    executor.join();
    lifecycle.join();

    REQUIRE(completed.load() == 500);
    REQUIRE(registry->usage(worker)->memory_bytes == 0);
}
