// enclave_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <enclave/core/error.hpp>
#include <string>
#include <vector>

using namespace enclave_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("MemoryError::out_of_memory") {
        Error err = MemoryError::out_of_memory(4096);
        REQUIRE(err.code() == ErrorCode::OutOfMemory);
        REQUIRE(err.is(MemoryError::Kind::OutOfMemory));
        REQUIRE(err.message().find("4096") != std::string::npos);
    }

    SECTION("MemoryError::region_already_exists") {
        Error err = MemoryError::region_already_exists(0x1000);
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.as<MemoryError>()->address == 0x1000);
    }

    SECTION("MemoryError::general keeps the reason") {
        Error err = MemoryError::general("Memory isolation is disabled");
        REQUIRE(err.is(MemoryError::Kind::General));
        REQUIRE(err.message() == "General error: Memory isolation is disabled");
    }

    SECTION("SandboxError::not_found") {
        Error err = SandboxError::not_found(7);
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<SandboxError>()->sandbox_id == 7);
    }

    SECTION("SandboxError::capability_denied") {
        Error err = SandboxError::capability_denied(3, "network");
        REQUIRE(err.code() == ErrorCode::PermissionDenied);
        REQUIRE(err.message().find("network") != std::string::npos);
    }

    SECTION("lifecycle errors are InvalidState") {
        REQUIRE(Error(SandboxError::already_running(1)).code() == ErrorCode::InvalidState);
        REQUIRE(Error(SandboxError::not_paused(1)).code() == ErrorCode::InvalidState);
        REQUIRE(Error(SandboxError::not_terminated(1)).code() == ErrorCode::InvalidState);
    }

    SECTION("kind checks do not cross taxonomies") {
        Error err = SandboxError::not_running(1);
        REQUIRE(err.is<SandboxError>());
        REQUIRE_FALSE(err.is<MemoryError>());
        REQUIRE_FALSE(err.is(SandboxError::Kind::NotPaused));
        REQUIRE_FALSE(err.is(MemoryError::Kind::OutOfMemory));
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = MemoryError::invalid_size(0);
    err.with_context("region", "buf1");

    auto chain = build_error_chain(err);
    REQUIRE(chain.find("InvalidArgument") != std::string::npos);
    REQUIRE(chain.find("[region=buf1]") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE_FALSE(r.is_ok());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with typed error") {
        Result<void> r = Err(SandboxError::already_terminated(2));
        REQUIRE(r.is_err());
        REQUIRE(r.error().is(SandboxError::Kind::AlreadyTerminated));
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("and_then on Err keeps the error") {
        Result<int> r = Err<int>(MemoryError::invalid_alignment(3));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().is(MemoryError::Kind::InvalidAlignment));
    }

    SECTION("or_else on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.or_else([](const Error& /*e*/) -> Result<int> {
            return Ok(0);
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 0);
    }
}

TEST_CASE("Result with complex types", "[core][result]") {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
}

// =============================================================================
// Error Statistics
// =============================================================================

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();

    debug::record_error(MemoryError::out_of_memory(64));
    debug::record_error(SandboxError::not_found(1));
    debug::record_error(Error("plain"));

    REQUIRE(debug::total_error_count() == 3);
    auto summary = debug::error_stats_summary();
    REQUIRE(summary.find("Memory: 1") != std::string::npos);
    REQUIRE(summary.find("Sandbox: 1") != std::string::npos);
    REQUIRE(summary.find("Generic: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
