// enclave_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <enclave/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

using namespace enclave_core;

namespace {

/// Captures one logger's output for the lifetime of the capture
class LogCapture {
public:
    LogCapture(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level)
        : m_logger(std::move(logger))
        , m_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out))
        , m_previous(m_logger->level()) {
        m_sink->set_pattern("%v");
        m_logger->sinks().push_back(m_sink);
        m_logger->set_level(level);
    }

    ~LogCapture() {
        auto& sinks = m_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
        m_logger->set_level(m_previous);
    }

    std::string text() {
        m_logger->flush();
        return m_out.str();
    }

private:
    std::ostringstream m_out;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
    spdlog::level::level_enum m_previous;
};

} // namespace

TEST_CASE("Log level names", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::off)) == "off");
}

TEST_CASE("Subsystem level overrides", "[core][log]") {
    SECTION("parsing") {
        auto memory = parse_logger_level("memory=debug");
        REQUIRE(memory.has_value());
        REQUIRE(memory->first == "enclave_memory");
        REQUIRE(memory->second == spdlog::level::debug);

        auto full = parse_logger_level("enclave_sandbox=off");
        REQUIRE(full.has_value());
        REQUIRE(full->first == "enclave_sandbox");

        REQUIRE_FALSE(parse_logger_level("memory").has_value());
        REQUIRE_FALSE(parse_logger_level("=debug").has_value());
        REQUIRE_FALSE(parse_logger_level("memory=loud").has_value());
    }

    SECTION("configure_logging applies them") {
        LogConfig config;
        config.level = spdlog::level::warn;
        config.logger_levels["enclave_memory"] = spdlog::level::trace;
        configure_logging(config);

        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(memory_logger()->level() == spdlog::level::trace);
        REQUIRE(sandbox_logger()->level() == spdlog::level::warn);
        REQUIRE(get_logger("test_created_later")->level() == spdlog::level::warn);

        configure_logging(LogConfig{});
        REQUIRE(memory_logger()->level() == spdlog::level::info);
    }

    SECTION("named loggers are shared") {
        REQUIRE(get_logger("test_named") == get_logger("test_named"));
        REQUIRE(sandbox_logger()->name() == "enclave_sandbox");
        REQUIRE(memory_logger()->name() == "enclave_memory");
        REQUIRE(core_logger()->name() == "enclave_core");
    }
}

TEST_CASE("Sandbox event lines", "[core][log]") {
    LogCapture capture(sandbox_logger(), spdlog::level::info);

    log_sandbox_event(spdlog::level::warn, 3, "Resource limit exceeded", {
        {"exceeded", "cpu"},
        {"policy", "terminate"},
    });
    log_sandbox_event(spdlog::level::info, 4, "Sandbox terminated");
    log_sandbox_event(spdlog::level::debug, 5, "Filtered out");

    auto text = capture.text();
    REQUIRE(text.find("Resource limit exceeded {sandbox=3, exceeded=\"cpu\", policy=\"terminate\"}")
        != std::string::npos);
    REQUIRE(text.find("Sandbox terminated {sandbox=4}") != std::string::npos);
    REQUIRE(text.find("Filtered out") == std::string::npos);
}

TEST_CASE("Region event lines", "[core][log]") {
    LogCapture capture(memory_logger(), spdlog::level::debug);

    log_region_event(spdlog::level::debug, "Registered region", 0x10000, 4096, "sandbox_7_main");

    auto text = capture.text();
    REQUIRE(text.find("Registered region {base=0x10000, size=4096, name=\"sandbox_7_main\"}") != std::string::npos);
}

TEST_CASE("Log scope traces entry and exit", "[core][log]") {
    auto logger = get_logger("test_scope");
    LogCapture capture(logger, spdlog::level::trace);

    {
        LogScope scope(logger, "shutdown");
    }

    auto text = capture.text();
    REQUIRE(text.find(">>> Entering shutdown") != std::string::npos);
    REQUIRE(text.find("<<< Exiting shutdown") != std::string::npos);
}
