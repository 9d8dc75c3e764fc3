#include <catch2/catch_test_macros.hpp>
#include "agentrelay/core/config.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <fstream>

using namespace agentrelay::core;
using agentrelay::testing::TempDir;

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.session.name == "agent-relay");
    REQUIRE(config.poller.interval_ms == 500);
    REQUIRE(config.poller.stability_threshold == 3);
    REQUIRE(config.breaker.failure_threshold == 5);
    REQUIRE(config.arbiter.context_reset_command == "/clear");
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config validation rejects bad values", "[config]") {
    Config config;

    SECTION("stability threshold") {
        config.poller.stability_threshold = 0;
        REQUIRE(config.validate().is_err());
    }
    SECTION("timeout not above interval") {
        config.poller.timeout_ms = config.poller.interval_ms;
        REQUIRE(config.validate().is_err());
    }
    SECTION("tiny inline threshold") {
        config.composer.inline_threshold = 10;
        REQUIRE(config.validate().is_err());
    }
    SECTION("breaker threshold") {
        config.breaker.failure_threshold = 0;
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);
    }
}

TEST_CASE("Config loads YAML over defaults", "[config]") {
    TempDir dir;
    fs::path file = dir.path() / "config.yaml";
    {
        std::ofstream out(file);
        out << "session:\n"
               "  name: relay-test\n"
               "  working_dir: " << dir.path().string() << "\n"
               "poller:\n"
               "  interval_ms: 250\n"
               "  stability_threshold: 4\n"
               "breaker:\n"
               "  failure_threshold: 2\n"
               "memory_store:\n"
               "  enabled: false\n";
    }

    auto result = Config::load(file);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.poller.interval_ms == 250);
    REQUIRE(config.poller.stability_threshold == 4);
    REQUIRE(config.poller.timeout_ms == 60000);
    REQUIRE(config.breaker.failure_threshold == 2);
    REQUIRE_FALSE(config.memory_store.enabled);
    REQUIRE(config.session.working_dir == dir.path());
}

TEST_CASE("Config load reports missing and invalid files", "[config]") {
    TempDir dir;

    auto missing = Config::load(dir.path() / "nope.yaml");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ErrorCode::ConfigNotFound);

    fs::path bad = dir.path() / "bad.yaml";
    {
        std::ofstream out(bad);
        out << "poller:\n  stability_threshold: 0\n";
    }
    auto invalid = Config::load(bad);
    REQUIRE(invalid.is_err());
    REQUIRE(invalid.error().code == ErrorCode::ConfigValidationFailed);

    auto fallback = Config::load_or_default(dir.path() / "nope.yaml");
    REQUIRE(fallback.poller.stability_threshold == 3);
}

TEST_CASE("Config round-trips through save", "[config]") {
    TempDir dir;
    Config config;
    config.session.name = "saved";
    config.composer.inline_threshold = 900;

    fs::path file = dir.path() / "saved.yaml";
    REQUIRE(config.save(file).is_ok());

    auto loaded = Config::load(file);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().composer.inline_threshold == 900);
}

TEST_CASE("Path expansion", "[config]") {
    setenv("AGENTRELAY_TEST_DIR", "/tmp/relay", 1);

    REQUIRE(expand_path(std::string("$AGENTRELAY_TEST_DIR/data")) == "/tmp/relay/data");
    REQUIRE(expand_path(std::string("${AGENTRELAY_TEST_DIR}/logs")) == "/tmp/relay/logs");
    REQUIRE(expand_path(std::string("/absolute/path")) == "/absolute/path");

    if (const char* home = std::getenv("HOME")) {
        REQUIRE(expand_path(std::string("~/x")) == std::string(home) + "/x");
    }
}
