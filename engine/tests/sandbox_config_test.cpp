#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "config/sandbox_config.h"

using namespace slotbox;

TEST_CASE("SandboxConfig defaults", "[config][defaults]") {
  SandboxConfig config = SandboxConfig::Default();
  REQUIRE(config.lanes == 1);
  REQUIRE(config.default_timeout_ms == 1000);
  REQUIRE(config.dispatch_grace_ms == 50);
  REQUIRE(config.memory_limit_bytes == 64 * 1024 * 1024);
  REQUIRE(config.worker_address_space_bytes == 0);
  REQUIRE(config.max_frame_bytes == 8 * 1024 * 1024);
  REQUIRE(config.trace);
}

TEST_CASE("SandboxConfig from JSON", "[config][json]") {
  SECTION("overrides and unknown keys") {
    SandboxConfig config;
    std::string error;
    REQUIRE(SandboxConfig::LoadFromJson(
        R"({"lanes": 4, "default_timeout_ms": 250, "trace": false, "comment": "ignored"})", config,
        &error));
    REQUIRE(config.lanes == 4);
    REQUIRE(config.default_timeout_ms == 250);
    REQUIRE_FALSE(config.trace);
    REQUIRE(config.dispatch_grace_ms == 50);
  }

  SECTION("malformed values") {
    SandboxConfig config;
    std::string error;
    REQUIRE_FALSE(SandboxConfig::LoadFromJson("{not json", config, &error));
    REQUIRE(error.find("JSON parse error") != std::string::npos);
    REQUIRE_FALSE(SandboxConfig::LoadFromJson("[]", config, &error));
    REQUIRE_FALSE(SandboxConfig::LoadFromJson(R"({"lanes": 0})", config, &error));
    REQUIRE_FALSE(SandboxConfig::LoadFromJson(R"({"lanes": 1000})", config, &error));
    REQUIRE_FALSE(SandboxConfig::LoadFromJson(R"({"default_timeout_ms": "fast"})", config, &error));
    REQUIRE_FALSE(SandboxConfig::LoadFromJson(R"({"trace": 1})", config, &error));
    REQUIRE_FALSE(
        SandboxConfig::LoadFromJson(R"({"default_timeout_ms": 10000000000000})", config, &error));
    REQUIRE(error.find("default_timeout_ms") != std::string::npos);
    REQUIRE_FALSE(
        SandboxConfig::LoadFromJson(R"({"dispatch_grace_ms": 10000000000000})", config, &error));
  }

  SECTION("failed load leaves the output untouched") {
    SandboxConfig config;
    config.lanes = 3;
    REQUIRE_FALSE(SandboxConfig::LoadFromJson(R"({"lanes": 2, "trace": "x"})", config));
    REQUIRE(config.lanes == 3);
  }
}

TEST_CASE("SandboxConfig from file", "[config][file]") {
  std::string path = "sandbox_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"lanes": 2, "max_frame_bytes": 1024})";
  }
  SandboxConfig config;
  std::string error;
  REQUIRE(SandboxConfig::LoadFromFile(path, config, &error));
  REQUIRE(config.lanes == 2);
  REQUIRE(config.max_frame_bytes == 1024);
  std::remove(path.c_str());

  REQUIRE_FALSE(SandboxConfig::LoadFromFile("does/not/exist.json", config, &error));
  REQUIRE(error.find("Failed to open") != std::string::npos);
}
