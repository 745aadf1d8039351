#include "flakeid/flake/generator.h"
#include "flakeid/flake/generator_config.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace flakeid;

// ── from_json ───────────────────────────────────────────────────────────────

TEST_CASE("from_json: reads every field", "[config]") {
  const auto result = flake::from_json(R"({
    "start_time": "2021-10-01T00:00:00Z",
    "machine_id": 3,
    "service_id_env": "FLAKEID_TEST_SERVICE",
    "unknown_key": [1, 2, 3]
  })");
  REQUIRE(result.has_value());
  const auto& config = result.value();
  CHECK(config.start_time == "2021-10-01T00:00:00Z");
  CHECK(config.machine_id == 3);
  CHECK_FALSE(config.service_id.has_value());
  CHECK_FALSE(config.machine_id_env.has_value());
  CHECK(config.service_id_env == "FLAKEID_TEST_SERVICE");
  CHECK_FALSE(config.machine_id_from_private_ip);
}

TEST_CASE("from_json: empty object is valid", "[config]") {
  const auto result = flake::from_json("{}");
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().start_time.has_value());
  CHECK_FALSE(result.value().machine_id.has_value());
}

TEST_CASE("from_json: malformed input returns an error", "[config]") {
  CHECK_FALSE(flake::from_json("").has_value());
  CHECK_FALSE(flake::from_json("{").has_value());
  CHECK_FALSE(flake::from_json("[1, 2]").has_value());
  CHECK_FALSE(flake::from_json(R"({"machine_id": "three"})").has_value());
  CHECK_FALSE(flake::from_json(R"({"machine_id_from_private_ip": "yes"})").has_value());
}

TEST_CASE("from_json: rejects fractional and overflowing IDs", "[config]") {
  SECTION("fractional service ID") {
    const auto result = flake::from_json(R"({"service_id": 3.9})");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("service_id must be an integer") != std::string::npos);
  }

  SECTION("machine ID wider than 32 bits") {
    const auto result = flake::from_json(R"({"machine_id": 4294967297})");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("machine_id is out of range") != std::string::npos);
  }

  SECTION("machine ID above 16 bits") {
    CHECK_FALSE(flake::from_json(R"({"machine_id": 65536})").has_value());
  }

  SECTION("negative service ID") {
    const auto result = flake::from_json(R"({"service_id": -1})");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("service_id is out of range") != std::string::npos);
  }

  SECTION("largest 16-bit value is still read") {
    const auto result = flake::from_json(R"({"machine_id": 65535, "service_id": 0})");
    REQUIRE(result.has_value());
    CHECK(result.value().machine_id == 65535);
    CHECK(result.value().service_id == 0);
  }
}

// ── to_json ─────────────────────────────────────────────────────────────────

TEST_CASE("to_json: sorted keys, unset fields omitted", "[config]") {
  flake::GeneratorConfig config;
  config.start_time = "2021-10-01T00:00:00Z";
  config.service_id = 4;
  config.machine_id = 3;
  CHECK(flake::to_json(config) ==
        R"({"machine_id":3,"service_id":4,"start_time":"2021-10-01T00:00:00Z"})");
  CHECK(flake::to_json(flake::GeneratorConfig{}) == "{}");
}

TEST_CASE("to_json output is accepted by from_json", "[config]") {
  flake::GeneratorConfig config;
  config.machine_id_env = "HOST_ID";
  config.service_id = 12;
  const auto parsed = flake::from_json(flake::to_json(config));
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().machine_id_env == "HOST_ID");
  CHECK(parsed.value().service_id == 12);
}

// ── load_config_file ────────────────────────────────────────────────────────

TEST_CASE("load_config_file: reads a file from disk", "[config]") {
  const auto path = std::filesystem::temp_directory_path() / "flakeid_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"machine_id": 5, "service_id": 6})";
  }

  const auto result = flake::load_config_file(path.string());
  std::filesystem::remove(path);

  REQUIRE(result.has_value());
  CHECK(result.value().machine_id == 5);
  CHECK(result.value().service_id == 6);
}

TEST_CASE("load_config_file: missing file returns an error", "[config]") {
  const auto result = flake::load_config_file("/nonexistent/flakeid/config.json");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("/nonexistent/flakeid/config.json") != std::string::npos);
}

// ── to_settings ─────────────────────────────────────────────────────────────

TEST_CASE("to_settings: literal IDs and start time", "[config]") {
  flake::GeneratorConfig config;
  config.start_time = "2021-10-01T00:00:00Z";
  config.machine_id = 3;
  config.service_id = 4;

  const auto settings = flake::to_settings(config);
  REQUIRE(settings.has_value());
  CHECK(settings.value().start_time == core::kDefaultStartTime);

  const auto generator = flake::Generator::create(settings.value());
  REQUIRE(generator.has_value());
  CHECK(generator.value()->machine_id() == 3);
  CHECK(generator.value()->service_id() == 4);
}

TEST_CASE("to_settings: no sources leaves the providers unset", "[config]") {
  const auto settings = flake::to_settings(flake::GeneratorConfig{});
  REQUIRE(settings.has_value());
  CHECK_FALSE(settings.value().start_time.has_value());
  CHECK_FALSE(static_cast<bool>(settings.value().machine_id));
  CHECK_FALSE(static_cast<bool>(settings.value().service_id));
}

TEST_CASE("to_settings: environment variable source", "[config]") {
  ::setenv("FLAKEID_TEST_MACHINE", "17", 1);
  flake::GeneratorConfig config;
  config.machine_id_env = "FLAKEID_TEST_MACHINE";

  const auto settings = flake::to_settings(config);
  REQUIRE(settings.has_value());
  const auto generator = flake::Generator::create(settings.value());
  ::unsetenv("FLAKEID_TEST_MACHINE");

  REQUIRE(generator.has_value());
  CHECK(generator.value()->machine_id() == 17);
}

TEST_CASE("to_settings: rejects invalid configuration", "[config]") {
  SECTION("unparseable start time") {
    flake::GeneratorConfig config;
    config.start_time = "yesterday";
    CHECK_FALSE(flake::to_settings(config).has_value());
  }

  SECTION("two machine ID sources") {
    flake::GeneratorConfig config;
    config.machine_id = 1;
    config.machine_id_env = "HOST_ID";
    const auto result = flake::to_settings(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("machine_id") != std::string::npos);
  }

  SECTION("literal outside 16 bits") {
    flake::GeneratorConfig config;
    config.service_id = 70000;
    CHECK_FALSE(flake::to_settings(config).has_value());
  }

  SECTION("negative literal") {
    flake::GeneratorConfig config;
    config.machine_id = -1;
    CHECK_FALSE(flake::to_settings(config).has_value());
  }
}

TEST_CASE("to_settings: 5-bit range is enforced at creation", "[config]") {
  flake::GeneratorConfig config;
  config.machine_id = 40;
  const auto settings = flake::to_settings(config);
  REQUIRE(settings.has_value());

  const auto generator = flake::Generator::create(settings.value());
  REQUIRE_FALSE(generator.has_value());
  CHECK(generator.error() == core::CreateError::kMachineIdOutOfRange);
}
