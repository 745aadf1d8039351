#include "flakeid/flake/generator_config.h"

#include "flakeid/flake/providers.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace flakeid::flake {

namespace {

using json = nlohmann::json;
using ConfigResult = core::Result<GeneratorConfig, std::string>;
using SettingsResult = core::Result<Settings, std::string>;

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
  if (j.contains(key) && !j.at(key).is_null()) {
    out = j.at(key).get<T>();
  }
}

// read_id accepts only integral numbers inside the 16-bit provider range. Fractions and
// wide values are errors rather than truncated.
std::optional<std::string> read_id(const json& j, const char* key, std::optional<int>& out) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  const json& value = j.at(key);
  if (!value.is_number_integer()) {
    return std::string{key} + " must be an integer";
  }

  constexpr auto kMaxId = std::numeric_limits<std::uint16_t>::max();
  if (value.is_number_unsigned()) {
    const auto id = value.get<std::uint64_t>();
    if (id > kMaxId) {
      return std::string{key} + " is out of range: " + std::to_string(id);
    }
    out = static_cast<int>(id);
    return std::nullopt;
  }
  const auto id = value.get<std::int64_t>();
  if (id < 0 || id > kMaxId) {
    return std::string{key} + " is out of range: " + std::to_string(id);
  }
  out = static_cast<int>(id);
  return std::nullopt;
}

// resolve_id picks the single configured source for one ID, or none.
core::Result<IdProvider, std::string> resolve_id(const char* label,
                                                 const std::optional<int>& literal,
                                                 const std::optional<std::string>& env_name,
                                                 bool from_private_ip) {
  using ProviderResult = core::Result<IdProvider, std::string>;

  const int sources = (literal.has_value() ? 1 : 0) + (env_name.has_value() ? 1 : 0) +
                      (from_private_ip ? 1 : 0);
  if (sources > 1) {
    return ProviderResult::err(std::string{label} + " has more than one source configured");
  }

  if (literal.has_value()) {
    if (literal.value() < 0 || literal.value() > std::numeric_limits<std::uint16_t>::max()) {
      return ProviderResult::err(std::string{label} + " is out of range: " +
                                 std::to_string(literal.value()));
    }
    return ProviderResult::ok(fixed_id(static_cast<std::uint16_t>(literal.value())));
  }
  if (env_name.has_value()) {
    return ProviderResult::ok(env_id(env_name.value()));
  }
  if (from_private_ip) {
    return ProviderResult::ok(private_ipv4_id());
  }
  return ProviderResult::ok(IdProvider{});
}

}  // namespace

std::string to_json(const GeneratorConfig& config) {
  // nlohmann::json's default object is a std::map, so keys come out sorted.
  json j = json::object();
  if (config.machine_id.has_value()) {
    j["machine_id"] = config.machine_id.value();
  }
  if (config.machine_id_env.has_value()) {
    j["machine_id_env"] = config.machine_id_env.value();
  }
  if (config.machine_id_from_private_ip) {
    j["machine_id_from_private_ip"] = true;
  }
  if (config.service_id.has_value()) {
    j["service_id"] = config.service_id.value();
  }
  if (config.service_id_env.has_value()) {
    j["service_id_env"] = config.service_id_env.value();
  }
  if (config.start_time.has_value()) {
    j["start_time"] = config.start_time.value();
  }
  return j.dump();
}

core::Result<GeneratorConfig, std::string> from_json(const std::string& json_str) {
  try {
    const json j = json::parse(json_str);
    if (!j.is_object()) {
      return ConfigResult::err("configuration must be a JSON object");
    }

    GeneratorConfig config;
    read_optional(j, "start_time", config.start_time);
    if (auto error = read_id(j, "machine_id", config.machine_id)) {
      return ConfigResult::err("invalid configuration: " + *error);
    }
    if (auto error = read_id(j, "service_id", config.service_id)) {
      return ConfigResult::err("invalid configuration: " + *error);
    }
    read_optional(j, "machine_id_env", config.machine_id_env);
    read_optional(j, "service_id_env", config.service_id_env);
    config.machine_id_from_private_ip = j.value("machine_id_from_private_ip", false);
    return ConfigResult::ok(std::move(config));
  } catch (const json::exception& e) {
    return ConfigResult::err(std::string{"invalid configuration: "} + e.what());
  }
}

core::Result<GeneratorConfig, std::string> load_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return ConfigResult::err("cannot open configuration file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return from_json(buffer.str());
}

core::Result<Settings, std::string> to_settings(const GeneratorConfig& config) {
  Settings settings;

  if (config.start_time.has_value()) {
    const auto start = core::parse_iso8601_utc(config.start_time.value());
    if (!start.has_value()) {
      return SettingsResult::err("start_time is not an ISO 8601 UTC timestamp: " +
                                 config.start_time.value());
    }
    settings.set_start_time(start.value());
  }

  auto machine = resolve_id("machine_id", config.machine_id, config.machine_id_env,
                            config.machine_id_from_private_ip);
  if (!machine.has_value()) {
    return SettingsResult::err(machine.error());
  }
  settings.machine_id = machine.value();

  auto service = resolve_id("service_id", config.service_id, config.service_id_env, false);
  if (!service.has_value()) {
    return SettingsResult::err(service.error());
  }
  settings.service_id = service.value();

  return SettingsResult::ok(std::move(settings));
}

}  // namespace flakeid::flake
