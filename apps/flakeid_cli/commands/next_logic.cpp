#include "next_logic.h"

#include "flakeid/core/time.h"
#include "flakeid/core/version.h"
#include "flakeid/flake/id_json.h"
#include "flakeid/flake/layout.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <system_error>

namespace {

std::optional<long long> parse_integer(const std::string& text) {
  long long value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string check_id_flag(const char* flag, const std::optional<std::string>& value) {
  if (!value.has_value()) {
    return "";
  }
  const auto parsed = parse_integer(value.value());
  if (!parsed.has_value() || parsed.value() < 0 || parsed.value() > 31) {
    return std::string{"Error: "} + flag + " must be an integer in 0..31, got '" +
           value.value() + "'";
  }
  return "";
}

}  // namespace

std::string validate_next_config(const NextCliConfig& config) {
  const auto count = parse_integer(config.count);
  if (!count.has_value() || count.value() < 1 ||
      count.value() > static_cast<long long>(kMaxCount)) {
    return "Error: --count must be an integer in 1.." + std::to_string(kMaxCount) + ", got '" +
           config.count + "'";
  }

  if (!flakeid::flake::parse_id_format(config.format).has_value()) {
    return "Error: invalid --format '" + config.format +
           "' (valid: decimal, padded, base2, hex, base32, base36, base64)";
  }

  if (auto error = check_id_flag("--machine-id", config.machine_id); !error.empty()) {
    return error;
  }
  if (auto error = check_id_flag("--service-id", config.service_id); !error.empty()) {
    return error;
  }

  if (config.start_time.has_value() &&
      !flakeid::core::parse_iso8601_utc(config.start_time.value()).has_value()) {
    return "Error: --start-time '" + config.start_time.value() +
           "' is not an ISO 8601 UTC timestamp (e.g. 2021-10-01T00:00:00Z)";
  }
  if (config.now.has_value() &&
      !flakeid::core::parse_iso8601_utc(config.now.value()).has_value()) {
    return "Error: --now '" + config.now.value() +
           "' is not an ISO 8601 UTC timestamp (e.g. 2026-01-01T00:00:00Z)";
  }

  return "";
}

flakeid::core::Result<flakeid::flake::GeneratorConfig, std::string> resolve_generator_config(
    const NextCliConfig& config) {
  using ConfigResult = flakeid::core::Result<flakeid::flake::GeneratorConfig, std::string>;

  flakeid::flake::GeneratorConfig resolved;
  if (config.config_path.has_value()) {
    auto loaded = flakeid::flake::load_config_file(config.config_path.value());
    if (!loaded.has_value()) {
      return ConfigResult::err(loaded.error());
    }
    resolved = loaded.value();
  }

  // Flags take precedence over the file and replace every other source for that ID.
  if (config.start_time.has_value()) {
    resolved.start_time = config.start_time;
  }
  if (config.machine_id.has_value()) {
    resolved.machine_id = static_cast<int>(parse_integer(config.machine_id.value()).value());
    resolved.machine_id_env.reset();
    resolved.machine_id_from_private_ip = false;
  }
  if (config.service_id.has_value()) {
    resolved.service_id = static_cast<int>(parse_integer(config.service_id.value()).value());
    resolved.service_id_env.reset();
  }

  return ConfigResult::ok(std::move(resolved));
}

void print_startup_diagnostics(const flakeid::flake::Generator& generator,
                               const flakeid::flake::GeneratorConfig& config,
                               const bool manual_clock, std::ostream& err) {
  err << "flakeid v" << flakeid::core::kBuildVersion << "\n";
  err << "Start time:  " << flakeid::core::format_iso8601_utc(generator.start_time()) << "\n";
  err << "Machine ID:  " << generator.machine_id() << "\n";
  err << "Service ID:  " << generator.service_id() << "\n";

  if (!config.start_time.has_value()) {
    err << "WARNING: No start time configured. Using the default start time "
        << flakeid::core::format_iso8601_utc(flakeid::core::kDefaultStartTime) << ".\n";
  }
  if (!config.machine_id.has_value() && !config.machine_id_env.has_value() &&
      !config.machine_id_from_private_ip) {
    err << "WARNING: No machine ID configured. Using machine ID 0.\n"
           "         Identifiers are only unique across processes with distinct\n"
           "         (machine ID, service ID) pairs.\n";
  }
  if (!config.service_id.has_value() && !config.service_id_env.has_value()) {
    err << "WARNING: No service ID configured. Using service ID 0.\n";
  }
  if (manual_clock) {
    err << "WARNING: --now pins a MANUAL clock. Output is reproducible but not unique\n"
           "         across runs. Do not use these identifiers in production.\n";
  }
}

int execute_next(flakeid::flake::Generator& generator, const std::size_t count,
                 const flakeid::flake::IdFormat format, const bool decompose, std::ostream& out,
                 std::ostream& err) {
  nlohmann::json parts = nlohmann::json::array();

  for (std::size_t i = 0; i < count; ++i) {
    const auto result = generator.next_id();
    if (!result.has_value()) {
      err << "Error: " << flakeid::core::error_message(result.error()) << "\n";
      return 1;
    }

    if (decompose) {
      parts.push_back(flakeid::flake::id_parts_to_json(flakeid::flake::decompose(result.value())));
    } else {
      out << flakeid::flake::format_id(result.value(), format) << "\n";
    }
  }

  if (decompose) {
    out << parts.dump(2) << "\n";
  }
  return 0;
}
