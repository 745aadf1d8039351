#pragma once

#include "flakeid/core/result.h"
#include "flakeid/flake/settings.h"

#include <optional>
#include <string>

namespace flakeid::flake {

// GeneratorConfig is the file/flag form of Settings.
//
// start_time: ISO 8601 UTC ("2021-10-01T00:00:00Z"); unset means the default start time.
// Each ID has at most one source: a literal value, an environment variable name, or (machine
// ID only) the private IPv4 address. No source means ID 0.
struct GeneratorConfig {
  std::optional<std::string> start_time;      // NOLINT(readability-identifier-naming)
  std::optional<int> machine_id;              // NOLINT(readability-identifier-naming)
  std::optional<int> service_id;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> machine_id_env;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> service_id_env;  // NOLINT(readability-identifier-naming)
  bool machine_id_from_private_ip{false};     // NOLINT(readability-identifier-naming)
};

// to_json serializes a GeneratorConfig. Keys are sorted alphabetically and unset fields are
// omitted, so output is deterministic given the same input.
[[nodiscard]] std::string to_json(const GeneratorConfig& config);

// from_json parses a GeneratorConfig. Unknown keys are ignored.
// Returns an error message for malformed JSON or wrongly typed fields.
[[nodiscard]] core::Result<GeneratorConfig, std::string> from_json(const std::string& json_str);

// load_config_file reads and parses a configuration file.
[[nodiscard]] core::Result<GeneratorConfig, std::string> load_config_file(const std::string& path);

// to_settings resolves a GeneratorConfig into Settings.
// Fails when start_time does not parse, an ID literal is outside 0..65535, or an ID has more
// than one source. Range checks against the bit layout happen in Generator::create.
[[nodiscard]] core::Result<Settings, std::string> to_settings(const GeneratorConfig& config);

}  // namespace flakeid::flake
