#pragma once

#include "flakeid/core/result.h"
#include "flakeid/flake/generator.h"
#include "flakeid/flake/generator_config.h"
#include "flakeid/flake/id_codec.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

// NextCliConfig holds the raw flags of `flakeid next`.
// Values stay as text until validate_next_config() checks them, so a bad flag is reported
// instead of silently falling back to a default.
struct NextCliConfig {
  std::optional<std::string> config_path;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> start_time;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> machine_id;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> service_id;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> now;          // NOLINT(readability-identifier-naming)
  std::string count{"1"};                  // NOLINT(readability-identifier-naming)
  std::string format{"decimal"};           // NOLINT(readability-identifier-naming)
  bool decompose{false};                   // NOLINT(readability-identifier-naming)
};

inline constexpr std::size_t kMaxCount = 1000000;

// validate_next_config checks flag syntax before any output is produced.
// Returns: "" on success, non-empty error message on failure.
[[nodiscard]] std::string validate_next_config(const NextCliConfig& config);

// resolve_generator_config loads --config (if given) and applies flag overrides on top.
// Precondition: validate_next_config(config) returned "".
[[nodiscard]] flakeid::core::Result<flakeid::flake::GeneratorConfig, std::string>
resolve_generator_config(const NextCliConfig& config);

// print_startup_diagnostics writes the generator's operating parameters to `err`,
// with a WARNING line for each defaulted or non-production choice.
void print_startup_diagnostics(const flakeid::flake::Generator& generator,
                               const flakeid::flake::GeneratorConfig& config, bool manual_clock,
                               std::ostream& err);

// execute_next issues `count` identifiers and prints them one per line in `format`, or as a
// JSON array of decompositions when `decompose` is set. Returns the process exit code.
int execute_next(flakeid::flake::Generator& generator, std::size_t count,
                 flakeid::flake::IdFormat format, bool decompose, std::ostream& out,
                 std::ostream& err);
