#include "next.h"

#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"
#include "flakeid/flake/generator.h"
#include "flakeid/flake/generator_config.h"

#include "next_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::vector<flakeid::apps::Option<NextCliConfig>> next_options() {
  return {
      {"--count", true, "Number of identifiers to issue (default 1)",
       [](NextCliConfig& c, const std::string& v) {
         c.count = v;
         return true;
       }},
      {"--format", true, "Output format (decimal|padded|base2|hex|base32|base36|base64)",
       [](NextCliConfig& c, const std::string& v) {
         c.format = v;
         return true;
       }},
      {"--config", true, "Path to a JSON generator configuration file",
       [](NextCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--start-time", true, "Start time, ISO 8601 UTC (overrides the file)",
       [](NextCliConfig& c, const std::string& v) {
         c.start_time = v;
         return true;
       }},
      {"--machine-id", true, "Machine ID 0..31 (overrides the file)",
       [](NextCliConfig& c, const std::string& v) {
         c.machine_id = v;
         return true;
       }},
      {"--service-id", true, "Service ID 0..31 (overrides the file)",
       [](NextCliConfig& c, const std::string& v) {
         c.service_id = v;
         return true;
       }},
      {"--now", true, "Pin a manual clock at this ISO 8601 UTC instant",
       [](NextCliConfig& c, const std::string& v) {
         c.now = v;
         return true;
       }},
      {"--decompose", false, "Print a JSON array of decompositions instead of identifiers",
       [](NextCliConfig& c, const std::string&) {
         c.decompose = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_next(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = next_options();
  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << parsed.error() << "\n\nUsage: flakeid next [options]\n";
    flakeid::apps::print_options(std::cerr, options);
    return 1;
  }
  const NextCliConfig& config = parsed.value();

  // Validate before emitting any diagnostics so no partial output appears on error.
  const std::string config_error = validate_next_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n\nUsage: flakeid next [options]\n";
    flakeid::apps::print_options(std::cerr, options);
    return 1;
  }

  const auto generator_config = resolve_generator_config(config);
  if (!generator_config.has_value()) {
    std::cerr << "Error: " << generator_config.error() << "\n";
    return 1;
  }

  const auto settings = flakeid::flake::to_settings(generator_config.value());
  if (!settings.has_value()) {
    std::cerr << "Error: " << settings.error() << "\n";
    return 1;
  }

  // The manual clock must outlive the generator; both live until return.
  std::unique_ptr<flakeid::core::ManualClock> manual_clock;
  flakeid::core::IClock* clock = &flakeid::core::system_clock();
  if (config.now.has_value()) {
    manual_clock = std::make_unique<flakeid::core::ManualClock>(
        flakeid::core::parse_iso8601_utc(config.now.value()).value());
    clock = manual_clock.get();
  }

  const auto generator = flakeid::flake::Generator::create(settings.value(), *clock);
  if (!generator.has_value()) {
    std::cerr << "Error: generator not created: "
              << flakeid::core::error_message(generator.error()) << "\n";
    return 1;
  }

  print_startup_diagnostics(*generator.value(), generator_config.value(),
                            manual_clock != nullptr, std::cerr);

  return execute_next(*generator.value(), static_cast<std::size_t>(std::stoll(config.count)),
                      flakeid::flake::parse_id_format(config.format).value(), config.decompose,
                      std::cout, std::cerr);
}
