#include "decompose.h"

#include "flakeid/flake/id_codec.h"

#include "decompose_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct DecomposeCliConfig {
  std::string format{"decimal"};
};

}  // namespace

int cmd_decompose(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  // Usage: flakeid decompose <id> [--format <format>]
  if (argc < 3 || argv[2][0] == '-') {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    std::cerr << "Usage: flakeid decompose <id> [--format <format>]\n";
    return 1;
  }
  const std::string text = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  const std::vector<flakeid::apps::Option<DecomposeCliConfig>> options = {
      {"--format", true, "Input format (decimal|padded|base2|hex|base32|base36|base64)",
       [](DecomposeCliConfig& c, const std::string& v) {
         c.format = v;
         return true;
       }},
  };
  // Flags start after the single <id>; any further positional token is a usage error.
  const auto config = flakeid::apps::parse_options(argc, argv, options, 3);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error()
              << "\nUsage: flakeid decompose <id> [--format <format>]\n";
    return 1;
  }

  const auto format = flakeid::flake::parse_id_format(config.value().format);
  if (!format.has_value()) {
    std::cerr << "Error: invalid --format '" << config.value().format
              << "' (valid: decimal, padded, base2, hex, base32, base36, base64)\n";
    return 1;
  }

  return execute_decompose(text, format.value(), std::cout, std::cerr);
}
