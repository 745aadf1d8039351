#pragma once

#include "flakeid/core/result.h"

#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flakeid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when the value is unacceptable; parsing then stops with an error
// naming the flag.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1], dispatches each recognised flag to its handler,
// and returns the populated config.
// Fails on the first unknown flag, flag missing its value, rejected value, or stray
// positional token. Callers consume their positional arguments before `start`.
template <typename Config>
core::Result<Config, std::string> parse_options(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::vector<Option<Config>>& options, int start = 1, Config default_config = {}) {
  using ParseResult = core::Result<Config, std::string>;
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        return ParseResult::err("Unknown option: " + arg);
      }
      return ParseResult::err("Unexpected argument: " + arg);
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        return ParseResult::err("Option " + arg + " requires a value");
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(config, value)) {
      return ParseResult::err("Invalid value for " + arg + ": '" + value + "'");
    }
  }

  return ParseResult::ok(std::move(config));
}

// print_options writes one entry per option for usage output.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
        << "      " << opt.description << "\n";
  }
}

}  // namespace flakeid::apps
