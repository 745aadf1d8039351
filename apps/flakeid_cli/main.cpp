#include "flakeid/core/version.h"

#include "commands/decompose.h"
#include "commands/next.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& out) {
  out << "Usage: flakeid <command> [options]\n"
         "\n"
         "Commands:\n"
         "  next        Issue identifiers\n"
         "  decompose   Print the fields of an identifier as JSON\n"
         "  version     Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "next") {
    return cmd_next(argc, argv);
  }
  if (subcommand == "decompose") {
    return cmd_decompose(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << "flakeid v" << flakeid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n\n";
  print_usage(std::cerr);
  return 1;
}
