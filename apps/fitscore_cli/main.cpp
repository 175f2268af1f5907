#include "commands/diagnose.h"
#include "commands/match.h"
#include "commands/rank.h"
#include "fitscore/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "fitscore_cli " << fitscore::core::kBuildVersion << "\n"
            << "Usage: fitscore_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  match     --candidate <file> --job <file> [--config <file>]\n"
            << "  rank      --job <file> --candidates <file> [--config <file>] [--top-k N]"
               " [--parallel N]\n"
            << "  diagnose  [--profiles <file>] [--config <file>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "match") {
    return cmd_match(argc, argv);
  }
  if (subcommand == "rank") {
    return cmd_rank(argc, argv);
  }
  if (subcommand == "diagnose") {
    return cmd_diagnose(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
