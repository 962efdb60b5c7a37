#include "commands/detect.h"
#include "commands/import_existing.h"

#include "txdedup/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "txdedup_cli " << txdedup::core::kEngineVersion << "\n"
            << "Usage: txdedup_cli <command> [options]\n"
            << "Commands:\n"
            << "  import   Load existing transactions into the history database\n"
            << "  detect   Classify candidate transactions against the history\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "import") {
    return cmd_import(argc, argv);
  }
  if (subcommand == "detect") {
    return cmd_detect(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << txdedup::core::kEngineVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
