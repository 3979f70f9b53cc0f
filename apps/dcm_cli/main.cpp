#include "commands/history.h"
#include "commands/match.h"
#include "commands/resolve.h"
#include "commands/snapshot.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "daily-collection-monitor CLI v0.1\n"
               "Usage: dcm_cli <command> [options]\n"
               "Commands:\n"
               "  resolve   Resolve filenames to work unit, category and date\n"
               "  history   Find the last file that satisfied a unit's category\n"
               "  match     Score strings against a candidate list\n"
               "  snapshot  Print a stored end-of-period snapshot\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "resolve") {
    return cmd_resolve(argc, argv);
  }
  if (subcommand == "history") {
    return cmd_history(argc, argv);
  }
  if (subcommand == "match") {
    return cmd_match(argc, argv);
  }
  if (subcommand == "snapshot") {
    return cmd_snapshot(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
