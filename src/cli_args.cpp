#include "cli_args.hpp"
#include "config.hpp"
#include "count_text.hpp"
#include <vector>

CliAction parse_args(int argc, const char* const* argv, CliOptions& out, std::string& msg) {
  std::vector<std::string> positional;
  bool options_done = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    int64_t ignored = 0;
    if (options_done || arg.empty() || arg[0] != '-' || arg == "-" || parse_count(arg, ignored)) {
      positional.push_back(arg);
      continue;
    }
    if (arg == "--") { options_done = true; continue; }
    if (arg == "-h" || arg == "--help") return CliAction::Help;
    if (arg == "-V" || arg == "--version") return CliAction::Version;
    if (arg == "-n" || arg == "--no-sync") { out.no_sync = true; continue; }
    msg = "unexpected argument '" + arg + "'";
    return CliAction::UsageError;
  }

  if (positional.empty()) { msg = "the following required argument was not provided: <PATH>"; return CliAction::UsageError; }
  if (positional.size() > 2) { msg = "unexpected argument '" + positional[2] + "'"; return CliAction::UsageError; }
  out.path = positional[0];
  if (positional.size() == 2) {
    int64_t v = 0;
    if (!parse_count(positional[1], v)) {
      msg = "invalid value '" + positional[1] + "' for [START_VALUE]: not a 64-bit signed integer";
      return CliAction::UsageError;
    }
    out.start_value = v;
  }
  return CliAction::Run;
}

void print_usage(std::ostream& os, const std::string& program_name) {
  os << "Usage: " << program_name << " [OPTIONS] <PATH> [START_VALUE]\n";
}

void print_help(std::ostream& os, const std::string& program_name) {
  os << TALLY_ABOUT << "\n\n";
  print_usage(os, program_name);
  os << "\n"
     << "Arguments:\n"
     << "  <PATH>         Path to file where we will store the counter value (will be overwritten)\n"
     << "  [START_VALUE]  Starting value (default: 0)\n"
     << "\n"
     << "Options:\n"
     << "  -n, --no-sync  Disable syncing of data to disk on every operation\n"
     << "  -h, --help     Print help\n"
     << "  -V, --version  Print version\n"
     << "\n"
     << "Keys: + = space increment, - _ backspace decrement, q Ctrl-C quit\n"
     << "Defaults are read from ~/" << TALLY_RC_FILE << " (set sync on|off, set log <path>, set loglevel <level>)\n";
}

void print_version(std::ostream& os) {
  os << TALLY_NAME << " " << TALLY_VERSION << "\n";
}
