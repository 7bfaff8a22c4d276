#include "cli_args.hpp"
#include "logger.hpp"
#include "rc_config.hpp"
#include "tally_app.hpp"
#include "terminfo_terminal.hpp"
#include <iostream>

int main(int argc, char** argv) {
  std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : TALLY_NAME;
  CliOptions cli;
  std::string msg;
  switch (parse_args(argc, argv, cli, msg)) {
    case CliAction::Help: print_help(std::cout, program); return 0;
    case CliAction::Version: print_version(std::cout); return 0;
    case CliAction::UsageError:
      std::cerr << "error: " << msg << "\n\n";
      print_usage(std::cerr, program);
      std::cerr << "\nFor more information, try '--help'.\n";
      return 2;
    case CliAction::Run: break;
  }

  RcConfig rc;
  if (auto rc_path = default_rc_path()) {
    if (!load_rc(*rc_path, rc, msg)) std::cerr << "Warning: " << msg << "\n";
  }
  disable_logging();
  if (rc.log_file && !init_logging(*rc.log_file, rc.log_level, msg)) {
    std::cerr << "Warning: " << msg << "\n";
  }
  for (const auto& w : rc.warnings) {
    std::cerr << "Warning: " << TALLY_RC_FILE << " " << w << "\n";
    LOG_WARN << TALLY_RC_FILE << " " << w;
  }

  TallyOptions opts;
  opts.path = cli.path;
  opts.start_value = cli.start_value;
  opts.data_sync = rc.data_sync && !cli.no_sync;

  bool ok = false;
  Failure failure = Failure::None;
  {
    TerminfoTerminal term;
    TallyApp app(term, opts);
    ok = app.run();
    failure = app.failure();
    msg = app.message();
  }
  if (ok) return 0;
  if (failure != Failure::Aborted) std::cerr << "Error: " << msg << std::endl;
  return 1;
}
