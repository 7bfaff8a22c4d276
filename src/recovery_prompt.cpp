#include "recovery_prompt.hpp"
#include "choice_reader.hpp"
#include "logger.hpp"
#include "terminal.hpp"

const char* const kRecoveryPrompt =
  "File contains non-counter data. Use anyway? (data will be lost!)  [y/n]";

const KeyMap<RecoveryChoice>& recovery_keys() {
  static const KeyMap<RecoveryChoice> keys = {
    {'y', RecoveryChoice::Yes},
    {'Y', RecoveryChoice::Yes},
    {'n', RecoveryChoice::No},
    {'N', RecoveryChoice::No},
    {'q', RecoveryChoice::Quit},
    {'Q', RecoveryChoice::Quit},
    {KEY_CTRL_C, RecoveryChoice::Quit},
  };
  return keys;
}

bool ask_overwrite(ITerminal& term, RecoveryChoice& choice, std::string& msg) {
  bool ok = false;
  {
    RawModeGuard raw(term);
    if (!raw.ok()) { msg = raw.error(); return false; }
    ok = read_choice(term, kRecoveryPrompt, recovery_keys(), choice, msg);
  }
  // the prompt line stays; answer output starts below it
  term.print_line("");
  if (ok) {
    LOG_INFO << "recovery answer: "
             << (choice == RecoveryChoice::Yes ? "yes" : choice == RecoveryChoice::No ? "no" : "quit");
  }
  return ok;
}
