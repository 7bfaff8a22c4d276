#include "tally_app.hpp"
#include "choice_reader.hpp"
#include "count_text.hpp"
#include "logger.hpp"
#include "recovery_prompt.hpp"

TallyApp::TallyApp(ITerminal& term, TallyOptions opts)
  : term_(term), opts_(std::move(opts)), counter_(opts_.path, opts_.data_sync) {}

const KeyMap<TallyChoice>& TallyApp::tally_keys() {
  static const KeyMap<TallyChoice> keys = {
    {'+', TallyChoice::Increment},
    {'=', TallyChoice::Increment}, // '+' without shift
    {' ', TallyChoice::Increment},
    {'-', TallyChoice::Decrement},
    {'_', TallyChoice::Decrement}, // '-' with shift
    {KEY_DEL, TallyChoice::Decrement},
    {KEY_CTRL_H, TallyChoice::Decrement},
    {'q', TallyChoice::Quit},
    {'Q', TallyChoice::Quit},
    {KEY_CTRL_C, TallyChoice::Quit},
  };
  return keys;
}

std::string TallyApp::prompt_for(int64_t value) {
  return "Count: " + format_count(value) + "    [+/-/q]";
}

bool TallyApp::fail(Failure kind, const std::string& msg) {
  failure_ = kind;
  message_ = msg;
  state_ = AppState::Quitting;
  if (kind == Failure::Aborted) {
    LOG_INFO << "aborted by user";
  } else {
    LOG_ERROR << msg;
  }
  return false;
}

bool TallyApp::run() {
  LOG_INFO << "counter file " << opts_.path.string()
           << (opts_.data_sync ? ", sync on" : ", sync off");
  if (!init_counter()) return false;
  state_ = AppState::Running;
  return loop();
}

bool TallyApp::init_counter() {
  std::string msg;
  bool invalid = false;
  if (!counter_.load(opts_.start_value, invalid, msg)) return fail(Failure::Io, msg);
  if (invalid) {
    RecoveryChoice choice = RecoveryChoice::No;
    if (!ask_overwrite(term_, choice, msg)) return fail(Failure::Io, msg);
    switch (choice) {
      case RecoveryChoice::Yes: counter_.reset(0); break;
      case RecoveryChoice::No: return fail(Failure::InvalidData, "File contained non-counter data");
      case RecoveryChoice::Quit: return fail(Failure::Aborted, "");
    }
  }
  if (!counter_.persist(msg)) return fail(Failure::Io, msg);
  LOG_INFO << "starting at " << counter_.value();
  return true;
}

bool TallyApp::loop() {
  std::string msg;
  // session guards; the ones inside read_choice are no-ops while these are held
  RawModeGuard raw(term_);
  if (!raw.ok()) return fail(Failure::Io, raw.error());
  {
    HiddenCursorGuard cursor(term_);
    while (state_ == AppState::Running) {
      TallyChoice choice = TallyChoice::Quit;
      if (!read_choice(term_, prompt_for(counter_.value()), tally_keys(), choice, msg)) {
        return fail(Failure::Io, msg);
      }
      if (!apply(choice, raw)) return false;
    }
  }
  raw.suspend();
  term_.print_line("");
  LOG_INFO << "quit at " << counter_.value();
  return true;
}

bool TallyApp::apply(TallyChoice choice, RawModeGuard& raw) {
  std::string msg;
  switch (choice) {
    case TallyChoice::Increment:
      if (counter_.increment() == CountStep::Overflow) return notice("overflow!", raw);
      break;
    case TallyChoice::Decrement:
      if (counter_.decrement() == CountStep::Underflow) return notice("underflow!", raw);
      break;
    case TallyChoice::Quit:
      state_ = AppState::Quitting;
      return true;
  }
  if (!counter_.persist(msg)) return fail(Failure::Io, msg);
  return true;
}

bool TallyApp::notice(const std::string& text, RawModeGuard& raw) {
  LOG_WARN << text << " at " << counter_.value();
  raw.suspend();
  term_.print_line("");
  term_.print_line(text);
  std::string msg;
  if (!raw.resume(msg)) return fail(Failure::Io, msg);
  return true;
}
