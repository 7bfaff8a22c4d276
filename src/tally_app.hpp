#pragma once
/*
 * TallyApp
 *
 * Purpose: the interactive loop. Loads the counter (asking before discarding
 *          non-counter data), then reads increment/decrement/quit choices,
 *          applies them and persists after every change.
 * State: Init → Running → Quitting. Overflow/underflow are notices, not errors.
 * Errors: run() returns false; failure()/message() say why. The terminal is
 *         restored on every return path.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "file_counter.hpp"
#include "iterminal.hpp"
#include "key_map.hpp"
#include "terminal.hpp"
#include "types.hpp"

struct TallyOptions {
  std::filesystem::path path;
  std::optional<int64_t> start_value;
  bool data_sync = true;
};

class TallyApp {
public:
  TallyApp(ITerminal& term, TallyOptions opts);
  bool run();

  static const KeyMap<TallyChoice>& tally_keys();
  static std::string prompt_for(int64_t value);

  AppState state() const { return state_; }
  Failure failure() const { return failure_; }
  const std::string& message() const { return message_; }
  const FileCounter& counter() const { return counter_; }

private:
  bool init_counter();
  bool loop();
  bool apply(TallyChoice choice, RawModeGuard& raw);
  bool notice(const std::string& text, RawModeGuard& raw);
  bool fail(Failure kind, const std::string& msg);

  ITerminal& term_;
  TallyOptions opts_;
  FileCounter counter_;
  AppState state_ = AppState::Init;
  Failure failure_ = Failure::None;
  std::string message_;
};
