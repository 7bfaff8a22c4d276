#pragma once
/*
 * RawModeGuard / HiddenCursorGuard
 *
 * Purpose: RAII ownership of the process-wide terminal modes.
 * Usage: construct before reading keys; destructor restores whatever this
 *        guard changed. Nested guards on an already-raw/hidden terminal are no-ops.
 */
#include "iterminal.hpp"
#include <string>

class RawModeGuard {
public:
  explicit RawModeGuard(ITerminal& term);
  ~RawModeGuard();
  RawModeGuard(const RawModeGuard&) = delete;
  RawModeGuard& operator=(const RawModeGuard&) = delete;

  bool ok() const { return ok_; }
  const std::string& error() const { return error_; }
  // leave raw mode for a normal line of output, then resume()
  void suspend();
  bool resume(std::string& msg);

private:
  ITerminal& term_;
  bool owned_ = false;
  bool ok_ = true;
  std::string error_;
};

class HiddenCursorGuard {
public:
  explicit HiddenCursorGuard(ITerminal& term);
  ~HiddenCursorGuard();
  HiddenCursorGuard(const HiddenCursorGuard&) = delete;
  HiddenCursorGuard& operator=(const HiddenCursorGuard&) = delete;

private:
  ITerminal& term_;
  bool was_visible_;
};
