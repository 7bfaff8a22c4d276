#include "terminal.hpp"

RawModeGuard::RawModeGuard(ITerminal& term) : term_(term) {
  if (term_.is_raw()) return;
  ok_ = term_.enter_raw(error_);
  owned_ = ok_;
}

RawModeGuard::~RawModeGuard() {
  if (owned_ && term_.is_raw()) term_.leave_raw();
}

void RawModeGuard::suspend() {
  if (term_.is_raw()) term_.leave_raw();
}

bool RawModeGuard::resume(std::string& msg) {
  if (term_.is_raw()) return true;
  return term_.enter_raw(msg);
}

HiddenCursorGuard::HiddenCursorGuard(ITerminal& term)
  : term_(term), was_visible_(term.cursor_visible()) {
  if (was_visible_) term_.set_cursor_visible(false);
}

HiddenCursorGuard::~HiddenCursorGuard() {
  if (was_visible_) term_.set_cursor_visible(true);
}
