#pragma once
/*
 * read_choice
 *
 * Purpose: block until a key in `keys` is pressed and return its value.
 * Behavior: raw mode + hidden cursor for the duration (scoped guards, no-ops if
 *           the caller already holds them); prompt redrawn on the current line
 *           before every read; unmapped keys are ignored. No timeout.
 * Errors: false with msg if raw mode can not be entered or a key read fails.
 */
#include <string>
#include "iterminal.hpp"
#include "key_map.hpp"
#include "logger.hpp"
#include "terminal.hpp"

template <typename T>
bool read_choice(ITerminal& term, const std::string& prompt, const KeyMap<T>& keys,
                 T& out, std::string& msg) {
  RawModeGuard raw(term);
  if (!raw.ok()) { msg = raw.error(); return false; }
  HiddenCursorGuard cursor(term);
  for (;;) {
    term.draw_prompt(prompt);
    int key = 0;
    if (!term.read_key(key, msg)) return false;
    if (const T* v = keys.find(key)) {
      out = *v;
      return true;
    }
    LOG_TRACE << "ignored key " << key;
  }
}
