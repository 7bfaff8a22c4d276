#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (raw mode, cursor, one prompt line, keys).
 * Goal: decouple from concrete impls (tty/headless), enable testing.
 */
#include <string>

class ITerminal {
public:
  virtual ~ITerminal() = default;
  // raw: unbuffered, no echo, Ctrl-C delivered as a key
  virtual bool enter_raw(std::string& msg) = 0;
  virtual void leave_raw() = 0;
  virtual bool is_raw() const = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual bool cursor_visible() const = 0;
  // clears the current line and draws text on it
  virtual void draw_prompt(const std::string& text) = 0;
  // blocks until one key press; false on end of input or terminal error
  virtual bool read_key(int& key, std::string& msg) = 0;
  // a normal text line, only meaningful outside raw mode
  virtual void print_line(const std::string& text) = 0;
};
