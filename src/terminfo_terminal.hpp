#pragma once
/*
 * TerminfoTerminal
 *
 * Purpose: ITerminal on a tty: termios raw mode, ncurses' terminfo layer for
 *          carriage return / clear-to-eol / cursor visibility.
 * Note: no screen is set up and the alternate screen is never entered, so the
 *       prompt is redrawn in place on the user's current line and every line
 *       printed stays in the scrollback.
 *       SIGTERM/SIGHUP/SIGQUIT restore mode and cursor before the default action.
 */
#include "iterminal.hpp"
#include <termios.h>
#include <signal.h>
#include <unistd.h>
#include <string>

class TerminfoTerminal : public ITerminal {
public:
  explicit TerminfoTerminal(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);
  ~TerminfoTerminal() override;
  TerminfoTerminal(const TerminfoTerminal&) = delete;
  TerminfoTerminal& operator=(const TerminfoTerminal&) = delete;

  bool enter_raw(std::string& msg) override;
  void leave_raw() override;
  bool is_raw() const override { return raw_; }
  void set_cursor_visible(bool visible) override;
  bool cursor_visible() const override { return cursor_visible_; }
  void draw_prompt(const std::string& text) override;
  bool read_key(int& key, std::string& msg) override;
  void print_line(const std::string& text) override;

private:
  bool load_terminfo(std::string& msg);
  int read_escape();
  void write_out(const std::string& s);
  void install_signal_restore();
  void remove_signal_restore();
  static void restore_terminal_on_signal(int sig);

  int in_fd_;
  int out_fd_;
  bool terminfo_loaded_ = false;
  std::string cr_;
  std::string el_;
  std::string civis_;
  std::string cnorm_;
  size_t last_prompt_len_ = 0;
  struct termios saved_{};
  bool raw_ = false;
  bool cursor_visible_ = true;
  bool handlers_installed_ = false;
  struct sigaction old_term_{};
  struct sigaction old_hup_{};
  struct sigaction old_quit_{};
};
