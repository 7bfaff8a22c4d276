#include "terminfo_terminal.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "types.hpp"
#include <poll.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <curses.h>
#include <term.h>

static std::string s_tputs_buf;
static int append_tputs_char(int c) {
  s_tputs_buf.push_back(static_cast<char>(c));
  return c;
}

// padding already applied; empty when the terminal lacks the capability
static std::string expand_cap(const char* name) {
  char* cap = tigetstr(name);
  if (cap == nullptr || cap == reinterpret_cast<char*>(-1)) return std::string();
  s_tputs_buf.clear();
  tputs(cap, 1, append_tputs_char);
  return s_tputs_buf;
}

// what the signal handler needs, copied out of the active terminal
static volatile std::sig_atomic_t s_raw_active = 0;
static volatile std::sig_atomic_t s_cursor_hidden = 0;
static int s_in_fd = -1;
static int s_out_fd = -1;
static struct termios s_saved{};
static char s_cnorm[64];
static size_t s_cnorm_len = 0;

TerminfoTerminal::TerminfoTerminal(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

TerminfoTerminal::~TerminfoTerminal() {
  if (!cursor_visible_) set_cursor_visible(true);
  leave_raw();
  remove_signal_restore();
}

bool TerminfoTerminal::load_terminfo(std::string& msg) {
  int err = 0;
  if (setupterm(nullptr, out_fd_, &err) != OK) {
    msg = err == 0 ? "can not initialize terminal: no terminfo entry for TERM"
                   : "can not initialize terminal: terminfo database not found";
    return false;
  }
  cr_ = expand_cap("cr");
  if (cr_.empty()) cr_ = "\r";
  el_ = expand_cap("el");
  civis_ = expand_cap("civis");
  cnorm_ = expand_cap("cnorm");
  del_curterm(cur_term);

  s_cnorm_len = cnorm_.size() < sizeof(s_cnorm) ? cnorm_.size() : 0;
  std::memcpy(s_cnorm, cnorm_.data(), s_cnorm_len);
  terminfo_loaded_ = true;
  LOG_DEBUG << "terminfo loaded" << (el_.empty() ? " (no el, padding prompts)" : "");
  return true;
}

bool TerminfoTerminal::enter_raw(std::string& msg) {
  if (raw_) return true;
  if (!terminfo_loaded_ && !load_terminfo(msg)) return false;
  if (::tcgetattr(in_fd_, &saved_) != 0) {
    msg = std::string("can not read terminal mode: ") + std::strerror(errno);
    return false;
  }
  struct termios raw = saved_;
  ::cfmakeraw(&raw);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(in_fd_, TCSANOW, &raw) != 0) {
    msg = std::string("can not enter raw mode: ") + std::strerror(errno);
    return false;
  }
  s_in_fd = in_fd_;
  s_out_fd = out_fd_;
  s_saved = saved_;
  s_raw_active = 1;
  install_signal_restore();
  raw_ = true;
  if (!cursor_visible_) write_out(civis_);
  return true;
}

void TerminfoTerminal::leave_raw() {
  if (!raw_) return;
  s_raw_active = 0;
  raw_ = false;
  if (::tcsetattr(in_fd_, TCSANOW, &saved_) != 0) {
    LOG_ERROR << "can not restore terminal mode: " << std::strerror(errno);
  }
}

void TerminfoTerminal::set_cursor_visible(bool visible) {
  if (visible == cursor_visible_) return;
  cursor_visible_ = visible;
  s_cursor_hidden = visible ? 0 : 1;
  if (terminfo_loaded_) write_out(visible ? cnorm_ : civis_);
}

void TerminfoTerminal::draw_prompt(const std::string& text) {
  std::string out = cr_;
  if (!el_.empty()) {
    out += el_;
    out += text;
  } else {
    out += text;
    if (last_prompt_len_ > text.size()) out.append(last_prompt_len_ - text.size(), ' ');
  }
  last_prompt_len_ = text.size();
  write_out(out);
}

bool TerminfoTerminal::read_key(int& key, std::string& msg) {
  unsigned char c = 0;
  for (;;) {
    ssize_t n = ::read(in_fd_, &c, 1);
    if (n == 1) break;
    if (n < 0 && errno == EINTR) continue;
    msg = n == 0 ? std::string("can not read key: end of input")
                 : std::string("can not read key: ") + std::strerror(errno);
    return false;
  }
  key = (c == 27) ? read_escape() : c;
  return true;
}

// ESC then CSI (ESC [ params final) or SS3 (ESC O final); a lone ESC is 27
int TerminfoTerminal::read_escape() {
  auto next = [this](unsigned char& c) {
    struct pollfd pfd{in_fd_, POLLIN, 0};
    if (::poll(&pfd, 1, TALLY_ESCAPE_DELAY_MS) <= 0) return false;
    return ::read(in_fd_, &c, 1) == 1;
  };
  unsigned char c = 0;
  if (!next(c)) return 27;
  if (c == '[') {
    while (next(c)) {
      if (c >= 0x40 && c <= 0x7e) break;
    }
  } else if (c == 'O') {
    (void)next(c);
  }
  return KEY_SEQUENCE;
}

void TerminfoTerminal::print_line(const std::string& text) {
  write_out(text + "\n");
}

void TerminfoTerminal::write_out(const std::string& s) {
  const char* p = s.data();
  size_t remain = s.size();
  while (remain > 0) {
    ssize_t w = ::write(out_fd_, p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      LOG_ERROR << "terminal write failed: " << std::strerror(errno);
      return;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
}

void TerminfoTerminal::restore_terminal_on_signal(int sig) {
  if (s_raw_active) {
    ::tcsetattr(s_in_fd, TCSANOW, &s_saved);
    s_raw_active = 0;
  }
  if (s_cursor_hidden && s_cnorm_len > 0) {
    ssize_t w = ::write(s_out_fd, s_cnorm, s_cnorm_len);
    (void)w;
  }
  std::signal(sig, SIG_DFL);
  std::raise(sig);
}

void TerminfoTerminal::install_signal_restore() {
  if (handlers_installed_) return;
  struct sigaction sa{};
  sa.sa_handler = &TerminfoTerminal::restore_terminal_on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGTERM, &sa, &old_term_);
  sigaction(SIGHUP, &sa, &old_hup_);
  sigaction(SIGQUIT, &sa, &old_quit_);
  handlers_installed_ = true;
}

void TerminfoTerminal::remove_signal_restore() {
  if (!handlers_installed_) return;
  sigaction(SIGTERM, &old_term_, nullptr);
  sigaction(SIGHUP, &old_hup_, nullptr);
  sigaction(SIGQUIT, &old_quit_, nullptr);
  handlers_installed_ = false;
}
