#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(std::vector<int> keys) : keys_(keys.begin(), keys.end()) {}

void HeadlessTerminal::push_keys(const std::vector<int>& keys) {
  keys_.insert(keys_.end(), keys.begin(), keys.end());
}

bool HeadlessTerminal::enter_raw(std::string& msg) {
  if (fail_enter_) { msg = "can not initialize terminal (headless)"; return false; }
  if (raw_) return true;
  raw_ = true;
  raw_enters_++;
  return true;
}

void HeadlessTerminal::leave_raw() {
  if (!raw_) return;
  raw_ = false;
  raw_leaves_++;
}

void HeadlessTerminal::draw_prompt(const std::string& text) {
  prompts_.push_back(text);
}

bool HeadlessTerminal::read_key(int& key, std::string& msg) {
  if (!raw_) { msg = "can not read key: terminal is not in raw mode"; return false; }
  if (keys_.empty()) { msg = "end of scripted input"; return false; }
  key = keys_.front();
  keys_.pop_front();
  return true;
}

void HeadlessTerminal::print_line(const std::string& text) {
  lines_.push_back(text);
}
