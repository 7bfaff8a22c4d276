#pragma once
/*
 * HeadlessTerminal
 *
 * 作用：无头终端实现（ITerminal），按脚本回放按键，用于自动化测试。
 * 记录：raw 模式/光标状态切换、绘制的提示行、普通输出行，供断言使用。
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal() = default;
  explicit HeadlessTerminal(std::vector<int> keys);

  void push_keys(const std::vector<int>& keys);
  void fail_enter_raw(bool fail) { fail_enter_ = fail; }

  bool enter_raw(std::string& msg) override;
  void leave_raw() override;
  bool is_raw() const override { return raw_; }
  void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
  bool cursor_visible() const override { return cursor_visible_; }
  void draw_prompt(const std::string& text) override;
  bool read_key(int& key, std::string& msg) override;
  void print_line(const std::string& text) override;

  const std::vector<std::string>& prompts() const { return prompts_; }
  const std::vector<std::string>& lines() const { return lines_; }
  int raw_enters() const { return raw_enters_; }
  int raw_leaves() const { return raw_leaves_; }
  size_t keys_left() const { return keys_.size(); }

private:
  std::deque<int> keys_;
  std::vector<std::string> prompts_;
  std::vector<std::string> lines_;
  bool raw_ = false;
  bool cursor_visible_ = true;
  bool fail_enter_ = false;
  int raw_enters_ = 0;
  int raw_leaves_ = 0;
};
