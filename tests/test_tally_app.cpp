#include "tally_app.hpp"
#include "headless_terminal.hpp"
#include "recovery_prompt.hpp"
#include "test_util.hpp"
#include <cassert>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

static TallyOptions options_for(const std::filesystem::path& p, std::optional<int64_t> start = std::nullopt) {
  TallyOptions opts;
  opts.path = p;
  opts.start_value = start;
  opts.data_sync = true;
  return opts;
}

static void assert_restored(const HeadlessTerminal& term) {
  assert(!term.is_raw());
  assert(term.cursor_visible());
  assert(term.raw_enters() == term.raw_leaves());
}

static void test_quit_immediately_keeps_initial_value(const TempDir& dir) {
  auto p = dir.file("quit.txt");
  write_file(p, "42\n");
  HeadlessTerminal term({'q'});
  TallyApp app(term, options_for(p));
  assert(app.run());
  assert(app.state() == AppState::Quitting);
  assert(app.failure() == Failure::None);
  assert(app.counter().value() == 42);
  assert(read_file(p) == "42");
  assert(term.prompts().size() == 1);
  assert(term.prompts()[0] == "Count: 42    [+/-/q]");
  assert_restored(term);
}

static void test_start_value_overrides_file(const TempDir& dir) {
  auto p = dir.file("start.txt");
  write_file(p, "9");
  HeadlessTerminal term({'Q'});
  TallyApp app(term, options_for(p, int64_t{5}));
  assert(app.run());
  assert(read_file(p) == "5");
  assert(term.prompts()[0] == "Count: 5    [+/-/q]");
}

static void test_increment_and_decrement_keys(const TempDir& dir) {
  auto p = dir.file("keys.txt");
  HeadlessTerminal term({'+', '=', ' ', '+', '-', '_', KEY_DEL, KEY_CTRL_H, '+', 'q'});
  TallyApp app(term, options_for(p, int64_t{0}));
  assert(app.run());
  assert(app.counter().value() == 1);
  assert(read_file(p) == "1");
  const std::vector<std::string> expected = {
    "Count: 0    [+/-/q]", "Count: 1    [+/-/q]", "Count: 2    [+/-/q]",
    "Count: 3    [+/-/q]", "Count: 4    [+/-/q]", "Count: 3    [+/-/q]",
    "Count: 2    [+/-/q]", "Count: 1    [+/-/q]", "Count: 0    [+/-/q]",
    "Count: 1    [+/-/q]",
  };
  assert(term.prompts() == expected);
  assert_restored(term);
}

static void test_decrement_below_zero_persists_negative(const TempDir& dir) {
  auto p = dir.file("negative.txt");
  HeadlessTerminal term({'-'});
  TallyApp app(term, options_for(p));
  // script ends after one key: the loop reports the read failure
  assert(!app.run());
  assert(app.failure() == Failure::Io);
  assert(app.counter().value() == -1);
  assert(read_file(p) == "-1");
  assert_restored(term);
}

static void test_unknown_keys_change_nothing(const TempDir& dir) {
  auto p = dir.file("unknown.txt");
  write_file(p, "3");
  HeadlessTerminal term({'x', 'a', '1', 27, KEY_SEQUENCE, 'q'});
  TallyApp app(term, options_for(p));
  assert(app.run());
  assert(app.counter().value() == 3);
  assert(read_file(p) == "3");
  assert(term.prompts().size() == 6);
  for (const auto& s : term.prompts()) assert(s == "Count: 3    [+/-/q]");
}

static void test_ctrl_c_quits_cleanly(const TempDir& dir) {
  auto p = dir.file("ctrlc.txt");
  HeadlessTerminal term({'+', KEY_CTRL_C, '+'});
  TallyApp app(term, options_for(p));
  assert(app.run());
  assert(read_file(p) == "1");
  assert(term.keys_left() == 1);
  assert_restored(term);
}

static void test_overflow_is_a_notice(const TempDir& dir) {
  auto p = dir.file("overflow.txt");
  const int64_t max = std::numeric_limits<int64_t>::max();
  HeadlessTerminal term({'+', 'q'});
  TallyApp app(term, options_for(p, max));
  assert(app.run());
  assert(app.counter().value() == max);
  assert(read_file(p) == "9223372036854775807");
  bool seen = false;
  for (const auto& l : term.lines()) if (l == "overflow!") seen = true;
  assert(seen);
  // left raw mode for the notice and came back for the next prompt
  assert(term.raw_enters() == 2);
  assert(term.prompts().size() == 2);
  assert_restored(term);
}

static void test_underflow_is_a_notice(const TempDir& dir) {
  auto p = dir.file("underflow.txt");
  const int64_t min = std::numeric_limits<int64_t>::min();
  HeadlessTerminal term({'-', '+', 'q'});
  TallyApp app(term, options_for(p, min));
  assert(app.run());
  assert(app.counter().value() == min + 1);
  assert(read_file(p) == "-9223372036854775807");
  bool seen = false;
  for (const auto& l : term.lines()) if (l == "underflow!") seen = true;
  assert(seen);
}

static void test_invalid_content_refused(const TempDir& dir) {
  auto p = dir.file("refuse.txt");
  write_file(p, "not-a-number");
  HeadlessTerminal term({'x', 'n', '+'});
  TallyApp app(term, options_for(p));
  assert(!app.run());
  assert(app.failure() == Failure::InvalidData);
  assert(app.message() == "File contained non-counter data");
  assert(read_file(p) == "not-a-number");
  assert(term.prompts().size() == 2);
  assert(term.prompts()[0] == kRecoveryPrompt);
  assert(term.keys_left() == 1);
  assert_restored(term);
}

static void test_invalid_content_accepted(const TempDir& dir) {
  auto p = dir.file("accept.txt");
  write_file(p, "shopping list\nmilk\n");
  HeadlessTerminal term({'Y', '+', 'q'});
  TallyApp app(term, options_for(p));
  assert(app.run());
  assert(app.counter().value() == 1);
  assert(read_file(p) == "1");
  assert(term.prompts()[1] == "Count: 0    [+/-/q]");
  assert_restored(term);
}

static void test_invalid_content_quit(const TempDir& dir) {
  for (int key : std::vector<int>{'q', 'Q', KEY_CTRL_C}) {
    auto p = dir.file("abort.txt");
    write_file(p, "abc");
    HeadlessTerminal term({key, '+'});
    TallyApp app(term, options_for(p));
    assert(!app.run());
    assert(app.failure() == Failure::Aborted);
    assert(read_file(p) == "abc");
    assert_restored(term);
  }
}

static void test_start_value_skips_recovery(const TempDir& dir) {
  auto p = dir.file("skip.txt");
  write_file(p, "not-a-number");
  HeadlessTerminal term({'q'});
  TallyApp app(term, options_for(p, int64_t{8}));
  assert(app.run());
  assert(read_file(p) == "8");
  assert(term.prompts().size() == 1);
}

static void test_io_failures_are_reported(const TempDir& dir) {
  HeadlessTerminal term({'q'});
  TallyApp app(term, options_for(dir.path()));
  assert(!app.run());
  assert(app.failure() == Failure::Io);
  assert(!app.message().empty());
  assert(term.prompts().empty());

  auto p = dir.file("noterm.txt");
  HeadlessTerminal broken({'q'});
  broken.fail_enter_raw(true);
  TallyApp app2(broken, options_for(p, int64_t{4}));
  assert(!app2.run());
  assert(app2.failure() == Failure::Io);
  // the initial value is already on disk before the loop starts
  assert(read_file(p) == "4");
  assert(broken.cursor_visible());
}

int main() {
  quiet_logging();
  TempDir dir("tally_app");
  test_quit_immediately_keeps_initial_value(dir);
  test_start_value_overrides_file(dir);
  test_increment_and_decrement_keys(dir);
  test_decrement_below_zero_persists_negative(dir);
  test_unknown_keys_change_nothing(dir);
  test_ctrl_c_quits_cleanly(dir);
  test_overflow_is_a_notice(dir);
  test_underflow_is_a_notice(dir);
  test_invalid_content_refused(dir);
  test_invalid_content_accepted(dir);
  test_invalid_content_quit(dir);
  test_start_value_skips_recovery(dir);
  test_io_failures_are_reported(dir);
  return 0;
}
