#include "choice_reader.hpp"
#include "headless_terminal.hpp"
#include "terminal.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>

enum class Pick { Left, Right };

static const KeyMap<Pick>& pick_keys() {
  static const KeyMap<Pick> keys = {{'l', Pick::Left}, {'r', Pick::Right}};
  return keys;
}

static void test_ignores_unmapped_keys() {
  HeadlessTerminal term({'x', 'z', 27, 'r', 'l'});
  Pick p = Pick::Left; std::string msg;
  assert(read_choice(term, "pick [l/r]", pick_keys(), p, msg));
  assert(p == Pick::Right);
  // drawn once per key read
  assert(term.prompts().size() == 4);
  for (const auto& s : term.prompts()) assert(s == "pick [l/r]");
  assert(term.keys_left() == 1);
  assert(!term.is_raw());
  assert(term.cursor_visible());
  assert(term.raw_enters() == 1 && term.raw_leaves() == 1);
}

static void test_nested_inside_held_raw_mode() {
  HeadlessTerminal term({'l', 'r'});
  {
    RawModeGuard raw(term);
    assert(raw.ok());
    HiddenCursorGuard cursor(term);
    Pick p = Pick::Right; std::string msg;
    assert(read_choice(term, "a", pick_keys(), p, msg));
    assert(p == Pick::Left);
    assert(term.is_raw());
    assert(!term.cursor_visible());
    assert(read_choice(term, "b", pick_keys(), p, msg));
    assert(p == Pick::Right);
    assert(term.raw_enters() == 1 && term.raw_leaves() == 0);
  }
  assert(!term.is_raw());
  assert(term.cursor_visible());
  assert(term.raw_leaves() == 1);
}

static void test_read_failure_restores_terminal() {
  HeadlessTerminal term({'x'});
  Pick p = Pick::Left; std::string msg;
  assert(!read_choice(term, "pick", pick_keys(), p, msg));
  assert(msg == "end of scripted input");
  assert(!term.is_raw());
  assert(term.cursor_visible());
}

static void test_raw_mode_unavailable() {
  HeadlessTerminal term({'l'});
  term.fail_enter_raw(true);
  Pick p = Pick::Right; std::string msg;
  assert(!read_choice(term, "pick", pick_keys(), p, msg));
  assert(!msg.empty());
  assert(p == Pick::Right);
  assert(term.prompts().empty());
  assert(term.cursor_visible());
}

static void test_suspend_and_resume() {
  HeadlessTerminal term;
  RawModeGuard raw(term);
  assert(term.is_raw());
  raw.suspend();
  assert(!term.is_raw());
  std::string msg;
  assert(raw.resume(msg));
  assert(term.is_raw());
  assert(term.raw_enters() == 2);
}

static void test_key_map_lookup() {
  KeyMap<int> m;
  assert(m.size() == 0);
  assert(m.find('a') == nullptr);
  m.bind('a', 1);
  m.bind('a', 2);
  assert(m.size() == 1);
  assert(m.contains('a'));
  assert(*m.find('a') == 2);
  assert(!m.contains('b'));
}

int main() {
  quiet_logging();
  test_ignores_unmapped_keys();
  test_nested_inside_held_raw_mode();
  test_read_failure_restores_terminal();
  test_raw_mode_unavailable();
  test_suspend_and_resume();
  test_key_map_lookup();
  return 0;
}
