#include "count_text.hpp"
#include <charconv>
#include <cctype>

bool parse_count(std::string_view s, int64_t& out) {
  // from_chars takes '-' but not '+'
  if (!s.empty() && s[0] == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s[0] == '-') return false;
  }
  if (s.empty()) return false;
  int64_t v = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, v, 10);
  if (ec != std::errc() || ptr != last) return false;
  out = v;
  return true;
}

std::string format_count(int64_t v) {
  return std::to_string(v);
}

std::string_view trim_right(std::string_view s) {
  size_t n = s.size();
  while (n > 0 && std::isspace(static_cast<unsigned char>(s[n - 1])) != 0) n--;
  return s.substr(0, n);
}
