#include "rc_config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <cstdlib>

static bool parse_on_off(const std::vector<std::string>& args, bool& out, const char* usage, std::string& msg) {
  if (args.size() == 1 && args[0] == "on") { out = true; return true; }
  if (args.size() == 1 && args[0] == "off") { out = false; return true; }
  msg = usage;
  return false;
}

static void register_rc_commands(CommandRegistry& registry, RcConfig& cfg) {
  registry.register_command("set sync", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    return parse_on_off(args, cfg.data_sync, "set sync: use set sync on|off", msg);
  });
  registry.register_command("set log", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set log: use set log <path>"; return false; }
    cfg.log_file = std::filesystem::path(args[0]);
    return true;
  });
  registry.register_command("set loglevel", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1 || !parse_severity(args[0], cfg.log_level)) {
      msg = "set loglevel: use trace|debug|info|warning|error|fatal";
      return false;
    }
    return true;
  });
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / TALLY_RC_FILE;
}

void apply_rc_lines(const std::vector<std::string>& lines, RcConfig& cfg) {
  CommandRegistry registry;
  register_rc_commands(registry, cfg);
  int lineno = 0;
  for (std::string s : lines) {
    lineno++;
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string msg;
    if (!registry.execute_line(s, msg)) {
      cfg.warnings.push_back("line " + std::to_string(lineno) + ": " + msg);
    }
  }
}

bool load_rc(const std::filesystem::path& path, RcConfig& cfg, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  apply_rc_lines(lines, cfg);
  return true;
}
