#pragma once
/*
 * RcConfig
 *
 * Purpose: user defaults read from ~/.tallyrc, one command per line.
 * Commands: set sync on|off, set log <path>, set loglevel <level>.
 * Note: a bad line becomes a warning; only an unreadable file is an error.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "logger.hpp"

struct RcConfig {
  bool data_sync = TALLY_DEFAULT_SYNC != 0;
  std::optional<std::filesystem::path> log_file;
  severity_level log_level = TALLY_DEFAULT_LOG_LEVEL;
  std::vector<std::string> warnings;
};

// $HOME/.tallyrc, or nothing when HOME is unset
std::optional<std::filesystem::path> default_rc_path();
// a missing file is not an error and leaves cfg untouched
bool load_rc(const std::filesystem::path& path, RcConfig& cfg, std::string& msg);
void apply_rc_lines(const std::vector<std::string>& lines, RcConfig& cfg);
