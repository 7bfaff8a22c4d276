#pragma once
/*
 * CLI arguments
 *
 * Usage: tally <path> [start_value] [-n|--no-sync] [-h|--help] [-V|--version]
 * Note: an argument that parses as a count ("-5") is positional, not a flag.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

enum class CliAction { Run, Help, Version, UsageError };

struct CliOptions {
  std::filesystem::path path;
  std::optional<int64_t> start_value;
  bool no_sync = false;
};

CliAction parse_args(int argc, const char* const* argv, CliOptions& out, std::string& msg);
void print_usage(std::ostream& os, const std::string& program_name);
void print_help(std::ostream& os, const std::string& program_name);
void print_version(std::ostream& os);
