#pragma once
/*
 * FileCounter
 *
 * Purpose: a signed 64-bit count mirrored into a one-line text file.
 * Feature: persist() rewrites in place (seek 0 → truncate → write → fdatasync),
 *          so the file never keeps residue of a longer previous value.
 * Note: increment/decrement only touch memory; the caller persists.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "posix_fd.hpp"
#include "types.hpp"

class FileCounter {
public:
  FileCounter(std::filesystem::path path, bool data_sync);

  // Opens (creating if absent) and picks the initial value:
  // start_value, else the file's first line, else 0.
  // invalid_content is set when that line is non-empty and not a count
  // (a first line longer than TALLY_MAX_COUNT_LINE never is one);
  // the value is then 0 and nothing has been written.
  bool load(std::optional<int64_t> start_value, bool& invalid_content, std::string& msg);
  bool persist(std::string& msg);

  CountStep increment();
  CountStep decrement();

  int64_t value() const { return count_; }
  void reset(int64_t v) { count_ = v; }
  bool is_open() const { return fd_.valid(); }
  bool data_sync() const { return data_sync_; }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  UniqueFd fd_;
  int64_t count_ = 0;
  bool data_sync_ = true;
};
