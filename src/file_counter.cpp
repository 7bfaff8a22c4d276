#include "file_counter.hpp"
#include "config.hpp"
#include "count_text.hpp"
#include "file_reader.hpp"
#include "logger.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <limits>

static bool fail(std::string& msg, const char* what, const std::filesystem::path& path) {
  msg = std::string(what) + " " + path.string() + ": " + std::strerror(errno);
  return false;
}

FileCounter::FileCounter(std::filesystem::path path, bool data_sync)
  : path_(std::move(path)), data_sync_(data_sync) {}

bool FileCounter::load(std::optional<int64_t> start_value, bool& invalid_content, std::string& msg) {
  invalid_content = false;
  fd_ = UniqueFd::open_rw(path_);
  if (!fd_.valid()) return fail(msg, "can not open file", path_);

  if (start_value) {
    count_ = *start_value;
    LOG_DEBUG << "start value " << count_ << " given, not reading " << path_.string();
    return true;
  }

  std::string line;
  bool too_long = false;
  if (!read_first_line(fd_.get(), TALLY_MAX_COUNT_LINE, line, too_long, msg)) {
    msg += " (" + path_.string() + ")";
    return false;
  }
  int64_t v = 0;
  if (!too_long && parse_count(trim_right(line), v)) {
    count_ = v;
    LOG_DEBUG << "read count " << count_ << " from " << path_.string();
  } else {
    count_ = 0;
    invalid_content = !line.empty();
    if (invalid_content) LOG_WARN << path_.string() << " holds non-counter data";
  }
  return true;
}

bool FileCounter::persist(std::string& msg) {
  if (!fd_.valid()) { msg = "counter file is not open: " + path_.string(); return false; }
  if (::lseek(fd_.get(), 0, SEEK_SET) < 0) return fail(msg, "can not seek", path_);
  if (::ftruncate(fd_.get(), 0) != 0) return fail(msg, "can not truncate", path_);

  std::string text = format_count(count_);
  const char* p = text.data();
  size_t remain = text.size();
  while (remain > 0) {
    ssize_t w = ::write(fd_.get(), p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      return fail(msg, "write file failed:", path_);
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
  if (data_sync_) {
#if defined(__APPLE__)
    if (::fsync(fd_.get()) != 0) return fail(msg, "sync file failed:", path_);
#else
    if (::fdatasync(fd_.get()) != 0) return fail(msg, "sync file failed:", path_);
#endif
  }
  LOG_DEBUG << "persisted " << text << " to " << path_.string() << (data_sync_ ? " (synced)" : "");
  return true;
}

CountStep FileCounter::increment() {
  if (count_ == std::numeric_limits<int64_t>::max()) return CountStep::Overflow;
  ++count_;
  return CountStep::Changed;
}

CountStep FileCounter::decrement() {
  if (count_ == std::numeric_limits<int64_t>::min()) return CountStep::Underflow;
  --count_;
  return CountStep::Changed;
}
