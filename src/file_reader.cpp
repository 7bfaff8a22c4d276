#include "file_reader.hpp"
#include "posix_fd.hpp"
#include "config.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

static std::string errno_text() { return std::strerror(errno); }

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd = UniqueFd::open_read(path);
  if (!fd.valid()) { msg = "can not open file " + path.string() + ": " + errno_text(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat " + path.string() + ": " + errno_text(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = "can not read " + path.string() + ": is a directory"; return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return true;
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file " + path.string() + ": " + errno_text(); return false; }
  const char* data = static_cast<const char*>(mem);

  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data + start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }
  ::munmap(mem, n);
  return true;
}

bool read_first_line(int fd, size_t max_len, std::string& out, bool& too_long, std::string& msg) {
  out.clear();
  too_long = false;
  char chunk[TALLY_READ_CHUNK_SIZE];
  off_t off = 0;
  while (out.size() < max_len) {
    size_t want = std::min(sizeof(chunk), max_len - out.size());
    ssize_t r = ::pread(fd, chunk, want, off);
    if (r < 0) {
      if (errno == EINTR) continue;
      msg = "can not read counter file: " + errno_text();
      return false;
    }
    if (r == 0) return true;
    const char* nl = static_cast<const char*>(std::memchr(chunk, '\n', static_cast<size_t>(r)));
    if (nl) {
      out.append(chunk, static_cast<size_t>(nl - chunk) + 1);
      return true;
    }
    out.append(chunk, static_cast<size_t>(r));
    off += r;
  }
  too_long = true;
  return true;
}
