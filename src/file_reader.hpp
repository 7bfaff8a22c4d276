#pragma once
/*
 * FileReader
 *
 * Purpose: small read helpers for the counter file and the rc file.
 * Usage: both return false with msg on failure; CRLF is normalized to LF.
 */
#include <vector>
#include <string>
#include <filesystem>

// mmap the whole file and split it into lines
bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);

// bytes from offset 0 through the first '\n' (kept), or to EOF;
// stops after max_len bytes and sets too_long when no '\n' came by then
bool read_first_line(int fd, size_t max_len, std::string& out, bool& too_long, std::string& msg);
