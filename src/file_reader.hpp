#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines on LF bytes.
 * Usage: read_lines(path, out_lines, msg); returns false with msg on failure.
 * Note: bytes are kept verbatim (no CRLF folding); a final LF ends the last
 *       line instead of opening an empty one.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

void split_lines(std::string_view data, std::vector<std::string>& out_lines);
