#pragma once
/*
 * TextBuffer
 *
 * Purpose: ordered, read-only sequence of logical lines (raw bytes).
 * Note: populated once before the session; never empty (an empty source
 *       is one blank line).
 */
#include <string>
#include <vector>
#include <filesystem>

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::vector<std::string> lines);

  bool empty() const;
  size_t line_count() const;
  const std::string& line(size_t r) const;
  size_t line_len(size_t r) const;

  void init_from_lines(std::vector<std::string>&& lines);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);

private:
  void ensure_not_empty();
  std::vector<std::string> lines_;
};
