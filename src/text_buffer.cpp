#include "text_buffer.hpp"
#include "file_reader.hpp"
#include <utility>

TextBuffer::TextBuffer() { ensure_not_empty(); }

TextBuffer::TextBuffer(std::vector<std::string> lines) { init_from_lines(std::move(lines)); }

// true when the buffer holds only the implicit blank line
bool TextBuffer::empty() const { return lines_.size() == 1 && lines_[0].empty(); }
size_t TextBuffer::line_count() const { return lines_.size(); }
const std::string& TextBuffer::line(size_t r) const { return lines_[r]; }
size_t TextBuffer::line_len(size_t r) const { return r < lines_.size() ? lines_[r].size() : 0; }

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(std::vector<std::string>&& src) {
  lines_ = std::move(src);
  ensure_not_empty();
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  std::vector<std::string> ls;
  ok = read_lines(path, ls, msg);
  if (ok) b.init_from_lines(std::move(ls));
  return b;
}
