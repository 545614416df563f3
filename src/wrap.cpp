#include "wrap.hpp"
#include "text_buffer.hpp"
#include <algorithm>

size_t rows_for_len(size_t len, int width) {
  size_t w = static_cast<size_t>(std::max(1, width));
  return len == 0 ? 1 : (len + w - 1) / w;
}

size_t row_start(size_t byte, int width) {
  size_t w = static_cast<size_t>(std::max(1, width));
  return byte / w * w;
}

size_t last_row_start(size_t len, int width) {
  return (rows_for_len(len, width) - 1) * static_cast<size_t>(std::max(1, width));
}

int end_of_row(size_t len, size_t start, int width) {
  if (start >= len) return 0;
  size_t remaining = len - start;
  return static_cast<int>(std::min(remaining, static_cast<size_t>(std::max(1, width)))) - 1;
}

bool next_row(const TextBuffer& buf, int width, RowRef& r) {
  size_t w = static_cast<size_t>(std::max(1, width));
  if (r.start + w < buf.line_len(r.line)) { r.start += w; return true; }
  if (r.line + 1 < buf.line_count()) { r.line++; r.start = 0; return true; }
  return false;
}

bool prev_row(const TextBuffer& buf, int width, RowRef& r) {
  size_t w = static_cast<size_t>(std::max(1, width));
  if (r.start >= w) { r.start -= w; return true; }
  if (r.line > 0) { r.line--; r.start = last_row_start(buf.line_len(r.line), width); return true; }
  return false;
}

std::optional<Position> locate(const TextBuffer& buf, const Viewport& vp, size_t line, size_t byte) {
  if (vp.window_width <= 0 || vp.window_height <= 0) return std::nullopt;
  if (line < vp.line_offset) return std::nullopt;
  size_t target = row_start(byte, vp.window_width);
  if (line == vp.line_offset && target < vp.line_offset_byte) return std::nullopt;
  RowRef r{vp.line_offset, vp.line_offset_byte};
  for (int row = 0; row < vp.window_height; ++row) {
    if (r.line == line && r.start == target) {
      return Position{static_cast<int>(byte - target), row};
    }
    if (!next_row(buf, vp.window_width, r)) break;
  }
  return std::nullopt;
}
