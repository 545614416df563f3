#include "renderer.hpp"
#include "config.hpp"
#include "wrap.hpp"
#include <algorithm>
#include <iterator>
#include <string_view>
#include <fmt/format.h>

static constexpr std::string_view kHideCursor = "\x1b[?25l";
static constexpr std::string_view kShowCursor = "\x1b[?25h";
static constexpr std::string_view kCursorHome = "\x1b[H";
static constexpr std::string_view kClearLine = "\x1b[K";
static constexpr std::string_view kRowBreak = "\r\n";

Renderer::Renderer() : filler_(WV_DEFAULT_FILLER) {
  out_.reserve(WV_WRITE_BUF_RESERVE);
}

void Renderer::append_move(int row, int col) {
  fmt::format_to(std::back_inserter(out_), "\x1b[{};{}H", row + 1, col + 1);
}

const std::string& Renderer::render(const TextBuffer& buf, const Viewport& vp, const Cursor& cur) {
  out_.clear();
  out_ += kHideCursor;
  out_ += kCursorHome;
  size_t w = static_cast<size_t>(std::max(1, vp.window_width));
  RowRef r{vp.line_offset, vp.line_offset_byte};
  bool has_text = vp.line_offset < buf.line_count();
  for (int row = 0; row < vp.window_height; ++row) {
    out_ += kClearLine;
    if (has_text) {
      const std::string& s = buf.line(r.line);
      size_t start = std::min(r.start, s.size());
      out_.append(s, start, std::min(w, s.size() - start));
      has_text = next_row(buf, vp.window_width, r);
    } else {
      out_ += filler_;
    }
    // no break after the last row, it would scroll the terminal
    if (row + 1 < vp.window_height) out_ += kRowBreak;
  }
  append_move(cur.pos.row, cur.pos.col);
  out_ += kShowCursor;
  return out_;
}
