#include "view_model.hpp"
#include "text_buffer.hpp"
#include "wrap.hpp"
#include <algorithm>

ViewModel::ViewModel(const TextBuffer& buf) : buf_(buf) {}

bool ViewModel::has_window() const { return vp_.window_width > 0 && vp_.window_height > 0; }

/*
 * Place the cursor on the row of `line` beginning at `start`. The column is
 * kept unless the row is shorter or the cursor is pinned to the row end.
 */
void ViewModel::land(size_t line, size_t start, int desired_col) {
  int e = end_of_row(buf_.line_len(line), start, vp_.window_width);
  bool shorter = desired_col > e;
  cur_.is_at_eol = cur_.is_at_eol || shorter;
  cur_.pos.col = cur_.is_at_eol ? e : desired_col;
  cur_.line = line;
  cur_.byte = start + static_cast<size_t>(cur_.pos.col);
}

bool ViewModel::cursor_left() {
  if (!has_window() || cur_.pos.col <= 0) return false;
  cur_.pos.col--;
  cur_.byte--;
  cur_.is_at_eol = false;
  return true;
}

bool ViewModel::cursor_right() {
  if (!has_window()) return false;
  size_t len = buf_.line_len(cur_.line);
  if (cur_.byte + 1 >= len || cur_.pos.col + 1 >= vp_.window_width) return false;
  cur_.pos.col++;
  cur_.byte++;
  cur_.is_at_eol = cur_.pos.col == end_of_row(len, row_start(cur_.byte, vp_.window_width), vp_.window_width);
  return true;
}

bool ViewModel::cursor_up() {
  if (!has_window()) return false;
  size_t w = static_cast<size_t>(vp_.window_width);
  bool same_line = cur_.byte >= w;
  if (!same_line && cur_.line == 0) return false;
  if (cur_.pos.row == 0) {
    if (!scroll_up()) return false;
    cur_.pos.row++;
  }
  cur_.pos.row--;
  if (same_line) {
    // previous row of a wrapped line is always full
    cur_.byte -= w;
    cur_.is_at_eol = cur_.pos.col == vp_.window_width - 1;
    return true;
  }
  size_t prev = cur_.line - 1;
  land(prev, last_row_start(buf_.line_len(prev), vp_.window_width), cur_.pos.col);
  return true;
}

bool ViewModel::cursor_down() {
  if (!has_window()) return false;
  size_t w = static_cast<size_t>(vp_.window_width);
  size_t start = row_start(cur_.byte, vp_.window_width);
  bool same_line = start + w < buf_.line_len(cur_.line);
  if (!same_line && cur_.line + 1 >= buf_.line_count()) return false;
  if (cur_.pos.row >= vp_.window_height - 1) {
    if (!scroll_down()) return false;
    cur_.pos.row--;
  }
  cur_.pos.row++;
  if (same_line) land(cur_.line, start + w, cur_.pos.col);
  else land(cur_.line + 1, 0, cur_.pos.col);
  return true;
}

void ViewModel::page_up() {
  // bounded by the first row of the buffer: cursor_up stops there
  for (int i = 0; i < vp_.window_height; ++i) {
    if (!cursor_up()) break;
  }
}

void ViewModel::page_down() {
  size_t remaining = buf_.line_count() - 1 - cur_.line;
  size_t n = std::min(static_cast<size_t>(std::max(0, vp_.window_height)), remaining);
  while (n--) {
    if (!cursor_down()) break;
  }
}

void ViewModel::home() {
  cur_ = Cursor{};
  vp_.line_offset = 0;
  vp_.line_offset_byte = 0;
}

void ViewModel::end() {
  if (!has_window()) return;
  size_t last = buf_.line_count() - 1;
  RowRef target{last, last_row_start(buf_.line_len(last), vp_.window_width)};
  RowRef origin = target;
  int row = 0;
  while (row < vp_.window_height - 1 && prev_row(buf_, vp_.window_width, origin)) row++;
  vp_.line_offset = origin.line;
  vp_.line_offset_byte = origin.start;
  cur_ = Cursor{Position{0, row}, target.line, target.start, false};
}

bool ViewModel::scroll_up() {
  if (!has_window()) return false;
  RowRef r{vp_.line_offset, vp_.line_offset_byte};
  if (!prev_row(buf_, vp_.window_width, r)) return false;
  vp_.line_offset = r.line;
  vp_.line_offset_byte = r.start;
  return true;
}

bool ViewModel::scroll_down() {
  if (!has_window()) return false;
  RowRef r{vp_.line_offset, vp_.line_offset_byte};
  if (!next_row(buf_, vp_.window_width, r)) return false;
  vp_.line_offset = r.line;
  vp_.line_offset_byte = r.start;
  return true;
}

bool ViewModel::set_window_size(WindowSize ws) {
  int w = std::max(1, ws.width);
  int h = std::max(1, ws.height);
  if (w == vp_.window_width && h == vp_.window_height) return false;
  vp_.window_width = w;
  vp_.window_height = h;
  size_t last = buf_.line_count() - 1;
  vp_.line_offset = std::min(vp_.line_offset, last);
  vp_.line_offset_byte = std::min(row_start(vp_.line_offset_byte, w),
                                  last_row_start(buf_.line_len(vp_.line_offset), w));
  cur_.line = std::min(cur_.line, last);
  size_t len = buf_.line_len(cur_.line);
  cur_.byte = len == 0 ? 0 : std::min(cur_.byte, len - 1);
  reveal_cursor();
  return true;
}

// Re-derive pos from (line, byte), moving the origin the least needed.
void ViewModel::reveal_cursor() {
  size_t start = row_start(cur_.byte, vp_.window_width);
  std::optional<Position> p = locate(buf_, vp_, cur_.line, cur_.byte);
  if (!p) {
    bool above = cur_.line < vp_.line_offset ||
                 (cur_.line == vp_.line_offset && start < vp_.line_offset_byte);
    RowRef origin{cur_.line, start};
    if (!above) {
      for (int i = 0; i < vp_.window_height - 1; ++i) {
        if (!prev_row(buf_, vp_.window_width, origin)) break;
      }
    }
    vp_.line_offset = origin.line;
    vp_.line_offset_byte = origin.start;
    p = locate(buf_, vp_, cur_.line, cur_.byte);
  }
  cur_.pos = p.value_or(Position{});
  int e = end_of_row(buf_.line_len(cur_.line), start, vp_.window_width);
  cur_.is_at_eol = cur_.is_at_eol && cur_.pos.col == e;
}

void ViewModel::apply(const KeyEvent& ev) {
  switch (ev.key) {
    case Key::ArrowUp: cursor_up(); break;
    case Key::ArrowDown: cursor_down(); break;
    case Key::ArrowLeft: cursor_left(); break;
    case Key::ArrowRight: cursor_right(); break;
    case Key::PageUp: page_up(); break;
    case Key::PageDown: page_down(); break;
    case Key::Home: home(); break;
    case Key::End: end(); break;
    case Key::Delete: case Key::Char: case Key::None: break;
  }
}
