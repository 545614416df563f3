#pragma once
/*
 * ViewModel
 *
 * Purpose: viewport + cursor state machine driven by decoded keys.
 * Keeps the screen position (pos) and the logical position (line, byte)
 * consistent under wrapping; a vertical move at a viewport edge scrolls
 * by one wrapped row instead of moving the cursor off screen.
 * Constraint: after every public call, 0 <= pos.row < window_height.
 */
#include "types.hpp"

class TextBuffer;

class ViewModel {
public:
  explicit ViewModel(const TextBuffer& buf);

  // Returns true when the dimensions changed.
  bool set_window_size(WindowSize ws);

  bool cursor_left();
  bool cursor_right();
  bool cursor_up();
  bool cursor_down();
  void page_up();
  void page_down();
  void home();
  void end();

  bool scroll_up();
  bool scroll_down();

  void apply(const KeyEvent& ev);

  const Cursor& cursor() const { return cur_; }
  const Viewport& viewport() const { return vp_; }

private:
  bool has_window() const;
  void land(size_t line, size_t start, int desired_col);
  void reveal_cursor();

  const TextBuffer& buf_;
  Viewport vp_{};
  Cursor cur_{};
};
