#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Position/Cursor/Viewport/Key).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

// Zero-based, screen-relative cell; (0,0) is the top-left visible cell.
struct Position { int col = 0; int row = 0; };

struct WindowSize { int width = 0; int height = 0; };

struct Cursor {
  Position pos{};
  size_t line = 0;
  size_t byte = 0;
  bool is_at_eol = false;
};

// Render origin: first (partially) visible line and the wrap boundary inside it.
struct Viewport {
  int window_width = 0;
  int window_height = 0;
  size_t line_offset = 0;
  size_t line_offset_byte = 0;
};

enum class Key { None, Char, ArrowUp, ArrowDown, ArrowLeft, ArrowRight, PageUp, PageDown, Home, End, Delete };

struct KeyEvent {
  Key key = Key::None;
  unsigned char ch = 0; // valid when key == Key::Char
};
