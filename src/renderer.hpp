#pragma once
/*
 * Renderer
 *
 * Purpose: build one frame of terminal control sequences for the visible
 *          rows (wrapped from the viewport origin) plus filler rows.
 * Constraint: stateless w.r.t. the model; reads snapshots, never mutates them.
 * The output buffer keeps its capacity across frames (clear, not realloc).
 */
#include <string>
#include "text_buffer.hpp"
#include "types.hpp"

class Renderer {
public:
  Renderer();
  const std::string& render(const TextBuffer& buf, const Viewport& vp, const Cursor& cur);
  const std::string& frame() const { return out_; }
  size_t capacity() const { return out_.capacity(); }
  // called once the frame has been written out
  void clear() { out_.clear(); }
  void set_filler(char c) { filler_ = c; }
  char filler() const { return filler_; }
private:
  void append_move(int row, int col);
  std::string out_;
  char filler_;
};
