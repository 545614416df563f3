#pragma once
/*
 * Wrap
 *
 * Purpose: pure wrap arithmetic shared by the view model and the renderer.
 * A line of L bytes at width W occupies max(1, ceil(L/W)) rows; rows start
 * at multiples of W and only the last one may be shorter.
 */
#include <cstddef>
#include <optional>
#include "types.hpp"

class TextBuffer;

size_t rows_for_len(size_t len, int width);
size_t row_start(size_t byte, int width);
size_t last_row_start(size_t len, int width);
// Column of the last occupied cell of the row starting at `start`; 0 when empty.
int end_of_row(size_t len, size_t start, int width);

// One rendered row: the line it belongs to and the byte it starts at.
struct RowRef {
  size_t line = 0;
  size_t start = 0;
};

bool next_row(const TextBuffer& buf, int width, RowRef& r);
bool prev_row(const TextBuffer& buf, int width, RowRef& r);

// Screen position of (line, byte) under vp, or nullopt when not visible.
std::optional<Position> locate(const TextBuffer& buf, const Viewport& vp, size_t line, size_t byte);
