#pragma once
/*
 * WindowSize query
 *
 * Purpose: find the viewport size through the cursor-position report:
 * push the cursor to the bottom-right (ESC[999C ESC[999B), ask for its
 * position (ESC[6n) and parse the ESC[<row>;<col>R reply.
 */
#include <optional>
#include <string>
#include <string_view>
#include "types.hpp"

class ITerminal;

// Parses a complete reply (terminating 'R' included). Stray bytes before
// the last ESC are skipped. Returns the 0-based position.
std::optional<Position> parse_cursor_report(std::string_view reply);

bool query_window_size(ITerminal& term, WindowSize& out, std::string& msg);
