#include "terminal.hpp"
#include "iterminal.hpp"
// last: curses defines function-like macros (clear, move, refresh)
#include <ncurses.h>

Terminal::Terminal(ITerminal& io) : io_(io) {
  initscr();
  raw();
  noecho();
  // flush the init sequence before raw writes begin
  refresh();
}

Terminal::~Terminal() {
  endwin();
  // restore the user's screen; nothing left to report to on failure
  if (io_.write("\x1b[2J\x1b[H")) io_.flush();
}
